// Example 02: Rule Editor
//
// Drives the add/delete workflow against an in-memory store, with change
// announcements forwarded to a callback and logging through spdlog.

#include <redirector/editor/rule_editor.hpp>
#include <redirector/log/spdlog_logger.hpp>
#include <redirector/notify/change_announcer.hpp>
#include <redirector/notify/notifier.hpp>
#include <redirector/store/rule_store.hpp>

#include <iostream>
#include <string>

using namespace redirector;

namespace {

void print_rules(RuleEditor& editor) {
    auto rules = editor.list_rules();
    if (!rules) {
        std::cerr << "list failed: " << rules.error().message << "\n";
        return;
    }
    std::cout << "Rules (" << rules->size() << "):\n";
    for (std::size_t i = 0; i < rules->size(); ++i) {
        const auto& rule = (*rules)[i];
        std::cout << "  " << RuleEditor::element_id_for(i) << "  "
                  << rule.source << " -> " << rule.destination
                  << (rule.is_regex ? "  (regex)" : "") << "\n";
    }
    std::cout << "\n";
}

void print_added(const std::string& label, const EditResult<rules::ValidationOutcome>& result) {
    if (result) {
        std::cout << label << ": " << rules::to_string(*result) << "\n";
    } else {
        std::cout << label << " failed: " << result.error().message << "\n";
    }
}

}  // namespace

int main() {
    set_logger(make_spdlog_console_logger(LogLevel::Debug));

    std::cout << "=== Rule Editor Example ===\n\n";

    auto announcer = std::make_unique<CallbackAnnouncer>(
        [](const std::string& source) { std::cout << "  [announce] added " << source << "\n"; },
        [](const std::string& source) { std::cout << "  [announce] removed " << source << "\n"; }
    );

    RuleEditor editor(
        std::make_unique<MemoryRuleStore>(),
        std::make_unique<LogNotifier>(),
        std::move(announcer)
    );

    // Whitespace is trimmed before storing.
    print_added("Added www.amazon.com", editor.add_rule("  www.amazon.com ", "smile.amazon.com"));
    // Advisory: bare domain to subdomain.
    print_added("Added amazon.co.uk", editor.add_rule("amazon.co.uk", "smile.amazon.co.uk"));
    // Regex source, stored verbatim apart from trimming.
    print_added("Added regex rule", editor.add_rule("^https?://old\\.example\\.com/(.*)$", "example.com", true));
    std::cout << "\n";

    // Refused: cycle back onto an existing destination.
    auto refused = editor.add_rule("smile.amazon.com", "www.amazon.com");
    if (!refused) {
        std::cout << "Refused: " << refused.error().message << "\n\n";
    }

    print_rules(editor);

    auto removed = editor.delete_rule("deleteRuleButton-1");
    if (removed) {
        std::cout << "Deleted " << removed->source << "\n\n";
    }

    // No digits: nothing is touched.
    auto ignored = editor.delete_rule("deleteRuleButton-");
    if (!ignored) {
        std::cout << "Ignored: " << ignored.error().message << "\n\n";
    }

    print_rules(editor);
    return 0;
}
