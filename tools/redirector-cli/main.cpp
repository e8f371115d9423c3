// ─────────────────────────────────────────────────────────────────────────────
// redirector-cli - Manage URL redirection rules from the command line
// ─────────────────────────────────────────────────────────────────────────────
//
// Usage:
//   redirector-cli --list
//   redirector-cli --add -s old.example.com -d new.example.com
//   redirector-cli --add -s '^https?://(www\.)?example\.com' -d example.org --regex
//   redirector-cli --check -s one.example.com -d example.com
//   redirector-cli --delete deleteRuleButton-0
//   redirector-cli --delete-index 2 --store ~/.config/redirector/rules.json
//
// Exit codes: 0 success, 1 rule rejected or operation failed, 2 bad usage.

#include <cxxopts.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/common.h>

#include "redirector/editor/editor_config.hpp"
#include "redirector/editor/rule_editor.hpp"
#include "redirector/log/spdlog_logger.hpp"
#include "redirector/notify/message_catalog.hpp"
#include "redirector/notify/notifier.hpp"
#include "redirector/store/json_file_rule_store.hpp"

#include <iostream>
#include <memory>
#include <string>

using namespace redirector;
using Json = nlohmann::json;

namespace {

// ═══════════════════════════════════════════════════════════════════════════
// ANSI Color Codes
// ═══════════════════════════════════════════════════════════════════════════

namespace color {
    const char* reset = "\033[0m";
    const char* bold  = "\033[1m";
    const char* dim   = "\033[2m";
    const char* red   = "\033[31m";
    const char* green = "\033[32m";

    bool enabled = true;

    std::string c(const char* code) {
        return enabled ? code : "";
    }
}

void print_error(const std::string& msg) {
    std::cerr << color::c(color::red) << "Error: " << color::c(color::reset) << msg << "\n";
}

// Prints popups as a coloured line on stderr.
class ConsoleNotifier final : public INotifier {
public:
    void notify(const Notification& notification) override {
        const char* tint = notification.severity == Severity::Error ? color::red : color::green;
        std::cerr << color::c(tint) << notification.symbol << ' ' << notification.text
                  << color::c(color::reset) << "\n";
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Commands
// ═══════════════════════════════════════════════════════════════════════════

int cmd_list(RuleEditor& editor, bool json_output) {
    auto rules = editor.list_rules();
    if (!rules) {
        print_error(rules.error().message);
        return 1;
    }

    if (json_output) {
        std::cout << Json{{RULES_STORAGE_KEY, rules_to_json(*rules)}}.dump(2) << "\n";
        return 0;
    }

    if (rules->empty()) {
        std::cout << editor.catalog().get(messages::NO_RULES) << "\n";
        return 0;
    }

    std::cout << color::c(color::bold) << editor.catalog().get(messages::CURRENT_RULES)
              << color::c(color::reset) << "\n";
    for (std::size_t i = 0; i < rules->size(); ++i) {
        const auto& rule = (*rules)[i];
        std::cout << "  " << color::c(color::dim) << RuleEditor::element_id_for(i) << color::c(color::reset)
                  << "  " << rule.source << " → " << rule.destination;
        if (rule.is_regex) {
            std::cout << color::c(color::dim) << "  (regex)" << color::c(color::reset);
        }
        std::cout << "\n";
    }
    return 0;
}

int report_outcome(
    const EditResult<rules::ValidationOutcome>& result,
    const CapturingNotifier* captured,
    bool json_output
) {
    if (json_output) {
        Json out = Json::object();
        if (result) {
            out["outcome"] = result->to_json();
        } else if (result.error().reason) {
            out["outcome"] = rules::ValidationOutcome::rejected(*result.error().reason).to_json();
        } else {
            out["error"] = result.error().message;
        }
        if (captured) {
            Json list = Json::array();
            for (const auto& notification : captured->notifications()) {
                list.push_back(notification.to_json());
            }
            out["notifications"] = list;
        }
        std::cout << out.dump(2) << "\n";
        return result ? 0 : 1;
    }

    if (!result) {
        if (result.error().code != EditErrorCode::Rejected) {
            print_error(result.error().message);
        }
        return 1;
    }
    std::cout << rules::to_string(*result) << "\n";
    return 0;
}

int cmd_check(RuleEditor& editor, const std::string& source, const std::string& destination,
              bool json_output) {
    auto result = editor.check_rule(source, destination);
    if (result && !json_output) {
        if (auto notification = make_notification(*result, editor.catalog())) {
            ConsoleNotifier{}.notify(*notification);
        }
    }
    const int exit_code = report_outcome(result, nullptr, json_output);
    return (result && !result->is_accepted()) ? 1 : exit_code;
}

int cmd_delete(const EditResult<Rule>& result, bool json_output) {
    if (!result) {
        if (json_output) {
            std::cout << Json{{"error", result.error().message},
                              {"code", std::string(to_string(result.error().code))}}.dump(2) << "\n";
        } else {
            print_error(result.error().message);
        }
        return 1;
    }

    if (json_output) {
        std::cout << Json{{"deleted", result->to_json()}}.dump(2) << "\n";
    } else {
        std::cout << "Deleted: " << result->source << " → " << result->destination << "\n";
    }
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    cxxopts::Options options("redirector-cli", "Manage URL redirection rules");

    options.add_options()
        // Storage
        ("store", "Rule store JSON file", cxxopts::value<std::string>()->default_value("redirection_rules.json"))
        ("messages", "Locale messages.json overriding notification texts", cxxopts::value<std::string>())

        // Commands
        ("l,list", "List current rules")
        ("a,add", "Add a rule (needs --source and --destination)")
        ("check", "Validate a rule without storing it (needs --source and --destination)")
        ("delete", "Delete the rule named by an element id, e.g. deleteRuleButton-0", cxxopts::value<std::string>())
        ("delete-index", "Delete the rule at a position", cxxopts::value<std::size_t>())

        // Rule fields
        ("s,source", "Source domain, path or pattern", cxxopts::value<std::string>())
        ("d,destination", "Destination domain or path", cxxopts::value<std::string>())
        ("r,regex", "Treat the source as a regular expression")
        ("keep-whitespace", "Store source and destination exactly as given")

        // Output and logging
        ("j,json", "Output results as JSON")
        ("no-color", "Disable colored output")
        ("log-level", "trace, debug, info, warn, error or off", cxxopts::value<std::string>()->default_value("warn"))
        ("log-file", "Also write logs to this file", cxxopts::value<std::string>())
        ("h,help", "Print usage");

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << options.help() << "\n";
            return 0;
        }

        color::enabled = !result.count("no-color");
        const bool json_output = result.count("json") > 0;

        const auto level_name = result["log-level"].as<std::string>();
        const auto level = parse_log_level(level_name);
        if (!level) {
            print_error("unknown log level: " + level_name);
            return 2;
        }

        EditorConfig config;
        config.with_store_path(result["store"].as<std::string>())
              .with_log_level(*level)
              .with_trim_on_store(result.count("keep-whitespace") == 0);
        if (result.count("messages")) {
            config.with_messages_path(result["messages"].as<std::string>());
        }
        if (result.count("log-file")) {
            config.with_log_file(result["log-file"].as<std::string>());
        }

        set_logger(make_editor_logger(config));

        // JSON mode collects notifications into the output document instead
        // of printing them.
        std::unique_ptr<INotifier> notifier;
        CapturingNotifier* captured = nullptr;
        if (json_output) {
            auto capturing = std::make_unique<CapturingNotifier>();
            captured = capturing.get();
            notifier = std::move(capturing);
        } else {
            notifier = std::make_unique<ConsoleNotifier>();
        }

        auto made = make_rule_editor(config, std::move(notifier));
        if (!made) {
            print_error(made.error().message);
            return 1;
        }
        RuleEditor& editor = **made;

        const bool wants_rule = result.count("add") || result.count("check");
        if (wants_rule && (!result.count("source") || !result.count("destination"))) {
            print_error("--add and --check need both --source and --destination");
            return 2;
        }

        if (result.count("add")) {
            auto added = editor.add_rule(
                result["source"].as<std::string>(),
                result["destination"].as<std::string>(),
                result.count("regex") > 0);
            return report_outcome(added, captured, json_output);
        }
        if (result.count("check")) {
            return cmd_check(editor, result["source"].as<std::string>(),
                             result["destination"].as<std::string>(), json_output);
        }
        if (result.count("delete")) {
            return cmd_delete(editor.delete_rule(result["delete"].as<std::string>()), json_output);
        }
        if (result.count("delete-index")) {
            return cmd_delete(editor.delete_rule_at(result["delete-index"].as<std::size_t>()), json_output);
        }

        // Default: show the table
        return cmd_list(editor, json_output);

    } catch (const cxxopts::exceptions::exception& e) {
        print_error(e.what());
        return 2;
    } catch (const spdlog::spdlog_ex& e) {
        print_error(std::string("cannot set up logging: ") + e.what());
        return 1;
    }
}
