// Example 01: Validating Rules
//
// Runs candidate rules through the validator against a fixed rule list and
// prints the outcome and the popup each one would produce.

#include <redirector/notify/message_catalog.hpp>
#include <redirector/notify/notifier.hpp>
#include <redirector/rules/domain_normalizer.hpp>
#include <redirector/rules/rule_validator.hpp>

#include <iostream>
#include <string>
#include <utility>
#include <vector>

using namespace redirector;

int main() {
    std::cout << "=== Rule Validation Example ===\n\n";

    const RuleSet existing = {
        {"nickschorr.com/path/", "nickschorr.com/path/test/", false},
        {"test.nickschorr.com/path/", "test.nickschorr.com/path/test/", false},
        {"old.example.com", "new.example.com", false},
    };

    const std::vector<std::pair<std::string, std::string>> candidates = {
        {"nickschorr.com", "nickschorr.com/test/"},     // accepted
        {"one.nickschorr.com", "nickschorr.com"},       // advisory, delta 1
        {"   ", "example.org"},                         // empty
        {"old.example.com", "example.org"},             // duplicate source
        {"new.example.com", "old.example.com"},         // cycle
    };

    MessageCatalog catalog;

    for (const auto& [source, destination] : candidates) {
        const auto outcome = rules::validate(source, destination, existing);

        std::cout << "'" << source << "' -> '" << destination << "'\n";
        std::cout << "  bare domains: '" << rules::get_domain(source)
                  << "' / '" << rules::get_domain(destination) << "'\n";
        std::cout << "  outcome:      " << rules::to_string(outcome) << "\n";

        if (auto notification = make_notification(outcome, catalog)) {
            std::cout << "  popup:        " << notification->symbol << " " << notification->text
                      << " (" << color_for(notification->severity) << ", "
                      << notification->display_time.count() << "ms)\n";
        }
        std::cout << "\n";
    }

    return 0;
}
