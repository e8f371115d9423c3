#ifndef REDIRECTOR_RULES_RULE_HPP
#define REDIRECTOR_RULES_RULE_HPP

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace redirector {

using Json = nlohmann::json;

// ═══════════════════════════════════════════════════════════════════════════
// Redirection Rule
// ═══════════════════════════════════════════════════════════════════════════
// One redirect: requests matching `source` are sent to `destination`.
// When `is_regex` is set, `source` is a regular expression pattern rather
// than literal text. The engine never compiles or runs the pattern.

struct Rule {
    std::string source;
    std::string destination;
    bool is_regex{false};

    // Field names match the persisted storage layout.
    [[nodiscard]] Json to_json() const {
        return {{"src", source}, {"dest", destination}, {"regex", is_regex}};
    }

    static Rule from_json(const Json& j) {
        return {
            j.at("src").get<std::string>(),
            j.at("dest").get<std::string>(),
            j.value("regex", false)
        };
    }

    friend bool operator==(const Rule&, const Rule&) = default;
};

// Ordered; position is used for display and index-based deletion only.
using RuleSet = std::vector<Rule>;

[[nodiscard]] inline Json rules_to_json(const RuleSet& rules) {
    Json arr = Json::array();
    for (const auto& rule : rules) {
        arr.push_back(rule.to_json());
    }
    return arr;
}

[[nodiscard]] inline RuleSet rules_from_json(const Json& arr) {
    RuleSet rules;
    rules.reserve(arr.size());
    for (const auto& item : arr) {
        rules.push_back(Rule::from_json(item));
    }
    return rules;
}

}  // namespace redirector

#endif  // REDIRECTOR_RULES_RULE_HPP
