#ifndef REDIRECTOR_STORE_JSON_FILE_RULE_STORE_HPP
#define REDIRECTOR_STORE_JSON_FILE_RULE_STORE_HPP

#include "redirector/store/rule_store.hpp"

#include <filesystem>

namespace redirector {

// Top-level key the rule array is stored under.
inline constexpr const char* RULES_STORAGE_KEY = "redirectionRules";

// ═══════════════════════════════════════════════════════════════════════════
// JsonFileRuleStore
// ═══════════════════════════════════════════════════════════════════════════
// Persists the rule list as a JSON document:
//
//   { "redirectionRules": [ { "src": "...", "dest": "...", "regex": false } ] }
//
// - A missing file loads as an empty list.
// - A document without the "redirectionRules" key loads as an empty list.
// - Other top-level keys are preserved across save().
// - save() writes "<path>.tmp" and renames it over <path>, creating parent
//   directories as needed.

class JsonFileRuleStore final : public IRuleStore {
public:
    explicit JsonFileRuleStore(std::filesystem::path path);

    [[nodiscard]] StoreResult<RuleSet> load() override;
    [[nodiscard]] StoreResult<void> save(const RuleSet& rules) override;

    [[nodiscard]] const std::filesystem::path& path() const noexcept {
        return path_;
    }

private:
    [[nodiscard]] StoreResult<Json> read_document() const;

    std::filesystem::path path_;
};

}  // namespace redirector

#endif  // REDIRECTOR_STORE_JSON_FILE_RULE_STORE_HPP
