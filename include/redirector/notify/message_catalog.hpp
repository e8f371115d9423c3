#ifndef REDIRECTOR_NOTIFY_MESSAGE_CATALOG_HPP
#define REDIRECTOR_NOTIFY_MESSAGE_CATALOG_HPP

#include "redirector/rules/rule.hpp"
#include "redirector/store/rule_store.hpp"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <string>
#include <string_view>

namespace redirector {

// ═══════════════════════════════════════════════════════════════════════════
// Message Ids
// ═══════════════════════════════════════════════════════════════════════════

namespace messages {
inline constexpr const char* NO_EMPTY             = "options_no_empty_rule_string";
inline constexpr const char* NO_DUPLICATES        = "options_no_duplicates_string";
inline constexpr const char* NO_CYCLES            = "options_no_cycles_string";
inline constexpr const char* MISMATCHED_SUBDOMAINS = "options_mismatched_subdomains_string";
inline constexpr const char* CURRENT_RULES        = "options_current_rules_string";
inline constexpr const char* NO_RULES             = "options_no_rules_string";
}  // namespace messages

// ═══════════════════════════════════════════════════════════════════════════
// MessageCatalog
// ═══════════════════════════════════════════════════════════════════════════
// Id -> display text. Starts with built-in English strings. A locale file
// in the browser-extension layout overrides individual entries:
//
//   { "options_no_cycles_string": { "message": "..." , "description": "..." } }

class MessageCatalog {
public:
    MessageCatalog();

    /// Empty string for unknown ids.
    [[nodiscard]] std::string get(std::string_view id) const;

    void set(std::string id, std::string text);

    /// Merge entries from a parsed locale document. Entries without a string
    /// "message" field are skipped. Returns the number merged.
    std::size_t merge(const Json& document);

    /// Read and merge a locale file.
    [[nodiscard]] StoreResult<std::size_t> merge_file(const std::filesystem::path& path);

private:
    std::map<std::string, std::string, std::less<>> texts_;
};

}  // namespace redirector

#endif  // REDIRECTOR_NOTIFY_MESSAGE_CATALOG_HPP
