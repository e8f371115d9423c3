#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Rule Editor Error
// ═══════════════════════════════════════════════════════════════════════════

#include "redirector/rules/rule_validator.hpp"
#include "redirector/store/rule_store.hpp"

#include <tl/expected.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace redirector {

enum class EditErrorCode {
    Rejected,         ///< Validator refused the rule
    InvalidIndex,     ///< Element id carries no index
    IndexOutOfRange,  ///< Index past the end of the rule list
    Store             ///< Loading or saving the rule list failed
};

[[nodiscard]] constexpr std::string_view to_string(EditErrorCode code) noexcept {
    switch (code) {
        case EditErrorCode::Rejected:        return "Rejected";
        case EditErrorCode::InvalidIndex:    return "InvalidIndex";
        case EditErrorCode::IndexOutOfRange: return "IndexOutOfRange";
        case EditErrorCode::Store:           return "Store";
    }
    return "Unknown";
}

struct EditError {
    EditErrorCode code;
    std::string message;
    std::optional<rules::RejectReason> reason;  ///< Set for Rejected

    [[nodiscard]] static EditError rejected(rules::RejectReason why) {
        return {
            EditErrorCode::Rejected,
            "rule rejected: " + std::string(rules::to_string(why)),
            why
        };
    }

    [[nodiscard]] static EditError invalid_index(std::string_view element_id) {
        return {
            EditErrorCode::InvalidIndex,
            "no rule index in \"" + std::string(element_id) + "\"",
            std::nullopt
        };
    }

    [[nodiscard]] static EditError index_out_of_range(std::size_t index, std::size_t size) {
        return {
            EditErrorCode::IndexOutOfRange,
            "rule index " + std::to_string(index) + " out of range (" + std::to_string(size) + " rules)",
            std::nullopt
        };
    }

    [[nodiscard]] static EditError store(const StoreError& err) {
        return {
            EditErrorCode::Store,
            std::string(to_string(err.code)) + ": " + err.message,
            std::nullopt
        };
    }
};

template <typename T>
using EditResult = tl::expected<T, EditError>;

}  // namespace redirector
