#ifndef REDIRECTOR_RULES_RULE_VALIDATOR_HPP
#define REDIRECTOR_RULES_RULE_VALIDATOR_HPP

#include "redirector/rules/rule.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace redirector::rules {

// ═══════════════════════════════════════════════════════════════════════════
// Validation Outcome
// ═══════════════════════════════════════════════════════════════════════════

enum class OutcomeKind {
    Accepted,               ///< Rule may be added
    AcceptedWithAdvisory,   ///< Rule may be added, subdomain depth differs
    Rejected                ///< Rule must not be added
};

enum class RejectReason {
    Empty,            ///< Source or destination has no visible characters
    DuplicateSource,  ///< Source already used by an existing rule
    Cycle             ///< Source is already some rule's destination
};

[[nodiscard]] constexpr std::string_view to_string(OutcomeKind kind) noexcept {
    switch (kind) {
        case OutcomeKind::Accepted:             return "Accepted";
        case OutcomeKind::AcceptedWithAdvisory: return "AcceptedWithAdvisory";
        case OutcomeKind::Rejected:             return "Rejected";
    }
    return "Unknown";
}

[[nodiscard]] constexpr std::string_view to_string(RejectReason reason) noexcept {
    switch (reason) {
        case RejectReason::Empty:           return "Empty";
        case RejectReason::DuplicateSource: return "DuplicateSource";
        case RejectReason::Cycle:           return "Cycle";
    }
    return "Unknown";
}

/// Result of a single validate() call. Carries classification only; any
/// user-facing text is chosen by the notifier.
class ValidationOutcome {
public:
    [[nodiscard]] static ValidationOutcome accepted() noexcept {
        return ValidationOutcome(OutcomeKind::Accepted, std::nullopt, 0);
    }

    [[nodiscard]] static ValidationOutcome accepted_with_advisory(std::size_t subdomain_delta) noexcept {
        return ValidationOutcome(OutcomeKind::AcceptedWithAdvisory, std::nullopt, subdomain_delta);
    }

    [[nodiscard]] static ValidationOutcome rejected(RejectReason reason) noexcept {
        return ValidationOutcome(OutcomeKind::Rejected, reason, 0);
    }

    [[nodiscard]] OutcomeKind kind() const noexcept { return kind_; }

    /// Set only when kind() == Rejected.
    [[nodiscard]] std::optional<RejectReason> reason() const noexcept { return reason_; }

    /// Non-zero only when kind() == AcceptedWithAdvisory.
    [[nodiscard]] std::size_t subdomain_delta() const noexcept { return subdomain_delta_; }

    [[nodiscard]] bool is_accepted() const noexcept { return kind_ != OutcomeKind::Rejected; }
    [[nodiscard]] bool has_advisory() const noexcept { return kind_ == OutcomeKind::AcceptedWithAdvisory; }

    [[nodiscard]] Json to_json() const;

    friend bool operator==(const ValidationOutcome&, const ValidationOutcome&) = default;

private:
    ValidationOutcome(OutcomeKind kind, std::optional<RejectReason> reason, std::size_t delta) noexcept
        : kind_(kind)
        , reason_(reason)
        , subdomain_delta_(delta)
    {}

    OutcomeKind kind_;
    std::optional<RejectReason> reason_;
    std::size_t subdomain_delta_;
};

/// "Rejected(Cycle)", "AcceptedWithAdvisory(2)", "Accepted"
[[nodiscard]] std::string to_string(const ValidationOutcome& outcome);

// ═══════════════════════════════════════════════════════════════════════════
// Rule Validation
// ═══════════════════════════════════════════════════════════════════════════
// Decides whether a candidate (source, destination) may join `existing`.
// Checks run in this order and the first failure wins:
//
//   1. Empty:           source or destination is blank or whitespace only
//   2. DuplicateSource: an existing rule has exactly this source
//   3. Cycle:           an existing rule has this source as its destination
//   4. Advisory:        subdomain_difference(source, destination) > 0
//
// Steps 2 and 3 compare the raw candidate strings against the stored ones
// without trimming or normalization. Stored rules are trimmed by the caller
// before saving, so " a.com" is not reported as a duplicate of "a.com".
//
// No chain is walked: the cycle check only asks whether the candidate source
// is already a destination. A self-redirect (source == destination) passes.
//
// validate() is pure: it reads `existing` and returns; it has no side
// effects and never throws.

[[nodiscard]] ValidationOutcome validate(
    std::string_view source,
    std::string_view destination,
    const RuleSet& existing
);

// ═══════════════════════════════════════════════════════════════════════════
// Helpers (exposed for testing and for the deletion path)
// ═══════════════════════════════════════════════════════════════════════════

// True when the string contains at least one non-whitespace character.
[[nodiscard]] bool has_chars(std::string_view text) noexcept;

// Heuristic count of leftover '.'-separated labels after removing the
// shorter normalized domain from the longer one. 0 when neither contains
// the other.
[[nodiscard]] std::size_t subdomain_difference(std::string_view source, std::string_view destination);

// First run of digits anywhere in `id`, parsed as an index.
// "deleteRuleButton-12" -> 12, "deleteRuleButton-" -> nullopt.
// Also nullopt if the digit run does not fit in std::size_t.
[[nodiscard]] std::optional<std::size_t> parse_trailing_index(std::string_view id) noexcept;

}  // namespace redirector::rules

#endif  // REDIRECTOR_RULES_RULE_VALIDATOR_HPP
