#include "redirector/rules/rule_validator.hpp"

#include "redirector/rules/domain_normalizer.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace redirector::rules {

// ═══════════════════════════════════════════════════════════════════════════
// ValidationOutcome
// ═══════════════════════════════════════════════════════════════════════════

Json ValidationOutcome::to_json() const {
    Json j = {{"kind", std::string(redirector::rules::to_string(kind_))}};
    if (reason_) {
        j["reason"] = std::string(redirector::rules::to_string(*reason_));
    }
    if (kind_ == OutcomeKind::AcceptedWithAdvisory) {
        j["subdomainDelta"] = subdomain_delta_;
    }
    return j;
}

std::string to_string(const ValidationOutcome& outcome) {
    switch (outcome.kind()) {
        case OutcomeKind::Accepted:
            return "Accepted";
        case OutcomeKind::AcceptedWithAdvisory:
            return "AcceptedWithAdvisory(" + std::to_string(outcome.subdomain_delta()) + ")";
        case OutcomeKind::Rejected: {
            const auto reason = outcome.reason().value_or(RejectReason::Empty);
            return "Rejected(" + std::string(to_string(reason)) + ")";
        }
    }
    return "Unknown";
}

// ═══════════════════════════════════════════════════════════════════════════
// Helpers
// ═══════════════════════════════════════════════════════════════════════════

bool has_chars(std::string_view text) noexcept {
    return std::any_of(text.begin(), text.end(), [](char c) {
        return !std::isspace(static_cast<unsigned char>(c));
    });
}

std::size_t subdomain_difference(std::string_view source, std::string_view destination) {
    const std::string source_domain = get_domain(source);
    const std::string destination_domain = get_domain(destination);

    // Ties go to the destination.
    const bool destination_longer = destination_domain.size() >= source_domain.size();
    std::string longer = destination_longer ? destination_domain : source_domain;
    const std::string& shorter = destination_longer ? source_domain : destination_domain;

    // Plain substring removal of the first occurrence. An empty `shorter`
    // matches at 0 and removes nothing, which falls into the 0 case below.
    const auto original_length = longer.size();
    const auto pos = longer.find(shorter);
    if (pos != std::string::npos) {
        longer.erase(pos, shorter.size());
    }
    if (longer.size() == original_length) {
        return 0;
    }

    return static_cast<std::size_t>(std::count(longer.begin(), longer.end(), '.'));
}

std::optional<std::size_t> parse_trailing_index(std::string_view id) noexcept {
    const auto is_digit = [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; };

    const auto first = std::find_if(id.begin(), id.end(), is_digit);
    if (first == id.end()) {
        return std::nullopt;
    }
    const auto last = std::find_if_not(first, id.end(), is_digit);

    const char* begin = id.data() + (first - id.begin());
    const char* end = id.data() + (last - id.begin());

    std::size_t value = 0;
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return value;
}

// ═══════════════════════════════════════════════════════════════════════════
// Main Validation Function
// ═══════════════════════════════════════════════════════════════════════════

ValidationOutcome validate(
    std::string_view source,
    std::string_view destination,
    const RuleSet& existing
) {
    if (!has_chars(source) || !has_chars(destination)) {
        return ValidationOutcome::rejected(RejectReason::Empty);
    }

    const bool duplicate = std::any_of(existing.begin(), existing.end(), [&](const Rule& rule) {
        return rule.source == source;
    });
    if (duplicate) {
        return ValidationOutcome::rejected(RejectReason::DuplicateSource);
    }

    const bool cycle = std::any_of(existing.begin(), existing.end(), [&](const Rule& rule) {
        return rule.destination == source;
    });
    if (cycle) {
        return ValidationOutcome::rejected(RejectReason::Cycle);
    }

    // Still admissible, but e.g. "amazon.com -> smile.amazon.com" usually
    // will not redirect as intended while "www.amazon.com -> smile.amazon.com"
    // will.
    const auto delta = subdomain_difference(source, destination);
    if (delta > 0) {
        return ValidationOutcome::accepted_with_advisory(delta);
    }

    return ValidationOutcome::accepted();
}

}  // namespace redirector::rules
