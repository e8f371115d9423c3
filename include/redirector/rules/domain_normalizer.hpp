#ifndef REDIRECTOR_RULES_DOMAIN_NORMALIZER_HPP
#define REDIRECTOR_RULES_DOMAIN_NORMALIZER_HPP

#include <string>
#include <string_view>

namespace redirector::rules {

// ═══════════════════════════════════════════════════════════════════════════
// Domain Normalization
// ═══════════════════════════════════════════════════════════════════════════
// Reduces a URL-like string to a bare host for the subdomain heuristic.
// Uniqueness and cycle checks never go through these; they compare raw
// strings.
//
// All three functions are total: any input, including the empty string,
// produces a result and nothing throws.
//
// KNOWN LIMITATION: strip_protocol() cuts at the first "//" anywhere in the
// input, not only after a "scheme:" prefix. "a.com/x//y" normalizes to "y".

// Everything after the first "//", or the input unchanged.
[[nodiscard]] std::string strip_protocol(std::string_view input);

// Everything before the first "/", or the input unchanged.
[[nodiscard]] std::string strip_path(std::string_view input);

// strip_path(strip_protocol(input))
[[nodiscard]] std::string get_domain(std::string_view input);

}  // namespace redirector::rules

#endif  // REDIRECTOR_RULES_DOMAIN_NORMALIZER_HPP
