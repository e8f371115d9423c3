#include "redirector/rules/domain_normalizer.hpp"

namespace redirector::rules {

std::string strip_protocol(std::string_view input) {
    constexpr std::string_view marker = "//";
    const auto pos = input.find(marker);
    if (pos == std::string_view::npos) {
        return std::string(input);
    }
    return std::string(input.substr(pos + marker.size()));
}

std::string strip_path(std::string_view input) {
    const auto pos = input.find('/');
    if (pos == std::string_view::npos) {
        return std::string(input);
    }
    return std::string(input.substr(0, pos));
}

std::string get_domain(std::string_view input) {
    return strip_path(strip_protocol(input));
}

}  // namespace redirector::rules
