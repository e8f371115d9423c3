#include "redirector/notify/change_announcer.hpp"

#include "redirector/log/logger.hpp"

namespace redirector {

void LogAnnouncer::rule_added(const std::string& source) {
    get_logger().info_fmt("addRule: {}", source);
}

void LogAnnouncer::rule_removed(const std::string& source) {
    get_logger().info_fmt("deleteRule: {}", source);
}

}  // namespace redirector
