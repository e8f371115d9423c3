#include "redirector/editor/editor_config.hpp"

#include <utility>

namespace redirector {

EditorConfig& EditorConfig::with_store_path(std::filesystem::path path) {
    store_path = std::move(path);
    return *this;
}

EditorConfig& EditorConfig::with_messages_path(std::filesystem::path path) {
    messages_path = std::move(path);
    return *this;
}

EditorConfig& EditorConfig::with_log_level(LogLevel level) {
    log_level = level;
    return *this;
}

EditorConfig& EditorConfig::with_log_file(std::filesystem::path path) {
    log_file = std::move(path);
    return *this;
}

EditorConfig& EditorConfig::with_trim_on_store(bool enabled) {
    trim_on_store = enabled;
    return *this;
}

}  // namespace redirector
