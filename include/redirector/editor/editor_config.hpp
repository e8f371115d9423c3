#ifndef REDIRECTOR_EDITOR_EDITOR_CONFIG_HPP
#define REDIRECTOR_EDITOR_EDITOR_CONFIG_HPP

#include "redirector/log/logger.hpp"

#include <filesystem>
#include <optional>

namespace redirector {

// ─────────────────────────────────────────────────────────────────────────────
// Editor Configuration
// ─────────────────────────────────────────────────────────────────────────────

struct EditorConfig {
    // JSON file holding the rule list.
    std::filesystem::path store_path{"redirection_rules.json"};

    // Optional locale file overriding the built-in notification texts.
    std::optional<std::filesystem::path> messages_path;

    LogLevel log_level{LogLevel::Warn};

    // When set, logs go to this file as well as the console.
    std::optional<std::filesystem::path> log_file;

    // Trim leading/trailing whitespace from source and destination before
    // a validated rule is stored.
    bool trim_on_store{true};

    // ─────────────────────────────────────────────────────────────────────────
    // Builder-Style Helpers
    // ─────────────────────────────────────────────────────────────────────────

    EditorConfig& with_store_path(std::filesystem::path path);
    EditorConfig& with_messages_path(std::filesystem::path path);
    EditorConfig& with_log_level(LogLevel level);
    EditorConfig& with_log_file(std::filesystem::path path);
    EditorConfig& with_trim_on_store(bool enabled);
};

}  // namespace redirector

#endif  // REDIRECTOR_EDITOR_EDITOR_CONFIG_HPP
