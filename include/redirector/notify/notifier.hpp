#ifndef REDIRECTOR_NOTIFY_NOTIFIER_HPP
#define REDIRECTOR_NOTIFY_NOTIFIER_HPP

#include "redirector/notify/message_catalog.hpp"
#include "redirector/rules/rule_validator.hpp"

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace redirector {

// ─────────────────────────────────────────────────────────────────────────────
// Notification
// ─────────────────────────────────────────────────────────────────────────────

enum class Severity {
    Error,    // Rule was refused
    Success   // Rule was added, with a caveat
};

[[nodiscard]] constexpr std::string_view to_string(Severity severity) noexcept {
    switch (severity) {
        case Severity::Error:   return "Error";
        case Severity::Success: return "Success";
    }
    return "Unknown";
}

// Popup background class the options page used for each severity.
[[nodiscard]] constexpr std::string_view color_for(Severity severity) noexcept {
    return severity == Severity::Error ? "red" : "green";
}

inline constexpr std::string_view WARNING_SYMBOL = "⚠";
inline constexpr std::string_view SUCCESS_SYMBOL = "✓";

struct Notification {
    std::string symbol;
    std::string text;
    Severity severity{Severity::Error};
    std::chrono::milliseconds display_time{0};

    [[nodiscard]] Json to_json() const {
        return {
            {"symbol", symbol},
            {"text", text},
            {"severity", std::string(to_string(severity))},
            {"color", std::string(color_for(severity))},
            {"displayTimeMs", display_time.count()}
        };
    }
};

/// How long a reader needs for `text`: 0 for empty text, otherwise
/// 500ms plus 75ms per character. `text` is UTF-8; each code point counts
/// once.
[[nodiscard]] std::chrono::milliseconds display_time_for(std::string_view text) noexcept;

/// Popup for an outcome, or nullopt when a plain Accepted needs none.
[[nodiscard]] std::optional<Notification> make_notification(
    const rules::ValidationOutcome& outcome,
    const MessageCatalog& catalog
);

// ─────────────────────────────────────────────────────────────────────────────
// INotifier - Presents notifications to the user
// ─────────────────────────────────────────────────────────────────────────────

class INotifier {
public:
    virtual ~INotifier() = default;
    virtual void notify(const Notification& notification) = 0;
};

/// Routes notifications through the global logger: errors at WARN,
/// advisories at INFO.
class LogNotifier final : public INotifier {
public:
    void notify(const Notification& notification) override;
};

/// Keeps every notification; used by tests and by the CLI's --json mode.
/// Safe to share between threads.
class CapturingNotifier final : public INotifier {
public:
    void notify(const Notification& notification) override {
        std::lock_guard<std::mutex> lock(mutex_);
        notifications_.push_back(notification);
    }

    [[nodiscard]] std::vector<Notification> notifications() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return notifications_;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        notifications_.clear();
    }

private:
    mutable std::mutex mutex_;
    std::vector<Notification> notifications_;
};

}  // namespace redirector

#endif  // REDIRECTOR_NOTIFY_NOTIFIER_HPP
