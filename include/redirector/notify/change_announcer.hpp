#ifndef REDIRECTOR_NOTIFY_CHANGE_ANNOUNCER_HPP
#define REDIRECTOR_NOTIFY_CHANGE_ANNOUNCER_HPP

#include <functional>
#include <string>
#include <utility>

namespace redirector {

// ─────────────────────────────────────────────────────────────────────────────
// IChangeAnnouncer - Tells other components a rule source came or went
// ─────────────────────────────────────────────────────────────────────────────
// Called only after the change has been saved.

class IChangeAnnouncer {
public:
    virtual ~IChangeAnnouncer() = default;

    virtual void rule_added(const std::string& source) = 0;
    virtual void rule_removed(const std::string& source) = 0;
};

class NullAnnouncer final : public IChangeAnnouncer {
public:
    void rule_added(const std::string& /*source*/) override {}
    void rule_removed(const std::string& /*source*/) override {}
};

/// Logs each change at INFO.
class LogAnnouncer final : public IChangeAnnouncer {
public:
    void rule_added(const std::string& source) override;
    void rule_removed(const std::string& source) override;
};

/// Forwards to user callbacks; an unset callback is skipped.
class CallbackAnnouncer final : public IChangeAnnouncer {
public:
    using Callback = std::function<void(const std::string&)>;

    CallbackAnnouncer(Callback on_added, Callback on_removed)
        : on_added_(std::move(on_added))
        , on_removed_(std::move(on_removed))
    {}

    void rule_added(const std::string& source) override {
        if (on_added_) {
            on_added_(source);
        }
    }

    void rule_removed(const std::string& source) override {
        if (on_removed_) {
            on_removed_(source);
        }
    }

private:
    Callback on_added_;
    Callback on_removed_;
};

}  // namespace redirector

#endif  // REDIRECTOR_NOTIFY_CHANGE_ANNOUNCER_HPP
