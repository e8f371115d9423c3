#ifndef REDIRECTOR_EDITOR_RULE_EDITOR_HPP
#define REDIRECTOR_EDITOR_RULE_EDITOR_HPP

#include "redirector/editor/edit_error.hpp"
#include "redirector/editor/editor_config.hpp"
#include "redirector/log/spdlog_logger.hpp"
#include "redirector/notify/change_announcer.hpp"
#include "redirector/notify/message_catalog.hpp"
#include "redirector/notify/notifier.hpp"
#include "redirector/rules/rule_validator.hpp"
#include "redirector/store/rule_store.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace redirector {

// Prefix of the per-row delete control ids: "deleteRuleButton-<index>".
inline constexpr std::string_view DELETE_BUTTON_PREFIX = "deleteRuleButton-";

// ═══════════════════════════════════════════════════════════════════════════
// RuleEditor
// ═══════════════════════════════════════════════════════════════════════════
// Owns the add/delete workflow around the pure validator:
//
//   add_rule:    load -> validate -> notify -> trim -> append -> save -> announce
//   delete_rule: parse index -> load -> erase -> save -> announce
//
// Each workflow holds an internal lock from load() to save(), so calls on
// one editor never see each other's stale snapshot. Nothing guards against
// another process writing the same store.
//
// The notifier and announcer are called after the lock is released, so they
// may call back into the editor. The announcer is only called after a
// successful save. When a save fails nothing is notified.

class RuleEditor {
public:
    RuleEditor(
        std::unique_ptr<IRuleStore> store,
        std::unique_ptr<INotifier> notifier = nullptr,
        std::unique_ptr<IChangeAnnouncer> announcer = nullptr,
        MessageCatalog catalog = {}
    );

    RuleEditor(const RuleEditor&) = delete;
    RuleEditor& operator=(const RuleEditor&) = delete;

    /// Validate and, if admitted, store a new rule. A rejection is returned
    /// as EditErrorCode::Rejected after the notifier has been told.
    [[nodiscard]] EditResult<rules::ValidationOutcome> add_rule(
        std::string_view source,
        std::string_view destination,
        bool is_regex = false
    );

    /// Validate against the current rules without storing or notifying.
    [[nodiscard]] EditResult<rules::ValidationOutcome> check_rule(
        std::string_view source,
        std::string_view destination
    );

    /// Delete by element id ("deleteRuleButton-3"). An id without digits
    /// fails with InvalidIndex before the store is read.
    [[nodiscard]] EditResult<Rule> delete_rule(std::string_view element_id);

    [[nodiscard]] EditResult<Rule> delete_rule_at(std::size_t index);

    [[nodiscard]] EditResult<RuleSet> list_rules();

    [[nodiscard]] const MessageCatalog& catalog() const noexcept {
        return catalog_;
    }

    void set_trim_on_store(bool enabled) noexcept {
        trim_on_store_ = enabled;
    }

    [[nodiscard]] static std::string element_id_for(std::size_t index);

private:
    std::unique_ptr<IRuleStore> store_;
    std::unique_ptr<INotifier> notifier_;
    std::unique_ptr<IChangeAnnouncer> announcer_;
    MessageCatalog catalog_;
    bool trim_on_store_{true};
    std::mutex mutex_;
};

/// JSON file store and log announcer wired from `config`. Notifications go
/// to `notifier`, or to a LogNotifier when none is given. Fails if the
/// configured messages file cannot be read.
[[nodiscard]] EditResult<std::unique_ptr<RuleEditor>> make_rule_editor(
    const EditorConfig& config,
    std::unique_ptr<INotifier> notifier = nullptr
);

/// Logger at `config.log_level` writing to stderr, plus `config.log_file`
/// when set. Install it with set_logger().
/// Throws spdlog::spdlog_ex if the log file cannot be opened.
[[nodiscard]] std::unique_ptr<SpdlogLogger> make_editor_logger(const EditorConfig& config);

}  // namespace redirector

#endif  // REDIRECTOR_EDITOR_RULE_EDITOR_HPP
