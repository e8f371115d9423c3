#include "redirector/editor/rule_editor.hpp"

#include "redirector/log/logger.hpp"
#include "redirector/store/json_file_rule_store.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

namespace redirector {

namespace {

constexpr std::string_view WHITESPACE = " \t\n\v\f\r";

std::string trim_copy(std::string_view value) {
    const auto begin = value.find_first_not_of(WHITESPACE);
    if (begin == std::string_view::npos) {
        return {};
    }
    const auto end = value.find_last_not_of(WHITESPACE);
    return std::string(value.substr(begin, end - begin + 1));
}

}  // namespace

RuleEditor::RuleEditor(
    std::unique_ptr<IRuleStore> store,
    std::unique_ptr<INotifier> notifier,
    std::unique_ptr<IChangeAnnouncer> announcer,
    MessageCatalog catalog
)
    : store_(std::move(store))
    , notifier_(std::move(notifier))
    , announcer_(std::move(announcer))
    , catalog_(std::move(catalog))
{
    if (!store_) {
        throw std::invalid_argument("RuleEditor: store cannot be null");
    }
    if (!notifier_) {
        notifier_ = std::make_unique<LogNotifier>();
    }
    if (!announcer_) {
        announcer_ = std::make_unique<NullAnnouncer>();
    }
}

std::string RuleEditor::element_id_for(std::size_t index) {
    return std::string(DELETE_BUTTON_PREFIX) + std::to_string(index);
}

// ─────────────────────────────────────────────────────────────────────────────
// Adding
// ─────────────────────────────────────────────────────────────────────────────

EditResult<rules::ValidationOutcome> RuleEditor::add_rule(
    std::string_view source,
    std::string_view destination,
    bool is_regex
) {
    std::optional<rules::ValidationOutcome> outcome;
    std::optional<Notification> notification;
    Rule rule;

    {
        std::lock_guard<std::mutex> lock(mutex_);

        auto current = store_->load();
        if (!current) {
            get_logger().error_fmt("Failed to load rules: {}", current.error().message);
            return tl::unexpected(EditError::store(current.error()));
        }

        outcome = rules::validate(source, destination, *current);
        notification = make_notification(*outcome, catalog_);

        if (outcome->is_accepted()) {
            rule.source = trim_on_store_ ? trim_copy(source) : std::string(source);
            rule.destination = trim_on_store_ ? trim_copy(destination) : std::string(destination);
            rule.is_regex = is_regex;
            current->push_back(rule);

            auto saved = store_->save(*current);
            if (!saved) {
                get_logger().error_fmt("Failed to save rules: {}", saved.error().message);
                return tl::unexpected(EditError::store(saved.error()));
            }
        }
    }

    // Notifier and announcer run unlocked: either may call back into the editor.
    if (notification) {
        notifier_->notify(*notification);
    }

    if (!outcome->is_accepted()) {
        get_logger().debug_fmt(
            "Failed to add rule: '{}' -> '{}', regex: {}. {}",
            source, destination, is_regex, rules::to_string(*outcome));
        return tl::unexpected(EditError::rejected(*outcome->reason()));
    }

    announcer_->rule_added(rule.source);
    get_logger().debug_fmt(
        "Added new rule: '{}' -> '{}', regex: {}", rule.source, rule.destination, rule.is_regex);
    return *outcome;
}

EditResult<rules::ValidationOutcome> RuleEditor::check_rule(
    std::string_view source,
    std::string_view destination
) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto current = store_->load();
    if (!current) {
        return tl::unexpected(EditError::store(current.error()));
    }
    return rules::validate(source, destination, *current);
}

// ─────────────────────────────────────────────────────────────────────────────
// Deleting
// ─────────────────────────────────────────────────────────────────────────────

EditResult<Rule> RuleEditor::delete_rule(std::string_view element_id) {
    const auto index = rules::parse_trailing_index(element_id);
    if (!index) {
        get_logger().debug_fmt("Invalid button index from button: {}", element_id);
        return tl::unexpected(EditError::invalid_index(element_id));
    }
    return delete_rule_at(*index);
}

EditResult<Rule> RuleEditor::delete_rule_at(std::size_t index) {
    Rule removed;

    {
        std::lock_guard<std::mutex> lock(mutex_);

        auto current = store_->load();
        if (!current) {
            get_logger().error_fmt("Failed to load rules: {}", current.error().message);
            return tl::unexpected(EditError::store(current.error()));
        }

        if (index >= current->size()) {
            get_logger().debug_fmt("No rule at index {} ({} rules)", index, current->size());
            return tl::unexpected(EditError::index_out_of_range(index, current->size()));
        }

        const auto position = current->begin() + static_cast<RuleSet::difference_type>(index);
        removed = std::move(*position);
        current->erase(position);

        auto saved = store_->save(*current);
        if (!saved) {
            get_logger().error_fmt("Failed to save rules: {}", saved.error().message);
            return tl::unexpected(EditError::store(saved.error()));
        }
    }

    announcer_->rule_removed(removed.source);
    get_logger().debug_fmt("Rule at index {} has been deleted: '{}'", index, removed.source);
    return removed;
}

// ─────────────────────────────────────────────────────────────────────────────
// Listing
// ─────────────────────────────────────────────────────────────────────────────

EditResult<RuleSet> RuleEditor::list_rules() {
    std::lock_guard<std::mutex> lock(mutex_);

    auto current = store_->load();
    if (!current) {
        return tl::unexpected(EditError::store(current.error()));
    }
    return std::move(*current);
}

// ─────────────────────────────────────────────────────────────────────────────
// Factory
// ─────────────────────────────────────────────────────────────────────────────

EditResult<std::unique_ptr<RuleEditor>> make_rule_editor(
    const EditorConfig& config,
    std::unique_ptr<INotifier> notifier
) {
    MessageCatalog catalog;
    if (config.messages_path) {
        auto merged = catalog.merge_file(*config.messages_path);
        if (!merged) {
            return tl::unexpected(EditError::store(merged.error()));
        }
        get_logger().debug_fmt("Loaded {} message(s) from {}", *merged, config.messages_path->string());
    }

    auto editor = std::make_unique<RuleEditor>(
        std::make_unique<JsonFileRuleStore>(config.store_path),
        std::move(notifier),
        std::make_unique<LogAnnouncer>(),
        std::move(catalog)
    );
    editor->set_trim_on_store(config.trim_on_store);
    return editor;
}

std::unique_ptr<SpdlogLogger> make_editor_logger(const EditorConfig& config) {
    // stderr keeps JSON written to stdout parseable.
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    if (config.log_file) {
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_file->string()));
    }
    return std::make_unique<SpdlogLogger>(std::move(sinks), config.log_level);
}

}  // namespace redirector
