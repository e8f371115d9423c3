#ifndef REDIRECTOR_STORE_RULE_STORE_HPP
#define REDIRECTOR_STORE_RULE_STORE_HPP

#include "redirector/rules/rule.hpp"

#include <tl/expected.hpp>

#include <string>
#include <string_view>
#include <utility>

namespace redirector {

// ─────────────────────────────────────────────────────────────────────────────
// Store Error Types
// ─────────────────────────────────────────────────────────────────────────────

struct StoreError {
    enum class Code {
        Io,      // File could not be opened, written or renamed
        Parse    // Stored data is not valid JSON or has the wrong shape
    };

    Code code;
    std::string message;

    static StoreError io(const std::string& msg) {
        return {Code::Io, msg};
    }

    static StoreError parse(const std::string& msg) {
        return {Code::Parse, msg};
    }
};

[[nodiscard]] constexpr std::string_view to_string(StoreError::Code code) noexcept {
    switch (code) {
        case StoreError::Code::Io:    return "Io";
        case StoreError::Code::Parse: return "Parse";
    }
    return "Unknown";
}

template <typename T>
using StoreResult = tl::expected<T, StoreError>;

// ─────────────────────────────────────────────────────────────────────────────
// IRuleStore - Persistence for the rule list
// ─────────────────────────────────────────────────────────────────────────────
// load() must return a consistent snapshot; save() replaces the whole list.
// Callers doing read-modify-write must not interleave another save between
// their load() and save().

class IRuleStore {
public:
    virtual ~IRuleStore() = default;

    [[nodiscard]] virtual StoreResult<RuleSet> load() = 0;
    [[nodiscard]] virtual StoreResult<void> save(const RuleSet& rules) = 0;
};

// ─────────────────────────────────────────────────────────────────────────────
// MemoryRuleStore - Keeps the rule list in process memory
// ─────────────────────────────────────────────────────────────────────────────

class MemoryRuleStore final : public IRuleStore {
public:
    MemoryRuleStore() = default;
    explicit MemoryRuleStore(RuleSet initial)
        : rules_(std::move(initial))
    {}

    [[nodiscard]] StoreResult<RuleSet> load() override {
        return rules_;
    }

    [[nodiscard]] StoreResult<void> save(const RuleSet& rules) override {
        rules_ = rules;
        return {};
    }

    [[nodiscard]] const RuleSet& rules() const noexcept {
        return rules_;
    }

private:
    RuleSet rules_;
};

}  // namespace redirector

#endif  // REDIRECTOR_STORE_RULE_STORE_HPP
