// ─────────────────────────────────────────────────────────────────────────────
// RuleEditor Tests
// ─────────────────────────────────────────────────────────────────────────────
// Add/delete workflows against MockRuleStore: what gets stored, what gets
// announced, and what must stay untouched when a step fails.

#include <catch2/catch_test_macros.hpp>

#include "mocks/mock_rule_store.hpp"

#include "redirector/editor/rule_editor.hpp"
#include "redirector/store/json_file_rule_store.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace redirector;
using redirector::testing::MockRuleStore;
using rules::OutcomeKind;
using rules::RejectReason;

namespace {

struct Announcements {
    std::vector<std::string> added;
    std::vector<std::string> removed;
};

// Editor wired to a mock store, a capturing notifier and a recording
// announcer. Raw pointers stay valid for the editor's lifetime.
struct Fixture {
    explicit Fixture(RuleSet initial = {}) {
        auto mock = std::make_unique<MockRuleStore>(std::move(initial));
        auto capturing = std::make_unique<CapturingNotifier>();
        store = mock.get();
        notifier = capturing.get();

        auto announcer = std::make_unique<CallbackAnnouncer>(
            [this](const std::string& source) { announced.added.push_back(source); },
            [this](const std::string& source) { announced.removed.push_back(source); }
        );

        editor = std::make_unique<RuleEditor>(std::move(mock), std::move(capturing), std::move(announcer));
    }

    Fixture(const Fixture&) = delete;
    Fixture& operator=(const Fixture&) = delete;

    MockRuleStore* store{nullptr};
    CapturingNotifier* notifier{nullptr};
    Announcements announced;
    std::unique_ptr<RuleEditor> editor;
};

// Records how many rules the editor reports while a notification is shown.
class ListingNotifier final : public INotifier {
public:
    void notify(const Notification& /*notification*/) override {
        auto current = editor->list_rules();
        sizes.push_back(current ? current->size() : 0);
    }

    RuleEditor* editor{nullptr};
    std::vector<std::size_t> sizes;
};

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Construction
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("RuleEditor requires a store", "[editor]") {
    REQUIRE_THROWS_AS(RuleEditor(nullptr), std::invalid_argument);
}

TEST_CASE("RuleEditor works with default notifier and announcer", "[editor]") {
    RuleEditor editor(std::make_unique<MemoryRuleStore>());

    auto added = editor.add_rule("a.com", "b.com");

    REQUIRE(added.has_value());
    REQUIRE(editor.list_rules()->size() == 1);
}

TEST_CASE("Element ids follow the delete button naming", "[editor]") {
    REQUIRE(RuleEditor::element_id_for(0) == "deleteRuleButton-0");
    REQUIRE(RuleEditor::element_id_for(12) == "deleteRuleButton-12");
}

// ═══════════════════════════════════════════════════════════════════════════
// Adding
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Accepted rule is trimmed, stored and announced", "[editor][add]") {
    Fixture f;

    auto added = f.editor->add_rule("  a.com  ", " b.com ", false);

    REQUIRE(added.has_value());
    REQUIRE(added->kind() == OutcomeKind::Accepted);
    REQUIRE(f.store->rules() == RuleSet{{"a.com", "b.com", false}});
    REQUIRE(f.announced.added == std::vector<std::string>{"a.com"});
    REQUIRE(f.notifier->notifications().empty());
}

TEST_CASE("Trimming can be switched off", "[editor][add]") {
    Fixture f;
    f.editor->set_trim_on_store(false);

    REQUIRE(f.editor->add_rule(" a.com", "b.com ").has_value());

    REQUIRE(f.store->rules().front() == Rule{" a.com", "b.com ", false});
}

TEST_CASE("Regex flag is stored with the rule", "[editor][add]") {
    Fixture f;

    REQUIRE(f.editor->add_rule("^https?://a\\.com/(.*)$", "b.com", true).has_value());

    REQUIRE(f.store->rules().front().is_regex);
}

TEST_CASE("Advisory rule is stored and notified", "[editor][add]") {
    Fixture f;

    auto added = f.editor->add_rule("amazon.com", "smile.amazon.com");

    REQUIRE(added.has_value());
    REQUIRE(added->has_advisory());
    REQUIRE(added->subdomain_delta() == 1);
    REQUIRE(f.store->rules().size() == 1);
    REQUIRE(f.notifier->notifications().size() == 1);
    REQUIRE(f.notifier->notifications()[0].severity == Severity::Success);
    REQUIRE(f.announced.added.size() == 1);
}

TEST_CASE("Rejected rule is notified but not stored", "[editor][add]") {
    Fixture f({{"a.com", "b.com", false}});

    SECTION("duplicate") {
        auto added = f.editor->add_rule("a.com", "c.com");
        REQUIRE_FALSE(added.has_value());
        REQUIRE(added.error().code == EditErrorCode::Rejected);
        REQUIRE(added.error().reason == RejectReason::DuplicateSource);
    }

    SECTION("cycle") {
        auto added = f.editor->add_rule("b.com", "a.com");
        REQUIRE_FALSE(added.has_value());
        REQUIRE(added.error().reason == RejectReason::Cycle);
    }

    SECTION("empty") {
        auto added = f.editor->add_rule("   ", "a.com");
        REQUIRE_FALSE(added.has_value());
        REQUIRE(added.error().reason == RejectReason::Empty);
    }

    REQUIRE(f.store->save_count() == 0);
    REQUIRE(f.store->rules().size() == 1);
    REQUIRE(f.announced.added.empty());
    REQUIRE(f.notifier->notifications().size() == 1);
    REQUIRE(f.notifier->notifications()[0].severity == Severity::Error);
}

TEST_CASE("Padded duplicate of a stored rule is admitted", "[editor][add]") {
    Fixture f;

    REQUIRE(f.editor->add_rule("a.com", "b.com").has_value());
    // Compared raw, then trimmed: the list ends up holding "a.com" twice.
    REQUIRE(f.editor->add_rule(" a.com", "c.com").has_value());

    const auto stored = f.store->rules();
    REQUIRE(stored.size() == 2);
    REQUIRE(stored[0].source == stored[1].source);
}

TEST_CASE("Load failure stops add before validation", "[editor][add]") {
    Fixture f;
    f.store->fail_next_load(StoreError::io("disk gone"));

    auto added = f.editor->add_rule("a.com", "b.com");

    REQUIRE_FALSE(added.has_value());
    REQUIRE(added.error().code == EditErrorCode::Store);
    REQUIRE(added.error().message.find("disk gone") != std::string::npos);
    REQUIRE(f.store->save_count() == 0);
    REQUIRE(f.notifier->notifications().empty());
}

TEST_CASE("Save failure is reported and nothing is announced", "[editor][add]") {
    Fixture f;
    f.store->fail_next_save(StoreError::io("read-only"));

    auto added = f.editor->add_rule("a.com", "b.com");

    REQUIRE_FALSE(added.has_value());
    REQUIRE(added.error().code == EditErrorCode::Store);
    REQUIRE(f.store->rules().empty());
    REQUIRE(f.announced.added.empty());
}

TEST_CASE("Failed save of an advisory rule shows no popup", "[editor][add]") {
    Fixture f;
    f.store->fail_next_save(StoreError::io("read-only"));

    auto added = f.editor->add_rule("amazon.com", "smile.amazon.com");

    REQUIRE_FALSE(added.has_value());
    REQUIRE(added.error().code == EditErrorCode::Store);
    REQUIRE(f.notifier->notifications().empty());
}

TEST_CASE("Unserializable rule leaves the rule file as it was", "[editor][add]") {
    const auto dir = std::filesystem::temp_directory_path() /
        ("redirector_editor_utf8_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
    const auto store_path = dir / "rules.json";

    RuleEditor editor(std::make_unique<JsonFileRuleStore>(store_path));
    REQUIRE(editor.add_rule("a.com", "b.com").has_value());

    auto added = editor.add_rule("bad\xff.com", "good.com");

    REQUIRE_FALSE(added.has_value());
    REQUIRE(added.error().code == EditErrorCode::Store);
    REQUIRE(*editor.list_rules() == RuleSet{{"a.com", "b.com", false}});

    std::filesystem::remove_all(dir);
}

TEST_CASE("check_rule validates without storing or notifying", "[editor][check]") {
    Fixture f({{"a.com", "b.com", false}});

    auto checked = f.editor->check_rule("b.com", "x.com");

    REQUIRE(checked.has_value());
    REQUIRE(checked->reason() == RejectReason::Cycle);
    REQUIRE(f.store->save_count() == 0);
    REQUIRE(f.notifier->notifications().empty());
}

// ═══════════════════════════════════════════════════════════════════════════
// Deleting
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Delete by element id removes that position", "[editor][delete]") {
    Fixture f({
        {"a.com", "b.com", false},
        {"c.com", "d.com", false},
        {"e.com", "f.com", false},
    });

    auto removed = f.editor->delete_rule("deleteRuleButton-1");

    REQUIRE(removed.has_value());
    REQUIRE(removed->source == "c.com");
    REQUIRE(f.store->rules() == RuleSet{{"a.com", "b.com", false}, {"e.com", "f.com", false}});
    REQUIRE(f.announced.removed == std::vector<std::string>{"c.com"});
}

TEST_CASE("Element id without digits leaves the store untouched", "[editor][delete]") {
    Fixture f({{"a.com", "b.com", false}});

    auto removed = f.editor->delete_rule("deleteRuleButton-");

    REQUIRE_FALSE(removed.has_value());
    REQUIRE(removed.error().code == EditErrorCode::InvalidIndex);
    REQUIRE(f.store->load_count() == 0);
    REQUIRE(f.store->save_count() == 0);
    REQUIRE(f.store->rules().size() == 1);
    REQUIRE(f.announced.removed.empty());
}

TEST_CASE("Index past the end is reported without saving", "[editor][delete]") {
    Fixture f({{"a.com", "b.com", false}});

    auto removed = f.editor->delete_rule_at(1);

    REQUIRE_FALSE(removed.has_value());
    REQUIRE(removed.error().code == EditErrorCode::IndexOutOfRange);
    REQUIRE(f.store->save_count() == 0);
    REQUIRE(f.store->rules().size() == 1);
}

TEST_CASE("Delete save failure keeps the rule and skips the announcement", "[editor][delete]") {
    Fixture f({{"a.com", "b.com", false}});
    f.store->fail_next_save(StoreError::io("read-only"));

    auto removed = f.editor->delete_rule_at(0);

    REQUIRE_FALSE(removed.has_value());
    REQUIRE(removed.error().code == EditErrorCode::Store);
    REQUIRE(f.store->rules().size() == 1);
    REQUIRE(f.announced.removed.empty());
}

TEST_CASE("Deleted source can be added again", "[editor][delete]") {
    Fixture f({{"a.com", "b.com", false}});

    REQUIRE(f.editor->delete_rule(RuleEditor::element_id_for(0)).has_value());
    REQUIRE(f.editor->add_rule("a.com", "z.com").has_value());
    REQUIRE(f.store->rules() == RuleSet{{"a.com", "z.com", false}});
}

// ═══════════════════════════════════════════════════════════════════════════
// Concurrency
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Concurrent adds of the same source store it once", "[editor][concurrency]") {
    Fixture f;
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&f, i] {
            (void)f.editor->add_rule("same.com", "dest" + std::to_string(i) + ".com");
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    REQUIRE(f.store->rules().size() == 1);
    REQUIRE(f.announced.added.size() == 1);
}

TEST_CASE("Announcer may read the rules back from the editor", "[editor][concurrency]") {
    RuleEditor* editor_ptr = nullptr;
    std::vector<std::size_t> sizes;
    const auto record_size = [&](const std::string& /*source*/) {
        sizes.push_back(editor_ptr->list_rules()->size());
    };

    RuleEditor editor(
        std::make_unique<MemoryRuleStore>(),
        nullptr,
        std::make_unique<CallbackAnnouncer>(record_size, record_size)
    );
    editor_ptr = &editor;

    REQUIRE(editor.add_rule("a.com", "b.com").has_value());
    REQUIRE(editor.delete_rule(RuleEditor::element_id_for(0)).has_value());

    REQUIRE(sizes == std::vector<std::size_t>{1, 0});
}

TEST_CASE("Notifier may read the rules back from the editor", "[editor][concurrency]") {
    auto listing = std::make_unique<ListingNotifier>();
    auto* notifier = listing.get();
    RuleEditor editor(std::make_unique<MemoryRuleStore>(), std::move(listing));
    notifier->editor = &editor;

    REQUIRE(editor.add_rule("amazon.com", "smile.amazon.com").has_value());
    REQUIRE_FALSE(editor.add_rule("amazon.com", "other.com").has_value());

    REQUIRE(notifier->sizes == std::vector<std::size_t>{1, 1});
}

// ═══════════════════════════════════════════════════════════════════════════
// make_rule_editor
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("make_rule_editor wires a JSON file store", "[editor][config]") {
    const auto dir = std::filesystem::temp_directory_path() /
        ("redirector_editor_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
    const auto store_path = dir / "rules.json";

    EditorConfig config;
    config.with_store_path(store_path).with_trim_on_store(true);

    auto editor = make_rule_editor(config);
    REQUIRE(editor.has_value());
    REQUIRE((*editor)->add_rule(" a.com ", "b.com").has_value());

    JsonFileRuleStore reread(store_path);
    auto stored = reread.load();
    REQUIRE(stored.has_value());
    REQUIRE(*stored == RuleSet{{"a.com", "b.com", false}});

    std::filesystem::remove_all(dir);
}

TEST_CASE("make_rule_editor applies a messages file", "[editor][config]") {
    const auto dir = std::filesystem::temp_directory_path() /
        ("redirector_editor_msgs_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
    std::filesystem::create_directories(dir);
    {
        std::ofstream out(dir / "messages.json");
        out << R"({"options_no_cycles_string": {"message": "Loop"}})";
    }

    EditorConfig config;
    config.with_store_path(dir / "rules.json").with_messages_path(dir / "messages.json");

    auto editor = make_rule_editor(config);
    REQUIRE(editor.has_value());
    REQUIRE((*editor)->catalog().get(messages::NO_CYCLES) == "Loop");

    std::filesystem::remove_all(dir);
}

TEST_CASE("make_rule_editor fails on a missing messages file", "[editor][config]") {
    EditorConfig config;
    config.with_messages_path("/nonexistent/redirector/messages.json");

    auto editor = make_rule_editor(config);

    REQUIRE_FALSE(editor.has_value());
    REQUIRE(editor.error().code == EditErrorCode::Store);
}

TEST_CASE("make_rule_editor sends popups to a given notifier", "[editor][config]") {
    const auto dir = std::filesystem::temp_directory_path() /
        ("redirector_editor_notify_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));

    auto capturing = std::make_unique<CapturingNotifier>();
    auto* notifier = capturing.get();
    EditorConfig config;
    config.with_store_path(dir / "rules.json");

    auto editor = make_rule_editor(config, std::move(capturing));
    REQUIRE(editor.has_value());
    REQUIRE((*editor)->add_rule("amazon.com", "smile.amazon.com").has_value());

    const auto shown = notifier->notifications();
    REQUIRE(shown.size() == 1);
    REQUIRE(shown[0].severity == Severity::Success);
    REQUIRE(shown[0].text == (*editor)->catalog().get(messages::MISMATCHED_SUBDOMAINS));

    std::filesystem::remove_all(dir);
}

TEST_CASE("make_editor_logger honours level and log file", "[editor][config][log]") {
    const auto dir = std::filesystem::temp_directory_path() /
        ("redirector_editor_log_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
    std::filesystem::create_directories(dir);
    const auto log_path = dir / "editor.log";

    EditorConfig config;
    config.with_log_level(LogLevel::Info).with_log_file(log_path);

    {
        auto logger = make_editor_logger(config);
        REQUIRE_FALSE(logger->should_log(LogLevel::Debug));
        REQUIRE(logger->should_log(LogLevel::Info));

        logger->debug("addRule: hidden.com");
        logger->info("Rule added: shown.com");
        logger->flush();
    }

    std::ifstream in(log_path);
    const std::string content{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    REQUIRE(content.find("hidden.com") == std::string::npos);
    REQUIRE(content.find("Rule added: shown.com") != std::string::npos);

    in.close();
    std::filesystem::remove_all(dir);
}

TEST_CASE("make_editor_logger without a log file only sets the level", "[editor][config][log]") {
    EditorConfig config;
    config.with_log_level(LogLevel::Error);

    auto logger = make_editor_logger(config);

    REQUIRE(logger->get_spdlog_logger()->sinks().size() == 1);
    REQUIRE_FALSE(logger->should_log(LogLevel::Warn));
    REQUIRE(logger->should_log(LogLevel::Error));
}

TEST_CASE("EditorConfig defaults", "[editor][config]") {
    EditorConfig config;

    REQUIRE(config.store_path == "redirection_rules.json");
    REQUIRE_FALSE(config.messages_path.has_value());
    REQUIRE(config.log_level == LogLevel::Warn);
    REQUIRE_FALSE(config.log_file.has_value());
    REQUIRE(config.trim_on_store);
}
