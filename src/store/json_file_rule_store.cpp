#include "redirector/store/json_file_rule_store.hpp"

#include "redirector/log/logger.hpp"

#include <fstream>
#include <sstream>
#include <string>
#include <system_error>

namespace redirector {

namespace fs = std::filesystem;

JsonFileRuleStore::JsonFileRuleStore(fs::path path)
    : path_(std::move(path))
{}

// ─────────────────────────────────────────────────────────────────────────────
// Reading
// ─────────────────────────────────────────────────────────────────────────────

StoreResult<Json> JsonFileRuleStore::read_document() const {
    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        if (ec) {
            return tl::unexpected(StoreError::io("cannot stat " + path_.string() + ": " + ec.message()));
        }
        return Json::object();
    }

    std::ifstream stream(path_, std::ios::binary);
    if (!stream.is_open()) {
        return tl::unexpected(StoreError::io("cannot open " + path_.string() + " for reading"));
    }

    std::ostringstream buffer;
    buffer << stream.rdbuf();
    if (stream.bad()) {
        return tl::unexpected(StoreError::io("read failed for " + path_.string()));
    }

    const std::string body = buffer.str();
    if (body.find_first_not_of(" \t\r\n") == std::string::npos) {
        return Json::object();
    }

    try {
        return Json::parse(body);
    } catch (const Json::parse_error& err) {
        return tl::unexpected(StoreError::parse(std::string("invalid JSON: ") + err.what()));
    }
}

StoreResult<RuleSet> JsonFileRuleStore::load() {
    auto document = read_document();
    if (!document) {
        return tl::unexpected(document.error());
    }

    if (!document->is_object()) {
        return tl::unexpected(StoreError::parse("top-level value is not an object"));
    }

    const auto it = document->find(RULES_STORAGE_KEY);
    if (it == document->end() || it->is_null()) {
        return RuleSet{};
    }
    if (!it->is_array()) {
        return tl::unexpected(StoreError::parse(std::string(RULES_STORAGE_KEY) + " is not an array"));
    }

    try {
        auto rules = rules_from_json(*it);
        REDIRECTOR_LOG_TRACE("loaded " + std::to_string(rules.size()) + " rule(s) from " + path_.string());
        return rules;
    } catch (const Json::exception& err) {
        return tl::unexpected(StoreError::parse(std::string("malformed rule entry: ") + err.what()));
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Writing
// ─────────────────────────────────────────────────────────────────────────────

StoreResult<void> JsonFileRuleStore::save(const RuleSet& rules) {
    // Keep any unrelated keys already in the document.
    auto existing = read_document();
    if (!existing) {
        return tl::unexpected(existing.error());
    }
    Json document = existing->is_object() ? std::move(*existing) : Json::object();
    document[RULES_STORAGE_KEY] = rules_to_json(rules);

    // Serialized before anything touches the disk: dump() throws on strings
    // that are not valid UTF-8.
    std::string body;
    try {
        body = document.dump(2);
    } catch (const Json::type_error& err) {
        return tl::unexpected(StoreError::parse(std::string("cannot serialize rules: ") + err.what()));
    }

    std::error_code ec;
    if (path_.has_parent_path()) {
        fs::create_directories(path_.parent_path(), ec);
        if (ec) {
            return tl::unexpected(StoreError::io(
                "cannot create " + path_.parent_path().string() + ": " + ec.message()));
        }
    }

    fs::path temp_path = path_;
    temp_path += ".tmp";
    {
        std::ofstream stream(temp_path, std::ios::binary | std::ios::trunc);
        if (!stream.is_open()) {
            return tl::unexpected(StoreError::io("cannot open " + temp_path.string() + " for writing"));
        }
        stream << body << '\n';
        stream.flush();
        if (!stream) {
            stream.close();
            std::error_code cleanup_ec;
            fs::remove(temp_path, cleanup_ec);
            return tl::unexpected(StoreError::io("write failed for " + temp_path.string()));
        }
    }

    fs::rename(temp_path, path_, ec);
    if (ec) {
        const std::string reason = ec.message();
        std::error_code cleanup_ec;
        fs::remove(temp_path, cleanup_ec);
        return tl::unexpected(StoreError::io("cannot replace " + path_.string() + ": " + reason));
    }

    REDIRECTOR_LOG_TRACE("saved " + std::to_string(rules.size()) + " rule(s) to " + path_.string());
    return {};
}

}  // namespace redirector
