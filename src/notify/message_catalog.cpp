#include "redirector/notify/message_catalog.hpp"

#include <fstream>

namespace redirector {

MessageCatalog::MessageCatalog()
    : texts_{
          {messages::NO_EMPTY, "Source and destination can't be empty."},
          {messages::NO_DUPLICATES, "That source already has a redirect rule."},
          {messages::NO_CYCLES, "That source is already a destination. Adding it would create a redirect loop."},
          {messages::MISMATCHED_SUBDOMAINS,
           "Rule added, but the source and destination have a different number of subdomains. "
           "The redirect may not work as expected."},
          {messages::CURRENT_RULES, "Current rules:"},
          {messages::NO_RULES, "There are no redirect rules yet."},
      }
{}

std::string MessageCatalog::get(std::string_view id) const {
    const auto it = texts_.find(id);
    if (it == texts_.end()) {
        return {};
    }
    return it->second;
}

void MessageCatalog::set(std::string id, std::string text) {
    texts_.insert_or_assign(std::move(id), std::move(text));
}

std::size_t MessageCatalog::merge(const Json& document) {
    if (!document.is_object()) {
        return 0;
    }

    std::size_t merged = 0;
    for (const auto& [id, entry] : document.items()) {
        if (!entry.is_object()) {
            continue;
        }
        const auto message = entry.find("message");
        if (message == entry.end() || !message->is_string()) {
            continue;
        }
        set(id, message->get<std::string>());
        ++merged;
    }
    return merged;
}

StoreResult<std::size_t> MessageCatalog::merge_file(const std::filesystem::path& path) {
    std::ifstream stream(path);
    if (!stream.is_open()) {
        return tl::unexpected(StoreError::io("cannot open " + path.string()));
    }

    Json document;
    try {
        stream >> document;
    } catch (const Json::parse_error& err) {
        return tl::unexpected(StoreError::parse(std::string("invalid JSON in ") + path.string() + ": " + err.what()));
    }

    if (!document.is_object()) {
        return tl::unexpected(StoreError::parse(path.string() + ": top-level value is not an object"));
    }
    return merge(document);
}

}  // namespace redirector
