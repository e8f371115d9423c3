#include "redirector/notify/notifier.hpp"

#include "redirector/log/logger.hpp"

namespace redirector {

std::chrono::milliseconds display_time_for(std::string_view text) noexcept {
    // Characters, not bytes: UTF-8 continuation bytes (10xxxxxx) are skipped.
    std::chrono::milliseconds::rep characters = 0;
    for (const char c : text) {
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
            ++characters;
        }
    }
    if (characters == 0) {
        return std::chrono::milliseconds{0};
    }
    return std::chrono::milliseconds{500 + 75 * characters};
}

std::optional<Notification> make_notification(
    const rules::ValidationOutcome& outcome,
    const MessageCatalog& catalog
) {
    std::string text;
    Severity severity = Severity::Error;

    switch (outcome.kind()) {
        case rules::OutcomeKind::Accepted:
            return std::nullopt;

        case rules::OutcomeKind::AcceptedWithAdvisory:
            text = catalog.get(messages::MISMATCHED_SUBDOMAINS);
            severity = Severity::Success;
            break;

        case rules::OutcomeKind::Rejected:
            switch (outcome.reason().value_or(rules::RejectReason::Empty)) {
                case rules::RejectReason::Empty:
                    text = catalog.get(messages::NO_EMPTY);
                    break;
                case rules::RejectReason::DuplicateSource:
                    text = catalog.get(messages::NO_DUPLICATES);
                    break;
                case rules::RejectReason::Cycle:
                    text = catalog.get(messages::NO_CYCLES);
                    break;
            }
            break;
    }

    Notification notification;
    notification.symbol = std::string(severity == Severity::Error ? WARNING_SYMBOL : SUCCESS_SYMBOL);
    notification.display_time = display_time_for(text);
    notification.text = std::move(text);
    notification.severity = severity;
    return notification;
}

void LogNotifier::notify(const Notification& notification) {
    auto& logger = get_logger();
    if (notification.severity == Severity::Error) {
        logger.warn_fmt("{} {}", notification.symbol, notification.text);
    } else {
        logger.info_fmt("{} {}", notification.symbol, notification.text);
    }
}

}  // namespace redirector
