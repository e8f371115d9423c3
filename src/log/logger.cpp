#include "redirector/log/logger.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace redirector {

namespace {

constexpr std::string_view RESET  = "\033[0m";
constexpr std::string_view GRAY   = "\033[90m";
constexpr std::string_view CYAN   = "\033[36m";
constexpr std::string_view GREEN  = "\033[32m";
constexpr std::string_view YELLOW = "\033[33m";
constexpr std::string_view RED    = "\033[31m";
constexpr std::string_view BOLD   = "\033[1m";

[[nodiscard]] std::string_view level_color(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return GRAY;
        case LogLevel::Debug: return CYAN;
        case LogLevel::Info:  return GREEN;
        case LogLevel::Warn:  return YELLOW;
        case LogLevel::Error:
        case LogLevel::Fatal: return RED;
        case LogLevel::Off:   return RESET;
    }
    return RESET;
}

[[nodiscard]] std::string format_timestamp(const std::chrono::system_clock::time_point& tp) {
    const auto time_t_val = std::chrono::system_clock::to_time_t(tp);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()
    ).count() % 1000;

    std::tm tm_buf{};
    localtime_r(&time_t_val, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms;
    return oss.str();
}

[[nodiscard]] std::string_view file_basename(const char* path) noexcept {
    std::string_view sv(path);
    const auto slash = sv.find_last_of('/');
    return slash == std::string_view::npos ? sv : sv.substr(slash + 1);
}

[[nodiscard]] bool iequals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != static_cast<unsigned char>(b[i])) {
            return false;
        }
    }
    return true;
}

}  // namespace

std::optional<LogLevel> parse_log_level(std::string_view name) noexcept {
    if (iequals(name, "trace")) return LogLevel::Trace;
    if (iequals(name, "debug")) return LogLevel::Debug;
    if (iequals(name, "info"))  return LogLevel::Info;
    if (iequals(name, "warn") || iequals(name, "warning")) return LogLevel::Warn;
    if (iequals(name, "error")) return LogLevel::Error;
    if (iequals(name, "fatal")) return LogLevel::Fatal;
    if (iequals(name, "off"))   return LogLevel::Off;
    return std::nullopt;
}

// ─────────────────────────────────────────────────────────────────────────────
// ConsoleLogger
// ─────────────────────────────────────────────────────────────────────────────

void ConsoleLogger::log(const LogRecord& record) {
    if (!should_log(record.level)) {
        return;
    }

    std::ostringstream oss;
    const bool colors = colors_enabled_;

    if (colors) oss << GRAY;
    oss << format_timestamp(record.timestamp);
    if (colors) oss << RESET << ' ' << BOLD << level_color(record.level);
    else        oss << ' ';
    oss << std::setw(5) << std::left << to_string(record.level);
    if (colors) oss << RESET << ' ' << GRAY;
    else        oss << ' ';
    oss << file_basename(record.location.file_name()) << ':' << record.location.line();
    if (colors) oss << RESET;
    oss << ' ' << record.message << '\n';

    static std::mutex output_mutex;
    std::lock_guard<std::mutex> lock(output_mutex);
    std::cerr << oss.str();
}

// ─────────────────────────────────────────────────────────────────────────────
// Global Logger
// ─────────────────────────────────────────────────────────────────────────────

namespace {

std::unique_ptr<ILogger>& logger_instance() {
    static std::unique_ptr<ILogger> instance = std::make_unique<NullLogger>();
    return instance;
}

std::mutex& logger_mutex() {
    static std::mutex mutex;
    return mutex;
}

}  // namespace

ILogger& get_logger() noexcept {
    std::lock_guard<std::mutex> lock(logger_mutex());
    return *logger_instance();
}

void set_logger(std::unique_ptr<ILogger> logger) noexcept {
    std::lock_guard<std::mutex> lock(logger_mutex());
    if (logger) {
        logger_instance() = std::move(logger);
    } else {
        logger_instance() = std::make_unique<NullLogger>();
    }
}

}  // namespace redirector
