// Copyright (c) 2025-2026 The Sandguard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/logging.h"

#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iostream>

namespace core {

namespace {

bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

std::string_view trim_ws(std::string_view sv) {
    while (!sv.empty() &&
           std::isspace(static_cast<unsigned char>(sv.front()))) {
        sv.remove_prefix(1);
    }
    while (!sv.empty() &&
           std::isspace(static_cast<unsigned char>(sv.back()))) {
        sv.remove_suffix(1);
    }
    return sv;
}

struct CategoryName {
    LogCategory cat;
    std::string_view name;
};

constexpr CategoryName CATEGORY_NAMES[] = {
    {LogCategory::ENGINE,   "ENGINE"},
    {LogCategory::CONFIG,   "CONFIG"},
    {LogCategory::STORE,    "STORE"},
    {LogCategory::STRATEGY, "STRATEGY"},
    {LogCategory::METRICS,  "METRICS"},
};

} // anonymous namespace

// ---------------------------------------------------------------------------
// Names
// ---------------------------------------------------------------------------

std::string_view log_level_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERR:   return "ERROR";
        case LogLevel::OFF:   return "OFF";
    }
    return "UNKNOWN";
}

std::string_view log_category_string(LogCategory cat) noexcept {
    const uint32_t bits = static_cast<uint32_t>(cat);
    if (bits == 0) return "NONE";

    const uint32_t lowest = bits & (~bits + 1u);
    for (const auto& entry : CATEGORY_NAMES) {
        if (static_cast<uint32_t>(entry.cat) == lowest) return entry.name;
    }
    return "UNKNOWN";
}

LogLevel parse_log_level(std::string_view name, LogLevel fallback) noexcept {
    name = trim_ws(name);
    if (iequals(name, "trace")) return LogLevel::TRACE;
    if (iequals(name, "debug")) return LogLevel::DEBUG;
    if (iequals(name, "info"))  return LogLevel::INFO;
    if (iequals(name, "warn") || iequals(name, "warning")) {
        return LogLevel::WARN;
    }
    if (iequals(name, "error")) return LogLevel::ERR;
    if (iequals(name, "off"))   return LogLevel::OFF;
    return fallback;
}

LogCategory parse_log_categories(std::string_view names) {
    LogCategory mask = LogCategory::NONE;
    while (!names.empty()) {
        const auto comma = names.find(',');
        const std::string_view token = trim_ws(names.substr(0, comma));

        if (iequals(token, "all")) {
            mask |= LogCategory::ALL;
        } else {
            for (const auto& entry : CATEGORY_NAMES) {
                if (iequals(token, entry.name)) mask |= entry.cat;
            }
        }

        if (comma == std::string_view::npos) break;
        names.remove_prefix(comma + 1);
    }
    return mask;
}

// ---------------------------------------------------------------------------
// Logger
// ---------------------------------------------------------------------------

Logger& Logger::instance() {
    static Logger the_logger;
    return the_logger;
}

Logger::~Logger() {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (file_stream_.is_open()) file_stream_.flush();
}

void Logger::set_level(LogLevel lvl) {
    level_.store(static_cast<int>(lvl), std::memory_order_release);
}

void Logger::set_categories(LogCategory cats) {
    enabled_categories_.store(static_cast<uint32_t>(cats),
                              std::memory_order_release);
}

LogLevel Logger::level() const noexcept {
    return static_cast<LogLevel>(level_.load(std::memory_order_acquire));
}

LogCategory Logger::enabled_categories() const noexcept {
    return static_cast<LogCategory>(
        enabled_categories_.load(std::memory_order_acquire));
}

bool Logger::will_log(LogLevel lvl, LogCategory cat) const noexcept {
    if (lvl == LogLevel::OFF ||
        static_cast<int>(lvl) < level_.load(std::memory_order_acquire)) {
        return false;
    }
    const uint32_t cat_bits = static_cast<uint32_t>(cat);
    if (cat_bits != 0 &&
        (enabled_categories_.load(std::memory_order_acquire) & cat_bits) == 0) {
        return false;
    }
    return print_to_console_.load(std::memory_order_acquire) ||
           print_to_file_.load(std::memory_order_acquire);
}

void Logger::set_print_to_console(bool enable) {
    print_to_console_.store(enable, std::memory_order_release);
}

Result<void> Logger::set_log_file(const std::filesystem::path& path) {
    std::lock_guard<std::mutex> lock(write_mutex_);

    if (file_stream_.is_open()) {
        file_stream_.flush();
        file_stream_.close();
    }
    if (path.empty()) {
        print_to_file_.store(false, std::memory_order_release);
        return make_ok();
    }

    file_stream_.open(path, std::ios::out | std::ios::app);
    if (!file_stream_.is_open()) {
        print_to_file_.store(false, std::memory_order_release);
        return make_error(ErrorCode::IO_ERROR,
                          "cannot open log file '" + path.string() + "'");
    }
    print_to_file_.store(true, std::memory_order_release);
    return make_ok();
}

void Logger::write(LogLevel lvl, LogCategory cat, std::string_view message) {
    std::string line;
    line.reserve(48 + message.size());
    line += '[';
    line += format_timestamp();
    line += "] [";
    line += log_level_string(lvl);
    line += "] [";
    line += log_category_string(cat);
    line += "] ";
    line += message;
    line += '\n';

    std::lock_guard<std::mutex> lock(write_mutex_);
    if (print_to_console_.load(std::memory_order_relaxed)) {
        std::cerr.write(line.data(), static_cast<std::streamsize>(line.size()));
    }
    if (print_to_file_.load(std::memory_order_relaxed) &&
        file_stream_.is_open()) {
        file_stream_.write(line.data(),
                           static_cast<std::streamsize>(line.size()));
        // Warnings and errors must survive a crash right after them.
        if (lvl >= LogLevel::WARN) file_stream_.flush();
    }
}

std::string Logger::format_timestamp() {
    using Clock = std::chrono::system_clock;

    const auto now = Clock::now();
    const auto epoch_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                              now.time_since_epoch()).count();
    const int millis = static_cast<int>(epoch_ms % 1000);

    const std::time_t time_val = Clock::to_time_t(now);
    std::tm tm_buf{};
#if defined(_WIN32) || defined(_WIN64)
    gmtime_s(&tm_buf, &time_val);
#else
    gmtime_r(&time_val, &tm_buf);
#endif

    char buf[32];
    const int n = std::snprintf(
        buf, sizeof(buf), "%04d-%02d-%02d %02d:%02d:%02d.%03d",
        tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
        tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, millis);
    return std::string(buf, static_cast<std::size_t>(n));
}

} // namespace core
