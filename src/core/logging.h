#pragma once
// Copyright (c) 2025-2026 The Sandguard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SANDGUARD_CORE_LOGGING_H
#define SANDGUARD_CORE_LOGGING_H

#include "core/error.h"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>
#include <string_view>

namespace core {

// ---------------------------------------------------------------------------
// LogLevel: severity levels for log messages
// ---------------------------------------------------------------------------
enum class LogLevel : int {
    TRACE   = 0,
    DEBUG   = 1,
    INFO    = 2,
    WARN    = 3,
    ERR     = 4,  // "ERROR" conflicts with Windows <windows.h> macro
    OFF     = 5,
};

// ---------------------------------------------------------------------------
// LogCategory: bitmask of engine subsystems
// ---------------------------------------------------------------------------
enum class LogCategory : uint32_t {
    NONE     = 0,
    ENGINE   = 1u << 0,   ///< trade lifecycle
    CONFIG   = 1u << 1,   ///< pool and host configuration
    STORE    = 1u << 2,   ///< backing store writes
    STRATEGY = 1u << 3,   ///< fee decisions
    METRICS  = 1u << 4,   ///< history updates, spikes
    ALL      = 0xFFFFFFFF,
};

inline constexpr LogCategory operator|(LogCategory a, LogCategory b) noexcept {
    return static_cast<LogCategory>(
        static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
}

inline constexpr LogCategory& operator|=(LogCategory& a,
                                          LogCategory b) noexcept {
    a = a | b;
    return a;
}

[[nodiscard]] std::string_view log_level_string(LogLevel level) noexcept;

/// Name of the lowest set bit, "NONE" for zero.
[[nodiscard]] std::string_view log_category_string(LogCategory cat) noexcept;

/// Parses "trace", "debug", "info", "warn", "error" or "off"
/// (case-insensitive).  Returns @p fallback when unknown.
[[nodiscard]] LogLevel parse_log_level(std::string_view name,
                                       LogLevel fallback) noexcept;

/// Parses a comma-separated category list ("engine,strategy", "all",
/// "none").  Unknown names are ignored.
[[nodiscard]] LogCategory parse_log_categories(std::string_view names);

// ---------------------------------------------------------------------------
// Logger: process-wide, thread-safe
//
// Filtering state is atomic so will_log() never takes the lock; the lock
// only serialises writes to the sinks.
// ---------------------------------------------------------------------------
class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level);
    void set_categories(LogCategory cats);

    [[nodiscard]] LogLevel level() const noexcept;
    [[nodiscard]] LogCategory enabled_categories() const noexcept;

    /// True if a message at @p level in @p cat would reach a sink.
    [[nodiscard]] bool will_log(LogLevel level,
                                LogCategory cat) const noexcept;

    void set_print_to_console(bool enable);

    /// Open @p path for appending and route file output there.  An empty
    /// path closes the current file.  On failure file output is disabled
    /// and an IO_ERROR is returned.
    [[nodiscard]] Result<void> set_log_file(const std::filesystem::path& path);

    /// Format and write one line:
    ///   [2026-02-03 12:00:00.123] [INFO] [CONFIG] message
    void write(LogLevel level, LogCategory cat, std::string_view message);

    Logger(const Logger&)            = delete;
    Logger& operator=(const Logger&) = delete;

private:
    Logger() = default;
    ~Logger();

    static std::string format_timestamp();

    std::atomic<int>      level_{static_cast<int>(LogLevel::INFO)};
    std::atomic<uint32_t> enabled_categories_{
        static_cast<uint32_t>(LogCategory::ALL)};
    std::atomic<bool>     print_to_console_{true};
    std::atomic<bool>     print_to_file_{false};

    std::mutex            write_mutex_;
    std::ofstream         file_stream_;
};

} // namespace core

// ---------------------------------------------------------------------------
// Convenience macros.  The will_log() check runs before the message
// expression is evaluated, so disabled levels cost one atomic load.
//
//   LOG_INFO(core::LogCategory::CONFIG, "pool " + short_id(id) + " set");
// ---------------------------------------------------------------------------

#define SANDGUARD_LOG(level, cat, msg)                                    \
    do {                                                                  \
        if (core::Logger::instance().will_log((level), (cat))) {          \
            core::Logger::instance().write((level), (cat),                \
                                           std::string(msg));             \
        }                                                                 \
    } while (0)

#define LOG_TRACE(cat, msg) SANDGUARD_LOG(core::LogLevel::TRACE, cat, msg)
#define LOG_DEBUG(cat, msg) SANDGUARD_LOG(core::LogLevel::DEBUG, cat, msg)
#define LOG_INFO(cat, msg)  SANDGUARD_LOG(core::LogLevel::INFO, cat, msg)
#define LOG_WARN(cat, msg)  SANDGUARD_LOG(core::LogLevel::WARN, cat, msg)

#endif // SANDGUARD_CORE_LOGGING_H
