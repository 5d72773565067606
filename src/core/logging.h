#pragma once
// Copyright (c) 2024-2026 The txcombine Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef TXCOMBINE_CORE_LOGGING_H
#define TXCOMBINE_CORE_LOGGING_H

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iosfwd>
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
    FATAL   = 5,
    OFF     = 6,
};

// ---------------------------------------------------------------------------
// LogCategory: subsystem label printed on each line
// ---------------------------------------------------------------------------
enum class LogCategory : uint8_t {
    NONE,
    RPC,
    WALLET,
    MEMPOOL,
    FEES,
    BUILD,
    CONFIG,
};

/// Returns the short string name for a log level (e.g. "INFO", "WARN").
[[nodiscard]] std::string_view log_level_string(LogLevel level) noexcept;

/// Returns the short string name for a log category (e.g. "RPC").
[[nodiscard]] std::string_view log_category_string(
    LogCategory cat) noexcept;

// ---------------------------------------------------------------------------
// Logger: explicitly owned log sink
// ---------------------------------------------------------------------------
// There is no process-wide instance. The owner (the CLI, or a test) builds
// one and hands a reference to every component that logs. Not thread-safe;
// the tool runs on a single thread.
// ---------------------------------------------------------------------------
class Logger {
public:
    /// Creates a logger writing console output to @p console.
    explicit Logger(std::ostream& console);
    ~Logger();

    Logger(const Logger&)            = delete;
    Logger& operator=(const Logger&) = delete;

    // -- configuration ------------------------------------------------------

    void set_level(LogLevel level) noexcept { level_ = level; }

    /// Returns true if a message at the given level would actually be
    /// written. The category only labels the line.
    [[nodiscard]] bool will_log(LogLevel level,
                                LogCategory cat) const noexcept;

    /// Opens (or replaces) the output log file in append mode; lines then
    /// go to the console and the file. An empty path closes the current
    /// file. Returns false when the file cannot be opened.
    bool set_log_file(const std::filesystem::path& path);

    void flush();

    // -- logging entry point ------------------------------------------------

    /// Writes one formatted log line. Callers go through the LOG_* macros
    /// so that will_log() is checked before the message is built.
    void write(LogLevel level, LogCategory cat, std::string_view message);

private:
    static std::string format_line(LogLevel level, LogCategory cat,
                                   std::string_view message);
    /// UTC, millisecond precision: "2026-02-03 12:00:00.123"
    static std::string format_timestamp();

    std::ostream*  console_;
    std::ofstream  file_stream_;
    LogLevel       level_ = LogLevel::WARN;
    bool           print_to_file_ = false;
};

} // namespace core

// ---------------------------------------------------------------------------
// Convenience macros
// ---------------------------------------------------------------------------
// Usage:
//   LOG_DEBUG(logger, core::LogCategory::FEES, "old fees " + s);
//
// The message is only evaluated when the logger would write it.
// ---------------------------------------------------------------------------

#define TXCOMBINE_LOG(logger, lvl, cat, msg)                              \
    do {                                                                  \
        if ((logger).will_log((lvl), (cat))) {                            \
            (logger).write((lvl), (cat), std::string(msg));               \
        }                                                                 \
    } while (0)

#define LOG_TRACE(logger, cat, msg) \
    TXCOMBINE_LOG(logger, core::LogLevel::TRACE, cat, msg)
#define LOG_DEBUG(logger, cat, msg) \
    TXCOMBINE_LOG(logger, core::LogLevel::DEBUG, cat, msg)
#define LOG_INFO(logger, cat, msg) \
    TXCOMBINE_LOG(logger, core::LogLevel::INFO, cat, msg)
#define LOG_WARN(logger, cat, msg) \
    TXCOMBINE_LOG(logger, core::LogLevel::WARN, cat, msg)

#endif // TXCOMBINE_CORE_LOGGING_H
