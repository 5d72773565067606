// Copyright (c) 2024-2026 The txcombine Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/logging.h"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <ostream>

namespace core {

// ---------------------------------------------------------------------------
// log_level_string
// ---------------------------------------------------------------------------
std::string_view log_level_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERR:   return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        case LogLevel::OFF:   return "OFF";
    }
    return "UNKNOWN";
}

// ---------------------------------------------------------------------------
// log_category_string
// ---------------------------------------------------------------------------
std::string_view log_category_string(LogCategory cat) noexcept {
    switch (cat) {
        case LogCategory::NONE:    return "NONE";
        case LogCategory::RPC:     return "RPC";
        case LogCategory::WALLET:  return "WALLET";
        case LogCategory::MEMPOOL: return "MEMPOOL";
        case LogCategory::FEES:    return "FEES";
        case LogCategory::BUILD:   return "BUILD";
        case LogCategory::CONFIG:  return "CONFIG";
        default:                   break;
    }
    return "UNKNOWN";
}

// ---------------------------------------------------------------------------
// Logger -- construction / destruction
// ---------------------------------------------------------------------------
Logger::Logger(std::ostream& console) : console_(&console) {}

Logger::~Logger() {
    flush();
}

// ---------------------------------------------------------------------------
// Logger -- configuration
// ---------------------------------------------------------------------------
bool Logger::will_log(LogLevel lvl, LogCategory /*cat*/) const noexcept {
    return level_ != LogLevel::OFF && lvl >= level_;
}

bool Logger::set_log_file(const std::filesystem::path& path) {
    if (file_stream_.is_open()) {
        file_stream_.close();
    }
    print_to_file_ = false;
    if (path.empty()) {
        return true;
    }

    file_stream_.open(path, std::ios::out | std::ios::app);
    print_to_file_ = file_stream_.is_open();
    return print_to_file_;
}

void Logger::flush() {
    if (file_stream_.is_open()) {
        file_stream_.flush();
    }
    console_->flush();
}

// ---------------------------------------------------------------------------
// Logger -- writing
// ---------------------------------------------------------------------------
void Logger::write(LogLevel lvl, LogCategory cat,
                   std::string_view message) {
    const std::string line = format_line(lvl, cat, message);

    *console_ << line;
    if (print_to_file_) {
        file_stream_ << line;
    }

    // Warnings and errors may be the last thing printed before exit.
    if (lvl >= LogLevel::WARN) {
        flush();
    }
}

//   [2026-02-03 12:00:00.123] [INFO] [RPC] message here\n
std::string Logger::format_line(LogLevel lvl, LogCategory cat,
                                std::string_view message) {
    std::string line;
    line.reserve(48 + message.size());
    line.append("[").append(format_timestamp()).append("] [");
    line.append(log_level_string(lvl)).append("] [");
    line.append(log_category_string(cat)).append("] ");
    line.append(message);
    line.push_back('\n');
    return line;
}

std::string Logger::format_timestamp() {
    using namespace std::chrono;

    const auto now = system_clock::now();
    const auto millis = static_cast<int>(
        duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000);

    const std::time_t seconds = system_clock::to_time_t(now);
    std::tm utc{};
    gmtime_r(&seconds, &utc);

    char date[24];
    const size_t len = std::strftime(date, sizeof(date), "%Y-%m-%d %H:%M:%S",
                                     &utc);
    char stamp[32];
    const int n = std::snprintf(stamp, sizeof(stamp), "%.*s.%03d",
                                static_cast<int>(len), date, millis);
    return std::string(stamp, static_cast<size_t>(n));
}

} // namespace core
