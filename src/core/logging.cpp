// Copyright (c) 2024-2026 The N3TX Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/logging.h"

#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iostream>

namespace core {

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

std::string_view log_category_string(LogCategory cat) noexcept {
    uint32_t bits = static_cast<uint32_t>(cat);
    if (bits == 0) return "NONE";
    if (bits == static_cast<uint32_t>(LogCategory::ALL)) return "ALL";

    switch (static_cast<LogCategory>(bits & (~bits + 1u))) {
        case LogCategory::CODEC:  return "CODEC";
        case LogCategory::SCRIPT: return "SCRIPT";
        case LogCategory::TX:     return "TX";
        case LogCategory::WALLET: return "WALLET";
        case LogCategory::CRYPTO: return "CRYPTO";
        case LogCategory::RPC:    return "RPC";
        case LogCategory::CONFIG: return "CONFIG";
        default:                  return "UNKNOWN";
    }
}

Logger& Logger::instance() {
    static Logger the_logger;
    return the_logger;
}

// ---------------------------------------------------------------------------
// Filters
// ---------------------------------------------------------------------------

void Logger::set_level(LogLevel lvl) {
    level_.store(static_cast<int>(lvl), std::memory_order_release);
}

LogLevel Logger::level() const noexcept {
    return static_cast<LogLevel>(level_.load(std::memory_order_acquire));
}

bool Logger::set_level_from_string(std::string_view name) {
    std::string lower;
    for (char c : name) {
        lower.push_back(static_cast<char>(
            std::tolower(static_cast<unsigned char>(c))));
    }

    LogLevel lvl;
    if (lower == "trace")                           lvl = LogLevel::TRACE;
    else if (lower == "debug")                      lvl = LogLevel::DEBUG;
    else if (lower == "info")                       lvl = LogLevel::INFO;
    else if (lower == "warn" || lower == "warning") lvl = LogLevel::WARN;
    else if (lower == "error")                      lvl = LogLevel::ERR;
    else if (lower == "fatal")                      lvl = LogLevel::FATAL;
    else if (lower == "off" || lower == "none")     lvl = LogLevel::OFF;
    else return false;

    set_level(lvl);
    return true;
}

void Logger::enable_category(LogCategory cat) {
    enabled_categories_.fetch_or(static_cast<uint32_t>(cat),
                                 std::memory_order_release);
}

void Logger::disable_category(LogCategory cat) {
    enabled_categories_.fetch_and(~static_cast<uint32_t>(cat),
                                  std::memory_order_release);
}

LogCategory Logger::enabled_categories() const noexcept {
    return static_cast<LogCategory>(
        enabled_categories_.load(std::memory_order_acquire));
}

bool Logger::will_log(LogLevel lvl, LogCategory cat) const noexcept {
    if (static_cast<int>(lvl) < level_.load(std::memory_order_acquire)) {
        return false;
    }
    // NONE always passes.
    uint32_t cat_bits = static_cast<uint32_t>(cat);
    return cat_bits == 0 ||
           (enabled_categories_.load(std::memory_order_acquire) & cat_bits) != 0;
}

// ---------------------------------------------------------------------------
// Sinks
// ---------------------------------------------------------------------------

void Logger::set_sink(Sink sink) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    sink_ = std::move(sink);
}

bool Logger::set_log_file(const std::filesystem::path& path) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (file_stream_.is_open()) file_stream_.close();
    if (path.empty()) return true;

    file_stream_.open(path, std::ios::out | std::ios::app);
    return file_stream_.is_open();
}

void Logger::write(LogLevel lvl, LogCategory cat, std::string_view message) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (sink_) {
        sink_(lvl, cat, message);
    }

    if (!sink_ || file_stream_.is_open()) {
        //   [2026-02-03 12:00:00.123] [DEBUG] [TX] message
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

        if (!sink_) std::cerr << line;
        if (file_stream_.is_open()) {
            file_stream_ << line;
            if (lvl >= LogLevel::WARN) file_stream_.flush();
        }
    }
}

std::string Logger::format_timestamp() {
    using Clock = std::chrono::system_clock;

    auto now = Clock::now();
    auto epoch_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        now.time_since_epoch()).count();
    std::time_t time_val = Clock::to_time_t(now);
    std::tm tm_buf{};
#if defined(_WIN32) || defined(_WIN64)
    gmtime_s(&tm_buf, &time_val);
#else
    gmtime_r(&time_val, &tm_buf);
#endif

    char buf[32];
    int n = std::snprintf(buf, sizeof(buf),
                          "%04d-%02d-%02d %02d:%02d:%02d.%03d",
                          tm_buf.tm_year + 1900, tm_buf.tm_mon + 1,
                          tm_buf.tm_mday, tm_buf.tm_hour, tm_buf.tm_min,
                          tm_buf.tm_sec, static_cast<int>(epoch_ms % 1000));
    return std::string(buf, static_cast<std::size_t>(n));
}

} // namespace core
