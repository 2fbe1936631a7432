#pragma once
// Copyright (c) 2024-2026 The N3TX Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef N3TX_CORE_LOGGING_H
#define N3TX_CORE_LOGGING_H

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>

namespace core {

enum class LogLevel : int {
    TRACE   = 0,
    DEBUG   = 1,
    INFO    = 2,
    WARN    = 3,
    ERR     = 4,  // "ERROR" conflicts with Windows <windows.h> macro
    FATAL   = 5,
    OFF     = 6,
};

// Bitmask, one bit per library area.
enum class LogCategory : uint32_t {
    NONE       = 0,
    CODEC      = 1u << 0,
    SCRIPT     = 1u << 1,
    TX         = 1u << 2,
    WALLET     = 1u << 3,
    CRYPTO     = 1u << 4,
    RPC        = 1u << 5,
    CONFIG     = 1u << 6,
    ALL        = 0xFFFFFFFF,
};

inline constexpr LogCategory operator|(LogCategory a, LogCategory b) noexcept {
    return static_cast<LogCategory>(
        static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
}

inline constexpr LogCategory operator&(LogCategory a, LogCategory b) noexcept {
    return static_cast<LogCategory>(
        static_cast<uint32_t>(a) & static_cast<uint32_t>(b));
}

[[nodiscard]] std::string_view log_level_string(LogLevel level) noexcept;

/// Name of the lowest set bit; "NONE" for zero.
[[nodiscard]] std::string_view log_category_string(
    LogCategory cat) noexcept;

// ---------------------------------------------------------------------------
// Logger -- process-wide, thread-safe
// ---------------------------------------------------------------------------
// Lines go to stderr unless the host installs a sink, and additionally to
// a log file when one is open.  The host application owns the policy; the
// library only emits.
// ---------------------------------------------------------------------------
class Logger {
public:
    /// Receives every line that passes the level and category filters.
    using Sink = std::function<void(LogLevel, LogCategory, std::string_view)>;

    static Logger& instance();

    void set_level(LogLevel level);
    [[nodiscard]] LogLevel level() const noexcept;

    /// Accepts "trace" through "off" (and "warning", "none").  Returns
    /// false and keeps the level for anything else.
    bool set_level_from_string(std::string_view name);

    void enable_category(LogCategory cat);
    void disable_category(LogCategory cat);
    [[nodiscard]] LogCategory enabled_categories() const noexcept;

    /// Lockless filter check, done by the macros before formatting.
    [[nodiscard]] bool will_log(LogLevel level,
                                LogCategory cat) const noexcept;

    /// Replace the stderr writer.  An empty sink restores it.
    void set_sink(Sink sink);

    /// Append lines to @p path.  An empty path closes the file.
    /// Returns false if the file cannot be opened.
    bool set_log_file(const std::filesystem::path& path);

    void write(LogLevel level, LogCategory cat, std::string_view message);

    Logger(const Logger&)            = delete;
    Logger& operator=(const Logger&) = delete;

private:
    Logger() = default;

    /// "2026-02-03 12:00:00.123" in UTC.
    static std::string format_timestamp();

    std::atomic<int>      level_{static_cast<int>(LogLevel::INFO)};
    std::atomic<uint32_t> enabled_categories_{
        static_cast<uint32_t>(LogCategory::ALL)};

    std::mutex            write_mutex_;
    Sink                  sink_;
    std::ofstream         file_stream_;
};

} // namespace core

// Usage:
//   LOG_DEBUG(core::LogCategory::TX, "signed transaction " + hash_hex);
//   LOG_WARN(core::LogCategory::WALLET, "NEP-2 passphrase mismatch");
#define N3TX_LOG(level, cat, msg)                                         \
    do {                                                                  \
        if (core::Logger::instance().will_log((level), (cat))) {          \
            core::Logger::instance().write((level), (cat),                \
                                           std::string(msg));             \
        }                                                                 \
    } while (0)

#define LOG_TRACE(cat, msg) N3TX_LOG(core::LogLevel::TRACE, cat, msg)
#define LOG_DEBUG(cat, msg) N3TX_LOG(core::LogLevel::DEBUG, cat, msg)
#define LOG_INFO(cat, msg)  N3TX_LOG(core::LogLevel::INFO, cat, msg)
#define LOG_WARN(cat, msg)  N3TX_LOG(core::LogLevel::WARN, cat, msg)
#define LOG_ERROR(cat, msg) N3TX_LOG(core::LogLevel::ERR, cat, msg)
#define LOG_FATAL(cat, msg) N3TX_LOG(core::LogLevel::FATAL, cat, msg)

#endif // N3TX_CORE_LOGGING_H
