#pragma once
// Copyright (c) 2024-2026 The N3TX Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace core {

// ---------------------------------------------------------------------------
// Common configuration key constants
// ---------------------------------------------------------------------------
inline constexpr const char* CONF_NETWORK         = "network";
inline constexpr const char* CONF_NETWORK_MAGIC   = "networkmagic";
inline constexpr const char* CONF_ADDRESS_VERSION = "addressversion";
inline constexpr const char* CONF_MAX_VUB_INCR    = "maxvalidincrement";
inline constexpr const char* CONF_SCRYPT_N        = "scryptn";
inline constexpr const char* CONF_SCRYPT_R        = "scryptr";
inline constexpr const char* CONF_SCRYPT_P        = "scryptp";
inline constexpr const char* CONF_LOGLEVEL        = "loglevel";
inline constexpr const char* CONF_LOGFILE         = "logfile";

// ---------------------------------------------------------------------------
// Config  --  hierarchical configuration with multiple sources
//
// Priority order: command-line args  >  config file  >  programmatic defaults
// Multi-value keys (e.g. -signer=a -signer=b) are accumulated into a
// vector accessible via get_list().
// ---------------------------------------------------------------------------
class Config {
public:
    Config() = default;

    // -- source loading -----------------------------------------------------

    /// Parse command-line arguments.
    /// Accepted formats:
    ///   -key=value   --key=value   (key/value pair)
    ///   -key         --key         (boolean flag, value = "1")
    void parse_args(int argc, const char* const argv[]);

    /// Parse an INI-style configuration file.
    /// Format per line:  key=value
    /// Lines starting with '#' and blank lines are ignored.
    core::Result<void> parse_file(const std::filesystem::path& path);

    /// Parse configuration text already held in memory (same format as
    /// parse_file).
    void parse_text(std::string_view text);

    // -- setters / getters --------------------------------------------------

    /// Set a key to a single value (replaces any previous values).
    void set(std::string_view key, std::string value);

    /// Return the first value for @p key, or std::nullopt if absent.
    [[nodiscard]] std::optional<std::string> get(std::string_view key) const;

    /// Return the first value for @p key, or @p default_val if absent.
    [[nodiscard]] std::string get_or(std::string_view key,
                                     std::string_view default_val) const;

    /// Return the value for @p key parsed as int64, or @p default_val.
    /// Accepts a "0x" prefix for hexadecimal values.
    [[nodiscard]] int64_t get_int(std::string_view key,
                                  int64_t default_val = 0) const;

    /// Return the value for @p key parsed as bool, or @p default_val.
    /// Truthy: "1", "true", "yes", "on" (case-insensitive).
    [[nodiscard]] bool get_bool(std::string_view key,
                                bool default_val = false) const;

    /// Return all values associated with @p key (multi-value support).
    [[nodiscard]] std::vector<std::string> get_list(
        std::string_view key) const;

    /// Check whether @p key exists in any source.
    [[nodiscard]] bool has(std::string_view key) const;

private:
    // Two separate maps so that CLI args always override file values.
    using ValueMap =
        std::unordered_map<std::string, std::vector<std::string>>;

    ValueMap cli_values_;
    ValueMap file_values_;

    void insert(ValueMap& target, std::string_view key, std::string value);
    void parse_line(std::string_view line, int line_num,
                    std::string_view origin);
    [[nodiscard]] const std::vector<std::string>* lookup(
        std::string_view key) const;
};

// ---------------------------------------------------------------------------
// NetworkSettings -- protocol parameters the library needs from its host
// ---------------------------------------------------------------------------
struct NetworkSettings {
    static constexpr uint32_t MAINNET_MAGIC = 860833102;
    static constexpr uint32_t TESTNET_MAGIC = 894710606;

    uint32_t network_magic = MAINNET_MAGIC;
    uint8_t  address_version = 0x35;
    uint32_t max_valid_until_block_increment = 5760;

    // NEP-2 scrypt cost parameters.
    uint64_t scrypt_n = 16384;
    uint32_t scrypt_r = 8;
    uint32_t scrypt_p = 8;

    /// Build settings from a Config. "network" selects the "mainnet" or
    /// "testnet" magic; "networkmagic" overrides it. Also applies the
    /// "loglevel" and "logfile" keys to the global logger.
    static core::Result<NetworkSettings> from_config(const Config& conf);
};

} // namespace core
