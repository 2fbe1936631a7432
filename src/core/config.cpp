// Copyright (c) 2024-2026 The N3TX Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/config.h"
#include "core/logging.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <fstream>
#include <sstream>
#include <string>

namespace core {

// ---------------------------------------------------------------------------
// Helpers (anonymous namespace)
// ---------------------------------------------------------------------------
namespace {

std::string_view trim(std::string_view sv) {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front())))
        sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back())))
        sv.remove_suffix(1);
    return sv;
}

/// Strip leading dashes from an argument key (one or two).
std::string_view strip_dashes(std::string_view sv) {
    if (sv.starts_with("--")) return sv.substr(2);
    if (sv.starts_with("-"))  return sv.substr(1);
    return sv;
}

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

bool parse_bool(std::string_view sv, bool default_val) {
    if (sv.empty()) return default_val;
    if (iequals(sv, "1") || iequals(sv, "true") ||
        iequals(sv, "yes") || iequals(sv, "on")) {
        return true;
    }
    if (iequals(sv, "0") || iequals(sv, "false") ||
        iequals(sv, "no") || iequals(sv, "off")) {
        return false;
    }
    return default_val;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Config -- internal helpers
// ---------------------------------------------------------------------------

void Config::insert(ValueMap& target, std::string_view key,
                    std::string value) {
    std::string k{key};
    target[k].push_back(std::move(value));
}

const std::vector<std::string>* Config::lookup(std::string_view key) const {
    std::string k{key};

    // CLI values take priority.
    if (auto it = cli_values_.find(k); it != cli_values_.end()) {
        return &it->second;
    }
    if (auto it = file_values_.find(k); it != file_values_.end()) {
        return &it->second;
    }
    return nullptr;
}

void Config::parse_line(std::string_view line, int line_num,
                        std::string_view origin) {
    std::string_view sv = trim(line);
    if (sv.empty() || sv.front() == '#') return;

    auto eq_pos = sv.find('=');
    if (eq_pos == std::string_view::npos) {
        insert(file_values_, sv, "1");
        return;
    }

    std::string_view key = trim(sv.substr(0, eq_pos));
    std::string_view val = trim(sv.substr(eq_pos + 1));

    if (key.empty()) {
        LOG_WARN(core::LogCategory::CONFIG,
                 "Config: empty key on line " +
                 std::to_string(line_num) + " of '" +
                 std::string{origin} + "'");
        return;
    }

    insert(file_values_, key, std::string{val});
}

// ---------------------------------------------------------------------------
// Config -- source loading
// ---------------------------------------------------------------------------

void Config::parse_args(int argc, const char* const argv[]) {
    // argv[0] is the program name -- skip it.
    for (int i = 1; i < argc; ++i) {
        std::string_view arg{argv[i]};
        if (arg.empty()) continue;

        if (!arg.starts_with("-")) {
            LOG_WARN(core::LogCategory::CONFIG,
                     "Config: ignoring positional argument '" +
                     std::string{arg} + "'");
            continue;
        }

        std::string_view stripped = strip_dashes(arg);

        auto eq_pos = stripped.find('=');
        if (eq_pos != std::string_view::npos) {
            std::string_view key = stripped.substr(0, eq_pos);
            std::string_view val = stripped.substr(eq_pos + 1);
            insert(cli_values_, trim(key), std::string{trim(val)});
        } else {
            insert(cli_values_, trim(stripped), "1");
        }
    }
}

core::Result<void> Config::parse_file(const std::filesystem::path& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        return core::Error(core::ErrorCode::CONFIG_ERROR,
                           "unable to open config file '" +
                           path.string() + "'");
    }

    LOG_INFO(core::LogCategory::CONFIG,
             "Config: loading configuration from '" + path.string() + "'");

    std::string line;
    int line_num = 0;
    while (std::getline(ifs, line)) {
        ++line_num;
        parse_line(line, line_num, path.string());
    }
    return core::make_ok();
}

void Config::parse_text(std::string_view text) {
    int line_num = 0;
    while (!text.empty()) {
        ++line_num;
        auto nl = text.find('\n');
        std::string_view line = text.substr(0, nl);
        parse_line(line, line_num, "<memory>");
        if (nl == std::string_view::npos) break;
        text.remove_prefix(nl + 1);
    }
}

// ---------------------------------------------------------------------------
// Config -- setters / getters
// ---------------------------------------------------------------------------

void Config::set(std::string_view key, std::string value) {
    std::string k{key};
    // Programmatic set goes into file_values_ (lower priority than CLI).
    file_values_[k] = {std::move(value)};
}

std::optional<std::string> Config::get(std::string_view key) const {
    const auto* vals = lookup(key);
    if (!vals || vals->empty()) return std::nullopt;
    return vals->front();
}

std::string Config::get_or(std::string_view key,
                           std::string_view default_val) const {
    auto val = get(key);
    return val.has_value() ? *val : std::string{default_val};
}

int64_t Config::get_int(std::string_view key, int64_t default_val) const {
    auto val = get(key);
    if (!val.has_value()) return default_val;

    std::string_view s{*val};
    int base = 10;
    if (s.size() > 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) {
        s.remove_prefix(2);
        base = 16;
    }

    int64_t result = default_val;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(),
                                     result, base);
    if (ec != std::errc{} || ptr != s.data() + s.size()) {
        LOG_WARN(core::LogCategory::CONFIG,
                 "Config: cannot parse '" + *val +
                 "' as integer for key '" + std::string{key} + "'");
        return default_val;
    }
    return result;
}

bool Config::get_bool(std::string_view key, bool default_val) const {
    auto val = get(key);
    if (!val.has_value()) return default_val;
    return parse_bool(*val, default_val);
}

std::vector<std::string> Config::get_list(std::string_view key) const {
    // Merge both sources: CLI values first (higher priority), then file.
    std::string k{key};
    std::vector<std::string> result;

    if (auto it = cli_values_.find(k); it != cli_values_.end()) {
        result.insert(result.end(),
                      it->second.begin(), it->second.end());
    }
    if (auto it = file_values_.find(k); it != file_values_.end()) {
        result.insert(result.end(),
                      it->second.begin(), it->second.end());
    }
    return result;
}

bool Config::has(std::string_view key) const {
    return lookup(key) != nullptr;
}

// ---------------------------------------------------------------------------
// NetworkSettings
// ---------------------------------------------------------------------------

core::Result<NetworkSettings> NetworkSettings::from_config(
    const Config& conf) {
    NetworkSettings settings;

    std::string net = conf.get_or(CONF_NETWORK, "mainnet");
    if (iequals(net, "mainnet") || iequals(net, "main")) {
        settings.network_magic = MAINNET_MAGIC;
    } else if (iequals(net, "testnet") || iequals(net, "test")) {
        settings.network_magic = TESTNET_MAGIC;
    } else if (!conf.has(CONF_NETWORK_MAGIC)) {
        return core::Error(core::ErrorCode::CONFIG_INVALID_ARG,
                           "unknown network '" + net +
                           "' and no networkmagic given");
    }

    if (conf.has(CONF_NETWORK_MAGIC)) {
        int64_t magic = conf.get_int(CONF_NETWORK_MAGIC, -1);
        if (magic < 0 || magic > 0xFFFFFFFFLL) {
            return core::Error(core::ErrorCode::CONFIG_INVALID_ARG,
                               "networkmagic must be a 32-bit value");
        }
        settings.network_magic = static_cast<uint32_t>(magic);
    }

    int64_t version = conf.get_int(CONF_ADDRESS_VERSION,
                                   settings.address_version);
    if (version < 0 || version > 0xFF) {
        return core::Error(core::ErrorCode::CONFIG_INVALID_ARG,
                           "addressversion must fit in one byte");
    }
    settings.address_version = static_cast<uint8_t>(version);

    int64_t incr = conf.get_int(CONF_MAX_VUB_INCR,
                                settings.max_valid_until_block_increment);
    if (incr <= 0 || incr > 0xFFFFFFFFLL) {
        return core::Error(core::ErrorCode::CONFIG_INVALID_ARG,
                           "maxvalidincrement must be positive");
    }
    settings.max_valid_until_block_increment = static_cast<uint32_t>(incr);

    int64_t n = conf.get_int(CONF_SCRYPT_N,
                             static_cast<int64_t>(settings.scrypt_n));
    int64_t r = conf.get_int(CONF_SCRYPT_R, settings.scrypt_r);
    int64_t p = conf.get_int(CONF_SCRYPT_P, settings.scrypt_p);
    // scrypt requires N to be a power of two greater than one.
    if (n < 2 || (n & (n - 1)) != 0 || r <= 0 || p <= 0 ||
        r > 0xFFFFFFFFLL || p > 0xFFFFFFFFLL) {
        return core::Error(core::ErrorCode::CONFIG_INVALID_ARG,
                           "invalid scrypt parameters");
    }
    settings.scrypt_n = static_cast<uint64_t>(n);
    settings.scrypt_r = static_cast<uint32_t>(r);
    settings.scrypt_p = static_cast<uint32_t>(p);

    auto& logger = Logger::instance();
    if (auto lvl = conf.get(CONF_LOGLEVEL)) {
        if (!logger.set_level_from_string(*lvl)) {
            return core::Error(core::ErrorCode::CONFIG_INVALID_ARG,
                               "unknown loglevel '" + *lvl + "'");
        }
    }
    if (auto file = conf.get(CONF_LOGFILE); file && !file->empty()) {
        if (!logger.set_log_file(*file)) {
            return core::Error(core::ErrorCode::CONFIG_INVALID_ARG,
                               "cannot open logfile '" + *file + "'");
        }
    }

    LOG_DEBUG(core::LogCategory::CONFIG,
              "network magic " + std::to_string(settings.network_magic) +
              ", address version " +
              std::to_string(settings.address_version));
    return settings;
}

} // namespace core
