// Copyright (c) 2024-2026 The N3TX Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/hex.h"

#include <algorithm>
#include <array>
#include <stdexcept>

namespace core {

// ---------------------------------------------------------------------------
// Lookup tables
// ---------------------------------------------------------------------------

static constexpr char HEX_DIGITS[] = "0123456789abcdef";

// Maps ASCII value -> nibble value, 0xFF means invalid.
static constexpr std::array<uint8_t, 256> make_decode_table() {
    std::array<uint8_t, 256> table{};
    for (auto& v : table) v = 0xFF;
    for (int i = 0; i <= 9; ++i) {
        table[static_cast<size_t>('0') + i] = static_cast<uint8_t>(i);
    }
    for (int i = 0; i < 6; ++i) {
        table[static_cast<size_t>('a') + i] = static_cast<uint8_t>(10 + i);
        table[static_cast<size_t>('A') + i] = static_cast<uint8_t>(10 + i);
    }
    return table;
}

static constexpr auto DECODE_TABLE = make_decode_table();

// ---------------------------------------------------------------------------
// Encoding / decoding
// ---------------------------------------------------------------------------

std::string to_hex(std::span<const uint8_t> data) {
    std::string result;
    result.reserve(data.size() * 2);
    for (uint8_t byte : data) {
        result.push_back(HEX_DIGITS[byte >> 4]);
        result.push_back(HEX_DIGITS[byte & 0x0F]);
    }
    return result;
}

std::optional<std::vector<uint8_t>> from_hex(std::string_view hex) {
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex.remove_prefix(2);
    }
    if (hex.size() % 2 != 0) {
        return std::nullopt;
    }

    std::vector<uint8_t> result;
    result.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        const uint8_t hi = DECODE_TABLE[static_cast<uint8_t>(hex[i])];
        const uint8_t lo = DECODE_TABLE[static_cast<uint8_t>(hex[i + 1])];
        if (hi == 0xFF || lo == 0xFF) {
            return std::nullopt;
        }
        result.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return result;
}

std::vector<uint8_t> hex_bytes(std::string_view hex) {
    auto decoded = from_hex(hex);
    if (!decoded) {
        throw std::invalid_argument("hex_bytes: malformed hex literal");
    }
    return std::move(*decoded);
}

std::vector<uint8_t> reversed(std::span<const uint8_t> data) {
    return std::vector<uint8_t>(data.rbegin(), data.rend());
}

}  // namespace core
