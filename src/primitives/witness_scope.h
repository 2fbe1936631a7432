#pragma once
// Copyright (c) 2024-2026 The N3TX Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace primitives {

// ---------------------------------------------------------------------------
// WitnessScope -- where a signer's witness may be checked
// ---------------------------------------------------------------------------
// Individual flags; a signer carries their OR as one byte.  GLOBAL may not
// be combined with any other flag.
// ---------------------------------------------------------------------------
enum class WitnessScope : uint8_t {
    NONE             = 0x00,
    CALLED_BY_ENTRY  = 0x01,
    CUSTOM_CONTRACTS = 0x10,
    CUSTOM_GROUPS    = 0x20,
    WITNESS_RULES    = 0x40,
    GLOBAL           = 0x80,
};

/// Bits that carry a defined flag.
inline constexpr uint8_t WITNESS_SCOPE_MASK = 0xF1;

[[nodiscard]] constexpr bool has_scope(uint8_t scopes,
                                       WitnessScope flag) noexcept {
    return (scopes & static_cast<uint8_t>(flag)) != 0;
}

[[nodiscard]] constexpr uint8_t with_scope(uint8_t scopes,
                                           WitnessScope flag) noexcept {
    return static_cast<uint8_t>(scopes | static_cast<uint8_t>(flag));
}

/// OR of @p flags.
uint8_t combine_scopes(std::span<const WitnessScope> flags) noexcept;

/// The set flags in ascending bit order; NONE alone for a zero byte.
std::vector<WitnessScope> split_scopes(uint8_t scopes);

/// True if only defined bits are set and GLOBAL stands alone.
[[nodiscard]] bool is_valid_scope_byte(uint8_t scopes) noexcept;

/// "CalledByEntry", "Global", ...
std::string scope_name(WitnessScope flag);

/// Comma separated flag names, e.g. "CalledByEntry, CustomContracts".
std::string scopes_to_string(uint8_t scopes);

} // namespace primitives
