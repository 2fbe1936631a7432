// Copyright (c) 2024-2026 The N3TX Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "primitives/witness_scope.h"

namespace primitives {

namespace {

constexpr WitnessScope ALL_FLAGS[] = {
    WitnessScope::CALLED_BY_ENTRY, WitnessScope::CUSTOM_CONTRACTS,
    WitnessScope::CUSTOM_GROUPS,   WitnessScope::WITNESS_RULES,
    WitnessScope::GLOBAL,
};

} // namespace

uint8_t combine_scopes(std::span<const WitnessScope> flags) noexcept {
    uint8_t out = 0;
    for (auto f : flags) out = with_scope(out, f);
    return out;
}

std::vector<WitnessScope> split_scopes(uint8_t scopes) {
    std::vector<WitnessScope> out;
    for (auto f : ALL_FLAGS) {
        if (has_scope(scopes, f)) out.push_back(f);
    }
    if (out.empty()) out.push_back(WitnessScope::NONE);
    return out;
}

bool is_valid_scope_byte(uint8_t scopes) noexcept {
    if ((scopes & ~WITNESS_SCOPE_MASK) != 0) return false;
    if (has_scope(scopes, WitnessScope::GLOBAL) &&
        scopes != static_cast<uint8_t>(WitnessScope::GLOBAL)) {
        return false;
    }
    return true;
}

std::string scope_name(WitnessScope flag) {
    switch (flag) {
    case WitnessScope::NONE:             return "None";
    case WitnessScope::CALLED_BY_ENTRY:  return "CalledByEntry";
    case WitnessScope::CUSTOM_CONTRACTS: return "CustomContracts";
    case WitnessScope::CUSTOM_GROUPS:    return "CustomGroups";
    case WitnessScope::WITNESS_RULES:    return "WitnessRules";
    case WitnessScope::GLOBAL:           return "Global";
    }
    return "Unknown";
}

std::string scopes_to_string(uint8_t scopes) {
    std::string out;
    for (auto f : split_scopes(scopes)) {
        if (!out.empty()) out += ", ";
        out += scope_name(f);
    }
    return out;
}

} // namespace primitives
