#pragma once
// Copyright (c) 2024-2026 The N3TX Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

#include "core/error.h"

namespace crypto {

// scrypt cost parameters.  N must be a power of two greater than 1.
struct ScryptParams {
    uint64_t n = 16384;
    uint32_t r = 8;
    uint32_t p = 8;
};

// Derive @p out_len bytes from @p password and @p salt.
core::Result<std::vector<uint8_t>> scrypt_derive(
    std::string_view password,
    std::span<const uint8_t> salt,
    const ScryptParams& params,
    size_t out_len);

} // namespace crypto
