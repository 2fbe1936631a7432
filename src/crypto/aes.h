#pragma once
// Copyright (c) 2024-2026 The N3TX Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <array>
#include <cstdint>
#include <span>
#include <vector>

#include "core/error.h"

namespace crypto {

inline constexpr size_t AES_BLOCK_SIZE = 16;

// AES-256-ECB encrypt without padding.  The plaintext length must be a
// multiple of AES_BLOCK_SIZE.
core::Result<std::vector<uint8_t>> aes256_ecb_encrypt(
    std::span<const uint8_t, 32> key,
    std::span<const uint8_t> plaintext);

// AES-256-ECB decrypt without padding.
core::Result<std::vector<uint8_t>> aes256_ecb_decrypt(
    std::span<const uint8_t, 32> key,
    std::span<const uint8_t> ciphertext);

} // namespace crypto
