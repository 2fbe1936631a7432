#pragma once
// Copyright (c) 2024-2026 The N3TX Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <cstdint>
#include <span>
#include <vector>

namespace core {

// Fill |buf| with cryptographically secure random bytes (OpenSSL RAND_bytes).
// Throws std::runtime_error on failure.
void get_random_bytes(std::span<uint8_t> buf);

// Return a single cryptographically secure random 32-bit integer.
// Used for transaction nonces.
uint32_t get_random_uint32();

// Allocate and return |count| cryptographically secure random bytes.
std::vector<uint8_t> get_random_bytes_vec(size_t count);

}  // namespace core
