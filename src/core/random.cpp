// Copyright (c) 2024-2026 The N3TX Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/random.h"

#include <stdexcept>

#include <openssl/rand.h>

namespace core {

void get_random_bytes(std::span<uint8_t> buf) {
    if (buf.empty()) {
        return;
    }
    // RAND_bytes returns 1 on success, 0 or -1 on failure.
    if (RAND_bytes(buf.data(), static_cast<int>(buf.size())) != 1) {
        throw std::runtime_error("core::get_random_bytes: RAND_bytes failed");
    }
}

uint32_t get_random_uint32() {
    uint8_t buf[4];
    get_random_bytes(std::span<uint8_t>(buf, 4));
    return static_cast<uint32_t>(buf[0])
         | (static_cast<uint32_t>(buf[1]) << 8)
         | (static_cast<uint32_t>(buf[2]) << 16)
         | (static_cast<uint32_t>(buf[3]) << 24);
}

std::vector<uint8_t> get_random_bytes_vec(size_t count) {
    std::vector<uint8_t> result(count);
    get_random_bytes(result);
    return result;
}

}  // namespace core
