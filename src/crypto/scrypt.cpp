// Copyright (c) 2024-2026 The N3TX Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "crypto/scrypt.h"

#include <string>

#include <openssl/err.h>
#include <openssl/evp.h>

namespace crypto {

core::Result<std::vector<uint8_t>> scrypt_derive(
    std::string_view password,
    std::span<const uint8_t> salt,
    const ScryptParams& params,
    size_t out_len) {

    if (params.n < 2 || (params.n & (params.n - 1)) != 0 ||
        params.r == 0 || params.p == 0) {
        return core::Error(core::ErrorCode::CRYPTO_ERROR,
                           "invalid scrypt parameters N=" +
                           std::to_string(params.n) + " r=" +
                           std::to_string(params.r) + " p=" +
                           std::to_string(params.p));
    }

    // 128 * N * r bytes of working memory, plus headroom.
    uint64_t max_mem = 128ULL * params.n * params.r * 2 + (1ULL << 20);

    std::vector<uint8_t> derived(out_len);
    int result = EVP_PBE_scrypt(
        password.data(), password.size(),
        salt.data(), salt.size(),
        params.n, params.r, params.p,
        max_mem,
        derived.data(), derived.size());

    if (result != 1) {
        unsigned long err = ERR_get_error();
        char err_buf[256];
        ERR_error_string_n(err, err_buf, sizeof(err_buf));
        return core::Error(core::ErrorCode::CRYPTO_ERROR,
                           std::string("scrypt derivation failed: ") +
                           err_buf);
    }
    return derived;
}

} // namespace crypto
