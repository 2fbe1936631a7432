// Copyright (c) 2024-2026 The N3TX Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "crypto/aes.h"

#include <memory>
#include <string>

#include <openssl/evp.h>

namespace crypto {

namespace {

// RAII wrapper for EVP_CIPHER_CTX
struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const {
        if (ctx) {
            EVP_CIPHER_CTX_free(ctx);
        }
    }
};
using CipherCtxPtr =
    std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

// One ECB pass in either direction; padding is disabled so the output has
// exactly the input length.
core::Result<std::vector<uint8_t>> ecb_crypt(
    std::span<const uint8_t, 32> key,
    std::span<const uint8_t> input,
    bool encrypt) {

    const char* dir = encrypt ? "encrypt" : "decrypt";
    if (input.empty() || input.size() % AES_BLOCK_SIZE != 0) {
        return core::Error(core::ErrorCode::CRYPTO_ERROR,
            std::string("AES-256-ECB ") + dir +
            ": input must be a non-empty multiple of 16 bytes");
    }

    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return core::Error(core::ErrorCode::CRYPTO_ERROR,
            "failed to create cipher context");
    }

    if (EVP_CipherInit_ex(ctx.get(), EVP_aes_256_ecb(), nullptr,
                          key.data(), nullptr, encrypt ? 1 : 0) != 1) {
        return core::Error(core::ErrorCode::CRYPTO_ERROR,
            std::string("EVP_CipherInit_ex failed (") + dir + ")");
    }
    EVP_CIPHER_CTX_set_padding(ctx.get(), 0);

    std::vector<uint8_t> out(input.size() + AES_BLOCK_SIZE);
    int out_len = 0;
    if (EVP_CipherUpdate(ctx.get(), out.data(), &out_len,
                         input.data(),
                         static_cast<int>(input.size())) != 1) {
        return core::Error(core::ErrorCode::CRYPTO_ERROR,
            std::string("EVP_CipherUpdate failed (") + dir + ")");
    }

    int final_len = 0;
    if (EVP_CipherFinal_ex(ctx.get(), out.data() + out_len,
                           &final_len) != 1) {
        return core::Error(core::ErrorCode::CRYPTO_ERROR,
            std::string("EVP_CipherFinal_ex failed (") + dir + ")");
    }
    out.resize(static_cast<size_t>(out_len + final_len));
    return out;
}

} // namespace

core::Result<std::vector<uint8_t>> aes256_ecb_encrypt(
    std::span<const uint8_t, 32> key,
    std::span<const uint8_t> plaintext) {
    return ecb_crypt(key, plaintext, true);
}

core::Result<std::vector<uint8_t>> aes256_ecb_decrypt(
    std::span<const uint8_t, 32> key,
    std::span<const uint8_t> ciphertext) {
    return ecb_crypt(key, ciphertext, false);
}

} // namespace crypto
