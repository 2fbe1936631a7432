#pragma once
// Copyright (c) 2024-2026 The N3TX Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <array>
#include <cstdint>
#include <span>
#include <vector>

#include "core/types.h"
#include "core/error.h"

typedef struct evp_pkey_st EVP_PKEY;

namespace crypto {

/// Compressed SEC1 public key: 0x02/0x03 || x.
using PublicKey = std::array<uint8_t, 33>;

/// Raw ECDSA signature: r || s, each 32 bytes big-endian.
using Signature = std::array<uint8_t, 64>;

/// ECDSA key pair on secp256r1 (NIST P-256) using the OpenSSL 3.0+ EVP API.
/// Owns a 32-byte secret and the corresponding EVP_PKEY.
class ECKey {
public:
    ECKey() = default;
    ~ECKey();

    ECKey(const ECKey& other);
    ECKey& operator=(const ECKey& other);

    ECKey(ECKey&& other) noexcept;
    ECKey& operator=(ECKey&& other) noexcept;

    /// Generate a new random key pair via OpenSSL.
    static core::Result<ECKey> generate();

    /// Construct from an existing 32-byte big-endian secret scalar.
    /// Fails if the scalar is zero or >= the curve order.
    static core::Result<ECKey> from_secret(std::span<const uint8_t, 32> secret);

    /// True when this object holds a private key.
    bool is_valid() const;

    /// Raw 32-byte secret scalar (big-endian).
    std::array<uint8_t, 32> secret() const;

    /// SEC1 compressed public key (33 bytes).
    PublicKey pubkey_compressed() const;

    /// SEC1 uncompressed public key (65 bytes: 0x04 || x || y).
    std::array<uint8_t, 65> pubkey_uncompressed() const;

    /// ECDSA over SHA256(message).  The signature nonce is random, so two
    /// calls over the same message return different signatures.
    core::Result<Signature> sign(std::span<const uint8_t> message) const;

    /// Verify a 64-byte r||s signature over SHA256(message).
    static bool verify(std::span<const uint8_t> pubkey,
                       std::span<const uint8_t> message,
                       std::span<const uint8_t> signature);

private:
    std::array<uint8_t, 32> secret_{};
    bool has_key_ = false;
    EVP_PKEY* pkey_ = nullptr;

    /// (Re)build the EVP_PKEY from secret_. Frees any previous pkey_.
    void rebuild_pkey();
};

/// True if @p pubkey is a SEC1 encoding (33 or 65 bytes) of a point on
/// secp256r1.
bool is_valid_pubkey(std::span<const uint8_t> pubkey);

/// Re-encode a valid SEC1 public key in compressed form.
core::Result<PublicKey> compress_pubkey(std::span<const uint8_t> pubkey);

}  // namespace crypto
