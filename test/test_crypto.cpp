// Copyright (c) 2024-2026 The N3TX Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// Unit tests for the crypto module.

#include "test_framework.h"

#include "core/hex.h"
#include "crypto/aes.h"
#include "crypto/hash.h"
#include "crypto/scrypt.h"
#include "crypto/secp256r1.h"

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace {

std::array<uint8_t, 32> secret_from_hex(std::string_view hex) {
    auto bytes = core::hex_bytes(hex);
    std::array<uint8_t, 32> out{};
    std::copy(bytes.begin(), bytes.end(), out.begin());
    return out;
}

} // namespace

// ============================================================================
// Hashes
// ============================================================================

TEST_CASE(Hash, sha256_abc) {
    auto h = crypto::sha256(std::string_view("abc"));
    // Digest bytes are stored as produced; to_hex_le() prints them in order.
    CHECK_EQ(h.to_hex_le(),
             "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE(Hash, sha256_empty) {
    auto h = crypto::sha256(std::span<const uint8_t>());
    CHECK_EQ(h.to_hex_le(),
             "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST_CASE(Hash, hash256_is_double_sha256) {
    std::vector<uint8_t> data = {'n', 'e', 'o'};
    auto once = crypto::sha256(data);
    auto twice = crypto::sha256(once.span());
    CHECK(crypto::hash256(data) == twice);
}

TEST_CASE(Hash, ripemd160_empty) {
    auto h = crypto::ripemd160(std::span<const uint8_t>());
    CHECK_EQ(h.to_hex_le(), "9c1185a5c5e9fc54612808977ee8f548b2258d31");
}

TEST_CASE(Hash, hash160_of_contract_script) {
    auto script = core::hex_bytes(
        "110c21026aa8fe6b4360a67a530e23c08c6a72525afde34719c5436f9d3ced759f"
        "939a3d110b41138defaf");
    CHECK_EQ(crypto::hash160(script).to_hex_le(),
             "0898ea2197378f623a7670974454448576d0aeaf");
}

TEST_CASE(Hash, hash_writer_matches_direct) {
    crypto::HashWriter w;
    std::vector<uint8_t> a = {1, 2, 3};
    std::vector<uint8_t> b = {4, 5};
    w.write(a);
    w.write(b);
    CHECK_EQ(w.size(), size_t{5});
    CHECK(w.sha256() == crypto::sha256(std::vector<uint8_t>({1, 2, 3, 4, 5})));
}

// ============================================================================
// AES-256-ECB
// ============================================================================

TEST_CASE(Aes, fips197_vector) {
    auto key = secret_from_hex(
        "000102030405060708090a0b0c0d0e0f101112131415161718191a1b1c1d1e1f");
    auto plain = core::hex_bytes("00112233445566778899aabbccddeeff");
    auto enc = crypto::aes256_ecb_encrypt(key, plain);
    CHECK_OK(enc);
    CHECK_EQ(core::to_hex(enc.value()), "8ea2b7ca516745bfeafc49904b496089");
    auto dec = crypto::aes256_ecb_decrypt(key, enc.value());
    CHECK_OK(dec);
    CHECK(dec.value() == plain);
}

TEST_CASE(Aes, rejects_partial_block) {
    std::array<uint8_t, 32> key{};
    std::vector<uint8_t> plain(15, 0);
    CHECK_ERR(crypto::aes256_ecb_encrypt(key, plain));
}

// ============================================================================
// scrypt
// ============================================================================

TEST_CASE(Scrypt, rfc7914_vector) {
    std::string salt = "NaCl";
    crypto::ScryptParams params{1024, 8, 16};
    auto out = crypto::scrypt_derive(
        "password",
        std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(salt.data()),
                                 salt.size()),
        params, 64);
    CHECK_OK(out);
    CHECK_EQ(core::to_hex(out.value()),
             "fdbabe1c9d3472007856e7190d01e9fe7c6ad7cbc8237830e77376634b373162"
             "2eaf30d92e22a3886ff109279d9830dac727afb94a83ee6d8360cbdfa2cc0640");
}

TEST_CASE(Scrypt, rejects_non_power_of_two) {
    std::vector<uint8_t> salt = {1, 2, 3, 4};
    crypto::ScryptParams params{1000, 8, 1};
    CHECK_ERR(crypto::scrypt_derive("pw", salt, params, 32));
}

// ============================================================================
// secp256r1
// ============================================================================

TEST_CASE(Secp256r1, public_key_from_secret) {
    auto key = crypto::ECKey::from_secret(secret_from_hex(
        "84180ac9d6eb6fba207ea4ef9d2200102d1ebeb4b9c07e2c6a738a42742e27a5"));
    CHECK_OK(key);
    CHECK(key.value().is_valid());
    CHECK_EQ(core::to_hex(key.value().pubkey_compressed()),
             "033a4d051b04b7fc0230d2b1aaedfd5a84be279a5361a7358db665ad7857787f1b");
}

TEST_CASE(Secp256r1, rejects_zero_secret) {
    std::array<uint8_t, 32> zero{};
    CHECK_ERR(crypto::ECKey::from_secret(zero));
}

TEST_CASE(Secp256r1, sign_and_verify) {
    auto key = crypto::ECKey::generate();
    CHECK_OK(key);
    std::vector<uint8_t> msg = {0xde, 0xad, 0xbe, 0xef};
    auto sig = key.value().sign(msg);
    CHECK_OK(sig);
    auto pub = key.value().pubkey_compressed();
    CHECK(crypto::ECKey::verify(pub, msg, sig.value()));

    std::vector<uint8_t> other = {0xde, 0xad, 0xbe, 0xee};
    CHECK(!crypto::ECKey::verify(pub, other, sig.value()));
}

TEST_CASE(Secp256r1, compress_uncompressed_key) {
    auto key = crypto::ECKey::generate();
    CHECK_OK(key);
    auto full = key.value().pubkey_uncompressed();
    auto compressed = crypto::compress_pubkey(full);
    CHECK_OK(compressed);
    CHECK(compressed.value() == key.value().pubkey_compressed());
    CHECK(crypto::is_valid_pubkey(compressed.value()));
}
