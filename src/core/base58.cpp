// Copyright (c) 2024-2026 The N3TX Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/base58.h"

#include <algorithm>
#include <array>
#include <cstring>
#include <memory>
#include <stdexcept>

#include <openssl/evp.h>

namespace core {

namespace {

// Reverse lookup: ASCII value -> Base58 digit index (0-57), or -1 if invalid.
constexpr std::array<int8_t, 256> make_base58_map() {
    std::array<int8_t, 256> table{};
    for (auto& v : table) v = -1;
    for (int i = 0; i < 58; ++i) {
        table[static_cast<uint8_t>(BASE58_ALPHABET[i])] =
            static_cast<int8_t>(i);
    }
    return table;
}

constexpr auto BASE58_MAP = make_base58_map();

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

// First 4 bytes of SHA256(SHA256(data)).
bool compute_checksum(std::span<const uint8_t> data,
                      uint8_t (&checksum_out)[4]) {
    std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx) return false;

    std::array<uint8_t, 32> hash1{};
    std::array<uint8_t, 32> hash2{};
    unsigned int out_len = 0;

    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), hash1.data(), &out_len) != 1) {
        return false;
    }
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), hash1.data(), hash1.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), hash2.data(), &out_len) != 1) {
        return false;
    }

    std::memcpy(checksum_out, hash2.data(), 4);
    return true;
}

}  // namespace

// ---------------------------------------------------------------------------
// base58_encode
// ---------------------------------------------------------------------------
// Treat the input as a big-endian unsigned integer and repeatedly divide by
// 58.  Leading zero bytes map to leading '1' characters.
// ---------------------------------------------------------------------------
std::string base58_encode(std::span<const uint8_t> data) {
    size_t leading_zeros = 0;
    while (leading_zeros < data.size() && data[leading_zeros] == 0) {
        ++leading_zeros;
    }

    // log(256) / log(58) ~ 1.366
    std::vector<uint8_t> digits(data.size() * 138 / 100 + 1, 0);
    size_t used = 0;

    for (size_t i = leading_zeros; i < data.size(); ++i) {
        int carry = data[i];
        size_t j = 0;
        for (auto it = digits.rbegin();
             (carry != 0 || j < used) && it != digits.rend(); ++it, ++j) {
            carry += 256 * static_cast<int>(*it);
            *it = static_cast<uint8_t>(carry % 58);
            carry /= 58;
        }
        used = j;
    }

    auto it = digits.begin();
    while (it != digits.end() && *it == 0) ++it;

    std::string result(leading_zeros, '1');
    result.reserve(leading_zeros + static_cast<size_t>(digits.end() - it));
    for (; it != digits.end(); ++it) {
        result.push_back(BASE58_ALPHABET[*it]);
    }
    return result;
}

// ---------------------------------------------------------------------------
// base58_decode
// ---------------------------------------------------------------------------
std::optional<std::vector<uint8_t>> base58_decode(std::string_view str) {
    size_t leading_ones = 0;
    while (leading_ones < str.size() && str[leading_ones] == '1') {
        ++leading_ones;
    }

    // log(58) / log(256) ~ 0.733
    std::vector<uint8_t> bytes(str.size() * 733 / 1000 + 1, 0);

    for (size_t i = leading_ones; i < str.size(); ++i) {
        int digit = BASE58_MAP[static_cast<uint8_t>(str[i])];
        if (digit < 0) {
            return std::nullopt;
        }

        int carry = digit;
        for (auto it = bytes.rbegin(); it != bytes.rend(); ++it) {
            carry += 58 * static_cast<int>(*it);
            *it = static_cast<uint8_t>(carry % 256);
            carry /= 256;
        }
        if (carry != 0) {
            return std::nullopt;
        }
    }

    auto it = bytes.begin();
    while (it != bytes.end() && *it == 0) ++it;

    std::vector<uint8_t> result(leading_ones, 0x00);
    result.insert(result.end(), it, bytes.end());
    return result;
}

// ---------------------------------------------------------------------------
// Base58Check
// ---------------------------------------------------------------------------
std::string base58check_encode(std::span<const uint8_t> data) {
    std::vector<uint8_t> buf(data.begin(), data.end());
    uint8_t checksum[4] = {};
    if (!compute_checksum(data, checksum)) {
        // Only reachable when OpenSSL cannot allocate a digest context.
        throw std::runtime_error("base58check_encode: SHA256 unavailable");
    }
    buf.insert(buf.end(), checksum, checksum + 4);
    return base58_encode(buf);
}

core::Result<std::vector<uint8_t>> base58check_decode(std::string_view str) {
    auto decoded = base58_decode(str);
    if (!decoded) {
        return core::Error(core::ErrorCode::PARSE_BAD_FORMAT,
                           "invalid Base58 character");
    }
    if (decoded->size() < 4) {
        return core::Error(core::ErrorCode::PARSE_BAD_FORMAT,
                           "Base58Check payload shorter than checksum");
    }

    const size_t payload_len = decoded->size() - 4;
    uint8_t expected[4] = {};
    if (!compute_checksum(
            std::span<const uint8_t>(decoded->data(), payload_len),
            expected)) {
        return core::Error(core::ErrorCode::CRYPTO_HASH_FAIL,
                           "SHA256 unavailable");
    }
    if (std::memcmp(decoded->data() + payload_len, expected, 4) != 0) {
        return core::Error(core::ErrorCode::PARSE_CHECKSUM,
                           "Base58Check checksum mismatch");
    }

    decoded->resize(payload_len);
    return std::move(*decoded);
}

}  // namespace core
