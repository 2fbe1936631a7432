// Copyright (c) 2024-2026 The N3TX Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/bigint.h"

#include <algorithm>
#include <stdexcept>

#include <openssl/bn.h>
#include <openssl/crypto.h>

namespace core {

void BigInt::BnDeleter::operator()(BIGNUM* p) const { BN_free(p); }

namespace {

BIGNUM* checked_new() {
    BIGNUM* bn = BN_new();
    if (!bn) throw std::bad_alloc();
    return bn;
}

} // namespace

// ---------------------------------------------------------------------------
// Lifetime
// ---------------------------------------------------------------------------

BigInt::BigInt() : bn_(checked_new()) {}

BigInt::BigInt(int64_t value) : bn_(checked_new()) {
    uint64_t magnitude = value < 0
        ? uint64_t{0} - static_cast<uint64_t>(value)
        : static_cast<uint64_t>(value);
    uint8_t le[8];
    for (int i = 0; i < 8; ++i) {
        le[i] = static_cast<uint8_t>((magnitude >> (8 * i)) & 0xFF);
    }
    if (!BN_lebin2bn(le, 8, bn_.get())) throw std::bad_alloc();
    BN_set_negative(bn_.get(), value < 0 ? 1 : 0);
}

BigInt::~BigInt() = default;

BigInt::BigInt(const BigInt& other) : bn_(BN_dup(other.bn_.get())) {
    if (!bn_) throw std::bad_alloc();
}

BigInt& BigInt::operator=(const BigInt& other) {
    if (this != &other) {
        if (!BN_copy(bn_.get(), other.bn_.get())) throw std::bad_alloc();
    }
    return *this;
}

// A moved-from BigInt keeps a valid zero so every method stays usable.
BigInt::BigInt(BigInt&& other) noexcept : bn_(std::move(other.bn_)) {
    other.bn_.reset(BN_new());
}

BigInt& BigInt::operator=(BigInt&& other) noexcept {
    if (this != &other) {
        bn_.swap(other.bn_);
        if (other.bn_) BN_zero(other.bn_.get());
    }
    return *this;
}

// ---------------------------------------------------------------------------
// Conversions
// ---------------------------------------------------------------------------

core::Result<BigInt> BigInt::from_string(std::string_view dec) {
    std::string_view digits = dec;
    if (!digits.empty() && digits.front() == '-') digits.remove_prefix(1);
    if (digits.empty() ||
        !std::all_of(digits.begin(), digits.end(),
                     [](char c) { return c >= '0' && c <= '9'; })) {
        return core::Error(core::ErrorCode::PARSE_BAD_FORMAT,
                           "not a decimal integer: '" + std::string(dec) + "'");
    }

    std::string text(dec);
    BIGNUM* raw = nullptr;
    if (BN_dec2bn(&raw, text.c_str()) == 0 || !raw) {
        return core::Error(core::ErrorCode::PARSE_BAD_FORMAT,
                           "BN_dec2bn rejected '" + text + "'");
    }
    BigInt out;
    out.bn_.reset(raw);
    return out;
}

BigInt BigInt::from_le_bytes(std::span<const uint8_t> bytes) {
    BigInt out;
    if (bytes.empty()) return out;

    if (!BN_lebin2bn(bytes.data(), static_cast<int>(bytes.size()),
                     out.bn_.get())) {
        throw std::bad_alloc();
    }
    if (bytes.back() & 0x80) {
        // Negative: subtract 2^(8n).
        BigInt modulus;
        BN_set_bit(modulus.bn_.get(), static_cast<int>(bytes.size() * 8));
        BN_sub(out.bn_.get(), out.bn_.get(), modulus.bn_.get());
    }
    return out;
}

std::vector<uint8_t> BigInt::to_le_bytes() const {
    if (BN_is_zero(bn_.get())) return {};

    if (!BN_is_negative(bn_.get())) {
        int n = BN_num_bytes(bn_.get());
        std::vector<uint8_t> out(static_cast<size_t>(n));
        BN_bn2lebinpad(bn_.get(), out.data(), n);
        if (out.back() & 0x80) out.push_back(0x00);
        return out;
    }

    // Two's complement of the magnitude over n bytes: 2^(8n) - |v|.
    BIGNUM* mag = BN_dup(bn_.get());
    if (!mag) throw std::bad_alloc();
    std::unique_ptr<BIGNUM, BnDeleter> mag_guard(mag);
    BN_set_negative(mag, 0);

    int n = BN_num_bytes(mag);
    std::unique_ptr<BIGNUM, BnDeleter> t(checked_new());
    BN_set_bit(t.get(), n * 8);
    BN_sub(t.get(), t.get(), mag);

    std::vector<uint8_t> out(static_cast<size_t>(n));
    BN_bn2lebinpad(t.get(), out.data(), n);
    if (!(out.back() & 0x80)) out.push_back(0xFF);
    return out;
}

std::string BigInt::to_string() const {
    char* dec = BN_bn2dec(bn_.get());
    if (!dec) throw std::bad_alloc();
    std::string out(dec);
    OPENSSL_free(dec);
    return out;
}

bool BigInt::is_zero() const { return BN_is_zero(bn_.get()); }

bool BigInt::is_negative() const { return BN_is_negative(bn_.get()) != 0; }

std::optional<int64_t> BigInt::to_int64() const {
    auto le = to_le_bytes();
    if (le.size() > 8) return std::nullopt;

    uint64_t raw = 0;
    for (size_t i = 0; i < le.size(); ++i) {
        raw |= static_cast<uint64_t>(le[i]) << (8 * i);
    }
    // Sign-extend from the encoded width.
    if (!le.empty() && (le.back() & 0x80)) {
        for (size_t i = le.size(); i < 8; ++i) {
            raw |= uint64_t{0xFF} << (8 * i);
        }
    }
    return static_cast<int64_t>(raw);
}

// ---------------------------------------------------------------------------
// Comparison
// ---------------------------------------------------------------------------

bool BigInt::operator==(const BigInt& other) const {
    return BN_cmp(bn_.get(), other.bn_.get()) == 0;
}

std::strong_ordering BigInt::operator<=>(const BigInt& other) const {
    int c = BN_cmp(bn_.get(), other.bn_.get());
    if (c < 0) return std::strong_ordering::less;
    if (c > 0) return std::strong_ordering::greater;
    return std::strong_ordering::equal;
}

} // namespace core
