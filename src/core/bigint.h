#pragma once
// Copyright (c) 2024-2026 The N3TX Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"

#include <compare>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

typedef struct bignum_st BIGNUM;

namespace core {

// ---------------------------------------------------------------------------
// BigInt -- arbitrary-precision signed integer backed by an OpenSSL BIGNUM
// ---------------------------------------------------------------------------
// VM integers are exchanged as little-endian two's-complement byte strings
// of minimal length; to_le_bytes()/from_le_bytes() implement that mapping.
// ---------------------------------------------------------------------------
class BigInt {
public:
    BigInt();
    BigInt(int64_t value);  // NOLINT implicit
    ~BigInt();

    BigInt(const BigInt& other);
    BigInt& operator=(const BigInt& other);
    BigInt(BigInt&& other) noexcept;
    BigInt& operator=(BigInt&& other) noexcept;

    /// Parse a decimal string with an optional leading '-'.
    static core::Result<BigInt> from_string(std::string_view dec);

    /// Interpret @p bytes as little-endian two's complement.  An empty span
    /// is zero.
    static BigInt from_le_bytes(std::span<const uint8_t> bytes);

    /// Minimal little-endian two's-complement encoding.  Zero encodes as an
    /// empty vector.
    [[nodiscard]] std::vector<uint8_t> to_le_bytes() const;

    [[nodiscard]] std::string to_string() const;

    [[nodiscard]] bool is_zero() const;
    [[nodiscard]] bool is_negative() const;

    /// The value as int64_t, or nullopt when it does not fit.
    [[nodiscard]] std::optional<int64_t> to_int64() const;

    [[nodiscard]] bool operator==(const BigInt& other) const;
    [[nodiscard]] std::strong_ordering operator<=>(const BigInt& other) const;

private:
    struct BnDeleter {
        void operator()(BIGNUM* p) const;
    };
    std::unique_ptr<BIGNUM, BnDeleter> bn_;
};

} // namespace core
