#pragma once
// Copyright (c) 2024-2026 The N3TX Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace core {

// ---------------------------------------------------------------------------
// Blob<N> -- fixed-size byte array (little-endian internal storage)
// ---------------------------------------------------------------------------
// Base template for uint256 (N=32, transaction and block hashes) and
// uint160 (N=20, script hashes).  Bytes are stored in the order they appear
// on the wire (little-endian).  Hex display uses the reversed order, which
// is how N3 tooling prints hashes ("0x" + big-endian hex).
// ---------------------------------------------------------------------------
template <std::size_t N>
class Blob {
public:
    static constexpr std::size_t SIZE = N;

    constexpr Blob() noexcept : bytes_{} {}

    /// Construct from raw wire-order (little-endian) bytes.
    static Blob from_bytes(std::span<const uint8_t, N> bytes) noexcept;

    /// Construct from display-order (big-endian) bytes.
    static Blob from_bytes_be(std::span<const uint8_t, N> bytes) noexcept;

    /// Parse a display-order hex string of exactly 2*N characters, with an
    /// optional "0x" prefix.  Throws std::invalid_argument on malformed
    /// input.
    static Blob from_hex(std::string_view hex);

    /// Display-order hex (2*N lower-case chars, no prefix).
    [[nodiscard]] std::string to_hex() const;

    /// Wire-order hex (the raw bytes as stored).
    [[nodiscard]] std::string to_hex_le() const;

    [[nodiscard]] const uint8_t* data() const noexcept { return bytes_.data(); }
    [[nodiscard]]       uint8_t* data()       noexcept { return bytes_.data(); }

    [[nodiscard]] const std::array<uint8_t, N>& bytes() const noexcept {
        return bytes_;
    }

    /// Display-order copy of the bytes.
    [[nodiscard]] std::array<uint8_t, N> bytes_be() const noexcept;

    [[nodiscard]] std::span<const uint8_t> span() const noexcept {
        return std::span<const uint8_t>(bytes_);
    }

    [[nodiscard]] constexpr std::size_t size() const noexcept { return N; }

    [[nodiscard]] bool is_zero() const noexcept;

    // Comparison treats the value as a big unsigned integer.
    [[nodiscard]] std::strong_ordering operator<=>(const Blob& other) const noexcept;
    [[nodiscard]] bool operator==(const Blob& other) const noexcept;

protected:
    std::array<uint8_t, N> bytes_;
};

// ---------------------------------------------------------------------------
// uint256 -- 32-byte hash
// ---------------------------------------------------------------------------
class uint256 : public Blob<32> {
public:
    using Blob<32>::Blob;

    static uint256 from_hex(std::string_view hex);
    static uint256 from_bytes(std::span<const uint8_t, 32> bytes) noexcept;
    static uint256 from_bytes_be(std::span<const uint8_t, 32> bytes) noexcept;
};

// ---------------------------------------------------------------------------
// uint160 -- 20-byte script hash (account and contract identifiers)
// ---------------------------------------------------------------------------
class uint160 : public Blob<20> {
public:
    using Blob<20>::Blob;

    static uint160 from_hex(std::string_view hex);
    static uint160 from_bytes(std::span<const uint8_t, 20> bytes) noexcept;
    static uint160 from_bytes_be(std::span<const uint8_t, 20> bytes) noexcept;
};

}  // namespace core

// ---------------------------------------------------------------------------
// std::hash specializations
// ---------------------------------------------------------------------------
template <>
struct std::hash<core::uint256> {
    std::size_t operator()(const core::uint256& v) const noexcept;
};

template <>
struct std::hash<core::uint160> {
    std::size_t operator()(const core::uint160& v) const noexcept;
};
