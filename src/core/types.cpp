// Copyright (c) 2024-2026 The N3TX Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/types.h"

#include <algorithm>
#include <stdexcept>

namespace core {

namespace {

constexpr char HEX_DIGITS[] = "0123456789abcdef";

/// Convert a single hex character to its 4-bit value.
/// Returns -1 on invalid input.
constexpr int hex_digit_value(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

template <std::size_t N>
std::size_t fnv1a(const std::array<uint8_t, N>& b) noexcept {
    std::size_t h = 14695981039346656037ULL;
    for (auto byte : b) {
        h ^= static_cast<std::size_t>(byte);
        h *= 1099511628211ULL;
    }
    return h;
}

}  // namespace

// ===========================================================================
// Blob<N>
// ===========================================================================

// Definitions live here with explicit instantiations for N=32 and N=20 at
// the bottom of the file.

template <std::size_t N>
Blob<N> Blob<N>::from_bytes(std::span<const uint8_t, N> bytes) noexcept {
    Blob<N> result;
    std::copy(bytes.begin(), bytes.end(), result.bytes_.begin());
    return result;
}

template <std::size_t N>
Blob<N> Blob<N>::from_bytes_be(std::span<const uint8_t, N> bytes) noexcept {
    Blob<N> result;
    std::reverse_copy(bytes.begin(), bytes.end(), result.bytes_.begin());
    return result;
}

template <std::size_t N>
Blob<N> Blob<N>::from_hex(std::string_view hex) {
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex.remove_prefix(2);
    }

    if (hex.size() != N * 2) {
        throw std::invalid_argument(
            "Blob::from_hex: expected " + std::to_string(N * 2) +
            " hex chars, got " + std::to_string(hex.size()));
    }

    // Display order is big-endian; store reversed.
    Blob<N> result;
    for (std::size_t i = 0; i < N; ++i) {
        int hi = hex_digit_value(hex[2 * i]);
        int lo = hex_digit_value(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            throw std::invalid_argument(
                "Blob::from_hex: invalid hex character");
        }
        result.bytes_[N - 1 - i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return result;
}

template <std::size_t N>
std::string Blob<N>::to_hex() const {
    std::string out;
    out.reserve(N * 2);
    for (std::size_t i = N; i > 0; --i) {
        uint8_t byte = bytes_[i - 1];
        out.push_back(HEX_DIGITS[byte >> 4]);
        out.push_back(HEX_DIGITS[byte & 0x0F]);
    }
    return out;
}

template <std::size_t N>
std::string Blob<N>::to_hex_le() const {
    std::string out;
    out.reserve(N * 2);
    for (uint8_t byte : bytes_) {
        out.push_back(HEX_DIGITS[byte >> 4]);
        out.push_back(HEX_DIGITS[byte & 0x0F]);
    }
    return out;
}

template <std::size_t N>
std::array<uint8_t, N> Blob<N>::bytes_be() const noexcept {
    std::array<uint8_t, N> out{};
    std::reverse_copy(bytes_.begin(), bytes_.end(), out.begin());
    return out;
}

template <std::size_t N>
bool Blob<N>::is_zero() const noexcept {
    for (auto b : bytes_) {
        if (b != 0) return false;
    }
    return true;
}

template <std::size_t N>
std::strong_ordering Blob<N>::operator<=>(const Blob& other) const noexcept {
    // Most-significant byte is at index N-1.
    for (std::size_t i = N; i > 0; --i) {
        if (bytes_[i - 1] != other.bytes_[i - 1]) {
            return bytes_[i - 1] < other.bytes_[i - 1]
                       ? std::strong_ordering::less
                       : std::strong_ordering::greater;
        }
    }
    return std::strong_ordering::equal;
}

template <std::size_t N>
bool Blob<N>::operator==(const Blob& other) const noexcept {
    return bytes_ == other.bytes_;
}

template class Blob<32>;
template class Blob<20>;

// ===========================================================================
// uint256 / uint160 factories
// ===========================================================================

uint256 uint256::from_hex(std::string_view hex) {
    uint256 result;
    static_cast<Blob<32>&>(result) = Blob<32>::from_hex(hex);
    return result;
}

uint256 uint256::from_bytes(std::span<const uint8_t, 32> bytes) noexcept {
    uint256 result;
    static_cast<Blob<32>&>(result) = Blob<32>::from_bytes(bytes);
    return result;
}

uint256 uint256::from_bytes_be(std::span<const uint8_t, 32> bytes) noexcept {
    uint256 result;
    static_cast<Blob<32>&>(result) = Blob<32>::from_bytes_be(bytes);
    return result;
}

uint160 uint160::from_hex(std::string_view hex) {
    uint160 result;
    static_cast<Blob<20>&>(result) = Blob<20>::from_hex(hex);
    return result;
}

uint160 uint160::from_bytes(std::span<const uint8_t, 20> bytes) noexcept {
    uint160 result;
    static_cast<Blob<20>&>(result) = Blob<20>::from_bytes(bytes);
    return result;
}

uint160 uint160::from_bytes_be(std::span<const uint8_t, 20> bytes) noexcept {
    uint160 result;
    static_cast<Blob<20>&>(result) = Blob<20>::from_bytes_be(bytes);
    return result;
}

}  // namespace core

std::size_t std::hash<core::uint256>::operator()(
    const core::uint256& v) const noexcept {
    return core::fnv1a(v.bytes());
}

std::size_t std::hash<core::uint160>::operator()(
    const core::uint160& v) const noexcept {
    return core::fnv1a(v.bytes());
}
