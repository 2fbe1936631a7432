#pragma once
// Copyright (c) 2024-2026 The N3TX Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "core/stream.h"
#include "core/types.h"

#include <algorithm>
#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <limits>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace core {

// ===================================================================
// Serialization concepts
// ===================================================================

/// A type is Serializable if it exposes a `serialize(Stream&)` method.
template <typename T>
concept Serializable = requires(const T t, BinaryWriter& s) {
    { t.serialize(s) };
};

/// A type is Deserializable if it exposes a static
/// `deserialize(BinaryReader&)` factory that returns an instance of itself.
template <typename T>
concept Deserializable = requires(BinaryReader& r) {
    { T::deserialize(r) } -> std::same_as<T>;
};

// ===================================================================
// Safety limits
// ===================================================================

/// Default cap for a var-bytes / var-string payload (16 MiB).
inline constexpr uint64_t MAX_VAR_BYTES = 0x1000000;

/// Default cap for a var-list element count.
inline constexpr uint64_t MAX_VAR_LIST = 0x10000;

// ===================================================================
// Var-int encoding
// ===================================================================
//
//   0x00 .. 0xFC            -> 1 byte   (value itself)
//   0xFD .. 0xFFFF          -> 0xFD + 2 bytes LE
//   0x10000 .. 0xFFFF'FFFF  -> 0xFE + 4 bytes LE
//   larger                  -> 0xFF + 8 bytes LE
// ===================================================================

/// Number of bytes ser_write_var_int() emits for @p n.
[[nodiscard]] constexpr size_t var_size(uint64_t n) noexcept {
    if (n < 0xFD) return 1;
    if (n <= 0xFFFF) return 3;
    if (n <= 0xFFFFFFFFULL) return 5;
    return 9;
}

/// Encoded size of a var-bytes field holding @p len bytes.
[[nodiscard]] constexpr size_t var_bytes_size(size_t len) noexcept {
    return var_size(len) + len;
}

template <typename Stream>
void ser_write_var_int(Stream& s, uint64_t n) {
    if (n < 0xFD) {
        uint8_t v = static_cast<uint8_t>(n);
        s.write(std::span<const uint8_t>(&v, 1));
    } else if (n <= 0xFFFF) {
        uint8_t buf[3] = {0xFD,
                          static_cast<uint8_t>(n & 0xFF),
                          static_cast<uint8_t>((n >> 8) & 0xFF)};
        s.write(std::span<const uint8_t>(buf, 3));
    } else if (n <= 0xFFFFFFFFULL) {
        uint8_t buf[5];
        buf[0] = 0xFE;
        for (int i = 0; i < 4; ++i) {
            buf[1 + i] = static_cast<uint8_t>((n >> (8 * i)) & 0xFF);
        }
        s.write(std::span<const uint8_t>(buf, 5));
    } else {
        uint8_t buf[9];
        buf[0] = 0xFF;
        for (int i = 0; i < 8; ++i) {
            buf[1 + i] = static_cast<uint8_t>((n >> (8 * i)) & 0xFF);
        }
        s.write(std::span<const uint8_t>(buf, 9));
    }
}

/// Read a var-int.  Throws FormatError on non-canonical encoding or a
/// value above @p max.
template <typename Stream>
uint64_t ser_read_var_int(Stream& s,
                          uint64_t max = std::numeric_limits<uint64_t>::max()) {
    uint8_t hdr{};
    s.read(std::span<uint8_t>(&hdr, 1));

    uint64_t n;
    if (hdr < 0xFD) {
        n = hdr;
    } else if (hdr == 0xFD) {
        uint8_t buf[2];
        s.read(std::span<uint8_t>(buf, 2));
        n = static_cast<uint64_t>(buf[0])
          | (static_cast<uint64_t>(buf[1]) << 8);
        if (n < 0xFD) {
            throw FormatError("ser_read_var_int(): non-canonical encoding");
        }
    } else if (hdr == 0xFE) {
        uint8_t buf[4];
        s.read(std::span<uint8_t>(buf, 4));
        n = 0;
        for (int i = 0; i < 4; ++i) {
            n |= static_cast<uint64_t>(buf[i]) << (8 * i);
        }
        if (n < 0x10000ULL) {
            throw FormatError("ser_read_var_int(): non-canonical encoding");
        }
    } else {
        uint8_t buf[8];
        s.read(std::span<uint8_t>(buf, 8));
        n = 0;
        for (int i = 0; i < 8; ++i) {
            n |= static_cast<uint64_t>(buf[i]) << (8 * i);
        }
        if (n < 0x100000000ULL) {
            throw FormatError("ser_read_var_int(): non-canonical encoding");
        }
    }

    if (n > max) {
        throw FormatError("ser_read_var_int(): value " + std::to_string(n) +
                          " exceeds limit " + std::to_string(max));
    }
    return n;
}

// ===================================================================
// Primitive serializers -- little-endian wire format
// ===================================================================

template <typename Stream>
inline void ser_write_u8(Stream& s, uint8_t v) {
    s.write(std::span<const uint8_t>(&v, 1));
}

template <typename Stream>
inline void ser_write_u16(Stream& s, uint16_t v) {
    uint8_t buf[2];
    buf[0] = static_cast<uint8_t>(v & 0xFF);
    buf[1] = static_cast<uint8_t>((v >> 8) & 0xFF);
    s.write(std::span<const uint8_t>(buf, 2));
}

template <typename Stream>
inline void ser_write_u32(Stream& s, uint32_t v) {
    uint8_t buf[4];
    for (int i = 0; i < 4; ++i) {
        buf[i] = static_cast<uint8_t>((v >> (8 * i)) & 0xFF);
    }
    s.write(std::span<const uint8_t>(buf, 4));
}

template <typename Stream>
inline void ser_write_u64(Stream& s, uint64_t v) {
    uint8_t buf[8];
    for (int i = 0; i < 8; ++i) {
        buf[i] = static_cast<uint8_t>((v >> (8 * i)) & 0xFF);
    }
    s.write(std::span<const uint8_t>(buf, 8));
}

template <typename Stream>
inline void ser_write_i16(Stream& s, int16_t v) {
    ser_write_u16(s, static_cast<uint16_t>(v));
}

template <typename Stream>
inline void ser_write_i32(Stream& s, int32_t v) {
    ser_write_u32(s, static_cast<uint32_t>(v));
}

template <typename Stream>
inline void ser_write_i64(Stream& s, int64_t v) {
    ser_write_u64(s, static_cast<uint64_t>(v));
}

template <typename Stream>
inline void ser_write_bool(Stream& s, bool v) {
    ser_write_u8(s, v ? 1 : 0);
}

template <typename Stream>
inline void ser_write_bytes(Stream& s, std::span<const uint8_t> data) {
    s.write(data);
}

// ===================================================================
// Primitive deserializers -- little-endian wire format
// ===================================================================

template <typename Stream>
inline uint8_t ser_read_u8(Stream& s) {
    uint8_t v{};
    s.read(std::span<uint8_t>(&v, 1));
    return v;
}

template <typename Stream>
inline uint16_t ser_read_u16(Stream& s) {
    uint8_t buf[2];
    s.read(std::span<uint8_t>(buf, 2));
    return static_cast<uint16_t>(buf[0] | (buf[1] << 8));
}

template <typename Stream>
inline uint32_t ser_read_u32(Stream& s) {
    uint8_t buf[4];
    s.read(std::span<uint8_t>(buf, 4));
    return static_cast<uint32_t>(buf[0])
         | (static_cast<uint32_t>(buf[1]) << 8)
         | (static_cast<uint32_t>(buf[2]) << 16)
         | (static_cast<uint32_t>(buf[3]) << 24);
}

template <typename Stream>
inline uint64_t ser_read_u64(Stream& s) {
    uint8_t buf[8];
    s.read(std::span<uint8_t>(buf, 8));
    uint64_t v = 0;
    for (int i = 0; i < 8; ++i) {
        v |= static_cast<uint64_t>(buf[i]) << (8 * i);
    }
    return v;
}

template <typename Stream>
inline int16_t ser_read_i16(Stream& s) {
    return static_cast<int16_t>(ser_read_u16(s));
}

template <typename Stream>
inline int32_t ser_read_i32(Stream& s) {
    return static_cast<int32_t>(ser_read_u32(s));
}

template <typename Stream>
inline int64_t ser_read_i64(Stream& s) {
    return static_cast<int64_t>(ser_read_u64(s));
}

/// Single byte, strictly 0x00 or 0x01.
template <typename Stream>
inline bool ser_read_bool(Stream& s) {
    uint8_t v = ser_read_u8(s);
    if (v > 1) {
        throw FormatError("ser_read_bool(): invalid boolean value");
    }
    return v != 0;
}

template <typename Stream>
inline std::vector<uint8_t> ser_read_bytes(Stream& s, size_t n) {
    auto view = s.take(n);
    return std::vector<uint8_t>(view.begin(), view.end());
}

// ===================================================================
// Var-bytes / var-string
// ===================================================================

/// var-int length prefix followed by the raw bytes.
template <typename Stream>
void ser_write_var_bytes(Stream& s, std::span<const uint8_t> data) {
    ser_write_var_int(s, data.size());
    if (!data.empty()) s.write(data);
}

template <typename Stream>
std::vector<uint8_t> ser_read_var_bytes(Stream& s,
                                        uint64_t max = MAX_VAR_BYTES) {
    uint64_t len = ser_read_var_int(s, max);
    return ser_read_bytes(s, static_cast<size_t>(len));
}

/// UTF-8 string with a var-int length prefix.
template <typename Stream>
void ser_write_var_string(Stream& s, std::string_view str) {
    ser_write_var_bytes(s, std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(str.data()), str.size()));
}

template <typename Stream>
std::string ser_read_var_string(Stream& s, uint64_t max = MAX_VAR_BYTES) {
    auto bytes = ser_read_var_bytes(s, max);
    return std::string(bytes.begin(), bytes.end());
}

/// Write @p str into a field of exactly @p width bytes, zero padded.
/// Fails when the string does not fit.
template <typename Stream>
core::Result<void> ser_write_fixed_string(Stream& s, std::string_view str,
                                          size_t width) {
    if (str.size() > width) {
        return core::Error(core::ErrorCode::CONFIG_INVALID_ARG,
                           "string of " + std::to_string(str.size()) +
                           " bytes exceeds fixed width " +
                           std::to_string(width));
    }
    std::vector<uint8_t> buf(width, 0);
    std::memcpy(buf.data(), str.data(), str.size());
    s.write(std::span<const uint8_t>(buf));
    return core::make_ok();
}

/// Read a zero padded fixed-width string.  Padding must be all zero.
template <typename Stream>
std::string ser_read_fixed_string(Stream& s, size_t width) {
    auto bytes = ser_read_bytes(s, width);
    size_t len = 0;
    while (len < bytes.size() && bytes[len] != 0) ++len;
    for (size_t i = len; i < bytes.size(); ++i) {
        if (bytes[i] != 0) {
            throw FormatError("ser_read_fixed_string(): non-zero padding");
        }
    }
    return std::string(bytes.begin(), bytes.begin() + static_cast<long>(len));
}

// ===================================================================
// Hashes
// ===================================================================
// Stored as raw wire-order bytes without a length prefix.

template <typename Stream>
inline void ser_write_uint160(Stream& s, const core::uint160& v) {
    s.write(v.span());
}

template <typename Stream>
inline core::uint160 ser_read_uint160(Stream& s) {
    std::array<uint8_t, 20> bytes{};
    s.read(std::span<uint8_t>(bytes));
    return core::uint160::from_bytes(std::span<const uint8_t, 20>(bytes));
}

template <typename Stream>
inline void ser_write_uint256(Stream& s, const core::uint256& v) {
    s.write(v.span());
}

template <typename Stream>
inline core::uint256 ser_read_uint256(Stream& s) {
    std::array<uint8_t, 32> bytes{};
    s.read(std::span<uint8_t>(bytes));
    return core::uint256::from_bytes(std::span<const uint8_t, 32>(bytes));
}

/// Compressed secp256r1 point: 0x02/0x03 prefix plus 32 bytes.
template <typename Stream>
std::array<uint8_t, 33> ser_read_encoded_ec_point(Stream& s) {
    std::array<uint8_t, 33> point{};
    s.read(std::span<uint8_t>(point.data(), 1));
    if (point[0] != 0x02 && point[0] != 0x03) {
        throw FormatError("ser_read_encoded_ec_point(): bad prefix byte");
    }
    s.read(std::span<uint8_t>(point.data() + 1, 32));
    return point;
}

// ===================================================================
// Var-lists of Serializable / Deserializable T
// ===================================================================

template <typename Stream, Serializable T>
void ser_write_list(Stream& s, const std::vector<T>& v) {
    ser_write_var_int(s, v.size());
    for (const auto& elem : v) {
        elem.serialize(s);
    }
}

template <Deserializable T>
std::vector<T> ser_read_list(BinaryReader& r, uint64_t max = MAX_VAR_LIST) {
    uint64_t count = ser_read_var_int(r, max);
    std::vector<T> result;
    result.reserve(std::min<size_t>(static_cast<size_t>(count), r.available()));
    for (uint64_t i = 0; i < count; ++i) {
        result.push_back(T::deserialize(r));
    }
    return result;
}

// ===================================================================
// Helpers
// ===================================================================

/// Serialize @p obj into a fresh byte vector.
template <Serializable T>
[[nodiscard]] inline std::vector<uint8_t> to_bytes(const T& obj) {
    BinaryWriter w;
    obj.serialize(w);
    return w.release();
}

/// Serialized byte count of @p obj.
template <Serializable T>
[[nodiscard]] inline size_t serialized_size(const T& obj) {
    BinaryWriter w;
    obj.serialize(w);
    return w.size();
}

/// Encoded size of a var-list, summing each element's serialized size.
template <Serializable T>
[[nodiscard]] inline size_t list_size(const std::vector<T>& v) {
    size_t total = var_size(v.size());
    for (const auto& elem : v) total += serialized_size(elem);
    return total;
}

/// Run a throwing decoder over @p data and convert reader exceptions into
/// PARSE_* errors.  When @p require_eof is set, trailing bytes are a
/// format error.
template <typename F>
[[nodiscard]] auto decode_bytes(std::span<const uint8_t> data, F&& decoder,
                                bool require_eof = true)
    -> core::Result<std::invoke_result_t<F, BinaryReader&>> {
    using T = std::invoke_result_t<F, BinaryReader&>;
    BinaryReader reader(data);
    try {
        T value = decoder(reader);
        if (require_eof && !reader.eof()) {
            return core::Error(core::ErrorCode::PARSE_BAD_FORMAT,
                               std::to_string(reader.available()) +
                               " trailing bytes after payload");
        }
        return value;
    } catch (const OutOfBoundsError& e) {
        return core::Error(core::ErrorCode::PARSE_OUT_OF_BOUNDS, e.what());
    } catch (const FormatError& e) {
        return core::Error(core::ErrorCode::PARSE_BAD_FORMAT, e.what());
    } catch (const std::exception& e) {
        return core::Error(core::ErrorCode::PARSE_ERROR, e.what());
    }
}

}  // namespace core
