#pragma once
// Copyright (c) 2024-2026 The N3TX Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// Hash functions used by the N3 protocol, backed by OpenSSL EVP.
//
// Provides:
//   - sha256() / hash256()   -- single and double SHA-256.
//   - ripemd160() / hash160() -- RIPEMD-160 and RIPEMD160(SHA256(x)).
//   - HashWriter             -- stream adapter for incremental hashing.
//   - hash<T>()              -- SHA-256 of any Serializable object.
//
// Digests are returned as wire-order blobs: the digest bytes exactly as the
// hash function emits them.  Display hex reverses them (see core::Blob).
// ---------------------------------------------------------------------------

#include "core/serialize.h"
#include "core/stream.h"
#include "core/types.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace crypto {

[[nodiscard]] core::uint256 sha256(std::span<const uint8_t> data);
[[nodiscard]] core::uint256 sha256(std::string_view text);

/// SHA256(SHA256(data)).
[[nodiscard]] core::uint256 hash256(std::span<const uint8_t> data);

[[nodiscard]] core::uint160 ripemd160(std::span<const uint8_t> data);

/// RIPEMD160(SHA256(data)) -- the script hash of a VM script.
[[nodiscard]] core::uint160 hash160(std::span<const uint8_t> data);

// ===================================================================
// HashWriter -- stream adapter for incremental hashing
// ===================================================================

/// Accumulates bytes written via the stream interface and produces a
/// SHA-256 digest on demand.  Satisfies the write side of the stream
/// concept so it can be passed straight to serialize().
class HashWriter {
public:
    HashWriter() = default;

    void write(std::span<const uint8_t> data) {
        buf_.insert(buf_.end(), data.begin(), data.end());
    }

    /// Single SHA-256 of everything written so far.  May be called
    /// repeatedly.
    [[nodiscard]] core::uint256 sha256() const {
        return crypto::sha256(std::span<const uint8_t>(buf_));
    }

    [[nodiscard]] size_t size() const noexcept { return buf_.size(); }

    void clear() { buf_.clear(); }

private:
    std::vector<uint8_t> buf_;
};

/// Serialize @p obj and return SHA-256 of the bytes.
template <core::Serializable T>
[[nodiscard]] core::uint256 hash(const T& obj) {
    HashWriter w;
    obj.serialize(w);
    return w.sha256();
}

}  // namespace crypto
