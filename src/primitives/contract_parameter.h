#pragma once
// Copyright (c) 2024-2026 The N3TX Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/bigint.h"
#include "core/error.h"
#include "core/stream.h"
#include "core/types.h"
#include "crypto/secp256r1.h"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace primitives {

// ---------------------------------------------------------------------------
// ContractParameterType -- wire tag of a ContractParameter
// ---------------------------------------------------------------------------
enum class ContractParameterType : uint8_t {
    ANY        = 0x00,
    BOOLEAN    = 0x10,
    INTEGER    = 0x11,
    BYTE_ARRAY = 0x12,
    STRING     = 0x13,
    HASH160    = 0x14,
    HASH256    = 0x15,
    PUBLIC_KEY = 0x16,
    SIGNATURE  = 0x17,
    ARRAY      = 0x20,
    MAP        = 0x22,
};

/// "Any", "Boolean", "Integer", ... as used by node RPC.
std::string_view parameter_type_name(ContractParameterType type) noexcept;

// ---------------------------------------------------------------------------
// ContractParameter -- typed argument for a contract invocation
// ---------------------------------------------------------------------------
// A closed sum of the parameter kinds the VM understands.  Used as input to
// the script builder and as the typed form of decoded VM return values.
//
// Binary layout: one ContractParameterType byte followed by the payload
//   Any        -> nothing
//   Boolean    -> 1 byte (0/1)
//   Integer    -> var-bytes, little-endian two's complement
//   ByteArray  -> var-bytes
//   String     -> var-string (UTF-8)
//   Hash160    -> 20 bytes, Hash256 -> 32 bytes (wire order)
//   PublicKey  -> 33 bytes compressed, Signature -> 64 bytes
//   Array      -> var-int count, then each element
//   Map        -> var-int count, then key/value pairs
// ---------------------------------------------------------------------------
class ContractParameter {
public:
    struct ByteArray {
        std::vector<uint8_t> bytes;
        bool operator==(const ByteArray&) const = default;
    };
    using Array      = std::vector<ContractParameter>;
    using MapEntry   = std::pair<ContractParameter, ContractParameter>;
    using MapEntries = std::vector<MapEntry>;

    /// Decoder refuses nesting deeper than this.
    static constexpr int MAX_DEPTH = 16;

private:
    // Alternative order matters: type() maps the index to the wire tag.
    using Storage = std::variant<std::monostate, bool, core::BigInt,
                                 ByteArray, std::string, core::uint160,
                                 core::uint256, crypto::PublicKey,
                                 crypto::Signature, Array, MapEntries>;
    Storage storage_;

    explicit ContractParameter(Storage s) : storage_(std::move(s)) {}

public:
    ContractParameter() : storage_(std::monostate{}) {}

    // -- Factories ----------------------------------------------------------

    static ContractParameter any() { return ContractParameter(); }
    static ContractParameter boolean(bool v);
    static ContractParameter integer(core::BigInt v);
    static ContractParameter byte_array(std::span<const uint8_t> v);
    static ContractParameter string(std::string_view v);
    static ContractParameter hash160(const core::uint160& v);
    static ContractParameter hash256(const core::uint256& v);
    static ContractParameter public_key(const crypto::PublicKey& v);
    static ContractParameter signature(const crypto::Signature& v);
    static ContractParameter array(Array items);

    /// Map keys must be primitive (not Array or Map).
    static core::Result<ContractParameter> map(MapEntries entries);

    // -- Type queries -------------------------------------------------------

    [[nodiscard]] ContractParameterType type() const noexcept;

    [[nodiscard]] bool is_any()   const { return std::holds_alternative<std::monostate>(storage_); }
    [[nodiscard]] bool is_array() const { return std::holds_alternative<Array>(storage_); }
    [[nodiscard]] bool is_map()   const { return std::holds_alternative<MapEntries>(storage_); }

    // -- Accessors (nullptr on type mismatch) -------------------------------

    [[nodiscard]] const bool*              as_bool()       const { return std::get_if<bool>(&storage_); }
    [[nodiscard]] const core::BigInt*      as_integer()    const { return std::get_if<core::BigInt>(&storage_); }
    [[nodiscard]] const ByteArray*         as_byte_array() const { return std::get_if<ByteArray>(&storage_); }
    [[nodiscard]] const std::string*       as_string()     const { return std::get_if<std::string>(&storage_); }
    [[nodiscard]] const core::uint160*     as_hash160()    const { return std::get_if<core::uint160>(&storage_); }
    [[nodiscard]] const core::uint256*     as_hash256()    const { return std::get_if<core::uint256>(&storage_); }
    [[nodiscard]] const crypto::PublicKey* as_public_key() const { return std::get_if<crypto::PublicKey>(&storage_); }
    [[nodiscard]] const crypto::Signature* as_signature()  const { return std::get_if<crypto::Signature>(&storage_); }
    [[nodiscard]] const Array*             as_array()      const { return std::get_if<Array>(&storage_); }
    [[nodiscard]] const MapEntries*        as_map()        const { return std::get_if<MapEntries>(&storage_); }

    /// Raw bytes a data push of this parameter emits (ByteArray, String,
    /// Hash160, Hash256, PublicKey, Signature).  Empty for other kinds.
    [[nodiscard]] std::vector<uint8_t> push_bytes() const;

    /// Short human-readable rendering for logs, e.g. "Integer(42)".
    [[nodiscard]] std::string to_string() const;

    [[nodiscard]] bool operator==(const ContractParameter& other) const;

    // -- Binary codec -------------------------------------------------------

    void serialize(core::BinaryWriter& w) const;

    /// Throws core::OutOfBoundsError / core::FormatError.
    static ContractParameter deserialize(core::BinaryReader& r);

    [[nodiscard]] std::vector<uint8_t> to_bytes() const;
    static core::Result<ContractParameter> from_bytes(
        std::span<const uint8_t> data);

private:
    static ContractParameter deserialize_at(core::BinaryReader& r, int depth);
};

} // namespace primitives
