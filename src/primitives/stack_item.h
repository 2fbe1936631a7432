#pragma once
// Copyright (c) 2024-2026 The N3TX Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/bigint.h"
#include "core/error.h"
#include "core/stream.h"
#include "core/types.h"
#include "primitives/contract_parameter.h"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace primitives {

enum class StackItemType : uint8_t {
    ANY               = 0x00,
    POINTER           = 0x10,
    BOOLEAN           = 0x20,
    INTEGER           = 0x21,
    BYTE_STRING       = 0x28,
    BUFFER            = 0x30,
    ARRAY             = 0x40,
    STRUCT            = 0x41,
    MAP               = 0x48,
    INTEROP_INTERFACE = 0x60,
};

std::string_view stack_item_type_name(StackItemType type) noexcept;

// ---------------------------------------------------------------------------
// StackItem -- a value returned by VM execution
// ---------------------------------------------------------------------------
// Parsed from the VM binary-serializer format (type byte + payload; the
// same framing as ContractParameter with StackItemType tags).  Pointer and
// InteropInterface are not serializable and only appear when constructed
// from an RPC result.
// ---------------------------------------------------------------------------
class StackItem {
public:
    using Items      = std::vector<StackItem>;
    using MapEntries = std::vector<std::pair<StackItem, StackItem>>;

    static constexpr int MAX_DEPTH = 16;

private:
    using Storage = std::variant<std::monostate, bool, core::BigInt,
                                 std::vector<uint8_t>, Items, MapEntries,
                                 uint32_t>;
    StackItemType type_ = StackItemType::ANY;
    Storage storage_;

    StackItem(StackItemType type, Storage s)
        : type_(type), storage_(std::move(s)) {}

public:
    StackItem() = default;

    static StackItem any() { return StackItem(); }
    static StackItem boolean(bool v);
    static StackItem integer(core::BigInt v);
    static StackItem byte_string(std::span<const uint8_t> v);
    static StackItem buffer(std::span<const uint8_t> v);
    static StackItem array(Items items);
    static StackItem structure(Items items);
    static StackItem map(MapEntries entries);
    static StackItem pointer(uint32_t position);
    static StackItem interop_interface();

    [[nodiscard]] StackItemType type() const noexcept { return type_; }

    // -- Value conversions (nullopt when the item has no such reading) ------

    /// Boolean reading: Integer != 0, non-empty byte data with a non-zero
    /// byte, Boolean as is.
    [[nodiscard]] std::optional<bool> as_bool() const;

    /// Integer reading: Integer, Boolean (0/1) or byte data up to 32 bytes.
    [[nodiscard]] std::optional<core::BigInt> as_integer() const;

    /// Byte reading of ByteString/Buffer, or the minimal encoding of an
    /// Integer.
    [[nodiscard]] std::optional<std::vector<uint8_t>> as_bytes() const;

    /// UTF-8 reading of the byte data.
    [[nodiscard]] std::optional<std::string> as_string() const;

    /// 20 bytes of byte data read as a wire-order script hash.
    [[nodiscard]] std::optional<core::uint160> as_hash160() const;

    [[nodiscard]] const Items*      as_items() const { return std::get_if<Items>(&storage_); }
    [[nodiscard]] const MapEntries* as_map()   const { return std::get_if<MapEntries>(&storage_); }

    /// Typed view of this item.  Pointer and InteropInterface have no
    /// parameter form and fail.
    [[nodiscard]] core::Result<ContractParameter> to_contract_parameter() const;

    [[nodiscard]] bool operator==(const StackItem& other) const;

    // -- Binary codec -------------------------------------------------------

    void serialize(core::BinaryWriter& w) const;
    static StackItem deserialize(core::BinaryReader& r);

    static core::Result<StackItem> from_bytes(std::span<const uint8_t> data);

private:
    static StackItem deserialize_at(core::BinaryReader& r, int depth);
};

} // namespace primitives
