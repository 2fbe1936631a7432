// Copyright (c) 2024-2026 The N3TX Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "primitives/stack_item.h"

#include "core/serialize.h"

#include <algorithm>

namespace primitives {

std::string_view stack_item_type_name(StackItemType type) noexcept {
    switch (type) {
    case StackItemType::ANY:               return "Any";
    case StackItemType::POINTER:           return "Pointer";
    case StackItemType::BOOLEAN:           return "Boolean";
    case StackItemType::INTEGER:           return "Integer";
    case StackItemType::BYTE_STRING:       return "ByteString";
    case StackItemType::BUFFER:            return "Buffer";
    case StackItemType::ARRAY:             return "Array";
    case StackItemType::STRUCT:            return "Struct";
    case StackItemType::MAP:               return "Map";
    case StackItemType::INTEROP_INTERFACE: return "InteropInterface";
    }
    return "Unknown";
}

// ---------------------------------------------------------------------------
// Factories
// ---------------------------------------------------------------------------

StackItem StackItem::boolean(bool v) {
    return StackItem(StackItemType::BOOLEAN,
                     Storage(std::in_place_type<bool>, v));
}

StackItem StackItem::integer(core::BigInt v) {
    return StackItem(StackItemType::INTEGER,
                     Storage(std::in_place_type<core::BigInt>, std::move(v)));
}

StackItem StackItem::byte_string(std::span<const uint8_t> v) {
    return StackItem(StackItemType::BYTE_STRING,
                     Storage(std::in_place_type<std::vector<uint8_t>>,
                             v.begin(), v.end()));
}

StackItem StackItem::buffer(std::span<const uint8_t> v) {
    return StackItem(StackItemType::BUFFER,
                     Storage(std::in_place_type<std::vector<uint8_t>>,
                             v.begin(), v.end()));
}

StackItem StackItem::array(Items items) {
    return StackItem(StackItemType::ARRAY,
                     Storage(std::in_place_type<Items>, std::move(items)));
}

StackItem StackItem::structure(Items items) {
    return StackItem(StackItemType::STRUCT,
                     Storage(std::in_place_type<Items>, std::move(items)));
}

StackItem StackItem::map(MapEntries entries) {
    return StackItem(StackItemType::MAP,
                     Storage(std::in_place_type<MapEntries>,
                             std::move(entries)));
}

StackItem StackItem::pointer(uint32_t position) {
    return StackItem(StackItemType::POINTER,
                     Storage(std::in_place_type<uint32_t>, position));
}

StackItem StackItem::interop_interface() {
    return StackItem(StackItemType::INTEROP_INTERFACE, Storage());
}

// ---------------------------------------------------------------------------
// Conversions
// ---------------------------------------------------------------------------

std::optional<bool> StackItem::as_bool() const {
    if (auto* b = std::get_if<bool>(&storage_)) return *b;
    if (auto* i = std::get_if<core::BigInt>(&storage_)) return !i->is_zero();
    if (auto* d = std::get_if<std::vector<uint8_t>>(&storage_)) {
        return std::any_of(d->begin(), d->end(),
                           [](uint8_t c) { return c != 0; });
    }
    return std::nullopt;
}

std::optional<core::BigInt> StackItem::as_integer() const {
    if (auto* i = std::get_if<core::BigInt>(&storage_)) return *i;
    if (auto* b = std::get_if<bool>(&storage_)) {
        return core::BigInt(*b ? 1 : 0);
    }
    if (auto* d = std::get_if<std::vector<uint8_t>>(&storage_)) {
        if (d->size() > 32) return std::nullopt;
        return core::BigInt::from_le_bytes(*d);
    }
    return std::nullopt;
}

std::optional<std::vector<uint8_t>> StackItem::as_bytes() const {
    if (auto* d = std::get_if<std::vector<uint8_t>>(&storage_)) return *d;
    if (auto* i = std::get_if<core::BigInt>(&storage_)) {
        return i->to_le_bytes();
    }
    return std::nullopt;
}

std::optional<std::string> StackItem::as_string() const {
    auto* d = std::get_if<std::vector<uint8_t>>(&storage_);
    if (!d) return std::nullopt;
    return std::string(d->begin(), d->end());
}

std::optional<core::uint160> StackItem::as_hash160() const {
    auto* d = std::get_if<std::vector<uint8_t>>(&storage_);
    if (!d || d->size() != 20) return std::nullopt;
    return core::uint160::from_bytes(std::span<const uint8_t, 20>(*d));
}

core::Result<ContractParameter> StackItem::to_contract_parameter() const {
    switch (type_) {
    case StackItemType::ANY:
        return ContractParameter::any();
    case StackItemType::BOOLEAN:
        return ContractParameter::boolean(std::get<bool>(storage_));
    case StackItemType::INTEGER:
        return ContractParameter::integer(std::get<core::BigInt>(storage_));
    case StackItemType::BYTE_STRING:
    case StackItemType::BUFFER:
        return ContractParameter::byte_array(
            std::get<std::vector<uint8_t>>(storage_));
    case StackItemType::ARRAY:
    case StackItemType::STRUCT: {
        ContractParameter::Array params;
        for (const auto& item : std::get<Items>(storage_)) {
            N3TX_TRY_ASSIGN(p, item.to_contract_parameter());
            params.push_back(std::move(p));
        }
        return ContractParameter::array(std::move(params));
    }
    case StackItemType::MAP: {
        ContractParameter::MapEntries entries;
        for (const auto& [k, v] : std::get<MapEntries>(storage_)) {
            N3TX_TRY_ASSIGN(key, k.to_contract_parameter());
            N3TX_TRY_ASSIGN(value, v.to_contract_parameter());
            entries.emplace_back(std::move(key), std::move(value));
        }
        return ContractParameter::map(std::move(entries));
    }
    case StackItemType::POINTER:
    case StackItemType::INTEROP_INTERFACE:
        break;
    }
    return core::Error(core::ErrorCode::CONFIG_INVALID_ARG,
                       std::string(stack_item_type_name(type_)) +
                       " has no contract parameter form");
}

bool StackItem::operator==(const StackItem& other) const {
    return type_ == other.type_ && storage_ == other.storage_;
}

// ---------------------------------------------------------------------------
// Binary codec
// ---------------------------------------------------------------------------

void StackItem::serialize(core::BinaryWriter& w) const {
    core::ser_write_u8(w, static_cast<uint8_t>(type_));
    switch (type_) {
    case StackItemType::ANY:
        break;
    case StackItemType::BOOLEAN:
        core::ser_write_bool(w, std::get<bool>(storage_));
        break;
    case StackItemType::INTEGER:
        core::ser_write_var_bytes(
            w, std::get<core::BigInt>(storage_).to_le_bytes());
        break;
    case StackItemType::BYTE_STRING:
    case StackItemType::BUFFER:
        core::ser_write_var_bytes(w, std::get<std::vector<uint8_t>>(storage_));
        break;
    case StackItemType::ARRAY:
    case StackItemType::STRUCT:
        core::ser_write_list(w, std::get<Items>(storage_));
        break;
    case StackItemType::MAP: {
        const auto& entries = std::get<MapEntries>(storage_);
        core::ser_write_var_int(w, entries.size());
        for (const auto& [k, v] : entries) {
            k.serialize(w);
            v.serialize(w);
        }
        break;
    }
    case StackItemType::POINTER:
    case StackItemType::INTEROP_INTERFACE:
        // Not representable; the type byte alone marks the slot.
        break;
    }
}

StackItem StackItem::deserialize(core::BinaryReader& r) {
    return deserialize_at(r, 0);
}

StackItem StackItem::deserialize_at(core::BinaryReader& r, int depth) {
    if (depth > MAX_DEPTH) {
        throw core::FormatError("StackItem: nesting too deep");
    }

    auto tag = core::ser_read_u8(r);
    switch (static_cast<StackItemType>(tag)) {
    case StackItemType::ANY:
        return any();
    case StackItemType::BOOLEAN:
        return boolean(core::ser_read_bool(r));
    case StackItemType::INTEGER:
        return integer(core::BigInt::from_le_bytes(
            core::ser_read_var_bytes(r, 32)));
    case StackItemType::BYTE_STRING:
        return byte_string(core::ser_read_var_bytes(r));
    case StackItemType::BUFFER:
        return buffer(core::ser_read_var_bytes(r));
    case StackItemType::ARRAY:
    case StackItemType::STRUCT: {
        auto count = core::ser_read_var_int(r, core::MAX_VAR_LIST);
        Items items;
        items.reserve(std::min<size_t>(static_cast<size_t>(count), r.available()));
        for (uint64_t i = 0; i < count; ++i) {
            items.push_back(deserialize_at(r, depth + 1));
        }
        return static_cast<StackItemType>(tag) == StackItemType::ARRAY
            ? array(std::move(items))
            : structure(std::move(items));
    }
    case StackItemType::MAP: {
        auto count = core::ser_read_var_int(r, core::MAX_VAR_LIST);
        MapEntries entries;
        entries.reserve(std::min<size_t>(static_cast<size_t>(count), r.available()));
        for (uint64_t i = 0; i < count; ++i) {
            auto key = deserialize_at(r, depth + 1);
            auto value = deserialize_at(r, depth + 1);
            entries.emplace_back(std::move(key), std::move(value));
        }
        return map(std::move(entries));
    }
    case StackItemType::POINTER:
    case StackItemType::INTEROP_INTERFACE:
        break;
    }
    throw core::FormatError("StackItem: type byte " + std::to_string(tag) +
                            " is not deserializable");
}

core::Result<StackItem> StackItem::from_bytes(std::span<const uint8_t> data) {
    return core::decode_bytes(data, [](core::BinaryReader& r) {
        return deserialize(r);
    });
}

} // namespace primitives
