// Copyright (c) 2024-2026 The N3TX Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "primitives/contract_parameter.h"

#include "core/hex.h"
#include "core/serialize.h"

#include <algorithm>

namespace primitives {

std::string_view parameter_type_name(ContractParameterType type) noexcept {
    switch (type) {
    case ContractParameterType::ANY:        return "Any";
    case ContractParameterType::BOOLEAN:    return "Boolean";
    case ContractParameterType::INTEGER:    return "Integer";
    case ContractParameterType::BYTE_ARRAY: return "ByteArray";
    case ContractParameterType::STRING:     return "String";
    case ContractParameterType::HASH160:    return "Hash160";
    case ContractParameterType::HASH256:    return "Hash256";
    case ContractParameterType::PUBLIC_KEY: return "PublicKey";
    case ContractParameterType::SIGNATURE:  return "Signature";
    case ContractParameterType::ARRAY:      return "Array";
    case ContractParameterType::MAP:        return "Map";
    }
    return "Unknown";
}

// ---------------------------------------------------------------------------
// Factories
// ---------------------------------------------------------------------------

ContractParameter ContractParameter::boolean(bool v) {
    return ContractParameter(Storage(std::in_place_type<bool>, v));
}

ContractParameter ContractParameter::integer(core::BigInt v) {
    return ContractParameter(Storage(std::in_place_type<core::BigInt>,
                                     std::move(v)));
}

ContractParameter ContractParameter::byte_array(std::span<const uint8_t> v) {
    return ContractParameter(Storage(
        ByteArray{std::vector<uint8_t>(v.begin(), v.end())}));
}

ContractParameter ContractParameter::string(std::string_view v) {
    return ContractParameter(Storage(std::in_place_type<std::string>, v));
}

ContractParameter ContractParameter::hash160(const core::uint160& v) {
    return ContractParameter(Storage(v));
}

ContractParameter ContractParameter::hash256(const core::uint256& v) {
    return ContractParameter(Storage(v));
}

ContractParameter ContractParameter::public_key(const crypto::PublicKey& v) {
    return ContractParameter(Storage(std::in_place_type<crypto::PublicKey>, v));
}

ContractParameter ContractParameter::signature(const crypto::Signature& v) {
    return ContractParameter(Storage(std::in_place_type<crypto::Signature>, v));
}

ContractParameter ContractParameter::array(Array items) {
    return ContractParameter(Storage(std::in_place_type<Array>,
                                     std::move(items)));
}

core::Result<ContractParameter> ContractParameter::map(MapEntries entries) {
    for (const auto& [key, value] : entries) {
        if (key.is_array() || key.is_map()) {
            return core::Error(core::ErrorCode::CONFIG_INVALID_ARG,
                               "map keys must be primitive parameters");
        }
    }
    return ContractParameter(Storage(std::in_place_type<MapEntries>,
                                     std::move(entries)));
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

ContractParameterType ContractParameter::type() const noexcept {
    static constexpr ContractParameterType BY_INDEX[] = {
        ContractParameterType::ANY,        ContractParameterType::BOOLEAN,
        ContractParameterType::INTEGER,    ContractParameterType::BYTE_ARRAY,
        ContractParameterType::STRING,     ContractParameterType::HASH160,
        ContractParameterType::HASH256,    ContractParameterType::PUBLIC_KEY,
        ContractParameterType::SIGNATURE,  ContractParameterType::ARRAY,
        ContractParameterType::MAP,
    };
    static_assert(std::size(BY_INDEX) == std::variant_size_v<Storage>);
    return BY_INDEX[storage_.index()];
}

std::vector<uint8_t> ContractParameter::push_bytes() const {
    if (auto* p = std::get_if<ByteArray>(&storage_)) return p->bytes;
    if (auto* p = std::get_if<std::string>(&storage_)) {
        return std::vector<uint8_t>(p->begin(), p->end());
    }
    if (auto* p = std::get_if<core::uint160>(&storage_)) {
        return std::vector<uint8_t>(p->bytes().begin(), p->bytes().end());
    }
    if (auto* p = std::get_if<core::uint256>(&storage_)) {
        return std::vector<uint8_t>(p->bytes().begin(), p->bytes().end());
    }
    if (auto* p = std::get_if<crypto::PublicKey>(&storage_)) {
        return std::vector<uint8_t>(p->begin(), p->end());
    }
    if (auto* p = std::get_if<crypto::Signature>(&storage_)) {
        return std::vector<uint8_t>(p->begin(), p->end());
    }
    return {};
}

std::string ContractParameter::to_string() const {
    std::string out(parameter_type_name(type()));
    out += '(';
    switch (type()) {
    case ContractParameterType::ANY:
        break;
    case ContractParameterType::BOOLEAN:
        out += *as_bool() ? "true" : "false";
        break;
    case ContractParameterType::INTEGER:
        out += as_integer()->to_string();
        break;
    case ContractParameterType::STRING:
        out += '"' + *as_string() + '"';
        break;
    case ContractParameterType::HASH160:
        out += "0x" + as_hash160()->to_hex();
        break;
    case ContractParameterType::HASH256:
        out += "0x" + as_hash256()->to_hex();
        break;
    case ContractParameterType::BYTE_ARRAY:
    case ContractParameterType::PUBLIC_KEY:
    case ContractParameterType::SIGNATURE:
        out += core::to_hex(push_bytes());
        break;
    case ContractParameterType::ARRAY: {
        const auto& items = *as_array();
        for (size_t i = 0; i < items.size(); ++i) {
            if (i) out += ", ";
            out += items[i].to_string();
        }
        break;
    }
    case ContractParameterType::MAP: {
        const auto& entries = *as_map();
        for (size_t i = 0; i < entries.size(); ++i) {
            if (i) out += ", ";
            out += entries[i].first.to_string() + ": " +
                   entries[i].second.to_string();
        }
        break;
    }
    }
    out += ')';
    return out;
}

bool ContractParameter::operator==(const ContractParameter& other) const {
    return storage_ == other.storage_;
}

// ---------------------------------------------------------------------------
// Binary codec
// ---------------------------------------------------------------------------

void ContractParameter::serialize(core::BinaryWriter& w) const {
    core::ser_write_u8(w, static_cast<uint8_t>(type()));
    switch (type()) {
    case ContractParameterType::ANY:
        break;
    case ContractParameterType::BOOLEAN:
        core::ser_write_bool(w, *as_bool());
        break;
    case ContractParameterType::INTEGER:
        core::ser_write_var_bytes(w, as_integer()->to_le_bytes());
        break;
    case ContractParameterType::BYTE_ARRAY:
    case ContractParameterType::STRING:
        core::ser_write_var_bytes(w, push_bytes());
        break;
    case ContractParameterType::HASH160:
    case ContractParameterType::HASH256:
    case ContractParameterType::PUBLIC_KEY:
    case ContractParameterType::SIGNATURE:
        core::ser_write_bytes(w, push_bytes());
        break;
    case ContractParameterType::ARRAY:
        core::ser_write_list(w, *as_array());
        break;
    case ContractParameterType::MAP: {
        const auto& entries = *as_map();
        core::ser_write_var_int(w, entries.size());
        for (const auto& [key, value] : entries) {
            key.serialize(w);
            value.serialize(w);
        }
        break;
    }
    }
}

ContractParameter ContractParameter::deserialize(core::BinaryReader& r) {
    return deserialize_at(r, 0);
}

ContractParameter ContractParameter::deserialize_at(core::BinaryReader& r,
                                                    int depth) {
    if (depth > MAX_DEPTH) {
        throw core::FormatError("ContractParameter: nesting too deep");
    }

    auto tag = core::ser_read_u8(r);
    switch (static_cast<ContractParameterType>(tag)) {
    case ContractParameterType::ANY:
        return any();
    case ContractParameterType::BOOLEAN:
        return boolean(core::ser_read_bool(r));
    case ContractParameterType::INTEGER: {
        auto le = core::ser_read_var_bytes(r, 32);
        return integer(core::BigInt::from_le_bytes(le));
    }
    case ContractParameterType::BYTE_ARRAY:
        return byte_array(core::ser_read_var_bytes(r));
    case ContractParameterType::STRING:
        return string(core::ser_read_var_string(r));
    case ContractParameterType::HASH160:
        return hash160(core::ser_read_uint160(r));
    case ContractParameterType::HASH256:
        return hash256(core::ser_read_uint256(r));
    case ContractParameterType::PUBLIC_KEY:
        return public_key(core::ser_read_encoded_ec_point(r));
    case ContractParameterType::SIGNATURE: {
        crypto::Signature sig{};
        r.read(sig);
        return signature(sig);
    }
    case ContractParameterType::ARRAY: {
        auto count = core::ser_read_var_int(r, core::MAX_VAR_LIST);
        Array items;
        items.reserve(std::min<size_t>(static_cast<size_t>(count), r.available()));
        for (uint64_t i = 0; i < count; ++i) {
            items.push_back(deserialize_at(r, depth + 1));
        }
        return array(std::move(items));
    }
    case ContractParameterType::MAP: {
        auto count = core::ser_read_var_int(r, core::MAX_VAR_LIST);
        MapEntries entries;
        entries.reserve(std::min<size_t>(static_cast<size_t>(count), r.available()));
        for (uint64_t i = 0; i < count; ++i) {
            auto key = deserialize_at(r, depth + 1);
            auto value = deserialize_at(r, depth + 1);
            entries.emplace_back(std::move(key), std::move(value));
        }
        auto m = map(std::move(entries));
        if (!m.ok()) throw core::FormatError(m.error().message());
        return std::move(m).value();
    }
    }
    throw core::FormatError("ContractParameter: unknown type byte " +
                            std::to_string(tag));
}

std::vector<uint8_t> ContractParameter::to_bytes() const {
    return core::to_bytes(*this);
}

core::Result<ContractParameter> ContractParameter::from_bytes(
    std::span<const uint8_t> data) {
    return core::decode_bytes(data, [](core::BinaryReader& r) {
        return deserialize(r);
    });
}

} // namespace primitives
