// Copyright (c) 2024-2026 The N3TX Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "primitives/witness_condition.h"

#include "core/hex.h"
#include "core/serialize.h"

#include <algorithm>

namespace primitives {

namespace {

template <class... Ts> struct Overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

core::Result<void> validate_list(const WitnessCondition::List& list,
                                 int remaining_depth) {
    if (remaining_depth <= 0) {
        return core::Error(core::ErrorCode::CONFIG_NESTING_DEPTH,
                           "witness conditions nest deeper than " +
                           std::to_string(MAX_CONDITION_NESTING) + " levels");
    }
    if (list.empty()) {
        return core::Error(core::ErrorCode::CONFIG_INVALID_ARG,
                           "composite witness condition has no operands");
    }
    if (list.size() > MAX_SUBITEMS) {
        return core::Error(core::ErrorCode::CONFIG_TOO_MANY_ITEMS,
                           "composite witness condition has " +
                           std::to_string(list.size()) + " operands, max " +
                           std::to_string(MAX_SUBITEMS));
    }
    for (const auto& child : list) {
        N3TX_TRY_VOID(child.validate(remaining_depth - 1));
    }
    return core::make_ok();
}

} // namespace

// ---------------------------------------------------------------------------
// Factories
// ---------------------------------------------------------------------------

WitnessCondition WitnessCondition::boolean(bool value) {
    return WitnessCondition(BooleanCondition{value});
}

WitnessCondition WitnessCondition::negate(WitnessCondition operand) {
    return WitnessCondition(NotCondition{
        std::make_shared<const WitnessCondition>(std::move(operand))});
}

WitnessCondition WitnessCondition::all_of(List expressions) {
    return WitnessCondition(AndCondition{std::move(expressions)});
}

WitnessCondition WitnessCondition::any_of(List expressions) {
    return WitnessCondition(OrCondition{std::move(expressions)});
}

WitnessCondition WitnessCondition::script_hash(const core::uint160& hash) {
    return WitnessCondition(ScriptHashCondition{hash});
}

WitnessCondition WitnessCondition::group(const crypto::PublicKey& key) {
    return WitnessCondition(GroupCondition{key});
}

WitnessCondition WitnessCondition::called_by_entry() {
    return WitnessCondition(CalledByEntryCondition{});
}

WitnessCondition WitnessCondition::called_by_contract(
    const core::uint160& hash) {
    return WitnessCondition(CalledByContractCondition{hash});
}

WitnessCondition WitnessCondition::called_by_group(
    const crypto::PublicKey& key) {
    return WitnessCondition(CalledByGroupCondition{key});
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

WitnessConditionType WitnessCondition::type() const noexcept {
    static constexpr WitnessConditionType TAGS[] = {
        WitnessConditionType::BOOLEAN,
        WitnessConditionType::NOT,
        WitnessConditionType::AND,
        WitnessConditionType::OR,
        WitnessConditionType::SCRIPT_HASH,
        WitnessConditionType::GROUP,
        WitnessConditionType::CALLED_BY_ENTRY,
        WitnessConditionType::CALLED_BY_CONTRACT,
        WitnessConditionType::CALLED_BY_GROUP,
    };
    return TAGS[storage_.index()];
}

int WitnessCondition::nesting_depth() const {
    auto list_depth = [](const List& list) {
        int deepest = 0;
        for (const auto& c : list) deepest = std::max(deepest, c.nesting_depth());
        return deepest + 1;
    };
    return std::visit(Overloaded{
        [&](const AndCondition& c) { return list_depth(c.expressions); },
        [&](const OrCondition& c)  { return list_depth(c.expressions); },
        [](const NotCondition& c)  { return c.operand->nesting_depth() + 1; },
        [](const auto&)            { return 0; },
    }, storage_);
}

core::Result<void> WitnessCondition::validate(int max_depth) const {
    return std::visit(Overloaded{
        [&](const AndCondition& c) { return validate_list(c.expressions, max_depth); },
        [&](const OrCondition& c)  { return validate_list(c.expressions, max_depth); },
        [&](const NotCondition& c) -> core::Result<void> {
            if (max_depth <= 0) {
                return core::Error(core::ErrorCode::CONFIG_NESTING_DEPTH,
                                   "witness conditions nest deeper than " +
                                   std::to_string(MAX_CONDITION_NESTING) +
                                   " levels");
            }
            return c.operand->validate(max_depth - 1);
        },
        [](const auto&)            { return core::make_ok(); },
    }, storage_);
}

std::string WitnessCondition::to_string() const {
    auto join = [](std::string_view name, const List& list) {
        std::string out(name);
        out += '(';
        for (size_t i = 0; i < list.size(); ++i) {
            if (i) out += ", ";
            out += list[i].to_string();
        }
        return out + ')';
    };
    return std::visit(Overloaded{
        [](const BooleanCondition& c) {
            return std::string(c.value ? "Boolean(true)" : "Boolean(false)");
        },
        [](const NotCondition& c) {
            return "Not(" + c.operand->to_string() + ")";
        },
        [&](const AndCondition& c) { return join("And", c.expressions); },
        [&](const OrCondition& c)  { return join("Or", c.expressions); },
        [](const ScriptHashCondition& c) {
            return "ScriptHash(0x" + c.hash.to_hex() + ")";
        },
        [](const GroupCondition& c) {
            return "Group(" + core::to_hex(c.group) + ")";
        },
        [](const CalledByEntryCondition&) {
            return std::string("CalledByEntry");
        },
        [](const CalledByContractCondition& c) {
            return "CalledByContract(0x" + c.hash.to_hex() + ")";
        },
        [](const CalledByGroupCondition& c) {
            return "CalledByGroup(" + core::to_hex(c.group) + ")";
        },
    }, storage_);
}

// ---------------------------------------------------------------------------
// Serialization
// ---------------------------------------------------------------------------

void WitnessCondition::serialize(core::BinaryWriter& w) const {
    core::ser_write_u8(w, static_cast<uint8_t>(type()));
    std::visit(Overloaded{
        [&](const BooleanCondition& c) { core::ser_write_bool(w, c.value); },
        [&](const NotCondition& c)     { c.operand->serialize(w); },
        [&](const AndCondition& c)     { core::ser_write_list(w, c.expressions); },
        [&](const OrCondition& c)      { core::ser_write_list(w, c.expressions); },
        [&](const ScriptHashCondition& c) { core::ser_write_uint160(w, c.hash); },
        [&](const GroupCondition& c)   { core::ser_write_bytes(w, c.group); },
        [](const CalledByEntryCondition&) {},
        [&](const CalledByContractCondition& c) {
            core::ser_write_uint160(w, c.hash);
        },
        [&](const CalledByGroupCondition& c) {
            core::ser_write_bytes(w, c.group);
        },
    }, storage_);
}

WitnessCondition WitnessCondition::deserialize(core::BinaryReader& r) {
    return deserialize_at(r, MAX_CONDITION_NESTING);
}

WitnessCondition WitnessCondition::deserialize_at(core::BinaryReader& r,
                                                  int remaining_depth) {
    auto read_list = [&]() {
        if (remaining_depth <= 0) {
            throw core::FormatError("witness condition nesting too deep");
        }
        uint64_t count = core::ser_read_var_int(r, MAX_SUBITEMS);
        if (count == 0) {
            throw core::FormatError("empty composite witness condition");
        }
        List list;
        list.reserve(static_cast<size_t>(count));
        for (uint64_t i = 0; i < count; ++i) {
            list.push_back(deserialize_at(r, remaining_depth - 1));
        }
        return list;
    };

    uint8_t tag = core::ser_read_u8(r);
    switch (static_cast<WitnessConditionType>(tag)) {
    case WitnessConditionType::BOOLEAN:
        return boolean(core::ser_read_bool(r));
    case WitnessConditionType::NOT:
        if (remaining_depth <= 0) {
            throw core::FormatError("witness condition nesting too deep");
        }
        return negate(deserialize_at(r, remaining_depth - 1));
    case WitnessConditionType::AND:
        return all_of(read_list());
    case WitnessConditionType::OR:
        return any_of(read_list());
    case WitnessConditionType::SCRIPT_HASH:
        return script_hash(core::ser_read_uint160(r));
    case WitnessConditionType::GROUP:
        return group(core::ser_read_encoded_ec_point(r));
    case WitnessConditionType::CALLED_BY_ENTRY:
        return called_by_entry();
    case WitnessConditionType::CALLED_BY_CONTRACT:
        return called_by_contract(core::ser_read_uint160(r));
    case WitnessConditionType::CALLED_BY_GROUP:
        return called_by_group(core::ser_read_encoded_ec_point(r));
    }
    throw core::FormatError("unknown witness condition type 0x" +
                            core::to_hex(std::span(&tag, 1)));
}

bool WitnessCondition::operator==(const WitnessCondition& other) const {
    return core::to_bytes(*this) == core::to_bytes(other);
}

// ---------------------------------------------------------------------------
// WitnessRule
// ---------------------------------------------------------------------------

void WitnessRule::serialize(core::BinaryWriter& w) const {
    core::ser_write_u8(w, static_cast<uint8_t>(action));
    condition.serialize(w);
}

WitnessRule WitnessRule::deserialize(core::BinaryReader& r) {
    uint8_t action = core::ser_read_u8(r);
    if (action > static_cast<uint8_t>(WitnessAction::ALLOW)) {
        throw core::FormatError("unknown witness rule action " +
                                std::to_string(action));
    }
    return WitnessRule{static_cast<WitnessAction>(action),
                       WitnessCondition::deserialize(r)};
}

} // namespace primitives
