// Copyright (c) 2024-2026 The N3TX Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// Unit tests for witness scopes, witness conditions and rules, signers,
// transaction attributes and witnesses.

#include "test_framework.h"

#include "core/hex.h"
#include "core/serialize.h"
#include "crypto/secp256r1.h"
#include "primitives/signer.h"
#include "primitives/transaction_attribute.h"
#include "primitives/witness.h"
#include "primitives/witness_condition.h"
#include "primitives/witness_scope.h"
#include "wallet/account.h"

#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

using namespace primitives;

namespace {

crypto::ECKey key_from_secret(std::string_view hex) {
    auto bytes = core::hex_bytes(hex);
    std::array<uint8_t, 32> secret{};
    std::copy(bytes.begin(), bytes.end(), secret.begin());
    return crypto::ECKey::from_secret(secret).value();
}

wallet::Account default_account() {
    return wallet::Account::from_key(key_from_secret(
        "84180ac9d6eb6fba207ea4ef9d2200102d1ebeb4b9c07e2c6a738a42742e27a5"));
}

crypto::PublicKey group_key(uint8_t fill) {
    crypto::PublicKey key{};
    key.fill(fill);
    key[0] = 0x02;
    return key;
}

core::uint160 hash_of(uint8_t fill) {
    std::array<uint8_t, 20> bytes{};
    bytes.fill(fill);
    return core::uint160::from_bytes(bytes);
}

core::Result<Signer> parse_signer(std::span<const uint8_t> bytes) {
    return core::decode_bytes(bytes, [](core::BinaryReader& r) {
        return Signer::deserialize(r);
    });
}

core::Result<WitnessCondition> parse_condition(std::span<const uint8_t> bytes) {
    return core::decode_bytes(bytes, [](core::BinaryReader& r) {
        return WitnessCondition::deserialize(r);
    });
}

} // namespace

// ============================================================================
// Witness scopes
// ============================================================================

TEST_CASE(WitnessScope, combine_and_split) {
    std::vector<WitnessScope> flags = {WitnessScope::CALLED_BY_ENTRY,
                                       WitnessScope::CUSTOM_CONTRACTS};
    uint8_t b = combine_scopes(flags);
    CHECK_EQ(b, uint8_t{0x11});
    CHECK(split_scopes(b) == flags);
    CHECK_EQ(scopes_to_string(b), "CalledByEntry, CustomContracts");
    CHECK(split_scopes(0) == std::vector<WitnessScope>({WitnessScope::NONE}));
}

TEST_CASE(WitnessScope, valid_bytes) {
    CHECK(is_valid_scope_byte(0x00));
    CHECK(is_valid_scope_byte(0x71));
    CHECK(is_valid_scope_byte(0x80));
    CHECK(!is_valid_scope_byte(0x81));
    CHECK(!is_valid_scope_byte(0x02));
}

// ============================================================================
// Witness conditions
// ============================================================================

TEST_CASE(WitnessCondition, leaf_wire_forms) {
    CHECK_EQ(core::to_hex(core::to_bytes(WitnessCondition::boolean(true))), "0001");
    CHECK_EQ(core::to_hex(core::to_bytes(WitnessCondition::called_by_entry())), "20");
    auto sh = core::to_bytes(WitnessCondition::script_hash(hash_of(0xAB)));
    CHECK_EQ(sh.size(), size_t{21});
    CHECK_EQ(sh[0], uint8_t{0x18});
    auto grp = core::to_bytes(WitnessCondition::called_by_group(group_key(0x11)));
    CHECK_EQ(grp.size(), size_t{34});
    CHECK_EQ(grp[0], uint8_t{0x29});
}

TEST_CASE(WitnessCondition, composite_round_trip) {
    auto cond = WitnessCondition::any_of({
        WitnessCondition::all_of({
            WitnessCondition::called_by_entry(),
            WitnessCondition::boolean(false),
        }),
        WitnessCondition::negate(
            WitnessCondition::called_by_contract(hash_of(0x01))),
    });
    CHECK_EQ(cond.nesting_depth(), 2);
    CHECK_OK(cond.validate());
    auto bytes = core::to_bytes(cond);
    auto back = parse_condition(bytes);
    CHECK_OK(back);
    CHECK(back.value() == cond);
    CHECK(back.value().type() == WitnessConditionType::OR);
}

TEST_CASE(WitnessCondition, not_counts_as_a_level) {
    auto shallow = WitnessCondition::all_of({
        WitnessCondition::negate(WitnessCondition::boolean(true)),
    });
    CHECK_EQ(shallow.nesting_depth(), 2);
    CHECK_OK(shallow.validate());
    CHECK_OK(parse_condition(core::to_bytes(shallow)));

    auto deep = WitnessCondition::all_of({
        WitnessCondition::negate(WitnessCondition::all_of({
            WitnessCondition::boolean(true),
        })),
    });
    CHECK_EQ(deep.nesting_depth(), 3);
    auto r = deep.validate();
    CHECK_ERR(r);
    CHECK(r.error().code() == core::ErrorCode::CONFIG_NESTING_DEPTH);
    CHECK_ERR(parse_condition(core::to_bytes(deep)));

    auto triple_not = WitnessCondition::negate(WitnessCondition::negate(
        WitnessCondition::negate(WitnessCondition::called_by_entry())));
    CHECK_ERR(triple_not.validate());
}

TEST_CASE(WitnessCondition, long_not_chain_is_rejected) {
    // Not tags repeated far past the depth limit, then Boolean(true).
    std::vector<uint8_t> bytes(2000000, 0x01);
    bytes.push_back(0x00);
    bytes.push_back(0x01);
    auto r = parse_condition(bytes);
    CHECK_ERR(r);
    CHECK(r.error().code() == core::ErrorCode::PARSE_BAD_FORMAT);

    // The same chain inside a signer's rule list.
    std::vector<uint8_t> signer(20, 0x07);
    signer.push_back(0x40);   // WitnessRules scope
    signer.push_back(0x01);   // one rule
    signer.push_back(0x01);   // Allow
    signer.insert(signer.end(), bytes.begin(), bytes.end());
    auto s = parse_signer(signer);
    CHECK_ERR(s);
    CHECK(s.error().code() == core::ErrorCode::PARSE_BAD_FORMAT);
}

TEST_CASE(WitnessCondition, rejects_deep_nesting) {
    auto deep = WitnessCondition::all_of({
        WitnessCondition::all_of({
            WitnessCondition::all_of({WitnessCondition::boolean(true)}),
        }),
    });
    CHECK_EQ(deep.nesting_depth(), 3);
    auto r = deep.validate();
    CHECK_ERR(r);
    CHECK(r.error().code() == core::ErrorCode::CONFIG_NESTING_DEPTH);

    auto parsed = parse_condition(core::to_bytes(deep));
    CHECK_ERR(parsed);
    CHECK(parsed.error().code() == core::ErrorCode::PARSE_BAD_FORMAT);
}

TEST_CASE(WitnessCondition, composite_item_limits) {
    auto empty = WitnessCondition::all_of({});
    CHECK_ERR(empty.validate());

    WitnessCondition::List many(17, WitnessCondition::called_by_entry());
    auto too_many = WitnessCondition::any_of(many);
    auto r = too_many.validate();
    CHECK_ERR(r);
    CHECK(r.error().code() == core::ErrorCode::CONFIG_TOO_MANY_ITEMS);
    CHECK_ERR(parse_condition(core::to_bytes(too_many)));

    many.pop_back();
    CHECK_OK(WitnessCondition::any_of(many).validate());
}

TEST_CASE(WitnessCondition, rejects_unknown_tag) {
    CHECK_ERR(parse_condition(core::hex_bytes("05")));
    CHECK_ERR(parse_condition(core::hex_bytes("0002")));
}

TEST_CASE(WitnessRule, wire_form) {
    WitnessRule rule{WitnessAction::ALLOW, WitnessCondition::called_by_entry()};
    auto bytes = core::to_bytes(rule);
    CHECK_EQ(core::to_hex(bytes), "0120");
    auto back = core::decode_bytes(bytes, [](core::BinaryReader& r) {
        return WitnessRule::deserialize(r);
    });
    CHECK_OK(back);
    CHECK(back.value() == rule);

    auto bad = core::decode_bytes(core::hex_bytes("0220"), [](core::BinaryReader& r) {
        return WitnessRule::deserialize(r);
    });
    CHECK_ERR(bad);
}

// ============================================================================
// Signers
// ============================================================================

TEST_CASE(Signer, account_signer_identity) {
    auto account = default_account();
    auto signer = AccountSigner::called_by_entry(account);
    CHECK(signer.script_hash() == account.script_hash());
    CHECK_EQ(signer.scopes(), uint8_t{0x01});
    CHECK(signer.account().address() == account.address());
}

TEST_CASE(Signer, global_rejects_allowed_contracts) {
    auto signer = AccountSigner::global(default_account());
    std::vector<core::uint160> contracts = {hash_of(0x01)};
    auto r = signer.set_allowed_contracts(contracts);
    CHECK_ERR(r);
    CHECK(r.error().code() == core::ErrorCode::CONFIG_SCOPE_CONFLICT);
    CHECK_EQ(signer.scopes(), uint8_t{0x80});
    CHECK(signer.allowed_contracts().empty());

    std::vector<crypto::PublicKey> groups = {group_key(0x01)};
    CHECK_ERR(signer.set_allowed_groups(groups));
}

TEST_CASE(Signer, called_by_entry_adds_custom_contracts) {
    auto signer = AccountSigner::called_by_entry(default_account());
    std::vector<core::uint160> contracts = {hash_of(0x01), hash_of(0x02)};
    CHECK_OK(signer.set_allowed_contracts(contracts));
    CHECK(signer.has_scope(WitnessScope::CALLED_BY_ENTRY));
    CHECK(signer.has_scope(WitnessScope::CUSTOM_CONTRACTS));
    CHECK_EQ(signer.allowed_contracts().size(), size_t{2});
}

TEST_CASE(Signer, allowed_groups_cap) {
    std::vector<crypto::PublicKey> sixteen;
    for (uint8_t i = 0; i < 16; ++i) sixteen.push_back(group_key(i));
    auto exact = AccountSigner::called_by_entry(default_account());
    CHECK_OK(exact.set_allowed_groups(sixteen));
    CHECK_EQ(exact.allowed_groups().size(), size_t{16});

    std::vector<crypto::PublicKey> one_more = {group_key(0xEE)};
    auto r = exact.set_allowed_groups(one_more);
    CHECK_ERR(r);
    CHECK(r.error().code() == core::ErrorCode::CONFIG_TOO_MANY_ITEMS);
    CHECK_EQ(exact.allowed_groups().size(), size_t{16});

    auto over = AccountSigner::called_by_entry(default_account());
    auto seventeen = sixteen;
    seventeen.push_back(group_key(0xEE));
    CHECK_ERR(over.set_allowed_groups(seventeen));
    CHECK(!over.has_scope(WitnessScope::CUSTOM_GROUPS));
}

TEST_CASE(Signer, rules_are_validated) {
    auto signer = ContractSigner::called_by_entry(hash_of(0x42));
    std::vector<WitnessRule> deep = {{
        WitnessAction::DENY,
        WitnessCondition::all_of({WitnessCondition::all_of({
            WitnessCondition::all_of({WitnessCondition::boolean(true)}),
        })}),
    }};
    auto r = signer.set_rules(deep);
    CHECK_ERR(r);
    CHECK(r.error().code() == core::ErrorCode::CONFIG_NESTING_DEPTH);
    CHECK(!signer.has_scope(WitnessScope::WITNESS_RULES));

    std::vector<WitnessRule> ok = {{WitnessAction::ALLOW,
                                    WitnessCondition::boolean(true)}};
    CHECK_OK(signer.set_rules(ok));
    CHECK(signer.has_scope(WitnessScope::WITNESS_RULES));
}

TEST_CASE(Signer, wire_layout) {
    auto hash = hash_of(0x0F);
    TransactionSigner plain(hash, 0x01);
    auto bytes = core::to_bytes(Signer(plain));
    CHECK_EQ(bytes.size(), size_t{21});
    CHECK_EQ(bytes.back(), uint8_t{0x01});

    auto signer = AccountSigner::called_by_entry(default_account());
    std::vector<core::uint160> contracts = {hash_of(0x01)};
    CHECK_OK(signer.set_allowed_contracts(contracts));
    std::vector<WitnessRule> rules = {{WitnessAction::ALLOW,
                                       WitnessCondition::called_by_entry()}};
    CHECK_OK(signer.set_rules(rules));
    auto wire = core::to_bytes(Signer(signer));
    // hash | scopes 0x51 | 1 contract | 1 rule (ALLOW CalledByEntry)
    CHECK_EQ(wire.size(), size_t{20 + 1 + 1 + 20 + 1 + 2});
    CHECK_EQ(wire[20], uint8_t{0x51});
    CHECK_EQ(core::to_hex(std::span(wire).last(3)), "010120");
    CHECK_EQ(signer.serialized_size(), wire.size());
}

TEST_CASE(Signer, deserialize_yields_wire_signer) {
    auto signer = AccountSigner::called_by_entry(default_account());
    std::vector<crypto::PublicKey> groups = {group_key(0x05)};
    CHECK_OK(signer.set_allowed_groups(groups));
    Signer original(signer);

    auto back = parse_signer(core::to_bytes(original));
    CHECK_OK(back);
    CHECK(back.value().is_transaction());
    CHECK(back.value() == original);
    CHECK(back.value().base().allowed_groups() == signer.allowed_groups());
}

TEST_CASE(Signer, deserialize_rejects_bad_scopes) {
    std::vector<uint8_t> bytes(20, 0x00);
    bytes.push_back(0x81);  // Global combined with CalledByEntry
    CHECK_ERR(parse_signer(bytes));

    std::vector<uint8_t> too_many(20, 0x00);
    too_many.push_back(0x10);
    too_many.push_back(17);
    for (int i = 0; i < 17; ++i) too_many.insert(too_many.end(), 20, 0x01);
    CHECK_ERR(parse_signer(too_many));
}

// ============================================================================
// Transaction attributes
// ============================================================================

TEST_CASE(TransactionAttribute, high_priority_wire) {
    auto attr = TransactionAttribute::high_priority();
    CHECK(attr.is_high_priority());
    CHECK_EQ(core::to_hex(core::to_bytes(attr)), "01");
}

TEST_CASE(TransactionAttribute, oracle_response_round_trip) {
    auto attr = TransactionAttribute::oracle_response(
        7, OracleResponseCode::SUCCESS, {0xCA, 0xFE});
    auto bytes = core::to_bytes(attr);
    CHECK_EQ(core::to_hex(bytes), "11" "0700000000000000" "00" "02cafe");
    auto back = core::decode_bytes(bytes, [](core::BinaryReader& r) {
        return TransactionAttribute::deserialize(r);
    });
    CHECK_OK(back);
    CHECK(back.value() == attr);
    CHECK_EQ(back.value().as_oracle_response()->id, uint64_t{7});
}

TEST_CASE(TransactionAttribute, failed_oracle_response_has_no_result) {
    auto bytes = core::hex_bytes("11" "0100000000000000" "14" "0101");
    auto r = core::decode_bytes(bytes, [](core::BinaryReader& rd) {
        return TransactionAttribute::deserialize(rd);
    });
    CHECK_ERR(r);
    auto unknown = core::decode_bytes(core::hex_bytes("20"), [](core::BinaryReader& rd) {
        return TransactionAttribute::deserialize(rd);
    });
    CHECK_ERR(unknown);
}

// ============================================================================
// Witnesses
// ============================================================================

TEST_CASE(Witness, single_sig_matches_account) {
    auto account = default_account();
    std::vector<uint8_t> message = {0x01, 0x02, 0x03};
    auto w = Witness::create(message, *account.key());
    CHECK_OK(w);
    CHECK(w.value().verification().script_hash() == account.script_hash());
    auto sigs = w.value().invocation().signatures();
    CHECK_OK(sigs);
    CHECK(crypto::ECKey::verify(account.key()->pubkey_compressed(), message,
                                sigs.value()[0]));
}

TEST_CASE(Witness, multisig_takes_threshold_signatures) {
    std::vector<crypto::ECKey> keys;
    std::vector<crypto::PublicKey> pubs;
    for (int i = 0; i < 3; ++i) {
        keys.push_back(crypto::ECKey::generate().value());
        pubs.push_back(keys.back().pubkey_compressed());
    }
    auto vs = script::VerificationScript::from_multisig(pubs, 2);
    CHECK_OK(vs);

    std::vector<uint8_t> message = {0xAA};
    std::vector<crypto::Signature> sigs;
    for (const auto& k : keys) sigs.push_back(k.sign(message).value());

    auto w = Witness::create_multisig(vs.value(), sigs);
    CHECK_OK(w);
    CHECK_EQ(w.value().invocation().signatures().value().size(), size_t{2});

    std::vector<crypto::Signature> one(sigs.begin(), sigs.begin() + 1);
    auto short_w = Witness::create_multisig(vs.value(), one);
    CHECK_ERR(short_w);
    CHECK(short_w.error().code() == core::ErrorCode::CONFIG_MULTISIG);

    auto single = script::VerificationScript::from_public_key(pubs[0]);
    CHECK_ERR(Witness::create_multisig(single, sigs));
}

TEST_CASE(Witness, contract_witness_has_empty_verification) {
    std::vector<ContractParameter> params = {ContractParameter::integer(1)};
    auto w = Witness::create_contract_witness(params);
    CHECK_OK(w);
    CHECK(w.value().verification().empty());
    CHECK(!w.value().invocation().empty());

    auto bytes = core::to_bytes(w.value());
    auto back = core::decode_bytes(bytes, [](core::BinaryReader& r) {
        return Witness::deserialize(r);
    });
    CHECK_OK(back);
    CHECK(back.value() == w.value());
    CHECK_EQ(w.value().serialized_size(), bytes.size());
}
