// Copyright (c) 2024-2026 The N3TX Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// Unit tests for the script layer: opcodes, interop tags, the builder,
// the reader, verification and invocation scripts, contract parameters
// and stack items.

#include "test_framework.h"

#include "core/bigint.h"
#include "core/hex.h"
#include "crypto/secp256r1.h"
#include "primitives/contract_parameter.h"
#include "primitives/script/builder.h"
#include "primitives/script/interop.h"
#include "primitives/script/invocation.h"
#include "primitives/script/opcodes.h"
#include "primitives/script/reader.h"
#include "primitives/script/verification.h"
#include "primitives/stack_item.h"

#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

using namespace primitives;
using namespace primitives::script;

namespace {

crypto::PublicKey key_from_hex(std::string_view hex) {
    auto bytes = core::hex_bytes(hex);
    crypto::PublicKey key{};
    std::copy(bytes.begin(), bytes.end(), key.begin());
    return key;
}

std::string pushed_integer(int64_t n) {
    ScriptBuilder sb;
    auto r = sb.push_integer(core::BigInt(n));
    if (!r.ok()) return "error";
    return core::to_hex(sb.bytes());
}

const char* KEY_A =
    "035fdb1d1f06759547020891ae97c729327853aeb1256b6fe0473bc2e9fa42ff50";
const char* KEY_B =
    "033a4d051b04b7fc0230d2b1aaedfd5a84be279a5361a7358db665ad7857787f1b";
const char* KEY_C =
    "026aa8fe6b4360a67a530e23c08c6a72525afde34719c5436f9d3ced759f939a3d";

} // namespace

// ============================================================================
// Opcodes and interop
// ============================================================================

TEST_CASE(Opcodes, operand_sizes) {
    CHECK_EQ(operand_size(Opcode::PUSHINT8).size, uint8_t{1});
    CHECK_EQ(operand_size(Opcode::PUSHINT256).size, uint8_t{32});
    CHECK_EQ(operand_size(Opcode::PUSHDATA1).prefix, uint8_t{1});
    CHECK_EQ(operand_size(Opcode::PUSHDATA2).prefix, uint8_t{2});
    CHECK_EQ(operand_size(Opcode::PUSHDATA4).prefix, uint8_t{4});
    CHECK_EQ(operand_size(Opcode::SYSCALL).size, uint8_t{4});
    CHECK_EQ(operand_size(Opcode::PUSH0).size, uint8_t{0});
}

TEST_CASE(Opcodes, names_and_validity) {
    CHECK_EQ(opcode_name(Opcode::PUSHDATA1), "PUSHDATA1");
    CHECK(opcode_from_name("SYSCALL") == Opcode::SYSCALL);
    CHECK(!opcode_from_name("NOSUCHOP").has_value());
    CHECK(is_valid_opcode(0x41));
    CHECK(!is_valid_opcode(0x06));
}

TEST_CASE(Opcodes, small_ints) {
    CHECK(decode_small_int(Opcode::PUSHM1) == -1);
    CHECK(decode_small_int(Opcode::PUSH16) == 16);
    CHECK(!decode_small_int(Opcode::PUSHINT8).has_value());
    CHECK(encode_small_int(5) == Opcode::PUSH5);
}

TEST_CASE(Interop, service_tags) {
    CHECK_EQ(core::to_hex(interop_tag(InteropService::CRYPTO_CHECK_SIG)), "56e7b327");
    CHECK_EQ(core::to_hex(interop_tag(InteropService::CRYPTO_CHECK_MULTISIG)),
             "9ed0dc3a");
    CHECK_EQ(core::to_hex(interop_tag(InteropService::CONTRACT_CALL)), "627d5b52");
    auto tag = interop_tag(InteropService::ITERATOR_NEXT);
    CHECK(interop_from_tag(tag) == InteropService::ITERATOR_NEXT);
    CHECK_EQ(interop_name(InteropService::CONTRACT_CALL), "System.Contract.Call");
}

// ============================================================================
// ScriptBuilder -- pushes
// ============================================================================

TEST_CASE(ScriptBuilder, push_small_integers) {
    CHECK_EQ(pushed_integer(-1), "0f");
    CHECK_EQ(pushed_integer(0), "10");
    CHECK_EQ(pushed_integer(16), "20");
}

TEST_CASE(ScriptBuilder, push_wide_integers) {
    CHECK_EQ(pushed_integer(17), "0011");
    CHECK_EQ(pushed_integer(-100000), "026079feff");
    CHECK_EQ(pushed_integer(128), "018000");
    CHECK_EQ(pushed_integer(-2), "00fe");
    CHECK_EQ(pushed_integer(65536), "0200000100");
    CHECK_EQ(pushed_integer(INT64_MAX), "03ffffffffffffff7f");
}

TEST_CASE(ScriptBuilder, push_integer_too_wide) {
    auto huge = core::BigInt::from_string(
        "1" + std::string(80, '0'));  // beyond 256 bits
    CHECK_OK(huge);
    ScriptBuilder sb;
    auto r = sb.push_integer(huge.value());
    CHECK_ERR(r);
    CHECK(r.error().code() == core::ErrorCode::SCRIPT_INT_TOO_LARGE);
    CHECK_EQ(sb.size(), size_t{0});
}

TEST_CASE(ScriptBuilder, push_data_prefixes) {
    ScriptBuilder small;
    small.push_data(std::string_view("abc"));
    CHECK_EQ(core::to_hex(small.bytes()), "0c03616263");

    std::vector<uint8_t> mid(256, 0xAB);
    ScriptBuilder two;
    two.push_data(mid);
    CHECK_EQ(two.bytes()[0], uint8_t{0x0D});
    CHECK_EQ(two.bytes()[1], uint8_t{0x00});
    CHECK_EQ(two.bytes()[2], uint8_t{0x01});
    CHECK_EQ(two.size(), size_t{3 + 256});

    std::vector<uint8_t> big(0x10000, 0x01);
    ScriptBuilder four;
    four.push_data(big);
    CHECK_EQ(four.bytes()[0], uint8_t{0x0E});
    CHECK_EQ(four.size(), size_t{5 + 0x10000});
}

TEST_CASE(ScriptBuilder, push_bool_and_null) {
    ScriptBuilder sb;
    sb.push_bool(true).push_bool(false);
    CHECK_OK(sb.push_param(ContractParameter::any()));
    CHECK_EQ(core::to_hex(sb.bytes()), "08090b");
}

TEST_CASE(ScriptBuilder, push_params_in_order) {
    std::vector<ContractParameter> params = {
        ContractParameter::integer(1),
        ContractParameter::string("x"),
    };
    ScriptBuilder sb;
    CHECK_OK(sb.push_params(params));
    // PUSH1, PUSHDATA1 "x", PUSH2, PACK
    CHECK_EQ(core::to_hex(sb.bytes()), "110c017812c0");
}

TEST_CASE(ScriptBuilder, push_empty_array_and_map) {
    ScriptBuilder sb;
    CHECK_OK(sb.push_param(ContractParameter::array({})));
    auto m = ContractParameter::map({
        {ContractParameter::integer(1), ContractParameter::boolean(true)},
    });
    CHECK_OK(m);
    CHECK_OK(sb.push_param(m.value()));
    // NEWARRAY0, then value PUSHT, key PUSH1, count PUSH1, PACKMAP
    CHECK_EQ(core::to_hex(sb.bytes()), "c2081111be");
}

TEST_CASE(ScriptBuilder, map_rejects_container_keys) {
    auto m = ContractParameter::map({
        {ContractParameter::array({}), ContractParameter::integer(1)},
    });
    CHECK_ERR(m);
}

TEST_CASE(ScriptBuilder, contract_call_without_params) {
    auto neo = core::uint160::from_hex("ef4073a0f2b305a38ec4050e4d3d28bc40ea63f5");
    auto script = build_contract_script(neo, "symbol", {});
    CHECK_OK(script);
    CHECK_EQ(core::to_hex(script.value()),
             "c21f0c0673796d626f6c0c14f563ea40bc283d4d0e05c48ea305b3f2a07340ef"
             "41627d5b52");
}

TEST_CASE(ScriptBuilder, contract_call_read_only_flags) {
    auto neo = core::uint160::from_hex("ef4073a0f2b305a38ec4050e4d3d28bc40ea63f5");
    ScriptBuilder sb;
    CHECK_OK(sb.contract_call(neo, "symbol", {}, CallFlags::READ_ONLY));
    // PUSH5 for READ_STATES | ALLOW_CALL
    CHECK_EQ(sb.bytes()[1], uint8_t{0x15});
}

TEST_CASE(ScriptBuilder, unwrap_iterator_script_parses) {
    auto hash = core::uint160::from_hex("ef4073a0f2b305a38ec4050e4d3d28bc40ea63f5");
    std::vector<ContractParameter> params = {ContractParameter::integer(7)};
    auto script = build_contract_call_and_unwrap_iterator(hash, "tokensOf",
                                                          params, 10);
    CHECK_OK(script);
    auto text = ScriptReader::to_opcode_string(script.value());
    CHECK_OK(text);
    CHECK(text.value().find("System.Iterator.Next") != std::string::npos);
    CHECK(text.value().find("System.Iterator.Value") != std::string::npos);
    CHECK(text.value().find("JMPIFNOT") != std::string::npos);
}

TEST_CASE(ScriptBuilder, contract_hash_script_layout) {
    auto sender = core::uint160::from_hex("0000000000000000000000000000000000000001");
    auto built = build_contract_hash_script(sender, 0x01020304, "c");
    CHECK_OK(built);
    const auto& script = built.value();
    CHECK_EQ(script[0], uint8_t{0x38});  // ABORT
    // The checksum is pushed as a 4-byte little-endian PUSHINT32.
    CHECK_EQ(core::to_hex(std::span(script).subspan(23, 5)), "0204030201");
    auto text = ScriptReader::to_opcode_string(script);
    CHECK_OK(text);
    CHECK(text.value().rfind("ABORT\n", 0) == 0);
}

// ============================================================================
// Verification scripts
// ============================================================================

TEST_CASE(Verification, single_sig_vector) {
    auto script = build_verification_script(key_from_hex(KEY_A));
    CHECK_EQ(core::to_hex(script),
             "0c21035fdb1d1f06759547020891ae97c729327853aeb1256b6fe0473bc2e9fa42ff50"
             "4156e7b327");
    CHECK_EQ(script.size(), size_t{40});

    auto vs = VerificationScript::from_public_key(key_from_hex(KEY_A));
    CHECK(vs.is_single_sig());
    CHECK(!vs.is_multisig());
    auto m = vs.signing_threshold();
    CHECK_OK(m);
    CHECK_EQ(m.value(), 1);
    auto keys = vs.public_keys();
    CHECK_OK(keys);
    CHECK_EQ(keys.value().size(), size_t{1});
    CHECK(keys.value()[0] == key_from_hex(KEY_A));
}

TEST_CASE(Verification, multisig_is_order_independent) {
    std::vector<crypto::PublicKey> one = {
        key_from_hex(KEY_A), key_from_hex(KEY_B), key_from_hex(KEY_C)};
    std::vector<crypto::PublicKey> two = {
        key_from_hex(KEY_C), key_from_hex(KEY_A), key_from_hex(KEY_B)};
    auto a = build_multisig_script(one, 2);
    auto b = build_multisig_script(two, 2);
    CHECK_OK(a);
    CHECK_OK(b);
    CHECK(a.value() == b.value());
    CHECK(script_hash(a.value()) == script_hash(b.value()));
}

TEST_CASE(Verification, multisig_introspection) {
    std::vector<crypto::PublicKey> keys = {
        key_from_hex(KEY_A), key_from_hex(KEY_B), key_from_hex(KEY_C)};
    auto vs = VerificationScript::from_multisig(keys, 2);
    CHECK_OK(vs);
    CHECK(vs.value().is_multisig());
    CHECK(!vs.value().is_single_sig());
    CHECK_EQ(vs.value().signing_threshold().value(), 2);
    CHECK_EQ(vs.value().nr_of_accounts().value(), 3);

    auto parsed = vs.value().public_keys();
    CHECK_OK(parsed);
    CHECK(std::is_sorted(parsed.value().begin(), parsed.value().end()));

    // Layout: PUSH2, three 35-byte key pushes, PUSH3, SYSCALL + tag.
    const auto& s = vs.value().script();
    CHECK_EQ(s.size(), size_t{1 + 3 * 35 + 1 + 5});
    CHECK_EQ(s.front(), uint8_t{0x12});
    CHECK_EQ(core::to_hex(std::span(s).last(4)), "9ed0dc3a");
}

TEST_CASE(Verification, multisig_key_group_boundaries) {
    std::vector<crypto::PublicKey> keys = {key_from_hex(KEY_A), key_from_hex(KEY_B)};
    auto built = build_multisig_script(keys, 1);
    CHECK_OK(built);
    const auto good = built.value();
    CHECK(VerificationScript(good).is_multisig());

    // Threshold only: the key loop stops at end of input.
    CHECK(!VerificationScript(std::vector<uint8_t>{0x11}).is_multisig());

    // A key push with the wrong length is rejected outright.
    auto short_key = good;
    short_key[2] = 32;
    CHECK(!VerificationScript(short_key).is_multisig());

    // The opcode after the keys is re-read as the key count.
    auto wrong_count = good;
    wrong_count[1 + 2 * 35] = 0x13;  // PUSH3 for two keys
    CHECK(!VerificationScript(wrong_count).is_multisig());
    CHECK_ERR(VerificationScript(wrong_count).public_keys());

    // No keys at all: PUSH1 PUSH0 SYSCALL.
    std::vector<uint8_t> no_keys = {0x11, 0x10};
    no_keys.insert(no_keys.end(), good.end() - 5, good.end());
    CHECK(!VerificationScript(no_keys).is_multisig());
}

TEST_CASE(Verification, multisig_threshold_bounds) {
    std::vector<crypto::PublicKey> keys = {key_from_hex(KEY_A), key_from_hex(KEY_B)};
    auto too_high = build_multisig_script(keys, 3);
    CHECK_ERR(too_high);
    CHECK(too_high.error().code() == core::ErrorCode::CONFIG_MULTISIG);
    CHECK_ERR(build_multisig_script(keys, 0));
    CHECK_ERR(build_multisig_script({}, 1));
}

TEST_CASE(Verification, non_standard_scripts) {
    VerificationScript empty;
    CHECK(!empty.is_single_sig());
    CHECK(!empty.is_multisig());
    CHECK_ERR(empty.signing_threshold());

    auto script = build_verification_script(key_from_hex(KEY_A));
    script.back() ^= 0x01;  // corrupt the interop tag
    VerificationScript bad(script);
    CHECK(!bad.is_single_sig());
    auto r = bad.public_keys();
    CHECK_ERR(r);
    CHECK(r.error().code() == core::ErrorCode::SCRIPT_INVALID);
}

TEST_CASE(Verification, script_hash_matches_hash160) {
    auto vs = VerificationScript::from_public_key(key_from_hex(KEY_A));
    CHECK(vs.script_hash() == script_hash(vs.script()));
}

// ============================================================================
// Invocation scripts
// ============================================================================

TEST_CASE(Invocation, signature_push_layout) {
    crypto::Signature sig{};
    sig[0] = 0xAA;
    auto inv = InvocationScript::from_signature(sig);
    CHECK_EQ(inv.script().size(), size_t{66});
    CHECK_EQ(inv.script()[0], uint8_t{0x0C});
    CHECK_EQ(inv.script()[1], uint8_t{0x40});
    auto sigs = inv.signatures();
    CHECK_OK(sigs);
    CHECK_EQ(sigs.value().size(), size_t{1});
    CHECK(sigs.value()[0] == sig);
}

TEST_CASE(Invocation, sign_and_verify_message) {
    auto key = crypto::ECKey::generate();
    CHECK_OK(key);
    std::vector<uint8_t> msg = {1, 2, 3, 4};
    auto inv = InvocationScript::from_message_and_key(msg, key.value());
    CHECK_OK(inv);
    auto sigs = inv.value().signatures();
    CHECK_OK(sigs);
    CHECK(crypto::ECKey::verify(key.value().pubkey_compressed(), msg,
                                sigs.value()[0]));
}

TEST_CASE(Invocation, rejects_non_signature_pushes) {
    ScriptBuilder sb;
    sb.push_data(std::string_view("not a signature"));
    InvocationScript inv(sb.to_bytes());
    CHECK_ERR(inv.signatures());
}

TEST_CASE(Invocation, oversized_push_length_is_out_of_bounds) {
    // PUSHDATA4 declaring 0xFFFFFFFF bytes with nothing after it.
    InvocationScript inv(std::vector<uint8_t>{0x0E, 0xFF, 0xFF, 0xFF, 0xFF});
    auto sigs = inv.signatures();
    CHECK_ERR(sigs);
    CHECK(sigs.error().code() == core::ErrorCode::PARSE_OUT_OF_BOUNDS);

    std::vector<uint8_t> short_push = {0x0C, 0x40, 0x01, 0x02};
    auto r = InvocationScript(short_push).signatures();
    CHECK_ERR(r);
    CHECK(r.error().code() == core::ErrorCode::PARSE_OUT_OF_BOUNDS);
}

// ============================================================================
// ScriptReader
// ============================================================================

TEST_CASE(ScriptReader, verification_script_text) {
    auto script = build_verification_script(key_from_hex(KEY_A));
    auto text = ScriptReader::to_opcode_string(script);
    CHECK_OK(text);
    CHECK_EQ(text.value(),
             std::string("PUSHDATA1 33 ") + KEY_A +
             "\nSYSCALL System.Crypto.CheckSig\n");
}

TEST_CASE(ScriptReader, fixed_operands_and_unknown_tags) {
    auto script = core::hex_bytes("0011" "41deadbeef");
    auto text = ScriptReader::to_opcode_string(script);
    CHECK_OK(text);
    CHECK_EQ(text.value(), "PUSHINT8 11\nSYSCALL deadbeef\n");
}

TEST_CASE(ScriptReader, rejects_bad_input) {
    CHECK_ERR(ScriptReader::to_opcode_string(core::hex_bytes("06")));
    auto truncated = ScriptReader::to_opcode_string(core::hex_bytes("0c05aabb"));
    CHECK_ERR(truncated);
    CHECK(truncated.error().code() == core::ErrorCode::PARSE_OUT_OF_BOUNDS);
}

TEST_CASE(ScriptReader, read_push_helpers) {
    ScriptBuilder sb;
    sb.push_data(std::string_view("hi"));
    CHECK_OK(sb.push_integer(core::BigInt(-100000)));
    CHECK_OK(sb.push_integer(core::BigInt(7)));
    auto bytes = sb.to_bytes();
    core::BinaryReader r(bytes);
    CHECK(read_push_data(r) == std::vector<uint8_t>({'h', 'i'}));
    CHECK(read_push_int(r) == core::BigInt(-100000));
    CHECK(read_push_int(r) == core::BigInt(7));
    CHECK(r.eof());
}

// ============================================================================
// ContractParameter
// ============================================================================

TEST_CASE(ContractParameter, codec_round_trip) {
    auto map = ContractParameter::map({
        {ContractParameter::string("k"), ContractParameter::integer(-5)},
    });
    CHECK_OK(map);
    auto nested = ContractParameter::array({
        ContractParameter::boolean(false),
        ContractParameter::hash160(core::uint160::from_hex(
            "ef4073a0f2b305a38ec4050e4d3d28bc40ea63f5")),
        ContractParameter::public_key(key_from_hex(KEY_B)),
        map.value(),
        ContractParameter::any(),
    });
    auto bytes = nested.to_bytes();
    auto back = ContractParameter::from_bytes(bytes);
    CHECK_OK(back);
    CHECK(back.value() == nested);
    CHECK(back.value().type() == ContractParameterType::ARRAY);
    CHECK_EQ(back.value().as_array()->size(), size_t{5});
}

TEST_CASE(ContractParameter, rejects_unknown_type) {
    CHECK_ERR(ContractParameter::from_bytes(core::hex_bytes("99")));
}

TEST_CASE(ContractParameter, names) {
    CHECK_EQ(parameter_type_name(ContractParameterType::HASH160), "Hash160");
    CHECK_EQ(parameter_type_name(ContractParameterType::BYTE_ARRAY), "ByteArray");
}

// ============================================================================
// StackItem
// ============================================================================

TEST_CASE(StackItem, parse_and_convert) {
    // Array [Integer 5, ByteString "ab"]
    auto item = StackItem::from_bytes(core::hex_bytes("4002210105280261" "62"));
    CHECK_OK(item);
    CHECK(item.value().type() == StackItemType::ARRAY);
    const auto* items = item.value().as_items();
    CHECK(items != nullptr);
    CHECK_EQ(items->size(), size_t{2});
    CHECK((*items)[0].as_integer() == core::BigInt(5));
    CHECK((*items)[1].as_string() == std::string("ab"));

    auto param = item.value().to_contract_parameter();
    CHECK_OK(param);
    CHECK(param.value().is_array());
}

TEST_CASE(StackItem, interop_has_no_parameter_form) {
    CHECK_ERR(StackItem::interop_interface().to_contract_parameter());
}
