// Copyright (c) 2024-2026 The N3TX Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// Unit tests for transactions and the transaction builder.

#include "test_framework.h"

#include "core/config.h"
#include "core/error.h"
#include "core/hex.h"
#include "crypto/hash.h"
#include "crypto/secp256r1.h"
#include "primitives/script/builder.h"
#include "primitives/signer.h"
#include "primitives/transaction.h"
#include "rpc/provider.h"
#include "wallet/account.h"
#include "wallet/transaction_builder.h"

#include <algorithm>
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

using namespace primitives;

namespace {

// ---------------------------------------------------------------------------
// In-memory provider
// ---------------------------------------------------------------------------
class MockProvider : public rpc::Provider {
public:
    uint32_t                       block_count = 1000;
    uint32_t                       magic = core::NetworkSettings::MAINNET_MAGIC;
    std::vector<crypto::PublicKey> committee;
    rpc::InvocationResult          invocation{"HALT", 100000, "", {}};
    int64_t                        network_fee = 12345;
    int64_t                        gas_balance = 100000000000;
    bool                           fail_invoke = false;

    int                            balance_calls = 0;
    std::vector<uint8_t>           fee_tx;
    std::vector<uint8_t>           sent_tx;

    core::Result<uint32_t> get_block_count() override { return block_count; }
    core::Result<uint32_t> get_network_magic() override { return magic; }

    core::Result<std::vector<crypto::PublicKey>> get_committee() override {
        return committee;
    }

    core::Result<rpc::InvocationResult> invoke_script(
        std::span<const uint8_t>, std::span<const Signer>) override {
        if (fail_invoke) {
            return core::Error(core::ErrorCode::INTERNAL_ERROR, "node unreachable");
        }
        return invocation;
    }

    core::Result<int64_t> calculate_network_fee(
        std::span<const uint8_t> tx_bytes) override {
        fee_tx.assign(tx_bytes.begin(), tx_bytes.end());
        return network_fee;
    }

    core::Result<int64_t> get_gas_balance(const core::uint160&) override {
        ++balance_calls;
        return gas_balance;
    }

    core::Result<core::uint256> send_raw_transaction(
        std::span<const uint8_t> tx_bytes) override {
        sent_tx.assign(tx_bytes.begin(), tx_bytes.end());
        auto tx = Transaction::from_bytes(tx_bytes);
        if (!tx.ok()) return tx.error();
        return tx.value().hash();
    }
};

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

wallet::Account random_account() {
    return wallet::Account::create().value();
}

core::uint160 hash_of(uint8_t fill) {
    std::array<uint8_t, 20> bytes{};
    bytes.fill(fill);
    return core::uint160::from_bytes(bytes);
}

std::vector<uint8_t> simple_script() {
    auto neo = core::uint160::from_hex("ef4073a0f2b305a38ec4050e4d3d28bc40ea63f5");
    return script::build_contract_script(neo, "symbol", {}).value();
}

Transaction sample_transaction() {
    std::vector<Signer> signers = {TransactionSigner(hash_of(0x01), 0x01)};
    return Transaction(0, 0x01020304, 5000, signers, 100, 200, {},
                       simple_script());
}

} // namespace

// ============================================================================
// Transaction -- wire format
// ============================================================================

TEST_CASE(Transaction, header_layout) {
    auto tx = sample_transaction();
    auto bytes = tx.unsigned_bytes();
    CHECK_EQ(core::to_hex(std::span(bytes).first(Transaction::HEADER_SIZE)),
             "00" "04030201" "6400000000000000" "c800000000000000" "88130000");
    // signers: count, hash, scope; no attributes; var-bytes script
    CHECK_EQ(bytes[25], uint8_t{0x01});
    CHECK_EQ(bytes[46], uint8_t{0x01});
    CHECK_EQ(bytes[47], uint8_t{0x00});
    CHECK_EQ(bytes.size(), size_t{25 + 1 + 21 + 1 + 1 + simple_script().size()});
}

TEST_CASE(Transaction, unsigned_round_trip) {
    std::vector<Signer> signers = {TransactionSigner(hash_of(0x01), 0x01),
                                   TransactionSigner(hash_of(0x02), 0x80)};
    std::vector<TransactionAttribute> attrs = {TransactionAttribute::high_priority()};
    Transaction tx(0, 77, 9000, signers, 1, 2, attrs, simple_script());
    auto back = Transaction::from_bytes(tx.unsigned_bytes());
    CHECK_OK(back);
    CHECK(back.value() == tx);
    CHECK(back.value().witnesses().empty());
    CHECK(!back.value().is_signed());
}

TEST_CASE(Transaction, hash_and_sign_data) {
    auto tx = sample_transaction();
    CHECK(tx.hash() == crypto::sha256(tx.unsigned_bytes()));
    auto data = tx.sign_data(core::NetworkSettings::MAINNET_MAGIC);
    CHECK_EQ(data.size(), size_t{36});
    CHECK_EQ(core::to_hex(std::span(data).first(4)), "4e454f33");
    CHECK(std::equal(data.begin() + 4, data.end(), tx.hash().bytes().begin()));
}

TEST_CASE(Transaction, rejects_invalid_encodings) {
    auto good = sample_transaction().unsigned_bytes();

    auto bad_version = good;
    bad_version[0] = 0x01;
    CHECK_ERR(Transaction::from_bytes(bad_version));

    auto negative_fee = good;
    negative_fee[12] = 0x80;  // top byte of the system fee
    CHECK_ERR(Transaction::from_bytes(negative_fee));

    Transaction no_signers(0, 1, 1, {}, 0, 0, {}, simple_script());
    CHECK_ERR(Transaction::from_bytes(no_signers.unsigned_bytes()));

    std::vector<Signer> dup = {TransactionSigner(hash_of(0x01), 0x01),
                               TransactionSigner(hash_of(0x01), 0x80)};
    Transaction duplicated(0, 1, 1, dup, 0, 0, {}, simple_script());
    CHECK_ERR(Transaction::from_bytes(duplicated.unsigned_bytes()));

    std::vector<Signer> one = {TransactionSigner(hash_of(0x01), 0x01)};
    Transaction empty_script(0, 1, 1, one, 0, 0, {}, {});
    CHECK_ERR(Transaction::from_bytes(empty_script.unsigned_bytes()));

    std::vector<TransactionAttribute> twice = {TransactionAttribute::high_priority(),
                                               TransactionAttribute::high_priority()};
    Transaction dup_attrs(0, 1, 1, one, 0, 0, twice, simple_script());
    CHECK_ERR(Transaction::from_bytes(dup_attrs.unsigned_bytes()));

    auto truncated = good;
    truncated.pop_back();
    auto r = Transaction::from_bytes(truncated);
    CHECK_ERR(r);
    CHECK(r.error().code() == core::ErrorCode::PARSE_OUT_OF_BOUNDS);
}

TEST_CASE(Transaction, witness_count_must_match) {
    // Encoded with an empty witness list for one signer.
    auto bytes = sample_transaction().to_bytes();
    CHECK_EQ(bytes.back(), uint8_t{0x00});
    CHECK_ERR(Transaction::from_bytes(bytes));
}

TEST_CASE(Transaction, sender_is_first_signer) {
    auto tx = sample_transaction();
    CHECK(tx.sender() == hash_of(0x01));
    Transaction empty;
    CHECK(!empty.is_signed());
}

TEST_CASE(Transaction, send_requires_witnesses) {
    MockProvider provider;
    auto tx = sample_transaction();
    auto r = tx.send(provider);
    CHECK_ERR(r);
    CHECK(r.error().code() == core::ErrorCode::TX_NOT_SIGNED);
    CHECK(provider.sent_tx.empty());
}

TEST_CASE(Transaction, send_rejects_oversized) {
    MockProvider provider;
    std::vector<Signer> one = {TransactionSigner(hash_of(0x01), 0x01)};
    std::vector<uint8_t> huge(Transaction::MAX_TRANSACTION_SIZE, 0x21);  // NOP
    Transaction tx(0, 1, 1, one, 0, 0, {}, huge, {Witness()});
    auto r = tx.send(provider);
    CHECK_ERR(r);
    CHECK(r.error().code() == core::ErrorCode::TX_TOO_LARGE);
}

// ============================================================================
// TransactionBuilder -- validation
// ============================================================================

TEST_CASE(TransactionBuilder, requires_signers_and_script) {
    MockProvider provider;
    wallet::TransactionBuilder no_signers(provider);
    no_signers.script(simple_script());
    auto r1 = no_signers.build_unsigned();
    CHECK_ERR(r1);
    CHECK(r1.error().code() == core::ErrorCode::CONFIG_NO_SIGNERS);

    wallet::TransactionBuilder no_script(provider);
    no_script.signers({AccountSigner::called_by_entry(default_account())});
    auto r2 = no_script.build_unsigned();
    CHECK_ERR(r2);
    CHECK(r2.error().code() == core::ErrorCode::CONFIG_NO_SCRIPT);
}

TEST_CASE(TransactionBuilder, rejects_duplicate_signers) {
    MockProvider provider;
    auto account = default_account();
    wallet::TransactionBuilder b(provider);
    b.script(simple_script())
     .signers({AccountSigner::called_by_entry(account),
               AccountSigner::global(account)});
    auto r = b.build_unsigned();
    CHECK_ERR(r);
    CHECK(r.error().code() == core::ErrorCode::CONFIG_DUP_SIGNER);
}

TEST_CASE(TransactionBuilder, signer_and_attribute_caps) {
    MockProvider provider;
    std::vector<Signer> seventeen;
    for (uint8_t i = 0; i < 17; ++i) {
        seventeen.push_back(TransactionSigner(hash_of(i), 0x01));
    }
    wallet::TransactionBuilder many(provider);
    many.script(simple_script()).signers(seventeen);
    auto r1 = many.build_unsigned();
    CHECK_ERR(r1);
    CHECK(r1.error().code() == core::ErrorCode::CONFIG_TOO_MANY_SIGNERS);

    std::vector<Signer> sixteen(seventeen.begin(), seventeen.begin() + 16);
    wallet::TransactionBuilder full(provider);
    full.script(simple_script()).signers(sixteen)
        .attributes({TransactionAttribute::high_priority()});
    auto r2 = full.build_unsigned();
    CHECK_ERR(r2);
    CHECK(r2.error().code() == core::ErrorCode::CONFIG_TOO_MANY_ATTRS);
}

TEST_CASE(TransactionBuilder, rejects_bad_arguments) {
    MockProvider provider;
    auto signer = AccountSigner::called_by_entry(default_account());

    wallet::TransactionBuilder zero_vub(provider);
    zero_vub.script(simple_script()).signers({signer}).valid_until_block(0);
    CHECK_ERR(zero_vub.build_unsigned());

    wallet::TransactionBuilder dup_attr(provider);
    dup_attr.script(simple_script()).signers({signer})
        .attributes({TransactionAttribute::high_priority(),
                     TransactionAttribute::high_priority()});
    auto r = dup_attr.build_unsigned();
    CHECK_ERR(r);
    CHECK(r.error().code() == core::ErrorCode::CONFIG_INVALID_ARG);

    wallet::TransactionBuilder big(provider);
    big.script(std::vector<uint8_t>(0x10000, 0x21)).signers({signer});
    CHECK_ERR(big.build_unsigned());
}

TEST_CASE(TransactionBuilder, first_signer_reorders) {
    MockProvider provider;
    auto a = default_account();
    auto b = random_account();
    wallet::TransactionBuilder builder(provider);
    builder.signers({AccountSigner::called_by_entry(a),
                     AccountSigner::called_by_entry(b)});
    CHECK_OK(builder.first_signer(b.script_hash()));
    CHECK(builder.signers()[0].script_hash() == b.script_hash());
    CHECK(builder.signers()[1].script_hash() == a.script_hash());
    CHECK_ERR(builder.first_signer(hash_of(0x77)));
}

// ============================================================================
// TransactionBuilder -- fees and provider use
// ============================================================================

TEST_CASE(TransactionBuilder, fees_and_default_expiry) {
    MockProvider provider;
    wallet::TransactionBuilder b(provider);
    b.script(simple_script())
     .signers({AccountSigner::called_by_entry(default_account())})
     .nonce(42)
     .additional_system_fee(7)
     .additional_network_fee(5);
    auto tx = b.build_unsigned();
    CHECK_OK(tx);
    CHECK_EQ(tx.value().nonce(), uint32_t{42});
    CHECK_EQ(tx.value().valid_until_block(), uint32_t{1000 + 5760 - 1});
    CHECK_EQ(tx.value().system_fee(), int64_t{100007});
    CHECK_EQ(tx.value().network_fee(), int64_t{12350});
    CHECK(tx.value().witnesses().empty());
    CHECK_EQ(provider.balance_calls, 0);
}

TEST_CASE(TransactionBuilder, explicit_expiry_and_extended_script) {
    MockProvider provider;
    auto script = simple_script();
    wallet::TransactionBuilder b(provider);
    b.script(script).extend_script(script)
     .signers({AccountSigner::called_by_entry(default_account())})
     .valid_until_block(1234);
    auto tx = b.build_unsigned();
    CHECK_OK(tx);
    CHECK_EQ(tx.value().valid_until_block(), uint32_t{1234});
    CHECK_EQ(tx.value().script().size(), 2 * script.size());
}

TEST_CASE(TransactionBuilder, default_expiry_must_fit_uint32) {
    MockProvider provider;
    provider.block_count = 0xFFFFFFF0;
    wallet::TransactionBuilder b(provider);
    b.script(simple_script())
     .signers({AccountSigner::called_by_entry(default_account())});
    auto tx = b.build_unsigned();
    CHECK_ERR(tx);
    CHECK(tx.error().code() == core::ErrorCode::CONFIG_INVALID_ARG);

    // The last height that still leaves room for the full increment.
    provider.block_count = 0xFFFFFFFFu - 5760 + 1;
    auto edge = b.build_unsigned();
    CHECK_OK(edge);
    CHECK_EQ(edge.value().valid_until_block(), uint32_t{0xFFFFFFFF});
}

TEST_CASE(TransactionBuilder, fee_estimate_sees_placeholder_witnesses) {
    MockProvider provider;
    auto account = default_account();
    wallet::TransactionBuilder b(provider);
    b.script(simple_script()).signers({AccountSigner::called_by_entry(account)});
    CHECK_OK(b.build_unsigned());

    auto priced = Transaction::from_bytes(provider.fee_tx);
    CHECK_OK(priced);
    CHECK_EQ(priced.value().witnesses().size(), size_t{1});
    const auto& w = priced.value().witnesses()[0];
    CHECK(w.verification() == *account.verification_script());
    CHECK_EQ(w.invocation().script().size(), size_t{66});
}

TEST_CASE(TransactionBuilder, multisig_placeholder_has_threshold_pushes) {
    MockProvider provider;
    std::vector<crypto::PublicKey> keys;
    for (int i = 0; i < 3; ++i) keys.push_back(random_account().key()->pubkey_compressed());
    auto multisig = wallet::Account::create_multisig(keys, 2);
    CHECK_OK(multisig);

    wallet::TransactionBuilder b(provider);
    b.script(simple_script())
     .signers({AccountSigner::called_by_entry(multisig.value())});
    CHECK_OK(b.build_unsigned());
    auto priced = Transaction::from_bytes(provider.fee_tx);
    CHECK_OK(priced);
    auto sigs = priced.value().witnesses()[0].invocation().signatures();
    CHECK_OK(sigs);
    CHECK_EQ(sigs.value().size(), size_t{2});

    auto signed_tx = b.sign();
    CHECK_ERR(signed_tx);
    CHECK(signed_tx.error().code() == core::ErrorCode::CONFIG_MULTISIG);
}

TEST_CASE(TransactionBuilder, script_fault_is_reported) {
    MockProvider provider;
    provider.invocation.state = "FAULT";
    provider.invocation.exception = "method not found";
    wallet::TransactionBuilder b(provider);
    b.script(simple_script())
     .signers({AccountSigner::called_by_entry(default_account())});
    auto r = b.build_unsigned();
    CHECK_ERR(r);
    CHECK(r.error().code() == core::ErrorCode::TX_ERROR);
    CHECK(r.error().message().find("method not found") != std::string::npos);
}

TEST_CASE(TransactionBuilder, provider_failure_is_delegated) {
    MockProvider provider;
    provider.fail_invoke = true;
    wallet::TransactionBuilder b(provider);
    b.script(simple_script())
     .signers({AccountSigner::called_by_entry(default_account())});
    auto r = b.build_unsigned();
    CHECK_ERR(r);
    CHECK(r.error().code() == core::ErrorCode::PROVIDER_ERROR);
    CHECK(core::error_category(r.error().code()) == core::ErrorCategory::DELEGATED);
}

TEST_CASE(TransactionBuilder, fee_consumer_is_advisory) {
    MockProvider provider;
    provider.gas_balance = 10;
    int64_t seen_required = 0;
    int64_t seen_balance = 0;
    wallet::TransactionBuilder b(provider);
    b.script(simple_script())
     .signers({AccountSigner::called_by_entry(default_account())})
     .fee_consumer([&](int64_t required, int64_t balance) {
         seen_required = required;
         seen_balance = balance;
     });
    auto tx = b.build_unsigned();
    CHECK_OK(tx);
    CHECK_EQ(provider.balance_calls, 1);
    CHECK_EQ(seen_required, tx.value().system_fee() + tx.value().network_fee());
    CHECK_EQ(seen_balance, int64_t{10});
}

TEST_CASE(TransactionBuilder, fee_error_fails_build) {
    MockProvider provider;
    provider.gas_balance = 10;
    wallet::TransactionBuilder b(provider);
    b.script(simple_script())
     .signers({AccountSigner::called_by_entry(default_account())})
     .fee_error(core::Error(core::ErrorCode::TX_INSUFFICIENT_FUNDS, "too poor"));
    auto r = b.build_unsigned();
    CHECK_ERR(r);
    CHECK(r.error().code() == core::ErrorCode::TX_INSUFFICIENT_FUNDS);

    provider.gas_balance = 100000000000;
    CHECK_OK(b.build_unsigned());
}

TEST_CASE(TransactionBuilder, high_priority_needs_committee) {
    MockProvider provider;
    auto account = default_account();
    provider.committee = {random_account().key()->pubkey_compressed()};
    wallet::TransactionBuilder b(provider);
    b.script(simple_script())
     .signers({AccountSigner::called_by_entry(account)})
     .attributes({TransactionAttribute::high_priority()});
    auto r = b.build_unsigned();
    CHECK_ERR(r);
    CHECK(r.error().code() == core::ErrorCode::CONFIG_NOT_COMMITTEE);

    provider.committee.push_back(account.key()->pubkey_compressed());
    CHECK_OK(b.build_unsigned());
}

TEST_CASE(TransactionBuilder, high_priority_from_committee_multisig) {
    MockProvider provider;
    auto member = random_account();
    auto other = random_account();
    provider.committee = {member.key()->pubkey_compressed()};
    std::vector<crypto::PublicKey> keys = {member.key()->pubkey_compressed(),
                                           other.key()->pubkey_compressed()};
    auto multisig = wallet::Account::create_multisig(keys, 1);
    CHECK_OK(multisig);
    wallet::TransactionBuilder b(provider);
    b.script(simple_script())
     .signers({AccountSigner::called_by_entry(multisig.value())})
     .attributes({TransactionAttribute::high_priority()});
    CHECK_OK(b.build_unsigned());
}

// ============================================================================
// TransactionBuilder -- signing
// ============================================================================

TEST_CASE(TransactionBuilder, sign_end_to_end) {
    MockProvider provider;
    auto account = default_account();
    wallet::TransactionBuilder b(provider);
    b.script(simple_script()).signers({AccountSigner::called_by_entry(account)});
    auto tx = b.sign();
    CHECK_OK(tx);
    const auto& signed_tx = tx.value();
    CHECK_EQ(signed_tx.signers().size(), size_t{1});
    CHECK_EQ(signed_tx.witnesses().size(), size_t{1});
    CHECK(signed_tx.is_signed());
    CHECK(signed_tx.witnesses()[0].verification().script_hash() ==
          signed_tx.signers()[0].script_hash());

    auto sigs = signed_tx.witnesses()[0].invocation().signatures();
    CHECK_OK(sigs);
    CHECK(crypto::ECKey::verify(account.key()->pubkey_compressed(),
                                signed_tx.sign_data(provider.magic),
                                sigs.value()[0]));

    auto back = Transaction::from_bytes(signed_tx.to_bytes());
    CHECK_OK(back);
    CHECK(back.value().script() == signed_tx.script());
    CHECK(back.value().signers() == signed_tx.signers());
    CHECK(back.value().hash() == signed_tx.hash());
    CHECK_EQ(back.value().size(), signed_tx.to_bytes().size());
}

TEST_CASE(TransactionBuilder, sign_then_send) {
    MockProvider provider;
    provider.block_count = 4321;
    wallet::TransactionBuilder b(provider);
    b.script(simple_script())
     .signers({AccountSigner::called_by_entry(default_account())});
    auto tx = b.sign();
    CHECK_OK(tx);
    auto hash = tx.value().send(provider);
    CHECK_OK(hash);
    CHECK(hash.value() == tx.value().hash());
    CHECK(tx.value().block_count_when_sent() == 4321u);
    CHECK(provider.sent_tx == tx.value().to_bytes());
}

TEST_CASE(TransactionBuilder, sign_with_contract_signer) {
    MockProvider provider;
    auto account = default_account();
    std::vector<ContractParameter> params = {ContractParameter::integer(3)};
    wallet::TransactionBuilder b(provider);
    b.script(simple_script())
     .signers({AccountSigner::called_by_entry(account),
               ContractSigner::called_by_entry(hash_of(0x99), params)});
    auto tx = b.sign();
    CHECK_OK(tx);
    CHECK_EQ(tx.value().witnesses().size(), size_t{2});
    CHECK(tx.value().witnesses()[1].verification().empty());
    CHECK(tx.value().sender() == account.script_hash());
}

TEST_CASE(TransactionBuilder, sign_needs_private_keys) {
    MockProvider provider;
    auto watch_only = wallet::Account::from_script_hash(hash_of(0x33));
    wallet::TransactionBuilder b(provider);
    b.script(simple_script())
     .signers({AccountSigner::called_by_entry(watch_only)});
    CHECK_OK(b.build_unsigned());
    auto r = b.sign();
    CHECK_ERR(r);
    CHECK(r.error().code() == core::ErrorCode::CONFIG_NO_PRIVATE_KEY);

    wallet::TransactionBuilder wire(provider);
    wire.script(simple_script())
        .signers({TransactionSigner(hash_of(0x44), 0x01)});
    CHECK_ERR(wire.sign());
}

TEST_CASE(TransactionBuilder, sign_checks_network_magic) {
    MockProvider provider;
    provider.magic = core::NetworkSettings::TESTNET_MAGIC;
    wallet::TransactionBuilder b(provider);
    b.script(simple_script())
     .signers({AccountSigner::called_by_entry(default_account())});
    auto r = b.sign();
    CHECK_ERR(r);
    CHECK(r.error().code() == core::ErrorCode::CONFIG_INVALID_ARG);

    core::NetworkSettings testnet;
    testnet.network_magic = core::NetworkSettings::TESTNET_MAGIC;
    wallet::TransactionBuilder t(provider, testnet);
    t.script(simple_script())
     .signers({AccountSigner::called_by_entry(default_account())});
    CHECK_OK(t.sign());
}
