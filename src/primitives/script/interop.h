#pragma once
// Copyright (c) 2024-2026 The N3TX Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

namespace primitives::script {

/// Interop services reachable through SYSCALL.  A SYSCALL operand is the
/// 4-byte service tag: the first four bytes of SHA256(service name).
enum class InteropService : uint8_t {
    CRYPTO_CHECK_SIG,
    CRYPTO_CHECK_MULTISIG,
    CONTRACT_CALL,
    CONTRACT_CALL_NATIVE,
    CONTRACT_GET_CALL_FLAGS,
    CONTRACT_CREATE_STANDARD_ACCOUNT,
    CONTRACT_CREATE_MULTISIG_ACCOUNT,
    CONTRACT_NATIVE_ON_PERSIST,
    CONTRACT_NATIVE_POST_PERSIST,
    ITERATOR_NEXT,
    ITERATOR_VALUE,
    RUNTIME_PLATFORM,
    RUNTIME_GET_TRIGGER,
    RUNTIME_GET_TIME,
    RUNTIME_GET_SCRIPT_CONTAINER,
    RUNTIME_GET_EXECUTING_SCRIPT_HASH,
    RUNTIME_GET_CALLING_SCRIPT_HASH,
    RUNTIME_GET_ENTRY_SCRIPT_HASH,
    RUNTIME_CHECK_WITNESS,
    RUNTIME_GET_INVOCATION_COUNTER,
    RUNTIME_LOG,
    RUNTIME_NOTIFY,
    RUNTIME_GET_NOTIFICATIONS,
    RUNTIME_GAS_LEFT,
    RUNTIME_BURN_GAS,
    RUNTIME_GET_NETWORK,
    RUNTIME_GET_RANDOM,
    STORAGE_GET_CONTEXT,
    STORAGE_GET_READ_ONLY_CONTEXT,
    STORAGE_AS_READ_ONLY,
    STORAGE_GET,
    STORAGE_FIND,
    STORAGE_PUT,
    STORAGE_DELETE,
};

using InteropTag = std::array<uint8_t, 4>;

/// Dotted service name, e.g. "System.Contract.Call".
std::string_view interop_name(InteropService svc) noexcept;

/// SYSCALL operand for @p svc.
InteropTag interop_tag(InteropService svc);

/// Fixed execution price in datoshi (0 where the price is dynamic).
uint64_t interop_price(InteropService svc) noexcept;

/// Reverse lookup of a SYSCALL operand.
std::optional<InteropService> interop_from_tag(std::span<const uint8_t> tag);

} // namespace primitives::script
