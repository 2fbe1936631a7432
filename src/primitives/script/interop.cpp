// Copyright (c) 2024-2026 The N3TX Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "primitives/script/interop.h"
#include "crypto/hash.h"

#include <algorithm>
#include <vector>

namespace primitives::script {

namespace {

constexpr InteropService ALL_SERVICES[] = {
    InteropService::CRYPTO_CHECK_SIG,
    InteropService::CRYPTO_CHECK_MULTISIG,
    InteropService::CONTRACT_CALL,
    InteropService::CONTRACT_CALL_NATIVE,
    InteropService::CONTRACT_GET_CALL_FLAGS,
    InteropService::CONTRACT_CREATE_STANDARD_ACCOUNT,
    InteropService::CONTRACT_CREATE_MULTISIG_ACCOUNT,
    InteropService::CONTRACT_NATIVE_ON_PERSIST,
    InteropService::CONTRACT_NATIVE_POST_PERSIST,
    InteropService::ITERATOR_NEXT,
    InteropService::ITERATOR_VALUE,
    InteropService::RUNTIME_PLATFORM,
    InteropService::RUNTIME_GET_TRIGGER,
    InteropService::RUNTIME_GET_TIME,
    InteropService::RUNTIME_GET_SCRIPT_CONTAINER,
    InteropService::RUNTIME_GET_EXECUTING_SCRIPT_HASH,
    InteropService::RUNTIME_GET_CALLING_SCRIPT_HASH,
    InteropService::RUNTIME_GET_ENTRY_SCRIPT_HASH,
    InteropService::RUNTIME_CHECK_WITNESS,
    InteropService::RUNTIME_GET_INVOCATION_COUNTER,
    InteropService::RUNTIME_LOG,
    InteropService::RUNTIME_NOTIFY,
    InteropService::RUNTIME_GET_NOTIFICATIONS,
    InteropService::RUNTIME_GAS_LEFT,
    InteropService::RUNTIME_BURN_GAS,
    InteropService::RUNTIME_GET_NETWORK,
    InteropService::RUNTIME_GET_RANDOM,
    InteropService::STORAGE_GET_CONTEXT,
    InteropService::STORAGE_GET_READ_ONLY_CONTEXT,
    InteropService::STORAGE_AS_READ_ONLY,
    InteropService::STORAGE_GET,
    InteropService::STORAGE_FIND,
    InteropService::STORAGE_PUT,
    InteropService::STORAGE_DELETE,
};

struct TagTable {
    std::vector<std::pair<InteropTag, InteropService>> entries;

    TagTable() {
        for (auto svc : ALL_SERVICES) {
            entries.emplace_back(interop_tag(svc), svc);
        }
    }
};

const TagTable& tag_table() {
    static const TagTable instance;
    return instance;
}

} // namespace

std::string_view interop_name(InteropService svc) noexcept {
    switch (svc) {
    case InteropService::CRYPTO_CHECK_SIG:
        return "System.Crypto.CheckSig";
    case InteropService::CRYPTO_CHECK_MULTISIG:
        return "System.Crypto.CheckMultisig";
    case InteropService::CONTRACT_CALL:
        return "System.Contract.Call";
    case InteropService::CONTRACT_CALL_NATIVE:
        return "System.Contract.CallNative";
    case InteropService::CONTRACT_GET_CALL_FLAGS:
        return "System.Contract.GetCallFlags";
    case InteropService::CONTRACT_CREATE_STANDARD_ACCOUNT:
        return "System.Contract.CreateStandardAccount";
    case InteropService::CONTRACT_CREATE_MULTISIG_ACCOUNT:
        return "System.Contract.CreateMultisigAccount";
    case InteropService::CONTRACT_NATIVE_ON_PERSIST:
        return "System.Contract.NativeOnPersist";
    case InteropService::CONTRACT_NATIVE_POST_PERSIST:
        return "System.Contract.NativePostPersist";
    case InteropService::ITERATOR_NEXT:
        return "System.Iterator.Next";
    case InteropService::ITERATOR_VALUE:
        return "System.Iterator.Value";
    case InteropService::RUNTIME_PLATFORM:
        return "System.Runtime.Platform";
    case InteropService::RUNTIME_GET_TRIGGER:
        return "System.Runtime.GetTrigger";
    case InteropService::RUNTIME_GET_TIME:
        return "System.Runtime.GetTime";
    case InteropService::RUNTIME_GET_SCRIPT_CONTAINER:
        return "System.Runtime.GetScriptContainer";
    case InteropService::RUNTIME_GET_EXECUTING_SCRIPT_HASH:
        return "System.Runtime.GetExecutingScriptHash";
    case InteropService::RUNTIME_GET_CALLING_SCRIPT_HASH:
        return "System.Runtime.GetCallingScriptHash";
    case InteropService::RUNTIME_GET_ENTRY_SCRIPT_HASH:
        return "System.Runtime.GetEntryScriptHash";
    case InteropService::RUNTIME_CHECK_WITNESS:
        return "System.Runtime.CheckWitness";
    case InteropService::RUNTIME_GET_INVOCATION_COUNTER:
        return "System.Runtime.GetInvocationCounter";
    case InteropService::RUNTIME_LOG:
        return "System.Runtime.Log";
    case InteropService::RUNTIME_NOTIFY:
        return "System.Runtime.Notify";
    case InteropService::RUNTIME_GET_NOTIFICATIONS:
        return "System.Runtime.GetNotifications";
    case InteropService::RUNTIME_GAS_LEFT:
        return "System.Runtime.GasLeft";
    case InteropService::RUNTIME_BURN_GAS:
        return "System.Runtime.BurnGas";
    case InteropService::RUNTIME_GET_NETWORK:
        return "System.Runtime.GetNetwork";
    case InteropService::RUNTIME_GET_RANDOM:
        return "System.Runtime.GetRandom";
    case InteropService::STORAGE_GET_CONTEXT:
        return "System.Storage.GetContext";
    case InteropService::STORAGE_GET_READ_ONLY_CONTEXT:
        return "System.Storage.GetReadOnlyContext";
    case InteropService::STORAGE_AS_READ_ONLY:
        return "System.Storage.AsReadOnly";
    case InteropService::STORAGE_GET:
        return "System.Storage.Get";
    case InteropService::STORAGE_FIND:
        return "System.Storage.Find";
    case InteropService::STORAGE_PUT:
        return "System.Storage.Put";
    case InteropService::STORAGE_DELETE:
        return "System.Storage.Delete";
    }
    return "";
}

InteropTag interop_tag(InteropService svc) {
    auto digest = crypto::sha256(interop_name(svc));
    InteropTag tag{};
    std::copy_n(digest.data(), tag.size(), tag.begin());
    return tag;
}

uint64_t interop_price(InteropService svc) noexcept {
    switch (svc) {
    case InteropService::RUNTIME_PLATFORM:
    case InteropService::RUNTIME_GET_TRIGGER:
    case InteropService::RUNTIME_GET_TIME:
    case InteropService::RUNTIME_GET_SCRIPT_CONTAINER:
    case InteropService::RUNTIME_GET_NETWORK:
        return 8;
    case InteropService::ITERATOR_VALUE:
    case InteropService::RUNTIME_GET_EXECUTING_SCRIPT_HASH:
    case InteropService::RUNTIME_GET_CALLING_SCRIPT_HASH:
    case InteropService::RUNTIME_GET_ENTRY_SCRIPT_HASH:
    case InteropService::RUNTIME_GET_INVOCATION_COUNTER:
    case InteropService::RUNTIME_GAS_LEFT:
    case InteropService::RUNTIME_BURN_GAS:
    case InteropService::RUNTIME_GET_RANDOM:
    case InteropService::STORAGE_GET_CONTEXT:
    case InteropService::STORAGE_GET_READ_ONLY_CONTEXT:
    case InteropService::STORAGE_AS_READ_ONLY:
        return 16;
    case InteropService::CONTRACT_GET_CALL_FLAGS:
    case InteropService::RUNTIME_CHECK_WITNESS:
        return 1024;
    case InteropService::RUNTIME_GET_NOTIFICATIONS:
        return 4096;
    case InteropService::CRYPTO_CHECK_SIG:
    case InteropService::CONTRACT_CALL:
    case InteropService::CONTRACT_CREATE_STANDARD_ACCOUNT:
    case InteropService::ITERATOR_NEXT:
    case InteropService::RUNTIME_LOG:
    case InteropService::RUNTIME_NOTIFY:
    case InteropService::STORAGE_GET:
    case InteropService::STORAGE_FIND:
    case InteropService::STORAGE_PUT:
    case InteropService::STORAGE_DELETE:
        return 32768;
    default:
        return 0;
    }
}

std::optional<InteropService> interop_from_tag(std::span<const uint8_t> tag) {
    if (tag.size() != 4) return std::nullopt;
    for (const auto& [t, svc] : tag_table().entries) {
        if (std::equal(t.begin(), t.end(), tag.begin())) return svc;
    }
    return std::nullopt;
}

} // namespace primitives::script
