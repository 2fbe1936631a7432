// Copyright (c) 2024-2026 The N3TX Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "rpc/provider.h"

#include "core/logging.h"

namespace rpc {

core::Error delegated(const core::Error& err, std::string_view call) {
    LOG_WARN(core::LogCategory::RPC,
             std::string(call) + " failed: " + err.message());
    if (err.code() == core::ErrorCode::PROVIDER_ERROR) {
        return err;
    }
    return core::Error(core::ErrorCode::PROVIDER_ERROR,
                       std::string(call) + ": " + err.message());
}

} // namespace rpc
