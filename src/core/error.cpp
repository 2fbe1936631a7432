// Copyright (c) 2024-2026 The N3TX Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"

#include <sstream>

namespace core {

// ---------------------------------------------------------------------------
// error_code_name: human-readable label for every ErrorCode variant
// ---------------------------------------------------------------------------
std::string_view error_code_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::NONE:                    return "NONE";

        // Parsing
        case ErrorCode::PARSE_ERROR:             return "PARSE_ERROR";
        case ErrorCode::PARSE_OVERFLOW:          return "PARSE_OVERFLOW";
        case ErrorCode::PARSE_OUT_OF_BOUNDS:     return "PARSE_OUT_OF_BOUNDS";
        case ErrorCode::PARSE_BAD_FORMAT:        return "PARSE_BAD_FORMAT";
        case ErrorCode::PARSE_BAD_OPCODE:        return "PARSE_BAD_OPCODE";
        case ErrorCode::PARSE_CHECKSUM:          return "PARSE_CHECKSUM";

        // Configuration
        case ErrorCode::CONFIG_ERROR:            return "CONFIG_ERROR";
        case ErrorCode::CONFIG_NO_SIGNERS:       return "CONFIG_NO_SIGNERS";
        case ErrorCode::CONFIG_NO_SCRIPT:        return "CONFIG_NO_SCRIPT";
        case ErrorCode::CONFIG_DUP_SIGNER:       return "CONFIG_DUP_SIGNER";
        case ErrorCode::CONFIG_TOO_MANY_SIGNERS: return "CONFIG_TOO_MANY_SIGNERS";
        case ErrorCode::CONFIG_TOO_MANY_ITEMS:   return "CONFIG_TOO_MANY_ITEMS";
        case ErrorCode::CONFIG_SCOPE_CONFLICT:   return "CONFIG_SCOPE_CONFLICT";
        case ErrorCode::CONFIG_NESTING_DEPTH:    return "CONFIG_NESTING_DEPTH";
        case ErrorCode::CONFIG_MULTISIG:         return "CONFIG_MULTISIG";
        case ErrorCode::CONFIG_NO_PRIVATE_KEY:   return "CONFIG_NO_PRIVATE_KEY";
        case ErrorCode::CONFIG_INVALID_ARG:      return "CONFIG_INVALID_ARG";
        case ErrorCode::CONFIG_TOO_MANY_ATTRS:   return "CONFIG_TOO_MANY_ATTRS";
        case ErrorCode::CONFIG_NOT_COMMITTEE:    return "CONFIG_NOT_COMMITTEE";

        // Script
        case ErrorCode::SCRIPT_ERROR:            return "SCRIPT_ERROR";
        case ErrorCode::SCRIPT_INVALID:          return "SCRIPT_INVALID";
        case ErrorCode::SCRIPT_INT_TOO_LARGE:    return "SCRIPT_INT_TOO_LARGE";

        // Cryptography
        case ErrorCode::CRYPTO_ERROR:            return "CRYPTO_ERROR";
        case ErrorCode::CRYPTO_HASH_FAIL:        return "CRYPTO_HASH_FAIL";
        case ErrorCode::CRYPTO_SIG_FAIL:         return "CRYPTO_SIG_FAIL";
        case ErrorCode::CRYPTO_KEY_FAIL:         return "CRYPTO_KEY_FAIL";
        case ErrorCode::CRYPTO_PASSPHRASE:       return "CRYPTO_PASSPHRASE";

        // Transaction
        case ErrorCode::TX_ERROR:                return "TX_ERROR";
        case ErrorCode::TX_TOO_LARGE:            return "TX_TOO_LARGE";
        case ErrorCode::TX_NOT_SIGNED:           return "TX_NOT_SIGNED";
        case ErrorCode::TX_INSUFFICIENT_FUNDS:   return "TX_INSUFFICIENT_FUNDS";

        // Wallet
        case ErrorCode::WALLET_ERROR:            return "WALLET_ERROR";
        case ErrorCode::WALLET_KEY_MISS:         return "WALLET_KEY_MISS";

        // Provider
        case ErrorCode::PROVIDER_ERROR:          return "PROVIDER_ERROR";

        // Internal
        case ErrorCode::INTERNAL_ERROR:          return "INTERNAL_ERROR";
    }

    return "UNKNOWN";
}

// ---------------------------------------------------------------------------
// Error::format: build a diagnostic string including source location
// ---------------------------------------------------------------------------
std::string Error::format() const {
    if (code_ == ErrorCode::NONE) {
        return "no error";
    }

    std::ostringstream oss;
    oss << error_code_name(code_)
        << '(' << static_cast<uint16_t>(code_) << ')';

    if (!message_.empty()) {
        oss << ": " << message_;
    }

    const char* file = location_.file_name();
    if (file && file[0] != '\0') {
        oss << " [" << file
            << ':' << location_.line()
            << ':' << location_.column() << ']';
    }

    return oss.str();
}

// ---------------------------------------------------------------------------
// error_category: coarse classification used by callers that only care
// whether a failure was caused by input, configuration or a collaborator
// ---------------------------------------------------------------------------
ErrorCategory error_category(ErrorCode code) noexcept {
    auto raw = static_cast<uint16_t>(code);
    if (raw == 0)                 return ErrorCategory::NONE;
    if (raw >= 100 && raw < 200)  return ErrorCategory::FORMAT;
    if (raw >= 200 && raw < 400)  return ErrorCategory::CONFIGURATION;
    if (code == ErrorCode::CRYPTO_PASSPHRASE) {
        return ErrorCategory::PASSPHRASE;
    }
    if (raw >= 700 && raw < 800)  return ErrorCategory::DELEGATED;
    return ErrorCategory::OTHER;
}

} // namespace core
