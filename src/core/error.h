#pragma once
// Copyright (c) 2024-2026 The N3TX Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <cstdint>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace core {

// ErrorCode: categorized error codes for the n3tx stack
enum class ErrorCode : uint16_t {
    NONE                   = 0,
    // Parsing / serialization (100-199)
    PARSE_ERROR            = 100, PARSE_OVERFLOW      = 101,
    PARSE_OUT_OF_BOUNDS    = 102, PARSE_BAD_FORMAT    = 103,
    PARSE_BAD_OPCODE       = 104, PARSE_CHECKSUM      = 105,
    // Configuration of signers, witnesses and builders (200-299)
    CONFIG_ERROR           = 200, CONFIG_NO_SIGNERS   = 201,
    CONFIG_NO_SCRIPT       = 202, CONFIG_DUP_SIGNER   = 203,
    CONFIG_TOO_MANY_SIGNERS = 204, CONFIG_TOO_MANY_ITEMS = 205,
    CONFIG_SCOPE_CONFLICT  = 206, CONFIG_NESTING_DEPTH = 207,
    CONFIG_MULTISIG        = 208, CONFIG_NO_PRIVATE_KEY = 209,
    CONFIG_INVALID_ARG     = 210, CONFIG_TOO_MANY_ATTRS = 211,
    CONFIG_NOT_COMMITTEE   = 212,
    // Script construction (300-399)
    SCRIPT_ERROR           = 300, SCRIPT_INVALID      = 301,
    SCRIPT_INT_TOO_LARGE   = 302,
    // Cryptography (400-499)
    CRYPTO_ERROR           = 400, CRYPTO_HASH_FAIL    = 401,
    CRYPTO_SIG_FAIL        = 402, CRYPTO_KEY_FAIL     = 403,
    CRYPTO_PASSPHRASE      = 404,
    // Transaction (500-599)
    TX_ERROR               = 500, TX_TOO_LARGE        = 501,
    TX_NOT_SIGNED          = 502, TX_INSUFFICIENT_FUNDS = 503,
    // Wallet (600-699)
    WALLET_ERROR           = 600, WALLET_KEY_MISS     = 601,
    // Provider collaborator (700-799)
    PROVIDER_ERROR         = 700,
    // Internal (900-999)
    INTERNAL_ERROR         = 900,
};

[[nodiscard]] std::string_view error_code_name(ErrorCode code) noexcept;

// ErrorCategory: which party is responsible for a failure
enum class ErrorCategory : uint8_t {
    NONE,
    FORMAT,          // malformed or truncated input bytes
    CONFIGURATION,   // caller assembled an invalid signer/script/builder
    PASSPHRASE,      // key decryption with the wrong password
    DELEGATED,       // failure reported by an injected collaborator
    OTHER,
};

[[nodiscard]] ErrorCategory error_category(ErrorCode code) noexcept;

// Error: rich error value carrying code, message, and origin location
class Error {
public:
    Error() noexcept : code_(ErrorCode::NONE) {}

    explicit Error(
        ErrorCode code,
        std::string message = {},
        std::source_location loc = std::source_location::current()) noexcept
        : code_(code), message_(std::move(message)), location_(loc) {}

    [[nodiscard]] ErrorCode          code()    const noexcept { return code_; }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }
    [[nodiscard]] const std::source_location& location() const noexcept {
        return location_;
    }
    [[nodiscard]] bool is_ok() const noexcept { return code_ == ErrorCode::NONE; }
    [[nodiscard]] explicit operator bool() const noexcept { return !is_ok(); }
    [[nodiscard]] std::string format() const;

    bool operator==(const Error& o) const noexcept { return code_ == o.code_; }
    bool operator!=(const Error& o) const noexcept { return code_ != o.code_; }

private:
    ErrorCode            code_;
    std::string          message_;
    std::source_location location_;
};

// Result<T, E>: a sum type holding either a value T or an error E
template <typename T, typename E = Error>
class Result {
    static_assert(!std::is_same_v<T, E>,
                  "Result value and error types must differ");
public:
    Result(const T& val) : storage_(val) {}             // NOLINT implicit
    Result(T&& val) : storage_(std::move(val)) {}       // NOLINT implicit
    Result(const E& err) : storage_(err) {}             // NOLINT implicit
    Result(E&& err) : storage_(std::move(err)) {}       // NOLINT implicit

    Result(const Result&)            = default;
    Result(Result&&) noexcept        = default;
    Result& operator=(const Result&) = default;
    Result& operator=(Result&&) noexcept = default;
    ~Result()                        = default;

    [[nodiscard]] bool has_value() const noexcept {
        return std::holds_alternative<T>(storage_);
    }
    [[nodiscard]] bool ok() const noexcept { return has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return ok(); }

    [[nodiscard]] T& value() & {
        if (!ok()) throw std::runtime_error("Result::value() on error");
        return std::get<T>(storage_);
    }
    [[nodiscard]] const T& value() const& {
        if (!ok()) throw std::runtime_error("Result::value() on error");
        return std::get<T>(storage_);
    }
    [[nodiscard]] T&& value() && {
        if (!ok()) throw std::runtime_error("Result::value() on error");
        return std::get<T>(std::move(storage_));
    }
    [[nodiscard]] E& error() & {
        if (ok()) throw std::runtime_error("Result::error() on value");
        return std::get<E>(storage_);
    }
    [[nodiscard]] const E& error() const& {
        if (ok()) throw std::runtime_error("Result::error() on value");
        return std::get<E>(storage_);
    }
    [[nodiscard]] E&& error() && {
        if (ok()) throw std::runtime_error("Result::error() on value");
        return std::get<E>(std::move(storage_));
    }

    [[nodiscard]] T value_or(T default_val) const {
        return ok() ? std::get<T>(storage_) : std::move(default_val);
    }

    // map: Result<T,E> -> (T -> U) -> Result<U,E>
    template <typename F>
    [[nodiscard]] auto map(F&& func) const&
        -> Result<std::invoke_result_t<F, const T&>, E> {
        using U = std::invoke_result_t<F, const T&>;
        if (ok()) return Result<U, E>{func(std::get<T>(storage_))};
        return Result<U, E>{std::get<E>(storage_)};
    }
    template <typename F>
    [[nodiscard]] auto map(F&& func) &&
        -> Result<std::invoke_result_t<F, T&&>, E> {
        using U = std::invoke_result_t<F, T&&>;
        if (ok()) return Result<U, E>{func(std::get<T>(std::move(storage_)))};
        return Result<U, E>{std::get<E>(std::move(storage_))};
    }

    // and_then: Result<T,E> -> (T -> Result<U,E>) -> Result<U,E>
    template <typename F>
    [[nodiscard]] auto and_then(F&& func) const&
        -> std::invoke_result_t<F, const T&> {
        using R = std::invoke_result_t<F, const T&>;
        if (ok()) return func(std::get<T>(storage_));
        return R{std::get<E>(storage_)};
    }
    template <typename F>
    [[nodiscard]] auto and_then(F&& func) &&
        -> std::invoke_result_t<F, T&&> {
        using R = std::invoke_result_t<F, T&&>;
        if (ok()) return func(std::get<T>(std::move(storage_)));
        return R{std::get<E>(std::move(storage_))};
    }

private:
    std::variant<T, E> storage_;
};

// Void-specialization: Result<void, E> for side-effect-only operations
template <typename E>
class Result<void, E> {
public:
    Result() noexcept : storage_(Void{}) {}
    Result(const E& err) : storage_(err) {}             // NOLINT implicit
    Result(E&& err) : storage_(std::move(err)) {}       // NOLINT implicit

    Result(const Result&)            = default;
    Result(Result&&) noexcept        = default;
    Result& operator=(const Result&) = default;
    Result& operator=(Result&&) noexcept = default;
    ~Result()                        = default;

    [[nodiscard]] bool has_value() const noexcept {
        return std::holds_alternative<Void>(storage_);
    }
    [[nodiscard]] bool ok() const noexcept { return has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return ok(); }

    void value() const {
        if (!ok()) throw std::runtime_error("Result::value() on error");
    }
    [[nodiscard]] E& error() & {
        if (ok()) throw std::runtime_error("Result::error() on value");
        return std::get<E>(storage_);
    }
    [[nodiscard]] const E& error() const& {
        if (ok()) throw std::runtime_error("Result::error() on value");
        return std::get<E>(storage_);
    }

    template <typename F>
    [[nodiscard]] auto and_then(F&& func) const&
        -> std::invoke_result_t<F> {
        if (ok()) return func();
        return std::invoke_result_t<F>{std::get<E>(storage_)};
    }

private:
    struct Void {};
    std::variant<Void, E> storage_;
};

// Factory helpers
[[nodiscard]] inline Error make_error(
    ErrorCode code,
    std::string message = {},
    std::source_location loc = std::source_location::current()) noexcept {
    return Error(code, std::move(message), loc);
}

template <typename T>
[[nodiscard]] inline Result<T> make_result(T&& val) {
    return Result<T>{std::forward<T>(val)};
}

[[nodiscard]] inline Result<void> make_ok() noexcept {
    return Result<void>{};
}

// N3TX_TRY_ASSIGN: declare @p var from a Result or return its error
// Usage:  N3TX_TRY_ASSIGN(val, some_result_expr);
#define N3TX_TRY_ASSIGN(var, expr)                                        \
    auto _n3tx_tmp_##var = (expr);                                        \
    if (!_n3tx_tmp_##var.ok())                                            \
        return std::move(_n3tx_tmp_##var).error();                        \
    auto var = std::move(_n3tx_tmp_##var).value()

// N3TX_TRY_VOID: propagate errors from Result<void> expressions
#define N3TX_TRY_VOID(expr)                                               \
    do {                                                                  \
        auto _n3tx_tmp = (expr);                                          \
        if (!_n3tx_tmp.ok()) return std::move(_n3tx_tmp).error();         \
    } while (false)

} // namespace core
