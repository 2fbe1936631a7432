// Copyright (c) 2024-2026 The N3TX Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "crypto/hash.h"

#include <memory>
#include <stdexcept>
#include <string>

#include <openssl/evp.h>

namespace crypto {

namespace {

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
struct MdDeleter {
    void operator()(EVP_MD* md) const { EVP_MD_free(md); }
};

// Fetched once per process; RIPEMD-160 lives in the default provider from
// OpenSSL 3.0.7 on.
EVP_MD* fetch_md(const char* name) {
    EVP_MD* md = EVP_MD_fetch(nullptr, name, nullptr);
    if (!md) {
        throw std::runtime_error(std::string("EVP_MD_fetch failed for ") +
                                 name);
    }
    return md;
}

const EVP_MD* sha256_md() {
    static std::unique_ptr<EVP_MD, MdDeleter> md{
        fetch_md("SHA256")};
    return md.get();
}

const EVP_MD* ripemd160_md() {
    static std::unique_ptr<EVP_MD, MdDeleter> md{
        fetch_md("RIPEMD160")};
    return md.get();
}

template <size_t N>
std::array<uint8_t, N> digest(const EVP_MD* md,
                              std::span<const uint8_t> data) {
    std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx(EVP_MD_CTX_new());
    std::array<uint8_t, N> out{};
    unsigned int out_len = 0;
    if (!ctx ||
        EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), out.data(), &out_len) != 1 ||
        out_len != N) {
        throw std::runtime_error("EVP digest computation failed");
    }
    return out;
}

} // namespace

core::uint256 sha256(std::span<const uint8_t> data) {
    auto d = digest<32>(sha256_md(), data);
    return core::uint256::from_bytes(d);
}

core::uint256 sha256(std::string_view text) {
    return sha256(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(text.data()), text.size()));
}

core::uint256 hash256(std::span<const uint8_t> data) {
    auto first = digest<32>(sha256_md(), data);
    auto second = digest<32>(sha256_md(), first);
    return core::uint256::from_bytes(second);
}

core::uint160 ripemd160(std::span<const uint8_t> data) {
    auto d = digest<20>(ripemd160_md(), data);
    return core::uint160::from_bytes(d);
}

core::uint160 hash160(std::span<const uint8_t> data) {
    auto first = digest<32>(sha256_md(), data);
    auto second = digest<20>(ripemd160_md(), first);
    return core::uint160::from_bytes(second);
}

}  // namespace crypto
