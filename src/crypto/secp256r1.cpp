// Copyright (c) 2024-2026 The N3TX Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "crypto/secp256r1.h"

#include <cstring>
#include <memory>

#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/crypto.h>
#include <openssl/ec.h>
#include <openssl/evp.h>
#include <openssl/obj_mac.h>
#include <openssl/param_build.h>

namespace crypto {

// ---------------------------------------------------------------------------
// secp256r1 curve order (big-endian).
// n = FFFFFFFF00000000FFFFFFFFFFFFFFFFBCE6FAADA7179E84F3B9CAC2FC632551
// ---------------------------------------------------------------------------
static const uint8_t SECP256R1_ORDER[] = {
    0xFF, 0xFF, 0xFF, 0xFF, 0x00, 0x00, 0x00, 0x00,
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
    0xBC, 0xE6, 0xFA, 0xAD, 0xA7, 0x17, 0x9E, 0x84,
    0xF3, 0xB9, 0xCA, 0xC2, 0xFC, 0x63, 0x25, 0x51
};

// ---------------------------------------------------------------------------
// RAII helpers for OpenSSL objects
// ---------------------------------------------------------------------------
struct BN_Deleter  { void operator()(BIGNUM* p)       const { BN_free(p); } };
struct BN_CTX_Del  { void operator()(BN_CTX* p)       const { BN_CTX_free(p); } };
struct EC_GRP_Del  { void operator()(EC_GROUP* p)     const { EC_GROUP_free(p); } };
struct EC_PT_Del   { void operator()(EC_POINT* p)     const { EC_POINT_free(p); } };
struct EVP_KEY_Del { void operator()(EVP_PKEY* p)     const { EVP_PKEY_free(p); } };
struct EVP_CTX_Del { void operator()(EVP_PKEY_CTX* p) const { EVP_PKEY_CTX_free(p); } };
struct EVP_MD_Del  { void operator()(EVP_MD_CTX* p)   const { EVP_MD_CTX_free(p); } };
struct PB_Deleter  { void operator()(OSSL_PARAM_BLD* p) const {
    OSSL_PARAM_BLD_free(p);
} };
struct OP_Deleter  { void operator()(OSSL_PARAM* p)   const {
    OSSL_PARAM_free(p);
} };

using BN_ptr      = std::unique_ptr<BIGNUM, BN_Deleter>;
using BN_CTX_ptr  = std::unique_ptr<BN_CTX, BN_CTX_Del>;
using EC_GRP_ptr  = std::unique_ptr<EC_GROUP, EC_GRP_Del>;
using EC_PT_ptr   = std::unique_ptr<EC_POINT, EC_PT_Del>;
using EVP_KEY_ptr = std::unique_ptr<EVP_PKEY, EVP_KEY_Del>;
using EVP_CTX_ptr = std::unique_ptr<EVP_PKEY_CTX, EVP_CTX_Del>;
using EVP_MD_ptr  = std::unique_ptr<EVP_MD_CTX, EVP_MD_Del>;
using PB_ptr      = std::unique_ptr<OSSL_PARAM_BLD, PB_Deleter>;
using OP_ptr      = std::unique_ptr<OSSL_PARAM, OP_Deleter>;

static constexpr const char* CURVE_NAME = "prime256v1";

// ---------------------------------------------------------------------------
// Internal: reusable EC_GROUP for secp256r1.
// ---------------------------------------------------------------------------
static EC_GROUP* secp256r1_group() {
    static EC_GRP_ptr group{
        EC_GROUP_new_by_curve_name(NID_X9_62_prime256v1)};
    return group.get();
}

static const BIGNUM* secp256r1_order_bn() {
    static BN_ptr order{BN_bin2bn(SECP256R1_ORDER,
                                   sizeof(SECP256R1_ORDER),
                                   nullptr)};
    return order.get();
}

// ---------------------------------------------------------------------------
// Internal: decode any SEC1 encoding and re-encode it in @p form.
// Returns the number of bytes written, 0 on failure.
// ---------------------------------------------------------------------------
static size_t reencode_point(const uint8_t* in, size_t in_len,
                             point_conversion_form_t form,
                             uint8_t* out, size_t out_cap) {
    EC_GROUP* grp = secp256r1_group();
    if (!grp) return 0;
    BN_CTX_ptr ctx{BN_CTX_new()};
    EC_PT_ptr pt{EC_POINT_new(grp)};
    if (!ctx || !pt) return 0;
    if (EC_POINT_oct2point(grp, pt.get(), in, in_len, ctx.get()) != 1) {
        return 0;
    }
    if (EC_POINT_is_at_infinity(grp, pt.get()) ||
        EC_POINT_is_on_curve(grp, pt.get(), ctx.get()) != 1) {
        return 0;
    }
    return EC_POINT_point2oct(grp, pt.get(), form, out, out_cap, ctx.get());
}

// ---------------------------------------------------------------------------
// Internal: build an EVP_PKEY from a 32-byte secret using OSSL_PARAM.
// ---------------------------------------------------------------------------
static EVP_PKEY* build_pkey_from_secret(const uint8_t* secret_32) {
    PB_ptr bld{OSSL_PARAM_BLD_new()};
    if (!bld) return nullptr;

    if (!OSSL_PARAM_BLD_push_utf8_string(
            bld.get(), OSSL_PKEY_PARAM_GROUP_NAME, CURVE_NAME, 0)) {
        return nullptr;
    }

    // OSSL_PARAM_BLD_push_BN keeps a pointer; priv_bn must outlive
    // OSSL_PARAM_BLD_to_param().
    BN_ptr priv_bn{BN_bin2bn(secret_32, 32, nullptr)};
    if (!priv_bn) return nullptr;
    if (!OSSL_PARAM_BLD_push_BN(
            bld.get(), OSSL_PKEY_PARAM_PRIV_KEY, priv_bn.get())) {
        return nullptr;
    }

    // Public key = secret * G, uncompressed.
    BN_CTX_ptr ctx{BN_CTX_new()};
    EC_GROUP* grp = secp256r1_group();
    EC_PT_ptr pub_pt{EC_POINT_new(grp)};
    if (!ctx || !pub_pt ||
        !EC_POINT_mul(grp, pub_pt.get(), priv_bn.get(), nullptr, nullptr,
                      ctx.get())) {
        return nullptr;
    }

    uint8_t pub_buf[65];
    size_t pub_len = EC_POINT_point2oct(
        grp, pub_pt.get(), POINT_CONVERSION_UNCOMPRESSED,
        pub_buf, sizeof(pub_buf), ctx.get());
    if (pub_len != 65) return nullptr;

    if (!OSSL_PARAM_BLD_push_octet_string(
            bld.get(), OSSL_PKEY_PARAM_PUB_KEY, pub_buf, pub_len)) {
        return nullptr;
    }

    OP_ptr params{OSSL_PARAM_BLD_to_param(bld.get())};
    if (!params) return nullptr;

    EVP_PKEY_CTX* pctx = EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr);
    if (!pctx) return nullptr;
    EVP_CTX_ptr pctx_guard{pctx};

    if (EVP_PKEY_fromdata_init(pctx) <= 0) return nullptr;

    EVP_PKEY* pkey = nullptr;
    if (EVP_PKEY_fromdata(pctx, &pkey, EVP_PKEY_KEYPAIR,
                          params.get()) <= 0) {
        return nullptr;
    }
    return pkey;
}

// ---------------------------------------------------------------------------
// Internal: build an EVP_PKEY holding only a public key from SEC1 bytes.
// ---------------------------------------------------------------------------
static EVP_PKEY* build_pkey_from_pubkey(const uint8_t* pub_data,
                                        size_t pub_len) {
    PB_ptr bld{OSSL_PARAM_BLD_new()};
    if (!bld) return nullptr;

    if (!OSSL_PARAM_BLD_push_utf8_string(
            bld.get(), OSSL_PKEY_PARAM_GROUP_NAME, CURVE_NAME, 0)) {
        return nullptr;
    }
    if (!OSSL_PARAM_BLD_push_octet_string(
            bld.get(), OSSL_PKEY_PARAM_PUB_KEY, pub_data, pub_len)) {
        return nullptr;
    }

    OP_ptr params{OSSL_PARAM_BLD_to_param(bld.get())};
    if (!params) return nullptr;

    EVP_PKEY_CTX* pctx = EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr);
    if (!pctx) return nullptr;
    EVP_CTX_ptr pctx_guard{pctx};

    if (EVP_PKEY_fromdata_init(pctx) <= 0) return nullptr;

    EVP_PKEY* pkey = nullptr;
    if (EVP_PKEY_fromdata(pctx, &pkey, EVP_PKEY_PUBLIC_KEY,
                          params.get()) <= 0) {
        return nullptr;
    }
    return pkey;
}

// ---------------------------------------------------------------------------
// Internal: extract the uncompressed public key (65 bytes) from EVP_PKEY.
// ---------------------------------------------------------------------------
static bool extract_pubkey_uncompressed(EVP_PKEY* pkey, uint8_t out[65]) {
    uint8_t raw[65];
    size_t len = 0;
    if (!EVP_PKEY_get_octet_string_param(
            pkey, OSSL_PKEY_PARAM_PUB_KEY, raw, sizeof(raw), &len)) {
        return false;
    }
    if (len == 65 && raw[0] == 0x04) {
        std::memcpy(out, raw, 65);
        return true;
    }
    return reencode_point(raw, len, POINT_CONVERSION_UNCOMPRESSED,
                          out, 65) == 65;
}

// ---------------------------------------------------------------------------
// Internal: DER <-> r||s conversion.
// ---------------------------------------------------------------------------
static void encode_der_integer(const uint8_t* val, size_t val_len,
                               std::vector<uint8_t>& out) {
    // Skip leading zeros but keep at least one byte.
    size_t skip = 0;
    while (skip < val_len - 1 && val[skip] == 0) ++skip;
    const uint8_t* start = val + skip;
    size_t len = val_len - skip;

    bool need_pad = (start[0] & 0x80) != 0;
    out.push_back(0x02);  // INTEGER tag
    out.push_back(static_cast<uint8_t>(len + (need_pad ? 1 : 0)));
    if (need_pad) out.push_back(0x00);
    out.insert(out.end(), start, start + len);
}

static std::vector<uint8_t> compact_to_der(const uint8_t* r32,
                                           const uint8_t* s32) {
    std::vector<uint8_t> inner;
    inner.reserve(72);
    encode_der_integer(r32, 32, inner);
    encode_der_integer(s32, 32, inner);

    std::vector<uint8_t> der;
    der.reserve(inner.size() + 2);
    der.push_back(0x30);  // SEQUENCE
    der.push_back(static_cast<uint8_t>(inner.size()));
    der.insert(der.end(), inner.begin(), inner.end());
    return der;
}

static bool der_to_compact(const uint8_t* der, size_t der_len,
                           uint8_t r_out[32], uint8_t s_out[32]) {
    if (der_len < 8 || der[0] != 0x30) return false;
    size_t seq_len = der[1];
    if (seq_len + 2 > der_len) return false;

    const uint8_t* p = der + 2;
    const uint8_t* end = der + 2 + seq_len;

    auto read_int = [&](uint8_t out[32]) -> bool {
        if (p >= end || *p != 0x02) return false;
        ++p;
        if (p >= end) return false;
        size_t ilen = *p++;
        if (p + ilen > end) return false;

        // Strip leading zero padding.
        const uint8_t* istart = p;
        size_t ilen_raw = ilen;
        if (ilen > 1 && istart[0] == 0x00) {
            ++istart;
            --ilen_raw;
        }
        if (ilen_raw > 32) return false;

        std::memset(out, 0, 32);
        std::memcpy(out + 32 - ilen_raw, istart, ilen_raw);
        p += ilen;
        return true;
    };

    if (!read_int(r_out)) return false;
    if (!read_int(s_out)) return false;
    return true;
}

// ---------------------------------------------------------------------------
// ECKey lifetime
// ---------------------------------------------------------------------------

ECKey::~ECKey() {
    if (pkey_) EVP_PKEY_free(pkey_);
    OPENSSL_cleanse(secret_.data(), secret_.size());
}

ECKey::ECKey(const ECKey& other)
    : secret_(other.secret_),
      has_key_(other.has_key_) {
    rebuild_pkey();
}

ECKey& ECKey::operator=(const ECKey& other) {
    if (this != &other) {
        secret_ = other.secret_;
        has_key_ = other.has_key_;
        rebuild_pkey();
    }
    return *this;
}

ECKey::ECKey(ECKey&& other) noexcept
    : secret_(other.secret_),
      has_key_(other.has_key_),
      pkey_(other.pkey_) {
    other.pkey_ = nullptr;
    other.has_key_ = false;
    OPENSSL_cleanse(other.secret_.data(), other.secret_.size());
}

ECKey& ECKey::operator=(ECKey&& other) noexcept {
    if (this != &other) {
        if (pkey_) EVP_PKEY_free(pkey_);
        OPENSSL_cleanse(secret_.data(), secret_.size());

        secret_ = other.secret_;
        has_key_ = other.has_key_;
        pkey_ = other.pkey_;

        other.pkey_ = nullptr;
        other.has_key_ = false;
        OPENSSL_cleanse(other.secret_.data(), other.secret_.size());
    }
    return *this;
}

// ---------------------------------------------------------------------------
// Key construction
// ---------------------------------------------------------------------------

core::Result<ECKey> ECKey::generate() {
    EVP_PKEY* raw = EVP_PKEY_Q_keygen(nullptr, nullptr, "EC", CURVE_NAME);
    if (!raw) {
        return core::Error(core::ErrorCode::CRYPTO_KEY_FAIL,
                           "EVP_PKEY_Q_keygen failed for secp256r1");
    }
    EVP_KEY_ptr guard{raw};

    BIGNUM* priv_raw = nullptr;
    if (!EVP_PKEY_get_bn_param(raw, OSSL_PKEY_PARAM_PRIV_KEY, &priv_raw)) {
        return core::Error(core::ErrorCode::CRYPTO_KEY_FAIL,
                           "cannot read generated private key");
    }
    BN_ptr priv_bn{priv_raw};

    ECKey key;
    if (BN_bn2binpad(priv_bn.get(), key.secret_.data(), 32) != 32) {
        return core::Error(core::ErrorCode::CRYPTO_KEY_FAIL,
                           "generated private key exceeds 32 bytes");
    }
    key.pkey_ = guard.release();
    key.has_key_ = true;
    return key;
}

core::Result<ECKey> ECKey::from_secret(std::span<const uint8_t, 32> secret) {
    // Validate: secret must be in [1, n-1].
    BN_ptr s_bn{BN_bin2bn(secret.data(), 32, nullptr)};
    if (!s_bn || BN_is_zero(s_bn.get()) ||
        BN_cmp(s_bn.get(), secp256r1_order_bn()) >= 0) {
        return core::Error(core::ErrorCode::CRYPTO_KEY_FAIL,
                           "secret key out of range for secp256r1");
    }

    ECKey key;
    std::memcpy(key.secret_.data(), secret.data(), 32);
    key.has_key_ = true;
    key.rebuild_pkey();

    if (!key.pkey_) {
        return core::Error(core::ErrorCode::CRYPTO_KEY_FAIL,
                           "failed to build EVP_PKEY from secret");
    }
    return key;
}

bool ECKey::is_valid() const { return has_key_ && pkey_ != nullptr; }

std::array<uint8_t, 32> ECKey::secret() const { return secret_; }

void ECKey::rebuild_pkey() {
    if (pkey_) {
        EVP_PKEY_free(pkey_);
        pkey_ = nullptr;
    }
    if (!has_key_) return;
    pkey_ = build_pkey_from_secret(secret_.data());
}

// ---------------------------------------------------------------------------
// Public key accessors
// ---------------------------------------------------------------------------

PublicKey ECKey::pubkey_compressed() const {
    PublicKey out{};
    if (!pkey_) return out;
    uint8_t uncomp[65];
    if (extract_pubkey_uncompressed(pkey_, uncomp)) {
        // 0x02 if y is even, 0x03 if odd.
        out[0] = (uncomp[64] & 1) ? 0x03 : 0x02;
        std::memcpy(out.data() + 1, uncomp + 1, 32);
    }
    return out;
}

std::array<uint8_t, 65> ECKey::pubkey_uncompressed() const {
    std::array<uint8_t, 65> out{};
    if (!pkey_) return out;
    extract_pubkey_uncompressed(pkey_, out.data());
    return out;
}

// ---------------------------------------------------------------------------
// ECDSA
// ---------------------------------------------------------------------------

core::Result<Signature> ECKey::sign(std::span<const uint8_t> message) const {
    if (!pkey_) {
        return core::Error(core::ErrorCode::CRYPTO_KEY_FAIL,
                           "sign() on an empty key");
    }

    EVP_MD_ptr md_ctx{EVP_MD_CTX_new()};
    if (!md_ctx ||
        EVP_DigestSignInit(md_ctx.get(), nullptr, EVP_sha256(), nullptr,
                           pkey_) <= 0) {
        return core::Error(core::ErrorCode::CRYPTO_SIG_FAIL,
                           "EVP_DigestSignInit failed");
    }

    size_t sig_len = 0;
    if (EVP_DigestSign(md_ctx.get(), nullptr, &sig_len,
                       message.data(), message.size()) <= 0) {
        return core::Error(core::ErrorCode::CRYPTO_SIG_FAIL,
                           "EVP_DigestSign size query failed");
    }
    std::vector<uint8_t> der(sig_len);
    if (EVP_DigestSign(md_ctx.get(), der.data(), &sig_len,
                       message.data(), message.size()) <= 0) {
        return core::Error(core::ErrorCode::CRYPTO_SIG_FAIL,
                           "EVP_DigestSign failed");
    }
    der.resize(sig_len);

    Signature out{};
    if (!der_to_compact(der.data(), der.size(), out.data(),
                        out.data() + 32)) {
        return core::Error(core::ErrorCode::CRYPTO_SIG_FAIL,
                           "malformed DER signature from OpenSSL");
    }
    return out;
}

bool ECKey::verify(std::span<const uint8_t> pubkey,
                   std::span<const uint8_t> message,
                   std::span<const uint8_t> signature) {
    if (pubkey.size() != 33 && pubkey.size() != 65) return false;
    if (signature.size() != 64) return false;

    EVP_PKEY* pk = build_pkey_from_pubkey(pubkey.data(), pubkey.size());
    if (!pk) return false;
    EVP_KEY_ptr guard{pk};

    std::vector<uint8_t> der =
        compact_to_der(signature.data(), signature.data() + 32);

    EVP_MD_ptr md_ctx{EVP_MD_CTX_new()};
    if (!md_ctx ||
        EVP_DigestVerifyInit(md_ctx.get(), nullptr, EVP_sha256(), nullptr,
                             pk) <= 0) {
        return false;
    }
    return EVP_DigestVerify(md_ctx.get(), der.data(), der.size(),
                            message.data(), message.size()) == 1;
}

// ---------------------------------------------------------------------------
// Public key helpers
// ---------------------------------------------------------------------------

bool is_valid_pubkey(std::span<const uint8_t> pubkey) {
    if (pubkey.size() == 33) {
        if (pubkey[0] != 0x02 && pubkey[0] != 0x03) return false;
    } else if (pubkey.size() == 65) {
        if (pubkey[0] != 0x04) return false;
    } else {
        return false;
    }
    uint8_t scratch[65];
    return reencode_point(pubkey.data(), pubkey.size(),
                          POINT_CONVERSION_UNCOMPRESSED,
                          scratch, sizeof(scratch)) == 65;
}

core::Result<PublicKey> compress_pubkey(std::span<const uint8_t> pubkey) {
    if (!is_valid_pubkey(pubkey)) {
        return core::Error(core::ErrorCode::CRYPTO_KEY_FAIL,
                           "not a secp256r1 public key");
    }
    PublicKey out{};
    if (reencode_point(pubkey.data(), pubkey.size(),
                       POINT_CONVERSION_COMPRESSED,
                       out.data(), out.size()) != 33) {
        return core::Error(core::ErrorCode::CRYPTO_KEY_FAIL,
                           "point compression failed");
    }
    return out;
}

}  // namespace crypto
