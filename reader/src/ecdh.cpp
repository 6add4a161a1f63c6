#include "ecdh.hpp"
#include "glog_error.hpp"
#include <openssl/evp.h>
#include <openssl/ec.h>
#include <openssl/core_names.h>
#include <openssl/obj_mac.h>
#include <openssl/bn.h>
#include <openssl/param_build.h>
#include <openssl/params.h>
#include <openssl/crypto.h>
#include <stdexcept>
#include <string>

using glog::CryptoError;
using glog::CryptoErrc;

namespace ecdh {

static const char* kGroupName = "secp256k1";

// ── Scalar / point helpers ────────────────────────────────────────────────────

void check_private_key(const std::vector<uint8_t>& sk) {
    if (sk.size() != kPrivateKeyLen)
        throw CryptoError(CryptoErrc::InvalidPrivateKey,
            "expected " + std::to_string(kPrivateKeyLen) + " bytes, got " +
            std::to_string(sk.size()));

    EC_GROUP* group = EC_GROUP_new_by_curve_name(NID_secp256k1);
    if (!group) throw std::runtime_error("secp256k1: EC_GROUP_new_by_curve_name failed");

    BIGNUM* d = BN_bin2bn(sk.data(), (int)sk.size(), nullptr);
    if (!d) {
        EC_GROUP_free(group);
        throw std::runtime_error("secp256k1: BN_bin2bn failed");
    }
    // get0_order points into the group; do not free it separately.
    const BIGNUM* order = EC_GROUP_get0_order(group);
    bool ok = !BN_is_zero(d) && BN_cmp(d, order) < 0;
    BN_free(d);
    EC_GROUP_free(group);

    if (!ok)
        throw CryptoError(CryptoErrc::InvalidPrivateKey, "scalar outside [1, n-1]");
}

std::vector<uint8_t> public_key(const std::vector<uint8_t>& sk) {
    check_private_key(sk);

    EC_GROUP* group = EC_GROUP_new_by_curve_name(NID_secp256k1);
    if (!group) throw std::runtime_error("secp256k1: EC_GROUP_new_by_curve_name failed");

    BIGNUM*   d  = BN_bin2bn(sk.data(), (int)sk.size(), nullptr);
    EC_POINT* pt = EC_POINT_new(group);
    if (!d || !pt || EC_POINT_mul(group, pt, d, nullptr, nullptr, nullptr) != 1) {
        EC_POINT_free(pt);
        BN_clear_free(d);
        EC_GROUP_free(group);
        throw std::runtime_error("secp256k1: EC_POINT_mul failed");
    }
    BN_clear_free(d);

    std::vector<uint8_t> pk(kPublicKeyLen);
    size_t n = EC_POINT_point2oct(group, pt, POINT_CONVERSION_COMPRESSED,
                                  pk.data(), pk.size(), nullptr);
    EC_POINT_free(pt);
    EC_GROUP_free(group);
    if (n != kPublicKeyLen)
        throw std::runtime_error("secp256k1: EC_POINT_point2oct failed");
    return pk;
}

// Load an EC public key from compressed point bytes.
static EVP_PKEY* load_pubkey(const uint8_t* pk, size_t pk_len) {
    OSSL_PARAM_BLD* bld = OSSL_PARAM_BLD_new();
    if (!bld) return nullptr;
    OSSL_PARAM_BLD_push_utf8_string(bld, OSSL_PKEY_PARAM_GROUP_NAME, kGroupName, 0);
    OSSL_PARAM_BLD_push_octet_string(bld, OSSL_PKEY_PARAM_PUB_KEY, (void*)pk, pk_len);
    OSSL_PARAM* params = OSSL_PARAM_BLD_to_param(bld);
    OSSL_PARAM_BLD_free(bld);
    if (!params) return nullptr;

    EVP_PKEY_CTX* ctx = EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr);
    EVP_PKEY* pkey = nullptr;
    if (ctx) {
        if (EVP_PKEY_fromdata_init(ctx) <= 0 ||
            EVP_PKEY_fromdata(ctx, &pkey, EVP_PKEY_PUBLIC_KEY, params) <= 0)
            pkey = nullptr;
        EVP_PKEY_CTX_free(ctx);
    }
    OSSL_PARAM_free(params);
    return pkey;
}

// Load an EC key pair from a big-endian scalar and its compressed public key.
static EVP_PKEY* load_keypair(const std::vector<uint8_t>& sk, const std::vector<uint8_t>& pk) {
    BIGNUM* priv_bn = BN_bin2bn(sk.data(), (int)sk.size(), nullptr);
    if (!priv_bn) return nullptr;

    OSSL_PARAM_BLD* bld = OSSL_PARAM_BLD_new();
    if (!bld) { BN_clear_free(priv_bn); return nullptr; }
    OSSL_PARAM_BLD_push_utf8_string(bld, OSSL_PKEY_PARAM_GROUP_NAME, kGroupName, 0);
    OSSL_PARAM_BLD_push_BN(bld, OSSL_PKEY_PARAM_PRIV_KEY, priv_bn);
    OSSL_PARAM_BLD_push_octet_string(bld, OSSL_PKEY_PARAM_PUB_KEY,
                                     (void*)pk.data(), pk.size());
    OSSL_PARAM* params = OSSL_PARAM_BLD_to_param(bld);
    OSSL_PARAM_BLD_free(bld);
    BN_clear_free(priv_bn);
    if (!params) return nullptr;

    EVP_PKEY_CTX* ctx = EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr);
    EVP_PKEY* pkey = nullptr;
    if (ctx) {
        if (EVP_PKEY_fromdata_init(ctx) <= 0 ||
            EVP_PKEY_fromdata(ctx, &pkey, EVP_PKEY_KEYPAIR, params) <= 0)
            pkey = nullptr;
        EVP_PKEY_CTX_free(ctx);
    }
    OSSL_PARAM* priv = OSSL_PARAM_locate(params, OSSL_PKEY_PARAM_PRIV_KEY);
    if (priv && priv->data) OPENSSL_cleanse(priv->data, priv->data_size);
    OSSL_PARAM_free(params);
    return pkey;
}

// ── Key generation ────────────────────────────────────────────────────────────

KeyPair keygen() {
    EVP_PKEY_CTX* ctx = EVP_PKEY_CTX_new_id(EVP_PKEY_EC, nullptr);
    if (!ctx) throw std::runtime_error("EVP_PKEY_CTX_new_id (EC) failed");

    if (EVP_PKEY_keygen_init(ctx) <= 0) {
        EVP_PKEY_CTX_free(ctx);
        throw std::runtime_error("EVP_PKEY_keygen_init failed");
    }
    if (EVP_PKEY_CTX_set_ec_paramgen_curve_nid(ctx, NID_secp256k1) <= 0) {
        EVP_PKEY_CTX_free(ctx);
        throw std::runtime_error("EVP_PKEY_CTX_set_ec_paramgen_curve_nid failed");
    }

    EVP_PKEY* pkey = nullptr;
    if (EVP_PKEY_keygen(ctx, &pkey) <= 0) {
        EVP_PKEY_CTX_free(ctx);
        throw std::runtime_error("EVP_PKEY_keygen (secp256k1) failed");
    }
    EVP_PKEY_CTX_free(ctx);

    // Private key: big-endian scalar padded to 32 bytes
    BIGNUM* priv_bn = nullptr;
    if (EVP_PKEY_get_bn_param(pkey, OSSL_PKEY_PARAM_PRIV_KEY, &priv_bn) <= 0) {
        EVP_PKEY_free(pkey);
        throw std::runtime_error("Failed to get secp256k1 private key");
    }
    EVP_PKEY_free(pkey);

    KeyPair kp;
    kp.sk.resize(kPrivateKeyLen);
    if (BN_bn2binpad(priv_bn, kp.sk.data(), (int)kPrivateKeyLen) < 0) {
        BN_clear_free(priv_bn);
        throw std::runtime_error("BN_bn2binpad failed");
    }
    BN_clear_free(priv_bn);

    kp.pk = public_key(kp.sk);
    return kp;
}

// ── ECDH ──────────────────────────────────────────────────────────────────────

std::vector<uint8_t> shared_secret(const std::vector<uint8_t>& sk,
                                   const uint8_t* pub, size_t pub_len)
{
    std::vector<uint8_t> own_pk = public_key(sk);

    if (pub_len != kPublicKeyLen || (pub[0] != 0x02 && pub[0] != 0x03))
        throw CryptoError(CryptoErrc::InvalidPublicKey,
            "expected a " + std::to_string(kPublicKeyLen) + "-byte compressed point");

    EVP_PKEY* peer = load_pubkey(pub, pub_len);
    if (!peer)
        throw CryptoError(CryptoErrc::InvalidPublicKey, "point is not on secp256k1");

    EVP_PKEY* own = load_keypair(sk, own_pk);
    if (!own) {
        EVP_PKEY_free(peer);
        throw CryptoError(CryptoErrc::InvalidPrivateKey, "failed to load private key");
    }

    EVP_PKEY_CTX* dctx = EVP_PKEY_CTX_new(own, nullptr);
    EVP_PKEY_free(own);
    if (!dctx) {
        EVP_PKEY_free(peer);
        throw std::runtime_error("secp256k1: EVP_PKEY_CTX_new (derive) failed");
    }
    if (EVP_PKEY_derive_init(dctx) <= 0) {
        EVP_PKEY_CTX_free(dctx);
        EVP_PKEY_free(peer);
        throw std::runtime_error("secp256k1: derive init failed");
    }
    if (EVP_PKEY_derive_set_peer(dctx, peer) <= 0) {
        EVP_PKEY_CTX_free(dctx);
        EVP_PKEY_free(peer);
        throw CryptoError(CryptoErrc::InvalidPublicKey, "peer key rejected");
    }
    EVP_PKEY_free(peer);

    size_t ss_len = kSharedSecretLen;
    std::vector<uint8_t> ss(kSharedSecretLen);
    if (EVP_PKEY_derive(dctx, ss.data(), &ss_len) <= 0 || ss_len != kSharedSecretLen) {
        EVP_PKEY_CTX_free(dctx);
        throw std::runtime_error("secp256k1: EVP_PKEY_derive failed");
    }
    EVP_PKEY_CTX_free(dctx);
    return ss;
}

} // namespace ecdh
