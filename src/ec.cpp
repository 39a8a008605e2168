#include "blobseal/ec.hpp"

#include "blobseal/constants.hpp"
#include "blobseal/crypto_utils.hpp"
#include "blobseal/errors.hpp"

#include <stdexcept>
#include <string>

#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/evp.h>
#include <openssl/obj_mac.h>

namespace blobseal::ec {

namespace {

using crypto::detail::UniqueBignum;
using crypto::detail::UniqueECKey;
using crypto::detail::UniqueECPoint;
using crypto::detail::UniquePKEY;
using crypto::detail::UniquePKEYCtx;

constexpr int kCurveNid = NID_secp256k1;

UniquePKEY WrapEcKey(UniqueECKey ec_key) {
    UniquePKEY pkey(EVP_PKEY_new());
    if (!pkey) {
        throw std::runtime_error("Failed to allocate EVP_PKEY");
    }
    if (EVP_PKEY_set1_EC_KEY(pkey.get(), ec_key.get()) != 1) {
        throw std::runtime_error("Failed to assign EC key");
    }
    return pkey;
}

UniquePKEY GenerateKey() {
    UniquePKEYCtx ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_EC, nullptr));
    if (!ctx) {
        throw std::runtime_error("Failed to initialize EC keygen");
    }
    if (EVP_PKEY_keygen_init(ctx.get()) != 1) {
        throw std::runtime_error("Failed to init EC keygen");
    }
    if (EVP_PKEY_CTX_set_ec_paramgen_curve_nid(ctx.get(), kCurveNid) != 1) {
        throw std::runtime_error("Failed to set EC curve");
    }
    EVP_PKEY* raw = nullptr;
    if (EVP_PKEY_keygen(ctx.get(), &raw) != 1 || !raw) {
        throw std::runtime_error("Failed to generate EC key");
    }
    return UniquePKEY(raw);
}

UniqueECKey KeyFromSecret(const Bytes& secret) {
    if (secret.size() != constants::kSecretLen) {
        throw KeyError("Account secret must be 32 bytes");
    }
    UniqueECKey ec_key(EC_KEY_new_by_curve_name(kCurveNid));
    if (!ec_key) {
        throw std::runtime_error("Failed to create EC key");
    }
    const EC_GROUP* group = EC_KEY_get0_group(ec_key.get());
    UniqueBignum priv(BN_bin2bn(secret.data(), static_cast<int>(secret.size()), nullptr));
    if (!priv) {
        throw std::runtime_error("Failed to load EC private scalar");
    }
    const BIGNUM* order = EC_GROUP_get0_order(group);
    if (BN_is_zero(priv.get()) || BN_cmp(priv.get(), order) >= 0) {
        throw KeyError("Account secret is not a valid secp256k1 scalar");
    }
    if (EC_KEY_set_private_key(ec_key.get(), priv.get()) != 1) {
        throw KeyError("Failed to set EC private key");
    }
    UniqueECPoint pub(EC_POINT_new(group));
    if (!pub) {
        throw std::runtime_error("Failed to create EC point");
    }
    if (EC_POINT_mul(group, pub.get(), priv.get(), nullptr, nullptr, nullptr) != 1) {
        throw std::runtime_error("Failed to compute EC public key");
    }
    if (EC_KEY_set_public_key(ec_key.get(), pub.get()) != 1) {
        throw std::runtime_error("Failed to set EC public key");
    }
    return ec_key;
}

Bytes EncodePublicPoint(const EC_KEY* ec_key) {
    const EC_GROUP* group = EC_KEY_get0_group(ec_key);
    const EC_POINT* point = EC_KEY_get0_public_key(ec_key);
    if (!group || !point) {
        throw std::runtime_error("EC public key missing");
    }
    std::size_t len = EC_POINT_point2oct(group, point, POINT_CONVERSION_UNCOMPRESSED, nullptr, 0, nullptr);
    if (len == 0) {
        throw std::runtime_error("Failed to encode EC public key");
    }
    Bytes out(len);
    if (EC_POINT_point2oct(group, point, POINT_CONVERSION_UNCOMPRESSED, out.data(), out.size(), nullptr) != len) {
        throw std::runtime_error("Failed to encode EC public key");
    }
    return out;
}

UniqueECKey KeyFromPoint(const Bytes& encoded) {
    if (encoded.size() != constants::kPublicKeyLen || encoded[0] != 0x04) {
        throw KeyError("Public key must be a 65-byte uncompressed secp256k1 point");
    }
    UniqueECKey ec_key(EC_KEY_new_by_curve_name(kCurveNid));
    if (!ec_key) {
        throw std::runtime_error("Failed to create EC key");
    }
    const EC_GROUP* group = EC_KEY_get0_group(ec_key.get());
    UniqueECPoint point(EC_POINT_new(group));
    if (!point) {
        throw std::runtime_error("Failed to create EC point");
    }
    if (EC_POINT_oct2point(group, point.get(), encoded.data(), encoded.size(), nullptr) != 1) {
        throw KeyError("Invalid EC public key encoding");
    }
    if (EC_POINT_is_at_infinity(group, point.get()) == 1
        || EC_POINT_is_on_curve(group, point.get(), nullptr) != 1) {
        throw KeyError("EC public key is not on secp256k1");
    }
    if (EC_KEY_set_public_key(ec_key.get(), point.get()) != 1) {
        throw KeyError("Failed to set EC public key");
    }
    return ec_key;
}

Bytes DeriveShared(EVP_PKEY* priv, EVP_PKEY* peer) {
    UniquePKEYCtx ctx(EVP_PKEY_CTX_new(priv, nullptr));
    if (!ctx) {
        throw std::runtime_error("Failed to init ECDH ctx");
    }
    if (EVP_PKEY_derive_init(ctx.get()) != 1) {
        throw std::runtime_error("Failed to init ECDH derive");
    }
    if (EVP_PKEY_derive_set_peer(ctx.get(), peer) != 1) {
        throw KeyError("Failed to set ECDH peer");
    }
    std::size_t len = 0;
    if (EVP_PKEY_derive(ctx.get(), nullptr, &len) != 1 || len == 0) {
        throw std::runtime_error("Failed to size ECDH shared secret");
    }
    Bytes shared(len);
    if (EVP_PKEY_derive(ctx.get(), shared.data(), &len) != 1) {
        throw std::runtime_error("Failed to derive ECDH shared secret");
    }
    shared.resize(len);
    return shared;
}

}  // namespace

Bytes PublicKeyFromSecret(const Bytes& secret) {
    UniqueECKey key = KeyFromSecret(secret);
    return EncodePublicPoint(key.get());
}

void ValidatePublicKey(const Bytes& public_key) {
    KeyFromPoint(public_key);
}

KemResult KemEncrypt(const Bytes& recipient_public_key) {
    UniquePKEY peer = WrapEcKey(KeyFromPoint(recipient_public_key));
    UniquePKEY eph = GenerateKey();
    Bytes shared = DeriveShared(eph.get(), peer.get());
    const EC_KEY* eph_ec = EVP_PKEY_get0_EC_KEY(eph.get());
    if (!eph_ec) {
        throw std::runtime_error("EC key expected");
    }
    return {EncodePublicPoint(eph_ec), shared};
}

Bytes KemDecrypt(const Bytes& secret, const Bytes& ephemeral_public) {
    UniquePKEY priv = WrapEcKey(KeyFromSecret(secret));
    UniquePKEY peer = WrapEcKey(KeyFromPoint(ephemeral_public));
    return DeriveShared(priv.get(), peer.get());
}

}  // namespace blobseal::ec
