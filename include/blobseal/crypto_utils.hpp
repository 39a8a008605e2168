#pragma once

#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/evp.h>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <memory>
#include <vector>

namespace blobseal::crypto::detail {

// RAII wrappers for OpenSSL resources
struct EVPCipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const noexcept {
        if (ctx) EVP_CIPHER_CTX_free(ctx);
    }
};

struct EVPMDCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const noexcept {
        if (ctx) EVP_MD_CTX_free(ctx);
    }
};

struct EVPPKEYCtxDeleter {
    void operator()(EVP_PKEY_CTX* ctx) const noexcept {
        if (ctx) EVP_PKEY_CTX_free(ctx);
    }
};

struct EVPPKEYDeleter {
    void operator()(EVP_PKEY* key) const noexcept {
        if (key) EVP_PKEY_free(key);
    }
};

struct ECKeyDeleter {
    void operator()(EC_KEY* key) const noexcept {
        if (key) EC_KEY_free(key);
    }
};

struct ECPointDeleter {
    void operator()(EC_POINT* point) const noexcept {
        if (point) EC_POINT_free(point);
    }
};

struct BignumDeleter {
    void operator()(BIGNUM* bn) const noexcept {
        if (bn) BN_clear_free(bn);
    }
};

using UniqueCipherCtx = std::unique_ptr<EVP_CIPHER_CTX, EVPCipherCtxDeleter>;
using UniqueMDCtx = std::unique_ptr<EVP_MD_CTX, EVPMDCtxDeleter>;
using UniquePKEYCtx = std::unique_ptr<EVP_PKEY_CTX, EVPPKEYCtxDeleter>;
using UniquePKEY = std::unique_ptr<EVP_PKEY, EVPPKEYDeleter>;
using UniqueECKey = std::unique_ptr<EC_KEY, ECKeyDeleter>;
using UniqueECPoint = std::unique_ptr<EC_POINT, ECPointDeleter>;
using UniqueBignum = std::unique_ptr<BIGNUM, BignumDeleter>;

// Fast append without reallocation checks
inline void AppendBytes(std::vector<std::uint8_t>& dest, const std::uint8_t* src, std::size_t len) {
    if (len == 0) return;
    const std::size_t old_size = dest.size();
    dest.resize(old_size + len);
    std::memcpy(dest.data() + old_size, src, len);
}

inline void AppendBytes(std::vector<std::uint8_t>& dest, const std::vector<std::uint8_t>& src) {
    if (src.empty()) return;
    AppendBytes(dest, src.data(), src.size());
}

}  // namespace blobseal::crypto::detail
