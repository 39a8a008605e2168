#include "blobseal/crypto.hpp"

#include "blobseal/constants.hpp"
#include "blobseal/errors.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/rand.h>

#include <limits>
#include <stdexcept>

namespace blobseal::crypto {

namespace {

void Ensure(bool ok, const char* message) {
    if (!ok) {
        throw std::runtime_error(message);
    }
}

void EnsureKey(const Bytes& key) {
    if (key.size() != constants::kKeyLen) {
        throw std::runtime_error("AES-GCM expects 32-byte key");
    }
}

int CheckedInt(std::size_t value, const char* message) {
    if (value > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
        throw std::runtime_error(message);
    }
    return static_cast<int>(value);
}

}  // namespace

Bytes RandomBytes(std::size_t size) {
    Bytes out(size);
    if (size == 0) {
        return out;
    }
    Ensure(RAND_bytes(out.data(), CheckedInt(out.size(), "RAND_bytes size too large")) == 1,
           "RAND_bytes failed");
    return out;
}

void Wipe(Bytes& data) noexcept {
    if (!data.empty()) {
        OPENSSL_cleanse(data.data(), data.size());
    }
    data.clear();
}

Bytes Sha256(const std::uint8_t* data, std::size_t len) {
    Sha256Stream stream;
    stream.Update(data, len);
    return stream.Final();
}

Bytes Sha256(const Bytes& data) {
    return Sha256(data.data(), data.size());
}

std::string Sha256Hex(const Bytes& data) {
    return ToHex(Sha256(data));
}

Sha256Stream::Sha256Stream() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) {
        throw std::runtime_error("SHA-256 context allocation failed");
    }
    Ensure(EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) == 1, "SHA-256 init failed");
}

void Sha256Stream::Update(const std::uint8_t* data, std::size_t len) {
    if (finalized_) {
        throw std::logic_error("SHA-256 stream already finalized");
    }
    if (len == 0) {
        return;
    }
    Ensure(EVP_DigestUpdate(ctx_.get(), data, len) == 1, "SHA-256 update failed");
}

Bytes Sha256Stream::Final() {
    if (finalized_) {
        throw std::logic_error("SHA-256 stream already finalized");
    }
    Bytes out(EVP_MAX_MD_SIZE);
    unsigned int out_len = 0;
    Ensure(EVP_DigestFinal_ex(ctx_.get(), out.data(), &out_len) == 1, "SHA-256 final failed");
    finalized_ = true;
    out.resize(out_len);
    return out;
}

std::string Sha256Stream::FinalHex() {
    return ToHex(Final());
}

Bytes HkdfSha256(const Bytes& key_material, const Bytes& salt, std::string_view info, std::size_t length) {
    detail::UniquePKEYCtx pctx(EVP_PKEY_CTX_new_id(EVP_PKEY_HKDF, nullptr));
    if (!pctx) {
        throw std::runtime_error("HKDF context allocation failed");
    }
    Bytes out(length);
    std::size_t out_len = out.size();

    Ensure(EVP_PKEY_derive_init(pctx.get()) == 1, "HKDF init failed");
    Ensure(EVP_PKEY_CTX_set_hkdf_md(pctx.get(), EVP_sha256()) == 1, "HKDF set md failed");
    Ensure(EVP_PKEY_CTX_set1_hkdf_key(pctx.get(), key_material.data(),
                                      CheckedInt(key_material.size(), "HKDF key too large")) == 1,
           "HKDF set key failed");
    if (!salt.empty()) {
        Ensure(EVP_PKEY_CTX_set1_hkdf_salt(pctx.get(), salt.data(),
                                           CheckedInt(salt.size(), "HKDF salt too large")) == 1,
               "HKDF set salt failed");
    }
    if (!info.empty()) {
        Ensure(EVP_PKEY_CTX_add1_hkdf_info(pctx.get(), reinterpret_cast<const unsigned char*>(info.data()),
                                           CheckedInt(info.size(), "HKDF info too large")) == 1,
               "HKDF set info failed");
    }
    Ensure(EVP_PKEY_derive(pctx.get(), out.data(), &out_len) == 1, "HKDF derive failed");
    out.resize(out_len);
    return out;
}

std::size_t AesGcmEncryptWithIvInto(const Bytes& key,
                                    const Bytes& iv,
                                    const std::uint8_t* plaintext,
                                    std::size_t plaintext_len,
                                    const Bytes& aad,
                                    std::uint8_t* out,
                                    std::size_t out_len) {
    EnsureKey(key);
    if (iv.empty()) {
        throw std::runtime_error("AES-GCM IV is required");
    }
    if (out_len < plaintext_len + constants::kAeadTagLen) {
        throw std::runtime_error("AES-GCM output buffer too small");
    }
    detail::UniqueCipherCtx ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        throw std::runtime_error("AES-GCM context allocation failed");
    }
    int len = 0;
    std::size_t total_len = 0;

    Ensure(EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) == 1,
           "AES-GCM init failed");
    Ensure(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(iv.size()), nullptr) == 1,
           "AES-GCM set iv length failed");
    Ensure(EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), iv.data()) == 1,
           "AES-GCM set key failed");
    if (!aad.empty()) {
        Ensure(EVP_EncryptUpdate(ctx.get(), nullptr, &len, aad.data(), CheckedInt(aad.size(), "AAD too large")) == 1,
               "AES-GCM aad failed");
    }
    if (plaintext_len > 0) {
        Ensure(EVP_EncryptUpdate(ctx.get(), out, &len, plaintext,
                                 CheckedInt(plaintext_len, "AES-GCM block too large")) == 1,
               "AES-GCM encrypt failed");
        total_len += static_cast<std::size_t>(len);
    }
    Ensure(EVP_EncryptFinal_ex(ctx.get(), out + total_len, &len) == 1, "AES-GCM final failed");
    total_len += static_cast<std::size_t>(len);
    Ensure(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(constants::kAeadTagLen),
                               out + total_len) == 1,
           "AES-GCM get tag failed");
    return total_len + constants::kAeadTagLen;
}

std::size_t AesGcmDecryptWithIvInto(const Bytes& key,
                                    const std::uint8_t* iv,
                                    std::size_t iv_len,
                                    const std::uint8_t* blob,
                                    std::size_t blob_len,
                                    const Bytes& aad,
                                    std::uint8_t* out,
                                    std::size_t out_len) {
    EnsureKey(key);
    if (iv_len == 0) {
        throw std::runtime_error("AES-GCM IV is required");
    }
    if (blob_len < constants::kAeadTagLen) {
        throw IntegrityError("AES-GCM blob too short for authentication tag");
    }
    const std::size_t cipher_len = blob_len - constants::kAeadTagLen;
    if (out_len < cipher_len) {
        throw std::runtime_error("AES-GCM output buffer too small");
    }
    detail::UniqueCipherCtx ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        throw std::runtime_error("AES-GCM context allocation failed");
    }
    int len = 0;
    std::size_t total_len = 0;

    Ensure(EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) == 1,
           "AES-GCM init failed");
    Ensure(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(iv_len), nullptr) == 1,
           "AES-GCM set iv length failed");
    Ensure(EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), iv) == 1, "AES-GCM set key failed");
    if (!aad.empty()) {
        Ensure(EVP_DecryptUpdate(ctx.get(), nullptr, &len, aad.data(), CheckedInt(aad.size(), "AAD too large")) == 1,
               "AES-GCM aad failed");
    }
    if (cipher_len > 0) {
        Ensure(EVP_DecryptUpdate(ctx.get(), out, &len, blob, CheckedInt(cipher_len, "AES-GCM block too large")) == 1,
               "AES-GCM decrypt failed");
        total_len += static_cast<std::size_t>(len);
    }
    Ensure(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(constants::kAeadTagLen),
                               const_cast<std::uint8_t*>(blob + cipher_len)) == 1,
           "AES-GCM set tag failed");
    if (EVP_DecryptFinal_ex(ctx.get(), out + total_len, &len) != 1) {
        OPENSSL_cleanse(out, cipher_len);
        throw IntegrityError("AES-GCM authentication failed");
    }
    total_len += static_cast<std::size_t>(len);
    return total_len;
}

Bytes AesGcmEncryptWithIv(const Bytes& key, const Bytes& iv, const Bytes& plaintext, const Bytes& aad) {
    Bytes out(plaintext.size() + constants::kAeadTagLen);
    std::size_t written = AesGcmEncryptWithIvInto(key, iv, plaintext.data(), plaintext.size(), aad,
                                                  out.data(), out.size());
    out.resize(written);
    return out;
}

Bytes AesGcmDecryptWithIv(const Bytes& key, const Bytes& iv, const Bytes& blob, const Bytes& aad) {
    if (blob.size() < constants::kAeadTagLen) {
        throw IntegrityError("AES-GCM blob too short for authentication tag");
    }
    Bytes plaintext(blob.size() - constants::kAeadTagLen);
    std::size_t written = AesGcmDecryptWithIvInto(key, iv.data(), iv.size(), blob.data(), blob.size(), aad,
                                                  plaintext.data(), plaintext.size());
    plaintext.resize(written);
    return plaintext;
}

std::string ToHex(const Bytes& data) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.resize(data.size() * 2);
    for (std::size_t i = 0; i < data.size(); ++i) {
        out[i * 2] = kHex[(data[i] >> 4) & 0x0F];
        out[i * 2 + 1] = kHex[data[i] & 0x0F];
    }
    return out;
}

Bytes FromHex(std::string_view hex, bool* ok) {
    auto nibble = [](char ch) -> int {
        if (ch >= '0' && ch <= '9') return ch - '0';
        if (ch >= 'a' && ch <= 'f') return ch - 'a' + 10;
        if (ch >= 'A' && ch <= 'F') return ch - 'A' + 10;
        return -1;
    };
    Bytes out;
    bool success = hex.size() % 2 == 0;
    if (success) {
        out.reserve(hex.size() / 2);
        for (std::size_t i = 0; i < hex.size(); i += 2) {
            int hi = nibble(hex[i]);
            int lo = nibble(hex[i + 1]);
            if (hi < 0 || lo < 0) {
                success = false;
                break;
            }
            out.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
        }
    }
    if (ok) {
        *ok = success;
    }
    if (!success) {
        out.clear();
    }
    return out;
}

}  // namespace blobseal::crypto
