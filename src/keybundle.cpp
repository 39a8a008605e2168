#include "blobseal/keybundle.hpp"

#include "blobseal/base64.hpp"
#include "blobseal/constants.hpp"
#include "blobseal/crypto.hpp"
#include "blobseal/ec.hpp"
#include "blobseal/errors.hpp"

#include <openssl/crypto.h>

#include <algorithm>
#include <utility>

namespace blobseal {

KeyBundle::KeyBundle(Bytes key) : key_(std::move(key)) {
    if (key_.size() != constants::kKeyLen) {
        crypto::Wipe(key_);
        throw KeyError("File key must be 32 bytes");
    }
}

KeyBundle::~KeyBundle() {
    crypto::Wipe(key_);
}

KeyBundle::KeyBundle(KeyBundle&& other) noexcept : key_(std::move(other.key_)) {
    other.key_.clear();
}

KeyBundle& KeyBundle::operator=(KeyBundle&& other) noexcept {
    if (this != &other) {
        crypto::Wipe(key_);
        key_ = std::move(other.key_);
        other.key_.clear();
    }
    return *this;
}

namespace keybundle {

namespace {

constexpr std::size_t kWrapHeaderLen = 4 + 2;
constexpr std::size_t kWrapTotalLen = kWrapHeaderLen + constants::kPublicKeyLen + constants::kAeadNonceLen
                                      + constants::kKeyLen + constants::kAeadTagLen;

Bytes WrapHeader(const Bytes& ephemeral_public) {
    Bytes header(constants::kWrapMagic.begin(), constants::kWrapMagic.end());
    header.push_back(static_cast<std::uint8_t>((ephemeral_public.size() >> 8) & 0xFF));
    header.push_back(static_cast<std::uint8_t>(ephemeral_public.size() & 0xFF));
    crypto::detail::AppendBytes(header, ephemeral_public);
    return header;
}

Bytes SealKey(Bytes& shared, const Bytes& ephemeral_public) {
    Bytes key = crypto::HkdfSha256(shared, ephemeral_public, constants::kWrapInfo, constants::kKeyLen);
    crypto::Wipe(shared);
    return key;
}

}  // namespace

KeyBundle Generate() {
    return KeyBundle(crypto::RandomBytes(constants::kKeyLen));
}

std::string Wrap(const KeyBundle& bundle, const Bytes& recipient_public_key) {
    if (bundle.Empty()) {
        throw KeyError("Cannot wrap an empty key bundle");
    }
    ec::KemResult kem = ec::KemEncrypt(recipient_public_key);
    Bytes seal_key = SealKey(kem.shared, kem.ephemeral_public);
    Bytes header = WrapHeader(kem.ephemeral_public);
    Bytes nonce = crypto::RandomBytes(constants::kAeadNonceLen);
    Bytes sealed;
    try {
        sealed = crypto::AesGcmEncryptWithIv(seal_key, nonce, bundle.Key(), header);
    } catch (...) {
        crypto::Wipe(seal_key);
        throw;
    }
    crypto::Wipe(seal_key);

    Bytes blob = std::move(header);
    blob.reserve(kWrapTotalLen);
    crypto::detail::AppendBytes(blob, nonce);
    crypto::detail::AppendBytes(blob, sealed);
    return base64::Encode(blob);
}

KeyBundle Unwrap(const std::string& wrapped, const Bytes& account_secret) {
    bool ok = false;
    Bytes blob = base64::Decode(wrapped, &ok);
    if (!ok) {
        throw KeyError("Wrapped key is not valid base64");
    }
    if (blob.size() != kWrapTotalLen) {
        throw KeyError("Wrapped key has unexpected length");
    }
    if (!std::equal(constants::kWrapMagic.begin(), constants::kWrapMagic.end(), blob.begin())) {
        throw KeyError("Wrapped key has unknown format");
    }
    std::size_t epk_len = (static_cast<std::size_t>(blob[4]) << 8) | blob[5];
    if (epk_len != constants::kPublicKeyLen) {
        throw KeyError("Wrapped key has unexpected ephemeral key length");
    }
    auto epk_begin = blob.begin() + kWrapHeaderLen;
    Bytes ephemeral_public(epk_begin, epk_begin + static_cast<std::ptrdiff_t>(epk_len));
    auto nonce_begin = epk_begin + static_cast<std::ptrdiff_t>(epk_len);
    Bytes nonce(nonce_begin, nonce_begin + static_cast<std::ptrdiff_t>(constants::kAeadNonceLen));
    Bytes sealed(nonce_begin + static_cast<std::ptrdiff_t>(constants::kAeadNonceLen), blob.end());

    Bytes shared = ec::KemDecrypt(account_secret, ephemeral_public);
    Bytes seal_key = SealKey(shared, ephemeral_public);
    Bytes key;
    try {
        key = crypto::AesGcmDecryptWithIv(seal_key, nonce, sealed, WrapHeader(ephemeral_public));
    } catch (const IntegrityError&) {
        crypto::Wipe(seal_key);
        throw KeyError("Wrapped key does not open with this account key");
    }
    crypto::Wipe(seal_key);
    return KeyBundle(std::move(key));
}

Bytes DeriveAccountSecret(std::string_view signature) {
    if (signature.empty()) {
        throw KeyError("Session signature is empty");
    }
    return crypto::Sha256(reinterpret_cast<const std::uint8_t*>(signature.data()), signature.size());
}

Bytes PublicKeyFromSecret(const Bytes& account_secret) {
    return ec::PublicKeyFromSecret(account_secret);
}

void VerifyAccountKey(const Bytes& account_secret, const Bytes& published_public_key) {
    ec::ValidatePublicKey(published_public_key);
    Bytes derived = ec::PublicKeyFromSecret(account_secret);
    if (derived.size() != published_public_key.size()
        || CRYPTO_memcmp(derived.data(), published_public_key.data(), derived.size()) != 0) {
        throw KeyError("Account key does not match the published public key");
    }
}

}  // namespace keybundle

}  // namespace blobseal
