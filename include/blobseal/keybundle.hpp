#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace blobseal {

using Bytes = std::vector<std::uint8_t>;

// Per-file AES-256-GCM key. Move-only; the key bytes are wiped on destruction.
class KeyBundle {
public:
    KeyBundle() = default;
    explicit KeyBundle(Bytes key);
    ~KeyBundle();

    KeyBundle(const KeyBundle&) = delete;
    KeyBundle& operator=(const KeyBundle&) = delete;
    KeyBundle(KeyBundle&& other) noexcept;
    KeyBundle& operator=(KeyBundle&& other) noexcept;

    const Bytes& Key() const noexcept { return key_; }
    bool Empty() const noexcept { return key_.empty(); }

private:
    Bytes key_;
};

namespace keybundle {

KeyBundle Generate();

// Hybrid wrap for one recipient's secp256k1 public key, base64 encoded.
// Throws KeyError for a malformed public key.
std::string Wrap(const KeyBundle& bundle, const Bytes& recipient_public_key);

// Throws KeyError on any malformed input or when the wrapped key was not made for this secret.
KeyBundle Unwrap(const std::string& wrapped, const Bytes& account_secret);

// SHA-256 of the wallet's stable session signature, used as the private scalar.
Bytes DeriveAccountSecret(std::string_view signature);
Bytes PublicKeyFromSecret(const Bytes& account_secret);
// Throws KeyError when the secret does not belong to published_public_key.
void VerifyAccountKey(const Bytes& account_secret, const Bytes& published_public_key);

}  // namespace keybundle

}  // namespace blobseal
