#pragma once

#include <cstdint>
#include <vector>

namespace blobseal::ec {

using Bytes = std::vector<std::uint8_t>;

struct KemResult {
    Bytes ephemeral_public;
    Bytes shared;
};

// Account keys are secp256k1. Public keys travel as 65-byte uncompressed points.
Bytes PublicKeyFromSecret(const Bytes& secret);
void ValidatePublicKey(const Bytes& public_key);
KemResult KemEncrypt(const Bytes& recipient_public_key);
Bytes KemDecrypt(const Bytes& secret, const Bytes& ephemeral_public);

}  // namespace blobseal::ec
