#pragma once

#include "blobseal/crypto_utils.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace blobseal::crypto {

using Bytes = std::vector<std::uint8_t>;

Bytes RandomBytes(std::size_t size);
void Wipe(Bytes& data) noexcept;

Bytes Sha256(const std::uint8_t* data, std::size_t len);
Bytes Sha256(const Bytes& data);
std::string Sha256Hex(const Bytes& data);

// Incremental SHA-256 for inputs that are never materialised in one buffer.
class Sha256Stream {
public:
    Sha256Stream();

    void Update(const std::uint8_t* data, std::size_t len);
    void Update(const Bytes& data) { Update(data.data(), data.size()); }
    Bytes Final();
    std::string FinalHex();

private:
    detail::UniqueMDCtx ctx_;
    bool finalized_ = false;
};

Bytes HkdfSha256(const Bytes& key_material, const Bytes& salt, std::string_view info, std::size_t length);

// Output is ciphertext || tag. Throws IntegrityError when the tag does not verify.
Bytes AesGcmEncryptWithIv(const Bytes& key, const Bytes& iv, const Bytes& plaintext, const Bytes& aad);
Bytes AesGcmDecryptWithIv(const Bytes& key, const Bytes& iv, const Bytes& blob, const Bytes& aad);
std::size_t AesGcmEncryptWithIvInto(const Bytes& key,
                                    const Bytes& iv,
                                    const std::uint8_t* plaintext,
                                    std::size_t plaintext_len,
                                    const Bytes& aad,
                                    std::uint8_t* out,
                                    std::size_t out_len);
std::size_t AesGcmDecryptWithIvInto(const Bytes& key,
                                    const std::uint8_t* iv,
                                    std::size_t iv_len,
                                    const std::uint8_t* blob,
                                    std::size_t blob_len,
                                    const Bytes& aad,
                                    std::uint8_t* out,
                                    std::size_t out_len);

std::string ToHex(const Bytes& data);
Bytes FromHex(std::string_view hex, bool* ok = nullptr);

}  // namespace blobseal::crypto
