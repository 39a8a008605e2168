#include "blobseal/chunk_codec.hpp"

#include "blobseal/crypto.hpp"
#include "blobseal/errors.hpp"

#include <algorithm>
#include <cstdio>
#include <stdexcept>
#include <utility>

namespace blobseal {

Bytes Chunk::Ciphertext() const {
    const std::size_t offset = constants::kFrameHeaderLen + constants::kAeadNonceLen;
    if (frame.size() < offset + constants::kAeadTagLen) {
        throw ProtocolError("Chunk frame is too short");
    }
    return Bytes(frame.begin() + static_cast<std::ptrdiff_t>(offset), frame.end());
}

namespace chunk_codec {

namespace {

constexpr std::size_t kMinBody = constants::kAeadNonceLen + constants::kAeadTagLen;

std::string FormatHeader(std::size_t body_len) {
    if (body_len > constants::kFrameMaxBody) {
        throw ProtocolError("Chunk body of " + std::to_string(body_len) + " bytes exceeds the frame header");
    }
    char buf[constants::kFrameHeaderLen + 1];
    std::snprintf(buf, sizeof(buf), "%08zu", body_len);
    return std::string(buf, constants::kFrameHeaderLen);
}

std::size_t ParseHeader(const std::uint8_t* data, std::size_t available) {
    if (available < constants::kFrameHeaderLen) {
        throw ProtocolError("Truncated chunk frame header");
    }
    std::size_t value = 0;
    for (std::size_t i = 0; i < constants::kFrameHeaderLen; ++i) {
        std::uint8_t ch = data[i];
        if (ch < '0' || ch > '9') {
            throw ProtocolError("Chunk frame header is not numeric");
        }
        value = value * 10 + static_cast<std::size_t>(ch - '0');
    }
    if (value == 0) {
        throw ProtocolError("Chunk frame declares an empty body");
    }
    if (value < kMinBody) {
        throw ProtocolError("Chunk frame body is shorter than nonce and tag");
    }
    if (value > available - constants::kFrameHeaderLen) {
        throw ProtocolError("Chunk frame declares " + std::to_string(value) + " bytes but only "
                            + std::to_string(available - constants::kFrameHeaderLen) + " are present");
    }
    return value;
}

// Appends the plaintext of one frame to out and returns the frame's total length.
std::size_t DecodeOne(const std::uint8_t* data, std::size_t available, const KeyBundle& bundle, Bytes& out) {
    std::size_t body = ParseHeader(data, available);
    const std::uint8_t* nonce = data + constants::kFrameHeaderLen;
    const std::uint8_t* blob = nonce + constants::kAeadNonceLen;
    std::size_t blob_len = body - constants::kAeadNonceLen;
    std::size_t pt_len = blob_len - constants::kAeadTagLen;
    std::size_t offset = out.size();
    out.resize(offset + pt_len);
    crypto::AesGcmDecryptWithIvInto(bundle.Key(), nonce, constants::kAeadNonceLen, blob, blob_len, {},
                                    out.data() + offset, pt_len);
    return constants::kFrameHeaderLen + body;
}

Bytes DefaultNonce() {
    return crypto::RandomBytes(constants::kAeadNonceLen);
}

}  // namespace

EncryptedObject Encode(std::istream& plaintext, const KeyBundle& bundle, const EncodeOptions& options) {
    if (bundle.Empty()) {
        throw KeyError("Cannot encrypt with an empty key bundle");
    }
    if (options.block_size == 0) {
        throw std::invalid_argument("block_size must be positive");
    }
    FormatHeader(options.block_size + kMinBody);
    const NonceSource& next_nonce = options.nonce_source ? options.nonce_source : NonceSource(DefaultNonce);

    EncryptedObject object;
    crypto::Sha256Stream plain_hash;
    crypto::Sha256Stream combined;
    Bytes block(options.block_size);
    std::size_t index = 0;
    while (true) {
        plaintext.read(reinterpret_cast<char*>(block.data()), static_cast<std::streamsize>(block.size()));
        if (plaintext.bad()) {
            throw std::runtime_error("Failed to read plaintext");
        }
        std::size_t got = static_cast<std::size_t>(plaintext.gcount());
        if (got == 0 && index > 0) {
            break;
        }

        Chunk chunk;
        chunk.index = index;
        chunk.plaintext_size = got;
        chunk.nonce = next_nonce();
        if (chunk.nonce.size() != constants::kAeadNonceLen) {
            throw std::invalid_argument("Nonce source must yield 12-byte nonces");
        }
        std::string header = FormatHeader(constants::kAeadNonceLen + got + constants::kAeadTagLen);
        chunk.frame.resize(constants::kFrameHeaderLen + kMinBody + got);
        std::copy(header.begin(), header.end(), chunk.frame.begin());
        std::copy(chunk.nonce.begin(), chunk.nonce.end(), chunk.frame.begin() + constants::kFrameHeaderLen);
        std::uint8_t* out = chunk.frame.data() + constants::kFrameHeaderLen + constants::kAeadNonceLen;
        crypto::AesGcmEncryptWithIvInto(bundle.Key(), chunk.nonce, block.data(), got, {}, out,
                                        got + constants::kAeadTagLen);
        chunk.hash = ChunkHash(chunk.frame);

        plain_hash.Update(block.data(), got);
        combined.Update(chunk.frame);
        object.total_size += chunk.frame.size();
        object.chunks.push_back(std::move(chunk));
        ++index;

        if (got < block.size()) {
            break;
        }
    }
    crypto::Wipe(block);
    object.plaintext_hash = plain_hash.FinalHex();
    object.combined_hash = combined.FinalHex();
    return object;
}

Bytes Decode(const Chunk& chunk, const KeyBundle& bundle) {
    Bytes out;
    try {
        std::size_t used = DecodeOne(chunk.frame.data(), chunk.frame.size(), bundle, out);
        if (used != chunk.frame.size()) {
            throw ProtocolError("Chunk " + std::to_string(chunk.index) + " has trailing bytes after its frame");
        }
    } catch (...) {
        crypto::Wipe(out);
        throw;
    }
    return out;
}

Bytes DecodeFrames(const Bytes& region, const KeyBundle& bundle) {
    if (region.empty()) {
        throw ProtocolError("No chunk frames to decode");
    }
    Bytes out;
    try {
        std::size_t pos = 0;
        while (pos < region.size()) {
            pos += DecodeOne(region.data() + pos, region.size() - pos, bundle, out);
        }
    } catch (...) {
        crypto::Wipe(out);
        throw;
    }
    return out;
}

std::vector<Bytes> SplitFrames(const Bytes& region) {
    std::vector<Bytes> frames;
    std::size_t pos = 0;
    while (pos < region.size()) {
        std::size_t len = constants::kFrameHeaderLen + ParseHeader(region.data() + pos, region.size() - pos);
        frames.emplace_back(region.begin() + static_cast<std::ptrdiff_t>(pos),
                            region.begin() + static_cast<std::ptrdiff_t>(pos + len));
        pos += len;
    }
    return frames;
}

std::string ChunkHash(const Bytes& frame) {
    return crypto::Sha256Hex(frame);
}

std::string CombinedHash(const std::vector<Chunk>& chunks) {
    std::vector<const Chunk*> ordered;
    ordered.reserve(chunks.size());
    for (const auto& chunk : chunks) {
        ordered.push_back(&chunk);
    }
    std::sort(ordered.begin(), ordered.end(), [](const Chunk* a, const Chunk* b) { return a->index < b->index; });
    crypto::Sha256Stream stream;
    for (const Chunk* chunk : ordered) {
        stream.Update(chunk->frame);
    }
    return stream.FinalHex();
}

std::string CombinedHash(const std::vector<Bytes>& ordered_frames) {
    crypto::Sha256Stream stream;
    for (const auto& frame : ordered_frames) {
        stream.Update(frame);
    }
    return stream.FinalHex();
}

std::string PlaintextHash(std::istream& plaintext, std::size_t read_size) {
    if (read_size == 0) {
        read_size = constants::kDefaultReadSize;
    }
    crypto::Sha256Stream stream;
    std::vector<char> buffer(read_size);
    while (plaintext) {
        plaintext.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize got = plaintext.gcount();
        if (got > 0) {
            stream.Update(reinterpret_cast<const std::uint8_t*>(buffer.data()), static_cast<std::size_t>(got));
        }
    }
    if (plaintext.bad()) {
        throw std::runtime_error("Failed to read plaintext");
    }
    return stream.FinalHex();
}

std::vector<ManifestEntry> Manifest(const EncryptedObject& object) {
    std::vector<ManifestEntry> entries;
    entries.reserve(object.chunks.size());
    for (const auto& chunk : object.chunks) {
        entries.push_back({chunk.index, chunk.hash, chunk.frame.size()});
    }
    std::sort(entries.begin(), entries.end(),
              [](const ManifestEntry& a, const ManifestEntry& b) { return a.index < b.index; });
    return entries;
}

}  // namespace chunk_codec

}  // namespace blobseal
