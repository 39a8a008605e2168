#pragma once

#include "blobseal/constants.hpp"
#include "blobseal/keybundle.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <istream>
#include <string>
#include <vector>

namespace blobseal {

// One encrypted block. `frame` is the exact byte sequence that is stored and hashed:
// [8-digit decimal body length][nonce][ciphertext][tag]
struct Chunk {
    std::size_t index = 0;
    std::size_t plaintext_size = 0;
    Bytes nonce;
    Bytes frame;
    std::string hash;

    // Ciphertext followed by the tag, copied out of the frame.
    Bytes Ciphertext() const;
};

struct EncryptedObject {
    std::vector<Chunk> chunks;
    std::string combined_hash;
    std::string plaintext_hash;
    std::uint64_t total_size = 0;
};

struct ManifestEntry {
    std::size_t index = 0;
    std::string hash;
    std::uint64_t size = 0;
};

namespace chunk_codec {

using NonceSource = std::function<Bytes()>;

struct EncodeOptions {
    std::size_t block_size = constants::kDefaultBlockSize;
    // Defaults to RAND_bytes; must return 12 bytes per call.
    NonceSource nonce_source;
};

EncryptedObject Encode(std::istream& plaintext, const KeyBundle& bundle, const EncodeOptions& options = {});

Bytes Decode(const Chunk& chunk, const KeyBundle& bundle);
// Decrypts back-to-back frames. Throws IntegrityError or ProtocolError; never returns partial output.
Bytes DecodeFrames(const Bytes& region, const KeyBundle& bundle);
// Splits back-to-back frames without decrypting them.
std::vector<Bytes> SplitFrames(const Bytes& region);

std::string ChunkHash(const Bytes& frame);
// SHA-256 over the frames in index order, lowercase hex.
std::string CombinedHash(const std::vector<Chunk>& chunks);
std::string CombinedHash(const std::vector<Bytes>& ordered_frames);

std::string PlaintextHash(std::istream& plaintext, std::size_t read_size = constants::kDefaultReadSize);
std::vector<ManifestEntry> Manifest(const EncryptedObject& object);

}  // namespace chunk_codec

}  // namespace blobseal
