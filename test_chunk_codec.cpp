#include "blobseal/chunk_codec.hpp"
#include "blobseal/crypto.hpp"
#include "blobseal/errors.hpp"
#include "blobseal/keybundle.hpp"

#include "test_support.hpp"

#include <sstream>
#include <string>

using namespace blobseal_test;
namespace chunk_codec = blobseal::chunk_codec;

namespace {

constexpr std::size_t kMiB = 1024 * 1024;

blobseal::KeyBundle FixedKey() {
    return blobseal::KeyBundle(Bytes(32, 0x42));
}

blobseal::EncryptedObject EncodeBytes(const Bytes& data,
                                      const blobseal::KeyBundle& bundle,
                                      std::size_t block_size,
                                      std::uint32_t nonce_start = 0) {
    std::istringstream in(std::string(data.begin(), data.end()));
    chunk_codec::EncodeOptions options;
    options.block_size = block_size;
    options.nonce_source = CounterNonces(nonce_start);
    return chunk_codec::Encode(in, bundle, options);
}

Bytes Concat(const blobseal::EncryptedObject& object) {
    Bytes region;
    for (const auto& chunk : object.chunks) {
        region.insert(region.end(), chunk.frame.begin(), chunk.frame.end());
    }
    return region;
}

}  // namespace

int main() {
    Run("frame layout", []() {
        blobseal::KeyBundle bundle = FixedKey();
        Bytes data = ToBytes("hello, chunked world");
        blobseal::EncryptedObject object = EncodeBytes(data, bundle, 8);
        CheckEq(object.chunks.size(), std::size_t{3}, "20 bytes in 8-byte blocks");
        const blobseal::Chunk& first = object.chunks[0];
        CheckEq(std::string(first.frame.begin(), first.frame.begin() + 8), std::string("00000036"),
                "header is body length 12+8+16");
        Check(Bytes(first.frame.begin() + 8, first.frame.begin() + 20) == first.nonce, "nonce follows header");
        CheckEq(first.Ciphertext().size(), std::size_t{24}, "ciphertext plus tag");
        CheckEq(first.hash, blobseal::crypto::Sha256Hex(first.frame), "chunk hash covers the frame");
        CheckEq(object.chunks[2].plaintext_size, std::size_t{4}, "short final block");
        CheckEq(object.plaintext_hash, blobseal::crypto::Sha256Hex(data), "plaintext hash");
        std::uint64_t total = 0;
        for (std::size_t i = 0; i < object.chunks.size(); ++i) {
            CheckEq(object.chunks[i].index, i, "index " + std::to_string(i));
            total += object.chunks[i].frame.size();
        }
        CheckEq(object.total_size, total, "total size sums frames");
        CheckEq(object.combined_hash, blobseal::crypto::Sha256Hex(Concat(object)), "combined hash over frames");
        CheckEq(chunk_codec::CombinedHash(object.chunks), object.combined_hash, "recomputed combined hash");
    });

    Run("round trip", []() {
        blobseal::KeyBundle bundle = blobseal::keybundle::Generate();
        Bytes data = Pattern(100000, 7);
        blobseal::EncryptedObject object = EncodeBytes(data, bundle, 4096);
        CheckEq(object.chunks.size(), std::size_t{25}, "ceil(100000/4096) chunks");
        Bytes out;
        for (const auto& chunk : object.chunks) {
            Bytes piece = chunk_codec::Decode(chunk, bundle);
            CheckEq(piece.size(), chunk.plaintext_size, "chunk " + std::to_string(chunk.index) + " size");
            out.insert(out.end(), piece.begin(), piece.end());
        }
        Check(out == data, "per-chunk decode restores plaintext");
        Check(chunk_codec::DecodeFrames(Concat(object), bundle) == data, "multi-frame region decode");
        CheckEq(chunk_codec::SplitFrames(Concat(object)).size(), object.chunks.size(), "split frames");
    });

    Run("empty input", []() {
        blobseal::KeyBundle bundle = FixedKey();
        blobseal::EncryptedObject object = EncodeBytes({}, bundle, 1024);
        CheckEq(object.chunks.size(), std::size_t{1}, "one chunk");
        CheckEq(object.chunks[0].frame.size(), std::size_t{8 + 12 + 16}, "header, nonce and tag only");
        CheckEq(std::string(object.chunks[0].frame.begin(), object.chunks[0].frame.begin() + 8),
                std::string("00000028"), "header");
        Check(chunk_codec::Decode(object.chunks[0], bundle).empty(), "decodes to empty");
    });

    Run("exact block multiple", []() {
        blobseal::KeyBundle bundle = FixedKey();
        blobseal::EncryptedObject object = EncodeBytes(Pattern(2048), bundle, 1024);
        CheckEq(object.chunks.size(), std::size_t{2}, "no trailing empty chunk");
    });

    Run("70 MiB in 32 MiB blocks", []() {
        blobseal::KeyBundle bundle = FixedKey();
        Bytes data = Pattern(70 * kMiB, 3);
        blobseal::EncryptedObject first = EncodeBytes(data, bundle, 32 * kMiB);
        CheckEq(first.chunks.size(), std::size_t{3}, "three chunks");
        CheckEq(first.chunks[2].plaintext_size, 6 * kMiB, "6 MiB tail");
        blobseal::EncryptedObject second = EncodeBytes(data, bundle, 32 * kMiB);
        CheckEq(second.combined_hash, first.combined_hash, "same key and nonces give the same address");
        data[data.size() / 2] ^= 0x01;
        blobseal::EncryptedObject changed = EncodeBytes(data, bundle, 32 * kMiB);
        Check(changed.combined_hash != first.combined_hash, "one flipped byte changes the address");
        CheckEq(changed.chunks[0].hash, first.chunks[0].hash, "untouched chunk keeps its hash");
        Check(changed.chunks[1].hash != first.chunks[1].hash, "touched chunk changes its hash");
    });

    Run("nonces", []() {
        blobseal::KeyBundle bundle = FixedKey();
        Bytes data = Pattern(3000);
        blobseal::EncryptedObject a = EncodeBytes(data, bundle, 1000, 0);
        blobseal::EncryptedObject b = EncodeBytes(data, bundle, 1000, 50);
        Check(a.combined_hash != b.combined_hash, "address depends on nonces");
        Check(a.chunks[0].nonce != a.chunks[1].nonce, "fresh nonce per chunk");
        std::istringstream in("abc");
        chunk_codec::EncodeOptions options;
        blobseal::EncryptedObject random_nonces = chunk_codec::Encode(in, bundle, options);
        CheckEq(random_nonces.chunks[0].nonce.size(), std::size_t{12}, "default source yields 12 bytes");
        std::istringstream again("abc");
        options.nonce_source = []() { return Bytes(8, 0); };
        CheckThrows<std::invalid_argument>([&]() { chunk_codec::Encode(again, bundle, options); }, "short nonce");
        std::istringstream oversized("abc");
        chunk_codec::EncodeOptions huge;
        huge.block_size = 100000000;
        CheckThrows<blobseal::ProtocolError>([&]() { chunk_codec::Encode(oversized, bundle, huge); },
                                             "block size beyond the 8-digit header");
    });

    Run("tampering", []() {
        blobseal::KeyBundle bundle = FixedKey();
        blobseal::EncryptedObject object = EncodeBytes(Pattern(500), bundle, 200);
        blobseal::Chunk tampered = object.chunks[1];
        tampered.frame[30] ^= 0x01;
        CheckThrows<blobseal::IntegrityError>([&]() { chunk_codec::Decode(tampered, bundle); }, "flipped ciphertext");
        blobseal::KeyBundle other(Bytes(32, 0x43));
        CheckThrows<blobseal::IntegrityError>([&]() { chunk_codec::Decode(object.chunks[0], other); }, "wrong key");
        Bytes region = Concat(object);
        region[region.size() - 1] ^= 0x80;
        CheckThrows<blobseal::IntegrityError>([&]() { chunk_codec::DecodeFrames(region, bundle); },
                                              "tag failure in the last frame");
    });

    Run("malformed frames", []() {
        blobseal::KeyBundle bundle = FixedKey();
        blobseal::EncryptedObject object = EncodeBytes(Pattern(100), bundle, 100);
        Bytes region = Concat(object);

        Bytes non_numeric = region;
        non_numeric[3] = 'x';
        CheckThrows<blobseal::ProtocolError>([&]() { chunk_codec::DecodeFrames(non_numeric, bundle); },
                                             "non-numeric header");
        Bytes zero = ToBytes("00000000");
        CheckThrows<blobseal::ProtocolError>([&]() { chunk_codec::DecodeFrames(zero, bundle); }, "zero length");
        Bytes tiny = ToBytes("00000010");
        tiny.resize(18, 0);
        CheckThrows<blobseal::ProtocolError>([&]() { chunk_codec::DecodeFrames(tiny, bundle); },
                                             "body shorter than nonce and tag");
        Bytes truncated(region.begin(), region.end() - 5);
        CheckThrows<blobseal::ProtocolError>([&]() { chunk_codec::DecodeFrames(truncated, bundle); },
                                             "declared length beyond the region");
        Bytes trailing = region;
        trailing.push_back('0');
        CheckThrows<blobseal::ProtocolError>([&]() { chunk_codec::DecodeFrames(trailing, bundle); },
                                             "partial trailing header");
        blobseal::Chunk padded = object.chunks[0];
        padded.frame.push_back(0);
        CheckThrows<blobseal::ProtocolError>([&]() { chunk_codec::Decode(padded, bundle); }, "bytes after frame");
        CheckThrows<blobseal::ProtocolError>([&]() { chunk_codec::DecodeFrames({}, bundle); }, "empty region");
    });

    Run("manifest and plaintext hash", []() {
        blobseal::KeyBundle bundle = FixedKey();
        Bytes data = Pattern(2500);
        blobseal::EncryptedObject object = EncodeBytes(data, bundle, 1000);
        std::vector<blobseal::ManifestEntry> manifest = chunk_codec::Manifest(object);
        CheckEq(manifest.size(), std::size_t{3}, "one entry per chunk");
        CheckEq(manifest[2].size, std::uint64_t{8 + 12 + 500 + 16}, "entry size is the frame size");
        CheckEq(manifest[1].hash, object.chunks[1].hash, "entry hash");
        std::istringstream in(std::string(data.begin(), data.end()));
        CheckEq(chunk_codec::PlaintextHash(in, 333), blobseal::crypto::Sha256Hex(data), "streamed plaintext hash");
    });

    return Summary("test_chunk_codec");
}
