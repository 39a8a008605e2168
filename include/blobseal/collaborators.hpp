#pragma once

#include "blobseal/chunk_codec.hpp"
#include "blobseal/errors.hpp"
#include "blobseal/metadata.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

namespace blobseal {

struct CallOptions {
    std::chrono::milliseconds timeout{15000};
};

struct ProviderEndpoint {
    std::string id;
    std::string address;
};

// Wallet that signs the fixed session message. The signature must be stable per account.
class WalletSigner {
public:
    virtual ~WalletSigner() = default;
    virtual std::string SignSessionMessage(const std::string& account, const CallOptions& options) = 0;
};

class PublicKeyDirectory {
public:
    virtual ~PublicKeyDirectory() = default;
    // nullopt when the account has not published a key.
    virtual std::optional<Bytes> Lookup(const std::string& account, const CallOptions& options) = 0;
};

struct LedgerSubmission {
    std::string owner;
    std::string combined_hash;
    std::uint64_t total_size = 0;
    std::int64_t expires_at = 0;  // unix seconds
    std::string wrapped_key;
    std::vector<ManifestEntry> manifest;
    FileMetadata metadata;
};

struct LedgerReceipt {
    std::string transaction_id;
    std::vector<ProviderEndpoint> endpoints;
};

class LedgerClient {
public:
    virtual ~LedgerClient() = default;
    virtual LedgerReceipt Submit(const LedgerSubmission& submission, const CallOptions& options) = 0;
};

struct ResourceRecord {
    std::string content_hash;
    std::string owner;
    std::string wrapped_key;
    std::vector<ProviderEndpoint> endpoints;
    FileMetadata metadata;
};

struct ManifestSubmission {
    std::string transaction_id;
    std::string content_hash;
    std::string owner;
    std::string wrapped_key;
    std::vector<ManifestEntry> manifest;
    std::vector<ProviderEndpoint> endpoints;
    FileMetadata metadata;
};

struct RecipientKey {
    std::string account;
    std::string wrapped_key;
};

// For a directory grant `resource_id` is empty, `directory_path` is set and each wrapped_key
// is the per-file keys joined with "||".
struct ShareGrant {
    std::string resource_id;
    std::string directory_path;
    std::string owner;
    std::vector<RecipientKey> recipients;
    std::int64_t expires_at = 0;  // unix seconds
};

struct RevokeRequest {
    std::string resource_id;
    std::string directory_path;
    std::string owner;
    std::string account;
};

struct DirectoryEntry {
    std::string path;
    bool is_directory = false;
    std::string content_hash;
    std::string wrapped_key;
};

// One replica of the metadata directory.
class DirectoryClient {
public:
    virtual ~DirectoryClient() = default;
    virtual std::string Id() const = 0;
    // nullopt when this replica does not know the resource.
    virtual std::optional<ResourceRecord> Query(const std::string& content_hash,
                                                const std::string& account,
                                                const CallOptions& options) = 0;
    virtual void SubmitManifest(const ManifestSubmission& submission, const CallOptions& options) = 0;
    virtual void Share(const ShareGrant& grant, const CallOptions& options) = 0;
    virtual void Revoke(const RevokeRequest& request, const CallOptions& options) = 0;
    virtual std::optional<ShareGrant> QueryShare(const std::string& resource_id,
                                                 const std::string& owner,
                                                 const CallOptions& options) = 0;
    // Entries directly under path; sub-directories are listed with is_directory set.
    virtual std::vector<DirectoryEntry> List(const std::string& path,
                                             const std::string& owner,
                                             const CallOptions& options) = 0;
};

// Multipart provider response, pulled in reads of the caller's choosing.
class ObjectStream {
public:
    virtual ~ObjectStream() = default;
    virtual std::string ContentType() const = 0;
    // Out-of-band X-Total-Chunks value when the provider sent one.
    virtual std::optional<std::size_t> TotalChunks() const = 0;
    // Returns 0 at end of stream.
    virtual std::size_t Read(std::uint8_t* buffer, std::size_t capacity) = 0;
};

struct ChunkPush {
    std::string transaction_id;
    std::string content_hash;
    std::string owner;
    std::size_t index = 0;
    std::size_t total_chunks = 0;
    std::string chunk_hash;
};

class StorageProvider {
public:
    virtual ~StorageProvider() = default;
    virtual void PushChunk(const ProviderEndpoint& endpoint,
                           const ChunkPush& push,
                           const Bytes& frame,
                           const CallOptions& options) = 0;
    virtual std::unique_ptr<ObjectStream> Fetch(const ProviderEndpoint& endpoint,
                                                const std::string& content_hash,
                                                const CallOptions& options) = 0;
};

// Runs one collaborator call. Failures that are not already classified surface as NetworkError,
// as does a call that returns after its deadline.
template <typename Fn>
auto CallWithDeadline(const std::string& what, const CallOptions& options, Fn&& fn) -> decltype(fn()) {
    const auto start = std::chrono::steady_clock::now();
    auto check = [&]() {
        auto elapsed = std::chrono::steady_clock::now() - start;
        if (elapsed > options.timeout) {
            throw NetworkError(what + " timed out after " + std::to_string(options.timeout.count()) + " ms");
        }
    };
    try {
        if constexpr (std::is_void_v<decltype(fn())>) {
            fn();
            check();
        } else {
            auto result = fn();
            check();
            return result;
        }
    } catch (const Error&) {
        throw;
    } catch (const std::exception& exc) {
        throw NetworkError(what + " failed: " + exc.what());
    }
}

}  // namespace blobseal
