#pragma once

#include "blobseal/chunk_codec.hpp"
#include "blobseal/collaborators.hpp"
#include "blobseal/config.hpp"
#include "blobseal/fanout.hpp"
#include "blobseal/metadata.hpp"
#include "blobseal/session.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace blobseal {

struct ProgressEvent {
    std::string operation;  // "upload" or "download"
    std::string stage;
    double fraction = 0.0;
    std::string message;
    std::optional<std::size_t> chunk_index;
    std::optional<std::size_t> total_chunks;
};

using ProgressSink = std::function<void(const ProgressEvent&)>;

// Non-owning; every pointer must outlive the orchestrator.
struct Collaborators {
    WalletSigner* signer = nullptr;
    PublicKeyDirectory* keys = nullptr;
    LedgerClient* ledger = nullptr;
    StorageProvider* storage = nullptr;
    std::vector<DirectoryClient*> directories;
};

struct UploadRequest {
    std::string owner;
    std::string file_name;
    std::string content_type;
    std::string path = "/";
    std::optional<std::uint32_t> expiration_days;
};

struct UploadResult {
    std::string content_hash;
    std::string plaintext_hash;
    std::string transaction_id;
    std::uint64_t total_size = 0;
    std::size_t chunk_count = 0;
    std::vector<ProviderEndpoint> endpoints;
    FileMetadata metadata;
    FanOutResult manifest;
};

// An upload whose ledger entry exists but whose chunks are not all stored.
struct PendingUpload {
    std::string owner;
    EncryptedObject object;
    std::vector<ManifestEntry> manifest;
    std::string wrapped_key;
    LedgerReceipt receipt;
    FileMetadata metadata;
};

struct DownloadRequest {
    std::string content_hash;
    std::string account;
};

struct DownloadResult {
    Bytes plaintext;
    FileMetadata metadata;
    std::string provider;
    // Providers that failed before the one that served the file.
    std::vector<ProviderAttempt> failed_attempts;
};

class TransferOrchestrator {
public:
    TransferOrchestrator(Session& session, Collaborators collaborators, Config config = Config{});

    // Stages run in order; a failure throws UploadError naming the stage.
    // Throws UploadInProgressError if the session already has an upload running.
    // A forward-only stream is hashed during encryption instead of in a separate pass.
    UploadResult Upload(std::istream& plaintext, const UploadRequest& request, const ProgressSink& progress = {});

    // Pushes every chunk of a failed upload again under its committed content hash and
    // transaction id, then publishes the manifest. The ledger is not called.
    UploadResult ResumeUpload(const std::shared_ptr<const PendingUpload>& pending,
                              const ProgressSink& progress = {});

    // Tries each provider in turn. Throws ProvidersExhaustedError when none yields verified plaintext.
    DownloadResult Download(const DownloadRequest& request, const ProgressSink& progress = {});

    void SetNonceSource(chunk_codec::NonceSource source) { nonce_source_ = std::move(source); }
    const Config& Settings() const noexcept { return config_; }

private:
    UploadResult Publish(const std::shared_ptr<const PendingUpload>& pending, const ProgressSink& progress);
    ResourceRecord QueryRecord(const DownloadRequest& request);
    KeyBundle OpenFileKey(const ResourceRecord& record, const std::string& account);
    Bytes FetchFrom(const ProviderEndpoint& endpoint,
                    const std::string& content_hash,
                    const KeyBundle& bundle,
                    const ProgressSink& progress);
    CallOptions NetworkCall() const { return CallOptions{config_.network_timeout}; }

    Session& session_;
    Collaborators collaborators_;
    Config config_;
    chunk_codec::NonceSource nonce_source_;
};

}  // namespace blobseal
