#include "blobseal/transfer.hpp"

#include "blobseal/crypto.hpp"
#include "blobseal/errors.hpp"
#include "blobseal/keybundle.hpp"
#include "blobseal/log.hpp"
#include "blobseal/stream_decoder.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <utility>

namespace blobseal {

namespace {

constexpr const char* kUpload = "upload";
constexpr const char* kDownload = "download";

constexpr std::size_t kUploadStages = 8;

void Emit(const ProgressSink& progress, ProgressEvent event) {
    if (progress) {
        progress(event);
    }
}

void EmitStage(const ProgressSink& progress,
               const char* operation,
               const std::string& stage,
               double fraction,
               std::string message) {
    log::Debug(std::string(operation) + ": " + stage);
    ProgressEvent event;
    event.operation = operation;
    event.stage = stage;
    event.fraction = fraction;
    event.message = std::move(message);
    Emit(progress, std::move(event));
}

double UploadFraction(std::size_t stage) {
    return static_cast<double>(stage) / kUploadStages;
}

// Runs one upload stage, rewrapping any failure as UploadError for that stage.
template <typename Fn>
auto RunStage(const std::string& stage, Fn&& fn, std::shared_ptr<const PendingUpload> pending = nullptr)
    -> decltype(fn()) {
    try {
        return fn();
    } catch (const UploadError&) {
        throw;
    } catch (const std::exception& exc) {
        throw UploadError(stage, ErrorKind(exc), exc.what(), std::move(pending));
    }
}

std::string Lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return text;
}

bool IsContentHash(const std::string& hash) {
    return hash.size() == constants::kHashLen * 2
           && std::all_of(hash.begin(), hash.end(), [](unsigned char ch) { return std::isxdigit(ch) != 0; });
}

std::int64_t ExpiresAt(std::uint32_t days) {
    auto now = std::chrono::system_clock::now();
    auto expires = now + std::chrono::hours(24) * static_cast<std::int64_t>(days);
    return std::chrono::duration_cast<std::chrono::seconds>(expires.time_since_epoch()).count();
}

}  // namespace

TransferOrchestrator::TransferOrchestrator(Session& session, Collaborators collaborators, Config config)
    : session_(session), collaborators_(std::move(collaborators)), config_(std::move(config)) {
    if (!collaborators_.signer || !collaborators_.ledger || !collaborators_.storage) {
        throw std::invalid_argument("TransferOrchestrator requires a signer, a ledger and a storage provider");
    }
    if (std::any_of(collaborators_.directories.begin(), collaborators_.directories.end(),
                    [](DirectoryClient* replica) { return replica == nullptr; })) {
        throw std::invalid_argument("Directory replica list contains a null entry");
    }
}

UploadResult TransferOrchestrator::Upload(std::istream& plaintext,
                                          const UploadRequest& request,
                                          const ProgressSink& progress) {
    if (request.owner.empty()) {
        throw std::invalid_argument("Upload owner is required");
    }
    if (!plaintext) {
        throw std::invalid_argument("Plaintext stream is not readable");
    }
    UploadGuard guard(session_);

    EmitStage(progress, kUpload, "hash-plaintext", UploadFraction(0), "Hashing file");
    std::optional<std::string> plaintext_hash = RunStage("hash-plaintext", [&]() -> std::optional<std::string> {
        std::istream::pos_type start = plaintext.tellg();
        if (start == std::istream::pos_type(-1)) {
            log::Debug("plaintext stream is not seekable; hashing during encryption");
            return std::nullopt;
        }
        std::string hash = chunk_codec::PlaintextHash(plaintext, config_.read_size);
        plaintext.clear();
        plaintext.seekg(start);
        if (!plaintext) {
            throw std::runtime_error("Failed to rewind plaintext stream");
        }
        return hash;
    });

    EmitStage(progress, kUpload, "generate-key", UploadFraction(1), "Generating file key");
    KeyBundle bundle = RunStage("generate-key", []() { return keybundle::Generate(); });

    EmitStage(progress, kUpload, "encrypt", UploadFraction(2), "Encrypting chunks");
    EncryptedObject object = RunStage("encrypt", [&]() {
        chunk_codec::EncodeOptions options;
        options.block_size = config_.block_size;
        options.nonce_source = nonce_source_;
        EncryptedObject encoded = chunk_codec::Encode(plaintext, bundle, options);
        if (plaintext_hash && encoded.plaintext_hash != *plaintext_hash) {
            throw IntegrityError("Plaintext changed between hashing and encryption");
        }
        return encoded;
    });

    EmitStage(progress, kUpload, "hash-chunks", UploadFraction(3), "Computing content address");
    std::vector<ManifestEntry> manifest = RunStage("hash-chunks", [&]() {
        for (const auto& chunk : object.chunks) {
            if (chunk_codec::ChunkHash(chunk.frame) != chunk.hash) {
                throw IntegrityError("Chunk " + std::to_string(chunk.index) + " hash mismatch");
            }
        }
        object.combined_hash = chunk_codec::CombinedHash(object.chunks);
        return chunk_codec::Manifest(object);
    });

    EmitStage(progress, kUpload, "wrap-key", UploadFraction(4), "Wrapping file key");
    std::string wrapped_key = RunStage("wrap-key", [&]() {
        Bytes secret = session_.AccountSecret(request.owner, *collaborators_.signer, NetworkCall());
        Bytes public_key = keybundle::PublicKeyFromSecret(secret);
        crypto::Wipe(secret);
        return keybundle::Wrap(bundle, public_key);
    });

    EmitStage(progress, kUpload, "ledger-submit", UploadFraction(5), "Submitting to ledger");
    FileMetadata file_metadata;
    LedgerReceipt receipt = RunStage("ledger-submit", [&]() {
        std::uint32_t days = request.expiration_days.value_or(config_.expiration_days);
        if (days == 0 || days > constants::kMaxExpirationDays) {
            throw std::invalid_argument("Expiration must be between 1 and "
                                        + std::to_string(constants::kMaxExpirationDays) + " days");
        }
        LedgerSubmission submission;
        submission.owner = request.owner;
        submission.combined_hash = object.combined_hash;
        submission.total_size = object.total_size;
        submission.expires_at = ExpiresAt(days);
        submission.wrapped_key = wrapped_key;
        submission.manifest = manifest;
        submission.metadata = metadata::Describe(request.file_name, request.content_type, object.plaintext_hash,
                                                 request.path, metadata::NowMillis());
        file_metadata = submission.metadata;
        LedgerReceipt submitted = CallWithDeadline("ledger submit", NetworkCall(), [&]() {
            return collaborators_.ledger->Submit(submission, NetworkCall());
        });
        if (submitted.endpoints.empty()) {
            throw ProtocolError("Ledger assigned no storage providers");
        }
        if (submitted.endpoints.front().address.empty()) {
            throw ProtocolError("Primary storage provider has no address");
        }
        return submitted;
    });

    auto pending = std::make_shared<PendingUpload>();
    pending->owner = request.owner;
    pending->object = std::move(object);
    pending->manifest = std::move(manifest);
    pending->wrapped_key = std::move(wrapped_key);
    pending->receipt = std::move(receipt);
    pending->metadata = std::move(file_metadata);
    return Publish(pending, progress);
}

UploadResult TransferOrchestrator::ResumeUpload(const std::shared_ptr<const PendingUpload>& pending,
                                                const ProgressSink& progress) {
    if (!pending) {
        throw std::invalid_argument("No pending upload to resume");
    }
    UploadGuard guard(session_);
    log::Info("resuming upload of " + pending->object.combined_hash + " (" + pending->receipt.transaction_id + ")");
    return Publish(pending, progress);
}

UploadResult TransferOrchestrator::Publish(const std::shared_ptr<const PendingUpload>& pending,
                                           const ProgressSink& progress) {
    const EncryptedObject& object = pending->object;
    const LedgerReceipt& receipt = pending->receipt;
    const std::size_t total_chunks = object.chunks.size();

    EmitStage(progress, kUpload, "push-chunks", UploadFraction(6), "Uploading chunks");
    RunStage(
        "push-chunks",
        [&]() {
            const ProviderEndpoint& primary = receipt.endpoints.front();
            const CallOptions push_options{config_.upload_timeout};
            for (const auto& chunk : object.chunks) {
                ChunkPush push;
                push.transaction_id = receipt.transaction_id;
                push.content_hash = object.combined_hash;
                push.owner = pending->owner;
                push.index = chunk.index;
                push.total_chunks = total_chunks;
                push.chunk_hash = chunk.hash;
                CallWithDeadline("push chunk " + std::to_string(chunk.index) + " to " + primary.id, push_options,
                                 [&]() { collaborators_.storage->PushChunk(primary, push, chunk.frame, push_options); });
                ProgressEvent event;
                event.operation = kUpload;
                event.stage = "push-chunks";
                event.fraction =
                    UploadFraction(6) + (static_cast<double>(chunk.index + 1) / total_chunks) / kUploadStages;
                event.message =
                    "Uploaded chunk " + std::to_string(chunk.index + 1) + " of " + std::to_string(total_chunks);
                event.chunk_index = chunk.index;
                event.total_chunks = total_chunks;
                Emit(progress, std::move(event));
            }
        },
        pending);

    EmitStage(progress, kUpload, "submit-manifest", UploadFraction(7), "Publishing manifest");
    ManifestSubmission submission;
    submission.transaction_id = receipt.transaction_id;
    submission.content_hash = object.combined_hash;
    submission.owner = pending->owner;
    submission.wrapped_key = pending->wrapped_key;
    submission.manifest = pending->manifest;
    submission.endpoints = receipt.endpoints;
    submission.metadata = pending->metadata;
    const CallOptions options = NetworkCall();

    UploadResult result;
    result.manifest = FanOut(collaborators_.directories, "manifest submit", [&](DirectoryClient& replica) {
        CallWithDeadline("manifest submit to " + replica.Id(), options,
                         [&]() { replica.SubmitManifest(submission, options); });
    });
    if (result.manifest.success_count == 0) {
        log::Warn("manifest for " + object.combined_hash + " reached no directory replica; chunks are stored");
    }

    result.content_hash = object.combined_hash;
    result.plaintext_hash = object.plaintext_hash;
    result.transaction_id = receipt.transaction_id;
    result.total_size = object.total_size;
    result.chunk_count = total_chunks;
    result.endpoints = receipt.endpoints;
    result.metadata = pending->metadata;
    EmitStage(progress, kUpload, "done", 1.0, "Upload complete");
    return result;
}

ResourceRecord TransferOrchestrator::QueryRecord(const DownloadRequest& request) {
    std::string errors;
    bool unreachable = false;
    for (DirectoryClient* replica : collaborators_.directories) {
        try {
            std::optional<ResourceRecord> record = CallWithDeadline(
                "directory query on " + replica->Id(), NetworkCall(),
                [&]() { return replica->Query(request.content_hash, request.account, NetworkCall()); });
            if (record) {
                return std::move(*record);
            }
        } catch (const NetworkError& exc) {
            log::Warn(std::string("directory query failed: ") + exc.what());
            errors += std::string(errors.empty() ? "" : "; ") + exc.what();
            unreachable = true;
        } catch (const ProtocolError& exc) {
            log::Warn("directory replica " + replica->Id() + " returned a malformed record: " + exc.what());
            errors += std::string(errors.empty() ? "" : "; ") + replica->Id() + ": " + exc.what();
        }
    }
    if (unreachable) {
        throw NetworkError("No directory replica returned " + request.content_hash + ": " + errors);
    }
    if (!errors.empty()) {
        throw ProtocolError("No directory replica returned a usable record for " + request.content_hash + ": "
                            + errors);
    }
    throw ProtocolError("Resource " + request.content_hash + " is not known to any directory replica");
}

KeyBundle TransferOrchestrator::OpenFileKey(const ResourceRecord& record, const std::string& account) {
    Bytes secret = session_.AccountSecret(account, *collaborators_.signer, NetworkCall());
    try {
        if (collaborators_.keys) {
            std::optional<Bytes> published = CallWithDeadline(
                "public key lookup", NetworkCall(), [&]() { return collaborators_.keys->Lookup(account, NetworkCall()); });
            if (!published) {
                throw KeyError("Account " + account + " has no published public key");
            }
            keybundle::VerifyAccountKey(secret, *published);
        }
        KeyBundle bundle = keybundle::Unwrap(record.wrapped_key, secret);
        crypto::Wipe(secret);
        return bundle;
    } catch (const KeyError&) {
        crypto::Wipe(secret);
        session_.Forget(account);
        throw;
    }
}

Bytes TransferOrchestrator::FetchFrom(const ProviderEndpoint& endpoint,
                                      const std::string& content_hash,
                                      const KeyBundle& bundle,
                                      const ProgressSink& progress) {
    const CallOptions options{config_.download_timeout};
    const auto start = std::chrono::steady_clock::now();
    const std::string what = "fetch from " + endpoint.id;
    std::unique_ptr<ObjectStream> stream =
        CallWithDeadline(what, options, [&]() { return collaborators_.storage->Fetch(endpoint, content_hash, options); });
    if (!stream) {
        throw NetworkError(what + " returned no stream");
    }

    StreamDecoder decoder(stream->ContentType(), stream->TotalChunks());
    std::vector<Part> parts;
    std::vector<std::uint8_t> buffer(config_.read_size);
    auto collect = [&](std::vector<Part> completed) {
        for (auto& part : completed) {
            ProgressEvent event;
            event.operation = kDownload;
            event.stage = "fetch";
            event.chunk_index = part.index;
            event.total_chunks = decoder.TotalChunks();
            if (event.total_chunks && *event.total_chunks > 0) {
                event.fraction = static_cast<double>(parts.size() + 1) / static_cast<double>(*event.total_chunks);
            }
            event.message = "Received chunk " + std::to_string(part.index) + " from " + endpoint.id;
            Emit(progress, std::move(event));
            parts.push_back(std::move(part));
        }
    };
    while (true) {
        std::size_t got = CallWithDeadline(what, options, [&]() { return stream->Read(buffer.data(), buffer.size()); });
        if (std::chrono::steady_clock::now() - start > options.timeout) {
            throw NetworkError(what + " timed out after " + std::to_string(options.timeout.count()) + " ms");
        }
        if (got == 0) {
            break;
        }
        collect(decoder.Feed(buffer.data(), got));
    }
    collect(decoder.Finish());

    std::size_t total = decoder.TotalChunks().value_or(parts.size());
    if (!decoder.TotalChunks()) {
        log::Debug(endpoint.id + " reported no chunk count; assuming " + std::to_string(total));
    }
    std::vector<Part> ordered = StreamDecoder::Reassemble(std::move(parts), total);

    EmitStage(progress, kDownload, "verify", 0.9, "Verifying content address");
    std::vector<Bytes> frames;
    frames.reserve(ordered.size());
    for (auto& part : ordered) {
        frames.push_back(std::move(part.body));
    }
    std::string combined = chunk_codec::CombinedHash(frames);
    if (combined != Lower(content_hash)) {
        throw IntegrityError("Content from " + endpoint.id + " hashes to " + combined + ", expected " + content_hash);
    }

    EmitStage(progress, kDownload, "decrypt", 0.95, "Decrypting");
    Bytes plaintext;
    try {
        for (const auto& frame : frames) {
            Bytes piece = chunk_codec::DecodeFrames(frame, bundle);
            crypto::detail::AppendBytes(plaintext, piece);
            crypto::Wipe(piece);
        }
    } catch (...) {
        crypto::Wipe(plaintext);
        throw;
    }
    return plaintext;
}

DownloadResult TransferOrchestrator::Download(const DownloadRequest& request, const ProgressSink& progress) {
    if (!IsContentHash(request.content_hash)) {
        throw std::invalid_argument("Content hash must be 64 hex characters");
    }
    if (request.account.empty()) {
        throw std::invalid_argument("Download account is required");
    }
    if (collaborators_.directories.empty()) {
        throw std::invalid_argument("Download requires at least one directory replica");
    }

    EmitStage(progress, kDownload, "query", 0.0, "Looking up " + request.content_hash);
    ResourceRecord record = QueryRecord(request);

    EmitStage(progress, kDownload, "unwrap", 0.05, "Opening file key");
    KeyBundle bundle = OpenFileKey(record, request.account);

    DownloadResult result;
    result.metadata = record.metadata;
    for (const auto& endpoint : record.endpoints) {
        if (endpoint.address.empty()) {
            result.failed_attempts.push_back({endpoint.id, "ProtocolError", "Provider has no address"});
            log::Warn("skipping provider " + endpoint.id + " with no address");
            continue;
        }
        EmitStage(progress, kDownload, "fetch", 0.1, "Fetching from " + endpoint.id);
        try {
            Bytes plaintext = FetchFrom(endpoint, request.content_hash, bundle, progress);
            const std::string& expected = record.metadata.original_file_hash;
            if (!expected.empty() && crypto::Sha256Hex(plaintext) != Lower(expected)) {
                crypto::Wipe(plaintext);
                throw IntegrityError("Plaintext from " + endpoint.id + " does not match original_file_hash");
            }
            result.plaintext = std::move(plaintext);
            result.provider = endpoint.id;
            EmitStage(progress, kDownload, "done", 1.0, "Download complete");
            return result;
        } catch (const NetworkError& exc) {
            result.failed_attempts.push_back({endpoint.id, ErrorKind(exc), exc.what()});
        } catch (const ProtocolError& exc) {
            result.failed_attempts.push_back({endpoint.id, ErrorKind(exc), exc.what()});
        } catch (const IntegrityError& exc) {
            result.failed_attempts.push_back({endpoint.id, ErrorKind(exc), exc.what()});
        }
        log::Warn("provider " + endpoint.id + " failed (" + result.failed_attempts.back().kind + ": "
                  + result.failed_attempts.back().message + "); trying next provider");
    }
    throw ProvidersExhaustedError(std::move(result.failed_attempts));
}

}  // namespace blobseal
