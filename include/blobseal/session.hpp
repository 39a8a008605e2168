#pragma once

#include "blobseal/collaborators.hpp"

#include <atomic>
#include <map>
#include <mutex>
#include <string>

namespace blobseal {

// Per-user context: derived account secrets and the single in-flight upload slot.
class Session {
public:
    Session() = default;
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // Cached secret, or derived from the wallet's session signature on first use.
    Bytes AccountSecret(const std::string& account, WalletSigner& signer, const CallOptions& options);
    bool HasCachedSecret(const std::string& account) const;
    void Forget(const std::string& account);
    // Logout: wipes every cached secret.
    void Clear();

    bool TryBeginUpload() noexcept;
    void EndUpload() noexcept;
    bool UploadInFlight() const noexcept { return upload_in_flight_.load(); }

private:
    mutable std::mutex mutex_;
    std::map<std::string, Bytes> secrets_;
    std::atomic<bool> upload_in_flight_{false};
};

// Holds the session's upload slot for its lifetime. Throws UploadInProgressError when taken.
class UploadGuard {
public:
    explicit UploadGuard(Session& session);
    ~UploadGuard();

    UploadGuard(const UploadGuard&) = delete;
    UploadGuard& operator=(const UploadGuard&) = delete;

private:
    Session& session_;
};

}  // namespace blobseal
