#include "blobseal/session.hpp"

#include "blobseal/crypto.hpp"
#include "blobseal/keybundle.hpp"
#include "blobseal/log.hpp"

namespace blobseal {

Session::~Session() {
    Clear();
}

Bytes Session::AccountSecret(const std::string& account, WalletSigner& signer, const CallOptions& options) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = secrets_.find(account);
        if (it != secrets_.end()) {
            return it->second;
        }
    }
    log::Debug("deriving account key for " + account);
    std::string signature = CallWithDeadline("wallet signature", options,
                                             [&]() { return signer.SignSessionMessage(account, options); });
    Bytes secret = keybundle::DeriveAccountSecret(signature);
    std::lock_guard<std::mutex> lock(mutex_);
    auto inserted = secrets_.emplace(account, secret);
    if (!inserted.second) {
        crypto::Wipe(secret);
        return inserted.first->second;
    }
    return secret;
}

bool Session::HasCachedSecret(const std::string& account) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return secrets_.count(account) > 0;
}

void Session::Forget(const std::string& account) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = secrets_.find(account);
    if (it != secrets_.end()) {
        crypto::Wipe(it->second);
        secrets_.erase(it);
    }
}

void Session::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& entry : secrets_) {
        crypto::Wipe(entry.second);
    }
    secrets_.clear();
}

bool Session::TryBeginUpload() noexcept {
    bool expected = false;
    return upload_in_flight_.compare_exchange_strong(expected, true);
}

void Session::EndUpload() noexcept {
    upload_in_flight_.store(false);
}

UploadGuard::UploadGuard(Session& session) : session_(session) {
    if (!session_.TryBeginUpload()) {
        throw UploadInProgressError();
    }
}

UploadGuard::~UploadGuard() {
    session_.EndUpload();
}

}  // namespace blobseal
