#include "blobseal/share.hpp"

#include "blobseal/constants.hpp"
#include "blobseal/crypto.hpp"
#include "blobseal/ec.hpp"
#include "blobseal/errors.hpp"
#include "blobseal/keybundle.hpp"
#include "blobseal/log.hpp"

#include <chrono>
#include <stdexcept>
#include <utility>

namespace blobseal {

namespace {

constexpr int kMaxDirectoryDepth = 32;

std::int64_t NowSeconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch())
        .count();
}

std::string JoinPath(const std::string& parent, const std::string& child) {
    if (child.empty() || child.front() == '/') {
        return child;
    }
    if (parent.empty() || parent.back() == '/') {
        return parent + child;
    }
    return parent + "/" + child;
}

}  // namespace

std::string JoinCombinedKeys(const std::vector<std::string>& wrapped_keys) {
    std::string combined;
    for (std::size_t i = 0; i < wrapped_keys.size(); ++i) {
        const std::string& key = wrapped_keys[i];
        if (key.empty()) {
            throw ProtocolError("Wrapped key " + std::to_string(i) + " is empty");
        }
        if (key.find('|') != std::string::npos) {
            throw ProtocolError("Wrapped key " + std::to_string(i) + " contains the key delimiter");
        }
        if (i > 0) {
            combined += constants::kCombinedKeyDelim;
        }
        combined += key;
    }
    return combined;
}

std::vector<std::string> SplitCombinedKeys(const std::string& combined) {
    std::vector<std::string> keys;
    if (combined.empty()) {
        return keys;
    }
    const std::string delim(constants::kCombinedKeyDelim);
    std::size_t start = 0;
    while (true) {
        std::size_t pos = combined.find(delim, start);
        std::string key = combined.substr(start, pos == std::string::npos ? std::string::npos : pos - start);
        if (key.empty() || key.find('|') != std::string::npos) {
            throw ProtocolError("Malformed combined key list");
        }
        keys.push_back(std::move(key));
        if (pos == std::string::npos) {
            break;
        }
        start = pos + delim.size();
    }
    return keys;
}

ShareProtocol::ShareProtocol(Session& session,
                             WalletSigner& signer,
                             PublicKeyDirectory& keys,
                             std::vector<DirectoryClient*> replicas,
                             Config config)
    : session_(session), signer_(signer), keys_(keys), replicas_(std::move(replicas)), config_(std::move(config)) {
    for (DirectoryClient* replica : replicas_) {
        if (!replica) {
            throw std::invalid_argument("Directory replica list contains a null entry");
        }
    }
}

std::vector<Bytes> ShareProtocol::ResolveRecipients(const std::vector<std::string>& recipients,
                                                    std::int64_t expires_at) {
    if (recipients.empty()) {
        throw std::invalid_argument("At least one recipient is required");
    }
    if (expires_at <= NowSeconds()) {
        throw std::invalid_argument("Share expiration must be in the future");
    }
    if (replicas_.empty()) {
        throw QuorumError("No directory replicas configured");
    }
    std::vector<Bytes> public_keys;
    public_keys.reserve(recipients.size());
    for (const auto& account : recipients) {
        std::optional<Bytes> key = CallWithDeadline("public key lookup for " + account, NetworkCall(),
                                                    [&]() { return keys_.Lookup(account, NetworkCall()); });
        if (!key) {
            throw KeyError("Recipient " + account + " has no published public key");
        }
        ec::ValidatePublicKey(*key);
        public_keys.push_back(std::move(*key));
    }
    return public_keys;
}

Bytes ShareProtocol::OwnerSecret(const std::string& owner) {
    return session_.AccountSecret(owner, signer_, NetworkCall());
}

std::string ShareProtocol::OwnerWrappedKey(const std::string& resource_id, const std::string& owner) {
    std::string errors;
    for (DirectoryClient* replica : replicas_) {
        try {
            std::optional<ResourceRecord> record = CallWithDeadline(
                "directory query on " + replica->Id(), NetworkCall(),
                [&]() { return replica->Query(resource_id, owner, NetworkCall()); });
            if (record && !record->wrapped_key.empty()) {
                return record->wrapped_key;
            }
        } catch (const NetworkError& exc) {
            errors += std::string(errors.empty() ? "" : "; ") + exc.what();
        } catch (const ProtocolError& exc) {
            log::Warn("directory replica " + replica->Id() + " returned a malformed record: " + exc.what());
            errors += std::string(errors.empty() ? "" : "; ") + replica->Id() + ": " + exc.what();
        }
    }
    if (!errors.empty()) {
        throw QuorumError("No directory replica returned the key for " + resource_id + ": " + errors);
    }
    throw KeyError("No wrapped key for " + resource_id + " owned by " + owner);
}

void ShareProtocol::CollectFiles(const std::string& path,
                                 const std::string& owner,
                                 std::vector<FileKey>& out,
                                 int depth) {
    if (depth > kMaxDirectoryDepth) {
        throw ProtocolError("Directory tree under " + path + " is too deep");
    }
    std::optional<std::vector<DirectoryEntry>> entries;
    std::string errors;
    for (DirectoryClient* replica : replicas_) {
        try {
            entries = CallWithDeadline("directory listing on " + replica->Id(), NetworkCall(),
                                       [&]() { return replica->List(path, owner, NetworkCall()); });
            break;
        } catch (const NetworkError& exc) {
            errors += std::string(errors.empty() ? "" : "; ") + exc.what();
        } catch (const ProtocolError& exc) {
            log::Warn("directory replica " + replica->Id() + " returned a malformed listing: " + exc.what());
            errors += std::string(errors.empty() ? "" : "; ") + replica->Id() + ": " + exc.what();
        }
    }
    if (!entries) {
        throw QuorumError("No directory replica listed " + path + ": " + errors);
    }
    for (const auto& entry : *entries) {
        std::string full = JoinPath(path, entry.path);
        if (entry.is_directory) {
            CollectFiles(full, owner, out, depth + 1);
            continue;
        }
        std::string wrapped = entry.wrapped_key;
        if (wrapped.empty()) {
            if (entry.content_hash.empty()) {
                throw ProtocolError("Directory entry " + full + " has neither a key nor a content hash");
            }
            wrapped = OwnerWrappedKey(entry.content_hash, owner);
        }
        out.push_back({full, std::move(wrapped)});
    }
}

ShareResult ShareProtocol::RequireQuorum(ShareResult result, const std::string& what) const {
    if (result.success_count == 0) {
        std::string message = what + " reached none of " + std::to_string(replicas_.size()) + " replica(s)";
        for (const auto& failure : result.failed) {
            message += "; " + failure.replica + ": " + failure.error;
        }
        throw QuorumError(message);
    }
    if (result.failure_count > 0) {
        log::Warn(what + " acknowledged by " + std::to_string(result.success_count) + " of "
                  + std::to_string(replicas_.size()) + " replicas");
    }
    return result;
}

ShareResult ShareProtocol::Share(const std::string& resource_id,
                                 const std::string& owner,
                                 const std::vector<std::string>& recipients,
                                 std::int64_t expires_at) {
    if (resource_id.empty() || owner.empty()) {
        throw std::invalid_argument("Share requires a resource and an owner");
    }
    std::vector<Bytes> public_keys = ResolveRecipients(recipients, expires_at);

    Bytes secret = OwnerSecret(owner);
    KeyBundle bundle;
    try {
        bundle = keybundle::Unwrap(OwnerWrappedKey(resource_id, owner), secret);
    } catch (...) {
        crypto::Wipe(secret);
        throw;
    }
    crypto::Wipe(secret);

    ShareGrant grant;
    grant.resource_id = resource_id;
    grant.owner = owner;
    grant.expires_at = expires_at;
    for (std::size_t i = 0; i < recipients.size(); ++i) {
        grant.recipients.push_back({recipients[i], keybundle::Wrap(bundle, public_keys[i])});
    }

    const CallOptions options = NetworkCall();
    return RequireQuorum(FanOut(replicas_, "share of " + resource_id,
                                [&](DirectoryClient& replica) {
                                    CallWithDeadline("share on " + replica.Id(), options,
                                                     [&]() { replica.Share(grant, options); });
                                }),
                         "share of " + resource_id);
}

ShareResult ShareProtocol::Revoke(const std::string& resource_id, const std::string& owner, const std::string& account) {
    if (resource_id.empty() || owner.empty() || account.empty()) {
        throw std::invalid_argument("Revoke requires a resource, an owner and an account");
    }
    if (replicas_.empty()) {
        throw QuorumError("No directory replicas configured");
    }
    RevokeRequest request;
    request.resource_id = resource_id;
    request.owner = owner;
    request.account = account;
    const CallOptions options = NetworkCall();
    return RequireQuorum(FanOut(replicas_, "revoke of " + resource_id,
                                [&](DirectoryClient& replica) {
                                    CallWithDeadline("revoke on " + replica.Id(), options,
                                                     [&]() { replica.Revoke(request, options); });
                                }),
                         "revoke of " + resource_id);
}

ShareResult ShareProtocol::ShareDirectory(const std::string& path,
                                          const std::string& owner,
                                          const std::vector<std::string>& recipients,
                                          std::int64_t expires_at) {
    if (path.empty() || owner.empty()) {
        throw std::invalid_argument("Directory share requires a path and an owner");
    }
    std::vector<Bytes> public_keys = ResolveRecipients(recipients, expires_at);

    std::vector<FileKey> files;
    CollectFiles(path, owner, files, 0);
    if (files.empty()) {
        throw std::invalid_argument("Directory " + path + " contains no files to share");
    }
    log::Debug("sharing " + std::to_string(files.size()) + " file(s) under " + path);

    Bytes secret = OwnerSecret(owner);
    std::vector<KeyBundle> bundles;
    bundles.reserve(files.size());
    try {
        for (const auto& file : files) {
            bundles.push_back(keybundle::Unwrap(file.wrapped_key, secret));
        }
    } catch (...) {
        crypto::Wipe(secret);
        throw;
    }
    crypto::Wipe(secret);

    ShareGrant grant;
    grant.directory_path = path;
    grant.owner = owner;
    grant.expires_at = expires_at;
    for (std::size_t i = 0; i < recipients.size(); ++i) {
        std::vector<std::string> wrapped;
        wrapped.reserve(bundles.size());
        for (const auto& bundle : bundles) {
            wrapped.push_back(keybundle::Wrap(bundle, public_keys[i]));
        }
        grant.recipients.push_back({recipients[i], JoinCombinedKeys(wrapped)});
    }

    const CallOptions options = NetworkCall();
    return RequireQuorum(FanOut(replicas_, "directory share of " + path,
                                [&](DirectoryClient& replica) {
                                    CallWithDeadline("directory share on " + replica.Id(), options,
                                                     [&]() { replica.Share(grant, options); });
                                }),
                         "directory share of " + path);
}

ShareResult ShareProtocol::RevokeDirectory(const std::string& path,
                                           const std::string& owner,
                                           const std::string& account) {
    if (path.empty() || owner.empty() || account.empty()) {
        throw std::invalid_argument("Directory revoke requires a path, an owner and an account");
    }
    if (replicas_.empty()) {
        throw QuorumError("No directory replicas configured");
    }
    RevokeRequest request;
    request.directory_path = path;
    request.owner = owner;
    request.account = account;
    const CallOptions options = NetworkCall();
    return RequireQuorum(FanOut(replicas_, "directory revoke of " + path,
                                [&](DirectoryClient& replica) {
                                    CallWithDeadline("directory revoke on " + replica.Id(), options,
                                                     [&]() { replica.Revoke(request, options); });
                                }),
                         "directory revoke of " + path);
}

ShareGrant ShareProtocol::ShareInfo(const std::string& resource_id, const std::string& owner) {
    if (replicas_.empty()) {
        throw QuorumError("No directory replicas configured");
    }
    std::string errors;
    for (DirectoryClient* replica : replicas_) {
        try {
            std::optional<ShareGrant> grant = CallWithDeadline(
                "share query on " + replica->Id(), NetworkCall(),
                [&]() { return replica->QueryShare(resource_id, owner, NetworkCall()); });
            if (grant) {
                return std::move(*grant);
            }
            errors += std::string(errors.empty() ? "" : "; ") + replica->Id() + ": not found";
        } catch (const Error& exc) {
            log::Warn("share query failed on replica " + replica->Id() + ": " + exc.what());
            errors += std::string(errors.empty() ? "" : "; ") + replica->Id() + ": " + exc.what();
        }
    }
    throw QuorumError("No replica returned share info for " + resource_id + ": " + errors);
}

}  // namespace blobseal
