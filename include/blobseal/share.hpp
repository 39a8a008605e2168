#pragma once

#include "blobseal/collaborators.hpp"
#include "blobseal/config.hpp"
#include "blobseal/fanout.hpp"
#include "blobseal/session.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace blobseal {

using ShareResult = FanOutResult;

// Joins per-file wrapped keys with "||". Throws ProtocolError if any encoding contains '|'.
std::string JoinCombinedKeys(const std::vector<std::string>& wrapped_keys);
std::vector<std::string> SplitCombinedKeys(const std::string& combined);

// Re-wraps file keys for other accounts and pushes grants to every directory replica.
// Write operations succeed when at least one replica acknowledges; QuorumError when none does.
class ShareProtocol {
public:
    ShareProtocol(Session& session,
                  WalletSigner& signer,
                  PublicKeyDirectory& keys,
                  std::vector<DirectoryClient*> replicas,
                  Config config = Config{});

    // Throws KeyError before any network write when a recipient has no published key.
    ShareResult Share(const std::string& resource_id,
                      const std::string& owner,
                      const std::vector<std::string>& recipients,
                      std::int64_t expires_at);
    ShareResult Revoke(const std::string& resource_id, const std::string& owner, const std::string& account);

    ShareResult ShareDirectory(const std::string& path,
                               const std::string& owner,
                               const std::vector<std::string>& recipients,
                               std::int64_t expires_at);
    ShareResult RevokeDirectory(const std::string& path, const std::string& owner, const std::string& account);

    // First grant any replica returns, in replica order.
    ShareGrant ShareInfo(const std::string& resource_id, const std::string& owner);

private:
    struct FileKey {
        std::string path;
        std::string wrapped_key;
    };

    std::vector<Bytes> ResolveRecipients(const std::vector<std::string>& recipients, std::int64_t expires_at);
    Bytes OwnerSecret(const std::string& owner);
    std::string OwnerWrappedKey(const std::string& resource_id, const std::string& owner);
    void CollectFiles(const std::string& path, const std::string& owner, std::vector<FileKey>& out, int depth);
    ShareResult RequireQuorum(ShareResult result, const std::string& what) const;
    CallOptions NetworkCall() const { return CallOptions{config_.network_timeout}; }

    Session& session_;
    WalletSigner& signer_;
    PublicKeyDirectory& keys_;
    std::vector<DirectoryClient*> replicas_;
    Config config_;
};

}  // namespace blobseal
