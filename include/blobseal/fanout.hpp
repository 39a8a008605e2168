#pragma once

#include "blobseal/collaborators.hpp"
#include "blobseal/errors.hpp"
#include "blobseal/log.hpp"

#include <cstddef>
#include <future>
#include <string>
#include <utility>
#include <vector>

namespace blobseal {

struct ReplicaFailure {
    std::string replica;
    std::string error;
};

// Per-replica outcome of a directory write.
struct FanOutResult {
    std::size_t success_count = 0;
    std::size_t failure_count = 0;
    std::vector<std::string> successful;
    std::vector<ReplicaFailure> failed;
};

// Runs fn(replica) against every replica concurrently. Each replica's failure is recorded, not thrown.
template <typename Fn>
FanOutResult FanOut(const std::vector<DirectoryClient*>& replicas, const std::string& what, Fn fn) {
    std::vector<std::future<void>> pending;
    pending.reserve(replicas.size());
    for (DirectoryClient* replica : replicas) {
        pending.push_back(std::async(std::launch::async, [replica, &fn]() { fn(*replica); }));
    }
    FanOutResult result;
    for (std::size_t i = 0; i < replicas.size(); ++i) {
        const std::string id = replicas[i]->Id();
        try {
            pending[i].get();
            result.successful.push_back(id);
            ++result.success_count;
        } catch (const std::exception& exc) {
            std::string error = ErrorKind(exc) + ": " + exc.what();
            log::Warn(what + " failed on replica " + id + ": " + error);
            result.failed.push_back({id, std::move(error)});
            ++result.failure_count;
        }
    }
    return result;
}

}  // namespace blobseal
