#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace blobseal {

struct PendingUpload;

class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message) : std::runtime_error(message) {}
};

// Timeout or connection failure talking to a collaborator.
class NetworkError : public Error {
public:
    explicit NetworkError(const std::string& message) : Error(message) {}
};

// Authentication tag failure or content hash mismatch.
class IntegrityError : public Error {
public:
    explicit IntegrityError(const std::string& message) : Error(message) {}
};

// Malformed or unwrappable key material, or a recipient without a published key.
class KeyError : public Error {
public:
    explicit KeyError(const std::string& message) : Error(message) {}
};

// Malformed frame, multi-part stream or manifest.
class ProtocolError : public Error {
public:
    explicit ProtocolError(const std::string& message) : Error(message) {}
};

// A replica fan-out where no replica acknowledged.
class QuorumError : public Error {
public:
    explicit QuorumError(const std::string& message) : Error(message) {}
};

class UploadInProgressError : public Error {
public:
    UploadInProgressError() : Error("Another upload is already in progress") {}
};

class UploadError : public Error {
public:
    UploadError(std::string stage,
                std::string cause_kind,
                const std::string& cause,
                std::shared_ptr<const PendingUpload> pending = nullptr)
        : Error("Upload failed at stage '" + stage + "': " + cause_kind + ": " + cause),
          stage_(std::move(stage)),
          cause_kind_(std::move(cause_kind)),
          pending_(std::move(pending)) {}

    const std::string& Stage() const noexcept { return stage_; }
    const std::string& CauseKind() const noexcept { return cause_kind_; }
    // Set once the ledger entry exists; hand it to TransferOrchestrator::ResumeUpload.
    const std::shared_ptr<const PendingUpload>& Pending() const noexcept { return pending_; }

private:
    std::string stage_;
    std::string cause_kind_;
    std::shared_ptr<const PendingUpload> pending_;
};

struct ProviderAttempt {
    std::string provider;
    std::string kind;
    std::string message;
};

class ProvidersExhaustedError : public Error {
public:
    explicit ProvidersExhaustedError(std::vector<ProviderAttempt> attempts);

    const std::vector<ProviderAttempt>& Attempts() const noexcept { return attempts_; }
    // Kind of the last provider's failure ("NetworkError", "IntegrityError", ...).
    std::string LastKind() const;

private:
    std::vector<ProviderAttempt> attempts_;
};

// Name of the taxonomy class an exception belongs to, for aggregate reports.
std::string ErrorKind(const std::exception& exc);

}  // namespace blobseal
