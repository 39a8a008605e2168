#include "blobseal/errors.hpp"

namespace blobseal {

namespace {

std::string DescribeAttempts(const std::vector<ProviderAttempt>& attempts) {
    std::string message = "All providers exhausted after " + std::to_string(attempts.size()) + " attempt(s)";
    for (const auto& attempt : attempts) {
        message += "; " + attempt.provider + ": " + attempt.kind + ": " + attempt.message;
    }
    if (!attempts.empty()) {
        message += "; last error: " + attempts.back().message;
    }
    return message;
}

}  // namespace

ProvidersExhaustedError::ProvidersExhaustedError(std::vector<ProviderAttempt> attempts)
    : Error(DescribeAttempts(attempts)), attempts_(std::move(attempts)) {}

std::string ProvidersExhaustedError::LastKind() const {
    if (attempts_.empty()) {
        return {};
    }
    return attempts_.back().kind;
}

std::string ErrorKind(const std::exception& exc) {
    if (dynamic_cast<const NetworkError*>(&exc)) {
        return "NetworkError";
    }
    if (dynamic_cast<const IntegrityError*>(&exc)) {
        return "IntegrityError";
    }
    if (dynamic_cast<const KeyError*>(&exc)) {
        return "KeyError";
    }
    if (dynamic_cast<const ProtocolError*>(&exc)) {
        return "ProtocolError";
    }
    if (dynamic_cast<const QuorumError*>(&exc)) {
        return "QuorumError";
    }
    if (dynamic_cast<const UploadInProgressError*>(&exc)) {
        return "UploadInProgressError";
    }
    if (dynamic_cast<const ProvidersExhaustedError*>(&exc)) {
        return "ProvidersExhaustedError";
    }
    if (dynamic_cast<const UploadError*>(&exc)) {
        return "UploadError";
    }
    return "Error";
}

}  // namespace blobseal
