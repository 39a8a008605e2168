#include "blobseal/config.hpp"

#include "blobseal/env.hpp"

#include <limits>

namespace blobseal {

namespace {

constexpr std::uint64_t kMaxBlockSize =
    constants::kFrameMaxBody - constants::kAeadNonceLen - constants::kAeadTagLen;
constexpr std::uint64_t kMaxReadSize = 64u * 1024u * 1024u;

std::uint64_t Bounded(std::uint64_t value, std::uint64_t max_value, std::uint64_t default_value) {
    return value > max_value ? default_value : value;
}

std::chrono::milliseconds Millis(const char* name, std::chrono::milliseconds default_value) {
    std::uint64_t raw = env::GetUnsigned(name, static_cast<std::uint64_t>(default_value.count()));
    raw = Bounded(raw, static_cast<std::uint64_t>(std::numeric_limits<std::int32_t>::max()),
                  static_cast<std::uint64_t>(default_value.count()));
    return std::chrono::milliseconds(static_cast<std::int64_t>(raw));
}

}  // namespace

Config Config::FromEnvironment() {
    Config config;
    config.block_size = static_cast<std::size_t>(
        Bounded(env::GetUnsigned("BLOBSEAL_BLOCK_SIZE", config.block_size), kMaxBlockSize, config.block_size));
    config.read_size = static_cast<std::size_t>(
        Bounded(env::GetUnsigned("BLOBSEAL_READ_SIZE", config.read_size), kMaxReadSize, config.read_size));
    config.network_timeout = Millis("BLOBSEAL_NETWORK_TIMEOUT_MS", config.network_timeout);
    config.download_timeout = Millis("BLOBSEAL_DOWNLOAD_TIMEOUT_MS", config.download_timeout);
    config.upload_timeout = Millis("BLOBSEAL_UPLOAD_TIMEOUT_MS", config.upload_timeout);
    config.expiration_days = static_cast<std::uint32_t>(
        Bounded(env::GetUnsigned("BLOBSEAL_EXPIRATION_DAYS", config.expiration_days), constants::kMaxExpirationDays,
                config.expiration_days));
    config.log_level = log::ParseLevel(env::Get("BLOBSEAL_LOG_LEVEL"), config.log_level);
    return config;
}

}  // namespace blobseal
