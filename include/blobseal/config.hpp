#pragma once

#include "blobseal/constants.hpp"
#include "blobseal/log.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace blobseal {

struct Config {
    std::size_t block_size = constants::kDefaultBlockSize;
    std::size_t read_size = constants::kDefaultReadSize;
    std::chrono::milliseconds network_timeout{15000};
    std::chrono::milliseconds download_timeout{60000};
    std::chrono::milliseconds upload_timeout{60000};
    std::uint32_t expiration_days = 30;
    log::Level log_level = log::Level::Warn;

    // BLOBSEAL_* variables; unparsable, zero or out-of-range values keep the default.
    static Config FromEnvironment();
};

}  // namespace blobseal
