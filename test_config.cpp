#include "blobseal/cli_colors.hpp"
#include "blobseal/config.hpp"
#include "blobseal/env.hpp"
#include "blobseal/log.hpp"

#include "test_support.hpp"

#include <cstdlib>
#include <sstream>
#include <string>

using namespace blobseal_test;

namespace {

const char* const kVariables[] = {"BLOBSEAL_BLOCK_SIZE",        "BLOBSEAL_READ_SIZE",
                                  "BLOBSEAL_NETWORK_TIMEOUT_MS", "BLOBSEAL_DOWNLOAD_TIMEOUT_MS",
                                  "BLOBSEAL_UPLOAD_TIMEOUT_MS",  "BLOBSEAL_EXPIRATION_DAYS",
                                  "BLOBSEAL_LOG_LEVEL",          "BLOBSEAL_TEST_FLAG"};

void ClearEnvironment() {
    for (const char* name : kVariables) {
        unsetenv(name);
    }
}

}  // namespace

int main() {
    Run("defaults", []() {
        ClearEnvironment();
        blobseal::Config config = blobseal::Config::FromEnvironment();
        CheckEq(config.block_size, std::size_t{32u * 1024u * 1024u}, "32 MiB blocks");
        CheckEq(config.read_size, std::size_t{64u * 1024u}, "64 KiB reads");
        CheckEq(config.network_timeout.count(), 15000, "network timeout");
        CheckEq(config.download_timeout.count(), 60000, "download timeout");
        CheckEq(config.upload_timeout.count(), 60000, "upload timeout");
        CheckEq(config.expiration_days, 30u, "share expiry");
        Check(config.log_level == blobseal::log::Level::Warn, "warn level");
    });

    Run("environment overrides", []() {
        ClearEnvironment();
        setenv("BLOBSEAL_BLOCK_SIZE", "4096", 1);
        setenv("BLOBSEAL_READ_SIZE", "512", 1);
        setenv("BLOBSEAL_NETWORK_TIMEOUT_MS", "250", 1);
        setenv("BLOBSEAL_DOWNLOAD_TIMEOUT_MS", "1000", 1);
        setenv("BLOBSEAL_UPLOAD_TIMEOUT_MS", "2000", 1);
        setenv("BLOBSEAL_EXPIRATION_DAYS", "7", 1);
        setenv("BLOBSEAL_LOG_LEVEL", "Debug", 1);
        blobseal::Config config = blobseal::Config::FromEnvironment();
        CheckEq(config.block_size, std::size_t{4096}, "block size");
        CheckEq(config.read_size, std::size_t{512}, "read size");
        CheckEq(config.network_timeout.count(), 250, "network timeout");
        CheckEq(config.download_timeout.count(), 1000, "download timeout");
        CheckEq(config.upload_timeout.count(), 2000, "upload timeout");
        CheckEq(config.expiration_days, 7u, "expiry days");
        Check(config.log_level == blobseal::log::Level::Debug, "level name is case-insensitive");
        ClearEnvironment();
    });

    Run("invalid values keep defaults", []() {
        ClearEnvironment();
        setenv("BLOBSEAL_BLOCK_SIZE", "0", 1);
        setenv("BLOBSEAL_READ_SIZE", "-5", 1);
        setenv("BLOBSEAL_NETWORK_TIMEOUT_MS", "fast", 1);
        setenv("BLOBSEAL_DOWNLOAD_TIMEOUT_MS", "99999999999999999999999", 1);
        setenv("BLOBSEAL_UPLOAD_TIMEOUT_MS", "4294967296", 1);
        setenv("BLOBSEAL_EXPIRATION_DAYS", "100000", 1);
        setenv("BLOBSEAL_LOG_LEVEL", "chatty", 1);
        blobseal::Config config = blobseal::Config::FromEnvironment();
        CheckEq(config.block_size, std::size_t{32u * 1024u * 1024u}, "zero block size");
        CheckEq(config.read_size, std::size_t{64u * 1024u}, "negative read size");
        CheckEq(config.network_timeout.count(), 15000, "non-numeric timeout");
        CheckEq(config.download_timeout.count(), 60000, "overflowing timeout");
        CheckEq(config.upload_timeout.count(), 60000, "timeout beyond int32");
        CheckEq(config.expiration_days, 30u, "expiry beyond a century");
        Check(config.log_level == blobseal::log::Level::Warn, "unknown level name");

        setenv("BLOBSEAL_BLOCK_SIZE", "99999972", 1);
        CheckEq(blobseal::Config::FromEnvironment().block_size, std::size_t{32u * 1024u * 1024u},
                "block whose frame length needs nine digits");
        setenv("BLOBSEAL_BLOCK_SIZE", "99999971", 1);
        CheckEq(blobseal::Config::FromEnvironment().block_size, std::size_t{99999971}, "largest block");
        ClearEnvironment();
    });

    Run("env flags", []() {
        ClearEnvironment();
        Check(!blobseal::env::IsEnabled("BLOBSEAL_TEST_FLAG"), "unset is off");
        Check(blobseal::env::IsEnabled("BLOBSEAL_TEST_FLAG", true), "unset uses default");
        setenv("BLOBSEAL_TEST_FLAG", "YES", 1);
        Check(blobseal::env::IsEnabled("BLOBSEAL_TEST_FLAG"), "yes");
        setenv("BLOBSEAL_TEST_FLAG", "0", 1);
        Check(!blobseal::env::IsEnabled("BLOBSEAL_TEST_FLAG", true), "zero");
        ClearEnvironment();
    });

    Run("log levels", []() {
        using blobseal::log::Level;
        Check(blobseal::log::ParseLevel("warning") == Level::Warn, "warning alias");
        Check(blobseal::log::ParseLevel("NONE") == Level::Off, "none alias");
        Check(blobseal::log::ParseLevel("", Level::Info) == Level::Info, "empty name");
        CheckEq(std::string(blobseal::log::LevelName(Level::Error)), std::string("ERROR"), "level name");
    });

    Run("log output", []() {
        blobseal::cli::SetColorsEnabled(false);
        std::ostringstream out;
        blobseal::log::SetStream(&out);
        blobseal::log::SetLevel(blobseal::log::Level::Info);
        blobseal::log::Debug("hidden");
        blobseal::log::Info("chunk 3 pushed");
        blobseal::log::Error("ledger unreachable");
        blobseal::log::SetLevel(blobseal::log::Level::Off);
        blobseal::log::Error("silenced");
        blobseal::log::SetStream(nullptr);

        CheckEq(out.str(), std::string("[blobseal] INFO: chunk 3 pushed\n[blobseal] ERROR: ledger unreachable\n"),
                "prefix and level filter");
        Check(!blobseal::log::Enabled(blobseal::log::Level::Error), "off disables every level");
    });

    return Summary("test_config");
}
