#include "blobseal/cli_colors.hpp"

#include <atomic>
#include <cstdio>

#include <unistd.h>

namespace blobseal::cli {

namespace {
    // -1 = auto-detect per stream, 0 = off, 1 = on
    std::atomic<int> g_override{-1};

    bool IsTty(std::ostream& os) {
        if (&os == &std::cout) {
            return isatty(fileno(stdout)) != 0;
        }
        if (&os == &std::cerr || &os == &std::clog) {
            return isatty(fileno(stderr)) != 0;
        }
        return false;
    }
}

bool ColorsEnabled(std::ostream& os) {
    int forced = g_override.load();
    if (forced >= 0) {
        return forced == 1;
    }
    return IsTty(os);
}

void SetColorsEnabled(bool enabled) {
    g_override.store(enabled ? 1 : 0);
}

std::string Colorize(const std::string& text, const char* color, std::ostream& os) {
    if (!ColorsEnabled(os)) {
        return text;
    }
    return std::string(color) + text + color::RESET;
}

}  // namespace blobseal::cli
