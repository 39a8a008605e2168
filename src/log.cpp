#include "blobseal/log.hpp"

#include "blobseal/cli_colors.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>

namespace blobseal::log {

namespace {

std::atomic<int> g_level{static_cast<int>(Level::Warn)};
std::atomic<std::ostream*> g_stream{nullptr};
std::mutex g_write_mutex;

const char* LevelColor(Level level) {
    switch (level) {
        case Level::Debug:
            return cli::color::BRIGHT_BLACK;
        case Level::Info:
            return cli::color::CYAN;
        case Level::Warn:
            return cli::color::YELLOW;
        case Level::Error:
            return cli::color::BOLD_RED;
        case Level::Off:
            break;
    }
    return cli::color::RESET;
}

}  // namespace

Level ParseLevel(std::string_view name, Level default_level) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    if (lowered == "debug") return Level::Debug;
    if (lowered == "info") return Level::Info;
    if (lowered == "warn" || lowered == "warning") return Level::Warn;
    if (lowered == "error") return Level::Error;
    if (lowered == "off" || lowered == "none") return Level::Off;
    return default_level;
}

std::string_view LevelName(Level level) {
    switch (level) {
        case Level::Debug:
            return "DEBUG";
        case Level::Info:
            return "INFO";
        case Level::Warn:
            return "WARN";
        case Level::Error:
            return "ERROR";
        case Level::Off:
            return "OFF";
    }
    return "UNKNOWN";
}

void SetLevel(Level level) {
    g_level.store(static_cast<int>(level));
}

Level GetLevel() {
    return static_cast<Level>(g_level.load());
}

bool Enabled(Level level) {
    return level != Level::Off && static_cast<int>(level) >= g_level.load();
}

void SetStream(std::ostream* stream) {
    g_stream.store(stream);
}

void Write(Level level, std::string_view message) {
    if (!Enabled(level)) {
        return;
    }
    std::ostream* out = g_stream.load();
    if (!out) {
        out = &std::cerr;
    }
    std::string prefix = "[blobseal] " + std::string(LevelName(level)) + ":";
    std::lock_guard<std::mutex> lock(g_write_mutex);
    *out << cli::Colorize(prefix, LevelColor(level), *out) << " " << message << "\n";
    out->flush();
}

}  // namespace blobseal::log
