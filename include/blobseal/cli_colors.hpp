#pragma once

#include <iostream>
#include <ostream>
#include <string>

namespace blobseal::cli {

namespace color {
    constexpr const char* RESET = "\033[0m";

    constexpr const char* YELLOW = "\033[0;33m";
    constexpr const char* CYAN = "\033[0;36m";

    constexpr const char* BOLD_RED = "\033[1;31m";

    constexpr const char* BRIGHT_BLACK = "\033[0;90m";
}

// Colors are on when the stream is a TTY, unless SetColorsEnabled overrides it
bool ColorsEnabled(std::ostream& os = std::cout);
void SetColorsEnabled(bool enabled);

std::string Colorize(const std::string& text, const char* color, std::ostream& os = std::cout);

inline std::string Cyan(const std::string& text) { return Colorize(text, color::CYAN); }

}  // namespace blobseal::cli
