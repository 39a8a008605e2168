#include "blobseal/env.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace blobseal::env {

namespace {

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return value;
}

}  // namespace

std::string Get(std::string_view name) {
    std::string key(name);
    const char* value = std::getenv(key.c_str());
    if (!value) {
        return {};
    }
    return std::string(value);
}

bool IsEnabled(std::string_view name, bool default_value) {
    std::string value = Get(name);
    if (value.empty()) {
        return default_value;
    }
    value = ToLower(value);
    return value == "1" || value == "true" || value == "yes" || value == "on";
}

std::uint64_t GetUnsigned(std::string_view name, std::uint64_t default_value) {
    std::string raw = Get(name);
    if (raw.empty()) {
        return default_value;
    }
    if (!std::all_of(raw.begin(), raw.end(), [](unsigned char ch) { return std::isdigit(ch) != 0; })) {
        return default_value;
    }
    try {
        std::uint64_t parsed = std::stoull(raw);
        return parsed == 0 ? default_value : parsed;
    } catch (const std::out_of_range&) {
        return default_value;
    }
}

}  // namespace blobseal::env
