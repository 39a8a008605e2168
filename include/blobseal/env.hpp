#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace blobseal::env {

std::string Get(std::string_view name);
bool IsEnabled(std::string_view name, bool default_value = false);
std::uint64_t GetUnsigned(std::string_view name, std::uint64_t default_value);

}  // namespace blobseal::env
