#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace blobseal::base64 {

std::string Encode(const std::vector<std::uint8_t>& data);
// Canonical padded alphabet only, no whitespace. On failure *ok is false and the result is empty.
std::vector<std::uint8_t> Decode(const std::string& input, bool* ok = nullptr);

}  // namespace blobseal::base64
