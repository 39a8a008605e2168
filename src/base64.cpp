#include "blobseal/base64.hpp"

#include <array>

namespace blobseal::base64 {

namespace {

constexpr char kAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
constexpr std::uint8_t kInvalid = 0xFF;

std::array<std::uint8_t, 256> BuildReverse() {
    std::array<std::uint8_t, 256> table{};
    table.fill(kInvalid);
    for (std::uint8_t i = 0; i < 64; ++i) {
        table[static_cast<unsigned char>(kAlphabet[i])] = i;
    }
    return table;
}

const std::array<std::uint8_t, 256> kReverse = BuildReverse();

// Appends the bytes of one 4-character group; only the final group may carry padding.
bool DecodeQuad(const char* quad, bool last, std::vector<std::uint8_t>& out) {
    std::uint32_t bits = 0;
    int pad = 0;
    for (int i = 0; i < 4; ++i) {
        unsigned char c = static_cast<unsigned char>(quad[i]);
        if (c == '=') {
            if (!last || i < 2) {
                return false;
            }
            ++pad;
            bits <<= 6;
            continue;
        }
        if (pad > 0 || kReverse[c] == kInvalid) {
            return false;
        }
        bits = (bits << 6) | kReverse[c];
    }
    out.push_back(static_cast<std::uint8_t>(bits >> 16));
    if (pad < 2) {
        out.push_back(static_cast<std::uint8_t>(bits >> 8));
    }
    if (pad < 1) {
        out.push_back(static_cast<std::uint8_t>(bits));
    }
    return true;
}

}  // namespace

std::string Encode(const std::vector<std::uint8_t>& data) {
    std::string out;
    out.reserve(((data.size() + 2) / 3) * 4);
    for (std::size_t i = 0; i < data.size(); i += 3) {
        std::size_t remaining = data.size() - i;
        std::uint32_t group = static_cast<std::uint32_t>(data[i]) << 16;
        if (remaining > 1) {
            group |= static_cast<std::uint32_t>(data[i + 1]) << 8;
        }
        if (remaining > 2) {
            group |= data[i + 2];
        }
        out.push_back(kAlphabet[(group >> 18) & 0x3F]);
        out.push_back(kAlphabet[(group >> 12) & 0x3F]);
        out.push_back(remaining > 1 ? kAlphabet[(group >> 6) & 0x3F] : '=');
        out.push_back(remaining > 2 ? kAlphabet[group & 0x3F] : '=');
    }
    return out;
}

std::vector<std::uint8_t> Decode(const std::string& input, bool* ok) {
    std::vector<std::uint8_t> out;
    bool success = input.size() % 4 == 0;
    if (success) {
        out.reserve((input.size() / 4) * 3);
        for (std::size_t i = 0; i < input.size(); i += 4) {
            if (!DecodeQuad(input.data() + i, i + 4 == input.size(), out)) {
                success = false;
                break;
            }
        }
    }
    if (ok) {
        *ok = success;
    }
    if (!success) {
        out.clear();
    }
    return out;
}

}  // namespace blobseal::base64
