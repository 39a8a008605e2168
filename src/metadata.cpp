#include "blobseal/metadata.hpp"

#include "blobseal/base64.hpp"
#include "blobseal/constants.hpp"
#include "blobseal/crypto.hpp"
#include "blobseal/errors.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <utility>
#include <vector>

namespace blobseal::metadata {

namespace {

std::string EscapeJson(std::string_view input) {
    std::string out;
    out.reserve(input.size());
    for (char ch : input) {
        switch (ch) {
            case '\\':
            case '"':
                out.push_back('\\');
                out.push_back(ch);
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(ch) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(ch));
                    out += buf;
                } else {
                    out.push_back(ch);
                }
        }
    }
    return out;
}

class JsonScanner {
public:
    explicit JsonScanner(const std::string& json) : json_(json) {}

    void SkipSpace() {
        while (pos_ < json_.size() && (json_[pos_] == ' ' || json_[pos_] == '\n' || json_[pos_] == '\r'
                                       || json_[pos_] == '\t')) {
            ++pos_;
        }
    }

    bool Consume(char expected) {
        SkipSpace();
        if (pos_ < json_.size() && json_[pos_] == expected) {
            ++pos_;
            return true;
        }
        return false;
    }

    void Expect(char expected) {
        if (!Consume(expected)) {
            throw ProtocolError(std::string("Malformed metadata: expected '") + expected + "'");
        }
    }

    std::string String() {
        Expect('"');
        std::string out;
        while (pos_ < json_.size()) {
            char ch = json_[pos_++];
            if (ch == '"') {
                return out;
            }
            if (ch != '\\') {
                out.push_back(ch);
                continue;
            }
            if (pos_ >= json_.size()) {
                break;
            }
            char esc = json_[pos_++];
            switch (esc) {
                case '"':
                case '\\':
                case '/':
                    out.push_back(esc);
                    break;
                case 'n':
                    out.push_back('\n');
                    break;
                case 'r':
                    out.push_back('\r');
                    break;
                case 't':
                    out.push_back('\t');
                    break;
                case 'u': {
                    if (pos_ + 4 > json_.size()
                        || !std::all_of(json_.begin() + static_cast<std::ptrdiff_t>(pos_),
                                        json_.begin() + static_cast<std::ptrdiff_t>(pos_ + 4),
                                        [](unsigned char c) { return std::isxdigit(c) != 0; })) {
                        throw ProtocolError("Malformed metadata: bad unicode escape");
                    }
                    unsigned code = static_cast<unsigned>(std::stoul(json_.substr(pos_, 4), nullptr, 16));
                    pos_ += 4;
                    if (code > 0x7F) {
                        throw ProtocolError("Malformed metadata: unsupported escape");
                    }
                    out.push_back(static_cast<char>(code));
                    break;
                }
                default:
                    throw ProtocolError("Malformed metadata: bad escape");
            }
        }
        throw ProtocolError("Malformed metadata: unterminated string");
    }

    bool AtEnd() {
        SkipSpace();
        return pos_ == json_.size();
    }

private:
    const std::string& json_;
    std::size_t pos_ = 0;
};

}  // namespace

std::int64_t NowMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

std::string HashFileName(std::string_view original_name, std::int64_t timestamp_ms) {
    std::string input(original_name);
    input += std::to_string(timestamp_ms);
    return crypto::Sha256Hex(crypto::Bytes(input.begin(), input.end()));
}

FileMetadata Describe(std::string_view original_name,
                      std::string_view content_type,
                      std::string_view plaintext_hash,
                      std::string_view path,
                      std::int64_t timestamp_ms) {
    FileMetadata meta;
    meta.name = HashFileName(original_name, timestamp_ms);
    meta.original_name = std::string(original_name);
    meta.content_type = content_type.empty() ? std::string(constants::kDefaultContentType)
                                             : std::string(content_type);
    meta.original_file_hash = std::string(plaintext_hash);
    meta.path = path.empty() ? std::string("/") : std::string(path);
    return meta;
}

std::string Encode(const FileMetadata& meta) {
    std::vector<std::pair<std::string, std::string>> fields;
    fields.emplace_back("name", meta.name);
    fields.emplace_back("original_name", meta.original_name);
    fields.emplace_back("content_type", meta.content_type);
    fields.emplace_back("original_file_hash", meta.original_file_hash);
    fields.emplace_back("path", meta.path);
    fields.emplace_back("version", std::string(constants::kEngineVersion));

    std::string json;
    json.reserve(fields.size() * 48);
    json.push_back('{');
    for (std::size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) {
            json.push_back(',');
        }
        json.push_back('"');
        json += EscapeJson(fields[i].first);
        json += "\":\"";
        json += EscapeJson(fields[i].second);
        json.push_back('"');
    }
    json.push_back('}');
    return base64::Encode(crypto::Bytes(json.begin(), json.end()));
}

FileMetadata Decode(const std::string& blob) {
    FileMetadata meta;
    if (blob.empty()) {
        return meta;
    }
    bool ok = false;
    crypto::Bytes decoded = base64::Decode(blob, &ok);
    if (!ok) {
        throw ProtocolError("Metadata is not valid base64");
    }
    std::string json(decoded.begin(), decoded.end());
    JsonScanner scanner(json);
    scanner.Expect('{');
    if (!scanner.Consume('}')) {
        do {
            std::string key = scanner.String();
            scanner.Expect(':');
            std::string value = scanner.String();
            if (key == "name") {
                meta.name = std::move(value);
            } else if (key == "original_name") {
                meta.original_name = std::move(value);
            } else if (key == "content_type") {
                meta.content_type = std::move(value);
            } else if (key == "original_file_hash") {
                meta.original_file_hash = std::move(value);
            } else if (key == "path") {
                meta.path = std::move(value);
            }
        } while (scanner.Consume(','));
        scanner.Expect('}');
    }
    if (!scanner.AtEnd()) {
        throw ProtocolError("Malformed metadata: trailing data");
    }
    return meta;
}

}  // namespace blobseal::metadata
