#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace blobseal {

// Ledger-side description of an uploaded file. `name` is the hashed file name.
struct FileMetadata {
    std::string name;
    std::string original_name;
    std::string content_type;
    std::string original_file_hash;
    std::string path;
};

namespace metadata {

std::int64_t NowMillis();
// SHA-256 hex of the name with the upload timestamp appended.
std::string HashFileName(std::string_view original_name, std::int64_t timestamp_ms);

FileMetadata Describe(std::string_view original_name,
                      std::string_view content_type,
                      std::string_view plaintext_hash,
                      std::string_view path,
                      std::int64_t timestamp_ms);

// Base64 of a flat JSON object with snake_case keys.
std::string Encode(const FileMetadata& meta);
// Throws ProtocolError on a blob that is not base64 JSON. Unknown keys are ignored.
FileMetadata Decode(const std::string& blob);

}  // namespace metadata

}  // namespace blobseal
