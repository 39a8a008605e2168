#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace blobseal::constants {

inline constexpr std::size_t kKeyLen = 32;
inline constexpr std::size_t kAeadNonceLen = 12;
inline constexpr std::size_t kAeadTagLen = 16;
inline constexpr std::size_t kHashLen = 32;

inline constexpr std::size_t kFrameHeaderLen = 8;
inline constexpr std::size_t kFrameMaxBody = 99999999;
inline constexpr std::size_t kDefaultBlockSize = 32u * 1024u * 1024u;
inline constexpr std::size_t kDefaultReadSize = 64u * 1024u;
inline constexpr std::uint32_t kMaxExpirationDays = 36500;

inline constexpr std::size_t kSecretLen = 32;
inline constexpr std::size_t kPublicKeyLen = 65;

inline constexpr std::string_view kWrapMagic = "BSK1";
inline constexpr std::string_view kWrapInfo = "blobseal.keywrap.v1";
inline constexpr std::string_view kCombinedKeyDelim = "||";

inline constexpr std::string_view kHeaderChunkIndex = "X-Chunk-Index";
inline constexpr std::string_view kHeaderContentRange = "Content-Range";
inline constexpr std::string_view kHeaderContentLength = "Content-Length";
inline constexpr std::string_view kHeaderTotalChunks = "X-Total-Chunks";

inline constexpr std::string_view kDefaultContentType = "application/octet-stream";
inline constexpr std::string_view kEngineVersion = "1.0.0";

}  // namespace blobseal::constants
