#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace blobseal {

using Bytes = std::vector<std::uint8_t>;

struct Part {
    std::size_t index = 0;
    Bytes body;
};

// Incremental parser for a multipart/byteranges provider response where each part is one chunk frame.
// Reads may split headers, bodies and delimiters at any byte.
class StreamDecoder {
public:
    enum class State { SeekingFirstBoundary, ParsingPartHeaders, ReadingPartBody, Done, Error };

    // Throws ProtocolError when content_type carries no boundary parameter.
    explicit StreamDecoder(std::string_view content_type,
                           std::optional<std::size_t> total_chunks = std::nullopt);

    // Returns the parts completed by this read, in arrival order.
    std::vector<Part> Feed(const std::uint8_t* data, std::size_t len);
    std::vector<Part> Feed(const Bytes& data) { return Feed(data.data(), data.size()); }
    // Call once the source is exhausted. Throws ProtocolError on a truncated stream.
    std::vector<Part> Finish();

    State CurrentState() const noexcept { return state_; }
    const std::string& Boundary() const noexcept { return boundary_; }
    // Out-of-band total when given, otherwise the first total seen in a range header.
    std::optional<std::size_t> TotalChunks() const noexcept { return total_; }

    static std::string ExtractBoundary(std::string_view content_type);
    // Sorts by index; throws ProtocolError on duplicates, out-of-range or missing indices.
    static std::vector<Part> Reassemble(std::vector<Part> parts, std::size_t total);

private:
    void Advance(std::vector<Part>& out);
    bool ParseBoundaryTail();
    bool ParseHeaders();
    bool ReadBody(std::vector<Part>& out);
    void EmitPart(std::vector<Part>& out);
    [[noreturn]] void Fail(const std::string& message);
    void EnsureUsable() const;

    std::string boundary_;
    std::string delimiter_;       // "--" + boundary
    std::string body_delimiter_;  // "\r\n--" + boundary
    std::optional<std::size_t> total_;

    State state_ = State::SeekingFirstBoundary;
    bool awaiting_tail_ = false;
    Bytes buffer_;

    std::size_t part_index_ = 0;
    std::optional<std::size_t> part_length_;
    Bytes part_body_;
    std::size_t parts_seen_ = 0;
};

}  // namespace blobseal
