#include "blobseal/stream_decoder.hpp"

#include "blobseal/constants.hpp"
#include "blobseal/errors.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace blobseal {

namespace {

constexpr std::size_t kMaxHeaderBlock = 64 * 1024;
constexpr std::size_t kMaxBoundaryLine = 256;
constexpr std::string_view kCrlf = "\r\n";
constexpr std::string_view kHeaderEnd = "\r\n\r\n";

std::string Lower(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return out;
}

std::string_view Trim(std::string_view text) {
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) {
        text.remove_prefix(1);
    }
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t')) {
        text.remove_suffix(1);
    }
    return text;
}

std::optional<std::size_t> ParseCount(std::string_view text) {
    text = Trim(text);
    if (text.empty() || text.size() > 18) {
        return std::nullopt;
    }
    std::size_t value = 0;
    for (char ch : text) {
        if (ch < '0' || ch > '9') {
            return std::nullopt;
        }
        value = value * 10 + static_cast<std::size_t>(ch - '0');
    }
    return value;
}

// "chunk <i>/<n>", keyword matched case-insensitively.
bool ParseChunkRange(std::string_view value, std::size_t& index, std::size_t& total) {
    value = Trim(value);
    std::string lowered = Lower(value);
    if (lowered.compare(0, 5, "chunk") != 0) {
        return false;
    }
    std::string_view rest = value.substr(5);
    if (rest.empty() || (rest.front() != ' ' && rest.front() != '\t')) {
        return false;
    }
    rest = Trim(rest);
    std::size_t slash = rest.find('/');
    if (slash == std::string_view::npos) {
        return false;
    }
    auto i = ParseCount(rest.substr(0, slash));
    auto n = ParseCount(rest.substr(slash + 1));
    if (!i || !n) {
        return false;
    }
    index = *i;
    total = *n;
    return true;
}

std::size_t Find(const Bytes& haystack, std::string_view needle, std::size_t from = 0) {
    if (from >= haystack.size()) {
        return std::string::npos;
    }
    auto it = std::search(haystack.begin() + static_cast<std::ptrdiff_t>(from), haystack.end(),
                          needle.begin(), needle.end(),
                          [](std::uint8_t a, char b) { return a == static_cast<std::uint8_t>(b); });
    if (it == haystack.end()) {
        return std::string::npos;
    }
    return static_cast<std::size_t>(it - haystack.begin());
}

void Consume(Bytes& buffer, std::size_t count) {
    buffer.erase(buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(count));
}

}  // namespace

StreamDecoder::StreamDecoder(std::string_view content_type, std::optional<std::size_t> total_chunks)
    : boundary_(ExtractBoundary(content_type)),
      delimiter_("--" + boundary_),
      body_delimiter_("\r\n--" + boundary_) {
    if (total_chunks && *total_chunks > 0) {
        total_ = total_chunks;
    }
}

std::string StreamDecoder::ExtractBoundary(std::string_view content_type) {
    std::string lowered = Lower(content_type);
    std::size_t pos = lowered.find("boundary=");
    if (pos == std::string::npos) {
        throw ProtocolError("No boundary found in multipart Content-Type");
    }
    std::string_view value = content_type.substr(pos + 9);
    std::size_t end = value.find(';');
    if (end != std::string_view::npos) {
        value = value.substr(0, end);
    }
    value = Trim(value);
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        value = value.substr(1, value.size() - 2);
    }
    if (value.empty()) {
        throw ProtocolError("Empty multipart boundary");
    }
    return std::string(value);
}

std::vector<Part> StreamDecoder::Feed(const std::uint8_t* data, std::size_t len) {
    EnsureUsable();
    std::vector<Part> out;
    if (state_ == State::Done) {
        return out;
    }
    buffer_.insert(buffer_.end(), data, data + len);
    try {
        Advance(out);
    } catch (const ProtocolError&) {
        state_ = State::Error;
        throw;
    }
    return out;
}

std::vector<Part> StreamDecoder::Finish() {
    EnsureUsable();
    std::vector<Part> out;
    if (state_ == State::Done) {
        return out;
    }
    if (awaiting_tail_) {
        bool blank = std::all_of(buffer_.begin(), buffer_.end(),
                                 [](std::uint8_t ch) { return ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n'; });
        if (!blank) {
            Fail("Trailing bytes after the last part delimiter");
        }
        state_ = State::Done;
        buffer_.clear();
        return out;
    }
    if (state_ == State::ReadingPartBody && part_length_) {
        // Final part without a closing delimiter is accepted when its declared length is intact.
        std::size_t expected = *part_length_;
        std::size_t have = part_body_.size() + buffer_.size();
        bool crlf_tail = have == expected + 2 && buffer_.size() >= 2
                         && buffer_[buffer_.size() - 2] == '\r' && buffer_.back() == '\n';
        if (have == expected || crlf_tail) {
            if (crlf_tail) {
                buffer_.resize(buffer_.size() - 2);
            }
            part_body_.insert(part_body_.end(), buffer_.begin(), buffer_.end());
            buffer_.clear();
            EmitPart(out);
            state_ = State::Done;
            return out;
        }
    }
    if (state_ == State::SeekingFirstBoundary) {
        Fail("Stream ended before the first multipart boundary");
    }
    Fail("Stream ended before the closing multipart boundary");
}

void StreamDecoder::Advance(std::vector<Part>& out) {
    while (state_ != State::Done) {
        if (awaiting_tail_) {
            if (!ParseBoundaryTail()) {
                return;
            }
            continue;
        }
        switch (state_) {
            case State::SeekingFirstBoundary: {
                std::size_t pos = Find(buffer_, delimiter_);
                if (pos == std::string::npos) {
                    std::size_t keep = delimiter_.size() - 1;
                    if (buffer_.size() > keep) {
                        Consume(buffer_, buffer_.size() - keep);
                    }
                    return;
                }
                Consume(buffer_, pos + delimiter_.size());
                awaiting_tail_ = true;
                break;
            }
            case State::ParsingPartHeaders:
                if (!ParseHeaders()) {
                    return;
                }
                state_ = State::ReadingPartBody;
                break;
            case State::ReadingPartBody:
                if (!ReadBody(out)) {
                    return;
                }
                break;
            case State::Done:
            case State::Error:
                return;
        }
    }
    buffer_.clear();
}

// Buffer starts right after a delimiter: either "--" (close) or optional whitespace then CRLF.
bool StreamDecoder::ParseBoundaryTail() {
    if (buffer_.size() < 2) {
        return false;
    }
    if (buffer_[0] == '-' && buffer_[1] == '-') {
        awaiting_tail_ = false;
        state_ = State::Done;
        buffer_.clear();
        return true;
    }
    std::size_t eol = Find(buffer_, kCrlf);
    std::size_t scan_end = eol == std::string::npos ? buffer_.size() : eol;
    for (std::size_t i = 0; i < scan_end; ++i) {
        if (buffer_[i] != ' ' && buffer_[i] != '\t' && !(i + 1 == buffer_.size() && buffer_[i] == '\r')) {
            Fail("Malformed multipart delimiter line");
        }
    }
    if (eol == std::string::npos) {
        if (buffer_.size() > kMaxBoundaryLine) {
            Fail("Multipart delimiter line too long");
        }
        return false;
    }
    Consume(buffer_, eol + kCrlf.size());
    awaiting_tail_ = false;
    state_ = State::ParsingPartHeaders;
    return true;
}

bool StreamDecoder::ParseHeaders() {
    std::size_t end = Find(buffer_, kHeaderEnd);
    if (end == std::string::npos) {
        if (buffer_.size() >= 2 && buffer_[0] == '\r' && buffer_[1] == '\n') {
            Fail("Part " + std::to_string(parts_seen_) + " has no headers");
        }
        if (buffer_.size() > kMaxHeaderBlock) {
            Fail("Part header block too large");
        }
        return false;
    }
    std::string block(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(end));
    Consume(buffer_, end + kHeaderEnd.size());

    std::optional<std::string> chunk_index;
    std::optional<std::string> content_range;
    std::optional<std::string> content_length;
    const std::string index_name = Lower(constants::kHeaderChunkIndex);
    const std::string range_name = Lower(constants::kHeaderContentRange);
    const std::string length_name = Lower(constants::kHeaderContentLength);

    std::size_t pos = 0;
    while (pos <= block.size()) {
        std::size_t eol = block.find(kCrlf, pos);
        std::string_view line(block);
        line = line.substr(pos, eol == std::string::npos ? std::string::npos : eol - pos);
        pos = eol == std::string::npos ? block.size() + 1 : eol + kCrlf.size();
        if (line.empty()) {
            continue;
        }
        std::size_t colon = line.find(':');
        if (colon == std::string_view::npos) {
            Fail("Malformed part header line");
        }
        std::string name = Lower(Trim(line.substr(0, colon)));
        std::string value(Trim(line.substr(colon + 1)));
        if (name == index_name) {
            chunk_index = value;
        } else if (name == range_name) {
            content_range = value;
        } else if (name == length_name) {
            content_length = value;
        }
    }

    std::size_t range_index = 0;
    std::size_t range_total = 0;
    bool have_range = content_range && ParseChunkRange(*content_range, range_index, range_total);
    if (have_range && !total_) {
        total_ = range_total;
    }

    if (chunk_index) {
        auto parsed = ParseCount(*chunk_index);
        if (!parsed) {
            Fail("Unparsable " + std::string(constants::kHeaderChunkIndex) + " header: " + *chunk_index);
        }
        part_index_ = *parsed;
    } else if (have_range) {
        part_index_ = range_index;
    } else {
        Fail("Could not determine chunk index for part " + std::to_string(parts_seen_));
    }

    part_length_.reset();
    if (content_length) {
        part_length_ = ParseCount(*content_length);
        if (!part_length_) {
            Fail("Unparsable Content-Length header: " + *content_length);
        }
    }
    part_body_.clear();
    return true;
}

bool StreamDecoder::ReadBody(std::vector<Part>& out) {
    std::size_t pos = Find(buffer_, body_delimiter_);
    if (pos == std::string::npos) {
        std::size_t holdback = body_delimiter_.size();
        if (buffer_.size() > holdback) {
            std::size_t movable = buffer_.size() - holdback;
            part_body_.insert(part_body_.end(), buffer_.begin(),
                              buffer_.begin() + static_cast<std::ptrdiff_t>(movable));
            Consume(buffer_, movable);
        }
        return false;
    }
    part_body_.insert(part_body_.end(), buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(pos));
    Consume(buffer_, pos + body_delimiter_.size());
    EmitPart(out);
    awaiting_tail_ = true;
    return true;
}

void StreamDecoder::EmitPart(std::vector<Part>& out) {
    if (part_length_ && *part_length_ != part_body_.size()) {
        Fail("Chunk " + std::to_string(part_index_) + " declares Content-Length " + std::to_string(*part_length_)
             + " but carried " + std::to_string(part_body_.size()) + " bytes");
    }
    Part part;
    part.index = part_index_;
    part.body = std::move(part_body_);
    part_body_.clear();
    part_length_.reset();
    out.push_back(std::move(part));
    ++parts_seen_;
}

void StreamDecoder::Fail(const std::string& message) {
    state_ = State::Error;
    throw ProtocolError(message);
}

void StreamDecoder::EnsureUsable() const {
    if (state_ == State::Error) {
        throw ProtocolError("Stream decoder is in the error state");
    }
}

std::vector<Part> StreamDecoder::Reassemble(std::vector<Part> parts, std::size_t total) {
    if (total == 0) {
        throw ProtocolError("Total chunk count is zero");
    }
    std::sort(parts.begin(), parts.end(), [](const Part& a, const Part& b) { return a.index < b.index; });
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (parts[i].index >= total) {
            throw ProtocolError("Chunk index " + std::to_string(parts[i].index) + " is outside [0, "
                                + std::to_string(total) + ")");
        }
        if (i > 0 && parts[i].index == parts[i - 1].index) {
            throw ProtocolError("Duplicate chunk index " + std::to_string(parts[i].index));
        }
    }
    if (parts.size() != total) {
        std::size_t missing = parts.size();
        for (std::size_t i = 0; i < parts.size(); ++i) {
            if (parts[i].index != i) {
                missing = i;
                break;
            }
        }
        throw ProtocolError("Missing chunk index " + std::to_string(missing) + " of " + std::to_string(total));
    }
    return parts;
}

}  // namespace blobseal
