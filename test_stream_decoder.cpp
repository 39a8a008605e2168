#include "blobseal/errors.hpp"
#include "blobseal/stream_decoder.hpp"

#include "test_support.hpp"

#include <string>
#include <vector>

using namespace blobseal_test;
using blobseal::Part;
using blobseal::StreamDecoder;

namespace {

const std::string kContentType = "multipart/byteranges; boundary=blobseal-test-boundary";

std::vector<Bytes> SampleBodies() {
    // The middle body contains a delimiter lookalike that is not preceded by CRLF.
    Bytes tricky = ToBytes("--blobseal-test-boundary inside a body\r\n-");
    return {Pattern(300, 1), tricky, Pattern(1, 3), Pattern(4097, 4)};
}

std::vector<Part> FeedInSteps(StreamDecoder& decoder, const Bytes& data, std::size_t step) {
    std::vector<Part> parts;
    for (std::size_t pos = 0; pos < data.size(); pos += step) {
        std::size_t n = std::min(step, data.size() - pos);
        for (auto& part : decoder.Feed(data.data() + pos, n)) {
            parts.push_back(std::move(part));
        }
    }
    for (auto& part : decoder.Finish()) {
        parts.push_back(std::move(part));
    }
    return parts;
}

bool SameBodies(const std::vector<Part>& parts, const std::vector<Bytes>& bodies) {
    if (parts.size() != bodies.size()) {
        return false;
    }
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (parts[i].index != i || parts[i].body != bodies[i]) {
            return false;
        }
    }
    return true;
}

}  // namespace

int main() {
    Run("boundary extraction", []() {
        CheckEq(StreamDecoder::ExtractBoundary("multipart/byteranges; boundary=abc"), std::string("abc"), "plain");
        CheckEq(StreamDecoder::ExtractBoundary("multipart/byteranges; BOUNDARY=\"a b\"; charset=x"),
                std::string("a b"), "quoted, case-insensitive, with trailing params");
        CheckThrows<blobseal::ProtocolError>([]() { StreamDecoder("multipart/byteranges"); }, "missing boundary");
        CheckThrows<blobseal::ProtocolError>([]() { StreamDecoder("multipart/byteranges; boundary=\"\""); },
                                             "empty boundary");
    });

    Run("whole stream", []() {
        std::vector<Bytes> bodies = SampleBodies();
        StreamDecoder decoder(kContentType, bodies.size());
        std::vector<Part> parts = FeedInSteps(decoder, BuildMultipart(Indexed(bodies)), 1 << 20);
        Check(SameBodies(parts, bodies), "all parts decoded");
        Check(decoder.CurrentState() == StreamDecoder::State::Done, "done after closing delimiter");
        CheckEq(decoder.TotalChunks().value_or(0), bodies.size(), "out-of-band total");
    });

    Run("arbitrary read splits", []() {
        std::vector<Bytes> bodies = SampleBodies();
        Bytes stream = BuildMultipart(Indexed(bodies));
        bool all_ok = true;
        for (std::size_t step = 1; step <= 64; ++step) {
            StreamDecoder decoder(kContentType, bodies.size());
            all_ok = all_ok && SameBodies(FeedInSteps(decoder, stream, step), bodies);
        }
        Check(all_ok, "every split size from 1 to 64 bytes yields the same parts");
        StreamDecoder odd(kContentType);
        Check(SameBodies(FeedInSteps(odd, stream, 4099), bodies), "split inside the large body");
    });

    Run("parts are emitted as they complete", []() {
        std::vector<Bytes> bodies = SampleBodies();
        Bytes stream = BuildMultipart(Indexed(bodies));
        StreamDecoder decoder(kContentType);
        std::size_t emitted_before_end = 0;
        std::size_t half = stream.size() / 2;
        emitted_before_end = decoder.Feed(stream.data(), half).size();
        Check(emitted_before_end > 0, "first half completes at least one part");
    });

    Run("range header shim", []() {
        std::vector<Bytes> bodies = SampleBodies();
        MultipartOptions options;
        options.index_header = IndexHeader::ContentRange;
        StreamDecoder decoder(kContentType);
        std::vector<Part> parts = FeedInSteps(decoder, BuildMultipart(Indexed(bodies), options), 5);
        Check(SameBodies(parts, bodies), "index from Content-Range");
        CheckEq(decoder.TotalChunks().value_or(0), bodies.size(), "total from Content-Range");

        options.index_header = IndexHeader::Both;
        StreamDecoder both(kContentType);
        Check(SameBodies(FeedInSteps(both, BuildMultipart(Indexed(bodies), options), 11), bodies),
              "X-Chunk-Index wins over Content-Range");

        options.index_header = IndexHeader::ContentRange;
        options.range_total = 9;
        StreamDecoder authoritative(kContentType, bodies.size());
        FeedInSteps(authoritative, BuildMultipart(Indexed(bodies), options), 64);
        CheckEq(authoritative.TotalChunks().value_or(0), bodies.size(), "out-of-band total is authoritative");
    });

    Run("header names are case-insensitive", []() {
        std::string raw = "--b\r\nx-chunk-index: 0\r\ncontent-length: 3\r\n\r\nabc\r\n--b--\r\n";
        StreamDecoder decoder("multipart/byteranges; boundary=b");
        std::vector<Part> parts = FeedInSteps(decoder, ToBytes(raw), 2);
        Check(parts.size() == 1 && parts[0].body == ToBytes("abc"), "lower-case headers accepted");
    });

    Run("missing index", []() {
        std::vector<Bytes> bodies = SampleBodies();
        MultipartOptions options;
        options.index_header = IndexHeader::None;
        StreamDecoder decoder(kContentType);
        Bytes stream = BuildMultipart(Indexed(bodies), options);
        CheckThrows<blobseal::ProtocolError>([&]() { decoder.Feed(stream); }, "no index header");
        Check(decoder.CurrentState() == StreamDecoder::State::Error, "error state");
        CheckThrows<blobseal::ProtocolError>([&]() { decoder.Feed(ToBytes("more")); }, "later feeds fail");
        CheckThrows<blobseal::ProtocolError>([&]() { decoder.Finish(); }, "finish fails");

        std::string raw = "--b\r\nX-Chunk-Index: one\r\n\r\nabc\r\n--b--\r\n";
        StreamDecoder bad("multipart/byteranges; boundary=b");
        CheckThrows<blobseal::ProtocolError>([&]() { bad.Feed(ToBytes(raw)); }, "unparsable index");
    });

    Run("content-length mismatch", []() {
        std::string raw = "--b\r\nX-Chunk-Index: 0\r\nContent-Length: 5\r\n\r\nabc\r\n--b--\r\n";
        StreamDecoder decoder("multipart/byteranges; boundary=b");
        CheckThrows<blobseal::ProtocolError>([&]() { FeedInSteps(decoder, ToBytes(raw), 3); }, "declared 5, got 3");
    });

    Run("truncated streams", []() {
        std::vector<Bytes> bodies = SampleBodies();
        Bytes stream = BuildMultipart(Indexed(bodies));
        Bytes cut(stream.begin(), stream.begin() + static_cast<std::ptrdiff_t>(stream.size() / 2));
        StreamDecoder decoder(kContentType);
        CheckThrows<blobseal::ProtocolError>([&]() { FeedInSteps(decoder, cut, 100); }, "cut mid-part");
        StreamDecoder nothing(kContentType);
        CheckThrows<blobseal::ProtocolError>([&]() { FeedInSteps(nothing, ToBytes("no parts here"), 4); },
                                             "no boundary at all");

        MultipartOptions options;
        options.closing_delimiter = false;
        StreamDecoder lenient(kContentType);
        Check(SameBodies(FeedInSteps(lenient, BuildMultipart(Indexed(bodies), options), 9), bodies),
              "missing closing delimiter accepted when Content-Length is intact");
    });

    Run("epilogue is ignored", []() {
        std::vector<Bytes> bodies = {ToBytes("x")};
        Bytes stream = BuildMultipart(Indexed(bodies));
        Bytes epilogue = ToBytes("trailing epilogue");
        stream.insert(stream.end(), epilogue.begin(), epilogue.end());
        StreamDecoder decoder(kContentType);
        Check(SameBodies(FeedInSteps(decoder, stream, 3), bodies), "parts unaffected");
    });

    Run("reassembly", []() {
        std::vector<Bytes> bodies = SampleBodies();
        std::vector<std::pair<std::size_t, Bytes>> shuffled = {
            {2, bodies[2]}, {0, bodies[0]}, {3, bodies[3]}, {1, bodies[1]}};
        StreamDecoder decoder(kContentType, bodies.size());
        std::vector<Part> parts = FeedInSteps(decoder, BuildMultipart(shuffled), 13);
        CheckEq(parts.front().index, std::size_t{2}, "arrival order preserved by the decoder");
        Check(SameBodies(StreamDecoder::Reassemble(parts, 4), bodies), "out-of-order parts reassembled");

        std::vector<Part> missing(parts.begin(), parts.end() - 1);
        CheckThrows<blobseal::ProtocolError>([&]() { StreamDecoder::Reassemble(missing, 4); }, "missing chunk");
        std::vector<Part> duplicate = parts;
        duplicate.push_back(parts[0]);
        CheckThrows<blobseal::ProtocolError>([&]() { StreamDecoder::Reassemble(duplicate, 5); }, "duplicate index");
        CheckThrows<blobseal::ProtocolError>([&]() { StreamDecoder::Reassemble(parts, 3); }, "index outside total");
        CheckThrows<blobseal::ProtocolError>([&]() { StreamDecoder::Reassemble({}, 0); }, "zero total");
    });

    return Summary("test_stream_decoder");
}
