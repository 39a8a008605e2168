#include "blobseal/chunk_codec.hpp"
#include "blobseal/cli_colors.hpp"
#include "blobseal/config.hpp"
#include "blobseal/crypto.hpp"
#include "blobseal/keybundle.hpp"
#include "blobseal/log.hpp"
#include "blobseal/metadata.hpp"
#include "blobseal/stream_decoder.hpp"

#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace {

void PrintUsage() {
    std::cout << "Usage:\n";
    std::cout << "  blobseal pubkey <signature>\n";
    std::cout << "  blobseal hash <file>\n";
    std::cout << "  blobseal seal <file> --recipient <pubkey-hex> [--out <path>] [--block-size <n>]\n";
    std::cout << "  blobseal open <frames> --key <wrapped> --signature <signature> [--out <path>]\n";
    std::cout << "  blobseal demux <response> --content-type <value> [--total <n>] [--out <path>]\n";
    std::cout << "  blobseal meta <blob>\n";
    std::cout << "Global flags: --no-color, --log-level <debug|info|warn|error|off>\n";
}

struct Args {
    std::string input;
    std::string output;
    std::string recipient;
    std::string key;
    std::string signature;
    std::string content_type;
    std::optional<std::size_t> total;
    std::optional<std::size_t> block_size;
};

std::string NextValue(int argc, char** argv, int& idx, const std::string& flag) {
    if (idx + 1 >= argc) {
        throw std::runtime_error("Missing value for " + flag);
    }
    idx += 2;
    return argv[idx - 1];
}

std::size_t ParseSize(const std::string& text, const std::string& flag) {
    try {
        std::size_t used = 0;
        unsigned long long value = std::stoull(text, &used);
        if (used != text.size() || value == 0) {
            throw std::invalid_argument(text);
        }
        return static_cast<std::size_t>(value);
    } catch (const std::logic_error&) {
        throw std::runtime_error("Invalid value for " + flag + ": " + text);
    }
}

Args ParseArgs(int argc, char** argv, int start_index) {
    Args opts;
    if (start_index >= argc) {
        throw std::runtime_error("Missing input path");
    }
    opts.input = argv[start_index];
    int idx = start_index + 1;
    while (idx < argc) {
        std::string flag(argv[idx]);
        if (flag == "--out" || flag == "-o") {
            opts.output = NextValue(argc, argv, idx, flag);
        } else if (flag == "--recipient") {
            opts.recipient = NextValue(argc, argv, idx, flag);
        } else if (flag == "--key") {
            opts.key = NextValue(argc, argv, idx, flag);
        } else if (flag == "--signature") {
            opts.signature = NextValue(argc, argv, idx, flag);
        } else if (flag == "--content-type") {
            opts.content_type = NextValue(argc, argv, idx, flag);
        } else if (flag == "--total") {
            opts.total = ParseSize(NextValue(argc, argv, idx, flag), flag);
        } else if (flag == "--block-size") {
            opts.block_size = ParseSize(NextValue(argc, argv, idx, flag), flag);
        } else {
            throw std::runtime_error("Unknown flag: " + flag);
        }
    }
    return opts;
}

std::vector<std::uint8_t> ReadFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Failed to open " + path);
    }
    return std::vector<std::uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

void WriteFile(const std::string& path, const std::vector<std::uint8_t>& data) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("Failed to open " + path + " for writing");
    }
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!out) {
        throw std::runtime_error("Failed to write " + path);
    }
}

std::vector<std::uint8_t> HexArg(const std::string& hex, const std::string& what) {
    bool ok = false;
    std::vector<std::uint8_t> bytes = blobseal::crypto::FromHex(hex, &ok);
    if (!ok) {
        throw std::runtime_error(what + " must be hex");
    }
    return bytes;
}

void PrintField(const std::string& name, const std::string& value) {
    std::cout << blobseal::cli::Cyan(name + ":") << " " << value << "\n";
}

int Seal(const Args& opts, const blobseal::Config& config) {
    if (opts.recipient.empty()) {
        throw std::runtime_error("--recipient is required");
    }
    std::vector<std::uint8_t> recipient = HexArg(opts.recipient, "Recipient public key");
    std::ifstream in(opts.input, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Failed to open " + opts.input);
    }
    blobseal::KeyBundle bundle = blobseal::keybundle::Generate();
    blobseal::chunk_codec::EncodeOptions encode;
    encode.block_size = opts.block_size.value_or(config.block_size);
    blobseal::EncryptedObject object = blobseal::chunk_codec::Encode(in, bundle, encode);
    std::string wrapped = blobseal::keybundle::Wrap(bundle, recipient);

    std::vector<std::uint8_t> region;
    region.reserve(object.total_size);
    for (const auto& chunk : object.chunks) {
        region.insert(region.end(), chunk.frame.begin(), chunk.frame.end());
    }
    std::string out_path = opts.output.empty() ? opts.input + ".bsl" : opts.output;
    WriteFile(out_path, region);

    PrintField("content_hash", object.combined_hash);
    PrintField("plaintext_hash", object.plaintext_hash);
    PrintField("chunks", std::to_string(object.chunks.size()));
    PrintField("total_size", std::to_string(object.total_size));
    PrintField("wrapped_key", wrapped);
    PrintField("output", out_path);
    return 0;
}

int Open(const Args& opts) {
    if (opts.key.empty() || opts.signature.empty()) {
        throw std::runtime_error("--key and --signature are required");
    }
    std::vector<std::uint8_t> secret = blobseal::keybundle::DeriveAccountSecret(opts.signature);
    blobseal::KeyBundle bundle = blobseal::keybundle::Unwrap(opts.key, secret);
    blobseal::crypto::Wipe(secret);
    std::vector<std::uint8_t> region = ReadFile(opts.input);
    std::vector<std::uint8_t> plaintext = blobseal::chunk_codec::DecodeFrames(region, bundle);
    std::string out_path = opts.output;
    if (out_path.empty()) {
        const std::string ext = ".bsl";
        bool has_ext = opts.input.size() > ext.size()
                       && opts.input.compare(opts.input.size() - ext.size(), ext.size(), ext) == 0;
        out_path = has_ext ? opts.input.substr(0, opts.input.size() - ext.size()) : opts.input + ".out";
    }
    WriteFile(out_path, plaintext);
    blobseal::crypto::Wipe(plaintext);
    PrintField("content_hash", blobseal::crypto::Sha256Hex(region));
    PrintField("output", out_path);
    return 0;
}

int Demux(const Args& opts, const blobseal::Config& config) {
    if (opts.content_type.empty()) {
        throw std::runtime_error("--content-type is required");
    }
    std::ifstream in(opts.input, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Failed to open " + opts.input);
    }
    blobseal::StreamDecoder decoder(opts.content_type, opts.total);
    std::vector<blobseal::Part> parts;
    std::vector<char> buffer(config.read_size);
    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize got = in.gcount();
        if (got <= 0) {
            break;
        }
        for (auto& part : decoder.Feed(reinterpret_cast<const std::uint8_t*>(buffer.data()),
                                       static_cast<std::size_t>(got))) {
            parts.push_back(std::move(part));
        }
    }
    if (in.bad()) {
        throw std::runtime_error("Failed to read " + opts.input);
    }
    for (auto& part : decoder.Finish()) {
        parts.push_back(std::move(part));
    }
    std::size_t total = decoder.TotalChunks().value_or(parts.size());
    std::vector<blobseal::Part> ordered = blobseal::StreamDecoder::Reassemble(std::move(parts), total);
    std::vector<std::vector<std::uint8_t>> frames;
    std::vector<std::uint8_t> region;
    for (auto& part : ordered) {
        region.insert(region.end(), part.body.begin(), part.body.end());
        frames.push_back(std::move(part.body));
    }
    std::string out_path = opts.output.empty() ? opts.input + ".bsl" : opts.output;
    WriteFile(out_path, region);
    PrintField("chunks", std::to_string(frames.size()));
    PrintField("content_hash", blobseal::chunk_codec::CombinedHash(frames));
    PrintField("output", out_path);
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    std::vector<char*> args;
    blobseal::Config config = blobseal::Config::FromEnvironment();
    try {
        for (int i = 0; i < argc; ++i) {
            std::string arg(argv[i]);
            if (arg == "--no-color") {
                blobseal::cli::SetColorsEnabled(false);
            } else if (arg == "--log-level") {
                if (i + 1 >= argc) {
                    throw std::runtime_error("Missing value for --log-level");
                }
                config.log_level = blobseal::log::ParseLevel(argv[++i], config.log_level);
            } else {
                args.push_back(argv[i]);
            }
        }
    } catch (const std::exception& exc) {
        std::cerr << blobseal::cli::Colorize("Error:", blobseal::cli::color::BOLD_RED, std::cerr) << " "
                  << exc.what() << "\n";
        return 2;
    }
    blobseal::log::SetLevel(config.log_level);
    int count = static_cast<int>(args.size());
    if (count < 3) {
        PrintUsage();
        return 2;
    }
    std::string command(args[1]);
    try {
        if (command == "pubkey") {
            std::vector<std::uint8_t> secret = blobseal::keybundle::DeriveAccountSecret(args[2]);
            std::cout << blobseal::crypto::ToHex(blobseal::keybundle::PublicKeyFromSecret(secret)) << "\n";
            blobseal::crypto::Wipe(secret);
            return 0;
        }
        if (command == "hash") {
            std::ifstream in(args[2], std::ios::binary);
            if (!in) {
                throw std::runtime_error(std::string("Failed to open ") + args[2]);
            }
            std::cout << blobseal::chunk_codec::PlaintextHash(in, config.read_size) << "\n";
            return 0;
        }
        if (command == "meta") {
            blobseal::FileMetadata meta = blobseal::metadata::Decode(args[2]);
            PrintField("name", meta.name);
            PrintField("original_name", meta.original_name);
            PrintField("content_type", meta.content_type);
            PrintField("original_file_hash", meta.original_file_hash);
            PrintField("path", meta.path);
            return 0;
        }
        if (command == "seal") {
            return Seal(ParseArgs(count, args.data(), 2), config);
        }
        if (command == "open") {
            return Open(ParseArgs(count, args.data(), 2));
        }
        if (command == "demux") {
            return Demux(ParseArgs(count, args.data(), 2), config);
        }
        PrintUsage();
        return 2;
    } catch (const std::exception& exc) {
        std::cerr << blobseal::cli::Colorize("Error:", blobseal::cli::color::BOLD_RED, std::cerr) << " "
                  << exc.what() << "\n";
        return 1;
    }
}
