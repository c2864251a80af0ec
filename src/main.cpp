#include "pixvault.hpp"
#include "ffmpeg_decoder.hpp"
#include "payload.hpp"

#include <csignal>
#include <limits>
#include <stdexcept>
#include <utility>
#include <iostream>
#include <string>
#include <vector>

static CancellationToken g_cancel;

void signal_handler(int) {
    g_cancel.cancel();
}

namespace {

void print_usage(const char* prog) {
    std::cerr << "Usage:\n"
              << "  " << prog << " encode <input> <output.mp4> [--resolution WxH] [--fps N] [--chunk-size N]\n"
              << "        [--no-compression] [--level N] [--style rings|nested|sweep] [--threads N]\n"
              << "        [--crf N] [--preset NAME]\n"
              << "  " << prog << " decode <input.mp4> <output> --resolution WxH --chunk-size N --encoded-size N\n"
              << "        [--no-compression] [--checksum HEX] [--style NAME] [--threads N]\n"
              << "  " << prog << " probe <video>\n"
              << "  " << prog << " hash <file>\n"
              << "Common: --verbose, --quiet" << std::endl;
}

// Prints every 25th frame, plus the start and completion messages
class ConsoleProgress : public ProgressSink {
public:
    void notify(uint64_t bytes, uint64_t frames, const std::string& message) override {
        if (frames == 0 || frames % 25 == 0 || message.find("complete") != std::string::npos) {
            std::cout << "[PROGRESS] " << message << " (" << bytes << " bytes, " << frames << " frames)" << std::endl;
        }
    }
};

constexpr uint64_t kIntMax = static_cast<uint64_t>(std::numeric_limits<int>::max());
constexpr uint64_t kSizeMax = static_cast<uint64_t>(std::numeric_limits<size_t>::max());

struct Args {
    std::vector<std::string> positional;
    std::vector<std::pair<std::string, std::string>> options;
    std::vector<std::string> flags;

    bool has(const std::string& name) const {
        for (const auto& f : flags) if (f == name) return true;
        return false;
    }
    const std::string* get(const std::string& name) const {
        for (const auto& o : options) if (o.first == name) return &o.second;
        return nullptr;
    }
};

Args parse_args(int argc, char** argv, int first) {
    static const std::vector<std::string> kSwitches = {"--no-compression", "--verbose", "--quiet"};
    Args args;
    for (int i = first; i < argc; ++i) {
        std::string a = argv[i];
        if (a.rfind("--", 0) != 0) {
            args.positional.push_back(a);
            continue;
        }
        bool is_switch = false;
        for (const auto& s : kSwitches) if (a == s) is_switch = true;
        if (is_switch) {
            args.flags.push_back(a);
        } else {
            if (i + 1 >= argc) throw InvalidInputError("Missing value for " + a);
            args.options.emplace_back(a, argv[++i]);
        }
    }
    return args;
}

int run_encode(const Args& args) {
    if (args.positional.size() != 2) throw InvalidInputError("encode needs <input> <output>");

    CodecConfig config;
    if (auto v = args.get("--resolution")) {
        auto wh = parse_resolution(*v);
        config.width = wh.first;
        config.height = wh.second;
    }
    if (auto v = args.get("--fps")) config.fps = static_cast<int>(parse_unsigned("--fps", *v, kIntMax));
    if (auto v = args.get("--chunk-size")) config.chunk_size = static_cast<size_t>(parse_unsigned("--chunk-size", *v, kSizeMax));
    if (auto v = args.get("--level")) config.compression_level = static_cast<int>(parse_unsigned("--level", *v, kIntMax));
    if (auto v = args.get("--style")) config.pattern_style = parse_pattern_style(*v);
    if (auto v = args.get("--threads")) config.num_threads = static_cast<size_t>(parse_unsigned("--threads", *v, kSizeMax));
    if (auto v = args.get("--crf")) config.video.crf = static_cast<int>(parse_unsigned("--crf", *v, kIntMax));
    if (auto v = args.get("--preset")) config.video.preset = *v;
    if (args.has("--no-compression")) config.use_compression = false;

    ConsoleProgress progress;
    EncodeResult r = encode_file(args.positional[0], args.positional[1], config, &progress, &g_cancel);

    std::cout << "Original size:   " << r.original_size << " bytes\n"
              << "Encoded payload: " << r.encoded_payload_size << " bytes" << (r.compressed ? " (zstd)" : "") << "\n"
              << "Chunk size:      " << r.effective_chunk_size << "\n"
              << "Frames:          " << r.frame_count << "\n"
              << "SHA-256:         " << r.checksum << "\n"
              << "Decode with: decode " << args.positional[1] << " <output> --resolution "
              << config.width << "x" << config.height << " --chunk-size " << r.effective_chunk_size
              << " --encoded-size " << r.encoded_payload_size
              << (config.use_compression ? "" : " --no-compression")
              << " --checksum " << r.checksum << std::endl;
    return 0;
}

int run_decode(const Args& args) {
    if (args.positional.size() != 2) throw InvalidInputError("decode needs <input> <output>");

    const std::string* resolution = args.get("--resolution");
    const std::string* chunk = args.get("--chunk-size");
    const std::string* encoded = args.get("--encoded-size");
    if (!resolution || !chunk || !encoded)
        throw InvalidInputError("decode needs --resolution, --chunk-size and --encoded-size");

    DecodeParams params;
    auto wh = parse_resolution(*resolution);
    params.width = wh.first;
    params.height = wh.second;
    params.chunk_size = static_cast<size_t>(parse_unsigned("--chunk-size", *chunk, kSizeMax));
    params.encoded_payload_size = parse_unsigned("--encoded-size", *encoded, std::numeric_limits<uint64_t>::max());
    params.use_compression = !args.has("--no-compression");
    if (auto v = args.get("--checksum")) params.expected_checksum = *v;
    if (auto v = args.get("--style")) params.pattern_style = parse_pattern_style(*v);
    if (auto v = args.get("--threads")) params.num_threads = static_cast<size_t>(parse_unsigned("--threads", *v, kSizeMax));

    ConsoleProgress progress;
    DecodeResult r = decode_file(args.positional[0], args.positional[1], params, &progress, &g_cancel);

    std::cout << "Restored size: " << r.restored_size << " bytes" << (r.was_compressed ? " (zstd)" : "") << "\n"
              << "Frames read:   " << r.frames_read << " (" << r.repaired_frames << " repaired)\n"
              << "Style:         " << pattern_style_name(r.pattern_style) << "\n"
              << "SHA-256:       " << r.checksum << (r.checksum_verified ? " (verified)" : " (not verified)")
              << std::endl;
    return 0;
}

int run_probe(const Args& args) {
    if (args.positional.size() != 1) throw InvalidInputError("probe needs <video>");
    VideoInfo info = probe_video(args.positional[0]);
    std::cout << "Container:  " << info.container << "\n"
              << "Codec:      " << info.codec_name << "\n"
              << "Resolution: " << info.width << "x" << info.height << "\n"
              << "FPS:        " << info.fps << "\n"
              << "Frames:     " << info.frame_count << std::endl;
    return 0;
}

int run_hash(const Args& args) {
    if (args.positional.size() != 1) throw InvalidInputError("hash needs <file>");
    std::cout << file_sha256(args.positional[0]) << "  " << args.positional[0] << std::endl;
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    const std::string command = argv[1];
    try {
        Args args = parse_args(argc, argv, 2);
        LogLevel level = LogLevel::Info;
        if (args.has("--verbose")) level = LogLevel::Debug;
        if (args.has("--quiet")) level = LogLevel::Warn;
        library_init(level);

        if (command == "encode") return run_encode(args);
        if (command == "decode") return run_decode(args);
        if (command == "probe") return run_probe(args);
        if (command == "hash") return run_hash(args);

        print_usage(argv[0]);
        return 1;
    } catch (const VaultError& e) {
        std::cerr << "[" << error_code_name(e.code()) << "] " << e.what() << std::endl;
        return static_cast<int>(e.code()) & 0xFF;
    } catch (const std::exception& e) {
        std::cerr << "Exception: " << e.what() << std::endl;
        return static_cast<int>(ErrorCode::Unknown);
    }
}
