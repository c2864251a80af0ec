// Mini-tests: full file -> video -> file round trips through FFmpeg

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

#include "ffmpeg_decoder.hpp"
#include "payload.hpp"
#include "pixvault.hpp"

#define T_ASSERT(expr) do{ if(!(expr)){ \
    std::cerr << "[FAIL] " << __FUNCTION__ << ":" << __LINE__ << " -> " #expr "\n"; return false; } }while(0)

namespace fs = std::filesystem;

static fs::path work_dir() {
    static const fs::path dir = [] {
        fs::path d = fs::temp_directory_path() / ("pixvault_minitest_" + std::to_string(::getpid()));
        fs::create_directories(d);
        return d;
    }();
    return dir;
}

static std::string tmp(const std::string& name) { return (work_dir() / name).string(); }

static void write_file(const std::string& path, const std::vector<uint8_t>& data) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
}

static std::vector<uint8_t> read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return std::vector<uint8_t>((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

static std::vector<uint8_t> make_random(size_t n, uint32_t seed) {
    std::mt19937 rng(seed);
    std::vector<uint8_t> out(n);
    for (auto& b : out) b = static_cast<uint8_t>(rng() & 0xFF);
    return out;
}

static CodecConfig small_config() {
    CodecConfig cfg;
    cfg.width = 256;
    cfg.height = 256;
    cfg.chunk_size = 256;
    cfg.num_threads = 2;
    return cfg;
}

static DecodeParams params_for(const CodecConfig& cfg, const EncodeResult& enc) {
    DecodeParams p;
    p.width = cfg.width;
    p.height = cfg.height;
    p.chunk_size = enc.effective_chunk_size;
    p.use_compression = cfg.use_compression;
    p.encoded_payload_size = enc.encoded_payload_size;
    p.expected_checksum = enc.checksum;
    p.num_threads = cfg.num_threads;
    return p;
}

template <typename Err, typename Fn>
static bool throws_as(Fn&& fn) {
    try {
        fn();
    } catch (const Err&) {
        return true;
    } catch (const std::exception& e) {
        std::cerr << "  unexpected exception: " << e.what() << "\n";
        return false;
    }
    return false;
}

class RecordingSink : public ProgressSink {
public:
    void notify(uint64_t bytes, uint64_t frames, const std::string& message) override {
        if (frames < last_frames) monotonic = false;
        last_frames = frames;
        last_bytes = bytes;
        last_message = message;
        ++calls;
    }
    uint64_t calls = 0;
    uint64_t last_frames = 0;
    uint64_t last_bytes = 0;
    std::string last_message;
    bool monotonic = true;
};

class ThrowingSink : public ProgressSink {
public:
    void notify(uint64_t, uint64_t, const std::string&) override {
        ++calls;
        throw std::runtime_error("sink exploded");
    }
    uint64_t calls = 0;
};

class SlowSink : public ProgressSink {
public:
    void notify(uint64_t, uint64_t frames, const std::string& message) override {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        last_frames = frames;
        last_message = message;
    }
    uint64_t last_frames = 0;
    std::string last_message;
};

// ------------------ TEST A : tiny file, one frame ----------------------------
static bool test_tiny() {
    const std::string input = tmp("tiny.bin"), video = tmp("tiny.mp4"), output = tmp("tiny.out");
    const std::vector<uint8_t> data = {'p', 'i', 'x', 'v', 'a', 'u', 'l', 't', '\n', 0};
    write_file(input, data);

    CodecConfig cfg = small_config();
    cfg.pattern_style = PatternStyle::Sweep;
    RecordingSink sink;
    EncodeResult enc = encode_file(input, video, cfg, &sink);
    T_ASSERT(enc.frame_count == 1);
    T_ASSERT(enc.original_size == data.size());
    T_ASSERT(enc.effective_chunk_size == 256);
    T_ASSERT(enc.compressed);
    T_ASSERT(enc.checksum == sha256_hex(data.data(), data.size()));
    T_ASSERT(sink.monotonic && sink.last_message == "Encoding complete");

    VideoInfo info = probe_video(video);
    T_ASSERT(info.width == 256 && info.height == 256);
    T_ASSERT(info.frame_count == 1);

    // style left unset: detected from the first frame
    DecodeResult dec = decode_file(video, output, params_for(cfg, enc));
    T_ASSERT(read_file(output) == data);
    T_ASSERT(dec.checksum_verified && dec.was_compressed);
    T_ASSERT(dec.frames_read == 1);
    T_ASSERT(dec.pattern_style == PatternStyle::Sweep);
    return true;
}

// ------------------ TEST B : 1 MiB random file --------------------------------
static bool test_large() {
    const std::string input = tmp("large.bin"), video = tmp("large.mp4"), output = tmp("large.out");
    const auto data = make_random(1024 * 1024, 42);
    write_file(input, data);

    CodecConfig cfg;
    cfg.chunk_size = 4096;
    EncodeResult enc = encode_file(input, video, cfg);
    // random bytes do not compress, zstd only adds framing
    T_ASSERT(enc.encoded_payload_size >= data.size());
    T_ASSERT(enc.frame_count == (enc.encoded_payload_size + 4095) / 4096);

    DecodeResult dec = decode_file(video, output, params_for(cfg, enc));
    T_ASSERT(dec.restored_size == data.size());
    T_ASSERT(dec.frames_read == enc.frame_count);
    T_ASSERT(read_file(output) == data);
    return true;
}

// ------------------ TEST C : empty file ---------------------------------------
static bool test_empty() {
    const std::string input = tmp("empty.bin"), video = tmp("empty.mp4"), output = tmp("empty.out");
    write_file(input, {});

    CodecConfig cfg = small_config();
    EncodeResult enc = encode_file(input, video, cfg);
    T_ASSERT(enc.frame_count == 0);
    T_ASSERT(enc.encoded_payload_size == 0);
    T_ASSERT(enc.checksum == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");

    DecodeResult dec = decode_file(video, output, params_for(cfg, enc));
    T_ASSERT(dec.restored_size == 0 && dec.frames_read == 0);
    T_ASSERT(fs::exists(output) && fs::file_size(output) == 0);
    return true;
}

// ------------------ TEST D : chunk size clamping ------------------------------
static bool test_clamp() {
    const std::string input = tmp("clamp.bin"), video = tmp("clamp.mp4"), output = tmp("clamp.out");
    const auto data = make_random(1000, 7);
    write_file(input, data);

    CodecConfig cfg = small_config();
    cfg.chunk_size = 4096;
    cfg.use_compression = false;
    cfg.pattern_style = PatternStyle::NestedSquares;
    EncodeResult enc = encode_file(input, video, cfg);
    T_ASSERT(enc.effective_chunk_size == 320);
    T_ASSERT(!enc.compressed && enc.encoded_payload_size == 1000);
    T_ASSERT(enc.frame_count == 4);

    // the requested size does not describe the artifact
    DecodeParams wrong = params_for(cfg, enc);
    wrong.chunk_size = 4096;
    T_ASSERT(throws_as<ConfigError>([&] { decode_file(video, output, wrong); }));
    T_ASSERT(!fs::exists(output));

    DecodeResult dec = decode_file(video, output, params_for(cfg, enc));
    T_ASSERT(!dec.was_compressed && dec.checksum_verified);
    T_ASSERT(read_file(output) == data);
    return true;
}

// ------------------ TEST E : damaged artifacts --------------------------------
static bool test_damaged_artifact() {
    const std::string input = tmp("dmg.bin"), video = tmp("dmg.mp4");
    const auto data = make_random(3000, 9);
    write_file(input, data);

    CodecConfig cfg = small_config();
    EncodeResult enc = encode_file(input, video, cfg);
    const auto artifact = read_file(video);
    T_ASSERT(artifact.size() > 64);

    // either a reported failure with no output left behind, or the exact bytes
    auto decode_is_safe = [&](const std::string& damaged, const std::string& output) {
        try {
            decode_file(damaged, output, params_for(cfg, enc));
        } catch (const VaultError& e) {
            std::cout << "  rejected (" << error_code_name(e.code()) << "): " << e.what() << "\n";
            return !fs::exists(output);
        }
        return read_file(output) == data;
    };

    std::vector<uint8_t> truncated(artifact.begin(), artifact.begin() + artifact.size() / 2);
    write_file(tmp("dmg_trunc.mp4"), truncated);
    T_ASSERT(decode_is_safe(tmp("dmg_trunc.mp4"), tmp("dmg_trunc.out")));

    std::vector<uint8_t> flipped = artifact;
    for (size_t i = 0; i < 16; ++i) flipped[flipped.size() / 2 + i] ^= 0xFF;
    write_file(tmp("dmg_flip.mp4"), flipped);
    T_ASSERT(decode_is_safe(tmp("dmg_flip.mp4"), tmp("dmg_flip.out")));

    // not a video at all
    write_file(tmp("dmg_junk.mp4"), make_random(4096, 10));
    T_ASSERT(throws_as<DecodingError>([&] { decode_file(tmp("dmg_junk.mp4"), tmp("dmg_junk.out"), params_for(cfg, enc)); }));
    T_ASSERT(!fs::exists(tmp("dmg_junk.out")));

    // wrong digest on an intact artifact
    DecodeParams p = params_for(cfg, enc);
    p.expected_checksum = std::string(64, '0');
    T_ASSERT(throws_as<IntegrityError>([&] { decode_file(video, tmp("dmg_sum.out"), p); }));
    T_ASSERT(!fs::exists(tmp("dmg_sum.out")));
    return true;
}

// ------------------ TEST F : progress, cancellation, misuse -------------------
static bool test_job_control() {
    const std::string input = tmp("ctl.bin"), video = tmp("ctl.mp4");
    write_file(input, make_random(2000, 11));
    CodecConfig cfg = small_config();

    // a failing sink never fails the job
    ThrowingSink bad;
    EncodeResult enc = encode_file(input, video, cfg, &bad);
    T_ASSERT(bad.calls > 0 && enc.frame_count > 0);

    // relay hands the final update over before it joins
    SlowSink slow;
    {
        AsyncProgressRelay relay(slow);
        encode_file(input, tmp("ctl_relay.mp4"), cfg, &relay);
    }
    T_ASSERT(slow.last_message == "Encoding complete");

    CancellationToken cancel;
    cancel.cancel();
    T_ASSERT(throws_as<CancelledError>([&] { encode_file(input, tmp("ctl_cancel.mp4"), cfg, nullptr, &cancel); }));
    T_ASSERT(!fs::exists(tmp("ctl_cancel.mp4")));

    EncodeJob job(cfg);
    job.run(input, tmp("ctl_job.mp4"));
    T_ASSERT(job.state() == EncodeState::Finalized);
    bool misuse = false;
    try {
        job.run(input, tmp("ctl_job2.mp4"));
    } catch (const JobStateError& e) {
        misuse = e.code() == ErrorCode::InvalidHandle;
    }
    T_ASSERT(misuse);

    DecodeJob failing(params_for(cfg, enc));
    T_ASSERT(throws_as<InvalidInputError>([&] { failing.run(tmp("missing.mp4"), tmp("missing.out")); }));
    T_ASSERT(failing.state() == DecodeState::Failed);

    T_ASSERT(throws_as<InvalidInputError>([&] { encode_file(tmp("missing.bin"), tmp("missing.mp4"), cfg); }));
    return true;
}

// ------------------ TEST G : encoder that fails to start ----------------------
static bool test_failed_start() {
    const std::string input = tmp("keep.bin"), video = tmp("keep.mp4");
    write_file(input, make_random(500, 12));
    const std::vector<uint8_t> existing = {'d', 'o', ' ', 'n', 'o', 't', ' ', 't', 'o', 'u', 'c', 'h'};
    write_file(video, existing);

    CodecConfig cfg = small_config();
    cfg.video.preset = "no-such-preset";
    T_ASSERT(throws_as<EncodingError>([&] { encode_file(input, video, cfg); }));
    T_ASSERT(fs::exists(video));
    T_ASSERT(read_file(video) == existing);
    return true;
}

// ------------------ TEST H : concurrent jobs ---------------------------------
static bool test_concurrent() {
    const std::string in_a = tmp("conc_a.bin"), in_b = tmp("conc_b.bin");
    const auto data_a = make_random(1500, 21), data_b = make_random(2500, 22);
    write_file(in_a, data_a);
    write_file(in_b, data_b);

    const CodecConfig cfg = small_config();
    EncodeResult enc_a, enc_b;
    std::string err_a, err_b;
    auto encode_into = [&cfg](const std::string& in, const std::string& out, EncodeResult& res, std::string& err) {
        try {
            res = encode_file(in, out, cfg);
        } catch (const VaultError& e) {
            err = e.what();
        }
    };
    std::thread ta(encode_into, in_a, tmp("conc_a.mp4"), std::ref(enc_a), std::ref(err_a));
    std::thread tb(encode_into, in_b, tmp("conc_b.mp4"), std::ref(enc_b), std::ref(err_b));
    ta.join();
    tb.join();
    T_ASSERT(err_a.empty() && err_b.empty());
    T_ASSERT(enc_a.checksum == sha256_hex(data_a.data(), data_a.size()));
    T_ASSERT(enc_b.checksum == sha256_hex(data_b.data(), data_b.size()));

    decode_file(tmp("conc_a.mp4"), tmp("conc_a.out"), params_for(cfg, enc_a));
    decode_file(tmp("conc_b.mp4"), tmp("conc_b.out"), params_for(cfg, enc_b));
    T_ASSERT(read_file(tmp("conc_a.out")) == data_a);
    T_ASSERT(read_file(tmp("conc_b.out")) == data_b);
    return true;
}

int main() {
    library_init(LogLevel::Warn);
    bool ok = true;

    ok &= test_tiny();
    std::cout << "[A] tiny file : " << (ok ? "OK" : "FAIL") << "\n";

    ok &= test_large();
    std::cout << "[B] 1 MiB random : " << (ok ? "OK" : "FAIL") << "\n";

    ok &= test_empty();
    std::cout << "[C] empty file : " << (ok ? "OK" : "FAIL") << "\n";

    ok &= test_clamp();
    std::cout << "[D] chunk clamping : " << (ok ? "OK" : "FAIL") << "\n";

    ok &= test_damaged_artifact();
    std::cout << "[E] damaged artifacts : " << (ok ? "OK" : "FAIL") << "\n";

    ok &= test_job_control();
    std::cout << "[F] job control : " << (ok ? "OK" : "FAIL") << "\n";

    ok &= test_failed_start();
    std::cout << "[G] failed encoder start : " << (ok ? "OK" : "FAIL") << "\n";

    ok &= test_concurrent();
    std::cout << "[H] concurrent jobs : " << (ok ? "OK" : "FAIL") << "\n";

    std::error_code ec;
    fs::remove_all(work_dir(), ec);

    std::cout << (ok ? "ALL TESTS PASSED\n" : "SOME TESTS FAILED\n");
    return ok ? 0 : 1;
}
