// Mini-tests: configuration validation, frame geometry and chunk clamping

#include <climits>
#include <cstdint>
#include <iostream>
#include <string>

#include "codec_config.hpp"
#include "errors.hpp"
#include "frame_geometry.hpp"
#include "pixvault.hpp"

#define T_ASSERT(expr) do{ if(!(expr)){ \
    std::cerr << "[FAIL] " << __FUNCTION__ << ":" << __LINE__ << " -> " #expr "\n"; return false; } }while(0)

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

// ------------------ TEST A : config validation -------------------------------
static bool test_config_validation() {
    CodecConfig ok;
    ok.validate();

    CodecConfig small = ok;
    small.width = 128;
    T_ASSERT(throws_as<InvalidInputError>([&] { small.validate(); }));

    CodecConfig huge = ok;
    huge.width = 8192;
    T_ASSERT(throws_as<InvalidInputError>([&] { huge.validate(); }));

    CodecConfig odd = ok;
    odd.height = 721;
    T_ASSERT(throws_as<InvalidInputError>([&] { odd.validate(); }));

    CodecConfig fps = ok;
    fps.fps = 0;
    T_ASSERT(throws_as<InvalidInputError>([&] { fps.validate(); }));
    fps.fps = 121;
    T_ASSERT(throws_as<InvalidInputError>([&] { fps.validate(); }));

    CodecConfig chunk = ok;
    chunk.chunk_size = 0;
    T_ASSERT(throws_as<InvalidInputError>([&] { chunk.validate(); }));
    chunk.chunk_size = kMaxChunkSize + 1;
    T_ASSERT(throws_as<InvalidInputError>([&] { chunk.validate(); }));

    CodecConfig level = ok;
    level.compression_level = 0;
    T_ASSERT(throws_as<InvalidInputError>([&] { level.validate(); }));
    level.use_compression = false;   // level is irrelevant without compression
    level.validate();

    CodecConfig crf = ok;
    crf.video.crf = 52;
    T_ASSERT(throws_as<InvalidInputError>([&] { crf.validate(); }));

    T_ASSERT(throws_as<InvalidInputError>([] { CodecConfig c; c.width = 100; EncodeJob job(c); }));
    return true;
}

// ------------------ TEST B : boundary parsing --------------------------------
static bool test_parsing() {
    auto wh = parse_resolution("1280x720");
    T_ASSERT(wh.first == 1280 && wh.second == 720);
    T_ASSERT(throws_as<InvalidInputError>([] { parse_resolution("1280"); }));
    T_ASSERT(throws_as<InvalidInputError>([] { parse_resolution("1280x720x3"); }));
    T_ASSERT(throws_as<InvalidInputError>([] { parse_resolution("-1280x720"); }));
    T_ASSERT(throws_as<InvalidInputError>([] { parse_resolution("100x100"); }));

    for (PatternStyle s : kAllPatternStyles) {
        T_ASSERT(parse_pattern_style(pattern_style_name(s)) == s);
    }
    T_ASSERT(parse_pattern_style("SWEEP") == PatternStyle::Sweep);
    T_ASSERT(parse_pattern_style("geometric") == PatternStyle::Rings);
    T_ASSERT(throws_as<InvalidInputError>([] { parse_pattern_style("spiral"); }));

    T_ASSERT(parse_unsigned("--fps", "30", INT_MAX) == 30);
    T_ASSERT(parse_unsigned("--chunk-size", "0", SIZE_MAX) == 0);
    T_ASSERT(parse_unsigned("--encoded-size", "18446744073709551615", UINT64_MAX) == UINT64_MAX);
    // 2^32 + 30 must not wrap to 30
    T_ASSERT(throws_as<InvalidInputError>([] { parse_unsigned("--fps", "4294967326", INT_MAX); }));
    T_ASSERT(throws_as<InvalidInputError>([] { parse_unsigned("--fps", "2147483648", INT_MAX); }));
    T_ASSERT(throws_as<InvalidInputError>([] { parse_unsigned("--fps", "99999999999999999999999", INT_MAX); }));
    T_ASSERT(throws_as<InvalidInputError>([] { parse_unsigned("--fps", "-1", INT_MAX); }));
    T_ASSERT(throws_as<InvalidInputError>([] { parse_unsigned("--fps", "", INT_MAX); }));
    T_ASSERT(throws_as<InvalidInputError>([] { parse_unsigned("--fps", "12a", INT_MAX); }));

    DecodeParams p;
    p.expected_checksum = "abc";
    T_ASSERT(throws_as<InvalidInputError>([&] { p.validate(); }));
    p.expected_checksum = std::string(64, 'A');
    p.validate();
    return true;
}

// ------------------ TEST C : geometry ----------------------------------------
static bool test_geometry() {
    FrameGeometry g = derive_geometry(256, 256, 256);
    T_ASSERT(g.stripe_len == 32);
    T_ASSERT(g.symbol_count == 320);
    T_ASSERT(g.block_side == 14);
    T_ASSERT(g.cols == 18 && g.rows == 18);
    T_ASSERT(g.origin_x == 2 && g.origin_y == 2);
    T_ASSERT(g.grid_cells() >= g.symbol_count);
    T_ASSERT(g.data_capacity() >= g.chunk_size);

    // grid stays inside the frame
    cv::Rect last = block_rect(g, g.grid_cells() - 1);
    T_ASSERT(last.x + last.width <= g.width && last.y + last.height <= g.height);

    // ten bytes still get a full-size stripe of 8
    FrameGeometry tiny = derive_geometry(256, 256, 10);
    T_ASSERT(tiny.stripe_len == 8);
    T_ASSERT(tiny.symbol_count == 80);
    T_ASSERT(tiny.block_side >= 25);

    FrameGeometry hd = derive_geometry(1280, 720, 4096);
    T_ASSERT(hd.stripe_len == 512);
    T_ASSERT(hd.block_side == 13);

    FrameGeometry fhd = derive_geometry(1920, 1080, 4096);
    T_ASSERT(fhd.block_side == 20);
    return true;
}

// ------------------ TEST D : clamping ----------------------------------------
static bool test_clamping() {
    T_ASSERT(max_chunk_size(256, 256) == 320);
    T_ASSERT(max_chunk_size(1920, 1080) == 11520);
    T_ASSERT(max_chunk_size(8, 8) == 0);

    T_ASSERT(effective_chunk_size(256, 256, 256) == 256);
    T_ASSERT(effective_chunk_size(256, 256, 4096) == 320);
    T_ASSERT(throws_as<ConfigError>([] { effective_chunk_size(8, 8, 1); }));

    // the clamped value is representable, one byte-stripe more is not
    FrameGeometry at_max = derive_geometry(256, 256, 320);
    T_ASSERT(at_max.block_side >= kMinBlockSide);
    T_ASSERT(throws_as<ConfigError>([] { derive_geometry(256, 256, 321); }));
    T_ASSERT(throws_as<ConfigError>([] { derive_geometry(256, 256, 4096); }));
    return true;
}

// ------------------ TEST E : artifact estimates ------------------------------
static bool test_estimates() {
    T_ASSERT(estimate_artifact_frames(0, 4096) == 0);
    T_ASSERT(estimate_artifact_frames(10, 256) == 1);
    T_ASSERT(estimate_artifact_frames(4096, 4096) == 1);
    T_ASSERT(estimate_artifact_frames(1024 * 1024 + 1, 4096) == 257);
    T_ASSERT(throws_as<ConfigError>([] { estimate_artifact_frames(10, 0); }));

    // 2 frames of 256x256 RGB24, halved
    T_ASSERT(estimate_artifact_size(256, 256, 300, 256) == 2ull * 256 * 256 * 3 / 2);
    T_ASSERT(estimate_artifact_size(1920, 1080, 0, 4096) == 0);
    return true;
}

int main() {
    bool ok = true;

    ok &= test_config_validation();
    std::cout << "[A] config validation : " << (ok ? "OK" : "FAIL") << "\n";

    ok &= test_parsing();
    std::cout << "[B] boundary parsing : " << (ok ? "OK" : "FAIL") << "\n";

    ok &= test_geometry();
    std::cout << "[C] frame geometry : " << (ok ? "OK" : "FAIL") << "\n";

    ok &= test_clamping();
    std::cout << "[D] chunk clamping : " << (ok ? "OK" : "FAIL") << "\n";

    ok &= test_estimates();
    std::cout << "[E] artifact estimates : " << (ok ? "OK" : "FAIL") << "\n";

    std::cout << (ok ? "ALL TESTS PASSED\n" : "SOME TESTS FAILED\n");
    return ok ? 0 : 1;
}
