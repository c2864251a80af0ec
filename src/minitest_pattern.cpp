// Mini-tests: symbol templates, frame rendering and reading, style detection

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <random>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

#include "erasure_coder.hpp"
#include "errors.hpp"
#include "frame_geometry.hpp"
#include "pattern_codec.hpp"

#define T_ASSERT(expr) do{ if(!(expr)){ \
    std::cerr << "[FAIL] " << __FUNCTION__ << ":" << __LINE__ << " -> " #expr "\n"; return false; } }while(0)

static std::vector<uint8_t> make_random(size_t n, uint32_t seed) {
    std::mt19937 rng(seed);
    std::vector<uint8_t> out(n);
    for (auto& b : out) b = static_cast<uint8_t>(rng() & 0xFF);
    return out;
}

static bool same_frame(const cv::Mat& a, const cv::Mat& b) {
    return a.size() == b.size() && a.type() == b.type() && cv::norm(a, b, cv::NORM_INF) == 0.0;
}

// Fills every block of one stripe with uniform noise
static void scramble_stripe(cv::Mat& frame, const FrameGeometry& g, size_t stripe) {
    for (size_t cell = stripe * g.stripe_len; cell < (stripe + 1) * g.stripe_len; ++cell) {
        cv::Mat roi = frame(block_rect(g, cell));
        cv::randu(roi, cv::Scalar::all(0), cv::Scalar::all(256));
    }
}

// ------------------ TEST A : templates ---------------------------------------
static bool test_templates() {
    for (int side : {12, 13, 14, 20, 33}) {
        for (PatternStyle style : kAllPatternStyles) {
            SymbolTemplate t = SymbolTemplate::build(style, side);
            T_ASSERT(t.inner.rows == side && t.inner.cols == side);
            T_ASSERT(cv::countNonZero(t.inner) + cv::countNonZero(t.outer) == side * side);
            T_ASSERT(t.inner_core.size() >= 6 && t.outer_core.size() >= 6);
            for (const cv::Point& p : t.inner_core) T_ASSERT(t.inner.at<uchar>(p) == 255);
            for (const cv::Point& p : t.outer_core) T_ASSERT(t.outer.at<uchar>(p) == 255);
        }
    }

    bool threw = false;
    try { SymbolTemplate::build(PatternStyle::Rings, kMinBlockSide - 1); } catch (const ConfigError&) { threw = true; }
    T_ASSERT(threw);

    // levels span the ladder evenly
    T_ASSERT(nibble_level(0) == kLumaLow);
    T_ASSERT(nibble_level(15) == kLumaHigh);
    for (int n = 1; n < kLumaLevels; ++n) T_ASSERT(nibble_level(n) - nibble_level(n - 1) >= 12);
    return true;
}

// ------------------ TEST B : clean render / read -----------------------------
static bool test_clean() {
    ErasureCoder fec;
    const FrameGeometry g = derive_geometry(256, 256, 256);
    const auto chunk = make_random(256, 11);

    for (PatternStyle style : kAllPatternStyles) {
        PatternEncoder enc(g, style, fec);
        cv::Mat frame = enc.render(chunk);
        T_ASSERT(frame.type() == CV_8UC4 && frame.cols == 256 && frame.rows == 256);
        T_ASSERT(same_frame(frame, enc.render(chunk)));

        PatternDecoder dec(g, style, fec);
        DecodedChunk out = dec.decode(frame);
        T_ASSERT(out.bytes == chunk);
        T_ASSERT(out.erased_stripes == 0);
        T_ASSERT(!out.repaired && !out.unrecoverable && !out.parity_mismatch);
        T_ASSERT(out.mean_confidence == 1.0);
    }

    // short chunk: zero padding up to chunk_size
    const std::vector<uint8_t> tiny = {'h', 'e', 'l', 'l', 'o', ' ', 'p', 'i', 'x', '!'};
    PatternEncoder enc(g, PatternStyle::Sweep, fec);
    DecodedChunk out = PatternDecoder(g, PatternStyle::Sweep, fec).decode(enc.render(tiny));
    T_ASSERT(out.bytes.size() == g.chunk_size);
    T_ASSERT(std::equal(tiny.begin(), tiny.end(), out.bytes.begin()));
    for (size_t i = tiny.size(); i < out.bytes.size(); ++i) T_ASSERT(out.bytes[i] == 0);

    // styles draw different pictures of the same bytes
    T_ASSERT(!same_frame(PatternEncoder(g, PatternStyle::Rings, fec).render(chunk),
                         PatternEncoder(g, PatternStyle::NestedSquares, fec).render(chunk)));
    return true;
}

// ------------------ TEST C : noise and blur ----------------------------------
static bool test_degraded() {
    ErasureCoder fec;
    const FrameGeometry g = derive_geometry(256, 256, 256);
    const auto chunk = make_random(256, 12);
    cv::theRNG().state = 12345;

    for (PatternStyle style : kAllPatternStyles) {
        cv::Mat frame = PatternEncoder(g, style, fec).render(chunk);
        cv::GaussianBlur(frame, frame, cv::Size(3, 3), 0.8);

        cv::Mat noisy;
        frame.convertTo(noisy, CV_32FC4);
        cv::Mat noise(frame.size(), CV_32FC4);
        cv::randn(noise, cv::Scalar::all(0), cv::Scalar::all(2.5));
        noisy += noise;
        noisy.convertTo(frame, CV_8UC4);

        DecodedChunk out = PatternDecoder(g, style, fec).decode(frame);
        T_ASSERT(out.bytes == chunk);
        T_ASSERT(!out.unrecoverable && !out.parity_mismatch);
        T_ASSERT(out.mean_confidence > 0.8);
    }
    return true;
}

// ------------------ TEST D : stripe damage -----------------------------------
static bool test_damage() {
    ErasureCoder fec;
    const FrameGeometry g = derive_geometry(256, 256, 256);
    const auto chunk = make_random(256, 13);
    PatternEncoder enc(g, PatternStyle::Rings, fec);
    PatternDecoder dec(g, PatternStyle::Rings, fec);
    cv::theRNG().state = 777;

    // one data stripe plus one parity stripe: rebuilt
    cv::Mat frame = enc.render(chunk);
    scramble_stripe(frame, g, 2);
    scramble_stripe(frame, g, 8);
    DecodedChunk out = dec.decode(frame);
    T_ASSERT(out.erased_stripes == 2);
    T_ASSERT(out.repaired && !out.unrecoverable);
    T_ASSERT(out.bytes == chunk);

    // three stripes: beyond the parity budget
    scramble_stripe(frame, g, 5);
    out = dec.decode(frame);
    T_ASSERT(out.erased_stripes == 3);
    T_ASSERT(out.unrecoverable && !out.repaired);

    // confidently wrong blocks are not erasures, parity flags them
    frame = enc.render(chunk);
    for (size_t cell = 0; cell < g.stripe_len; ++cell) {
        frame(block_rect(g, cell)).setTo(cv::Scalar(128, 128, 128, 255));
    }
    out = dec.decode(frame);
    T_ASSERT(out.erased_stripes == 0);
    T_ASSERT(out.parity_mismatch);
    T_ASSERT(out.bytes != chunk);
    return true;
}

// ------------------ TEST E : style detection ---------------------------------
static bool test_detect() {
    ErasureCoder fec;
    const FrameGeometry g = derive_geometry(1280, 720, 4096);
    const auto chunk = make_random(4096, 14);

    for (PatternStyle style : kAllPatternStyles) {
        cv::Mat frame = PatternEncoder(g, style, fec).render(chunk);
        T_ASSERT(detect_style(frame, g, fec) == style);

        cv::GaussianBlur(frame, frame, cv::Size(3, 3), 0.8);
        T_ASSERT(detect_style(frame, g, fec) == style);
    }
    return true;
}

// ------------------ TEST F : misuse ------------------------------------------
static bool test_misuse() {
    ErasureCoder fec;
    const FrameGeometry g = derive_geometry(256, 256, 256);
    PatternEncoder enc(g, PatternStyle::Rings, fec);
    PatternDecoder dec(g, PatternStyle::Rings, fec);

    bool threw = false;
    try { enc.render(make_random(257, 15)); } catch (const EncodingError&) { threw = true; }
    T_ASSERT(threw);

    threw = false;
    cv::Mat small(128, 128, CV_8UC4, cv::Scalar::all(0));
    try { dec.decode(small); } catch (const DecodingError&) { threw = true; }
    T_ASSERT(threw);

    threw = false;
    cv::Mat bgr(256, 256, CV_8UC3, cv::Scalar::all(0));
    try { dec.decode(bgr); } catch (const DecodingError&) { threw = true; }
    T_ASSERT(threw);
    return true;
}

int main() {
    bool ok = true;

    ok &= test_templates();
    std::cout << "[A] symbol templates : " << (ok ? "OK" : "FAIL") << "\n";

    ok &= test_clean();
    std::cout << "[B] clean render/read : " << (ok ? "OK" : "FAIL") << "\n";

    ok &= test_degraded();
    std::cout << "[C] blur + noise : " << (ok ? "OK" : "FAIL") << "\n";

    ok &= test_damage();
    std::cout << "[D] stripe damage : " << (ok ? "OK" : "FAIL") << "\n";

    ok &= test_detect();
    std::cout << "[E] style detection : " << (ok ? "OK" : "FAIL") << "\n";

    ok &= test_misuse();
    std::cout << "[F] misuse : " << (ok ? "OK" : "FAIL") << "\n";

    std::cout << (ok ? "ALL TESTS PASSED\n" : "SOME TESTS FAILED\n");
    return ok ? 0 : 1;
}
