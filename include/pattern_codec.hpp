#ifndef PIXVAULT_PATTERN_CODEC_HPP
#define PIXVAULT_PATTERN_CODEC_HPP

#include <array>
#include <cstdint>
#include <vector>

#include <opencv2/core.hpp>

#include "codec_config.hpp"
#include "erasure_coder.hpp"
#include "frame_geometry.hpp"
#include "slicer.hpp"

// Luma ladder shared by both directions: nibble n is drawn at
// kLumaLow + round(n * (kLumaHigh - kLumaLow) / 15).
constexpr int kLumaLow = 32;
constexpr int kLumaHigh = 220;
constexpr int kLumaLevels = 16;

// Chroma offset of tinted blocks; small enough that no RGB channel clips
constexpr double kTintAmplitude = 14.0;
constexpr int kTintHues = 12;

// A block whose weaker region wins with less than this share of the votes
// is not trusted, and its whole stripe is handed to the erasure decoder.
constexpr double kMinVoteShare = 0.6;

int nibble_level(int nibble);

// Per-style split of a block into an inner region (high nibble) and an outer
// region (low nibble). The cores drop a margin along both the block border
// and the inner/outer boundary, where the video codec smears edges.
struct SymbolTemplate {
    PatternStyle style = PatternStyle::Rings;
    int side = 0;
    cv::Mat inner;          // CV_8U, 255 inside
    cv::Mat outer;
    std::vector<cv::Point> inner_core;
    std::vector<cv::Point> outer_core;

    static SymbolTemplate build(PatternStyle style, int side);
};

// Draws one chunk per RGBA frame. Output depends only on the chunk bytes,
// the geometry and the style.
class PatternEncoder {
public:
    PatternEncoder(const FrameGeometry& geometry, PatternStyle style, const ErasureCoder& fec);

    // Throws EncodingError if the chunk is larger than the geometry's chunk size
    cv::Mat render(const std::vector<uint8_t>& chunk) const;
    cv::Mat render(const Chunk& chunk) const { return render(chunk.payload); }

    const FrameGeometry& geometry() const { return geometry_; }
    PatternStyle style() const { return tmpl_.style; }

private:
    void paint_block(cv::Mat& frame, size_t cell, uint8_t symbol, bool pad) const;

    FrameGeometry geometry_;
    SymbolTemplate tmpl_;
    const ErasureCoder& fec_;
    // [hue][level], hue == kTintHues is the neutral tint used for padding
    std::array<std::array<cv::Scalar, kLumaLevels>, kTintHues + 1> palette_;
};

struct BlockVote {
    uint8_t symbol = 0;
    double confidence = 0.0;   // min(inner share, outer share)
};

struct DecodedChunk {
    std::vector<uint8_t> bytes;       // always geometry.chunk_size bytes
    int erased_stripes = 0;
    bool repaired = false;            // erasures were rebuilt from parity
    bool unrecoverable = false;       // more erasures than parity, best-effort bytes
    bool parity_mismatch = false;     // no erasures, yet parity disagrees
    double mean_confidence = 0.0;
};

class PatternDecoder {
public:
    PatternDecoder(const FrameGeometry& geometry, PatternStyle style, const ErasureCoder& fec);

    // Frame must be CV_8UC4 RGBA at the geometry's resolution (DecodingError otherwise)
    DecodedChunk decode(const cv::Mat& frame) const;

    BlockVote read_block(const cv::Mat& frame, size_t cell) const;
    double mean_confidence(const cv::Mat& frame) const;

    const FrameGeometry& geometry() const { return geometry_; }
    PatternStyle style() const { return tmpl_.style; }

private:
    void check_frame(const cv::Mat& frame) const;

    FrameGeometry geometry_;
    SymbolTemplate tmpl_;
    const ErasureCoder& fec_;
    std::array<uint8_t, 256> nearest_;   // luma -> nibble
};

// Style whose templates explain the frame best; ties go to the lowest enum value
PatternStyle detect_style(const cv::Mat& frame, const FrameGeometry& geometry, const ErasureCoder& fec);

#endif // PIXVAULT_PATTERN_CODEC_HPP
