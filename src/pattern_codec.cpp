#include "pattern_codec.hpp"
#include "errors.hpp"
#include "logging.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <string>

#include <opencv2/imgproc.hpp>

int nibble_level(int nibble) {
    return kLumaLow + (nibble * (kLumaHigh - kLumaLow) + 7) / 15;
}

namespace {

// Full-range BT.601, returned in the frame's RGBA channel order
cv::Scalar rgba_from_ycbcr(double y, double cb, double cr) {
    const double r = y + 1.402 * (cr - 128.0);
    const double g = y - 0.344136 * (cb - 128.0) - 0.714136 * (cr - 128.0);
    const double b = y + 1.772 * (cb - 128.0);
    return cv::Scalar(cv::saturate_cast<uchar>(r), cv::saturate_cast<uchar>(g),
                      cv::saturate_cast<uchar>(b), 255);
}

int block_hue(const FrameGeometry& g, size_t cell, PatternStyle style) {
    const int col = static_cast<int>(cell % static_cast<size_t>(g.cols));
    const int row = static_cast<int>(cell / static_cast<size_t>(g.cols));
    return (col * 5 + row * 3 + static_cast<int>(style)) % kTintHues;
}

std::vector<cv::Point> core_points(const cv::Mat& region, int margin) {
    cv::Mat kernel = cv::getStructuringElement(cv::MORPH_RECT, cv::Size(2 * margin + 1, 2 * margin + 1));
    cv::Mat core;
    // constant 0 outside the block: the block border erodes too
    cv::erode(region, core, kernel, cv::Point(-1, -1), 1, cv::BORDER_CONSTANT, cv::Scalar(0));
    std::vector<cv::Point> points;
    if (cv::countNonZero(core) > 0) cv::findNonZero(core, points);
    return points;
}

} // namespace

// ---------------------- SymbolTemplate ----------------------

SymbolTemplate SymbolTemplate::build(PatternStyle style, int side) {
    if (side < kMinBlockSide) {
        throw ConfigError("Block side " + std::to_string(side) + " below minimum " + std::to_string(kMinBlockSide));
    }

    SymbolTemplate t;
    t.style = style;
    t.side = side;
    t.inner = cv::Mat::zeros(side, side, CV_8U);

    switch (style) {
        case PatternStyle::Rings: {
            // centred disc, coordinates in half pixels (shift = 1)
            const int radius = cvRound(2.0 * side * 0.3);
            cv::circle(t.inner, cv::Point(side - 1, side - 1), radius, cv::Scalar(255),
                       cv::FILLED, cv::LINE_8, 1);
            break;
        }
        case PatternStyle::NestedSquares: {
            // square of half the block area nested into the top-left corner
            const int q = cvRound(side / std::sqrt(2.0));
            cv::rectangle(t.inner, cv::Rect(0, 0, q, q), cv::Scalar(255), cv::FILLED);
            break;
        }
        case PatternStyle::Sweep: {
            // upper-right half, swept from the top edge to the main diagonal
            const std::vector<cv::Point> wedge = {
                cv::Point(1, 0), cv::Point(side - 1, 0), cv::Point(side - 1, side - 2)};
            cv::fillConvexPoly(t.inner, wedge, cv::Scalar(255), cv::LINE_8);
            break;
        }
    }
    cv::bitwise_not(t.inner, t.outer);

    const int margin = std::max(1, side / 8);
    t.inner_core = core_points(t.inner, margin);
    t.outer_core = core_points(t.outer, margin);
    if (t.inner_core.empty() || t.outer_core.empty()) {
        throw ConfigError(std::string("Pattern style '") + pattern_style_name(style) +
                          "' leaves no readable core at block side " + std::to_string(side));
    }
    return t;
}

// ---------------------- PatternEncoder ----------------------

PatternEncoder::PatternEncoder(const FrameGeometry& geometry, PatternStyle style, const ErasureCoder& fec)
    : geometry_(geometry), tmpl_(SymbolTemplate::build(style, geometry.block_side)), fec_(fec) {
    const double pi = std::acos(-1.0);
    for (int hue = 0; hue <= kTintHues; ++hue) {
        double cb = 128.0, cr = 128.0;
        if (hue < kTintHues) {
            const double angle = 2.0 * pi * hue / kTintHues;
            cb += kTintAmplitude * std::cos(angle);
            cr += kTintAmplitude * std::sin(angle);
        }
        for (int n = 0; n < kLumaLevels; ++n) {
            palette_[hue][n] = rgba_from_ycbcr(nibble_level(n), cb, cr);
        }
    }
}

void PatternEncoder::paint_block(cv::Mat& frame, size_t cell, uint8_t symbol, bool pad) const {
    cv::Mat roi = frame(block_rect(geometry_, cell));
    const int hue = pad ? kTintHues : block_hue(geometry_, cell, tmpl_.style);
    roi.setTo(palette_[hue][symbol >> 4], tmpl_.inner);
    roi.setTo(palette_[hue][symbol & 0x0F], tmpl_.outer);
}

cv::Mat PatternEncoder::render(const std::vector<uint8_t>& chunk) const {
    if (chunk.size() > geometry_.chunk_size) {
        throw EncodingError("Chunk of " + std::to_string(chunk.size()) + " bytes exceeds chunk size " +
                            std::to_string(geometry_.chunk_size));
    }

    // data stripes: chunk bytes then 0x00 padding; parity computed over both
    std::vector<uint8_t> stripes(geometry_.symbol_count, 0);
    std::copy(chunk.begin(), chunk.end(), stripes.begin());
    fec_.encode(stripes, geometry_.stripe_len);

    // filler cells and margins stay mid-grey
    cv::Mat frame(geometry_.height, geometry_.width, CV_8UC4, cv::Scalar(128, 128, 128, 255));
    const size_t data_end = geometry_.data_capacity();
    for (size_t cell = 0; cell < geometry_.symbol_count; ++cell) {
        const bool pad = cell >= chunk.size() && cell < data_end;
        paint_block(frame, cell, stripes[cell], pad);
    }
    return frame;
}

// ---------------------- PatternDecoder ----------------------

PatternDecoder::PatternDecoder(const FrameGeometry& geometry, PatternStyle style, const ErasureCoder& fec)
    : geometry_(geometry), tmpl_(SymbolTemplate::build(style, geometry.block_side)), fec_(fec) {
    for (int luma = 0; luma < 256; ++luma) {
        int best = 0;
        for (int n = 1; n < kLumaLevels; ++n) {
            if (std::abs(luma - nibble_level(n)) < std::abs(luma - nibble_level(best))) best = n;
        }
        nearest_[luma] = static_cast<uint8_t>(best);
    }
}

void PatternDecoder::check_frame(const cv::Mat& frame) const {
    if (frame.type() != CV_8UC4 || frame.cols != geometry_.width || frame.rows != geometry_.height) {
        throw DecodingError("Frame is " + std::to_string(frame.cols) + "x" + std::to_string(frame.rows) +
                            " (type " + std::to_string(frame.type()) + "), expected RGBA " +
                            std::to_string(geometry_.width) + "x" + std::to_string(geometry_.height));
    }
}

BlockVote PatternDecoder::read_block(const cv::Mat& frame, size_t cell) const {
    const cv::Mat roi = frame(block_rect(geometry_, cell));

    auto vote = [&](const std::vector<cv::Point>& core, double& share) {
        std::array<int, kLumaLevels> hist{};
        for (const cv::Point& p : core) {
            const uchar* px = roi.ptr<uchar>(p.y) + 4 * p.x;
            const int luma = (77 * px[0] + 150 * px[1] + 29 * px[2] + 128) >> 8;
            ++hist[nearest_[luma]];
        }
        int winner = 0;
        for (int n = 1; n < kLumaLevels; ++n) {
            if (hist[n] > hist[winner]) winner = n;
        }
        share = static_cast<double>(hist[winner]) / static_cast<double>(core.size());
        return winner;
    };

    double inner_share = 0.0, outer_share = 0.0;
    const int high = vote(tmpl_.inner_core, inner_share);
    const int low = vote(tmpl_.outer_core, outer_share);

    BlockVote v;
    v.symbol = static_cast<uint8_t>((high << 4) | low);
    v.confidence = std::min(inner_share, outer_share);
    return v;
}

double PatternDecoder::mean_confidence(const cv::Mat& frame) const {
    check_frame(frame);
    double sum = 0.0;
    for (size_t cell = 0; cell < geometry_.symbol_count; ++cell) {
        sum += read_block(frame, cell).confidence;
    }
    return sum / static_cast<double>(geometry_.symbol_count);
}

DecodedChunk PatternDecoder::decode(const cv::Mat& frame) const {
    check_frame(frame);

    std::vector<uint8_t> stripes(geometry_.symbol_count);
    std::vector<bool> erased(kTotalStripes, false);
    double confidence_sum = 0.0;

    for (size_t cell = 0; cell < geometry_.symbol_count; ++cell) {
        const BlockVote v = read_block(frame, cell);
        stripes[cell] = v.symbol;
        confidence_sum += v.confidence;
        if (v.confidence < kMinVoteShare) erased[cell / geometry_.stripe_len] = true;
    }

    DecodedChunk out;
    out.mean_confidence = confidence_sum / static_cast<double>(geometry_.symbol_count);
    out.erased_stripes = static_cast<int>(std::count(erased.begin(), erased.end(), true));

    if (out.erased_stripes == 0) {
        out.parity_mismatch = !fec_.parity_consistent(stripes, geometry_.stripe_len);
    } else if (out.erased_stripes <= fec_.parity_stripes() &&
               fec_.decode(stripes, geometry_.stripe_len, erased)) {
        out.repaired = true;
    } else {
        out.unrecoverable = true;
    }

    out.bytes.assign(stripes.begin(), stripes.begin() + static_cast<std::ptrdiff_t>(geometry_.chunk_size));
    return out;
}

PatternStyle detect_style(const cv::Mat& frame, const FrameGeometry& geometry, const ErasureCoder& fec) {
    PatternStyle best = kAllPatternStyles[0];
    double best_score = -1.0;
    for (PatternStyle style : kAllPatternStyles) {
        const double score = PatternDecoder(geometry, style, fec).mean_confidence(frame);
        LOG_DEBUG("PATTERN", "style " << pattern_style_name(style) << " scores " << score);
        if (score > best_score) {
            best_score = score;
            best = style;
        }
    }
    return best;
}
