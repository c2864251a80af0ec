#include "frame_geometry.hpp"
#include "errors.hpp"
#include "logging.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace {

size_t stripe_length(size_t chunk_size) {
    size_t per_stripe = (chunk_size + kDataStripes - 1) / kDataStripes;
    return (per_stripe + 7) / 8 * 8;
}

size_t cells_at(int width, int height, int side) {
    return static_cast<size_t>(width / side) * static_cast<size_t>(height / side);
}

} // namespace

size_t max_chunk_size(int width, int height) {
    if (width < kMinBlockSide || height < kMinBlockSide) return 0;
    size_t stripe = cells_at(width, height, kMinBlockSide) / kTotalStripes / 8 * 8;
    return kDataStripes * stripe;
}

size_t effective_chunk_size(int width, int height, size_t requested) {
    size_t max_size = max_chunk_size(width, height);
    if (max_size == 0) {
        throw ConfigError("Resolution " + std::to_string(width) + "x" + std::to_string(height) +
                          " cannot carry any data, unrecoverable even after clamping");
    }
    if (requested > max_size) {
        LOG_WARN("GEOMETRY", "chunk size " << requested << " does not fit " << width << "x" << height
                 << " with " << kMinBlockSide << "px blocks, clamped to " << max_size);
        return max_size;
    }
    return requested;
}

FrameGeometry derive_geometry(int width, int height, size_t chunk_size) {
    if (chunk_size == 0) throw ConfigError("Chunk size must be non-zero");
    if (width <= 0 || height <= 0) throw ConfigError("Frame dimensions must be positive");

    FrameGeometry g;
    g.width = width;
    g.height = height;
    g.chunk_size = chunk_size;
    g.stripe_len = stripe_length(chunk_size);
    g.symbol_count = kTotalStripes * g.stripe_len;

    // upper bound from area, then walk down to the first side that fits
    const double area_side = std::sqrt(static_cast<double>(width) * height / static_cast<double>(g.symbol_count));
    int side = std::min(static_cast<int>(area_side), std::min(width, height));
    while (side >= kMinBlockSide && cells_at(width, height, side) < g.symbol_count) --side;

    if (side < kMinBlockSide) {
        throw ConfigError("Chunk size " + std::to_string(chunk_size) + " does not fit " +
                          std::to_string(width) + "x" + std::to_string(height) +
                          " (max " + std::to_string(max_chunk_size(width, height)) + ")");
    }

    g.block_side = side;
    g.cols = width / side;
    g.rows = height / side;
    g.origin_x = (width - g.cols * side) / 2;
    g.origin_y = (height - g.rows * side) / 2;
    return g;
}

uint64_t estimate_artifact_frames(uint64_t payload_size, size_t chunk_size) {
    if (chunk_size == 0) throw ConfigError("Chunk size must be non-zero");
    return (payload_size + chunk_size - 1) / chunk_size;
}

uint64_t estimate_artifact_size(int width, int height, uint64_t payload_size, size_t chunk_size) {
    const uint64_t frame_bytes = static_cast<uint64_t>(width) * static_cast<uint64_t>(height) * 3;
    return estimate_artifact_frames(payload_size, chunk_size) * frame_bytes / 2;
}

cv::Rect block_rect(const FrameGeometry& geometry, size_t cell) {
    const int col = static_cast<int>(cell % static_cast<size_t>(geometry.cols));
    const int row = static_cast<int>(cell / static_cast<size_t>(geometry.cols));
    return cv::Rect(geometry.origin_x + col * geometry.block_side,
                    geometry.origin_y + row * geometry.block_side,
                    geometry.block_side, geometry.block_side);
}
