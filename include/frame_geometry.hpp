#ifndef PIXVAULT_FRAME_GEOMETRY_HPP
#define PIXVAULT_FRAME_GEOMETRY_HPP

#include <cstddef>
#include <cstdint>
#include <opencv2/core.hpp>

// Intra-frame FEC layout: every chunk is spread over k data stripes and
// protected by r Reed-Solomon parity stripes.
constexpr int kDataStripes = 8;
constexpr int kParityStripes = 2;
constexpr int kTotalStripes = kDataStripes + kParityStripes;

// Smallest symbol block edge in pixels (144 pixels per byte)
constexpr int kMinBlockSide = 12;

// Symbol i lives in stripe i / stripe_len, at byte i % stripe_len, and is
// drawn in grid cell i in raster order. A burst of damaged blocks therefore
// costs few whole stripes instead of one symbol in many codewords.
struct FrameGeometry {
    int width = 0;
    int height = 0;
    size_t chunk_size = 0;
    size_t stripe_len = 0;      // multiple of 8 (jerasure w=8 packet alignment)
    size_t symbol_count = 0;    // kTotalStripes * stripe_len
    int block_side = 0;
    int cols = 0;
    int rows = 0;
    int origin_x = 0;           // grid is centred, margins are filler
    int origin_y = 0;

    size_t data_capacity() const { return kDataStripes * stripe_len; }
    size_t grid_cells() const { return static_cast<size_t>(cols) * static_cast<size_t>(rows); }
};

// Throws ConfigError when chunk_size cannot be represented with blocks of at
// least kMinBlockSide pixels at this resolution.
FrameGeometry derive_geometry(int width, int height, size_t chunk_size);

// Largest chunk size representable at (width, height); 0 if none.
size_t max_chunk_size(int width, int height);

// min(requested, max_chunk_size). Throws ConfigError if nothing fits.
size_t effective_chunk_size(int width, int height, size_t requested);

// Frames needed for a payload: ceil(payload_size / chunk_size).
uint64_t estimate_artifact_frames(uint64_t payload_size, size_t chunk_size);

// Rough artifact size: half the raw RGB24 frame data. Dense patterns rarely
// compress better than that at the default crf.
uint64_t estimate_artifact_size(int width, int height, uint64_t payload_size, size_t chunk_size);

// Pixel rectangle of grid cell `cell` (raster order)
cv::Rect block_rect(const FrameGeometry& geometry, size_t cell);

#endif // PIXVAULT_FRAME_GEOMETRY_HPP
