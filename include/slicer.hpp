#pragma once
#include <vector>
#include <cstdint>
#include <cstddef>
#include <functional>

struct Chunk {
    uint64_t index;
    std::vector<uint8_t> payload;   // <= chunk_size bytes, only the last one may be short
};

// Slice an in-memory payload into ceil(size / chunk_size) chunks (no padding)
std::vector<Chunk> slice_payload(const std::vector<uint8_t>& payload, size_t chunk_size);

// Streaming form: bytes arrive in arbitrary pieces, full chunks are emitted as
// soon as they are complete, the short tail on finish().
class ChunkSlicer {
public:
    ChunkSlicer(size_t chunk_size, std::function<void(Chunk)> emit);

    void feed(const uint8_t* data, size_t n);
    void finish();

    uint64_t chunks_emitted() const { return next_index_; }

private:
    void flush_pending();

    size_t chunk_size_;
    std::function<void(Chunk)> emit_;
    std::vector<uint8_t> pending_;
    uint64_t next_index_ = 0;
};
