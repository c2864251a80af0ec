#include "slicer.hpp"
#include "errors.hpp"
#include <algorithm>

std::vector<Chunk> slice_payload(const std::vector<uint8_t>& payload, size_t chunk_size) {
    std::vector<Chunk> chunks;

    if (chunk_size == 0) throw InvalidInputError("Chunk size must be non-zero");
    if (payload.empty()) return chunks;

    size_t total_chunks = (payload.size() + chunk_size - 1) / chunk_size;
    chunks.reserve(total_chunks);

    for (size_t i = 0; i < total_chunks; ++i) {
        size_t offset = i * chunk_size;
        size_t len = std::min(chunk_size, payload.size() - offset);

        Chunk c;
        c.index = i;
        c.payload.assign(payload.begin() + offset, payload.begin() + offset + len);
        chunks.push_back(std::move(c));
    }

    return chunks;
}

ChunkSlicer::ChunkSlicer(size_t chunk_size, std::function<void(Chunk)> emit)
    : chunk_size_(chunk_size), emit_(std::move(emit)) {
    if (chunk_size_ == 0) throw InvalidInputError("Chunk size must be non-zero");
    pending_.reserve(chunk_size_);
}

void ChunkSlicer::flush_pending() {
    Chunk c;
    c.index = next_index_++;
    c.payload.swap(pending_);
    pending_.reserve(chunk_size_);
    emit_(std::move(c));
}

void ChunkSlicer::feed(const uint8_t* data, size_t n) {
    while (n > 0) {
        size_t take = std::min(n, chunk_size_ - pending_.size());
        pending_.insert(pending_.end(), data, data + take);
        data += take;
        n -= take;
        if (pending_.size() == chunk_size_) flush_pending();
    }
}

void ChunkSlicer::finish() {
    if (!pending_.empty()) flush_pending();
}
