#include "pixvault.hpp"
#include "erasure_coder.hpp"

extern "C" {
#include <libavutil/log.h>
}

#include <algorithm>
#include <cctype>
#include <mutex>

namespace {
std::once_flag g_init_once;
}

ErrorCode library_init(LogLevel level) {
    std::call_once(g_init_once, [level]() {
        av_log_set_level(AV_LOG_ERROR);
        set_log_level(level);
        init_galois_field();
        LOG_DEBUG("INIT", "pixvault " << PIXVAULT_VERSION << " initialised");
    });
    return ErrorCode::Success;
}

const char* library_version() {
    return "pixvault " PIXVAULT_VERSION;
}

const char* encode_state_name(EncodeState state) {
    switch (state) {
        case EncodeState::Idle:      return "idle";
        case EncodeState::Preparing: return "preparing";
        case EncodeState::Chunking:  return "chunking";
        case EncodeState::Rendering: return "rendering";
        case EncodeState::Finalized: return "finalized";
        case EncodeState::Failed:    return "failed";
    }
    return "unknown";
}

const char* decode_state_name(DecodeState state) {
    switch (state) {
        case DecodeState::Idle:             return "idle";
        case DecodeState::OpeningContainer: return "opening-container";
        case DecodeState::Reading:          return "reading";
        case DecodeState::Reassembling:     return "reassembling";
        case DecodeState::Decompressing:    return "decompressing";
        case DecodeState::Verifying:        return "verifying";
        case DecodeState::Done:             return "done";
        case DecodeState::Failed:           return "failed";
    }
    return "unknown";
}

void DecodeParams::validate() const {
    validate_resolution(width, height);
    if (chunk_size == 0 || chunk_size > kMaxChunkSize) {
        throw InvalidInputError("Chunk size must be between 1 and 10485760 bytes");
    }
    if (!expected_checksum.empty()) {
        const bool hex = std::all_of(expected_checksum.begin(), expected_checksum.end(),
                                     [](unsigned char c) { return std::isxdigit(c) != 0; });
        if (expected_checksum.size() != 64 || !hex) {
            throw InvalidInputError("Expected checksum must be 64 hex characters (SHA-256)");
        }
    }
}

EncodeResult encode_file(const std::string& input_path, const std::string& output_path,
                         const CodecConfig& config, ProgressSink* sink,
                         const CancellationToken* cancel) {
    EncodeJob job(config);
    return job.run(input_path, output_path, sink, cancel);
}

DecodeResult decode_file(const std::string& input_path, const std::string& output_path,
                         const DecodeParams& params, ProgressSink* sink,
                         const CancellationToken* cancel) {
    DecodeJob job(params);
    return job.run(input_path, output_path, sink, cancel);
}
