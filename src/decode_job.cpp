#include "pixvault.hpp"
#include "erasure_coder.hpp"
#include "ffmpeg_decoder.hpp"
#include "frame_geometry.hpp"
#include "frame_sequencer.hpp"
#include "job_guard.hpp"
#include "pattern_codec.hpp"
#include "payload.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>

DecodeJob::DecodeJob(DecodeParams params) : m_params(std::move(params)) {
    library_init();
    m_params.validate();
}

void DecodeJob::enter(DecodeState next) {
    m_state.store(next);
    LOG_DEBUG("DECODER", "state -> " << decode_state_name(next));
}

DecodeResult DecodeJob::run(const std::string& input_path, const std::string& output_path,
                            ProgressSink* sink, const CancellationToken* cancel) {
    RunGuard guard(m_running, "Decode");
    if (m_state.load() != DecodeState::Idle) {
        throw JobStateError(ErrorCode::InvalidHandle,
                            std::string("Decode job already ended (") + decode_state_name(m_state.load()) + ")");
    }

    bool output_created = false;
    try {
        return execute(input_path, output_path, sink, cancel, output_created);
    } catch (const VaultError& e) {
        enter(DecodeState::Failed);
        LOG_ERROR("DECODER", error_code_name(e.code()) << ": " << e.what());
        if (output_created) remove_partial_output(output_path);
        throw;
    } catch (const std::exception& e) {
        enter(DecodeState::Failed);
        LOG_ERROR("DECODER", "Unexpected failure: " << e.what());
        if (output_created) remove_partial_output(output_path);
        throw VaultError(ErrorCode::Unknown, e.what());
    }
}

DecodeResult DecodeJob::execute(const std::string& input_path, const std::string& output_path,
                                ProgressSink* sink, const CancellationToken* cancel,
                                bool& output_created) {
    enter(DecodeState::OpeningContainer);
    notify_progress(sink, 0, 0, "Starting decode of " + input_path);

    const DecodeParams& p = m_params;
    std::error_code ec;
    if (!std::filesystem::is_regular_file(input_path, ec)) {
        throw InvalidInputError("Video file not found: " + input_path);
    }

    // an oversized chunk size fails here, it cannot match any encoding
    const FrameGeometry geometry = derive_geometry(p.width, p.height, p.chunk_size);
    const uint64_t expected_frames = estimate_artifact_frames(p.encoded_payload_size, p.chunk_size);

    std::ofstream out(output_path, std::ios::binary | std::ios::trunc);
    if (!out) throw IoError("Cannot create output file: " + output_path);
    output_created = true;

    PayloadRestorer restorer(p.use_compression, [&](const uint8_t* data, size_t n) {
        out.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(n));
        if (!out) throw IoError("Write failed on " + output_path);
    });

    DecodeResult result;
    if (expected_frames > 0) {
        FFmpegDecoder video(input_path);
        ErasureCoder fec;
        WorkerPool pool(resolve_thread_count(p.num_threads));
        FrameSequenceReader reader(video, geometry, p.pattern_style, fec, pool, expected_frames);

        enter(DecodeState::Reading);
        uint64_t payload_left = p.encoded_payload_size;
        DecodedChunk chunk;
        while (reader.next(chunk)) {
            if (cancel) cancel->throwIfCancelled("reading frames");
            if (m_state.load() == DecodeState::Reading) enter(DecodeState::Reassembling);

            // the last chunk carries padding beyond the payload
            const size_t take = static_cast<size_t>(std::min<uint64_t>(payload_left, chunk.bytes.size()));
            restorer.feed(chunk.bytes.data(), take);
            payload_left -= take;

            if (restorer.decompressing() && m_state.load() == DecodeState::Reassembling) {
                enter(DecodeState::Decompressing);
            }
            notify_progress(sink, p.encoded_payload_size - payload_left, reader.framesRead(),
                            "Decoded frame " + std::to_string(reader.framesRead()));
        }
        result.frames_read = reader.framesRead();
        result.repaired_frames = reader.repairedFrames();
        result.pattern_style = reader.style();
        if (reader.damagedFrames() > 0) {
            LOG_WARN("DECODER", reader.damagedFrames() << " frame(s) could not be fully repaired");
        }
    } else {
        LOG_INFO("DECODER", "Empty payload, no frames to read from " << input_path);
        result.pattern_style = p.pattern_style.value_or(PatternStyle::Rings);
    }

    enter(DecodeState::Verifying);
    result.checksum = restorer.finish();
    out.close();
    if (!out) throw IoError("Failed to finalize " + output_path);

    verify_checksum(p.expected_checksum, result.checksum);
    result.checksum_verified = !p.expected_checksum.empty();
    result.restored_size = restorer.restored_size();
    result.was_compressed = restorer.decompressing();

    if (!result.checksum_verified && !result.was_compressed) {
        LOG_WARN("DECODER", "Raw payload restored without an expected checksum, integrity unverified");
    }

    enter(DecodeState::Done);
    notify_progress(sink, result.restored_size, result.frames_read, "Decoding complete");
    LOG_INFO("DECODER", input_path << " -> " << output_path << ": " << result.restored_size
             << " bytes from " << result.frames_read << " frames, sha256 " << result.checksum
             << (result.checksum_verified ? " (verified)" : ""));
    return result;
}
