#include "pixvault.hpp"
#include "erasure_coder.hpp"
#include "ffmpeg_encoder.h"
#include "frame_geometry.hpp"
#include "frame_sequencer.hpp"
#include "job_guard.hpp"
#include "pattern_codec.hpp"
#include "payload.hpp"
#include "slicer.hpp"

#include <filesystem>
#include <fstream>
#include <vector>

EncodeJob::EncodeJob(CodecConfig config) : m_config(std::move(config)) {
    library_init();
    m_config.validate();
}

void EncodeJob::enter(EncodeState next) {
    m_state.store(next);
    LOG_DEBUG("ENCODER", "state -> " << encode_state_name(next));
}

EncodeResult EncodeJob::run(const std::string& input_path, const std::string& output_path,
                            ProgressSink* sink, const CancellationToken* cancel) {
    RunGuard guard(m_running, "Encode");
    if (m_state.load() != EncodeState::Idle) {
        throw JobStateError(ErrorCode::InvalidHandle,
                            std::string("Encode job already ended (") + encode_state_name(m_state.load()) + ")");
    }

    bool output_created = false;
    try {
        return execute(input_path, output_path, sink, cancel, output_created);
    } catch (const VaultError& e) {
        enter(EncodeState::Failed);
        LOG_ERROR("ENCODER", error_code_name(e.code()) << ": " << e.what());
        if (output_created) remove_partial_output(output_path);
        throw;
    } catch (const std::exception& e) {
        enter(EncodeState::Failed);
        LOG_ERROR("ENCODER", "Unexpected failure: " << e.what());
        if (output_created) remove_partial_output(output_path);
        throw VaultError(ErrorCode::Unknown, e.what());
    }
}

EncodeResult EncodeJob::execute(const std::string& input_path, const std::string& output_path,
                                ProgressSink* sink, const CancellationToken* cancel,
                                bool& output_created) {
    enter(EncodeState::Preparing);
    notify_progress(sink, 0, 0, "Starting encode of " + input_path);

    std::error_code ec;
    if (!std::filesystem::is_regular_file(input_path, ec)) {
        throw InvalidInputError("Input file not found: " + input_path);
    }
    std::ifstream in(input_path, std::ios::binary);
    if (!in) throw InvalidInputError("Cannot open input file: " + input_path);

    const CodecConfig& cfg = m_config;
    const size_t chunk_size = effective_chunk_size(cfg.width, cfg.height, cfg.chunk_size);
    const FrameGeometry geometry = derive_geometry(cfg.width, cfg.height, chunk_size);
    LOG_INFO("ENCODER", "Chunk size " << chunk_size << " -> " << geometry.cols << "x" << geometry.rows
             << " grid of " << geometry.block_side << "px blocks, style " << pattern_style_name(cfg.pattern_style));
    const uint64_t input_size = std::filesystem::file_size(input_path, ec);
    if (!ec) {
        // upper bound before compression
        LOG_INFO("ENCODER", "Expect up to " << estimate_artifact_frames(input_size, chunk_size) << " frames, ~"
                 << estimate_artifact_size(cfg.width, cfg.height, input_size, chunk_size) / (1024 * 1024)
                 << " MiB of video");
    }

    // read-only from here on, shared by the render workers
    ErasureCoder fec;
    PatternEncoder pattern(geometry, cfg.pattern_style, fec);
    WorkerPool pool(resolve_thread_count(cfg.num_threads));

    // a session that fails to start cleans up after itself
    FFmpegEncoder video(output_path, cfg.width, cfg.height, cfg.fps, cfg.video);
    output_created = true;

    uint64_t payload_done = 0;
    FrameSequenceWriter writer(pattern, video, pool, [&](uint64_t index, size_t bytes) {
        payload_done += bytes;
        notify_progress(sink, payload_done, index + 1, "Encoded frame " + std::to_string(index + 1));
        if (cancel) cancel->throwIfCancelled("rendering");
    });

    ChunkSlicer slicer(chunk_size, [&](Chunk chunk) {
        if (m_state.load() != EncodeState::Rendering) enter(EncodeState::Rendering);
        writer.submit(std::move(chunk));
    });
    PayloadPreparer preparer(cfg.use_compression, cfg.compression_level,
                             [&](const uint8_t* data, size_t n) { slicer.feed(data, n); });

    enter(EncodeState::Chunking);
    std::vector<char> buffer(cfg.read_buffer_size);
    while (in) {
        if (cancel) cancel->throwIfCancelled("reading input");
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const std::streamsize got = in.gcount();
        if (got > 0) preparer.feed(reinterpret_cast<const uint8_t*>(buffer.data()), static_cast<size_t>(got));
    }
    if (in.bad()) throw IoError("Read failed on " + input_path);

    preparer.finish();
    slicer.finish();
    writer.drain();
    if (cancel) cancel->throwIfCancelled("finalizing");
    video.finish();

    EncodeResult result;
    result.encoded_payload_size = preparer.payload_size();
    result.effective_chunk_size = chunk_size;
    result.checksum = preparer.checksum();
    result.original_size = preparer.original_size();
    result.frame_count = writer.framesWritten();
    result.compressed = preparer.compressed();

    enter(EncodeState::Finalized);
    notify_progress(sink, result.encoded_payload_size, result.frame_count, "Encoding complete");
    LOG_INFO("ENCODER", input_path << " (" << result.original_size << " bytes) -> " << output_path << ": "
             << result.frame_count << " frames, payload " << result.encoded_payload_size
             << " bytes, chunk " << result.effective_chunk_size);
    return result;
}
