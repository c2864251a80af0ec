#ifndef PIXVAULT_HPP
#define PIXVAULT_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "codec_config.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "progress.hpp"

#define PIXVAULT_VERSION "0.1.0"

// One-time library setup (FFmpeg log level, our log level). Safe to call
// from any thread any number of times; only the first call has an effect.
ErrorCode library_init(LogLevel level = LogLevel::Info);
const char* library_version();

struct EncodeResult {
    uint64_t encoded_payload_size = 0;   // bytes actually spread over frames
    size_t effective_chunk_size = 0;     // after clamping, needed to decode
    std::string checksum;                // SHA-256 of the original bytes, hex
    uint64_t original_size = 0;
    uint64_t frame_count = 0;
    bool compressed = false;
};

// Everything the artifact does not describe about itself
struct DecodeParams {
    int width = 1920;
    int height = 1080;
    size_t chunk_size = 4096;
    bool use_compression = true;
    uint64_t encoded_payload_size = 0;
    std::string expected_checksum;              // empty: not verified against a digest
    std::optional<PatternStyle> pattern_style;  // empty: detected from the first frame
    size_t num_threads = 0;

    void validate() const;
};

struct DecodeResult {
    uint64_t restored_size = 0;
    std::string checksum;
    bool checksum_verified = false;
    bool was_compressed = false;
    uint64_t frames_read = 0;
    uint64_t repaired_frames = 0;
    PatternStyle pattern_style = PatternStyle::Rings;
};

enum class EncodeState { Idle, Preparing, Chunking, Rendering, Finalized, Failed };
enum class DecodeState { Idle, OpeningContainer, Reading, Reassembling, Decompressing, Verifying, Done, Failed };

const char* encode_state_name(EncodeState state);
const char* decode_state_name(DecodeState state);

// Single-use encode of one file into one video artifact
class EncodeJob {
public:
    explicit EncodeJob(CodecConfig config);

    EncodeJob(const EncodeJob&) = delete;
    EncodeJob& operator=(const EncodeJob&) = delete;

    // Throws VaultError subclasses; the partial output is removed on failure.
    // JobStateError(OperationInProgress) while another run is active,
    // JobStateError(InvalidHandle) once the job has ended.
    EncodeResult run(const std::string& input_path, const std::string& output_path,
                     ProgressSink* sink = nullptr, const CancellationToken* cancel = nullptr);

    EncodeState state() const { return m_state.load(); }
    const CodecConfig& config() const { return m_config; }

private:
    EncodeResult execute(const std::string& input_path, const std::string& output_path,
                         ProgressSink* sink, const CancellationToken* cancel, bool& output_created);
    void enter(EncodeState next);

    CodecConfig m_config;
    std::atomic<EncodeState> m_state{EncodeState::Idle};
    std::atomic<bool> m_running{false};
};

class DecodeJob {
public:
    explicit DecodeJob(DecodeParams params);

    DecodeJob(const DecodeJob&) = delete;
    DecodeJob& operator=(const DecodeJob&) = delete;

    DecodeResult run(const std::string& input_path, const std::string& output_path,
                     ProgressSink* sink = nullptr, const CancellationToken* cancel = nullptr);

    DecodeState state() const { return m_state.load(); }
    const DecodeParams& params() const { return m_params; }

private:
    DecodeResult execute(const std::string& input_path, const std::string& output_path,
                         ProgressSink* sink, const CancellationToken* cancel, bool& output_created);
    void enter(DecodeState next);

    DecodeParams m_params;
    std::atomic<DecodeState> m_state{DecodeState::Idle};
    std::atomic<bool> m_running{false};
};

EncodeResult encode_file(const std::string& input_path, const std::string& output_path,
                         const CodecConfig& config, ProgressSink* sink = nullptr,
                         const CancellationToken* cancel = nullptr);

DecodeResult decode_file(const std::string& input_path, const std::string& output_path,
                         const DecodeParams& params, ProgressSink* sink = nullptr,
                         const CancellationToken* cancel = nullptr);

#endif // PIXVAULT_HPP
