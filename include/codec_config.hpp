#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>

// Visual primitive that splits every symbol block into an inner and an outer
// region. Closed set: adding a style means adding a case to every switch.
enum class PatternStyle : uint8_t {
    Rings = 0,          // disc inside the block
    NestedSquares = 1,  // square nested inside the block
    Sweep = 2           // 180 degree swept wedge
};

constexpr PatternStyle kAllPatternStyles[] = {
    PatternStyle::Rings, PatternStyle::NestedSquares, PatternStyle::Sweep
};

const char* pattern_style_name(PatternStyle style);
PatternStyle parse_pattern_style(const std::string& name);   // throws InvalidInputError

constexpr int kMinWidth = 256;
constexpr int kMinHeight = 256;
constexpr int kMaxWidth = 7680;
constexpr int kMaxHeight = 4320;
constexpr int kMaxFps = 120;
constexpr size_t kMaxChunkSize = 10 * 1024 * 1024;
constexpr size_t kMinReadBuffer = 4 * 1024;
constexpr size_t kMaxReadBuffer = 64 * 1024 * 1024;

// Codec session knobs. They do not change the logical format, but an artifact
// only keeps its redundancy margin if it was written with sane values.
struct VideoSettings {
    std::string codec_name = "libx264";
    int crf = 18;
    std::string preset = "fast";
    int gop = 0;   // 0 -> 2 * fps
};

struct CodecConfig {
    int width = 1920;
    int height = 1080;
    int fps = 30;
    size_t chunk_size = 4096;
    bool use_compression = true;
    int compression_level = 3;
    PatternStyle pattern_style = PatternStyle::Rings;
    size_t num_threads = 0;                 // 0 -> hardware concurrency
    size_t read_buffer_size = 1024 * 1024;
    VideoSettings video;

    // Throws InvalidInputError on malformed values. Representability of
    // chunk_size at this resolution is checked by the geometry layer.
    void validate() const;
};

// "1920x1080" -> {1920, 1080}; enforces the supported resolution window.
std::pair<int, int> parse_resolution(const std::string& resolution);

void validate_resolution(int width, int height);

// Decimal digits only, at most max_value; InvalidInputError naming `what` otherwise.
// Use the target type's maximum so a value never wraps when narrowed.
uint64_t parse_unsigned(const std::string& what, const std::string& text, uint64_t max_value);

size_t resolve_thread_count(size_t requested);
