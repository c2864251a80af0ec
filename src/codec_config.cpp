#include "codec_config.hpp"
#include "errors.hpp"

#include <zstd.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <thread>

const char* pattern_style_name(PatternStyle style) {
    switch (style) {
        case PatternStyle::Rings:         return "rings";
        case PatternStyle::NestedSquares: return "nested";
        case PatternStyle::Sweep:         return "sweep";
    }
    return "rings";
}

PatternStyle parse_pattern_style(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (PatternStyle style : kAllPatternStyles) {
        if (lower == pattern_style_name(style)) return style;
    }
    // original front ends called the default style "geometric"
    if (lower == "geometric") return PatternStyle::Rings;

    throw InvalidInputError("Unknown pattern style '" + name + "' (expected rings, nested or sweep)");
}

void validate_resolution(int width, int height) {
    if (width < kMinWidth || height < kMinHeight) {
        throw InvalidInputError("Minimum resolution is 256x256");
    }
    if (width > kMaxWidth || height > kMaxHeight) {
        throw InvalidInputError("Maximum resolution is 7680x4320 (8K)");
    }
    // yuv420p needs even dimensions
    if ((width % 2) != 0 || (height % 2) != 0) {
        throw InvalidInputError("Resolution must have even width and height");
    }
}

std::pair<int, int> parse_resolution(const std::string& resolution) {
    const size_t x = resolution.find('x');
    if (x == std::string::npos || resolution.find('x', x + 1) != std::string::npos) {
        throw InvalidInputError("Resolution must be in format WIDTHxHEIGHT (e.g., 1920x1080)");
    }

    auto parse_dim = [](const std::string& text, const char* what) {
        if (text.empty() || !std::all_of(text.begin(), text.end(),
                                         [](unsigned char c) { return std::isdigit(c) != 0; })) {
            throw InvalidInputError(std::string("Invalid ") + what);
        }
        try {
            return std::stoi(text);
        } catch (const std::out_of_range&) {
            throw InvalidInputError(std::string("Invalid ") + what);
        }
    };

    int width = parse_dim(resolution.substr(0, x), "width");
    int height = parse_dim(resolution.substr(x + 1), "height");
    validate_resolution(width, height);
    return {width, height};
}

uint64_t parse_unsigned(const std::string& what, const std::string& text, uint64_t max_value) {
    if (text.empty() || !std::all_of(text.begin(), text.end(),
                                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
        throw InvalidInputError("Invalid value for " + what + ": '" + text + "'");
    }
    unsigned long long value = 0;
    try {
        value = std::stoull(text);
    } catch (const std::out_of_range&) {
        throw InvalidInputError("Value for " + what + " is out of range: " + text);
    }
    if (value > max_value) {
        throw InvalidInputError("Value for " + what + " is out of range: " + text +
                                " (max " + std::to_string(max_value) + ")");
    }
    return value;
}

void CodecConfig::validate() const {
    validate_resolution(width, height);

    if (fps <= 0 || fps > kMaxFps) {
        throw InvalidInputError("FPS must be between 1 and 120");
    }
    if (chunk_size == 0 || chunk_size > kMaxChunkSize) {
        throw InvalidInputError("Chunk size must be between 1 and 10485760 bytes");
    }
    if (use_compression) {
        if (compression_level == 0 ||
            compression_level < ZSTD_minCLevel() || compression_level > ZSTD_maxCLevel()) {
            throw InvalidInputError("Compression level must be between " +
                                    std::to_string(ZSTD_minCLevel()) + " and " +
                                    std::to_string(ZSTD_maxCLevel()) + " (non-zero)");
        }
    }
    if (read_buffer_size < kMinReadBuffer || read_buffer_size > kMaxReadBuffer) {
        throw InvalidInputError("Read buffer size must be between 4 KiB and 64 MiB");
    }
    if (video.crf < 0 || video.crf > 51) {
        throw InvalidInputError("CRF must be between 0 and 51");
    }
    if (video.gop < 0) {
        throw InvalidInputError("GOP size cannot be negative");
    }
    if (video.codec_name.empty()) {
        throw InvalidInputError("Video codec name cannot be empty");
    }
}

size_t resolve_thread_count(size_t requested) {
    if (requested > 0) return requested;
    unsigned hw = std::thread::hardware_concurrency();
    return hw > 0 ? hw : 1;
}
