#pragma once

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/imgutils.h>
#include <libswscale/swscale.h>
}

#include <opencv2/core.hpp>
#include <cstdint>
#include <string>

struct VideoInfo {
    int width = 0;
    int height = 0;
    double fps = 0.0;
    int64_t frame_count = 0;
    std::string codec_name;
    std::string container;
};

// Demuxes the best video stream of a container and yields its frames as
// RGBA Mats in stored order.
class FFmpegDecoder {
public:
    explicit FFmpegDecoder(const std::string& inputPath);
    ~FFmpegDecoder();

    FFmpegDecoder(const FFmpegDecoder&) = delete;
    FFmpegDecoder& operator=(const FFmpegDecoder&) = delete;

    // Next frame as CV_8UC4 RGBA; false once the stream is drained.
    // Throws DecodingError on demux or decode failures.
    bool decode(cv::Mat& output_frame);

    int width() const { return codec_ctx ? codec_ctx->width : 0; }
    int height() const { return codec_ctx ? codec_ctx->height : 0; }
    int64_t framesDecoded() const { return frames_decoded; }
    VideoInfo info() const;

private:
    std::string path;
    AVFormatContext* format_ctx = nullptr;
    AVCodecContext* codec_ctx = nullptr;
    AVFrame* frame = nullptr;
    AVPacket* packet = nullptr;
    SwsContext* sws_ctx = nullptr;
    int stream_index = -1;
    bool draining = false;
    int64_t frames_decoded = 0;

    void init();
    void convert(cv::Mat& output_frame);
    void cleanup();
};

// Container level facts about an artifact. Counts frames by demuxing when
// the container does not record it.
VideoInfo probe_video(const std::string& path);
