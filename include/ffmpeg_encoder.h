#pragma once

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/imgutils.h>
#include <libavutil/opt.h>
#include <libswscale/swscale.h>
}

#include <opencv2/core.hpp>
#include <cstdint>
#include <string>

#include "codec_config.hpp"

// av_strerror() as a std::string
std::string av_error_string(int errnum);

// One muxing + encoding session writing RGBA frames into a video container.
// finish() must be called for a playable file; destroying an unfinished
// encoder closes the file without a trailer (abort path).
// A constructor that throws leaves the output path as it found it unless the
// file had already been opened for writing, in which case it is removed.
class FFmpegEncoder {
public:
    FFmpegEncoder(const std::string& outputPath, int width, int height, int fps,
                  const VideoSettings& settings);
    ~FFmpegEncoder();

    FFmpegEncoder(const FFmpegEncoder&) = delete;
    FFmpegEncoder& operator=(const FFmpegEncoder&) = delete;

    // RGBA Mat (CV_8UC4, width x height) -> next frame, pts = frame index
    void encodeFrame(const cv::Mat& rgbaFrame);

    // Drains the encoder and writes the container trailer
    void finish();

    int64_t framesWritten() const { return frameCounter; }
    int64_t packetsWritten() const { return packetCounter; }
    std::string codecName() const { return codec ? codec->name : ""; }

private:
    std::string m_path;
    int m_width, m_height, m_fps;
    VideoSettings m_settings;
    int64_t frameCounter = 0;
    int64_t packetCounter = 0;
    bool outputOpened = false;
    bool headerWritten = false;
    bool finished = false;

    const AVCodec* codec = nullptr;
    AVFormatContext* formatContext = nullptr;
    AVStream* stream = nullptr;
    AVCodecContext* codecContext = nullptr;
    AVFrame* frame = nullptr;
    AVPacket* pkt = nullptr;
    SwsContext* swsCtx = nullptr;

    void initEncoder();
    void writePackets(AVFrame* input);
    void cleanup();
};
