#include "ffmpeg_encoder.h"
#include "errors.hpp"
#include "logging.hpp"
#include <filesystem>
#include <system_error>
#include <thread>

std::string av_error_string(int errnum) {
    char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
    av_strerror(errnum, buf, sizeof(buf));
    return std::string(buf);
}

FFmpegEncoder::FFmpegEncoder(const std::string& outputPath, int width, int height, int fps,
                             const VideoSettings& settings)
    : m_path(outputPath), m_width(width), m_height(height), m_fps(fps), m_settings(settings)
{
    try {
        initEncoder();
    } catch (...) {
        cleanup();
        // the file was opened (and truncated) by this session, nothing useful is left in it
        if (outputOpened) {
            std::error_code ec;
            std::filesystem::remove(m_path, ec);
        }
        throw;
    }
}

void FFmpegEncoder::initEncoder() {
    int ret = avformat_alloc_output_context2(&formatContext, nullptr, nullptr, m_path.c_str());
    if (ret < 0 || !formatContext) {
        LOG_WARN("ENCODER", "No container matches '" << m_path << "', falling back to mp4");
        ret = avformat_alloc_output_context2(&formatContext, nullptr, "mp4", m_path.c_str());
    }
    if (ret < 0 || !formatContext)
        throw EncodingError("Failed to allocate output context: " + av_error_string(ret));

    if (!m_settings.codec_name.empty())
        codec = avcodec_find_encoder_by_name(m_settings.codec_name.c_str());
    if (!codec) {
        LOG_WARN("ENCODER", "Encoder '" << m_settings.codec_name << "' not available, trying any H264 encoder");
        codec = avcodec_find_encoder(AV_CODEC_ID_H264);
    }
    if (!codec)
        throw EncodingError("H264 codec not found");

    stream = avformat_new_stream(formatContext, nullptr);
    if (!stream)
        throw EncodingError("Failed to create video stream");

    codecContext = avcodec_alloc_context3(codec);
    if (!codecContext)
        throw EncodingError("Failed to allocate codec context");

    codecContext->width = m_width;
    codecContext->height = m_height;
    codecContext->time_base = {1, m_fps};
    codecContext->framerate = {m_fps, 1};
    codecContext->gop_size = m_settings.gop > 0 ? m_settings.gop : 2 * m_fps;
    codecContext->max_b_frames = 0;   // decode order == presentation order
    codecContext->pix_fmt = AV_PIX_FMT_YUV420P;
    codecContext->thread_count = std::thread::hardware_concurrency();
    stream->time_base = codecContext->time_base;

    if (formatContext->oformat->flags & AVFMT_GLOBALHEADER)
        codecContext->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;

    AVDictionary* opts = nullptr;
    if (codec->id == AV_CODEC_ID_H264) {
        av_dict_set(&opts, "crf", std::to_string(m_settings.crf).c_str(), 0);
        av_dict_set(&opts, "preset", m_settings.preset.c_str(), 0);
    }
    ret = avcodec_open2(codecContext, codec, &opts);
    av_dict_free(&opts);
    if (ret < 0)
        throw EncodingError("Failed to open codec " + std::string(codec->name) + ": " + av_error_string(ret));

    ret = avcodec_parameters_from_context(stream->codecpar, codecContext);
    if (ret < 0)
        throw EncodingError("Failed to copy codec parameters: " + av_error_string(ret));

    if (!(formatContext->oformat->flags & AVFMT_NOFILE)) {
        ret = avio_open(&formatContext->pb, m_path.c_str(), AVIO_FLAG_WRITE);
        if (ret < 0)
            throw IoError("Cannot open output '" + m_path + "': " + av_error_string(ret));
        outputOpened = true;
    }

    ret = avformat_write_header(formatContext, nullptr);
    if (ret < 0)
        throw EncodingError("Failed to write container header: " + av_error_string(ret));
    headerWritten = true;

    frame = av_frame_alloc();
    pkt = av_packet_alloc();
    if (!frame || !pkt)
        throw EncodingError("Failed to allocate frame or packet");

    frame->format = codecContext->pix_fmt;
    frame->width = codecContext->width;
    frame->height = codecContext->height;

    if (av_frame_get_buffer(frame, 32) < 0)
        throw EncodingError("Could not allocate frame buffer");

    swsCtx = sws_getContext(
        m_width, m_height, AV_PIX_FMT_RGBA,
        m_width, m_height, AV_PIX_FMT_YUV420P,
        SWS_BILINEAR, nullptr, nullptr, nullptr
    );

    if (!swsCtx)
        throw EncodingError("Failed to initialize swscale context");

    LOG_INFO("ENCODER", codec->name << " " << m_width << "x" << m_height << " @ " << m_fps
             << " fps, crf " << m_settings.crf << ", preset " << m_settings.preset
             << ", gop " << codecContext->gop_size << " -> " << m_path);
}

void FFmpegEncoder::encodeFrame(const cv::Mat& rgbaFrame) {
    if (finished)
        throw EncodingError("Encoder already finished");
    if (rgbaFrame.type() != CV_8UC4 || rgbaFrame.cols != m_width || rgbaFrame.rows != m_height)
        throw EncodingError("Frame must be RGBA " + std::to_string(m_width) + "x" + std::to_string(m_height));

    int ret = av_frame_make_writable(frame);
    if (ret < 0)
        throw EncodingError("Frame buffer not writable: " + av_error_string(ret));

    const uint8_t* inData[1] = { rgbaFrame.data };
    int inLinesize[1] = { static_cast<int>(rgbaFrame.step) };

    sws_scale(swsCtx, inData, inLinesize, 0, m_height, frame->data, frame->linesize);
    frame->pts = frameCounter++;

    writePackets(frame);
}

void FFmpegEncoder::writePackets(AVFrame* input) {
    int ret = avcodec_send_frame(codecContext, input);
    if (ret < 0 && ret != AVERROR_EOF)
        throw EncodingError("Failed to send frame to encoder: " + av_error_string(ret));

    while (true) {
        ret = avcodec_receive_packet(codecContext, pkt);
        if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF)
            break;
        if (ret < 0)
            throw EncodingError("Failed to receive packet: " + av_error_string(ret));

        pkt->stream_index = stream->index;
        av_packet_rescale_ts(pkt, codecContext->time_base, stream->time_base);
        ret = av_interleaved_write_frame(formatContext, pkt);
        av_packet_unref(pkt);
        if (ret < 0)
            throw IoError("Failed to write packet: " + av_error_string(ret));
        ++packetCounter;
    }
}

void FFmpegEncoder::finish() {
    if (finished) return;

    writePackets(nullptr);

    int ret = av_write_trailer(formatContext);
    if (ret < 0)
        throw EncodingError("Failed to write container trailer: " + av_error_string(ret));
    finished = true;

    if (!(formatContext->oformat->flags & AVFMT_NOFILE) && formatContext->pb) {
        ret = avio_closep(&formatContext->pb);
        if (ret < 0)
            throw IoError("Failed to close output '" + m_path + "': " + av_error_string(ret));
    }

    LOG_INFO("ENCODER", "Finished " << m_path << ": " << frameCounter << " frames, "
             << packetCounter << " packets");
}

void FFmpegEncoder::cleanup() {
    if (formatContext && !(formatContext->oformat->flags & AVFMT_NOFILE) && formatContext->pb)
        avio_closep(&formatContext->pb);
    if (codecContext) avcodec_free_context(&codecContext);
    if (frame) av_frame_free(&frame);
    if (pkt) av_packet_free(&pkt);
    if (swsCtx) { sws_freeContext(swsCtx); swsCtx = nullptr; }
    if (formatContext) { avformat_free_context(formatContext); formatContext = nullptr; }
}

FFmpegEncoder::~FFmpegEncoder() {
    if (headerWritten && !finished)
        LOG_DEBUG("ENCODER", "Session for " << m_path << " closed without trailer");
    cleanup();
}
