#include "ffmpeg_decoder.hpp"
#include "errors.hpp"
#include "ffmpeg_encoder.h"
#include "logging.hpp"

namespace {

void open_input(AVFormatContext** ctx, const std::string& path) {
    int ret = avformat_open_input(ctx, path.c_str(), nullptr, nullptr);
    if (ret == AVERROR(ENOENT))
        throw InvalidInputError("Video file not found: " + path);
    if (ret < 0)
        throw DecodingError("Cannot open video '" + path + "': " + av_error_string(ret));

    ret = avformat_find_stream_info(*ctx, nullptr);
    if (ret < 0) {
        avformat_close_input(ctx);
        throw DecodingError("Cannot read stream info of '" + path + "': " + av_error_string(ret));
    }
}

} // namespace

FFmpegDecoder::FFmpegDecoder(const std::string& inputPath) : path(inputPath) {
    try {
        init();
    } catch (...) {
        cleanup();
        throw;
    }
}

void FFmpegDecoder::init() {
    open_input(&format_ctx, path);

    const AVCodec* codec = nullptr;
    stream_index = av_find_best_stream(format_ctx, AVMEDIA_TYPE_VIDEO, -1, -1, &codec, 0);
    if (stream_index < 0 || !codec)
        throw DecodingError("No decodable video stream in '" + path + "'");

    codec_ctx = avcodec_alloc_context3(codec);
    if (!codec_ctx) throw DecodingError("Failed to alloc codec context");

    int ret = avcodec_parameters_to_context(codec_ctx, format_ctx->streams[stream_index]->codecpar);
    if (ret < 0) throw DecodingError("Failed to copy codec parameters: " + av_error_string(ret));

    codec_ctx->thread_count = 1;
    codec_ctx->thread_type = FF_THREAD_FRAME;

    ret = avcodec_open2(codec_ctx, codec, nullptr);
    if (ret < 0) throw DecodingError("Could not open decoder: " + av_error_string(ret));

    frame = av_frame_alloc();
    packet = av_packet_alloc();
    if (!frame || !packet) throw DecodingError("Failed to allocate frame or packet");

    LOG_DEBUG("DECODER", "Opened " << path << ": " << codec->name << " "
              << codec_ctx->width << "x" << codec_ctx->height);
}

bool FFmpegDecoder::decode(cv::Mat& output_frame) {
    while (true) {
        int ret = avcodec_receive_frame(codec_ctx, frame);
        if (ret == 0) {
            convert(output_frame);
            av_frame_unref(frame);
            ++frames_decoded;
            return true;
        }
        if (ret == AVERROR_EOF) return false;
        if (ret != AVERROR(EAGAIN))
            throw DecodingError("Decoding frame " + std::to_string(frames_decoded) + " failed: " + av_error_string(ret));
        if (draining) return false;

        // decoder wants input
        ret = av_read_frame(format_ctx, packet);
        if (ret == AVERROR_EOF) {
            draining = true;
            ret = avcodec_send_packet(codec_ctx, nullptr);
            if (ret < 0 && ret != AVERROR_EOF)
                throw DecodingError("Failed to flush decoder: " + av_error_string(ret));
            continue;
        }
        if (ret < 0)
            throw DecodingError("Failed to read packet: " + av_error_string(ret));

        if (packet->stream_index != stream_index) {
            av_packet_unref(packet);
            continue;
        }
        ret = avcodec_send_packet(codec_ctx, packet);
        av_packet_unref(packet);
        if (ret < 0)
            throw DecodingError("Failed to send packet to decoder: " + av_error_string(ret));
    }
}

void FFmpegDecoder::convert(cv::Mat& output_frame) {
    sws_ctx = sws_getCachedContext(
        sws_ctx,
        frame->width, frame->height, static_cast<AVPixelFormat>(frame->format),
        frame->width, frame->height, AV_PIX_FMT_RGBA,
        SWS_BILINEAR, nullptr, nullptr, nullptr
    );
    if (!sws_ctx) throw DecodingError("Failed to initialize swscale context");

    output_frame.create(frame->height, frame->width, CV_8UC4);
    uint8_t* dest[1] = { output_frame.data };
    int dest_stride[1] = { static_cast<int>(output_frame.step) };

    sws_scale(sws_ctx, frame->data, frame->linesize, 0, frame->height, dest, dest_stride);
}

VideoInfo FFmpegDecoder::info() const {
    VideoInfo vi;
    const AVStream* st = format_ctx->streams[stream_index];
    vi.width = codec_ctx->width;
    vi.height = codec_ctx->height;
    AVRational rate = av_guess_frame_rate(format_ctx, const_cast<AVStream*>(st), nullptr);
    vi.fps = rate.den > 0 ? av_q2d(rate) : 0.0;
    vi.frame_count = st->nb_frames;
    vi.codec_name = codec_ctx->codec ? codec_ctx->codec->name : "";
    vi.container = format_ctx->iformat ? format_ctx->iformat->name : "";
    return vi;
}

void FFmpegDecoder::cleanup() {
    if (codec_ctx) avcodec_free_context(&codec_ctx);
    if (frame) av_frame_free(&frame);
    if (packet) av_packet_free(&packet);
    if (sws_ctx) { sws_freeContext(sws_ctx); sws_ctx = nullptr; }
    if (format_ctx) avformat_close_input(&format_ctx);
}

FFmpegDecoder::~FFmpegDecoder() {
    cleanup();
}

VideoInfo probe_video(const std::string& path) {
    AVFormatContext* ctx = nullptr;
    open_input(&ctx, path);

    int index = av_find_best_stream(ctx, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
    if (index < 0) {
        avformat_close_input(&ctx);
        throw DecodingError("No video stream in '" + path + "'");
    }

    AVStream* st = ctx->streams[index];
    VideoInfo vi;
    vi.width = st->codecpar->width;
    vi.height = st->codecpar->height;
    AVRational rate = av_guess_frame_rate(ctx, st, nullptr);
    vi.fps = rate.den > 0 ? av_q2d(rate) : 0.0;
    vi.codec_name = avcodec_get_name(st->codecpar->codec_id);
    vi.container = ctx->iformat ? ctx->iformat->name : "";
    vi.frame_count = st->nb_frames;

    if (vi.frame_count <= 0) {
        AVPacket* pkt = av_packet_alloc();
        if (!pkt) {
            avformat_close_input(&ctx);
            throw DecodingError("Failed to allocate packet");
        }
        int64_t count = 0;
        while (av_read_frame(ctx, pkt) >= 0) {
            if (pkt->stream_index == index) ++count;
            av_packet_unref(pkt);
        }
        av_packet_free(&pkt);
        vi.frame_count = count;
    }

    avformat_close_input(&ctx);
    LOG_INFO("PROBE", path << ": " << vi.container << "/" << vi.codec_name << " "
             << vi.width << "x" << vi.height << " @ " << vi.fps << " fps, " << vi.frame_count << " frames");
    return vi;
}
