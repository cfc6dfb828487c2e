#include "decode/still_loader.hpp"
#include "decode/scaler.hpp"
#include "core/log.hpp"

extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
}

#include <algorithm>

namespace nla::decode {

namespace {

// Owns the demux and decode state for one still-image read.
struct StillReader {
    AVFormatContext* fmt = nullptr;
    AVCodecContext* ctx = nullptr;
    AVPacket* packet = nullptr;
    AVFrame* frame = nullptr;

    ~StillReader() {
        if(frame) av_frame_free(&frame);
        if(packet) av_packet_free(&packet);
        if(ctx) avcodec_free_context(&ctx);
        if(fmt) avformat_close_input(&fmt);
    }
};

} // namespace

core::Result<StillImage> load_still_image(const std::string& path, int max_width, int max_height) {
    StillReader r;
    if(avformat_open_input(&r.fmt, path.c_str(), nullptr, nullptr) < 0) {
        return core::Error<StillImage>("cannot open image " + path);
    }
    if(avformat_find_stream_info(r.fmt, nullptr) < 0) {
        return core::Error<StillImage>("no stream info in " + path);
    }
    const AVCodec* codec = nullptr;
    const int stream = av_find_best_stream(r.fmt, AVMEDIA_TYPE_VIDEO, -1, -1, &codec, 0);
    if(stream < 0 || !codec) return core::Error<StillImage>("no image stream in " + path);

    r.ctx = avcodec_alloc_context3(codec);
    if(!r.ctx || avcodec_parameters_to_context(r.ctx, r.fmt->streams[stream]->codecpar) < 0 ||
       avcodec_open2(r.ctx, codec, nullptr) < 0) {
        return core::Error<StillImage>("cannot open image codec for " + path);
    }

    r.packet = av_packet_alloc();
    r.frame = av_frame_alloc();
    if(!r.packet || !r.frame) return core::Error<StillImage>("out of memory decoding " + path);

    bool got = false;
    bool flushed = false;
    while(!got) {
        int rc = avcodec_receive_frame(r.ctx, r.frame);
        if(rc == 0) { got = true; break; }
        if(rc != AVERROR(EAGAIN) || flushed) break;
        if(av_read_frame(r.fmt, r.packet) < 0) {
            rc = avcodec_send_packet(r.ctx, nullptr);
            if(rc < 0 && rc != AVERROR_EOF) break;
            flushed = true;
            continue;
        }
        if(r.packet->stream_index == stream) rc = avcodec_send_packet(r.ctx, r.packet);
        av_packet_unref(r.packet);
        if(rc < 0 && rc != AVERROR(EAGAIN)) break;
    }
    if(!got) return core::Error<StillImage>("no decodable frame in " + path);

    StillImage out;
    out.source_width = std::max(r.frame->width, 1);
    out.source_height = std::max(r.frame->height, 1);
    auto [w, h] = fit_dimensions(out.source_width, out.source_height, max_width, max_height);
    FrameScaler scaler(w, h);
    if(!scaler.scale(r.frame)) return core::Error<StillImage>("cannot convert " + path + " to RGBA");
    out.image = scaler.copy_out();
    if(out.image.empty()) return core::Error<StillImage>("empty image " + path);
    return core::Result<StillImage>(std::move(out));
}

} // namespace nla::decode
