#include "decode/decoder.hpp"
#include "decode/hw_accel.hpp"
#include "decode/scaler.hpp"
#include "core/log.hpp"
#include "core/log_config.hpp"
#include "core/stopwatch.hpp"

extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libavutil/error.h>
#include <libavutil/hwcontext.h>
}

#include <algorithm>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace nla::decode {

namespace {

// Frames whose timestamp is within this distance before the target still count as reaching it.
constexpr double kTimeEpsilon = 0.001;

std::string av_error_string(int code) {
    char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
    av_strerror(code, buf, sizeof(buf));
    return std::string(buf);
}

void init_ffmpeg_logging() {
    static std::once_flag once;
    std::call_once(once, []{ av_log_set_level(AV_LOG_ERROR); });
}

class FFmpegVideoDecoder final : public IVideoDecoder {
public:
    explicit FFmpegVideoDecoder(DecoderOpenParams params) : params_(std::move(params)) {}

    ~FFmpegVideoDecoder() override {
        if(held_) av_frame_free(&held_);
        if(sw_frame_) av_frame_free(&sw_frame_);
        if(frame_) av_frame_free(&frame_);
        if(packet_) av_packet_free(&packet_);
        if(ctx_) avcodec_free_context(&ctx_);
        if(fmt_) avformat_close_input(&fmt_);
        // hw_device_ releases its own reference after the codec context has dropped its one.
    }

    core::VoidResult open() {
        const std::string& path = params_.path;
        int rc = avformat_open_input(&fmt_, path.c_str(), nullptr, nullptr);
        if(rc < 0) return core::Error<bool>("cannot open " + path + ": " + av_error_string(rc));

        rc = avformat_find_stream_info(fmt_, nullptr);
        if(rc < 0) return core::Error<bool>("no stream info in " + path + ": " + av_error_string(rc));

        const AVCodec* codec = nullptr;
        stream_index_ = av_find_best_stream(fmt_, AVMEDIA_TYPE_VIDEO, -1, -1, &codec, 0);
        if(stream_index_ < 0 || !codec) return core::Error<bool>("no decodable video stream in " + path);
        codec_ = codec;
        time_base_ = fmt_->streams[stream_index_]->time_base;

        bool opened = false;
        if(params_.allow_hw && !params_.hw_candidates.empty()) {
            opened = open_codec(codec, true);
            if(!opened) log::warn("Hardware decoder open failed for " + path + ", retrying in software");
        }
        if(!opened && !open_codec(codec, false)) {
            return core::Error<bool>(std::string("cannot open codec ") + codec->name + " for " + path);
        }

        src_w_ = std::max(ctx_->width, 1);
        src_h_ = std::max(ctx_->height, 1);
        auto [tw, th] = fit_dimensions(src_w_, src_h_, params_.max_width, params_.max_height);
        scaler_ = std::make_unique<FrameScaler>(tw, th);

        packet_ = av_packet_alloc();
        frame_ = av_frame_alloc();
        sw_frame_ = av_frame_alloc();
        held_ = av_frame_alloc();
        if(!packet_ || !frame_ || !sw_frame_ || !held_) return core::Error<bool>("out of memory allocating decode frames");

        log::debug("Opened " + path + " (" + codec->name + " " + std::to_string(src_w_) + "x" + std::to_string(src_h_) +
                   " -> " + std::to_string(tw) + "x" + std::to_string(th) + (negotiator_ ? ", hw" : ", sw") + ")");
        return core::Ok();
    }

    DecodeResponse decode_at(double time_seconds, DecodeMode mode) override {
        DecodeResponse resp;
        resp.source_width = src_w_;
        resp.source_height = src_h_;
        const double target = std::max(time_seconds, 0.0);
        if(!ctx_) return resp;

        const bool sequential = mode == DecodeMode::Sequential && can_continue_to(target);
        NLA_DECODE_TRACE(params_.path + " @" + std::to_string(target) + " " + (sequential ? "sequential" : "seek"));
        if(!sequential) {
            core::Stopwatch seek_sw;
            const bool ok = seek_to(target);
            resp.timings.seek_ms = seek_sw.elapsed_ms();
            if(!ok) return resp;
        }

        core::Stopwatch loop_sw;
        AVFrame* chosen = next_frame(target);
        while(chosen && !produce(chosen, resp)) {
            // Transfer failed: drop this frame and keep decoding, in software once the limit is hit.
            av_frame_unref(chosen);
            if(++transfer_failures_ >= std::max(params_.hw_transfer_failure_limit, 1)) {
                if(!fall_back_to_software() || !seek_to(target)) break;
            }
            chosen = next_frame(target);
        }
        av_frame_unref(frame_);
        av_frame_unref(held_);

        const double loop_ms = loop_sw.elapsed_ms();
        resp.timings.packet_ms = std::max(0.0, loop_ms - resp.timings.transfer_ms - resp.timings.scale_ms - resp.timings.copy_ms);
        return resp;
    }

    bool hardware_active() const override { return static_cast<bool>(negotiator_); }

private:
    // frame_ when a frame reaches target, else the last frame passed before the stream ended.
    AVFrame* next_frame(double target) {
        AVFrame* f = receive_until(target);
        if(!f && held_->buf[0]) f = held_;
        return f;
    }

    bool fall_back_to_software() {
        log::warn("Hardware frame transfer keeps failing for " + params_.path + ", switching to software decode");
        transfer_failures_ = 0;
        av_frame_unref(held_);
        if(!open_codec(codec_, false)) {
            log::error("Cannot reopen " + params_.path + " in software");
            return false;
        }
        return true;
    }

    bool open_codec(const AVCodec* codec, bool try_hw) {
        if(ctx_) avcodec_free_context(&ctx_);
        negotiator_.reset();
        hw_device_.reset();

        ctx_ = avcodec_alloc_context3(codec);
        if(!ctx_) return false;
        if(avcodec_parameters_to_context(ctx_, fmt_->streams[stream_index_]->codecpar) < 0) return false;
        ctx_->thread_count = 0;
        ctx_->pkt_timebase = time_base_;

        if(try_hw) {
            auto probe = params_.hw_probe ? params_.hw_probe(codec, params_.hw_candidates)
                                          : probe_hw_device(codec, params_.hw_candidates);
            if(probe) {
                negotiator_ = std::make_unique<HwFormatNegotiator>(probe->pix_fmt);
                negotiator_->install(ctx_);
                ctx_->hw_device_ctx = probe->device.new_ref();
                hw_device_ = std::move(probe->device);
            } else {
                log::debug("No hardware device for " + params_.path + ", using software decode");
            }
        }

        const int rc = avcodec_open2(ctx_, codec, nullptr);
        if(rc < 0) {
            log::debug("avcodec_open2 failed: " + av_error_string(rc));
            avcodec_free_context(&ctx_);
            negotiator_.reset();
            hw_device_.reset();
            return false;
        }
        return true;
    }

    bool can_continue_to(double target) const {
        if(!last_time_ || eof_) return false;
        return target > *last_time_ && target - *last_time_ <= params_.sequential_window_seconds;
    }

    bool seek_to(double target) {
        const int64_t ts = static_cast<int64_t>(target * AV_TIME_BASE);
        const int rc = av_seek_frame(fmt_, -1, ts, AVSEEK_FLAG_BACKWARD);
        last_time_.reset();
        if(rc < 0) {
            log::debug("Seek to " + std::to_string(target) + "s failed in " + params_.path + ": " + av_error_string(rc));
            return false;
        }
        avcodec_flush_buffers(ctx_);
        eof_ = false;
        draining_ = false;
        return true;
    }

    double frame_seconds(const AVFrame* f) const {
        int64_t pts = f->best_effort_timestamp;
        if(pts == AV_NOPTS_VALUE) pts = f->pts;
        if(pts == AV_NOPTS_VALUE) return -1.0;
        return static_cast<double>(pts) * av_q2d(time_base_);
    }

    // Decodes forward until a frame reaches target. Returns frame_ on success, nullptr at
    // end of stream or on a decoder error. Frames passed on the way are kept in held_.
    AVFrame* receive_until(double target) {
        while(true) {
            int rc = avcodec_receive_frame(ctx_, frame_);
            if(rc == 0) {
                const double t = frame_seconds(frame_);
                if(t >= 0.0 && t + kTimeEpsilon < target) {
                    av_frame_unref(held_);
                    av_frame_move_ref(held_, frame_);
                    continue;
                }
                return frame_;
            }
            if(rc == AVERROR_EOF) {
                eof_ = true;
                return nullptr;
            }
            if(rc != AVERROR(EAGAIN)) {
                log::debug("Decoder error in " + params_.path + ": " + av_error_string(rc));
                return nullptr;
            }
            if(draining_) return nullptr;

            rc = av_read_frame(fmt_, packet_);
            if(rc < 0) {
                draining_ = true;
                rc = avcodec_send_packet(ctx_, nullptr);
                if(rc < 0 && rc != AVERROR_EOF) {
                    log::debug("Decoder flush failed in " + params_.path + ": " + av_error_string(rc));
                    return nullptr;
                }
                continue;
            }
            if(packet_->stream_index != stream_index_) {
                av_packet_unref(packet_);
                continue;
            }
            rc = avcodec_send_packet(ctx_, packet_);
            av_packet_unref(packet_);
            if(rc < 0 && rc != AVERROR(EAGAIN)) {
                NLA_DECODE_TRACE("Skipping corrupt packet in " + params_.path + ": " + av_error_string(rc));
            }
        }
    }

    // Returns false only when a hardware surface could not be transferred to host memory.
    bool produce(AVFrame* decoded, DecodeResponse& resp) {
        AVFrame* usable = decoded;
        bool from_hw = false;
        if(negotiator_ && decoded->format == negotiator_->hw_format()) {
            core::Stopwatch sw;
            av_frame_unref(sw_frame_);
            const int rc = params_.hw_transfer ? params_.hw_transfer(sw_frame_, decoded)
                                               : default_frame_transfer(sw_frame_, decoded);
            resp.timings.transfer_ms += sw.elapsed_ms();
            if(rc < 0) {
                log::debug("Hardware frame transfer failed: " + av_error_string(rc));
                av_frame_unref(sw_frame_);
                return false;
            }
            transfer_failures_ = 0;
            av_frame_copy_props(sw_frame_, decoded);
            usable = sw_frame_;
            from_hw = true;
        }

        core::Stopwatch scale_sw;
        const bool scaled = scaler_->scale(usable);
        resp.timings.scale_ms += scale_sw.elapsed_ms();
        if(!scaled) return true;

        core::Stopwatch copy_sw;
        RgbaImage image = scaler_->copy_out();
        resp.timings.copy_ms += copy_sw.elapsed_ms();
        if(image.empty()) return true;

        const double t = frame_seconds(decoded);
        last_time_ = t >= 0.0 ? t : 0.0;
        resp.image = std::move(image);
        resp.used_hw = from_hw;
        return true;
    }

    DecoderOpenParams params_;
    const AVCodec* codec_ = nullptr;
    AVFormatContext* fmt_ = nullptr;
    AVCodecContext* ctx_ = nullptr;
    AVPacket* packet_ = nullptr;
    AVFrame* frame_ = nullptr;
    AVFrame* sw_frame_ = nullptr;
    AVFrame* held_ = nullptr;
    int stream_index_ = -1;
    AVRational time_base_{1, 1};
    int src_w_ = 0;
    int src_h_ = 0;
    std::unique_ptr<HwFormatNegotiator> negotiator_;
    HwDeviceRef hw_device_;
    std::unique_ptr<FrameScaler> scaler_;
    std::optional<double> last_time_;
    bool eof_ = false;
    bool draining_ = false;
    int transfer_failures_ = 0;
};

} // namespace

core::Result<std::unique_ptr<IVideoDecoder>> open_ffmpeg_decoder(const DecoderOpenParams& params) {
    init_ffmpeg_logging();
    auto decoder = std::make_unique<FFmpegVideoDecoder>(params);
    auto opened = decoder->open();
    if(opened.is_error()) return core::Error<std::unique_ptr<IVideoDecoder>>(opened.error());
    return core::Result<std::unique_ptr<IVideoDecoder>>(std::unique_ptr<IVideoDecoder>(std::move(decoder)));
}

DecoderFactory make_ffmpeg_decoder_factory() {
    return [](const DecoderOpenParams& params) { return open_ffmpeg_decoder(params); };
}

} // namespace nla::decode
