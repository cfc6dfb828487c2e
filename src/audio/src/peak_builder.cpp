#include "audio/peak_builder.hpp"
#include "timeline/asset_resolver.hpp"
#include "core/log.hpp"
#include "core/stopwatch.hpp"

extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libavutil/channel_layout.h>
#include <libavutil/error.h>
#include <libavutil/mathematics.h>
#include <libswresample/swresample.h>
}

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <limits>

namespace nla::audio {

namespace {

std::string av_error_string(int code) {
    char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
    av_strerror(code, buf, sizeof(buf));
    return std::string(buf);
}

// Decodes one audio stream and hands resampled interleaved float frames to the accumulator.
class AudioPeakDecoder {
public:
    AudioPeakDecoder(const PeakBuildConfig& config, PeakAccumulator& sink) : config_(config), sink_(sink) {}

    ~AudioPeakDecoder() {
        if(swr_) swr_free(&swr_);
        if(frame_) av_frame_free(&frame_);
        if(packet_) av_packet_free(&packet_);
        if(ctx_) avcodec_free_context(&ctx_);
        if(fmt_) avformat_close_input(&fmt_);
    }

    AudioPeakDecoder(const AudioPeakDecoder&) = delete;
    AudioPeakDecoder& operator=(const AudioPeakDecoder&) = delete;

    core::VoidResult open(const std::string& path) {
        int rc = avformat_open_input(&fmt_, path.c_str(), nullptr, nullptr);
        if(rc < 0) return core::Error<bool>("cannot open " + path + ": " + av_error_string(rc));
        rc = avformat_find_stream_info(fmt_, nullptr);
        if(rc < 0) return core::Error<bool>("no stream info in " + path + ": " + av_error_string(rc));

        const AVCodec* codec = nullptr;
        stream_index_ = av_find_best_stream(fmt_, AVMEDIA_TYPE_AUDIO, -1, -1, &codec, 0);
        if(stream_index_ < 0 || !codec) return core::Error<bool>("no audio stream found in " + path);

        ctx_ = avcodec_alloc_context3(codec);
        if(!ctx_) return core::Error<bool>("out of memory allocating audio decoder");
        rc = avcodec_parameters_to_context(ctx_, fmt_->streams[stream_index_]->codecpar);
        if(rc < 0) return core::Error<bool>("bad audio codec parameters: " + av_error_string(rc));
        ctx_->pkt_timebase = fmt_->streams[stream_index_]->time_base;
        rc = avcodec_open2(ctx_, codec, nullptr);
        if(rc < 0) return core::Error<bool>(std::string("cannot open audio codec ") + codec->name + ": " + av_error_string(rc));

        if(ctx_->sample_rate <= 0) return core::Error<bool>("audio stream reports no sample rate");

        AVChannelLayout in_layout{};
        if(ctx_->ch_layout.order == AV_CHANNEL_ORDER_UNSPEC || ctx_->ch_layout.nb_channels <= 0) {
            av_channel_layout_default(&in_layout, std::max(ctx_->ch_layout.nb_channels, 1));
        } else {
            av_channel_layout_copy(&in_layout, &ctx_->ch_layout);
        }
        AVChannelLayout out_layout{};
        av_channel_layout_default(&out_layout, config_.target_channels);

        rc = swr_alloc_set_opts2(&swr_,
            &out_layout, AV_SAMPLE_FMT_FLT, static_cast<int>(config_.target_rate),
            &in_layout, ctx_->sample_fmt, ctx_->sample_rate,
            0, nullptr);
        av_channel_layout_uninit(&in_layout);
        av_channel_layout_uninit(&out_layout);
        if(rc < 0 || !swr_) return core::Error<bool>("cannot configure resampler: " + av_error_string(rc));
        rc = swr_init(swr_);
        if(rc < 0) return core::Error<bool>("cannot initialise resampler: " + av_error_string(rc));

        packet_ = av_packet_alloc();
        frame_ = av_frame_alloc();
        if(!packet_ || !frame_) return core::Error<bool>("out of memory allocating audio frames");

        log::debug("Peak decode " + path + ": " + codec->name + " " + std::to_string(ctx_->sample_rate) + " Hz, " +
                   std::to_string(ctx_->ch_layout.nb_channels) + " ch");
        return core::Ok();
    }

    core::VoidResult run() {
        int rc = 0;
        while((rc = av_read_frame(fmt_, packet_)) >= 0) {
            if(packet_->stream_index != stream_index_) {
                av_packet_unref(packet_);
                continue;
            }
            rc = avcodec_send_packet(ctx_, packet_);
            av_packet_unref(packet_);
            if(rc < 0 && rc != AVERROR(EAGAIN) && rc != AVERROR_INVALIDDATA) {
                return core::Error<bool>("audio decode failed: " + av_error_string(rc));
            }
            auto drained = drain();
            if(drained.is_error()) return drained;
        }
        if(rc != AVERROR_EOF) log::debug("Audio read stopped early: " + av_error_string(rc));

        rc = avcodec_send_packet(ctx_, nullptr);
        if(rc < 0 && rc != AVERROR_EOF) return core::Error<bool>("audio decoder flush failed: " + av_error_string(rc));
        auto drained = drain();
        if(drained.is_error()) return drained;
        flush_resampler();
        return core::Ok();
    }

private:
    core::VoidResult drain() {
        while(true) {
            const int rc = avcodec_receive_frame(ctx_, frame_);
            if(rc == AVERROR(EAGAIN) || rc == AVERROR_EOF) return core::Ok();
            if(rc < 0) return core::Error<bool>("audio decode failed: " + av_error_string(rc));
            convert(const_cast<const uint8_t**>(frame_->extended_data), frame_->nb_samples);
            av_frame_unref(frame_);
        }
    }

    void convert(const uint8_t** input, int in_samples) {
        const int in_rate = ctx_->sample_rate;
        const int out_rate = static_cast<int>(config_.target_rate);
        const int max_out = static_cast<int>(av_rescale_rnd(swr_get_delay(swr_, in_rate) + in_samples,
                                                            out_rate, in_rate, AV_ROUND_UP));
        if(max_out <= 0) return;
        buffer_.resize(static_cast<size_t>(max_out) * config_.target_channels);
        uint8_t* out_planes[1] = {reinterpret_cast<uint8_t*>(buffer_.data())};
        const int got = swr_convert(swr_, out_planes, max_out, input, in_samples);
        if(got < 0) {
            log::debug("Resample failed: " + av_error_string(got));
            return;
        }
        sink_.push_interleaved(buffer_.data(), static_cast<size_t>(got), config_.target_channels);
    }

    void flush_resampler() {
        convert(nullptr, 0);
    }

    PeakBuildConfig config_;
    PeakAccumulator& sink_;
    AVFormatContext* fmt_ = nullptr;
    AVCodecContext* ctx_ = nullptr;
    SwrContext* swr_ = nullptr;
    AVPacket* packet_ = nullptr;
    AVFrame* frame_ = nullptr;
    int stream_index_ = -1;
    std::vector<float> buffer_;
};

} // namespace

int16_t sample_to_i16(float sample) {
    const float clamped = std::clamp(sample, -1.0f, 1.0f);
    return static_cast<int16_t>(std::lround(clamped * static_cast<float>(std::numeric_limits<int16_t>::max())));
}

PeakAccumulator::PeakAccumulator(uint32_t block_size) : block_size_(std::max<uint32_t>(block_size, 1)) {}

void PeakAccumulator::push_interleaved(const float* samples, size_t frame_count, int channels) {
    if(!samples || channels <= 0) return;
    const size_t stride = static_cast<size_t>(channels);
    for(size_t i = 0; i < frame_count; ++i) {
        const float* f = samples + i * stride;
        push_frame(f[0], channels > 1 ? f[1] : f[0]);
    }
}

void PeakAccumulator::push_frame(float left, float right) {
    min_l_ = std::min(min_l_, left);
    max_l_ = std::max(max_l_, left);
    min_r_ = std::min(min_r_, right);
    max_r_ = std::max(max_r_, right);
    if(++count_ >= block_size_) flush_block();
}

std::vector<PeakPair> PeakAccumulator::finish() {
    if(count_ > 0) flush_block();
    return std::move(peaks_);
}

void PeakAccumulator::flush_block() {
    peaks_.push_back(PeakPair{sample_to_i16(min_l_), sample_to_i16(max_l_),
                              sample_to_i16(min_r_), sample_to_i16(max_r_)});
    reset_block();
}

void PeakAccumulator::reset_block() {
    count_ = 0;
    min_l_ = 1.0f;
    max_l_ = -1.0f;
    min_r_ = 1.0f;
    max_r_ = -1.0f;
}

std::vector<PeakPair> combine_peaks(const std::vector<PeakPair>& peaks, uint32_t factor) {
    if(factor == 0) return peaks;
    std::vector<PeakPair> combined;
    combined.reserve(peaks.size() / factor + 1);
    for(size_t start = 0; start < peaks.size(); start += factor) {
        const size_t end = std::min(peaks.size(), start + factor);
        PeakPair out{std::numeric_limits<int16_t>::max(), std::numeric_limits<int16_t>::min(),
                     std::numeric_limits<int16_t>::max(), std::numeric_limits<int16_t>::min()};
        for(size_t i = start; i < end; ++i) {
            out.min_l = std::min(out.min_l, peaks[i].min_l);
            out.max_l = std::max(out.max_l, peaks[i].max_l);
            out.min_r = std::min(out.min_r, peaks[i].min_r);
            out.max_r = std::max(out.max_r, peaks[i].max_r);
        }
        combined.push_back(out);
    }
    return combined;
}

std::vector<PeakLevel> build_levels(std::vector<PeakPair> base_peaks, uint32_t base_block,
                                    uint32_t factor, size_t max_levels) {
    std::vector<PeakLevel> levels;
    levels.push_back(PeakLevel{base_block, std::move(base_peaks)});

    while(levels.size() < max_levels) {
        const PeakLevel& prev = levels.back();
        if(prev.peaks.size() <= 1) break;
        auto next = combine_peaks(prev.peaks, factor);
        if(next.size() == prev.peaks.size()) break;
        const uint32_t block = prev.block_size * factor;
        levels.push_back(PeakLevel{block, std::move(next)});
    }
    return levels;
}

core::Result<PeakCache> build_peak_cache(const std::string& source_path, const PeakBuildConfig& config) {
    auto identity = source_identity(source_path);
    if(identity.is_error()) return core::Error<PeakCache>(identity.error());
    if(config.target_channels == 0 || config.target_rate == 0) {
        return core::Error<PeakCache>("peak build needs a non-zero target rate and channel count");
    }

    log::info("Peak build start: " + source_path + " base_block=" + std::to_string(config.base_block) +
              " levels=" + std::to_string(config.max_levels) + " rate=" + std::to_string(config.target_rate));
    core::Stopwatch sw;

    PeakAccumulator accumulator(config.base_block);
    {
        AudioPeakDecoder decoder(config, accumulator);
        auto opened = decoder.open(source_path);
        if(opened.is_error()) return core::Error<PeakCache>(opened.error());
        auto ran = decoder.run();
        if(ran.is_error()) return core::Error<PeakCache>(ran.error());
    }

    PeakCache cache;
    cache.sample_rate = config.target_rate;
    cache.channels = config.target_channels;
    cache.source_size = identity.value().size;
    cache.source_mtime = identity.value().mtime_seconds;
    cache.levels = build_levels(accumulator.finish(), config.base_block, config.level_factor, config.max_levels);

    log::info("Peak build complete: " + source_path + " levels=" + std::to_string(cache.levels.size()) +
              " base_peaks=" + std::to_string(cache.levels.empty() ? 0 : cache.levels.front().peaks.size()) +
              " (" + std::to_string(static_cast<int>(sw.elapsed_ms())) + " ms)");
    return cache;
}

core::Result<std::string> build_and_store_peak_cache(const std::string& project_root, uint64_t asset_id,
                                                     const std::string& source_path, const PeakBuildConfig& config) {
    auto cache = build_peak_cache(source_path, config);
    if(cache.is_error()) return core::Error<std::string>(cache.error());
    std::string path = peak_cache_path(project_root, asset_id);
    auto written = write_peak_cache(path, cache.value());
    if(written.is_error()) return core::Error<std::string>(written.error());
    return path;
}

std::optional<std::string> resolve_audio_source(const std::string& project_root, const timeline::Asset& asset) {
    using Kind = timeline::Asset::Kind;
    switch(asset.kind) {
        case Kind::Audio:
        case Kind::Video:
            if(project_root.empty()) return asset.path;
            return (std::filesystem::path(project_root) / asset.path).string();
        case Kind::GenerativeAudio:
            return timeline::resolve_generative_path(project_root, asset.path, asset.active_version,
                                                     timeline::audio_extensions());
        case Kind::GenerativeVideo:
            return timeline::resolve_generative_path(project_root, asset.path, asset.active_version,
                                                     timeline::video_extensions());
        default:
            return std::nullopt;
    }
}

} // namespace nla::audio
