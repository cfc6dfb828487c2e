#include "decode/scaler.hpp"
#include "core/log.hpp"

extern "C" {
#include <libavutil/frame.h>
#include <libavutil/imgutils.h>
#include <libswscale/swscale.h>
}

#include <algorithm>
#include <cstring>

namespace nla::decode {

FrameScaler::FrameScaler(int target_width, int target_height)
    : target_w_(std::max(target_width, 1)), target_h_(std::max(target_height, 1)) {}

FrameScaler::~FrameScaler() {
    if(sws_) sws_freeContext(sws_);
    release_buffer();
}

void FrameScaler::release_buffer() {
    if(dst_data_[0]) av_freep(&dst_data_[0]);
    std::fill(std::begin(dst_data_), std::end(dst_data_), nullptr);
    std::fill(std::begin(dst_linesize_), std::end(dst_linesize_), 0);
}

bool FrameScaler::ensure_context(int format, int width, int height) {
    if(sws_ && dst_data_[0] && format == src_format_ && width == src_w_ && height == src_h_) return true;

    // Key is committed only after both the buffer and the context exist.
    src_format_ = -1;
    if(!dst_data_[0]) {
        if(av_image_alloc(dst_data_, dst_linesize_, target_w_, target_h_, AV_PIX_FMT_RGBA, 32) < 0) {
            log::error("FrameScaler: av_image_alloc failed");
            release_buffer();
            return false;
        }
    }

    if(sws_) { sws_freeContext(sws_); sws_ = nullptr; }
    sws_ = sws_getContext(width, height, static_cast<AVPixelFormat>(format),
                          target_w_, target_h_, AV_PIX_FMT_RGBA,
                          SWS_BILINEAR, nullptr, nullptr, nullptr);
    if(!sws_) {
        log::warn("FrameScaler: sws_getContext failed for format " + std::to_string(format) + " " +
                  std::to_string(width) + "x" + std::to_string(height));
        return false;
    }
    src_format_ = format;
    src_w_ = width;
    src_h_ = height;
    ++rebuilds_;
    return true;
}

bool FrameScaler::scale(const AVFrame* src) {
    if(!src || src->width <= 0 || src->height <= 0 || src->format < 0) return false;
    if(!ensure_context(src->format, src->width, src->height)) return false;
    const int rows = sws_scale(sws_, src->data, src->linesize, 0, src->height, dst_data_, dst_linesize_);
    return rows > 0;
}

RgbaImage FrameScaler::copy_out() const {
    RgbaImage out(target_w_, target_h_);
    if(!dst_data_[0]) return RgbaImage{};
    const size_t row_bytes = static_cast<size_t>(target_w_) * 4;
    for(int y = 0; y < target_h_; ++y) {
        std::memcpy(out.row(y), dst_data_[0] + static_cast<size_t>(y) * static_cast<size_t>(dst_linesize_[0]), row_bytes);
    }
    return out;
}

} // namespace nla::decode
