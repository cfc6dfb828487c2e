#pragma once
#include "decode/frame.hpp"

#include <cstdint>

struct AVFrame;
struct SwsContext;

namespace nla::decode {

// Converts decoded frames to packed RGBA at a fixed target size. The swscale
// context is rebuilt lazily whenever the source (format, width, height) changes.
class FrameScaler {
public:
    FrameScaler(int target_width, int target_height);
    ~FrameScaler();

    FrameScaler(const FrameScaler&) = delete;
    FrameScaler& operator=(const FrameScaler&) = delete;

    // Scales src into the internal RGBA buffer. Returns false on unusable input.
    bool scale(const AVFrame* src);
    // Copies the last scaled frame into a tightly packed image.
    RgbaImage copy_out() const;

    int target_width() const { return target_w_; }
    int target_height() const { return target_h_; }
    int rebuild_count() const { return rebuilds_; }

private:
    bool ensure_context(int format, int width, int height);
    void release_buffer();

    int target_w_;
    int target_h_;
    SwsContext* sws_ = nullptr;
    int src_format_ = -1;
    int src_w_ = 0;
    int src_h_ = 0;
    int rebuilds_ = 0;
    uint8_t* dst_data_[4] = {nullptr, nullptr, nullptr, nullptr};
    int dst_linesize_[4] = {0, 0, 0, 0};
};

} // namespace nla::decode
