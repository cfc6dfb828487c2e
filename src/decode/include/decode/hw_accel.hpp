#pragma once
#include "decode/hw_device.hpp"

#include <functional>
#include <optional>
#include <vector>

extern "C" {
#include <libavutil/buffer.h>
#include <libavutil/hwcontext.h>
#include <libavutil/pixfmt.h>
}

struct AVCodec;
struct AVCodecContext;
struct AVFrame;

namespace nla::decode {

AVHWDeviceType to_av_device_type(HwDeviceKind kind);
// Hardware surface format conventionally produced by a device type.
AVPixelFormat preferred_hw_pix_fmt(HwDeviceKind kind);

// Owns one reference to an FFmpeg hardware device context and releases it exactly once.
class HwDeviceRef {
public:
    HwDeviceRef() = default;
    explicit HwDeviceRef(AVBufferRef* ref) : ref_(ref) {}
    ~HwDeviceRef() { reset(); }

    HwDeviceRef(const HwDeviceRef&) = delete;
    HwDeviceRef& operator=(const HwDeviceRef&) = delete;
    HwDeviceRef(HwDeviceRef&& other) noexcept : ref_(other.ref_) { other.ref_ = nullptr; }
    HwDeviceRef& operator=(HwDeviceRef&& other) noexcept;

    AVBufferRef* get() const { return ref_; }
    // Additional reference for handing to a codec context; caller owns it.
    AVBufferRef* new_ref() const;
    void reset();
    explicit operator bool() const { return ref_ != nullptr; }

private:
    AVBufferRef* ref_ = nullptr;
};

// Picks the pixel format a codec context decodes into. Installed into the codec
// context at open time; FFmpeg reaches it through AVCodecContext::opaque.
class HwFormatNegotiator {
public:
    explicit HwFormatNegotiator(AVPixelFormat hw_format) : hw_format_(hw_format) {}

    // Returns the hardware format when offered, else the first software format.
    AVPixelFormat choose(const AVPixelFormat* offered) const;
    AVPixelFormat hw_format() const { return hw_format_; }

    void install(AVCodecContext* ctx);

private:
    static AVPixelFormat get_format_trampoline(AVCodecContext* ctx, const AVPixelFormat* offered);
    AVPixelFormat hw_format_;
};

// Creates a device of the given type, storing a new reference in *out. Returns an AVERROR code.
using DeviceCreateFn = std::function<int(AVBufferRef** out, AVHWDeviceType type)>;
int default_device_create(AVBufferRef** out, AVHWDeviceType type);

struct HwProbeResult {
    HwDeviceKind kind;
    HwDeviceRef device;
    AVPixelFormat pix_fmt = AV_PIX_FMT_NONE;
};

// Tries candidates in order and returns the first device that can be created and that
// the codec can decode into. A null codec skips the codec capability check.
std::optional<HwProbeResult> probe_hw_device(const AVCodec* codec,
                                             const std::vector<HwDeviceKind>& candidates,
                                             const DeviceCreateFn& create = default_device_create);

using HwProbeFn = std::function<std::optional<HwProbeResult>(const AVCodec* codec,
                                                             const std::vector<HwDeviceKind>& candidates)>;

// Copies a decoded hardware surface into host memory. Returns an AVERROR code.
using FrameTransferFn = std::function<int(AVFrame* dst, const AVFrame* src)>;
int default_frame_transfer(AVFrame* dst, const AVFrame* src);

} // namespace nla::decode
