#include "decode/hw_accel.hpp"
#include "core/log.hpp"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavutil/pixdesc.h>
}

#include <string>

namespace nla::decode {

const char* hw_device_name(HwDeviceKind kind) {
    switch(kind) {
        case HwDeviceKind::Vaapi: return "vaapi";
        case HwDeviceKind::Cuda: return "cuda";
        case HwDeviceKind::Vdpau: return "vdpau";
        case HwDeviceKind::VideoToolbox: return "videotoolbox";
        case HwDeviceKind::D3D11VA: return "d3d11va";
        case HwDeviceKind::DXVA2: return "dxva2";
    }
    return "unknown";
}

std::optional<HwDeviceKind> hw_device_from_name(const std::string& name) {
    for(HwDeviceKind k : {HwDeviceKind::Vaapi, HwDeviceKind::Cuda, HwDeviceKind::Vdpau,
                          HwDeviceKind::VideoToolbox, HwDeviceKind::D3D11VA, HwDeviceKind::DXVA2}) {
        if(name == hw_device_name(k)) return k;
    }
    return std::nullopt;
}

std::vector<HwDeviceKind> platform_hw_candidates() {
#if defined(_WIN32)
    return {HwDeviceKind::D3D11VA, HwDeviceKind::DXVA2, HwDeviceKind::Cuda};
#elif defined(__APPLE__)
    return {HwDeviceKind::VideoToolbox};
#else
    return {HwDeviceKind::Vaapi, HwDeviceKind::Cuda, HwDeviceKind::Vdpau};
#endif
}

AVHWDeviceType to_av_device_type(HwDeviceKind kind) {
    switch(kind) {
        case HwDeviceKind::Vaapi: return AV_HWDEVICE_TYPE_VAAPI;
        case HwDeviceKind::Cuda: return AV_HWDEVICE_TYPE_CUDA;
        case HwDeviceKind::Vdpau: return AV_HWDEVICE_TYPE_VDPAU;
        case HwDeviceKind::VideoToolbox: return AV_HWDEVICE_TYPE_VIDEOTOOLBOX;
        case HwDeviceKind::D3D11VA: return AV_HWDEVICE_TYPE_D3D11VA;
        case HwDeviceKind::DXVA2: return AV_HWDEVICE_TYPE_DXVA2;
    }
    return AV_HWDEVICE_TYPE_NONE;
}

AVPixelFormat preferred_hw_pix_fmt(HwDeviceKind kind) {
    switch(kind) {
        case HwDeviceKind::Vaapi: return AV_PIX_FMT_VAAPI;
        case HwDeviceKind::Cuda: return AV_PIX_FMT_CUDA;
        case HwDeviceKind::Vdpau: return AV_PIX_FMT_VDPAU;
        case HwDeviceKind::VideoToolbox: return AV_PIX_FMT_VIDEOTOOLBOX;
        case HwDeviceKind::D3D11VA: return AV_PIX_FMT_D3D11;
        case HwDeviceKind::DXVA2: return AV_PIX_FMT_DXVA2_VLD;
    }
    return AV_PIX_FMT_NONE;
}

HwDeviceRef& HwDeviceRef::operator=(HwDeviceRef&& other) noexcept {
    if(this != &other) {
        reset();
        ref_ = other.ref_;
        other.ref_ = nullptr;
    }
    return *this;
}

AVBufferRef* HwDeviceRef::new_ref() const {
    return ref_ ? av_buffer_ref(ref_) : nullptr;
}

void HwDeviceRef::reset() {
    if(ref_) av_buffer_unref(&ref_);
}

AVPixelFormat HwFormatNegotiator::choose(const AVPixelFormat* offered) const {
    if(!offered) return AV_PIX_FMT_NONE;
    if(hw_format_ != AV_PIX_FMT_NONE) {
        for(const AVPixelFormat* p = offered; *p != AV_PIX_FMT_NONE; ++p) {
            if(*p == hw_format_) return hw_format_;
        }
    }
    // Hardware surface not on offer: take the first format we can read on the CPU.
    for(const AVPixelFormat* p = offered; *p != AV_PIX_FMT_NONE; ++p) {
        const AVPixFmtDescriptor* desc = av_pix_fmt_desc_get(*p);
        if(desc && !(desc->flags & AV_PIX_FMT_FLAG_HWACCEL)) return *p;
    }
    return offered[0];
}

void HwFormatNegotiator::install(AVCodecContext* ctx) {
    if(!ctx) return;
    ctx->opaque = this;
    ctx->get_format = &HwFormatNegotiator::get_format_trampoline;
}

AVPixelFormat HwFormatNegotiator::get_format_trampoline(AVCodecContext* ctx, const AVPixelFormat* offered) {
    const auto* self = static_cast<const HwFormatNegotiator*>(ctx->opaque);
    if(!self) return offered ? offered[0] : AV_PIX_FMT_NONE;
    return self->choose(offered);
}

int default_device_create(AVBufferRef** out, AVHWDeviceType type) {
    return av_hwdevice_ctx_create(out, type, nullptr, nullptr, 0);
}

int default_frame_transfer(AVFrame* dst, const AVFrame* src) {
    return av_hwframe_transfer_data(dst, src, 0);
}

namespace {

// Pixel format the codec produces through a device context of this type, or NONE.
AVPixelFormat codec_hw_format(const AVCodec* codec, AVHWDeviceType type) {
    for(int i = 0;; ++i) {
        const AVCodecHWConfig* config = avcodec_get_hw_config(codec, i);
        if(!config) break;
        if((config->methods & AV_CODEC_HW_CONFIG_METHOD_HW_DEVICE_CTX) && config->device_type == type) {
            return config->pix_fmt;
        }
    }
    return AV_PIX_FMT_NONE;
}

} // namespace

std::optional<HwProbeResult> probe_hw_device(const AVCodec* codec,
                                             const std::vector<HwDeviceKind>& candidates,
                                             const DeviceCreateFn& create) {
    if(!create) return std::nullopt;
    for(HwDeviceKind kind : candidates) {
        const AVHWDeviceType type = to_av_device_type(kind);
        if(type == AV_HWDEVICE_TYPE_NONE) continue;

        AVPixelFormat pix_fmt = preferred_hw_pix_fmt(kind);
        if(codec) {
            pix_fmt = codec_hw_format(codec, type);
            if(pix_fmt == AV_PIX_FMT_NONE) {
                log::debug(std::string("HW probe: codec ") + codec->name + " has no " + hw_device_name(kind) + " config");
                continue;
            }
        }

        AVBufferRef* raw = nullptr;
        const int rc = create(&raw, type);
        HwDeviceRef device(raw);
        if(rc < 0 || !device) {
            log::debug(std::string("HW probe: ") + hw_device_name(kind) + " unavailable (rc=" + std::to_string(rc) + ")");
            continue;
        }
        log::info(std::string("Hardware decode device selected: ") + hw_device_name(kind));
        return HwProbeResult{kind, std::move(device), pix_fmt};
    }
    return std::nullopt;
}

} // namespace nla::decode
