#pragma once
#include "decode/frame.hpp"
#include "decode/hw_accel.hpp"
#include "decode/hw_device.hpp"
#include "core/result.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace nla::decode {

struct DecoderOpenParams {
    std::string path;
    int max_width = 960;
    int max_height = 540;
    bool allow_hw = true;
    std::vector<HwDeviceKind> hw_candidates = platform_hw_candidates();
    double sequential_window_seconds = 2.0;
    // Empty functions select probe_hw_device and default_frame_transfer.
    HwProbeFn hw_probe;
    FrameTransferFn hw_transfer;
    // Consecutive transfer failures after which the decoder reopens in software.
    int hw_transfer_failure_limit = 3;
};

// One open media source. Instances are confined to the thread that created them.
class IVideoDecoder {
public:
    virtual ~IVideoDecoder() = default;
    // Produces the first frame whose timestamp reaches time_seconds, scaled to fit the open bounds.
    virtual DecodeResponse decode_at(double time_seconds, DecodeMode mode) = 0;
    virtual bool hardware_active() const = 0;
};

using DecoderFactory = std::function<core::Result<std::unique_ptr<IVideoDecoder>>(const DecoderOpenParams&)>;

core::Result<std::unique_ptr<IVideoDecoder>> open_ffmpeg_decoder(const DecoderOpenParams& params);
DecoderFactory make_ffmpeg_decoder_factory();

} // namespace nla::decode
