#pragma once
#include "decode/frame.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace nla::render {

// Decoders may report a frame slightly before the requested time; clip ends are clamped by this much.
inline constexpr double kFrameTimeEpsilon = 0.001;
inline constexpr size_t kMaxCacheBuckets = 120;
inline constexpr int kPlateBorderWidth = 1;

struct Rgba8 { uint8_t r = 0, g = 0, b = 0, a = 255; };
inline constexpr Rgba8 kPlateBorderColor{0x27, 0x27, 0x2a, 255};

using PreviewDecodeMode = decode::DecodeMode;

// Per-call timing and counter breakdown for the diagnostics overlay.
struct PreviewStats {
    double total_ms = 0.0;
    double collect_ms = 0.0;
    double composite_ms = 0.0;
    double encode_ms = 0.0;
    double video_decode_ms = 0.0;
    double video_decode_seek_ms = 0.0;
    double video_decode_packet_ms = 0.0;
    double video_decode_transfer_ms = 0.0;
    double video_decode_scale_ms = 0.0;
    double video_decode_copy_ms = 0.0;
    double still_load_ms = 0.0;
    size_t hw_decode_frames = 0;
    size_t sw_decode_frames = 0;
    size_t layers = 0;
    size_t cache_hits = 0;
    size_t cache_misses = 0;

    void add_decode_timings(const decode::DecodeTimings& t);
};

std::string stats_to_json(const PreviewStats& stats);
std::string stats_summary(const PreviewStats& stats);

struct PreviewFrameInfo {
    uint64_t version = 0;
    int width = 0;
    int height = 0;
};

// Layer geometry in canvas pixels.
struct PreviewLayerPlacement {
    float offset_x = 0.0f;
    float offset_y = 0.0f;
    float scaled_w = 0.0f;
    float scaled_h = 0.0f;
    float opacity = 1.0f;
    float rotation_deg = 0.0f;
};

struct PreviewLayerGpu {
    std::shared_ptr<const decode::RgbaImage> image;
    PreviewLayerPlacement placement;
};

struct PreviewLayerStack {
    int canvas_width = 0;
    int canvas_height = 0;
    std::vector<PreviewLayerGpu> layers;
};

struct RenderOutput {
    std::optional<PreviewFrameInfo> frame;
    std::optional<PreviewLayerStack> layers;
    PreviewStats stats;
};

} // namespace nla::render
