#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace nla::decode {

// Tightly packed 8-bit RGBA pixels, row-major, no padding between rows.
struct RgbaImage {
    int width = 0;
    int height = 0;
    std::vector<uint8_t> pixels;

    RgbaImage() = default;
    RgbaImage(int w, int h);
    static RgbaImage filled(int w, int h, uint8_t r, uint8_t g, uint8_t b, uint8_t a);

    size_t size_bytes() const { return pixels.size(); }
    bool empty() const { return width <= 0 || height <= 0 || pixels.empty(); }

    uint8_t* row(int y) { return pixels.data() + static_cast<size_t>(y) * static_cast<size_t>(width) * 4; }
    const uint8_t* row(int y) const { return pixels.data() + static_cast<size_t>(y) * static_cast<size_t>(width) * 4; }
};

enum class DecodeMode { Seek, Sequential };

const char* to_string(DecodeMode mode);

// Wall-clock breakdown of one decode call, in milliseconds.
struct DecodeTimings {
    double seek_ms = 0.0;
    double packet_ms = 0.0;
    double transfer_ms = 0.0;
    double scale_ms = 0.0;
    double copy_ms = 0.0;

    double total_ms() const { return seek_ms + packet_ms + transfer_ms + scale_ms + copy_ms; }
    DecodeTimings& operator+=(const DecodeTimings& o);
};

struct DecodeRequest {
    std::string path;
    double time_seconds = 0.0;
    DecodeMode mode = DecodeMode::Seek;
    uint64_t lane = 0;
    bool allow_hw = true;
};

struct DecodeResponse {
    std::optional<RgbaImage> image;   // empty when no frame could be produced
    int source_width = 0;
    int source_height = 0;
    DecodeTimings timings;
    bool used_hw = false;
};

// Fits (src_w, src_h) inside (max_w, max_h) keeping aspect ratio. Never upscales;
// dimensions are rounded and at least 1.
std::pair<int, int> fit_dimensions(int src_w, int src_h, int max_w, int max_h);

} // namespace nla::decode
