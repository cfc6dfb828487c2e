#include "decode/frame.hpp"

#include <algorithm>
#include <cmath>

namespace nla::decode {

RgbaImage::RgbaImage(int w, int h)
    : width(std::max(w, 0)), height(std::max(h, 0)),
      pixels(static_cast<size_t>(std::max(w, 0)) * static_cast<size_t>(std::max(h, 0)) * 4, 0) {}

RgbaImage RgbaImage::filled(int w, int h, uint8_t r, uint8_t g, uint8_t b, uint8_t a) {
    RgbaImage img(w, h);
    for(size_t i = 0; i + 3 < img.pixels.size(); i += 4) {
        img.pixels[i] = r; img.pixels[i+1] = g; img.pixels[i+2] = b; img.pixels[i+3] = a;
    }
    return img;
}

const char* to_string(DecodeMode mode) {
    return mode == DecodeMode::Sequential ? "sequential" : "seek";
}

DecodeTimings& DecodeTimings::operator+=(const DecodeTimings& o) {
    seek_ms += o.seek_ms;
    packet_ms += o.packet_ms;
    transfer_ms += o.transfer_ms;
    scale_ms += o.scale_ms;
    copy_ms += o.copy_ms;
    return *this;
}

std::pair<int, int> fit_dimensions(int src_w, int src_h, int max_w, int max_h) {
    max_w = std::max(max_w, 1);
    max_h = std::max(max_h, 1);
    src_w = std::max(src_w, 1);
    src_h = std::max(src_h, 1);
    if(src_w <= max_w && src_h <= max_h) return {src_w, src_h};

    const double scale_w = static_cast<double>(max_w) / src_w;
    const double scale_h = static_cast<double>(max_h) / src_h;
    const double scale = std::max(std::min(scale_w, scale_h), 0.01);
    const int w = std::max(1, static_cast<int>(std::lround(src_w * scale)));
    const int h = std::max(1, static_cast<int>(std::lround(src_h * scale)));
    return {w, h};
}

} // namespace nla::decode
