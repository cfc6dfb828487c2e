#include "render/layers.hpp"
#include "core/log_config.hpp"

#include <algorithm>
#include <cmath>

namespace nla::render {

namespace {

constexpr float kPi = 3.14159265358979323846f;
constexpr float kRotationEpsilon = 0.01f;

struct Sample { float r, g, b, a; };

Sample sample_bilinear(const decode::RgbaImage& img, float sx, float sy) {
    sx = std::clamp(sx, 0.0f, static_cast<float>(img.width - 1));
    sy = std::clamp(sy, 0.0f, static_cast<float>(img.height - 1));
    const int x0 = static_cast<int>(sx);
    const int y0 = static_cast<int>(sy);
    const int x1 = std::min(x0 + 1, img.width - 1);
    const int y1 = std::min(y0 + 1, img.height - 1);
    const float fx = sx - static_cast<float>(x0);
    const float fy = sy - static_cast<float>(y0);

    const uint8_t* p00 = img.row(y0) + x0 * 4;
    const uint8_t* p10 = img.row(y0) + x1 * 4;
    const uint8_t* p01 = img.row(y1) + x0 * 4;
    const uint8_t* p11 = img.row(y1) + x1 * 4;
    float c[4];
    for(int i = 0; i < 4; ++i) {
        const float top = p00[i] + (p10[i] - p00[i]) * fx;
        const float bottom = p01[i] + (p11[i] - p01[i]) * fx;
        c[i] = top + (bottom - top) * fy;
    }
    return Sample{c[0], c[1], c[2], c[3]};
}

uint8_t to_u8(float v) {
    return static_cast<uint8_t>(std::lround(std::clamp(v, 0.0f, 255.0f)));
}

void blend_over(uint8_t* dst, const Sample& s, float opacity) {
    const float a = (s.a / 255.0f) * opacity;
    if(a <= 0.0f) return;
    const float inv = 1.0f - a;
    dst[0] = to_u8(s.r * a + dst[0] * inv);
    dst[1] = to_u8(s.g * a + dst[1] * inv);
    dst[2] = to_u8(s.b * a + dst[2] * inv);
    dst[3] = to_u8(255.0f * a + dst[3] * inv);
}

} // namespace

std::optional<PreviewLayerPlacement> compute_layer_placement(const decode::RgbaImage& image,
                                                             int source_width, int source_height,
                                                             const timeline::ClipTransform& transform,
                                                             float preview_scale, float canvas_w, float canvas_h) {
    const float decoded_w = static_cast<float>(std::max(image.width, 1));
    const float decoded_h = static_cast<float>(std::max(image.height, 1));
    const float source_w = source_width > 0 ? static_cast<float>(source_width) : decoded_w;
    const float source_h = source_height > 0 ? static_cast<float>(source_height) : decoded_h;

    const float base_scale_x = (source_w * preview_scale) / decoded_w;
    const float base_scale_y = (source_h * preview_scale) / decoded_h;
    const float scaled_w = decoded_w * base_scale_x * std::max(transform.scale_x, 0.01f);
    const float scaled_h = decoded_h * base_scale_y * std::max(transform.scale_y, 0.01f);
    if(!(scaled_w > 0.0f) || !(scaled_h > 0.0f)) return std::nullopt;

    PreviewLayerPlacement p;
    p.scaled_w = scaled_w;
    p.scaled_h = scaled_h;
    p.offset_x = (canvas_w - scaled_w) * 0.5f + transform.position_x * preview_scale;
    p.offset_y = (canvas_h - scaled_h) * 0.5f + transform.position_y * preview_scale;
    p.opacity = std::clamp(transform.opacity, 0.0f, 1.0f);
    p.rotation_deg = transform.rotation_deg;
    return p;
}

void composite_layer(decode::RgbaImage& canvas, const decode::RgbaImage& image, const PreviewLayerPlacement& p) {
    if(canvas.empty() || image.empty() || p.opacity <= 0.0f) return;
    if(p.scaled_w < 0.5f || p.scaled_h < 0.5f) return;

    const float cx = p.offset_x + p.scaled_w * 0.5f;
    const float cy = p.offset_y + p.scaled_h * 0.5f;
    const bool rotated = std::abs(p.rotation_deg) > kRotationEpsilon;
    const float angle = p.rotation_deg * kPi / 180.0f;
    const float cos_a = rotated ? std::cos(angle) : 1.0f;
    const float sin_a = rotated ? std::sin(angle) : 0.0f;

    // Axis-aligned bounds of the (possibly rotated) layer rectangle.
    const float half_w = std::abs(p.scaled_w * 0.5f * cos_a) + std::abs(p.scaled_h * 0.5f * sin_a);
    const float half_h = std::abs(p.scaled_w * 0.5f * sin_a) + std::abs(p.scaled_h * 0.5f * cos_a);
    const int x_begin = std::max(0, static_cast<int>(std::floor(cx - half_w)));
    const int y_begin = std::max(0, static_cast<int>(std::floor(cy - half_h)));
    const int x_end = std::min(canvas.width, static_cast<int>(std::ceil(cx + half_w)));
    const int y_end = std::min(canvas.height, static_cast<int>(std::ceil(cy + half_h)));
    if(x_begin >= x_end || y_begin >= y_end) return;

    const float to_src_x = static_cast<float>(image.width) / p.scaled_w;
    const float to_src_y = static_cast<float>(image.height) / p.scaled_h;

    for(int y = y_begin; y < y_end; ++y) {
        uint8_t* dst_row = canvas.row(y);
        const float dy = static_cast<float>(y) + 0.5f - cy;
        for(int x = x_begin; x < x_end; ++x) {
            const float dx = static_cast<float>(x) + 0.5f - cx;
            // Inverse rotation takes the canvas pixel back into the layer's frame.
            const float lx = dx * cos_a + dy * sin_a + p.scaled_w * 0.5f;
            const float ly = -dx * sin_a + dy * cos_a + p.scaled_h * 0.5f;
            if(lx < 0.0f || ly < 0.0f || lx >= p.scaled_w || ly >= p.scaled_h) continue;
            const Sample s = sample_bilinear(image, lx * to_src_x - 0.5f, ly * to_src_y - 0.5f);
            blend_over(dst_row + x * 4, s, p.opacity);
        }
    }
    NLA_RENDER_TRACE("composited layer " + std::to_string(image.width) + "x" + std::to_string(image.height) +
                     " at " + std::to_string(p.offset_x) + "," + std::to_string(p.offset_y));
}

void draw_border(decode::RgbaImage& image, Rgba8 color, int border_width) {
    if(image.empty() || border_width <= 0) return;
    border_width = std::min({border_width, image.width, image.height});
    auto put = [&](int x, int y) {
        uint8_t* px = image.row(y) + x * 4;
        px[0] = color.r; px[1] = color.g; px[2] = color.b; px[3] = color.a;
    };
    for(int i = 0; i < border_width; ++i) {
        for(int x = 0; x < image.width; ++x) { put(x, i); put(x, image.height - 1 - i); }
        for(int y = 0; y < image.height; ++y) { put(i, y); put(image.width - 1 - i, y); }
    }
}

} // namespace nla::render
