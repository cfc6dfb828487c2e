#pragma once
#include "render/preview_types.hpp"
#include "timeline/timeline.hpp"

#include <optional>

namespace nla::render {

// Resolves a clip transform to canvas pixels. image is the decoded (possibly downscaled)
// frame; source_width/height are the native media dimensions, 0 meaning "same as decoded".
std::optional<PreviewLayerPlacement> compute_layer_placement(const decode::RgbaImage& image,
                                                             int source_width, int source_height,
                                                             const timeline::ClipTransform& transform,
                                                             float preview_scale, float canvas_w, float canvas_h);

// Draws image onto canvas at placement: bilinear sampling, rotation about the layer
// center (clockwise for positive degrees), alpha scaled by opacity, source-over blend.
void composite_layer(decode::RgbaImage& canvas, const decode::RgbaImage& image, const PreviewLayerPlacement& placement);

void draw_border(decode::RgbaImage& image, Rgba8 color, int border_width);

} // namespace nla::render
