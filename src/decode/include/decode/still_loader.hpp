#pragma once
#include "decode/frame.hpp"
#include "core/result.hpp"

#include <functional>
#include <string>

namespace nla::decode {

struct StillImage {
    RgbaImage image;        // fitted to the requested bounds
    int source_width = 0;
    int source_height = 0;
};

// Decodes a still image (png, jpg, webp, ...) through FFmpeg's image demuxers.
core::Result<StillImage> load_still_image(const std::string& path, int max_width, int max_height);

using StillLoader = std::function<core::Result<StillImage>(const std::string& path, int max_width, int max_height)>;

} // namespace nla::decode
