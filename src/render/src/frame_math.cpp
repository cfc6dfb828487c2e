#include "render/frame_math.hpp"
#include "render/preview_types.hpp"

#include <algorithm>
#include <cmath>

namespace nla::render {

CanvasSize preview_canvas_size(int project_width, int project_height, int max_width, int max_height) {
    if(project_width <= 0 || project_height <= 0) {
        return CanvasSize{std::max(max_width, 1), std::max(max_height, 1), 1.0f};
    }
    const float scale_w = static_cast<float>(max_width) / static_cast<float>(project_width);
    const float scale_h = static_cast<float>(max_height) / static_cast<float>(project_height);
    const float scale = std::max(std::min({scale_w, scale_h, 1.0f}), 0.01f);
    const int w = std::max(1, static_cast<int>(std::lround(project_width * scale)));
    const int h = std::max(1, static_cast<int>(std::lround(project_height * scale)));
    return CanvasSize{w, h, scale};
}

int64_t time_to_frame_index(double time_seconds, double fps) {
    fps = std::max(fps, 1.0);
    return static_cast<int64_t>(std::floor(std::max(time_seconds, 0.0) * fps));
}

double frame_index_to_time(int64_t frame_index, double fps) {
    fps = std::max(fps, 1.0);
    return static_cast<double>(std::max<int64_t>(frame_index, 0)) / fps;
}

double clamp_time(double time_seconds, std::optional<double> duration) {
    double t = std::max(time_seconds, 0.0);
    if(duration) t = std::min(t, std::max(*duration - kFrameTimeEpsilon, 0.0));
    return t;
}

uint64_t track_lane_id(timeline::TrackId track_id) {
    return static_cast<uint64_t>(track_id);
}

} // namespace nla::render
