#pragma once
#include "timeline/timeline.hpp"

#include <cstdint>
#include <optional>

namespace nla::render {

struct CanvasSize {
    int width = 1;
    int height = 1;
    float scale = 1.0f;     // canvas pixels per project pixel
};

// Fits the project resolution into the preview bounds without upscaling.
// A zero-sized project falls back to the bounds at scale 1.
CanvasSize preview_canvas_size(int project_width, int project_height, int max_width, int max_height);

int64_t time_to_frame_index(double time_seconds, double fps);
double frame_index_to_time(int64_t frame_index, double fps);
// Keeps t inside [0, duration - epsilon] so the last frame stays decodable.
double clamp_time(double time_seconds, std::optional<double> duration);
// Decode routing lane for all clips of a track.
uint64_t track_lane_id(timeline::TrackId track_id);

} // namespace nla::render
