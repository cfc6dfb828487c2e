#pragma once
#include "timeline/timeline.hpp"

#include <optional>
#include <vector>

namespace nla::timeline {

enum class SnapTargetKind { ClipEdge, Playhead, Marker };

// Tie-break priority when two targets are equally close.
int snap_priority(SnapTargetKind kind);

// A position, in frame units, that a dragged element can lock onto.
struct SnapTarget {
    double frame = 0.0;
    SnapTargetKind kind = SnapTargetKind::Playhead;
    std::optional<ClipId> clip_id;
    std::optional<MarkerId> marker_id;

    static SnapTarget clip_edge(double frame, ClipId clip);
    static SnapTarget playhead(double frame);
    static SnapTarget marker(double frame, MarkerId marker);
};

struct SnapMatch {
    double delta_frames = 0.0;  // add to the source to land on the target
    SnapTarget target;
};

double frames_from_seconds(double time_seconds, double fps);
double seconds_from_frames(double frames, double fps);
double snap_time_to_frame(double time_seconds, double fps);
// Converts a pixel threshold at the given zoom (pixels per second) into frames.
double snap_threshold_frames(double threshold_px, double zoom, double fps);

std::optional<SnapMatch> best_snap_delta_frames(const std::vector<double>& sources_frames,
                                                const std::vector<SnapTarget>& targets,
                                                double threshold_frames);

// Clip start/end edges, the playhead and all markers, minus the element being dragged.
std::vector<SnapTarget> collect_snap_targets(const ProjectSnapshot& snapshot, double playhead_seconds,
                                             std::optional<ClipId> exclude_clip = std::nullopt,
                                             std::optional<MarkerId> exclude_marker = std::nullopt);

struct DragResult {
    double time_seconds = 0.0;
    std::optional<double> snapped_to_seconds;   // guide position when a snap happened
};

// Resolves a horizontal drag of an element that started at start_seconds: converts the
// pointer delta to frames, snaps when enabled, rounds to a frame and clamps to [0, duration].
DragResult resolve_drag(double start_seconds, double delta_px, double zoom, double fps, double duration_seconds,
                        const std::vector<SnapTarget>& targets, double threshold_px, bool snap_enabled);

} // namespace nla::timeline
