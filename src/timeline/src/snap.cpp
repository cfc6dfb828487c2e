#include "timeline/snap.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace nla::timeline {

namespace {
constexpr double kSnapEpsilon = 1e-4;
}

int snap_priority(SnapTargetKind kind) {
    switch(kind) {
        case SnapTargetKind::ClipEdge: return 3;
        case SnapTargetKind::Playhead: return 2;
        case SnapTargetKind::Marker: return 1;
    }
    return 0;
}

SnapTarget SnapTarget::clip_edge(double frame, ClipId clip) {
    return SnapTarget{frame, SnapTargetKind::ClipEdge, clip, std::nullopt};
}

SnapTarget SnapTarget::playhead(double frame) {
    return SnapTarget{frame, SnapTargetKind::Playhead, std::nullopt, std::nullopt};
}

SnapTarget SnapTarget::marker(double frame, MarkerId marker) {
    return SnapTarget{frame, SnapTargetKind::Marker, std::nullopt, marker};
}

double frames_from_seconds(double time_seconds, double fps) {
    return time_seconds * std::max(fps, 1.0);
}

double seconds_from_frames(double frames, double fps) {
    return frames / std::max(fps, 1.0);
}

double snap_time_to_frame(double time_seconds, double fps) {
    fps = std::max(fps, 1.0);
    return std::round(time_seconds * fps) / fps;
}

double snap_threshold_frames(double threshold_px, double zoom, double fps) {
    if(zoom <= 0.0) return 0.0;
    return (threshold_px / zoom) * fps;
}

std::optional<SnapMatch> best_snap_delta_frames(const std::vector<double>& sources_frames,
                                                const std::vector<SnapTarget>& targets,
                                                double threshold_frames) {
    if(sources_frames.empty() || targets.empty() || !(threshold_frames > 0.0)) return std::nullopt;

    std::optional<SnapMatch> best;
    double best_distance = std::numeric_limits<double>::infinity();
    int best_priority = std::numeric_limits<int>::min();

    for(double source : sources_frames) {
        for(const auto& target : targets) {
            const double delta = target.frame - source;
            const double distance = std::abs(delta);
            if(distance > threshold_frames) continue;
            const int priority = snap_priority(target.kind);
            const bool closer = distance + kSnapEpsilon < best_distance;
            const bool tie_wins = std::abs(distance - best_distance) <= kSnapEpsilon && priority > best_priority;
            if(closer || tie_wins) {
                best_distance = distance;
                best_priority = priority;
                best = SnapMatch{delta, target};
            }
        }
    }
    return best;
}

std::vector<SnapTarget> collect_snap_targets(const ProjectSnapshot& snapshot, double playhead_seconds,
                                             std::optional<ClipId> exclude_clip,
                                             std::optional<MarkerId> exclude_marker) {
    const double fps = snapshot.settings.fps;
    std::vector<SnapTarget> targets;
    targets.reserve(snapshot.clips.size() * 2 + snapshot.markers.size() + 1);
    for(const auto& clip : snapshot.clips) {
        if(exclude_clip && clip.id == *exclude_clip) continue;
        targets.push_back(SnapTarget::clip_edge(frames_from_seconds(clip.start_time, fps), clip.id));
        targets.push_back(SnapTarget::clip_edge(frames_from_seconds(clip.end_time(), fps), clip.id));
    }
    targets.push_back(SnapTarget::playhead(frames_from_seconds(playhead_seconds, fps)));
    for(const auto& marker : snapshot.markers) {
        if(exclude_marker && marker.id == *exclude_marker) continue;
        targets.push_back(SnapTarget::marker(frames_from_seconds(marker.time, fps), marker.id));
    }
    return targets;
}

DragResult resolve_drag(double start_seconds, double delta_px, double zoom, double fps, double duration_seconds,
                        const std::vector<SnapTarget>& targets, double threshold_px, bool snap_enabled) {
    DragResult result;
    const double delta_frames = zoom > 0.0 ? (delta_px / zoom) * fps : 0.0;
    double frames = std::round(frames_from_seconds(start_seconds, fps)) + delta_frames;

    if(snap_enabled) {
        const double threshold = snap_threshold_frames(threshold_px, zoom, fps);
        if(auto hit = best_snap_delta_frames({frames}, targets, threshold)) {
            frames += hit->delta_frames;
            result.snapped_to_seconds = seconds_from_frames(hit->target.frame, fps);
        }
    }

    const double max_frames = std::round(frames_from_seconds(std::max(duration_seconds, 0.0), fps));
    const double snapped = std::clamp(std::round(frames), 0.0, max_frames);
    result.time_seconds = seconds_from_frames(snapped, fps);
    return result;
}

} // namespace nla::timeline
