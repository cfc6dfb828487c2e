#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace nla::timeline {

using ClipId = uint64_t;
using TrackId = uint64_t;
using AssetId = uint64_t;
using MarkerId = uint64_t;

struct ProjectSettings {
    int width = 1920;
    int height = 1080;
    double fps = 30.0;
    double duration_seconds = 60.0;
};

struct Track {
    enum class Type { Video, Audio, Marker };

    TrackId id = 0;
    std::string name;
    Type type = Type::Video;
    float volume = 1.0f;
};

struct ClipTransform {
    float position_x = 0.0f;
    float position_y = 0.0f;
    float scale_x = 1.0f;
    float scale_y = 1.0f;
    float rotation_deg = 0.0f;
    float opacity = 1.0f;
};

struct Clip {
    ClipId id = 0;
    AssetId asset_id = 0;
    TrackId track_id = 0;
    double start_time = 0.0;
    double duration = 0.0;
    double trim_in_seconds = 0.0;
    float volume = 1.0f;
    ClipTransform transform;

    double end_time() const { return start_time + duration; }
    bool active_at(double t) const { return t >= start_time && t < end_time(); }
    // Media time for timeline time t, floored at 0.
    double source_time_at(double t) const;
};

struct Asset {
    enum class Kind { Video, Image, Audio, GenerativeVideo, GenerativeImage, GenerativeAudio };

    AssetId id = 0;
    std::string name;
    Kind kind = Kind::Video;
    // File path for plain assets, folder for generative ones; relative to the project root.
    std::string path;
    std::optional<std::string> active_version;
    std::optional<double> duration_seconds;

    bool is_visual() const;
    bool is_video() const { return kind == Kind::Video || kind == Kind::GenerativeVideo; }
    bool is_generative() const;
};

struct Marker {
    MarkerId id = 0;
    double time = 0.0;
    std::string label;
};

// A visual clip active at some time, with its z-order lane resolved.
struct ActiveClip {
    const Clip* clip = nullptr;
    const Asset* asset = nullptr;
    size_t track_index = 0;     // position among video tracks, 0 = first
    double source_time = 0.0;
};

// Read-only view of a project handed to the renderer for one call.
struct ProjectSnapshot {
    std::string project_root;
    ProjectSettings settings;
    std::vector<Track> tracks;
    std::vector<Clip> clips;
    std::vector<Asset> assets;
    std::vector<Marker> markers;

    const Asset* find_asset(AssetId id) const;
    const Track* find_track(TrackId id) const;
    const Clip* find_clip(ClipId id) const;
    // Video track id -> index among video tracks in declaration order.
    std::unordered_map<TrackId, size_t> visual_track_order() const;
    std::vector<ActiveClip> active_visual_clips(double time_seconds) const;
    bool has_visual_clips() const;
};

} // namespace nla::timeline
