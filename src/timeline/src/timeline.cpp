#include "timeline/timeline.hpp"

#include <algorithm>

namespace nla::timeline {

double Clip::source_time_at(double t) const {
    return std::max(t - start_time + trim_in_seconds, 0.0);
}

bool Asset::is_visual() const {
    switch(kind) {
        case Kind::Video:
        case Kind::Image:
        case Kind::GenerativeVideo:
        case Kind::GenerativeImage:
            return true;
        default:
            return false;
    }
}

bool Asset::is_generative() const {
    return kind == Kind::GenerativeVideo || kind == Kind::GenerativeImage || kind == Kind::GenerativeAudio;
}

const Asset* ProjectSnapshot::find_asset(AssetId id) const {
    auto it = std::find_if(assets.begin(), assets.end(), [id](const Asset& a){ return a.id == id; });
    return it == assets.end() ? nullptr : &*it;
}

const Track* ProjectSnapshot::find_track(TrackId id) const {
    auto it = std::find_if(tracks.begin(), tracks.end(), [id](const Track& t){ return t.id == id; });
    return it == tracks.end() ? nullptr : &*it;
}

const Clip* ProjectSnapshot::find_clip(ClipId id) const {
    auto it = std::find_if(clips.begin(), clips.end(), [id](const Clip& c){ return c.id == id; });
    return it == clips.end() ? nullptr : &*it;
}

std::unordered_map<TrackId, size_t> ProjectSnapshot::visual_track_order() const {
    std::unordered_map<TrackId, size_t> order;
    size_t next = 0;
    for(const auto& track : tracks) {
        if(track.type == Track::Type::Video) order.emplace(track.id, next++);
    }
    return order;
}

std::vector<ActiveClip> ProjectSnapshot::active_visual_clips(double time_seconds) const {
    std::vector<ActiveClip> out;
    const auto order = visual_track_order();
    for(const auto& clip : clips) {
        auto track = order.find(clip.track_id);
        if(track == order.end()) continue;
        if(!clip.active_at(time_seconds)) continue;
        const Asset* asset = find_asset(clip.asset_id);
        if(!asset || !asset->is_visual()) continue;
        out.push_back(ActiveClip{&clip, asset, track->second, clip.source_time_at(time_seconds)});
    }
    return out;
}

bool ProjectSnapshot::has_visual_clips() const {
    return std::any_of(clips.begin(), clips.end(), [this](const Clip& c){
        const Asset* a = find_asset(c.asset_id);
        return a && a->is_visual();
    });
}

} // namespace nla::timeline
