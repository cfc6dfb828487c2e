#pragma once
#include "render/preview_types.hpp"
#include "render/frame_store.hpp"
#include "cache/frame_cache.hpp"
#include "core/config.hpp"
#include "decode/decode_worker.hpp"
#include "decode/still_loader.hpp"
#include "timeline/timeline.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace nla::render {

struct PlateCacheInfo {
    int width = 0;
    int height = 0;
    size_t bytes = 0;
};

// Turns a timeline snapshot at a time into a composited preview frame (CPU path) or
// a layer stack (GPU path). One render call runs at a time; cache and plate state are
// guarded internally so the query methods may be called from other threads.
class PreviewRenderer {
public:
    PreviewRenderer(std::string project_root,
                    const core::PreviewConfig& config,
                    std::shared_ptr<PreviewFrameStore> store,
                    std::shared_ptr<decode::VideoDecodeWorker> decoder,
                    decode::StillLoader still_loader = decode::load_still_image);

    // Production wiring: FFmpeg decode pool sized from config.
    static std::unique_ptr<PreviewRenderer> create(std::string project_root,
                                                   const core::PreviewConfig& config,
                                                   std::shared_ptr<PreviewFrameStore> store);

    RenderOutput render_frame(const timeline::ProjectSnapshot& snapshot, double time_seconds,
                              PreviewDecodeMode mode, bool allow_hw_decode);
    RenderOutput render_layers(const timeline::ProjectSnapshot& snapshot, double time_seconds,
                               PreviewDecodeMode mode, bool allow_hw_decode);

    // Warms the cache for window_frames frames after (direction > 0) or before
    // (direction < 0) time_seconds.
    void prefetch_frames(const timeline::ProjectSnapshot& snapshot, double time_seconds, int direction,
                         unsigned window_frames, PreviewDecodeMode mode, bool allow_hw_decode);

    // Per visual clip, which time buckets of the clip have a cached frame.
    std::unordered_map<timeline::ClipId, std::vector<bool>>
    cached_buckets_for_project(const timeline::ProjectSnapshot& snapshot, double bucket_hint_seconds) const;

    void invalidate_path(const std::string& path);
    void invalidate_folder(const std::string& folder);
    cache::FrameCacheStats cache_stats() const;
    std::optional<PlateCacheInfo> plate_cache_bytes() const;

    int max_width() const { return max_width_; }
    int max_height() const { return max_height_; }
    const std::shared_ptr<PreviewFrameStore>& store() const { return store_; }

private:
    struct PreviewLayer {
        size_t track_index = 0;
        double start_time = 0.0;
        std::shared_ptr<const decode::RgbaImage> image;
        timeline::ClipTransform transform;
        int source_width = 0;
        int source_height = 0;
    };

    struct PendingDecode {
        size_t track_index = 0;
        double start_time = 0.0;
        std::string path;
        double frame_time = 0.0;
        cache::FrameKey key;
        timeline::ClipTransform transform;
        uint64_t lane = 0;
    };

    // Cache key and decode time for an asset at a media time.
    struct FrameTarget {
        std::string path;
        bool is_video = false;
        int64_t frame_index = 0;
        double frame_time = 0.0;
    };

    const std::string& root_for(const timeline::ProjectSnapshot& snapshot) const;
    std::optional<FrameTarget> frame_target(const std::string& root, const timeline::Asset& asset,
                                            double source_time, double fps) const;
    std::vector<PreviewLayer> collect_layers(const timeline::ProjectSnapshot& snapshot, double time_seconds,
                                             PreviewDecodeMode mode, bool allow_hw_decode, PreviewStats& stats);
    std::shared_ptr<const decode::RgbaImage> load_clip_frame(const std::string& root, const timeline::Asset& asset,
                                                             double source_time, double fps, PreviewDecodeMode mode,
                                                             uint64_t lane, bool allow_hw_decode, PreviewStats* stats);
    std::optional<decode::StillImage> load_still(const std::string& path) const;
    std::optional<cache::CachedFrame> cache_get(const cache::FrameKey& key);
    void cache_insert(const cache::FrameKey& key, const std::shared_ptr<const decode::RgbaImage>& image, int sw, int sh);
    std::shared_ptr<const decode::RgbaImage> plate_fill(int width, int height);

    std::string project_root_;
    int max_width_;
    int max_height_;
    std::shared_ptr<PreviewFrameStore> store_;
    std::shared_ptr<decode::VideoDecodeWorker> decoder_;
    decode::StillLoader still_loader_;

    mutable std::mutex cache_mutex_;
    cache::FrameCache cache_;

    struct PlateCache {
        int width = 0;
        int height = 0;
        std::shared_ptr<const decode::RgbaImage> fill;
    };
    mutable std::mutex plate_mutex_;
    std::optional<PlateCache> plate_;
};

} // namespace nla::render
