#include "render/preview_renderer.hpp"
#include "render/frame_math.hpp"
#include "render/layers.hpp"
#include "timeline/asset_resolver.hpp"
#include "core/log.hpp"
#include "core/profiling.hpp"
#include "core/stopwatch.hpp"

#include <algorithm>
#include <cmath>
#include <future>
#include <utility>

namespace nla::render {

PreviewRenderer::PreviewRenderer(std::string project_root,
                                 const core::PreviewConfig& config,
                                 std::shared_ptr<PreviewFrameStore> store,
                                 std::shared_ptr<decode::VideoDecodeWorker> decoder,
                                 decode::StillLoader still_loader)
    : project_root_(std::move(project_root)),
      max_width_(std::max(config.max_preview_width, 1)),
      max_height_(std::max(config.max_preview_height, 1)),
      store_(std::move(store)),
      decoder_(std::move(decoder)),
      still_loader_(std::move(still_loader)),
      cache_(config.frame_cache_bytes) {
    if(!store_) store_ = std::make_shared<PreviewFrameStore>(config.preview_store_depth);
}

std::unique_ptr<PreviewRenderer> PreviewRenderer::create(std::string project_root,
                                                         const core::PreviewConfig& config,
                                                         std::shared_ptr<PreviewFrameStore> store) {
    decode::DecodeWorkerOptions opts;
    opts.max_width = std::max(config.max_preview_width, 1);
    opts.max_height = std::max(config.max_preview_height, 1);
    opts.worker_count = config.resolved_decode_workers();
    opts.max_open_decoders = config.max_open_decoders;
    opts.sequential_window_seconds = config.sequential_window_seconds;
    if(!config.allow_hw_decode) opts.hw_candidates.clear();
    auto pool = std::make_shared<decode::VideoDecodeWorker>(std::move(opts), decode::make_ffmpeg_decoder_factory());
    return std::make_unique<PreviewRenderer>(std::move(project_root), config, std::move(store), std::move(pool));
}

const std::string& PreviewRenderer::root_for(const timeline::ProjectSnapshot& snapshot) const {
    return snapshot.project_root.empty() ? project_root_ : snapshot.project_root;
}

std::optional<PreviewRenderer::FrameTarget> PreviewRenderer::frame_target(const std::string& root,
                                                                         const timeline::Asset& asset,
                                                                         double source_time, double fps) const {
    auto source = timeline::resolve_asset_source(root, asset);
    if(!source) return std::nullopt;
    FrameTarget target;
    target.path = std::move(source->path);
    target.is_video = source->is_video;
    if(target.is_video) {
        const double t = clamp_time(source_time, source->duration_seconds);
        target.frame_index = time_to_frame_index(t, fps);
        target.frame_time = frame_index_to_time(target.frame_index, fps);
    }
    return target;
}

std::optional<cache::CachedFrame> PreviewRenderer::cache_get(const cache::FrameKey& key) {
    std::scoped_lock lock(cache_mutex_);
    return cache_.get(key);
}

void PreviewRenderer::cache_insert(const cache::FrameKey& key, const std::shared_ptr<const decode::RgbaImage>& image,
                                   int sw, int sh) {
    std::scoped_lock lock(cache_mutex_);
    cache_.insert(key, image, sw, sh);
}

std::optional<decode::StillImage> PreviewRenderer::load_still(const std::string& path) const {
    if(!still_loader_) return std::nullopt;
    auto loaded = still_loader_(path, max_width_, max_height_);
    if(loaded.is_error()) {
        log::warn("Still image load failed: " + loaded.error());
        return std::nullopt;
    }
    return loaded.take();
}

std::vector<PreviewRenderer::PreviewLayer>
PreviewRenderer::collect_layers(const timeline::ProjectSnapshot& snapshot, double time_seconds,
                                PreviewDecodeMode mode, bool allow_hw_decode, PreviewStats& stats) {
    const double fps = std::max(snapshot.settings.fps, 1.0);
    const std::string& root = root_for(snapshot);

    std::vector<PreviewLayer> layers;
    std::vector<PendingDecode> pending;
    for(const auto& active : snapshot.active_visual_clips(time_seconds)) {
        auto target = frame_target(root, *active.asset, active.source_time, fps);
        if(!target) continue;
        cache::FrameKey key{target->path, target->frame_index};

        if(auto cached = cache_get(key)) {
            ++stats.cache_hits;
            layers.push_back(PreviewLayer{active.track_index, active.clip->start_time, std::move(cached->image),
                                          active.clip->transform, cached->source_width, cached->source_height});
            continue;
        }
        ++stats.cache_misses;

        if(!target->is_video) {
            core::Stopwatch sw;
            auto still = load_still(target->path);
            stats.still_load_ms += sw.elapsed_ms();
            if(!still) continue;
            auto image = std::make_shared<const decode::RgbaImage>(std::move(still->image));
            cache_insert(key, image, still->source_width, still->source_height);
            layers.push_back(PreviewLayer{active.track_index, active.clip->start_time, std::move(image),
                                          active.clip->transform, still->source_width, still->source_height});
            continue;
        }

        pending.push_back(PendingDecode{active.track_index, active.clip->start_time, target->path, target->frame_time,
                                        std::move(key), active.clip->transform, track_lane_id(active.clip->track_id)});
    }

    // Dispatch every miss before waiting so different lanes decode in parallel.
    std::vector<std::pair<PendingDecode, std::future<decode::DecodeResponse>>> requests;
    requests.reserve(pending.size());
    for(auto& item : pending) {
        if(!decoder_) break;
        auto fut = decoder_->decode_async(item.path, item.frame_time, mode, item.lane, allow_hw_decode);
        if(fut) requests.emplace_back(std::move(item), std::move(*fut));
    }

    for(auto& [item, fut] : requests) {
        decode::DecodeResponse response = fut.get();
        stats.add_decode_timings(response.timings);
        if(!response.image) continue;
        if(response.used_hw) ++stats.hw_decode_frames;
        else ++stats.sw_decode_frames;
        auto image = std::make_shared<const decode::RgbaImage>(std::move(*response.image));
        cache_insert(item.key, image, response.source_width, response.source_height);
        layers.push_back(PreviewLayer{item.track_index, item.start_time, std::move(image), item.transform,
                                      response.source_width, response.source_height});
    }

    // Back to front: higher track index first, then by clip start.
    std::stable_sort(layers.begin(), layers.end(), [](const PreviewLayer& a, const PreviewLayer& b) {
        if(a.track_index != b.track_index) return a.track_index > b.track_index;
        return a.start_time < b.start_time;
    });
    return layers;
}

RenderOutput PreviewRenderer::render_frame(const timeline::ProjectSnapshot& snapshot, double time_seconds,
                                           PreviewDecodeMode mode, bool allow_hw_decode) {
    core::Stopwatch total;
    RenderOutput out;
    PreviewStats& stats = out.stats;
    const CanvasSize canvas_size = preview_canvas_size(snapshot.settings.width, snapshot.settings.height,
                                                       max_width_, max_height_);

    std::vector<PreviewLayer> layers;
    {
        NLA_PROFILE_SCOPE("render.collect");
        core::Stopwatch sw;
        layers = collect_layers(snapshot, time_seconds, mode, allow_hw_decode, stats);
        stats.collect_ms = sw.elapsed_ms();
    }
    stats.layers = layers.size();

    if(layers.empty() && !snapshot.has_visual_clips()) {
        stats.total_ms = total.elapsed_ms();
        return out;
    }

    auto canvas = decode::RgbaImage::filled(canvas_size.width, canvas_size.height, 0, 0, 0, 255);
    {
        NLA_PROFILE_SCOPE("render.composite");
        core::Stopwatch sw;
        const float cw = static_cast<float>(canvas_size.width);
        const float ch = static_cast<float>(canvas_size.height);
        for(const auto& layer : layers) {
            auto placement = compute_layer_placement(*layer.image, layer.source_width, layer.source_height,
                                                     layer.transform, canvas_size.scale, cw, ch);
            if(placement) composite_layer(canvas, *layer.image, *placement);
        }
        draw_border(canvas, kPlateBorderColor, kPlateBorderWidth);
        stats.composite_ms = sw.elapsed_ms();
    }

    std::optional<uint64_t> version;
    {
        NLA_PROFILE_SCOPE("render.store");
        core::Stopwatch sw;
        version = store_->store_preview_frame(canvas.width, canvas.height, std::move(canvas.pixels));
        stats.encode_ms = sw.elapsed_ms();
    }
    stats.total_ms = total.elapsed_ms();
    if(version) out.frame = PreviewFrameInfo{*version, canvas_size.width, canvas_size.height};
    return out;
}

RenderOutput PreviewRenderer::render_layers(const timeline::ProjectSnapshot& snapshot, double time_seconds,
                                            PreviewDecodeMode mode, bool allow_hw_decode) {
    core::Stopwatch total;
    RenderOutput out;
    PreviewStats& stats = out.stats;
    const CanvasSize canvas_size = preview_canvas_size(snapshot.settings.width, snapshot.settings.height,
                                                       max_width_, max_height_);

    std::vector<PreviewLayer> layers;
    {
        NLA_PROFILE_SCOPE("render.collect");
        core::Stopwatch sw;
        layers = collect_layers(snapshot, time_seconds, mode, allow_hw_decode, stats);
        stats.collect_ms = sw.elapsed_ms();
    }
    stats.layers = layers.size();

    if(layers.empty() && !snapshot.has_visual_clips()) {
        stats.total_ms = total.elapsed_ms();
        return out;
    }

    PreviewLayerStack stack;
    stack.canvas_width = canvas_size.width;
    stack.canvas_height = canvas_size.height;
    const float cw = static_cast<float>(canvas_size.width);
    const float ch = static_cast<float>(canvas_size.height);

    if(auto fill = plate_fill(canvas_size.width, canvas_size.height)) {
        PreviewLayerPlacement plate;
        plate.scaled_w = cw;
        plate.scaled_h = ch;
        stack.layers.push_back(PreviewLayerGpu{std::move(fill), plate});
    }
    for(auto& layer : layers) {
        auto placement = compute_layer_placement(*layer.image, layer.source_width, layer.source_height,
                                                 layer.transform, canvas_size.scale, cw, ch);
        if(placement) stack.layers.push_back(PreviewLayerGpu{std::move(layer.image), *placement});
    }

    stats.total_ms = total.elapsed_ms();
    out.layers = std::move(stack);
    return out;
}

std::shared_ptr<const decode::RgbaImage> PreviewRenderer::plate_fill(int width, int height) {
    if(width <= 0 || height <= 0) return nullptr;
    std::scoped_lock lock(plate_mutex_);
    if(plate_ && plate_->width == width && plate_->height == height) return plate_->fill;
    auto fill = std::make_shared<const decode::RgbaImage>(decode::RgbaImage::filled(width, height, 0, 0, 0, 255));
    plate_ = PlateCache{width, height, fill};
    return fill;
}

std::optional<PlateCacheInfo> PreviewRenderer::plate_cache_bytes() const {
    std::scoped_lock lock(plate_mutex_);
    if(!plate_ || !plate_->fill) return std::nullopt;
    return PlateCacheInfo{plate_->width, plate_->height, plate_->fill->size_bytes()};
}

std::shared_ptr<const decode::RgbaImage>
PreviewRenderer::load_clip_frame(const std::string& root, const timeline::Asset& asset, double source_time, double fps,
                                 PreviewDecodeMode mode, uint64_t lane, bool allow_hw_decode, PreviewStats* stats) {
    auto target = frame_target(root, asset, source_time, fps);
    if(!target) return nullptr;
    cache::FrameKey key{target->path, target->frame_index};

    if(auto cached = cache_get(key)) {
        if(stats) ++stats->cache_hits;
        return cached->image;
    }
    if(stats) ++stats->cache_misses;

    if(!target->is_video) {
        core::Stopwatch sw;
        auto still = load_still(target->path);
        if(stats) stats->still_load_ms += sw.elapsed_ms();
        if(!still) return nullptr;
        auto image = std::make_shared<const decode::RgbaImage>(std::move(still->image));
        cache_insert(key, image, still->source_width, still->source_height);
        return image;
    }

    if(!decoder_) return nullptr;
    auto response = mode == PreviewDecodeMode::Sequential
        ? decoder_->decode_sequential(target->path, target->frame_time, lane, allow_hw_decode)
        : decoder_->decode(target->path, target->frame_time, lane, allow_hw_decode);
    if(!response) return nullptr;
    if(stats) stats->add_decode_timings(response->timings);
    if(!response->image) return nullptr;
    if(stats) {
        if(response->used_hw) ++stats->hw_decode_frames;
        else ++stats->sw_decode_frames;
    }
    auto image = std::make_shared<const decode::RgbaImage>(std::move(*response->image));
    cache_insert(key, image, response->source_width, response->source_height);
    return image;
}

void PreviewRenderer::prefetch_frames(const timeline::ProjectSnapshot& snapshot, double time_seconds, int direction,
                                      unsigned window_frames, PreviewDecodeMode mode, bool allow_hw_decode) {
    if(window_frames == 0 || direction == 0) return;
    const double fps = std::max(snapshot.settings.fps, 1.0);
    const std::string& root = root_for(snapshot);
    const int64_t start_frame = time_to_frame_index(time_seconds, fps);
    const int64_t step = direction > 0 ? 1 : -1;

    for(unsigned offset = 1; offset <= window_frames; ++offset) {
        const int64_t frame_index = start_frame + step * static_cast<int64_t>(offset);
        if(frame_index < 0) break;
        const double frame_time = frame_index_to_time(frame_index, fps);
        for(const auto& active : snapshot.active_visual_clips(frame_time)) {
            load_clip_frame(root, *active.asset, active.source_time, fps, mode,
                            track_lane_id(active.clip->track_id), allow_hw_decode, nullptr);
        }
    }
}

std::unordered_map<timeline::ClipId, std::vector<bool>>
PreviewRenderer::cached_buckets_for_project(const timeline::ProjectSnapshot& snapshot, double bucket_hint_seconds) const {
    std::unordered_map<timeline::ClipId, std::vector<bool>> result;
    const double fps = std::max(snapshot.settings.fps, 1.0);
    const double min_bucket = std::max(1.0 / fps, 0.001);
    const double hint = std::max(bucket_hint_seconds, min_bucket);
    const std::string& root = root_for(snapshot);

    std::scoped_lock lock(cache_mutex_);
    for(const auto& clip : snapshot.clips) {
        const timeline::Asset* asset = snapshot.find_asset(clip.asset_id);
        if(!asset || !asset->is_visual()) continue;
        auto source = timeline::resolve_asset_source(root, *asset);
        if(!source) continue;
        const double clip_duration = std::max(clip.duration, 0.0);
        if(clip_duration <= 0.0) continue;

        const double bucket_seconds = std::max({hint, clip_duration / static_cast<double>(kMaxCacheBuckets), min_bucket});
        const auto bucket_count = static_cast<size_t>(std::max(std::ceil(clip_duration / bucket_seconds), 1.0));
        std::vector<bool> buckets(bucket_count, false);

        const auto frames = cache_.frame_indices_for(source->path);
        if(!source->is_video) {
            const bool cached = std::find(frames.begin(), frames.end(), 0) != frames.end();
            std::fill(buckets.begin(), buckets.end(), cached);
        } else {
            const double clip_start = std::max(clip.trim_in_seconds, 0.0);
            const double clip_end = clip_start + clip_duration;
            for(int64_t frame_index : frames) {
                const double t = frame_index_to_time(frame_index, fps);
                if(t < clip_start || t > clip_end) continue;
                const auto bucket = static_cast<size_t>(std::floor((t - clip_start) / bucket_seconds));
                if(bucket < buckets.size()) buckets[bucket] = true;
            }
        }
        result.emplace(clip.id, std::move(buckets));
    }
    return result;
}

void PreviewRenderer::invalidate_path(const std::string& path) {
    std::scoped_lock lock(cache_mutex_);
    cache_.invalidate_path(path);
}

void PreviewRenderer::invalidate_folder(const std::string& folder) {
    std::scoped_lock lock(cache_mutex_);
    cache_.invalidate_folder(folder);
}

cache::FrameCacheStats PreviewRenderer::cache_stats() const {
    std::scoped_lock lock(cache_mutex_);
    return cache_.stats();
}

} // namespace nla::render
