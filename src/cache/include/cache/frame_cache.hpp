#pragma once
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "decode/frame.hpp"

namespace nla::cache {

// Identity of a decoded frame: source path plus frame index at project rate.
struct FrameKey {
    std::string path;
    int64_t frame_index = 0;

    bool operator==(const FrameKey& o) const { return frame_index == o.frame_index && path == o.path; }
};

struct FrameKeyHash {
    size_t operator()(const FrameKey& k) const {
        const size_t h = std::hash<std::string>()(k.path);
        return h ^ (std::hash<int64_t>()(k.frame_index) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2));
    }
};

// Shared read-only handle returned by lookups; the image outlives eviction while held.
struct CachedFrame {
    std::shared_ptr<const decode::RgbaImage> image;
    int source_width = 0;
    int source_height = 0;
};

struct FrameCacheStats {
    size_t entries = 0;
    size_t total_bytes = 0;
    size_t max_bytes = 0;
    size_t tracked_paths = 0;
    size_t lru_records = 0;
};

// Byte-budgeted LRU cache of decoded frames. Not internally synchronized; the owner
// serializes access.
class FrameCache {
public:
    explicit FrameCache(size_t max_bytes) : max_bytes_(max_bytes) {}

    std::optional<CachedFrame> get(const FrameKey& key);
    // Ignored when the image is empty, larger than the whole budget, or the budget is zero.
    void insert(FrameKey key, std::shared_ptr<const decode::RgbaImage> image, int source_width, int source_height);

    void invalidate_path(const std::string& path);
    // Drops every frame whose path lies under folder (component-wise prefix).
    void invalidate_folder(const std::string& folder);
    void clear();

    // Cached frame indices for a path; empty when nothing is cached.
    std::vector<int64_t> frame_indices_for(const std::string& path) const;
    bool contains(const FrameKey& key) const { return entries_.find(key) != entries_.end(); }

    size_t total_bytes() const { return total_bytes_; }
    size_t max_bytes() const { return max_bytes_; }
    size_t size() const { return entries_.size(); }
    FrameCacheStats stats() const;

private:
    struct Entry {
        std::shared_ptr<const decode::RgbaImage> image;
        int source_width = 0;
        int source_height = 0;
        size_t size_bytes = 0;
        uint64_t last_used = 0;
    };

    struct LruRecord {
        FrameKey key;
        uint64_t stamp = 0;
    };

    void evict_if_needed();
    void compact_lru_if_needed();
    void remove_entry(const FrameKey& key);
    void unindex(const FrameKey& key);

    size_t max_bytes_;
    size_t total_bytes_ = 0;
    uint64_t access_counter_ = 0;
    std::unordered_map<FrameKey, Entry, FrameKeyHash> entries_;
    std::deque<LruRecord> lru_order_;
    std::unordered_map<std::string, std::unordered_set<int64_t>> asset_index_;
};

// True when path equals folder or lies beneath it.
bool path_is_under(const std::string& path, const std::string& folder);

} // namespace nla::cache
