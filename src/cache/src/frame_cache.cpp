#include "cache/frame_cache.hpp"
#include "core/log.hpp"

#include <algorithm>

namespace nla::cache {

namespace {

bool is_separator(char c) { return c == '/' || c == '\\'; }

// Records beyond this multiple of live entries (plus slack) trigger a queue rebuild.
constexpr size_t kLruCompactFactor = 8;
constexpr size_t kLruCompactSlack = 1024;

} // namespace

bool path_is_under(const std::string& path, const std::string& folder) {
    std::string prefix = folder;
    while(prefix.size() > 1 && is_separator(prefix.back())) prefix.pop_back();
    if(prefix.empty()) return false;
    if(path.size() < prefix.size() || path.compare(0, prefix.size(), prefix) != 0) return false;
    if(path.size() == prefix.size()) return true;
    return is_separator(prefix.back()) || is_separator(path[prefix.size()]);
}

std::optional<CachedFrame> FrameCache::get(const FrameKey& key) {
    auto it = entries_.find(key);
    if(it == entries_.end()) return std::nullopt;
    it->second.last_used = ++access_counter_;
    lru_order_.push_back(LruRecord{key, it->second.last_used});
    compact_lru_if_needed();
    return CachedFrame{it->second.image, it->second.source_width, it->second.source_height};
}

void FrameCache::insert(FrameKey key, std::shared_ptr<const decode::RgbaImage> image, int source_width, int source_height) {
    const size_t size_bytes = image ? image->size_bytes() : 0;
    if(size_bytes == 0 || max_bytes_ == 0 || size_bytes > max_bytes_) return;

    auto existing = entries_.find(key);
    if(existing != entries_.end()) {
        total_bytes_ -= existing->second.size_bytes;
        entries_.erase(existing);
    }

    const uint64_t stamp = ++access_counter_;
    asset_index_[key.path].insert(key.frame_index);
    lru_order_.push_back(LruRecord{key, stamp});
    entries_.emplace(std::move(key), Entry{std::move(image), source_width, source_height, size_bytes, stamp});
    total_bytes_ += size_bytes;

    evict_if_needed();
    compact_lru_if_needed();
}

void FrameCache::evict_if_needed() {
    while(total_bytes_ > max_bytes_ && !lru_order_.empty()) {
        LruRecord record = std::move(lru_order_.front());
        lru_order_.pop_front();
        auto it = entries_.find(record.key);
        if(it == entries_.end() || it->second.last_used != record.stamp) continue;   // stale record
        total_bytes_ -= it->second.size_bytes;
        entries_.erase(it);
        unindex(record.key);
    }
}

void FrameCache::compact_lru_if_needed() {
    if(lru_order_.size() <= entries_.size() * kLruCompactFactor + kLruCompactSlack) return;
    std::deque<LruRecord> live;
    for(auto& record : lru_order_) {
        auto it = entries_.find(record.key);
        if(it != entries_.end() && it->second.last_used == record.stamp) live.push_back(std::move(record));
    }
    lru_order_.swap(live);
}

void FrameCache::unindex(const FrameKey& key) {
    auto idx = asset_index_.find(key.path);
    if(idx == asset_index_.end()) return;
    idx->second.erase(key.frame_index);
    if(idx->second.empty()) asset_index_.erase(idx);
}

void FrameCache::remove_entry(const FrameKey& key) {
    auto it = entries_.find(key);
    if(it == entries_.end()) return;
    total_bytes_ -= it->second.size_bytes;
    entries_.erase(it);
}

void FrameCache::invalidate_path(const std::string& path) {
    auto idx = asset_index_.find(path);
    if(idx == asset_index_.end()) return;
    const size_t dropped = idx->second.size();
    for(int64_t frame_index : idx->second) remove_entry(FrameKey{path, frame_index});
    asset_index_.erase(idx);
    log::debug("Frame cache: invalidated " + std::to_string(dropped) + " frame(s) of " + path);
}

void FrameCache::invalidate_folder(const std::string& folder) {
    std::vector<std::string> paths;
    for(const auto& [path, frames] : asset_index_) {
        if(path_is_under(path, folder)) paths.push_back(path);
    }
    for(const auto& path : paths) invalidate_path(path);
}

void FrameCache::clear() {
    entries_.clear();
    lru_order_.clear();
    asset_index_.clear();
    total_bytes_ = 0;
}

std::vector<int64_t> FrameCache::frame_indices_for(const std::string& path) const {
    std::vector<int64_t> out;
    auto idx = asset_index_.find(path);
    if(idx == asset_index_.end()) return out;
    out.assign(idx->second.begin(), idx->second.end());
    std::sort(out.begin(), out.end());
    return out;
}

FrameCacheStats FrameCache::stats() const {
    FrameCacheStats s;
    s.entries = entries_.size();
    s.total_bytes = total_bytes_;
    s.max_bytes = max_bytes_;
    s.tracked_paths = asset_index_.size();
    s.lru_records = lru_order_.size();
    return s;
}

} // namespace nla::cache
