#include "render/frame_store.hpp"
#include "core/log.hpp"

#include <algorithm>
#include <mutex>
#include <string>

namespace nla::render {

PreviewFrameStore::PreviewFrameStore(size_t depth, uint64_t initial_version)
    : depth_(std::max<size_t>(depth, 1)), latest_version_(initial_version) {}

std::optional<uint64_t> PreviewFrameStore::store_preview_frame(int width, int height, std::vector<uint8_t> bytes) {
    if(width <= 0 || height <= 0 || bytes.empty()) {
        log::debug("Preview store: rejected empty frame");
        return std::nullopt;
    }
    const size_t expected = static_cast<size_t>(width) * static_cast<size_t>(height) * 4;
    if(bytes.size() != expected) {
        log::debug("Preview store: rejected frame of " + std::to_string(bytes.size()) + " bytes, expected " +
                   std::to_string(expected));
        return std::nullopt;
    }

    auto shared = std::make_shared<const std::vector<uint8_t>>(std::move(bytes));
    std::unique_lock lock(mutex_);
    uint64_t version = latest_version_ + 1;
    if(version == 0) version = 1;   // 0 means "no frame"
    latest_version_ = version;
    frames_.push_back(StoredFrame{version, width, height, std::move(shared)});
    while(frames_.size() > depth_) frames_.pop_front();
    return version;
}

std::optional<StoredFrame> PreviewFrameStore::get_frame(uint64_t version) const {
    std::shared_lock lock(mutex_);
    if(frames_.empty()) return std::nullopt;
    auto it = std::find_if(frames_.begin(), frames_.end(), [version](const StoredFrame& f){ return f.version == version; });
    return it != frames_.end() ? *it : frames_.back();
}

FrameBytes PreviewFrameStore::get_preview_bytes(uint64_t version) const {
    auto frame = get_frame(version);
    return frame ? frame->bytes : nullptr;
}

FrameBytes PreviewFrameStore::get_latest_preview_bytes() const {
    std::shared_lock lock(mutex_);
    return frames_.empty() ? nullptr : frames_.back().bytes;
}

uint64_t PreviewFrameStore::latest_version() const {
    std::shared_lock lock(mutex_);
    return latest_version_;
}

size_t PreviewFrameStore::retained() const {
    std::shared_lock lock(mutex_);
    return frames_.size();
}

} // namespace nla::render
