#pragma once
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <vector>

namespace nla::render {

using FrameBytes = std::shared_ptr<const std::vector<uint8_t>>;

struct StoredFrame {
    uint64_t version = 0;
    int width = 0;
    int height = 0;
    FrameBytes bytes;
};

// Short versioned history of composited RGBA frames. One writer (the render path),
// many readers (the byte-serving side).
class PreviewFrameStore {
public:
    // initial_version lets a recreated store continue numbering where a previous one stopped.
    explicit PreviewFrameStore(size_t depth = 2, uint64_t initial_version = 0);

    // Rejects zero dimensions, empty buffers and buffers whose length is not w*h*4.
    std::optional<uint64_t> store_preview_frame(int width, int height, std::vector<uint8_t> bytes);

    // The frame with this version if still retained, else the latest one. Null only
    // when nothing was ever stored.
    FrameBytes get_preview_bytes(uint64_t version) const;
    FrameBytes get_latest_preview_bytes() const;
    std::optional<StoredFrame> get_frame(uint64_t version) const;

    uint64_t latest_version() const;
    size_t depth() const { return depth_; }
    size_t retained() const;

private:
    const size_t depth_;
    mutable std::shared_mutex mutex_;
    uint64_t latest_version_ = 0;
    std::deque<StoredFrame> frames_;
};

} // namespace nla::render
