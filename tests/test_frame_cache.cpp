#include <catch2/catch_test_macros.hpp>
#include "cache/frame_cache.hpp"

#include <memory>

using nla::cache::FrameCache;
using nla::cache::FrameKey;
using nla::decode::RgbaImage;

namespace {

constexpr size_t kMiB = 1024 * 1024;

// side x side RGBA image: side*side*4 bytes.
std::shared_ptr<const RgbaImage> image_of(int side, uint8_t v = 0) {
    return std::make_shared<const RgbaImage>(RgbaImage::filled(side, side, v, v, v, 255));
}

} // namespace

TEST_CASE("FrameCache evicts least recently used frames past the byte budget", "[cache]") {
    FrameCache cache(10 * kMiB);
    cache.insert(FrameKey{"/a", 0}, image_of(1024), 1024, 1024);   // 4 MiB each
    cache.insert(FrameKey{"/a", 1}, image_of(1024), 1024, 1024);
    cache.insert(FrameKey{"/b", 0}, image_of(1024), 1024, 1024);

    REQUIRE(cache.total_bytes() == 8 * kMiB);
    REQUIRE_FALSE(cache.get(FrameKey{"/a", 0}).has_value());
    REQUIRE(cache.get(FrameKey{"/a", 1}).has_value());
    REQUIRE(cache.get(FrameKey{"/b", 0}).has_value());
    REQUIRE(cache.size() == 2);
}

TEST_CASE("FrameCache get refreshes recency", "[cache]") {
    FrameCache cache(10 * kMiB);
    cache.insert(FrameKey{"/a", 0}, image_of(1024), 1024, 1024);
    cache.insert(FrameKey{"/a", 1}, image_of(1024), 1024, 1024);
    REQUIRE(cache.get(FrameKey{"/a", 0}).has_value());   // /a:1 is now the oldest
    cache.insert(FrameKey{"/b", 0}, image_of(1024), 1024, 1024);

    REQUIRE(cache.contains(FrameKey{"/a", 0}));
    REQUIRE_FALSE(cache.contains(FrameKey{"/a", 1}));
    REQUIRE(cache.contains(FrameKey{"/b", 0}));
}

TEST_CASE("FrameCache keeps total bytes in sync with entries", "[cache]") {
    FrameCache cache(1 * kMiB);
    for(int i = 0; i < 40; ++i) {
        cache.insert(FrameKey{"/clip", i}, image_of(128), 128, 128);   // 64 KiB each
        REQUIRE(cache.total_bytes() <= cache.max_bytes());
        REQUIRE(cache.total_bytes() == cache.size() * 128 * 128 * 4);
    }
    REQUIRE(cache.size() == 16);
}

TEST_CASE("FrameCache replaces an existing key without double counting", "[cache]") {
    FrameCache cache(1 * kMiB);
    cache.insert(FrameKey{"/a", 3}, image_of(64, 10), 64, 64);
    cache.insert(FrameKey{"/a", 3}, image_of(32, 20), 320, 320);

    REQUIRE(cache.size() == 1);
    REQUIRE(cache.total_bytes() == 32 * 32 * 4);
    auto hit = cache.get(FrameKey{"/a", 3});
    REQUIRE(hit.has_value());
    REQUIRE(hit->image->width == 32);
    REQUIRE(hit->source_width == 320);
    REQUIRE(hit->image->pixels[0] == 20);
}

TEST_CASE("FrameCache ignores empty and oversized frames", "[cache]") {
    FrameCache cache(1000);
    cache.insert(FrameKey{"/a", 0}, std::make_shared<const RgbaImage>(), 0, 0);
    cache.insert(FrameKey{"/a", 1}, nullptr, 0, 0);
    cache.insert(FrameKey{"/a", 2}, image_of(16), 16, 16);   // 1024 bytes > budget
    REQUIRE(cache.size() == 0);
    REQUIRE(cache.total_bytes() == 0);

    FrameCache disabled(0);
    disabled.insert(FrameKey{"/a", 0}, image_of(1), 1, 1);
    REQUIRE(disabled.size() == 0);
}

TEST_CASE("FrameCache handles outlive eviction", "[cache]") {
    FrameCache cache(16 * 16 * 4);
    cache.insert(FrameKey{"/a", 0}, image_of(16, 7), 16, 16);
    auto held = cache.get(FrameKey{"/a", 0});
    REQUIRE(held.has_value());
    cache.insert(FrameKey{"/a", 1}, image_of(16, 9), 16, 16);

    REQUIRE_FALSE(cache.contains(FrameKey{"/a", 0}));
    REQUIRE(held->image->pixels[0] == 7);
}

TEST_CASE("FrameCache invalidate_path drops every frame of one source", "[cache]") {
    FrameCache cache(4 * kMiB);
    for(int i = 0; i < 5; ++i) cache.insert(FrameKey{"/media/a.mp4", i}, image_of(8), 8, 8);
    cache.insert(FrameKey{"/media/b.mp4", 0}, image_of(8), 8, 8);

    cache.invalidate_path("/media/a.mp4");
    REQUIRE(cache.size() == 1);
    REQUIRE(cache.frame_indices_for("/media/a.mp4").empty());
    REQUIRE(cache.total_bytes() == 8 * 8 * 4);
    REQUIRE(cache.contains(FrameKey{"/media/b.mp4", 0}));

    cache.invalidate_path("/not/cached");
    REQUIRE(cache.size() == 1);
}

TEST_CASE("FrameCache invalidate_folder matches whole path components", "[cache]") {
    FrameCache cache(4 * kMiB);
    cache.insert(FrameKey{"/proj/gen/shot1/v1.png", 0}, image_of(8), 8, 8);
    cache.insert(FrameKey{"/proj/gen/shot1/v2.png", 0}, image_of(8), 8, 8);
    cache.insert(FrameKey{"/proj/gen/shot10/v1.png", 0}, image_of(8), 8, 8);

    cache.invalidate_folder("/proj/gen/shot1");
    REQUIRE(cache.size() == 1);
    REQUIRE(cache.contains(FrameKey{"/proj/gen/shot10/v1.png", 0}));

    cache.invalidate_folder("/proj/gen/");
    REQUIRE(cache.size() == 0);
    REQUIRE(cache.total_bytes() == 0);
}

TEST_CASE("path_is_under accepts both separators", "[cache]") {
    using nla::cache::path_is_under;
    REQUIRE(path_is_under("/a/b/c.mp4", "/a/b"));
    REQUIRE(path_is_under("/a/b", "/a/b"));
    REQUIRE(path_is_under("C:\\proj\\gen\\x.png", "C:\\proj\\gen"));
    REQUIRE_FALSE(path_is_under("/a/bc.mp4", "/a/b"));
    REQUIRE_FALSE(path_is_under("/a", "/a/b"));
    REQUIRE_FALSE(path_is_under("/a/b", ""));
}

TEST_CASE("FrameCache reverse index reports sorted frame indices", "[cache]") {
    FrameCache cache(4 * kMiB);
    for(int64_t i : {9, 2, 5}) cache.insert(FrameKey{"/v.mp4", i}, image_of(4), 4, 4);
    REQUIRE(cache.frame_indices_for("/v.mp4") == std::vector<int64_t>{2, 5, 9});

    auto stats = cache.stats();
    REQUIRE(stats.entries == 3);
    REQUIRE(stats.tracked_paths == 1);
    REQUIRE(stats.max_bytes == 4 * kMiB);

    cache.clear();
    REQUIRE(cache.stats().entries == 0);
    REQUIRE(cache.stats().lru_records == 0);
    REQUIRE(cache.frame_indices_for("/v.mp4").empty());
}

TEST_CASE("FrameCache compacts stale LRU records during long scrubbing", "[cache]") {
    FrameCache cache(4 * kMiB);
    cache.insert(FrameKey{"/v.mp4", 0}, image_of(4), 4, 4);
    cache.insert(FrameKey{"/v.mp4", 1}, image_of(4), 4, 4);
    for(int i = 0; i < 10000; ++i) {
        REQUIRE(cache.get(FrameKey{"/v.mp4", i % 2}).has_value());
    }
    REQUIRE(cache.stats().lru_records <= 2 * 8 + 1024 + 1);

    // Recency survives compaction: /v.mp4:1 was touched last, so :0 goes first.
    FrameCache small(3 * 4 * 4 * 4);
    small.insert(FrameKey{"/s", 0}, image_of(4), 4, 4);
    small.insert(FrameKey{"/s", 1}, image_of(4), 4, 4);
    for(int i = 0; i < 3000; ++i) REQUIRE(small.get(FrameKey{"/s", i % 2}).has_value());
    small.insert(FrameKey{"/s", 2}, image_of(4), 4, 4);
    small.insert(FrameKey{"/s", 3}, image_of(4), 4, 4);
    REQUIRE_FALSE(small.contains(FrameKey{"/s", 0}));
    REQUIRE(small.contains(FrameKey{"/s", 1}));
}
