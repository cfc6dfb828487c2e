#include <catch2/catch_test_macros.hpp>
#include "decode/decoder_lru.hpp"

#include <memory>
#include <optional>
#include <string>
#include <tuple>

using nla::decode::DecoderLru;

TEST_CASE("DecoderLru creates once and reuses", "[decode][lru]") {
    DecoderLru<std::string, int> lru(2);
    int made = 0;
    auto make = [&]() -> std::optional<int> { return ++made; };

    REQUIRE(*lru.get_or_insert("a", make) == 1);
    REQUIRE(*lru.get_or_insert("a", make) == 1);
    REQUIRE(made == 1);
    REQUIRE(lru.size() == 1);
}

TEST_CASE("DecoderLru evicts the least recently accessed entry", "[decode][lru]") {
    DecoderLru<std::string, int> lru(2);
    auto value = [](int v) { return [v]() -> std::optional<int> { return v; }; };

    lru.get_or_insert("a", value(1));
    lru.get_or_insert("b", value(2));
    REQUIRE(lru.find("a") != nullptr);        // b is now the oldest
    lru.get_or_insert("c", value(3));

    REQUIRE(lru.contains("a"));
    REQUIRE_FALSE(lru.contains("b"));
    REQUIRE(lru.contains("c"));
    REQUIRE(lru.size() == 2);
}

TEST_CASE("DecoderLru leaves the map untouched when creation fails", "[decode][lru]") {
    DecoderLru<std::string, int> lru(1);
    lru.get_or_insert("a", []() -> std::optional<int> { return 1; });
    auto* v = lru.get_or_insert("b", []() -> std::optional<int> { return std::nullopt; });

    REQUIRE(v == nullptr);
    REQUIRE(lru.contains("a"));
    REQUIRE(lru.size() == 1);
}

TEST_CASE("DecoderLru holds move-only values under composite keys", "[decode][lru]") {
    using Key = std::tuple<std::string, uint64_t, bool>;
    DecoderLru<Key, std::unique_ptr<int>> lru(3);
    auto make = [](int v) { return [v]() -> std::optional<std::unique_ptr<int>> { return std::make_unique<int>(v); }; };

    lru.get_or_insert(Key{"/a.mp4", 0, true}, make(1));
    lru.get_or_insert(Key{"/a.mp4", 1, true}, make(2));
    lru.get_or_insert(Key{"/a.mp4", 0, false}, make(3));
    REQUIRE(lru.size() == 3);
    REQUIRE(**lru.find(Key{"/a.mp4", 1, true}) == 2);

    REQUIRE(lru.erase(Key{"/a.mp4", 0, false}));
    REQUIRE_FALSE(lru.erase(Key{"/a.mp4", 0, false}));
    lru.clear();
    REQUIRE(lru.size() == 0);
}

TEST_CASE("DecoderLru treats zero capacity as one", "[decode][lru]") {
    DecoderLru<int, int> lru(0);
    REQUIRE(lru.capacity() == 1);
    lru.get_or_insert(1, []() -> std::optional<int> { return 10; });
    lru.get_or_insert(2, []() -> std::optional<int> { return 20; });
    REQUIRE(lru.size() == 1);
    REQUIRE(lru.contains(2));
}
