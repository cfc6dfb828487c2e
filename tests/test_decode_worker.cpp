#include <catch2/catch_test_macros.hpp>
#include "decode/decode_worker.hpp"
#include "support/fake_decoder.hpp"

#include <future>
#include <map>
#include <vector>

using namespace nla::decode;
using nla::test::FakeDecoderBehavior;
using nla::test::FakeDecoderLog;
using nla::test::make_fake_factory;

namespace {

DecodeWorkerOptions options(unsigned workers, size_t max_open = 8) {
    DecodeWorkerOptions o;
    o.max_width = 32;
    o.max_height = 32;
    o.worker_count = workers;
    o.max_open_decoders = max_open;
    o.hw_candidates = {HwDeviceKind::Vaapi};
    return o;
}

} // namespace

TEST_CASE("Decode pool returns frames fitted to the configured bounds", "[decode][pool]") {
    auto log = std::make_shared<FakeDecoderLog>();
    VideoDecodeWorker pool(options(2), make_fake_factory(log));

    auto resp = pool.decode("/clip.mp4", 1.0, 0, false);
    REQUIRE(resp.has_value());
    REQUIRE(resp->image.has_value());
    REQUIRE(resp->image->width == 32);
    REQUIRE(resp->image->height == 18);
    REQUIRE(resp->source_width == 64);
    REQUIRE(resp->source_height == 36);
    REQUIRE_FALSE(resp->used_hw);
}

TEST_CASE("Decode pool pins a lane to one worker thread", "[decode][pool]") {
    auto log = std::make_shared<FakeDecoderLog>();
    VideoDecodeWorker pool(options(3), make_fake_factory(log));
    REQUIRE(pool.worker_count() == 3);
    REQUIRE(pool.worker_for_lane(4) == 1);
    REQUIRE(pool.worker_for_lane(6) == 0);

    std::vector<std::future<DecodeResponse>> pending;
    for(int i = 0; i < 5; ++i) {
        for(uint64_t lane : {0u, 1u, 2u, 3u}) {
            auto f = pool.decode_async("/lane" + std::to_string(lane) + ".mp4", i * 0.04, DecodeMode::Sequential, lane, false);
            REQUIRE(f.has_value());
            pending.push_back(std::move(*f));
        }
    }
    for(auto& f : pending) REQUIRE(f.get().image.has_value());

    // Lanes 0 and 3 share worker 0; every lane stays on one thread.
    std::map<std::string, std::thread::id> thread_of;
    for(const auto& call : log->calls_copy()) {
        auto [it, inserted] = thread_of.emplace(call.path, call.thread);
        if(!inserted) REQUIRE(it->second == call.thread);
    }
    REQUIRE(thread_of.size() == 4);
    REQUIRE(thread_of["/lane0.mp4"] == thread_of["/lane3.mp4"]);
    REQUIRE(thread_of["/lane0.mp4"] != thread_of["/lane1.mp4"]);
}

TEST_CASE("Decode pool serves one lane in submission order", "[decode][pool]") {
    auto log = std::make_shared<FakeDecoderLog>();
    VideoDecodeWorker pool(options(2), make_fake_factory(log));

    std::vector<std::future<DecodeResponse>> pending;
    for(int i = 0; i < 20; ++i) {
        pending.push_back(*pool.decode_async("/seq.mp4", i * 0.1, DecodeMode::Sequential, 7, false));
    }
    for(auto& f : pending) f.get();

    std::vector<double> times;
    for(const auto& call : log->calls_copy()) times.push_back(call.time_seconds);
    REQUIRE(times.size() == 20);
    for(size_t i = 1; i < times.size(); ++i) REQUIRE(times[i] > times[i - 1]);
}

TEST_CASE("Decode pool keeps one decoder per path, lane and hw flag", "[decode][pool]") {
    auto log = std::make_shared<FakeDecoderLog>();
    VideoDecodeWorker pool(options(1), make_fake_factory(log));

    pool.decode("/a.mp4", 0.0, 0, true);
    pool.decode("/a.mp4", 0.5, 0, true);
    REQUIRE(log->open_count() == 1);

    pool.decode("/a.mp4", 0.5, 1, true);     // new lane
    pool.decode("/a.mp4", 0.5, 0, false);    // software variant
    REQUIRE(log->open_count() == 3);

    std::scoped_lock lock(log->mutex);
    REQUIRE(log->opens[0].hw_candidates == std::vector<HwDeviceKind>{HwDeviceKind::Vaapi});
    REQUIRE(log->opens[2].hw_candidates.empty());
    REQUIRE_FALSE(log->opens[2].allow_hw);
}

TEST_CASE("Decode pool bounds open decoders per worker", "[decode][pool]") {
    auto log = std::make_shared<FakeDecoderLog>();
    VideoDecodeWorker pool(options(1, 2), make_fake_factory(log));

    pool.decode("/a.mp4", 0.0, 0, false);
    pool.decode("/b.mp4", 0.0, 0, false);
    pool.decode("/c.mp4", 0.0, 0, false);    // evicts /a.mp4
    REQUIRE(log->live_decoders.load() == 2);
    pool.decode("/a.mp4", 0.0, 0, false);    // reopened
    REQUIRE(log->open_count() == 4);
}

TEST_CASE("Decode pool contains open failures and decoder exceptions", "[decode][pool]") {
    auto log = std::make_shared<FakeDecoderLog>();
    FakeDecoderBehavior behavior;
    behavior.fail_open = {"/missing.mp4"};
    behavior.throw_on = {"/broken.mp4"};
    behavior.empty_frames = {"/blank.mp4"};
    VideoDecodeWorker pool(options(1), make_fake_factory(log, behavior));

    auto missing = pool.decode("/missing.mp4", 0.0, 0, false);
    REQUIRE(missing.has_value());
    REQUIRE_FALSE(missing->image.has_value());

    auto broken = pool.decode("/broken.mp4", 0.0, 0, false);
    REQUIRE(broken.has_value());
    REQUIRE_FALSE(broken->image.has_value());
    REQUIRE(log->live_decoders.load() == 0);    // dropped after throwing

    auto blank = pool.decode("/blank.mp4", 0.0, 0, false);
    REQUIRE(blank.has_value());
    REQUIRE_FALSE(blank->image.has_value());
    REQUIRE(blank->source_width == 64);

    // The same worker thread keeps serving requests.
    auto ok = pool.decode("/fine.mp4", 0.0, 0, false);
    REQUIRE(ok.has_value());
    REQUIRE(ok->image.has_value());
}

TEST_CASE("Decode pool completes queued work on shutdown and rejects new work", "[decode][pool]") {
    auto log = std::make_shared<FakeDecoderLog>();
    VideoDecodeWorker pool(options(2), make_fake_factory(log));

    std::vector<std::future<DecodeResponse>> pending;
    for(int i = 0; i < 10; ++i) pending.push_back(*pool.decode_async("/q.mp4", i * 0.1, DecodeMode::Seek, i, false));
    pool.shutdown();
    for(auto& f : pending) REQUIRE(f.get().image.has_value());

    REQUIRE_FALSE(pool.decode_async("/q.mp4", 0.0, DecodeMode::Seek, 0, false).has_value());
    REQUIRE_FALSE(pool.decode("/q.mp4", 0.0, 0, false).has_value());
    pool.shutdown();
    REQUIRE(log->live_decoders.load() == 0);
}

TEST_CASE("Decode pool reports hardware use from the decoder", "[decode][pool]") {
    auto log = std::make_shared<FakeDecoderLog>();
    FakeDecoderBehavior behavior;
    behavior.hardware = true;
    VideoDecodeWorker pool(options(1), make_fake_factory(log, behavior));

    REQUIRE(pool.decode("/hw.mp4", 0.0, 0, true)->used_hw);
    REQUIRE_FALSE(pool.decode("/hw.mp4", 0.0, 0, false)->used_hw);
}

TEST_CASE("Default worker count stays within one to four", "[decode][pool]") {
    const unsigned n = VideoDecodeWorker::default_worker_count();
    REQUIRE(n >= 1);
    REQUIRE(n <= 4);
}
