#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "core/profiling.hpp"
#include "render/preview_renderer.hpp"
#include "support/synthetic_media.hpp"

#include <fstream>
#include <iterator>
#include <thread>

using namespace nla::prof;
using Catch::Approx;

TEST_CASE("ScopedTimer records samples", "[profiling]") {
    Accumulator::instance().clear();
    {
        NLA_PROFILE_SCOPE("sleep_test");
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    auto samples = Accumulator::instance().snapshot();
    bool found = false;
    for(const auto& s : samples) {
        if(s.name == "sleep_test") { found = true; REQUIRE(s.ms >= 2.0); }
    }
    REQUIRE(found);
}

TEST_CASE("Profiling stats ordering and bounds", "[profiling]") {
    Accumulator::instance().clear();
    for(double ms : {10.0, 20.0, 30.0, 40.0}) Accumulator::instance().add({"task", ms});
    auto agg = Accumulator::instance().aggregate();
    REQUIRE(agg.contains("task"));
    auto st = agg["task"];
    REQUIRE(st.count == 4);
    REQUIRE(st.min_ms == Approx(10.0));
    REQUIRE(st.max_ms == Approx(40.0));
    REQUIRE(st.total_ms == Approx(100.0));
    REQUIRE(st.avg_ms == Approx(25.0));
    REQUIRE(st.p50_ms == Approx(20.0));    // floor(0.5 * 3) = 1
    REQUIRE(st.p95_ms == Approx(30.0));    // floor(0.95 * 3) = 2
}

TEST_CASE("Profiling percentiles pick lower ranks", "[profiling]") {
    Accumulator::instance().clear();
    Accumulator::instance().add({"one", 7.5});
    Accumulator::instance().add({"two", 30.0});
    Accumulator::instance().add({"two", 10.0});
    for(int i = 0; i < 19; ++i) Accumulator::instance().add({"skew", 1.0});
    Accumulator::instance().add({"skew", 100.0});

    auto agg = Accumulator::instance().aggregate();
    REQUIRE(agg["one"].p50_ms == Approx(7.5));
    REQUIRE(agg["one"].p95_ms == Approx(7.5));
    REQUIRE(agg["two"].p50_ms == Approx(10.0));
    REQUIRE(agg["two"].p95_ms == Approx(10.0));
    REQUIRE(agg["skew"].count == 20);
    REQUIRE(agg["skew"].p95_ms == Approx(1.0));
    REQUIRE(agg["skew"].max_ms == Approx(100.0));
}

TEST_CASE("Profiling JSON lists every scope", "[profiling]") {
    Accumulator::instance().clear();
    Accumulator::instance().add({"io", 5.0});
    const std::string path = nla::test::scratch_path("profiling.json");
    REQUIRE(Accumulator::instance().write_json(path));
    std::ifstream ifs(path);
    REQUIRE(ifs.good());
    std::string content((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    REQUIRE(content.find("\"samples\"") != std::string::npos);
    REQUIRE(content.find("\"io\"") != std::string::npos);

    REQUIRE_FALSE(Accumulator::instance().write_json(nla::test::scratch_path("missing_dir/x/profiling.json")));
}

TEST_CASE("Frame renders emit pipeline scopes", "[profiling][render]") {
    using namespace nla::timeline;
    Accumulator::instance().clear();

    ProjectSnapshot snap;
    snap.tracks = {Track{1, "V1", Track::Type::Video, 1.0f}};
    Asset asset; asset.id = 1; asset.kind = Asset::Kind::Image; asset.path = "a.png";
    snap.assets = {asset};
    Clip clip; clip.id = 1; clip.asset_id = 1; clip.track_id = 1; clip.duration = 5.0;
    snap.clips = {clip};

    nla::core::PreviewConfig cfg;
    cfg.max_preview_width = 64;
    cfg.max_preview_height = 36;
    auto no_stills = [](const std::string& path, int, int) {
        return nla::core::Error<nla::decode::StillImage>("unavailable: " + path);
    };
    nla::render::PreviewRenderer renderer("/proj", cfg, nullptr, nullptr, no_stills);
    REQUIRE(renderer.render_frame(snap, 1.0, nla::render::PreviewDecodeMode::Seek, false).frame.has_value());

    auto agg = Accumulator::instance().aggregate();
    REQUIRE(agg["render.collect"].count == 1);
    REQUIRE(agg["render.composite"].count == 1);
    REQUIRE(agg["render.store"].count == 1);
}
