#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "core/config.hpp"
#include "core/log.hpp"

#include <limits>
#include <map>
#include <stdexcept>
#include <vector>

using namespace nla::core;
using Catch::Approx;

namespace {

EnvLookup env(std::map<std::string, std::string> vars) {
    return [vars = std::move(vars)](const std::string& name) -> std::optional<std::string> {
        auto it = vars.find(name);
        if(it == vars.end()) return std::nullopt;
        return it->second;
    };
}

// Captures warnings for the lifetime of the object.
struct WarningCapture {
    std::vector<std::string> messages;
    WarningCapture() {
        nla::log::set_sink([this](nla::log::Level lvl, const std::string& msg) {
            if(lvl == nla::log::Level::Warn) messages.push_back(msg);
        });
    }
    ~WarningCapture() { nla::log::set_sink({}); }
};

} // namespace

TEST_CASE("Config defaults without overrides", "[config]") {
    auto cfg = load_config(env({}));
    REQUIRE(cfg.max_preview_width == 960);
    REQUIRE(cfg.max_preview_height == 540);
    REQUIRE(cfg.frame_cache_bytes == size_t(512) * 1024 * 1024);
    REQUIRE(cfg.preview_store_depth == 2);
    REQUIRE(cfg.allow_hw_decode);
    REQUIRE(cfg.decode_workers == 0);
    REQUIRE(cfg.max_open_decoders == 8);
    REQUIRE(cfg.sequential_window_seconds == Approx(2.0));
    REQUIRE_FALSE(cfg.log_json);
    REQUIRE(cfg.log_level == nla::log::Level::Info);

    auto null_lookup = load_config(EnvLookup{});
    REQUIRE(null_lookup.max_preview_width == 960);
}

TEST_CASE("Config reads environment overrides", "[config]") {
    auto cfg = load_config(env({{"NLA_PREVIEW_MAX_WIDTH", "1280"},
                                {"NLA_PREVIEW_MAX_HEIGHT", "720"},
                                {"NLA_FRAME_CACHE_MB", "64"},
                                {"NLA_PREVIEW_STORE_DEPTH", "4"},
                                {"NLA_DECODE_WORKERS", "3"},
                                {"NLA_MAX_OPEN_DECODERS", "2"},
                                {"NLA_SEQUENTIAL_WINDOW_MS", "500"},
                                {"NLA_DISABLE_HWACCEL", "yes"},
                                {"NLA_LOG_JSON", "1"},
                                {"NLA_LOG_LEVEL", "Warning"}}));
    REQUIRE(cfg.max_preview_width == 1280);
    REQUIRE(cfg.max_preview_height == 720);
    REQUIRE(cfg.frame_cache_bytes == size_t(64) * 1024 * 1024);
    REQUIRE(cfg.preview_store_depth == 4);
    REQUIRE(cfg.decode_workers == 3);
    REQUIRE(cfg.resolved_decode_workers() == 3);
    REQUIRE(cfg.max_open_decoders == 2);
    REQUIRE(cfg.sequential_window_seconds == Approx(0.5));
    REQUIRE_FALSE(cfg.allow_hw_decode);
    REQUIRE(cfg.log_json);
    REQUIRE(cfg.log_level == nla::log::Level::Warn);
}

TEST_CASE("Malformed overrides keep the default and warn", "[config]") {
    WarningCapture capture;
    auto cfg = load_config(env({{"NLA_PREVIEW_MAX_WIDTH", "wide"},
                                {"NLA_FRAME_CACHE_MB", "-5"},
                                {"NLA_DECODE_WORKERS", "0"},
                                {"NLA_SEQUENTIAL_WINDOW_MS", "12ms"},
                                {"NLA_DISABLE_HWACCEL", "maybe"},
                                {"NLA_LOG_LEVEL", "loud"}}));
    REQUIRE(cfg.max_preview_width == 960);
    REQUIRE(cfg.frame_cache_bytes == size_t(512) * 1024 * 1024);
    REQUIRE(cfg.decode_workers == 0);
    REQUIRE(cfg.sequential_window_seconds == Approx(2.0));
    REQUIRE(cfg.allow_hw_decode);
    REQUIRE(cfg.log_level == nla::log::Level::Info);
    REQUIRE(capture.messages.size() == 6);
    REQUIRE(capture.messages[0].find("NLA_PREVIEW_MAX_WIDTH") != std::string::npos);
}

TEST_CASE("Overrides too large for their field keep the default", "[config]") {
    WarningCapture capture;
    auto cfg = load_config(env({{"NLA_FRAME_CACHE_MB", "9999999999999"},
                                {"NLA_PREVIEW_MAX_WIDTH", "3000000000"},
                                {"NLA_PREVIEW_MAX_HEIGHT", "99999999999999999999999"}}));
    REQUIRE(cfg.max_preview_width == 960);
    REQUIRE(cfg.max_preview_height == 540);
    REQUIRE(cfg.frame_cache_bytes == size_t(512) * 1024 * 1024);
    REQUIRE(capture.messages.size() == 3);

    auto fits = load_config(env({{"NLA_PREVIEW_MAX_WIDTH", "2147483647"}}));
    REQUIRE(fits.max_preview_width == 2147483647);
}

TEST_CASE("Automatic worker count stays within the pool limits", "[config]") {
    PreviewConfig cfg;
    const unsigned n = cfg.resolved_decode_workers();
    REQUIRE(n >= 1);
    REQUIRE(n <= 4);
}

TEST_CASE("Pixel bounds parse and clamp to the int range", "[config]") {
    REQUIRE(parse_dimension("640") == std::optional<int>{640});
    REQUIRE(parse_dimension("320.9") == std::optional<int>{320});
    REQUIRE(parse_dimension("0") == std::optional<int>{1});
    REQUIRE(parse_dimension("1e20") == std::optional<int>{std::numeric_limits<int>::max()});
    REQUIRE_FALSE(parse_dimension("-4").has_value());
    REQUIRE_FALSE(parse_dimension("nan").has_value());
    REQUIRE_FALSE(parse_dimension("inf").has_value());
    REQUIRE_FALSE(parse_dimension("12px").has_value());
    REQUIRE_FALSE(parse_dimension("").has_value());
}

TEST_CASE("Log level names parse case-insensitively", "[config][log]") {
    REQUIRE(parse_log_level("TRACE") == nla::log::Level::Trace);
    REQUIRE(parse_log_level("debug") == nla::log::Level::Debug);
    REQUIRE(parse_log_level("warn") == nla::log::Level::Warn);
    REQUIRE(parse_log_level("Critical") == nla::log::Level::Critical);
    REQUIRE_FALSE(parse_log_level("").has_value());
    REQUIRE(std::string(nla::log::level_name(nla::log::Level::Error)) == "error");
}

TEST_CASE("Log records below the threshold are dropped", "[log]") {
    std::vector<std::pair<nla::log::Level, std::string>> seen;
    nla::log::set_sink([&seen](nla::log::Level lvl, const std::string& msg) { seen.emplace_back(lvl, msg); });
    const auto previous = nla::log::level();

    nla::log::set_level(nla::log::Level::Warn);
    nla::log::debug("hidden");
    nla::log::info("hidden");
    nla::log::warn("shown");
    nla::log::error("also shown");
    REQUIRE(seen.size() == 2);
    REQUIRE(seen[0].first == nla::log::Level::Warn);
    REQUIRE(seen[1].second == "also shown");

    // A throwing sink must not escape the logger.
    nla::log::set_sink([](nla::log::Level, const std::string&) { throw std::runtime_error("sink down"); });
    nla::log::error("dropped");

    nla::log::set_sink({});
    nla::log::set_level(previous);
}

TEST_CASE("Logging config applies level and json mode", "[config][log]") {
    const auto previous = nla::log::level();
    PreviewConfig cfg;
    cfg.log_json = true;
    cfg.log_level = nla::log::Level::Error;
    apply_logging_config(cfg);
    REQUIRE(nla::log::json_mode());
    REQUIRE(nla::log::level() == nla::log::Level::Error);

    nla::log::set_json_mode(false);
    nla::log::set_level(previous);
}
