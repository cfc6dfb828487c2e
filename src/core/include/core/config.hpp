#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>

#include "core/log.hpp"

namespace nla::core {

// Runtime knobs for the preview pipeline. Defaults match an interactive
// editing session on a typical desktop.
struct PreviewConfig {
    int max_preview_width = 960;
    int max_preview_height = 540;
    size_t frame_cache_bytes = size_t(512) * 1024 * 1024;
    size_t preview_store_depth = 2;
    bool allow_hw_decode = true;
    unsigned decode_workers = 0;        // 0 = hardware concurrency clamped to [1, 4]
    size_t max_open_decoders = 8;       // per worker
    double sequential_window_seconds = 2.0;
    bool log_json = false;
    log::Level log_level = log::Level::Info;

    unsigned resolved_decode_workers() const;
};

// Returns the value of an environment variable, or nullopt when unset.
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

PreviewConfig load_config(const EnvLookup& lookup);
PreviewConfig load_config_from_env();
void apply_logging_config(const PreviewConfig& cfg);

std::optional<log::Level> parse_log_level(const std::string& text);
// Parses a pixel bound. Fractions truncate, zero becomes 1 and values past the int range clamp to it.
std::optional<int> parse_dimension(const std::string& text);

} // namespace nla::core
