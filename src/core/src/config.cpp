#include "core/config.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <thread>

namespace nla::core {

namespace {

constexpr unsigned kMaxAutoWorkers = 4;

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

std::optional<long long> parse_integer(const std::string& text) {
    if(text.empty()) return std::nullopt;
    char* end = nullptr;
    errno = 0;
    const long long v = std::strtoll(text.c_str(), &end, 10);
    if(end == text.c_str() || *end != '\0' || errno == ERANGE) return std::nullopt;
    return v;
}

std::optional<bool> parse_flag(const std::string& text) {
    const auto t = lowercase(text);
    if(t == "1" || t == "true" || t == "yes" || t == "on") return true;
    if(t == "0" || t == "false" || t == "no" || t == "off") return false;
    return std::nullopt;
}

void reject(const std::string& name, const std::string& value) {
    log::warn("Ignoring " + name + "='" + value + "' (malformed), keeping default");
}

// Reads a positive integer override; malformed, non-positive or out-of-range values keep the default.
template<typename T>
void read_positive(const EnvLookup& lookup, const char* name, T& out, unsigned long long scale = 1) {
    auto raw = lookup(name);
    if(!raw) return;
    auto v = parse_integer(*raw);
    if(!v || *v <= 0) { reject(name, *raw); return; }
    const auto value = static_cast<unsigned long long>(*v);
    if(value > static_cast<unsigned long long>(std::numeric_limits<T>::max()) / scale) {
        reject(name, *raw);
        return;
    }
    out = static_cast<T>(value * scale);
}

} // namespace

unsigned PreviewConfig::resolved_decode_workers() const {
    if(decode_workers > 0) return decode_workers;
    unsigned hc = std::thread::hardware_concurrency();
    return std::clamp(hc, 1u, kMaxAutoWorkers);
}

std::optional<int> parse_dimension(const std::string& text) {
    if(text.empty()) return std::nullopt;
    char* end = nullptr;
    const double v = std::strtod(text.c_str(), &end);
    if(end == text.c_str() || *end != '\0' || !std::isfinite(v) || v < 0.0) return std::nullopt;
    if(v >= static_cast<double>(std::numeric_limits<int>::max())) return std::numeric_limits<int>::max();
    return std::max(1, static_cast<int>(v));
}

std::optional<log::Level> parse_log_level(const std::string& text) {
    const auto t = lowercase(text);
    if(t == "trace") return log::Level::Trace;
    if(t == "debug") return log::Level::Debug;
    if(t == "info") return log::Level::Info;
    if(t == "warn" || t == "warning") return log::Level::Warn;
    if(t == "error") return log::Level::Error;
    if(t == "critical") return log::Level::Critical;
    return std::nullopt;
}

PreviewConfig load_config(const EnvLookup& lookup) {
    PreviewConfig cfg;
    if(!lookup) return cfg;

    read_positive(lookup, "NLA_PREVIEW_MAX_WIDTH", cfg.max_preview_width);
    read_positive(lookup, "NLA_PREVIEW_MAX_HEIGHT", cfg.max_preview_height);
    read_positive(lookup, "NLA_FRAME_CACHE_MB", cfg.frame_cache_bytes, 1024ULL * 1024ULL);
    read_positive(lookup, "NLA_PREVIEW_STORE_DEPTH", cfg.preview_store_depth);
    read_positive(lookup, "NLA_DECODE_WORKERS", cfg.decode_workers);
    read_positive(lookup, "NLA_MAX_OPEN_DECODERS", cfg.max_open_decoders);

    if(auto raw = lookup("NLA_SEQUENTIAL_WINDOW_MS")) {
        auto v = parse_integer(*raw);
        if(v && *v > 0) cfg.sequential_window_seconds = static_cast<double>(*v) / 1000.0;
        else reject("NLA_SEQUENTIAL_WINDOW_MS", *raw);
    }
    if(auto raw = lookup("NLA_DISABLE_HWACCEL")) {
        auto v = parse_flag(*raw);
        if(v) cfg.allow_hw_decode = !*v;
        else reject("NLA_DISABLE_HWACCEL", *raw);
    }
    if(auto raw = lookup("NLA_LOG_JSON")) {
        auto v = parse_flag(*raw);
        if(v) cfg.log_json = *v;
        else reject("NLA_LOG_JSON", *raw);
    }
    if(auto raw = lookup("NLA_LOG_LEVEL")) {
        auto v = parse_log_level(*raw);
        if(v) cfg.log_level = *v;
        else reject("NLA_LOG_LEVEL", *raw);
    }
    return cfg;
}

PreviewConfig load_config_from_env() {
    return load_config([](const std::string& name) -> std::optional<std::string> {
        if(const char* s = std::getenv(name.c_str())) return std::string(s);
        return std::nullopt;
    });
}

void apply_logging_config(const PreviewConfig& cfg) {
    log::set_json_mode(cfg.log_json);
    log::set_level(cfg.log_level);
}

} // namespace nla::core
