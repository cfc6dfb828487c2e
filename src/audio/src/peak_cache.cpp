#include "audio/peak_cache.hpp"
#include "core/log.hpp"

#include <array>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace nla::audio {

namespace fs = std::filesystem;

namespace {

// Explicit little-endian so caches move between hosts.
template<typename T>
void put_le(std::ofstream& out, T value) {
    using U = std::make_unsigned_t<T>;
    U bits = static_cast<U>(value);
    std::array<char, sizeof(T)> buf{};
    for(size_t i = 0; i < sizeof(T); ++i) {
        buf[i] = static_cast<char>((bits >> (8 * i)) & 0xFF);
    }
    out.write(buf.data(), static_cast<std::streamsize>(buf.size()));
}

template<typename T>
bool get_le(std::ifstream& in, T& value) {
    using U = std::make_unsigned_t<T>;
    std::array<unsigned char, sizeof(T)> buf{};
    if(!in.read(reinterpret_cast<char*>(buf.data()), static_cast<std::streamsize>(buf.size()))) return false;
    U bits = 0;
    for(size_t i = 0; i < sizeof(T); ++i) {
        bits |= static_cast<U>(static_cast<U>(buf[i]) << (8 * i));
    }
    value = static_cast<T>(bits);
    return true;
}

uint64_t remaining_bytes(std::ifstream& in) {
    const auto pos = in.tellg();
    in.seekg(0, std::ios::end);
    const auto end = in.tellg();
    in.seekg(pos);
    if(pos < 0 || end < pos) return 0;
    return static_cast<uint64_t>(end - pos);
}

} // namespace

std::string peak_cache_path(const std::string& project_root, uint64_t asset_id) {
    fs::path p = fs::path(project_root) / ".cache" / "audio" / "peaks" / (std::to_string(asset_id) + ".peaks");
    return p.string();
}

core::Result<PeakCache> load_peak_cache(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if(!in) return core::Error<PeakCache>("cannot open peak cache " + path);

    char magic[4] = {0};
    if(!in.read(magic, sizeof(magic))) return core::Error<PeakCache>("truncated peak cache header");
    if(std::memcmp(magic, kPeakMagic, sizeof(magic)) != 0) return core::Error<PeakCache>("invalid peak cache magic");

    uint32_t version = 0;
    if(!get_le(in, version)) return core::Error<PeakCache>("truncated peak cache header");
    if(version != kPeakVersion) {
        return core::Error<PeakCache>("unsupported peak cache version " + std::to_string(version));
    }

    PeakCache cache;
    uint16_t level_count = 0;
    if(!get_le(in, cache.sample_rate) || !get_le(in, cache.channels) || !get_le(in, level_count) ||
       !get_le(in, cache.source_size) || !get_le(in, cache.source_mtime)) {
        return core::Error<PeakCache>("truncated peak cache header");
    }

    if(uint64_t{level_count} * 8 > remaining_bytes(in)) {
        return core::Error<PeakCache>("truncated peak cache level table");
    }
    std::vector<std::pair<uint32_t, uint32_t>> level_info(level_count);
    for(auto& [block_size, peak_count] : level_info) {
        if(!get_le(in, block_size) || !get_le(in, peak_count)) {
            return core::Error<PeakCache>("truncated peak cache level table");
        }
    }

    const bool mono = cache.channels == 1;
    uint64_t payload = 0;
    for(const auto& info : level_info) payload += uint64_t{info.second} * (mono ? 4 : 8);
    if(payload > remaining_bytes(in)) return core::Error<PeakCache>("truncated peak data in " + path);

    cache.levels.reserve(level_count);
    for(const auto& [block_size, peak_count] : level_info) {
        PeakLevel level;
        level.block_size = block_size;
        level.peaks.reserve(peak_count);
        for(uint32_t i = 0; i < peak_count; ++i) {
            PeakPair p;
            bool ok = get_le(in, p.min_l) && get_le(in, p.max_l);
            if(ok && !mono) ok = get_le(in, p.min_r) && get_le(in, p.max_r);
            if(!ok) return core::Error<PeakCache>("truncated peak data in " + path);
            if(mono) {
                p.min_r = p.min_l;
                p.max_r = p.max_l;
            }
            level.peaks.push_back(p);
        }
        cache.levels.push_back(std::move(level));
    }
    return cache;
}

core::VoidResult write_peak_cache(const std::string& path, const PeakCache& cache) {
    std::error_code ec;
    const fs::path target(path);
    if(target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if(ec) return core::Error<bool>("cannot create " + target.parent_path().string() + ": " + ec.message());
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if(!out) return core::Error<bool>("cannot write peak cache " + path);

    out.write(kPeakMagic, sizeof(kPeakMagic));
    put_le(out, kPeakVersion);
    put_le(out, cache.sample_rate);
    put_le(out, cache.channels);
    put_le(out, static_cast<uint16_t>(cache.levels.size()));
    put_le(out, cache.source_size);
    put_le(out, cache.source_mtime);

    for(const auto& level : cache.levels) {
        put_le(out, level.block_size);
        put_le(out, static_cast<uint32_t>(level.peaks.size()));
    }

    const bool mono = cache.channels == 1;
    for(const auto& level : cache.levels) {
        for(const auto& p : level.peaks) {
            put_le(out, p.min_l);
            put_le(out, p.max_l);
            if(!mono) {
                put_le(out, p.min_r);
                put_le(out, p.max_r);
            }
        }
    }

    out.flush();
    if(!out) return core::Error<bool>("write failed for peak cache " + path);
    log::debug("Wrote peak cache " + path + " (" + std::to_string(cache.levels.size()) + " levels)");
    return core::Ok();
}

core::Result<SourceIdentity> source_identity(const std::string& path) {
    std::error_code ec;
    const auto size = fs::file_size(path, ec);
    if(ec) return core::Error<SourceIdentity>("cannot stat " + path + ": " + ec.message());
    const auto written = fs::last_write_time(path, ec);
    if(ec) return core::Error<SourceIdentity>("cannot stat " + path + ": " + ec.message());

    const auto sys = std::chrono::file_clock::to_sys(written);
    const auto secs = std::chrono::duration_cast<std::chrono::seconds>(sys.time_since_epoch()).count();
    SourceIdentity id;
    id.size = static_cast<uint64_t>(size);
    id.mtime_seconds = secs > 0 ? static_cast<uint64_t>(secs) : 0;
    return id;
}

core::Result<bool> cache_matches_source(const PeakCache& cache, const std::string& source_path) {
    auto id = source_identity(source_path);
    if(id.is_error()) return core::Error<bool>(id.error());
    return core::Ok(cache.source_size == id.value().size && cache.source_mtime == id.value().mtime_seconds);
}

} // namespace nla::audio
