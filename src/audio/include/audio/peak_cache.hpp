#pragma once
#include "core/result.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace nla::audio {

inline constexpr char kPeakMagic[4] = {'N', 'L', 'A', '1'};
inline constexpr uint32_t kPeakVersion = 1;

// Min/max of one block per channel. Mono caches store left only and mirror it into right on load.
struct PeakPair {
    int16_t min_l = 0;
    int16_t max_l = 0;
    int16_t min_r = 0;
    int16_t max_r = 0;

    bool operator==(const PeakPair&) const = default;
};

struct PeakLevel {
    uint32_t block_size = 0;    // sample frames per peak
    std::vector<PeakPair> peaks;
};

// Multi-resolution waveform summary of one audio source, level 0 being the finest.
struct PeakCache {
    uint32_t sample_rate = 0;
    uint16_t channels = 0;
    uint64_t source_size = 0;
    uint64_t source_mtime = 0;
    std::vector<PeakLevel> levels;
};

struct SourceIdentity {
    uint64_t size = 0;
    uint64_t mtime_seconds = 0;
};

// <project_root>/.cache/audio/peaks/<asset_id>.peaks
std::string peak_cache_path(const std::string& project_root, uint64_t asset_id);

core::Result<PeakCache> load_peak_cache(const std::string& path);
// Creates missing parent directories.
core::VoidResult write_peak_cache(const std::string& path, const PeakCache& cache);

core::Result<SourceIdentity> source_identity(const std::string& path);
// True when the cache was built from the file as it is on disk now.
core::Result<bool> cache_matches_source(const PeakCache& cache, const std::string& source_path);

} // namespace nla::audio
