#pragma once
#include "audio/peak_cache.hpp"
#include "core/result.hpp"
#include "timeline/timeline.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace nla::audio {

struct PeakBuildConfig {
    uint32_t base_block = 256;
    uint32_t level_factor = 4;
    size_t max_levels = 8;
    uint32_t target_rate = 48000;
    uint16_t target_channels = 2;
};

// Clamps to [-1, 1] and scales to the int16 range, rounding to nearest.
int16_t sample_to_i16(float sample);

// Folds interleaved float frames into fixed-size min/max blocks.
class PeakAccumulator {
public:
    explicit PeakAccumulator(uint32_t block_size);

    // channels == 1 treats each sample as a frame with identical left and right.
    void push_interleaved(const float* samples, size_t frame_count, int channels);
    void push_frame(float left, float right);
    // Flushes a trailing partial block and hands over the peaks.
    std::vector<PeakPair> finish();

    size_t peak_count() const { return peaks_.size(); }

private:
    void flush_block();
    void reset_block();

    uint32_t block_size_;
    uint32_t count_ = 0;
    float min_l_ = 1.0f, max_l_ = -1.0f;
    float min_r_ = 1.0f, max_r_ = -1.0f;
    std::vector<PeakPair> peaks_;
};

std::vector<PeakPair> combine_peaks(const std::vector<PeakPair>& peaks, uint32_t factor);

// Level 0 holds base_peaks; each further level merges factor peaks of the previous one.
// Stops at max_levels, when a level has at most one peak, or when merging no longer shrinks.
std::vector<PeakLevel> build_levels(std::vector<PeakPair> base_peaks, uint32_t base_block,
                                    uint32_t factor, size_t max_levels);

// Decodes the first audio stream of source_path, resampled to target rate/channels as float.
core::Result<PeakCache> build_peak_cache(const std::string& source_path, const PeakBuildConfig& config = {});
// Builds and writes to peak_cache_path(project_root, asset_id); returns the written path.
core::Result<std::string> build_and_store_peak_cache(const std::string& project_root, uint64_t asset_id,
                                                     const std::string& source_path,
                                                     const PeakBuildConfig& config = {});

// Audio file feeding an asset's waveform: audio and video assets, including generative ones.
std::optional<std::string> resolve_audio_source(const std::string& project_root, const timeline::Asset& asset);

} // namespace nla::audio
