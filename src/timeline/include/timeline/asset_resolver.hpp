#pragma once
#include "timeline/timeline.hpp"

#include <optional>
#include <string>
#include <vector>

namespace nla::timeline {

struct ResolvedSource {
    std::string path;
    bool is_video = false;
    std::optional<double> duration_seconds;
};

const std::vector<std::string>& image_extensions();
const std::vector<std::string>& video_extensions();
const std::vector<std::string>& audio_extensions();

// Maps a visual asset to the file to decode. Generative assets look in their folder
// for "<active_version>.<ext>" first, then for any file with an accepted extension.
std::optional<ResolvedSource> resolve_asset_source(const std::string& project_root, const Asset& asset);

std::optional<std::string> resolve_generative_path(const std::string& project_root, const std::string& folder,
                                                   const std::optional<std::string>& active_version,
                                                   const std::vector<std::string>& extensions);

} // namespace nla::timeline
