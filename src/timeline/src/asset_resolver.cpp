#include "timeline/asset_resolver.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace nla::timeline {

namespace {

bool iequals(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y){ return std::tolower(x) == std::tolower(y); });
}

std::string join(const std::string& root, const std::string& rel) {
    if(root.empty()) return rel;
    return (fs::path(root) / fs::path(rel)).string();
}

} // namespace

const std::vector<std::string>& image_extensions() {
    static const std::vector<std::string> exts{"png", "jpg", "jpeg", "webp"};
    return exts;
}

const std::vector<std::string>& video_extensions() {
    static const std::vector<std::string> exts{"mp4", "mov", "mkv", "webm"};
    return exts;
}

const std::vector<std::string>& audio_extensions() {
    static const std::vector<std::string> exts{"wav", "mp3", "ogg", "flac", "m4a"};
    return exts;
}

std::optional<std::string> resolve_generative_path(const std::string& project_root, const std::string& folder,
                                                   const std::optional<std::string>& active_version,
                                                   const std::vector<std::string>& extensions) {
    const fs::path dir = join(project_root, folder);
    std::error_code ec;

    if(active_version) {
        for(const auto& ext : extensions) {
            fs::path candidate = dir / (*active_version + "." + ext);
            if(fs::exists(candidate, ec)) return candidate.string();
        }
    }

    // Directory iteration order is unspecified; sort so the pick is stable across runs.
    std::vector<fs::path> files;
    for(fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        if(it->is_regular_file(ec)) files.push_back(it->path());
    }
    std::sort(files.begin(), files.end());
    for(const auto& file : files) {
        std::string ext = file.extension().string();
        if(!ext.empty() && ext.front() == '.') ext.erase(0, 1);
        for(const auto& allowed : extensions) {
            if(iequals(ext, allowed)) return file.string();
        }
    }
    return std::nullopt;
}

std::optional<ResolvedSource> resolve_asset_source(const std::string& project_root, const Asset& asset) {
    switch(asset.kind) {
        case Asset::Kind::Image:
            return ResolvedSource{join(project_root, asset.path), false, asset.duration_seconds};
        case Asset::Kind::Video:
            return ResolvedSource{join(project_root, asset.path), true, asset.duration_seconds};
        case Asset::Kind::GenerativeImage: {
            auto p = resolve_generative_path(project_root, asset.path, asset.active_version, image_extensions());
            if(!p) return std::nullopt;
            return ResolvedSource{*p, false, asset.duration_seconds};
        }
        case Asset::Kind::GenerativeVideo: {
            auto p = resolve_generative_path(project_root, asset.path, asset.active_version, video_extensions());
            if(!p) return std::nullopt;
            return ResolvedSource{*p, true, asset.duration_seconds};
        }
        default:
            return std::nullopt;
    }
}

} // namespace nla::timeline
