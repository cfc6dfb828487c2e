#include "core/config.hpp"
#include "core/log.hpp"
#include "core/profiling.hpp"
#include "render/preview_renderer.hpp"
#include "timeline/asset_resolver.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>

namespace {

void print_usage() {
    std::cout << "Usage: nla_preview_probe [--time S] [--width W] [--height H] [--sequential] [--no-hw]\n"
                 "                         [--out file.rgba] [--stats-json file] <media-file>\n";
}

bool is_image_path(const std::string& path) {
    std::string ext = std::filesystem::path(path).extension().string();
    if(!ext.empty() && ext.front() == '.') ext.erase(0, 1);
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    const auto& images = nla::timeline::image_extensions();
    return std::find(images.begin(), images.end(), ext) != images.end();
}

// One clip on one video track covering [0, time + 1s).
nla::timeline::ProjectSnapshot single_clip_snapshot(const std::string& media_path, double time_seconds) {
    using namespace nla::timeline;
    ProjectSnapshot snap;
    snap.settings.duration_seconds = std::max(time_seconds + 1.0, snap.settings.duration_seconds);

    Track track;
    track.id = 1;
    track.name = "V1";
    snap.tracks.push_back(track);

    Asset asset;
    asset.id = 1;
    asset.name = std::filesystem::path(media_path).filename().string();
    asset.kind = is_image_path(media_path) ? Asset::Kind::Image : Asset::Kind::Video;
    asset.path = std::filesystem::absolute(media_path).string();
    snap.assets.push_back(asset);

    Clip clip;
    clip.id = 1;
    clip.asset_id = asset.id;
    clip.track_id = track.id;
    clip.duration = time_seconds + 1.0;
    snap.clips.push_back(clip);
    return snap;
}

bool parse_number(const std::string& text, double& out) {
    try {
        size_t used = 0;
        out = std::stod(text, &used);
        return used == text.size() && std::isfinite(out);
    } catch(const std::exception&) {
        return false;
    }
}

} // namespace

int main(int argc, char** argv) {
    using namespace nla;

    auto config = core::load_config_from_env();
    core::apply_logging_config(config);

    double time_seconds = 0.0;
    bool sequential = false;
    std::string out_path;
    std::string stats_path;
    std::string media_path;

    for(int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        auto next_value = [&](std::string& dst) {
            if(i + 1 >= argc) return false;
            dst = argv[++i];
            return true;
        };
        std::string value;
        if(a == "--help" || a == "-h") { print_usage(); return 0; }
        if(a == "--sequential") { sequential = true; continue; }
        if(a == "--no-hw") { config.allow_hw_decode = false; continue; }
        if(a == "--out") { if(!next_value(out_path)) { print_usage(); return 1; } continue; }
        if(a == "--stats-json") { if(!next_value(stats_path)) { print_usage(); return 1; } continue; }
        if(a == "--width" || a == "--height") {
            std::optional<int> bound;
            if(next_value(value)) bound = core::parse_dimension(value);
            if(!bound) {
                std::cerr << "Invalid value for " << a << "\n";
                return 1;
            }
            (a == "--width" ? config.max_preview_width : config.max_preview_height) = *bound;
            continue;
        }
        if(a == "--time") {
            double number = 0.0;
            if(!next_value(value) || !parse_number(value, number) || number < 0.0) {
                std::cerr << "Invalid value for " << a << "\n";
                return 1;
            }
            time_seconds = number;
            continue;
        }
        if(!a.empty() && a.front() == '-') {
            std::cerr << "Unknown option " << a << "\n";
            print_usage();
            return 1;
        }
        media_path = a; // last non-flag wins
    }
    if(media_path.empty()) { print_usage(); return 1; }

    log::info("nla_preview_probe rendering " + media_path + " @ " + std::to_string(time_seconds) + "s");

    auto store = std::make_shared<render::PreviewFrameStore>(config.preview_store_depth);
    auto renderer = render::PreviewRenderer::create(std::string(), config, store);
    const auto snapshot = single_clip_snapshot(media_path, time_seconds);
    const auto mode = sequential ? render::PreviewDecodeMode::Sequential : render::PreviewDecodeMode::Seek;

    auto output = renderer->render_frame(snapshot, time_seconds, mode, config.allow_hw_decode);
    std::cout << "Stats: " << render::stats_summary(output.stats) << "\n";
    std::cout << "Stats JSON: " << render::stats_to_json(output.stats) << "\n";

    if(!stats_path.empty() && !prof::Accumulator::instance().write_json(stats_path)) {
        log::warn("Could not write profiling stats to " + stats_path);
    }

    if(!output.frame || output.stats.layers == 0) {
        log::error("No frame produced for " + media_path);
        return 2;
    }

    const auto& frame = *output.frame;
    std::cout << "Frame: version=" << frame.version << " size=" << frame.width << 'x' << frame.height << "\n";

    if(!out_path.empty()) {
        auto bytes = store->get_preview_bytes(frame.version);
        std::ofstream out(out_path, std::ios::binary | std::ios::trunc);
        if(!bytes || !out) {
            log::error("Could not write frame to " + out_path);
            return 2;
        }
        out.write(reinterpret_cast<const char*>(bytes->data()), static_cast<std::streamsize>(bytes->size()));
        std::cout << "Wrote " << bytes->size() << " bytes to " << out_path << "\n";
    }

    renderer.reset();
    log::info("Exiting nla_preview_probe.");
    return 0;
}
