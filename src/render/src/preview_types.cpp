#include "render/preview_types.hpp"

#include <iomanip>
#include <sstream>

namespace nla::render {

void PreviewStats::add_decode_timings(const decode::DecodeTimings& t) {
    video_decode_ms += t.total_ms();
    video_decode_seek_ms += t.seek_ms;
    video_decode_packet_ms += t.packet_ms;
    video_decode_transfer_ms += t.transfer_ms;
    video_decode_scale_ms += t.scale_ms;
    video_decode_copy_ms += t.copy_ms;
}

std::string stats_to_json(const PreviewStats& s) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(3);
    os << "{\"total_ms\":" << s.total_ms
       << ",\"collect_ms\":" << s.collect_ms
       << ",\"composite_ms\":" << s.composite_ms
       << ",\"encode_ms\":" << s.encode_ms
       << ",\"video_decode_ms\":" << s.video_decode_ms
       << ",\"video_decode_seek_ms\":" << s.video_decode_seek_ms
       << ",\"video_decode_packet_ms\":" << s.video_decode_packet_ms
       << ",\"video_decode_transfer_ms\":" << s.video_decode_transfer_ms
       << ",\"video_decode_scale_ms\":" << s.video_decode_scale_ms
       << ",\"video_decode_copy_ms\":" << s.video_decode_copy_ms
       << ",\"still_load_ms\":" << s.still_load_ms
       << ",\"hw_decode_frames\":" << s.hw_decode_frames
       << ",\"sw_decode_frames\":" << s.sw_decode_frames
       << ",\"layers\":" << s.layers
       << ",\"cache_hits\":" << s.cache_hits
       << ",\"cache_misses\":" << s.cache_misses << '}';
    return os.str();
}

std::string stats_summary(const PreviewStats& s) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(2);
    os << "total=" << s.total_ms << "ms collect=" << s.collect_ms << "ms composite=" << s.composite_ms
       << "ms encode=" << s.encode_ms << "ms decode=" << s.video_decode_ms
       << "ms (seek=" << s.video_decode_seek_ms << " packet=" << s.video_decode_packet_ms
       << " transfer=" << s.video_decode_transfer_ms << " scale=" << s.video_decode_scale_ms
       << " copy=" << s.video_decode_copy_ms << ") still=" << s.still_load_ms
       << "ms layers=" << s.layers << " hits=" << s.cache_hits << " misses=" << s.cache_misses
       << " hw=" << s.hw_decode_frames << " sw=" << s.sw_decode_frames;
    return os.str();
}

} // namespace nla::render
