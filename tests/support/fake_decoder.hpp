#pragma once
#include "decode/decoder.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace nla::test {

struct FakeCall {
    std::string path;
    double time_seconds = 0.0;
    decode::DecodeMode mode = decode::DecodeMode::Seek;
    std::thread::id thread;
};

// Shared between a factory and every decoder it opens.
struct FakeDecoderLog {
    std::mutex mutex;
    std::vector<FakeCall> calls;
    std::vector<decode::DecoderOpenParams> opens;
    std::atomic<int> live_decoders{0};

    std::vector<FakeCall> calls_copy() {
        std::scoped_lock lock(mutex);
        return calls;
    }
    size_t open_count() {
        std::scoped_lock lock(mutex);
        return opens.size();
    }
};

struct FakeDecoderBehavior {
    int source_width = 64;
    int source_height = 36;
    uint8_t r = 200, g = 100, b = 50, a = 255;
    bool hardware = false;
    std::set<std::string> fail_open;     // paths whose open fails
    std::set<std::string> throw_on;      // paths whose decode_at throws
    std::set<std::string> empty_frames;  // paths that decode to no image
};

class FakeDecoder final : public decode::IVideoDecoder {
public:
    FakeDecoder(decode::DecoderOpenParams params, FakeDecoderBehavior behavior, std::shared_ptr<FakeDecoderLog> log)
        : params_(std::move(params)), behavior_(std::move(behavior)), log_(std::move(log)) {
        ++log_->live_decoders;
    }
    ~FakeDecoder() override { --log_->live_decoders; }

    decode::DecodeResponse decode_at(double time_seconds, decode::DecodeMode mode) override {
        {
            std::scoped_lock lock(log_->mutex);
            log_->calls.push_back(FakeCall{params_.path, time_seconds, mode, std::this_thread::get_id()});
        }
        if(behavior_.throw_on.count(params_.path)) throw std::runtime_error("fake decoder failure");

        decode::DecodeResponse resp;
        resp.source_width = behavior_.source_width;
        resp.source_height = behavior_.source_height;
        if(behavior_.empty_frames.count(params_.path)) return resp;

        auto [w, h] = decode::fit_dimensions(behavior_.source_width, behavior_.source_height,
                                             params_.max_width, params_.max_height);
        resp.image = decode::RgbaImage::filled(w, h, behavior_.r, behavior_.g, behavior_.b, behavior_.a);
        resp.used_hw = hardware_active();
        if(mode == decode::DecodeMode::Seek) resp.timings.seek_ms = 0.5;
        resp.timings.packet_ms = 0.25;
        return resp;
    }

    bool hardware_active() const override { return behavior_.hardware && params_.allow_hw; }

private:
    decode::DecoderOpenParams params_;
    FakeDecoderBehavior behavior_;
    std::shared_ptr<FakeDecoderLog> log_;
};

inline decode::DecoderFactory make_fake_factory(std::shared_ptr<FakeDecoderLog> log, FakeDecoderBehavior behavior = {}) {
    return [log, behavior](const decode::DecoderOpenParams& params)
        -> core::Result<std::unique_ptr<decode::IVideoDecoder>> {
        {
            std::scoped_lock lock(log->mutex);
            log->opens.push_back(params);
        }
        if(behavior.fail_open.count(params.path)) {
            return core::Error<std::unique_ptr<decode::IVideoDecoder>>("cannot open " + params.path);
        }
        return core::Result<std::unique_ptr<decode::IVideoDecoder>>(
            std::unique_ptr<decode::IVideoDecoder>(std::make_unique<FakeDecoder>(params, behavior, log)));
    };
}

} // namespace nla::test
