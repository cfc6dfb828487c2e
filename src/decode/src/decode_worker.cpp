#include "decode/decode_worker.hpp"
#include "decode/decoder_lru.hpp"
#include "core/log.hpp"
#include "core/log_config.hpp"

#include <algorithm>
#include <tuple>

namespace nla::decode {

namespace {

constexpr unsigned kMaxWorkers = 4;

using DecoderKey = std::tuple<std::string, uint64_t, bool>;   // (path, lane, allow_hw)
using DecoderMap = DecoderLru<DecoderKey, std::unique_ptr<IVideoDecoder>>;

} // namespace

unsigned VideoDecodeWorker::default_worker_count() {
    return std::clamp(std::thread::hardware_concurrency(), 1u, kMaxWorkers);
}

VideoDecodeWorker::VideoDecodeWorker(int max_width, int max_height)
    : VideoDecodeWorker(DecodeWorkerOptions{max_width, max_height}) {}

VideoDecodeWorker::VideoDecodeWorker(DecodeWorkerOptions options, DecoderFactory factory)
    : options_(std::move(options)), factory_(std::move(factory)) {
    options_.max_width = std::max(options_.max_width, 1);
    options_.max_height = std::max(options_.max_height, 1);
    const unsigned count = options_.worker_count > 0 ? options_.worker_count : default_worker_count();
    workers_.reserve(count);
    for(unsigned i = 0; i < count; ++i) {
        auto worker = std::make_unique<Worker>();
        worker->index = i;
        workers_.push_back(std::move(worker));
    }
    for(auto& w : workers_) {
        Worker* raw = w.get();
        raw->thread = std::thread([this, raw]{ run(*raw); });
    }
    log::debug("Decode pool started with " + std::to_string(count) + " worker(s)");
}

VideoDecodeWorker::~VideoDecodeWorker() { shutdown(); }

void VideoDecodeWorker::shutdown() {
    {
        std::scoped_lock lock(lifecycle_mutex_);
        if(shut_down_) return;
        shut_down_ = true;
    }
    for(auto& w : workers_) {
        {
            std::lock_guard<std::mutex> lk(w->mutex);
            w->stopping = true;
        }
        w->cv.notify_all();
    }
    for(auto& w : workers_) if(w->thread.joinable()) w->thread.join();
    log::debug("Decode pool stopped");
}

std::optional<std::future<DecodeResponse>> VideoDecodeWorker::submit(DecodeRequest request) {
    if(workers_.empty()) return std::nullopt;
    Worker& w = *workers_[worker_for_lane(request.lane)];
    Job job{std::move(request), {}};
    auto future = job.promise.get_future();
    {
        std::lock_guard<std::mutex> lk(w.mutex);
        if(w.stopping) return std::nullopt;
        w.queue.push_back(std::move(job));
    }
    w.cv.notify_one();
    return future;
}

std::optional<std::future<DecodeResponse>> VideoDecodeWorker::decode_async(const std::string& path, double time_seconds,
                                                                           DecodeMode mode, uint64_t lane, bool allow_hw) {
    return submit(DecodeRequest{path, time_seconds, mode, lane, allow_hw});
}

std::optional<DecodeResponse> VideoDecodeWorker::decode(const std::string& path, double time_seconds, uint64_t lane, bool allow_hw) {
    auto pending = decode_async(path, time_seconds, DecodeMode::Seek, lane, allow_hw);
    if(!pending) return std::nullopt;
    return pending->get();
}

std::optional<DecodeResponse> VideoDecodeWorker::decode_sequential(const std::string& path, double time_seconds, uint64_t lane, bool allow_hw) {
    auto pending = decode_async(path, time_seconds, DecodeMode::Sequential, lane, allow_hw);
    if(!pending) return std::nullopt;
    return pending->get();
}

void VideoDecodeWorker::run(Worker& worker) {
    DecoderMap decoders(options_.max_open_decoders);

    auto process = [&](const DecodeRequest& req) -> DecodeResponse {
        DecoderKey key{req.path, req.lane, req.allow_hw};
        try {
            auto* slot = decoders.get_or_insert(key, [&]() -> std::optional<std::unique_ptr<IVideoDecoder>> {
                DecoderOpenParams params;
                params.path = req.path;
                params.max_width = options_.max_width;
                params.max_height = options_.max_height;
                params.allow_hw = req.allow_hw;
                params.hw_candidates = req.allow_hw ? options_.hw_candidates : std::vector<HwDeviceKind>{};
                params.sequential_window_seconds = options_.sequential_window_seconds;
                auto opened = factory_(params);
                if(opened.is_error()) {
                    log::warn("Decoder open failed: " + opened.error());
                    return std::nullopt;
                }
                return opened.take();
            });
            if(!slot || !*slot) return DecodeResponse{};
            return (*slot)->decode_at(req.time_seconds, req.mode);
        } catch(const std::exception& e) {
            log::error("Decode worker " + std::to_string(worker.index) + " failed on " + req.path + ": " + e.what());
            decoders.erase(key);
            return DecodeResponse{};
        }
    };

    while(true) {
        Job job;
        {
            std::unique_lock<std::mutex> lk(worker.mutex);
            worker.cv.wait(lk, [&]{ return worker.stopping || !worker.queue.empty(); });
            if(worker.queue.empty()) break;
            job = std::move(worker.queue.front());
            worker.queue.pop_front();
        }
        NLA_DECODE_TRACE("worker " + std::to_string(worker.index) + " lane " + std::to_string(job.request.lane) +
                         " " + to_string(job.request.mode) + " " + job.request.path);
        job.promise.set_value(process(job.request));
    }
    decoders.clear();
}

} // namespace nla::decode
