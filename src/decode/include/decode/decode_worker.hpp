#pragma once
#include "decode/decoder.hpp"

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace nla::decode {

struct DecodeWorkerOptions {
    int max_width = 960;
    int max_height = 540;
    unsigned worker_count = 0;          // 0 = hardware concurrency clamped to [1, 4]
    size_t max_open_decoders = 8;       // per worker thread
    double sequential_window_seconds = 2.0;
    std::vector<HwDeviceKind> hw_candidates = platform_hw_candidates();
};

// Fixed pool of decode threads. Each thread owns its decoders; requests are pinned to
// a thread by lane so consecutive requests of one lane run in submission order on the
// same decoder.
class VideoDecodeWorker {
public:
    VideoDecodeWorker(int max_width, int max_height);
    explicit VideoDecodeWorker(DecodeWorkerOptions options, DecoderFactory factory = make_ffmpeg_decoder_factory());
    ~VideoDecodeWorker();

    VideoDecodeWorker(const VideoDecodeWorker&) = delete;
    VideoDecodeWorker& operator=(const VideoDecodeWorker&) = delete;

    // Blocking seek-mode decode. Empty only when the pool has been shut down.
    std::optional<DecodeResponse> decode(const std::string& path, double time_seconds, uint64_t lane, bool allow_hw);
    // Blocking decode that continues from the decoder's current position when possible.
    std::optional<DecodeResponse> decode_sequential(const std::string& path, double time_seconds, uint64_t lane, bool allow_hw);
    // Queues a request; dropping the returned future discards the result.
    std::optional<std::future<DecodeResponse>> decode_async(const std::string& path, double time_seconds,
                                                            DecodeMode mode, uint64_t lane, bool allow_hw);
    std::optional<std::future<DecodeResponse>> submit(DecodeRequest request);

    unsigned worker_count() const { return static_cast<unsigned>(workers_.size()); }
    size_t worker_for_lane(uint64_t lane) const { return static_cast<size_t>(lane % workers_.size()); }

    // Completes queued requests, then joins all threads. Safe to call more than once.
    void shutdown();

    static unsigned default_worker_count();

private:
    struct Job {
        DecodeRequest request;
        std::promise<DecodeResponse> promise;
    };

    struct Worker {
        size_t index = 0;
        std::thread thread;
        std::mutex mutex;
        std::condition_variable cv;
        std::deque<Job> queue;
        bool stopping = false;
    };

    void run(Worker& worker);

    DecodeWorkerOptions options_;
    DecoderFactory factory_;
    std::vector<std::unique_ptr<Worker>> workers_;
    std::mutex lifecycle_mutex_;
    bool shut_down_ = false;
};

} // namespace nla::decode
