#pragma once

#include <chrono>

namespace nla::core {

// Millisecond stopwatch used for the per-stage fields of decode and render stats.
class Stopwatch {
public:
    using clock = std::chrono::steady_clock;

    Stopwatch() : start_(clock::now()), lap_(start_) {}

    void restart() { start_ = lap_ = clock::now(); }

    double elapsed_ms() const {
        return std::chrono::duration<double, std::milli>(clock::now() - start_).count();
    }

    // Time since the previous lap (or construction), then starts a new lap.
    double lap_ms() {
        const auto now = clock::now();
        const double ms = std::chrono::duration<double, std::milli>(now - lap_).count();
        lap_ = now;
        return ms;
    }

private:
    clock::time_point start_;
    clock::time_point lap_;
};

} // namespace nla::core
