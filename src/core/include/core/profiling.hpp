#pragma once
#include <chrono>
#include <string>
#include <mutex>
#include <vector>
#include <unordered_map>

namespace nla::prof {

struct Sample { std::string name; double ms = 0.0; };

// Process-wide sample sink for named scopes (render.collect, render.composite, ...)
class Accumulator {
public:
    static Accumulator& instance();
    void add(Sample s);
    std::vector<Sample> snapshot();
    struct Stats { size_t count=0; double total_ms=0.0; double min_ms=0.0; double max_ms=0.0; double p50_ms=0.0; double p95_ms=0.0; double avg_ms=0.0; };
    std::unordered_map<std::string, Stats> aggregate();
    // Aggregated stats as a JSON document; includes avg, p50, p95, max, min per name.
    bool write_json(const std::string& path);
    // Not safe to call while other threads are still adding samples.
    void clear();
private:
    std::mutex mtx_; std::vector<Sample> samples_;
};

class ScopedTimer {
public:
    explicit ScopedTimer(const char* name): name_(name), start_(Clock::now()) {}
    ~ScopedTimer();
    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;
private:
    using Clock = std::chrono::steady_clock;
    const char* name_; Clock::time_point start_;
};

} // namespace nla::prof

#define NLA_PP_CAT(a,b) NLA_PP_CAT_INNER(a,b)
#define NLA_PP_CAT_INNER(a,b) a##b

#define NLA_PROFILE_SCOPE(name) ::nla::prof::ScopedTimer NLA_PP_CAT(nla_prof_scope_u_, __COUNTER__){name}
