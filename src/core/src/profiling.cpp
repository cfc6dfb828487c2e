#include "core/profiling.hpp"
#include "core/log.hpp"

#include <algorithm>
#include <fstream>
#include <map>
#include <numeric>

namespace nla::prof {

namespace {

// Nearest lower rank: index floor(q * (n - 1)) of the sorted samples.
double lower_rank(const std::vector<double>& sorted, double q) {
    const auto idx = static_cast<size_t>(q * static_cast<double>(sorted.size() - 1));
    return sorted[std::min(idx, sorted.size() - 1)];
}

void write_escaped(std::ofstream& out, const std::string& text) {
    for(char c : text) {
        if(c == '"' || c == '\\') out << '\\';
        out << c;
    }
}

} // namespace

Accumulator& Accumulator::instance() {
    static Accumulator inst;
    return inst;
}

void Accumulator::add(Sample s) {
    std::scoped_lock lock(mtx_);
    samples_.push_back(std::move(s));
}

std::vector<Sample> Accumulator::snapshot() {
    std::scoped_lock lock(mtx_);
    return samples_;
}

std::unordered_map<std::string, Accumulator::Stats> Accumulator::aggregate() {
    std::unordered_map<std::string, std::vector<double>> by_name;
    for(const auto& s : snapshot()) by_name[s.name].push_back(s.ms);

    std::unordered_map<std::string, Stats> out;
    out.reserve(by_name.size());
    for(auto& [name, times] : by_name) {
        std::sort(times.begin(), times.end());
        Stats st;
        st.count = times.size();
        st.min_ms = times.front();
        st.max_ms = times.back();
        st.total_ms = std::accumulate(times.begin(), times.end(), 0.0);
        st.avg_ms = st.total_ms / static_cast<double>(st.count);
        st.p50_ms = lower_rank(times, 0.50);
        st.p95_ms = lower_rank(times, 0.95);
        out.emplace(name, st);
    }
    return out;
}

void Accumulator::clear() {
    std::scoped_lock lock(mtx_);
    samples_.clear();
}

bool Accumulator::write_json(const std::string& path) {
    const auto agg = aggregate();
    // Ordered by scope name so reports diff cleanly between runs.
    const std::map<std::string, Stats> ordered(agg.begin(), agg.end());

    std::ofstream out(path, std::ios::trunc);
    if(!out) {
        log::warn("Cannot write profiling report to " + path);
        return false;
    }
    out << "{\n  \"samples\": [";
    const char* sep = "\n";
    for(const auto& [name, st] : ordered) {
        out << sep << "    { \"name\": \"";
        write_escaped(out, name);
        out << "\", \"count\": " << st.count
            << ", \"total_ms\": " << st.total_ms
            << ", \"avg_ms\": " << st.avg_ms
            << ", \"min_ms\": " << st.min_ms
            << ", \"p50_ms\": " << st.p50_ms
            << ", \"p95_ms\": " << st.p95_ms
            << ", \"max_ms\": " << st.max_ms << " }";
        sep = ",\n";
    }
    out << "\n  ]\n}\n";
    out.flush();
    return static_cast<bool>(out);
}

ScopedTimer::~ScopedTimer() {
    const double ms = std::chrono::duration<double, std::milli>(Clock::now() - start_).count();
    Accumulator::instance().add(Sample{name_, ms});
}

} // namespace nla::prof
