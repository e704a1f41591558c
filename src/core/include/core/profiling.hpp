#pragma once
#include <chrono>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace nle::prof {

struct Sample { std::string name; double ms = 0.0; };

struct Stats {
    size_t count = 0;
    double total_ms = 0.0;
    double min_ms = 0.0;
    double max_ms = 0.0;
    double p50_ms = 0.0;
    double p95_ms = 0.0;
    double avg_ms = 0.0;
};

// Collects scope timings for edit commits, audio reschedule passes and app ticks.
// Only the newest `capacity()` samples are kept so a long playback session stays bounded.
class Accumulator {
public:
    static constexpr size_t kDefaultCapacity = 16384;

    static Accumulator& instance();

    void add(Sample s);
    std::vector<Sample> snapshot();
    std::unordered_map<std::string, Stats> aggregate();
    std::optional<Stats> stats(const std::string& name);

    void set_capacity(size_t capacity);
    size_t capacity();

    // JSON report with one entry per sample name, sorted by total time
    bool write_json(const std::string& path);
    // One info line per sample name
    void log_summary();
    void clear();

private:
    std::mutex mtx_;
    std::deque<Sample> samples_;
    size_t capacity_ = kDefaultCapacity;
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

} // namespace nle::prof

#define NLE_PP_CAT(a,b) NLE_PP_CAT_INNER(a,b)
#define NLE_PP_CAT_INNER(a,b) a##b

#define NLE_PROFILE_SCOPE(name) ::nle::prof::ScopedTimer NLE_PP_CAT(nle_prof_scope_u_, __COUNTER__){name}
