#include "core/profiling.hpp"
#include "core/log.hpp"
#include <algorithm>
#include <fstream>
#include <spdlog/fmt/fmt.h>

namespace nle::prof {

namespace {

double percentile(const std::vector<double>& sorted, double q) {
    if(sorted.empty()) return 0.0;
    auto idx = static_cast<size_t>(q * static_cast<double>(sorted.size() - 1));
    return sorted[std::min(idx, sorted.size() - 1)];
}

Stats summarize(std::vector<double> values) {
    Stats st;
    if(values.empty()) return st;
    std::sort(values.begin(), values.end());
    st.count = values.size();
    st.min_ms = values.front();
    st.max_ms = values.back();
    for(double v : values) st.total_ms += v;
    st.avg_ms = st.total_ms / static_cast<double>(st.count);
    st.p50_ms = percentile(values, 0.5);
    st.p95_ms = percentile(values, 0.95);
    return st;
}

std::vector<std::pair<std::string, Stats>> by_total(std::unordered_map<std::string, Stats> agg) {
    std::vector<std::pair<std::string, Stats>> rows(agg.begin(), agg.end());
    std::sort(rows.begin(), rows.end(), [](const auto& a, const auto& b){
        if(a.second.total_ms != b.second.total_ms) return a.second.total_ms > b.second.total_ms;
        return a.first < b.first;
    });
    return rows;
}

} // namespace

Accumulator& Accumulator::instance() {
    static Accumulator inst;
    return inst;
}

void Accumulator::add(Sample s) {
    std::scoped_lock lock(mtx_);
    samples_.push_back(std::move(s));
    while(samples_.size() > capacity_) samples_.pop_front();
}

std::vector<Sample> Accumulator::snapshot() {
    std::scoped_lock lock(mtx_);
    return {samples_.begin(), samples_.end()};
}

std::unordered_map<std::string, Stats> Accumulator::aggregate() {
    std::unordered_map<std::string, std::vector<double>> buckets;
    {
        std::scoped_lock lock(mtx_);
        for(const auto& s : samples_) buckets[s.name].push_back(s.ms);
    }
    std::unordered_map<std::string, Stats> out;
    out.reserve(buckets.size());
    for(auto& [name, values] : buckets) out.emplace(name, summarize(std::move(values)));
    return out;
}

std::optional<Stats> Accumulator::stats(const std::string& name) {
    std::vector<double> values;
    {
        std::scoped_lock lock(mtx_);
        for(const auto& s : samples_) if(s.name == name) values.push_back(s.ms);
    }
    if(values.empty()) return std::nullopt;
    return summarize(std::move(values));
}

void Accumulator::set_capacity(size_t capacity) {
    std::scoped_lock lock(mtx_);
    capacity_ = std::max<size_t>(capacity, 1);
    while(samples_.size() > capacity_) samples_.pop_front();
}

size_t Accumulator::capacity() {
    std::scoped_lock lock(mtx_);
    return capacity_;
}

bool Accumulator::write_json(const std::string& path) {
    auto rows = by_total(aggregate());
    std::ofstream ofs(path, std::ios::trunc);
    if(!ofs) return false;
    ofs << "{\n  \"samples\": [";
    for(size_t i = 0; i < rows.size(); ++i) {
        const auto& [name, st] = rows[i];
        ofs << (i ? ",\n" : "\n")
            << fmt::format("    {{ \"name\": \"{}\", \"count\": {}, \"total_ms\": {:.4f}, \"avg_ms\": {:.4f}, "
                           "\"min_ms\": {:.4f}, \"max_ms\": {:.4f}, \"p50_ms\": {:.4f}, \"p95_ms\": {:.4f} }}",
                           name, st.count, st.total_ms, st.avg_ms, st.min_ms, st.max_ms, st.p50_ms, st.p95_ms);
    }
    ofs << "\n  ]\n}\n";
    return static_cast<bool>(ofs);
}

void Accumulator::log_summary() {
    for(const auto& [name, st] : by_total(aggregate())) {
        nle::log::info(fmt::format("[prof] {} n={} avg={:.3f}ms p95={:.3f}ms max={:.3f}ms",
                                   name, st.count, st.avg_ms, st.p95_ms, st.max_ms));
    }
}

void Accumulator::clear() {
    std::scoped_lock lock(mtx_);
    samples_.clear();
}

ScopedTimer::~ScopedTimer() {
    double ms = std::chrono::duration<double, std::milli>(Clock::now() - start_).count();
    Accumulator::instance().add(Sample{std::string(name_), ms});
}

} // namespace nle::prof
