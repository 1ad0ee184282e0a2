#include "call_relay/metrics.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace call_relay {

namespace {

template <typename Map>
std::vector<std::string> sorted_keys(const Map& map) {
    std::vector<std::string> keys;
    keys.reserve(map.size());
    for (const auto& item : map) {
        keys.push_back(item.first);
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

}

Metrics& Metrics::instance() {
    static Metrics metrics;
    return metrics;
}

Metrics::Metrics() {
    histogram_bounds_ = {0.05, 0.1, 0.25, 0.5, 0.75, 1.0, 1.5, 2.0,
                         3.0, 5.0, 10.0, 30.0};
}

void Metrics::increment(const std::string& counter, uint64_t by) {
    std::lock_guard<std::mutex> lock(mutex_);
    counters_[counter] += by;
}

void Metrics::session_opened() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++active_sessions_;
    ++counters_["sessions"];
}

void Metrics::session_closed() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (active_sessions_ > 0) {
        --active_sessions_;
    }
}

Metrics::HistogramSeries& Metrics::histogram_for(const std::string& stage) {
    auto& series = latency_histograms_[stage];
    if (series.buckets.empty()) {
        series.buckets.assign(histogram_bounds_.size() + 1, 0);
    }
    return series;
}

void Metrics::observe_latency(const std::string& stage, double seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& histogram = histogram_for(stage);
    histogram.count += 1;
    histogram.sum += seconds;
    for (size_t i = 0; i < histogram_bounds_.size(); ++i) {
        if (seconds <= histogram_bounds_[i]) {
            histogram.buckets[i] += 1;
        }
    }
    histogram.buckets.back() += 1;
}

uint64_t Metrics::counter_value(const std::string& counter) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = counters_.find(counter);
    return it == counters_.end() ? 0 : it->second;
}

int64_t Metrics::active_sessions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_sessions_;
}

std::string Metrics::render_prometheus() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream out;
    out.setf(std::ios::fixed);
    out << std::setprecision(6);

    out << "# HELP call_relay_events_total Relay events by kind\n";
    out << "# TYPE call_relay_events_total counter\n";
    for (const auto& name : sorted_keys(counters_)) {
        out << "call_relay_events_total{event=\"" << name << "\"} "
            << counters_.at(name) << "\n";
    }

    out << "# HELP call_relay_active_sessions Calls with an attached media stream\n";
    out << "# TYPE call_relay_active_sessions gauge\n";
    out << "call_relay_active_sessions " << active_sessions_ << "\n";

    out << "# HELP call_relay_stage_seconds Latency of external calls by stage\n";
    out << "# TYPE call_relay_stage_seconds histogram\n";
    for (const auto& stage : sorted_keys(latency_histograms_)) {
        const auto& series = latency_histograms_.at(stage);
        for (size_t i = 0; i < histogram_bounds_.size(); ++i) {
            out << "call_relay_stage_seconds_bucket{stage=\"" << stage
                << "\",le=\"" << histogram_bounds_[i] << "\"} "
                << series.buckets[i] << "\n";
        }
        out << "call_relay_stage_seconds_bucket{stage=\"" << stage
            << "\",le=\"+Inf\"} " << series.buckets.back() << "\n";
        out << "call_relay_stage_seconds_count{stage=\"" << stage << "\"} "
            << series.count << "\n";
        out << "call_relay_stage_seconds_sum{stage=\"" << stage << "\"} "
            << series.sum << "\n";
    }

    return out.str();
}

}
