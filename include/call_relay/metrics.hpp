#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace call_relay {

class Metrics {
public:
    static Metrics& instance();

    void increment(const std::string& counter, uint64_t by = 1);
    void session_opened();
    void session_closed();
    void observe_latency(const std::string& stage, double seconds);
    std::string render_prometheus() const;

    uint64_t counter_value(const std::string& counter) const;
    int64_t active_sessions() const;

private:
    struct HistogramSeries {
        uint64_t count = 0;
        double sum = 0.0;
        std::vector<uint64_t> buckets;
    };

    Metrics();

    HistogramSeries& histogram_for(const std::string& stage);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, uint64_t> counters_;
    int64_t active_sessions_ = 0;
    std::unordered_map<std::string, HistogramSeries> latency_histograms_;
    std::vector<double> histogram_bounds_;
};

}
