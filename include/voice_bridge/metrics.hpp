#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace voice_bridge {

class Metrics {
public:
    static Metrics& instance();

    void increment_sessions_started();
    void increment_sessions_rejected(const std::string& reason);
    void increment_frames_dropped(const std::string& reason);
    void observe_action(const std::string& action, bool success, double seconds);
    std::string render_prometheus() const;

private:
    struct HistogramSeries {
        uint64_t count = 0;
        double sum = 0.0;
        std::vector<uint64_t> buckets;
    };

    Metrics();

    HistogramSeries& histogram_for(const std::string& action);

    mutable std::mutex mutex_;
    uint64_t sessions_started_ = 0;
    std::map<std::string, uint64_t> sessions_rejected_;
    std::map<std::string, uint64_t> frames_dropped_;
    std::map<std::pair<std::string, std::string>, uint64_t> action_calls_;
    std::map<std::string, HistogramSeries> action_histograms_;
    std::vector<double> histogram_bounds_;
};

}
