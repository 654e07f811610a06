#include "voice_bridge/metrics.hpp"

#include <iomanip>
#include <sstream>

namespace voice_bridge {

Metrics& Metrics::instance() {
    static Metrics metrics;
    return metrics;
}

Metrics::Metrics() {
    histogram_bounds_ = {0.01, 0.025, 0.05, 0.1, 0.25, 0.5, 1.0, 2.5, 5.0, 10.0};
}

void Metrics::increment_sessions_started() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++sessions_started_;
}

void Metrics::increment_sessions_rejected(const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++sessions_rejected_[reason];
}

void Metrics::increment_frames_dropped(const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++frames_dropped_[reason];
}

Metrics::HistogramSeries& Metrics::histogram_for(const std::string& action) {
    auto& series = action_histograms_[action];
    if (series.buckets.empty()) {
        series.buckets.assign(histogram_bounds_.size() + 1, 0);
    }
    return series;
}

void Metrics::observe_action(const std::string& action, bool success, double seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++action_calls_[{action, success ? "success" : "failure"}];
    auto& histogram = histogram_for(action);
    histogram.count += 1;
    histogram.sum += seconds;
    for (size_t i = 0; i < histogram_bounds_.size(); ++i) {
        if (seconds <= histogram_bounds_[i]) {
            histogram.buckets[i] += 1;
        }
    }
    histogram.buckets.back() += 1;
}

std::string Metrics::render_prometheus() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream out;
    out.setf(std::ios::fixed);
    out << std::setprecision(6);

    out << "# HELP voice_sessions_started_total Bridged calls accepted\n";
    out << "# TYPE voice_sessions_started_total counter\n";
    out << "voice_sessions_started_total " << sessions_started_ << "\n";

    out << "# HELP voice_sessions_rejected_total Carrier connections refused before a session\n";
    out << "# TYPE voice_sessions_rejected_total counter\n";
    for (const auto& [reason, count] : sessions_rejected_) {
        out << "voice_sessions_rejected_total{reason=\"" << reason << "\"} " << count << "\n";
    }

    out << "# HELP voice_frames_dropped_total Audio frames dropped by the bridge\n";
    out << "# TYPE voice_frames_dropped_total counter\n";
    for (const auto& [reason, count] : frames_dropped_) {
        out << "voice_frames_dropped_total{reason=\"" << reason << "\"} " << count << "\n";
    }

    out << "# HELP voice_action_calls_total Tool calls executed by action and outcome\n";
    out << "# TYPE voice_action_calls_total counter\n";
    for (const auto& [key, count] : action_calls_) {
        out << "voice_action_calls_total{action=\"" << key.first << "\",outcome=\""
            << key.second << "\"} " << count << "\n";
    }

    out << "# HELP voice_action_duration_seconds Tool call execution time\n";
    out << "# TYPE voice_action_duration_seconds histogram\n";
    for (const auto& [action, series] : action_histograms_) {
        for (size_t i = 0; i < histogram_bounds_.size(); ++i) {
            out << "voice_action_duration_seconds_bucket{action=\"" << action
                << "\",le=\"" << histogram_bounds_[i] << "\"} "
                << series.buckets[i] << "\n";
        }
        out << "voice_action_duration_seconds_bucket{action=\"" << action
            << "\",le=\"+Inf\"} " << series.buckets.back() << "\n";
        out << "voice_action_duration_seconds_count{action=\"" << action << "\"} "
            << series.count << "\n";
        out << "voice_action_duration_seconds_sum{action=\"" << action << "\"} "
            << series.sum << "\n";
    }

    return out.str();
}

}
