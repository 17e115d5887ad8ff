#include "monitoring/latency_tracker.hpp"
#include <algorithm>

namespace dexbook {

void LatencyTracker::record(uint64_t latency_ns) {
    if (samples_.size() < MAX_SAMPLES) {
        samples_.push_back(latency_ns);
    } else {
        samples_[recorded_ % MAX_SAMPLES] = latency_ns;
    }
    ++recorded_;
}

LatencyTracker::Stats LatencyTracker::compute_stats() const {
    Stats stats{};
    size_t n = samples_.size();
    if (n == 0) return stats;

    // Off the hot path: only for reporting
    std::vector<uint64_t> sorted(samples_);
    std::sort(sorted.begin(), sorted.end());

    stats.count = n;
    stats.min = sorted[0];
    stats.max = sorted[n - 1];
    stats.p50 = sorted[n * 50 / 100];
    stats.p90 = sorted[n * 90 / 100];
    stats.p95 = sorted[n * 95 / 100];
    stats.p99 = sorted[n * 99 / 100];
    stats.p999 = sorted[std::min(n - 1, n * 999 / 1000)];

    double sum = 0.0;
    for (uint64_t v : sorted) sum += static_cast<double>(v);
    stats.mean = sum / static_cast<double>(n);

    return stats;
}

} // namespace dexbook
