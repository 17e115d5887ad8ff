#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace dexbook {

/// Latency tracker: keeps the most recent MAX_SAMPLES samples and computes
/// percentile statistics (p50, p90, p95, p99, p99.9, max) on demand.
class LatencyTracker {
public:
    static constexpr size_t MAX_SAMPLES = 1 << 20;

    LatencyTracker() = default;

    /// Record a latency sample (nanoseconds). Overwrites the oldest once full.
    void record(uint64_t latency_ns);

    struct Stats {
        uint64_t p50 = 0;
        uint64_t p90 = 0;
        uint64_t p95 = 0;
        uint64_t p99 = 0;
        uint64_t p999 = 0;
        uint64_t max = 0;
        uint64_t min = 0;
        double mean = 0.0;
        size_t count = 0;
    };

    Stats compute_stats() const;

    size_t count() const noexcept { return samples_.size(); }
    uint64_t total_recorded() const noexcept { return recorded_; }
    void clear() noexcept { samples_.clear(); recorded_ = 0; }

private:
    std::vector<uint64_t> samples_;
    uint64_t recorded_ = 0;
};

} // namespace dexbook
