#pragma once

#include "common/errors.hpp"
#include "monitoring/latency_tracker.hpp"
#include <array>
#include <cstdint>
#include <string>

namespace dexbook {

/// Counters and latency distributions for one book's command stream.
class MetricsCollector {
public:
    MetricsCollector() { rejects_.fill(0); }

    LatencyTracker& place_latency() { return place_latency_; }
    LatencyTracker& cancel_latency() { return cancel_latency_; }
    const LatencyTracker& place_latency() const { return place_latency_; }
    const LatencyTracker& cancel_latency() const { return cancel_latency_; }

    void record_place(DexError error, size_t fill_count, bool rested) noexcept;
    void record_cancel(DexError error) noexcept;

    uint64_t places() const noexcept { return place_count_; }
    uint64_t rested() const noexcept { return rested_count_; }
    uint64_t fills() const noexcept { return fill_count_; }
    uint64_t cancels() const noexcept { return cancel_count_; }
    uint64_t rejects(DexError error) const noexcept { return rejects_[static_cast<size_t>(error)]; }
    uint64_t total_rejects() const noexcept;

    void print_summary(double elapsed_seconds) const;

    /// Returns false if the file cannot be written.
    bool dump_csv(const std::string& path) const;

    void reset() noexcept;

private:
    void print_latency_stats(const char* name, const LatencyTracker& tracker) const;

    LatencyTracker place_latency_;
    LatencyTracker cancel_latency_;

    uint64_t place_count_ = 0;
    uint64_t rested_count_ = 0;
    uint64_t fill_count_ = 0;
    uint64_t cancel_count_ = 0;
    std::array<uint64_t, DEX_ERROR_COUNT> rejects_;
};

} // namespace dexbook
