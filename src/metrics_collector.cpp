#include "monitoring/metrics_collector.hpp"
#include <cstdio>
#include <fstream>

namespace dexbook {

void MetricsCollector::record_place(DexError error, size_t fill_count, bool rested) noexcept {
    fill_count_ += fill_count;
    if (error != DexError::None) {
        ++rejects_[static_cast<size_t>(error)];
        return;
    }
    ++place_count_;
    if (rested) ++rested_count_;
}

void MetricsCollector::record_cancel(DexError error) noexcept {
    if (error != DexError::None) {
        ++rejects_[static_cast<size_t>(error)];
        return;
    }
    ++cancel_count_;
}

uint64_t MetricsCollector::total_rejects() const noexcept {
    uint64_t total = 0;
    for (size_t i = 1; i < DEX_ERROR_COUNT; ++i) total += rejects_[i];
    return total;
}

void MetricsCollector::print_summary(double elapsed_seconds) const {
    printf("\n=== Order Book Report ===\n\n");

    printf("--- Throughput (%.2fs elapsed) ---\n", elapsed_seconds);
    uint64_t commands = place_count_ + cancel_count_ + total_rejects();
    printf("  Commands:       %lu", static_cast<unsigned long>(commands));
    if (elapsed_seconds > 0) {
        printf("  (%.0f cmds/sec)", static_cast<double>(commands) / elapsed_seconds);
    }
    printf("\n");
    printf("  Orders placed:  %lu (rested: %lu)\n",
           static_cast<unsigned long>(place_count_), static_cast<unsigned long>(rested_count_));
    printf("  Fills:          %lu\n", static_cast<unsigned long>(fill_count_));
    printf("  Cancels:        %lu\n", static_cast<unsigned long>(cancel_count_));
    printf("\n");

    printf("--- Rejects ---\n");
    for (size_t i = 1; i < DEX_ERROR_COUNT; ++i) {
        if (rejects_[i] == 0) continue;
        printf("  %-22s %lu\n", to_string(static_cast<DexError>(i)), static_cast<unsigned long>(rejects_[i]));
    }
    printf("\n");

    printf("--- Latency Statistics (nanoseconds) ---\n");
    printf("%-12s %10s %10s %10s %10s %10s %10s\n",
           "Command", "p50", "p90", "p95", "p99", "p99.9", "max");
    print_latency_stats("Place", place_latency_);
    print_latency_stats("Cancel", cancel_latency_);
    printf("\n");
}

void MetricsCollector::print_latency_stats(const char* name, const LatencyTracker& tracker) const {
    if (tracker.count() == 0) {
        printf("%-12s %10s %10s %10s %10s %10s %10s\n", name, "N/A", "N/A", "N/A", "N/A", "N/A", "N/A");
        return;
    }

    auto stats = tracker.compute_stats();
    printf("%-12s %10lu %10lu %10lu %10lu %10lu %10lu\n",
           name,
           static_cast<unsigned long>(stats.p50),
           static_cast<unsigned long>(stats.p90),
           static_cast<unsigned long>(stats.p95),
           static_cast<unsigned long>(stats.p99),
           static_cast<unsigned long>(stats.p999),
           static_cast<unsigned long>(stats.max));
}

bool MetricsCollector::dump_csv(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) return false;

    file << "command,p50,p90,p95,p99,p999,max,count\n";

    auto write_row = [&](const char* name, const LatencyTracker& tracker) {
        if (tracker.count() == 0) return;
        auto stats = tracker.compute_stats();
        file << name << ","
             << stats.p50 << "," << stats.p90 << "," << stats.p95 << ","
             << stats.p99 << "," << stats.p999 << "," << stats.max << ","
             << stats.count << "\n";
    };

    write_row("place", place_latency_);
    write_row("cancel", cancel_latency_);
    return file.good();
}

void MetricsCollector::reset() noexcept {
    place_latency_.clear();
    cancel_latency_.clear();
    place_count_ = 0;
    rested_count_ = 0;
    fill_count_ = 0;
    cancel_count_ = 0;
    rejects_.fill(0);
}

} // namespace dexbook
