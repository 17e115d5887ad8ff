#pragma once

#include "common/types.hpp"
#include "containers/lock_free_queue.hpp"
#include "engine/matching_engine.hpp"
#include "monitoring/metrics_collector.hpp"
#include <atomic>
#include <thread>

namespace dexbook {

enum class CommandType : uint8_t {
    Place = 0,
    Cancel = 1
};

struct OrderCommand {
    uint64_t sequence;
    CommandType type;
    Side side;
    Price price;
    Quantity quantity;
    OrderId order_id;           // Cancel target
    SettlementAccount party;
};

struct CommandReport {
    uint64_t sequence;
    CommandType type;
    DexError error;
    OrderId order_id;           // Resting id for Place, target for Cancel
    Quantity filled_quantity;
    Quantity resting_quantity;
    uint32_t fill_count;
    Timestamp latency_ns;
};

/// OrderGateway: the single consumer for one book. Commands arrive on an
/// SPSC input queue, run one at a time against the book, and produce a
/// CommandReport on the output queue. Because only the consumer thread
/// touches the book, place/cancel never interleave.
class OrderGateway {
public:
    static constexpr size_t QUEUE_CAPACITY = 65536;

    using InputQueue = LockFreeRingBuffer<OrderCommand, QUEUE_CAPACITY>;
    using OutputQueue = LockFreeRingBuffer<CommandReport, QUEUE_CAPACITY>;

    OrderGateway(OrderBook& book, MatchingEngine& engine, InputQueue& input, OutputQueue& output);

    /// Run a single command on the calling thread (for tests and replay).
    CommandReport process_command(const OrderCommand& command);

    /// Start the consumer thread, pinned to core_id when core_id >= 0.
    void start(int core_id);

    /// Stop the consumer after it has drained the input queue.
    void stop();

    bool running() const noexcept { return running_.load(std::memory_order_relaxed); }
    uint64_t commands_processed() const noexcept { return commands_processed_.load(std::memory_order_relaxed); }
    uint64_t reports_dropped() const noexcept { return reports_dropped_.load(std::memory_order_relaxed); }

    /// Read only while stopped.
    const MetricsCollector& metrics() const noexcept { return metrics_; }

private:
    void run_loop(int core_id);
    void handle(const OrderCommand& command);

    OrderBook& book_;
    MatchingEngine& engine_;
    InputQueue& input_;
    OutputQueue& output_;
    MetricsCollector metrics_;

    std::atomic<bool> running_{false};
    std::thread thread_;
    std::atomic<uint64_t> commands_processed_{0};
    std::atomic<uint64_t> reports_dropped_{0};
};

} // namespace dexbook
