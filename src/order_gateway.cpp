#include "engine/order_gateway.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"

namespace dexbook {

OrderGateway::OrderGateway(OrderBook& book, MatchingEngine& engine, InputQueue& input, OutputQueue& output)
    : book_(book), engine_(engine), input_(input), output_(output)
{}

CommandReport OrderGateway::process_command(const OrderCommand& command) {
    CommandReport report{};
    report.sequence = command.sequence;
    report.type = command.type;

    Timestamp start = now_ns();
    if (command.type == CommandType::Place) {
        PlaceOutcome outcome = engine_.place(book_, command.side, command.price, command.quantity, command.party);
        report.error = outcome.error;
        report.order_id = outcome.resting_order_id;
        report.filled_quantity = outcome.filled_quantity;
        report.resting_quantity = outcome.resting_quantity;
        report.fill_count = static_cast<uint32_t>(outcome.fills.size());
        report.latency_ns = now_ns() - start;

        metrics_.place_latency().record(report.latency_ns);
        metrics_.record_place(outcome.error, outcome.fills.size(), outcome.resting_order_id != NO_ORDER);
    } else {
        report.error = engine_.cancel(book_, command.order_id, command.party);
        report.order_id = command.order_id;
        report.latency_ns = now_ns() - start;

        metrics_.cancel_latency().record(report.latency_ns);
        metrics_.record_cancel(report.error);
    }

    commands_processed_.fetch_add(1, std::memory_order_relaxed);
    return report;
}

void OrderGateway::start(int core_id) {
    if (running_.exchange(true)) return;
    thread_ = std::thread(&OrderGateway::run_loop, this, core_id);
}

void OrderGateway::stop() {
    running_.store(false, std::memory_order_relaxed);
    if (thread_.joinable()) {
        thread_.join();
    }
}

void OrderGateway::handle(const OrderCommand& command) {
    CommandReport report = process_command(command);
    if (!output_.try_push(report)) [[unlikely]] {
        reports_dropped_.fetch_add(1, std::memory_order_relaxed);
    }
}

void OrderGateway::run_loop(int core_id) {
    if (core_id >= 0 && !pin_thread_to_core(core_id)) {
        LOG_WARNF("gateway: could not pin to core %d", core_id);
    }
    LOG_INFO("gateway: consumer started");

    while (running_.load(std::memory_order_relaxed)) {
        OrderCommand command;
        if (input_.try_pop(command)) {
            handle(command);
        } else {
            std::this_thread::yield();
        }
    }

    // Drain remaining
    input_.drain([this](const OrderCommand& command) { handle(command); });
    LOG_INFOF("gateway: consumer stopped after %lu commands",
              static_cast<unsigned long>(commands_processed()));
}

} // namespace dexbook
