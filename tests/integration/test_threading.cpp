#include <gtest/gtest.h>
#include "../fixtures/engine_fixture.hpp"
#include "common/logger.hpp"
#include "engine/order_gateway.hpp"
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace dexbook;
using dexbook::testing::EngineFixture;

class ThreadingTest : public EngineFixture {};

TEST_F(ThreadingTest, GatewaySerializesProducerStream) {
    auto input = std::make_unique<OrderGateway::InputQueue>();
    auto output = std::make_unique<OrderGateway::OutputQueue>();
    OrderGateway gateway(*book_, *engine_, *input, *output);

    Logger::instance().set_level(LogLevel::Error);
    Logger::instance().start();
    gateway.start(-1);

    constexpr uint64_t N = 20000;
    const Quantity base_supply = ledger_.total_supply(BASE);
    const Quantity quote_supply = ledger_.total_supply(QUOTE);

    std::thread producer([&]() {
        for (uint64_t i = 0; i < N; ++i) {
            OrderCommand cmd{};
            cmd.sequence = i;
            cmd.type = CommandType::Place;
            cmd.side = (i % 3 == 0) ? Side::Buy : Side::Sell;
            cmd.price = 100 + (i % 7);
            cmd.quantity = 1 + (i % 5);
            cmd.party = (i % 2 == 0) ? alice_ : bob_;
            while (!input->try_push(cmd)) {
                std::this_thread::yield();
            }
        }
    });

    std::vector<CommandReport> reports;
    reports.reserve(N);
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(30);
    while (reports.size() < N && std::chrono::steady_clock::now() < deadline) {
        CommandReport r;
        if (output->try_pop(r)) {
            reports.push_back(r);
        } else {
            std::this_thread::yield();
        }
    }

    producer.join();
    gateway.stop();
    Logger::instance().stop();

    ASSERT_EQ(reports.size(), N);
    EXPECT_EQ(gateway.reports_dropped(), 0u);
    for (uint64_t i = 0; i < N; ++i) {
        EXPECT_EQ(reports[i].sequence, i);
    }

    // The main thread only reads after stop()
    expect_not_crossed();
    expect_custody_matches_book();
    EXPECT_EQ(ledger_.total_supply(BASE), base_supply);
    EXPECT_EQ(ledger_.total_supply(QUOTE), quote_supply);
    EXPECT_EQ(gateway.metrics().places() + gateway.metrics().total_rejects(), N);
}

TEST_F(ThreadingTest, GatewayStopsCleanlyWhenIdle) {
    auto input = std::make_unique<OrderGateway::InputQueue>();
    auto output = std::make_unique<OrderGateway::OutputQueue>();
    OrderGateway gateway(*book_, *engine_, *input, *output);

    gateway.start(-1);
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    gateway.stop();
    EXPECT_EQ(gateway.commands_processed(), 0u);
    EXPECT_TRUE(output->empty());
}
