#include <benchmark/benchmark.h>
#include "engine/event_sink.hpp"
#include "engine/matching_engine.hpp"
#include "settlement/in_memory_ledger.hpp"
#include <memory>

using namespace dexbook;

namespace {

/// Drops every event so the benchmark measures matching, not recording.
class NullSink : public EventSink {
public:
    void publish(const TradeEvent& event) override { benchmark::DoNotOptimize(event); }
};

struct Market {
    Market() {
        params.base_asset = 1;
        params.quote_asset = 2;
        params.base_custody = ledger.open_account(0, 1);
        params.quote_custody = ledger.open_account(0, 2);
        params.max_orders_per_side = 4096;
        book = std::make_unique<OrderBook>(params);
        engine = std::make_unique<MatchingEngine>(ledger, ledger, sink);

        maker = ledger.open_party(1, 1, 2);
        taker = ledger.open_party(2, 1, 2);
        ledger.deposit(maker.base_account, 1'000'000'000'000ULL);
        ledger.deposit(maker.quote_account, 1'000'000'000'000ULL);
        ledger.deposit(taker.base_account, 1'000'000'000'000ULL);
        ledger.deposit(taker.quote_account, 1'000'000'000'000ULL);
    }

    InMemoryLedger ledger;
    NullSink sink;
    BookParams params;
    std::unique_ptr<OrderBook> book;
    std::unique_ptr<MatchingEngine> engine;
    SettlementAccount maker;
    SettlementAccount taker;
};

} // anonymous namespace

static void BM_PlaceAndCancelResting(benchmark::State& state) {
    Market m;
    for (auto _ : state) {
        PlaceOutcome out = m.engine->place(*m.book, Side::Buy, 10000, 10, m.taker);
        m.engine->cancel(*m.book, out.resting_order_id, m.taker);
    }
}
BENCHMARK(BM_PlaceAndCancelResting);

static void BM_SingleFill(benchmark::State& state) {
    Market m;
    for (auto _ : state) {
        state.PauseTiming();
        m.engine->place(*m.book, Side::Sell, 10000, 10, m.maker);
        state.ResumeTiming();
        PlaceOutcome out = m.engine->place(*m.book, Side::Buy, 10000, 10, m.taker);
        benchmark::DoNotOptimize(out);
    }
}
BENCHMARK(BM_SingleFill);

static void BM_SweepLevels(benchmark::State& state) {
    Market m;
    const auto levels = static_cast<Price>(state.range(0));
    for (auto _ : state) {
        state.PauseTiming();
        for (Price p = 0; p < levels; ++p) {
            m.engine->place(*m.book, Side::Sell, 10000 + p, 10, m.maker);
        }
        state.ResumeTiming();
        PlaceOutcome out = m.engine->place(*m.book, Side::Buy, 10000 + levels, 10 * levels, m.taker);
        benchmark::DoNotOptimize(out);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_SweepLevels)->Arg(1)->Arg(10)->Arg(100);

BENCHMARK_MAIN();
