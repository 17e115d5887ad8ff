#include "common/types.hpp"
#include "common/config.hpp"
#include "common/logger.hpp"
#include "engine/event_sink.hpp"
#include "engine/matching_engine.hpp"
#include "engine/order_gateway.hpp"
#include "order_book/order_book.hpp"
#include "settlement/in_memory_ledger.hpp"

#include <csignal>
#include <cstdio>
#include <atomic>
#include <chrono>
#include <memory>
#include <random>
#include <thread>
#include <vector>

namespace {
    std::atomic<bool> g_running{true};

    void signal_handler(int) {
        g_running.store(false, std::memory_order_relaxed);
    }

    constexpr dexbook::PartyId BOOK_OWNER = 0;
}

int main(int argc, char* argv[]) {
    using namespace dexbook;

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    // --- Load config ---
    EngineConfig config;
    if (argc > 1) {
        config = load_config(argv[1]);
        printf("Loaded config from: %s\n", argv[1]);
    } else {
        config = default_config();
        printf("Using default configuration\n");
    }

    std::string invalid = validate_config(config);
    if (!invalid.empty()) {
        fprintf(stderr, "Invalid configuration: %s\n", invalid.c_str());
        return 1;
    }

    // --- Logger ---
    if (!config.log_path.empty() && !Logger::instance().open_file(config.log_path)) {
        fprintf(stderr, "Cannot open log file %s, logging to stderr\n", config.log_path.c_str());
    }
    Logger::instance().set_level(parse_log_level(config.log_level));
    Logger::instance().start();
    LOG_INFO("dexbook simulator starting");

    const SimulationConfig& sim = config.simulation;
    const AssetId base = config.book.base_asset;
    const AssetId quote = config.book.quote_asset;

    // --- Ledger, custody and parties ---
    InMemoryLedger ledger;
    BookParams params;
    params.base_asset = base;
    params.quote_asset = quote;
    params.base_custody = ledger.open_account(BOOK_OWNER, base);
    params.quote_custody = ledger.open_account(BOOK_OWNER, quote);
    params.max_orders_per_side = config.book.max_orders_per_side;

    std::vector<SettlementAccount> parties;
    parties.reserve(sim.num_parties);
    for (uint32_t i = 0; i < sim.num_parties; ++i) {
        SettlementAccount party = ledger.open_party(static_cast<PartyId>(i + 1), base, quote);
        if (ledger.deposit(party.base_account, sim.initial_base_balance) != TransferStatus::Ok ||
            ledger.deposit(party.quote_account, sim.initial_quote_balance) != TransferStatus::Ok) {
            fprintf(stderr, "Failed to fund party %u\n", i + 1);
            Logger::instance().stop();
            return 1;
        }
        parties.push_back(party);
    }
    const Quantity base_supply = ledger.total_supply(base);
    const Quantity quote_supply = ledger.total_supply(quote);

    OrderBook book(params);
    TradeRecorder trades;
    MatchingEngine engine(ledger, ledger, trades);

    auto input_ptr = std::make_unique<OrderGateway::InputQueue>();
    auto output_ptr = std::make_unique<OrderGateway::OutputQueue>();
    auto& input = *input_ptr;
    auto& output = *output_ptr;
    OrderGateway gateway(book, engine, input, output);

    printf("\n=== dexbook simulator ===\n");
    printf("  Pair:            base %u / quote %u\n", base, quote);
    printf("  Parties:         %u\n", sim.num_parties);
    printf("  Commands:        %lu (cancel ratio %.2f)\n",
           static_cast<unsigned long>(sim.num_commands), sim.cancel_ratio);
    printf("  Capacity/side:   %zu\n\n", params.max_orders_per_side);

    // --- Drive random order flow ---
    std::mt19937_64 rng(sim.seed);
    std::uniform_int_distribution<uint32_t> party_dist(0, sim.num_parties - 1);
    std::uniform_int_distribution<Price> price_dist(sim.mid_price - sim.price_band, sim.mid_price + sim.price_band);
    std::uniform_int_distribution<Quantity> qty_dist(1, sim.max_order_quantity);
    std::uniform_real_distribution<double> unit(0.0, 1.0);

    struct LiveOrder {
        OrderId id;
        uint32_t party;
    };
    std::vector<LiveOrder> live;
    std::vector<uint32_t> party_of_sequence;
    party_of_sequence.reserve(sim.num_commands);
    uint64_t reports = 0;

    auto collect_reports = [&]() {
        output.drain([&](const CommandReport& report) {
            ++reports;
            if (report.type == CommandType::Place && report.error == DexError::None &&
                report.order_id != NO_ORDER) {
                live.push_back({report.order_id, party_of_sequence[report.sequence]});
            }
        });
    };

    auto start_time = std::chrono::steady_clock::now();
    gateway.start(config.gateway_core);

    for (uint64_t seq = 0; seq < sim.num_commands && g_running.load(std::memory_order_relaxed); ++seq) {
        OrderCommand cmd{};
        cmd.sequence = seq;

        if (!live.empty() && unit(rng) < sim.cancel_ratio) {
            size_t idx = rng() % live.size();
            LiveOrder target = live[idx];
            live[idx] = live.back();
            live.pop_back();
            cmd.type = CommandType::Cancel;
            cmd.order_id = target.id;
            cmd.party = parties[target.party];
            party_of_sequence.push_back(target.party);
        } else {
            uint32_t p = party_dist(rng);
            cmd.type = CommandType::Place;
            cmd.side = (rng() & 1) ? Side::Buy : Side::Sell;
            cmd.price = price_dist(rng);
            cmd.quantity = qty_dist(rng);
            cmd.party = parties[p];
            party_of_sequence.push_back(p);
        }

        while (!input.try_push(cmd)) {
            collect_reports();
            std::this_thread::yield();
        }
        collect_reports();
    }

    gateway.stop();
    collect_reports();

    auto end_time = std::chrono::steady_clock::now();
    double elapsed = std::chrono::duration<double>(end_time - start_time).count();

    // --- Conservation check: custody holds exactly the resting reservations ---
    Quantity locked_quote = 0;
    Quantity locked_base = 0;
    for (const Order& o : book.orders(Side::Buy)) locked_quote += o.price * o.quantity;
    for (const Order& o : book.orders(Side::Sell)) locked_base += o.quantity;

    bool conserved = ledger.total_supply(base) == base_supply &&
                     ledger.total_supply(quote) == quote_supply &&
                     ledger.balance(params.base_custody) == locked_base &&
                     ledger.balance(params.quote_custody) == locked_quote;

    if (!conserved) {
        LOG_ERROR("conservation check failed");
    }
    LOG_INFO("dexbook simulator finished");
    Logger::instance().stop();

    // --- Report ---
    gateway.metrics().print_summary(elapsed);

    printf("--- Book ---\n");
    auto bid = book.best_bid();
    auto ask = book.best_ask();
    printf("  Best bid:        %s%lu\n", bid ? "" : "none ", static_cast<unsigned long>(bid.value_or(0)));
    printf("  Best ask:        %s%lu\n", ask ? "" : "none ", static_cast<unsigned long>(ask.value_or(0)));
    printf("  Resting orders:  %zu bids / %zu asks\n", book.order_count(Side::Buy), book.order_count(Side::Sell));
    printf("  Last order id:   %lu\n", static_cast<unsigned long>(book.last_order_id()));
    printf("  Trades:          %zu (%lu base units)\n", trades.size(),
           static_cast<unsigned long>(trades.total_quantity()));
    printf("  Reports:         %lu (dropped %lu)\n", static_cast<unsigned long>(reports),
           static_cast<unsigned long>(gateway.reports_dropped()));
    printf("  Conservation:    %s\n", conserved ? "OK" : "VIOLATED");

    if (!config.metrics_csv_path.empty() && !gateway.metrics().dump_csv(config.metrics_csv_path)) {
        fprintf(stderr, "Cannot write metrics to %s\n", config.metrics_csv_path.c_str());
    }

    printf("\nSimulation complete.\n");
    return conserved ? 0 : 1;
}
