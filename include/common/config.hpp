#pragma once

#include "common/types.hpp"
#include <string>

namespace dexbook {

struct BookConfig {
    AssetId base_asset = 1;
    AssetId quote_asset = 2;
    size_t max_orders_per_side = 1024;
};

/// Random order flow driven through the gateway by the simulator.
struct SimulationConfig {
    uint32_t num_parties = 16;
    uint64_t num_commands = 100'000;
    uint64_t seed = 42;
    Price mid_price = 10'000;
    Price price_band = 50;              // Limit prices drawn from mid +/- band
    Quantity max_order_quantity = 100;
    double cancel_ratio = 0.2;          // Share of commands that cancel a live order
    Quantity initial_base_balance = 1'000'000;
    Quantity initial_quote_balance = 10'000'000'000;
};

struct EngineConfig {
    BookConfig book;
    SimulationConfig simulation;

    // Logging
    std::string log_level = "info";
    std::string log_path;               // Empty: stderr

    // Gateway consumer thread
    int gateway_core = -1;              // -1: do not pin

    // Paths
    std::string config_path;
    std::string metrics_csv_path;
};

EngineConfig load_config(const std::string& path);
EngineConfig default_config();

/// Returns an empty string when config is usable, otherwise a description
/// of the first invalid field.
std::string validate_config(const EngineConfig& config);

} // namespace dexbook
