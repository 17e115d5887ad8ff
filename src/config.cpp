#include "common/config.hpp"
#include <cstdint>
#include <fstream>
#include <iterator>
#include <stdexcept>

namespace dexbook {

// Flat JSON reader: {"key": number, "key": "string", ...}. Nested objects are
// not interpreted; every key is looked up by name anywhere in the file.
namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\n\r");
    return s.substr(start, end - start + 1);
}

} // anonymous namespace

EngineConfig default_config() {
    return EngineConfig{};
}

EngineConfig load_config(const std::string& path) {
    EngineConfig config = default_config();

    std::ifstream file(path);
    if (!file.is_open()) {
        return config; // Defaults if file not found
    }

    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());

    auto extract_value = [&](const std::string& key) -> std::string {
        std::string search_key = "\"" + key + "\"";
        size_t pos = content.find(search_key);
        if (pos == std::string::npos) return "";
        pos = content.find(':', pos + search_key.size());
        if (pos == std::string::npos) return "";
        pos++;
        while (pos < content.size() && (content[pos] == ' ' || content[pos] == '\t')) pos++;
        if (pos >= content.size()) return "";

        if (content[pos] == '"') {
            size_t end = content.find('"', pos + 1);
            if (end == std::string::npos) return "";
            return content.substr(pos + 1, end - pos - 1);
        }

        size_t end = content.find_first_of(",}\n", pos);
        if (end == std::string::npos) end = content.size();
        return trim(content.substr(pos, end - pos));
    };

    // Malformed numbers keep the default
    auto try_uint64 = [&](const std::string& key, uint64_t& target) {
        std::string val = extract_value(key);
        if (val.empty()) return;
        try {
            size_t used = 0;
            unsigned long long parsed = std::stoull(val, &used);
            if (used == val.size() && val[0] != '-') target = parsed;
        } catch (const std::exception&) {
        }
    };

    auto try_uint32 = [&](const std::string& key, uint32_t& target) {
        uint64_t v = target;
        try_uint64(key, v);
        if (v <= UINT32_MAX) target = static_cast<uint32_t>(v);
    };

    auto try_size = [&](const std::string& key, size_t& target) {
        uint64_t v = target;
        try_uint64(key, v);
        target = static_cast<size_t>(v);
    };

    auto try_int = [&](const std::string& key, int& target) {
        std::string val = extract_value(key);
        if (val.empty()) return;
        try {
            target = std::stoi(val);
        } catch (const std::exception&) {
        }
    };

    auto try_double = [&](const std::string& key, double& target) {
        std::string val = extract_value(key);
        if (val.empty()) return;
        try {
            target = std::stod(val);
        } catch (const std::exception&) {
        }
    };

    auto try_string = [&](const std::string& key, std::string& target) {
        std::string val = extract_value(key);
        if (!val.empty()) target = val;
    };

    // Book
    try_uint32("base_asset", config.book.base_asset);
    try_uint32("quote_asset", config.book.quote_asset);
    try_size("max_orders_per_side", config.book.max_orders_per_side);

    // Simulation
    try_uint32("num_parties", config.simulation.num_parties);
    try_uint64("num_commands", config.simulation.num_commands);
    try_uint64("seed", config.simulation.seed);
    try_uint64("mid_price", config.simulation.mid_price);
    try_uint64("price_band", config.simulation.price_band);
    try_uint64("max_order_quantity", config.simulation.max_order_quantity);
    try_double("cancel_ratio", config.simulation.cancel_ratio);
    try_uint64("initial_base_balance", config.simulation.initial_base_balance);
    try_uint64("initial_quote_balance", config.simulation.initial_quote_balance);

    // Logging / runtime
    try_string("log_level", config.log_level);
    try_string("log_path", config.log_path);
    try_int("gateway_core", config.gateway_core);
    try_string("metrics_csv_path", config.metrics_csv_path);

    config.config_path = path;
    return config;
}

std::string validate_config(const EngineConfig& config) {
    if (config.book.base_asset == config.book.quote_asset) {
        return "base_asset and quote_asset must differ";
    }
    if (config.book.max_orders_per_side == 0) {
        return "max_orders_per_side must be positive";
    }
    if (config.book.max_orders_per_side > (1u << 30)) {
        return "max_orders_per_side too large";
    }
    if (config.log_level != "debug" && config.log_level != "info" &&
        config.log_level != "warn" && config.log_level != "error") {
        return "log_level must be one of debug, info, warn, error";
    }

    const SimulationConfig& sim = config.simulation;
    if (sim.num_parties < 2) {
        return "num_parties must be at least 2";
    }
    if (sim.max_order_quantity == 0) {
        return "max_order_quantity must be positive";
    }
    if (sim.price_band >= sim.mid_price) {
        return "price_band must be below mid_price";
    }
    if (sim.cancel_ratio < 0.0 || sim.cancel_ratio > 1.0) {
        return "cancel_ratio must be within [0, 1]";
    }
    return "";
}

} // namespace dexbook
