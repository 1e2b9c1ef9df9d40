// =============================================================================
// config.cpp - JSON configuration loading
// =============================================================================

#include "mercuri/config.hpp"

#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

namespace mercuri {

using json = nlohmann::json;

namespace {

[[noreturn]] void config_error(const std::string& msg) {
    throw VaultError(errors::CONFIGURATION_ERROR, msg);
}

const json& require(const json& j, const char* key) {
    if (!j.is_object() || !j.contains(key)) {
        config_error(std::string("missing config key: ") + key);
    }
    return j.at(key);
}

Address parse_address(const json& j, const char* key) {
    const json& v = require(j, key);
    if (!v.is_string()) {
        config_error(std::string(key) + " must be an address string");
    }
    return address::from_hex(v.get<std::string>());
}

Address parse_address_or(const json& j, const char* key, const Address& fallback) {
    if (!j.contains(key)) return fallback;
    return parse_address(j, key);
}

I128 parse_amount(const json& v, const char* key) {
    try {
        if (v.is_string()) return amount::from_string(v.get<std::string>());
        if (v.is_number_unsigned()) return static_cast<I128>(v.get<uint64_t>());
        if (v.is_number_integer()) return static_cast<I128>(v.get<int64_t>());
    } catch (const VaultError& e) {
        config_error(std::string(key) + ": " + e.what());
    }
    config_error(std::string(key) + " must be an integer or decimal string");
}

TokenAmounts parse_amounts(const json& j, const char* key) {
    if (!j.contains(key)) return {};
    const json& v = j.at(key);
    TokenAmounts out;
    out.amount0 = parse_amount(require(v, "amount0"), "amount0");
    out.amount1 = parse_amount(require(v, "amount1"), "amount1");
    if (out.amount0 < 0 || out.amount1 < 0) {
        config_error(std::string(key) + " amounts must not be negative");
    }
    return out;
}

template <typename T>
T parse_number(const json& j, const char* key, T fallback) {
    if (!j.contains(key)) return fallback;
    const json& v = j.at(key);
    if (!v.is_number_integer()) {
        config_error(std::string(key) + " must be an integer");
    }
    return v.get<T>();
}

} // namespace

FactoryConfig Config::factory_from_json(const json& j) {
    FactoryConfig cfg;
    cfg.address = parse_address(j, "address");
    cfg.admin = parse_address(j, "admin");
    cfg.fee_bps = parse_number<uint32_t>(j, "fee_bps", 0);
    cfg.fee_recipient = parse_address(j, "fee_recipient");

    if (cfg.fee_bps > MAX_PERFORMANCE_FEE_BPS) {
        config_error("fee_bps " + std::to_string(cfg.fee_bps) + " above ceiling");
    }
    return cfg;
}

ScenarioConfig Config::scenario_from_json(const json& j) {
    ScenarioConfig cfg;

    if (j.contains("log_level")) {
        cfg.log_level = j.at("log_level").get<std::string>();
    }

    cfg.factory = factory_from_json(require(j, "factory"));
    cfg.registry_admin = parse_address_or(j, "registry_admin", cfg.factory.admin);
    cfg.liquidity_engine = parse_address(j, "liquidity_engine");
    cfg.swap_engine = parse_address(j, "swap_engine");
    cfg.wrapped_native = parse_address(j, "wrapped_native");

    cfg.owner = parse_address(j, "owner");
    cfg.manager = parse_address_or(j, "manager", address::ZERO);
    cfg.unwrap_native = j.value("unwrap_native", false);

    const json& pool = require(j, "pool");
    cfg.pool.pool = parse_address(pool, "address");
    cfg.pool.token0 = Currency(parse_address(pool, "token0"));
    cfg.pool.token1 = Currency(parse_address(pool, "token1"));
    cfg.pool.fee = parse_number<uint32_t>(pool, "fee", fees::FEE_005);
    cfg.pool.tick_spacing = parse_number<int32_t>(pool, "tick_spacing", 10);
    if (!(cfg.pool.token0 < cfg.pool.token1)) {
        config_error("pool tokens must be distinct and sorted (token0 < token1)");
    }

    cfg.owner_funds = parse_amounts(j, "owner_funds");
    cfg.deposit = parse_amounts(j, "deposit");
    cfg.fees_earned = parse_amounts(j, "fees_earned");

    if (j.contains("mint")) {
        const json& m = j.at("mint");
        cfg.mint.tick_lower = parse_number<int32_t>(m, "tick_lower", cfg.mint.tick_lower);
        cfg.mint.tick_upper = parse_number<int32_t>(m, "tick_upper", cfg.mint.tick_upper);
        cfg.mint.slippage_bps = parse_number<uint32_t>(m, "slippage_bps", cfg.mint.slippage_bps);
        cfg.mint.desired = parse_amounts(m, "desired");
        if (cfg.mint.slippage_bps >= BPS_DENOMINATOR) {
            config_error("mint.slippage_bps must be below 10000");
        }
    }

    return cfg;
}

ScenarioConfig Config::from_json(std::string_view content) {
    json j = json::parse(content.begin(), content.end(), nullptr, false);
    if (j.is_discarded()) {
        config_error("config is not valid JSON");
    }

    try {
        return scenario_from_json(j);
    } catch (const json::exception& e) {
        config_error(std::string("config has a wrongly typed value: ") + e.what());
    }
}

ScenarioConfig Config::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        config_error("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json(buffer.str());
}

} // namespace mercuri
