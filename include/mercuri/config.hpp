#ifndef MERCURI_CONFIG_HPP
#define MERCURI_CONFIG_HPP

#include <cstdint>
#include <string>
#include <string_view>

#include <nlohmann/json_fwd.hpp>

#include "factory.hpp"
#include "types.hpp"

namespace mercuri {

// =============================================================================
// Scenario Configuration (simulated deployment)
// =============================================================================

struct MintPlan {
    int32_t tick_lower = -600;
    int32_t tick_upper = 600;
    TokenAmounts desired;
    uint32_t slippage_bps = 50;   // Minimums = desired * (1 - slippage)
};

struct ScenarioConfig {
    std::string log_level = "info";

    FactoryConfig factory;
    Address registry_admin;
    Address liquidity_engine;
    Address swap_engine;
    Address wrapped_native;

    Address owner;
    Address manager;
    PoolKey pool;
    bool unwrap_native = false;

    TokenAmounts owner_funds;     // Minted to the owner before deposit
    TokenAmounts deposit;
    MintPlan mint;
    TokenAmounts fees_earned;     // Swap income credited while active
};

// =============================================================================
// Config - JSON loading
// =============================================================================
//
// Addresses are "0x"-prefixed hex strings; amounts are decimal strings or
// integers. Invalid input throws VaultError(CONFIGURATION_ERROR).

class Config {
public:
    static FactoryConfig factory_from_json(const nlohmann::json& j);
    static ScenarioConfig scenario_from_json(const nlohmann::json& j);

    static ScenarioConfig from_json(std::string_view content);
    static ScenarioConfig from_file(std::string_view path);
};

} // namespace mercuri

#endif // MERCURI_CONFIG_HPP
