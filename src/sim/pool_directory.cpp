// =============================================================================
// pool_directory.cpp - Simulated pool registry
// =============================================================================

#include "mercuri/sim/pool_directory.hpp"

#include <spdlog/spdlog.h>

namespace mercuri::sim {

void SimPoolDirectory::create_pool(const PoolKey& key) {
    if (address::is_zero(key.pool)) {
        throw VaultError(errors::CONFIGURATION_ERROR, "pool address is zero");
    }
    // Currencies must be sorted
    if (!(key.token0 < key.token1)) {
        throw VaultError(errors::CONFIGURATION_ERROR, "pool tokens not sorted or identical");
    }
    if (key.fee == 0 || key.tick_spacing <= 0) {
        throw VaultError(errors::CONFIGURATION_ERROR, "invalid fee tier or tick spacing");
    }
    if (pools_.count(key.pool) != 0) {
        throw VaultError(errors::CONFIGURATION_ERROR, "pool already initialized");
    }

    pools_.emplace(key.pool, key);
    spdlog::debug("sim: pool {} initialized ({} / {}, fee {})", address::to_hex(key.pool),
                  address::to_hex(key.token0.addr), address::to_hex(key.token1.addr), key.fee);
}

std::optional<PoolKey> SimPoolDirectory::find_pool(const Address& pool) const {
    auto it = pools_.find(pool);
    if (it == pools_.end()) return std::nullopt;
    return it->second;
}

} // namespace mercuri::sim
