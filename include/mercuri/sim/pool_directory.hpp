#ifndef MERCURI_SIM_POOL_DIRECTORY_HPP
#define MERCURI_SIM_POOL_DIRECTORY_HPP

#include <map>
#include <optional>

#include "../interfaces.hpp"
#include "../types.hpp"

namespace mercuri::sim {

// =============================================================================
// SimPoolDirectory - registry of initialized pools
// =============================================================================

class SimPoolDirectory : public IPoolDirectory {
public:
    // Registers a pool; throws VaultError(CONFIGURATION_ERROR) for an invalid
    // key or an address already in use
    void create_pool(const PoolKey& key);

    std::optional<PoolKey> find_pool(const Address& pool) const override;

    size_t pool_count() const { return pools_.size(); }

private:
    std::map<Address, PoolKey> pools_;
};

} // namespace mercuri::sim

#endif // MERCURI_SIM_POOL_DIRECTORY_HPP
