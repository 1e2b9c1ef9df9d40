#ifndef MERCURI_FACTORY_HPP
#define MERCURI_FACTORY_HPP

#include <cstdint>
#include <map>
#include <memory>
#include <vector>

#include "events.hpp"
#include "interfaces.hpp"
#include "types.hpp"
#include "vault.hpp"

namespace mercuri {

// =============================================================================
// Factory Configuration
// =============================================================================

struct FactoryConfig {
    Address address;          // Factory identity; vault addresses derive from it
    Address admin;            // May change the protocol fee
    uint32_t fee_bps = 0;     // Performance fee on swap income
    Address fee_recipient;
};

struct FactoryDeps {
    ILiquidityEngine& liquidity;
    ISwapEngine& swap;
    IManagerRegistry& registry;
    IPoolDirectory& pools;
    ITokenDirectory& tokens;
    IWrappedNative& wrapped;
    INativeBank& native;
    IStateJournal& journal;
};

// =============================================================================
// VaultFactory - deploys vaults and serves the global fee configuration
// =============================================================================

class VaultFactory : public IFeeSource {
public:
    // Throws VaultError(CONFIGURATION_ERROR) for an invalid config
    VaultFactory(const FactoryConfig& config, const FactoryDeps& deps, IVaultEvents* events = nullptr);
    ~VaultFactory() override = default;

    VaultFactory(const VaultFactory&) = delete;
    VaultFactory& operator=(const VaultFactory&) = delete;

    const Address& address() const { return config_.address; }
    const Address& admin() const { return config_.admin; }

    // =========================================================================
    // Protocol Fee
    // =========================================================================

    ProtocolFees protocol_fees() const override;

    // Admin only; rejects bps above MAX_PERFORMANCE_FEE_BPS and a zero recipient
    void set_protocol_fee(const Address& caller, uint32_t fee_bps, const Address& recipient);

    // =========================================================================
    // Deployment
    // =========================================================================

    // Deploys a vault for `owner` bound to `pool`; the token pair and fee tier
    // come from the pool directory. Unknown pools raise CONFIGURATION_ERROR.
    Vault& create_vault(const Address& owner, const Address& manager, const Address& pool);

    std::vector<Vault*> vaults_of(const Address& owner) const;
    Vault* find_vault(const Address& vault) const;
    size_t vault_count() const { return vaults_.size(); }

private:
    FactoryConfig config_;
    FactoryDeps deps_;
    IVaultEvents* events_;

    std::vector<std::unique_ptr<Vault>> vaults_;
    std::map<Address, std::vector<Vault*>> by_owner_;

    static void validate_fee(uint32_t fee_bps, const Address& recipient);
    Address derive_address(uint64_t nonce) const;
};

} // namespace mercuri

#endif // MERCURI_FACTORY_HPP
