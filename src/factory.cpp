// =============================================================================
// factory.cpp - Vault factory and protocol fee configuration
// =============================================================================

#include "mercuri/factory.hpp"

#include <spdlog/spdlog.h>

namespace mercuri {

VaultFactory::VaultFactory(const FactoryConfig& config, const FactoryDeps& deps, IVaultEvents* events)
    : config_(config), deps_(deps), events_(events) {
    if (address::is_zero(config.address)) {
        throw VaultError(errors::CONFIGURATION_ERROR, "factory address is zero");
    }
    if (address::is_zero(config.admin)) {
        throw VaultError(errors::CONFIGURATION_ERROR, "factory admin is zero");
    }
    validate_fee(config.fee_bps, config.fee_recipient);
}

void VaultFactory::validate_fee(uint32_t fee_bps, const Address& recipient) {
    if (fee_bps > MAX_PERFORMANCE_FEE_BPS) {
        throw VaultError(errors::CONFIGURATION_ERROR,
                         "performance fee " + std::to_string(fee_bps) + " bps above ceiling");
    }
    if (address::is_zero(recipient)) {
        throw VaultError(errors::CONFIGURATION_ERROR, "fee recipient is zero");
    }
}

// =============================================================================
// Protocol Fee
// =============================================================================

ProtocolFees VaultFactory::protocol_fees() const {
    return {config_.fee_bps, config_.fee_recipient};
}

void VaultFactory::set_protocol_fee(const Address& caller, uint32_t fee_bps, const Address& recipient) {
    if (caller != config_.admin) {
        throw VaultError(errors::UNAUTHORIZED, "caller is not the factory admin");
    }
    validate_fee(fee_bps, recipient);

    config_.fee_bps = fee_bps;
    config_.fee_recipient = recipient;
    spdlog::info("factory: protocol fee set to {} bps, recipient {}", fee_bps,
                 address::to_hex(recipient));
}

// =============================================================================
// Deployment
// =============================================================================

Address VaultFactory::derive_address(uint64_t nonce) const {
    // FNV-1a over (factory address, nonce), stretched to 20 bytes
    Address out = {};
    uint64_t h = 1469598103934665603ULL;
    auto mix = [&h](uint8_t b) {
        h ^= b;
        h *= 1099511628211ULL;
    };
    for (uint8_t b : config_.address) mix(b);
    for (size_t i = 0; i < 8; ++i) mix(static_cast<uint8_t>(nonce >> (8 * i)));

    for (size_t i = 0; i < out.size(); ++i) {
        mix(static_cast<uint8_t>(i));
        out[i] = static_cast<uint8_t>(h >> 56);
    }
    return out;
}

Vault& VaultFactory::create_vault(const Address& owner, const Address& manager, const Address& pool) {
    std::optional<PoolKey> key = deps_.pools.find_pool(pool);
    if (!key) {
        throw VaultError(errors::CONFIGURATION_ERROR, "unknown pool " + address::to_hex(pool));
    }

    VaultParams params{derive_address(vaults_.size()), owner, manager, *key};
    VaultDeps deps{deps_.liquidity, deps_.swap, deps_.registry, *this, deps_.pools,
                   deps_.tokens, deps_.wrapped, deps_.native, deps_.journal};

    auto vault = std::make_unique<Vault>(params, deps, events_);
    Vault& ref = *vault;
    vaults_.push_back(std::move(vault));
    by_owner_[owner].push_back(&ref);

    spdlog::info("factory: deployed vault {} for owner {}", address::to_hex(ref.address()),
                 address::to_hex(owner));
    return ref;
}

std::vector<Vault*> VaultFactory::vaults_of(const Address& owner) const {
    auto it = by_owner_.find(owner);
    if (it == by_owner_.end()) return {};
    return it->second;
}

Vault* VaultFactory::find_vault(const Address& vault) const {
    for (const auto& v : vaults_) {
        if (v->address() == vault) return v.get();
    }
    return nullptr;
}

} // namespace mercuri
