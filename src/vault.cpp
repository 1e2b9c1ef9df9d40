// =============================================================================
// vault.cpp - Single-position liquidity vault
// =============================================================================

#include "mercuri/vault.hpp"

#include <optional>

#include <spdlog/spdlog.h>

namespace mercuri {

namespace {

void require_config(bool ok, const char* what) {
    if (!ok) {
        throw VaultError(errors::CONFIGURATION_ERROR, what);
    }
}

inline std::string hex(const Address& a) { return address::to_hex(a); }

} // namespace

// =============================================================================
// Transaction - guard + snapshot + journal level for one entry point call
// =============================================================================

class Vault::Transaction {
public:
    explicit Transaction(Vault& vault)
        : vault_(vault), saved_(vault.state_) {
        lock_.emplace(vault_.guard_);
        vault_.deps_.journal.begin();
    }

    ~Transaction() {
        if (!committed_) {
            vault_.state_ = saved_;
            vault_.pending_.clear();
            vault_.deps_.journal.rollback();
        }
    }

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    // Notifications go out after the guard is released
    void commit() {
        if (!vault_.state_.ledger.settled()) {
            throw VaultError(errors::INVALID_STATE, "fee ledger not settled at end of call");
        }

        vault_.deps_.journal.commit();
        committed_ = true;
        lock_.reset();

        auto pending = std::move(vault_.pending_);
        vault_.pending_.clear();
        for (auto& notify : pending) {
            notify(vault_.events_);
        }
    }

private:
    Vault& vault_;
    State saved_;
    std::optional<ReentrancyGuard::Lock> lock_;
    bool committed_{false};
};

// =============================================================================
// Constructor
// =============================================================================

static NullEvents null_events;

Vault::Vault(const VaultParams& params, const VaultDeps& deps, IVaultEvents* events)
    : params_(params)
    , deps_(deps)
    , events_(events ? *events : null_events)
    , auth_(params.owner, deps.registry) {
    require_config(!address::is_zero(params.self), "vault address is zero");
    require_config(!address::is_zero(params.owner), "owner is zero");
    require_config(params.owner != params.self, "owner is the vault itself");
    require_config(!address::is_zero(params.pool.pool), "pool address is zero");
    require_config(!params.pool.token0.is_zero() && !params.pool.token1.is_zero(), "pool token is zero");
    require_config(params.pool.token0 < params.pool.token1, "pool tokens not sorted or identical");
    require_config(params.pool.fee > 0, "pool fee tier is zero");
    std::optional<PoolKey> bound = deps.pools.find_pool(params.pool.pool);
    require_config(bound.has_value(), "pool is not registered");
    require_config(*bound == params.pool, "pool key does not match the bound pool");
    require_config(!address::is_zero(deps.liquidity.address()), "liquidity engine address is zero");
    require_config(!address::is_zero(deps.swap.address()), "swap engine address is zero");
    require_config(!address::is_zero(deps.wrapped.address()), "wrapped native address is zero");

    state_.manager = params.manager;

    spdlog::info("vault {} created: owner={} manager={} pool={}", hex(params_.self),
                 hex(params_.owner), hex(params_.manager), hex(params_.pool.pool));
}

// =============================================================================
// Owner Configuration
// =============================================================================

void Vault::set_manager(const Address& caller, const Address& new_manager) {
    Transaction tx(*this);
    auth_.authorize(OperationClass::OWNER_ONLY, caller, state_.manager);

    if (new_manager == params_.owner || new_manager == params_.self) {
        throw VaultError(errors::INVALID_REFERENCE, "manager cannot be the owner or the vault");
    }

    state_.manager = new_manager;
    emit([self = params_.self, new_manager](IVaultEvents& e) {
        e.on_manager_changed(self, new_manager);
    });
    spdlog::info("vault {} manager set to {}", hex(params_.self), hex(new_manager));

    tx.commit();
}

void Vault::set_unwrap_native(const Address& caller, bool enabled) {
    Transaction tx(*this);
    auth_.authorize(OperationClass::OWNER_ONLY, caller, state_.manager);

    state_.unwrap_native = enabled;
    spdlog::debug("vault {} unwrap_native={}", hex(params_.self), enabled);

    tx.commit();
}

void Vault::deposit(const Address& caller, const Currency& token, I128 amount) {
    Transaction tx(*this);
    auth_.authorize(OperationClass::OWNER_ONLY, caller, state_.manager);

    if (!params_.pool.contains(token)) {
        throw VaultError(errors::INVALID_REFERENCE, "token is not part of the vault pair");
    }
    if (amount <= 0) {
        throw VaultError(errors::INVALID_AMOUNT, "deposit amount must be positive");
    }

    deps_.tokens.token(token).transfer_from(params_.self, params_.owner, params_.self, amount);
    emit([self = params_.self, token, amount](IVaultEvents& e) {
        e.on_deposit(self, token, amount);
    });

    tx.commit();
}

// =============================================================================
// Position Lifecycle
// =============================================================================

void Vault::require_position(uint64_t token_id) const {
    if (state_.position_id == 0) {
        throw VaultError(errors::INVALID_STATE, "no active position");
    }
    if (token_id != state_.position_id) {
        throw VaultError(errors::INVALID_REFERENCE,
                         "position " + std::to_string(token_id) + " is not the vault's position");
    }
}

void Vault::approve_exact(IToken& token, const Address& spender, I128 amount) {
    token.approve(params_.self, spender, 0);
    if (amount > 0) {
        token.approve(params_.self, spender, amount);
    }
}

MintResult Vault::mint(const Address& caller, const MintParams& params) {
    Transaction tx(*this);
    Role role = auth_.authorize(OperationClass::DELEGATED, caller, state_.manager);

    if (state_.position_id != 0) {
        throw VaultError(errors::INVALID_STATE, "vault already holds a position");
    }
    if (params.token0 != params_.pool.token0 || params.token1 != params_.pool.token1 ||
        params.fee != params_.pool.fee) {
        throw VaultError(errors::INVALID_REFERENCE, "mint does not target the vault's pool");
    }
    if (params.recipient != params_.self) {
        throw VaultError(errors::INVALID_REFERENCE, "position recipient must be the vault");
    }
    if (params.amount0_min <= 0 || params.amount1_min <= 0) {
        throw VaultError(errors::SLIPPAGE_VIOLATION, "mint requires nonzero minimum amounts");
    }

    const Address engine = deps_.liquidity.address();
    approve_exact(token0(), engine, params.amount0_desired);
    approve_exact(token1(), engine, params.amount1_desired);

    MintResult result = deps_.liquidity.mint(params_.self, params);
    if (result.token_id == 0) {
        throw VaultError(errors::INVALID_STATE, "liquidity engine returned position id 0");
    }

    approve_exact(token0(), engine, 0);
    approve_exact(token1(), engine, 0);

    state_.position_id = result.token_id;
    spdlog::info("vault {} minted position {} by {} liquidity={}", hex(params_.self),
                 result.token_id, role_name(role), amount::to_string(result.liquidity));

    tx.commit();
    return result;
}

IncreaseLiquidityResult Vault::increase_liquidity(const Address& caller,
                                                  const IncreaseLiquidityParams& params) {
    Transaction tx(*this);
    auth_.authorize(OperationClass::DELEGATED, caller, state_.manager);
    require_position(params.token_id);

    const Address engine = deps_.liquidity.address();
    approve_exact(token0(), engine, params.amount0_desired);
    approve_exact(token1(), engine, params.amount1_desired);

    IncreaseLiquidityResult result = deps_.liquidity.increase_liquidity(params_.self, params);

    approve_exact(token0(), engine, 0);
    approve_exact(token1(), engine, 0);

    spdlog::debug("vault {} increased position {} by {}", hex(params_.self), params.token_id,
                  amount::to_string(result.liquidity));

    tx.commit();
    return result;
}

TokenAmounts Vault::decrease_liquidity(const Address& caller, const DecreaseLiquidityParams& params) {
    Transaction tx(*this);
    auth_.authorize(OperationClass::DELEGATED, caller, state_.manager);
    require_position(params.token_id);

    TokenAmounts principal = deps_.liquidity.decrease_liquidity(params_.self, params);
    state_.ledger.record_principal(principal);

    spdlog::debug("vault {} decreased position {}: principal owed {} / {}", hex(params_.self),
                  params.token_id, amount::to_string(principal.amount0),
                  amount::to_string(principal.amount1));

    tx.commit();
    return principal;
}

void Vault::burn(const Address& caller, uint64_t token_id) {
    Transaction tx(*this);
    auth_.authorize(OperationClass::DELEGATED, caller, state_.manager);
    require_position(token_id);

    deps_.liquidity.burn(params_.self, token_id);
    state_.position_id = 0;
    state_.ledger.clear_principal();

    spdlog::info("vault {} burned position {}", hex(params_.self), token_id);

    tx.commit();
}

TokenAmounts Vault::collect_fees(const Address& caller, uint64_t token_id) {
    Transaction tx(*this);
    auth_.authorize(OperationClass::DELEGATED, caller, state_.manager);
    require_position(token_id);

    TokenAmounts income = collect_income(token_id);
    apply_performance_fee();

    tx.commit();
    return income;
}

TokenAmounts Vault::close_position(const Address& caller, uint64_t token_id) {
    Transaction tx(*this);
    auth_.authorize(OperationClass::DELEGATED, caller, state_.manager);
    require_position(token_id);

    TokenAmounts principal = teardown(token_id);
    finish_position(token_id, principal);

    tx.commit();
    return principal;
}

// =============================================================================
// Teardown
// =============================================================================
//
// The order below is fixed:
//   1. collect while liquidity is still in place (fee income only)
//   2. take the performance fee on that income and zero the ledger
//   3. remove all liquidity (principal moves to the owed balance)
//   4. collect again (principal, never taxed)

TokenAmounts Vault::collect_income(uint64_t token_id) {
    const I128 liquidity_before = deps_.liquidity.positions(token_id).liquidity;

    TokenAmounts collected = deps_.liquidity.collect(
        params_.self, {token_id, params_.self, I128_MAX, I128_MAX});

    TokenAmounts income = state_.ledger.accrue(collected, liquidity_before);
    spdlog::debug("vault {} collected {} / {} from position {}, fee base {} / {}",
                  hex(params_.self), amount::to_string(collected.amount0),
                  amount::to_string(collected.amount1), token_id,
                  amount::to_string(income.amount0), amount::to_string(income.amount1));
    return income;
}

TokenAmounts Vault::apply_performance_fee() {
    // Read live on every application, including a zero fee base
    ProtocolFees cfg = deps_.fees.protocol_fees();
    if (cfg.fee_bps > MAX_PERFORMANCE_FEE_BPS) {
        spdlog::warn("protocol fee {} bps above ceiling, clamped to {}", cfg.fee_bps,
                     MAX_PERFORMANCE_FEE_BPS);
        cfg.fee_bps = MAX_PERFORMANCE_FEE_BPS;
    }
    if (address::is_zero(cfg.recipient)) {
        spdlog::warn("protocol fee recipient unset, no performance fee taken");
        cfg.fee_bps = 0;
    }

    TokenAmounts fee = state_.ledger.performance_fee(cfg.fee_bps);
    if (fee.amount0 > 0) {
        token0().transfer(params_.self, cfg.recipient, fee.amount0);
    }
    if (fee.amount1 > 0) {
        token1().transfer(params_.self, cfg.recipient, fee.amount1);
    }

    state_.ledger.clear_accrued();
    emit([self = params_.self, cfg, fee](IVaultEvents& e) {
        e.on_performance_fee(self, cfg.recipient, cfg.fee_bps, fee);
    });
    return fee;
}

TokenAmounts Vault::teardown(uint64_t token_id) {
    collect_income(token_id);
    apply_performance_fee();

    // No minimum-output floor: an exit must always be possible
    const I128 liquidity = deps_.liquidity.positions(token_id).liquidity;
    if (liquidity > 0) {
        deps_.liquidity.decrease_liquidity(params_.self, {token_id, liquidity, 0, 0, NO_DEADLINE});
    }

    TokenAmounts principal = deps_.liquidity.collect(
        params_.self, {token_id, params_.self, I128_MAX, I128_MAX});
    state_.ledger.clear_principal();
    return principal;
}

void Vault::finish_position(uint64_t token_id, const TokenAmounts& principal) {
    deps_.liquidity.burn(params_.self, token_id);
    state_.position_id = 0;

    emit([self = params_.self, token_id, principal](IVaultEvents& e) {
        e.on_position_closed(self, token_id, principal);
    });
    spdlog::info("vault {} closed position {}: principal {} / {}", hex(params_.self), token_id,
                 amount::to_string(principal.amount0), amount::to_string(principal.amount1));
}

// =============================================================================
// Capital
// =============================================================================

void Vault::withdraw_all(const Address& caller) {
    Transaction tx(*this);
    auth_.authorize(OperationClass::OWNER_ONLY, caller, state_.manager);

    if (state_.position_id != 0) {
        const uint64_t token_id = state_.position_id;
        TokenAmounts principal = teardown(token_id);
        finish_position(token_id, principal);
    }

    sweep(token0());
    sweep(token1());

    tx.commit();
}

void Vault::sweep(IToken& token) {
    const I128 balance = token.balance_of(params_.self);
    if (balance <= 0) {
        return;
    }

    const Currency currency = token.currency();
    const Address to = params_.owner;

    if (currency == wrapped_native() && state_.unwrap_native) {
        deps_.wrapped.withdraw(params_.self, balance);
        if (!deps_.native.send(params_.self, to, balance)) {
            throw VaultError(errors::TRANSFER_FAILURE, "native transfer to owner failed");
        }
        emit([self = params_.self, to, balance](IVaultEvents& e) {
            e.on_native_withdraw(self, to, balance);
        });
        return;
    }

    token.transfer(params_.self, to, balance);
    emit([self = params_.self, currency, to, balance](IVaultEvents& e) {
        e.on_withdraw(self, currency, to, balance);
    });
}

// =============================================================================
// Rebalance
// =============================================================================

I128 Vault::rebalance(const Address& caller, const ExactInputSingleParams& params) {
    Transaction tx(*this);
    Role role = auth_.authorize(OperationClass::DELEGATED, caller, state_.manager);

    if (params.recipient != params_.self) {
        throw VaultError(errors::INVALID_REFERENCE, "swap recipient must be the vault");
    }
    if (!params_.pool.contains(params.token_in) || !params_.pool.contains(params.token_out) ||
        params.token_in == params.token_out) {
        throw VaultError(errors::INVALID_REFERENCE, "swap must pair the vault's two tokens");
    }
    if (params.amount_in <= 0) {
        throw VaultError(errors::INVALID_AMOUNT, "swap amount must be positive");
    }

    approve_exact(deps_.tokens.token(params.token_in), deps_.swap.address(), params.amount_in);
    I128 amount_out = deps_.swap.exact_input_single(params_.self, params);

    spdlog::info("vault {} rebalanced by {}: {} in, {} out", hex(params_.self), role_name(role),
                 amount::to_string(params.amount_in), amount::to_string(amount_out));

    tx.commit();
    return amount_out;
}

// =============================================================================
// Native Receipts
// =============================================================================

void Vault::receive_native(const Address& sender, I128 amount) {
    if (sender == deps_.wrapped.address()) {
        spdlog::debug("vault {} received {} native from unwrap", hex(params_.self),
                      amount::to_string(amount));
        return;
    }

    if (sender == deps_.swap.address()) {
        if (!params_.pool.contains(wrapped_native())) {
            throw VaultError(errors::INVALID_REFERENCE, "vault pair has no wrapped native token");
        }
        deps_.wrapped.deposit(params_.self, amount);
        spdlog::debug("vault {} re-wrapped {} native refund", hex(params_.self),
                      amount::to_string(amount));
        return;
    }

    spdlog::warn("vault {} rejected native from {}", hex(params_.self), hex(sender));
    throw VaultError(errors::UNAUTHORIZED, "unexpected native sender");
}

} // namespace mercuri
