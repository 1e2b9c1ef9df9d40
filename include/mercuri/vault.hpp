#ifndef MERCURI_VAULT_HPP
#define MERCURI_VAULT_HPP

#include <cstdint>
#include <functional>
#include <utility>
#include <vector>

#include "auth.hpp"
#include "events.hpp"
#include "guard.hpp"
#include "interfaces.hpp"
#include "ledger.hpp"
#include "types.hpp"

namespace mercuri {

// =============================================================================
// Vault Configuration
// =============================================================================

enum class PositionState : uint8_t {
    EMPTY = 0,
    ACTIVE = 1
};

struct VaultParams {
    Address self;       // Address the vault holds funds under
    Address owner;      // Immutable
    Address manager;    // Zero = no delegate
    PoolKey pool;       // Immutable pool binding
};

// Collaborators are borrowed and must outlive the vault
struct VaultDeps {
    ILiquidityEngine& liquidity;
    ISwapEngine& swap;
    IManagerRegistry& registry;
    IFeeSource& fees;
    IPoolDirectory& pools;
    ITokenDirectory& tokens;
    IWrappedNative& wrapped;
    INativeBank& native;
    IStateJournal& journal;
};

// =============================================================================
// Vault - custody and lifecycle of one concentrated-liquidity position
// =============================================================================
//
// Every mutating entry point is guarded (no nested entry), authorized, and
// atomic: on any exception the vault's state, the host journal and pending
// notifications are all rolled back.

class Vault : public INativeReceiver {
public:
    // Throws VaultError(CONFIGURATION_ERROR) for an invalid setup, including a
    // pool key that does not match the pool directory's record
    Vault(const VaultParams& params, const VaultDeps& deps, IVaultEvents* events = nullptr);
    ~Vault() override = default;

    // Non-copyable
    Vault(const Vault&) = delete;
    Vault& operator=(const Vault&) = delete;

    // =========================================================================
    // Queries
    // =========================================================================

    const Address& address() const { return params_.self; }
    const Address& owner() const { return params_.owner; }
    const Address& manager() const { return state_.manager; }
    const PoolKey& pool() const { return params_.pool; }
    Currency wrapped_native() const { return Currency(deps_.wrapped.address()); }

    uint64_t position_id() const { return state_.position_id; }
    PositionState state() const {
        return state_.position_id == 0 ? PositionState::EMPTY : PositionState::ACTIVE;
    }

    const TokenAmounts& accrued_fees() const { return state_.ledger.accrued(); }
    const TokenAmounts& principal_owed() const { return state_.ledger.principal_owed(); }
    bool unwrap_native() const { return state_.unwrap_native; }

    // Live classification (queries the registry)
    Role role_of(const Address& caller) const { return auth_.classify(caller, state_.manager); }

    // =========================================================================
    // Owner Configuration
    // =========================================================================

    void set_manager(const Address& caller, const Address& new_manager);
    void set_unwrap_native(const Address& caller, bool enabled);

    // Pulls `amount` of token0/token1 from the owner (requires allowance)
    void deposit(const Address& caller, const Currency& token, I128 amount);

    // =========================================================================
    // Position Lifecycle (owner or approved manager)
    // =========================================================================

    MintResult mint(const Address& caller, const MintParams& params);
    IncreaseLiquidityResult increase_liquidity(const Address& caller,
                                               const IncreaseLiquidityParams& params);
    // Principal moved to the owed balance is recorded so it is never fee-taxed
    TokenAmounts decrease_liquidity(const Address& caller, const DecreaseLiquidityParams& params);
    void burn(const Address& caller, uint64_t token_id);

    // Collect-while-active plus performance fee; proceeds stay in the vault.
    // Returns the fee base booked by this call.
    TokenAmounts collect_fees(const Address& caller, uint64_t token_id);

    // Full teardown and burn. Returns the untaxed principal collected.
    TokenAmounts close_position(const Address& caller, uint64_t token_id);

    // =========================================================================
    // Capital (owner only)
    // =========================================================================

    // Tears down any active position, then sweeps both tokens to the owner
    void withdraw_all(const Address& caller);

    // =========================================================================
    // Rebalance (owner or approved manager)
    // =========================================================================

    I128 rebalance(const Address& caller, const ExactInputSingleParams& params);

    // =========================================================================
    // Native Receipts
    // =========================================================================

    // Accepts unwraps from the wrapped-native contract and refunds from the
    // swap engine (re-wrapped); rejects everything else.
    void receive_native(const Address& sender, I128 amount) override;

private:
    class Transaction;

    struct State {
        Address manager;
        uint64_t position_id = 0;
        FeeLedger ledger;
        bool unwrap_native = false;
    };

    VaultParams params_;
    VaultDeps deps_;
    IVaultEvents& events_;
    Authorizer auth_;
    ReentrancyGuard guard_;
    State state_;

    // Notifications raised by the in-flight call, delivered on commit
    std::vector<std::function<void(IVaultEvents&)>> pending_;

    IToken& token0() { return deps_.tokens.token(params_.pool.token0); }
    IToken& token1() { return deps_.tokens.token(params_.pool.token1); }

    void emit(std::function<void(IVaultEvents&)> notify) { pending_.push_back(std::move(notify)); }

    void require_position(uint64_t token_id) const;
    void approve_exact(IToken& token, const Address& spender, I128 amount);

    // Teardown steps
    TokenAmounts collect_income(uint64_t token_id);
    TokenAmounts apply_performance_fee();
    TokenAmounts teardown(uint64_t token_id);
    void finish_position(uint64_t token_id, const TokenAmounts& principal);

    void sweep(IToken& token);
};

} // namespace mercuri

#endif // MERCURI_VAULT_HPP
