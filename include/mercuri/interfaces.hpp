#ifndef MERCURI_INTERFACES_HPP
#define MERCURI_INTERFACES_HPP

#include <cstdint>
#include <optional>

#include "types.hpp"

namespace mercuri {

// Collaborators the vault consumes. Every call carries the calling identity
// explicitly (`sender`); rejections are raised as VaultError.

// =============================================================================
// Liquidity Engine (non-fungible position manager)
// =============================================================================

struct MintParams {
    Currency token0;
    Currency token1;
    uint32_t fee;
    int32_t tick_lower;
    int32_t tick_upper;
    I128 amount0_desired;
    I128 amount1_desired;
    I128 amount0_min;
    I128 amount1_min;
    Address recipient;
    uint64_t deadline;
};

struct MintResult {
    uint64_t token_id;
    I128 liquidity;
    I128 amount0;
    I128 amount1;
};

struct IncreaseLiquidityParams {
    uint64_t token_id;
    I128 amount0_desired;
    I128 amount1_desired;
    I128 amount0_min;
    I128 amount1_min;
    uint64_t deadline;
};

struct IncreaseLiquidityResult {
    I128 liquidity;
    I128 amount0;
    I128 amount1;
};

struct DecreaseLiquidityParams {
    uint64_t token_id;
    I128 liquidity;
    I128 amount0_min;
    I128 amount1_min;
    uint64_t deadline;
};

struct CollectParams {
    uint64_t token_id;
    Address recipient;
    I128 amount0_max;
    I128 amount1_max;
};

struct PositionSnapshot {
    Address owner;
    Currency token0;
    Currency token1;
    uint32_t fee;
    int32_t tick_lower;
    int32_t tick_upper;
    I128 liquidity;
    I128 tokens_owed0;
    I128 tokens_owed1;
};

class ILiquidityEngine {
public:
    virtual ~ILiquidityEngine() = default;

    virtual Address address() const = 0;

    virtual MintResult mint(const Address& sender, const MintParams& params) = 0;
    virtual IncreaseLiquidityResult increase_liquidity(const Address& sender,
                                                       const IncreaseLiquidityParams& params) = 0;
    // Moves principal into the position's owed balance
    virtual TokenAmounts decrease_liquidity(const Address& sender,
                                            const DecreaseLiquidityParams& params) = 0;
    virtual TokenAmounts collect(const Address& sender, const CollectParams& params) = 0;
    // Requires zero liquidity and nothing owed
    virtual void burn(const Address& sender, uint64_t token_id) = 0;

    // Throws VaultError(POSITION_NOT_FOUND) for unknown ids
    virtual PositionSnapshot positions(uint64_t token_id) const = 0;
};

// =============================================================================
// Swap Engine
// =============================================================================

struct ExactInputSingleParams {
    Currency token_in;
    Currency token_out;
    uint32_t fee;
    Address recipient;
    I128 amount_in;
    I128 amount_out_minimum;
    I128 sqrt_price_limit_x96;   // 0 = no limit
};

class ISwapEngine {
public:
    virtual ~ISwapEngine() = default;

    virtual Address address() const = 0;

    // Pulls amount_in from sender via allowance; returns amount out
    virtual I128 exact_input_single(const Address& sender, const ExactInputSingleParams& params) = 0;
};

// =============================================================================
// Live Configuration Sources
// =============================================================================

class IManagerRegistry {
public:
    virtual ~IManagerRegistry() = default;
    virtual bool is_approved(const Address& manager) const = 0;
};

struct ProtocolFees {
    uint32_t fee_bps;
    Address recipient;
};

class IFeeSource {
public:
    virtual ~IFeeSource() = default;
    virtual ProtocolFees protocol_fees() const = 0;
};

// Resolves a pool address to its token pair and fee tier
class IPoolDirectory {
public:
    virtual ~IPoolDirectory() = default;
    virtual std::optional<PoolKey> find_pool(const Address& pool) const = 0;
};

// =============================================================================
// Tokens and Native Currency
// =============================================================================

class IToken {
public:
    virtual ~IToken() = default;

    virtual Currency currency() const = 0;
    virtual I128 balance_of(const Address& holder) const = 0;
    virtual I128 allowance(const Address& holder, const Address& spender) const = 0;

    virtual void transfer(const Address& sender, const Address& to, I128 amount) = 0;
    virtual void transfer_from(const Address& spender, const Address& from,
                               const Address& to, I128 amount) = 0;
    virtual void approve(const Address& sender, const Address& spender, I128 amount) = 0;
};

class ITokenDirectory {
public:
    virtual ~ITokenDirectory() = default;
    virtual IToken& token(const Currency& currency) = 0;
};

class IWrappedNative {
public:
    virtual ~IWrappedNative() = default;

    virtual Address address() const = 0;

    // Wraps `amount` of the sender's native balance
    virtual void deposit(const Address& sender, I128 amount) = 0;
    // Unwraps and sends native currency back to the sender
    virtual void withdraw(const Address& sender, I128 amount) = 0;
};

class INativeBank {
public:
    virtual ~INativeBank() = default;

    virtual I128 balance_of(const Address& holder) const = 0;

    // Returns false when the transfer is refused (low-level call semantics)
    virtual bool send(const Address& from, const Address& to, I128 amount) = 0;
};

class INativeReceiver {
public:
    virtual ~INativeReceiver() = default;
    virtual void receive_native(const Address& sender, I128 amount) = 0;
};

// =============================================================================
// State Journal (host transaction boundary)
// =============================================================================

// begin() opens a nested level; commit()/rollback() close the innermost one.
// commit() and rollback() must not throw.
class IStateJournal {
public:
    virtual ~IStateJournal() = default;

    virtual void begin() = 0;
    virtual void commit() = 0;
    virtual void rollback() = 0;
};

} // namespace mercuri

#endif // MERCURI_INTERFACES_HPP
