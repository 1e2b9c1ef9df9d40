// =============================================================================
// liquidity_engine.cpp - Simulated position manager
// =============================================================================

#include "mercuri/sim/liquidity_engine.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "mercuri/ledger.hpp"

namespace mercuri::sim {

namespace {

// Tick bounds of a concentrated-liquidity pool
constexpr int32_t MIN_TICK = -887272;
constexpr int32_t MAX_TICK = 887272;

} // namespace

SimLiquidityEngine::SimLiquidityEngine(SimChain& chain, const Address& addr)
    : chain_(chain), address_(addr) {
    chain_.attach(*this);
}

// =============================================================================
// Internal Helpers
// =============================================================================

const SimLiquidityEngine::Position& SimLiquidityEngine::find(uint64_t token_id) const {
    auto it = book_.positions.find(token_id);
    if (it == book_.positions.end()) {
        throw VaultError(errors::POSITION_NOT_FOUND, "invalid token id " + std::to_string(token_id));
    }
    return it->second;
}

SimLiquidityEngine::Position& SimLiquidityEngine::owned(const Address& sender, uint64_t token_id) {
    auto it = book_.positions.find(token_id);
    if (it == book_.positions.end()) {
        throw VaultError(errors::POSITION_NOT_FOUND, "invalid token id " + std::to_string(token_id));
    }
    if (it->second.owner != sender) {
        throw VaultError(errors::UNAUTHORIZED, "not approved for position " + std::to_string(token_id));
    }
    return it->second;
}

void SimLiquidityEngine::check_deadline(uint64_t deadline) const {
    if (chain_.now() > deadline) {
        throw VaultError(errors::DEADLINE_EXPIRED, "transaction too old");
    }
}

void SimLiquidityEngine::poke(Position& pos) {
    pos.tokens_owed0 += pos.fees_pending0;
    pos.tokens_owed1 += pos.fees_pending1;
    pos.fees_pending0 = 0;
    pos.fees_pending1 = 0;
}

TokenAmounts SimLiquidityEngine::pull(const Address& sender, const Position& pos,
                                      I128 amount0_desired, I128 amount1_desired,
                                      I128 amount0_min, I128 amount1_min) {
    if (amount0_desired < 0 || amount1_desired < 0) {
        throw VaultError(errors::INVALID_AMOUNT, "negative desired amount");
    }

    TokenAmounts used{apply_bps(amount0_desired, fill_ratio_bps_),
                      apply_bps(amount1_desired, fill_ratio_bps_)};
    if (used.amount0 < amount0_min || used.amount1 < amount1_min) {
        throw VaultError(errors::SLIPPAGE_VIOLATION, "price slippage check");
    }
    if (used.is_zero()) {
        throw VaultError(errors::INVALID_AMOUNT, "zero liquidity");
    }

    if (used.amount0 > 0) {
        chain_.token(pos.token0).transfer_from(address_, sender, address_, used.amount0);
    }
    if (used.amount1 > 0) {
        chain_.token(pos.token1).transfer_from(address_, sender, address_, used.amount1);
    }
    return used;
}

// =============================================================================
// ILiquidityEngine
// =============================================================================

MintResult SimLiquidityEngine::mint(const Address& sender, const MintParams& params) {
    check_deadline(params.deadline);

    if (!(params.token0 < params.token1)) {
        throw VaultError(errors::INVALID_REFERENCE, "tokens not sorted");
    }
    if (params.tick_lower >= params.tick_upper ||
        params.tick_lower < MIN_TICK || params.tick_upper > MAX_TICK) {
        throw VaultError(errors::INVALID_TICK_RANGE, "invalid tick range");
    }

    Position pos{};
    pos.owner = params.recipient;
    pos.token0 = params.token0;
    pos.token1 = params.token1;
    pos.fee = params.fee;
    pos.tick_lower = params.tick_lower;
    pos.tick_upper = params.tick_upper;

    TokenAmounts used = pull(sender, pos, params.amount0_desired, params.amount1_desired,
                             params.amount0_min, params.amount1_min);
    pos.principal0 = used.amount0;
    pos.principal1 = used.amount1;
    pos.liquidity = used.amount0 + used.amount1;

    uint64_t token_id = book_.next_id++;
    book_.positions[token_id] = pos;

    spdlog::debug("engine: minted position {} liquidity={}", token_id, amount::to_string(pos.liquidity));
    return {token_id, pos.liquidity, used.amount0, used.amount1};
}

IncreaseLiquidityResult SimLiquidityEngine::increase_liquidity(const Address& sender,
                                                               const IncreaseLiquidityParams& params) {
    check_deadline(params.deadline);
    Position& pos = owned(sender, params.token_id);

    TokenAmounts used = pull(sender, pos, params.amount0_desired, params.amount1_desired,
                             params.amount0_min, params.amount1_min);
    I128 added = used.amount0 + used.amount1;

    poke(pos);
    pos.principal0 += used.amount0;
    pos.principal1 += used.amount1;
    pos.liquidity += added;

    return {added, used.amount0, used.amount1};
}

TokenAmounts SimLiquidityEngine::decrease_liquidity(const Address& sender,
                                                    const DecreaseLiquidityParams& params) {
    check_deadline(params.deadline);
    Position& pos = owned(sender, params.token_id);

    if (params.liquidity <= 0 || params.liquidity > pos.liquidity) {
        throw VaultError(errors::INVALID_AMOUNT, "invalid liquidity to remove");
    }

    TokenAmounts out;
    if (params.liquidity == pos.liquidity) {
        out = {pos.principal0, pos.principal1};
    } else {
        out = {pos.principal0 * params.liquidity / pos.liquidity,
               pos.principal1 * params.liquidity / pos.liquidity};
    }
    if (out.amount0 < params.amount0_min || out.amount1 < params.amount1_min) {
        throw VaultError(errors::SLIPPAGE_VIOLATION, "price slippage check");
    }

    poke(pos);
    pos.principal0 -= out.amount0;
    pos.principal1 -= out.amount1;
    pos.liquidity -= params.liquidity;
    pos.tokens_owed0 += out.amount0;
    pos.tokens_owed1 += out.amount1;
    return out;
}

TokenAmounts SimLiquidityEngine::collect(const Address& sender, const CollectParams& params) {
    Position& pos = owned(sender, params.token_id);
    if (params.amount0_max < 0 || params.amount1_max < 0) {
        throw VaultError(errors::INVALID_AMOUNT, "negative collect maximum");
    }

    if (pos.liquidity > 0) {
        poke(pos);
    }

    TokenAmounts out{std::min(pos.tokens_owed0, params.amount0_max),
                     std::min(pos.tokens_owed1, params.amount1_max)};
    pos.tokens_owed0 -= out.amount0;
    pos.tokens_owed1 -= out.amount1;

    if (out.amount0 > 0) chain_.move_token(pos.token0, address_, params.recipient, out.amount0);
    if (out.amount1 > 0) chain_.move_token(pos.token1, address_, params.recipient, out.amount1);
    return out;
}

void SimLiquidityEngine::burn(const Address& sender, uint64_t token_id) {
    Position& pos = owned(sender, token_id);
    if (pos.liquidity != 0 || pos.tokens_owed0 != 0 || pos.tokens_owed1 != 0 ||
        pos.fees_pending0 != 0 || pos.fees_pending1 != 0) {
        throw VaultError(errors::INVALID_STATE, "position not cleared");
    }
    book_.positions.erase(token_id);
}

PositionSnapshot SimLiquidityEngine::positions(uint64_t token_id) const {
    const Position& pos = find(token_id);
    return {pos.owner, pos.token0, pos.token1, pos.fee, pos.tick_lower, pos.tick_upper,
            pos.liquidity, pos.tokens_owed0, pos.tokens_owed1};
}

// =============================================================================
// Simulation Controls
// =============================================================================

void SimLiquidityEngine::accrue_fees(uint64_t token_id, I128 fee0, I128 fee1) {
    auto it = book_.positions.find(token_id);
    if (it == book_.positions.end()) {
        throw VaultError(errors::POSITION_NOT_FOUND, "invalid token id " + std::to_string(token_id));
    }
    Position& pos = it->second;
    if (pos.liquidity == 0) {
        throw VaultError(errors::INVALID_STATE, "no liquidity to earn fees");
    }

    chain_.mint_token(pos.token0, address_, fee0);
    chain_.mint_token(pos.token1, address_, fee1);
    pos.fees_pending0 += fee0;
    pos.fees_pending1 += fee1;
}

TokenAmounts SimLiquidityEngine::pending_fees(uint64_t token_id) const {
    const Position& pos = find(token_id);
    return {pos.fees_pending0, pos.fees_pending1};
}

TokenAmounts SimLiquidityEngine::principal(uint64_t token_id) const {
    const Position& pos = find(token_id);
    return {pos.principal0, pos.principal1};
}

void SimLiquidityEngine::restore() {
    if (saved_.empty()) return;
    book_ = std::move(saved_.back());
    saved_.pop_back();
}

void SimLiquidityEngine::discard() {
    if (saved_.empty()) return;
    saved_.pop_back();
}

} // namespace mercuri::sim
