#ifndef MERCURI_SIM_LIQUIDITY_ENGINE_HPP
#define MERCURI_SIM_LIQUIDITY_ENGINE_HPP

#include <cstdint>
#include <map>
#include <vector>

#include "../interfaces.hpp"
#include "../types.hpp"
#include "chain.hpp"

namespace mercuri::sim {

// =============================================================================
// SimLiquidityEngine - non-fungible position manager over SimChain
// =============================================================================
//
// Liquidity units equal the principal supplied (amount0 + amount1). Swap fees
// accrue as pending income and move into the owed balance when the position
// is poked (collect, decrease), mirroring a concentrated-liquidity pool.

class SimLiquidityEngine : public ILiquidityEngine, public Journaled {
public:
    SimLiquidityEngine(SimChain& chain, const Address& addr);

    Address address() const override { return address_; }

    MintResult mint(const Address& sender, const MintParams& params) override;
    IncreaseLiquidityResult increase_liquidity(const Address& sender,
                                               const IncreaseLiquidityParams& params) override;
    TokenAmounts decrease_liquidity(const Address& sender,
                                    const DecreaseLiquidityParams& params) override;
    TokenAmounts collect(const Address& sender, const CollectParams& params) override;
    void burn(const Address& sender, uint64_t token_id) override;
    PositionSnapshot positions(uint64_t token_id) const override;

    // =========================================================================
    // Simulation Controls
    // =========================================================================

    // Credits swap-fee income to an active position
    void accrue_fees(uint64_t token_id, I128 fee0, I128 fee1);

    // Share of the desired amounts a mint/increase actually consumes
    void set_fill_ratio_bps(uint32_t bps) { fill_ratio_bps_ = bps; }

    bool exists(uint64_t token_id) const { return book_.positions.count(token_id) > 0; }
    size_t position_count() const { return book_.positions.size(); }
    TokenAmounts pending_fees(uint64_t token_id) const;
    TokenAmounts principal(uint64_t token_id) const;

    // Journaled
    void save() override { saved_.push_back(book_); }
    void restore() override;
    void discard() override;

private:
    struct Position {
        Address owner;
        Currency token0;
        Currency token1;
        uint32_t fee;
        int32_t tick_lower;
        int32_t tick_upper;
        I128 liquidity;
        I128 principal0;
        I128 principal1;
        I128 fees_pending0;
        I128 fees_pending1;
        I128 tokens_owed0;
        I128 tokens_owed1;
    };

    struct Book {
        std::map<uint64_t, Position> positions;
        uint64_t next_id = 1;
    };

    SimChain& chain_;
    Address address_;
    uint32_t fill_ratio_bps_ = BPS_DENOMINATOR;

    Book book_;
    std::vector<Book> saved_;

    const Position& find(uint64_t token_id) const;
    Position& owned(const Address& sender, uint64_t token_id);
    void check_deadline(uint64_t deadline) const;
    TokenAmounts pull(const Address& sender, const Position& pos,
                      I128 amount0_desired, I128 amount1_desired,
                      I128 amount0_min, I128 amount1_min);

    static void poke(Position& pos);
};

} // namespace mercuri::sim

#endif // MERCURI_SIM_LIQUIDITY_ENGINE_HPP
