#ifndef MERCURI_LEDGER_HPP
#define MERCURI_LEDGER_HPP

#include <cstdint>

#include "types.hpp"

namespace mercuri {

// =============================================================================
// FeeLedger - swap-fee income awaiting the performance fee, kept apart from
// principal
// =============================================================================
//
// accrued():        fee income collected while the position was active and
//                   not yet taxed. Nonzero only between teardown steps 1 and 2.
// principal_owed(): principal a partial decrease moved into the engine's owed
//                   balance. It is excluded from the next fee base.

class FeeLedger {
public:
    const TokenAmounts& accrued() const { return accrued_; }
    const TokenAmounts& principal_owed() const { return principal_owed_; }

    bool settled() const { return accrued_.is_zero(); }

    void record_principal(const TokenAmounts& principal);
    void clear_principal() { principal_owed_ = {}; }

    // Books the proceeds of a collect-while-active call. Recorded principal is
    // netted out first; nothing is booked unless `liquidity_before` was nonzero.
    // Returns the amount added to the fee base.
    TokenAmounts accrue(const TokenAmounts& collected, I128 liquidity_before);

    // floor(accrued * fee_bps / 10000) per token
    TokenAmounts performance_fee(uint32_t fee_bps) const;

    void clear_accrued() { accrued_ = {}; }

private:
    TokenAmounts accrued_;
    TokenAmounts principal_owed_;
};

// floor(amount * bps / 10000) without intermediate overflow
I128 apply_bps(I128 amount, uint32_t bps);

} // namespace mercuri

#endif // MERCURI_LEDGER_HPP
