// =============================================================================
// ledger.cpp - Fee/principal ledger
// =============================================================================

#include "mercuri/ledger.hpp"

#include <algorithm>

namespace mercuri {

namespace {

// Splits `collected` into (principal consumed, remainder) against `principal`
inline I128 net_of_principal(I128 collected, I128& principal) {
    I128 consumed = std::min(collected, principal);
    principal -= consumed;
    return collected - consumed;
}

} // namespace

I128 apply_bps(I128 amount, uint32_t bps) {
    if (amount <= 0 || bps == 0) return 0;
    I128 whole = amount / BPS_DENOMINATOR;
    I128 rest = amount % BPS_DENOMINATOR;
    return whole * bps + (rest * bps) / BPS_DENOMINATOR;
}

void FeeLedger::record_principal(const TokenAmounts& principal) {
    if (principal.amount0 < 0 || principal.amount1 < 0) {
        throw VaultError(errors::INVALID_AMOUNT, "negative principal");
    }
    principal_owed_ = principal_owed_ + principal;
}

TokenAmounts FeeLedger::accrue(const TokenAmounts& collected, I128 liquidity_before) {
    if (collected.amount0 < 0 || collected.amount1 < 0) {
        throw VaultError(errors::INVALID_AMOUNT, "negative collect proceeds");
    }

    TokenAmounts income{
        net_of_principal(collected.amount0, principal_owed_.amount0),
        net_of_principal(collected.amount1, principal_owed_.amount1)
    };

    // With zero liquidity the owed balance is principal, never income.
    // Accepted risk: fees left uncollected before a full decrease are
    // untaxed when the position is later closed.
    if (liquidity_before <= 0) {
        return {};
    }

    accrued_ = accrued_ + income;
    return income;
}

TokenAmounts FeeLedger::performance_fee(uint32_t fee_bps) const {
    return {apply_bps(accrued_.amount0, fee_bps), apply_bps(accrued_.amount1, fee_bps)};
}

} // namespace mercuri
