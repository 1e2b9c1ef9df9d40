// =============================================================================
// swap_engine.cpp - Simulated single-hop router
// =============================================================================

#include "mercuri/sim/swap_engine.hpp"

#include <spdlog/spdlog.h>

namespace mercuri::sim {

namespace {

// Fee denominator: 1e6 (1 pip = 0.0001%)
constexpr uint32_t FEE_DENOMINATOR = 1000000;

} // namespace

SimSwapEngine::SimSwapEngine(SimChain& chain, const Address& addr)
    : chain_(chain), address_(addr) {}

void SimSwapEngine::set_rate(const Currency& token_in, const Currency& token_out,
                             I128 numerator, I128 denominator) {
    if (numerator <= 0 || denominator <= 0) {
        throw VaultError(errors::INVALID_AMOUNT, "rate must be positive");
    }
    rates_[{token_in, token_out}] = {numerator, denominator};
}

I128 SimSwapEngine::exact_input_single(const Address& sender, const ExactInputSingleParams& params) {
    if (params.amount_in <= 0) {
        throw VaultError(errors::INVALID_AMOUNT, "amount in must be positive");
    }
    if (params.fee >= FEE_DENOMINATOR) {
        throw VaultError(errors::INVALID_AMOUNT, "invalid fee tier");
    }

    auto it = rates_.find({params.token_in, params.token_out});
    if (it == rates_.end()) {
        throw VaultError(errors::INVALID_REFERENCE, "no route for token pair");
    }

    chain_.token(params.token_in).transfer_from(address_, sender, address_, params.amount_in);

    I128 net = params.amount_in - params.amount_in * params.fee / FEE_DENOMINATOR;
    I128 amount_out = net * it->second.numerator / it->second.denominator;
    if (amount_out < params.amount_out_minimum) {
        throw VaultError(errors::SLIPPAGE_VIOLATION, "too little received");
    }

    chain_.token(params.token_out).transfer(address_, params.recipient, amount_out);
    ++swap_count_;

    spdlog::debug("swap: {} in, {} out to {}", amount::to_string(params.amount_in),
                  amount::to_string(amount_out), address::to_hex(params.recipient));
    return amount_out;
}

void SimSwapEngine::refund_native(const Address& to, I128 amount) {
    if (!chain_.send(address_, to, amount)) {
        throw VaultError(errors::TRANSFER_FAILURE, "native refund refused");
    }
}

} // namespace mercuri::sim
