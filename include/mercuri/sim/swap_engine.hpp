#ifndef MERCURI_SIM_SWAP_ENGINE_HPP
#define MERCURI_SIM_SWAP_ENGINE_HPP

#include <map>
#include <utility>

#include "../interfaces.hpp"
#include "../types.hpp"
#include "chain.hpp"

namespace mercuri::sim {

// =============================================================================
// SimSwapEngine - fixed-rate single-hop router over SimChain
// =============================================================================
//
// amount_out = amount_in * (1e6 - fee) / 1e6 * numerator / denominator.
// Output is paid from the engine's own token inventory.

class SimSwapEngine : public ISwapEngine {
public:
    SimSwapEngine(SimChain& chain, const Address& addr);

    Address address() const override { return address_; }

    I128 exact_input_single(const Address& sender, const ExactInputSingleParams& params) override;

    // Price of token_out per token_in as a ratio
    void set_rate(const Currency& token_in, const Currency& token_out, I128 numerator, I128 denominator);

    // Sends native currency held by the engine to `to`
    void refund_native(const Address& to, I128 amount);

    uint64_t swap_count() const { return swap_count_; }

private:
    struct Rate {
        I128 numerator;
        I128 denominator;
    };

    SimChain& chain_;
    Address address_;
    std::map<std::pair<Currency, Currency>, Rate> rates_;
    uint64_t swap_count_ = 0;
};

} // namespace mercuri::sim

#endif // MERCURI_SIM_SWAP_ENGINE_HPP
