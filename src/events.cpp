// =============================================================================
// events.cpp - spdlog notification sink
// =============================================================================

#include "mercuri/events.hpp"

#include <spdlog/spdlog.h>

namespace mercuri {

void LoggingEvents::on_manager_changed(const Address& vault, const Address& manager) {
    spdlog::info("[{}] ManagerChanged manager={}", address::to_hex(vault), address::to_hex(manager));
}

void LoggingEvents::on_deposit(const Address& vault, const Currency& token, I128 amount) {
    spdlog::info("[{}] Deposit token={} amount={}", address::to_hex(vault),
                 address::to_hex(token.addr), amount::to_string(amount));
}

void LoggingEvents::on_withdraw(const Address& vault, const Currency& token,
                                const Address& to, I128 amount) {
    spdlog::info("[{}] Withdraw token={} to={} amount={}", address::to_hex(vault),
                 address::to_hex(token.addr), address::to_hex(to), amount::to_string(amount));
}

void LoggingEvents::on_native_withdraw(const Address& vault, const Address& to, I128 amount) {
    spdlog::info("[{}] NativeWithdraw to={} amount={}", address::to_hex(vault),
                 address::to_hex(to), amount::to_string(amount));
}

void LoggingEvents::on_position_closed(const Address& vault, uint64_t token_id,
                                       const TokenAmounts& principal) {
    spdlog::info("[{}] PositionClosed id={} amount0={} amount1={}", address::to_hex(vault),
                 token_id, amount::to_string(principal.amount0), amount::to_string(principal.amount1));
}

void LoggingEvents::on_performance_fee(const Address& vault, const Address& recipient,
                                       uint32_t fee_bps, const TokenAmounts& fee) {
    spdlog::info("[{}] PerformanceFeeTaken recipient={} bps={} fee0={} fee1={}",
                 address::to_hex(vault), address::to_hex(recipient), fee_bps,
                 amount::to_string(fee.amount0), amount::to_string(fee.amount1));
}

} // namespace mercuri
