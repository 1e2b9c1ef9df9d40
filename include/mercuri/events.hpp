#ifndef MERCURI_EVENTS_HPP
#define MERCURI_EVENTS_HPP

#include <cstdint>

#include "types.hpp"

namespace mercuri {

// =============================================================================
// Vault Notifications
// =============================================================================

// Delivered only after the operation that raised them has committed.
class IVaultEvents {
public:
    virtual ~IVaultEvents() = default;

    virtual void on_manager_changed(const Address& vault, const Address& manager) {}
    virtual void on_deposit(const Address& vault, const Currency& token, I128 amount) {}
    virtual void on_withdraw(const Address& vault, const Currency& token,
                             const Address& to, I128 amount) {}
    virtual void on_native_withdraw(const Address& vault, const Address& to, I128 amount) {}
    virtual void on_position_closed(const Address& vault, uint64_t token_id,
                                    const TokenAmounts& principal) {}
    virtual void on_performance_fee(const Address& vault, const Address& recipient,
                                    uint32_t fee_bps, const TokenAmounts& fee) {}
};

// No-op sink
class NullEvents : public IVaultEvents {};

// Writes every notification to the spdlog default logger
class LoggingEvents : public IVaultEvents {
public:
    void on_manager_changed(const Address& vault, const Address& manager) override;
    void on_deposit(const Address& vault, const Currency& token, I128 amount) override;
    void on_withdraw(const Address& vault, const Currency& token,
                     const Address& to, I128 amount) override;
    void on_native_withdraw(const Address& vault, const Address& to, I128 amount) override;
    void on_position_closed(const Address& vault, uint64_t token_id,
                            const TokenAmounts& principal) override;
    void on_performance_fee(const Address& vault, const Address& recipient,
                            uint32_t fee_bps, const TokenAmounts& fee) override;
};

} // namespace mercuri

#endif // MERCURI_EVENTS_HPP
