#ifndef MERCURI_GUARD_HPP
#define MERCURI_GUARD_HPP

#include "types.hpp"

namespace mercuri {

// =============================================================================
// ReentrancyGuard - single-flight sentinel shared by a vault's entry points
// =============================================================================

class ReentrancyGuard {
public:
    ReentrancyGuard() = default;

    ReentrancyGuard(const ReentrancyGuard&) = delete;
    ReentrancyGuard& operator=(const ReentrancyGuard&) = delete;

    bool entered() const { return entered_; }

    // Holds the guard for the lifetime of one entry point call.
    // Throws VaultError(REENTRANCY) if the guard is already held.
    class Lock {
    public:
        explicit Lock(ReentrancyGuard& guard) : guard_(guard) {
            if (guard_.entered_) {
                throw VaultError(errors::REENTRANCY, "reentrant call");
            }
            guard_.entered_ = true;
        }

        ~Lock() { guard_.entered_ = false; }

        Lock(const Lock&) = delete;
        Lock& operator=(const Lock&) = delete;

    private:
        ReentrancyGuard& guard_;
    };

private:
    bool entered_{false};
};

} // namespace mercuri

#endif // MERCURI_GUARD_HPP
