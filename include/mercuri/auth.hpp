#ifndef MERCURI_AUTH_HPP
#define MERCURI_AUTH_HPP

#include <cstdint>

#include "interfaces.hpp"
#include "types.hpp"

namespace mercuri {

// =============================================================================
// Roles and Operation Classes
// =============================================================================

enum class Role : uint8_t {
    DENIED = 0,
    OWNER = 1,
    MANAGER = 2
};

enum class OperationClass : uint8_t {
    DELEGATED = 0,   // Position lifecycle, fee collection, rebalance
    OWNER_ONLY = 1   // Capital movement, manager reassignment, configuration
};

const char* role_name(Role role);

// =============================================================================
// Authorizer - owner/manager gate
// =============================================================================

class Authorizer {
public:
    Authorizer(const Address& owner, const IManagerRegistry& registry);

    const Address& owner() const { return owner_; }

    // Owner unconditionally; manager only while the registry approves it
    // at the moment of the call.
    Role classify(const Address& caller, const Address& manager) const;

    // Returns the caller's role or throws VaultError(UNAUTHORIZED)
    Role authorize(OperationClass op, const Address& caller, const Address& manager) const;

private:
    Address owner_;
    const IManagerRegistry& registry_;
};

} // namespace mercuri

#endif // MERCURI_AUTH_HPP
