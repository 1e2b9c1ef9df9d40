// =============================================================================
// auth.cpp - Owner/manager authorization gate
// =============================================================================

#include "mercuri/auth.hpp"

#include <spdlog/spdlog.h>

namespace mercuri {

const char* role_name(Role role) {
    switch (role) {
        case Role::OWNER: return "owner";
        case Role::MANAGER: return "manager";
        case Role::DENIED: return "denied";
    }
    return "denied";
}

Authorizer::Authorizer(const Address& owner, const IManagerRegistry& registry)
    : owner_(owner), registry_(registry) {}

Role Authorizer::classify(const Address& caller, const Address& manager) const {
    if (caller == owner_) {
        return Role::OWNER;
    }

    // Registry standing is queried on every call, never cached
    if (!address::is_zero(manager) && caller == manager && registry_.is_approved(caller)) {
        return Role::MANAGER;
    }

    return Role::DENIED;
}

Role Authorizer::authorize(OperationClass op, const Address& caller, const Address& manager) const {
    if (op == OperationClass::OWNER_ONLY) {
        if (caller != owner_) {
            spdlog::warn("owner-only call rejected for {}", address::to_hex(caller));
            throw VaultError(errors::UNAUTHORIZED, "caller is not the owner");
        }
        return Role::OWNER;
    }

    Role role = classify(caller, manager);
    if (role == Role::DENIED) {
        spdlog::warn("delegated call rejected for {}", address::to_hex(caller));
        throw VaultError(errors::UNAUTHORIZED, "caller is not an authorized operator");
    }
    return role;
}

} // namespace mercuri
