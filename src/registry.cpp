// =============================================================================
// registry.cpp - Manager registry
// =============================================================================

#include "mercuri/registry.hpp"

#include <spdlog/spdlog.h>

namespace mercuri {

ManagerRegistry::ManagerRegistry(const Address& admin) : admin_(admin) {
    if (address::is_zero(admin)) {
        throw VaultError(errors::CONFIGURATION_ERROR, "registry admin is zero");
    }
}

void ManagerRegistry::set_approved(const Address& caller, const Address& manager, bool approved) {
    if (caller != admin_) {
        throw VaultError(errors::UNAUTHORIZED, "caller is not the registry admin");
    }
    if (address::is_zero(manager)) {
        throw VaultError(errors::INVALID_REFERENCE, "manager is zero");
    }

    if (approved) {
        approved_.insert(manager);
    } else {
        approved_.erase(manager);
    }
    spdlog::info("registry: manager {} approved={}", address::to_hex(manager), approved);
}

bool ManagerRegistry::is_approved(const Address& manager) const {
    return approved_.count(manager) > 0;
}

std::vector<Address> ManagerRegistry::approved_managers() const {
    return {approved_.begin(), approved_.end()};
}

} // namespace mercuri
