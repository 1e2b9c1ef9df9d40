#ifndef MERCURI_REGISTRY_HPP
#define MERCURI_REGISTRY_HPP

#include <set>
#include <vector>

#include "interfaces.hpp"
#include "types.hpp"

namespace mercuri {

// =============================================================================
// ManagerRegistry - advisory list of protocol-approved managers
// =============================================================================

class ManagerRegistry : public IManagerRegistry {
public:
    // Throws VaultError(CONFIGURATION_ERROR) for a zero admin
    explicit ManagerRegistry(const Address& admin);

    const Address& admin() const { return admin_; }

    // Admin only
    void set_approved(const Address& caller, const Address& manager, bool approved);

    bool is_approved(const Address& manager) const override;

    std::vector<Address> approved_managers() const;

private:
    Address admin_;
    std::set<Address> approved_;
};

} // namespace mercuri

#endif // MERCURI_REGISTRY_HPP
