/**
 * @file builtin_registry.cpp
 * @brief Registry of the built-in domain types
 */

#include "objfmt/domain.hpp"

namespace objfmt::cert {

Result<TypeRegistry> build_builtin_registry()
{
    TypeRegistry registry;
    if (auto registered = registry.register_type<ProtectionProfile>(); !registered) {
        return std::unexpected(registered.error());
    }
    if (auto registered = registry.register_type<MaintenanceReport>(); !registered) {
        return std::unexpected(registered.error());
    }
    if (auto registered = registry.register_type<FIPSAlgorithm>(); !registered) {
        return std::unexpected(registered.error());
    }
    return registry;
}

}  // namespace objfmt::cert
