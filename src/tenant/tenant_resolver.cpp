#include "tenant/tenant_resolver.hpp"
#include "core/error.hpp"

namespace sqlsession {

TenantResolver::TenantResolver(std::string separator)
    : separator_(std::move(separator)) {
    if (separator_.empty()) {
        throw ConfigurationError("Tenant separator must not be empty");
    }
}

std::string TenantResolver::resolve(const std::string& database, const TenantId& tenant) const {
    if (database.empty()) {
        throw ConfigurationError("Database name must not be empty");
    }
    if (!has_tenant(tenant)) {
        return database;
    }
    std::string resolved;
    resolved.reserve(tenant->size() + separator_.size() + database.size());
    resolved += *tenant;
    resolved += separator_;
    resolved += database;
    return resolved;
}

} // namespace sqlsession
