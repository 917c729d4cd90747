#pragma once

#include <optional>
#include <string>

namespace sqlsession {

/**
 * @brief Opaque tenant token; std::nullopt means "no tenant"
 */
using TenantId = std::optional<std::string>;

/**
 * @brief Maps (logical database, tenant) to the physical database name
 *
 * With a tenant the resolved name is <tenant><separator><database>
 * (default separator "__"); without one (or with an empty tenant) it is the
 * bare logical name. The resolved name keys the engine cache.
 */
class TenantResolver {
public:
    explicit TenantResolver(std::string separator = "__");

    /**
     * @throws ConfigurationError if database is empty
     */
    [[nodiscard]] std::string resolve(const std::string& database, const TenantId& tenant) const;

    [[nodiscard]] const std::string& separator() const { return separator_; }

    [[nodiscard]] static bool has_tenant(const TenantId& tenant) {
        return tenant.has_value() && !tenant->empty();
    }

private:
    std::string separator_;
};

/** @brief Tenant id for log lines ("-" when absent) */
[[nodiscard]] inline std::string tenant_label(const TenantId& tenant) {
    return TenantResolver::has_tenant(tenant) ? *tenant : std::string("-");
}

} // namespace sqlsession
