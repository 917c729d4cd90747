#include "config/connection_descriptor.hpp"
#include "core/utils.hpp"

#include <format>

namespace sqlsession {

std::optional<SecurityMode> parse_security_mode(std::string_view name) {
    std::string lower = utils::to_lower(std::string(name));
    for (char& c : lower) {
        if (c == '_') c = '-';
    }
    if (lower == "disable")     return SecurityMode::DISABLE;
    if (lower == "allow")       return SecurityMode::ALLOW;
    if (lower == "prefer")      return SecurityMode::PREFER;
    if (lower == "require")     return SecurityMode::REQUIRE;
    if (lower == "verify-ca")   return SecurityMode::VERIFY_CA;
    if (lower == "verify-full") return SecurityMode::VERIFY_FULL;
    return std::nullopt;
}

ConnectionDescriptor::ConnectionDescriptor(ConnectionSettings settings)
    : settings_(std::move(settings)),
      backend_(parse_database_type(settings_.backend)) {

    if (settings_.host.empty()) {
        throw ConfigurationError("Connection host is required");
    }
    if (settings_.username.empty()) {
        throw ConfigurationError("Connection username is required");
    }
    if (settings_.port == 0) {
        throw ConfigurationError("Connection port must be non-zero");
    }

    const auto& pool = settings_.pool;
    if (pool.min_connections > pool.max_connections) {
        throw ConfigurationError(std::format(
            "Pool bounds out of order: min_connections={} > max_connections={}",
            pool.min_connections, pool.max_connections));
    }
    // Also bounds concurrent checkouts when pooling is disabled
    if (pool.max_connections == 0) {
        throw ConfigurationError("Pool max_connections must be at least 1");
    }

    const auto& retry = settings_.retry;
    if (retry.max_retries < 0) {
        throw ConfigurationError(std::format(
            "Retry count must not be negative (max_retries={})", retry.max_retries));
    }
    if (retry.max_statement_retries < 0) {
        throw ConfigurationError(std::format(
            "Statement retry count must not be negative (max_statement_retries={})",
            retry.max_statement_retries));
    }
    if (retry.initial_backoff.count() < 0 || retry.max_backoff.count() < 0) {
        throw ConfigurationError("Retry backoff delays must not be negative");
    }
    if (retry.backoff == BackoffKind::EXPONENTIAL && retry.multiplier <= 0.0) {
        throw ConfigurationError("Exponential backoff multiplier must be positive");
    }
    if (settings_.connect_timeout.count() < 0) {
        throw ConfigurationError("Connect timeout must not be negative");
    }
    if (settings_.tenant_separator.empty()) {
        throw ConfigurationError("Tenant separator must not be empty");
    }
}

std::string ConnectionDescriptor::target() const {
    return std::format("{}:{}", settings_.host, settings_.port);
}

} // namespace sqlsession
