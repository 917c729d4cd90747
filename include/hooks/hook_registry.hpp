#pragma once

#include "core/error.hpp"
#include "session/isession.hpp"
#include "tenant/tenant_resolver.hpp"
#include <array>
#include <functional>
#include <initializer_list>
#include <shared_mutex>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace sqlsession {

/** @brief Auto hook: tenant -> statements executed verbatim, in order */
using AutoHook = std::function<std::vector<std::string>(const TenantId&)>;

/** @brief Manual hook: arbitrary work through a fresh session */
using ManualHook = std::function<void(ISession&, const TenantId&)>;

using HookCallable = std::variant<AutoHook, ManualHook>;

struct HookEntry {
    HookKind kind;
    std::string database;
    std::string label;          // optional, reported in HookExecutionError
    HookCallable callable;
};

/**
 * @brief One database name or a list of them
 */
class DatabaseNames {
public:
    DatabaseNames(const char* name) : names_{std::string(name)} {}
    DatabaseNames(std::string name) : names_{std::move(name)} {}
    DatabaseNames(std::initializer_list<std::string> names) : names_(names) {}
    DatabaseNames(std::vector<std::string> names) : names_(std::move(names)) {}

    [[nodiscard]] const std::vector<std::string>& names() const { return names_; }

private:
    std::vector<std::string> names_;
};

/**
 * @brief Ordered precreate/postcreate hooks per logical database
 *
 * Insertion order is execution order within a kind. Registering the same
 * callable twice appends it twice. Registration is expected to finish
 * before the first request for a database; a hook added after that
 * database was provisioned never runs for the existing engine.
 *
 * A manual hook must not request a session or engine for the database it
 * is provisioning. On the same manager and thread this is rejected with
 * SessionError (reported as the hook's failure); through an
 * AsyncSessionManager future it waits on its own creation and never
 * completes.
 */
class HookRegistry {
public:
    /**
     * @brief Append a hook under each name
     * @throws ConfigurationError on an empty name list/name, an empty
     *         callable, or a callable type not matching the kind
     */
    void add(HookKind kind, const DatabaseNames& names, HookCallable callable,
             std::string label = {});

    /**
     * @brief Hooks of one kind for one database, in registration order
     *        (empty when none are registered)
     */
    [[nodiscard]] std::vector<HookEntry> get(HookKind kind, const std::string& database) const;

    [[nodiscard]] size_t count(HookKind kind, const std::string& database) const;
    [[nodiscard]] size_t size() const;

    // ========================================================================
    // Registration helpers: each returns the callable unchanged
    // ========================================================================

    template <typename F>
    F register_precreate(const DatabaseNames& names, F fn, std::string label = {}) {
        add(HookKind::PRECREATE_AUTO, names, to_auto_hook(fn), std::move(label));
        return fn;
    }

    template <typename F>
    F register_precreate_manual(const DatabaseNames& names, F fn, std::string label = {}) {
        add(HookKind::PRECREATE_MANUAL, names, ManualHook(fn), std::move(label));
        return fn;
    }

    template <typename F>
    F register_postcreate(const DatabaseNames& names, F fn, std::string label = {}) {
        add(HookKind::POSTCREATE_AUTO, names, to_auto_hook(fn), std::move(label));
        return fn;
    }

    template <typename F>
    F register_postcreate_manual(const DatabaseNames& names, F fn, std::string label = {}) {
        add(HookKind::POSTCREATE_MANUAL, names, ManualHook(fn), std::move(label));
        return fn;
    }

private:
    // Accepts callables returning one statement or a list of statements
    template <typename F>
    static AutoHook to_auto_hook(const F& fn) {
        using R = std::invoke_result_t<const F&, const TenantId&>;
        if constexpr (std::is_convertible_v<R, std::string>) {
            return [fn](const TenantId& tenant) {
                return std::vector<std::string>{std::string(fn(tenant))};
            };
        } else {
            return AutoHook(fn);
        }
    }

    using KindLists = std::array<std::vector<HookEntry>, kHookKindCount>;

    std::unordered_map<std::string, KindLists> hooks_;
    mutable std::shared_mutex mutex_;
};

} // namespace sqlsession
