#include "hooks/hook_registry.hpp"
#include "core/utils.hpp"
#include <format>
#include <mutex>

namespace sqlsession {

void HookRegistry::add(HookKind kind, const DatabaseNames& names, HookCallable callable,
                       std::string label) {
    if (names.names().empty()) {
        throw ConfigurationError(std::format(
            "Hook {} registered without a database name", hook_kind_to_string(kind)));
    }

    const bool manual_callable = std::holds_alternative<ManualHook>(callable);
    if (manual_callable != is_manual(kind)) {
        throw ConfigurationError(std::format(
            "Hook {} requires a {} callable", hook_kind_to_string(kind),
            is_manual(kind) ? "session" : "statement"));
    }

    const bool empty = std::visit([](const auto& fn) { return !fn; }, callable);
    if (empty) {
        throw ConfigurationError(std::format(
            "Hook {} registered with an empty callable", hook_kind_to_string(kind)));
    }

    for (const auto& db : names.names()) {
        if (db.empty()) {
            throw ConfigurationError(std::format(
                "Hook {} registered with an empty database name", hook_kind_to_string(kind)));
        }
    }

    std::unique_lock lock(mutex_);
    for (const auto& db : names.names()) {
        hooks_[db][static_cast<size_t>(kind)].push_back(HookEntry{kind, db, label, callable});
        utils::log::debug(std::format("Registered {} hook #{} for database '{}'",
            hook_kind_to_string(kind), hooks_[db][static_cast<size_t>(kind)].size(), db));
    }
}

std::vector<HookEntry> HookRegistry::get(HookKind kind, const std::string& database) const {
    std::shared_lock lock(mutex_);
    const auto it = hooks_.find(database);
    if (it == hooks_.end()) {
        return {};
    }
    return it->second[static_cast<size_t>(kind)];
}

size_t HookRegistry::count(HookKind kind, const std::string& database) const {
    std::shared_lock lock(mutex_);
    const auto it = hooks_.find(database);
    return it == hooks_.end() ? 0 : it->second[static_cast<size_t>(kind)].size();
}

size_t HookRegistry::size() const {
    std::shared_lock lock(mutex_);
    size_t total = 0;
    for (const auto& [db, lists] : hooks_) {
        for (const auto& list : lists) {
            total += list.size();
        }
    }
    return total;
}

} // namespace sqlsession
