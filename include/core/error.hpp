#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace sqlsession {

/**
 * @brief Orchestration states of one get_session / get_engine request
 *
 * Transitions are strictly sequential:
 *   IDLE → ENGINE_READY → PRECREATED → SCHEMA_READY → POSTCREATED
 *        → SESSION_ACTIVE → CLOSED
 */
enum class OrchestrationState {
    IDLE,
    ENGINE_READY,
    PRECREATED,
    SCHEMA_READY,
    POSTCREATED,
    SESSION_ACTIVE,
    CLOSED
};

[[nodiscard]] inline std::string_view orchestration_state_to_string(OrchestrationState state) {
    switch (state) {
        case OrchestrationState::IDLE:           return "idle";
        case OrchestrationState::ENGINE_READY:   return "engine_ready";
        case OrchestrationState::PRECREATED:     return "precreated";
        case OrchestrationState::SCHEMA_READY:   return "schema_ready";
        case OrchestrationState::POSTCREATED:    return "postcreated";
        case OrchestrationState::SESSION_ACTIVE: return "session_active";
        case OrchestrationState::CLOSED:         return "closed";
        default: return "unknown";
    }
}

/**
 * @brief Hook kinds, in execution order within a provisioning run
 */
enum class HookKind : uint8_t {
    PRECREATE_AUTO,
    PRECREATE_MANUAL,
    POSTCREATE_AUTO,
    POSTCREATE_MANUAL
};

inline constexpr size_t kHookKindCount = 4;

[[nodiscard]] inline std::string_view hook_kind_to_string(HookKind kind) {
    switch (kind) {
        case HookKind::PRECREATE_AUTO:    return "precreate-auto";
        case HookKind::PRECREATE_MANUAL:  return "precreate-manual";
        case HookKind::POSTCREATE_AUTO:   return "postcreate-auto";
        case HookKind::POSTCREATE_MANUAL: return "postcreate-manual";
        default: return "unknown";
    }
}

[[nodiscard]] inline constexpr bool is_precreate(HookKind kind) noexcept {
    return kind == HookKind::PRECREATE_AUTO || kind == HookKind::PRECREATE_MANUAL;
}

[[nodiscard]] inline constexpr bool is_manual(HookKind kind) noexcept {
    return kind == HookKind::PRECREATE_MANUAL || kind == HookKind::POSTCREATE_MANUAL;
}

// ============================================================================
// Exception taxonomy
// ============================================================================

/**
 * @brief Base of every error surfaced by the session manager
 *
 * Carries the orchestration state in which the failure happened so callers
 * can decide whether manual cleanup is needed.
 */
class SessionManagerError : public std::runtime_error {
public:
    SessionManagerError(OrchestrationState state, const std::string& message)
        : std::runtime_error(message), state_(state) {}

    [[nodiscard]] OrchestrationState state() const noexcept { return state_; }

private:
    OrchestrationState state_;
};

/**
 * @brief Invalid connection settings, detected at construction (never retried)
 */
class ConfigurationError : public SessionManagerError {
public:
    explicit ConfigurationError(const std::string& message)
        : SessionManagerError(OrchestrationState::IDLE, message) {}
};

/**
 * @brief Engine could not be established
 *
 * attempts() is the number of connection attempts made; transient() tells
 * whether the last cause was a transient condition (retries exhausted) or a
 * non-transient one that aborted retrying.
 */
class ConnectionError : public SessionManagerError {
public:
    ConnectionError(const std::string& message, std::string last_cause,
                    uint32_t attempts, bool transient)
        : SessionManagerError(OrchestrationState::ENGINE_READY, message),
          last_cause_(std::move(last_cause)),
          attempts_(attempts),
          transient_(transient) {}

    [[nodiscard]] const std::string& last_cause() const noexcept { return last_cause_; }
    [[nodiscard]] uint32_t attempts() const noexcept { return attempts_; }
    [[nodiscard]] bool transient() const noexcept { return transient_; }

private:
    std::string last_cause_;
    uint32_t attempts_;
    bool transient_;
};

/**
 * @brief A precreate/postcreate hook failed
 *
 * ordinal() is the 1-based registration position of the failing hook within
 * its kind. Hooks that ran before it stay committed.
 */
class HookExecutionError : public SessionManagerError {
public:
    HookExecutionError(HookKind kind, std::string database, size_t ordinal,
                       std::string label, const std::string& cause)
        : SessionManagerError(
              is_precreate(kind) ? OrchestrationState::PRECREATED
                                 : OrchestrationState::POSTCREATED,
              build_message(kind, database, ordinal, label, cause)),
          kind_(kind),
          database_(std::move(database)),
          ordinal_(ordinal),
          label_(std::move(label)),
          cause_(cause) {}

    [[nodiscard]] HookKind kind() const noexcept { return kind_; }
    [[nodiscard]] const std::string& database() const noexcept { return database_; }
    [[nodiscard]] size_t ordinal() const noexcept { return ordinal_; }
    [[nodiscard]] const std::string& label() const noexcept { return label_; }
    [[nodiscard]] const std::string& cause() const noexcept { return cause_; }

private:
    static std::string build_message(HookKind kind, const std::string& database,
                                     size_t ordinal, const std::string& label,
                                     const std::string& cause) {
        std::string msg = "Hook ";
        msg += hook_kind_to_string(kind);
        msg += " #" + std::to_string(ordinal);
        if (!label.empty()) {
            msg += " '" + label + "'";
        }
        msg += " failed for database '" + database + "': " + cause;
        return msg;
    }

    HookKind kind_;
    std::string database_;
    size_t ordinal_;
    std::string label_;
    std::string cause_;
};

/**
 * @brief Irrecoverable DDL failure during schema materialization
 */
class SchemaError : public SessionManagerError {
public:
    SchemaError(std::string database, const std::string& message)
        : SessionManagerError(OrchestrationState::SCHEMA_READY, message),
          database_(std::move(database)) {}

    [[nodiscard]] const std::string& database() const noexcept { return database_; }

private:
    std::string database_;
};

/**
 * @brief Session misuse (use after close) or commit/rollback failure
 */
class SessionError : public SessionManagerError {
public:
    explicit SessionError(const std::string& message,
                          OrchestrationState state = OrchestrationState::SESSION_ACTIVE)
        : SessionManagerError(state, message) {}
};

/**
 * @brief The caller requested a stop before the request completed
 */
class CancelledError : public SessionManagerError {
public:
    CancelledError(OrchestrationState state, const std::string& message)
        : SessionManagerError(state, message) {}
};

} // namespace sqlsession
