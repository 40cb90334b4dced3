/**
 * @file action_handlers.hpp
 * @brief Type-specific executors for response actions
 *
 * Each handler turns one ResponseAction into an ActionResult. Handlers
 * catch their own errors and report them as failed results; the engine
 * additionally guards against handlers that throw or hang.
 *
 * **Targets**:
 * - block:    ip (first ip indicator), user_session (first `user_`
 *             resource), property_access (first `property_` resource);
 *             `duration` seconds, default 3600
 * - lock:     account; `duration` seconds, default 1800
 * - restrict: permissions, data_access, concurrent_sessions (`limit`, default 1)
 * - alert:    `level` (default from risk), `channels` (default dashboard)
 * - notify:   `channels` (default email)
 * - log:      appends a response_log record with all parameters
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <memory>
#include <optional>
#include <chrono>
#include <map>
#include <atomic>

#include "warden/core/security_types.hpp"
#include "warden/core/collaborators.hpp"
#include "warden/response/response_types.hpp"
#include "warden/response/audit_trail.hpp"

namespace warden {
namespace response {

/**
 * @class ActionToken
 * @brief Settles whether a running action may still take effect
 *
 * The engine abandons the token when the action's time limit passes; a
 * handler commits it immediately before its side effect. Whichever comes
 * first wins, so an action reported as timed out never applies anything.
 */
class ActionToken {
public:
    /// Handler side; false once the engine has abandoned the action
    bool Commit() {
        int expected = PENDING;
        return state_.compare_exchange_strong(expected, COMMITTED) || expected == COMMITTED;
    }

    /// Engine side; false if the handler already committed
    bool Abandon() {
        int expected = PENDING;
        return state_.compare_exchange_strong(expected, ABANDONED) || expected == ABANDONED;
    }

private:
    enum : int { PENDING, COMMITTED, ABANDONED };
    std::atomic<int> state_{PENDING};
};

/**
 * @class ActionHandler
 * @brief Executes one action type
 *
 * Handlers may be invoked from a worker thread and must not keep
 * references to their arguments after returning. A handler with a side
 * effect calls @p token.Commit() right before it and fails the action if
 * that returns false.
 */
class ActionHandler {
public:
    virtual ~ActionHandler() = default;

    virtual ActionResult Execute(const ResponseAction& action,
                                 const core::ThreatIntelligence& threat,
                                 const core::SecurityIncident& incident,
                                 ActionToken& token) = 0;
};

/**
 * @struct Enforcement
 * @brief A mitigation applied to a subject
 */
struct Enforcement {
    std::string action;                 ///< block | lock | restrict
    std::string target;                 ///< ip, account, permissions...
    std::string subject;                ///< The ip address or user id affected
    std::chrono::seconds duration{0};   ///< Zero means until lifted by an operator
    std::optional<core::TimePoint> expires_at;
    std::string threat_id;
    std::string incident_id;
    std::map<std::string, std::string> details;
};

/**
 * @class EnforcementBackend
 * @brief Where block/lock/restrict decisions are applied
 *
 * Apply() throws std::runtime_error if the enforcement could not be applied.
 */
class EnforcementBackend {
public:
    virtual ~EnforcementBackend() = default;

    virtual void Apply(const Enforcement& enforcement) = 0;
};

/**
 * @class AuditingEnforcementBackend
 * @brief Logs each enforcement and records it in the audit trail
 */
class AuditingEnforcementBackend : public EnforcementBackend {
public:
    AuditingEnforcementBackend(std::shared_ptr<AuditTrail> audit,
                               core::ClockFunction clock = core::Clock::now);

    void Apply(const Enforcement& enforcement) override;

private:
    std::shared_ptr<AuditTrail> audit_;
    core::ClockFunction clock_;
};

/**
 * @class EnforcementHandler
 * @brief Shared subject resolution for block, lock and restrict
 */
class EnforcementHandler : public ActionHandler {
public:
    EnforcementHandler(std::shared_ptr<EnforcementBackend> backend,
                       core::ClockFunction clock);

protected:
    /// First ip indicator value
    static std::optional<std::string> FindIp(const core::ThreatIntelligence& threat);

    /// Value after `<prefix>` of the first affected resource starting with it
    static std::optional<std::string> FindResource(const core::ThreatIntelligence& threat,
                                                   const std::string& prefix);

    /// User subject: `user_` resource first, then a user indicator
    static std::optional<std::string> FindUser(const core::ThreatIntelligence& threat);

    ActionResult Enforce(Enforcement enforcement, const std::string& message, ActionToken& token);

    std::shared_ptr<EnforcementBackend> backend_;
    core::ClockFunction clock_;
};

class BlockHandler : public EnforcementHandler {
public:
    using EnforcementHandler::EnforcementHandler;

    ActionResult Execute(const ResponseAction& action,
                         const core::ThreatIntelligence& threat,
                         const core::SecurityIncident& incident,
                         ActionToken& token) override;
};

class LockHandler : public EnforcementHandler {
public:
    using EnforcementHandler::EnforcementHandler;

    ActionResult Execute(const ResponseAction& action,
                         const core::ThreatIntelligence& threat,
                         const core::SecurityIncident& incident,
                         ActionToken& token) override;
};

class RestrictHandler : public EnforcementHandler {
public:
    using EnforcementHandler::EnforcementHandler;

    ActionResult Execute(const ResponseAction& action,
                         const core::ThreatIntelligence& threat,
                         const core::SecurityIncident& incident,
                         ActionToken& token) override;
};

/**
 * @class AlertHandler
 * @brief Raises an alert at the requested level through the dispatcher
 */
class AlertHandler : public ActionHandler {
public:
    AlertHandler(std::shared_ptr<core::AlertDispatcher> dispatcher,
                 core::ClockFunction clock = core::Clock::now);

    ActionResult Execute(const ResponseAction& action,
                         const core::ThreatIntelligence& threat,
                         const core::SecurityIncident& incident,
                         ActionToken& token) override;

private:
    std::shared_ptr<core::AlertDispatcher> dispatcher_;
    core::ClockFunction clock_;
};

class NotifyHandler : public ActionHandler {
public:
    NotifyHandler(std::shared_ptr<core::AlertDispatcher> dispatcher,
                  core::ClockFunction clock = core::Clock::now);

    ActionResult Execute(const ResponseAction& action,
                         const core::ThreatIntelligence& threat,
                         const core::SecurityIncident& incident,
                         ActionToken& token) override;

private:
    std::shared_ptr<core::AlertDispatcher> dispatcher_;
    core::ClockFunction clock_;
};

class LogHandler : public ActionHandler {
public:
    LogHandler(std::shared_ptr<AuditTrail> audit,
               core::ClockFunction clock = core::Clock::now);

    ActionResult Execute(const ResponseAction& action,
                         const core::ThreatIntelligence& threat,
                         const core::SecurityIncident& incident,
                         ActionToken& token) override;

private:
    std::shared_ptr<AuditTrail> audit_;
    core::ClockFunction clock_;
};

/**
 * @brief Read an integer parameter
 * @throws std::invalid_argument if present but not a non-negative integer
 */
long ParseIntParameter(const ResponseAction& action, const std::string& name, long fallback);

/// Parameter value or @p fallback when absent
std::string GetParameter(const ResponseAction& action, const std::string& name,
                         const std::string& fallback = "");

} // namespace response
} // namespace warden
