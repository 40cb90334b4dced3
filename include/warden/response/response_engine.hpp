/**
 * @file response_engine.hpp
 * @brief Automated response: rule matching and ordered action execution
 *
 * **Execution**:
 * 1. Select rules whose conditions all hold for the threat
 * 2. Drop disabled and non auto-executable rules
 * 3. Sort by priority (ascending, stable)
 * 4. Run each rule's actions in declared order through the registered
 *    handlers; every action runs under a timeout and a failure never stops
 *    later actions or rules
 * 5. Aggregate the outcome and append it to the audit trail
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <functional>
#include <chrono>

#include "warden/core/security_types.hpp"
#include "warden/core/collaborators.hpp"
#include "warden/response/response_types.hpp"
#include "warden/response/audit_trail.hpp"
#include "warden/response/action_handlers.hpp"
#include "warden/stores/rule_store.hpp"

namespace warden {
namespace response {

using ResponseRuleStore = stores::RuleStore<ResponseRule>;

/**
 * @struct ExecutionOptions
 * @brief Per-call limits imposed by the caller (usually the monitor tick)
 */
struct ExecutionOptions {
    std::optional<std::chrono::milliseconds> budget;   ///< Total time for this response
    std::function<bool()> cancelled;                   ///< Checked between actions
};

/**
 * @class ResponseEngine
 * @brief Matches threats against response rules and executes their actions
 *
 * **Usage Example**:
 * @code
 * auto audit = std::make_shared<MemoryAuditTrail>();
 * auto rules = std::make_shared<ResponseRuleStore>(ValidateResponseRule, DefaultResponseRules());
 * ResponseEngine engine(rules, audit);
 * engine.RegisterDefaultHandlers(dispatcher);
 *
 * auto result = engine.Execute(threat, incident);
 * if (!result.success) {
 *     for (const auto& error : result.errors) spdlog::warn("{}", error);
 * }
 * @endcode
 */
class ResponseEngine {
public:
    struct Config {
        std::chrono::milliseconds action_timeout{5000};   ///< Per-action limit
    };

    ResponseEngine(std::shared_ptr<ResponseRuleStore> rules,
                   std::shared_ptr<AuditTrail> audit);

    ResponseEngine(std::shared_ptr<ResponseRuleStore> rules,
                   std::shared_ptr<AuditTrail> audit,
                   const Config& config,
                   core::ClockFunction clock = core::Clock::now);

    /// Replace the handler for one action type
    void RegisterHandler(ActionType type, std::shared_ptr<ActionHandler> handler);

    /**
     * @brief Install the built-in handlers for all six action types
     * @param dispatcher Alert/notify delivery; may be null (log only)
     * @param backend Enforcement backend; defaults to one recording into the audit trail
     */
    void RegisterDefaultHandlers(std::shared_ptr<core::AlertDispatcher> dispatcher,
                                 std::shared_ptr<EnforcementBackend> backend = nullptr);

    /**
     * @brief Execute the response for one threat
     *
     * Never throws. When no rule matches, `success` is false and no action
     * is attempted; the invocation is still audited. An action past its
     * time limit is failed and can no longer take effect; one that had
     * already committed its side effect is waited for instead.
     */
    AutomatedResponseResult Execute(const core::ThreatIntelligence& threat,
                                    const core::SecurityIncident& incident,
                                    const ExecutionOptions& options = ExecutionOptions{});

    /// Enabled, auto-executable rules matching @p threat, in execution order
    std::vector<ResponseRule> MatchingRules(const core::ThreatIntelligence& threat) const;

    void SetConfig(const Config& config);
    Config GetConfig() const;

    std::shared_ptr<ResponseRuleStore> Rules() const { return rules_; }

private:
    ExecutedAction RunAction(const std::string& rule_id,
                             const ResponseAction& action,
                             const core::ThreatIntelligence& threat,
                             const core::SecurityIncident& incident,
                             std::chrono::milliseconds timeout);

    void Audit(const AutomatedResponseResult& result);

    std::shared_ptr<ResponseRuleStore> rules_;
    std::shared_ptr<AuditTrail> audit_;
    Config config_;
    core::ClockFunction clock_;

    mutable std::mutex mutex_;   ///< Guards handlers_ and config_
    std::map<ActionType, std::shared_ptr<ActionHandler>> handlers_;
};

} // namespace response
} // namespace warden
