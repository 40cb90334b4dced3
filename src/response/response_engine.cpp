/**
 * @file response_engine.cpp
 * @brief Implementation of the automated response engine
 *
 * **Timeouts**:
 * Each handler call runs as a packaged task on its own detached thread with
 * copies of its inputs. If the result is not ready within the action
 * timeout (bounded by what is left of the caller's budget) the action is
 * recorded as failed and the thread is abandoned; it can no longer affect
 * the result.
 *
 * @date 2025
 */

#include "warden/response/response_engine.hpp"
#include "warden/analyzers/conditions.hpp"
#include "warden/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <future>
#include <thread>
#include <system_error>

namespace warden {
namespace response {

using core::SecurityIncident;
using core::ThreatIntelligence;
using std::chrono::milliseconds;

// ============================================================================
// CONSTRUCTOR
// ============================================================================

ResponseEngine::ResponseEngine(std::shared_ptr<ResponseRuleStore> rules,
                               std::shared_ptr<AuditTrail> audit)
    : ResponseEngine(std::move(rules), std::move(audit), Config{}) {
}

ResponseEngine::ResponseEngine(std::shared_ptr<ResponseRuleStore> rules,
                               std::shared_ptr<AuditTrail> audit,
                               const Config& config,
                               core::ClockFunction clock)
    : rules_(std::move(rules))
    , audit_(std::move(audit))
    , config_(config)
    , clock_(std::move(clock)) {
    spdlog::debug("Response engine created with {} rule(s)", rules_ ? rules_->Size() : 0);
}

void ResponseEngine::RegisterHandler(ActionType type, std::shared_ptr<ActionHandler> handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_[type] = std::move(handler);
}

void ResponseEngine::RegisterDefaultHandlers(std::shared_ptr<core::AlertDispatcher> dispatcher,
                                             std::shared_ptr<EnforcementBackend> backend) {
    if (!backend) {
        backend = std::make_shared<AuditingEnforcementBackend>(audit_, clock_);
    }

    RegisterHandler(ActionType::BLOCK, std::make_shared<BlockHandler>(backend, clock_));
    RegisterHandler(ActionType::LOCK, std::make_shared<LockHandler>(backend, clock_));
    RegisterHandler(ActionType::RESTRICT, std::make_shared<RestrictHandler>(backend, clock_));
    RegisterHandler(ActionType::ALERT, std::make_shared<AlertHandler>(dispatcher, clock_));
    RegisterHandler(ActionType::NOTIFY, std::make_shared<NotifyHandler>(dispatcher, clock_));
    RegisterHandler(ActionType::LOG, std::make_shared<LogHandler>(audit_, clock_));
}

void ResponseEngine::SetConfig(const Config& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
}

ResponseEngine::Config ResponseEngine::GetConfig() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

// ============================================================================
// RULE MATCHING
// ============================================================================

std::vector<ResponseRule> ResponseEngine::MatchingRules(const ThreatIntelligence& threat) const {
    std::vector<ResponseRule> matching;
    if (!rules_) {
        return matching;
    }

    for (auto& rule : rules_->List()) {
        if (!rule.enabled || !rule.auto_execute) {
            continue;
        }
        bool all_match = std::all_of(rule.conditions.begin(), rule.conditions.end(),
                                     [&threat](const analyzers::ResponseCondition& condition) {
                                         return analyzers::EvaluateCondition(condition, threat);
                                     });
        if (all_match) {
            matching.push_back(std::move(rule));
        }
    }

    std::stable_sort(matching.begin(), matching.end(),
                     [](const ResponseRule& a, const ResponseRule& b) {
                         return a.priority < b.priority;
                     });
    return matching;
}

// ============================================================================
// EXECUTION
// ============================================================================

AutomatedResponseResult ResponseEngine::Execute(const ThreatIntelligence& threat,
                                                const SecurityIncident& incident,
                                                const ExecutionOptions& options) {
    const auto start = std::chrono::steady_clock::now();
    const milliseconds action_timeout = GetConfig().action_timeout;

    AutomatedResponseResult result;
    result.threat_id = threat.threat_id;
    result.incident_id = incident.id;
    result.executed_at = clock_();

    spdlog::info("Executing automated response for threat {} (risk {})",
                 threat.threat_id, threat.risk_score);

    std::vector<ResponseRule> rules;
    try {
        rules = MatchingRules(threat);
    }
    catch (const std::exception& e) {
        result.errors.push_back(std::string("Rule matching failed: ") + e.what());
    }

    if (rules.empty()) {
        result.success = false;
        result.message = result.errors.empty() ? "No matching response rules found" : result.errors.front();
        spdlog::info("No response rules matched threat {}", threat.threat_id);
        Audit(result);
        return result;
    }

    bool stopped = false;

    for (const auto& rule : rules) {
        result.rules_executed.push_back(rule.id);
        spdlog::debug("Running response rule {} ({} actions)", rule.id, rule.actions.size());

        for (const auto& action : rule.actions) {
            if (!stopped && options.cancelled && options.cancelled()) {
                stopped = true;
            }

            milliseconds timeout = action_timeout;
            bool budget_exhausted = false;
            if (options.budget) {
                auto elapsed = std::chrono::duration_cast<milliseconds>(
                    std::chrono::steady_clock::now() - start);
                auto remaining = *options.budget - elapsed;
                if (remaining.count() <= 0) {
                    budget_exhausted = true;
                }
                else {
                    timeout = std::min(timeout, remaining);
                }
            }

            ExecutedAction executed;
            if (stopped || budget_exhausted) {
                executed.rule_id = rule.id;
                executed.action = action;
                executed.executed_at = clock_();
                executed.result = ActionResult::Failed(stopped ? "Cancelled: monitor stopping"
                                                               : "Skipped: response budget exhausted");
            }
            else {
                executed = RunAction(rule.id, action, threat, incident, timeout);
            }

            if (!executed.result.success) {
                result.errors.push_back(rule.id + "/" + ActionTypeToString(action.type) + ": " +
                                        executed.result.message);
            }
            result.actions_executed.push_back(std::move(executed));
        }
    }

    result.execution_time = std::chrono::duration_cast<milliseconds>(
        std::chrono::steady_clock::now() - start);
    result.success = result.errors.empty();
    result.message = result.success
        ? "All responses executed successfully"
        : "Partial success: " + std::to_string(result.errors.size()) + " action(s) failed";

    spdlog::info("Response for threat {}: {} action(s), {} failed, {}ms",
                 threat.threat_id, result.actions_executed.size(),
                 result.errors.size(), result.execution_time.count());

    Audit(result);
    return result;
}

ExecutedAction ResponseEngine::RunAction(const std::string& rule_id,
                                         const ResponseAction& action,
                                         const ThreatIntelligence& threat,
                                         const SecurityIncident& incident,
                                         milliseconds timeout) {
    ExecutedAction executed;
    executed.rule_id = rule_id;
    executed.action = action;
    executed.executed_at = clock_();

    std::shared_ptr<ActionHandler> handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = handlers_.find(action.type);
        if (it != handlers_.end()) {
            handler = it->second;
        }
    }

    if (!handler) {
        executed.result = ActionResult::Failed("No handler registered for action type " +
                                               ActionTypeToString(action.type));
        return executed;
    }

    const auto start = std::chrono::steady_clock::now();

    auto token = std::make_shared<ActionToken>();
    auto task = std::make_shared<std::packaged_task<ActionResult()>>(
        [handler, action, threat, incident, token]() {
            return handler->Execute(action, threat, incident, *token);
        });
    auto future = task->get_future();

    try {
        std::thread([task]() { (*task)(); }).detach();
    }
    catch (const std::system_error& e) {
        executed.result = ActionResult::Failed(std::string("Could not start action: ") + e.what());
        return executed;
    }

    if (future.wait_for(timeout) != std::future_status::ready) {
        if (token->Abandon()) {
            executed.duration = std::chrono::duration_cast<milliseconds>(
                std::chrono::steady_clock::now() - start);
            executed.result = ActionResult::Failed("Timed out after " + std::to_string(timeout.count()) + "ms");
            spdlog::warn("Action {} of rule {} timed out", ActionTypeToString(action.type), rule_id);
            return executed;
        }
        // Side effect already under way; report what it actually did
        spdlog::warn("Action {} of rule {} passed its {}ms limit while applying, waiting for it",
                     ActionTypeToString(action.type), rule_id, timeout.count());
        future.wait();
    }

    try {
        executed.result = future.get();
    }
    catch (const std::exception& e) {
        executed.result = ActionResult::Failed(e.what());
        spdlog::error("Action {} of rule {} threw: {}", ActionTypeToString(action.type), rule_id, e.what());
    }
    catch (...) {
        executed.result = ActionResult::Failed("unknown error");
        spdlog::error("Action {} of rule {} threw a non-standard exception", ActionTypeToString(action.type), rule_id);
    }

    executed.duration = std::chrono::duration_cast<milliseconds>(
        std::chrono::steady_clock::now() - start);

    if (!executed.result.success) {
        spdlog::warn("Action {} of rule {} failed: {}",
                     ActionTypeToString(action.type), rule_id, executed.result.message);
    }

    return executed;
}

void ResponseEngine::Audit(const AutomatedResponseResult& result) {
    if (!audit_) {
        return;
    }

    AuditRecord record;
    record.kind = "response";
    record.threat_id = result.threat_id;
    record.incident_id = result.incident_id;
    record.recorded_at = result.executed_at;
    record.details["success"] = result.success ? "true" : "false";
    record.details["message"] = result.message;
    record.details["execution_time_ms"] = std::to_string(result.execution_time.count());
    record.details["rules"] = utils::StringUtils::Join(result.rules_executed, ",");
    record.actions = result.actions_executed;

    try {
        audit_->Append(record);
    }
    catch (const std::exception& e) {
        spdlog::error("Failed to audit response for threat {}: {}", result.threat_id, e.what());
    }
}

} // namespace response
} // namespace warden
