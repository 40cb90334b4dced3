/**
 * @file response_types.hpp
 * @brief Response rules, actions and execution results
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <chrono>

#include "warden/core/security_types.hpp"
#include "warden/analyzers/conditions.hpp"

namespace warden {
namespace response {

/**
 * @enum ActionType
 * @brief Kinds of automated mitigation
 */
enum class ActionType {
    BLOCK,      ///< Block an ip, user session or property access
    LOCK,       ///< Lock an account
    RESTRICT,   ///< Restrict permissions, data access or concurrent sessions
    ALERT,      ///< Raise an alert through the dispatcher
    NOTIFY,     ///< Notify over named channels
    LOG         ///< Append a detailed response record to the audit trail
};

/**
 * @struct ResponseAction
 * @brief Typed action with free-form parameters
 *
 * Parameters are strings; lists (notify channels) are comma separated and
 * numbers (durations in seconds, limits) are parsed by the handler.
 */
struct ResponseAction {
    ActionType type{ActionType::LOG};
    std::map<std::string, std::string> parameters;   ///< target, duration, level, channels...
};

/**
 * @struct ResponseRule
 * @brief Policy mapping a class of threats to ordered actions
 */
struct ResponseRule {
    std::string id;
    std::string name;
    std::vector<analyzers::ResponseCondition> conditions;  ///< All must hold
    std::vector<ResponseAction> actions;                   ///< Executed in order
    int priority{5};                                       ///< Lower runs first
    bool enabled{true};
    bool auto_execute{true};
};

/**
 * @struct ActionResult
 * @brief Handler outcome
 */
struct ActionResult {
    bool success{false};
    std::string message;
    std::map<std::string, std::string> details;

    static ActionResult Ok(std::string message, std::map<std::string, std::string> details = {}) {
        return ActionResult{true, std::move(message), std::move(details)};
    }

    static ActionResult Failed(std::string message) {
        return ActionResult{false, std::move(message), {}};
    }
};

/**
 * @struct ExecutedAction
 * @brief One attempted action with timing and outcome
 */
struct ExecutedAction {
    std::string rule_id;
    ResponseAction action;
    ActionResult result;
    core::TimePoint executed_at;
    std::chrono::milliseconds duration{0};
};

/**
 * @struct AutomatedResponseResult
 * @brief Aggregate outcome of one Execute() call
 */
struct AutomatedResponseResult {
    std::string threat_id;
    std::string incident_id;
    bool success{false};                        ///< No action failed and at least one rule ran
    std::string message;
    std::vector<std::string> rules_executed;    ///< Rule ids in execution order
    std::vector<ExecutedAction> actions_executed;
    std::chrono::milliseconds execution_time{0};
    std::vector<std::string> errors;
    core::TimePoint executed_at;
};

std::string ActionTypeToString(ActionType type);
std::optional<ActionType> ActionTypeFromString(const std::string& name);

/**
 * @brief Check a response rule before it enters a rule store
 * @throws core::ValidationError on an empty id or action list
 */
void ValidateResponseRule(const ResponseRule& rule);

/// Built-in response policy (brute force, escalation, exfiltration...)
std::vector<ResponseRule> DefaultResponseRules();

/// Map an outcome onto the incident record shape
std::vector<core::ResponseActionRecord> ToActionRecords(const AutomatedResponseResult& result);

} // namespace response
} // namespace warden
