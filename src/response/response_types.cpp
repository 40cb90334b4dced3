/**
 * @file response_types.cpp
 * @brief Response rule validation and the built-in response policy
 *
 * @date 2025
 */

#include "warden/response/response_types.hpp"

namespace warden {
namespace response {

using analyzers::ConditionOperator;
using analyzers::MakeCondition;
using analyzers::ThreatField;
using core::ValidationError;

std::string ActionTypeToString(ActionType type) {
    switch (type) {
        case ActionType::BLOCK:    return "block";
        case ActionType::LOCK:     return "lock";
        case ActionType::RESTRICT: return "restrict";
        case ActionType::ALERT:    return "alert";
        case ActionType::NOTIFY:   return "notify";
        case ActionType::LOG:      return "log";
    }
    return "log";
}

std::optional<ActionType> ActionTypeFromString(const std::string& name) {
    if (name == "block")    return ActionType::BLOCK;
    if (name == "lock")     return ActionType::LOCK;
    if (name == "restrict") return ActionType::RESTRICT;
    if (name == "alert")    return ActionType::ALERT;
    if (name == "notify")   return ActionType::NOTIFY;
    if (name == "log")      return ActionType::LOG;
    return std::nullopt;
}

void ValidateResponseRule(const ResponseRule& rule) {
    if (rule.id.empty()) {
        throw ValidationError("response rule id must not be empty");
    }
    if (rule.actions.empty()) {
        throw ValidationError("response rule '" + rule.id + "': at least one action is required");
    }
    for (const auto& condition : rule.conditions) {
        if (condition.IsSame()) {
            throw ValidationError("response rule '" + rule.id + "': SAME is only valid in correlation rules");
        }
        if (condition.op == ConditionOperator::REGEX && !condition.pattern) {
            throw ValidationError("response rule '" + rule.id + "': regex condition was not compiled");
        }
    }
}

namespace {

ResponseAction Action(ActionType type, std::map<std::string, std::string> parameters) {
    return ResponseAction{type, std::move(parameters)};
}

analyzers::ResponseCondition TypeIs(const std::string& threat_type) {
    return MakeCondition(ThreatField::THREAT_TYPE, ConditionOperator::EQUALS, threat_type);
}

analyzers::ResponseCondition RiskAbove(double threshold) {
    return MakeCondition(ThreatField::RISK_SCORE, ConditionOperator::GREATER_THAN, threshold);
}

} // namespace

std::vector<ResponseRule> DefaultResponseRules() {
    std::vector<ResponseRule> rules;

    rules.push_back(ResponseRule{
        "critical_brute_force",
        "Critical Brute Force Response",
        {TypeIs("brute_force_advanced"), RiskAbove(90)},
        {
            Action(ActionType::BLOCK, {{"target", "ip"}, {"duration", "3600"}}),
            Action(ActionType::LOCK, {{"target", "account"}, {"duration", "1800"}}),
            Action(ActionType::ALERT, {{"level", "critical"}, {"immediate", "true"}}),
            Action(ActionType::NOTIFY, {{"channels", "email,sms"}, {"escalate", "true"}}),
        },
        1, true, true});

    rules.push_back(ResponseRule{
        "high_privilege_escalation",
        "High Privilege Escalation Response",
        {TypeIs("privilege_escalation"), RiskAbove(75)},
        {
            Action(ActionType::RESTRICT, {{"target", "permissions"}, {"immediate", "true"}}),
            Action(ActionType::ALERT, {{"level", "high"}, {"immediate", "true"}}),
            Action(ActionType::LOG, {{"detailed", "true"}, {"preserve", "true"}}),
            Action(ActionType::NOTIFY, {{"channels", "email"}, {"escalate", "false"}}),
        },
        2, true, true});

    rules.push_back(ResponseRule{
        "data_exfiltration_response",
        "Data Exfiltration Response",
        {TypeIs("financial_data_exfiltration")},
        {
            Action(ActionType::RESTRICT, {{"target", "data_access"}, {"immediate", "true"}}),
            Action(ActionType::BLOCK, {{"target", "user_session"}, {"duration", "1800"}}),
            Action(ActionType::ALERT, {{"level", "high"}, {"immediate", "true"}}),
            Action(ActionType::LOG, {{"detailed", "true"}, {"forensic", "true"}}),
        },
        1, true, true});

    rules.push_back(ResponseRule{
        "property_access_violation",
        "Property Access Violation Response",
        {TypeIs("property_access_violation")},
        {
            Action(ActionType::BLOCK, {{"target", "property_access"}, {"duration", "600"}}),
            Action(ActionType::ALERT, {{"level", "medium"}, {"immediate", "false"}}),
            Action(ActionType::LOG, {{"detailed", "true"}}),
        },
        3, true, true});

    rules.push_back(ResponseRule{
        "session_anomaly_response",
        "Session Anomaly Response",
        {TypeIs("session_hijacking"), RiskAbove(50)},
        {
            Action(ActionType::RESTRICT, {{"target", "concurrent_sessions"}, {"limit", "1"}}),
            Action(ActionType::ALERT, {{"level", "medium"}}),
            Action(ActionType::LOG, {{"session_details", "true"}}),
        },
        4, true, true});

    rules.push_back(ResponseRule{
        "coordinated_attack_response",
        "Coordinated Attack Response",
        {TypeIs("coordinated_attack"), RiskAbove(80)},
        {
            Action(ActionType::BLOCK, {{"target", "ip"}, {"duration", "3600"}}),
            Action(ActionType::ALERT, {{"level", "high"}, {"immediate", "true"}}),
            Action(ActionType::LOG, {{"detailed", "true"}, {"forensic", "true"}}),
        },
        2, true, true});

    return rules;
}

std::vector<core::ResponseActionRecord> ToActionRecords(const AutomatedResponseResult& result) {
    std::vector<core::ResponseActionRecord> records;
    records.reserve(result.actions_executed.size());
    for (const auto& executed : result.actions_executed) {
        core::ResponseActionRecord record;
        record.rule_id = executed.rule_id;
        record.action_type = ActionTypeToString(executed.action.type);
        record.success = executed.result.success;
        record.message = executed.result.message;
        record.executed_at = executed.executed_at;
        records.push_back(std::move(record));
    }
    return records;
}

} // namespace response
} // namespace warden
