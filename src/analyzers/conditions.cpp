/**
 * @file conditions.cpp
 * @brief Condition construction, field accessors and evaluation
 *
 * @date 2025
 */

#include "warden/analyzers/conditions.hpp"
#include "warden/utils/string_utils.hpp"

#include <algorithm>
#include <cmath>

namespace warden {
namespace analyzers {

using core::ValidationError;
using utils::StringUtils;

namespace {

// Lists accept a single string for convenience: "in": "EXPORT"
ConditionValue NormalizeListValue(const ConditionValue& value, const std::string& where) {
    if (const auto* list = std::get_if<std::vector<std::string>>(&value)) {
        if (list->empty()) {
            throw ValidationError(where + ": list value must not be empty");
        }
        return value;
    }
    if (const auto* text = std::get_if<std::string>(&value)) {
        return std::vector<std::string>{*text};
    }
    throw ValidationError(where + ": operator requires a list of strings");
}

std::shared_ptr<const std::regex> CompilePattern(const ConditionValue& value, const std::string& where) {
    const auto* text = std::get_if<std::string>(&value);
    if (text == nullptr) {
        throw ValidationError(where + ": regex operator requires a string pattern");
    }
    try {
        return std::make_shared<const std::regex>(*text, std::regex::ECMAScript);
    }
    catch (const std::regex_error& e) {
        throw ValidationError(where + ": invalid regex '" + *text + "': " + e.what());
    }
}

bool ListContains(const std::vector<std::string>& list, const std::string& value) {
    return std::find(list.begin(), list.end(), value) != list.end();
}

// Shared string comparison for both event and threat conditions
template <typename Field>
bool MatchString(const RuleCondition<Field>& condition, const std::string& field_value) {
    switch (condition.op) {
        case ConditionOperator::EQUALS:
            return std::get<std::string>(condition.value) == field_value;
        case ConditionOperator::NOT_EQUALS:
            return std::get<std::string>(condition.value) != field_value;
        case ConditionOperator::CONTAINS:
            return StringUtils::Contains(field_value, std::get<std::string>(condition.value));
        case ConditionOperator::IN:
            return ListContains(std::get<std::vector<std::string>>(condition.value), field_value);
        case ConditionOperator::NOT_IN:
            return !ListContains(std::get<std::vector<std::string>>(condition.value), field_value);
        case ConditionOperator::REGEX:
            return condition.pattern && std::regex_search(field_value, *condition.pattern);
        default:
            return false;
    }
}

} // namespace

// ============================================================================
// CONDITION CONSTRUCTION
// ============================================================================

CorrelationCondition MakeCondition(EventField field, ConditionOperator op, ConditionValue value) {
    const std::string where = "condition on '" + EventFieldToString(field) + "'";

    CorrelationCondition condition;
    condition.field = field;
    condition.op = op;

    switch (op) {
        case ConditionOperator::EQUALS:
        case ConditionOperator::NOT_EQUALS:
        case ConditionOperator::CONTAINS:
            if (!std::holds_alternative<std::string>(value)) {
                throw ValidationError(where + ": " + OperatorToString(op) + " requires a string value");
            }
            if (op == ConditionOperator::CONTAINS && std::get<std::string>(value) == kSameValue) {
                throw ValidationError(where + ": SAME is only valid with equals/not_equals");
            }
            condition.value = std::move(value);
            break;
        case ConditionOperator::IN:
        case ConditionOperator::NOT_IN:
            condition.value = NormalizeListValue(value, where);
            break;
        case ConditionOperator::REGEX:
            condition.pattern = CompilePattern(value, where);
            condition.value = std::move(value);
            break;
        case ConditionOperator::GREATER_THAN:
        case ConditionOperator::LESS_THAN:
            throw ValidationError(where + ": numeric operators are not supported on event fields");
    }

    return condition;
}

ResponseCondition MakeCondition(ThreatField field, ConditionOperator op, ConditionValue value) {
    const std::string where = "condition on '" + ThreatFieldToString(field) + "'";

    ResponseCondition condition;
    condition.field = field;
    condition.op = op;

    switch (op) {
        case ConditionOperator::EQUALS:
        case ConditionOperator::NOT_EQUALS:
            if (std::holds_alternative<std::vector<std::string>>(value)) {
                throw ValidationError(where + ": " + OperatorToString(op) + " requires a scalar value");
            }
            condition.value = std::move(value);
            break;
        case ConditionOperator::CONTAINS:
            if (!std::holds_alternative<std::string>(value)) {
                throw ValidationError(where + ": contains requires a string value");
            }
            condition.value = std::move(value);
            break;
        case ConditionOperator::IN:
        case ConditionOperator::NOT_IN:
            condition.value = NormalizeListValue(value, where);
            break;
        case ConditionOperator::REGEX:
            condition.pattern = CompilePattern(value, where);
            condition.value = std::move(value);
            break;
        case ConditionOperator::GREATER_THAN:
        case ConditionOperator::LESS_THAN:
            if (!std::holds_alternative<double>(value)) {
                throw ValidationError(where + ": " + OperatorToString(op) + " requires a numeric value");
            }
            condition.value = std::move(value);
            break;
    }

    return condition;
}

// ============================================================================
// FIELD ACCESSORS
// ============================================================================

std::optional<std::string> GetEventField(const core::SecurityEvent& event, EventField field) {
    switch (field) {
        case EventField::ACTION:      return event.action;
        case EventField::ACTOR_ID:    return event.actor_id;
        case EventField::TENANT_ID:   return event.tenant_id;
        case EventField::IP_ADDRESS:  return event.ip_address;
        case EventField::RESOURCE:    return event.resource;
        case EventField::RESOURCE_ID: return event.resource_id;
    }
    return std::nullopt;
}

ConditionValue GetThreatField(const core::ThreatIntelligence& threat, ThreatField field) {
    switch (field) {
        case ThreatField::THREAT_TYPE:        return threat.threat_type;
        case ThreatField::RISK_SCORE:         return static_cast<double>(threat.risk_score);
        case ThreatField::CONFIDENCE:         return static_cast<double>(threat.confidence);
        case ThreatField::STATUS:             return core::ThreatStatusToString(threat.status);
        case ThreatField::AFFECTED_RESOURCES: return threat.affected_resources;
        case ThreatField::INDICATOR_COUNT:    return static_cast<double>(threat.indicators.size());
        case ThreatField::RESOURCE_COUNT:     return static_cast<double>(threat.affected_resources.size());
        case ThreatField::TIMELINE_COUNT:     return static_cast<double>(threat.timeline.size());
    }
    return std::string{};
}

// ============================================================================
// EVALUATION
// ============================================================================

bool EvaluateCondition(const CorrelationCondition& condition, const core::SecurityEvent& event) {
    if (condition.IsSame()) {
        return true;
    }

    auto field_value = GetEventField(event, condition.field);
    if (!field_value) {
        return condition.op == ConditionOperator::NOT_EQUALS ||
               condition.op == ConditionOperator::NOT_IN;
    }

    return MatchString(condition, *field_value);
}

bool EvaluateCondition(const ResponseCondition& condition, const core::ThreatIntelligence& threat) {
    ConditionValue field_value = GetThreatField(threat, condition.field);

    // Numeric fields
    if (const auto* number = std::get_if<double>(&field_value)) {
        const double* expected = std::get_if<double>(&condition.value);
        switch (condition.op) {
            case ConditionOperator::GREATER_THAN:
                return expected != nullptr && *number > *expected;
            case ConditionOperator::LESS_THAN:
                return expected != nullptr && *number < *expected;
            case ConditionOperator::EQUALS:
                return expected != nullptr && std::fabs(*number - *expected) < 1e-9;
            case ConditionOperator::NOT_EQUALS:
                return expected == nullptr || std::fabs(*number - *expected) >= 1e-9;
            default:
                return false;
        }
    }

    if (condition.op == ConditionOperator::GREATER_THAN || condition.op == ConditionOperator::LESS_THAN) {
        return false;
    }

    // String fields; a numeric rule value never equals a string field
    if (const auto* text = std::get_if<std::string>(&field_value)) {
        if (std::holds_alternative<double>(condition.value)) {
            return condition.op == ConditionOperator::NOT_EQUALS;
        }
        return MatchString(condition, *text);
    }

    // List fields (affected resources): any element may satisfy the condition
    const auto& elements = std::get<std::vector<std::string>>(field_value);
    if (std::holds_alternative<double>(condition.value)) {
        return condition.op == ConditionOperator::NOT_EQUALS;
    }

    const bool negative = condition.op == ConditionOperator::NOT_EQUALS ||
                          condition.op == ConditionOperator::NOT_IN;
    if (negative) {
        return std::all_of(elements.begin(), elements.end(),
                           [&condition](const std::string& element) {
                               return MatchString(condition, element);
                           });
    }

    return std::any_of(elements.begin(), elements.end(),
                       [&condition](const std::string& element) {
                           return MatchString(condition, element);
                       });
}

// ============================================================================
// NAME CONVERSIONS
// ============================================================================

std::string OperatorToString(ConditionOperator op) {
    switch (op) {
        case ConditionOperator::EQUALS:       return "equals";
        case ConditionOperator::NOT_EQUALS:   return "not_equals";
        case ConditionOperator::CONTAINS:     return "contains";
        case ConditionOperator::IN:           return "in";
        case ConditionOperator::NOT_IN:       return "not_in";
        case ConditionOperator::REGEX:        return "regex";
        case ConditionOperator::GREATER_THAN: return "greater_than";
        case ConditionOperator::LESS_THAN:    return "less_than";
    }
    return "equals";
}

std::optional<ConditionOperator> OperatorFromString(const std::string& name) {
    if (name == "equals")       return ConditionOperator::EQUALS;
    if (name == "not_equals")   return ConditionOperator::NOT_EQUALS;
    if (name == "contains")     return ConditionOperator::CONTAINS;
    if (name == "in")           return ConditionOperator::IN;
    if (name == "not_in")       return ConditionOperator::NOT_IN;
    if (name == "regex")        return ConditionOperator::REGEX;
    if (name == "greater_than") return ConditionOperator::GREATER_THAN;
    if (name == "less_than")    return ConditionOperator::LESS_THAN;
    return std::nullopt;
}

std::string EventFieldToString(EventField field) {
    switch (field) {
        case EventField::ACTION:      return "action";
        case EventField::ACTOR_ID:    return "actorId";
        case EventField::TENANT_ID:   return "tenantId";
        case EventField::IP_ADDRESS:  return "ipAddress";
        case EventField::RESOURCE:    return "resource";
        case EventField::RESOURCE_ID: return "resourceId";
    }
    return "action";
}

std::optional<EventField> EventFieldFromString(const std::string& name) {
    // userId / propertyId are the audit-log column names
    if (name == "action")                             return EventField::ACTION;
    if (name == "actorId" || name == "userId")        return EventField::ACTOR_ID;
    if (name == "tenantId" || name == "propertyId")   return EventField::TENANT_ID;
    if (name == "ipAddress")                          return EventField::IP_ADDRESS;
    if (name == "resource")                           return EventField::RESOURCE;
    if (name == "resourceId")                         return EventField::RESOURCE_ID;
    return std::nullopt;
}

std::string ThreatFieldToString(ThreatField field) {
    switch (field) {
        case ThreatField::THREAT_TYPE:        return "threatType";
        case ThreatField::RISK_SCORE:         return "riskScore";
        case ThreatField::CONFIDENCE:         return "confidence";
        case ThreatField::STATUS:             return "status";
        case ThreatField::AFFECTED_RESOURCES: return "affectedResources";
        case ThreatField::INDICATOR_COUNT:    return "indicatorCount";
        case ThreatField::RESOURCE_COUNT:     return "resourceCount";
        case ThreatField::TIMELINE_COUNT:     return "timelineCount";
    }
    return "threatType";
}

std::optional<ThreatField> ThreatFieldFromString(const std::string& name) {
    if (name == "threatType")        return ThreatField::THREAT_TYPE;
    if (name == "riskScore")         return ThreatField::RISK_SCORE;
    if (name == "confidence")        return ThreatField::CONFIDENCE;
    if (name == "status")            return ThreatField::STATUS;
    if (name == "affectedResources") return ThreatField::AFFECTED_RESOURCES;
    if (name == "indicatorCount")    return ThreatField::INDICATOR_COUNT;
    if (name == "resourceCount")     return ThreatField::RESOURCE_COUNT;
    if (name == "timelineCount")     return ThreatField::TIMELINE_COUNT;
    return std::nullopt;
}

} // namespace analyzers
} // namespace warden
