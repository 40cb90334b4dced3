/**
 * @file conditions.hpp
 * @brief Typed rule conditions evaluated against events and threats
 *
 * Rule conditions address a closed set of fields through enum-keyed
 * accessors, so a misspelled field is rejected when the rule is built or
 * loaded instead of silently comparing against nothing.
 *
 * **Operators**:
 * - equals / not_equals: exact string (or numeric) comparison
 * - contains: substring match
 * - in / not_in: membership in a list of strings
 * - regex: ECMAScript regex search (compiled once, at rule build time)
 * - greater_than / less_than: numeric fields only (threat conditions)
 *
 * The string value `SAME` is reserved for correlation conditions: with
 * `equals` it groups events by that field, with `not_equals` it requires
 * the group to span at least two distinct values of the field.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <variant>
#include <optional>
#include <memory>
#include <regex>

#include "warden/core/security_types.hpp"

namespace warden {
namespace analyzers {

/// Reserved value meaning "equal (or distinct) across the correlated group"
inline constexpr const char* kSameValue = "SAME";

/**
 * @enum ConditionOperator
 * @brief Comparison applied between a field and a rule value
 */
enum class ConditionOperator {
    EQUALS,
    NOT_EQUALS,
    CONTAINS,
    IN,
    NOT_IN,
    REGEX,
    GREATER_THAN,
    LESS_THAN
};

/**
 * @enum EventField
 * @brief SecurityEvent fields addressable by correlation rules
 */
enum class EventField {
    ACTION,
    ACTOR_ID,
    TENANT_ID,
    IP_ADDRESS,
    RESOURCE,
    RESOURCE_ID
};

/**
 * @enum ThreatField
 * @brief ThreatIntelligence fields addressable by response rules
 */
enum class ThreatField {
    THREAT_TYPE,
    RISK_SCORE,
    CONFIDENCE,
    STATUS,
    AFFECTED_RESOURCES,
    INDICATOR_COUNT,    ///< Number of indicators
    RESOURCE_COUNT,     ///< Number of affected resources
    TIMELINE_COUNT      ///< Number of timeline entries
};

/// Rule value: a string, a number, or a list of strings
using ConditionValue = std::variant<std::string, double, std::vector<std::string>>;

/**
 * @struct RuleCondition
 * @brief One field/operator/value triple
 *
 * Build instances through MakeCondition() so the value shape is checked
 * and regex patterns are compiled up front.
 */
template <typename Field>
struct RuleCondition {
    Field field;
    ConditionOperator op{ConditionOperator::EQUALS};
    ConditionValue value;
    std::shared_ptr<const std::regex> pattern;  ///< Set when op == REGEX

    /// True when the value is the reserved `SAME` marker
    bool IsSame() const {
        const auto* text = std::get_if<std::string>(&value);
        return text != nullptr && *text == kSameValue;
    }
};

using CorrelationCondition = RuleCondition<EventField>;
using ResponseCondition = RuleCondition<ThreatField>;

/**
 * @brief Build a validated correlation condition
 * @throws core::ValidationError on an operator/value mismatch or bad regex
 */
CorrelationCondition MakeCondition(EventField field, ConditionOperator op, ConditionValue value);

/**
 * @brief Build a validated response condition
 * @throws core::ValidationError on an operator/value mismatch or bad regex
 */
ResponseCondition MakeCondition(ThreatField field, ConditionOperator op, ConditionValue value);

/// Field accessor; nullopt when the event has no value for the field
std::optional<std::string> GetEventField(const core::SecurityEvent& event, EventField field);

/// Field accessor; strings, numbers or string lists depending on the field
ConditionValue GetThreatField(const core::ThreatIntelligence& threat, ThreatField field);

/**
 * @brief Evaluate a non-SAME condition against one event
 *
 * SAME conditions always pass here; they are group-level constraints.
 * A missing field fails positive operators (equals, contains, in, regex)
 * and passes negative ones (not_equals, not_in).
 */
bool EvaluateCondition(const CorrelationCondition& condition, const core::SecurityEvent& event);

/// Evaluate a condition against a threat record
bool EvaluateCondition(const ResponseCondition& condition, const core::ThreatIntelligence& threat);

// Name conversions (config files use camelCase field names as in the audit schema)

std::string OperatorToString(ConditionOperator op);
std::optional<ConditionOperator> OperatorFromString(const std::string& name);

std::string EventFieldToString(EventField field);
std::optional<EventField> EventFieldFromString(const std::string& name);

std::string ThreatFieldToString(ThreatField field);
std::optional<ThreatField> ThreatFieldFromString(const std::string& name);

} // namespace analyzers
} // namespace warden
