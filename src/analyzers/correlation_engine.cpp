/**
 * @file correlation_engine.cpp
 * @brief Implementation of rule-driven event correlation
 *
 * **Grouping**:
 * Events are grouped by the concrete values of the rule's `equals SAME`
 * fields. An event without a value for a grouping field lands in the
 * `unknown` bucket for that field, so events from several anonymous actors
 * may be merged into one group. This is reported through the correlation
 * key (`actorId=unknown`) rather than by dropping the events.
 *
 * **Divergence**:
 * A `not_equals SAME` field is not grouped on. Instead the group must carry
 * at least two distinct (present) values of it, e.g. a brute force spread
 * across several source addresses.
 *
 * @date 2025
 */

#include "warden/analyzers/correlation_engine.hpp"
#include "warden/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <map>
#include <set>

namespace warden {
namespace analyzers {

using core::SecurityEvent;
using core::ThreatIndicator;
using core::ValidationError;

namespace {

bool EventBefore(const SecurityEvent& a, const SecurityEvent& b) {
    if (a.timestamp != b.timestamp) {
        return a.timestamp < b.timestamp;
    }
    return a.id < b.id;
}

// Fields split by their role in grouping, each listed once in declaration order
struct GroupingFields {
    std::vector<EventField> same;
    std::vector<EventField> divergent;
};

GroupingFields CollectGroupingFields(const CorrelationRule& rule) {
    GroupingFields fields;
    for (const auto& condition : rule.conditions) {
        if (!condition.IsSame()) {
            continue;
        }
        auto& target = condition.op == ConditionOperator::EQUALS ? fields.same : fields.divergent;
        if (std::find(target.begin(), target.end(), condition.field) == target.end()) {
            target.push_back(condition.field);
        }
    }
    return fields;
}

std::string GroupKey(const SecurityEvent& event, const std::vector<EventField>& fields) {
    std::vector<std::string> parts;
    parts.reserve(fields.size());
    for (EventField field : fields) {
        auto value = GetEventField(event, field);
        parts.push_back(EventFieldToString(field) + "=" + value.value_or(kUnknownKeyValue));
    }
    return utils::StringUtils::Join(parts, "|");
}

bool HasDivergence(const std::vector<SecurityEvent>& events, const std::vector<EventField>& fields) {
    for (EventField field : fields) {
        std::set<std::string> values;
        for (const auto& event : events) {
            if (auto value = GetEventField(event, field)) {
                values.insert(*value);
            }
        }
        if (values.size() < 2) {
            return false;
        }
    }
    return true;
}

template <typename Accessor>
std::size_t CountDistinct(const std::vector<SecurityEvent>& events, Accessor accessor) {
    std::set<std::string> values;
    for (const auto& event : events) {
        const auto& value = accessor(event);
        if (value) {
            values.insert(*value);
        }
    }
    return values.size();
}

CorrelationCondition Cond(EventField field, ConditionOperator op, ConditionValue value) {
    return MakeCondition(field, op, std::move(value));
}

} // namespace

// ============================================================================
// RULE VALIDATION
// ============================================================================

void ValidateRule(const CorrelationRule& rule) {
    if (rule.id.empty()) {
        throw ValidationError("correlation rule id must not be empty");
    }

    const std::string where = "correlation rule '" + rule.id + "'";

    if (rule.conditions.empty()) {
        throw ValidationError(where + ": at least one condition is required");
    }
    if (rule.time_window.count() <= 0) {
        throw ValidationError(where + ": time window must be positive");
    }
    if (rule.min_events < 1) {
        throw ValidationError(where + ": min_events must be at least 1");
    }
    if (rule.max_events < rule.min_events) {
        throw ValidationError(where + ": max_events must be >= min_events");
    }
    if (rule.risk_multiplier <= 0.0) {
        throw ValidationError(where + ": risk multiplier must be positive");
    }
    if (rule.confidence < 0 || rule.confidence > 100) {
        throw ValidationError(where + ": confidence must be within 0-100");
    }

    for (const auto& condition : rule.conditions) {
        if (condition.op == ConditionOperator::REGEX && !condition.pattern) {
            throw ValidationError(where + ": regex condition was not compiled");
        }
        if (condition.op == ConditionOperator::GREATER_THAN ||
            condition.op == ConditionOperator::LESS_THAN) {
            throw ValidationError(where + ": numeric operators are not supported on event fields");
        }
    }
}

// ============================================================================
// BUILT-IN RULES
// ============================================================================

std::vector<CorrelationRule> DefaultCorrelationRules() {
    using std::chrono::minutes;
    using Op = ConditionOperator;
    using F = EventField;
    using List = std::vector<std::string>;

    std::vector<CorrelationRule> rules;

    {
        CorrelationRule rule;
        rule.id = "coordinated_brute_force";
        rule.name = "Coordinated Brute Force Attack";
        rule.description = "Repeated failed logins against one account from several addresses";
        rule.time_window = minutes(15);
        rule.min_events = 5;
        rule.max_events = 100;
        rule.conditions = {
            Cond(F::ACTION, Op::EQUALS, std::string("FAILED_LOGIN")),
            Cond(F::ACTOR_ID, Op::EQUALS, std::string(kSameValue)),
            Cond(F::IP_ADDRESS, Op::NOT_EQUALS, std::string(kSameValue)),
        };
        rule.risk_multiplier = 2.5;
        rule.confidence = 85;
        rule.priority = 1;
        rules.push_back(std::move(rule));
    }

    {
        CorrelationRule rule;
        rule.id = "privilege_escalation_chain";
        rule.name = "Privilege Escalation Chain";
        rule.description = "Sequence of permission-related actions by one user";
        rule.time_window = minutes(30);
        rule.min_events = 3;
        rule.max_events = 10;
        rule.conditions = {
            Cond(F::ACTION, Op::CONTAINS, std::string("PERMISSION")),
            Cond(F::ACTOR_ID, Op::EQUALS, std::string(kSameValue)),
        };
        rule.risk_multiplier = 3.0;
        rule.confidence = 90;
        rule.priority = 1;
        rules.push_back(std::move(rule));
    }

    {
        CorrelationRule rule;
        rule.id = "data_exfiltration_pattern";
        rule.name = "Data Exfiltration Pattern";
        rule.description = "Bulk exports or downloads by one user";
        rule.time_window = minutes(60);
        rule.min_events = 10;
        rule.max_events = 50;
        rule.conditions = {
            Cond(F::ACTION, Op::IN, List{"EXPORT", "DOWNLOAD"}),
            Cond(F::ACTOR_ID, Op::EQUALS, std::string(kSameValue)),
        };
        rule.risk_multiplier = 2.0;
        rule.confidence = 80;
        rule.priority = 2;
        rules.push_back(std::move(rule));
    }

    {
        CorrelationRule rule;
        rule.id = "lateral_movement";
        rule.name = "Lateral Movement";
        rule.description = "One user accessing several properties in a short time";
        rule.time_window = minutes(30);
        rule.min_events = 5;
        rule.max_events = 20;
        rule.conditions = {
            Cond(F::ACTION, Op::CONTAINS, std::string("ACCESS")),
            Cond(F::ACTOR_ID, Op::EQUALS, std::string(kSameValue)),
            Cond(F::TENANT_ID, Op::NOT_EQUALS, std::string(kSameValue)),
        };
        rule.risk_multiplier = 1.8;
        rule.confidence = 75;
        rule.priority = 3;
        rules.push_back(std::move(rule));
    }

    {
        CorrelationRule rule;
        rule.id = "reconnaissance_activity";
        rule.name = "Reconnaissance Activity";
        rule.description = "High volume of view/list/search actions by one user";
        rule.time_window = minutes(45);
        rule.min_events = 15;
        rule.max_events = 100;
        rule.conditions = {
            Cond(F::ACTION, Op::IN, List{"VIEW", "LIST", "SEARCH"}),
            Cond(F::ACTOR_ID, Op::EQUALS, std::string(kSameValue)),
        };
        rule.risk_multiplier = 1.5;
        rule.confidence = 70;
        rule.priority = 4;
        rules.push_back(std::move(rule));
    }

    {
        CorrelationRule rule;
        rule.id = "session_manipulation";
        rule.name = "Session Manipulation";
        rule.description = "Unusual login/logout churn for one user";
        rule.time_window = minutes(20);
        rule.min_events = 8;
        rule.max_events = 30;
        rule.conditions = {
            Cond(F::ACTION, Op::IN, List{"LOGIN", "LOGOUT", "SESSION"}),
            Cond(F::ACTOR_ID, Op::EQUALS, std::string(kSameValue)),
        };
        rule.risk_multiplier = 1.7;
        rule.confidence = 65;
        rule.priority = 4;
        rules.push_back(std::move(rule));
    }

    return rules;
}

// ============================================================================
// CONSTRUCTOR
// ============================================================================

CorrelationEngine::CorrelationEngine()
    : CorrelationEngine(Config{}) {
}

CorrelationEngine::CorrelationEngine(const Config& config)
    : config_(config) {
}

// ============================================================================
// PUBLIC API - CORRELATION
// ============================================================================

std::vector<EventCorrelation> CorrelationEngine::Correlate(
    const std::vector<SecurityEvent>& events,
    const std::vector<CorrelationRule>& rules) const {

    std::vector<EventCorrelation> correlations;
    if (events.empty()) {
        return correlations;
    }

    for (const auto& rule : rules) {
        if (!rule.enabled) {
            continue;
        }

        try {
            auto matches = EvaluateRule(rule, events);
            if (!matches.empty()) {
                spdlog::debug("Rule {} produced {} correlation(s)", rule.id, matches.size());
            }
            for (auto& match : matches) {
                correlations.push_back(std::move(match));
            }
        }
        catch (const std::exception& e) {
            spdlog::error("Correlation rule {} failed: {}", rule.id, e.what());
        }
    }

    std::stable_sort(correlations.begin(), correlations.end(),
                     [](const EventCorrelation& a, const EventCorrelation& b) {
                         if (a.risk_score != b.risk_score) {
                             return a.risk_score > b.risk_score;
                         }
                         return a.priority < b.priority;
                     });

    if (correlations.size() > config_.max_correlations) {
        correlations.resize(config_.max_correlations);
    }

    return correlations;
}

std::vector<EventCorrelation> CorrelationEngine::EvaluateRule(
    const CorrelationRule& rule,
    const std::vector<SecurityEvent>& events) const {

    std::vector<EventCorrelation> results;

    // Phase 1: per-event filtering on non-SAME conditions
    std::vector<SecurityEvent> matching;
    for (const auto& event : events) {
        bool all_match = std::all_of(rule.conditions.begin(), rule.conditions.end(),
                                     [&event](const CorrelationCondition& condition) {
                                         return EvaluateCondition(condition, event);
                                     });
        if (all_match) {
            matching.push_back(event);
        }
    }

    if (matching.size() < static_cast<std::size_t>(rule.min_events)) {
        return results;
    }

    // Phase 2: group by the SAME fields
    GroupingFields fields = CollectGroupingFields(rule);
    std::map<std::string, std::vector<SecurityEvent>> groups;
    for (auto& event : matching) {
        std::string key = GroupKey(event, fields.same);
        groups[key].push_back(std::move(event));
    }

    // Phase 3: size, window and divergence checks
    for (auto& entry : groups) {
        auto& group = entry.second;
        if (group.size() < static_cast<std::size_t>(rule.min_events) ||
            group.size() > static_cast<std::size_t>(rule.max_events)) {
            continue;
        }

        std::sort(group.begin(), group.end(), EventBefore);

        auto span = std::chrono::duration_cast<std::chrono::milliseconds>(
            group.back().timestamp - group.front().timestamp);
        if (span > rule.time_window) {
            spdlog::debug("Rule {} group [{}] spans {}ms, window {}ms",
                          rule.id, entry.first, span.count(), rule.time_window.count());
            continue;
        }

        if (!HasDivergence(group, fields.divergent)) {
            continue;
        }

        results.push_back(BuildCorrelation(rule, entry.first, std::move(group)));
    }

    return results;
}

// ============================================================================
// CORRELATION CONSTRUCTION
// ============================================================================

EventCorrelation CorrelationEngine::BuildCorrelation(const CorrelationRule& rule,
                                                     const std::string& key,
                                                     std::vector<SecurityEvent> events) const {
    EventCorrelation correlation;
    correlation.rule_id = rule.id;
    correlation.rule_name = rule.name;
    correlation.correlation_key = key;
    correlation.confidence = rule.confidence;
    correlation.priority = rule.priority;

    CorrelationPattern& pattern = correlation.pattern;
    pattern.event_count = events.size();
    pattern.time_span = std::chrono::duration_cast<std::chrono::milliseconds>(
        events.back().timestamp - events.front().timestamp);
    pattern.frequency = pattern.time_span.count() > 0
        ? static_cast<double>(events.size()) * scoring::kMillisPerMinute /
              static_cast<double>(pattern.time_span.count())
        : static_cast<double>(events.size());
    pattern.unique_actors = CountDistinct(events, [](const SecurityEvent& e) -> const auto& { return e.actor_id; });
    pattern.unique_ips = CountDistinct(events, [](const SecurityEvent& e) -> const auto& { return e.ip_address; });
    pattern.unique_tenants = CountDistinct(events, [](const SecurityEvent& e) -> const auto& { return e.tenant_id; });

    std::set<std::string> actions;
    for (const auto& event : events) {
        actions.insert(event.action);
    }
    pattern.unique_actions = actions.size();

    double base = scoring::BaseScore(pattern.event_count, rule.min_events,
                                     pattern.time_span, pattern.unique_actions);
    correlation.risk_score = scoring::CorrelationRisk(base, rule.risk_multiplier);

    correlation.indicators = ExtractIndicators(events);

    std::set<std::string> resources;
    for (const auto& event : events) {
        for (auto& resource : core::AffectedResourcesOf(event)) {
            resources.insert(std::move(resource));
        }
    }
    correlation.affected_resources.assign(resources.begin(), resources.end());

    correlation.detected_at = events.back().timestamp;
    correlation.events = std::move(events);

    return correlation;
}

std::vector<ThreatIndicator> CorrelationEngine::ExtractIndicators(
    const std::vector<SecurityEvent>& events) const {

    struct Observation {
        int count{0};
        core::TimePoint first;
        core::TimePoint last;
    };

    auto observe = [](std::map<std::string, Observation>& seen,
                      const std::string& value, core::TimePoint when) {
        auto& obs = seen[value];
        if (obs.count == 0 || when < obs.first) obs.first = when;
        if (obs.count == 0 || when > obs.last) obs.last = when;
        ++obs.count;
    };

    std::map<std::string, Observation> ips;
    std::map<std::string, Observation> users;
    std::set<std::string> actions;

    for (const auto& event : events) {
        if (event.ip_address) {
            observe(ips, *event.ip_address, event.timestamp);
        }
        if (event.actor_id) {
            observe(users, *event.actor_id, event.timestamp);
        }
        actions.insert(event.action);
    }

    std::vector<ThreatIndicator> indicators;

    for (const auto& [ip, obs] : ips) {
        ThreatIndicator indicator;
        indicator.type = core::IndicatorType::IP;
        indicator.value = ip;
        indicator.confidence = scoring::IpIndicatorConfidence(obs.count);
        indicator.first_seen = obs.first;
        indicator.last_seen = obs.last;
        indicator.occurrences = obs.count;
        indicators.push_back(std::move(indicator));
    }

    for (const auto& [user, obs] : users) {
        ThreatIndicator indicator;
        indicator.type = core::IndicatorType::USER;
        indicator.value = user;
        indicator.confidence = scoring::UserIndicatorConfidence(obs.count);
        indicator.first_seen = obs.first;
        indicator.last_seen = obs.last;
        indicator.occurrences = obs.count;
        indicators.push_back(std::move(indicator));
    }

    if (actions.size() > 1) {
        ThreatIndicator indicator;
        indicator.type = core::IndicatorType::PATTERN;
        indicator.value = "multi_action_" + std::to_string(actions.size());
        indicator.confidence = scoring::kPatternIndicatorConfidence;
        indicator.first_seen = events.front().timestamp;
        indicator.last_seen = events.back().timestamp;
        indicator.occurrences = static_cast<int>(events.size());
        indicators.push_back(std::move(indicator));
    }

    return indicators;
}

} // namespace analyzers
} // namespace warden
