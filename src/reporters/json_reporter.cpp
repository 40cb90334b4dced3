/**
 * @file json_reporter.cpp
 * @brief nlohmann::json serialization of pipeline records
 *
 * **Conventions**:
 * - snake_case keys
 * - timestamps as ISO-8601 UTC strings, durations as `*_ms` integers
 * - optional event fields are omitted when absent
 *
 * @date 2025
 */

#include "warden/reporters/json_reporter.hpp"
#include "warden/utils/time_utils.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace warden {
namespace reporters {

using utils::TimeUtils;

namespace {

std::string Timestamp(const core::TimePoint& time) {
    return TimeUtils::FormatTimestamp(time);
}

json StringMap(const std::map<std::string, std::string>& values) {
    json j = json::object();
    for (const auto& [key, value] : values) {
        j[key] = value;
    }
    return j;
}

json ToJson(const core::SecurityEvent& event) {
    json j;
    j["id"] = event.id;
    j["timestamp"] = Timestamp(event.timestamp);
    j["action"] = event.action;
    if (event.actor_id)    j["actor_id"] = *event.actor_id;
    if (event.tenant_id)   j["tenant_id"] = *event.tenant_id;
    if (event.resource)    j["resource"] = *event.resource;
    if (event.resource_id) j["resource_id"] = *event.resource_id;
    if (event.ip_address)  j["ip_address"] = *event.ip_address;
    if (!event.details.empty()) {
        j["details"] = StringMap(event.details);
    }
    return j;
}

json ToJson(const core::ThreatIndicator& indicator) {
    return json{
        {"type", core::IndicatorTypeToString(indicator.type)},
        {"value", indicator.value},
        {"confidence", indicator.confidence},
        {"occurrences", indicator.occurrences},
        {"first_seen", Timestamp(indicator.first_seen)},
        {"last_seen", Timestamp(indicator.last_seen)}
    };
}

json ToJson(const core::TimelineEntry& entry) {
    json j{
        {"timestamp", Timestamp(entry.timestamp)},
        {"event", entry.event},
        {"severity", core::SeverityToString(entry.severity)}
    };
    if (!entry.details.empty()) {
        j["details"] = StringMap(entry.details);
    }
    return j;
}

// Element types serialized through ArrayOf; defined below
json ToJson(const core::Evidence& evidence);
json ToJson(const core::ResponseActionRecord& record);
json ToJson(const analyzers::EventCorrelation& correlation);
json ToJson(const analyzers::CorrelationRule& rule);
json ToJson(const response::ResponseAction& action);
json ToJson(const response::ExecutedAction& executed);
json ToJson(const response::ResponseRule& rule);

template <typename T>
json ArrayOf(const std::vector<T>& items) {
    json array = json::array();
    for (const auto& item : items) {
        array.push_back(ToJson(item));
    }
    return array;
}

json ToJson(const analyzers::CorrelationPattern& pattern) {
    return json{
        {"event_count", pattern.event_count},
        {"time_span_ms", pattern.time_span.count()},
        {"frequency_per_minute", pattern.frequency},
        {"unique_actors", pattern.unique_actors},
        {"unique_ips", pattern.unique_ips},
        {"unique_tenants", pattern.unique_tenants},
        {"unique_actions", pattern.unique_actions}
    };
}

json ToJson(const analyzers::EventCorrelation& correlation) {
    json event_ids = json::array();
    for (const auto& event : correlation.events) {
        event_ids.push_back(event.id);
    }

    return json{
        {"rule_id", correlation.rule_id},
        {"rule_name", correlation.rule_name},
        {"correlation_key", correlation.correlation_key},
        {"risk_score", correlation.risk_score},
        {"confidence", correlation.confidence},
        {"priority", correlation.priority},
        {"pattern", ToJson(correlation.pattern)},
        {"event_ids", event_ids},
        {"indicators", ArrayOf(correlation.indicators)},
        {"affected_resources", correlation.affected_resources},
        {"detected_at", Timestamp(correlation.detected_at)}
    };
}

json ToJson(const core::ThreatIntelligence& threat) {
    return json{
        {"threat_id", threat.threat_id},
        {"threat_type", threat.threat_type},
        {"risk_score", threat.risk_score},
        {"confidence", threat.confidence},
        {"status", core::ThreatStatusToString(threat.status)},
        {"indicators", ArrayOf(threat.indicators)},
        {"affected_resources", threat.affected_resources},
        {"timeline", ArrayOf(threat.timeline)},
        {"source_event_ids", threat.source_event_ids},
        {"created_at", Timestamp(threat.created_at)},
        {"updated_at", Timestamp(threat.updated_at)}
    };
}

json ToJson(const core::Evidence& evidence) {
    return json{
        {"type", core::IndicatorTypeToString(evidence.type)},
        {"value", evidence.value},
        {"timestamp", Timestamp(evidence.timestamp)},
        {"confidence", evidence.confidence}
    };
}

json ToJson(const core::ResponseActionRecord& record) {
    return json{
        {"rule_id", record.rule_id},
        {"action_type", record.action_type},
        {"success", record.success},
        {"message", record.message},
        {"executed_at", Timestamp(record.executed_at)}
    };
}

json ToJson(const core::SecurityIncident& incident) {
    json j{
        {"id", incident.id},
        {"threat_id", incident.threat_id},
        {"severity", core::SeverityToString(incident.severity)},
        {"status", core::IncidentStatusToString(incident.status)},
        {"title", incident.title},
        {"description", incident.description},
        {"affected_resources", incident.affected_resources},
        {"created_at", Timestamp(incident.created_at)},
        {"updated_at", Timestamp(incident.updated_at)},
        {"escalated", incident.escalated},
        {"timeline", ArrayOf(incident.timeline)},
        {"evidence", ArrayOf(incident.evidence)},
        {"response_actions", ArrayOf(incident.response_actions)}
    };
    j["resolution"] = incident.resolution ? json(*incident.resolution) : json(nullptr);
    return j;
}

json ToJson(const core::IncidentPatch& patch) {
    json j;
    if (patch.status) {
        j["status"] = core::IncidentStatusToString(*patch.status);
    }
    if (patch.severity) {
        j["severity"] = core::SeverityToString(*patch.severity);
    }
    if (patch.escalated) {
        j["escalated"] = *patch.escalated;
    }
    if (patch.response_actions) {
        j["response_actions"] = ArrayOf(*patch.response_actions);
    }
    if (patch.resolution) {
        j["resolution"] = *patch.resolution;
    }
    j["updated_at"] = Timestamp(patch.updated_at);
    return j;
}

json ToJson(const core::SecurityAlert& alert) {
    return json{
        {"id", alert.id},
        {"threat_id", alert.threat_id},
        {"incident_id", alert.incident_id},
        {"level", core::SeverityToString(alert.level)},
        {"title", alert.title},
        {"message", alert.message},
        {"channels", alert.channels},
        {"action_required", alert.action_required},
        {"escalated", alert.escalated},
        {"created_at", Timestamp(alert.created_at)},
        {"details", StringMap(alert.details)}
    };
}

json ToJson(const response::ResponseAction& action) {
    return json{
        {"type", response::ActionTypeToString(action.type)},
        {"parameters", StringMap(action.parameters)}
    };
}

json ToJson(const response::ExecutedAction& executed) {
    json j{
        {"rule_id", executed.rule_id},
        {"type", response::ActionTypeToString(executed.action.type)},
        {"parameters", StringMap(executed.action.parameters)},
        {"success", executed.result.success},
        {"message", executed.result.message},
        {"executed_at", Timestamp(executed.executed_at)},
        {"duration_ms", executed.duration.count()}
    };
    if (!executed.result.details.empty()) {
        j["details"] = StringMap(executed.result.details);
    }
    return j;
}

json ToJson(const response::AutomatedResponseResult& result) {
    return json{
        {"threat_id", result.threat_id},
        {"incident_id", result.incident_id},
        {"success", result.success},
        {"message", result.message},
        {"rules_executed", result.rules_executed},
        {"actions_executed", ArrayOf(result.actions_executed)},
        {"execution_time_ms", result.execution_time.count()},
        {"errors", result.errors},
        {"executed_at", Timestamp(result.executed_at)}
    };
}

json ConditionValueToJson(const analyzers::ConditionValue& value) {
    if (const auto* text = std::get_if<std::string>(&value)) {
        return *text;
    }
    if (const auto* number = std::get_if<double>(&value)) {
        return *number;
    }
    return std::get<std::vector<std::string>>(value);
}

template <typename Field, typename NameOf>
json ConditionsToJson(const std::vector<analyzers::RuleCondition<Field>>& conditions, NameOf name_of) {
    json array = json::array();
    for (const auto& condition : conditions) {
        array.push_back(json{
            {"field", name_of(condition.field)},
            {"operator", analyzers::OperatorToString(condition.op)},
            {"value", ConditionValueToJson(condition.value)}
        });
    }
    return array;
}

json ToJson(const analyzers::CorrelationRule& rule) {
    return json{
        {"id", rule.id},
        {"name", rule.name},
        {"description", rule.description},
        {"time_window_ms", rule.time_window.count()},
        {"min_events", rule.min_events},
        {"max_events", rule.max_events},
        {"conditions", ConditionsToJson(rule.conditions, analyzers::EventFieldToString)},
        {"risk_multiplier", rule.risk_multiplier},
        {"confidence", rule.confidence},
        {"priority", rule.priority},
        {"enabled", rule.enabled}
    };
}

json ToJson(const response::ResponseRule& rule) {
    return json{
        {"id", rule.id},
        {"name", rule.name},
        {"conditions", ConditionsToJson(rule.conditions, analyzers::ThreatFieldToString)},
        {"actions", ArrayOf(rule.actions)},
        {"priority", rule.priority},
        {"enabled", rule.enabled},
        {"auto_execute", rule.auto_execute}
    };
}

} // namespace

// ============================================================================
// CONSTRUCTOR
// ============================================================================

JsonReporter::JsonReporter(const JsonReporterConfig& config)
    : config_(config) {
}

namespace {

std::string Dump(const json& j, const JsonReporterConfig& config) {
    // Replace invalid UTF-8 from audit payloads instead of throwing
    return j.dump(config.pretty_print ? config.indent : -1, ' ', false,
                  json::error_handler_t::replace);
}

} // namespace

// ============================================================================
// PUBLIC API
// ============================================================================

std::string JsonReporter::EventToJson(const core::SecurityEvent& event) const {
    return Dump(ToJson(event), config_);
}

std::string JsonReporter::CorrelationToJson(const analyzers::EventCorrelation& correlation) const {
    return Dump(ToJson(correlation), config_);
}

std::string JsonReporter::CorrelationsToJson(
    const std::vector<analyzers::EventCorrelation>& correlations) const {
    json root{
        {"count", correlations.size()},
        {"correlations", ArrayOf(correlations)}
    };
    return Dump(root, config_);
}

std::string JsonReporter::ThreatToJson(const core::ThreatIntelligence& threat) const {
    return Dump(ToJson(threat), config_);
}

std::string JsonReporter::IncidentToJson(const core::SecurityIncident& incident) const {
    return Dump(ToJson(incident), config_);
}

std::string JsonReporter::AlertToJson(const core::SecurityAlert& alert) const {
    return Dump(ToJson(alert), config_);
}

std::string JsonReporter::ResponseResultToJson(const response::AutomatedResponseResult& result) const {
    return Dump(ToJson(result), config_);
}

std::string JsonReporter::AuditRecordToJson(const response::AuditRecord& record) const {
    json j{
        {"kind", record.kind},
        {"threat_id", record.threat_id},
        {"incident_id", record.incident_id},
        {"recorded_at", Timestamp(record.recorded_at)},
        {"details", StringMap(record.details)}
    };
    if (!record.actions.empty()) {
        j["actions"] = ArrayOf(record.actions);
    }
    return Dump(j, config_);
}

std::string JsonReporter::StatsToJson(const monitors::MonitoringStats& stats) const {
    json j{
        {"state", monitors::MonitorStateToString(stats.state)},
        {"start_time", Timestamp(stats.start_time)},
        {"uptime_ms", stats.uptime.count()},
        {"last_check", Timestamp(stats.last_check)},
        {"events_processed", stats.events_processed},
        {"threats_detected", stats.threats_detected},
        {"correlations_detected", stats.correlations_detected},
        {"incidents_created", stats.incidents_created},
        {"incidents_escalated", stats.incidents_escalated},
        {"duplicate_threats_skipped", stats.duplicate_threats_skipped},
        {"threats_below_threshold", stats.threats_below_threshold},
        {"auto_responses_triggered", stats.auto_responses_triggered},
        {"auto_responses_suppressed", stats.auto_responses_suppressed},
        {"response_failures", stats.response_failures},
        {"alerts_sent", stats.alerts_sent},
        {"alerts_failed", stats.alerts_failed},
        {"errors", {
            {"ingestion", stats.ingestion_errors},
            {"deep_detection", stats.deep_detection_errors},
            {"correlation", stats.correlation_errors},
            {"classification", stats.classification_errors}
        }},
        {"last_tick_duration_ms", stats.last_tick_duration.count()},
        {"cursor", stats.cursor}
    };
    return Dump(j, config_);
}

std::string JsonReporter::IndicatorStatsToJson(const stores::IndicatorStats& stats) const {
    json j{
        {"total", stats.total},
        {"by_type", stats.by_type},
        {"by_severity", stats.by_severity},
        {"lookups", stats.lookups},
        {"hits", stats.hits},
        {"expired_removed", stats.expired_removed}
    };
    return Dump(j, config_);
}

std::string JsonReporter::IncidentCreatedRecord(const core::SecurityIncident& incident) const {
    json j{
        {"record", "incident"},
        {"incident", ToJson(incident)}
    };
    return Dump(j, config_);
}

std::string JsonReporter::IncidentUpdatedRecord(const std::string& incident_id,
                                                const core::IncidentPatch& patch) const {
    json j{
        {"record", "incident_update"},
        {"id", incident_id},
        {"patch", ToJson(patch)}
    };
    return Dump(j, config_);
}

std::string JsonReporter::RulesToJson(const std::vector<analyzers::CorrelationRule>& correlation_rules,
                                      const std::vector<response::ResponseRule>& response_rules) const {
    json j{
        {"correlation_rules", ArrayOf(correlation_rules)},
        {"response_rules", ArrayOf(response_rules)}
    };
    return Dump(j, config_);
}

bool JsonReporter::ValidateJson(const std::string& json_string) const {
    try {
        auto parsed = json::parse(json_string);
        (void)parsed;
        return true;
    }
    catch (const json::parse_error& e) {
        spdlog::debug("JSON validation failed: {}", e.what());
        return false;
    }
}

} // namespace reporters
} // namespace warden
