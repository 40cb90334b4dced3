/**
 * @file json_reporter.hpp
 * @brief Machine-readable JSON output for every pipeline record
 *
 * Used by the JSON-lines sinks and audit trail (compact, one object per
 * line) and by the CLI (pretty printed). Timestamps are ISO-8601 UTC with
 * millisecond precision. Rule output uses the same shape the configuration
 * loader accepts, so `warden rules` output can be fed back as a config.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>

#include "warden/core/security_types.hpp"
#include "warden/analyzers/correlation_engine.hpp"
#include "warden/response/response_types.hpp"
#include "warden/response/audit_trail.hpp"
#include "warden/monitors/monitoring_types.hpp"
#include "warden/stores/indicator_store.hpp"

namespace warden {
namespace reporters {

/**
 * @struct JsonReporterConfig
 * @brief Output formatting
 */
struct JsonReporterConfig {
    bool pretty_print{true};   ///< Indent nested objects
    int indent{2};             ///< Spaces per level when pretty printing
};

/**
 * @class JsonReporter
 * @brief Serializes events, correlations, threats, incidents, alerts,
 *        response results, audit records, statistics and rules
 *
 * **Usage Example**:
 * @code
 * JsonReporter reporter;
 * std::cout << reporter.CorrelationsToJson(engine.Correlate(events, rules)) << std::endl;
 *
 * JsonReporter compact(JsonReporterConfig{false, 0});
 * stream << compact.AlertToJson(alert) << '\n';
 * @endcode
 */
class JsonReporter {
public:
    explicit JsonReporter(const JsonReporterConfig& config = JsonReporterConfig{});

    std::string EventToJson(const core::SecurityEvent& event) const;
    std::string CorrelationToJson(const analyzers::EventCorrelation& correlation) const;
    std::string CorrelationsToJson(const std::vector<analyzers::EventCorrelation>& correlations) const;
    std::string ThreatToJson(const core::ThreatIntelligence& threat) const;
    std::string IncidentToJson(const core::SecurityIncident& incident) const;
    std::string AlertToJson(const core::SecurityAlert& alert) const;
    std::string ResponseResultToJson(const response::AutomatedResponseResult& result) const;
    std::string AuditRecordToJson(const response::AuditRecord& record) const;
    std::string StatsToJson(const monitors::MonitoringStats& stats) const;
    std::string IndicatorStatsToJson(const stores::IndicatorStats& stats) const;

    /// `{"record": "incident", "incident": {...}}`
    std::string IncidentCreatedRecord(const core::SecurityIncident& incident) const;

    /// `{"record": "incident_update", "id": "...", "patch": {...}}`
    std::string IncidentUpdatedRecord(const std::string& incident_id, const core::IncidentPatch& patch) const;

    /**
     * @brief Rule sets in configuration-file shape
     *
     * `{"correlation_rules": [...], "response_rules": [...]}`
     */
    std::string RulesToJson(const std::vector<analyzers::CorrelationRule>& correlation_rules,
                            const std::vector<response::ResponseRule>& response_rules) const;

    /// Syntax check
    bool ValidateJson(const std::string& json_string) const;

    void UpdateConfig(const JsonReporterConfig& config) { config_ = config; }

private:
    JsonReporterConfig config_;
};

} // namespace reporters
} // namespace warden
