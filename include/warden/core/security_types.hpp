/**
 * @file security_types.hpp
 * @brief Core data model shared by the correlation, classification and response pipeline
 *
 * Defines the immutable audit-derived SecurityEvent, the unified
 * ThreatIntelligence record, SecurityIncident and SecurityAlert, together
 * with the enum <-> string helpers used by configuration and reporting.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <chrono>
#include <functional>
#include <stdexcept>
#include <cstdint>

namespace warden {
namespace core {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

/// Injectable time source (tests replace it with a controllable clock)
using ClockFunction = std::function<TimePoint()>;

/**
 * @class ValidationError
 * @brief Raised when a rule or configuration value is rejected
 *
 * Stores are left unchanged when this is thrown.
 */
class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @struct SecurityEvent
 * @brief Immutable fact read from the audit log
 *
 * Created by the audit log and never mutated by the pipeline. Optional
 * fields are absent when the source record had no value for them.
 */
struct SecurityEvent {
    int64_t id{0};                              ///< Monotonic, source-assigned id
    TimePoint timestamp;                        ///< When the audited action happened
    std::optional<std::string> actor_id;        ///< Acting user
    std::optional<std::string> tenant_id;       ///< Property / business unit
    std::string action;                         ///< Free-form verb (FAILED_LOGIN, EXPORT...)
    std::optional<std::string> resource;        ///< Resource kind
    std::optional<std::string> resource_id;     ///< Resource identifier
    std::optional<std::string> ip_address;      ///< Client address
    std::map<std::string, std::string> details; ///< Opaque payload
};

/**
 * @enum Severity
 * @brief Severity tiers used for events, incidents and alerts
 */
enum class Severity {
    INFO,
    LOW,
    MEDIUM,
    HIGH,
    CRITICAL
};

/**
 * @enum IndicatorType
 * @brief Kinds of indicators of compromise attached to a threat
 */
enum class IndicatorType {
    IP,         ///< Client IP address
    USER,       ///< Actor id
    DEVICE,     ///< Device fingerprint
    PATTERN,    ///< Behavioural pattern (multi-action sequence)
    BEHAVIOR,   ///< Behavioural anomaly
    DOMAIN,     ///< DNS name (threat feed)
    URL,        ///< URL (threat feed)
    HASH        ///< File hash (threat feed)
};

/**
 * @struct ThreatIndicator
 * @brief One indicator of compromise and how often it was observed
 */
struct ThreatIndicator {
    IndicatorType type{IndicatorType::IP};
    std::string value;
    int confidence{0};          ///< 0-100
    TimePoint first_seen;
    TimePoint last_seen;
    int occurrences{1};
};

/**
 * @enum ThreatStatus
 * @brief Lifecycle of a ThreatIntelligence record
 */
enum class ThreatStatus {
    ACTIVE,
    INVESTIGATING,
    CONTAINED,
    RESOLVED,
    FALSE_POSITIVE
};

/**
 * @struct TimelineEntry
 * @brief One step of a threat or incident timeline
 */
struct TimelineEntry {
    TimePoint timestamp;
    std::string event;                          ///< Human-readable description
    Severity severity{Severity::LOW};
    std::map<std::string, std::string> details;
};

/**
 * @struct ThreatIntelligence
 * @brief Unified threat record
 *
 * Produced either by classifying a single event or by converting an
 * EventCorrelation. The threat id is deterministic for a given source so
 * that incident creation is idempotent per threat.
 */
struct ThreatIntelligence {
    std::string threat_id;
    std::string threat_type;                    ///< e.g. brute_force_advanced, coordinated_attack
    int risk_score{0};                          ///< 0-100
    int confidence{0};                          ///< 0-100
    std::vector<ThreatIndicator> indicators;
    std::vector<std::string> affected_resources;
    std::vector<TimelineEntry> timeline;
    ThreatStatus status{ThreatStatus::ACTIVE};
    TimePoint created_at;
    TimePoint updated_at;
    std::vector<int64_t> source_event_ids;      ///< Audit events the threat was built from
};

/**
 * @enum IncidentStatus
 * @brief Incident lifecycle; incidents are never deleted, only closed
 */
enum class IncidentStatus {
    OPEN,
    INVESTIGATING,
    CONTAINED,
    RESOLVED,
    CLOSED
};

/**
 * @struct Evidence
 * @brief Indicator snapshot stored on an incident
 */
struct Evidence {
    IndicatorType type{IndicatorType::IP};
    std::string value;
    TimePoint timestamp;
    int confidence{0};
};

/**
 * @struct ResponseActionRecord
 * @brief Outcome of one automated action, as recorded on the incident
 */
struct ResponseActionRecord {
    std::string rule_id;
    std::string action_type;
    bool success{false};
    std::string message;
    TimePoint executed_at;
};

/**
 * @struct SecurityIncident
 * @brief Durable record of one detected problem
 */
struct SecurityIncident {
    std::string id;
    std::string threat_id;
    Severity severity{Severity::LOW};
    IncidentStatus status{IncidentStatus::OPEN};
    std::string title;
    std::string description;
    std::vector<std::string> affected_resources;
    TimePoint created_at;
    TimePoint updated_at;
    bool escalated{false};
    std::vector<TimelineEntry> timeline;
    std::vector<Evidence> evidence;
    std::vector<ResponseActionRecord> response_actions;  ///< Filled after the response engine runs
    std::optional<std::string> resolution;
};

/**
 * @struct IncidentPatch
 * @brief Partial update applied through IncidentSink::UpdateIncident
 */
struct IncidentPatch {
    std::optional<IncidentStatus> status;
    std::optional<Severity> severity;                ///< Raised when a re-scan scores higher
    std::optional<bool> escalated;
    std::optional<std::vector<ResponseActionRecord>> response_actions;
    std::optional<std::string> resolution;
    TimePoint updated_at;
};

/**
 * @struct SecurityAlert
 * @brief Alert handed to the dispatcher after incident handling
 */
struct SecurityAlert {
    std::string id;
    std::string threat_id;
    std::string incident_id;
    Severity level{Severity::LOW};
    std::string title;
    std::string message;
    std::vector<std::string> channels;  ///< email, sms, push, dashboard, webhook, slack
    bool action_required{false};
    bool escalated{false};
    TimePoint created_at;
    std::map<std::string, std::string> details;
};

// String conversions (used by config loading and reporting)

std::string SeverityToString(Severity severity);
std::optional<Severity> SeverityFromString(const std::string& name);

std::string IndicatorTypeToString(IndicatorType type);
std::optional<IndicatorType> IndicatorTypeFromString(const std::string& name);

std::string ThreatStatusToString(ThreatStatus status);
std::optional<ThreatStatus> ThreatStatusFromString(const std::string& name);

std::string IncidentStatusToString(IncidentStatus status);

/**
 * @brief Bucket a 0-100 risk score into a severity tier
 *
 * Thresholds are inclusive lower bounds: score >= critical is CRITICAL,
 * >= high is HIGH, >= medium is MEDIUM, anything else LOW.
 */
Severity SeverityFromRisk(int risk_score, int critical = 90, int high = 75, int medium = 50);

/**
 * @brief Resource labels touched by an event
 *
 * `user_<actor>`, `property_<tenant>` and `<resource>_<resourceId>`, each
 * present only when the event carries the underlying fields.
 */
std::vector<std::string> AffectedResourcesOf(const SecurityEvent& event);

/**
 * @brief Process-unique identifier `<prefix>-<yyyymmddHHMMSS>-<seq>`
 *
 * Used for incidents (INC) and alerts (ALR). The sequence is shared by all
 * prefixes and never repeats within a process.
 */
std::string MakeSequentialId(const std::string& prefix, TimePoint when);

} // namespace core
} // namespace warden
