/**
 * @file real_time_monitor.hpp
 * @brief Orchestrates ingestion, deep detection, correlation and response
 *
 * The monitor owns three independently scheduled activities:
 * - **Ingestion**: reads events after the cursor, classifies each one
 * - **Deep detection**: re-classifies a slightly larger recent window
 * - **Correlation**: runs the correlation rules over the recent window
 *
 * Every detected threat goes through the same incident handling: incident
 * creation (idempotent per threat id), an optional rate-limited automated
 * response, and an alert routed by severity.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <memory>
#include <mutex>
#include <functional>
#include <cstdint>

#include "warden/core/security_types.hpp"
#include "warden/core/collaborators.hpp"
#include "warden/analyzers/correlation_engine.hpp"
#include "warden/response/response_engine.hpp"
#include "warden/monitors/monitoring_types.hpp"
#include "warden/monitors/periodic_task.hpp"
#include "warden/stores/rule_store.hpp"

namespace warden {
namespace monitors {

using CorrelationRuleStore = stores::RuleStore<analyzers::CorrelationRule>;

/**
 * @struct MonitorDependencies
 * @brief Collaborators injected into the monitor
 *
 * `source`, `incidents`, `alerts`, `responder` and `correlation_rules` are
 * required; `enrichment` is optional.
 */
struct MonitorDependencies {
    std::shared_ptr<core::EventSource> source;
    std::shared_ptr<core::IncidentSink> incidents;
    std::shared_ptr<core::AlertDispatcher> alerts;
    std::shared_ptr<response::ResponseEngine> responder;
    std::shared_ptr<CorrelationRuleStore> correlation_rules;
    std::shared_ptr<core::EnrichmentProvider> enrichment;
    core::ClockFunction clock{core::Clock::now};
};

/**
 * @struct MonitorObservers
 * @brief Optional notifications, called on the tick thread
 *
 * An observer that throws is logged and otherwise ignored.
 */
struct MonitorObservers {
    std::function<void(const core::ThreatIntelligence&)> on_threat_detected;
    std::function<void(const core::SecurityIncident&)> on_incident_created;
    std::function<void(const response::AutomatedResponseResult&)> on_response_executed;
    std::function<void(const core::SecurityAlert&)> on_alert_sent;
};

/**
 * @class RealTimeMonitor
 * @brief Poll-driven security monitor
 *
 * State machine: STOPPED -> STARTING -> RUNNING -> STOPPING -> STOPPED,
 * with ERROR reachable from STARTING when a collaborator is unavailable.
 * Start() may be retried from ERROR.
 *
 * **Usage Example**:
 * @code
 * RealTimeMonitor monitor(deps, config);
 * if (!monitor.Start()) {
 *     spdlog::error("Monitor failed to start");
 * }
 * ...
 * monitor.Stop();
 * auto stats = monitor.GetStats();
 * @endcode
 */
class RealTimeMonitor {
public:
    /// @throws core::ValidationError for a missing collaborator or invalid config
    explicit RealTimeMonitor(MonitorDependencies deps,
                             const MonitoringConfig& config = MonitoringConfig{});
    ~RealTimeMonitor();

    RealTimeMonitor(const RealTimeMonitor&) = delete;
    RealTimeMonitor& operator=(const RealTimeMonitor&) = delete;

    /**
     * @brief Check collaborators and start the schedules
     * @return false (state ERROR) if initialization failed
     */
    bool Start();

    /**
     * @brief Halt all schedules
     *
     * In-flight ticks get the configured grace period to finish and are
     * abandoned after that.
     */
    void Stop();

    /// Run ingestion, deep detection and correlation once, synchronously
    void ForceCheck();

    /**
     * @brief Apply new settings
     *
     * Only schedules whose interval or enable flag changed are restarted.
     * @throws core::ValidationError, leaving the current config in place
     */
    void UpdateConfig(const MonitoringConfig& config);

    void SetObservers(MonitorObservers observers);

    MonitoringConfig GetConfig() const;
    MonitoringStats GetStats() const;
    MonitorState GetState() const;
    bool IsRunning() const;

    /// Highest event id processed by ingestion
    int64_t GetCursor() const;

private:
    class Impl;

    void ApplySchedules(const MonitoringConfig& previous, const MonitoringConfig& current);

    std::shared_ptr<Impl> impl_;

    std::mutex lifecycle_mutex_;   ///< Serializes Start/Stop/UpdateConfig
    std::unique_ptr<PeriodicTask> ingestion_task_;
    std::unique_ptr<PeriodicTask> deep_detection_task_;
    std::unique_ptr<PeriodicTask> correlation_task_;
};

/// Delivery channels for an alert of the given severity
std::vector<std::string> ChannelsForSeverity(core::Severity severity);

} // namespace monitors
} // namespace warden
