/**
 * @file monitoring_types.cpp
 * @brief Monitor configuration validation
 *
 * @date 2025
 */

#include "warden/monitors/monitoring_types.hpp"

namespace warden {
namespace monitors {

using core::ValidationError;

void ValidateMonitoringConfig(const MonitoringConfig& config) {
    if (config.ingestion_interval.count() <= 0 ||
        config.deep_detection_interval.count() <= 0 ||
        config.correlation_interval.count() <= 0) {
        throw ValidationError("monitor intervals must be positive");
    }
    if (config.max_events_per_batch == 0) {
        throw ValidationError("max_events_per_batch must be positive");
    }
    if (config.correlation_window.count() <= 0) {
        throw ValidationError("correlation_window must be positive");
    }
    if (config.max_correlation_events == 0) {
        throw ValidationError("max_correlation_events must be positive");
    }
    if (config.max_auto_responses_per_hour < 0) {
        throw ValidationError("max_auto_responses_per_hour must not be negative");
    }
    if (config.tick_budget.count() <= 0) {
        throw ValidationError("tick_budget must be positive");
    }
    if (config.stop_grace_period.count() < 0) {
        throw ValidationError("stop_grace_period must not be negative");
    }
    if (config.dedup_capacity == 0) {
        throw ValidationError("dedup_capacity must be positive");
    }

    auto in_range = [](int value) { return value >= 0 && value <= 100; };
    if (!in_range(config.auto_response_min_risk) || !in_range(config.correlation_risk_threshold) ||
        !in_range(config.incident_threshold) || !in_range(config.critical_threshold) ||
        !in_range(config.high_threshold) || !in_range(config.medium_threshold)) {
        throw ValidationError("risk thresholds must be within 0-100");
    }
    if (!(config.critical_threshold > config.high_threshold &&
          config.high_threshold > config.medium_threshold)) {
        throw ValidationError("severity thresholds must satisfy critical > high > medium");
    }
}

std::string MonitorStateToString(MonitorState state) {
    switch (state) {
        case MonitorState::STOPPED:  return "stopped";
        case MonitorState::STARTING: return "starting";
        case MonitorState::RUNNING:  return "running";
        case MonitorState::STOPPING: return "stopping";
        case MonitorState::ERROR:    return "error";
    }
    return "stopped";
}

} // namespace monitors
} // namespace warden
