/**
 * @file monitoring_types.hpp
 * @brief Monitor configuration, lifecycle state and statistics
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <chrono>
#include <cstddef>
#include <cstdint>

#include "warden/core/security_types.hpp"

namespace warden {
namespace monitors {

/**
 * @enum MonitorState
 * @brief stopped -> starting -> running -> stopping -> stopped; error from starting
 */
enum class MonitorState {
    STOPPED,
    STARTING,
    RUNNING,
    STOPPING,
    ERROR
};

/**
 * @struct MonitoringConfig
 * @brief Process-wide tunables for the real-time monitor
 */
struct MonitoringConfig {
    // Schedules
    std::chrono::milliseconds ingestion_interval{5000};
    std::chrono::milliseconds deep_detection_interval{10000};
    std::chrono::milliseconds correlation_interval{15000};
    bool enable_deep_detection{true};
    bool enable_correlation{true};

    // Batching
    std::size_t max_events_per_batch{100};              ///< Ingestion and deep-detection reads
    std::chrono::milliseconds correlation_window{3600000};
    std::size_t max_correlation_events{1000};

    // Automated response
    bool enable_auto_response{true};
    int max_auto_responses_per_hour{50};
    int auto_response_min_risk{60};

    // Thresholds
    int correlation_risk_threshold{70};   ///< Correlations below this are ignored
    int incident_threshold{25};           ///< Threats below this risk are not reported
    int critical_threshold{90};
    int high_threshold{75};
    int medium_threshold{50};

    // Time limits
    std::chrono::milliseconds tick_budget{4000};        ///< Bound for response work inside one tick
    std::chrono::milliseconds stop_grace_period{2000};  ///< How long Stop() waits for a tick

    bool enable_enrichment{true};
    std::size_t dedup_capacity{10000};    ///< Threat ids remembered for idempotent incident creation

    /// Deep detection re-scans twice its own interval
    std::chrono::milliseconds DeepDetectionWindow() const { return deep_detection_interval * 2; }
};

/**
 * @brief Check a configuration before it is applied
 * @throws core::ValidationError on non-positive intervals, limits or inconsistent thresholds
 */
void ValidateMonitoringConfig(const MonitoringConfig& config);

/**
 * @struct MonitoringStats
 * @brief Counters since process start
 */
struct MonitoringStats {
    MonitorState state{MonitorState::STOPPED};
    core::TimePoint start_time;
    std::chrono::milliseconds uptime{0};
    core::TimePoint last_check;

    uint64_t events_processed{0};
    uint64_t threats_detected{0};
    uint64_t correlations_detected{0};
    uint64_t incidents_created{0};
    uint64_t incidents_escalated{0};         ///< Re-scans that raised an incident's severity
    uint64_t duplicate_threats_skipped{0};
    uint64_t threats_below_threshold{0};
    uint64_t auto_responses_triggered{0};
    uint64_t auto_responses_suppressed{0};   ///< Rejected by the hourly cap
    uint64_t response_failures{0};
    uint64_t alerts_sent{0};
    uint64_t alerts_failed{0};

    uint64_t ingestion_errors{0};
    uint64_t deep_detection_errors{0};
    uint64_t correlation_errors{0};
    uint64_t classification_errors{0};

    std::chrono::milliseconds last_tick_duration{0};
    int64_t cursor{0};
};

std::string MonitorStateToString(MonitorState state);

} // namespace monitors
} // namespace warden
