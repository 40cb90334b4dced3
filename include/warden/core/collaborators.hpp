/**
 * @file collaborators.hpp
 * @brief Contracts for the external systems the pipeline talks to
 *
 * The audit-log store, incident persistence, alert delivery and threat
 * intelligence feeds are owned elsewhere. The pipeline only depends on
 * these interfaces; concrete adapters live in adapters.hpp.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <chrono>
#include <cstddef>
#include <cstdint>

#include "warden/core/security_types.hpp"

namespace warden {
namespace core {

/**
 * @class EventSource
 * @brief Read-only view over persisted audit records
 *
 * Implementations must tolerate gaps in the id sequence and return events
 * ordered by ascending id (cursor reads) or ascending timestamp (window
 * reads). Reads may throw std::runtime_error when the store is unreachable;
 * callers treat that as a skipped tick.
 */
class EventSource {
public:
    virtual ~EventSource() = default;

    /**
     * @brief Read events with id strictly greater than @p since_id
     * @param since_id Last processed id (cursor)
     * @param limit Maximum number of events returned
     */
    virtual std::vector<SecurityEvent> ReadEvents(int64_t since_id, std::size_t limit) = 0;

    /**
     * @brief Read events with timestamp >= @p since
     */
    virtual std::vector<SecurityEvent> ReadEventsSince(TimePoint since, std::size_t limit) = 0;

    /**
     * @brief Read events inside the trailing @p window (relative to the source clock)
     */
    virtual std::vector<SecurityEvent> ReadRecent(std::chrono::milliseconds window,
                                                  std::size_t limit) = 0;

    /// Startup health check; false puts the monitor into the error state
    virtual bool IsAvailable() = 0;

    virtual std::string Name() const = 0;
};

/**
 * @class IncidentSink
 * @brief Append-biased incident persistence
 */
class IncidentSink {
public:
    virtual ~IncidentSink() = default;

    /// @return Id under which the incident was stored
    virtual std::string CreateIncident(const SecurityIncident& incident) = 0;

    virtual void UpdateIncident(const std::string& incident_id, const IncidentPatch& patch) = 0;
};

/**
 * @class AlertDispatcher
 * @brief Delivers alerts over opaque channels
 *
 * Retry policy belongs to the dispatcher; the pipeline logs failures and
 * moves on.
 */
class AlertDispatcher {
public:
    virtual ~AlertDispatcher() = default;

    /// @return true if the alert was handed off
    virtual bool Send(const SecurityAlert& alert, const std::vector<std::string>& channels) = 0;
};

/**
 * @struct EnrichmentMatch
 * @brief Threat-feed hit for a looked-up indicator
 */
struct EnrichmentMatch {
    ThreatIndicator indicator;
    Severity severity{Severity::LOW};
    std::string description;
    std::vector<std::string> tags;
};

/**
 * @class EnrichmentProvider
 * @brief Threat-intelligence lookup used to boost classification
 *
 * Optional: classification proceeds without it.
 */
class EnrichmentProvider {
public:
    virtual ~EnrichmentProvider() = default;

    virtual std::optional<EnrichmentMatch> Lookup(IndicatorType type, const std::string& value) = 0;

    /// Called once when the monitor starts
    virtual bool Initialize() { return true; }
};

} // namespace core
} // namespace warden
