/**
 * @file adapters.hpp
 * @brief Built-in implementations of the collaborator contracts
 *
 * In-memory variants back the tests and embedding hosts; JSON-lines
 * variants back the CLI.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <fstream>
#include <filesystem>
#include <optional>

#include "warden/core/collaborators.hpp"

namespace warden {
namespace core {

// ============================================================================
// EVENT SOURCES
// ============================================================================

/**
 * @class MemoryEventSource
 * @brief Thread-safe append-only event list
 *
 * SetFailing() makes every read throw, to simulate an unreachable store.
 */
class MemoryEventSource : public EventSource {
public:
    explicit MemoryEventSource(ClockFunction clock = Clock::now);

    void Append(SecurityEvent event);
    void Append(const std::vector<SecurityEvent>& events);

    void SetAvailable(bool available);
    void SetFailing(bool failing);

    std::vector<SecurityEvent> ReadEvents(int64_t since_id, std::size_t limit) override;
    std::vector<SecurityEvent> ReadEventsSince(TimePoint since, std::size_t limit) override;
    std::vector<SecurityEvent> ReadRecent(std::chrono::milliseconds window, std::size_t limit) override;
    bool IsAvailable() override;
    std::string Name() const override { return "memory"; }

    std::size_t Size() const;

protected:
    void CheckReadable() const;

    ClockFunction clock_;
    mutable std::mutex mutex_;
    std::vector<SecurityEvent> events_;
    bool available_{true};
    bool failing_{false};
};

/**
 * @class JsonlEventSource
 * @brief Audit export file, one JSON record per line
 *
 * The file is re-read on each call so appended records are picked up.
 * Malformed lines are skipped with a warning.
 */
class JsonlEventSource : public EventSource {
public:
    explicit JsonlEventSource(std::filesystem::path path, ClockFunction clock = Clock::now);

    std::vector<SecurityEvent> ReadEvents(int64_t since_id, std::size_t limit) override;
    std::vector<SecurityEvent> ReadEventsSince(TimePoint since, std::size_t limit) override;
    std::vector<SecurityEvent> ReadRecent(std::chrono::milliseconds window, std::size_t limit) override;
    bool IsAvailable() override;
    std::string Name() const override;

    /// Every parseable record, in file order
    std::vector<SecurityEvent> ReadAll();

private:
    std::filesystem::path path_;
    ClockFunction clock_;
    std::mutex mutex_;
};

// ============================================================================
// INCIDENT SINKS
// ============================================================================

/**
 * @class MemoryIncidentSink
 * @brief Keeps incidents in memory and applies patches in place
 */
class MemoryIncidentSink : public IncidentSink {
public:
    std::string CreateIncident(const SecurityIncident& incident) override;

    /// @throws std::runtime_error for an unknown incident id
    void UpdateIncident(const std::string& incident_id, const IncidentPatch& patch) override;

    std::vector<SecurityIncident> Incidents() const;
    std::optional<SecurityIncident> Get(const std::string& incident_id) const;
    std::size_t Size() const;

private:
    mutable std::mutex mutex_;
    std::vector<SecurityIncident> incidents_;
    std::map<std::string, std::size_t> index_;
};

/**
 * @class JsonlIncidentSink
 * @brief Append-only incident journal
 *
 * Creations are written as `incident` records and updates as
 * `incident_update` patch records; nothing is rewritten in place.
 */
class JsonlIncidentSink : public IncidentSink {
public:
    /// @throws std::runtime_error if the file cannot be opened for appending
    explicit JsonlIncidentSink(const std::filesystem::path& path);

    std::string CreateIncident(const SecurityIncident& incident) override;
    void UpdateIncident(const std::string& incident_id, const IncidentPatch& patch) override;

private:
    void WriteLine(const std::string& line);

    std::filesystem::path path_;
    std::mutex mutex_;
    std::ofstream stream_;
};

// ============================================================================
// ALERT DISPATCHERS
// ============================================================================

/// Writes alerts to the log; always succeeds
class LogAlertDispatcher : public AlertDispatcher {
public:
    bool Send(const SecurityAlert& alert, const std::vector<std::string>& channels) override;
};

/**
 * @class MemoryAlertDispatcher
 * @brief Records delivered alerts; can be told to refuse delivery
 */
class MemoryAlertDispatcher : public AlertDispatcher {
public:
    struct Delivery {
        SecurityAlert alert;
        std::vector<std::string> channels;
    };

    bool Send(const SecurityAlert& alert, const std::vector<std::string>& channels) override;

    void SetFailing(bool failing);
    std::vector<Delivery> Deliveries() const;
    std::size_t Size() const;

private:
    mutable std::mutex mutex_;
    std::vector<Delivery> deliveries_;
    bool failing_{false};
};

} // namespace core
} // namespace warden
