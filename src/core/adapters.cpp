/**
 * @file adapters.cpp
 * @brief Implementation of the built-in collaborator adapters
 *
 * @date 2025
 */

#include "warden/core/adapters.hpp"
#include "warden/parsers/audit_parser.hpp"
#include "warden/reporters/json_reporter.hpp"
#include "warden/utils/string_utils.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <stdexcept>

namespace warden {
namespace core {

namespace {

bool ById(const SecurityEvent& a, const SecurityEvent& b) {
    return a.id < b.id;
}

bool ByTime(const SecurityEvent& a, const SecurityEvent& b) {
    if (a.timestamp != b.timestamp) {
        return a.timestamp < b.timestamp;
    }
    return a.id < b.id;
}

/// Events with id > since_id, ascending, at most limit
std::vector<SecurityEvent> SelectAfterId(const std::vector<SecurityEvent>& events,
                                         int64_t since_id, std::size_t limit) {
    std::vector<SecurityEvent> selected;
    for (const auto& event : events) {
        if (event.id > since_id) {
            selected.push_back(event);
        }
    }
    std::sort(selected.begin(), selected.end(), ById);
    if (selected.size() > limit) {
        selected.resize(limit);
    }
    return selected;
}

/// Most recent `limit` events with timestamp >= since, ascending by time
std::vector<SecurityEvent> SelectSince(const std::vector<SecurityEvent>& events,
                                       TimePoint since, std::size_t limit) {
    std::vector<SecurityEvent> selected;
    for (const auto& event : events) {
        if (event.timestamp >= since) {
            selected.push_back(event);
        }
    }
    std::sort(selected.begin(), selected.end(), ByTime);
    if (selected.size() > limit) {
        selected.erase(selected.begin(), selected.end() - static_cast<std::ptrdiff_t>(limit));
    }
    return selected;
}

const reporters::JsonReporter& CompactReporter() {
    static const reporters::JsonReporter reporter(reporters::JsonReporterConfig{false, 0});
    return reporter;
}

} // namespace

// ============================================================================
// MemoryEventSource
// ============================================================================

MemoryEventSource::MemoryEventSource(ClockFunction clock)
    : clock_(std::move(clock)) {
}

void MemoryEventSource::Append(SecurityEvent event) {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.push_back(std::move(event));
}

void MemoryEventSource::Append(const std::vector<SecurityEvent>& events) {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.insert(events_.end(), events.begin(), events.end());
}

void MemoryEventSource::SetAvailable(bool available) {
    std::lock_guard<std::mutex> lock(mutex_);
    available_ = available;
}

void MemoryEventSource::SetFailing(bool failing) {
    std::lock_guard<std::mutex> lock(mutex_);
    failing_ = failing;
}

void MemoryEventSource::CheckReadable() const {
    if (failing_) {
        throw std::runtime_error("event source unreachable");
    }
}

std::vector<SecurityEvent> MemoryEventSource::ReadEvents(int64_t since_id, std::size_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    CheckReadable();
    return SelectAfterId(events_, since_id, limit);
}

std::vector<SecurityEvent> MemoryEventSource::ReadEventsSince(TimePoint since, std::size_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    CheckReadable();
    return SelectSince(events_, since, limit);
}

std::vector<SecurityEvent> MemoryEventSource::ReadRecent(std::chrono::milliseconds window,
                                                         std::size_t limit) {
    return ReadEventsSince(clock_() - window, limit);
}

bool MemoryEventSource::IsAvailable() {
    std::lock_guard<std::mutex> lock(mutex_);
    return available_;
}

std::size_t MemoryEventSource::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

// ============================================================================
// JsonlEventSource
// ============================================================================

JsonlEventSource::JsonlEventSource(std::filesystem::path path, ClockFunction clock)
    : path_(std::move(path))
    , clock_(std::move(clock)) {
}

std::vector<SecurityEvent> JsonlEventSource::ReadAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    parsers::AuditRecordParser parser;
    return parser.Parse(path_);
}

std::vector<SecurityEvent> JsonlEventSource::ReadEvents(int64_t since_id, std::size_t limit) {
    return SelectAfterId(ReadAll(), since_id, limit);
}

std::vector<SecurityEvent> JsonlEventSource::ReadEventsSince(TimePoint since, std::size_t limit) {
    return SelectSince(ReadAll(), since, limit);
}

std::vector<SecurityEvent> JsonlEventSource::ReadRecent(std::chrono::milliseconds window,
                                                        std::size_t limit) {
    return ReadEventsSince(clock_() - window, limit);
}

bool JsonlEventSource::IsAvailable() {
    std::error_code ec;
    bool exists = std::filesystem::is_regular_file(path_, ec);
    if (!exists) {
        spdlog::error("Audit export {} is not readable", path_.string());
    }
    return exists;
}

std::string JsonlEventSource::Name() const {
    return "jsonl:" + path_.string();
}

// ============================================================================
// MemoryIncidentSink
// ============================================================================

std::string MemoryIncidentSink::CreateIncident(const SecurityIncident& incident) {
    std::lock_guard<std::mutex> lock(mutex_);
    index_[incident.id] = incidents_.size();
    incidents_.push_back(incident);
    return incident.id;
}

void MemoryIncidentSink::UpdateIncident(const std::string& incident_id, const IncidentPatch& patch) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(incident_id);
    if (it == index_.end()) {
        throw std::runtime_error("unknown incident " + incident_id);
    }

    auto& incident = incidents_[it->second];
    if (patch.status) {
        incident.status = *patch.status;
    }
    if (patch.severity) {
        incident.severity = *patch.severity;
    }
    if (patch.escalated) {
        incident.escalated = *patch.escalated;
    }
    if (patch.response_actions) {
        incident.response_actions = *patch.response_actions;
    }
    if (patch.resolution) {
        incident.resolution = patch.resolution;
    }
    incident.updated_at = patch.updated_at;
}

std::vector<SecurityIncident> MemoryIncidentSink::Incidents() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return incidents_;
}

std::optional<SecurityIncident> MemoryIncidentSink::Get(const std::string& incident_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(incident_id);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return incidents_[it->second];
}

std::size_t MemoryIncidentSink::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return incidents_.size();
}

// ============================================================================
// JsonlIncidentSink
// ============================================================================

JsonlIncidentSink::JsonlIncidentSink(const std::filesystem::path& path)
    : path_(path) {
    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path());
    }
    stream_.open(path_, std::ios::app);
    if (!stream_) {
        throw std::runtime_error("cannot open incident journal " + path_.string());
    }
}

void JsonlIncidentSink::WriteLine(const std::string& line) {
    std::lock_guard<std::mutex> lock(mutex_);
    stream_ << line << '\n';
    stream_.flush();
    if (!stream_) {
        throw std::runtime_error("write to incident journal " + path_.string() + " failed");
    }
}

std::string JsonlIncidentSink::CreateIncident(const SecurityIncident& incident) {
    WriteLine(CompactReporter().IncidentCreatedRecord(incident));
    return incident.id;
}

void JsonlIncidentSink::UpdateIncident(const std::string& incident_id, const IncidentPatch& patch) {
    WriteLine(CompactReporter().IncidentUpdatedRecord(incident_id, patch));
}

// ============================================================================
// ALERT DISPATCHERS
// ============================================================================

bool LogAlertDispatcher::Send(const SecurityAlert& alert, const std::vector<std::string>& channels) {
    auto line = fmt::format("[{}] {} - {} (incident {}, channels: {})",
                            SeverityToString(alert.level), alert.title, alert.message,
                            alert.incident_id, utils::StringUtils::Join(channels, ","));
    if (alert.level == Severity::CRITICAL || alert.level == Severity::HIGH) {
        spdlog::warn("ALERT {}", line);
    }
    else {
        spdlog::info("ALERT {}", line);
    }
    return true;
}

bool MemoryAlertDispatcher::Send(const SecurityAlert& alert, const std::vector<std::string>& channels) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (failing_) {
        return false;
    }
    deliveries_.push_back(Delivery{alert, channels});
    return true;
}

void MemoryAlertDispatcher::SetFailing(bool failing) {
    std::lock_guard<std::mutex> lock(mutex_);
    failing_ = failing;
}

std::vector<MemoryAlertDispatcher::Delivery> MemoryAlertDispatcher::Deliveries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return deliveries_;
}

std::size_t MemoryAlertDispatcher::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return deliveries_.size();
}

} // namespace core
} // namespace warden
