/**
 * @file test_helpers.hpp
 * @brief Shared fixtures: controllable clock, event builders, fake handlers
 */

#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "warden/core/security_types.hpp"
#include "warden/response/action_handlers.hpp"

namespace warden {
namespace test {

/// Base instant for all test timelines: 2025-03-01T10:00:00Z
inline core::TimePoint BaseTime() {
    return core::TimePoint(std::chrono::seconds(1740823200));
}

/**
 * Clock that only moves when told to. Copies share the same time, so a
 * ClockFunction handed to a component keeps following the test.
 */
class ManualClock {
public:
    explicit ManualClock(core::TimePoint start = BaseTime())
        : now_(std::make_shared<std::atomic<int64_t>>(ToMillis(start))) {}

    core::TimePoint Now() const {
        return core::TimePoint(std::chrono::milliseconds(now_->load()));
    }

    void Advance(std::chrono::milliseconds delta) { *now_ += delta.count(); }
    void Set(core::TimePoint when) { *now_ = ToMillis(when); }

    core::ClockFunction Function() const {
        auto now = now_;
        return [now] { return core::TimePoint(std::chrono::milliseconds(now->load())); };
    }

private:
    static int64_t ToMillis(core::TimePoint when) {
        return std::chrono::duration_cast<std::chrono::milliseconds>(when.time_since_epoch()).count();
    }

    std::shared_ptr<std::atomic<int64_t>> now_;
};

/// Fluent SecurityEvent builder
class EventBuilder {
public:
    EventBuilder(int64_t id, std::string action) {
        event_.id = id;
        event_.action = std::move(action);
        event_.timestamp = BaseTime();
    }

    EventBuilder& At(core::TimePoint when) { event_.timestamp = when; return *this; }
    EventBuilder& AtMinute(int minute) {
        event_.timestamp = BaseTime() + std::chrono::minutes(minute);
        return *this;
    }
    EventBuilder& AtSecond(int second) {
        event_.timestamp = BaseTime() + std::chrono::seconds(second);
        return *this;
    }
    EventBuilder& Actor(std::string actor) { event_.actor_id = std::move(actor); return *this; }
    EventBuilder& Tenant(std::string tenant) { event_.tenant_id = std::move(tenant); return *this; }
    EventBuilder& Ip(std::string ip) { event_.ip_address = std::move(ip); return *this; }
    EventBuilder& Resource(std::string kind, std::string id) {
        event_.resource = std::move(kind);
        event_.resource_id = std::move(id);
        return *this;
    }

    core::SecurityEvent Build() const { return event_; }
    operator core::SecurityEvent() const { return event_; }

private:
    core::SecurityEvent event_;
};

/// Five FAILED_LOGIN events for actor 42 from three addresses, @p spacing apart
inline std::vector<core::SecurityEvent> BruteForceBurst(std::chrono::seconds spacing, int64_t first_id = 1) {
    const std::vector<std::string> ips = {"10.0.0.1", "10.0.0.2", "10.0.0.3", "10.0.0.1", "10.0.0.2"};
    std::vector<core::SecurityEvent> events;
    for (int i = 0; i < 5; ++i) {
        events.push_back(EventBuilder(first_id + i, "FAILED_LOGIN")
                             .At(BaseTime() + spacing * i)
                             .Actor("42")
                             .Ip(ips[i]));
    }
    return events;
}

/// Threat with an ip indicator and a user resource
inline core::ThreatIntelligence MakeThreat(const std::string& id, int risk,
                                           const std::string& type = "brute_force_advanced") {
    core::ThreatIntelligence threat;
    threat.threat_id = id;
    threat.threat_type = type;
    threat.risk_score = risk;
    threat.confidence = 80;
    threat.created_at = BaseTime();
    threat.updated_at = BaseTime();

    core::ThreatIndicator ip;
    ip.type = core::IndicatorType::IP;
    ip.value = "203.0.113.7";
    ip.confidence = 70;
    threat.indicators.push_back(ip);

    threat.affected_resources = {"user_42", "property_7"};
    return threat;
}

inline core::SecurityIncident MakeIncident(const core::ThreatIntelligence& threat) {
    core::SecurityIncident incident;
    incident.id = "INC-test-" + threat.threat_id;
    incident.threat_id = threat.threat_id;
    incident.severity = core::SeverityFromRisk(threat.risk_score);
    incident.created_at = BaseTime();
    incident.updated_at = BaseTime();
    return incident;
}

// ============================================================================
// FAKE HANDLERS
// ============================================================================

/// Records every call and succeeds
class RecordingHandler : public response::ActionHandler {
public:
    explicit RecordingHandler(std::string name) : name_(std::move(name)) {}

    response::ActionResult Execute(const response::ResponseAction&,
                                   const core::ThreatIntelligence& threat,
                                   const core::SecurityIncident&,
                                   response::ActionToken&) override {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_.push_back(threat.threat_id);
        return response::ActionResult::Ok(name_ + " done");
    }

    std::size_t Calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_.size();
    }

private:
    std::string name_;
    mutable std::mutex mutex_;
    std::vector<std::string> calls_;
};

/// Always throws
class ThrowingHandler : public response::ActionHandler {
public:
    response::ActionResult Execute(const response::ResponseAction&,
                                   const core::ThreatIntelligence&,
                                   const core::SecurityIncident&,
                                   response::ActionToken&) override {
        throw std::runtime_error("firewall API unreachable");
    }
};

/// Sleeps before succeeding
class SlowHandler : public response::ActionHandler {
public:
    explicit SlowHandler(std::chrono::milliseconds delay) : delay_(delay) {}

    response::ActionResult Execute(const response::ResponseAction&,
                                   const core::ThreatIntelligence&,
                                   const core::SecurityIncident&,
                                   response::ActionToken&) override {
        std::this_thread::sleep_for(delay_);
        return response::ActionResult::Ok("finished late");
    }

private:
    std::chrono::milliseconds delay_;
};

/// Throws something that is not a std::exception
class IntThrowingHandler : public response::ActionHandler {
public:
    response::ActionResult Execute(const response::ResponseAction&,
                                   const core::ThreatIntelligence&,
                                   const core::SecurityIncident&,
                                   response::ActionToken&) override {
        throw 42;
    }
};

/// Real block handler that takes a while to resolve its subject
class DelayedBlockHandler : public response::BlockHandler {
public:
    DelayedBlockHandler(std::shared_ptr<response::EnforcementBackend> backend, std::chrono::milliseconds delay)
        : BlockHandler(std::move(backend), core::Clock::now), delay_(delay) {}

    response::ActionResult Execute(const response::ResponseAction& action,
                                   const core::ThreatIntelligence& threat,
                                   const core::SecurityIncident& incident,
                                   response::ActionToken& token) override {
        std::this_thread::sleep_for(delay_);
        return BlockHandler::Execute(action, threat, incident, token);
    }

private:
    std::chrono::milliseconds delay_;
};

/// Appends its tag to a shared log, to observe ordering
class SequenceHandler : public response::ActionHandler {
public:
    SequenceHandler(std::shared_ptr<std::vector<std::string>> log, std::shared_ptr<std::mutex> mutex)
        : log_(std::move(log)), mutex_(std::move(mutex)) {}

    response::ActionResult Execute(const response::ResponseAction& action,
                                   const core::ThreatIntelligence&,
                                   const core::SecurityIncident&,
                                   response::ActionToken&) override {
        std::lock_guard<std::mutex> lock(*mutex_);
        log_->push_back(response::GetParameter(action, "tag"));
        return response::ActionResult::Ok("ok");
    }

private:
    std::shared_ptr<std::vector<std::string>> log_;
    std::shared_ptr<std::mutex> mutex_;
};

} // namespace test
} // namespace warden
