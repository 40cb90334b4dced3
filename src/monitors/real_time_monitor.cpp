/**
 * @file real_time_monitor.cpp
 * @brief Implementation of the real-time security monitor
 *
 * **Threading**:
 * Each activity runs on its own PeriodicTask. Task bodies hold only a
 * weak reference to the monitor state, so a tick abandoned by Stop() can
 * finish safely after the monitor is gone. Each activity is serialized by
 * its own mutex, which is also what ForceCheck() waits on.
 *
 * **Shared state**:
 * - cursor: atomic, written only by ingestion
 * - reported-threat ledger and statistics: mutex-guarded
 * - auto-response budget: RateLimiter (rolling hour)
 *
 * @date 2025
 */

#include "warden/monitors/real_time_monitor.hpp"
#include "warden/monitors/rate_limiter.hpp"
#include "warden/analyzers/threat_classifier.hpp"
#include "warden/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <deque>
#include <unordered_map>

namespace warden {
namespace monitors {

using core::SecurityEvent;
using core::SecurityIncident;
using core::SecurityAlert;
using core::Severity;
using core::ThreatIntelligence;
using std::chrono::milliseconds;

std::vector<std::string> ChannelsForSeverity(Severity severity) {
    switch (severity) {
        case Severity::CRITICAL: return {"email", "sms", "push", "dashboard", "webhook"};
        case Severity::HIGH:     return {"email", "push", "dashboard", "webhook"};
        case Severity::MEDIUM:   return {"dashboard", "webhook"};
        default:                 return {"dashboard"};
    }
}

// ============================================================================
// IMPLEMENTATION CLASS
// ============================================================================

class RealTimeMonitor::Impl {
public:
    Impl(MonitorDependencies deps, const MonitoringConfig& config)
        : deps_(std::move(deps))
        , limiter_(static_cast<std::size_t>(config.max_auto_responses_per_hour),
                   std::chrono::hours(1), deps_.clock)
        , config_(config) {
    }

    // Ticks; `cancellable` is false for ForceCheck()
    void IngestionTick(bool cancellable);
    void DeepDetectionTick(bool cancellable);
    void CorrelationTick(bool cancellable);

    MonitoringConfig Config() const {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return config_;
    }

    void SetConfig(const MonitoringConfig& config) {
        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            config_ = config;
        }
        limiter_.SetLimit(static_cast<std::size_t>(config.max_auto_responses_per_hour));
    }

    void SetObservers(MonitorObservers observers) {
        std::lock_guard<std::mutex> lock(observers_mutex_);
        observers_ = std::move(observers);
    }

    MonitoringStats Stats() const {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        MonitoringStats stats = stats_;
        stats.state = state_;
        stats.cursor = cursor_;
        if (state_ == MonitorState::RUNNING) {
            stats.uptime = std::chrono::duration_cast<milliseconds>(deps_.clock() - stats.start_time);
        }
        return stats;
    }

    template <typename Mutator>
    void UpdateStats(Mutator mutate) {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        mutate(stats_);
    }

    MonitorDependencies deps_;
    std::atomic<MonitorState> state_{MonitorState::STOPPED};
    std::atomic<bool> stopping_{false};
    std::atomic<int64_t> cursor_{0};

private:
    struct TickContext {
        MonitoringConfig config;
        std::chrono::steady_clock::time_point deadline;
        bool cancellable{true};
    };

    TickContext BeginTick(bool cancellable) const;
    void FinishTick(std::chrono::steady_clock::time_point started);
    bool ShouldStop(const TickContext& tick) const { return tick.cancellable && stopping_; }

    analyzers::ThreatClassifier MakeClassifier(const MonitoringConfig& config) const;

    /// Classify a batch; returns the number of events examined
    std::size_t ClassifyBatch(const std::vector<SecurityEvent>& events, const TickContext& tick,
                              bool advance_cursor);

    /// Highest risk seen so far for one threat id
    struct ReportedThreat {
        int risk_score{0};
        Severity severity{Severity::INFO};
        bool has_incident{false};
        std::string incident_id;            ///< Empty while creation is in flight
    };

    enum class Disposition {
        NEW_INCIDENT,
        ESCALATION,
        BELOW_THRESHOLD,
        DUPLICATE
    };

    void HandleThreat(const ThreatIntelligence& threat, const TickContext& tick);
    void EscalateIncident(const ThreatIntelligence& threat, const ReportedThreat& previous,
                          const TickContext& tick);
    void Respond(const ThreatIntelligence& threat, const SecurityIncident& incident, const TickContext& tick);
    SecurityIncident BuildIncident(const ThreatIntelligence& threat, const MonitoringConfig& config) const;
    void RunAutomatedResponse(const ThreatIntelligence& threat, const SecurityIncident& incident,
                              const TickContext& tick);
    void SendAlert(const ThreatIntelligence& threat, const SecurityIncident& incident,
                   const MonitoringConfig& config);

    /**
     * Record a sighting and decide what it warrants. A threat id opens at
     * most one incident; a later sighting with a higher severity tier
     * escalates it, and one that first crosses the incident threshold
     * opens it. @p previous receives the state before this sighting.
     */
    Disposition Claim(const ThreatIntelligence& threat, const MonitoringConfig& config,
                      ReportedThreat& previous);
    void RecordIncident(const std::string& threat_id, const std::string& incident_id);
    void Forget(const std::string& threat_id);

    template <typename Callback, typename Arg>
    void Notify(Callback MonitorObservers::*member, const Arg& arg, const char* what) {
        Callback callback;
        {
            std::lock_guard<std::mutex> lock(observers_mutex_);
            callback = observers_.*member;
        }
        if (!callback) {
            return;
        }
        try {
            callback(arg);
        }
        catch (const std::exception& e) {
            spdlog::warn("{} observer failed: {}", what, e.what());
        }
        catch (...) {
            spdlog::warn("{} observer failed: unknown error", what);
        }
    }

    analyzers::CorrelationEngine correlation_engine_;
    RateLimiter limiter_;

    mutable std::mutex config_mutex_;
    MonitoringConfig config_;

    mutable std::mutex stats_mutex_;
    MonitoringStats stats_;

    std::mutex observers_mutex_;
    MonitorObservers observers_;

    std::mutex dedup_mutex_;
    std::unordered_map<std::string, ReportedThreat> reported_;
    std::deque<std::string> reported_order_;

    std::mutex ingestion_mutex_;
    std::mutex deep_detection_mutex_;
    std::mutex correlation_mutex_;

    friend class RealTimeMonitor;
};

// ============================================================================
// TICK PLUMBING
// ============================================================================

RealTimeMonitor::Impl::TickContext RealTimeMonitor::Impl::BeginTick(bool cancellable) const {
    TickContext tick;
    tick.config = Config();
    tick.deadline = std::chrono::steady_clock::now() + tick.config.tick_budget;
    tick.cancellable = cancellable;
    return tick;
}

void RealTimeMonitor::Impl::FinishTick(std::chrono::steady_clock::time_point started) {
    auto duration = std::chrono::duration_cast<milliseconds>(std::chrono::steady_clock::now() - started);
    auto now = deps_.clock();
    UpdateStats([&](MonitoringStats& stats) {
        stats.last_check = now;
        stats.last_tick_duration = duration;
    });
}

analyzers::ThreatClassifier RealTimeMonitor::Impl::MakeClassifier(const MonitoringConfig& config) const {
    analyzers::ThreatClassifier::Config classifier_config;
    classifier_config.enable_enrichment = config.enable_enrichment;
    return analyzers::ThreatClassifier(classifier_config, deps_.enrichment);
}

std::size_t RealTimeMonitor::Impl::ClassifyBatch(const std::vector<SecurityEvent>& events,
                                                 const TickContext& tick,
                                                 bool advance_cursor) {
    auto classifier = MakeClassifier(tick.config);
    std::size_t examined = 0;

    for (const auto& event : events) {
        if (ShouldStop(tick)) {
            spdlog::debug("Stop requested, leaving {} events for the next tick", events.size() - examined);
            break;
        }
        ++examined;

        std::optional<ThreatIntelligence> threat;
        try {
            threat = classifier.Classify(event);
        }
        catch (const std::exception& e) {
            // Fail open: an unclassifiable event is treated as benign
            UpdateStats([](MonitoringStats& stats) { ++stats.classification_errors; });
            spdlog::warn("Classification of event {} failed: {}", event.id, e.what());
        }

        if (threat) {
            HandleThreat(*threat, tick);
        }

        if (advance_cursor && event.id > cursor_) {
            cursor_ = event.id;
        }
    }
    return examined;
}

// ============================================================================
// ACTIVITIES
// ============================================================================

void RealTimeMonitor::Impl::IngestionTick(bool cancellable) {
    std::lock_guard<std::mutex> serial(ingestion_mutex_);
    const auto started = std::chrono::steady_clock::now();
    auto tick = BeginTick(cancellable);

    std::vector<SecurityEvent> events;
    try {
        events = deps_.source->ReadEvents(cursor_, tick.config.max_events_per_batch);
    }
    catch (const std::exception& e) {
        UpdateStats([](MonitoringStats& stats) { ++stats.ingestion_errors; });
        spdlog::error("Ingestion read from {} failed, retrying next tick: {}",
                      deps_.source->Name(), e.what());
        FinishTick(started);
        return;
    }
    catch (...) {
        UpdateStats([](MonitoringStats& stats) { ++stats.ingestion_errors; });
        spdlog::error("Ingestion read from {} failed, retrying next tick: unknown error", deps_.source->Name());
        FinishTick(started);
        return;
    }

    try {
        auto examined = ClassifyBatch(events, tick, true);
        UpdateStats([examined](MonitoringStats& stats) { stats.events_processed += examined; });
        if (!events.empty()) {
            spdlog::debug("Ingestion: {} events, cursor at {}", examined, cursor_.load());
        }
    }
    catch (const std::exception& e) {
        UpdateStats([](MonitoringStats& stats) { ++stats.ingestion_errors; });
        spdlog::error("Ingestion tick failed: {}", e.what());
    }
    catch (...) {
        UpdateStats([](MonitoringStats& stats) { ++stats.ingestion_errors; });
        spdlog::error("Ingestion tick failed: unknown error");
    }
    FinishTick(started);
}

void RealTimeMonitor::Impl::DeepDetectionTick(bool cancellable) {
    std::lock_guard<std::mutex> serial(deep_detection_mutex_);
    const auto started = std::chrono::steady_clock::now();
    auto tick = BeginTick(cancellable);

    try {
        auto events = deps_.source->ReadRecent(tick.config.DeepDetectionWindow(),
                                               tick.config.max_events_per_batch);
        auto examined = ClassifyBatch(events, tick, false);
        spdlog::debug("Deep detection: re-scanned {} events", examined);
    }
    catch (const std::exception& e) {
        UpdateStats([](MonitoringStats& stats) { ++stats.deep_detection_errors; });
        spdlog::error("Deep detection tick failed: {}", e.what());
    }
    catch (...) {
        UpdateStats([](MonitoringStats& stats) { ++stats.deep_detection_errors; });
        spdlog::error("Deep detection tick failed: unknown error");
    }
    FinishTick(started);
}

void RealTimeMonitor::Impl::CorrelationTick(bool cancellable) {
    std::lock_guard<std::mutex> serial(correlation_mutex_);
    const auto started = std::chrono::steady_clock::now();
    auto tick = BeginTick(cancellable);

    try {
        auto events = deps_.source->ReadRecent(tick.config.correlation_window,
                                               tick.config.max_correlation_events);
        auto correlations = correlation_engine_.Correlate(events, deps_.correlation_rules->List());
        auto classifier = MakeClassifier(tick.config);

        std::size_t reported = 0;
        for (const auto& correlation : correlations) {
            if (ShouldStop(tick)) {
                break;
            }
            if (correlation.risk_score < tick.config.correlation_risk_threshold) {
                continue;
            }
            ++reported;
            UpdateStats([](MonitoringStats& stats) { ++stats.correlations_detected; });
            HandleThreat(classifier.FromCorrelation(correlation), tick);
        }

        spdlog::debug("Correlation: {} events, {} correlations, {} above threshold",
                      events.size(), correlations.size(), reported);
    }
    catch (const std::exception& e) {
        UpdateStats([](MonitoringStats& stats) { ++stats.correlation_errors; });
        spdlog::error("Correlation tick failed: {}", e.what());
    }
    catch (...) {
        UpdateStats([](MonitoringStats& stats) { ++stats.correlation_errors; });
        spdlog::error("Correlation tick failed: unknown error");
    }
    FinishTick(started);
}

// ============================================================================
// INCIDENT HANDLING
// ============================================================================

RealTimeMonitor::Impl::Disposition RealTimeMonitor::Impl::Claim(const ThreatIntelligence& threat,
                                                                const MonitoringConfig& config,
                                                                ReportedThreat& previous) {
    const auto severity = core::SeverityFromRisk(threat.risk_score, config.critical_threshold,
                                                 config.high_threshold, config.medium_threshold);
    const bool reportable = threat.risk_score >= config.incident_threshold;

    std::lock_guard<std::mutex> lock(dedup_mutex_);
    auto it = reported_.find(threat.threat_id);
    if (it == reported_.end()) {
        reported_.emplace(threat.threat_id, ReportedThreat{threat.risk_score, severity, reportable, ""});
        reported_order_.push_back(threat.threat_id);
        while (reported_order_.size() > config.dedup_capacity) {
            reported_.erase(reported_order_.front());
            reported_order_.pop_front();
        }
        return reportable ? Disposition::NEW_INCIDENT : Disposition::BELOW_THRESHOLD;
    }

    auto& entry = it->second;
    previous = entry;
    if (threat.risk_score <= entry.risk_score) {
        return Disposition::DUPLICATE;
    }
    if (entry.has_incident && (entry.incident_id.empty() || severity <= entry.severity)) {
        return Disposition::DUPLICATE;
    }

    entry.risk_score = threat.risk_score;
    entry.severity = severity;
    if (entry.has_incident) {
        return Disposition::ESCALATION;
    }
    if (!reportable) {
        return Disposition::BELOW_THRESHOLD;
    }
    entry.has_incident = true;
    return Disposition::NEW_INCIDENT;
}

void RealTimeMonitor::Impl::RecordIncident(const std::string& threat_id, const std::string& incident_id) {
    std::lock_guard<std::mutex> lock(dedup_mutex_);
    auto it = reported_.find(threat_id);
    if (it != reported_.end()) {
        it->second.incident_id = incident_id;
    }
}

void RealTimeMonitor::Impl::Forget(const std::string& threat_id) {
    std::lock_guard<std::mutex> lock(dedup_mutex_);
    reported_.erase(threat_id);
    reported_order_.erase(std::remove(reported_order_.begin(), reported_order_.end(), threat_id),
                          reported_order_.end());
}

void RealTimeMonitor::Impl::HandleThreat(const ThreatIntelligence& threat, const TickContext& tick) {
    const auto& config = tick.config;

    ReportedThreat previous;
    const auto disposition = Claim(threat, config, previous);

    if (disposition == Disposition::DUPLICATE) {
        UpdateStats([](MonitoringStats& stats) { ++stats.duplicate_threats_skipped; });
        return;
    }
    if (disposition == Disposition::ESCALATION) {
        EscalateIncident(threat, previous, tick);
        return;
    }

    UpdateStats([](MonitoringStats& stats) { ++stats.threats_detected; });
    Notify(&MonitorObservers::on_threat_detected, threat, "Threat");

    if (disposition == Disposition::BELOW_THRESHOLD) {
        UpdateStats([](MonitoringStats& stats) { ++stats.threats_below_threshold; });
        spdlog::debug("Threat {} below incident threshold ({} < {})",
                      threat.threat_id, threat.risk_score, config.incident_threshold);
        return;
    }

    SecurityIncident incident = BuildIncident(threat, config);
    try {
        incident.id = deps_.incidents->CreateIncident(incident);
    }
    catch (const std::exception& e) {
        // Allow a later tick to retry this threat
        Forget(threat.threat_id);
        spdlog::error("Creating incident for threat {} failed: {}", threat.threat_id, e.what());
        return;
    }
    RecordIncident(threat.threat_id, incident.id);

    UpdateStats([](MonitoringStats& stats) { ++stats.incidents_created; });
    spdlog::warn("Incident {} [{}] {} (risk {})", incident.id, core::SeverityToString(incident.severity),
                 incident.title, threat.risk_score);
    Notify(&MonitorObservers::on_incident_created, incident, "Incident");

    if (config.enable_auto_response && threat.risk_score >= config.auto_response_min_risk) {
        Respond(threat, incident, tick);
    }
    SendAlert(threat, incident, config);
}

void RealTimeMonitor::Impl::EscalateIncident(const ThreatIntelligence& threat, const ReportedThreat& previous,
                                             const TickContext& tick) {
    const auto& config = tick.config;

    SecurityIncident incident = BuildIncident(threat, config);
    incident.id = previous.incident_id;

    core::IncidentPatch patch;
    patch.severity = incident.severity;
    patch.escalated = incident.escalated;
    patch.updated_at = incident.updated_at;
    try {
        deps_.incidents->UpdateIncident(incident.id, patch);
    }
    catch (const std::exception& e) {
        spdlog::error("Escalating incident {} failed: {}", incident.id, e.what());
        return;
    }

    UpdateStats([](MonitoringStats& stats) { ++stats.incidents_escalated; });
    spdlog::warn("Incident {} escalated {} -> {} (risk {} -> {})", incident.id,
                 core::SeverityToString(previous.severity), core::SeverityToString(incident.severity),
                 previous.risk_score, threat.risk_score);

    // A response already had its chance if the earlier sighting cleared the floor
    if (config.enable_auto_response && threat.risk_score >= config.auto_response_min_risk &&
        previous.risk_score < config.auto_response_min_risk) {
        Respond(threat, incident, tick);
    }
    SendAlert(threat, incident, config);
}

void RealTimeMonitor::Impl::Respond(const ThreatIntelligence& threat, const SecurityIncident& incident,
                                    const TickContext& tick) {
    if (limiter_.TryAcquire()) {
        RunAutomatedResponse(threat, incident, tick);
        return;
    }
    UpdateStats([](MonitoringStats& stats) { ++stats.auto_responses_suppressed; });
    spdlog::warn("Auto-response cap of {}/hour reached, not responding to {}",
                 tick.config.max_auto_responses_per_hour, threat.threat_id);
}

SecurityIncident RealTimeMonitor::Impl::BuildIncident(const ThreatIntelligence& threat,
                                                      const MonitoringConfig& config) const {
    const auto now = deps_.clock();

    SecurityIncident incident;
    incident.id = core::MakeSequentialId("INC", now);
    incident.threat_id = threat.threat_id;
    incident.severity = core::SeverityFromRisk(threat.risk_score, config.critical_threshold,
                                               config.high_threshold, config.medium_threshold);
    incident.status = core::IncidentStatus::OPEN;
    incident.title = utils::StringUtils::ToTitle(threat.threat_type) + " Security Threat";
    incident.description = "Detected " + threat.threat_type + " with risk score " +
                           std::to_string(threat.risk_score) + " and confidence " +
                           std::to_string(threat.confidence) + "% affecting " +
                           std::to_string(threat.affected_resources.size()) + " resource(s)";
    incident.affected_resources = threat.affected_resources;
    incident.created_at = now;
    incident.updated_at = now;
    incident.escalated = threat.risk_score >= config.critical_threshold;
    incident.timeline = threat.timeline;

    core::TimelineEntry opened;
    opened.timestamp = now;
    opened.event = "Incident opened";
    opened.severity = incident.severity;
    opened.details["threat_id"] = threat.threat_id;
    incident.timeline.push_back(std::move(opened));

    for (const auto& indicator : threat.indicators) {
        core::Evidence evidence;
        evidence.type = indicator.type;
        evidence.value = indicator.value;
        evidence.timestamp = indicator.last_seen;
        evidence.confidence = indicator.confidence;
        incident.evidence.push_back(std::move(evidence));
    }
    return incident;
}

void RealTimeMonitor::Impl::RunAutomatedResponse(const ThreatIntelligence& threat,
                                                 const SecurityIncident& incident,
                                                 const TickContext& tick) {
    response::ExecutionOptions options;
    auto remaining = std::chrono::duration_cast<milliseconds>(tick.deadline - std::chrono::steady_clock::now());
    options.budget = std::max(remaining, milliseconds(0));
    if (tick.cancellable) {
        options.cancelled = [this] { return stopping_.load(); };
    }

    auto result = deps_.responder->Execute(threat, incident, options);

    UpdateStats([&result](MonitoringStats& stats) {
        ++stats.auto_responses_triggered;
        if (!result.success && !result.actions_executed.empty()) {
            ++stats.response_failures;
        }
    });
    Notify(&MonitorObservers::on_response_executed, result, "Response");

    if (result.actions_executed.empty()) {
        return;
    }

    core::IncidentPatch patch;
    patch.response_actions = response::ToActionRecords(result);
    patch.updated_at = deps_.clock();

    bool any_succeeded = std::any_of(result.actions_executed.begin(), result.actions_executed.end(),
                                     [](const response::ExecutedAction& action) { return action.result.success; });
    if (result.success) {
        patch.status = core::IncidentStatus::CONTAINED;
    }
    else if (any_succeeded) {
        patch.status = core::IncidentStatus::INVESTIGATING;
    }

    try {
        deps_.incidents->UpdateIncident(incident.id, patch);
    }
    catch (const std::exception& e) {
        spdlog::error("Recording response on incident {} failed: {}", incident.id, e.what());
    }
}

void RealTimeMonitor::Impl::SendAlert(const ThreatIntelligence& threat,
                                      const SecurityIncident& incident,
                                      const MonitoringConfig& config) {
    SecurityAlert alert;
    alert.created_at = deps_.clock();
    alert.id = core::MakeSequentialId("ALR", alert.created_at);
    alert.threat_id = threat.threat_id;
    alert.incident_id = incident.id;
    alert.level = incident.severity;
    alert.title = "Security Alert: " + incident.title;
    alert.message = incident.description;
    alert.channels = ChannelsForSeverity(alert.level);
    alert.action_required = threat.risk_score >= config.high_threshold;
    alert.escalated = threat.risk_score >= config.critical_threshold;
    alert.details["threat_type"] = threat.threat_type;
    alert.details["risk_score"] = std::to_string(threat.risk_score);
    alert.details["confidence"] = std::to_string(threat.confidence);

    bool sent = false;
    try {
        sent = deps_.alerts->Send(alert, alert.channels);
    }
    catch (const std::exception& e) {
        spdlog::warn("Alert dispatch for incident {} threw: {}", incident.id, e.what());
    }

    if (!sent) {
        UpdateStats([](MonitoringStats& stats) { ++stats.alerts_failed; });
        spdlog::warn("Alert {} for incident {} was not delivered", alert.id, incident.id);
        return;
    }

    UpdateStats([](MonitoringStats& stats) { ++stats.alerts_sent; });
    Notify(&MonitorObservers::on_alert_sent, alert, "Alert");
}

// ============================================================================
// CONSTRUCTOR / DESTRUCTOR
// ============================================================================

RealTimeMonitor::RealTimeMonitor(MonitorDependencies deps, const MonitoringConfig& config) {
    if (!deps.source || !deps.incidents || !deps.alerts || !deps.responder || !deps.correlation_rules) {
        throw core::ValidationError("monitor requires an event source, incident sink, alert "
                                    "dispatcher, response engine and correlation rule store");
    }
    if (!deps.clock) {
        deps.clock = core::Clock::now;
    }
    ValidateMonitoringConfig(config);

    impl_ = std::make_shared<Impl>(std::move(deps), config);

    std::weak_ptr<Impl> weak = impl_;
    ingestion_task_ = std::make_unique<PeriodicTask>("ingestion", config.ingestion_interval,
        [weak] { if (auto impl = weak.lock()) impl->IngestionTick(true); });
    deep_detection_task_ = std::make_unique<PeriodicTask>("deep-detection", config.deep_detection_interval,
        [weak] { if (auto impl = weak.lock()) impl->DeepDetectionTick(true); });
    correlation_task_ = std::make_unique<PeriodicTask>("correlation", config.correlation_interval,
        [weak] { if (auto impl = weak.lock()) impl->CorrelationTick(true); });

    spdlog::debug("Real-time monitor created (source: {})", impl_->deps_.source->Name());
}

RealTimeMonitor::~RealTimeMonitor() {
    Stop();
}

// ============================================================================
// LIFECYCLE
// ============================================================================

bool RealTimeMonitor::Start() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);

    auto state = impl_->state_.load();
    if (state == MonitorState::RUNNING) {
        spdlog::warn("Monitor already running");
        return true;
    }

    spdlog::info("═══════════════════════════════════════════════════════════════");
    spdlog::info("STARTING REAL-TIME SECURITY MONITOR");
    spdlog::info("═══════════════════════════════════════════════════════════════");

    impl_->state_ = MonitorState::STARTING;
    const auto config = impl_->Config();

    try {
        if (!impl_->deps_.source->IsAvailable()) {
            spdlog::error("Event source {} is unavailable", impl_->deps_.source->Name());
            impl_->state_ = MonitorState::ERROR;
            return false;
        }
        if (impl_->deps_.enrichment && config.enable_enrichment && !impl_->deps_.enrichment->Initialize()) {
            spdlog::error("Threat intelligence provider failed to initialize");
            impl_->state_ = MonitorState::ERROR;
            return false;
        }
    }
    catch (const std::exception& e) {
        spdlog::error("Monitor initialization failed: {}", e.what());
        impl_->state_ = MonitorState::ERROR;
        return false;
    }

    impl_->stopping_ = false;
    const auto now = impl_->deps_.clock();
    impl_->UpdateStats([now](MonitoringStats& stats) { stats.start_time = now; });

    ingestion_task_->Start();
    if (config.enable_deep_detection) {
        deep_detection_task_->Start();
    }
    if (config.enable_correlation) {
        correlation_task_->Start();
    }

    impl_->state_ = MonitorState::RUNNING;

    spdlog::info("  Ingestion:      every {}ms (batch {})", config.ingestion_interval.count(),
                 config.max_events_per_batch);
    spdlog::info("  Deep detection: {}", config.enable_deep_detection
                 ? "every " + std::to_string(config.deep_detection_interval.count()) + "ms" : "disabled");
    spdlog::info("  Correlation:    {}", config.enable_correlation
                 ? "every " + std::to_string(config.correlation_interval.count()) + "ms" : "disabled");
    spdlog::info("  Auto-response:  {}", config.enable_auto_response
                 ? std::to_string(config.max_auto_responses_per_hour) + "/hour" : "disabled");
    spdlog::info("✓ Monitor running");
    return true;
}

void RealTimeMonitor::Stop() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);

    if (impl_->state_ != MonitorState::RUNNING) {
        return;
    }

    spdlog::info("Stopping real-time monitor...");
    impl_->state_ = MonitorState::STOPPING;
    impl_->stopping_ = true;

    const auto grace = impl_->Config().stop_grace_period;
    bool clean = ingestion_task_->Stop(grace);
    clean = deep_detection_task_->Stop(grace) && clean;
    clean = correlation_task_->Stop(grace) && clean;

    if (!clean) {
        spdlog::warn("Some ticks were still running after {}ms and were abandoned", grace.count());
    }

    impl_->state_ = MonitorState::STOPPED;

    auto stats = impl_->Stats();
    spdlog::info("═══════════════════════════════════════════════════════════════");
    spdlog::info("✓ Monitor stopped");
    spdlog::info("  Events processed: {}", stats.events_processed);
    spdlog::info("  Threats detected: {}", stats.threats_detected);
    spdlog::info("  Incidents:        {}", stats.incidents_created);
    spdlog::info("═══════════════════════════════════════════════════════════════");
}

void RealTimeMonitor::ForceCheck() {
    spdlog::info("Forcing security check");
    const auto config = impl_->Config();

    impl_->IngestionTick(false);
    if (config.enable_deep_detection) {
        impl_->DeepDetectionTick(false);
    }
    if (config.enable_correlation) {
        impl_->CorrelationTick(false);
    }
}

// ============================================================================
// CONFIGURATION
// ============================================================================

void RealTimeMonitor::UpdateConfig(const MonitoringConfig& config) {
    ValidateMonitoringConfig(config);

    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    const auto previous = impl_->Config();
    impl_->SetConfig(config);
    ApplySchedules(previous, config);
    spdlog::info("Monitor configuration updated");
}

void RealTimeMonitor::ApplySchedules(const MonitoringConfig& previous, const MonitoringConfig& current) {
    const bool running = impl_->state_ == MonitorState::RUNNING;
    const auto grace = current.stop_grace_period;

    auto apply = [&](PeriodicTask& task, milliseconds old_interval, milliseconds new_interval,
                     bool was_enabled, bool enabled) {
        if (old_interval != new_interval) {
            task.Restart(new_interval, grace);
        }
        if (!running || was_enabled == enabled) {
            return;
        }
        if (enabled) {
            task.Start();
        }
        else {
            task.Stop(grace);
        }
    };

    apply(*ingestion_task_, previous.ingestion_interval, current.ingestion_interval, true, true);
    apply(*deep_detection_task_, previous.deep_detection_interval, current.deep_detection_interval,
          previous.enable_deep_detection, current.enable_deep_detection);
    apply(*correlation_task_, previous.correlation_interval, current.correlation_interval,
          previous.enable_correlation, current.enable_correlation);
}

// ============================================================================
// ACCESSORS
// ============================================================================

void RealTimeMonitor::SetObservers(MonitorObservers observers) {
    impl_->SetObservers(std::move(observers));
}

MonitoringConfig RealTimeMonitor::GetConfig() const {
    return impl_->Config();
}

MonitoringStats RealTimeMonitor::GetStats() const {
    return impl_->Stats();
}

MonitorState RealTimeMonitor::GetState() const {
    return impl_->state_;
}

bool RealTimeMonitor::IsRunning() const {
    return impl_->state_ == MonitorState::RUNNING;
}

int64_t RealTimeMonitor::GetCursor() const {
    return impl_->cursor_;
}

} // namespace monitors
} // namespace warden
