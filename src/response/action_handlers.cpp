/**
 * @file action_handlers.cpp
 * @brief Implementation of the block, lock, restrict, alert, notify and log handlers
 *
 * @date 2025
 */

#include "warden/response/action_handlers.hpp"
#include "warden/utils/string_utils.hpp"
#include "warden/utils/time_utils.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace warden {
namespace response {

using core::IndicatorType;
using core::SecurityIncident;
using core::ThreatIntelligence;
using utils::StringUtils;
using utils::TimeUtils;

// ============================================================================
// PARAMETER HELPERS
// ============================================================================

std::string GetParameter(const ResponseAction& action, const std::string& name,
                         const std::string& fallback) {
    auto it = action.parameters.find(name);
    return it == action.parameters.end() ? fallback : it->second;
}

long ParseIntParameter(const ResponseAction& action, const std::string& name, long fallback) {
    auto it = action.parameters.find(name);
    if (it == action.parameters.end() || StringUtils::Trim(it->second).empty()) {
        return fallback;
    }

    std::size_t consumed = 0;
    long value = std::stol(it->second, &consumed);
    if (consumed != StringUtils::Trim(it->second).size() || value < 0) {
        throw std::invalid_argument("parameter '" + name + "' must be a non-negative integer: " + it->second);
    }
    return value;
}

// ============================================================================
// ENFORCEMENT BACKEND
// ============================================================================

AuditingEnforcementBackend::AuditingEnforcementBackend(std::shared_ptr<AuditTrail> audit,
                                                       core::ClockFunction clock)
    : audit_(std::move(audit))
    , clock_(std::move(clock)) {
}

void AuditingEnforcementBackend::Apply(const Enforcement& enforcement) {
    spdlog::warn("ENFORCEMENT {} {} '{}' for threat {} ({})",
                 StringUtils::ToUpper(enforcement.action), enforcement.target, enforcement.subject,
                 enforcement.threat_id,
                 enforcement.duration.count() > 0
                     ? std::to_string(enforcement.duration.count()) + "s" : "until lifted");

    if (!audit_) {
        return;
    }

    AuditRecord record;
    record.kind = "enforcement";
    record.threat_id = enforcement.threat_id;
    record.incident_id = enforcement.incident_id;
    record.recorded_at = clock_();
    record.details = enforcement.details;
    record.details["action"] = enforcement.action;
    record.details["target"] = enforcement.target;
    record.details["subject"] = enforcement.subject;
    record.details["duration"] = std::to_string(enforcement.duration.count());
    if (enforcement.expires_at) {
        record.details["expires_at"] = TimeUtils::FormatTimestamp(*enforcement.expires_at);
    }
    record.details["reason"] = "Automated response to threat " + enforcement.threat_id;

    audit_->Append(record);
}

// ============================================================================
// ENFORCEMENT HANDLERS
// ============================================================================

EnforcementHandler::EnforcementHandler(std::shared_ptr<EnforcementBackend> backend,
                                       core::ClockFunction clock)
    : backend_(std::move(backend))
    , clock_(std::move(clock)) {
}

std::optional<std::string> EnforcementHandler::FindIp(const ThreatIntelligence& threat) {
    for (const auto& indicator : threat.indicators) {
        if (indicator.type == IndicatorType::IP) {
            return indicator.value;
        }
    }
    return std::nullopt;
}

std::optional<std::string> EnforcementHandler::FindResource(const ThreatIntelligence& threat,
                                                            const std::string& prefix) {
    for (const auto& resource : threat.affected_resources) {
        if (StringUtils::StartsWith(resource, prefix) && resource.size() > prefix.size()) {
            return resource.substr(prefix.size());
        }
    }
    return std::nullopt;
}

std::optional<std::string> EnforcementHandler::FindUser(const ThreatIntelligence& threat) {
    if (auto user = FindResource(threat, "user_")) {
        return user;
    }
    for (const auto& indicator : threat.indicators) {
        if (indicator.type == IndicatorType::USER) {
            return indicator.value;
        }
    }
    return std::nullopt;
}

ActionResult EnforcementHandler::Enforce(Enforcement enforcement, const std::string& message,
                                         ActionToken& token) {
    if (enforcement.duration.count() > 0) {
        enforcement.expires_at = clock_() + enforcement.duration;
    }

    if (!token.Commit()) {
        return ActionResult::Failed("Abandoned before " + enforcement.action + " was applied");
    }

    if (backend_) {
        backend_->Apply(enforcement);
    }
    else {
        spdlog::warn("No enforcement backend; {} {} '{}' recorded only",
                     enforcement.action, enforcement.target, enforcement.subject);
    }

    std::map<std::string, std::string> details{
        {"target", enforcement.target},
        {"subject", enforcement.subject},
        {"duration", std::to_string(enforcement.duration.count())},
    };
    if (enforcement.expires_at) {
        details["expires_at"] = TimeUtils::FormatTimestamp(*enforcement.expires_at);
    }
    return ActionResult::Ok(message, std::move(details));
}

ActionResult BlockHandler::Execute(const ResponseAction& action,
                                   const ThreatIntelligence& threat,
                                   const SecurityIncident& incident,
                                   ActionToken& token) {
    try {
        const std::string target = GetParameter(action, "target");
        const long duration = ParseIntParameter(action, "duration", 3600);

        Enforcement enforcement;
        enforcement.action = "block";
        enforcement.target = target;
        enforcement.duration = std::chrono::seconds(duration);
        enforcement.threat_id = threat.threat_id;
        enforcement.incident_id = incident.id;

        std::optional<std::string> subject;
        std::string label;
        if (target == "ip") {
            subject = FindIp(threat);
            label = "IP";
        }
        else if (target == "user_session") {
            subject = FindResource(threat, "user_");
            label = "User sessions for";
        }
        else if (target == "property_access") {
            subject = FindResource(threat, "property_");
            label = "Property access for";
        }
        else {
            return ActionResult::Failed("Unknown block target: " + target);
        }

        if (!subject) {
            return ActionResult::Failed("No " + target + " subject found in threat " + threat.threat_id);
        }

        enforcement.subject = *subject;
        return Enforce(std::move(enforcement),
                       label + " " + *subject + " blocked for " + std::to_string(duration) + " seconds",
                       token);
    }
    catch (const std::exception& e) {
        return ActionResult::Failed(std::string("Block action failed: ") + e.what());
    }
}

ActionResult LockHandler::Execute(const ResponseAction& action,
                                  const ThreatIntelligence& threat,
                                  const SecurityIncident& incident,
                                  ActionToken& token) {
    try {
        const std::string target = GetParameter(action, "target", "account");
        const long duration = ParseIntParameter(action, "duration", 1800);

        if (target != "account") {
            return ActionResult::Failed("Unknown lock target: " + target);
        }

        auto user = FindUser(threat);
        if (!user) {
            return ActionResult::Failed("No user found in threat " + threat.threat_id);
        }

        Enforcement enforcement;
        enforcement.action = "lock";
        enforcement.target = target;
        enforcement.subject = *user;
        enforcement.duration = std::chrono::seconds(duration);
        enforcement.threat_id = threat.threat_id;
        enforcement.incident_id = incident.id;

        return Enforce(std::move(enforcement),
                       "Account " + *user + " locked for " + std::to_string(duration) + " seconds",
                       token);
    }
    catch (const std::exception& e) {
        return ActionResult::Failed(std::string("Lock action failed: ") + e.what());
    }
}

ActionResult RestrictHandler::Execute(const ResponseAction& action,
                                      const ThreatIntelligence& threat,
                                      const SecurityIncident& incident,
                                      ActionToken& token) {
    try {
        const std::string target = GetParameter(action, "target");
        if (target != "permissions" && target != "data_access" && target != "concurrent_sessions") {
            return ActionResult::Failed("Unknown restrict target: " + target);
        }

        auto user = FindUser(threat);
        if (!user) {
            return ActionResult::Failed("No user found in threat " + threat.threat_id);
        }

        Enforcement enforcement;
        enforcement.action = "restrict";
        enforcement.target = target;
        enforcement.subject = *user;
        enforcement.duration = std::chrono::seconds(ParseIntParameter(action, "duration", 0));
        enforcement.threat_id = threat.threat_id;
        enforcement.incident_id = incident.id;

        std::string message;
        if (target == "concurrent_sessions") {
            const long limit = ParseIntParameter(action, "limit", 1);
            enforcement.details["limit"] = std::to_string(limit);
            message = "Concurrent sessions for " + *user + " limited to " + std::to_string(limit);
        }
        else if (target == "permissions") {
            message = "Permissions restricted for " + *user;
        }
        else {
            message = "Data access restricted for " + *user;
        }

        return Enforce(std::move(enforcement), message, token);
    }
    catch (const std::exception& e) {
        return ActionResult::Failed(std::string("Restrict action failed: ") + e.what());
    }
}

// ============================================================================
// ALERT / NOTIFY
// ============================================================================

AlertHandler::AlertHandler(std::shared_ptr<core::AlertDispatcher> dispatcher,
                           core::ClockFunction clock)
    : dispatcher_(std::move(dispatcher))
    , clock_(std::move(clock)) {
}

ActionResult AlertHandler::Execute(const ResponseAction& action,
                                   const ThreatIntelligence& threat,
                                   const SecurityIncident& incident,
                                   ActionToken& token) {
    try {
        const std::string level_name = GetParameter(action, "level");
        core::Severity level = core::SeverityFromRisk(threat.risk_score);
        if (!level_name.empty()) {
            auto parsed = core::SeverityFromString(level_name);
            if (!parsed) {
                return ActionResult::Failed("Unknown alert level: " + level_name);
            }
            level = *parsed;
        }

        auto channels = StringUtils::Split(GetParameter(action, "channels", "dashboard"), ',');

        core::SecurityAlert alert;
        alert.created_at = clock_();
        alert.id = core::MakeSequentialId("ALR", alert.created_at);
        alert.threat_id = threat.threat_id;
        alert.incident_id = incident.id;
        alert.level = level;
        alert.title = "SECURITY ALERT [" + StringUtils::ToUpper(core::SeverityToString(level)) + "]: " +
                      StringUtils::ToTitle(threat.threat_type);
        alert.message = "Automated response raised an alert for threat " + threat.threat_id +
                        " (risk " + std::to_string(threat.risk_score) + ")";
        alert.channels = channels;
        alert.action_required = GetParameter(action, "immediate") == "true";
        alert.details["source"] = "automated_response";

        if (!token.Commit()) {
            return ActionResult::Failed("Abandoned before alert " + alert.id + " was sent");
        }

        if (!dispatcher_) {
            spdlog::warn("{}", alert.title);
            return ActionResult::Ok("Alert logged with level " + core::SeverityToString(level),
                                    {{"level", core::SeverityToString(level)}});
        }

        if (!dispatcher_->Send(alert, channels)) {
            return ActionResult::Failed("Alert dispatcher rejected alert " + alert.id);
        }

        return ActionResult::Ok("Alert sent with level " + core::SeverityToString(level),
                                {{"level", core::SeverityToString(level)},
                                 {"alert_id", alert.id},
                                 {"channels", StringUtils::Join(channels, ",")}});
    }
    catch (const std::exception& e) {
        return ActionResult::Failed(std::string("Alert action failed: ") + e.what());
    }
}

NotifyHandler::NotifyHandler(std::shared_ptr<core::AlertDispatcher> dispatcher,
                             core::ClockFunction clock)
    : dispatcher_(std::move(dispatcher))
    , clock_(std::move(clock)) {
}

ActionResult NotifyHandler::Execute(const ResponseAction& action,
                                    const ThreatIntelligence& threat,
                                    const SecurityIncident& incident,
                                    ActionToken& token) {
    try {
        auto channels = StringUtils::Split(GetParameter(action, "channels", "email"), ',');
        if (channels.empty()) {
            return ActionResult::Failed("Notify action has no channels");
        }

        core::SecurityAlert notification;
        notification.created_at = clock_();
        notification.id = core::MakeSequentialId("ALR", notification.created_at);
        notification.threat_id = threat.threat_id;
        notification.incident_id = incident.id;
        notification.level = core::SeverityFromRisk(threat.risk_score);
        notification.title = "SECURITY NOTIFICATION: " + StringUtils::ToTitle(threat.threat_type);
        notification.message = "Threat " + threat.threat_id + " handled by automated response";
        notification.channels = channels;
        notification.escalated = GetParameter(action, "escalate") == "true";
        notification.details["source"] = "automated_response";

        const std::string joined = StringUtils::Join(channels, ",");

        if (!token.Commit()) {
            return ActionResult::Failed("Abandoned before notification via " + joined + " was sent");
        }

        if (!dispatcher_) {
            spdlog::warn("{} via {}", notification.title, joined);
        }
        else if (!dispatcher_->Send(notification, channels)) {
            return ActionResult::Failed("Notification via " + joined + " was not delivered");
        }

        return ActionResult::Ok("Notification sent via " + std::to_string(channels.size()) + " channels",
                                {{"channels", joined},
                                 {"escalate", notification.escalated ? "true" : "false"}});
    }
    catch (const std::exception& e) {
        return ActionResult::Failed(std::string("Notify action failed: ") + e.what());
    }
}

// ============================================================================
// LOG
// ============================================================================

LogHandler::LogHandler(std::shared_ptr<AuditTrail> audit, core::ClockFunction clock)
    : audit_(std::move(audit))
    , clock_(std::move(clock)) {
}

ActionResult LogHandler::Execute(const ResponseAction& action,
                                 const ThreatIntelligence& threat,
                                 const SecurityIncident& incident,
                                 ActionToken& token) {
    try {
        AuditRecord record;
        record.kind = "response_log";
        record.threat_id = threat.threat_id;
        record.incident_id = incident.id;
        record.recorded_at = clock_();
        record.details = action.parameters;
        record.details["threat_type"] = threat.threat_type;
        record.details["risk_score"] = std::to_string(threat.risk_score);
        record.details["confidence"] = std::to_string(threat.confidence);

        if (!token.Commit()) {
            return ActionResult::Failed("Abandoned before the response was logged");
        }

        if (audit_) {
            audit_->Append(record);
        }
        spdlog::info("Security response logged for threat {}", threat.threat_id);

        return ActionResult::Ok("Security response logged", action.parameters);
    }
    catch (const std::exception& e) {
        return ActionResult::Failed(std::string("Log action failed: ") + e.what());
    }
}

} // namespace response
} // namespace warden
