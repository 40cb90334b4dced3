/**
 * @file security_types.cpp
 * @brief Enum/string conversions for the core data model
 *
 * @date 2025
 */

#include "warden/core/security_types.hpp"
#include "warden/utils/time_utils.hpp"

#include <atomic>

namespace warden {
namespace core {

std::string SeverityToString(Severity severity) {
    switch (severity) {
        case Severity::INFO:     return "info";
        case Severity::LOW:      return "low";
        case Severity::MEDIUM:   return "medium";
        case Severity::HIGH:     return "high";
        case Severity::CRITICAL: return "critical";
        default:                 return "low";
    }
}

std::optional<Severity> SeverityFromString(const std::string& name) {
    if (name == "info")     return Severity::INFO;
    if (name == "low")      return Severity::LOW;
    if (name == "medium")   return Severity::MEDIUM;
    if (name == "high")     return Severity::HIGH;
    if (name == "critical") return Severity::CRITICAL;
    return std::nullopt;
}

std::string IndicatorTypeToString(IndicatorType type) {
    switch (type) {
        case IndicatorType::IP:       return "ip";
        case IndicatorType::USER:     return "user";
        case IndicatorType::DEVICE:   return "device";
        case IndicatorType::PATTERN:  return "pattern";
        case IndicatorType::BEHAVIOR: return "behavior";
        case IndicatorType::DOMAIN:   return "domain";
        case IndicatorType::URL:      return "url";
        case IndicatorType::HASH:     return "hash";
        default:                      return "pattern";
    }
}

std::optional<IndicatorType> IndicatorTypeFromString(const std::string& name) {
    if (name == "ip")       return IndicatorType::IP;
    if (name == "user")     return IndicatorType::USER;
    if (name == "device")   return IndicatorType::DEVICE;
    if (name == "pattern")  return IndicatorType::PATTERN;
    if (name == "behavior") return IndicatorType::BEHAVIOR;
    if (name == "domain")   return IndicatorType::DOMAIN;
    if (name == "url")      return IndicatorType::URL;
    if (name == "hash")     return IndicatorType::HASH;
    return std::nullopt;
}

std::string ThreatStatusToString(ThreatStatus status) {
    switch (status) {
        case ThreatStatus::ACTIVE:         return "active";
        case ThreatStatus::INVESTIGATING:  return "investigating";
        case ThreatStatus::CONTAINED:      return "contained";
        case ThreatStatus::RESOLVED:       return "resolved";
        case ThreatStatus::FALSE_POSITIVE: return "false_positive";
        default:                           return "active";
    }
}

std::optional<ThreatStatus> ThreatStatusFromString(const std::string& name) {
    if (name == "active")         return ThreatStatus::ACTIVE;
    if (name == "investigating")  return ThreatStatus::INVESTIGATING;
    if (name == "contained")      return ThreatStatus::CONTAINED;
    if (name == "resolved")       return ThreatStatus::RESOLVED;
    if (name == "false_positive") return ThreatStatus::FALSE_POSITIVE;
    return std::nullopt;
}

std::string IncidentStatusToString(IncidentStatus status) {
    switch (status) {
        case IncidentStatus::OPEN:          return "open";
        case IncidentStatus::INVESTIGATING: return "investigating";
        case IncidentStatus::CONTAINED:     return "contained";
        case IncidentStatus::RESOLVED:      return "resolved";
        case IncidentStatus::CLOSED:        return "closed";
        default:                            return "open";
    }
}

Severity SeverityFromRisk(int risk_score, int critical, int high, int medium) {
    if (risk_score >= critical) return Severity::CRITICAL;
    if (risk_score >= high)     return Severity::HIGH;
    if (risk_score >= medium)   return Severity::MEDIUM;
    return Severity::LOW;
}

std::vector<std::string> AffectedResourcesOf(const SecurityEvent& event) {
    std::vector<std::string> resources;
    if (event.actor_id) {
        resources.push_back("user_" + *event.actor_id);
    }
    if (event.tenant_id) {
        resources.push_back("property_" + *event.tenant_id);
    }
    if (event.resource && event.resource_id) {
        resources.push_back(*event.resource + "_" + *event.resource_id);
    }
    return resources;
}

std::string MakeSequentialId(const std::string& prefix, TimePoint when) {
    static std::atomic<uint64_t> sequence{0};
    uint64_t seq = ++sequence;
    return prefix + "-" + utils::TimeUtils::FormatCompact(when) + "-" + std::to_string(seq);
}

} // namespace core
} // namespace warden
