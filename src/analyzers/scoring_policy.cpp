/**
 * @file scoring_policy.cpp
 * @brief Scoring formulas and classification tables
 *
 * @date 2025
 */

#include "warden/analyzers/scoring_policy.hpp"
#include "warden/utils/string_utils.hpp"

#include <algorithm>
#include <cmath>
#include <map>

namespace warden {
namespace analyzers {
namespace scoring {

using core::Severity;

// ============================================================================
// CORRELATION SCORING
// ============================================================================

double CountScore(std::size_t event_count, int min_events) {
    if (min_events <= 0) {
        return kCountScoreCap;
    }
    double ratio = static_cast<double>(event_count) / static_cast<double>(min_events);
    return std::min(kCountScoreCap, ratio * kCountScorePerMinimum);
}

double DensityScore(std::size_t event_count, std::chrono::milliseconds time_span) {
    // All events at the same instant: maximal density
    if (time_span.count() <= 0) {
        return kDensityScoreCap;
    }
    double per_minute = static_cast<double>(event_count) * kMillisPerMinute /
                        static_cast<double>(time_span.count());
    return std::min(kDensityScoreCap, per_minute);
}

double ComplexityScore(std::size_t unique_actions) {
    return std::min(kComplexityScoreCap,
                    static_cast<double>(unique_actions) * kComplexityPerAction);
}

double BaseScore(std::size_t event_count, int min_events,
                 std::chrono::milliseconds time_span, std::size_t unique_actions) {
    return CountScore(event_count, min_events) +
           DensityScore(event_count, time_span) +
           ComplexityScore(unique_actions);
}

int CorrelationRisk(double base_score, double risk_multiplier) {
    double risk = std::min(static_cast<double>(kMaxRiskScore), base_score * risk_multiplier);
    return static_cast<int>(std::lround(std::max(0.0, risk)));
}

int IpIndicatorConfidence(int occurrences) {
    return std::min(kIndicatorConfidenceCap, occurrences * kIpConfidencePerOccurrence);
}

int UserIndicatorConfidence(int occurrences) {
    return std::min(kIndicatorConfidenceCap, occurrences * kUserConfidencePerOccurrence);
}

// ============================================================================
// CLASSIFICATION TABLES
// ============================================================================

std::optional<ActionProfile> LookupAction(const std::string& action) {
    static const std::map<std::string, ActionProfile> table = {
        {"FAILED_LOGIN",           {"brute_force_advanced",        Severity::MEDIUM}},
        {"UNAUTHORIZED_ACCESS",    {"privilege_probing",           Severity::HIGH}},
        {"PERMISSION_DENIED",      {"privilege_probing",           Severity::MEDIUM}},
        {"PERMISSION_CHANGE",      {"privilege_escalation",        Severity::HIGH}},
        {"ROLE_CHANGE",            {"privilege_escalation",        Severity::HIGH}},
        {"EXPORT",                 {"financial_data_exfiltration", Severity::MEDIUM}},
        {"BULK_EXPORT",            {"financial_data_exfiltration", Severity::HIGH}},
        {"DOWNLOAD",               {"financial_data_exfiltration", Severity::LOW}},
        {"PROPERTY_ACCESS_DENIED", {"property_access_violation",   Severity::MEDIUM}},
        {"SESSION_HIJACK",         {"session_hijacking",           Severity::HIGH}},
        {"SESSION_ANOMALY",        {"session_hijacking",           Severity::HIGH}},
        {"SECURITY_THREAT",        {"security_threat",             Severity::HIGH}},
        {"LOGIN",                  {"authentication",              Severity::INFO}},
        {"LOGOUT",                 {"authentication",              Severity::INFO}},
    };

    auto it = table.find(utils::StringUtils::ToUpper(action));
    if (it == table.end()) {
        return std::nullopt;
    }
    return it->second;
}

int SeverityBaseRisk(Severity severity) {
    switch (severity) {
        case Severity::INFO:     return 10;
        case Severity::LOW:      return 25;
        case Severity::MEDIUM:   return 50;
        case Severity::HIGH:     return 75;
        case Severity::CRITICAL: return 90;
    }
    return 25;
}

int SeverityConfidence(Severity severity) {
    switch (severity) {
        case Severity::INFO:     return 20;
        case Severity::LOW:      return 40;
        case Severity::MEDIUM:   return 60;
        case Severity::HIGH:     return 75;
        case Severity::CRITICAL: return 85;
    }
    return 40;
}

int EnrichmentRiskBoost(Severity severity) {
    switch (severity) {
        case Severity::CRITICAL: return 30;
        case Severity::HIGH:     return 20;
        case Severity::MEDIUM:   return 10;
        case Severity::LOW:      return 5;
        case Severity::INFO:     return 0;
    }
    return 0;
}

} // namespace scoring
} // namespace analyzers
} // namespace warden
