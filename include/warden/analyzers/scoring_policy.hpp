/**
 * @file scoring_policy.hpp
 * @brief Named scoring constants and the formulas built from them
 *
 * Every number that influences a risk score, a confidence value or a
 * threat classification lives here, so the heuristics can be tuned and
 * tested without touching the engines that apply them.
 *
 * **Correlation base score** (0-100 before the rule multiplier):
 * - count component:      min(50, events / min_events * 25)
 * - density component:    min(30, events per minute), 30 for a zero span
 * - complexity component: min(20, unique actions * 4)
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <optional>
#include <chrono>
#include <cstddef>

#include "warden/core/security_types.hpp"

namespace warden {
namespace analyzers {
namespace scoring {

// Correlation base score
constexpr double kCountScoreCap = 50.0;
constexpr double kCountScorePerMinimum = 25.0;     ///< Points per multiple of min_events
constexpr double kDensityScoreCap = 30.0;
constexpr double kMillisPerMinute = 60000.0;
constexpr double kComplexityScoreCap = 20.0;
constexpr double kComplexityPerAction = 4.0;
constexpr int kMaxRiskScore = 100;

// Correlation indicators
constexpr int kIpConfidencePerOccurrence = 10;
constexpr int kUserConfidencePerOccurrence = 15;
constexpr int kIndicatorConfidenceCap = 95;
constexpr int kPatternIndicatorConfidence = 80;

/// Top-N correlations returned by one Correlate() call
constexpr std::size_t kDefaultMaxCorrelations = 20;

double CountScore(std::size_t event_count, int min_events);
double DensityScore(std::size_t event_count, std::chrono::milliseconds time_span);
double ComplexityScore(std::size_t unique_actions);

/// Sum of the three components
double BaseScore(std::size_t event_count, int min_events,
                 std::chrono::milliseconds time_span, std::size_t unique_actions);

/// min(100, base * multiplier), rounded to the nearest integer
int CorrelationRisk(double base_score, double risk_multiplier);

int IpIndicatorConfidence(int occurrences);
int UserIndicatorConfidence(int occurrences);

/***************************************************************************
 * Single-event classification
 ***************************************************************************/

/**
 * @struct ActionProfile
 * @brief Threat type and severity assigned to an audit action
 */
struct ActionProfile {
    std::string threat_type;
    core::Severity severity{core::Severity::LOW};
};

/// Threat type assigned to security-relevant actions missing from the table
inline constexpr const char* kUnusualActivity = "unusual_activity";

/// Threat type assigned to correlation-derived threats
inline constexpr const char* kCoordinatedAttack = "coordinated_attack";

/**
 * @brief Look up an action in the fixed classification table
 *
 * Matching is case-insensitive. Returns nullopt for actions that are not
 * in the table; LOGIN and LOGOUT are in the table with INFO severity.
 */
std::optional<ActionProfile> LookupAction(const std::string& action);

/// Base risk by severity: info 10, low 25, medium 50, high 75, critical 90
int SeverityBaseRisk(core::Severity severity);

/// Classification confidence by severity: info 20, low 40, medium 60, high 75, critical 85
int SeverityConfidence(core::Severity severity);

/// Risk added by a threat-feed hit: critical 30, high 20, medium 10, low 5
int EnrichmentRiskBoost(core::Severity severity);

} // namespace scoring
} // namespace analyzers
} // namespace warden
