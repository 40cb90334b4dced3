/**
 * @file correlation_engine.hpp
 * @brief Rule-driven temporal correlation of audit events
 *
 * The correlation engine applies declarative CorrelationRules to a batch of
 * recent SecurityEvents and reports groups of events that together look like
 * an attack (brute force from rotating addresses, privilege escalation
 * chains, bulk exports...).
 *
 * **Algorithm (per enabled rule)**:
 * 1. Keep events that satisfy every non-SAME condition
 * 2. Skip the rule if fewer than min_events survive
 * 3. Group by the values of the `equals SAME` fields
 * 4. Keep groups with min_events..max_events events spanning at most the
 *    rule's time window, and at least two distinct values of every
 *    `not_equals SAME` field
 * 5. Score, extract indicators, emit one EventCorrelation per group
 *
 * Results across all rules are ordered by risk (descending), then rule
 * priority (ascending), and truncated to the configured top-N.
 *
 * Correlate() is a pure function of its inputs: no clock is read, no state
 * is kept between calls.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <cstddef>

#include "warden/core/security_types.hpp"
#include "warden/analyzers/conditions.hpp"
#include "warden/analyzers/scoring_policy.hpp"

namespace warden {
namespace analyzers {

/// Correlation key component used when a grouping field is missing
inline constexpr const char* kUnknownKeyValue = "unknown";

/**
 * @struct CorrelationRule
 * @brief Declarative multi-event detection rule
 */
struct CorrelationRule {
    std::string id;
    std::string name;
    std::string description;
    std::chrono::milliseconds time_window{0};       ///< Maximum span of a qualifying group
    int min_events{1};
    int max_events{1};
    std::vector<CorrelationCondition> conditions;   ///< All must hold
    double risk_multiplier{1.0};
    int confidence{50};                             ///< 0-100, copied onto correlations
    int priority{5};                                ///< Lower value wins ties
    bool enabled{true};
};

/**
 * @struct CorrelationPattern
 * @brief Shape of a correlated event group
 */
struct CorrelationPattern {
    std::size_t event_count{0};
    std::chrono::milliseconds time_span{0};
    double frequency{0.0};              ///< Events per minute (event_count when the span is zero)
    std::size_t unique_actors{0};
    std::size_t unique_ips{0};
    std::size_t unique_tenants{0};
    std::size_t unique_actions{0};
};

/**
 * @struct EventCorrelation
 * @brief One rule match over one group of events
 */
struct EventCorrelation {
    std::string rule_id;
    std::string rule_name;
    std::vector<core::SecurityEvent> events;        ///< Sorted by timestamp, then id
    std::string correlation_key;                    ///< `field=value` pairs of the grouping fields
    CorrelationPattern pattern;
    int risk_score{0};
    int confidence{0};
    int priority{0};
    std::vector<core::ThreatIndicator> indicators;
    std::vector<std::string> affected_resources;
    core::TimePoint detected_at;                    ///< Timestamp of the last event in the group
};

/**
 * @brief Check a rule before it enters a rule store
 *
 * Rejects empty ids, empty condition lists, non-positive windows,
 * min_events < 1, max_events < min_events, a non-positive multiplier and
 * confidence outside 0-100.
 *
 * @throws core::ValidationError describing the first problem found
 */
void ValidateRule(const CorrelationRule& rule);

/// Built-in correlation rules (brute force, escalation, exfiltration...)
std::vector<CorrelationRule> DefaultCorrelationRules();

/**
 * @class CorrelationEngine
 * @brief Stateless evaluator for correlation rules
 *
 * **Usage Example**:
 * @code
 * CorrelationEngine engine;
 * auto correlations = engine.Correlate(events, rule_store.List());
 * for (const auto& c : correlations) {
 *     spdlog::info("{}: {} events, risk {}", c.rule_id, c.pattern.event_count, c.risk_score);
 * }
 * @endcode
 */
class CorrelationEngine {
public:
    struct Config {
        std::size_t max_correlations{scoring::kDefaultMaxCorrelations};
    };

    CorrelationEngine();
    explicit CorrelationEngine(const Config& config);

    /**
     * @brief Apply every enabled rule to @p events
     *
     * A rule that throws is logged and skipped; the remaining rules are
     * still evaluated.
     */
    std::vector<EventCorrelation> Correlate(const std::vector<core::SecurityEvent>& events,
                                            const std::vector<CorrelationRule>& rules) const;

    /// Apply one rule, ignoring its enabled flag; results are unsorted
    std::vector<EventCorrelation> EvaluateRule(const CorrelationRule& rule,
                                               const std::vector<core::SecurityEvent>& events) const;

    const Config& GetConfig() const { return config_; }

private:
    EventCorrelation BuildCorrelation(const CorrelationRule& rule,
                                      const std::string& key,
                                      std::vector<core::SecurityEvent> events) const;

    std::vector<core::ThreatIndicator> ExtractIndicators(
        const std::vector<core::SecurityEvent>& events) const;

    Config config_;
};

} // namespace analyzers
} // namespace warden
