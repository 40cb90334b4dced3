/**
 * @file threat_classifier.hpp
 * @brief Converts single events and correlations into ThreatIntelligence
 *
 * Single events are mapped through a fixed action table (see
 * scoring_policy.hpp). Events with no security relevance produce no threat.
 * When an EnrichmentProvider is attached, ip and user indicators are looked
 * up in the threat feed and hits raise the risk score and confidence.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <memory>
#include <optional>
#include <cstdint>

#include "warden/core/security_types.hpp"
#include "warden/core/collaborators.hpp"
#include "warden/analyzers/correlation_engine.hpp"

namespace warden {
namespace analyzers {

/**
 * @class ThreatClassifier
 * @brief Single-event and correlation threat classification
 *
 * Classification never throws on unknown actions. Enrichment failures are
 * logged and the un-enriched threat is returned.
 *
 * Threat ids are deterministic:
 * - `evt-<eventId>-<threatType>` for single events
 * - `cor-<16 hex chars of SHA-256(ruleId|key|firstEventId)>` for correlations
 */
class ThreatClassifier {
public:
    struct Config {
        bool enable_enrichment{true};
    };

    ThreatClassifier();
    explicit ThreatClassifier(const Config& config,
                              std::shared_ptr<core::EnrichmentProvider> enrichment = nullptr);

    /**
     * @brief Classify one audit event
     * @return nullopt for info-level and non-security actions
     */
    std::optional<core::ThreatIntelligence> Classify(const core::SecurityEvent& event) const;

    /// Convert a correlation into a `coordinated_attack` threat
    core::ThreatIntelligence FromCorrelation(const EventCorrelation& correlation) const;

    void SetEnrichmentProvider(std::shared_ptr<core::EnrichmentProvider> enrichment);
    void SetConfig(const Config& config) { config_ = config; }

    static std::string EventThreatId(int64_t event_id, const std::string& threat_type);
    static std::string CorrelationThreatId(const EventCorrelation& correlation);

private:
    void Enrich(core::ThreatIntelligence& threat) const;

    Config config_;
    std::shared_ptr<core::EnrichmentProvider> enrichment_;
};

} // namespace analyzers
} // namespace warden
