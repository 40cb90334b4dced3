/**
 * @file threat_classifier.cpp
 * @brief Implementation of single-event and correlation classification
 *
 * **Single-event pipeline**:
 * 1. Look the action up in the classification table
 * 2. Fall back to `unusual_activity` (low) for other security keywords
 * 3. Derive risk and confidence from severity
 * 4. Attach ip/user indicators and affected resources
 * 5. Enrich from the threat feed when one is attached
 *
 * @date 2025
 */

#include "warden/analyzers/threat_classifier.hpp"
#include "warden/analyzers/scoring_policy.hpp"
#include "warden/utils/hash_utils.hpp"
#include "warden/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace warden {
namespace analyzers {

using core::IndicatorType;
using core::SecurityEvent;
using core::Severity;
using core::ThreatIndicator;
using core::ThreatIntelligence;
using core::TimelineEntry;
using utils::StringUtils;

namespace {

ThreatIndicator MakeIndicator(IndicatorType type, const std::string& value,
                              int confidence, core::TimePoint when) {
    ThreatIndicator indicator;
    indicator.type = type;
    indicator.value = value;
    indicator.confidence = confidence;
    indicator.first_seen = when;
    indicator.last_seen = when;
    indicator.occurrences = 1;
    return indicator;
}

std::string DescribeEvent(const SecurityEvent& event) {
    std::string text = event.action;
    if (event.actor_id) {
        text += " by user " + *event.actor_id;
    }
    if (event.ip_address) {
        text += " from " + *event.ip_address;
    }
    if (event.resource) {
        text += " on " + *event.resource;
        if (event.resource_id) {
            text += " " + *event.resource_id;
        }
    }
    return text;
}

Severity EventSeverity(const SecurityEvent& event) {
    if (auto profile = scoring::LookupAction(event.action)) {
        return profile->severity;
    }
    return Severity::LOW;
}

} // namespace

// ============================================================================
// CONSTRUCTOR
// ============================================================================

ThreatClassifier::ThreatClassifier()
    : ThreatClassifier(Config{}) {
}

ThreatClassifier::ThreatClassifier(const Config& config,
                                   std::shared_ptr<core::EnrichmentProvider> enrichment)
    : config_(config)
    , enrichment_(std::move(enrichment)) {
}

void ThreatClassifier::SetEnrichmentProvider(std::shared_ptr<core::EnrichmentProvider> enrichment) {
    enrichment_ = std::move(enrichment);
}

// ============================================================================
// IDENTIFIERS
// ============================================================================

std::string ThreatClassifier::EventThreatId(int64_t event_id, const std::string& threat_type) {
    return "evt-" + std::to_string(event_id) + "-" + threat_type;
}

std::string ThreatClassifier::CorrelationThreatId(const EventCorrelation& correlation) {
    std::string first_id = correlation.events.empty()
        ? "0" : std::to_string(correlation.events.front().id);
    return "cor-" + utils::HashUtils::Fingerprint(
        correlation.rule_id + "|" + correlation.correlation_key + "|" + first_id);
}

// ============================================================================
// PUBLIC API - CLASSIFICATION
// ============================================================================

std::optional<ThreatIntelligence> ThreatClassifier::Classify(const SecurityEvent& event) const {
    scoring::ActionProfile profile;

    if (auto known = scoring::LookupAction(event.action)) {
        if (known->severity == Severity::INFO) {
            return std::nullopt;
        }
        profile = *known;
    }
    else if (StringUtils::ContainsSecurityKeyword(event.action)) {
        profile.threat_type = scoring::kUnusualActivity;
        profile.severity = Severity::LOW;
    }
    else {
        return std::nullopt;
    }

    ThreatIntelligence threat;
    threat.threat_id = EventThreatId(event.id, profile.threat_type);
    threat.threat_type = profile.threat_type;
    threat.risk_score = scoring::SeverityBaseRisk(profile.severity);
    threat.confidence = scoring::SeverityConfidence(profile.severity);
    threat.status = core::ThreatStatus::ACTIVE;
    threat.created_at = event.timestamp;
    threat.updated_at = event.timestamp;
    threat.source_event_ids.push_back(event.id);

    if (event.ip_address) {
        threat.indicators.push_back(
            MakeIndicator(IndicatorType::IP, *event.ip_address, threat.confidence, event.timestamp));
    }
    if (event.actor_id) {
        threat.indicators.push_back(
            MakeIndicator(IndicatorType::USER, *event.actor_id, threat.confidence, event.timestamp));
    }

    threat.affected_resources = core::AffectedResourcesOf(event);

    TimelineEntry entry;
    entry.timestamp = event.timestamp;
    entry.event = DescribeEvent(event);
    entry.severity = profile.severity;
    entry.details["event_id"] = std::to_string(event.id);
    entry.details["action"] = event.action;
    threat.timeline.push_back(std::move(entry));

    Enrich(threat);

    spdlog::debug("Event {} classified as {} (risk {})",
                  event.id, threat.threat_type, threat.risk_score);
    return threat;
}

ThreatIntelligence ThreatClassifier::FromCorrelation(const EventCorrelation& correlation) const {
    ThreatIntelligence threat;
    threat.threat_id = CorrelationThreatId(correlation);
    threat.threat_type = scoring::kCoordinatedAttack;
    threat.risk_score = correlation.risk_score;
    threat.confidence = correlation.confidence;
    threat.indicators = correlation.indicators;
    threat.affected_resources = correlation.affected_resources;
    threat.status = core::ThreatStatus::ACTIVE;
    threat.created_at = correlation.detected_at;
    threat.updated_at = correlation.detected_at;

    for (const auto& event : correlation.events) {
        threat.source_event_ids.push_back(event.id);

        TimelineEntry entry;
        entry.timestamp = event.timestamp;
        entry.event = DescribeEvent(event);
        entry.severity = EventSeverity(event);
        entry.details["event_id"] = std::to_string(event.id);
        threat.timeline.push_back(std::move(entry));
    }

    TimelineEntry detection;
    detection.timestamp = correlation.detected_at;
    detection.event = "Correlation detected: " + correlation.rule_name;
    detection.severity = core::SeverityFromRisk(correlation.risk_score);
    detection.details["rule_id"] = correlation.rule_id;
    detection.details["correlation_key"] = correlation.correlation_key;
    detection.details["event_count"] = std::to_string(correlation.pattern.event_count);
    threat.timeline.push_back(std::move(detection));

    Enrich(threat);
    return threat;
}

// ============================================================================
// ENRICHMENT
// ============================================================================

void ThreatClassifier::Enrich(ThreatIntelligence& threat) const {
    if (!config_.enable_enrichment || !enrichment_) {
        return;
    }

    // Snapshot: enrichment may append indicators
    const auto observed = threat.indicators;

    for (const auto& indicator : observed) {
        if (indicator.type != IndicatorType::IP && indicator.type != IndicatorType::USER) {
            continue;
        }

        std::optional<core::EnrichmentMatch> match;
        try {
            match = enrichment_->Lookup(indicator.type, indicator.value);
        }
        catch (const std::exception& e) {
            spdlog::warn("Enrichment lookup for {} failed: {}", indicator.value, e.what());
            continue;
        }

        if (!match) {
            continue;
        }

        threat.risk_score = std::min(scoring::kMaxRiskScore,
                                     threat.risk_score + scoring::EnrichmentRiskBoost(match->severity));
        threat.confidence = std::max(threat.confidence, match->indicator.confidence);

        auto existing = std::find_if(threat.indicators.begin(), threat.indicators.end(),
                                     [&](const ThreatIndicator& i) {
                                         return i.type == indicator.type && i.value == indicator.value;
                                     });
        if (existing != threat.indicators.end()) {
            existing->confidence = std::max(existing->confidence, match->indicator.confidence);
        }

        TimelineEntry entry;
        entry.timestamp = threat.updated_at;
        entry.event = "Threat feed match: " + indicator.value +
                      (match->description.empty() ? "" : " (" + match->description + ")");
        entry.severity = match->severity;
        entry.details["indicator_type"] = core::IndicatorTypeToString(indicator.type);
        entry.details["tags"] = StringUtils::Join(match->tags, ",");
        threat.timeline.push_back(std::move(entry));

        spdlog::info("Threat {} enriched by feed match on {}", threat.threat_id, indicator.value);
    }
}

} // namespace analyzers
} // namespace warden
