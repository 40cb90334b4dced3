#include <gtest/gtest.h>

#include "warden/analyzers/threat_classifier.hpp"
#include "warden/stores/indicator_store.hpp"
#include "test_helpers.hpp"

using namespace warden;
using namespace warden::analyzers;
using warden::test::BruteForceBurst;
using warden::test::EventBuilder;

namespace {

class FailingFeed : public core::EnrichmentProvider {
public:
    std::optional<core::EnrichmentMatch> Lookup(core::IndicatorType, const std::string&) override {
        throw std::runtime_error("feed offline");
    }
};

std::shared_ptr<stores::IndicatorStore> FeedWithBadAddress() {
    auto feed = std::make_shared<stores::IndicatorStore>();
    stores::IntelIndicator bad;
    bad.type = core::IndicatorType::IP;
    bad.value = "10.0.0.1";
    bad.severity = core::Severity::HIGH;
    bad.confidence = 90;
    bad.description = "known botnet node";
    bad.tags = {"botnet"};
    feed->Add(bad);
    return feed;
}

} // namespace

// ============================================================================
// SINGLE EVENTS
// ============================================================================

TEST(ThreatClassifierTest, FailedLoginIsBruteForce) {
    ThreatClassifier classifier;
    auto threat = classifier.Classify(EventBuilder(17, "FAILED_LOGIN").Actor("42").Ip("10.0.0.1"));

    ASSERT_TRUE(threat.has_value());
    EXPECT_EQ(threat->threat_id, "evt-17-brute_force_advanced");
    EXPECT_EQ(threat->threat_type, "brute_force_advanced");
    EXPECT_EQ(threat->risk_score, 50);
    EXPECT_EQ(threat->confidence, 60);
    EXPECT_EQ(threat->status, core::ThreatStatus::ACTIVE);
    ASSERT_EQ(threat->indicators.size(), 2u);
    EXPECT_EQ(threat->affected_resources, std::vector<std::string>{"user_42"});
    EXPECT_EQ(threat->source_event_ids, std::vector<int64_t>{17});
    ASSERT_EQ(threat->timeline.size(), 1u);
}

TEST(ThreatClassifierTest, ActionLookupIsCaseInsensitive) {
    ThreatClassifier classifier;
    auto threat = classifier.Classify(EventBuilder(1, "unauthorized_access"));
    ASSERT_TRUE(threat.has_value());
    EXPECT_EQ(threat->threat_type, "privilege_probing");
    EXPECT_EQ(threat->risk_score, 75);
}

TEST(ThreatClassifierTest, RoutineActionsProduceNoThreat) {
    ThreatClassifier classifier;
    EXPECT_FALSE(classifier.Classify(EventBuilder(1, "LOGIN").Actor("42")).has_value());
    EXPECT_FALSE(classifier.Classify(EventBuilder(2, "LOGOUT").Actor("42")).has_value());
    EXPECT_FALSE(classifier.Classify(EventBuilder(3, "UPDATE_INVOICE")).has_value());
}

TEST(ThreatClassifierTest, UnknownSecurityActionIsUnusualActivity) {
    ThreatClassifier classifier;
    auto threat = classifier.Classify(EventBuilder(5, "DATA_EXPORT"));
    ASSERT_TRUE(threat.has_value());
    EXPECT_EQ(threat->threat_type, "unusual_activity");
    EXPECT_EQ(threat->risk_score, 25);
    EXPECT_EQ(threat->confidence, 40);
}

// ============================================================================
// ENRICHMENT
// ============================================================================

TEST(ThreatClassifierTest, FeedHitRaisesRiskAndConfidence) {
    ThreatClassifier classifier(ThreatClassifier::Config{}, FeedWithBadAddress());
    auto threat = classifier.Classify(EventBuilder(1, "FAILED_LOGIN").Actor("42").Ip("10.0.0.1"));

    ASSERT_TRUE(threat.has_value());
    EXPECT_EQ(threat->risk_score, 70);
    EXPECT_EQ(threat->confidence, 90);
    ASSERT_EQ(threat->timeline.size(), 2u);
    EXPECT_EQ(threat->timeline.back().event, "Threat feed match: 10.0.0.1 (known botnet node)");
    EXPECT_EQ(threat->timeline.back().details.at("tags"), "botnet");
}

TEST(ThreatClassifierTest, EnrichmentCanBeDisabled) {
    ThreatClassifier::Config config;
    config.enable_enrichment = false;
    ThreatClassifier classifier(config, FeedWithBadAddress());

    auto threat = classifier.Classify(EventBuilder(1, "FAILED_LOGIN").Ip("10.0.0.1"));
    ASSERT_TRUE(threat.has_value());
    EXPECT_EQ(threat->risk_score, 50);
}

TEST(ThreatClassifierTest, FeedFailureLeavesThreatUnenriched) {
    ThreatClassifier classifier(ThreatClassifier::Config{}, std::make_shared<FailingFeed>());
    auto threat = classifier.Classify(EventBuilder(1, "FAILED_LOGIN").Actor("42").Ip("10.0.0.1"));

    ASSERT_TRUE(threat.has_value());
    EXPECT_EQ(threat->risk_score, 50);
    EXPECT_EQ(threat->timeline.size(), 1u);
}

// ============================================================================
// CORRELATIONS
// ============================================================================

TEST(ThreatClassifierTest, CorrelationBecomesCoordinatedAttack) {
    CorrelationEngine engine;
    auto correlations = engine.Correlate(BruteForceBurst(std::chrono::seconds(150)),
                                         DefaultCorrelationRules());
    ASSERT_EQ(correlations.size(), 1u);

    ThreatClassifier classifier;
    auto threat = classifier.FromCorrelation(correlations[0]);

    EXPECT_EQ(threat.threat_type, "coordinated_attack");
    EXPECT_EQ(threat.risk_score, 74);
    EXPECT_EQ(threat.confidence, 85);
    EXPECT_EQ(threat.threat_id.rfind("cor-", 0), 0u);
    EXPECT_EQ(threat.threat_id.size(), 20u);
    EXPECT_EQ(threat.source_event_ids, (std::vector<int64_t>{1, 2, 3, 4, 5}));

    // One entry per event plus the detection itself
    ASSERT_EQ(threat.timeline.size(), 6u);
    EXPECT_EQ(threat.timeline.back().event, "Correlation detected: Coordinated Brute Force Attack");
    EXPECT_EQ(threat.timeline.back().details.at("correlation_key"), "actorId=42");
}

TEST(ThreatClassifierTest, CorrelationThreatIdIsStable) {
    CorrelationEngine engine;
    auto first = engine.Correlate(BruteForceBurst(std::chrono::seconds(150)), DefaultCorrelationRules());
    auto second = engine.Correlate(BruteForceBurst(std::chrono::seconds(150)), DefaultCorrelationRules());
    auto shifted = engine.Correlate(BruteForceBurst(std::chrono::seconds(150), 100), DefaultCorrelationRules());

    ASSERT_EQ(first.size(), 1u);
    ASSERT_EQ(second.size(), 1u);
    ASSERT_EQ(shifted.size(), 1u);
    EXPECT_EQ(ThreatClassifier::CorrelationThreatId(first[0]),
              ThreatClassifier::CorrelationThreatId(second[0]));
    EXPECT_NE(ThreatClassifier::CorrelationThreatId(first[0]),
              ThreatClassifier::CorrelationThreatId(shifted[0]));
}
