#include <gtest/gtest.h>

#include "warden/analyzers/correlation_engine.hpp"
#include "test_helpers.hpp"

#include <algorithm>

using namespace warden;
using namespace warden::analyzers;
using warden::test::BruteForceBurst;
using warden::test::EventBuilder;
using std::chrono::seconds;

namespace {

const CorrelationRule& FindRule(const std::vector<CorrelationRule>& rules, const std::string& id) {
    auto it = std::find_if(rules.begin(), rules.end(),
                           [&id](const CorrelationRule& rule) { return rule.id == id; });
    if (it == rules.end()) {
        throw std::runtime_error("no rule " + id);
    }
    return *it;
}

std::vector<core::SecurityEvent> EscalationChain(const std::string& actor, int64_t first_id) {
    return {
        EventBuilder(first_id, "PERMISSION_CHANGE").AtSecond(0).Actor(actor),
        EventBuilder(first_id + 1, "PERMISSION_CHANGE").AtSecond(60).Actor(actor),
        EventBuilder(first_id + 2, "PERMISSION_CHANGE").AtSecond(120).Actor(actor),
    };
}

} // namespace

class CorrelationEngineTest : public ::testing::Test {
protected:
    CorrelationEngine engine_;
    std::vector<CorrelationRule> rules_ = DefaultCorrelationRules();
};

// ============================================================================
// BRUTE FORCE
// ============================================================================

TEST_F(CorrelationEngineTest, BruteForceWithinWindowCorrelates) {
    auto correlations = engine_.Correlate(BruteForceBurst(seconds(150)), rules_);

    ASSERT_EQ(correlations.size(), 1u);
    const auto& c = correlations[0];
    EXPECT_EQ(c.rule_id, "coordinated_brute_force");
    EXPECT_EQ(c.correlation_key, "actorId=42");
    EXPECT_EQ(c.pattern.event_count, 5u);
    EXPECT_EQ(c.pattern.unique_ips, 3u);
    EXPECT_EQ(c.pattern.unique_actors, 1u);
    EXPECT_EQ(c.pattern.time_span, std::chrono::minutes(10));
    EXPECT_DOUBLE_EQ(c.pattern.frequency, 0.5);

    // (25 + 0.5 + 4) * 2.5 = 73.75
    EXPECT_EQ(c.risk_score, 74);
    EXPECT_EQ(c.confidence, 85);
    EXPECT_EQ(c.detected_at, test::BaseTime() + std::chrono::minutes(10));
}

TEST_F(CorrelationEngineTest, BruteForceSpreadBeyondWindowDoesNotCorrelate) {
    auto correlations = engine_.Correlate(BruteForceBurst(seconds(300)), rules_);
    EXPECT_TRUE(correlations.empty());
}

TEST_F(CorrelationEngineTest, SingleAddressFailsDivergence) {
    std::vector<core::SecurityEvent> events;
    for (int i = 0; i < 5; ++i) {
        events.push_back(EventBuilder(i + 1, "FAILED_LOGIN").AtSecond(i * 10).Actor("42").Ip("10.0.0.9"));
    }
    EXPECT_TRUE(engine_.EvaluateRule(FindRule(rules_, "coordinated_brute_force"), events).empty());
}

TEST_F(CorrelationEngineTest, IndicatorsCountOccurrences) {
    auto correlations = engine_.Correlate(BruteForceBurst(seconds(150)), rules_);
    ASSERT_EQ(correlations.size(), 1u);

    const auto& indicators = correlations[0].indicators;
    auto find = [&indicators](core::IndicatorType type, const std::string& value) {
        return std::find_if(indicators.begin(), indicators.end(),
                            [&](const core::ThreatIndicator& i) { return i.type == type && i.value == value; });
    };

    auto ip = find(core::IndicatorType::IP, "10.0.0.1");
    ASSERT_NE(ip, indicators.end());
    EXPECT_EQ(ip->occurrences, 2);
    EXPECT_EQ(ip->confidence, 20);

    auto user = find(core::IndicatorType::USER, "42");
    ASSERT_NE(user, indicators.end());
    EXPECT_EQ(user->occurrences, 5);
    EXPECT_EQ(user->confidence, 75);

    // One action only: no pattern indicator
    EXPECT_EQ(std::count_if(indicators.begin(), indicators.end(),
                            [](const core::ThreatIndicator& i) { return i.type == core::IndicatorType::PATTERN; }),
              0);
}

// ============================================================================
// GROUPING
// ============================================================================

TEST_F(CorrelationEngineTest, GroupsAreKeptPerActor) {
    auto events = EscalationChain("7", 1);
    auto other = EscalationChain("8", 10);
    other.pop_back();   // only two events for actor 8
    events.insert(events.end(), other.begin(), other.end());

    auto correlations = engine_.EvaluateRule(FindRule(rules_, "privilege_escalation_chain"), events);
    ASSERT_EQ(correlations.size(), 1u);
    EXPECT_EQ(correlations[0].correlation_key, "actorId=7");
}

TEST_F(CorrelationEngineTest, MissingGroupingFieldUsesUnknownBucket) {
    std::vector<core::SecurityEvent> events = {
        EventBuilder(1, "PERMISSION_CHANGE").AtSecond(0),
        EventBuilder(2, "PERMISSION_CHANGE").AtSecond(30),
        EventBuilder(3, "PERMISSION_CHANGE").AtSecond(60),
    };

    auto correlations = engine_.EvaluateRule(FindRule(rules_, "privilege_escalation_chain"), events);
    ASSERT_EQ(correlations.size(), 1u);
    EXPECT_EQ(correlations[0].correlation_key, "actorId=unknown");
}

TEST_F(CorrelationEngineTest, EventsAreSortedByTimeThenId) {
    std::vector<core::SecurityEvent> events = {
        EventBuilder(3, "PERMISSION_CHANGE").AtSecond(60).Actor("7"),
        EventBuilder(2, "PERMISSION_CHANGE").AtSecond(0).Actor("7"),
        EventBuilder(1, "PERMISSION_CHANGE").AtSecond(0).Actor("7"),
    };

    auto correlations = engine_.EvaluateRule(FindRule(rules_, "privilege_escalation_chain"), events);
    ASSERT_EQ(correlations.size(), 1u);
    const auto& grouped = correlations[0].events;
    EXPECT_EQ(grouped[0].id, 1);
    EXPECT_EQ(grouped[1].id, 2);
    EXPECT_EQ(grouped[2].id, 3);
}

TEST_F(CorrelationEngineTest, GroupLargerThanMaxEventsIsDropped) {
    CorrelationRule rule = FindRule(rules_, "privilege_escalation_chain");
    rule.max_events = 2;
    EXPECT_TRUE(engine_.EvaluateRule(rule, EscalationChain("7", 1)).empty());
}

// ============================================================================
// ORDERING AND LIMITS
// ============================================================================

TEST_F(CorrelationEngineTest, ResultsOrderedByRiskDescending) {
    auto events = BruteForceBurst(seconds(150));
    auto chain = EscalationChain("7", 100);
    events.insert(events.end(), chain.begin(), chain.end());

    auto correlations = engine_.Correlate(events, rules_);
    ASSERT_EQ(correlations.size(), 2u);
    // (25 + 1.5 + 4) * 3.0 = 91.5
    EXPECT_EQ(correlations[0].rule_id, "privilege_escalation_chain");
    EXPECT_EQ(correlations[0].risk_score, 92);
    EXPECT_EQ(correlations[1].rule_id, "coordinated_brute_force");
}

TEST_F(CorrelationEngineTest, TruncatesToTopN) {
    CorrelationEngine limited(CorrelationEngine::Config{1});
    auto events = BruteForceBurst(seconds(150));
    auto chain = EscalationChain("7", 100);
    events.insert(events.end(), chain.begin(), chain.end());

    auto correlations = limited.Correlate(events, rules_);
    ASSERT_EQ(correlations.size(), 1u);
    EXPECT_EQ(correlations[0].rule_id, "privilege_escalation_chain");
}

TEST_F(CorrelationEngineTest, DisabledRulesAreSkipped) {
    for (auto& rule : rules_) {
        rule.enabled = false;
    }
    EXPECT_TRUE(engine_.Correlate(BruteForceBurst(seconds(150)), rules_).empty());
}

TEST_F(CorrelationEngineTest, CorrelateIsDeterministic) {
    auto events = BruteForceBurst(seconds(150));
    auto chain = EscalationChain("7", 100);
    events.insert(events.end(), chain.begin(), chain.end());

    auto first = engine_.Correlate(events, rules_);
    std::reverse(events.begin(), events.end());
    auto second = engine_.Correlate(events, rules_);

    ASSERT_EQ(first.size(), second.size());
    for (std::size_t i = 0; i < first.size(); ++i) {
        EXPECT_EQ(first[i].rule_id, second[i].rule_id);
        EXPECT_EQ(first[i].correlation_key, second[i].correlation_key);
        EXPECT_EQ(first[i].risk_score, second[i].risk_score);
        EXPECT_EQ(first[i].affected_resources, second[i].affected_resources);
    }
}

TEST_F(CorrelationEngineTest, EmptyInputYieldsNothing) {
    EXPECT_TRUE(engine_.Correlate({}, rules_).empty());
}

// ============================================================================
// VALIDATION AND SCORING
// ============================================================================

TEST(CorrelationRuleValidationTest, RejectsBrokenRules) {
    CorrelationRule valid = DefaultCorrelationRules().front();
    EXPECT_NO_THROW(ValidateRule(valid));

    auto broken = valid;
    broken.id.clear();
    EXPECT_THROW(ValidateRule(broken), core::ValidationError);

    broken = valid;
    broken.conditions.clear();
    EXPECT_THROW(ValidateRule(broken), core::ValidationError);

    broken = valid;
    broken.time_window = std::chrono::milliseconds(0);
    EXPECT_THROW(ValidateRule(broken), core::ValidationError);

    broken = valid;
    broken.max_events = broken.min_events - 1;
    EXPECT_THROW(ValidateRule(broken), core::ValidationError);

    broken = valid;
    broken.confidence = 101;
    EXPECT_THROW(ValidateRule(broken), core::ValidationError);
}

TEST(ScoringPolicyTest, ComponentsAreCapped) {
    EXPECT_DOUBLE_EQ(scoring::CountScore(50, 5), 50.0);
    EXPECT_DOUBLE_EQ(scoring::DensityScore(10, std::chrono::milliseconds(0)), 30.0);
    EXPECT_DOUBLE_EQ(scoring::DensityScore(600, std::chrono::minutes(1)), 30.0);
    EXPECT_DOUBLE_EQ(scoring::ComplexityScore(9), 20.0);
    EXPECT_EQ(scoring::CorrelationRisk(90.0, 3.0), 100);
    EXPECT_EQ(scoring::IpIndicatorConfidence(20), 95);
}
