#include <gtest/gtest.h>

#include "warden/reporters/json_reporter.hpp"
#include "warden/parsers/config_parser.hpp"
#include "test_helpers.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;
using namespace warden;
using namespace warden::reporters;
using warden::test::EventBuilder;

class JsonReporterTest : public ::testing::Test {
protected:
    JsonReporter reporter_{JsonReporterConfig{false, 0}};
};

TEST_F(JsonReporterTest, EventOmitsAbsentFields) {
    core::SecurityEvent event = EventBuilder(7, "FAILED_LOGIN").AtMinute(1).Actor("42");
    event.details["reason"] = "bad password";

    auto j = json::parse(reporter_.EventToJson(event));

    EXPECT_EQ(j["id"], 7);
    EXPECT_EQ(j["timestamp"], "2025-03-01T10:01:00.000Z");
    EXPECT_EQ(j["actor_id"], "42");
    EXPECT_EQ(j["details"]["reason"], "bad password");
    EXPECT_FALSE(j.contains("ip_address"));
    EXPECT_FALSE(j.contains("tenant_id"));
}

TEST_F(JsonReporterTest, CorrelationsCarryPatternAndEventIds) {
    analyzers::CorrelationEngine engine;
    auto correlations = engine.Correlate(test::BruteForceBurst(std::chrono::seconds(150)),
                                         analyzers::DefaultCorrelationRules());
    ASSERT_EQ(correlations.size(), 1u);

    auto j = json::parse(reporter_.CorrelationsToJson(correlations));

    EXPECT_EQ(j["count"], 1);
    const auto& c = j["correlations"][0];
    EXPECT_EQ(c["rule_id"], "coordinated_brute_force");
    EXPECT_EQ(c["risk_score"], 74);
    EXPECT_EQ(c["pattern"]["event_count"], 5);
    EXPECT_EQ(c["pattern"]["time_span_ms"], 600000);
    EXPECT_EQ(c["event_ids"], json::array({1, 2, 3, 4, 5}));
}

TEST_F(JsonReporterTest, IncidentWithoutResolutionHasNull) {
    auto threat = test::MakeThreat("t-1", 80);
    auto incident = test::MakeIncident(threat);

    auto j = json::parse(reporter_.IncidentToJson(incident));

    EXPECT_EQ(j["id"], "INC-test-t-1");
    EXPECT_EQ(j["severity"], "high");
    EXPECT_EQ(j["status"], "open");
    EXPECT_TRUE(j["resolution"].is_null());
    EXPECT_TRUE(j["response_actions"].empty());
}

TEST_F(JsonReporterTest, IncidentRecordsForJsonLinesSink) {
    auto incident = test::MakeIncident(test::MakeThreat("t-2", 60));

    auto created = json::parse(reporter_.IncidentCreatedRecord(incident));
    EXPECT_EQ(created["record"], "incident");
    EXPECT_EQ(created["incident"]["threat_id"], "t-2");

    core::IncidentPatch patch;
    patch.status = core::IncidentStatus::CONTAINED;
    patch.updated_at = test::BaseTime();
    auto updated = json::parse(reporter_.IncidentUpdatedRecord(incident.id, patch));

    EXPECT_EQ(updated["record"], "incident_update");
    EXPECT_EQ(updated["id"], incident.id);
    EXPECT_EQ(updated["patch"]["status"], "contained");
    EXPECT_FALSE(updated["patch"].contains("resolution"));
}

TEST_F(JsonReporterTest, ResponseResultAndIncidentListActions) {
    auto threat = test::MakeThreat("t-3", 95);
    auto incident = test::MakeIncident(threat);

    response::AutomatedResponseResult result;
    result.threat_id = threat.threat_id;
    result.incident_id = incident.id;
    result.rules_executed = {"contain"};
    response::ExecutedAction blocked;
    blocked.rule_id = "contain";
    blocked.action = response::ResponseAction{response::ActionType::BLOCK, {{"target", "ip"}}};
    blocked.result = response::ActionResult::Ok("IP 203.0.113.7 blocked", {{"subject", "203.0.113.7"}});
    blocked.duration = std::chrono::milliseconds(3);
    result.actions_executed.push_back(blocked);

    auto j = json::parse(reporter_.ResponseResultToJson(result));
    ASSERT_EQ(j["actions_executed"].size(), 1u);
    EXPECT_EQ(j["actions_executed"][0]["type"], "block");
    EXPECT_EQ(j["actions_executed"][0]["parameters"]["target"], "ip");
    EXPECT_EQ(j["actions_executed"][0]["details"]["subject"], "203.0.113.7");
    EXPECT_EQ(j["actions_executed"][0]["duration_ms"], 3);

    core::Evidence evidence;
    evidence.type = core::IndicatorType::IP;
    evidence.value = "203.0.113.7";
    incident.evidence.push_back(evidence);
    incident.response_actions = response::ToActionRecords(result);

    auto i = json::parse(reporter_.IncidentToJson(incident));
    ASSERT_EQ(i["evidence"].size(), 1u);
    EXPECT_EQ(i["evidence"][0]["type"], "ip");
    ASSERT_EQ(i["response_actions"].size(), 1u);
    EXPECT_EQ(i["response_actions"][0]["rule_id"], "contain");
    EXPECT_EQ(i["response_actions"][0]["success"], true);
}

TEST_F(JsonReporterTest, EscalationPatchCarriesSeverity) {
    core::IncidentPatch patch;
    patch.severity = core::Severity::CRITICAL;
    patch.escalated = true;
    patch.updated_at = test::BaseTime();

    auto j = json::parse(reporter_.IncidentUpdatedRecord("INC-1", patch));

    EXPECT_EQ(j["patch"]["severity"], "critical");
    EXPECT_EQ(j["patch"]["escalated"], true);
    EXPECT_FALSE(j["patch"].contains("status"));
}

TEST_F(JsonReporterTest, StatsNestErrorCounters) {
    monitors::MonitoringStats stats;
    stats.state = monitors::MonitorState::RUNNING;
    stats.events_processed = 12;
    stats.ingestion_errors = 2;

    auto j = json::parse(reporter_.StatsToJson(stats));

    EXPECT_EQ(j["state"], "running");
    EXPECT_EQ(j["events_processed"], 12);
    EXPECT_EQ(j["errors"]["ingestion"], 2);
    EXPECT_EQ(j["errors"]["correlation"], 0);
}

TEST_F(JsonReporterTest, RuleOutputLoadsAsConfiguration) {
    const auto correlation_rules = analyzers::DefaultCorrelationRules();
    const auto response_rules = response::DefaultResponseRules();

    auto config = parsers::ConfigParser::Parse(reporter_.RulesToJson(correlation_rules, response_rules));

    ASSERT_TRUE(config.correlation_rules.has_value());
    ASSERT_EQ(config.correlation_rules->size(), correlation_rules.size());
    for (std::size_t i = 0; i < correlation_rules.size(); ++i) {
        EXPECT_EQ((*config.correlation_rules)[i].id, correlation_rules[i].id);
        EXPECT_EQ((*config.correlation_rules)[i].conditions.size(), correlation_rules[i].conditions.size());
    }
    ASSERT_TRUE(config.response_rules.has_value());
    ASSERT_EQ(config.response_rules->size(), response_rules.size());
    EXPECT_EQ(config.response_rules->back().actions.size(), response_rules.back().actions.size());
}

TEST_F(JsonReporterTest, PrettyPrintingIsConfigurable) {
    JsonReporter pretty;
    auto event = EventBuilder(1, "LOGIN").Build();

    EXPECT_NE(pretty.EventToJson(event).find('\n'), std::string::npos);
    EXPECT_EQ(reporter_.EventToJson(event).find('\n'), std::string::npos);
}

TEST_F(JsonReporterTest, ValidateJson) {
    EXPECT_TRUE(reporter_.ValidateJson(R"({"a": [1, 2]})"));
    EXPECT_FALSE(reporter_.ValidateJson("{\"a\": "));
}
