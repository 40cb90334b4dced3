#include <gtest/gtest.h>

#include "warden/parsers/config_parser.hpp"
#include "test_helpers.hpp"

#include <filesystem>
#include <fstream>

using namespace warden;
using namespace warden::parsers;

TEST(ConfigParserTest, EmptyDocumentKeepsDefaults) {
    auto config = ConfigParser::Parse("{}");

    EXPECT_EQ(config.monitor.ingestion_interval, std::chrono::milliseconds(5000));
    EXPECT_EQ(config.monitor.max_auto_responses_per_hour, 50);
    EXPECT_FALSE(config.correlation_rules.has_value());
    EXPECT_EQ(config.CorrelationRulesOrDefault().size(), 6u);
    EXPECT_FALSE(config.ResponseRulesOrDefault().empty());
    EXPECT_TRUE(config.indicators.empty());
}

TEST(ConfigParserTest, MonitorSettings) {
    auto config = ConfigParser::Parse(R"({
        "monitor": {
            "ingestion_interval_ms": 1000,
            "enable_correlation": false,
            "max_auto_responses_per_hour": 5,
            "incident_threshold": 40,
            "some_future_setting": true
        }
    })");

    EXPECT_EQ(config.monitor.ingestion_interval, std::chrono::milliseconds(1000));
    EXPECT_FALSE(config.monitor.enable_correlation);
    EXPECT_EQ(config.monitor.max_auto_responses_per_hour, 5);
    EXPECT_EQ(config.monitor.incident_threshold, 40);
    EXPECT_EQ(config.monitor.correlation_interval, std::chrono::milliseconds(15000));
}

TEST(ConfigParserTest, InvalidMonitorSettingsAreRejected) {
    EXPECT_THROW(ConfigParser::Parse(R"({"monitor": {"ingestion_interval_ms": 0}})"), core::ValidationError);
    EXPECT_THROW(ConfigParser::Parse(R"({"monitor": {"high_threshold": "high"}})"), core::ValidationError);
    EXPECT_THROW(ConfigParser::Parse(R"({"monitor": {"medium_threshold": 80}})"), core::ValidationError);
}

TEST(ConfigParserTest, CorrelationRuleSectionReplacesDefaults) {
    auto config = ConfigParser::Parse(R"({
        "correlation_rules": [{
            "id": "export_burst",
            "name": "Export Burst",
            "time_window_ms": 600000,
            "min_events": 3,
            "max_events": 20,
            "risk_multiplier": 2.0,
            "confidence": 70,
            "priority": 2,
            "conditions": [
                {"field": "action", "operator": "in", "value": ["EXPORT", "DOWNLOAD"]},
                {"field": "userId", "operator": "equals", "value": "SAME"},
                {"field": "ipAddress", "operator": "regex", "value": "^10\\."}
            ]
        }]
    })");

    auto rules = config.CorrelationRulesOrDefault();
    ASSERT_EQ(rules.size(), 1u);
    const auto& rule = rules[0];
    EXPECT_EQ(rule.id, "export_burst");
    EXPECT_EQ(rule.time_window, std::chrono::minutes(10));
    EXPECT_EQ(rule.min_events, 3);
    EXPECT_DOUBLE_EQ(rule.risk_multiplier, 2.0);
    ASSERT_EQ(rule.conditions.size(), 3u);
    EXPECT_EQ(rule.conditions[1].field, analyzers::EventField::ACTOR_ID);
    EXPECT_TRUE(rule.conditions[1].IsSame());
    EXPECT_TRUE(rule.conditions[2].pattern != nullptr);
}

TEST(ConfigParserTest, BadCorrelationRulesAreRejected) {
    // Unknown field
    EXPECT_THROW(ConfigParser::ParseCorrelationRule(R"({
        "id": "r", "time_window_ms": 1000, "min_events": 1, "max_events": 2,
        "conditions": [{"field": "password", "operator": "equals", "value": "x"}]
    })"), core::ValidationError);

    // Unknown operator
    EXPECT_THROW(ConfigParser::ParseCorrelationRule(R"({
        "id": "r", "time_window_ms": 1000, "min_events": 1, "max_events": 2,
        "conditions": [{"field": "action", "operator": "like", "value": "x"}]
    })"), core::ValidationError);

    // Broken regex
    EXPECT_THROW(ConfigParser::ParseCorrelationRule(R"({
        "id": "r", "time_window_ms": 1000, "min_events": 1, "max_events": 2,
        "conditions": [{"field": "action", "operator": "regex", "value": "(["}]
    })"), core::ValidationError);

    // max_events below min_events
    EXPECT_THROW(ConfigParser::ParseCorrelationRule(R"({
        "id": "r", "time_window_ms": 1000, "min_events": 5, "max_events": 2,
        "conditions": [{"field": "action", "operator": "equals", "value": "EXPORT"}]
    })"), core::ValidationError);

    // No conditions
    EXPECT_THROW(ConfigParser::ParseCorrelationRule(R"({
        "id": "r", "time_window_ms": 1000, "min_events": 1, "max_events": 2
    })"), core::ValidationError);
}

TEST(ConfigParserTest, ResponseRuleWithListParameters) {
    auto rule = ConfigParser::ParseResponseRule(R"({
        "id": "notify_team",
        "priority": 3,
        "auto_execute": false,
        "conditions": [
            {"field": "threatType", "operator": "equals", "value": "coordinated_attack"},
            {"field": "riskScore", "operator": "greater_than", "value": 80}
        ],
        "actions": [
            {"type": "notify", "parameters": {"channels": ["email", "slack"], "escalate": true}},
            {"type": "block", "parameters": {"target": "ip", "duration": 600}}
        ]
    })");

    EXPECT_EQ(rule.id, "notify_team");
    EXPECT_EQ(rule.name, "notify_team");
    EXPECT_EQ(rule.priority, 3);
    EXPECT_FALSE(rule.auto_execute);
    ASSERT_EQ(rule.conditions.size(), 2u);
    EXPECT_EQ(std::get<double>(rule.conditions[1].value), 80.0);

    ASSERT_EQ(rule.actions.size(), 2u);
    EXPECT_EQ(rule.actions[0].type, response::ActionType::NOTIFY);
    EXPECT_EQ(rule.actions[0].parameters.at("channels"), "email,slack");
    EXPECT_EQ(rule.actions[0].parameters.at("escalate"), "true");
    EXPECT_EQ(rule.actions[1].parameters.at("duration"), "600");
}

TEST(ConfigParserTest, BadResponseRulesAreRejected) {
    EXPECT_THROW(ConfigParser::ParseResponseRule(R"({"id": "r", "actions": []})"), core::ValidationError);
    EXPECT_THROW(ConfigParser::ParseResponseRule(R"({"id": "r", "actions": [{"type": "reboot"}]})"),
                 core::ValidationError);
    EXPECT_THROW(ConfigParser::ParseResponseRule(R"({
        "id": "r",
        "conditions": [{"field": "riskScore", "operator": "greater_than", "value": "high"}],
        "actions": [{"type": "log"}]
    })"), core::ValidationError);
    EXPECT_THROW(ConfigParser::ParseResponseRule(R"({"name": "no id", "actions": [{"type": "log"}]})"),
                 core::ValidationError);
}

TEST(ConfigParserTest, Indicators) {
    auto config = ConfigParser::Parse(R"({
        "indicators": [
            {"type": "ip", "value": "203.0.113.7", "severity": "critical", "confidence": 90,
             "tags": ["botnet"], "expires_at": "2025-03-02T00:00:00Z"},
            {"type": "domain", "value": "evil.example.com"}
        ]
    })");

    ASSERT_EQ(config.indicators.size(), 2u);
    const auto& ip = config.indicators[0];
    EXPECT_EQ(ip.type, core::IndicatorType::IP);
    EXPECT_EQ(ip.severity, core::Severity::CRITICAL);
    EXPECT_EQ(ip.confidence, 90);
    EXPECT_EQ(ip.tags, std::vector<std::string>{"botnet"});
    ASSERT_TRUE(ip.expires_at.has_value());
    EXPECT_EQ(*ip.expires_at, test::BaseTime() + std::chrono::hours(14));

    const auto& domain = config.indicators[1];
    EXPECT_EQ(domain.severity, core::Severity::MEDIUM);
    EXPECT_EQ(domain.source, "config");
    EXPECT_FALSE(domain.expires_at.has_value());

    EXPECT_THROW(ConfigParser::Parse(R"({"indicators": [{"type": "planet", "value": "x"}]})"),
                 core::ValidationError);
}

TEST(ConfigParserTest, MalformedDocuments) {
    EXPECT_THROW(ConfigParser::Parse("{not json"), core::ValidationError);
    EXPECT_THROW(ConfigParser::Parse("[1, 2]"), core::ValidationError);
    EXPECT_THROW(ConfigParser::Parse(R"({"correlation_rules": {}})"), core::ValidationError);
}

TEST(ConfigParserTest, LoadFile) {
    const auto path = std::filesystem::temp_directory_path() / "warden_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"monitor": {"correlation_interval_ms": 30000}})";
    }

    auto config = ConfigParser::LoadFile(path);
    EXPECT_EQ(config.monitor.correlation_interval, std::chrono::milliseconds(30000));
    std::filesystem::remove(path);

    EXPECT_THROW(ConfigParser::LoadFile(path), std::runtime_error);
}
