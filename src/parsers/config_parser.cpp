/**
 * @file config_parser.cpp
 * @brief Implementation of configuration loading
 *
 * Durations use `*_ms` keys. Response action parameters accept any JSON
 * scalar; arrays (e.g. `channels`) are joined with commas, which is the
 * form the action handlers read.
 *
 * @date 2025
 */

#include "warden/parsers/config_parser.hpp"
#include "warden/utils/string_utils.hpp"
#include "warden/utils/time_utils.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>
#include <set>

using json = nlohmann::json;

namespace warden {
namespace parsers {

using core::ValidationError;
using utils::StringUtils;
using utils::TimeUtils;

namespace {

// ============================================================================
// FIELD HELPERS
// ============================================================================

template <typename T>
T Get(const json& object, const char* key, const T& fallback, const std::string& context) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return fallback;
    }
    try {
        return it->get<T>();
    }
    catch (const json::exception& e) {
        throw ValidationError(context + ": invalid '" + key + "': " + e.what());
    }
}

std::string RequireString(const json& object, const char* key, const std::string& context) {
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        throw ValidationError(context + ": '" + key + "' must be a string");
    }
    return it->get<std::string>();
}

std::chrono::milliseconds GetMillis(const json& object, const char* key,
                                    std::chrono::milliseconds fallback, const std::string& context) {
    return std::chrono::milliseconds(Get<long long>(object, key, fallback.count(), context));
}

std::string ScalarToString(const json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_number_integer()) {
        return std::to_string(value.get<long long>());
    }
    if (value.is_array()) {
        std::vector<std::string> parts;
        for (const auto& item : value) {
            parts.push_back(ScalarToString(item));
        }
        return StringUtils::Join(parts, ",");
    }
    return value.dump();
}

analyzers::ConditionValue ParseConditionValue(const json& value, const std::string& context) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_number()) {
        return value.get<double>();
    }
    if (value.is_array()) {
        std::vector<std::string> items;
        for (const auto& item : value) {
            if (!item.is_string() && !item.is_number()) {
                throw ValidationError(context + ": list values must be strings or numbers");
            }
            items.push_back(ScalarToString(item));
        }
        return items;
    }
    throw ValidationError(context + ": condition value must be a string, number or list");
}

template <typename Field, typename FromString>
std::vector<analyzers::RuleCondition<Field>> ParseConditions(const json& rule, const std::string& context,
                                                             FromString field_from_string) {
    std::vector<analyzers::RuleCondition<Field>> conditions;
    auto it = rule.find("conditions");
    if (it == rule.end()) {
        return conditions;
    }
    if (!it->is_array()) {
        throw ValidationError(context + ": 'conditions' must be a list");
    }

    for (const auto& entry : *it) {
        if (!entry.is_object()) {
            throw ValidationError(context + ": condition must be an object");
        }
        const auto field_name = RequireString(entry, "field", context);
        const auto op_name = RequireString(entry, "operator", context);

        auto field = field_from_string(field_name);
        if (!field) {
            throw ValidationError(context + ": unknown field '" + field_name + "'");
        }
        auto op = analyzers::OperatorFromString(op_name);
        if (!op) {
            throw ValidationError(context + ": unknown operator '" + op_name + "'");
        }
        auto value_it = entry.find("value");
        if (value_it == entry.end()) {
            throw ValidationError(context + ": condition on '" + field_name + "' has no value");
        }

        conditions.push_back(analyzers::MakeCondition(*field, *op, ParseConditionValue(*value_it, context)));
    }
    return conditions;
}

// ============================================================================
// SECTION PARSERS
// ============================================================================

analyzers::CorrelationRule CorrelationRuleFromJson(const json& j) {
    if (!j.is_object()) {
        throw ValidationError("correlation rule must be an object");
    }

    analyzers::CorrelationRule rule;
    rule.id = RequireString(j, "id", "correlation rule");
    const std::string context = "correlation rule '" + rule.id + "'";

    rule.name = Get<std::string>(j, "name", rule.id, context);
    rule.description = Get<std::string>(j, "description", "", context);
    rule.time_window = GetMillis(j, "time_window_ms", rule.time_window, context);
    rule.min_events = Get<int>(j, "min_events", rule.min_events, context);
    rule.max_events = Get<int>(j, "max_events", rule.max_events, context);
    rule.risk_multiplier = Get<double>(j, "risk_multiplier", rule.risk_multiplier, context);
    rule.confidence = Get<int>(j, "confidence", rule.confidence, context);
    rule.priority = Get<int>(j, "priority", rule.priority, context);
    rule.enabled = Get<bool>(j, "enabled", rule.enabled, context);
    rule.conditions = ParseConditions<analyzers::EventField>(j, context, analyzers::EventFieldFromString);

    analyzers::ValidateRule(rule);
    return rule;
}

response::ResponseAction ActionFromJson(const json& j, const std::string& context) {
    if (!j.is_object()) {
        throw ValidationError(context + ": action must be an object");
    }
    const auto type_name = RequireString(j, "type", context);
    auto type = response::ActionTypeFromString(type_name);
    if (!type) {
        throw ValidationError(context + ": unknown action type '" + type_name + "'");
    }

    response::ResponseAction action;
    action.type = *type;

    auto params = j.find("parameters");
    if (params != j.end() && !params->is_null()) {
        if (!params->is_object()) {
            throw ValidationError(context + ": action parameters must be an object");
        }
        for (const auto& [key, value] : params->items()) {
            action.parameters[key] = ScalarToString(value);
        }
    }
    return action;
}

response::ResponseRule ResponseRuleFromJson(const json& j) {
    if (!j.is_object()) {
        throw ValidationError("response rule must be an object");
    }

    response::ResponseRule rule;
    rule.id = RequireString(j, "id", "response rule");
    const std::string context = "response rule '" + rule.id + "'";

    rule.name = Get<std::string>(j, "name", rule.id, context);
    rule.priority = Get<int>(j, "priority", rule.priority, context);
    rule.enabled = Get<bool>(j, "enabled", rule.enabled, context);
    rule.auto_execute = Get<bool>(j, "auto_execute", rule.auto_execute, context);
    rule.conditions = ParseConditions<analyzers::ThreatField>(j, context, analyzers::ThreatFieldFromString);

    auto actions = j.find("actions");
    if (actions != j.end()) {
        if (!actions->is_array()) {
            throw ValidationError(context + ": 'actions' must be a list");
        }
        for (const auto& entry : *actions) {
            rule.actions.push_back(ActionFromJson(entry, context));
        }
    }

    response::ValidateResponseRule(rule);
    return rule;
}

stores::IntelIndicator IndicatorFromJson(const json& j) {
    if (!j.is_object()) {
        throw ValidationError("indicator must be an object");
    }

    stores::IntelIndicator indicator;
    const auto type_name = RequireString(j, "type", "indicator");
    auto type = core::IndicatorTypeFromString(type_name);
    if (!type) {
        throw ValidationError("indicator: unknown type '" + type_name + "'");
    }
    indicator.type = *type;
    indicator.value = RequireString(j, "value", "indicator");

    const std::string context = "indicator '" + indicator.value + "'";

    const auto severity_name = Get<std::string>(j, "severity", "medium", context);
    auto severity = core::SeverityFromString(severity_name);
    if (!severity) {
        throw ValidationError(context + ": unknown severity '" + severity_name + "'");
    }
    indicator.severity = *severity;
    indicator.confidence = Get<int>(j, "confidence", indicator.confidence, context);
    indicator.description = Get<std::string>(j, "description", "", context);
    indicator.tags = Get<std::vector<std::string>>(j, "tags", {}, context);
    indicator.source = Get<std::string>(j, "source", "config", context);

    auto expires = j.find("expires_at");
    if (expires != j.end() && !expires->is_null()) {
        std::optional<core::TimePoint> when;
        if (expires->is_number_integer()) {
            when = TimeUtils::FromEpochMillis(expires->get<long long>());
        }
        else if (expires->is_string()) {
            when = TimeUtils::ParseTimestamp(expires->get<std::string>());
        }
        if (!when) {
            throw ValidationError(context + ": invalid 'expires_at'");
        }
        indicator.expires_at = when;
    }
    return indicator;
}

monitors::MonitoringConfig MonitorFromJson(const json& j) {
    const std::string context = "monitor";
    if (!j.is_object()) {
        throw ValidationError("'monitor' must be an object");
    }

    static const std::set<std::string> known_keys = {
        "ingestion_interval_ms", "deep_detection_interval_ms", "correlation_interval_ms",
        "enable_deep_detection", "enable_correlation", "max_events_per_batch",
        "correlation_window_ms", "max_correlation_events", "enable_auto_response",
        "max_auto_responses_per_hour", "auto_response_min_risk", "correlation_risk_threshold",
        "incident_threshold", "critical_threshold", "high_threshold", "medium_threshold",
        "tick_budget_ms", "stop_grace_period_ms", "enable_enrichment", "dedup_capacity"
    };
    for (const auto& item : j.items()) {
        if (known_keys.count(item.key()) == 0) {
            spdlog::warn("Ignoring unknown monitor setting '{}'", item.key());
        }
    }

    monitors::MonitoringConfig config;
    config.ingestion_interval = GetMillis(j, "ingestion_interval_ms", config.ingestion_interval, context);
    config.deep_detection_interval = GetMillis(j, "deep_detection_interval_ms", config.deep_detection_interval, context);
    config.correlation_interval = GetMillis(j, "correlation_interval_ms", config.correlation_interval, context);
    config.enable_deep_detection = Get<bool>(j, "enable_deep_detection", config.enable_deep_detection, context);
    config.enable_correlation = Get<bool>(j, "enable_correlation", config.enable_correlation, context);
    config.max_events_per_batch = Get<std::size_t>(j, "max_events_per_batch", config.max_events_per_batch, context);
    config.correlation_window = GetMillis(j, "correlation_window_ms", config.correlation_window, context);
    config.max_correlation_events = Get<std::size_t>(j, "max_correlation_events", config.max_correlation_events, context);
    config.enable_auto_response = Get<bool>(j, "enable_auto_response", config.enable_auto_response, context);
    config.max_auto_responses_per_hour = Get<int>(j, "max_auto_responses_per_hour", config.max_auto_responses_per_hour, context);
    config.auto_response_min_risk = Get<int>(j, "auto_response_min_risk", config.auto_response_min_risk, context);
    config.correlation_risk_threshold = Get<int>(j, "correlation_risk_threshold", config.correlation_risk_threshold, context);
    config.incident_threshold = Get<int>(j, "incident_threshold", config.incident_threshold, context);
    config.critical_threshold = Get<int>(j, "critical_threshold", config.critical_threshold, context);
    config.high_threshold = Get<int>(j, "high_threshold", config.high_threshold, context);
    config.medium_threshold = Get<int>(j, "medium_threshold", config.medium_threshold, context);
    config.tick_budget = GetMillis(j, "tick_budget_ms", config.tick_budget, context);
    config.stop_grace_period = GetMillis(j, "stop_grace_period_ms", config.stop_grace_period, context);
    config.enable_enrichment = Get<bool>(j, "enable_enrichment", config.enable_enrichment, context);
    config.dedup_capacity = Get<std::size_t>(j, "dedup_capacity", config.dedup_capacity, context);

    monitors::ValidateMonitoringConfig(config);
    return config;
}

json ParseDocument(const std::string& json_text, const std::string& what) {
    try {
        return json::parse(json_text);
    }
    catch (const json::parse_error& e) {
        throw ValidationError(what + " is not valid JSON: " + e.what());
    }
}

const json& RequireArray(const json& root, const char* key) {
    const auto& section = root.at(key);
    if (!section.is_array()) {
        throw ValidationError(std::string("'") + key + "' must be a list");
    }
    return section;
}

} // namespace

// ============================================================================
// WardenConfig
// ============================================================================

std::vector<analyzers::CorrelationRule> WardenConfig::CorrelationRulesOrDefault() const {
    return correlation_rules ? *correlation_rules : analyzers::DefaultCorrelationRules();
}

std::vector<response::ResponseRule> WardenConfig::ResponseRulesOrDefault() const {
    return response_rules ? *response_rules : response::DefaultResponseRules();
}

// ============================================================================
// PUBLIC API
// ============================================================================

WardenConfig ConfigParser::LoadFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("cannot open configuration file " + path.string());
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    spdlog::info("Loading configuration from {}", path.string());
    return Parse(buffer.str());
}

WardenConfig ConfigParser::Parse(const std::string& json_text) {
    json root = ParseDocument(json_text, "configuration");
    if (!root.is_object()) {
        throw ValidationError("configuration must be a JSON object");
    }

    WardenConfig config;

    if (root.contains("monitor")) {
        config.monitor = MonitorFromJson(root["monitor"]);
    }

    if (root.contains("correlation_rules")) {
        std::vector<analyzers::CorrelationRule> rules;
        for (const auto& entry : RequireArray(root, "correlation_rules")) {
            rules.push_back(CorrelationRuleFromJson(entry));
        }
        config.correlation_rules = std::move(rules);
        spdlog::debug("Loaded {} correlation rules", config.correlation_rules->size());
    }

    if (root.contains("response_rules")) {
        std::vector<response::ResponseRule> rules;
        for (const auto& entry : RequireArray(root, "response_rules")) {
            rules.push_back(ResponseRuleFromJson(entry));
        }
        config.response_rules = std::move(rules);
        spdlog::debug("Loaded {} response rules", config.response_rules->size());
    }

    if (root.contains("indicators")) {
        for (const auto& entry : RequireArray(root, "indicators")) {
            config.indicators.push_back(IndicatorFromJson(entry));
        }
        spdlog::debug("Loaded {} threat indicators", config.indicators.size());
    }

    return config;
}

analyzers::CorrelationRule ConfigParser::ParseCorrelationRule(const std::string& json_text) {
    return CorrelationRuleFromJson(ParseDocument(json_text, "correlation rule"));
}

response::ResponseRule ConfigParser::ParseResponseRule(const std::string& json_text) {
    return ResponseRuleFromJson(ParseDocument(json_text, "response rule"));
}

} // namespace parsers
} // namespace warden
