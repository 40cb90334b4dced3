/**
 * @file config_parser.hpp
 * @brief Loader for the warden JSON configuration document
 *
 * ```
 * {
 *   "monitor":           { "ingestion_interval_ms": 5000, ... },
 *   "correlation_rules": [ { "id": ..., "conditions": [...] }, ... ],
 *   "response_rules":    [ { "id": ..., "actions": [...] }, ... ],
 *   "indicators":        [ { "type": "ip", "value": "...", ... }, ... ]
 * }
 * ```
 *
 * Every section is optional. A present rule section replaces the built-in
 * rule set; an absent one keeps it.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>

#include "warden/analyzers/correlation_engine.hpp"
#include "warden/response/response_types.hpp"
#include "warden/monitors/monitoring_types.hpp"
#include "warden/stores/indicator_store.hpp"

namespace warden {
namespace parsers {

/**
 * @struct WardenConfig
 * @brief Parsed configuration document
 */
struct WardenConfig {
    monitors::MonitoringConfig monitor;
    std::optional<std::vector<analyzers::CorrelationRule>> correlation_rules;  ///< nullopt keeps defaults
    std::optional<std::vector<response::ResponseRule>> response_rules;         ///< nullopt keeps defaults
    std::vector<stores::IntelIndicator> indicators;

    /// Configured correlation rules, or the built-in set
    std::vector<analyzers::CorrelationRule> CorrelationRulesOrDefault() const;

    /// Configured response rules, or the built-in set
    std::vector<response::ResponseRule> ResponseRulesOrDefault() const;
};

/**
 * @class ConfigParser
 * @brief JSON to configuration structs, with validation
 *
 * All entry points throw core::ValidationError for content problems
 * (unknown field or operator names, bad types, rules rejected by the
 * engine validators) and std::runtime_error for I/O problems.
 */
class ConfigParser {
public:
    /// @throws std::runtime_error if the file cannot be read
    static WardenConfig LoadFile(const std::filesystem::path& path);

    static WardenConfig Parse(const std::string& json_text);

    /// Parse and validate one correlation rule object
    static analyzers::CorrelationRule ParseCorrelationRule(const std::string& json_text);

    /// Parse and validate one response rule object
    static response::ResponseRule ParseResponseRule(const std::string& json_text);
};

} // namespace parsers
} // namespace warden
