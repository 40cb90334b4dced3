/**
 * @file main.cpp
 * @brief Warden security monitor - Command-line interface
 *
 * Thin operational wrapper over the pipeline:
 * - `check`     one forced check over an audit export
 * - `run`       run the monitor until interrupted (or for a fixed duration)
 * - `correlate` offline correlation of an audit export, JSON to stdout
 * - `rules`     print the active rule sets as JSON
 *
 * Logs go to stderr so JSON output on stdout stays machine-readable.
 *
 * @date 2025
 */

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "warden/core/adapters.hpp"
#include "warden/analyzers/correlation_engine.hpp"
#include "warden/response/response_engine.hpp"
#include "warden/response/audit_trail.hpp"
#include "warden/monitors/real_time_monitor.hpp"
#include "warden/parsers/audit_parser.hpp"
#include "warden/parsers/config_parser.hpp"
#include "warden/reporters/json_reporter.hpp"
#include "warden/stores/indicator_store.hpp"

#include <iostream>
#include <algorithm>
#include <atomic>
#include <csignal>
#include <filesystem>
#include <thread>

using namespace warden;

namespace {

std::atomic<bool> g_interrupted{false};

void HandleSignal(int) {
    g_interrupted = true;
}

/*******************************************************************************
 * Pipeline assembly
 ******************************************************************************/

struct CommonOptions {
    std::string config_path;
    std::string events_path;
    std::string incidents_path;
    std::string audit_path;
    bool no_auto_response{false};
    int max_responses{-1};
};

parsers::WardenConfig LoadConfig(const std::string& path) {
    if (path.empty()) {
        return parsers::WardenConfig{};
    }
    return parsers::ConfigParser::LoadFile(path);
}

/**
 * Clock that starts at the newest event in the export and then advances in
 * real time, so windowed reads see historical exports.
 */
core::ClockFunction ReplayClock(const std::vector<core::SecurityEvent>& events) {
    auto newest = std::max_element(events.begin(), events.end(),
        [](const core::SecurityEvent& a, const core::SecurityEvent& b) { return a.timestamp < b.timestamp; });
    if (newest == events.end()) {
        return core::Clock::now;
    }
    const auto anchor = newest->timestamp;
    const auto started = core::Clock::now();
    return [anchor, started] { return anchor + (core::Clock::now() - started); };
}

struct Pipeline {
    std::shared_ptr<core::JsonlEventSource> source;
    std::shared_ptr<core::MemoryIncidentSink> memory_incidents;
    std::shared_ptr<stores::IndicatorStore> indicators;
    std::unique_ptr<monitors::RealTimeMonitor> monitor;
};

Pipeline BuildPipeline(const CommonOptions& options, bool replay) {
    auto config = LoadConfig(options.config_path);
    if (options.no_auto_response) {
        config.monitor.enable_auto_response = false;
    }
    if (options.max_responses >= 0) {
        config.monitor.max_auto_responses_per_hour = options.max_responses;
    }

    core::ClockFunction clock = core::Clock::now;
    if (replay) {
        parsers::AuditRecordParser parser;
        clock = ReplayClock(parser.Parse(options.events_path));
    }

    Pipeline pipeline;
    pipeline.source = std::make_shared<core::JsonlEventSource>(options.events_path, clock);

    std::shared_ptr<core::IncidentSink> incidents;
    if (options.incidents_path.empty()) {
        pipeline.memory_incidents = std::make_shared<core::MemoryIncidentSink>();
        incidents = pipeline.memory_incidents;
    }
    else {
        incidents = std::make_shared<core::JsonlIncidentSink>(options.incidents_path);
    }

    std::shared_ptr<response::AuditTrail> audit;
    if (options.audit_path.empty()) {
        audit = std::make_shared<response::MemoryAuditTrail>();
    }
    else {
        audit = std::make_shared<response::JsonlAuditTrail>(options.audit_path);
    }

    pipeline.indicators = std::make_shared<stores::IndicatorStore>(clock);
    for (const auto& indicator : config.indicators) {
        pipeline.indicators->Add(indicator);
    }

    auto dispatcher = std::make_shared<core::LogAlertDispatcher>();
    auto response_rules = std::make_shared<response::ResponseRuleStore>(
        response::ValidateResponseRule, config.ResponseRulesOrDefault());
    auto responder = std::make_shared<response::ResponseEngine>(
        response_rules, audit, response::ResponseEngine::Config{}, clock);
    responder->RegisterDefaultHandlers(dispatcher);

    monitors::MonitorDependencies deps;
    deps.source = pipeline.source;
    deps.incidents = incidents;
    deps.alerts = dispatcher;
    deps.responder = responder;
    deps.correlation_rules = std::make_shared<monitors::CorrelationRuleStore>(
        analyzers::ValidateRule, config.CorrelationRulesOrDefault());
    deps.enrichment = pipeline.indicators;
    deps.clock = clock;

    pipeline.monitor = std::make_unique<monitors::RealTimeMonitor>(deps, config.monitor);
    return pipeline;
}

void PrintSummary(const monitors::MonitoringStats& stats) {
    spdlog::info("━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━");
    spdlog::info("Events processed:   {}", stats.events_processed);
    spdlog::info("Threats detected:   {}", stats.threats_detected);
    spdlog::info("Correlations:       {}", stats.correlations_detected);
    spdlog::info("Incidents created:  {}", stats.incidents_created);
    spdlog::info("Escalations:        {}", stats.incidents_escalated);
    spdlog::info("Auto-responses:     {} ({} suppressed, {} failed)", stats.auto_responses_triggered,
                 stats.auto_responses_suppressed, stats.response_failures);
    spdlog::info("Alerts sent:        {} ({} failed)", stats.alerts_sent, stats.alerts_failed);
    spdlog::info("━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━");
}

/*******************************************************************************
 * Subcommands
 ******************************************************************************/

int RunCheck(const CommonOptions& options) {
    auto pipeline = BuildPipeline(options, true);
    pipeline.monitor->ForceCheck();

    auto stats = pipeline.monitor->GetStats();
    PrintSummary(stats);

    reporters::JsonReporter reporter;
    if (pipeline.memory_incidents) {
        for (const auto& incident : pipeline.memory_incidents->Incidents()) {
            std::cout << reporter.IncidentToJson(incident) << std::endl;
        }
    }
    std::cout << reporter.StatsToJson(stats) << std::endl;
    return 0;
}

int RunMonitor(const CommonOptions& options, int duration_seconds) {
    auto pipeline = BuildPipeline(options, false);

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    if (!pipeline.monitor->Start()) {
        spdlog::error("Monitor failed to start");
        return 1;
    }

    const auto started = std::chrono::steady_clock::now();
    while (!g_interrupted) {
        if (duration_seconds > 0 &&
            std::chrono::steady_clock::now() - started >= std::chrono::seconds(duration_seconds)) {
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    if (g_interrupted) {
        spdlog::info("Interrupt received");
    }
    pipeline.monitor->Stop();

    auto stats = pipeline.monitor->GetStats();
    PrintSummary(stats);
    std::cout << reporters::JsonReporter().StatsToJson(stats) << std::endl;
    return 0;
}

int RunCorrelate(const CommonOptions& options, int window_minutes) {
    auto config = LoadConfig(options.config_path);

    parsers::AuditRecordParser parser;
    auto events = parser.Parse(options.events_path);
    spdlog::info("Loaded {} events ({} malformed lines skipped)", events.size(), parser.LastSummary().skipped);

    if (window_minutes > 0 && !events.empty()) {
        auto newest = std::max_element(events.begin(), events.end(),
            [](const core::SecurityEvent& a, const core::SecurityEvent& b) { return a.timestamp < b.timestamp; });
        const auto since = newest->timestamp - std::chrono::minutes(window_minutes);
        events.erase(std::remove_if(events.begin(), events.end(),
                                    [since](const core::SecurityEvent& e) { return e.timestamp < since; }),
                     events.end());
    }

    stores::RuleStore<analyzers::CorrelationRule> rules(analyzers::ValidateRule,
                                                        config.CorrelationRulesOrDefault());
    analyzers::CorrelationEngine engine;
    auto correlations = engine.Correlate(events, rules.List());
    spdlog::info("{} correlations over {} events", correlations.size(), events.size());

    std::cout << reporters::JsonReporter().CorrelationsToJson(correlations) << std::endl;
    return 0;
}

int RunRules(const CommonOptions& options) {
    auto config = LoadConfig(options.config_path);
    std::cout << reporters::JsonReporter().RulesToJson(config.CorrelationRulesOrDefault(),
                                                       config.ResponseRulesOrDefault())
              << std::endl;
    return 0;
}

} // namespace

/*******************************************************************************
 * Main Application Entry Point
 ******************************************************************************/

int main(int argc, char** argv) {
    CLI::App app{"Warden - security event correlation and automated response"};
    app.require_subcommand(1);

    CommonOptions options;
    bool verbose = false;

    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");
    app.add_option("-c,--config", options.config_path, "JSON configuration file")
        ->check(CLI::ExistingFile);

    auto* check = app.add_subcommand("check", "Run one forced check over an audit export");
    check->add_option("--events", options.events_path, "Audit export (JSON lines)")
        ->required()
        ->check(CLI::ExistingFile);
    check->add_option("--incidents", options.incidents_path, "Append incidents to this JSON-lines file");
    check->add_option("--audit", options.audit_path, "Append response audit records to this file");
    check->add_flag("--no-auto-response", options.no_auto_response, "Disable automated responses");
    check->add_option("--max-responses", options.max_responses, "Automated responses per hour");

    int duration_seconds = 0;
    auto* run = app.add_subcommand("run", "Run the monitor until interrupted");
    run->add_option("--events", options.events_path, "Audit export (JSON lines)")
        ->required()
        ->check(CLI::ExistingFile);
    run->add_option("--incidents", options.incidents_path, "Append incidents to this JSON-lines file");
    run->add_option("--audit", options.audit_path, "Append response audit records to this file");
    run->add_option("--duration", duration_seconds, "Stop after this many seconds (0 = until signalled)")
        ->default_val(0);
    run->add_flag("--no-auto-response", options.no_auto_response, "Disable automated responses");
    run->add_option("--max-responses", options.max_responses, "Automated responses per hour");

    int window_minutes = 60;
    auto* correlate = app.add_subcommand("correlate", "Correlate an audit export offline");
    correlate->add_option("--events", options.events_path, "Audit export (JSON lines)")
        ->required()
        ->check(CLI::ExistingFile);
    correlate->add_option("--window-min", window_minutes, "Only events within N minutes of the newest")
        ->default_val(60);

    auto* rules = app.add_subcommand("rules", "Print correlation and response rules as JSON");

    CLI11_PARSE(app, argc, argv);

    spdlog::set_default_logger(spdlog::stderr_color_mt("warden"));
    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
    spdlog::debug("Verbose logging enabled");

    try {
        if (*check) {
            return RunCheck(options);
        }
        if (*run) {
            return RunMonitor(options, duration_seconds);
        }
        if (*correlate) {
            return RunCorrelate(options, window_minutes);
        }
        if (*rules) {
            return RunRules(options);
        }
        return 1;

    } catch (const core::ValidationError& e) {
        spdlog::error("Invalid configuration: {}", e.what());
        return 2;
    } catch (const std::filesystem::filesystem_error& e) {
        spdlog::error("Filesystem error: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
