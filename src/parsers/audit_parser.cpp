/**
 * @file audit_parser.cpp
 * @brief Implementation of audit record parsing
 *
 * **Record Format** (one per line):
 * ```
 * {"id": 1042, "timestamp": "2025-03-01T10:15:00.000Z", "action": "FAILED_LOGIN",
 *  "userId": "42", "propertyId": "7", "ipAddress": "10.0.0.5", "details": {...}}
 * ```
 *
 * Blank lines are ignored. Numeric ids may also arrive as strings. Detail
 * values that are not strings are kept as their compact JSON text.
 *
 * @date 2025
 */

#include "warden/parsers/audit_parser.hpp"
#include "warden/utils/string_utils.hpp"
#include "warden/utils/time_utils.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <fstream>
#include <initializer_list>
#include <stdexcept>

using json = nlohmann::json;

namespace warden {
namespace parsers {

using utils::StringUtils;
using utils::TimeUtils;

namespace {

/// First present, non-null key among @p names
const json* FindAny(const json& record, std::initializer_list<const char*> names) {
    for (const char* name : names) {
        auto it = record.find(name);
        if (it != record.end() && !it->is_null()) {
            return &*it;
        }
    }
    return nullptr;
}

std::string ScalarToString(const json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_number_integer()) {
        return std::to_string(value.get<long long>());
    }
    return value.dump();
}

std::optional<std::string> OptionalField(const json& record, std::initializer_list<const char*> names) {
    const json* value = FindAny(record, names);
    if (value == nullptr) {
        return std::nullopt;
    }
    std::string text = ScalarToString(*value);
    if (StringUtils::Trim(text).empty()) {
        return std::nullopt;
    }
    return text;
}

int64_t ParseId(const json& value) {
    if (value.is_number_integer()) {
        return value.get<int64_t>();
    }
    if (value.is_string()) {
        const auto text = value.get<std::string>();
        std::size_t consumed = 0;
        try {
            long long id = std::stoll(text, &consumed);
            if (consumed == text.size()) {
                return id;
            }
        }
        catch (const std::logic_error&) {
            // fall through to the error below
        }
    }
    throw std::runtime_error("invalid event id " + value.dump());
}

core::TimePoint ParseTime(const json& value) {
    if (value.is_number_integer()) {
        return TimeUtils::FromEpochMillis(value.get<long long>());
    }
    if (value.is_string()) {
        auto parsed = TimeUtils::ParseTimestamp(value.get<std::string>());
        if (parsed) {
            return *parsed;
        }
    }
    throw std::runtime_error("invalid timestamp " + value.dump());
}

} // namespace

AuditRecordParser::AuditRecordParser() {
    spdlog::debug("Audit record parser initialized");
}

// ============================================================================
// PARSING
// ============================================================================

std::vector<core::SecurityEvent> AuditRecordParser::Parse(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("cannot open audit export " + path.string());
    }

    summary_ = ParseSummary{};
    std::vector<core::SecurityEvent> events;
    std::string line;
    std::size_t line_number = 0;

    while (std::getline(file, line)) {
        ++line_number;
        if (StringUtils::Trim(line).empty()) {
            continue;
        }
        ++summary_.lines;

        try {
            events.push_back(ParseRecord(line));
            ++summary_.parsed;
        }
        catch (const std::exception& e) {
            ++summary_.skipped;
            spdlog::warn("{}:{}: skipping malformed audit record: {}",
                         path.filename().string(), line_number, e.what());
        }
    }

    spdlog::debug("Parsed {} audit records from {} ({} skipped)",
                  summary_.parsed, path.string(), summary_.skipped);
    return events;
}

std::optional<core::SecurityEvent> AuditRecordParser::ParseLine(const std::string& line) const {
    if (StringUtils::Trim(line).empty()) {
        return std::nullopt;
    }
    try {
        return ParseRecord(line);
    }
    catch (const std::exception& e) {
        spdlog::warn("Skipping malformed audit record: {}", e.what());
        return std::nullopt;
    }
}

core::SecurityEvent AuditRecordParser::ParseRecord(const std::string& json_text) const {
    json record;
    try {
        record = json::parse(json_text);
    }
    catch (const json::parse_error& e) {
        throw std::runtime_error(std::string("invalid JSON: ") + e.what());
    }
    if (!record.is_object()) {
        throw std::runtime_error("audit record is not an object");
    }

    core::SecurityEvent event;

    const json* id = FindAny(record, {"id"});
    if (id == nullptr) {
        throw std::runtime_error("missing id");
    }
    event.id = ParseId(*id);

    auto action = OptionalField(record, {"action"});
    if (!action) {
        throw std::runtime_error("missing action");
    }
    event.action = *action;

    const json* timestamp = FindAny(record, {"timestamp", "createdAt", "created_at"});
    if (timestamp == nullptr) {
        throw std::runtime_error("missing timestamp");
    }
    event.timestamp = ParseTime(*timestamp);

    event.actor_id = OptionalField(record, {"actorId", "actor_id", "userId", "user_id"});
    event.tenant_id = OptionalField(record, {"tenantId", "tenant_id", "propertyId", "property_id"});
    event.resource = OptionalField(record, {"resource"});
    event.resource_id = OptionalField(record, {"resourceId", "resource_id"});
    event.ip_address = OptionalField(record, {"ipAddress", "ip_address"});

    if (const json* details = FindAny(record, {"details"})) {
        if (details->is_object()) {
            for (const auto& [key, value] : details->items()) {
                event.details[key] = ScalarToString(value);
            }
        }
        else {
            event.details["raw"] = ScalarToString(*details);
        }
    }

    return event;
}

} // namespace parsers
} // namespace warden
