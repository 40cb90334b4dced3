/**
 * @file audit_parser.hpp
 * @brief Parser for JSON-lines audit log exports
 *
 * Converts persisted audit records into SecurityEvent values. Used by the
 * JSON-lines event source and by the offline `correlate` command.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <cstddef>

#include "warden/core/security_types.hpp"

namespace warden {
namespace parsers {

/**
 * @struct ParseSummary
 * @brief Line counts of the last Parse() call
 */
struct ParseSummary {
    std::size_t lines{0};       ///< Non-blank lines read
    std::size_t parsed{0};      ///< Records converted to events
    std::size_t skipped{0};     ///< Malformed records
};

/**
 * @class AuditRecordParser
 * @brief Parser for audit records, one JSON object per line
 *
 * Accepts both the audit schema's camelCase names (`actorId`, `userId`,
 * `tenantId`, `propertyId`, `ipAddress`, `resourceId`) and snake_case
 * names. `timestamp` is an ISO-8601 string or epoch milliseconds; `id` and
 * `action` are required.
 *
 * **Usage Example**:
 * @code
 * AuditRecordParser parser;
 * auto events = parser.Parse("audit.jsonl");
 * spdlog::info("{} events, {} skipped", events.size(), parser.LastSummary().skipped);
 * @endcode
 */
class AuditRecordParser {
public:
    AuditRecordParser();

    /**
     * @brief Parse a whole export file, skipping malformed lines
     * @throws std::runtime_error if the file cannot be opened
     */
    std::vector<core::SecurityEvent> Parse(const std::filesystem::path& path);

    /// Parse one line; nullopt (logged) when malformed
    std::optional<core::SecurityEvent> ParseLine(const std::string& line) const;

    /**
     * @brief Parse one record
     * @throws std::runtime_error describing the first problem found
     */
    core::SecurityEvent ParseRecord(const std::string& json_text) const;

    const ParseSummary& LastSummary() const { return summary_; }

private:
    ParseSummary summary_;
};

} // namespace parsers
} // namespace warden
