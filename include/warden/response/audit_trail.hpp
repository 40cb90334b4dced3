/**
 * @file audit_trail.hpp
 * @brief Append-only record of every automated response
 *
 * Every Execute() call of the response engine appends one `response`
 * record, whatever its outcome. Enforcement handlers append `enforcement`
 * records and the `log` action appends `response_log` records, so the
 * full sequence can be replayed for audit.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <fstream>
#include <filesystem>

#include "warden/core/security_types.hpp"
#include "warden/response/response_types.hpp"

namespace warden {
namespace response {

/**
 * @struct AuditRecord
 * @brief One append-only audit entry
 */
struct AuditRecord {
    std::string kind;                               ///< response | enforcement | response_log
    std::string threat_id;
    std::string incident_id;
    core::TimePoint recorded_at;
    std::map<std::string, std::string> details;
    std::vector<ExecutedAction> actions;            ///< Filled for `response` records
};

/**
 * @class AuditTrail
 * @brief Append-only audit sink
 *
 * Append() may throw std::runtime_error on I/O failure; callers log it.
 */
class AuditTrail {
public:
    virtual ~AuditTrail() = default;

    virtual void Append(const AuditRecord& record) = 0;
};

/**
 * @class MemoryAuditTrail
 * @brief Keeps records in memory (tests and the `check` command)
 */
class MemoryAuditTrail : public AuditTrail {
public:
    void Append(const AuditRecord& record) override;

    std::vector<AuditRecord> Records() const;
    std::size_t Size() const;

private:
    mutable std::mutex mutex_;
    std::vector<AuditRecord> records_;
};

/**
 * @class JsonlAuditTrail
 * @brief Appends one JSON object per line to a file
 */
class JsonlAuditTrail : public AuditTrail {
public:
    /// @throws std::runtime_error if the file cannot be opened for appending
    explicit JsonlAuditTrail(const std::filesystem::path& path);

    void Append(const AuditRecord& record) override;

private:
    std::filesystem::path path_;
    std::mutex mutex_;
    std::ofstream stream_;
};

} // namespace response
} // namespace warden
