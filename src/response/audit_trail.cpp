/**
 * @file audit_trail.cpp
 * @brief In-memory and JSON-lines audit trails
 *
 * @date 2025
 */

#include "warden/response/audit_trail.hpp"
#include "warden/reporters/json_reporter.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace warden {
namespace response {

// ============================================================================
// MEMORY TRAIL
// ============================================================================

void MemoryAuditTrail::Append(const AuditRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.push_back(record);
}

std::vector<AuditRecord> MemoryAuditTrail::Records() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_;
}

std::size_t MemoryAuditTrail::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

// ============================================================================
// JSONL TRAIL
// ============================================================================

JsonlAuditTrail::JsonlAuditTrail(const std::filesystem::path& path)
    : path_(path) {
    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path());
    }

    stream_.open(path_, std::ios::out | std::ios::app);
    if (!stream_.is_open()) {
        throw std::runtime_error("Cannot open audit trail: " + path_.string());
    }
    spdlog::debug("Audit trail: {}", path_.string());
}

void JsonlAuditTrail::Append(const AuditRecord& record) {
    static const reporters::JsonReporter reporter(reporters::JsonReporterConfig{false, 0});
    std::string line = reporter.AuditRecordToJson(record);

    std::lock_guard<std::mutex> lock(mutex_);
    stream_ << line << '\n';
    stream_.flush();
    if (!stream_) {
        throw std::runtime_error("Failed to write audit record to " + path_.string());
    }
}

} // namespace response
} // namespace warden
