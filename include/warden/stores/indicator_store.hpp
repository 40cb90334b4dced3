/**
 * @file indicator_store.hpp
 * @brief In-memory threat-intelligence indicator store
 *
 * Holds indicators of compromise loaded from configuration (or added by an
 * operator) and serves them to the classifier as an EnrichmentProvider.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <shared_mutex>
#include <cstddef>

#include "warden/core/security_types.hpp"
#include "warden/core/collaborators.hpp"

namespace warden {
namespace stores {

/**
 * @struct IntelIndicator
 * @brief Threat-feed entry
 */
struct IntelIndicator {
    core::IndicatorType type{core::IndicatorType::IP};
    std::string value;
    core::Severity severity{core::Severity::MEDIUM};
    int confidence{50};                          ///< 0-100
    std::string description;
    std::vector<std::string> tags;
    std::string source;                          ///< Feed name
    core::TimePoint added_at;
    std::optional<core::TimePoint> expires_at;   ///< Never expires when absent
};

/**
 * @struct IndicatorStats
 * @brief Store contents broken down by type and severity
 */
struct IndicatorStats {
    std::size_t total{0};
    std::map<std::string, std::size_t> by_type;
    std::map<std::string, std::size_t> by_severity;
    std::size_t lookups{0};
    std::size_t hits{0};
    std::size_t expired_removed{0};
};

/**
 * @class IndicatorStore
 * @brief Keyed by `type:value`; domain, url and hash values are case-insensitive
 *
 * Thread-safe. Expired entries are removed lazily on lookup and eagerly by
 * PurgeExpired().
 */
class IndicatorStore : public core::EnrichmentProvider {
public:
    explicit IndicatorStore(core::ClockFunction clock = core::Clock::now);

    /**
     * @brief Insert or replace an indicator
     * @throws core::ValidationError on an empty value or confidence outside 0-100
     */
    void Add(IntelIndicator indicator);

    bool Remove(core::IndicatorType type, const std::string& value);

    std::optional<IntelIndicator> Get(core::IndicatorType type, const std::string& value) const;

    std::optional<core::EnrichmentMatch> Lookup(core::IndicatorType type,
                                                const std::string& value) override;

    /// @return Number of entries removed
    std::size_t PurgeExpired();

    std::vector<IntelIndicator> List() const;
    std::size_t Size() const;
    IndicatorStats GetStats() const;

private:
    static std::string Key(core::IndicatorType type, const std::string& value);
    bool IsExpired(const IntelIndicator& indicator, core::TimePoint now) const;

    core::ClockFunction clock_;
    mutable std::shared_mutex mutex_;
    std::map<std::string, IntelIndicator> indicators_;
    std::size_t lookups_{0};
    std::size_t hits_{0};
    std::size_t expired_removed_{0};
};

} // namespace stores
} // namespace warden
