/**
 * @file indicator_store.cpp
 * @brief Implementation of the threat-intelligence indicator store
 *
 * @date 2025
 */

#include "warden/stores/indicator_store.hpp"
#include "warden/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <mutex>

namespace warden {
namespace stores {

using core::IndicatorType;
using core::ValidationError;

IndicatorStore::IndicatorStore(core::ClockFunction clock)
    : clock_(std::move(clock)) {
}

std::string IndicatorStore::Key(IndicatorType type, const std::string& value) {
    std::string normalized = utils::StringUtils::Trim(value);
    if (type == IndicatorType::DOMAIN || type == IndicatorType::URL || type == IndicatorType::HASH) {
        normalized = utils::StringUtils::ToLower(normalized);
    }
    return core::IndicatorTypeToString(type) + ":" + normalized;
}

bool IndicatorStore::IsExpired(const IntelIndicator& indicator, core::TimePoint now) const {
    return indicator.expires_at && *indicator.expires_at <= now;
}

void IndicatorStore::Add(IntelIndicator indicator) {
    if (utils::StringUtils::Trim(indicator.value).empty()) {
        throw ValidationError("indicator value must not be empty");
    }
    if (indicator.confidence < 0 || indicator.confidence > 100) {
        throw ValidationError("indicator '" + indicator.value + "': confidence must be within 0-100");
    }

    if (indicator.added_at == core::TimePoint{}) {
        indicator.added_at = clock_();
    }

    std::string key = Key(indicator.type, indicator.value);
    std::unique_lock<std::shared_mutex> lock(mutex_);
    indicators_[key] = std::move(indicator);
}

bool IndicatorStore::Remove(IndicatorType type, const std::string& value) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return indicators_.erase(Key(type, value)) > 0;
}

std::optional<IntelIndicator> IndicatorStore::Get(IndicatorType type, const std::string& value) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = indicators_.find(Key(type, value));
    if (it == indicators_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<core::EnrichmentMatch> IndicatorStore::Lookup(IndicatorType type,
                                                            const std::string& value) {
    const std::string key = Key(type, value);
    const auto now = clock_();

    std::unique_lock<std::shared_mutex> lock(mutex_);
    ++lookups_;

    auto it = indicators_.find(key);
    if (it == indicators_.end()) {
        return std::nullopt;
    }

    if (IsExpired(it->second, now)) {
        spdlog::debug("Indicator {} expired, removing", key);
        indicators_.erase(it);
        ++expired_removed_;
        return std::nullopt;
    }

    ++hits_;
    const IntelIndicator& intel = it->second;

    core::EnrichmentMatch match;
    match.indicator.type = intel.type;
    match.indicator.value = intel.value;
    match.indicator.confidence = intel.confidence;
    match.indicator.first_seen = intel.added_at;
    match.indicator.last_seen = now;
    match.indicator.occurrences = 1;
    match.severity = intel.severity;
    match.description = intel.description;
    match.tags = intel.tags;
    return match;
}

std::size_t IndicatorStore::PurgeExpired() {
    const auto now = clock_();
    std::unique_lock<std::shared_mutex> lock(mutex_);

    std::size_t removed = 0;
    for (auto it = indicators_.begin(); it != indicators_.end();) {
        if (IsExpired(it->second, now)) {
            it = indicators_.erase(it);
            ++removed;
        }
        else {
            ++it;
        }
    }

    expired_removed_ += removed;
    if (removed > 0) {
        spdlog::info("Purged {} expired indicator(s)", removed);
    }
    return removed;
}

std::vector<IntelIndicator> IndicatorStore::List() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<IntelIndicator> result;
    result.reserve(indicators_.size());
    for (const auto& entry : indicators_) {
        result.push_back(entry.second);
    }
    return result;
}

std::size_t IndicatorStore::Size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return indicators_.size();
}

IndicatorStats IndicatorStore::GetStats() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    IndicatorStats stats;
    stats.total = indicators_.size();
    for (const auto& entry : indicators_) {
        ++stats.by_type[core::IndicatorTypeToString(entry.second.type)];
        ++stats.by_severity[core::SeverityToString(entry.second.severity)];
    }
    stats.lookups = lookups_;
    stats.hits = hits_;
    stats.expired_removed = expired_removed_;
    return stats;
}

} // namespace stores
} // namespace warden
