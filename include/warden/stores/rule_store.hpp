/**
 * @file rule_store.hpp
 * @brief Read-mostly, validated rule registry
 *
 * One store instance owns one rule set (correlation or response rules).
 * Engines receive a snapshot through List(), so evaluation never holds the
 * lock. Every mutation is validated first; a rejected mutation leaves the
 * store unchanged.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <functional>
#include <shared_mutex>
#include <mutex>
#include <algorithm>
#include <set>

#include "warden/core/security_types.hpp"

namespace warden {
namespace stores {

/**
 * @class RuleStore
 * @brief Id-keyed rule registry guarded by a reader/writer lock
 *
 * @tparam Rule Rule type with a `std::string id` and `bool enabled` member
 *
 * Rules are kept in insertion order.
 *
 * **Usage Example**:
 * @code
 * stores::RuleStore<analyzers::CorrelationRule> rules(
 *     analyzers::ValidateRule, analyzers::DefaultCorrelationRules());
 * rules.SetEnabled("reconnaissance_activity", false);
 * auto correlations = engine.Correlate(events, rules.List());
 * @endcode
 */
template <typename Rule>
class RuleStore {
public:
    using Validator = std::function<void(const Rule&)>;

    explicit RuleStore(Validator validator, std::vector<Rule> initial = {})
        : validator_(std::move(validator)) {
        Replace(std::move(initial));
    }

    /// @throws core::ValidationError if invalid or the id already exists
    void Add(Rule rule) {
        validator_(rule);
        std::unique_lock<std::shared_mutex> lock(mutex_);
        if (FindLocked(rule.id) != rules_.end()) {
            throw core::ValidationError("rule '" + rule.id + "' already exists");
        }
        rules_.push_back(std::move(rule));
    }

    /// @throws core::ValidationError if invalid or the id is unknown
    void Update(Rule rule) {
        validator_(rule);
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = FindLocked(rule.id);
        if (it == rules_.end()) {
            throw core::ValidationError("rule '" + rule.id + "' does not exist");
        }
        *it = std::move(rule);
    }

    /// @return false if no rule had that id
    bool Remove(const std::string& id) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = FindLocked(id);
        if (it == rules_.end()) {
            return false;
        }
        rules_.erase(it);
        return true;
    }

    bool SetEnabled(const std::string& id, bool enabled) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = FindLocked(id);
        if (it == rules_.end()) {
            return false;
        }
        it->enabled = enabled;
        return true;
    }

    /**
     * @brief Swap the whole rule set
     *
     * All rules are validated (including id uniqueness) before anything is
     * replaced.
     */
    void Replace(std::vector<Rule> rules) {
        std::set<std::string> ids;
        for (const auto& rule : rules) {
            validator_(rule);
            if (!ids.insert(rule.id).second) {
                throw core::ValidationError("duplicate rule id '" + rule.id + "'");
            }
        }
        std::unique_lock<std::shared_mutex> lock(mutex_);
        rules_ = std::move(rules);
    }

    std::optional<Rule> Get(const std::string& id) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = std::find_if(rules_.begin(), rules_.end(),
                               [&id](const Rule& rule) { return rule.id == id; });
        if (it == rules_.end()) {
            return std::nullopt;
        }
        return *it;
    }

    /// Snapshot of all rules
    std::vector<Rule> List() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return rules_;
    }

    std::size_t Size() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return rules_.size();
    }

private:
    typename std::vector<Rule>::iterator FindLocked(const std::string& id) {
        return std::find_if(rules_.begin(), rules_.end(),
                            [&id](const Rule& rule) { return rule.id == id; });
    }

    Validator validator_;
    mutable std::shared_mutex mutex_;
    std::vector<Rule> rules_;
};

} // namespace stores
} // namespace warden
