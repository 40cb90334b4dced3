/**
 * @file rate_limiter.hpp
 * @brief Rolling-window cap on automated responses
 *
 * @date 2025
 */

#pragma once

#include <deque>
#include <mutex>
#include <chrono>
#include <cstddef>

#include "warden/core/security_types.hpp"

namespace warden {
namespace monitors {

/**
 * @class RateLimiter
 * @brief At most `limit` acquisitions within any trailing window
 *
 * Thread-safe. Timestamps older than the window are pruned on every call,
 * so the count resets gradually rather than at fixed hour boundaries.
 */
class RateLimiter {
public:
    RateLimiter(std::size_t limit,
                std::chrono::milliseconds window = std::chrono::hours(1),
                core::ClockFunction clock = core::Clock::now);

    /// Take a slot if one is free
    bool TryAcquire();

    std::size_t Used();
    std::size_t Remaining();

    /// Change the cap; slots already taken stay counted
    void SetLimit(std::size_t limit);
    std::size_t Limit() const;

private:
    void PruneLocked(core::TimePoint now);

    std::size_t limit_;
    std::chrono::milliseconds window_;
    core::ClockFunction clock_;
    mutable std::mutex mutex_;
    std::deque<core::TimePoint> stamps_;
};

} // namespace monitors
} // namespace warden
