/**
 * @file rate_limiter.cpp
 * @brief Rolling-window rate limiter
 *
 * @date 2025
 */

#include "warden/monitors/rate_limiter.hpp"

namespace warden {
namespace monitors {

RateLimiter::RateLimiter(std::size_t limit, std::chrono::milliseconds window,
                         core::ClockFunction clock)
    : limit_(limit)
    , window_(window)
    , clock_(std::move(clock)) {
}

void RateLimiter::PruneLocked(core::TimePoint now) {
    while (!stamps_.empty() && now - stamps_.front() >= window_) {
        stamps_.pop_front();
    }
}

bool RateLimiter::TryAcquire() {
    const auto now = clock_();
    std::lock_guard<std::mutex> lock(mutex_);
    PruneLocked(now);
    if (stamps_.size() >= limit_) {
        return false;
    }
    stamps_.push_back(now);
    return true;
}

std::size_t RateLimiter::Used() {
    const auto now = clock_();
    std::lock_guard<std::mutex> lock(mutex_);
    PruneLocked(now);
    return stamps_.size();
}

std::size_t RateLimiter::Remaining() {
    const auto now = clock_();
    std::lock_guard<std::mutex> lock(mutex_);
    PruneLocked(now);
    return stamps_.size() >= limit_ ? 0 : limit_ - stamps_.size();
}

void RateLimiter::SetLimit(std::size_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    limit_ = limit;
}

std::size_t RateLimiter::Limit() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return limit_;
}

} // namespace monitors
} // namespace warden
