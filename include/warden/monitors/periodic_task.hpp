/**
 * @file periodic_task.hpp
 * @brief Repeating background task with at-most-one run in flight
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <functional>
#include <memory>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <chrono>
#include <cstdint>

namespace warden {
namespace monitors {

/**
 * @class PeriodicTask
 * @brief Runs a body every interval on a dedicated thread
 *
 * - A scheduled run is skipped while another run (scheduled or RunNow())
 *   is still in flight.
 * - An exception escaping the body is logged and counted; the schedule
 *   continues.
 * - Stop() waits at most the grace period for an in-flight run, then
 *   abandons the worker thread. The body must therefore only capture state
 *   that outlives it (the monitor hands it a weak reference).
 */
class PeriodicTask {
public:
    using Body = std::function<void()>;

    PeriodicTask(std::string name, std::chrono::milliseconds interval, Body body);
    ~PeriodicTask();

    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    /// Start the schedule; no-op when already running
    void Start();

    /**
     * @brief Stop the schedule
     * @return true if the worker finished within @p grace and was joined
     */
    bool Stop(std::chrono::milliseconds grace);

    /// Run the body synchronously, waiting for any in-flight run first
    bool RunNow();

    /// Stop, change the interval, and start again if it was running
    void Restart(std::chrono::milliseconds interval, std::chrono::milliseconds grace);

    bool IsRunning() const;
    std::chrono::milliseconds Interval() const;
    const std::string& Name() const;

    uint64_t Runs() const;
    uint64_t Skipped() const;
    uint64_t Failures() const;

private:
    struct State;

    static void Loop(std::shared_ptr<State> state);
    static bool RunOnce(State& state, bool wait_for_slot);

    std::shared_ptr<State> state_;
    std::thread worker_;
};

} // namespace monitors
} // namespace warden
