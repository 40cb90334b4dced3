/**
 * @file periodic_task.cpp
 * @brief Implementation of the repeating background task
 *
 * Worker state lives in a shared block owned jointly by the task object
 * and its thread, so an abandoned worker never touches a destroyed task.
 *
 * @date 2025
 */

#include "warden/monitors/periodic_task.hpp"

#include <spdlog/spdlog.h>

namespace warden {
namespace monitors {

struct PeriodicTask::State {
    std::string name;
    Body body;

    std::mutex mutex;                 ///< Guards the fields below
    std::condition_variable cv;
    std::chrono::milliseconds interval{0};
    bool stop_requested{false};
    bool active{false};               ///< Worker thread alive
    uint64_t generation{0};           ///< Incremented per Start()

    std::mutex run_mutex;             ///< Held while the body runs

    std::atomic<uint64_t> runs{0};
    std::atomic<uint64_t> skipped{0};
    std::atomic<uint64_t> failures{0};
};

PeriodicTask::PeriodicTask(std::string name, std::chrono::milliseconds interval, Body body)
    : state_(std::make_shared<State>()) {
    state_->name = std::move(name);
    state_->interval = interval;
    state_->body = std::move(body);
}

PeriodicTask::~PeriodicTask() {
    Stop(std::chrono::milliseconds(0));
}

// ============================================================================
// LIFECYCLE
// ============================================================================

void PeriodicTask::Start() {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->active && !state_->stop_requested) {
            return;
        }
        state_->stop_requested = false;
        state_->active = true;
        ++state_->generation;
    }

    if (worker_.joinable()) {
        worker_.detach();
    }
    worker_ = std::thread(&PeriodicTask::Loop, state_);
    spdlog::debug("Task {} started ({}ms)", state_->name, Interval().count());
}

bool PeriodicTask::Stop(std::chrono::milliseconds grace) {
    bool finished = true;
    {
        std::unique_lock<std::mutex> lock(state_->mutex);
        if (!state_->active && !worker_.joinable()) {
            return true;
        }
        state_->stop_requested = true;
        state_->cv.notify_all();
        finished = state_->cv.wait_for(lock, grace, [this] { return !state_->active; });
    }

    if (!worker_.joinable()) {
        return finished;
    }

    if (finished) {
        worker_.join();
        spdlog::debug("Task {} stopped", state_->name);
        return true;
    }

    spdlog::warn("Task {} did not finish within {}ms, abandoning in-flight run",
                 state_->name, grace.count());
    worker_.detach();
    return false;
}

void PeriodicTask::Restart(std::chrono::milliseconds interval, std::chrono::milliseconds grace) {
    bool was_running = IsRunning();
    Stop(grace);
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->interval = interval;
    }
    if (was_running) {
        Start();
    }
    spdlog::info("Task {} rescheduled every {}ms", state_->name, interval.count());
}

bool PeriodicTask::RunNow() {
    return RunOnce(*state_, true);
}

// ============================================================================
// WORKER
// ============================================================================

void PeriodicTask::Loop(std::shared_ptr<State> state) {
    std::unique_lock<std::mutex> lock(state->mutex);
    const uint64_t generation = state->generation;

    auto superseded = [&state, generation] {
        return state->stop_requested || state->generation != generation;
    };

    while (!superseded()) {
        bool stop = state->cv.wait_for(lock, state->interval, superseded);
        if (stop) {
            break;
        }

        lock.unlock();
        RunOnce(*state, false);
        lock.lock();
    }

    // A newer worker may already own the state after an abandoned stop
    if (state->generation == generation) {
        state->active = false;
    }
    state->cv.notify_all();
}

bool PeriodicTask::RunOnce(State& state, bool wait_for_slot) {
    std::unique_lock<std::mutex> run_lock(state.run_mutex, std::defer_lock);
    if (wait_for_slot) {
        run_lock.lock();
    }
    else if (!run_lock.try_lock()) {
        ++state.skipped;
        spdlog::debug("Task {} still running, skipping scheduled run", state.name);
        return false;
    }

    try {
        state.body();
        ++state.runs;
        return true;
    }
    catch (const std::exception& e) {
        ++state.failures;
        spdlog::error("Task {} failed: {}", state.name, e.what());
        return false;
    }
    catch (...) {
        ++state.failures;
        spdlog::error("Task {} failed: unknown error", state.name);
        return false;
    }
}

// ============================================================================
// ACCESSORS
// ============================================================================

bool PeriodicTask::IsRunning() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->active && !state_->stop_requested;
}

std::chrono::milliseconds PeriodicTask::Interval() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->interval;
}

const std::string& PeriodicTask::Name() const {
    return state_->name;
}

uint64_t PeriodicTask::Runs() const { return state_->runs; }
uint64_t PeriodicTask::Skipped() const { return state_->skipped; }
uint64_t PeriodicTask::Failures() const { return state_->failures; }

} // namespace monitors
} // namespace warden
