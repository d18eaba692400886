#include "transport/SchedulerTimer.h"

#include <algorithm>

namespace transport {

ThreadTimer::~ThreadTimer() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shutdown_ = true;
        active_ = false;
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        if (worker_.get_id() == std::this_thread::get_id()) {
            worker_.detach();
        } else {
            worker_.join();
        }
    }
}

void ThreadTimer::start(double periodSec, Callback callback) {
    const auto period = std::chrono::duration_cast<Clock::duration>(
        std::chrono::duration<double>(std::max(0.001, periodSec)));
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callback_ = std::move(callback);
        period_ = period;
        nextFire_ = Clock::now() + period_;
        active_ = true;
        ++generation_;
        if (!worker_.joinable()) {
            worker_ = std::thread([this] { run(); });
        }
    }
    cv_.notify_all();
}

void ThreadTimer::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        active_ = false;
        ++generation_;
    }
    cv_.notify_all();
}

void ThreadTimer::stopAndWait() {
    std::unique_lock<std::mutex> lock(mutex_);
    active_ = false;
    ++generation_;
    cv_.notify_all();
    if (worker_.get_id() == std::this_thread::get_id()) {
        return;
    }
    cv_.wait(lock, [this] { return !inCallback_; });
}

bool ThreadTimer::running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

double ThreadTimer::now() const {
    return std::chrono::duration<double>(Clock::now() - epoch_).count();
}

void ThreadTimer::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!shutdown_) {
        if (!active_) {
            cv_.wait(lock, [this] { return shutdown_ || active_; });
            continue;
        }
        const std::uint64_t generation = generation_;
        const bool interrupted = cv_.wait_until(lock, nextFire_, [this, generation] {
            return shutdown_ || generation_ != generation;
        });
        if (interrupted) {
            continue;
        }

        Callback callback = callback_;
        nextFire_ += period_;
        // Fall back to the current time after a long stall instead of bursting.
        const auto current = Clock::now();
        if (nextFire_ < current) {
            nextFire_ = current + period_;
        }
        inCallback_ = true;
        lock.unlock();
        if (callback) {
            callback();
        }
        lock.lock();
        inCallback_ = false;
        cv_.notify_all();
    }
}

}  // namespace transport
