#pragma once

#include <condition_variable>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

namespace transport {

// Periodic wall-clock callback source. start() and stop() may be called from
// inside the callback.
class SchedulerTimer {
public:
    using Callback = std::function<void()>;

    virtual ~SchedulerTimer() = default;

    virtual void start(double periodSec, Callback callback) = 0;
    // Never blocks; a callback already running may still finish afterwards.
    virtual void stop() = 0;
    // Stops and waits until no callback is running. From inside the callback
    // this behaves like stop(). The caller must not hold a lock the callback takes.
    virtual void stopAndWait() { stop(); }
    virtual bool running() const = 0;
    // Monotonic wall-clock seconds.
    virtual double now() const = 0;
};

class ThreadTimer : public SchedulerTimer {
public:
    ThreadTimer() = default;
    ~ThreadTimer() override;

    ThreadTimer(const ThreadTimer&) = delete;
    ThreadTimer& operator=(const ThreadTimer&) = delete;

    void start(double periodSec, Callback callback) override;
    void stop() override;
    void stopAndWait() override;
    bool running() const override;
    double now() const override;

private:
    using Clock = std::chrono::steady_clock;

    void run();

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::thread worker_;
    Callback callback_;
    Clock::duration period_ = std::chrono::milliseconds(100);
    Clock::time_point nextFire_{};
    std::uint64_t generation_ = 0;
    bool active_ = false;
    bool inCallback_ = false;
    bool shutdown_ = false;
    const Clock::time_point epoch_ = Clock::now();
};

}  // namespace transport
