#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>

// Single-shot inactivity timer. arm() starts a fresh full-length countdown,
// disarm() cancels it. When a countdown runs out, on_expire is invoked on the
// timer thread with the timer lock held, so arm/disarm/fire never interleave:
// a disarm() racing an expiry either cancels it or waits for on_expire to
// return. on_expire must not call back into the timer.
class IdleTimer {
public:
    using Callback = std::function<void()>;

    IdleTimer(std::chrono::milliseconds timeout, Callback on_expire);
    ~IdleTimer();

    IdleTimer(const IdleTimer&) = delete;
    IdleTimer& operator=(const IdleTimer&) = delete;

    void arm();
    void disarm();

    bool armed() const;
    uint64_t fired_count() const;
    std::chrono::milliseconds timeout() const { return timeout_; }

private:
    void run(std::stop_token st);

    std::chrono::milliseconds timeout_;
    Callback on_expire_;

    mutable std::mutex mu_;
    std::condition_variable_any cv_;
    std::optional<std::chrono::steady_clock::time_point> deadline_;
    uint64_t generation_ = 0;
    uint64_t fired_ = 0;

    std::jthread thread_; // last, so it starts after the state above exists
};
