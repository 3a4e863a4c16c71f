#include "idle_timer.hpp"

IdleTimer::IdleTimer(std::chrono::milliseconds timeout, Callback on_expire)
    : timeout_(timeout), on_expire_(std::move(on_expire)),
      thread_([this](std::stop_token st) { run(st); }) {}

IdleTimer::~IdleTimer() {
    thread_.request_stop();
    cv_.notify_all();
    if (thread_.joinable()) thread_.join();
}

void IdleTimer::arm() {
    {
        std::lock_guard lock(mu_);
        deadline_ = std::chrono::steady_clock::now() + timeout_;
        ++generation_;
    }
    cv_.notify_all();
}

void IdleTimer::disarm() {
    {
        std::lock_guard lock(mu_);
        deadline_.reset();
        ++generation_;
    }
    cv_.notify_all();
}

bool IdleTimer::armed() const {
    std::lock_guard lock(mu_);
    return deadline_.has_value();
}

uint64_t IdleTimer::fired_count() const {
    std::lock_guard lock(mu_);
    return fired_;
}

void IdleTimer::run(std::stop_token st) {
    std::unique_lock lock(mu_);
    while (!st.stop_requested()) {
        if (!deadline_) {
            cv_.wait(lock, st, [this] { return deadline_.has_value(); });
            continue;
        }

        auto gen = generation_;
        auto deadline = *deadline_;
        bool changed = cv_.wait_until(lock, st, deadline, [this, gen] { return generation_ != gen; });
        if (changed || st.stop_requested()) continue;

        // Deadline passed with no arm/disarm in between.
        deadline_.reset();
        ++fired_;
        if (on_expire_) on_expire_();
    }
}
