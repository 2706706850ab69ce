/*
 * Tick_Scheduler Implementation
 */

#include "logic/tick_scheduler.hpp"
#include "utils/mono_clock.hpp"

#include <chrono>

uint64_t tick_next_deadline(uint64_t fired_deadline_us, uint64_t now_us,
                            uint32_t period_us, uint32_t *skipped) {
    uint64_t next = fired_deadline_us + period_us;
    uint32_t dropped = 0;

    if (period_us > 0U && now_us > next) {
        /* First grid point at or after now; everything before it is dropped */
        uint64_t periods = (now_us - fired_deadline_us + period_us - 1U) / period_us;
        next = fired_deadline_us + periods * period_us;
        uint64_t behind = periods - 1U;
        dropped = (behind > UINT32_MAX) ? UINT32_MAX : static_cast<uint32_t>(behind);
    }

    if (skipped != nullptr) {
        *skipped = dropped;
    }
    return next;
}

static inline uint32_t saturate_us(uint64_t us) {
    return (us > UINT32_MAX) ? UINT32_MAX : static_cast<uint32_t>(us);
}

Tick_Scheduler::Tick_Scheduler(uint32_t period_ms) : period_ms_(period_ms ? period_ms : 1U) {}

Tick_Scheduler::~Tick_Scheduler() {
    stop();
}

bool Tick_Scheduler::start(TickCallback callback) {
    if (running_.load() || !callback) {
        return false;
    }
    if (thread_.joinable()) {
        thread_.join();
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stats_ = {};
    }
    callback_ = std::move(callback);
    running_.store(true);
    thread_ = std::thread(&Tick_Scheduler::run, this);
    return true;
}

void Tick_Scheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_.store(false);
    }
    wake_.notify_all();
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
        thread_.join();
    }
}

TickStats Tick_Scheduler::get_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

void Tick_Scheduler::run() {
    using std::chrono::microseconds;
    using std::chrono::steady_clock;

    const uint32_t period_us = period_ms_ * 1000U;
    const steady_clock::time_point epoch = steady_clock::now();
    uint64_t deadline_us = 0;   /* relative to epoch; first tick is immediate */
    uint32_t tick_index = 0;

    std::unique_lock<std::mutex> lock(mutex_);
    while (running_.load()) {
        bool stopping = wake_.wait_until(lock, epoch + microseconds(deadline_us),
                                         [this] { return !running_.load(); });
        if (stopping) {
            break;
        }
        lock.unlock();

        uint64_t fired_us = static_cast<uint64_t>(
            std::chrono::duration_cast<microseconds>(steady_clock::now() - epoch).count());
        callback_(tick_index, mono_now_ms());
        uint64_t done_us = static_cast<uint64_t>(
            std::chrono::duration_cast<microseconds>(steady_clock::now() - epoch).count());

        uint32_t skipped = 0;
        uint64_t next_us = tick_next_deadline(deadline_us, done_us, period_us, &skipped);

        lock.lock();
        uint32_t late_us = (fired_us > deadline_us) ? saturate_us(fired_us - deadline_us) : 0U;
        if (late_us < stats_.jitter.min_us) {
            stats_.jitter.min_us = late_us;
        }
        if (late_us > stats_.jitter.max_us) {
            stats_.jitter.max_us = late_us;
        }
        stats_.jitter.last_us = late_us;

        uint32_t callback_us = saturate_us(done_us - fired_us);
        if (callback_us > stats_.max_callback_us) {
            stats_.max_callback_us = callback_us;
        }
        if (stats_.ticks < UINT32_MAX) {
            stats_.ticks++;
        }
        if (UINT32_MAX - stats_.missed >= skipped) {
            stats_.missed += skipped;
        } else {
            stats_.missed = UINT32_MAX;
        }

        deadline_us = next_us;
        tick_index++;
    }
}
