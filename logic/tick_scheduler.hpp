/*
 * Tick_Scheduler - Fixed-period emission thread
 * Fires once per period regardless of sample arrival; missed periods are
 * skipped, never replayed
 */

#ifndef TICK_SCHEDULER_HPP
#define TICK_SCHEDULER_HPP

#include "config.h"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

/*
 * Deadline after the one that just fired.
 * If the callback overran one or more whole periods, those deadlines are
 * dropped and *skipped receives how many. A deadline exactly at now_us is
 * kept (it fires immediately).
 */
uint64_t tick_next_deadline(uint64_t fired_deadline_us, uint64_t now_us,
                            uint32_t period_us, uint32_t *skipped);

/* Lateness of each firing relative to its deadline */
struct JitterStats {
    uint32_t min_us = UINT32_MAX;
    uint32_t max_us = 0;
    uint32_t last_us = 0;
};

struct TickStats {
    uint32_t ticks = 0;            /* Callbacks run */
    uint32_t missed = 0;           /* Periods skipped after an overrun */
    uint32_t max_callback_us = 0;  /* Slowest callback */
    JitterStats jitter;
};

/* tick_index counts fired ticks from 0; now_ms is mono_now_ms() at fire time */
using TickCallback = std::function<void(uint32_t tick_index, uint32_t now_ms)>;

class Tick_Scheduler {
public:
    explicit Tick_Scheduler(uint32_t period_ms = BRIDGE_TICK_PERIOD_MS);
    ~Tick_Scheduler();

    Tick_Scheduler(const Tick_Scheduler &) = delete;
    Tick_Scheduler &operator=(const Tick_Scheduler &) = delete;

    /* First tick fires immediately. Returns false if already running. */
    bool start(TickCallback callback);

    /* Wakes the thread and joins it. Safe to call more than once. */
    void stop();

    bool running() const { return running_.load(); }
    uint32_t period_ms() const { return period_ms_; }
    TickStats get_stats() const;

private:
    void run();

    uint32_t period_ms_;
    TickCallback callback_;
    std::thread thread_;
    std::atomic_bool running_{false};

    mutable std::mutex mutex_;
    std::condition_variable wake_;
    TickStats stats_ = {};
};

#endif // TICK_SCHEDULER_HPP
