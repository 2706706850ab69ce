/*
 * Bridge_Core - Notification ingest and guarded command state
 * Routes samples to calibration or conditioning; serves the latest
 * CommandPair to the tick thread without tearing
 */

#ifndef BRIDGE_CORE_HPP
#define BRIDGE_CORE_HPP

#include "config.h"
#include "types.h"
#include "logic/bias_calibrator.hpp"
#include "logic/signal_conditioner.hpp"

#include <atomic>
#include <cstdint>
#include <mutex>

enum class IngestOutcome : uint8_t {
    Calibration,   /* Counted toward the bias */
    Applied,       /* Conditioner updated */
    NonFinite,     /* NaN/Inf - dropped, state unchanged */
    Ignored        /* Uncalibrated, or window closed but not yet finished */
};

struct IngestStats {
    uint32_t received = 0;
    uint32_t calibration = 0;
    uint32_t applied = 0;
    uint32_t non_finite = 0;
    uint32_t ignored = 0;
};

/*============================================================================
 * Bridge_Core
 *============================================================================
 * Single writer (notification thread) / many readers (tick thread, status
 * heartbeat). Every access takes the same mutex and readers copy the whole
 * CommandPair, so a reader never observes half of an update.
 */
class Bridge_Core {
public:
    explicit Bridge_Core(const BridgeConfig &cfg);

    Bridge_Core(const Bridge_Core &) = delete;
    Bridge_Core &operator=(const Bridge_Core &) = delete;

    /* Uncalibrated -> Calibrating, opening the window at now_ms */
    bool begin_calibration(uint32_t now_ms, uint32_t window_ms = CALIB_WINDOW_MS);

    /* The only entry point for samples (called from the notification thread) */
    IngestOutcome on_sample(const RawSample &raw, uint32_t now_ms);

    bool calibration_window_elapsed(uint32_t now_ms) const;

    /*
     * Close calibration. On success the conditioner becomes Active with the
     * computed bias; on InsufficientData it stays Calibrating and the caller
     * is expected to abort startup.
     */
    CalibrationResult finish_calibration();

    /*
     * Non-blocking latest-value read for the tick thread.
     * Outside Active this is NEUTRAL_COMMAND (keeps the link alive without
     * sending anything derived from an undefined bias).
     */
    CommandPair latest_command() const;

    /* Incremented on every applied sample */
    uint32_t command_sequence() const;

    ConditionerPhase phase() const;
    Bias bias() const;
    FilterState filter() const;
    IngestStats stats() const;

private:
    mutable std::mutex mutex_;
    Signal_Conditioner conditioner_;
    Bias_Calibrator calibrator_;
    IngestStats stats_ = {};
    uint32_t sequence_ = 0;
};

enum class CalibrationWait : uint8_t {
    WindowElapsed,   /* finish_calibration() may run */
    Interrupted      /* Shutdown requested mid-window; do not finish */
};

/*
 * Block until the open calibration window has elapsed on mono_now_ms(),
 * checking stop_requested every poll_ms. A window that was never opened
 * never elapses, so only a stop request ends the wait.
 */
CalibrationWait bridge_wait_calibration(const Bridge_Core &core,
                                        const std::atomic_bool &stop_requested,
                                        uint32_t poll_ms = 10);

#endif // BRIDGE_CORE_HPP
