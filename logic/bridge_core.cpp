/*
 * Bridge_Core Implementation
 */

#include "logic/bridge_core.hpp"

#include "utils/mono_clock.hpp"

#include <chrono>
#include <cmath>
#include <cstdio>
#include <thread>

static inline void saturating_inc(uint32_t &counter) {
    if (counter < UINT32_MAX) {
        counter++;
    }
}

Bridge_Core::Bridge_Core(const BridgeConfig &cfg) : conditioner_(cfg) {}

bool Bridge_Core::begin_calibration(uint32_t now_ms, uint32_t window_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!conditioner_.begin_calibration()) {
        return false;
    }
    calibrator_.start(now_ms, window_ms);
    return true;
}

IngestOutcome Bridge_Core::on_sample(const RawSample &raw, uint32_t now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    saturating_inc(stats_.received);

    switch (conditioner_.phase()) {
        case ConditionerPhase::Active: {
            UpdateStatus st = conditioner_.update(raw);
            if (st == UpdateStatus::Applied) {
                saturating_inc(stats_.applied);
                sequence_++;
                return IngestOutcome::Applied;
            }
            if (st == UpdateStatus::NonFinite) {
                saturating_inc(stats_.non_finite);
                return IngestOutcome::NonFinite;
            }
            break;
        }
        case ConditionerPhase::Calibrating: {
            if (calibrator_.add_sample(raw, now_ms)) {
                saturating_inc(stats_.calibration);
                return IngestOutcome::Calibration;
            }
            /* Refused: closed/elapsed window is Ignored, NaN/Inf is NonFinite */
            if (!calibrator_.closed() && !calibrator_.window_elapsed(now_ms) &&
                (!std::isfinite(raw.roll) || !std::isfinite(raw.pitch))) {
                saturating_inc(stats_.non_finite);
                return IngestOutcome::NonFinite;
            }
            break;
        }
        case ConditionerPhase::Uncalibrated:
            break;
    }

    saturating_inc(stats_.ignored);
    return IngestOutcome::Ignored;
}

bool Bridge_Core::calibration_window_elapsed(uint32_t now_ms) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return calibrator_.started() && calibrator_.window_elapsed(now_ms);
}

CalibrationResult Bridge_Core::finish_calibration() {
    std::lock_guard<std::mutex> lock(mutex_);
    CalibrationResult result = calibrator_.finish();
    if (result.ok() && !conditioner_.activate(result.bias)) {
        result.status = CalibrationStatus::Failed;
        result.error = BridgeError::InsufficientData;
        snprintf(result.error_msg, sizeof(result.error_msg),
                 "Conditioner not in Calibrating phase");
    }
    return result;
}

CommandPair Bridge_Core::latest_command() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (conditioner_.phase() != ConditionerPhase::Active) {
        return NEUTRAL_COMMAND;
    }
    return conditioner_.output();
}

uint32_t Bridge_Core::command_sequence() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sequence_;
}

ConditionerPhase Bridge_Core::phase() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return conditioner_.phase();
}

Bias Bridge_Core::bias() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return conditioner_.bias();
}

FilterState Bridge_Core::filter() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return conditioner_.filter();
}

IngestStats Bridge_Core::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

CalibrationWait bridge_wait_calibration(const Bridge_Core &core,
                                        const std::atomic_bool &stop_requested,
                                        uint32_t poll_ms) {
    while (!core.calibration_window_elapsed(mono_now_ms())) {
        if (stop_requested.load()) {
            return CalibrationWait::Interrupted;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(poll_ms));
    }
    return CalibrationWait::WindowElapsed;
}
