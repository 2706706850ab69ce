/*
 * Bias_Calibrator - One-shot zero-reference estimation
 * Count-weighted mean of (roll, pitch) over a fixed hold-still window
 */

#ifndef BIAS_CALIBRATOR_HPP
#define BIAS_CALIBRATOR_HPP

#include "config.h"
#include "types.h"

#include <cstdint>

class Bias_Calibrator {
public:
    /* Open the window at now_ms. Discards anything accumulated before. */
    void start(uint32_t now_ms, uint32_t window_ms = CALIB_WINDOW_MS);

    /*
     * Accumulate one sample. Samples outside the window or with NaN/Inf
     * components are not counted (the latter increment rejected_count).
     * @return true if the sample contributed to the mean
     */
    bool add_sample(const RawSample &raw, uint32_t now_ms);

    /* true once now_ms is at or past the end of the window */
    bool window_elapsed(uint32_t now_ms) const;

    /*
     * Close the window and compute the bias. Mean is over received samples,
     * not time-integrated, so irregular spacing does not skew it.
     * Zero samples -> Failed / BridgeError::InsufficientData.
     */
    CalibrationResult finish();

    bool started() const { return started_; }
    bool closed() const { return closed_; }
    uint32_t sample_count() const { return count_; }

private:
    double sum_roll_ = 0.0;
    double sum_pitch_ = 0.0;
    uint32_t count_ = 0;
    uint32_t rejected_ = 0;
    uint32_t start_ms_ = 0;
    uint32_t window_ms_ = CALIB_WINDOW_MS;
    bool started_ = false;
    bool closed_ = false;
};

#endif // BIAS_CALIBRATOR_HPP
