/*
 * Bias_Calibrator Implementation
 */

#include "logic/bias_calibrator.hpp"
#include "logic/axis_shaping.hpp"

#include <cmath>
#include <cstdio>

void Bias_Calibrator::start(uint32_t now_ms, uint32_t window_ms) {
    sum_roll_ = 0.0;
    sum_pitch_ = 0.0;
    count_ = 0;
    rejected_ = 0;
    start_ms_ = now_ms;
    window_ms_ = window_ms;
    started_ = true;
    closed_ = false;
}

bool Bias_Calibrator::add_sample(const RawSample &raw, uint32_t now_ms) {
    if (!started_ || closed_ || window_elapsed(now_ms)) {
        return false;
    }
    if (!std::isfinite(raw.roll) || !std::isfinite(raw.pitch)) {
        if (rejected_ < UINT32_MAX) {
            rejected_++;
        }
        return false;
    }

    /* Same bound the conditioner applies, so bias and samples share a range */
    sum_roll_ += static_cast<double>(shape_clamp(raw.roll, -COND_RAW_LIMIT, COND_RAW_LIMIT));
    sum_pitch_ += static_cast<double>(shape_clamp(raw.pitch, -COND_RAW_LIMIT, COND_RAW_LIMIT));
    count_++;
    return true;
}

bool Bias_Calibrator::window_elapsed(uint32_t now_ms) const {
    /* Unsigned subtraction handles wrap */
    return (now_ms - start_ms_) >= window_ms_;
}

CalibrationResult Bias_Calibrator::finish() {
    CalibrationResult result = {};
    closed_ = true;
    result.sample_count = count_;
    result.rejected_count = rejected_;

    if (!started_ || count_ == 0U) {
        result.status = CalibrationStatus::Failed;
        result.error = BridgeError::InsufficientData;
        snprintf(result.error_msg, sizeof(result.error_msg),
                 "No samples in %lu ms window (%lu rejected)",
                 static_cast<unsigned long>(window_ms_),
                 static_cast<unsigned long>(rejected_));
        return result;
    }

    result.bias.roll_bias = static_cast<float>(sum_roll_ / count_);
    result.bias.pitch_bias = static_cast<float>(sum_pitch_ / count_);
    result.status = CalibrationStatus::Success;
    return result;
}
