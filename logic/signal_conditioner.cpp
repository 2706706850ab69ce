/*
 * Signal_Conditioner Implementation
 */

#include "logic/signal_conditioner.hpp"
#include "logic/axis_shaping.hpp"
#include "config.h"

#include <cmath>

const char *conditioner_phase_name(ConditionerPhase phase) {
    switch (phase) {
        case ConditionerPhase::Uncalibrated: return "Uncalibrated";
        case ConditionerPhase::Calibrating:  return "Calibrating";
        case ConditionerPhase::Active:       return "Active";
    }
    return "Unknown";
}

Signal_Conditioner::Signal_Conditioner(const BridgeConfig &cfg) : cfg_(cfg) {}

bool Signal_Conditioner::begin_calibration() {
    if (phase_ != ConditionerPhase::Uncalibrated) {
        return false;
    }
    phase_ = ConditionerPhase::Calibrating;
    return true;
}

bool Signal_Conditioner::activate(const Bias &bias) {
    if (phase_ != ConditionerPhase::Calibrating) {
        return false;
    }
    if (!std::isfinite(bias.roll_bias) || !std::isfinite(bias.pitch_bias)) {
        return false;
    }
    bias_ = bias;
    filter_ = {};
    output_ = NEUTRAL_COMMAND;
    phase_ = ConditionerPhase::Active;
    return true;
}

UpdateStatus Signal_Conditioner::update(const RawSample &raw) {
    if (phase_ != ConditionerPhase::Active) {
        return UpdateStatus::NotActive;
    }
    if (!std::isfinite(raw.roll) || !std::isfinite(raw.pitch)) {
        return UpdateStatus::NonFinite;
    }

    /* 1. Center (after bounding the sensor-native value) */
    float cx = shape_clamp(raw.roll, -COND_RAW_LIMIT, COND_RAW_LIMIT) - bias_.roll_bias;
    float cz = shape_clamp(raw.pitch, -COND_RAW_LIMIT, COND_RAW_LIMIT) - bias_.pitch_bias;

    /* 2. EMA */
    constexpr float a = COND_EMA_ALPHA;
    filter_.ema_x = a * cx + (1.0f - a) * filter_.ema_x;
    filter_.ema_z = a * cz + (1.0f - a) * filter_.ema_z;

    /* 3-6. Normalize, deadzone, expo, invert */
    output_.steer = shape_axis(filter_.ema_x, cfg_.x_scale, cfg_.deadzone, cfg_.expo,
                               cfg_.invert_x);
    output_.throttle = shape_axis(filter_.ema_z, cfg_.z_scale, cfg_.deadzone, cfg_.expo,
                                  cfg_.invert_z);
    return UpdateStatus::Applied;
}
