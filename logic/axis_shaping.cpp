/*
 * Axis Shaping Implementation
 */

#include "logic/axis_shaping.hpp"

#include <cmath>

float shape_clamp(float v, float lo, float hi) {
    if (std::isnan(v)) {
        return 0.0f;
    }
    if (v > hi) {
        return hi;
    }
    if (v < lo) {
        return lo;
    }
    return v;
}

float shape_clamp_unit(float v) {
    return shape_clamp(v, -1.0f, 1.0f);
}

float shape_normalize(float v, float scale) {
    return shape_clamp_unit(v / scale);
}

float shape_deadzone(float v, float deadzone) {
    float mag = fabsf(v);
    if (mag < deadzone) {
        return 0.0f;
    }
    float rescaled = (mag - deadzone) / (1.0f - deadzone);
    return (v < 0.0f) ? -rescaled : rescaled;
}

float shape_expo(float v, float expo) {
    if (v == 0.0f) {
        return 0.0f;
    }
    float mag = powf(fabsf(v), expo);
    return (v < 0.0f) ? -mag : mag;
}

float shape_axis(float ema, float scale, float deadzone, float expo, bool invert) {
    float v = shape_normalize(ema, scale);
    v = shape_deadzone(v, deadzone);
    v = shape_expo(v, expo);

    /* Re-clamp: powf rounding must not push |v| past 1 */
    v = shape_clamp_unit(v);
    return invert ? -v : v;
}
