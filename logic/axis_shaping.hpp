/*
 * Axis Shaping Math - Pure Algorithms (no OS dependencies)
 * Normalization, continuous deadzone, expo curve, sign inversion
 */

#ifndef AXIS_SHAPING_HPP
#define AXIS_SHAPING_HPP

/*
 * Clamp v to [lo, hi]. NaN maps to 0.0 so it can never leave this function.
 */
float shape_clamp(float v, float lo, float hi);

/* Shorthand for shape_clamp(v, -1.0f, 1.0f) */
float shape_clamp_unit(float v);

/*
 * Normalize a bias-centered, smoothed value against its full-scale tilt.
 * Returns clamp(v / scale, -1, 1). scale must be > 0.
 */
float shape_normalize(float v, float scale);

/*
 * Continuous deadzone on a normalized value in [-1, 1].
 * |v| < deadzone -> 0, otherwise the remaining range is rescaled to [0, 1]
 * so the output starts from 0 at the boundary (no step).
 */
float shape_deadzone(float v, float deadzone);

/*
 * Expo curve: sign(v) * |v|^expo. For |v| <= 1 and expo >= 1 the magnitude
 * never grows, so the [-1, 1] bound is preserved.
 */
float shape_expo(float v, float expo);

/*
 * Full pipeline for one axis after filtering:
 * normalize -> deadzone -> expo -> optional inversion.
 */
float shape_axis(float ema, float scale, float deadzone, float expo, bool invert);

#endif // AXIS_SHAPING_HPP
