/*
 * Frame Codec - CommandPair <-> "<throttle>,<steer>:\n" wire line
 * Encoder for the emission path; decoder and differential mix mirror the
 * actuator side for self-checks and tests
 */

#ifndef FRAME_CODEC_HPP
#define FRAME_CODEC_HPP

#include "types.h"

#include <cstddef>

/*
 * Format cmd as "%.2f,%.2f:\n" (throttle first).
 * Values are clamped to [-1, 1] and NaN is sent as 0 regardless of what the
 * caller guarantees. Values that round to zero are written as "0.00" (never
 * "-0.00").
 *
 * @return Number of characters written (excluding NUL), 0 if buf is too small
 */
size_t frame_encode(const CommandPair &cmd, char *buf, size_t buf_len);

/*
 * Parse one received line the way the actuator does: the colon terminator
 * must be present (a trailing '\n' after it is allowed), fields split on
 * the comma, both parse fully as finite floats.
 *
 * @return true and fills out on success; out untouched on failure
 */
bool frame_decode(const char *line, size_t len, CommandPair *out);

/* Motor output in percent, each in [-100, 100] */
struct WheelMix {
    float left;
    float right;
};

/*
 * Actuator-side differential mix:
 *   left  = clamp((throttle + steer) * 100, -100, 100)
 *   right = clamp((throttle - steer) * 100, -100, 100)
 */
WheelMix mix_differential(const CommandPair &cmd);

#endif // FRAME_CODEC_HPP
