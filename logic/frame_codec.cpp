/*
 * Frame Codec Implementation
 */

#include "logic/frame_codec.hpp"
#include "logic/axis_shaping.hpp"
#include "config.h"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>

/* Round to the printed precision first so a value that prints as zero is +0 */
static float wire_value(float v) {
    v = shape_clamp_unit(v);
    float scale = powf(10.0f, static_cast<float>(FRAME_DECIMALS));
    float rounded = roundf(v * scale) / scale;
    if (rounded == 0.0f) {
        return 0.0f;
    }
    return rounded;
}

size_t frame_encode(const CommandPair &cmd, char *buf, size_t buf_len) {
    if (buf == nullptr || buf_len == 0) {
        return 0;
    }

    int n = snprintf(buf, buf_len, "%.*f,%.*f%c\n",
                     static_cast<int>(FRAME_DECIMALS),
                     static_cast<double>(wire_value(cmd.throttle)),
                     static_cast<int>(FRAME_DECIMALS),
                     static_cast<double>(wire_value(cmd.steer)),
                     FRAME_TERMINATOR);
    if (n < 0 || static_cast<size_t>(n) >= buf_len) {
        buf[0] = '\0';
        return 0;
    }
    return static_cast<size_t>(n);
}

/* Parse [begin, end) as one float with nothing left over */
static bool parse_field(const char *begin, const char *end, float *out) {
    char tmp[FRAME_MAX_LEN];
    size_t len = static_cast<size_t>(end - begin);
    if (len == 0 || len >= sizeof(tmp)) {
        return false;
    }
    memcpy(tmp, begin, len);
    tmp[len] = '\0';

    char *parse_end = nullptr;
    float v = strtof(tmp, &parse_end);
    if (parse_end != tmp + len || !std::isfinite(v)) {
        return false;
    }
    *out = v;
    return true;
}

bool frame_decode(const char *line, size_t len, CommandPair *out) {
    if (line == nullptr || out == nullptr) {
        return false;
    }

    /* Strip one trailing newline, then require the colon */
    if (len > 0 && line[len - 1] == '\n') {
        len--;
    }
    if (len == 0 || line[len - 1] != FRAME_TERMINATOR) {
        return false;
    }
    const char *end = line + len - 1;

    const char *comma = static_cast<const char *>(memchr(line, ',', static_cast<size_t>(end - line)));
    if (comma == nullptr) {
        return false;
    }

    CommandPair parsed = {};
    if (!parse_field(line, comma, &parsed.throttle) ||
        !parse_field(comma + 1, end, &parsed.steer)) {
        return false;
    }
    *out = parsed;
    return true;
}

WheelMix mix_differential(const CommandPair &cmd) {
    WheelMix mix = {};
    mix.left = shape_clamp((cmd.throttle + cmd.steer) * 100.0f, -100.0f, 100.0f);
    mix.right = shape_clamp((cmd.throttle - cmd.steer) * 100.0f, -100.0f, 100.0f);
    return mix;
}
