/*
 * LEGO Mario Notification Decoding Implementation
 */

#include "logic/mario_packet.hpp"
#include "config.h"

#include <cstring>

int8_t mario_signed_byte(uint8_t b) {
    return (b > 127U) ? static_cast<int8_t>(static_cast<int>(b) - 256)
                      : static_cast<int8_t>(b);
}

bool mario_decode_imu(const uint8_t *data, size_t len, RawSample *out) {
    if (data == nullptr || out == nullptr) {
        return false;
    }
    if (len < MARIO_IMU_MIN_LEN || data[0] != MARIO_IMU_HEADER) {
        return false;
    }

    float x = static_cast<float>(mario_signed_byte(data[MARIO_IMU_X_INDEX]));
    float z = static_cast<float>(mario_signed_byte(data[MARIO_IMU_Z_INDEX]));

    out->roll = x;
    out->pitch = -z;
    return true;
}

static int hex_nibble(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

static bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

size_t hex_parse_packet(const char *line, uint8_t *out, size_t cap) {
    if (line == nullptr || out == nullptr || cap == 0) {
        return 0;
    }

    /* gatttool prefix: keep only what follows "value:" */
    const char *p = strstr(line, "value:");
    p = (p != nullptr) ? p + strlen("value:") : line;

    size_t count = 0;
    int high = -1;   /* pending high nibble, -1 if none */

    for (; *p != '\0'; ++p) {
        if (is_space(*p)) {
            if (high >= 0) {
                return 0;   /* odd digit count inside a token */
            }
            continue;
        }
        int nib = hex_nibble(*p);
        if (nib < 0) {
            return 0;
        }
        if (high < 0) {
            high = nib;
            continue;
        }
        if (count >= cap) {
            return 0;
        }
        out[count++] = static_cast<uint8_t>((high << 4) | nib);
        high = -1;
    }

    if (high >= 0) {
        return 0;
    }
    return count;
}
