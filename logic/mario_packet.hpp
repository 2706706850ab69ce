/*
 * LEGO Mario Notification Decoding - Pure Algorithms (no OS dependencies)
 * Text hex dump -> bytes -> RawSample
 */

#ifndef MARIO_PACKET_HPP
#define MARIO_PACKET_HPP

#include "types.h"

#include <cstddef>
#include <cstdint>

/*
 * Decode an IMU notification.
 * Accepted when len >= 7 and data[0] == 0x07. Byte 4 is the x tilt and
 * byte 6 the z tilt, both int8. Forward tilt on the figure is negative z,
 * so pitch = -z makes forward tilt positive throttle.
 *
 * @return true and fills out for an IMU packet; false for anything else
 */
bool mario_decode_imu(const uint8_t *data, size_t len, RawSample *out);

/* Two's complement view of one notification byte */
int8_t mario_signed_byte(uint8_t b);

/*
 * Parse one line of a notification dump into bytes.
 * Accepts "07 00 45 00 fe 01 12", "07004500fe0112", and the gatttool
 * form "Notification handle = 0x000e value: 07 00 45 ...". Trailing
 * whitespace/CR/LF is ignored.
 *
 * @return Number of bytes written to out, 0 if the line is empty, malformed,
 *         or longer than cap
 */
size_t hex_parse_packet(const char *line, uint8_t *out, size_t cap);

#endif // MARIO_PACKET_HPP
