/*
 * Core Type Definitions for the Tilt Bridge
 * Samples, bias, command pairs, configuration, and error taxonomy
 */

#ifndef BRIDGE_TYPES_H
#define BRIDGE_TYPES_H

#include <cstdint>

/*============================================================================
 * Sensor Data Types
 *============================================================================*/

/* One tilt notification in sensor-native units (no assumed range) */
struct RawSample {
    float roll;
    float pitch;
};

/* Zero reference, fixed for the session once calibration succeeds */
struct Bias {
    float roll_bias;
    float pitch_bias;
};

/* Exponentially smoothed, bias-centered axes */
struct FilterState {
    float ema_x = 0.0f;   /* roll -> steer */
    float ema_z = 0.0f;   /* pitch -> throttle */
};

/*============================================================================
 * Command Output
 *============================================================================
 * Both components are in [-1.0, +1.0] and never NaN. Only the most recent
 * pair is ever read; there is no command history.
 */
struct CommandPair {
    float throttle;
    float steer;
};

static constexpr CommandPair NEUTRAL_COMMAND = {0.0f, 0.0f};

/*============================================================================
 * Configuration
 *============================================================================
 * Read-only after startup validation.
 */
struct BridgeConfig {
    float x_scale;
    float z_scale;
    float deadzone;
    float expo;
    bool invert_x;
    bool invert_z;
};

/*============================================================================
 * Error Taxonomy
 *============================================================================*/
enum class BridgeError : uint8_t {
    None,
    InsufficientData,       /* Calibration window saw no samples - fatal */
    TransportWriteFailed,   /* One tick's write lost - counted, not fatal */
    NonFiniteSample,        /* NaN/Inf sample discarded */
    ConfigurationInvalid    /* Fatal before any ticking */
};

inline const char *bridge_error_name(BridgeError err) {
    switch (err) {
        case BridgeError::None:                 return "None";
        case BridgeError::InsufficientData:     return "InsufficientData";
        case BridgeError::TransportWriteFailed: return "TransportWriteFailed";
        case BridgeError::NonFiniteSample:      return "NonFiniteSample";
        case BridgeError::ConfigurationInvalid: return "ConfigurationInvalid";
    }
    return "Unknown";
}

/*============================================================================
 * Calibration Types
 *============================================================================*/
static constexpr uint8_t CALIB_MAX_ERROR_LEN = 64;

enum class CalibrationStatus : uint8_t { NotRun, Success, Failed };

struct CalibrationResult {
    CalibrationStatus status = CalibrationStatus::NotRun;
    BridgeError error = BridgeError::None;
    Bias bias = {0.0f, 0.0f};
    uint32_t sample_count = 0;
    uint32_t rejected_count = 0;
    char error_msg[CALIB_MAX_ERROR_LEN] = {};

    bool ok() const { return status == CalibrationStatus::Success; }
};

#endif /* BRIDGE_TYPES_H */
