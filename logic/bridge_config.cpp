/*
 * Bridge Configuration Implementation
 */

#include "logic/bridge_config.hpp"
#include "config.h"

#include <cmath>
#include <cstdio>

BridgeConfig bridge_config_defaults() {
    BridgeConfig cfg = {};
    cfg.x_scale = COND_DEFAULT_X_SCALE;
    cfg.z_scale = COND_DEFAULT_Z_SCALE;
    cfg.deadzone = COND_DEFAULT_DEADZONE;
    cfg.expo = COND_DEFAULT_EXPO;
    cfg.invert_x = COND_DEFAULT_INVERT_X;
    cfg.invert_z = COND_DEFAULT_INVERT_Z;
    return cfg;
}

static BridgeError reject(char *reason, size_t reason_len, const char *field, float value,
                          const char *rule) {
    if (reason != nullptr && reason_len > 0) {
        snprintf(reason, reason_len, "%s=%g must be %s", field,
                 static_cast<double>(value), rule);
    }
    return BridgeError::ConfigurationInvalid;
}

BridgeError bridge_config_validate(const BridgeConfig &cfg, char *reason,
                                   size_t reason_len) {
    /* Negated comparisons so NaN fails every check */
    if (!std::isfinite(cfg.x_scale) || !(cfg.x_scale > 0.0f)) {
        return reject(reason, reason_len, "x_scale", cfg.x_scale, "finite and > 0");
    }
    if (!std::isfinite(cfg.z_scale) || !(cfg.z_scale > 0.0f)) {
        return reject(reason, reason_len, "z_scale", cfg.z_scale, "finite and > 0");
    }
    if (!std::isfinite(cfg.deadzone) || !(cfg.deadzone >= 0.0f) || !(cfg.deadzone < 1.0f)) {
        return reject(reason, reason_len, "deadzone", cfg.deadzone, "in [0, 1)");
    }
    if (!std::isfinite(cfg.expo) || !(cfg.expo >= 1.0f)) {
        return reject(reason, reason_len, "expo", cfg.expo, "finite and >= 1");
    }

    if (reason != nullptr && reason_len > 0) {
        reason[0] = '\0';
    }
    return BridgeError::None;
}
