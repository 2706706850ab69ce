/*
 * Bridge Configuration - defaults from config.h and startup validation
 */

#ifndef BRIDGE_CONFIG_HPP
#define BRIDGE_CONFIG_HPP

#include "types.h"

#include <cstddef>

/* Configuration populated from the COND_DEFAULT_* constants */
BridgeConfig bridge_config_defaults();

/*
 * Check every field against its allowed range:
 *   x_scale, z_scale  finite and > 0
 *   deadzone          finite and in [0, 1)
 *   expo              finite and >= 1
 *
 * @param cfg       Configuration to check
 * @param reason    Optional buffer for a one-line description of the first violation
 * @param reason_len Size of reason in bytes
 * @return BridgeError::None or BridgeError::ConfigurationInvalid
 */
BridgeError bridge_config_validate(const BridgeConfig &cfg, char *reason,
                                   size_t reason_len);

#endif // BRIDGE_CONFIG_HPP
