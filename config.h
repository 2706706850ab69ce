/*
 * Build-time Configuration for the Tilt Bridge
 * Timing, calibration, shaping defaults, and transport limits
 */

#ifndef BRIDGE_CONFIG_H
#define BRIDGE_CONFIG_H

/*============================================================================
 * System Timing
 *============================================================================*/
#define BRIDGE_TICK_PERIOD_MS           100U     /* 10Hz command emission */
#define BRIDGE_HEARTBEAT_INTERVAL_MS    5000U    /* Status line cadence */
#define BRIDGE_MAIN_LOOP_SLEEP_MS       50U      /* Shutdown-flag poll interval */

/*============================================================================
 * Calibration Constants
 *============================================================================*/
#define CALIB_WINDOW_MS                 500U     /* Hold-still window for bias */
#define CALIB_SETTLE_MS                 300U     /* Wait after subscribe before window */

/*============================================================================
 * Signal Conditioning
 *============================================================================*/
#define COND_EMA_ALPHA                  0.20f    /* Settles within ~3 tick periods at 50Hz input */
#define COND_RAW_LIMIT                  1.0e6f   /* Finite raw input clamp (sensor-native units) */

/* Shaping defaults (user-facing feel) */
#define COND_DEFAULT_X_SCALE            30.0f    /* Steering: bigger = less sensitive */
#define COND_DEFAULT_Z_SCALE            30.0f    /* Throttle: bigger = less sensitive */
#define COND_DEFAULT_DEADZONE           0.10f    /* Fraction of full scale */
#define COND_DEFAULT_EXPO               1.4f     /* 1.0 = linear, >1 = soft center */
#define COND_DEFAULT_INVERT_X           false
#define COND_DEFAULT_INVERT_Z           false

/*============================================================================
 * Wire Frame
 *============================================================================*/
#define FRAME_DECIMALS                  2U       /* "%.2f,%.2f:\n" */
#define FRAME_MAX_LEN                   32U      /* "-1.00,-1.00:\n" + NUL fits easily */
#define FRAME_TERMINATOR                ':'

/*============================================================================
 * Transport (write-line side)
 *============================================================================*/
#define TX_WRITE_TIMEOUT_MS             40U      /* Must stay below BRIDGE_TICK_PERIOD_MS */
#define TX_RECOVERY_INTERVAL_MS         1000U    /* Reopen attempt cadence while failing */
#define TX_SERIAL_BAUD                  115200U  /* micro:bit USB serial default */

/*============================================================================
 * Notification Source (sensor side)
 *============================================================================*/
#define SRC_POLL_TIMEOUT_MS             100U     /* Reader wakeup for stop() */
#define SRC_MAX_LINE_LEN                256U
#define SRC_MAX_PACKET_LEN              64U

/* LEGO Mario IMU notification layout */
#define MARIO_IMU_HEADER                0x07U
#define MARIO_IMU_MIN_LEN               7U
#define MARIO_IMU_X_INDEX               4U
#define MARIO_IMU_Z_INDEX               6U

#endif /* BRIDGE_CONFIG_H */
