/*
 * Frame_Emitter - Encode the latest CommandPair and hand it to the transport
 * One attempt per tick: a failed write is counted and reported, never retried
 */

#ifndef FRAME_EMITTER_HPP
#define FRAME_EMITTER_HPP

#include "config.h"
#include "types.h"
#include "utils/status_reporter.hpp"
#include "utils/transport_interface.hpp"

#include <cstdint>
#include <mutex>

/*============================================================================
 * Emitter Statistics
 *============================================================================*/
struct EmitterStats {
    uint32_t frames_sent;            /* Lines accepted by the transport */
    uint32_t write_failures;         /* TransportWriteFailed count */
    uint32_t consecutive_failures;   /* Current failure streak (0 when healthy) */
    uint32_t recovery_attempts;      /* try_recovery() calls while failing */
    CommandPair last_sent;           /* Last command the transport accepted */
};

class Frame_Emitter {
public:
    Frame_Emitter(Line_Transport &transport, Status_Reporter &reporter,
                  uint32_t recovery_interval_ms = TX_RECOVERY_INTERVAL_MS);

    Frame_Emitter(const Frame_Emitter &) = delete;
    Frame_Emitter &operator=(const Frame_Emitter &) = delete;

    /*
     * Encode and write one frame.
     * While failing, asks the transport to recover at most once per
     * recovery interval before attempting the write.
     *
     * @param cmd     Latest command (clamped again by the encoder)
     * @param now_ms  Monotonic timestamp for recovery pacing
     * @return BridgeError::None or BridgeError::TransportWriteFailed
     */
    BridgeError emit(const CommandPair &cmd, uint32_t now_ms);

    EmitterStats get_stats() const;

private:
    Line_Transport &transport_;
    Status_Reporter &reporter_;
    uint32_t recovery_interval_ms_;
    uint32_t last_recovery_ms_ = 0;

    mutable std::mutex mutex_;
    EmitterStats stats_ = {};
};

#endif // FRAME_EMITTER_HPP
