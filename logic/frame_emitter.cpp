/*
 * Frame_Emitter Implementation
 */

#include "logic/frame_emitter.hpp"
#include "logic/frame_codec.hpp"

#include <cstdio>

Frame_Emitter::Frame_Emitter(Line_Transport &transport, Status_Reporter &reporter,
                             uint32_t recovery_interval_ms)
    : transport_(transport), reporter_(reporter),
      recovery_interval_ms_(recovery_interval_ms) {}

BridgeError Frame_Emitter::emit(const CommandPair &cmd, uint32_t now_ms) {
    char line[FRAME_MAX_LEN];
    size_t len = frame_encode(cmd, line, sizeof(line));

    uint32_t streak;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        streak = stats_.consecutive_failures;
    }

    if (streak > 0U && (now_ms - last_recovery_ms_) >= recovery_interval_ms_) {
        last_recovery_ms_ = now_ms;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stats_.recovery_attempts < UINT32_MAX) {
                stats_.recovery_attempts++;
            }
        }
        if (transport_.try_recovery()) {
            reporter_.show_status("TX", "Transport reopened");
        }
    }

    bool ok = (len > 0U) && transport_.write_line(line, len);

    /* Reports are formatted under the lock and delivered after it is released */
    char buf[80];
    bool failure_edge = false;
    bool recovered = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!ok) {
            if (stats_.write_failures < UINT32_MAX) {
                stats_.write_failures++;
            }
            if (stats_.consecutive_failures < UINT32_MAX) {
                stats_.consecutive_failures++;
            }
            /* Report the edge only; the heartbeat carries the running count */
            failure_edge = (stats_.consecutive_failures == 1U);
        } else {
            if (stats_.consecutive_failures > 0U) {
                snprintf(buf, sizeof(buf), "Recovered after %lu failed writes",
                         static_cast<unsigned long>(stats_.consecutive_failures));
                recovered = true;
                stats_.consecutive_failures = 0;
            }
            if (stats_.frames_sent < UINT32_MAX) {
                stats_.frames_sent++;
            }
            stats_.last_sent = cmd;
        }
    }

    if (!ok) {
        if (failure_edge) {
            last_recovery_ms_ = now_ms;
            reporter_.show_error("TX", "Write failed - dropping frames until transport recovers",
                                 StatusSeverity::Warning);
        }
        return BridgeError::TransportWriteFailed;
    }
    if (recovered) {
        reporter_.show_status("TX", buf);
    }
    return BridgeError::None;
}

EmitterStats Frame_Emitter::get_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}
