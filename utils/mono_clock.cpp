/*
 * Monotonic Clock Implementation
 */

#include "utils/mono_clock.hpp"

#include <chrono>

static std::chrono::steady_clock::time_point process_epoch() {
    static const std::chrono::steady_clock::time_point epoch =
        std::chrono::steady_clock::now();
    return epoch;
}

uint64_t mono_now_us() {
    auto elapsed = std::chrono::steady_clock::now() - process_epoch();
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::microseconds>(elapsed).count());
}

uint32_t mono_now_ms() {
    return static_cast<uint32_t>(mono_now_us() / 1000U);
}
