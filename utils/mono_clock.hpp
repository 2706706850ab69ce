/*
 * Monotonic Clock Helpers - steady_clock in the units the bridge logic uses
 */

#ifndef MONO_CLOCK_HPP
#define MONO_CLOCK_HPP

#include <cstdint>

/* Milliseconds since the first call in this process (wraps after ~49 days) */
uint32_t mono_now_ms();

/* Microseconds since the first call in this process */
uint64_t mono_now_us();

#endif // MONO_CLOCK_HPP
