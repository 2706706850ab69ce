/*
 * Signal_Conditioner - Raw tilt -> bounded CommandPair state machine
 * Bias centering, EMA smoothing, deadzone/expo shaping, axis inversion
 *
 * Not thread-safe. Bridge_Core owns the single instance and serializes
 * access between the notification and tick threads.
 */

#ifndef SIGNAL_CONDITIONER_HPP
#define SIGNAL_CONDITIONER_HPP

#include "types.h"

#include <cstdint>

/*============================================================================
 * Conditioner Phase
 *============================================================================
 * Strictly one-way: Uncalibrated -> Calibrating -> Active. Nothing moves a
 * conditioner backwards; a transport disconnect keeps the session's bias.
 */
enum class ConditionerPhase : uint8_t { Uncalibrated, Calibrating, Active };

const char *conditioner_phase_name(ConditionerPhase phase);

enum class UpdateStatus : uint8_t {
    Applied,     /* FilterState and output updated */
    NonFinite,   /* Sample had NaN/Inf - discarded, state unchanged */
    NotActive    /* Called outside Active - discarded, state unchanged */
};

class Signal_Conditioner {
public:
    explicit Signal_Conditioner(const BridgeConfig &cfg);

    /* Uncalibrated -> Calibrating. Returns false from any other phase. */
    bool begin_calibration();

    /* Calibrating -> Active with the session bias. Resets FilterState to 0. */
    bool activate(const Bias &bias);

    /*
     * Run one sample through centering, smoothing and shaping.
     * Finite samples beyond +/-COND_RAW_LIMIT are clamped first so no
     * intermediate can overflow.
     */
    UpdateStatus update(const RawSample &raw);

    /* Latest output; NEUTRAL_COMMAND until the first applied sample */
    CommandPair output() const { return output_; }

    ConditionerPhase phase() const { return phase_; }
    const FilterState &filter() const { return filter_; }
    const Bias &bias() const { return bias_; }
    const BridgeConfig &config() const { return cfg_; }

private:
    BridgeConfig cfg_;
    ConditionerPhase phase_ = ConditionerPhase::Uncalibrated;
    Bias bias_ = {0.0f, 0.0f};
    FilterState filter_ = {};
    CommandPair output_ = NEUTRAL_COMMAND;
};

#endif // SIGNAL_CONDITIONER_HPP
