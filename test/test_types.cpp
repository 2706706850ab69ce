/*
 * Unit tests for error naming and CalibrationResult defaults in types.h
 */

#include <gtest/gtest.h>
#include "types.h"

// ============================================================================
// Test Suite: BridgeErrorName
// ============================================================================

TEST(BridgeErrorName, AllErrorsNamed) {
    EXPECT_STREQ(bridge_error_name(BridgeError::None), "None");
    EXPECT_STREQ(bridge_error_name(BridgeError::InsufficientData), "InsufficientData");
    EXPECT_STREQ(bridge_error_name(BridgeError::TransportWriteFailed), "TransportWriteFailed");
    EXPECT_STREQ(bridge_error_name(BridgeError::NonFiniteSample), "NonFiniteSample");
    EXPECT_STREQ(bridge_error_name(BridgeError::ConfigurationInvalid), "ConfigurationInvalid");
}

TEST(BridgeErrorName, OutOfRangeValueIsUnknown) {
    EXPECT_STREQ(bridge_error_name(static_cast<BridgeError>(200)), "Unknown");
}

// ============================================================================
// Test Suite: CalibrationResultState
// ============================================================================

TEST(CalibrationResultState, DefaultIsNotRun) {
    CalibrationResult r;
    EXPECT_EQ(r.status, CalibrationStatus::NotRun);
    EXPECT_EQ(r.error, BridgeError::None);
    EXPECT_FALSE(r.ok());
    EXPECT_EQ(r.sample_count, 0U);
    EXPECT_EQ(r.rejected_count, 0U);
    EXPECT_STREQ(r.error_msg, "");
    EXPECT_FLOAT_EQ(r.bias.roll_bias, 0.0f);
    EXPECT_FLOAT_EQ(r.bias.pitch_bias, 0.0f);
}

TEST(CalibrationResultState, OkOnlyOnSuccess) {
    CalibrationResult r;
    r.status = CalibrationStatus::Failed;
    EXPECT_FALSE(r.ok());
    r.status = CalibrationStatus::Success;
    EXPECT_TRUE(r.ok());
}

TEST(NeutralCommand, IsZeroZero) {
    EXPECT_FLOAT_EQ(NEUTRAL_COMMAND.throttle, 0.0f);
    EXPECT_FLOAT_EQ(NEUTRAL_COMMAND.steer, 0.0f);
}
