/*
 * Bias_Calibrator Unit Tests
 * Window bounding, count-weighted mean, InsufficientData
 */

#include "logic/bias_calibrator.hpp"
#include <gtest/gtest.h>
#include <cstring>
#include <limits>

class BiasCalibratorTest : public ::testing::Test {
protected:
    Bias_Calibrator cal;
    static constexpr uint32_t WINDOW_MS = 500;
};

TEST_F(BiasCalibratorTest, MeanOfFiveIdenticalSamples) {
    cal.start(1000, WINDOW_MS);
    for (uint32_t i = 0; i < 5; ++i) {
        EXPECT_TRUE(cal.add_sample({10.0f, -5.0f}, 1000 + i * 100));
    }

    CalibrationResult r = cal.finish();
    EXPECT_TRUE(r.ok());
    EXPECT_EQ(r.error, BridgeError::None);
    EXPECT_EQ(r.sample_count, 5U);
    EXPECT_FLOAT_EQ(r.bias.roll_bias, 10.0f);
    EXPECT_FLOAT_EQ(r.bias.pitch_bias, -5.0f);
}

TEST_F(BiasCalibratorTest, WeightedBySampleCountNotTime) {
    /* Three quick samples at 0, then one late sample at 30: mean is 7.5,
     * a time-weighted average would be dominated by the long gap. */
    cal.start(0, WINDOW_MS);
    cal.add_sample({0.0f, 0.0f}, 0);
    cal.add_sample({0.0f, 0.0f}, 1);
    cal.add_sample({0.0f, 0.0f}, 2);
    cal.add_sample({30.0f, -30.0f}, 400);

    CalibrationResult r = cal.finish();
    ASSERT_TRUE(r.ok());
    EXPECT_FLOAT_EQ(r.bias.roll_bias, 7.5f);
    EXPECT_FLOAT_EQ(r.bias.pitch_bias, -7.5f);
}

TEST_F(BiasCalibratorTest, NoSamplesIsInsufficientData) {
    cal.start(0, WINDOW_MS);
    CalibrationResult r = cal.finish();

    EXPECT_FALSE(r.ok());
    EXPECT_EQ(r.status, CalibrationStatus::Failed);
    EXPECT_EQ(r.error, BridgeError::InsufficientData);
    EXPECT_EQ(r.sample_count, 0U);
    EXPECT_GT(strlen(r.error_msg), 0U);
}

TEST_F(BiasCalibratorTest, FinishWithoutStartFails) {
    CalibrationResult r = cal.finish();
    EXPECT_EQ(r.error, BridgeError::InsufficientData);
}

TEST_F(BiasCalibratorTest, SamplesAfterWindowAreNotCounted) {
    cal.start(100, WINDOW_MS);
    EXPECT_TRUE(cal.add_sample({2.0f, 2.0f}, 599));
    EXPECT_FALSE(cal.add_sample({100.0f, 100.0f}, 600));   /* window closed */
    EXPECT_TRUE(cal.window_elapsed(600));
    EXPECT_FALSE(cal.window_elapsed(599));

    CalibrationResult r = cal.finish();
    EXPECT_EQ(r.sample_count, 1U);
    EXPECT_FLOAT_EQ(r.bias.roll_bias, 2.0f);
}

TEST_F(BiasCalibratorTest, NonFiniteSamplesRejectedAndCounted) {
    const float nan = std::numeric_limits<float>::quiet_NaN();
    const float inf = std::numeric_limits<float>::infinity();

    cal.start(0, WINDOW_MS);
    EXPECT_FALSE(cal.add_sample({nan, 0.0f}, 10));
    EXPECT_FALSE(cal.add_sample({0.0f, inf}, 20));
    EXPECT_TRUE(cal.add_sample({4.0f, 6.0f}, 30));

    CalibrationResult r = cal.finish();
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.sample_count, 1U);
    EXPECT_EQ(r.rejected_count, 2U);
    EXPECT_FLOAT_EQ(r.bias.roll_bias, 4.0f);
    EXPECT_FLOAT_EQ(r.bias.pitch_bias, 6.0f);
}

TEST_F(BiasCalibratorTest, OnlyNonFiniteSamplesIsInsufficientData) {
    cal.start(0, WINDOW_MS);
    cal.add_sample({std::numeric_limits<float>::quiet_NaN(), 0.0f}, 10);

    CalibrationResult r = cal.finish();
    EXPECT_EQ(r.error, BridgeError::InsufficientData);
    EXPECT_EQ(r.rejected_count, 1U);
}

TEST_F(BiasCalibratorTest, SampleBeforeStartIgnored) {
    EXPECT_FALSE(cal.add_sample({1.0f, 1.0f}, 0));
    EXPECT_FALSE(cal.started());
}

TEST_F(BiasCalibratorTest, NoSamplesAfterFinish) {
    cal.start(0, WINDOW_MS);
    cal.add_sample({1.0f, 1.0f}, 10);
    cal.finish();
    EXPECT_FALSE(cal.add_sample({1.0f, 1.0f}, 20));
}

TEST_F(BiasCalibratorTest, WindowHandlesTimestampWrap) {
    const uint32_t start = UINT32_MAX - 100U;
    cal.start(start, WINDOW_MS);

    EXPECT_TRUE(cal.add_sample({1.0f, 1.0f}, start + 50U));
    EXPECT_TRUE(cal.add_sample({3.0f, 3.0f}, start + 300U));   /* wrapped past 0 */
    EXPECT_FALSE(cal.window_elapsed(start + 499U));
    EXPECT_TRUE(cal.window_elapsed(start + 500U));

    CalibrationResult r = cal.finish();
    EXPECT_EQ(r.sample_count, 2U);
    EXPECT_FLOAT_EQ(r.bias.roll_bias, 2.0f);
}

TEST_F(BiasCalibratorTest, RestartDiscardsPreviousWindow) {
    cal.start(0, WINDOW_MS);
    cal.add_sample({50.0f, 50.0f}, 10);
    cal.start(1000, WINDOW_MS);
    cal.add_sample({1.0f, -1.0f}, 1010);

    CalibrationResult r = cal.finish();
    EXPECT_EQ(r.sample_count, 1U);
    EXPECT_FLOAT_EQ(r.bias.roll_bias, 1.0f);
}
