/*
 * Unit tests for startup configuration validation
 */

#include <gtest/gtest.h>
#include <cstring>
#include <limits>
#include "logic/bridge_config.hpp"
#include "config.h"

class BridgeConfigTest : public ::testing::Test {
protected:
    BridgeConfig cfg = bridge_config_defaults();
    char reason[96] = {};
};

TEST_F(BridgeConfigTest, DefaultsMatchConfigHeader) {
    EXPECT_FLOAT_EQ(cfg.x_scale, COND_DEFAULT_X_SCALE);
    EXPECT_FLOAT_EQ(cfg.z_scale, COND_DEFAULT_Z_SCALE);
    EXPECT_FLOAT_EQ(cfg.deadzone, COND_DEFAULT_DEADZONE);
    EXPECT_FLOAT_EQ(cfg.expo, COND_DEFAULT_EXPO);
    EXPECT_EQ(cfg.invert_x, COND_DEFAULT_INVERT_X);
    EXPECT_EQ(cfg.invert_z, COND_DEFAULT_INVERT_Z);
}

TEST_F(BridgeConfigTest, DefaultsAreValid) {
    strcpy(reason, "stale");
    EXPECT_EQ(bridge_config_validate(cfg, reason, sizeof(reason)), BridgeError::None);
    EXPECT_STREQ(reason, "");
}

TEST_F(BridgeConfigTest, NonPositiveScaleRejected) {
    cfg.x_scale = 0.0f;
    EXPECT_EQ(bridge_config_validate(cfg, reason, sizeof(reason)),
              BridgeError::ConfigurationInvalid);
    EXPECT_STREQ(reason, "x_scale=0 must be finite and > 0");

    cfg = bridge_config_defaults();
    cfg.z_scale = -1.0f;
    EXPECT_EQ(bridge_config_validate(cfg, reason, sizeof(reason)),
              BridgeError::ConfigurationInvalid);
    EXPECT_STREQ(reason, "z_scale=-1 must be finite and > 0");
}

TEST_F(BridgeConfigTest, DeadzoneMustBeBelowOne) {
    cfg.deadzone = 1.0f;
    EXPECT_EQ(bridge_config_validate(cfg, reason, sizeof(reason)),
              BridgeError::ConfigurationInvalid);
    EXPECT_STREQ(reason, "deadzone=1 must be in [0, 1)");

    cfg.deadzone = -0.1f;
    EXPECT_EQ(bridge_config_validate(cfg, reason, sizeof(reason)),
              BridgeError::ConfigurationInvalid);
}

TEST_F(BridgeConfigTest, ExpoBelowOneRejected) {
    cfg.expo = 0.5f;
    EXPECT_EQ(bridge_config_validate(cfg, reason, sizeof(reason)),
              BridgeError::ConfigurationInvalid);
    EXPECT_STREQ(reason, "expo=0.5 must be finite and >= 1");
}

TEST_F(BridgeConfigTest, NonFiniteFieldsRejected) {
    const float nan = std::numeric_limits<float>::quiet_NaN();
    const float inf = std::numeric_limits<float>::infinity();

    cfg.x_scale = inf;
    EXPECT_EQ(bridge_config_validate(cfg, reason, sizeof(reason)),
              BridgeError::ConfigurationInvalid);
    EXPECT_EQ(strncmp(reason, "x_scale=", 8), 0);

    cfg = bridge_config_defaults();
    cfg.deadzone = nan;
    EXPECT_EQ(bridge_config_validate(cfg, reason, sizeof(reason)),
              BridgeError::ConfigurationInvalid);
    EXPECT_EQ(strncmp(reason, "deadzone=", 9), 0);

    cfg = bridge_config_defaults();
    cfg.expo = nan;
    EXPECT_EQ(bridge_config_validate(cfg, nullptr, 0), BridgeError::ConfigurationInvalid);
}

TEST_F(BridgeConfigTest, BoundaryValuesAccepted) {
    cfg.deadzone = 0.0f;
    cfg.expo = 1.0f;
    cfg.x_scale = 0.001f;
    EXPECT_EQ(bridge_config_validate(cfg, reason, sizeof(reason)), BridgeError::None);

    cfg.deadzone = 0.99f;
    cfg.expo = 4.0f;
    EXPECT_EQ(bridge_config_validate(cfg, nullptr, 0), BridgeError::None);
}

TEST_F(BridgeConfigTest, ReasonTruncatedToBuffer) {
    char small[8];
    cfg.x_scale = 0.0f;
    EXPECT_EQ(bridge_config_validate(cfg, small, sizeof(small)),
              BridgeError::ConfigurationInvalid);
    EXPECT_EQ(strlen(small), sizeof(small) - 1U);
}
