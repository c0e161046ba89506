/* SPDX-FileCopyrightText: 2025 Marionette Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "motion/motion.hpp"
#include "motion/motion_config.hpp"
#include "motion_test_utils.hpp"

#include <gtest/gtest.h>

using namespace mrn::motion;
using mrn::test::json;
using mrn::test::MotionBuilder;

// ============================================================================
// MotionConfig::fromJson
// ============================================================================

class MotionConfigTest : public ::testing::Test {};

TEST_F(MotionConfigTest, EmptyObjectKeepsDefaults) {
    auto config = MotionConfig::fromJson(json::object());
    ASSERT_TRUE(config.has_value());

    EXPECT_FALSE(config->loop.has_value());
    EXPECT_TRUE(config->loop_fade_in);
    EXPECT_EQ(config->behavior, MotionBehavior::V2);
    EXPECT_FLOAT_EQ(config->fade_in_seconds, -1.0f);
    EXPECT_FLOAT_EQ(config->fade_out_seconds, -1.0f);
    EXPECT_FLOAT_EQ(config->weight, 1.0f);
    EXPECT_FLOAT_EQ(config->offset_seconds, 0.0f);
    EXPECT_TRUE(config->eye_blink_ids.empty());
    EXPECT_FALSE(config->eye_blink_additive);
    EXPECT_FALSE(config->bezier_override.has_value());
}

TEST_F(MotionConfigTest, AllKeys) {
    const json j = {
        {"Loop", true},
        {"LoopFadeIn", false},
        {"MotionBehavior", "V1"},
        {"FadeInTime", 0.3},
        {"FadeOutTime", 0.4},
        {"Weight", 0.5},
        {"OffsetSeconds", 1.25},
        {"EyeBlinkIds", json::array({"ParamEyeLOpen", "ParamEyeROpen"})},
        {"LipSyncIds", json::array({"ParamMouthOpenY"})},
        {"EyeBlinkAdditive", true},
        {"LipSyncAdditive", true},
        {"AdditiveParameterIds", json::array({"ParamBreath"})},
        {"AdditivePartIds", json::array({"PartArmL"})},
        {"BezierEvaluation", "BinarySearch"},
    };

    auto config = MotionConfig::fromJson(j);
    ASSERT_TRUE(config.has_value()) << config.error().format();

    EXPECT_EQ(config->loop, true);
    EXPECT_FALSE(config->loop_fade_in);
    EXPECT_EQ(config->behavior, MotionBehavior::V1);
    EXPECT_FLOAT_EQ(config->fade_in_seconds, 0.3f);
    EXPECT_FLOAT_EQ(config->fade_out_seconds, 0.4f);
    EXPECT_FLOAT_EQ(config->weight, 0.5f);
    EXPECT_FLOAT_EQ(config->offset_seconds, 1.25f);
    ASSERT_EQ(config->eye_blink_ids.size(), 2u);
    EXPECT_EQ(config->eye_blink_ids[1], "ParamEyeROpen");
    ASSERT_EQ(config->lip_sync_ids.size(), 1u);
    EXPECT_TRUE(config->eye_blink_additive);
    EXPECT_TRUE(config->lip_sync_additive);
    EXPECT_EQ(config->additive_parameter_ids, std::vector<std::string>{"ParamBreath"});
    EXPECT_EQ(config->additive_part_ids, std::vector<std::string>{"PartArmL"});
    EXPECT_EQ(config->bezier_override, BezierEvaluation::BinarySearch);
}

TEST_F(MotionConfigTest, NotAnObject) {
    auto config = MotionConfig::fromJson(json::array());
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, MotionErrorCode::InvalidJson);
}

TEST_F(MotionConfigTest, UnknownBehavior) {
    auto config = MotionConfig::fromJson({{"MotionBehavior", "V3"}});
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, MotionErrorCode::InvalidJson);
}

TEST_F(MotionConfigTest, UnknownBezierEvaluation) {
    auto config = MotionConfig::fromJson({{"BezierEvaluation", "Newton"}});
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, MotionErrorCode::InvalidJson);
}

TEST_F(MotionConfigTest, WrongType) {
    auto config = MotionConfig::fromJson({{"Weight", "heavy"}});
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, MotionErrorCode::InvalidJson);
}

// ============================================================================
// Config applied to a motion
// ============================================================================

class MotionConfigApplyTest : public ::testing::Test {};

TEST_F(MotionConfigApplyTest, LoopFallsBackToAsset) {
    const auto data = MotionBuilder{}.loop(true).constant("Parameter", "ParamA", 1.0f).data();

    Motion from_asset(data);
    EXPECT_TRUE(from_asset.isLoop());

    MotionConfig config;
    config.loop = false;
    Motion overridden(data, config);
    EXPECT_FALSE(overridden.isLoop());
}

TEST_F(MotionConfigApplyTest, SetConfigReplacesSettings) {
    Motion motion(MotionBuilder{}.constant("Parameter", "ParamA", 1.0f).data());

    auto config = MotionConfig::fromJson({{"Weight", 0.25}, {"MotionBehavior", "V1"}});
    ASSERT_TRUE(config.has_value());
    motion.setConfig(*config);

    EXPECT_FLOAT_EQ(motion.getWeight(), 0.25f);
    EXPECT_EQ(motion.motionBehavior(), MotionBehavior::V1);
    EXPECT_FLOAT_EQ(motion.config().weight, 0.25f);
}

TEST_F(MotionConfigApplyTest, BezierOverrideSetter) {
    Motion motion(MotionBuilder{}.constant("Parameter", "ParamA", 1.0f).data());
    motion.setBezierOverride(BezierEvaluation::DeCasteljau);
    EXPECT_EQ(motion.config().bezier_override, BezierEvaluation::DeCasteljau);

    motion.setBezierOverride(std::nullopt);
    EXPECT_FALSE(motion.config().bezier_override.has_value());
}
