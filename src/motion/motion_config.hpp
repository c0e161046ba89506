/* SPDX-FileCopyrightText: 2025 Marionette Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "loop_behavior.hpp"
#include "motion_error.hpp"
#include "motion_types.hpp"

#include <expected>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <vector>

namespace mrn::motion {

    // Per-instance settings a scheduler hands to a Motion
    struct MotionConfig {
        // nullopt: use the asset's Meta.Loop
        std::optional<bool> loop;
        bool loop_fade_in = true;
        MotionBehavior behavior = MotionBehavior::V2;

        // Negative: use the asset's Meta fade times
        float fade_in_seconds = -1.0f;
        float fade_out_seconds = -1.0f;

        float weight = 1.0f;
        float offset_seconds = 0.0f;

        std::vector<std::string> eye_blink_ids;
        std::vector<std::string> lip_sync_ids;
        bool eye_blink_additive = false;
        bool lip_sync_additive = false;

        std::vector<std::string> additive_parameter_ids;
        std::vector<std::string> additive_part_ids;

        // Debug: evaluate all bezier segments with this method
        std::optional<BezierEvaluation> bezier_override;

        /**
         * @brief Read settings from a JSON object
         *
         * Keys: Loop, LoopFadeIn, MotionBehavior ("V1"/"V2"), FadeInTime, FadeOutTime,
         * Weight, OffsetSeconds, EyeBlinkIds, LipSyncIds, EyeBlinkAdditive,
         * LipSyncAdditive, AdditiveParameterIds, AdditivePartIds, BezierEvaluation
         * ("Cardano"/"DeCasteljau"/"BinarySearch"). Missing keys keep their defaults.
         */
        [[nodiscard]] static std::expected<MotionConfig, MotionError> fromJson(const nlohmann::json& j);
    };

} // namespace mrn::motion
