/* SPDX-FileCopyrightText: 2025 Marionette Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "motion_config.hpp"
#include "core/logger.hpp"

#include <nlohmann/json.hpp>

namespace mrn::motion {

    using json = nlohmann::json;

    namespace {

        std::optional<MotionBehavior> stringToBehavior(const std::string& str) {
            if (str == "V1")
                return MotionBehavior::V1;
            if (str == "V2")
                return MotionBehavior::V2;
            return std::nullopt;
        }

        std::optional<BezierEvaluation> stringToBezierEvaluation(const std::string& str) {
            if (str == "Cardano")
                return BezierEvaluation::Cardano;
            if (str == "DeCasteljau")
                return BezierEvaluation::DeCasteljau;
            if (str == "BinarySearch")
                return BezierEvaluation::BinarySearch;
            return std::nullopt;
        }

        std::unexpected<MotionError> invalid(std::string message) {
            LOG_ERROR("Invalid motion config: {}", message);
            return std::unexpected(MotionError{MotionErrorCode::InvalidJson, std::move(message)});
        }

    } // namespace

    std::expected<MotionConfig, MotionError> MotionConfig::fromJson(const json& j) {
        if (!j.is_object()) {
            return invalid("motion config must be an object");
        }

        MotionConfig config;
        try {
            if (const auto it = j.find("Loop"); it != j.end() && !it->is_null()) {
                config.loop = it->get<bool>();
            }
            config.loop_fade_in = j.value("LoopFadeIn", config.loop_fade_in);
            config.fade_in_seconds = j.value("FadeInTime", config.fade_in_seconds);
            config.fade_out_seconds = j.value("FadeOutTime", config.fade_out_seconds);
            config.weight = j.value("Weight", config.weight);
            config.offset_seconds = j.value("OffsetSeconds", config.offset_seconds);
            config.eye_blink_ids = j.value("EyeBlinkIds", config.eye_blink_ids);
            config.lip_sync_ids = j.value("LipSyncIds", config.lip_sync_ids);
            config.eye_blink_additive = j.value("EyeBlinkAdditive", config.eye_blink_additive);
            config.lip_sync_additive = j.value("LipSyncAdditive", config.lip_sync_additive);
            config.additive_parameter_ids = j.value("AdditiveParameterIds", config.additive_parameter_ids);
            config.additive_part_ids = j.value("AdditivePartIds", config.additive_part_ids);

            if (const auto it = j.find("MotionBehavior"); it != j.end()) {
                const auto behavior = stringToBehavior(it->get<std::string>());
                if (!behavior) {
                    return invalid("unknown MotionBehavior '" + it->get<std::string>() + "'");
                }
                config.behavior = *behavior;
            }

            if (const auto it = j.find("BezierEvaluation"); it != j.end() && !it->is_null()) {
                const auto mode = stringToBezierEvaluation(it->get<std::string>());
                if (!mode) {
                    return invalid("unknown BezierEvaluation '" + it->get<std::string>() + "'");
                }
                config.bezier_override = *mode;
            }
        } catch (const json::exception& e) {
            return invalid(e.what());
        }

        return config;
    }

} // namespace mrn::motion
