/* SPDX-FileCopyrightText: 2025 Marionette Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/model.hpp"
#include "motion_config.hpp"
#include "motion_data.hpp"
#include "motion_queue_entry.hpp"
#include "parameter_binding.hpp"

#include <expected>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mrn::motion {

    /**
     * @brief One playable instance of a motion asset
     *
     * Holds the shared, immutable MotionData together with per-instance settings
     * (MotionConfig, per-curve fade overrides, callbacks). Every frame the
     * scheduler calls updateParameters() or, with its own fade weight,
     * doUpdateParameters() for each playing entry.
     */
    class Motion {
    public:
        using FinishedCallback = std::function<void(Motion&)>;
        using BeganCallback = std::function<void(Motion&)>;

        Motion() = default;
        explicit Motion(std::shared_ptr<const MotionData> data, MotionConfig config = {});

        [[nodiscard]] static std::expected<Motion, MotionError> create(
            std::string_view json_text, MotionConfig config = {}, const MotionParseOptions& options = {});
        [[nodiscard]] static std::expected<Motion, MotionError> load(
            const std::filesystem::path& path, MotionConfig config = {}, const MotionParseOptions& options = {});

        // No data or no curves: every per-frame call is a no-op
        [[nodiscard]] bool isEmpty() const { return !data_ || data_->empty(); }

        [[nodiscard]] const std::shared_ptr<const MotionData>& data() const { return data_; }
        [[nodiscard]] const MotionConfig& config() const { return config_; }
        void setConfig(MotionConfig config);

        // ========== Per-frame update ==========

        // Setup, fade weight, parameter update and end check for one entry
        void updateParameters(core::Model& model, MotionQueueEntry& entry, float now);

        /**
         * @brief Sample all curves at the entry's playback time and write them into the model
         *
         * @param model        Target parameter table
         * @param now          Current time [s]
         * @param fade_weight  Motion weight computed by the scheduler
         * @param entry        Playback state; start/fade-in times are rewound on loop,
         *                     isFinished is set when a non-looping motion ends
         */
        void doUpdateParameters(core::Model& model, float now, float fade_weight, MotionQueueEntry& entry);

        void setupMotionQueueEntry(MotionQueueEntry& entry, float now);
        float updateFadeWeight(MotionQueueEntry& entry, float now) const;
        void adjustEndTime(MotionQueueEntry& entry) const;

        // ========== Events ==========

        // Payloads of events with fire time in (before_check_seconds, motion_time_seconds]
        [[nodiscard]] const std::vector<std::string>& getFiredEvents(float before_check_seconds, float motion_time_seconds);

        // getFiredEvents() relative to the entry start; advances the entry's last check time
        [[nodiscard]] const std::vector<std::string>& collectFiredEvents(MotionQueueEntry& entry, float now);

        // ========== Settings ==========

        void setLoop(bool loop) { config_.loop = loop; }
        [[nodiscard]] bool isLoop() const;

        void setLoopFadeIn(bool loop_fade_in) { config_.loop_fade_in = loop_fade_in; }
        [[nodiscard]] bool isLoopFadeIn() const { return config_.loop_fade_in; }

        void setMotionBehavior(MotionBehavior behavior) { config_.behavior = behavior; }
        [[nodiscard]] MotionBehavior motionBehavior() const { return config_.behavior; }

        void setFadeInTime(float seconds) { config_.fade_in_seconds = seconds; }
        void setFadeOutTime(float seconds) { config_.fade_out_seconds = seconds; }
        [[nodiscard]] float getFadeInTime() const;
        [[nodiscard]] float getFadeOutTime() const;

        void setWeight(float weight) { config_.weight = weight; }
        [[nodiscard]] float getWeight() const { return config_.weight; }

        void setOffsetSeconds(float seconds) { config_.offset_seconds = seconds; }

        void setEffectIds(std::vector<std::string> eye_blink_ids, std::vector<std::string> lip_sync_ids);
        void setAdditiveIds(std::vector<std::string> parameter_ids, std::vector<std::string> part_ids);
        void setEyeBlinkAdditive(bool additive) { config_.eye_blink_additive = additive; }
        void setLipSyncAdditive(bool additive) { config_.lip_sync_additive = additive; }

        void setBezierOverride(std::optional<BezierEvaluation> mode) { config_.bezier_override = mode; }

        void setFinishedMotionHandler(FinishedCallback callback) { on_finished_ = std::move(callback); }
        void setBeganMotionHandler(BeganCallback callback) { on_began_ = std::move(callback); }

        // Per-curve fade times; set on this instance only, the asset stays untouched
        void setParameterFadeInTime(const std::string& id, float seconds);
        void setParameterFadeOutTime(const std::string& id, float seconds);
        [[nodiscard]] float getParameterFadeInTime(const std::string& id) const;
        [[nodiscard]] float getParameterFadeOutTime(const std::string& id) const;

        // ========== Queries ==========

        // -1 when looping
        [[nodiscard]] float getDuration() const;
        [[nodiscard]] float getLoopDuration() const;

        [[nodiscard]] bool isExistModelOpacity() const { return getModelOpacityIndex().has_value(); }
        [[nodiscard]] std::optional<size_t> getModelOpacityIndex() const;
        [[nodiscard]] float getModelOpacityValue() const { return model_opacity_; }

        [[nodiscard]] float lastWeight() const { return last_weight_; }

    private:
        [[nodiscard]] float curveWeight(size_t curve_index, float now, float motion_fade_in, float motion_fade_out,
                                        const MotionQueueEntry& entry) const;

        std::shared_ptr<const MotionData> data_;
        MotionConfig config_;

        // Per-curve fade overrides, initialized from the asset
        std::vector<float> curve_fade_in_;
        std::vector<float> curve_fade_out_;

        ParameterBinding binding_;
        std::vector<bool> eye_blink_claimed_;
        std::vector<bool> lip_sync_claimed_;
        std::vector<std::string> fired_events_;

        FinishedCallback on_finished_;
        BeganCallback on_began_;

        bool previous_loop_state_ = false;
        float model_opacity_ = 1.0f;
        float last_weight_ = 0.0f;
    };

} // namespace mrn::motion
