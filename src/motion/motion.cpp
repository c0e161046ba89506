/* SPDX-FileCopyrightText: 2025 Marionette Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "motion.hpp"
#include "core/logger.hpp"
#include "curve_sampler.hpp"
#include "interpolation.hpp"
#include "loop_behavior.hpp"

namespace mrn::motion {

    Motion::Motion(std::shared_ptr<const MotionData> data, MotionConfig config)
        : data_(std::move(data)),
          config_(std::move(config)) {
        if (data_) {
            curve_fade_in_.reserve(data_->curveCount());
            curve_fade_out_.reserve(data_->curveCount());
            for (const auto& curve : data_->curves()) {
                curve_fade_in_.push_back(curve.fade_in_time);
                curve_fade_out_.push_back(curve.fade_out_time);
            }
        }
        previous_loop_state_ = isLoop();
    }

    std::expected<Motion, MotionError> Motion::create(std::string_view json_text, MotionConfig config,
                                                      const MotionParseOptions& options) {
        auto data = MotionData::parse(json_text, options);
        if (!data) {
            return std::unexpected(data.error());
        }
        return Motion(std::make_shared<const MotionData>(std::move(*data)), std::move(config));
    }

    std::expected<Motion, MotionError> Motion::load(const std::filesystem::path& path, MotionConfig config,
                                                    const MotionParseOptions& options) {
        auto data = loadMotionFile(path, options);
        if (!data) {
            return std::unexpected(data.error());
        }
        return Motion(std::make_shared<const MotionData>(std::move(*data)), std::move(config));
    }

    void Motion::setConfig(MotionConfig config) {
        config_ = std::move(config);
        binding_.invalidate();
    }

    void Motion::setEffectIds(std::vector<std::string> eye_blink_ids, std::vector<std::string> lip_sync_ids) {
        config_.eye_blink_ids = std::move(eye_blink_ids);
        config_.lip_sync_ids = std::move(lip_sync_ids);
        binding_.invalidate();
    }

    void Motion::setAdditiveIds(std::vector<std::string> parameter_ids, std::vector<std::string> part_ids) {
        config_.additive_parameter_ids = std::move(parameter_ids);
        config_.additive_part_ids = std::move(part_ids);
        binding_.invalidate();
    }

    bool Motion::isLoop() const {
        if (config_.loop) {
            return *config_.loop;
        }
        return data_ && data_->isLoop();
    }

    float Motion::getFadeInTime() const {
        if (config_.fade_in_seconds >= 0.0f || !data_) {
            return config_.fade_in_seconds;
        }
        return data_->fadeInSeconds();
    }

    float Motion::getFadeOutTime() const {
        if (config_.fade_out_seconds >= 0.0f || !data_) {
            return config_.fade_out_seconds;
        }
        return data_->fadeOutSeconds();
    }

    float Motion::getDuration() const {
        return isLoop() ? -1.0f : getLoopDuration();
    }

    float Motion::getLoopDuration() const {
        return data_ ? data_->duration() : -1.0f;
    }

    void Motion::setParameterFadeInTime(const std::string& id, const float seconds) {
        if (!data_) {
            return;
        }
        if (const auto index = data_->findCurve(id)) {
            curve_fade_in_[*index] = seconds;
        }
    }

    void Motion::setParameterFadeOutTime(const std::string& id, const float seconds) {
        if (!data_) {
            return;
        }
        if (const auto index = data_->findCurve(id)) {
            curve_fade_out_[*index] = seconds;
        }
    }

    float Motion::getParameterFadeInTime(const std::string& id) const {
        if (!data_) {
            return -1.0f;
        }
        const auto index = data_->findCurve(id);
        return index ? curve_fade_in_[*index] : -1.0f;
    }

    float Motion::getParameterFadeOutTime(const std::string& id) const {
        if (!data_) {
            return -1.0f;
        }
        const auto index = data_->findCurve(id);
        return index ? curve_fade_out_[*index] : -1.0f;
    }

    std::optional<size_t> Motion::getModelOpacityIndex() const {
        if (!data_) {
            return std::nullopt;
        }
        const auto [begin, end] = data_->curveRange(CurveTarget::Model);
        for (size_t c = begin; c < end; ++c) {
            if (data_->curveAt(c).id == MODEL_OPACITY_ID) {
                return c;
            }
        }
        return std::nullopt;
    }

    void Motion::adjustEndTime(MotionQueueEntry& entry) const {
        const float duration = getDuration();
        const float end_time = duration <= 0.0f ? -1.0f : entry.startTime() + duration;
        entry.setEndTime(end_time);
    }

    void Motion::setupMotionQueueEntry(MotionQueueEntry& entry, const float now) {
        if (entry.isStarted()) {
            return;
        }

        entry.setIsStarted(true);
        entry.setStartTime(now - config_.offset_seconds);
        entry.setFadeInStartTime(now);
        entry.setLastEventCheckSeconds(entry.startTime());

        if (entry.endTime() < 0.0f) {
            adjustEndTime(entry);
        }

        if (on_began_) {
            on_began_(*this);
        }
    }

    float Motion::updateFadeWeight(MotionQueueEntry& entry, const float now) const {
        const float fade_in_seconds = getFadeInTime();
        const float fade_out_seconds = getFadeOutTime();

        const float fade_in = fade_in_seconds <= 0.0f
                                  ? 1.0f
                                  : easeSine((now - entry.fadeInStartTime()) / fade_in_seconds);
        const float fade_out = (fade_out_seconds <= 0.0f || entry.endTime() < 0.0f)
                                   ? 1.0f
                                   : easeSine((entry.endTime() - now) / fade_out_seconds);

        const float fade_weight = config_.weight * fade_in * fade_out;
        entry.setState(now, fade_weight);
        return fade_weight;
    }

    void Motion::updateParameters(core::Model& model, MotionQueueEntry& entry, const float now) {
        if (isEmpty() || entry.isFinished()) {
            return;
        }

        setupMotionQueueEntry(entry, now);
        const float fade_weight = updateFadeWeight(entry, now);
        doUpdateParameters(model, now, fade_weight, entry);

        if (entry.endTime() > 0.0f && entry.endTime() < now) {
            entry.setIsFinished(true);
        }
    }

    float Motion::curveWeight(const size_t curve_index, const float now, const float motion_fade_in,
                              const float motion_fade_out, const MotionQueueEntry& entry) const {
        const float fade_in_time = curve_fade_in_[curve_index];
        const float fade_out_time = curve_fade_out_[curve_index];

        float fade_in = motion_fade_in;
        if (fade_in_time >= 0.0f) {
            fade_in = fade_in_time == 0.0f
                          ? 1.0f
                          : easeSine((now - entry.fadeInStartTime()) / fade_in_time);
        }

        float fade_out = motion_fade_out;
        if (fade_out_time >= 0.0f) {
            fade_out = (fade_out_time == 0.0f || entry.endTime() < 0.0f)
                           ? 1.0f
                           : easeSine((entry.endTime() - now) / fade_out_time);
        }

        return config_.weight * fade_in * fade_out;
    }

    void Motion::doUpdateParameters(core::Model& model, const float now, const float fade_weight,
                                    MotionQueueEntry& entry) {
        if (isEmpty()) {
            return;
        }

        const MotionData& data = *data_;
        const bool loop = isLoop();

        if (config_.behavior == MotionBehavior::V2 && previous_loop_state_ != loop) {
            adjustEndTime(entry);
            previous_loop_state_ = loop;
        }

        float time_offset = now - entry.startTime();
        if (time_offset < 0.0f) {
            time_offset = 0.0f;
        }

        binding_.bind(data, config_, model);

        const float fade_in_seconds = getFadeInTime();
        const float fade_out_seconds = getFadeOutTime();
        const float motion_fade_in = fade_in_seconds <= 0.0f
                                         ? 1.0f
                                         : easeSine((now - entry.fadeInStartTime()) / fade_in_seconds);
        const float motion_fade_out = (fade_out_seconds <= 0.0f || entry.endTime() < 0.0f)
                                          ? 1.0f
                                          : easeSine((entry.endTime() - now) / fade_out_seconds);

        float time = time_offset;
        float duration = data.duration();
        if (loop) {
            duration = loopDuration(config_.behavior, duration, data.fps());
            time = wrapLoopTime(time_offset, duration);
        }

        CurveSampleOptions sample_options;
        sample_options.loop_correction = loop && usesEndPointCorrection(config_.behavior);
        sample_options.loop_end_time = duration;
        sample_options.bezier_override = config_.bezier_override;

        // Model curves: effect values and model opacity
        std::optional<float> eye_blink_value;
        std::optional<float> lip_sync_value;

        const auto [model_begin, model_end] = data.curveRange(CurveTarget::Model);
        for (size_t c = model_begin; c < model_end; ++c) {
            const std::string& id = data.curveAt(c).id;
            if (id == EFFECT_EYE_BLINK) {
                eye_blink_value = sampleCurve(data, c, time, sample_options);
            } else if (id == EFFECT_LIP_SYNC) {
                lip_sync_value = sampleCurve(data, c, time, sample_options);
            } else if (id == MODEL_OPACITY_ID) {
                model_opacity_ = sampleCurve(data, c, time, sample_options);
                model.setModelOpacity(model_opacity_);
            }
        }

        // Parameter curves
        eye_blink_claimed_.assign(binding_.eyeBlinkTargets().size(), false);
        lip_sync_claimed_.assign(binding_.lipSyncTargets().size(), false);

        const auto [param_begin, param_end] = data.curveRange(CurveTarget::Parameter);
        for (size_t c = param_begin; c < param_end; ++c) {
            const auto parameter_index = binding_.targetIndex(c);
            if (!parameter_index) {
                continue;
            }

            float value = sampleCurve(data, c, time, sample_options);

            if (eye_blink_value) {
                if (const auto slot = binding_.eyeBlinkSlot(c)) {
                    value *= *eye_blink_value;
                    eye_blink_claimed_[*slot] = true;
                }
            }

            if (lip_sync_value) {
                if (const auto slot = binding_.lipSyncSlot(c)) {
                    value += *lip_sync_value;
                    lip_sync_claimed_[*slot] = true;
                }
            }

            const bool has_fade_override = curve_fade_in_[c] >= 0.0f || curve_fade_out_[c] >= 0.0f;
            const float weight = has_fade_override
                                     ? curveWeight(c, now, motion_fade_in, motion_fade_out, entry)
                                     : fade_weight;

            if (binding_.isAdditive(c)) {
                model.addParameterValue(*parameter_index, value, weight);
            } else {
                model.setParameterValue(*parameter_index, value, weight);
            }
        }

        // Effects on parameters no curve drove this frame
        if (eye_blink_value) {
            const auto& targets = binding_.eyeBlinkTargets();
            for (size_t i = 0; i < targets.size(); ++i) {
                if (eye_blink_claimed_[i] || !targets[i]) {
                    continue;
                }
                if (config_.eye_blink_additive) {
                    model.addParameterValue(*targets[i], *eye_blink_value, fade_weight);
                } else {
                    model.setParameterValue(*targets[i], *eye_blink_value, fade_weight);
                }
            }
        }

        if (lip_sync_value) {
            const auto& targets = binding_.lipSyncTargets();
            for (size_t i = 0; i < targets.size(); ++i) {
                if (lip_sync_claimed_[i] || !targets[i]) {
                    continue;
                }
                if (config_.lip_sync_additive) {
                    model.addParameterValue(*targets[i], *lip_sync_value, fade_weight);
                } else {
                    model.setParameterValue(*targets[i], *lip_sync_value, fade_weight);
                }
            }
        }

        // Part opacity curves, applied at full authored value
        const auto [part_begin, part_end] = data.curveRange(CurveTarget::PartOpacity);
        for (size_t c = part_begin; c < part_end; ++c) {
            const auto part_index = binding_.targetIndex(c);
            if (!part_index) {
                continue;
            }

            const float value = sampleCurve(data, c, time, sample_options);
            if (binding_.isAdditive(c)) {
                model.addPartOpacity(*part_index, value);
            } else {
                model.setPartOpacity(*part_index, value);
            }
        }

        if (time_offset >= duration) {
            if (loop) {
                LOG_TRACE("Motion loop restart at {:.3f}s (overflow {:.3f}s)", now, time);
                if (rewindForNextLoop(config_.behavior, entry, now, time, config_.loop_fade_in) && on_finished_) {
                    on_finished_(*this);
                }
            } else {
                LOG_TRACE("Motion finished at {:.3f}s", now);
                if (on_finished_) {
                    on_finished_(*this);
                }
                entry.setIsFinished(true);
            }
        }

        last_weight_ = fade_weight;
    }

    const std::vector<std::string>& Motion::getFiredEvents(const float before_check_seconds,
                                                           const float motion_time_seconds) {
        fired_events_.clear();
        if (!data_) {
            return fired_events_;
        }

        for (const auto& event : data_->events()) {
            if (event.fire_time > before_check_seconds && event.fire_time <= motion_time_seconds) {
                fired_events_.push_back(event.value);
            }
        }
        return fired_events_;
    }

    const std::vector<std::string>& Motion::collectFiredEvents(MotionQueueEntry& entry, const float now) {
        const auto& fired = getFiredEvents(entry.lastEventCheckSeconds() - entry.startTime(),
                                           now - entry.startTime());
        entry.setLastEventCheckSeconds(now);
        return fired;
    }

} // namespace mrn::motion
