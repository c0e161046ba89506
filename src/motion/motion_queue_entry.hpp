/* SPDX-FileCopyrightText: 2025 Marionette Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

namespace mrn::motion {

    /**
     * @brief Mutable playback state of one playing motion instance
     *
     * Owned by the scheduler, updated by Motion every frame. All times are in
     * seconds on the caller's clock. A negative end time means the playback is not
     * scheduled to end.
     */
    class MotionQueueEntry {
    public:
        [[nodiscard]] float startTime() const { return start_time_; }
        void setStartTime(float seconds) { start_time_ = seconds; }

        [[nodiscard]] float fadeInStartTime() const { return fade_in_start_time_; }
        void setFadeInStartTime(float seconds) { fade_in_start_time_ = seconds; }

        [[nodiscard]] float endTime() const { return end_time_; }
        void setEndTime(float seconds) { end_time_ = seconds; }

        [[nodiscard]] bool isFinished() const { return finished_; }
        void setIsFinished(bool finished) { finished_ = finished; }

        [[nodiscard]] bool isStarted() const { return started_; }
        void setIsStarted(bool started) { started_ = started; }

        [[nodiscard]] bool isTriggeredFadeOut() const { return triggered_fade_out_; }

        // Ends the playback at now + fade_out_seconds unless it already ends earlier
        void startFadeOut(float fade_out_seconds, float now);

        void setState(float time, float weight) {
            state_time_ = time;
            state_weight_ = weight;
        }
        [[nodiscard]] float stateTime() const { return state_time_; }
        [[nodiscard]] float stateWeight() const { return state_weight_; }

        [[nodiscard]] float lastEventCheckSeconds() const { return last_event_check_seconds_; }
        void setLastEventCheckSeconds(float seconds) { last_event_check_seconds_ = seconds; }

    private:
        float start_time_ = -1.0f;
        float fade_in_start_time_ = 0.0f;
        float end_time_ = -1.0f;
        float state_time_ = 0.0f;
        float state_weight_ = 0.0f;
        float last_event_check_seconds_ = 0.0f;
        bool finished_ = false;
        bool started_ = false;
        bool triggered_fade_out_ = false;
    };

} // namespace mrn::motion
