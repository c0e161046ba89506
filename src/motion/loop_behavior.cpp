/* SPDX-FileCopyrightText: 2025 Marionette Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "loop_behavior.hpp"

namespace mrn::motion {

    float loopDuration(const MotionBehavior behavior, const float duration, const float fps) {
        if (behavior == MotionBehavior::V2) {
            return duration + 1.0f / fps;
        }
        return duration;
    }

    float wrapLoopTime(const float elapsed, const float loop_duration) {
        if (loop_duration <= 0.0f) {
            return elapsed;
        }
        float time = elapsed;
        while (time > loop_duration) {
            time -= loop_duration;
        }
        return time;
    }

    bool usesEndPointCorrection(const MotionBehavior behavior) {
        return behavior == MotionBehavior::V2;
    }

    bool rewindForNextLoop(const MotionBehavior behavior, MotionQueueEntry& entry, const float now,
                           const float time, const bool loop_fade_in) {
        switch (behavior) {
        case MotionBehavior::V1:
            entry.setStartTime(now);
            if (loop_fade_in) {
                entry.setFadeInStartTime(now);
            }
            return false;
        case MotionBehavior::V2:
            entry.setStartTime(now - time);
            if (loop_fade_in) {
                entry.setFadeInStartTime(now - time);
            }
            return true;
        }
        return false;
    }

} // namespace mrn::motion
