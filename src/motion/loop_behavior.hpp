/* SPDX-FileCopyrightText: 2025 Marionette Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "motion_queue_entry.hpp"

#include <cstdint>

namespace mrn::motion {

    enum class MotionBehavior : uint8_t {
        V1, // legacy: restart exactly at the current time, no end-point correction
        V2  // current: keep the overflow past the seam, one extra frame per loop, end-point correction
    };

    // Loop length used for wrapping; V2 adds one frame period
    [[nodiscard]] float loopDuration(MotionBehavior behavior, float duration, float fps);

    // Playback time inside the loop, wrapped by repeated subtraction
    [[nodiscard]] float wrapLoopTime(float elapsed, float loop_duration);

    // Whether sampling joins each curve's end back to its start
    [[nodiscard]] bool usesEndPointCorrection(MotionBehavior behavior);

    /**
     * @brief Rewind an entry when a loop iteration is complete
     *
     * V2 sets start (and, with loop_fade_in, fade-in start) to now - time so the
     * overflow past the seam is kept. V1 sets both to now.
     *
     * @return true when the completed iteration is reported to the finished handler (V2)
     */
    bool rewindForNextLoop(MotionBehavior behavior, MotionQueueEntry& entry, float now, float time, bool loop_fade_in);

} // namespace mrn::motion
