/* SPDX-FileCopyrightText: 2025 Marionette Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "motion_queue_entry.hpp"

namespace mrn::motion {

    void MotionQueueEntry::startFadeOut(const float fade_out_seconds, const float now) {
        const float new_end_time = now + fade_out_seconds;
        triggered_fade_out_ = true;

        if (end_time_ < 0.0f || new_end_time < end_time_) {
            end_time_ = new_end_time;
        }
    }

} // namespace mrn::motion
