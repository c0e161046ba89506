/* SPDX-FileCopyrightText: 2025 Marionette Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "motion_data.hpp"

#include <optional>

namespace mrn::motion {

    struct CurveSampleOptions {
        // Join the curve's end back to its start while time < loop_end_time
        bool loop_correction = false;
        float loop_end_time = 0.0f;
        // Replaces the evaluator chosen at parse time for bezier segments
        std::optional<BezierEvaluation> bezier_override;
    };

    /**
     * @brief Value of a curve at a time
     *
     * Picks the first segment whose end point lies after `time` and evaluates it.
     * Past the last point the value is held, unless loop correction applies: then a
     * synthetic segment from the last point to the curve's first value placed at
     * loop_end_time is evaluated with the last segment's type (bezier as linear).
     */
    [[nodiscard]] float sampleCurve(const MotionData& data, size_t curve_index, float time,
                                    const CurveSampleOptions& options = {});

} // namespace mrn::motion
