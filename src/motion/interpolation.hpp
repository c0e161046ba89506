/* SPDX-FileCopyrightText: 2025 Marionette Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "motion_types.hpp"

#include <span>

namespace mrn::motion {

    // sin(clamp(x, 0, 1) * pi / 2)
    [[nodiscard]] float easeSine(float x);

    // Number of points a segment spans, including the point shared with the previous segment
    [[nodiscard]] constexpr size_t segmentPointCount(SegmentType type) {
        return type == SegmentType::Bezier ? 4 : 2;
    }

    [[nodiscard]] SegmentEvaluator evaluatorFor(SegmentType type, BezierEvaluation bezier);

    // Segment primitives. `points` starts at the segment's first point.
    [[nodiscard]] float linearEvaluate(std::span<const MotionPoint> points, float time);
    [[nodiscard]] float steppedEvaluate(std::span<const MotionPoint> points, float time);
    [[nodiscard]] float inverseSteppedEvaluate(std::span<const MotionPoint> points, float time);
    [[nodiscard]] float bezierEvaluate(std::span<const MotionPoint> points, float time);
    [[nodiscard]] float bezierEvaluateBinarySearch(std::span<const MotionPoint> points, float time);
    [[nodiscard]] float bezierEvaluateCardano(std::span<const MotionPoint> points, float time);

    // Real root in [0, 1] of a*t^3 + b*t^2 + c*t + d
    [[nodiscard]] float cardanoAlgorithmForBezier(float a, float b, float c, float d);

    [[nodiscard]] float evaluateSegment(SegmentEvaluator evaluator, std::span<const MotionPoint> points, float time);

} // namespace mrn::motion
