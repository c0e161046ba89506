/* SPDX-FileCopyrightText: 2025 Marionette Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "curve_sampler.hpp"
#include "interpolation.hpp"

#include <array>

namespace mrn::motion {

    namespace {

        float correctEndPoint(const MotionData& data, const MotionSegment& last_segment,
                              const size_t begin_point, const size_t end_point,
                              const float time, const float loop_end_time) {
            const std::array<MotionPoint, 2> points = {
                data.pointAt(end_point),
                MotionPoint{loop_end_time, data.pointAt(begin_point).value},
            };

            switch (last_segment.type) {
            case SegmentType::Stepped:
                return steppedEvaluate(points, time);
            case SegmentType::InverseStepped:
                return inverseSteppedEvaluate(points, time);
            case SegmentType::Linear:
            case SegmentType::Bezier:
                break;
            }
            return linearEvaluate(points, time);
        }

    } // namespace

    float sampleCurve(const MotionData& data, const size_t curve_index, const float time,
                      const CurveSampleOptions& options) {
        const MotionCurve& curve = data.curveAt(curve_index);
        const size_t end_segment = curve.base_segment_index + curve.segment_count;

        size_t last_point = data.segmentAt(curve.base_segment_index).base_point_index;
        for (size_t i = curve.base_segment_index; i < end_segment; ++i) {
            const MotionSegment& segment = data.segmentAt(i);
            last_point = segment.base_point_index + segment.lastPointOffset();

            if (data.pointAt(last_point).time > time) {
                SegmentEvaluator evaluator = segment.evaluator;
                if (options.bezier_override && segment.type == SegmentType::Bezier) {
                    evaluator = evaluatorFor(segment.type, *options.bezier_override);
                }
                return evaluateSegment(evaluator, data.segmentPoints(segment), time);
            }
        }

        if (options.loop_correction && time < options.loop_end_time) {
            const size_t first_point = data.segmentAt(curve.base_segment_index).base_point_index;
            return correctEndPoint(data, data.segmentAt(end_segment - 1), first_point, last_point,
                                   time, options.loop_end_time);
        }

        return data.pointAt(last_point).value;
    }

} // namespace mrn::motion
