/* SPDX-FileCopyrightText: 2025 Marionette Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace mrn::motion {

    inline constexpr const char* EFFECT_EYE_BLINK = "EyeBlink";
    inline constexpr const char* EFFECT_LIP_SYNC = "LipSync";
    inline constexpr const char* MODEL_OPACITY_ID = "Opacity";

    enum class CurveTarget : uint8_t { Model,
                                       Parameter,
                                       PartOpacity };

    // Numeric values are the codes used in the asset's segment stream
    enum class SegmentType : uint8_t { Linear = 0,
                                       Bezier = 1,
                                       Stepped = 2,
                                       InverseStepped = 3 };

    enum class BezierEvaluation : uint8_t {
        Cardano,     // closed-form cubic solve, time accurate
        DeCasteljau, // time fraction used as curve parameter (restricted / legacy assets)
        BinarySearch // bisection on the time axis, debug reference
    };

    // Evaluation routine bound to a segment when the asset is parsed
    enum class SegmentEvaluator : uint8_t { Linear,
                                            Stepped,
                                            InverseStepped,
                                            BezierDeCasteljau,
                                            BezierBinarySearch,
                                            BezierCardano };

    struct MotionPoint {
        float time = 0.0f;
        float value = 0.0f;
    };

    struct MotionSegment {
        SegmentType type = SegmentType::Linear;
        SegmentEvaluator evaluator = SegmentEvaluator::Linear;
        size_t base_point_index = 0;

        // Offset of the segment's end point from base_point_index
        [[nodiscard]] size_t lastPointOffset() const { return type == SegmentType::Bezier ? 3 : 1; }
    };

    struct MotionCurve {
        CurveTarget target = CurveTarget::Parameter;
        std::string id;
        size_t base_segment_index = 0;
        size_t segment_count = 0;
        float fade_in_time = -1.0f;  // < 0: use the motion fade, 0: instant
        float fade_out_time = -1.0f; // < 0: use the motion fade, 0: instant
    };

    struct MotionEvent {
        float fire_time = 0.0f;
        std::string value;
    };

} // namespace mrn::motion
