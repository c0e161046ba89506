/* SPDX-FileCopyrightText: 2025 Marionette Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "interpolation.hpp"

#include <algorithm>
#include <array>
#include <cassert>
#include <cmath>
#include <glm/common.hpp>
#include <glm/gtc/constants.hpp>

namespace mrn::motion {

    namespace {
        constexpr float CARDANO_EPSILON = 0.00001f;
        constexpr float BISECTION_X_ERROR = 0.01f;
        constexpr int BISECTION_MAX_ITERATIONS = 20;

        MotionPoint lerpPoints(const MotionPoint& a, const MotionPoint& b, float t) {
            return {std::lerp(a.time, b.time, t), std::lerp(a.value, b.value, t)};
        }

        // Three rounds of linear interpolation over the four control points
        float deCasteljau(std::span<const MotionPoint> points, float t) {
            const MotionPoint p01 = lerpPoints(points[0], points[1], t);
            const MotionPoint p12 = lerpPoints(points[1], points[2], t);
            const MotionPoint p23 = lerpPoints(points[2], points[3], t);

            const MotionPoint p012 = lerpPoints(p01, p12, t);
            const MotionPoint p123 = lerpPoints(p12, p23, t);

            return lerpPoints(p012, p123, t).value;
        }

        float quadraticEquation(float a, float b, float c) {
            if (std::abs(a) < CARDANO_EPSILON) {
                if (std::abs(b) < CARDANO_EPSILON) {
                    return -c;
                }
                return -c / b;
            }
            const float discriminant = std::max(b * b - 4.0f * a * c, 0.0f);
            return -(b + std::sqrt(discriminant)) / (2.0f * a);
        }

        using EvaluateFn = float (*)(std::span<const MotionPoint>, float);

        // Indexed by SegmentEvaluator
        constexpr std::array<EvaluateFn, 6> EVALUATORS = {
            &linearEvaluate,
            &steppedEvaluate,
            &inverseSteppedEvaluate,
            &bezierEvaluate,
            &bezierEvaluateBinarySearch,
            &bezierEvaluateCardano,
        };
    } // namespace

    float easeSine(const float x) {
        return std::sin(glm::clamp(x, 0.0f, 1.0f) * glm::half_pi<float>());
    }

    SegmentEvaluator evaluatorFor(const SegmentType type, const BezierEvaluation bezier) {
        switch (type) {
        case SegmentType::Linear:
            return SegmentEvaluator::Linear;
        case SegmentType::Stepped:
            return SegmentEvaluator::Stepped;
        case SegmentType::InverseStepped:
            return SegmentEvaluator::InverseStepped;
        case SegmentType::Bezier:
            switch (bezier) {
            case BezierEvaluation::DeCasteljau:
                return SegmentEvaluator::BezierDeCasteljau;
            case BezierEvaluation::BinarySearch:
                return SegmentEvaluator::BezierBinarySearch;
            case BezierEvaluation::Cardano:
                return SegmentEvaluator::BezierCardano;
            }
            break;
        }
        return SegmentEvaluator::Linear;
    }

    float linearEvaluate(std::span<const MotionPoint> points, const float time) {
        // No upper clamp: the loop correction path extrapolates slightly past the segment
        float t = (time - points[0].time) / (points[1].time - points[0].time);
        if (t < 0.0f) {
            t = 0.0f;
        }
        return std::lerp(points[0].value, points[1].value, t);
    }

    float steppedEvaluate(std::span<const MotionPoint> points, float /*time*/) {
        return points[0].value;
    }

    float inverseSteppedEvaluate(std::span<const MotionPoint> points, float /*time*/) {
        return points[1].value;
    }

    float bezierEvaluate(std::span<const MotionPoint> points, const float time) {
        float t = (time - points[0].time) / (points[3].time - points[0].time);
        if (t < 0.0f) {
            t = 0.0f;
        }
        return deCasteljau(points, t);
    }

    float bezierEvaluateBinarySearch(std::span<const MotionPoint> points, const float time) {
        const float x = time;
        float x1 = points[0].time;
        float x2 = points[3].time;
        float cx1 = points[1].time;
        float cx2 = points[2].time;

        float ta = 0.0f;
        float tb = 1.0f;
        float t = 0.0f;
        int i = 0;

        for (; i < BISECTION_MAX_ITERATIONS; ++i) {
            if (x < x1 + BISECTION_X_ERROR) {
                t = ta;
                break;
            }
            if (x2 - BISECTION_X_ERROR < x) {
                t = tb;
                break;
            }

            // Split the x projection of the current sub-curve at its midpoint
            float center = (cx1 + cx2) * 0.5f;
            cx1 = (x1 + cx1) * 0.5f;
            cx2 = (x2 + cx2) * 0.5f;
            const float ctrl12 = (cx1 + center) * 0.5f;
            const float ctrl21 = (cx2 + center) * 0.5f;
            center = (ctrl12 + ctrl21) * 0.5f;

            if (x < center) {
                tb = (ta + tb) * 0.5f;
                if (center - BISECTION_X_ERROR < x) {
                    t = tb;
                    break;
                }
                x2 = center;
                cx2 = ctrl12;
            } else {
                ta = (ta + tb) * 0.5f;
                if (x < center + BISECTION_X_ERROR) {
                    t = ta;
                    break;
                }
                x1 = center;
                cx1 = ctrl21;
            }
        }

        if (i == BISECTION_MAX_ITERATIONS) {
            t = (ta + tb) * 0.5f;
        }

        return deCasteljau(points, glm::clamp(t, 0.0f, 1.0f));
    }

    float bezierEvaluateCardano(std::span<const MotionPoint> points, const float time) {
        const float x1 = points[0].time;
        const float x2 = points[3].time;
        const float cx1 = points[1].time;
        const float cx2 = points[2].time;

        // The root solve is not exact at the anchors
        if (time <= x1) {
            return points[0].value;
        }
        if (time >= x2) {
            return points[3].value;
        }

        const float a = x2 - 3.0f * cx2 + 3.0f * cx1 - x1;
        const float b = 3.0f * cx2 - 6.0f * cx1 + 3.0f * x1;
        const float c = 3.0f * cx1 - 3.0f * x1;
        const float d = x1 - time;

        return deCasteljau(points, cardanoAlgorithmForBezier(a, b, c, d));
    }

    float cardanoAlgorithmForBezier(const float a, const float b, const float c, const float d) {
        if (std::abs(a) < CARDANO_EPSILON) {
            return glm::clamp(quadraticEquation(b, c, d), 0.0f, 1.0f);
        }

        const float ba = b / a;
        const float ca = c / a;
        const float da = d / a;

        const float p = (3.0f * ca - ba * ba) / 3.0f;
        const float p3 = p / 3.0f;
        const float q = (2.0f * ba * ba * ba - 9.0f * ba * ca + 27.0f * da) / 27.0f;
        const float q2 = q / 2.0f;
        const float discriminant = q2 * q2 + p3 * p3 * p3;

        // Of several real roots, prefer the one that lies in [0, 1] (within a small margin)
        constexpr float center = 0.5f;
        constexpr float threshold = center + 0.01f;

        if (discriminant < 0.0f) {
            const float mp3 = -p / 3.0f;
            const float mp33 = mp3 * mp3 * mp3;
            const float r = std::sqrt(mp33);
            const float cos_phi = glm::clamp(-q / (2.0f * r), -1.0f, 1.0f);
            const float phi = std::acos(cos_phi);
            const float t1 = 2.0f * std::cbrt(r);

            const float root1 = t1 * std::cos(phi / 3.0f) - ba / 3.0f;
            if (std::abs(root1 - center) < threshold) {
                return glm::clamp(root1, 0.0f, 1.0f);
            }

            const float root2 = t1 * std::cos((phi + glm::two_pi<float>()) / 3.0f) - ba / 3.0f;
            if (std::abs(root2 - center) < threshold) {
                return glm::clamp(root2, 0.0f, 1.0f);
            }

            const float root3 = t1 * std::cos((phi + 2.0f * glm::two_pi<float>()) / 3.0f) - ba / 3.0f;
            return glm::clamp(root3, 0.0f, 1.0f);
        }

        if (discriminant == 0.0f) {
            const float u1 = q2 < 0.0f ? std::cbrt(-q2) : -std::cbrt(q2);

            const float root1 = 2.0f * u1 - ba / 3.0f;
            if (std::abs(root1 - center) < threshold) {
                return glm::clamp(root1, 0.0f, 1.0f);
            }

            const float root2 = -u1 - ba / 3.0f;
            return glm::clamp(root2, 0.0f, 1.0f);
        }

        const float sd = std::sqrt(discriminant);
        const float u1 = std::cbrt(sd - q2);
        const float v1 = std::cbrt(sd + q2);
        const float root1 = u1 - v1 - ba / 3.0f;

        return glm::clamp(root1, 0.0f, 1.0f);
    }

    float evaluateSegment(const SegmentEvaluator evaluator, std::span<const MotionPoint> points, const float time) {
        const auto index = static_cast<size_t>(evaluator);
        assert(index < EVALUATORS.size());
        return EVALUATORS[index](points, time);
    }

} // namespace mrn::motion
