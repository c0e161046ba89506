/* SPDX-FileCopyrightText: 2025 Marionette Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "motion_data.hpp"
#include "interpolation.hpp"

#include <cassert>

namespace mrn::motion {

    const MotionCurve& MotionData::curveAt(size_t index) const {
        assert(index < curves_.size());
        return curves_[index];
    }

    const MotionSegment& MotionData::segmentAt(size_t index) const {
        assert(index < segments_.size());
        return segments_[index];
    }

    const MotionPoint& MotionData::pointAt(size_t index) const {
        assert(index < points_.size());
        return points_[index];
    }

    const MotionEvent& MotionData::eventAt(size_t index) const {
        assert(index < events_.size());
        return events_[index];
    }

    std::span<const MotionPoint> MotionData::segmentPoints(const MotionSegment& segment) const {
        const size_t count = segmentPointCount(segment.type);
        assert(segment.base_point_index + count <= points_.size());
        return std::span<const MotionPoint>(points_).subspan(segment.base_point_index, count);
    }

    std::pair<size_t, size_t> MotionData::curveRange(CurveTarget target) const {
        const size_t model_end = model_curve_count_;
        const size_t parameter_end = model_end + parameter_curve_count_;
        const size_t part_end = parameter_end + part_opacity_curve_count_;

        switch (target) {
        case CurveTarget::Model:
            return {0, model_end};
        case CurveTarget::Parameter:
            return {model_end, parameter_end};
        case CurveTarget::PartOpacity:
            return {parameter_end, part_end};
        }
        return {0, 0};
    }

    std::optional<size_t> MotionData::findCurve(const std::string& id) const {
        for (size_t i = 0; i < curves_.size(); ++i) {
            if (curves_[i].id == id) {
                return i;
            }
        }
        return std::nullopt;
    }

} // namespace mrn::motion
