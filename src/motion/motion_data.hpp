/* SPDX-FileCopyrightText: 2025 Marionette Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "motion_error.hpp"
#include "motion_types.hpp"

#include <expected>
#include <filesystem>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace mrn::motion {

    struct MotionParseOptions {
        // Evaluate every bezier with De Casteljau regardless of AreBeziersRestricted,
        // reproducing motions authored for the old bezier handling
        bool legacy_beziers = false;
    };

    /**
     * @brief Flattened, immutable curve data of one motion asset
     *
     * Curves index a contiguous run of segments, segments index their first point.
     * Adjacent segments of a curve share the boundary point. Curves are grouped by
     * target: all Model curves, then Parameter curves, then PartOpacity curves.
     *
     * Instances are created by the parse functions only and are meant to be shared
     * read-only (std::shared_ptr<const MotionData>) between motions playing the same clip.
     */
    class MotionData {
    public:
        MotionData() = default;

        /**
         * @brief Build from a parsed motion document
         *
         * Expected layout: Meta{Duration, Fps, Loop, CurveCount, TotalSegmentCount,
         * TotalPointCount, UserDataCount, FadeInTime, FadeOutTime, AreBeziersRestricted},
         * Curves[]{Target, Id, FadeInTime, FadeOutTime, Segments[]}, UserData[]{Time, Value}.
         */
        [[nodiscard]] static std::expected<MotionData, MotionError> fromJson(
            const nlohmann::json& j, const MotionParseOptions& options = {});

        [[nodiscard]] static std::expected<MotionData, MotionError> parse(
            std::string_view text, const MotionParseOptions& options = {});

        [[nodiscard]] float duration() const { return duration_; }
        [[nodiscard]] float fps() const { return fps_; }
        [[nodiscard]] bool isLoop() const { return loop_; }
        [[nodiscard]] float fadeInSeconds() const { return fade_in_seconds_; }
        [[nodiscard]] float fadeOutSeconds() const { return fade_out_seconds_; }
        [[nodiscard]] bool areBeziersRestricted() const { return beziers_restricted_; }
        [[nodiscard]] bool hasExplicitFadeIn() const { return explicit_fade_in_; }
        [[nodiscard]] bool hasExplicitFadeOut() const { return explicit_fade_out_; }

        [[nodiscard]] bool empty() const { return curves_.empty(); }

        [[nodiscard]] size_t curveCount() const { return curves_.size(); }
        [[nodiscard]] size_t segmentCount() const { return segments_.size(); }
        [[nodiscard]] size_t pointCount() const { return points_.size(); }
        [[nodiscard]] size_t eventCount() const { return events_.size(); }

        [[nodiscard]] const MotionCurve& curveAt(size_t index) const;
        [[nodiscard]] const MotionSegment& segmentAt(size_t index) const;
        [[nodiscard]] const MotionPoint& pointAt(size_t index) const;
        [[nodiscard]] const MotionEvent& eventAt(size_t index) const;

        [[nodiscard]] const std::vector<MotionCurve>& curves() const { return curves_; }
        [[nodiscard]] const std::vector<MotionEvent>& events() const { return events_; }

        // Control points of a segment, starting at its base point
        [[nodiscard]] std::span<const MotionPoint> segmentPoints(const MotionSegment& segment) const;

        // Half-open [first, last) range of curve indices with the given target
        [[nodiscard]] std::pair<size_t, size_t> curveRange(CurveTarget target) const;

        // First curve with the given id, any target
        [[nodiscard]] std::optional<size_t> findCurve(const std::string& id) const;

    private:
        friend class MotionDataParser;

        float duration_ = 0.0f;
        float fps_ = 30.0f;
        bool loop_ = false;
        float fade_in_seconds_ = 1.0f;
        float fade_out_seconds_ = 1.0f;
        bool explicit_fade_in_ = false;
        bool explicit_fade_out_ = false;
        bool beziers_restricted_ = false;

        std::vector<MotionCurve> curves_;
        std::vector<MotionSegment> segments_;
        std::vector<MotionPoint> points_;
        std::vector<MotionEvent> events_;

        // Number of curves per target group, in group order
        size_t model_curve_count_ = 0;
        size_t parameter_curve_count_ = 0;
        size_t part_opacity_curve_count_ = 0;
    };

    [[nodiscard]] std::expected<MotionData, MotionError> loadMotionFile(
        const std::filesystem::path& path, const MotionParseOptions& options = {});

} // namespace mrn::motion
