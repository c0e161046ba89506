/* SPDX-FileCopyrightText: 2025 Marionette Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/logger.hpp"
#include "core/path_utils.hpp"
#include "interpolation.hpp"
#include "motion_data.hpp"

#include <algorithm>
#include <cmath>
#include <initializer_list>
#include <nlohmann/json.hpp>
#include <string>

namespace mrn::motion {

    using json = nlohmann::json;

    namespace {

        constexpr const char* TARGET_MODEL = "Model";
        constexpr const char* TARGET_PARAMETER = "Parameter";
        constexpr const char* TARGET_PART_OPACITY = "PartOpacity";

        // Used when Meta has no (or a negative) fade time
        constexpr float DEFAULT_FADE_SECONDS = 1.0f;

        std::unexpected<MotionError> malformed(std::string message) {
            LOG_ERROR("Malformed motion asset: {}", message);
            return std::unexpected(MotionError{MotionErrorCode::MalformedAsset, std::move(message)});
        }

        std::unexpected<MotionError> invalidJson(std::string message) {
            LOG_ERROR("Invalid motion json: {}", message);
            return std::unexpected(MotionError{MotionErrorCode::InvalidJson, std::move(message)});
        }

        std::optional<CurveTarget> parseTarget(const std::string& name) {
            if (name == TARGET_MODEL)
                return CurveTarget::Model;
            if (name == TARGET_PARAMETER)
                return CurveTarget::Parameter;
            if (name == TARGET_PART_OPACITY)
                return CurveTarget::PartOpacity;
            return std::nullopt;
        }

        std::optional<SegmentType> parseSegmentType(const float code) {
            if (!(code >= 0.0f && code <= 3.0f) || code != std::floor(code)) {
                return std::nullopt;
            }
            switch (static_cast<int>(code)) {
            case 0:
                return SegmentType::Linear;
            case 1:
                return SegmentType::Bezier;
            case 2:
                return SegmentType::Stepped;
            case 3:
                return SegmentType::InverseStepped;
            default:
                return std::nullopt;
            }
        }

        std::optional<float> optionalNumber(const json& object, const char* key) {
            const auto it = object.find(key);
            if (it == object.end() || it->is_null()) {
                return std::nullopt;
            }
            return it->get<float>();
        }

        bool isNegativeCount(const json& object, const char* key) {
            const auto it = object.find(key);
            return it != object.end() && it->is_number() && it->get<double>() < 0.0;
        }

        std::optional<size_t> optionalCount(const json& object, const char* key) {
            const auto it = object.find(key);
            if (it == object.end() || it->is_null()) {
                return std::nullopt;
            }
            const auto count = it->get<int64_t>();
            if (count < 0) {
                return std::nullopt;
            }
            return static_cast<size_t>(count);
        }

        // Fade times in Meta: absent or negative means the default
        float metaFade(const std::optional<float>& value) {
            return value && *value >= 0.0f ? *value : DEFAULT_FADE_SECONDS;
        }

    } // namespace

    class MotionDataParser {
    public:
        static std::expected<MotionData, MotionError> parse(const json& j, const MotionParseOptions& options) {
            if (!j.is_object()) {
                return invalidJson("motion document must be an object");
            }

            const auto meta_it = j.find("Meta");
            if (meta_it == j.end() || !meta_it->is_object()) {
                return malformed("missing Meta");
            }
            const json& meta = *meta_it;

            MotionData data;

            for (const char* key : {"CurveCount", "TotalSegmentCount", "TotalPointCount", "UserDataCount"}) {
                if (isNegativeCount(meta, key)) {
                    return malformed(std::string("Meta.") + key + " must not be negative");
                }
            }

            const auto duration = optionalNumber(meta, "Duration");
            const auto fps = optionalNumber(meta, "Fps");
            const auto curve_count = optionalCount(meta, "CurveCount");
            const auto total_segment_count = optionalCount(meta, "TotalSegmentCount");
            const auto total_point_count = optionalCount(meta, "TotalPointCount");

            if (!duration)
                return malformed("Meta.Duration is required");
            if (!fps)
                return malformed("Meta.Fps is required");
            if (!curve_count)
                return malformed("Meta.CurveCount is required");
            if (!total_segment_count)
                return malformed("Meta.TotalSegmentCount is required");
            if (!total_point_count)
                return malformed("Meta.TotalPointCount is required");
            if (*fps <= 0.0f)
                return malformed("Meta.Fps must be positive");
            if (*duration < 0.0f)
                return malformed("Meta.Duration must not be negative");

            data.duration_ = *duration;
            data.fps_ = *fps;
            data.loop_ = meta.value("Loop", false);
            data.beziers_restricted_ = meta.value("AreBeziersRestricted", false);

            const auto fade_in = optionalNumber(meta, "FadeInTime");
            const auto fade_out = optionalNumber(meta, "FadeOutTime");
            data.fade_in_seconds_ = metaFade(fade_in);
            data.fade_out_seconds_ = metaFade(fade_out);
            data.explicit_fade_in_ = fade_in.has_value();
            data.explicit_fade_out_ = fade_out.has_value();

            const auto curves_it = j.find("Curves");
            if (curves_it == j.end() || !curves_it->is_array()) {
                return malformed("missing Curves");
            }
            if (curves_it->size() != *curve_count) {
                return malformed("Meta.CurveCount is " + std::to_string(*curve_count) + " but " +
                                 std::to_string(curves_it->size()) + " curves are present");
            }

            const BezierEvaluation bezier_mode = (data.beziers_restricted_ || options.legacy_beziers)
                                                     ? BezierEvaluation::DeCasteljau
                                                     : BezierEvaluation::Cardano;

            data.curves_.reserve(*curve_count);
            data.segments_.reserve(*total_segment_count);
            data.points_.reserve(*total_point_count);

            CurveTarget previous_target = CurveTarget::Model;
            for (const auto& curve_json : *curves_it) {
                if (auto result = parseCurve(data, curve_json, bezier_mode, previous_target); !result) {
                    return std::unexpected(result.error());
                }
                previous_target = data.curves_.back().target;
            }

            if (data.segments_.size() != *total_segment_count) {
                return malformed("Meta.TotalSegmentCount is " + std::to_string(*total_segment_count) + " but " +
                                 std::to_string(data.segments_.size()) + " segments were parsed");
            }
            if (data.points_.size() != *total_point_count) {
                return malformed("Meta.TotalPointCount is " + std::to_string(*total_point_count) + " but " +
                                 std::to_string(data.points_.size()) + " points were parsed");
            }

            if (auto result = parseEvents(data, j, meta); !result) {
                return std::unexpected(result.error());
            }

            LOG_DEBUG("Parsed motion: {} curves ({} model, {} parameter, {} part), {} segments, {} points, "
                      "{} events, duration {:.3f}s, loop {}",
                      data.curves_.size(), data.model_curve_count_, data.parameter_curve_count_,
                      data.part_opacity_curve_count_, data.segments_.size(), data.points_.size(),
                      data.events_.size(), data.duration_, data.loop_);

            return data;
        }

    private:
        static std::expected<void, MotionError> parseCurve(MotionData& data, const json& curve_json,
                                                           const BezierEvaluation bezier_mode,
                                                           const CurveTarget previous_target) {
            MotionCurve curve;

            const std::string target_name = curve_json.at("Target").get<std::string>();
            const auto target = parseTarget(target_name);
            if (!target) {
                return malformed("unknown curve target '" + target_name + "'");
            }
            curve.target = *target;
            curve.id = curve_json.at("Id").get<std::string>();

            // Model, Parameter and PartOpacity curves must come in that order
            if (static_cast<int>(curve.target) < static_cast<int>(previous_target)) {
                return malformed("curve '" + curve.id + "' breaks the Model/Parameter/PartOpacity grouping");
            }

            curve.fade_in_time = optionalNumber(curve_json, "FadeInTime").value_or(-1.0f);
            curve.fade_out_time = optionalNumber(curve_json, "FadeOutTime").value_or(-1.0f);

            const std::vector<float> stream = curve_json.at("Segments").get<std::vector<float>>();
            if (stream.size() < 2) {
                return malformed("curve '" + curve.id + "' has no points");
            }

            curve.base_segment_index = data.segments_.size();

            data.points_.push_back({stream[0], stream[1]});
            float anchor_time = stream[0];
            size_t position = 2;

            while (position < stream.size()) {
                const auto type = parseSegmentType(stream[position]);
                if (!type) {
                    return malformed("curve '" + curve.id + "' has unknown segment type code " +
                                     std::to_string(stream[position]));
                }

                const size_t new_points = segmentPointCount(*type) - 1;
                if (position + 1 + new_points * 2 > stream.size()) {
                    return malformed("curve '" + curve.id + "' has a truncated segment stream");
                }

                MotionSegment segment;
                segment.type = *type;
                segment.evaluator = evaluatorFor(*type, bezier_mode);
                segment.base_point_index = data.points_.size() - 1;

                for (size_t p = 0; p < new_points; ++p) {
                    const size_t offset = position + 1 + p * 2;
                    data.points_.push_back({stream[offset], stream[offset + 1]});
                }

                // Bezier control points may leave the segment's time span, anchors may not go back
                const float end_time = data.points_.back().time;
                if (end_time < anchor_time) {
                    return malformed("curve '" + curve.id + "' has decreasing point times");
                }
                anchor_time = end_time;

                data.segments_.push_back(segment);
                position += 1 + new_points * 2;
            }

            curve.segment_count = data.segments_.size() - curve.base_segment_index;
            if (curve.segment_count == 0) {
                return malformed("curve '" + curve.id + "' has no segments");
            }

            switch (curve.target) {
            case CurveTarget::Model:
                ++data.model_curve_count_;
                break;
            case CurveTarget::Parameter:
                ++data.parameter_curve_count_;
                break;
            case CurveTarget::PartOpacity:
                ++data.part_opacity_curve_count_;
                break;
            }

            data.curves_.push_back(std::move(curve));
            return {};
        }

        static std::expected<void, MotionError> parseEvents(MotionData& data, const json& j, const json& meta) {
            const size_t declared = optionalCount(meta, "UserDataCount").value_or(0);
            const auto user_data_it = j.find("UserData");

            if (user_data_it == j.end() || user_data_it->is_null()) {
                if (declared != 0) {
                    return malformed("Meta.UserDataCount is " + std::to_string(declared) + " but UserData is missing");
                }
                return {};
            }
            if (!user_data_it->is_array()) {
                return invalidJson("UserData must be an array");
            }
            if (user_data_it->size() != declared) {
                return malformed("Meta.UserDataCount is " + std::to_string(declared) + " but " +
                                 std::to_string(user_data_it->size()) + " entries are present");
            }

            data.events_.reserve(declared);
            for (const auto& entry : *user_data_it) {
                MotionEvent event;
                event.fire_time = entry.at("Time").get<float>();
                event.value = entry.at("Value").get<std::string>();

                if (event.fire_time < 0.0f || event.fire_time > data.duration_) {
                    LOG_WARN("Motion event '{}' at {:.3f}s lies outside [0, {:.3f}]",
                             event.value, event.fire_time, data.duration_);
                }
                data.events_.push_back(std::move(event));
            }

            std::stable_sort(data.events_.begin(), data.events_.end(),
                             [](const MotionEvent& a, const MotionEvent& b) { return a.fire_time < b.fire_time; });
            return {};
        }
    };

    std::expected<MotionData, MotionError> MotionData::fromJson(const json& j, const MotionParseOptions& options) {
        try {
            return MotionDataParser::parse(j, options);
        } catch (const json::exception& e) {
            return invalidJson(e.what());
        }
    }

    std::expected<MotionData, MotionError> MotionData::parse(std::string_view text, const MotionParseOptions& options) {
        json j;
        try {
            j = json::parse(text);
        } catch (const json::parse_error& e) {
            return invalidJson(e.what());
        }
        return fromJson(j, options);
    }

    std::expected<MotionData, MotionError> loadMotionFile(const std::filesystem::path& path,
                                                          const MotionParseOptions& options) {
        LOG_TIMER("Motion file loading");
        LOG_DEBUG("Loading motion: {}", core::path_to_utf8(path));

        const auto text = core::read_text_file(path);
        if (!text) {
            LOG_ERROR("Cannot open motion file: {}", core::path_to_utf8(path));
            return std::unexpected(MotionError{MotionErrorCode::FileNotFound, core::path_to_utf8(path)});
        }
        return MotionData::parse(*text, options);
    }

} // namespace mrn::motion
