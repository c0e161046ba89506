/* SPDX-FileCopyrightText: 2025 Marionette Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "parameter_binding.hpp"
#include "core/logger.hpp"

#include <algorithm>

namespace mrn::motion {

    namespace {

        std::optional<size_t> slotOf(const std::vector<std::string>& ids, const std::string& id) {
            const auto it = std::find(ids.begin(), ids.end(), id);
            if (it == ids.end()) {
                return std::nullopt;
            }
            return static_cast<size_t>(it - ids.begin());
        }

        bool contains(const std::vector<std::string>& ids, const std::string& id) {
            return std::find(ids.begin(), ids.end(), id) != ids.end();
        }

        std::vector<std::optional<size_t>> resolveParameters(const std::vector<std::string>& ids,
                                                             const core::Model& model) {
            std::vector<std::optional<size_t>> indices;
            indices.reserve(ids.size());
            for (const auto& id : ids) {
                indices.push_back(model.parameterIndex(id));
            }
            return indices;
        }

    } // namespace

    void ParameterBinding::bind(const MotionData& data, const MotionConfig& config, const core::Model& model) {
        if (isBoundTo(model) && curves_.size() == data.curveCount()) {
            return;
        }

        curves_.assign(data.curveCount(), CurveBinding{});
        size_t unresolved = 0;

        const auto [param_begin, param_end] = data.curveRange(CurveTarget::Parameter);
        for (size_t c = param_begin; c < param_end; ++c) {
            const std::string& id = data.curveAt(c).id;
            CurveBinding& binding = curves_[c];

            binding.index = model.parameterIndex(id);
            if (!binding.index) {
                LOG_TRACE("Motion parameter '{}' not present in model, skipped", id);
                ++unresolved;
                continue;
            }
            binding.additive = contains(config.additive_parameter_ids, id);
            binding.eye_blink_slot = slotOf(config.eye_blink_ids, id);
            binding.lip_sync_slot = slotOf(config.lip_sync_ids, id);
        }

        const auto [part_begin, part_end] = data.curveRange(CurveTarget::PartOpacity);
        for (size_t c = part_begin; c < part_end; ++c) {
            const std::string& id = data.curveAt(c).id;
            CurveBinding& binding = curves_[c];

            binding.index = model.partIndex(id);
            if (!binding.index) {
                LOG_TRACE("Motion part '{}' not present in model, skipped", id);
                ++unresolved;
                continue;
            }
            binding.additive = contains(config.additive_part_ids, id);
        }

        eye_blink_targets_ = resolveParameters(config.eye_blink_ids, model);
        lip_sync_targets_ = resolveParameters(config.lip_sync_ids, model);

        revision_ = model.revision();
        valid_ = true;

        LOG_TRACE("Bound motion to model: {} curves, {} unresolved", data.curveCount(), unresolved);
    }

} // namespace mrn::motion
