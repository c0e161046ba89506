/* SPDX-FileCopyrightText: 2025 Marionette Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/model.hpp"
#include "motion_config.hpp"
#include "motion_data.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace mrn::motion {

    /**
     * @brief Memoized resolution of a motion's ids against one model
     *
     * Resolves every Parameter/PartOpacity curve to a model index, its additive
     * flag and its eye-blink/lip-sync slot, plus the model index of each overlay
     * target. bind() is cheap when nothing changed; it rebuilds when the model's
     * revision differs, or after invalidate(). Revisions are unique per model
     * instance and table state, so a different model never matches.
     */
    class ParameterBinding {
    public:
        void bind(const MotionData& data, const MotionConfig& config, const core::Model& model);
        void invalidate() { valid_ = false; }

        [[nodiscard]] bool isBoundTo(const core::Model& model) const {
            return valid_ && revision_ == model.revision();
        }

        // Parameter index for Parameter curves, part index for PartOpacity curves
        [[nodiscard]] std::optional<size_t> targetIndex(size_t curve_index) const { return curves_[curve_index].index; }
        [[nodiscard]] bool isAdditive(size_t curve_index) const { return curves_[curve_index].additive; }

        // Position of the curve's id in the eye-blink / lip-sync id lists
        [[nodiscard]] std::optional<size_t> eyeBlinkSlot(size_t curve_index) const { return curves_[curve_index].eye_blink_slot; }
        [[nodiscard]] std::optional<size_t> lipSyncSlot(size_t curve_index) const { return curves_[curve_index].lip_sync_slot; }

        [[nodiscard]] const std::vector<std::optional<size_t>>& eyeBlinkTargets() const { return eye_blink_targets_; }
        [[nodiscard]] const std::vector<std::optional<size_t>>& lipSyncTargets() const { return lip_sync_targets_; }

    private:
        struct CurveBinding {
            std::optional<size_t> index;
            bool additive = false;
            std::optional<size_t> eye_blink_slot;
            std::optional<size_t> lip_sync_slot;
        };

        std::vector<CurveBinding> curves_;
        std::vector<std::optional<size_t>> eye_blink_targets_;
        std::vector<std::optional<size_t>> lip_sync_targets_;

        uint64_t revision_ = 0;
        bool valid_ = false;
    };

} // namespace mrn::motion
