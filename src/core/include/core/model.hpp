/* SPDX-FileCopyrightText: 2025 Marionette Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/export.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace mrn::core {

    struct ParameterInfo {
        std::string id;
        float minimum = 0.0f;
        float maximum = 1.0f;
        float default_value = 0.0f;
        bool repeat = false; // wrap into [minimum, maximum] instead of clamping
    };

    /**
     * @brief Scalar parameter table of a deformable model
     *
     * Motions write into it once per frame. Parameters and parts are addressed by
     * index; ids are resolved once with parameterIndex()/partIndex(). revision()
     * is unique across all models of the process and changes whenever the
     * parameter or part table changes, so a cached id resolution is valid only
     * while the revision it was built against is current. Copies share the
     * revision along with the table; a moved-from model receives a fresh one.
     */
    class MRN_CORE_API Model {
    public:
        Model();
        Model(const Model&) = default;
        Model& operator=(const Model&) = default;
        Model(Model&& other) noexcept;
        Model& operator=(Model&& other) noexcept;

        // Returns the index of the parameter, the existing one if the id is already present
        size_t addParameter(const ParameterInfo& info);
        size_t addPart(const std::string& id, float opacity = 1.0f);

        [[nodiscard]] size_t parameterCount() const { return parameters_.size(); }
        [[nodiscard]] size_t partCount() const { return part_ids_.size(); }

        [[nodiscard]] std::optional<size_t> parameterIndex(const std::string& id) const;
        [[nodiscard]] std::optional<size_t> partIndex(const std::string& id) const;

        [[nodiscard]] const ParameterInfo& parameter(size_t index) const;
        [[nodiscard]] const std::string& partId(size_t index) const;

        [[nodiscard]] float parameterValue(size_t index) const;
        [[nodiscard]] std::optional<float> parameterValue(const std::string& id) const;

        // weight == 1 replaces the value, otherwise value = old * (1 - weight) + new * weight
        void setParameterValue(size_t index, float value, float weight = 1.0f);
        // value = old + new * weight
        void addParameterValue(size_t index, float value, float weight = 1.0f);

        // By id; returns false when the model has no such parameter
        bool setParameterValue(const std::string& id, float value, float weight = 1.0f);
        bool addParameterValue(const std::string& id, float value, float weight = 1.0f);

        [[nodiscard]] float partOpacity(size_t index) const;
        void setPartOpacity(size_t index, float opacity);
        void addPartOpacity(size_t index, float opacity);

        [[nodiscard]] float modelOpacity() const { return model_opacity_; }
        void setModelOpacity(float opacity) { model_opacity_ = opacity; }

        void resetParameters();
        void saveParameters();
        void loadParameters();

        [[nodiscard]] uint64_t revision() const { return revision_; }

    private:
        // Leaves an empty table under a fresh revision
        void clear() noexcept;

        [[nodiscard]] float constrain(size_t index, float value) const;

        std::vector<ParameterInfo> parameters_;
        std::vector<float> values_;
        std::vector<float> saved_values_;
        std::unordered_map<std::string, size_t> parameter_lookup_;

        std::vector<std::string> part_ids_;
        std::vector<float> part_opacities_;
        std::unordered_map<std::string, size_t> part_lookup_;

        float model_opacity_ = 1.0f;
        uint64_t revision_;
    };

} // namespace mrn::core
