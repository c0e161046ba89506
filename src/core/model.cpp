/* SPDX-FileCopyrightText: 2025 Marionette Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/model.hpp"

#include <algorithm>
#include <atomic>
#include <cassert>
#include <cmath>
#include <utility>

namespace mrn::core {

    namespace {
        uint64_t nextRevision() {
            static std::atomic<uint64_t> counter{0};
            return counter.fetch_add(1, std::memory_order_relaxed) + 1;
        }
    } // namespace

    Model::Model() : revision_(nextRevision()) {}

    Model::Model(Model&& other) noexcept
        : parameters_(std::move(other.parameters_)),
          values_(std::move(other.values_)),
          saved_values_(std::move(other.saved_values_)),
          parameter_lookup_(std::move(other.parameter_lookup_)),
          part_ids_(std::move(other.part_ids_)),
          part_opacities_(std::move(other.part_opacities_)),
          part_lookup_(std::move(other.part_lookup_)),
          model_opacity_(other.model_opacity_),
          revision_(other.revision_) {
        other.clear();
    }

    Model& Model::operator=(Model&& other) noexcept {
        if (this != &other) {
            parameters_ = std::move(other.parameters_);
            values_ = std::move(other.values_);
            saved_values_ = std::move(other.saved_values_);
            parameter_lookup_ = std::move(other.parameter_lookup_);
            part_ids_ = std::move(other.part_ids_);
            part_opacities_ = std::move(other.part_opacities_);
            part_lookup_ = std::move(other.part_lookup_);
            model_opacity_ = other.model_opacity_;
            revision_ = other.revision_;
            other.clear();
        }
        return *this;
    }

    void Model::clear() noexcept {
        parameters_.clear();
        values_.clear();
        saved_values_.clear();
        parameter_lookup_.clear();
        part_ids_.clear();
        part_opacities_.clear();
        part_lookup_.clear();
        model_opacity_ = 1.0f;
        revision_ = nextRevision();
    }

    size_t Model::addParameter(const ParameterInfo& info) {
        if (const auto it = parameter_lookup_.find(info.id); it != parameter_lookup_.end()) {
            return it->second;
        }

        const size_t index = parameters_.size();
        parameters_.push_back(info);
        values_.push_back(info.default_value);
        parameter_lookup_[info.id] = index;
        revision_ = nextRevision();
        return index;
    }

    size_t Model::addPart(const std::string& id, float opacity) {
        if (const auto it = part_lookup_.find(id); it != part_lookup_.end()) {
            return it->second;
        }

        const size_t index = part_ids_.size();
        part_ids_.push_back(id);
        part_opacities_.push_back(opacity);
        part_lookup_[id] = index;
        revision_ = nextRevision();
        return index;
    }

    std::optional<size_t> Model::parameterIndex(const std::string& id) const {
        const auto it = parameter_lookup_.find(id);
        if (it == parameter_lookup_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::optional<size_t> Model::partIndex(const std::string& id) const {
        const auto it = part_lookup_.find(id);
        if (it == part_lookup_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    const ParameterInfo& Model::parameter(size_t index) const {
        assert(index < parameters_.size());
        return parameters_[index];
    }

    const std::string& Model::partId(size_t index) const {
        assert(index < part_ids_.size());
        return part_ids_[index];
    }

    float Model::parameterValue(size_t index) const {
        assert(index < values_.size());
        return values_[index];
    }

    std::optional<float> Model::parameterValue(const std::string& id) const {
        const auto index = parameterIndex(id);
        if (!index) {
            return std::nullopt;
        }
        return values_[*index];
    }

    void Model::setParameterValue(size_t index, float value, float weight) {
        assert(index < values_.size());
        value = constrain(index, value);
        values_[index] = weight == 1.0f ? value : values_[index] * (1.0f - weight) + value * weight;
    }

    void Model::addParameterValue(size_t index, float value, float weight) {
        assert(index < values_.size());
        setParameterValue(index, values_[index] + value * weight);
    }

    bool Model::setParameterValue(const std::string& id, float value, float weight) {
        const auto index = parameterIndex(id);
        if (!index) {
            return false;
        }
        setParameterValue(*index, value, weight);
        return true;
    }

    bool Model::addParameterValue(const std::string& id, float value, float weight) {
        const auto index = parameterIndex(id);
        if (!index) {
            return false;
        }
        addParameterValue(*index, value, weight);
        return true;
    }

    float Model::partOpacity(size_t index) const {
        assert(index < part_opacities_.size());
        return part_opacities_[index];
    }

    void Model::setPartOpacity(size_t index, float opacity) {
        assert(index < part_opacities_.size());
        part_opacities_[index] = opacity;
    }

    void Model::addPartOpacity(size_t index, float opacity) {
        assert(index < part_opacities_.size());
        part_opacities_[index] += opacity;
    }

    void Model::resetParameters() {
        for (size_t i = 0; i < parameters_.size(); ++i) {
            values_[i] = parameters_[i].default_value;
        }
    }

    void Model::saveParameters() { saved_values_ = values_; }

    void Model::loadParameters() {
        // Parameters added after the snapshot keep their current value
        const size_t count = std::min(saved_values_.size(), values_.size());
        std::copy_n(saved_values_.begin(), count, values_.begin());
    }

    float Model::constrain(size_t index, float value) const {
        const ParameterInfo& info = parameters_[index];
        if (!info.repeat) {
            return std::clamp(value, info.minimum, info.maximum);
        }

        const float range = info.maximum - info.minimum;
        if (range <= 0.0f) {
            return info.minimum;
        }
        if (value > info.maximum) {
            return info.minimum + std::fmod(value - info.maximum, range);
        }
        if (value < info.minimum) {
            return info.maximum - std::fmod(info.minimum - value, range);
        }
        return value;
    }

} // namespace mrn::core
