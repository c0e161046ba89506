/* SPDX-FileCopyrightText: 2025 Marionette Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <cstdint>
#include <string>

namespace mrn::motion {

    enum class MotionErrorCode : uint8_t {
        MalformedAsset, // structure or counts inconsistent with the declared metadata
        InvalidJson,    // not JSON, or a value of the wrong type
        FileNotFound
    };

    struct MotionError {
        MotionErrorCode code = MotionErrorCode::MalformedAsset;
        std::string message;

        [[nodiscard]] std::string format() const;
    };

    [[nodiscard]] const char* toString(MotionErrorCode code);

} // namespace mrn::motion
