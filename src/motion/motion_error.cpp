/* SPDX-FileCopyrightText: 2025 Marionette Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "motion_error.hpp"

namespace mrn::motion {

    const char* toString(const MotionErrorCode code) {
        switch (code) {
        case MotionErrorCode::MalformedAsset:
            return "malformed asset";
        case MotionErrorCode::InvalidJson:
            return "invalid json";
        case MotionErrorCode::FileNotFound:
            return "file not found";
        }
        return "unknown error";
    }

    std::string MotionError::format() const {
        return std::string(toString(code)) + ": " + message;
    }

} // namespace mrn::motion
