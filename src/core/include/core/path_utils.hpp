/* SPDX-FileCopyrightText: 2025 Marionette Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <string>

namespace mrn::core {

    /**
     * @brief Convert filesystem path to a UTF-8 string for log messages
     *
     * On Windows the native representation is wide; u8string() performs the conversion.
     * On Linux/Mac the native encoding is already UTF-8.
     */
    inline std::string path_to_utf8(const std::filesystem::path& p) {
#ifdef _WIN32
        const auto u8 = p.u8string();
        return std::string(u8.begin(), u8.end());
#else
        return p.string();
#endif
    }

    inline bool open_file_for_read(
        const std::filesystem::path& path,
        std::ios_base::openmode mode,
        std::ifstream& stream) {
#ifdef _WIN32
        stream.open(path.wstring(), mode);
#else
        stream.open(path, mode);
#endif
        return stream.is_open();
    }

    // Whole file as a string, nullopt if it cannot be opened
    inline std::optional<std::string> read_text_file(const std::filesystem::path& path) {
        std::ifstream file;
        if (!open_file_for_read(path, std::ios::in | std::ios::binary, file)) {
            return std::nullopt;
        }
        return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    }

} // namespace mrn::core
