/* SPDX-FileCopyrightText: 2025 DHResponse Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/error.hpp"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

namespace dhr::core {

    /**
     * @brief Open an output file stream in binary mode
     *
     * @param path The filesystem path to open
     * @param[out] stream Reference to store the opened ofstream
     * @return true if the file was opened successfully, false otherwise
     */
    inline bool open_file_for_write(
        const std::filesystem::path& path,
        std::ofstream& stream) {
        stream.open(path, std::ios::out | std::ios::binary | std::ios::trunc);
        return stream.is_open();
    }

    inline bool open_file_for_read(
        const std::filesystem::path& path,
        std::ifstream& stream) {
        stream.open(path, std::ios::in | std::ios::binary);
        return stream.is_open();
    }

    /**
     * @brief Default scratch directory: $TMPDIR if set, otherwise the system temp directory
     */
    inline std::filesystem::path default_scratch_dir() {
        if (const char* env = std::getenv("TMPDIR"); env && *env) {
            return std::filesystem::path(env);
        }
        return std::filesystem::temp_directory_path();
    }

    /**
     * @brief Create a new, empty, uniquely named file inside @p dir
     *
     * The file is created atomically (mkstemp) so two stores never race for
     * the same scratch name. The caller owns the returned path.
     *
     * @throws StorageError if the directory is unusable
     */
    inline std::filesystem::path make_unique_scratch_file(
        const std::filesystem::path& dir,
        const std::string& prefix) {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            throw StorageError("Cannot create scratch directory (" + ec.message() + ")", dir.string());
        }

        std::string pattern = (dir / (prefix + "XXXXXX")).string();
        const int fd = ::mkstemp(pattern.data());
        if (fd < 0) {
            throw StorageError(std::string("Cannot create scratch file (") + std::strerror(errno) + ")",
                               pattern);
        }
        ::close(fd);
        return std::filesystem::path(pattern);
    }

} // namespace dhr::core
