/* SPDX-FileCopyrightText: 2025 DHResponse Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <cstdint>
#include <stdexcept>
#include <utility>
#include <string>

namespace dhr::core {

    enum class ErrorCode : uint8_t {
        USAGE = 0,        // ambiguous arguments, invalid batch parameters
        NOT_FOUND = 1,    // missing store key on read/delete
        STORAGE = 2,      // I/O failure on the backing file, checkpoint or restore
        PRECONDITION = 3  // a stage's input tensor is absent (pipeline ordering bug)
    };

    inline const char* error_code_name(const ErrorCode code) {
        switch (code) {
        case ErrorCode::USAGE: return "UsageError";
        case ErrorCode::NOT_FOUND: return "NotFoundError";
        case ErrorCode::STORAGE: return "StorageError";
        case ErrorCode::PRECONDITION: return "PreconditionError";
        default: return "Error";
        }
    }

    class Error : public std::runtime_error {
    public:
        Error(const ErrorCode code, const std::string& message)
            : std::runtime_error(message),
              code_(code) {}

        ErrorCode code() const noexcept { return code_; }

    private:
        ErrorCode code_;
    };

    class UsageError : public Error {
    public:
        explicit UsageError(const std::string& message) : Error(ErrorCode::USAGE, message) {}
    };

    class NotFoundError : public Error {
    public:
        explicit NotFoundError(std::string key)
            : Error(ErrorCode::NOT_FOUND, "Key not found in tensor store: '" + key + "'"),
              key_(std::move(key)) {}

        const std::string& key() const noexcept { return key_; }

    private:
        std::string key_;
    };

    class StorageError : public Error {
    public:
        StorageError(const std::string& message, std::string path = {})
            : Error(ErrorCode::STORAGE, path.empty() ? message : message + ": " + path),
              path_(std::move(path)) {}

        const std::string& path() const noexcept { return path_; }

    private:
        std::string path_;
    };

    class PreconditionError : public Error {
    public:
        PreconditionError(std::string stage, std::string key)
            : Error(ErrorCode::PRECONDITION,
                    "Stage '" + stage + "' requires tensor '" + key + "', which has not been produced"),
              stage_(std::move(stage)),
              key_(std::move(key)) {}

        const std::string& stage() const noexcept { return stage_; }
        const std::string& key() const noexcept { return key_; }

    private:
        std::string stage_;
        std::string key_;
    };

} // namespace dhr::core
