/* SPDX-FileCopyrightText: 2025 DHResponse Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/path_utils.hpp"
#include "tensor_impl.hpp"
#include <format>
#include <fstream>
#include <utility>

namespace dhr::core {

    // Stream layout: magic, version, dtype, rank, numel, dims[rank], raw data.
    // All integers little-endian as laid out in memory.
    constexpr uint32_t TENSOR_FILE_MAGIC = 0x44484454; // "DHDT"
    constexpr uint32_t TENSOR_FILE_VERSION = 1;
    constexpr uint16_t TENSOR_FILE_MAX_RANK = 16;
    constexpr uint32_t TENSOR_RECORD_MAX_KEY = 1u << 16;

    namespace detail {

        template <typename T>
        void write_pod(std::ostream& os, const T& value) {
            os.write(reinterpret_cast<const char*>(&value), sizeof(value));
        }

        template <typename T>
        T read_pod(std::istream& is, const char* what) {
            T value{};
            is.read(reinterpret_cast<char*>(&value), sizeof(value));
            if (!is) {
                throw StorageError(std::format("Truncated tensor stream while reading {}", what));
            }
            return value;
        }

    } // namespace detail

    inline std::ostream& operator<<(std::ostream& os, const Tensor& tensor) {
        if (!tensor.is_valid()) {
            throw UsageError("Cannot serialize invalid tensor");
        }
        if (tensor.ndim() > TENSOR_FILE_MAX_RANK) {
            throw UsageError(std::format("Cannot serialize rank-{} tensor", tensor.ndim()));
        }

        detail::write_pod(os, TENSOR_FILE_MAGIC);
        detail::write_pod(os, TENSOR_FILE_VERSION);
        detail::write_pod(os, static_cast<uint8_t>(tensor.dtype()));
        detail::write_pod(os, static_cast<uint16_t>(tensor.ndim()));
        detail::write_pod(os, static_cast<uint64_t>(tensor.numel()));
        for (const size_t dim : tensor.shape().dims()) {
            detail::write_pod(os, static_cast<uint64_t>(dim));
        }
        os.write(reinterpret_cast<const char*>(tensor.data_ptr()), static_cast<std::streamsize>(tensor.bytes()));

        if (!os) {
            throw StorageError(std::format("Failed to write {} tensor {}", dtype_name(tensor.dtype()),
                                           tensor.shape().str()));
        }
        return os;
    }

    inline std::istream& operator>>(std::istream& is, Tensor& tensor) {
        if (detail::read_pod<uint32_t>(is, "magic") != TENSOR_FILE_MAGIC) {
            throw StorageError("Invalid tensor stream: wrong magic number");
        }
        if (const auto version = detail::read_pod<uint32_t>(is, "version"); version != TENSOR_FILE_VERSION) {
            throw StorageError(std::format("Unsupported tensor stream version {}", version));
        }
        const auto dtype = detail::read_pod<uint8_t>(is, "dtype");
        if (dtype > static_cast<uint8_t>(DataType::Float32)) {
            throw StorageError(std::format("Unsupported tensor dtype {}", dtype));
        }
        const auto rank = detail::read_pod<uint16_t>(is, "rank");
        if (rank > TENSOR_FILE_MAX_RANK) {
            throw StorageError(std::format("Corrupt tensor stream: rank {}", rank));
        }
        const auto numel = detail::read_pod<uint64_t>(is, "element count");

        std::vector<size_t> dims(rank);
        for (auto& d : dims) {
            d = static_cast<size_t>(detail::read_pod<uint64_t>(is, "dims"));
        }
        const TensorShape shape(dims);
        if (shape.elements() != numel) {
            throw StorageError(std::format("Corrupt tensor stream: shape {} has {} elements, header says {}",
                                           shape.str(), shape.elements(), numel));
        }

        Tensor loaded = Tensor::empty(shape, static_cast<DataType>(dtype));
        is.read(reinterpret_cast<char*>(loaded.data_ptr()), static_cast<std::streamsize>(loaded.bytes()));
        if (!is) {
            throw StorageError(std::format("Truncated tensor stream: expected {} data bytes", loaded.bytes()));
        }
        tensor = std::move(loaded);
        return is;
    }

    /// Length-prefixed string, used for record keys and dataset names
    inline void write_string_record(std::ostream& os, const std::string& value) {
        if (value.empty() || value.size() > TENSOR_RECORD_MAX_KEY) {
            throw StorageError(std::format("Record key of length {} cannot be encoded", value.size()));
        }
        detail::write_pod(os, static_cast<uint32_t>(value.size()));
        os.write(value.data(), static_cast<std::streamsize>(value.size()));
    }

    inline std::string read_string_record(std::istream& is) {
        const auto length = detail::read_pod<uint32_t>(is, "record key length");
        if (length == 0 || length > TENSOR_RECORD_MAX_KEY) {
            throw StorageError(std::format("Corrupt record: key length {}", length));
        }
        std::string value(length, '\0');
        is.read(value.data(), length);
        if (!is) {
            throw StorageError("Truncated record key");
        }
        return value;
    }

    /// Key-prefixed tensor, the unit of the store metadata blob
    inline void write_tensor_record(std::ostream& os, const std::string& key, const Tensor& tensor) {
        write_string_record(os, key);
        os << tensor;
    }

    inline std::pair<std::string, Tensor> read_tensor_record(std::istream& is) {
        std::string key = read_string_record(is);
        Tensor tensor;
        is >> tensor;
        return {std::move(key), std::move(tensor)};
    }

    inline void save_tensor(const Tensor& tensor, const std::string& filename) {
        std::ofstream file;
        if (!open_file_for_write(filename, file)) {
            throw StorageError("Failed to open file", filename);
        }
        file << tensor;
    }

    inline Tensor load_tensor(const std::string& filename) {
        std::ifstream file;
        if (!open_file_for_read(filename, file)) {
            throw StorageError("Failed to open file", filename);
        }
        Tensor tensor;
        file >> tensor;
        return tensor;
    }

} // namespace dhr::core
