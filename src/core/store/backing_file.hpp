/* SPDX-FileCopyrightText: 2025 DHResponse Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <core/tensor.hpp>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace H5 {
    class H5File;
}

namespace dhr::core {

    /**
     * @brief One HDF5 file holding a dataset per paged tensor.
     *
     * Dataset names may contain '/', intermediate groups are created on demand.
     * Every HDF5 failure is rethrown as StorageError carrying the file path.
     */
    class BackingFile {
    public:
        BackingFile(std::filesystem::path path, bool truncate);
        ~BackingFile();

        BackingFile(const BackingFile&) = delete;
        BackingFile& operator=(const BackingFile&) = delete;

        void open(bool truncate);
        void close();
        bool is_open() const { return static_cast<bool>(file_); }
        void flush();

        const std::filesystem::path& path() const { return path_; }

        void create_dataset(const std::string& name, const TensorShape& shape, DataType dtype);

        // Returns false when the dataset was already gone
        bool remove_dataset(const std::string& name);

        bool has_dataset(const std::string& name) const;
        TensorShape dataset_shape(const std::string& name) const;
        DataType dataset_dtype(const std::string& name) const;

        // Hyperslab access, one range per leading dimension
        Tensor read(const std::string& name, const BlockRanges& ranges) const;
        void write(const std::string& name, const BlockRanges& ranges, const Tensor& block);

        // Full paths of every dataset, walking nested groups
        std::vector<std::string> dataset_names() const;

    private:
        H5::H5File& file() const;

        std::filesystem::path path_;
        std::unique_ptr<H5::H5File> file_;
    };

} // namespace dhr::core
