/* SPDX-FileCopyrightText: 2025 DHResponse Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <core/tensor.hpp>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace dhr::core {

    class BackingFile;
    class TensorStore;

    enum class Residency : uint8_t {
        Resident = 0,
        Paged = 1
    };

    inline const char* residency_name(const Residency residency) {
        return residency == Residency::Resident ? "resident" : "paged";
    }

    constexpr uint32_t STORE_METADATA_MAGIC = 0x44485354; // "DHST"
    constexpr uint32_t STORE_METADATA_VERSION = 2;

    struct CreateOptions {
        Tensor data;                        // invalid tensor = no data
        bool resident = true;
        std::optional<TensorShape> shape;
        std::optional<DataType> dtype;      // defaults to the data's dtype, else float64
    };

    struct StoreOptions {
        std::filesystem::path backing_path; // empty = private temporary file
        std::filesystem::path scratch_dir;  // empty = $TMPDIR or the system temp directory
    };

    /**
     * @brief Uniform block access to one store entry, resident or paged.
     *
     * A handle stays bound to its key; every call re-resolves the key, so a
     * handle to an erased key throws NotFoundError.
     */
    class StoredTensor {
    public:
        const std::string& key() const { return key_; }
        TensorShape shape() const;
        DataType dtype() const;
        Residency residency() const;

        Tensor read(const BlockRanges& ranges = {}) const;
        void write(const BlockRanges& ranges, const Tensor& block);
        void add(const BlockRanges& ranges, const Tensor& block, double alpha = 1.0);

        Tensor load() const { return read({}); }
        void zero();

    private:
        friend class TensorStore;
        StoredTensor(TensorStore* store, std::string key) : store_(store), key_(std::move(key)) {}

        TensorStore* store_;
        std::string key_;
    };

    /**
     * @brief Keyed tensors held in memory or in one HDF5 backing file.
     *
     * A key is either resident or paged, never both. Paged entries name a
     * dataset in the backing file; datasets are reference counted so that
     * aliased keys survive each other's removal. The backing file is owned
     * exclusively: a second live store on the same path is rejected.
     */
    class TensorStore {
    public:
        struct Resident {
            Tensor tensor;
        };
        struct Paged {
            std::string dataset;
            TensorShape shape;
            DataType dtype;
        };
        using Entry = std::variant<Resident, Paged>;

        explicit TensorStore(StoreOptions options = {});
        ~TensorStore();

        TensorStore(const TensorStore&) = delete;
        TensorStore& operator=(const TensorStore&) = delete;
        TensorStore(TensorStore&&) = delete;
        TensorStore& operator=(TensorStore&&) = delete;

        /**
         * @brief Create or reuse @p key.
         *
         * An existing key with the requested shape and dtype and no new data is
         * zeroed in place. Anything else replaces the old entry.
         * @throws UsageError if neither data nor shape is given, or they disagree
         */
        StoredTensor create(const std::string& key, const CreateOptions& options);

        /// @throws NotFoundError if @p key is missing
        void erase(const std::string& key);

        /// Full in-memory copy; resident tensors are returned shallow
        Tensor load(const std::string& key) const;

        StoredTensor at(const std::string& key);

        /// Bind @p new_key to the storage of @p existing_key
        StoredTensor alias(const std::string& new_key, const std::string& existing_key);

        bool contains(const std::string& key) const { return entries_.contains(key); }
        std::vector<std::string> keys() const;
        size_t size() const { return entries_.size(); }
        Residency residency(const std::string& key) const;

        /// Physical datasets currently in the backing file
        size_t dataset_count() const;

        const std::filesystem::path& backing_path() const { return backing_path_; }
        bool owns_backing_file() const { return owns_backing_file_; }
        void flush();

        /**
         * @brief Copy the backing file to @p dataset_path and write resident
         * tensors to @p metadata_path.
         *
         * The metadata also records which dataset every paged key maps to, so
         * aliases survive a restore. Afterwards any dataset in the backing file
         * that no key reaches is mapped as paged under its own name. Nothing is
         * left on disk when the checkpoint fails.
         * @throws StorageError on I/O failure
         */
        void checkpoint(const std::filesystem::path& dataset_path,
                        const std::filesystem::path& metadata_path);

        /// @throws StorageError on I/O failure
        static std::unique_ptr<TensorStore> restore(const std::filesystem::path& dataset_path,
                                                    const std::filesystem::path& metadata_path,
                                                    StoreOptions options = {});

    private:
        friend class StoredTensor;

        const Entry& entry(const std::string& key) const;
        Entry& entry(const std::string& key);

        void map_backing_datasets(bool replace_existing);
        void recount_datasets();
        void release_dataset(const std::string& dataset);
        std::string fresh_dataset_name(const std::string& key);
        std::string encode_metadata() const;
        void merge_metadata(const std::filesystem::path& metadata_path);

        std::filesystem::path backing_path_;
        bool owns_backing_file_ = false;
        std::unique_ptr<BackingFile> file_;
        std::map<std::string, Entry> entries_;
        std::map<std::string, int> dataset_refs_;
        uint64_t dataset_serial_ = 0;
    };

} // namespace dhr::core
