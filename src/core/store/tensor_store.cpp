/* SPDX-FileCopyrightText: 2025 DHResponse Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/tensor_store.hpp"
#include "backing_file.hpp"
#include "core/batch_planner.hpp"
#include "core/logger.hpp"
#include "core/path_utils.hpp"
#include <algorithm>
#include <format>
#include <fstream>
#include <mutex>
#include <set>
#include <sstream>

namespace dhr::core {

    namespace {

        constexpr int64_t ZERO_SLAB_ELEMENTS = int64_t{1} << 23;

        // Backing files currently owned by a live store in this process
        std::mutex registry_mutex;

        std::set<std::string>& open_backing_files() {
            static std::set<std::string> paths;
            return paths;
        }

        std::string registry_key(const std::filesystem::path& path) {
            std::error_code ec;
            const auto canonical = std::filesystem::weakly_canonical(path, ec);
            return ec ? std::filesystem::absolute(path).lexically_normal().string() : canonical.string();
        }

        void register_backing_file(const std::filesystem::path& path) {
            std::lock_guard lock(registry_mutex);
            if (!open_backing_files().insert(registry_key(path)).second) {
                throw UsageError("Backing file is already owned by another live store: " + path.string());
            }
        }

        void unregister_backing_file(const std::filesystem::path& path) {
            std::lock_guard lock(registry_mutex);
            open_backing_files().erase(registry_key(path));
        }

    } // namespace

    // ============= StoredTensor =============

    TensorShape StoredTensor::shape() const {
        const auto& e = store_->entry(key_);
        if (const auto* resident = std::get_if<TensorStore::Resident>(&e)) {
            return resident->tensor.shape();
        }
        return std::get<TensorStore::Paged>(e).shape;
    }

    DataType StoredTensor::dtype() const {
        const auto& e = store_->entry(key_);
        if (const auto* resident = std::get_if<TensorStore::Resident>(&e)) {
            return resident->tensor.dtype();
        }
        return std::get<TensorStore::Paged>(e).dtype;
    }

    Residency StoredTensor::residency() const {
        return std::holds_alternative<TensorStore::Resident>(store_->entry(key_)) ? Residency::Resident
                                                                                    : Residency::Paged;
    }

    Tensor StoredTensor::read(const BlockRanges& ranges) const {
        const auto& e = store_->entry(key_);
        if (const auto* resident = std::get_if<TensorStore::Resident>(&e)) {
            return ranges.empty() ? resident->tensor : resident->tensor.block(ranges);
        }
        return store_->file_->read(std::get<TensorStore::Paged>(e).dataset, ranges);
    }

    void StoredTensor::write(const BlockRanges& ranges, const Tensor& block) {
        auto& e = store_->entry(key_);
        if (auto* resident = std::get_if<TensorStore::Resident>(&e)) {
            resident->tensor.set_block(ranges, block);
            return;
        }
        store_->file_->write(std::get<TensorStore::Paged>(e).dataset, ranges, block);
    }

    void StoredTensor::add(const BlockRanges& ranges, const Tensor& block, const double alpha) {
        auto& e = store_->entry(key_);
        if (auto* resident = std::get_if<TensorStore::Resident>(&e)) {
            resident->tensor.add_block(ranges, block, alpha);
            return;
        }

        const auto& paged = std::get<TensorStore::Paged>(e);
        Tensor current = store_->file_->read(paged.dataset, ranges).to(DataType::Float64);
        if (block.numel() != current.numel()) {
            throw UsageError(std::format("add to '{}': block {} does not match selection {}",
                                         key_, block.shape().str(), current.shape().str()));
        }
        current.add_(block.reshape(current.shape()), alpha);
        store_->file_->write(paged.dataset, ranges, current);
    }

    void StoredTensor::zero() {
        auto& e = store_->entry(key_);
        if (auto* resident = std::get_if<TensorStore::Resident>(&e)) {
            resident->tensor.zero_();
            return;
        }

        const auto& paged = std::get<TensorStore::Paged>(e);
        if (paged.shape.rank() == 0) {
            store_->file_->write(paged.dataset, {}, Tensor::zeros({}, paged.dtype));
            return;
        }

        // Zero in slabs along the leading dimension
        const auto rows = static_cast<int64_t>(paged.shape[0]);
        if (rows == 0)
            return;
        const int64_t row_elements = std::max<int64_t>(static_cast<int64_t>(paged.shape.elements()) / rows, 1);
        const int64_t slab = std::max<int64_t>(ZERO_SLAB_ELEMENTS / row_elements, 1);
        for (const auto& batch : plan_batches(0, rows, slab)) {
            std::vector<size_t> dims = paged.shape.dims();
            dims[0] = static_cast<size_t>(batch.size());
            store_->file_->write(paged.dataset, {batch}, Tensor::zeros(TensorShape(dims), paged.dtype));
        }
    }

    // ============= TensorStore =============

    TensorStore::TensorStore(StoreOptions options) {
        bool truncate = true;
        if (options.backing_path.empty()) {
            const auto dir = options.scratch_dir.empty() ? default_scratch_dir() : options.scratch_dir;
            backing_path_ = make_unique_scratch_file(dir, "dhr_store_");
            owns_backing_file_ = true;
        } else {
            backing_path_ = options.backing_path;
            std::error_code ec;
            truncate = !std::filesystem::exists(backing_path_, ec) ||
                       std::filesystem::file_size(backing_path_, ec) == 0;
        }

        try {
            register_backing_file(backing_path_);
        } catch (const UsageError&) {
            if (owns_backing_file_) {
                std::error_code ec;
                std::filesystem::remove(backing_path_, ec);
            }
            throw;
        }

        try {
            file_ = std::make_unique<BackingFile>(backing_path_, truncate);
            if (!truncate) {
                map_backing_datasets(true);
            }
        } catch (const Error&) {
            file_.reset();
            unregister_backing_file(backing_path_);
            if (owns_backing_file_) {
                std::error_code ec;
                std::filesystem::remove(backing_path_, ec);
            }
            throw;
        }

        LOG_DEBUG("Tensor store backed by {} ({})", backing_path_.string(),
                  owns_backing_file_ ? "private" : "explicit");
    }

    TensorStore::~TensorStore() {
        file_.reset();
        if (owns_backing_file_) {
            std::error_code ec;
            std::filesystem::remove(backing_path_, ec);
            if (ec) {
                LOG_WARN("Failed to remove backing file {}: {}", backing_path_.string(), ec.message());
            }
        }
        unregister_backing_file(backing_path_);
    }

    const TensorStore::Entry& TensorStore::entry(const std::string& key) const {
        const auto it = entries_.find(key);
        if (it == entries_.end()) {
            throw NotFoundError(key);
        }
        return it->second;
    }

    TensorStore::Entry& TensorStore::entry(const std::string& key) {
        const auto it = entries_.find(key);
        if (it == entries_.end()) {
            throw NotFoundError(key);
        }
        return it->second;
    }

    StoredTensor TensorStore::create(const std::string& key, const CreateOptions& options) {
        if (key.empty()) {
            throw UsageError("Tensor key must not be empty");
        }
        const bool has_data = options.data.is_valid();
        if (!has_data && !options.shape) {
            throw UsageError(std::format("create('{}'): neither data nor shape given", key));
        }
        if (has_data && options.shape && options.data.shape() != *options.shape) {
            throw UsageError(std::format("create('{}'): data shape {} disagrees with shape {}",
                                         key, options.data.shape().str(), options.shape->str()));
        }

        const TensorShape shape = has_data ? options.data.shape() : *options.shape;
        const DataType dtype = options.dtype.value_or(has_data ? options.data.dtype() : DataType::Float64);

        if (contains(key)) {
            StoredTensor existing(this, key);
            if (!has_data && existing.shape() == shape && existing.dtype() == dtype) {
                existing.zero();
                LOG_TRACE("Reusing '{}' {} ({})", key, shape.str(), residency_name(existing.residency()));
                return existing;
            }
        }

        // The replacement is built before the old entry goes away, so a failure
        // leaves the store as it was
        Entry replacement;
        if (options.resident) {
            Tensor tensor;
            if (has_data) {
                tensor = options.data.dtype() == dtype ? options.data : options.data.to(dtype);
            } else {
                tensor = Tensor::zeros(shape, dtype);
            }
            replacement = Resident{std::move(tensor)};
        } else {
            const std::string dataset = fresh_dataset_name(key);
            file_->create_dataset(dataset, shape, dtype);
            if (has_data) {
                try {
                    file_->write(dataset, {}, options.data);
                } catch (const Error&) {
                    if (!file_->remove_dataset(dataset)) {
                        LOG_WARN("Dataset '{}' vanished while discarding a failed create", dataset);
                    }
                    throw;
                }
            }
            replacement = Paged{dataset, shape, dtype};
        }

        if (contains(key)) {
            erase(key);
        }
        if (const auto* paged = std::get_if<Paged>(&replacement)) {
            dataset_refs_[paged->dataset] = 1;
        }
        entries_.emplace(key, std::move(replacement));

        LOG_DEBUG("Created {} tensor '{}' {} {}", options.resident ? "resident" : "paged", key, shape.str(),
                  dtype_name(dtype));
        return StoredTensor(this, key);
    }

    std::string TensorStore::fresh_dataset_name(const std::string& key) {
        if (!dataset_refs_.contains(key)) {
            if (file_->remove_dataset(key)) {
                LOG_DEBUG("Replaced unmapped dataset '{}'", key);
            }
            return key;
        }
        for (;;) {
            std::string name = std::format("{}~{}", key, ++dataset_serial_);
            if (!dataset_refs_.contains(name) && !file_->has_dataset(name)) {
                return name;
            }
        }
    }

    void TensorStore::erase(const std::string& key) {
        const auto it = entries_.find(key);
        if (it == entries_.end()) {
            throw NotFoundError(key);
        }
        if (const auto* paged = std::get_if<Paged>(&it->second)) {
            const std::string dataset = paged->dataset;
            entries_.erase(it);
            release_dataset(dataset);
        } else {
            entries_.erase(it);
        }
        LOG_TRACE("Erased '{}'", key);
    }

    void TensorStore::release_dataset(const std::string& dataset) {
        if (const auto ref = dataset_refs_.find(dataset); ref != dataset_refs_.end()) {
            if (--ref->second > 0)
                return;
            dataset_refs_.erase(ref);
        }
        if (!file_->remove_dataset(dataset)) {
            LOG_DEBUG("Dataset '{}' was already removed", dataset);
        }
    }

    Tensor TensorStore::load(const std::string& key) const {
        const auto& e = entry(key);
        if (const auto* resident = std::get_if<Resident>(&e)) {
            return resident->tensor;
        }
        return file_->read(std::get<Paged>(e).dataset, {});
    }

    StoredTensor TensorStore::at(const std::string& key) {
        entry(key);
        return StoredTensor(this, key);
    }

    StoredTensor TensorStore::alias(const std::string& new_key, const std::string& existing_key) {
        Entry copy = entry(existing_key);
        if (contains(new_key)) {
            throw UsageError(std::format("alias('{}'): key already exists", new_key));
        }
        if (const auto* paged = std::get_if<Paged>(&copy)) {
            ++dataset_refs_[paged->dataset];
        }
        entries_.emplace(new_key, std::move(copy));
        LOG_TRACE("Aliased '{}' -> '{}'", new_key, existing_key);
        return StoredTensor(this, new_key);
    }

    std::vector<std::string> TensorStore::keys() const {
        std::vector<std::string> out;
        out.reserve(entries_.size());
        for (const auto& [key, _] : entries_) {
            out.push_back(key);
        }
        return out;
    }

    Residency TensorStore::residency(const std::string& key) const {
        return std::holds_alternative<Resident>(entry(key)) ? Residency::Resident : Residency::Paged;
    }

    size_t TensorStore::dataset_count() const {
        return file_->dataset_names().size();
    }

    void TensorStore::flush() {
        file_->flush();
    }

    void TensorStore::map_backing_datasets(const bool replace_existing) {
        std::set<std::string> referenced;
        for (const auto& [key, e] : entries_) {
            if (const auto* paged = std::get_if<Paged>(&e)) {
                referenced.insert(paged->dataset);
            }
        }
        // Datasets reachable through a key keep their keys; the rest are mapped
        // under their own name
        for (const auto& name : file_->dataset_names()) {
            if (referenced.contains(name) || (!replace_existing && entries_.contains(name)))
                continue;
            entries_.insert_or_assign(name, Paged{name, file_->dataset_shape(name), file_->dataset_dtype(name)});
        }
        recount_datasets();
    }

    void TensorStore::recount_datasets() {
        dataset_refs_.clear();
        for (const auto& [key, e] : entries_) {
            if (const auto* paged = std::get_if<Paged>(&e)) {
                ++dataset_refs_[paged->dataset];
            }
        }
    }

    void TensorStore::checkpoint(const std::filesystem::path& dataset_path,
                                 const std::filesystem::path& metadata_path) {
        LOG_TIMER("TensorStore::checkpoint");

        // Encode first: an unencodable entry must fail before anything reaches disk
        const std::string metadata = encode_metadata();

        std::error_code ec;
        auto discard = [&ec](const std::filesystem::path& path) {
            std::filesystem::remove(path, ec);
            if (ec) {
                LOG_WARN("Failed to remove partial checkpoint file {}: {}", path.string(), ec.message());
            }
        };

        file_->flush();
        file_->close();
        std::filesystem::copy_file(backing_path_, dataset_path,
                                   std::filesystem::copy_options::overwrite_existing, ec);
        file_->open(false);
        if (ec) {
            const std::string reason = ec.message();
            discard(dataset_path);
            throw StorageError("Failed to copy backing file (" + reason + ")", dataset_path.string());
        }

        std::ofstream out;
        if (!open_file_for_write(metadata_path, out)) {
            discard(dataset_path);
            throw StorageError("Failed to open metadata file for writing", metadata_path.string());
        }
        out.write(metadata.data(), static_cast<std::streamsize>(metadata.size()));
        out.flush();
        if (!out) {
            out.close();
            discard(metadata_path);
            discard(dataset_path);
            throw StorageError("Failed to write metadata file", metadata_path.string());
        }

        map_backing_datasets(true);
        LOG_INFO("Checkpointed {} tensors to {} and {}", entries_.size(), dataset_path.string(),
                 metadata_path.string());
    }

    std::unique_ptr<TensorStore> TensorStore::restore(const std::filesystem::path& dataset_path,
                                                      const std::filesystem::path& metadata_path,
                                                      StoreOptions options) {
        LOG_TIMER("TensorStore::restore");

        if (!std::filesystem::exists(dataset_path)) {
            throw StorageError("Checkpoint dataset file not found", dataset_path.string());
        }
        if (!std::filesystem::exists(metadata_path)) {
            throw StorageError("Checkpoint metadata file not found", metadata_path.string());
        }

        auto store = std::make_unique<TensorStore>(std::move(options));

        // Replace the fresh backing file with the checkpointed one
        store->file_->close();
        std::error_code ec;
        std::filesystem::remove(store->backing_path_, ec);
        if (ec) {
            throw StorageError("Failed to discard initial backing file (" + ec.message() + ")",
                               store->backing_path_.string());
        }
        std::filesystem::copy_file(dataset_path, store->backing_path_,
                                   std::filesystem::copy_options::overwrite_existing, ec);
        if (ec) {
            throw StorageError("Failed to copy checkpoint file (" + ec.message() + ")", dataset_path.string());
        }
        store->file_->open(false);

        store->entries_.clear();
        store->merge_metadata(metadata_path);
        store->map_backing_datasets(false);

        LOG_INFO("Restored {} tensors from {}", store->size(), dataset_path.string());
        return store;
    }

    std::string TensorStore::encode_metadata() const {
        std::ostringstream out(std::ios::binary);

        uint64_t resident_count = 0;
        uint64_t paged_count = 0;
        for (const auto& [key, e] : entries_) {
            if (std::holds_alternative<Resident>(e))
                ++resident_count;
            else
                ++paged_count;
        }

        detail::write_pod(out, STORE_METADATA_MAGIC);
        detail::write_pod(out, STORE_METADATA_VERSION);
        detail::write_pod(out, resident_count);
        for (const auto& [key, e] : entries_) {
            if (const auto* resident = std::get_if<Resident>(&e)) {
                write_tensor_record(out, key, resident->tensor);
            }
        }

        // Key -> dataset table, so aliases and renamed datasets survive a restore
        detail::write_pod(out, paged_count);
        for (const auto& [key, e] : entries_) {
            if (const auto* paged = std::get_if<Paged>(&e)) {
                write_string_record(out, key);
                write_string_record(out, paged->dataset);
            }
        }

        if (!out) {
            throw StorageError("Failed to encode store metadata");
        }
        return std::move(out).str();
    }

    void TensorStore::merge_metadata(const std::filesystem::path& metadata_path) {
        std::ifstream in;
        if (!open_file_for_read(metadata_path, in)) {
            throw StorageError("Failed to open metadata file", metadata_path.string());
        }

        const auto magic = detail::read_pod<uint32_t>(in, "metadata magic");
        const auto version = detail::read_pod<uint32_t>(in, "metadata version");
        const auto count = detail::read_pod<uint64_t>(in, "metadata entry count");
        if (magic != STORE_METADATA_MAGIC) {
            throw StorageError("Invalid metadata file: wrong magic number", metadata_path.string());
        }
        if (version == 0 || version > STORE_METADATA_VERSION) {
            throw StorageError(std::format("Unsupported metadata version {}", version), metadata_path.string());
        }

        for (uint64_t i = 0; i < count; ++i) {
            try {
                auto [key, tensor] = read_tensor_record(in);
                entries_.insert_or_assign(std::move(key), Resident{std::move(tensor)});
            } catch (const StorageError& e) {
                throw StorageError(std::format("Metadata entry {} of {}: {}", i, count, e.what()),
                                   metadata_path.string());
            }
        }

        // Version 1 blobs carry no key table; every dataset is then mapped under its own name
        if (version >= 2) {
            const auto paged_count = detail::read_pod<uint64_t>(in, "metadata key table size");
            for (uint64_t i = 0; i < paged_count; ++i) {
                std::string key;
                std::string dataset;
                try {
                    key = read_string_record(in);
                    dataset = read_string_record(in);
                } catch (const StorageError& e) {
                    throw StorageError(std::format("Metadata key table entry {} of {}: {}", i, paged_count,
                                                   e.what()),
                                       metadata_path.string());
                }
                if (!file_->has_dataset(dataset)) {
                    throw StorageError(std::format("Key '{}' refers to missing dataset '{}'", key, dataset),
                                       metadata_path.string());
                }
                entries_.insert_or_assign(
                    std::move(key), Paged{dataset, file_->dataset_shape(dataset), file_->dataset_dtype(dataset)});
            }
        }
        recount_datasets();
    }

} // namespace dhr::core
