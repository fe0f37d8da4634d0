/* SPDX-FileCopyrightText: 2025 DHResponse Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "backing_file.hpp"
#include "core/logger.hpp"
#include <H5Cpp.h>
#include <format>
#include <mutex>

namespace dhr::core {

    namespace {

        template <typename Fn>
        auto guarded(const char* what, const std::filesystem::path& path, Fn&& fn) -> decltype(fn()) {
            try {
                return fn();
            } catch (const H5::Exception& e) {
                throw StorageError(std::format("HDF5 {} failed ({})", what, e.getDetailMsg()), path.string());
            }
        }

        const H5::PredType& h5_type(const DataType dtype) {
            return dtype == DataType::Float32 ? H5::PredType::NATIVE_FLOAT : H5::PredType::NATIVE_DOUBLE;
        }

        TensorShape shape_of(const H5::DataSpace& space) {
            const int rank = space.getSimpleExtentNdims();
            std::vector<hsize_t> dims(static_cast<size_t>(rank));
            if (rank > 0) {
                space.getSimpleExtentDims(dims.data());
            }
            return TensorShape(std::vector<size_t>(dims.begin(), dims.end()));
        }

        void collect_datasets(const H5::Group& group, const std::string& prefix, std::vector<std::string>& out) {
            const hsize_t n = group.getNumObjs();
            for (hsize_t i = 0; i < n; ++i) {
                const std::string name = group.getObjnameByIdx(i);
                const std::string full = prefix.empty() ? name : prefix + "/" + name;
                switch (group.childObjType(name)) {
                case H5O_TYPE_DATASET:
                    out.push_back(full);
                    break;
                case H5O_TYPE_GROUP:
                    collect_datasets(group.openGroup(name), full, out);
                    break;
                default:
                    break;
                }
            }
        }

        // Hyperslab selection of @p ranges inside @p full
        void select_block(H5::DataSpace& space, const TensorShape& full, const BlockRanges& ranges,
                          std::vector<hsize_t>& count) {
            const size_t rank = full.rank();
            std::vector<hsize_t> start(rank, 0);
            count.assign(rank, 0);
            for (size_t d = 0; d < rank; ++d) {
                if (d < ranges.size()) {
                    start[d] = static_cast<hsize_t>(ranges[d].start);
                    count[d] = static_cast<hsize_t>(ranges[d].size());
                } else {
                    count[d] = full[d];
                }
            }
            space.selectHyperslab(H5S_SELECT_SET, count.data(), start.data());
        }

    } // namespace

    BackingFile::BackingFile(std::filesystem::path path, const bool truncate)
        : path_(std::move(path)) {
        static std::once_flag silence_flag;
        std::call_once(silence_flag, [] { H5::Exception::dontPrint(); });
        open(truncate);
    }

    BackingFile::~BackingFile() {
        try {
            close();
        } catch (const std::exception& e) {
            LOG_ERROR("Failed to close backing file {}: {}", path_.string(), e.what());
        }
    }

    void BackingFile::open(const bool truncate) {
        if (file_)
            return;
        guarded("open", path_, [&] {
            file_ = std::make_unique<H5::H5File>(path_.string(), truncate ? H5F_ACC_TRUNC : H5F_ACC_RDWR);
        });
        LOG_DEBUG("Opened backing file {} ({})", path_.string(), truncate ? "new" : "existing");
    }

    void BackingFile::close() {
        if (!file_)
            return;
        guarded("close", path_, [&] {
            file_->close();
        });
        file_.reset();
    }

    void BackingFile::flush() {
        guarded("flush", path_, [&] {
            file().flush(H5F_SCOPE_GLOBAL);
        });
    }

    H5::H5File& BackingFile::file() const {
        if (!file_) {
            throw StorageError("Backing file is closed", path_.string());
        }
        return *file_;
    }

    void BackingFile::create_dataset(const std::string& name, const TensorShape& shape, const DataType dtype) {
        guarded("create_dataset", path_, [&] {
            H5::DSetCreatPropList plist;
            const double fill_value = 0.0;
            plist.setFillValue(H5::PredType::NATIVE_DOUBLE, &fill_value);

            H5::LinkCreatPropList lcpl;
            lcpl.setCreateIntermediateGroup(true);

            if (shape.rank() == 0) {
                const H5::DataSpace space(H5S_SCALAR);
                file().createDataSet(name, h5_type(dtype), space, plist, H5::DSetAccPropList::DEFAULT, lcpl);
            } else {
                const std::vector<hsize_t> dims(shape.dims().begin(), shape.dims().end());
                const H5::DataSpace space(static_cast<int>(dims.size()), dims.data());
                file().createDataSet(name, h5_type(dtype), space, plist, H5::DSetAccPropList::DEFAULT, lcpl);
            }
        });
        LOG_TRACE("Created dataset '{}' {} {}", name, shape.str(), dtype_name(dtype));
    }

    bool BackingFile::remove_dataset(const std::string& name) {
        if (!has_dataset(name))
            return false;
        guarded("unlink", path_, [&] {
            file().unlink(name);
        });
        return true;
    }

    bool BackingFile::has_dataset(const std::string& name) const {
        return guarded("lookup", path_, [&] {
            // Every path prefix must exist before the link itself can be queried
            size_t pos = 0;
            while ((pos = name.find('/', pos)) != std::string::npos) {
                if (!file().nameExists(name.substr(0, pos)))
                    return false;
                ++pos;
            }
            return file().nameExists(name) && file().childObjType(name) == H5O_TYPE_DATASET;
        });
    }

    TensorShape BackingFile::dataset_shape(const std::string& name) const {
        return guarded("get_shape", path_, [&] {
            const H5::DataSet ds = file().openDataSet(name);
            return shape_of(ds.getSpace());
        });
    }

    DataType BackingFile::dataset_dtype(const std::string& name) const {
        return guarded("get_dtype", path_, [&] {
            const H5::DataSet ds = file().openDataSet(name);
            if (ds.getTypeClass() != H5T_FLOAT) {
                throw StorageError(std::format("Dataset '{}' is not floating point", name), path_.string());
            }
            const size_t size = ds.getFloatType().getSize();
            if (size == 8)
                return DataType::Float64;
            if (size == 4)
                return DataType::Float32;
            throw StorageError(std::format("Dataset '{}' has unsupported float width {}", name, size), path_.string());
        });
    }

    Tensor BackingFile::read(const std::string& name, const BlockRanges& ranges) const {
        return guarded("read", path_, [&] {
            const H5::DataSet ds = file().openDataSet(name);
            H5::DataSpace fspace = ds.getSpace();
            const TensorShape full = shape_of(fspace);
            const DataType dtype = dataset_dtype(name);

            Tensor out = Tensor::empty(block_shape(full, ranges), dtype);
            if (out.numel() == 0)
                return out;

            if (full.rank() == 0) {
                ds.read(out.data_ptr(), h5_type(dtype));
                return out;
            }

            std::vector<hsize_t> count;
            select_block(fspace, full, ranges, count);
            const H5::DataSpace mspace(static_cast<int>(count.size()), count.data());
            ds.read(out.data_ptr(), h5_type(dtype), mspace, fspace);
            return out;
        });
    }

    void BackingFile::write(const std::string& name, const BlockRanges& ranges, const Tensor& block) {
        guarded("write", path_, [&] {
            const H5::DataSet ds = file().openDataSet(name);
            H5::DataSpace fspace = ds.getSpace();
            const TensorShape full = shape_of(fspace);
            const DataType dtype = dataset_dtype(name);

            const TensorShape expected = block_shape(full, ranges);
            if (block.numel() != expected.elements()) {
                throw UsageError(std::format("Block {} does not fit selection {} of dataset '{}'",
                                             block.shape().str(), expected.str(), name));
            }
            if (block.numel() == 0)
                return;

            const Tensor src = block.dtype() == dtype ? block : block.to(dtype);
            if (full.rank() == 0) {
                ds.write(src.data_ptr(), h5_type(dtype));
                return;
            }

            std::vector<hsize_t> count;
            select_block(fspace, full, ranges, count);
            const H5::DataSpace mspace(static_cast<int>(count.size()), count.data());
            ds.write(src.data_ptr(), h5_type(dtype), mspace, fspace);
        });
    }

    std::vector<std::string> BackingFile::dataset_names() const {
        return guarded("visit", path_, [&] {
            std::vector<std::string> names;
            collect_datasets(file(), "", names);
            return names;
        });
    }

} // namespace dhr::core
