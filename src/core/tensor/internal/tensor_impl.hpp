/* SPDX-FileCopyrightText: 2025 DHResponse Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */
#pragma once

#include "core/batch.hpp"
#include "core/error.hpp"
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace dhr::core {

    enum class DataType : uint8_t {
        Float64 = 0,
        Float32 = 1
    };

    constexpr size_t dtype_size(DataType dtype) {
        switch (dtype) {
        case DataType::Float64: return 8;
        case DataType::Float32: return 4;
        default: return 0;
        }
    }

    inline const char* dtype_name(DataType dtype) {
        switch (dtype) {
        case DataType::Float64: return "float64";
        case DataType::Float32: return "float32";
        default: return "unknown";
        }
    }

    class TensorShape {
    private:
        std::vector<size_t> dims_;
        size_t total_elements_ = 1;

    public:
        TensorShape() = default;
        TensorShape(std::initializer_list<size_t> dims) : dims_(dims) {
            compute_total();
        }
        explicit TensorShape(const std::vector<size_t>& dims) : dims_(dims) {
            compute_total();
        }
        explicit TensorShape(std::span<const size_t> dims) : dims_(dims.begin(), dims.end()) {
            compute_total();
        }

        size_t rank() const { return dims_.size(); }
        size_t operator[](size_t i) const {
            if (i >= dims_.size()) {
                throw UsageError("Shape index " + std::to_string(i) + " out of range for rank " +
                                 std::to_string(dims_.size()));
            }
            return dims_[i];
        }
        size_t elements() const { return total_elements_; }
        const std::vector<size_t>& dims() const { return dims_; }

        // Row-major strides
        std::vector<size_t> strides() const {
            if (dims_.empty())
                return {};

            std::vector<size_t> result(dims_.size());
            result.back() = 1;
            for (int i = static_cast<int>(dims_.size()) - 2; i >= 0; --i) {
                result[i] = result[i + 1] * dims_[i + 1];
            }
            return result;
        }

        bool operator==(const TensorShape& other) const { return dims_ == other.dims_; }
        bool operator!=(const TensorShape& other) const { return !(*this == other); }

        std::string str() const;

    private:
        void compute_total() {
            total_elements_ = 1;
            for (auto d : dims_) {
                total_elements_ *= d;
            }
        }
    };

    /**
     * @brief Dense row-major CPU tensor.
     *
     * Copies are shallow (shared storage); use clone() for a deep copy.
     * Arithmetic is defined for Float64 only; Float32 tensors are a storage
     * format converted with to().
     */
    class Tensor {
    public:
        Tensor() = default;

        // Factories
        static Tensor empty(const TensorShape& shape, DataType dtype = DataType::Float64);
        static Tensor zeros(const TensorShape& shape, DataType dtype = DataType::Float64);
        static Tensor full(const TensorShape& shape, double value, DataType dtype = DataType::Float64);
        static Tensor from_vector(const std::vector<double>& data, const TensorShape& shape);

        // Properties
        bool is_valid() const { return static_cast<bool>(storage_); }
        const TensorShape& shape() const { return shape_; }
        size_t ndim() const { return shape_.rank(); }
        size_t numel() const { return shape_.elements(); }
        size_t size(size_t dim) const { return shape_[dim]; }
        size_t bytes() const { return numel() * dtype_size(dtype_); }
        DataType dtype() const { return dtype_; }
        bool shares_storage(const Tensor& other) const { return storage_ && storage_ == other.storage_; }

        template <typename T>
        T* ptr() { return reinterpret_cast<T*>(storage_.get()); }
        template <typename T>
        const T* ptr() const { return reinterpret_cast<const T*>(storage_.get()); }

        void* data_ptr() { return storage_.get(); }
        const void* data_ptr() const { return storage_.get(); }

        // Element access (Float64)
        double& at(std::initializer_list<size_t> index);
        double at(std::initializer_list<size_t> index) const;

        // Copies and views
        Tensor clone() const;
        Tensor to(DataType dtype) const;
        Tensor reshape(const TensorShape& shape) const;

        // Block access. One range per leading dimension; missing ranges are full.
        Tensor block(const BlockRanges& ranges) const;
        Tensor& set_block(const BlockRanges& ranges, const Tensor& src);
        Tensor& add_block(const BlockRanges& ranges, const Tensor& src, double alpha = 1.0);

        // Swap the trailing two axes into a new tensor
        Tensor transpose_last2() const;

        // In-place arithmetic
        Tensor& zero_();
        Tensor& fill_(double value);
        Tensor& add_(const Tensor& other, double alpha = 1.0);
        Tensor& sub_(const Tensor& other) { return add_(other, -1.0); }
        Tensor& mul_(double value);
        Tensor& mul_(const Tensor& other);
        Tensor& div_(const Tensor& other);

        Tensor operator+(const Tensor& other) const;
        Tensor operator-(const Tensor& other) const;
        Tensor operator*(double value) const;
        Tensor operator-() const;

        // Reductions
        double sum_scalar() const;
        double dot(const Tensor& other) const;
        double max_abs() const;
        double max_abs_diff(const Tensor& other) const;
        bool allclose(const Tensor& other, double rtol = 1e-9, double atol = 1e-12) const;

        std::vector<double> to_vector() const;
        std::string str() const;

    private:
        void require_float64(const char* op) const;
        void require_same_shape(const Tensor& other, const char* op) const;

        std::shared_ptr<std::byte[]> storage_;
        TensorShape shape_;
        DataType dtype_ = DataType::Float64;
    };

    /// Block shape selected by @p ranges within @p shape.
    TensorShape block_shape(const TensorShape& shape, const BlockRanges& ranges);

    /// Validates @p ranges against @p shape; throws UsageError on out-of-bounds ranges.
    void check_block_ranges(const TensorShape& shape, const BlockRanges& ranges);

} // namespace dhr::core
