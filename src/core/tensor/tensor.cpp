/* SPDX-FileCopyrightText: 2025 DHResponse Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/logger.hpp"
#include "internal/tensor_impl.hpp"
#include <algorithm>
#include <cmath>
#include <cstring>
#include <format>

namespace dhr::core {

    namespace {

        // Visits every contiguous trailing-dimension run of a block.
        // fn(source_offset, block_offset, run_length), offsets in elements.
        template <typename Fn>
        void for_each_block_run(const TensorShape& shape, const BlockRanges& ranges, Fn&& fn) {
            const size_t rank = shape.rank();
            if (rank == 0) {
                fn(size_t{0}, size_t{0}, size_t{1});
                return;
            }

            const auto strides = shape.strides();
            std::vector<size_t> lo(rank), extent(rank);
            for (size_t d = 0; d < rank; ++d) {
                if (d < ranges.size()) {
                    lo[d] = static_cast<size_t>(ranges[d].start);
                    extent[d] = static_cast<size_t>(ranges[d].size());
                } else {
                    lo[d] = 0;
                    extent[d] = shape[d];
                }
                if (extent[d] == 0)
                    return;
            }

            const size_t run = extent[rank - 1];
            std::vector<size_t> idx(rank - 1, 0);
            size_t block_offset = 0;
            while (true) {
                size_t src = lo[rank - 1];
                for (size_t d = 0; d + 1 < rank; ++d) {
                    src += (lo[d] + idx[d]) * strides[d];
                }
                fn(src, block_offset, run);
                block_offset += run;

                int d = static_cast<int>(rank) - 2;
                for (; d >= 0; --d) {
                    if (++idx[d] < extent[d])
                        break;
                    idx[d] = 0;
                }
                if (d < 0)
                    break;
            }
        }

        std::shared_ptr<std::byte[]> allocate(const size_t bytes) {
            return std::shared_ptr<std::byte[]>(new std::byte[std::max<size_t>(bytes, 1)]);
        }

    } // namespace

    std::string TensorShape::str() const {
        std::string out = "[";
        for (size_t i = 0; i < dims_.size(); ++i) {
            if (i > 0)
                out += ", ";
            out += std::to_string(dims_[i]);
        }
        return out + "]";
    }

    TensorShape block_shape(const TensorShape& shape, const BlockRanges& ranges) {
        check_block_ranges(shape, ranges);
        std::vector<size_t> dims = shape.dims();
        for (size_t d = 0; d < ranges.size(); ++d) {
            dims[d] = static_cast<size_t>(ranges[d].size());
        }
        return TensorShape(dims);
    }

    void check_block_ranges(const TensorShape& shape, const BlockRanges& ranges) {
        if (ranges.size() > shape.rank()) {
            throw UsageError(std::format("{} block ranges given for a rank-{} tensor", ranges.size(), shape.rank()));
        }
        for (size_t d = 0; d < ranges.size(); ++d) {
            const auto& r = ranges[d];
            if (r.start < 0 || r.stop < r.start || static_cast<size_t>(r.stop) > shape[d]) {
                throw UsageError(std::format("Block range {} out of bounds for dimension {} of shape {}",
                                             r.str(), d, shape.str()));
            }
        }
    }

    // ============= Factories =============

    Tensor Tensor::empty(const TensorShape& shape, const DataType dtype) {
        Tensor t;
        t.shape_ = shape;
        t.dtype_ = dtype;
        t.storage_ = allocate(shape.elements() * dtype_size(dtype));
        return t;
    }

    Tensor Tensor::zeros(const TensorShape& shape, const DataType dtype) {
        Tensor t = empty(shape, dtype);
        std::memset(t.storage_.get(), 0, t.bytes());
        return t;
    }

    Tensor Tensor::full(const TensorShape& shape, const double value, const DataType dtype) {
        Tensor t = empty(shape, DataType::Float64);
        std::fill_n(t.ptr<double>(), t.numel(), value);
        return dtype == DataType::Float64 ? t : t.to(dtype);
    }

    Tensor Tensor::from_vector(const std::vector<double>& data, const TensorShape& shape) {
        if (data.size() != shape.elements()) {
            throw UsageError(std::format("from_vector: {} values for shape {}", data.size(), shape.str()));
        }
        Tensor t = empty(shape, DataType::Float64);
        std::copy(data.begin(), data.end(), t.ptr<double>());
        return t;
    }

    // ============= Element access =============

    double& Tensor::at(std::initializer_list<size_t> index) {
        require_float64("at");
        if (index.size() != ndim()) {
            throw UsageError(std::format("at: {} indices for rank-{} tensor", index.size(), ndim()));
        }
        const auto strides = shape_.strides();
        size_t offset = 0;
        size_t d = 0;
        for (const size_t i : index) {
            if (i >= shape_[d]) {
                throw UsageError(std::format("at: index {} out of range for dimension {} of shape {}", i, d, shape_.str()));
            }
            offset += i * strides[d++];
        }
        return ptr<double>()[offset];
    }

    double Tensor::at(std::initializer_list<size_t> index) const {
        return const_cast<Tensor*>(this)->at(index);
    }

    // ============= Copies and views =============

    Tensor Tensor::clone() const {
        if (!is_valid())
            return Tensor();
        Tensor t = empty(shape_, dtype_);
        std::memcpy(t.storage_.get(), storage_.get(), bytes());
        return t;
    }

    Tensor Tensor::to(const DataType dtype) const {
        if (dtype == dtype_)
            return clone();

        Tensor t = empty(shape_, dtype);
        const size_t n = numel();
        if (dtype_ == DataType::Float64) {
            const double* src = ptr<double>();
            float* dst = t.ptr<float>();
            for (size_t i = 0; i < n; ++i)
                dst[i] = static_cast<float>(src[i]);
        } else {
            const float* src = ptr<float>();
            double* dst = t.ptr<double>();
            for (size_t i = 0; i < n; ++i)
                dst[i] = static_cast<double>(src[i]);
        }
        return t;
    }

    Tensor Tensor::reshape(const TensorShape& shape) const {
        if (shape.elements() != numel()) {
            throw UsageError(std::format("Cannot reshape {} into {}", shape_.str(), shape.str()));
        }
        Tensor t = *this;
        t.shape_ = shape;
        return t;
    }

    Tensor Tensor::block(const BlockRanges& ranges) const {
        const TensorShape out_shape = block_shape(shape_, ranges);
        Tensor out = empty(out_shape, dtype_);
        const size_t elem = dtype_size(dtype_);
        const auto* src = storage_.get();
        auto* dst = out.storage_.get();
        for_each_block_run(shape_, ranges, [&](size_t s, size_t b, size_t run) {
            std::memcpy(dst + b * elem, src + s * elem, run * elem);
        });
        return out;
    }

    Tensor& Tensor::set_block(const BlockRanges& ranges, const Tensor& src) {
        const TensorShape expected = block_shape(shape_, ranges);
        if (src.numel() != expected.elements()) {
            throw UsageError(std::format("set_block: source shape {} does not match block shape {}",
                                         src.shape().str(), expected.str()));
        }
        const Tensor& converted = src.dtype() == dtype_ ? src : src.to(dtype_);
        const size_t elem = dtype_size(dtype_);
        auto* dst = storage_.get();
        const auto* from = converted.storage_.get();
        for_each_block_run(shape_, ranges, [&](size_t s, size_t b, size_t run) {
            std::memcpy(dst + s * elem, from + b * elem, run * elem);
        });
        return *this;
    }

    Tensor& Tensor::add_block(const BlockRanges& ranges, const Tensor& src, const double alpha) {
        require_float64("add_block");
        src.require_float64("add_block");
        const TensorShape expected = block_shape(shape_, ranges);
        if (src.numel() != expected.elements()) {
            throw UsageError(std::format("add_block: source shape {} does not match block shape {}",
                                         src.shape().str(), expected.str()));
        }
        double* dst = ptr<double>();
        const double* from = src.ptr<double>();
        for_each_block_run(shape_, ranges, [&](size_t s, size_t b, size_t run) {
            for (size_t i = 0; i < run; ++i)
                dst[s + i] += alpha * from[b + i];
        });
        return *this;
    }

    Tensor Tensor::transpose_last2() const {
        require_float64("transpose_last2");
        if (ndim() < 2) {
            throw UsageError("transpose_last2 requires rank >= 2, got shape " + shape_.str());
        }
        const size_t m = shape_[ndim() - 2];
        const size_t n = shape_[ndim() - 1];
        const size_t batch = (m * n == 0) ? 0 : numel() / (m * n);

        std::vector<size_t> dims = shape_.dims();
        std::swap(dims[ndim() - 2], dims[ndim() - 1]);
        Tensor out = empty(TensorShape(dims), dtype_);

        const double* src = ptr<double>();
        double* dst = out.ptr<double>();
        for (size_t b = 0; b < batch; ++b) {
            const double* s = src + b * m * n;
            double* d = dst + b * m * n;
            for (size_t i = 0; i < m; ++i)
                for (size_t j = 0; j < n; ++j)
                    d[j * m + i] = s[i * n + j];
        }
        return out;
    }

    // ============= In-place arithmetic =============

    Tensor& Tensor::zero_() {
        if (is_valid())
            std::memset(storage_.get(), 0, bytes());
        return *this;
    }

    Tensor& Tensor::fill_(const double value) {
        require_float64("fill_");
        std::fill_n(ptr<double>(), numel(), value);
        return *this;
    }

    Tensor& Tensor::add_(const Tensor& other, const double alpha) {
        require_same_shape(other, "add_");
        double* a = ptr<double>();
        const double* b = other.ptr<double>();
        const size_t n = numel();
        for (size_t i = 0; i < n; ++i)
            a[i] += alpha * b[i];
        return *this;
    }

    Tensor& Tensor::mul_(const double value) {
        require_float64("mul_");
        double* a = ptr<double>();
        const size_t n = numel();
        for (size_t i = 0; i < n; ++i)
            a[i] *= value;
        return *this;
    }

    Tensor& Tensor::mul_(const Tensor& other) {
        require_same_shape(other, "mul_");
        double* a = ptr<double>();
        const double* b = other.ptr<double>();
        const size_t n = numel();
        for (size_t i = 0; i < n; ++i)
            a[i] *= b[i];
        return *this;
    }

    Tensor& Tensor::div_(const Tensor& other) {
        require_same_shape(other, "div_");
        double* a = ptr<double>();
        const double* b = other.ptr<double>();
        const size_t n = numel();
        for (size_t i = 0; i < n; ++i)
            a[i] /= b[i];
        return *this;
    }

    Tensor Tensor::operator+(const Tensor& other) const {
        Tensor out = clone();
        out.add_(other);
        return out;
    }

    Tensor Tensor::operator-(const Tensor& other) const {
        Tensor out = clone();
        out.add_(other, -1.0);
        return out;
    }

    Tensor Tensor::operator*(const double value) const {
        Tensor out = clone();
        out.mul_(value);
        return out;
    }

    Tensor Tensor::operator-() const {
        return *this * -1.0;
    }

    // ============= Reductions =============

    double Tensor::sum_scalar() const {
        require_float64("sum_scalar");
        const double* a = ptr<double>();
        double sum = 0.0;
        for (size_t i = 0; i < numel(); ++i)
            sum += a[i];
        return sum;
    }

    double Tensor::dot(const Tensor& other) const {
        require_same_shape(other, "dot");
        const double* a = ptr<double>();
        const double* b = other.ptr<double>();
        double sum = 0.0;
        for (size_t i = 0; i < numel(); ++i)
            sum += a[i] * b[i];
        return sum;
    }

    double Tensor::max_abs() const {
        require_float64("max_abs");
        const double* a = ptr<double>();
        double m = 0.0;
        for (size_t i = 0; i < numel(); ++i)
            m = std::max(m, std::abs(a[i]));
        return m;
    }

    double Tensor::max_abs_diff(const Tensor& other) const {
        require_same_shape(other, "max_abs_diff");
        const double* a = ptr<double>();
        const double* b = other.ptr<double>();
        double m = 0.0;
        for (size_t i = 0; i < numel(); ++i)
            m = std::max(m, std::abs(a[i] - b[i]));
        return m;
    }

    bool Tensor::allclose(const Tensor& other, const double rtol, const double atol) const {
        if (shape_ != other.shape_)
            return false;
        const double* a = ptr<double>();
        const double* b = other.ptr<double>();
        for (size_t i = 0; i < numel(); ++i) {
            if (std::abs(a[i] - b[i]) > atol + rtol * std::abs(b[i]))
                return false;
        }
        return true;
    }

    std::vector<double> Tensor::to_vector() const {
        if (!is_valid())
            return {};
        const Tensor src = dtype_ == DataType::Float64 ? *this : to(DataType::Float64);
        return std::vector<double>(src.ptr<double>(), src.ptr<double>() + numel());
    }

    std::string Tensor::str() const {
        if (!is_valid())
            return "Tensor(invalid)";
        return std::format("Tensor(shape={}, dtype={})", shape_.str(), dtype_name(dtype_));
    }

    void Tensor::require_float64(const char* op) const {
        if (!is_valid()) {
            throw UsageError(std::string(op) + ": invalid tensor");
        }
        if (dtype_ != DataType::Float64) {
            throw UsageError(std::format("{}: arithmetic requires float64, got {}", op, dtype_name(dtype_)));
        }
    }

    void Tensor::require_same_shape(const Tensor& other, const char* op) const {
        require_float64(op);
        other.require_float64(op);
        if (shape_ != other.shape_) {
            LOG_ERROR("{}: shape mismatch {} vs {}", op, shape_.str(), other.shape_.str());
            throw UsageError(std::format("{}: shape mismatch {} vs {}", op, shape_.str(), other.shape_.str()));
        }
    }

} // namespace dhr::core
