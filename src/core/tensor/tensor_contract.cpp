/* SPDX-FileCopyrightText: 2025 DHResponse Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "internal/tensor_contract.hpp"
#include <algorithm>
#include <array>
#include <cblas.h>
#include <cctype>
#include <format>
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>

namespace dhr::core {

    namespace {

        struct ParsedSpec {
            std::string a;
            std::string b;
            std::string out;
        };

        ParsedSpec parse_spec(const std::string_view spec) {
            std::string s;
            s.reserve(spec.size());
            for (const char c : spec) {
                if (!std::isspace(static_cast<unsigned char>(c)))
                    s.push_back(c);
            }

            const auto arrow = s.find("->");
            if (arrow == std::string::npos) {
                throw UsageError(std::format("einsum '{}': missing '->'", spec));
            }
            const std::string lhs = s.substr(0, arrow);
            const auto comma = lhs.find(',');
            if (comma == std::string::npos || lhs.find(',', comma + 1) != std::string::npos) {
                throw UsageError(std::format("einsum '{}': expected exactly two operands", spec));
            }

            ParsedSpec parsed{lhs.substr(0, comma), lhs.substr(comma + 1), s.substr(arrow + 2)};
            for (const auto* labels : {&parsed.a, &parsed.b, &parsed.out}) {
                for (size_t i = 0; i < labels->size(); ++i) {
                    const char c = (*labels)[i];
                    if (!std::isalpha(static_cast<unsigned char>(c))) {
                        throw UsageError(std::format("einsum '{}': invalid label '{}'", spec, c));
                    }
                    if (labels->find(c) != i) {
                        throw UsageError(std::format("einsum '{}': label '{}' repeated in one term", spec, c));
                    }
                }
            }
            return parsed;
        }

        size_t product(const std::vector<size_t>& dims) {
            size_t n = 1;
            for (const size_t d : dims)
                n *= d;
            return n;
        }

        // Contiguous copy of t (axes named by labels) with its axes reordered to order
        Tensor permuted(const Tensor& t, const std::string& labels, const std::string& order) {
            if (labels == order)
                return t;

            const auto src_strides = t.shape().strides();
            std::vector<size_t> dims;
            std::vector<size_t> strides;
            for (const char c : order) {
                const auto pos = labels.find(c);
                dims.push_back(t.size(pos));
                strides.push_back(src_strides[pos]);
            }

            Tensor out = Tensor::empty(TensorShape(dims));
            const size_t n = out.numel();
            if (n == 0)
                return out;

            const double* src = t.ptr<double>();
            double* dst = out.ptr<double>();
            std::vector<size_t> idx(dims.size(), 0);
            size_t offset = 0;
            for (size_t flat = 0; flat < n; ++flat) {
                dst[flat] = src[offset];
                for (int d = static_cast<int>(dims.size()) - 1; d >= 0; --d) {
                    offset += strides[d];
                    if (++idx[d] < dims[d])
                        break;
                    offset -= strides[d] * dims[d];
                    idx[d] = 0;
                }
            }
            return out;
        }

        // Sums t over every label not in keep; the result has labels keep
        Tensor reduced(const Tensor& t, const std::string& labels, const std::string& keep) {
            std::string dropped;
            for (const char c : labels) {
                if (keep.find(c) == std::string::npos)
                    dropped.push_back(c);
            }
            if (dropped.empty())
                return permuted(t, labels, keep);

            const Tensor ordered = permuted(t, labels, keep + dropped);
            std::vector<size_t> keep_dims;
            for (const char c : keep)
                keep_dims.push_back(t.size(labels.find(c)));

            Tensor out = Tensor::zeros(TensorShape(keep_dims));
            const size_t nkeep = out.numel();
            const size_t ndrop = nkeep == 0 ? 0 : ordered.numel() / nkeep;
            const double* src = ordered.ptr<double>();
            double* dst = out.ptr<double>();
            for (size_t i = 0; i < nkeep; ++i) {
                double acc = 0.0;
                for (size_t j = 0; j < ndrop; ++j)
                    acc += src[i * ndrop + j];
                dst[i] = acc;
            }
            return out;
        }

    } // namespace

    Tensor einsum(const std::string_view spec, const Tensor& a, const Tensor& b,
                  const ContractionOptions& options) {
        if (!a.is_valid() || !b.is_valid()) {
            throw UsageError(std::format("einsum '{}': invalid operand", spec));
        }
        if (a.dtype() != DataType::Float64 || b.dtype() != DataType::Float64) {
            throw UsageError(std::format("einsum '{}': operands must be float64", spec));
        }

        const ParsedSpec p = parse_spec(spec);
        if (p.a.size() != a.ndim() || p.b.size() != b.ndim()) {
            throw UsageError(std::format("einsum '{}': operand ranks {} and {} do not match labels",
                                         spec, a.ndim(), b.ndim()));
        }

        std::array<int64_t, 128> extent;
        extent.fill(-1);
        auto bind = [&](const std::string& labels, const Tensor& t) {
            for (size_t i = 0; i < labels.size(); ++i) {
                const auto c = static_cast<unsigned char>(labels[i]);
                const auto e = static_cast<int64_t>(t.size(i));
                if (extent[c] >= 0 && extent[c] != e) {
                    throw UsageError(std::format("einsum '{}': label '{}' has extents {} and {}",
                                                 spec, labels[i], extent[c], e));
                }
                extent[c] = e;
            }
        };
        bind(p.a, a);
        bind(p.b, b);

        // Output labels shared by both operands are batch indices (G), the rest
        // are row (M) or column (N) indices. Labels summed over and present in
        // both operands form the gemm inner dimension (K); labels summed over and
        // present in only one operand are reduced before the product.
        std::string batch, rows, cols, inner;
        for (const char c : p.out) {
            const bool in_a = p.a.find(c) != std::string::npos;
            const bool in_b = p.b.find(c) != std::string::npos;
            if (!in_a && !in_b) {
                throw UsageError(std::format("einsum '{}': output label '{}' not found in operands", spec, c));
            }
            (in_a && in_b ? batch : in_a ? rows : cols).push_back(c);
        }
        for (const char c : p.a) {
            if (p.out.find(c) == std::string::npos && p.b.find(c) != std::string::npos)
                inner.push_back(c);
        }

        auto dims_of = [&](const std::string& labels) {
            std::vector<size_t> dims;
            for (const char c : labels)
                dims.push_back(static_cast<size_t>(extent[static_cast<unsigned char>(c)]));
            return dims;
        };
        const size_t ng = product(dims_of(batch));
        const size_t m = product(dims_of(rows));
        const size_t n = product(dims_of(cols));
        const size_t k = product(dims_of(inner));

        Tensor result = Tensor::zeros(TensorShape(dims_of(batch + rows + cols)));
        if (result.numel() == 0 || k == 0)
            return permuted(result, batch + rows + cols, p.out);

        const Tensor lhs = reduced(a, p.a, batch + rows + inner);
        const Tensor rhs = reduced(b, p.b, batch + inner + cols);

        const double* pa = lhs.ptr<double>();
        const double* pb = rhs.ptr<double>();
        double* pr = result.ptr<double>();
        const auto M = static_cast<int>(m);
        const auto N = static_cast<int>(n);
        const auto K = static_cast<int>(k);

        auto gemm = [&](const size_t g_begin, const size_t g_end) {
            for (size_t g = g_begin; g < g_end; ++g) {
                cblas_dgemm(CblasRowMajor, CblasNoTrans, CblasNoTrans, M, N, K, 1.0,
                            pa + g * m * k, K, pb + g * k * n, N, 0.0, pr + g * m * n, N);
            }
        };

        if (options.parallel && ng > 1) {
            tbb::parallel_for(tbb::blocked_range<size_t>(0, ng, std::max<size_t>(options.grain, 1)),
                              [&](const tbb::blocked_range<size_t>& range) {
                                  gemm(range.begin(), range.end());
                              });
        } else {
            gemm(0, ng);
        }
        return permuted(result, batch + rows + cols, p.out);
    }

} // namespace dhr::core
