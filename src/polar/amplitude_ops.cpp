/* SPDX-FileCopyrightText: 2025 DHResponse Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "amplitude_ops.hpp"
#include "core/batch_planner.hpp"
#include "core/logger.hpp"
#include <cmath>
#include <format>

namespace dhr::polar {

    using core::Tensor;

    Tensor biorthogonalize(const Tensor& t, const double cc, const double c_os, const double c_ss) {
        const double coef_0 = cc * (c_os + c_ss);
        const double coef_1 = -cc * c_ss;

        if (std::abs(coef_1) < SAME_SPIN_TOLERANCE) {
            return t * coef_0;
        }

        Tensor res = t.transpose_last2();
        res.mul_(coef_1);
        res.add_(t, coef_0);
        return res;
    }

    void symmetrize_last2_(Tensor& t) {
        if (t.ndim() < 2 || t.size(t.ndim() - 1) != t.size(t.ndim() - 2)) {
            throw core::UsageError("symmetrize_last2 requires square trailing axes, got " + t.shape().str());
        }
        if (t.dtype() != core::DataType::Float64) {
            throw core::UsageError("symmetrize_last2 requires float64");
        }

        const size_t n = t.size(t.ndim() - 1);
        if (n == 0)
            return;
        const size_t batch = t.numel() / (n * n);
        double* data = t.ptr<double>();
        for (size_t b = 0; b < batch; ++b) {
            double* m = data + b * n * n;
            for (size_t i = 0; i < n; ++i) {
                m[i * n + i] *= 2.0;
                for (size_t j = i + 1; j < n; ++j) {
                    const double s = m[i * n + j] + m[j * n + i];
                    m[i * n + j] = s;
                    m[j * n + i] = s;
                }
            }
        }
    }

    void symmetrize_last2(core::StoredTensor tensor, const int64_t chunk) {
        const auto shape = tensor.shape();
        if (shape.rank() <= 2) {
            Tensor whole = tensor.read().clone();
            symmetrize_last2_(whole);
            tensor.write({}, whole);
            return;
        }

        for (const auto& batch : core::plan_batches(0, static_cast<int64_t>(shape[0]), chunk)) {
            Tensor block = tensor.read({batch});
            symmetrize_last2_(block);
            tensor.write({batch}, block);
        }
    }

    Tensor energy_denominator(const Tensor& ei, const Tensor& ej, const Tensor& ea, const Tensor& eb) {
        const size_t ni = ei.numel(), nj = ej.numel(), na = ea.numel(), nb = eb.numel();
        Tensor d = Tensor::empty({ni, nj, na, nb});
        const double* pi = ei.ptr<double>();
        const double* pj = ej.ptr<double>();
        const double* pa = ea.ptr<double>();
        const double* pb = eb.ptr<double>();
        double* out = d.ptr<double>();
        for (size_t i = 0; i < ni; ++i)
            for (size_t j = 0; j < nj; ++j)
                for (size_t a = 0; a < na; ++a)
                    for (size_t b = 0; b < nb; ++b)
                        *out++ = pi[i] + pj[j] - pa[a] - pb[b];
        return d;
    }

    void divide_trailing_(Tensor& t, const Tensor& denom) {
        const size_t n = denom.numel();
        if (n == 0 || t.numel() % n != 0) {
            throw core::UsageError(std::format("divide_trailing_: {} is not a multiple of {}",
                                               t.shape().str(), denom.shape().str()));
        }
        double* data = t.ptr<double>();
        const double* d = denom.ptr<double>();
        const size_t batch = t.numel() / n;
        for (size_t b = 0; b < batch; ++b) {
            double* row = data + b * n;
            for (size_t k = 0; k < n; ++k) {
                row[k] /= d[k];
            }
        }
    }

} // namespace dhr::polar
