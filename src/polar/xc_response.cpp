/* SPDX-FileCopyrightText: 2025 DHResponse Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "xc_response.hpp"
#include <format>

namespace dhr::polar {

    using core::Tensor;

    Tensor rks_gga_wv2(const Tensor& rho0, const Tensor& rho1, const Tensor& rho2,
                       const Tensor& fxc, const Tensor& kxc, const Tensor& weight) {
        const size_t ngrid = weight.numel();
        for (const auto* t : {&rho0, &rho1, &rho2}) {
            if (t->numel() != 4 * ngrid) {
                throw core::UsageError(std::format("rks_gga_wv2: density {} does not match {} grid points",
                                                   t->shape().str(), ngrid));
            }
        }
        if (fxc.numel() < 3 * ngrid || kxc.numel() != 4 * ngrid) {
            throw core::UsageError(std::format("rks_gga_wv2: kernel shapes {} / {} do not match {} grid points",
                                               fxc.shape().str(), kxc.shape().str(), ngrid));
        }

        const double* r0 = rho0.ptr<double>();
        const double* r1 = rho1.ptr<double>();
        const double* r2 = rho2.ptr<double>();
        const double* f = fxc.ptr<double>();
        const double* k = kxc.ptr<double>();
        const double* w = weight.ptr<double>();

        Tensor wv = Tensor::zeros({4, ngrid});
        double* out = wv.ptr<double>();

        for (size_t g = 0; g < ngrid; ++g) {
            const double frr = f[g];
            const double frg = f[ngrid + g];
            const double fgg = f[2 * ngrid + g];
            const double frrr = k[g];
            const double frrg = k[ngrid + g];
            const double frgg = k[2 * ngrid + g];
            const double fggg = k[3 * ngrid + g];

            double sigma01 = 0.0, sigma02 = 0.0, sigma12 = 0.0;
            for (size_t r = 1; r < 4; ++r) {
                sigma01 += r0[r * ngrid + g] * r1[r * ngrid + g];
                sigma02 += r0[r * ngrid + g] * r2[r * ngrid + g];
                sigma12 += r1[r * ngrid + g] * r2[r * ngrid + g];
            }
            sigma01 *= 2.0;
            sigma02 *= 2.0;
            sigma12 *= 2.0;

            const double r1r2 = r1[g] * r2[g];
            const double r1s2 = r1[g] * sigma02;
            const double s1r2 = sigma01 * r2[g];
            const double s1s2 = sigma01 * sigma02;

            const double wv0 = frrr * r1r2 + frrg * r1s2 + frrg * s1r2 + frgg * s1s2 + frg * sigma12;
            const double wv1 = frrg * r1r2 + frgg * r1s2 + frgg * s1r2 + fggg * s1s2 + fgg * sigma12;

            out[g] = 0.5 * wv0 * w[g];
            for (size_t r = 1; r < 4; ++r) {
                double v = wv1 * r0[r * ngrid + g];
                v += frg * r1[g] * r2[r * ngrid + g];
                v += frg * r2[g] * r1[r * ngrid + g];
                v += fgg * sigma01 * r2[r * ngrid + g];
                v += fgg * sigma02 * r1[r * ngrid + g];
                out[r * ngrid + g] = 2.0 * v * w[g];
            }
        }
        return wv;
    }

} // namespace dhr::polar
