/* SPDX-FileCopyrightText: 2025 DHResponse Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "cpks_solver.hpp"
#include "core/logger.hpp"
#include <cmath>
#include <format>

namespace dhr::polar {

    Tensor JacobiCpksSolver::solve(const CpksOperator& op,
                                   const Tensor& mo_energy,
                                   const Tensor& mo_occ,
                                   const Tensor& rhs,
                                   const int max_cycle,
                                   const double tol) const {
        const size_t nmo = mo_energy.numel();
        if (mo_occ.numel() != nmo) {
            throw core::UsageError(std::format("CPKS: {} energies but {} occupations", nmo, mo_occ.numel()));
        }

        const double* occ = mo_occ.ptr<double>();
        size_t nocc = 0;
        while (nocc < nmo && occ[nocc] > 0.0) {
            ++nocc;
        }
        for (size_t p = nocc; p < nmo; ++p) {
            if (occ[p] > 0.0) {
                throw core::UsageError("CPKS: occupied orbitals must precede virtual orbitals");
            }
        }
        const size_t nvir = nmo - nocc;
        if (rhs.ndim() != 3 || rhs.size(1) != nvir || rhs.size(2) != nocc) {
            throw core::UsageError(std::format("CPKS: right-hand side {} does not match (nset, {}, {})",
                                               rhs.shape().str(), nvir, nocc));
        }
        if (max_cycle <= 0 || tol <= 0.0) {
            throw core::UsageError(std::format("CPKS: invalid max_cycle={} tol={}", max_cycle, tol));
        }

        const double* e = mo_energy.ptr<double>();
        Tensor e_ai = Tensor::empty({nvir, nocc});
        double* pe = e_ai.ptr<double>();
        for (size_t a = 0; a < nvir; ++a) {
            for (size_t i = 0; i < nocc; ++i) {
                const double gap = e[nocc + a] - e[i];
                if (std::abs(gap) < 1e-12) {
                    throw core::UsageError(std::format("CPKS: degenerate orbital pair ({}, {})", nocc + a, i));
                }
                pe[a * nocc + i] = gap;
            }
        }

        Tensor U = Tensor::zeros(rhs.shape());
        last_converged_ = false;
        double diff = 0.0;
        int cycle = 0;
        for (cycle = 1; cycle <= max_cycle; ++cycle) {
            Tensor next = op(U);
            next.add_(rhs);
            next.mul_(-1.0);
            const size_t nset = rhs.size(0);
            double* pn = next.ptr<double>();
            for (size_t s = 0; s < nset; ++s) {
                for (size_t k = 0; k < nvir * nocc; ++k) {
                    pn[s * nvir * nocc + k] /= pe[k];
                }
            }
            diff = next.max_abs_diff(U);
            U = std::move(next);
            LOG_TRACE("CPKS cycle {}: max update {:.3e}", cycle, diff);
            if (diff < tol) {
                last_converged_ = true;
                break;
            }
        }
        last_iterations_ = last_converged_ ? cycle : max_cycle;

        if (last_converged_) {
            LOG_DEBUG("CPKS converged in {} cycles ({} sets, max update {:.3e})", last_iterations_, rhs.size(0), diff);
        } else {
            LOG_WARN("CPKS not converged after {} cycles: max update {:.3e} > tol {:.1e}", max_cycle, diff, tol);
        }
        return U;
    }

} // namespace dhr::polar
