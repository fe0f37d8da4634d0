/* SPDX-FileCopyrightText: 2025 DHResponse Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "collaborators.hpp"

namespace dhr::polar {

    /**
     * @brief Preconditioned fixed-point CPKS solver.
     *
     * Iterates U <- -(rhs + A(U)) / (e_a - e_i) from U = 0 until the largest
     * update falls below tol. Not converging within max_cycle is logged, not
     * thrown; the last iterate is returned.
     */
    class JacobiCpksSolver : public ICpksSolver {
    public:
        Tensor solve(const CpksOperator& op,
                     const Tensor& mo_energy,
                     const Tensor& mo_occ,
                     const Tensor& rhs,
                     int max_cycle,
                     double tol) const override;

        int last_iterations() const { return last_iterations_; }
        bool last_converged() const { return last_converged_; }

    private:
        mutable int last_iterations_ = 0;
        mutable bool last_converged_ = false;
    };

} // namespace dhr::polar
