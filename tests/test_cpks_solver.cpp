/* SPDX-FileCopyrightText: 2025 DHResponse Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "polar/cpks_solver.hpp"
#include <gtest/gtest.h>

using namespace dhr::core;
using namespace dhr::polar;

class CpksSolverTest : public ::testing::Test {
protected:
    static constexpr size_t nocc = 2;
    static constexpr size_t nvir = 3;

    // A(U) = 0.1 U + 0.05 sum(U) per set
    static Tensor coupling(const Tensor& U) {
        Tensor out = U * 0.1;
        for (size_t s = 0; s < U.size(0); ++s) {
            double total = 0.0;
            for (size_t a = 0; a < nvir; ++a)
                for (size_t i = 0; i < nocc; ++i)
                    total += U.at({s, a, i});
            for (size_t a = 0; a < nvir; ++a)
                for (size_t i = 0; i < nocc; ++i)
                    out.at({s, a, i}) += 0.05 * total;
        }
        return out;
    }

    Tensor mo_energy = Tensor::from_vector({-1.0, -0.5, 0.5, 1.0, 1.5}, {5});
    Tensor mo_occ = Tensor::from_vector({2.0, 2.0, 0.0, 0.0, 0.0}, {5});
    Tensor rhs = Tensor::from_vector({0.3, -0.2, 0.1, 0.5, -0.4, 0.2,
                                      -0.1, 0.0, 0.7, 0.2, 0.3, -0.6},
                                     {2, nvir, nocc});
};

TEST_F(CpksSolverTest, SolutionSatisfiesResponseEquation) {
    JacobiCpksSolver solver;
    const Tensor U = solver.solve(coupling, mo_energy, mo_occ, rhs, 200, 1e-12);
    ASSERT_EQ(U.shape(), rhs.shape());
    EXPECT_TRUE(solver.last_converged());
    EXPECT_GT(solver.last_iterations(), 1);

    const Tensor AU = coupling(U);
    for (size_t s = 0; s < 2; ++s)
        for (size_t a = 0; a < nvir; ++a)
            for (size_t i = 0; i < nocc; ++i) {
                const double gap = mo_energy.at({nocc + a}) - mo_energy.at({i});
                const double residual = gap * U.at({s, a, i}) + AU.at({s, a, i}) + rhs.at({s, a, i});
                EXPECT_NEAR(residual, 0.0, 1e-10);
            }
}

TEST_F(CpksSolverTest, UncoupledSolutionIsDiagonal) {
    JacobiCpksSolver solver;
    auto zero_op = [](const Tensor& U) { return Tensor::zeros(U.shape()); };
    const Tensor U = solver.solve(zero_op, mo_energy, mo_occ, rhs, 10, 1e-12);
    EXPECT_TRUE(solver.last_converged());
    EXPECT_DOUBLE_EQ(U.at({1, 2, 0}), -rhs.at({1, 2, 0}) / (1.5 - (-1.0)));
}

TEST_F(CpksSolverTest, NotConvergedReturnsLastIterate) {
    JacobiCpksSolver solver;
    const Tensor U = solver.solve(coupling, mo_energy, mo_occ, rhs, 2, 1e-14);
    EXPECT_FALSE(solver.last_converged());
    EXPECT_EQ(solver.last_iterations(), 2);
    EXPECT_GT(U.max_abs(), 0.0);
}

TEST_F(CpksSolverTest, InvalidInputsThrow) {
    JacobiCpksSolver solver;
    EXPECT_THROW(solver.solve(coupling, mo_energy, mo_occ, Tensor::zeros({2, nocc, nvir}), 10, 1e-8), UsageError);
    EXPECT_THROW(solver.solve(coupling, mo_energy, mo_occ, rhs, 0, 1e-8), UsageError);
    EXPECT_THROW(solver.solve(coupling, mo_energy, mo_occ, rhs, 10, 0.0), UsageError);

    const auto interleaved = Tensor::from_vector({2.0, 0.0, 2.0, 0.0, 0.0}, {5});
    EXPECT_THROW(solver.solve(coupling, mo_energy, interleaved, rhs, 10, 1e-8), UsageError);

    const auto degenerate = Tensor::from_vector({-1.0, 0.5, 0.5, 1.0, 1.5}, {5});
    EXPECT_THROW(solver.solve(coupling, degenerate, mo_occ, rhs, 10, 1e-8), UsageError);

    EXPECT_THROW(solver.solve(coupling, mo_energy, Tensor::zeros({4}), rhs, 10, 1e-8), UsageError);
}
