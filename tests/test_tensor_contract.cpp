/* SPDX-FileCopyrightText: 2025 DHResponse Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/tensor.hpp"
#include <gtest/gtest.h>
#include <random>

using namespace dhr::core;

class TensorContractTest : public ::testing::Test {
protected:
    void SetUp() override { gen.seed(42); }

    Tensor random(const TensorShape& shape) {
        std::vector<double> v(shape.elements());
        for (auto& x : v)
            x = dist(gen);
        return Tensor::from_vector(v, shape);
    }

    std::mt19937 gen;
    std::uniform_real_distribution<double> dist{-1.0, 1.0};
};

TEST_F(TensorContractTest, MatrixProduct) {
    const auto a = random({3, 4});
    const auto b = random({4, 5});
    const auto c = einsum("ik,kj->ij", a, b);
    ASSERT_EQ(c.shape(), TensorShape({3, 5}));
    for (size_t i = 0; i < 3; ++i) {
        for (size_t j = 0; j < 5; ++j) {
            double ref = 0.0;
            for (size_t k = 0; k < 4; ++k)
                ref += a.at({i, k}) * b.at({k, j});
            EXPECT_NEAR(c.at({i, j}), ref, 1e-12);
        }
    }
}

TEST_F(TensorContractTest, ResponseStyleContraction) {
    // Ami,Pma->APia against explicit loops
    const size_t A = 3, m = 5, i_ = 2, P = 4, a_ = 3;
    const auto U = random({A, m, i_});
    const auto Y = random({P, m, a_});
    const auto out = einsum("Ami, Pma -> APia", U, Y);
    ASSERT_EQ(out.shape(), TensorShape({A, P, i_, a_}));
    for (size_t x = 0; x < A; ++x)
        for (size_t p = 0; p < P; ++p)
            for (size_t i = 0; i < i_; ++i)
                for (size_t a = 0; a < a_; ++a) {
                    double ref = 0.0;
                    for (size_t k = 0; k < m; ++k)
                        ref += U.at({x, k, i}) * Y.at({p, k, a});
                    EXPECT_NEAR(out.at({x, p, i, a}), ref, 1e-12);
                }
}

TEST_F(TensorContractTest, SharedOutputLabelIsBroadcast) {
    const auto a = random({3, 4});
    const auto e = random({4});
    const auto out = einsum("vp,p->vp", a, e);
    for (size_t v = 0; v < 3; ++v)
        for (size_t p = 0; p < 4; ++p)
            EXPECT_NEAR(out.at({v, p}), a.at({v, p}) * e.at({p}), 1e-14);
}

TEST_F(TensorContractTest, FullContractionToScalar) {
    const auto a = random({2, 3, 4});
    const auto s = einsum("ijk,ijk->", a, a);
    EXPECT_EQ(s.ndim(), 0);
    EXPECT_NEAR(s.sum_scalar(), a.dot(a), 1e-12);
}

TEST_F(TensorContractTest, ParallelMatchesSerial) {
    const auto t = random({4, 3, 5, 5});
    const auto g = random({6, 3, 5});
    const auto serial = einsum("ijab,Pjb->Pia", t, g);
    const auto parallel = einsum("ijab,Pjb->Pia", t, g, {.parallel = true, .grain = 1});
    EXPECT_TRUE(parallel.allclose(serial, 0.0, 0.0));
}

TEST_F(TensorContractTest, LabelSummedInOneOperandIsReduced) {
    const auto a = random({3, 4, 2});
    const auto b = random({4, 5});
    const auto c = einsum("ijk,jl->il", a, b);
    ASSERT_EQ(c.shape(), TensorShape({3, 5}));
    for (size_t i = 0; i < 3; ++i) {
        for (size_t l = 0; l < 5; ++l) {
            double ref = 0.0;
            for (size_t j = 0; j < 4; ++j)
                for (size_t k = 0; k < 2; ++k)
                    ref += a.at({i, j, k}) * b.at({j, l});
            EXPECT_NEAR(c.at({i, l}), ref, 1e-12);
        }
    }
}

TEST_F(TensorContractTest, BatchedProductWithPermutedOutput) {
    const auto a = random({4, 2, 3});
    const auto b = random({3, 4, 5});
    const auto c = einsum("Pij,jPk->kPi", a, b, {.parallel = true, .grain = 1});
    ASSERT_EQ(c.shape(), TensorShape({5, 4, 2}));
    for (size_t k = 0; k < 5; ++k) {
        for (size_t P = 0; P < 4; ++P) {
            for (size_t i = 0; i < 2; ++i) {
                double ref = 0.0;
                for (size_t j = 0; j < 3; ++j)
                    ref += a.at({P, i, j}) * b.at({j, P, k});
                EXPECT_NEAR(c.at({k, P, i}), ref, 1e-12);
            }
        }
    }
}

TEST_F(TensorContractTest, EmptyExtentGivesZeros) {
    const auto a = Tensor::zeros({3, 0});
    const auto b = Tensor::zeros({0, 2});
    const auto c = einsum("ik,kj->ij", a, b);
    ASSERT_EQ(c.shape(), TensorShape({3, 2}));
    EXPECT_DOUBLE_EQ(c.max_abs(), 0.0);
}

TEST_F(TensorContractTest, InvalidSpecsThrow) {
    const auto a = random({2, 3});
    const auto b = random({3, 2});
    EXPECT_THROW(einsum("ij,jk", a, b), UsageError);
    EXPECT_THROW(einsum("ij,jk,kl->il", a, b), UsageError);
    EXPECT_THROW(einsum("ii,jk->ik", a, b), UsageError);
    EXPECT_THROW(einsum("ij,ik->jk", a, b), UsageError);
    EXPECT_THROW(einsum("ijk,jk->ik", a, b), UsageError);
    EXPECT_THROW(einsum("ij,jk->iz", a, b), UsageError);
}
