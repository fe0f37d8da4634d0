/* SPDX-FileCopyrightText: 2025 DHResponse Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/tensor.hpp"
#include <gtest/gtest.h>

using namespace dhr::core;

class TensorBasicTest : public ::testing::Test {
protected:
    // 0, 1, 2, ... laid out row-major
    static Tensor iota(const TensorShape& shape) {
        std::vector<double> values(shape.elements());
        for (size_t i = 0; i < values.size(); ++i)
            values[i] = static_cast<double>(i);
        return Tensor::from_vector(values, shape);
    }
};

// ============= Creation =============

TEST_F(TensorBasicTest, ZerosAndFull) {
    const auto z = Tensor::zeros({2, 3});
    EXPECT_EQ(z.ndim(), 2);
    EXPECT_EQ(z.numel(), 6);
    EXPECT_EQ(z.dtype(), DataType::Float64);
    EXPECT_DOUBLE_EQ(z.sum_scalar(), 0.0);

    const auto f = Tensor::full({4}, 2.5);
    EXPECT_DOUBLE_EQ(f.sum_scalar(), 10.0);
}

TEST_F(TensorBasicTest, FromVectorRejectsWrongSize) {
    EXPECT_THROW(Tensor::from_vector({1.0, 2.0, 3.0}, {2, 2}), UsageError);
}

TEST_F(TensorBasicTest, CopiesShareStorageCloneDoesNot) {
    auto a = iota({3});
    auto shallow = a;
    auto deep = a.clone();
    a.at({0}) = 42.0;
    EXPECT_TRUE(shallow.shares_storage(a));
    EXPECT_DOUBLE_EQ(shallow.at({0}), 42.0);
    EXPECT_FALSE(deep.shares_storage(a));
    EXPECT_DOUBLE_EQ(deep.at({0}), 0.0);
}

TEST_F(TensorBasicTest, AtChecksBounds) {
    auto t = iota({2, 3});
    EXPECT_DOUBLE_EQ(t.at({1, 2}), 5.0);
    EXPECT_THROW(t.at({2, 0}), UsageError);
    EXPECT_THROW(t.at({0}), UsageError);
}

TEST_F(TensorBasicTest, ReshapeKeepsElements) {
    const auto t = iota({2, 3});
    const auto r = t.reshape({3, 2});
    EXPECT_DOUBLE_EQ(r.at({2, 1}), 5.0);
    EXPECT_THROW(t.reshape({4, 2}), UsageError);
}

// ============= Blocks =============

TEST_F(TensorBasicTest, BlockSelectsLeadingRanges) {
    const auto t = iota({3, 4, 2});
    const auto b = t.block({make_batch(1, 3), make_batch(2, 4)});
    ASSERT_EQ(b.shape(), TensorShape({2, 2, 2}));
    EXPECT_DOUBLE_EQ(b.at({0, 0, 0}), t.at({1, 2, 0}));
    EXPECT_DOUBLE_EQ(b.at({1, 1, 1}), t.at({2, 3, 1}));
}

TEST_F(TensorBasicTest, BlockOutOfBoundsThrows) {
    const auto t = iota({3, 4});
    EXPECT_THROW(t.block({make_batch(0, 4)}), UsageError);
    EXPECT_THROW(t.block({full_range(3), full_range(4), full_range(1)}), UsageError);
}

TEST_F(TensorBasicTest, SetAndAddBlock) {
    auto t = Tensor::zeros({3, 3});
    t.set_block({make_batch(1, 3), make_batch(0, 2)}, Tensor::full({2, 2}, 1.0));
    t.add_block({make_batch(2, 3)}, Tensor::full({1, 3}, 2.0), -0.5);

    EXPECT_DOUBLE_EQ(t.at({0, 0}), 0.0);
    EXPECT_DOUBLE_EQ(t.at({1, 1}), 1.0);
    EXPECT_DOUBLE_EQ(t.at({2, 0}), 0.0);
    EXPECT_DOUBLE_EQ(t.at({2, 2}), -1.0);
}

TEST_F(TensorBasicTest, TransposeLast2) {
    const auto t = iota({2, 2, 3});
    const auto tt = t.transpose_last2();
    ASSERT_EQ(tt.shape(), TensorShape({2, 3, 2}));
    for (size_t a = 0; a < 2; ++a)
        for (size_t i = 0; i < 2; ++i)
            for (size_t j = 0; j < 3; ++j)
                EXPECT_DOUBLE_EQ(tt.at({a, j, i}), t.at({a, i, j}));
}

// ============= Arithmetic =============

TEST_F(TensorBasicTest, InPlaceArithmetic) {
    auto a = iota({4});
    const auto b = Tensor::full({4}, 2.0);
    a.add_(b, 0.5);
    EXPECT_DOUBLE_EQ(a.at({3}), 4.0);
    a.mul_(b);
    EXPECT_DOUBLE_EQ(a.at({3}), 8.0);
    a.div_(b);
    EXPECT_DOUBLE_EQ(a.at({3}), 4.0);
    a.sub_(b);
    EXPECT_DOUBLE_EQ(a.at({3}), 2.0);
}

TEST_F(TensorBasicTest, ShapeMismatchThrows) {
    auto a = iota({4});
    EXPECT_THROW(a.add_(iota({2, 2})), UsageError);
}

TEST_F(TensorBasicTest, Reductions) {
    const auto a = iota({2, 2});
    EXPECT_DOUBLE_EQ(a.sum_scalar(), 6.0);
    EXPECT_DOUBLE_EQ(a.dot(a), 14.0);
    EXPECT_DOUBLE_EQ((-a).max_abs(), 3.0);
    EXPECT_DOUBLE_EQ(a.max_abs_diff(a * 2.0), 3.0);
    EXPECT_TRUE(a.allclose(a + Tensor::full({2, 2}, 1e-14)));
    EXPECT_FALSE(a.allclose(a + Tensor::full({2, 2}, 1e-3)));
}

TEST_F(TensorBasicTest, Float32IsStorageOnly) {
    const auto a = iota({3});
    const auto f = a.to(DataType::Float32);
    EXPECT_EQ(f.dtype(), DataType::Float32);
    EXPECT_EQ(f.bytes(), 12);
    auto copy = f.clone();
    EXPECT_THROW(copy.mul_(2.0), UsageError);
    EXPECT_TRUE(f.to(DataType::Float64).allclose(a));
}
