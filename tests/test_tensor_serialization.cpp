/* SPDX-FileCopyrightText: 2025 DHResponse Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/tensor.hpp"
#include <filesystem>
#include <gtest/gtest.h>
#include <sstream>
#include <string>

using namespace dhr::core;
namespace fs = std::filesystem;

class TensorSerializationTest : public ::testing::Test {
protected:
    fs::path temp_dir_;

    void SetUp() override {
        temp_dir_ = fs::temp_directory_path() /
                    ("dhr_tensor_serialization_test_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::create_directories(temp_dir_);
    }

    void TearDown() override { fs::remove_all(temp_dir_); }

    std::string temp_file(const std::string& name) const { return (temp_dir_ / name).string(); }
};

TEST_F(TensorSerializationTest, Float64) {
    const auto t = Tensor::from_vector({1.0, -2.5, 3.25, 1e-300}, {2, 2});
    std::stringstream ss;
    ss << t;
    Tensor loaded;
    ss >> loaded;
    EXPECT_EQ(loaded.shape(), t.shape());
    EXPECT_EQ(loaded.to_vector(), t.to_vector());
}

TEST_F(TensorSerializationTest, Float32KeepsDtype) {
    const auto t = Tensor::from_vector({1.0, 2.0, 3.0}, {3}).to(DataType::Float32);
    std::stringstream ss;
    ss << t;
    Tensor loaded;
    ss >> loaded;
    EXPECT_EQ(loaded.dtype(), DataType::Float32);
    EXPECT_TRUE(loaded.to(DataType::Float64).allclose(t.to(DataType::Float64)));
}

TEST_F(TensorSerializationTest, Scalar) {
    const auto t = Tensor::full({}, 42.0);
    std::stringstream ss;
    ss << t;
    Tensor loaded;
    ss >> loaded;
    EXPECT_EQ(loaded.ndim(), 0);
    EXPECT_EQ(loaded.numel(), 1);
    EXPECT_DOUBLE_EQ(loaded.sum_scalar(), 42.0);
}

TEST_F(TensorSerializationTest, File) {
    const auto t = Tensor::full({2, 3, 4}, 0.125);
    const auto path = temp_file("t.bin");
    save_tensor(t, path);
    const auto loaded = load_tensor(path);
    EXPECT_EQ(loaded.shape(), t.shape());
    EXPECT_TRUE(loaded.allclose(t));
}

TEST_F(TensorSerializationTest, WrongMagicThrows) {
    std::stringstream ss;
    ss << Tensor::zeros({2});
    std::string bytes = ss.str();
    bytes[0] ^= 0x7f;
    std::stringstream corrupted(bytes);
    Tensor loaded;
    EXPECT_THROW(corrupted >> loaded, StorageError);
}

TEST_F(TensorSerializationTest, TruncatedThrows) {
    std::stringstream ss;
    ss << Tensor::zeros({16});
    const std::string bytes = ss.str();
    std::stringstream truncated(bytes.substr(0, bytes.size() - 8));
    Tensor loaded;
    EXPECT_THROW(truncated >> loaded, StorageError);
}

TEST_F(TensorSerializationTest, MissingFileThrows) {
    EXPECT_THROW(load_tensor(temp_file("missing.bin")), StorageError);
}
