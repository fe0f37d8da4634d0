/* SPDX-FileCopyrightText: 2025 DHResponse Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/batch_planner.hpp"
#include "core/tensor_store.hpp"
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <iterator>

using namespace dhr::core;
namespace fs = std::filesystem;

class TensorStoreTest : public ::testing::Test {
protected:
    fs::path temp_dir_;

    void SetUp() override {
        temp_dir_ = fs::temp_directory_path() /
                    ("dhr_tensor_store_test_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(temp_dir_);
        fs::create_directories(temp_dir_ / "scratch");
    }

    void TearDown() override { fs::remove_all(temp_dir_); }

    StoreOptions scratch_options() const { return {.scratch_dir = temp_dir_ / "scratch"}; }

    size_t scratch_files() const {
        return static_cast<size_t>(std::distance(fs::directory_iterator(temp_dir_ / "scratch"), fs::directory_iterator{}));
    }

    static Tensor iota(const TensorShape& shape, const double offset = 0.0) {
        std::vector<double> values(shape.elements());
        for (size_t i = 0; i < values.size(); ++i)
            values[i] = offset + static_cast<double>(i);
        return Tensor::from_vector(values, shape);
    }
};

// ============= Create / load / erase =============

TEST_F(TensorStoreTest, ResidentAndPagedRoundTrip) {
    TensorStore store(scratch_options());
    store.create("r", {.data = iota({2, 3})});
    store.create("p", {.data = iota({3, 4}, 10.0), .resident = false});

    EXPECT_EQ(store.residency("r"), Residency::Resident);
    EXPECT_EQ(store.residency("p"), Residency::Paged);
    EXPECT_EQ(store.dataset_count(), 1);
    EXPECT_EQ(store.load("r").to_vector(), iota({2, 3}).to_vector());
    EXPECT_EQ(store.load("p").to_vector(), iota({3, 4}, 10.0).to_vector());
    EXPECT_EQ(store.keys(), (std::vector<std::string>{"p", "r"}));
}

TEST_F(TensorStoreTest, CreateRequiresDataOrShape) {
    TensorStore store(scratch_options());
    EXPECT_THROW(store.create("x", {}), UsageError);
    EXPECT_THROW(store.create("x", {.data = iota({2, 2}), .shape = TensorShape{4}}), UsageError);
    EXPECT_FALSE(store.contains("x"));
}

TEST_F(TensorStoreTest, MissingKeysThrowNotFound) {
    TensorStore store(scratch_options());
    EXPECT_THROW(store.load("missing"), NotFoundError);
    EXPECT_THROW(store.erase("missing"), NotFoundError);
    EXPECT_THROW(store.at("missing"), NotFoundError);

    auto handle = store.create("x", {.shape = TensorShape{2}});
    store.erase("x");
    EXPECT_THROW(handle.read(), NotFoundError);
}

TEST_F(TensorStoreTest, IdempotentRecreateZeroesInPlace) {
    TensorStore store(scratch_options());
    store.create("T", {.data = iota({4, 4}, 1.0), .resident = false});
    ASSERT_EQ(store.dataset_count(), 1);

    auto again = store.create("T", {.resident = false, .shape = TensorShape{4, 4}});
    EXPECT_TRUE(store.contains("T"));
    EXPECT_EQ(store.dataset_count(), 1);
    EXPECT_DOUBLE_EQ(again.load().max_abs(), 0.0);

    store.create("R", {.data = iota({2}, 1.0)});
    store.create("R", {.shape = TensorShape{2}});
    EXPECT_DOUBLE_EQ(store.load("R").max_abs(), 0.0);
}

TEST_F(TensorStoreTest, RecreateWithDataReplaces) {
    TensorStore store(scratch_options());
    store.create("T", {.shape = TensorShape{2, 2}, .dtype = DataType::Float32});
    store.create("T", {.data = iota({3}), .resident = false});
    EXPECT_EQ(store.residency("T"), Residency::Paged);
    EXPECT_EQ(store.at("T").shape(), TensorShape({3}));
    EXPECT_EQ(store.at("T").dtype(), DataType::Float64);
}

// ============= Block access =============

TEST_F(TensorStoreTest, PagedHyperslabWrites) {
    TensorStore store(scratch_options());
    auto t = store.create("blk", {.resident = false, .shape = TensorShape{3, 5, 4}});

    t.write({make_batch(1, 2), make_batch(2, 5)}, Tensor::full({1, 3, 4}, 7.0));
    t.add({make_batch(1, 3), make_batch(4, 5)}, Tensor::full({2, 1, 4}, 1.0), -2.0);

    const auto full = t.load();
    EXPECT_DOUBLE_EQ(full.at({0, 0, 0}), 0.0);
    EXPECT_DOUBLE_EQ(full.at({1, 1, 3}), 0.0);
    EXPECT_DOUBLE_EQ(full.at({1, 2, 0}), 7.0);
    EXPECT_DOUBLE_EQ(full.at({1, 4, 2}), 5.0);
    EXPECT_DOUBLE_EQ(full.at({2, 4, 1}), -2.0);
    EXPECT_DOUBLE_EQ(full.sum_scalar(), 7.0 * 12 - 2.0 * 8);

    const auto part = t.read({make_batch(1, 2), make_batch(2, 3)});
    EXPECT_EQ(part.shape(), TensorShape({1, 1, 4}));
    EXPECT_DOUBLE_EQ(part.sum_scalar(), 28.0);

    EXPECT_THROW(t.read({make_batch(0, 4)}), UsageError);
}

TEST_F(TensorStoreTest, BatchedProcessingMatchesUnbatched) {
    TensorStore store(scratch_options());
    auto T = store.create("T", {.data = iota({4, 4}), .resident = false});
    auto R = store.create("R", {.resident = false, .shape = TensorShape{4, 4}});

    const auto batches = plan_batches(0, 4, 2);
    ASSERT_EQ(batches.size(), 2);
    EXPECT_EQ(batches[0], make_batch(0, 2));
    EXPECT_EQ(batches[1], make_batch(2, 4));

    for (const auto& b : batches) {
        auto blk = T.read({b});
        blk.mul_(2.0).add_(Tensor::full(blk.shape(), 1.0));
        R.write({b}, blk);
    }

    auto expected = iota({4, 4});
    expected.mul_(2.0).add_(Tensor::full({4, 4}, 1.0));
    EXPECT_EQ(R.load().to_vector(), expected.to_vector());
}

// ============= Aliasing =============

TEST_F(TensorStoreTest, EraseOneAliasKeepsTheOther) {
    TensorStore store(scratch_options());
    store.create("A", {.data = iota({5}), .resident = false});
    store.alias("B", "A");
    EXPECT_EQ(store.dataset_count(), 1);

    store.erase("A");
    EXPECT_EQ(store.dataset_count(), 1);
    EXPECT_EQ(store.load("B").to_vector(), iota({5}).to_vector());

    store.erase("B");
    EXPECT_EQ(store.dataset_count(), 0);
    EXPECT_THROW(store.alias("C", "B"), NotFoundError);
}

TEST_F(TensorStoreTest, RecreateAliasedKeyWithNewShape) {
    TensorStore store(scratch_options());
    store.create("A", {.data = iota({5}), .resident = false});
    store.alias("B", "A");

    auto a = store.create("A", {.resident = false, .shape = TensorShape{2, 3}});
    EXPECT_EQ(a.shape(), TensorShape({2, 3}));
    EXPECT_EQ(store.load("A").to_vector(), std::vector<double>(6, 0.0));
    EXPECT_EQ(store.load("B").to_vector(), iota({5}).to_vector());
    EXPECT_EQ(store.dataset_count(), 2);

    a.write({}, iota({2, 3}, 10.0));
    EXPECT_EQ(store.load("B").to_vector(), iota({5}).to_vector());

    store.erase("B");
    EXPECT_EQ(store.dataset_count(), 1);
    EXPECT_EQ(store.load("A").to_vector(), iota({2, 3}, 10.0).to_vector());

    // The freed name is handed out again
    store.create("B", {.data = iota({4}), .resident = false});
    EXPECT_EQ(store.dataset_count(), 2);
    EXPECT_EQ(store.load("B").to_vector(), iota({4}).to_vector());
}

TEST_F(TensorStoreTest, RecreateAliasedKeyAsResident) {
    TensorStore store(scratch_options());
    store.create("A", {.data = iota({3}), .resident = false});
    store.alias("B", "A");

    store.create("A", {.data = iota({2}, 7.0)});
    EXPECT_EQ(store.residency("A"), Residency::Resident);
    EXPECT_EQ(store.residency("B"), Residency::Paged);
    EXPECT_EQ(store.load("B").to_vector(), iota({3}).to_vector());
    EXPECT_EQ(store.dataset_count(), 1);
}

TEST_F(TensorStoreTest, AliasToExistingKeyThrows) {
    TensorStore store(scratch_options());
    store.create("A", {.shape = TensorShape{1}});
    store.create("B", {.shape = TensorShape{1}});
    EXPECT_THROW(store.alias("B", "A"), UsageError);
}

// ============= Backing file ownership =============

TEST_F(TensorStoreTest, PrivateBackingFileRemovedOnDestruction) {
    fs::path backing;
    {
        TensorStore store(scratch_options());
        store.create("p", {.data = iota({8}), .resident = false});
        backing = store.backing_path();
        EXPECT_TRUE(store.owns_backing_file());
        EXPECT_TRUE(fs::exists(backing));
    }
    EXPECT_FALSE(fs::exists(backing));
    EXPECT_EQ(scratch_files(), 0);
}

TEST_F(TensorStoreTest, BackingFileIsExclusive) {
    const auto path = temp_dir_ / "shared.h5";
    {
        TensorStore first({.backing_path = path});
        EXPECT_FALSE(first.owns_backing_file());
        EXPECT_THROW(TensorStore({.backing_path = path}), UsageError);
    }
    EXPECT_NO_THROW(TensorStore({.backing_path = path}));
}

TEST_F(TensorStoreTest, ExplicitBackingFileIsReopened) {
    const auto path = temp_dir_ / "explicit.h5";
    {
        TensorStore store({.backing_path = path});
        store.create("kept", {.data = iota({2, 3}), .resident = false});
    }
    ASSERT_TRUE(fs::exists(path));

    TensorStore reopened({.backing_path = path});
    ASSERT_TRUE(reopened.contains("kept"));
    EXPECT_EQ(reopened.residency("kept"), Residency::Paged);
    EXPECT_EQ(reopened.load("kept").to_vector(), iota({2, 3}).to_vector());
}

// ============= Checkpoint / restore =============

TEST_F(TensorStoreTest, CheckpointRestoreIsBitIdentical) {
    const auto dataset = temp_dir_ / "ck.h5";
    const auto metadata = temp_dir_ / "ck.dat";

    TensorStore store(scratch_options());
    store.create("scalar", {.data = Tensor::full({}, 3.5)});
    store.create("resident", {.data = iota({2, 3}, -1.5)});
    store.create("paged", {.data = iota({3, 2, 2}, 0.25), .resident = false});
    store.create("single", {.data = iota({4}), .resident = false, .dtype = DataType::Float32});
    store.checkpoint(dataset, metadata);

    // The live store keeps working after a checkpoint
    EXPECT_EQ(store.load("paged").to_vector(), iota({3, 2, 2}, 0.25).to_vector());

    auto restored = TensorStore::restore(dataset, metadata, scratch_options());
    EXPECT_EQ(restored->keys(), store.keys());
    for (const auto& key : store.keys()) {
        const auto a = store.load(key);
        const auto b = restored->load(key);
        EXPECT_EQ(a.shape(), b.shape()) << key;
        EXPECT_EQ(a.dtype(), b.dtype()) << key;
        EXPECT_EQ(a.to(DataType::Float64).to_vector(), b.to(DataType::Float64).to_vector()) << key;
    }
    EXPECT_EQ(restored->residency("resident"), Residency::Resident);
    EXPECT_EQ(restored->residency("paged"), Residency::Paged);
}

TEST_F(TensorStoreTest, CheckpointRestoreKeepsAliases) {
    const auto dataset = temp_dir_ / "ck.h5";
    const auto metadata = temp_dir_ / "ck.dat";

    TensorStore store(scratch_options());
    store.create("A", {.data = iota({4}), .resident = false});
    store.alias("B", "A");
    store.alias("C", "A");
    store.erase("A");
    store.create("A", {.data = iota({2, 2}, 5.0), .resident = false});
    store.create("r", {.data = iota({3}, -2.0)});
    store.checkpoint(dataset, metadata);

    // Refreshing after the checkpoint must not bring erased keys back
    EXPECT_EQ(store.keys(), (std::vector<std::string>{"A", "B", "C", "r"}));
    EXPECT_EQ(store.dataset_count(), 2);

    auto restored = TensorStore::restore(dataset, metadata, scratch_options());
    EXPECT_EQ(restored->keys(), store.keys());
    EXPECT_EQ(restored->dataset_count(), 2);
    for (const auto& key : store.keys()) {
        EXPECT_EQ(restored->residency(key), store.residency(key)) << key;
        EXPECT_EQ(restored->load(key).to_vector(), store.load(key).to_vector()) << key;
    }

    // B and C still share one dataset after the restore
    restored->at("B").write({make_batch(0, 1)}, Tensor::from_vector({42.0}, {1}));
    EXPECT_DOUBLE_EQ(restored->load("C").at({0}), 42.0);
    restored->erase("B");
    EXPECT_EQ(restored->dataset_count(), 2);
    restored->erase("C");
    EXPECT_EQ(restored->dataset_count(), 1);
}

TEST_F(TensorStoreTest, FailedCheckpointLeavesNothingBehind) {
    TensorStore store(scratch_options());
    store.create("p", {.data = iota({3}), .resident = false});

    // Unencodable resident key
    store.create(std::string(70000, 'k'), {.data = iota({1})});
    const auto dataset = temp_dir_ / "ck.h5";
    const auto metadata = temp_dir_ / "ck.dat";
    EXPECT_THROW(store.checkpoint(dataset, metadata), StorageError);
    EXPECT_FALSE(fs::exists(dataset));
    EXPECT_FALSE(fs::exists(metadata));
    store.erase(std::string(70000, 'k'));

    // Unwritable dataset destination
    const auto missing_dir = temp_dir_ / "missing";
    EXPECT_THROW(store.checkpoint(missing_dir / "ck.h5", metadata), StorageError);
    EXPECT_FALSE(fs::exists(metadata));

    // The store is still usable and a later checkpoint succeeds
    EXPECT_EQ(store.load("p").to_vector(), iota({3}).to_vector());
    store.checkpoint(dataset, metadata);
    EXPECT_TRUE(fs::exists(dataset));
    EXPECT_TRUE(fs::exists(metadata));
}

TEST_F(TensorStoreTest, RestoreLeavesNoScratchFile) {
    const auto dataset = temp_dir_ / "ck.h5";
    const auto metadata = temp_dir_ / "ck.dat";
    {
        TensorStore store({.backing_path = temp_dir_ / "source.h5"});
        store.create("p", {.data = iota({6}), .resident = false});
        store.checkpoint(dataset, metadata);
    }
    {
        auto restored = TensorStore::restore(dataset, metadata, scratch_options());
        EXPECT_EQ(restored->load("p").to_vector(), iota({6}).to_vector());
        EXPECT_EQ(scratch_files(), 1);
    }
    EXPECT_EQ(scratch_files(), 0);
    EXPECT_TRUE(fs::exists(dataset));
}

TEST_F(TensorStoreTest, RestoreFromMissingFilesThrows) {
    EXPECT_THROW(TensorStore::restore(temp_dir_ / "none.h5", temp_dir_ / "none.dat", scratch_options()),
                 StorageError);
}

TEST_F(TensorStoreTest, CorruptMetadataThrows) {
    const auto dataset = temp_dir_ / "ck.h5";
    const auto metadata = temp_dir_ / "ck.dat";
    {
        TensorStore store(scratch_options());
        store.create("p", {.data = iota({2}), .resident = false});
        store.checkpoint(dataset, metadata);
    }
    {
        std::ofstream out(metadata, std::ios::binary | std::ios::trunc);
        out << "not a metadata file";
    }
    EXPECT_THROW(TensorStore::restore(dataset, metadata, scratch_options()), StorageError);
    EXPECT_EQ(scratch_files(), 0);
}
