/* SPDX-FileCopyrightText: 2025 DHResponse Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/batch_planner.hpp"
#include "core/resource_monitor.hpp"
#include <gtest/gtest.h>
#include <limits>

using namespace dhr::core;

TEST(BatchPlannerTest, BatchesCoverRangeExactly) {
    for (int64_t start : {0, 3, 17}) {
        for (int64_t length : {0, 1, 7, 16, 33}) {
            for (int64_t chunk : {1, 2, 5, 16, 100}) {
                const int64_t stop = start + length;
                const auto batches = plan_batches(start, stop, chunk);
                int64_t cursor = start;
                for (const auto& b : batches) {
                    EXPECT_EQ(b.start, cursor);
                    EXPECT_GT(b.size(), 0);
                    EXPECT_LE(b.size(), chunk);
                    cursor = b.stop;
                }
                EXPECT_EQ(cursor, stop);
                if (!batches.empty()) {
                    EXPECT_EQ(batches.back().stop, stop);
                }
            }
        }
    }
}

TEST(BatchPlannerTest, HugeChunkGivesSingleBatch) {
    constexpr int64_t max = std::numeric_limits<int64_t>::max();
    const auto whole = plan_batches(0, 10, max);
    ASSERT_EQ(whole.size(), 1);
    EXPECT_EQ(whole[0].start, 0);
    EXPECT_EQ(whole[0].stop, 10);

    const auto tail = plan_batches(max - 5, max, 4);
    ASSERT_EQ(tail.size(), 2);
    EXPECT_EQ(tail[0].stop, max - 1);
    EXPECT_EQ(tail[1].start, max - 1);
    EXPECT_EQ(tail[1].stop, max);
}

TEST(BatchPlannerTest, InvalidBatchParametersThrow) {
    EXPECT_THROW(plan_batches(0, 10, 0), UsageError);
    EXPECT_THROW(plan_batches(0, 10, -3), UsageError);
    EXPECT_THROW(plan_batches(5, 2, 1), UsageError);
}

TEST(BatchPlannerTest, ChunkSizeFromBudget) {
    // 0.8 * 1000 - 200 = 600 bytes for units of 100 bytes
    EXPECT_EQ(compute_chunk_size(100, 1000, 200), 6);
    EXPECT_EQ(compute_chunk_size(100, 1000, 200, 4), 4);
    EXPECT_EQ(compute_chunk_size(100, 1000), 8);
}

TEST(BatchPlannerTest, ChunkSizeFloorsAtOneWhenOversubscribed) {
    EXPECT_EQ(compute_chunk_size(100, 1000, 5000), 1);
    EXPECT_EQ(compute_chunk_size(10'000, 1000), 1);
    EXPECT_EQ(compute_chunk_size(1, 0), 1);
}

TEST(BatchPlannerTest, ZeroUnitCostIsUnconstrained) {
    EXPECT_EQ(compute_chunk_size(0, 1000, 0, 42), 42);
    EXPECT_EQ(compute_chunk_size(0, 1000), 1);
}

TEST(BatchPlannerTest, NegativeInputsThrow) {
    EXPECT_THROW(compute_chunk_size(-1, 1000), UsageError);
    EXPECT_THROW(compute_chunk_size(1, -1000), UsageError);
    EXPECT_THROW(compute_chunk_size(1, 1000, -1), UsageError);
}

TEST(BatchPlannerTest, ChunkSizeMonotonicity) {
    const int64_t baseline = 3000;
    int64_t previous = std::numeric_limits<int64_t>::max();
    for (int64_t unit = 1; unit < 5000; unit = unit * 3 + 1) {
        const int64_t n = compute_chunk_size(unit, 100'000, baseline);
        EXPECT_GE(n, 1);
        EXPECT_LE(n, previous) << "unit cost " << unit;
        previous = n;
    }

    previous = 0;
    for (int64_t budget = 0; budget < 1'000'000; budget = budget * 2 + 1000) {
        const int64_t n = compute_chunk_size(64, budget, baseline);
        EXPECT_GE(n, 1);
        EXPECT_GE(n, previous) << "budget " << budget;
        previous = n;
    }
}

TEST(BatchPlannerTest, ElementBudgetsUseMegabytes) {
    EXPECT_EQ(megabytes_to_bytes(1.0), 1024 * 1024);
    EXPECT_EQ(elements_to_bytes(10), 80);
    EXPECT_EQ(elements_to_bytes(10, DataType::Float32), 40);
    // 0.8 MB / 8 KB units = 102 units
    EXPECT_EQ(compute_chunk_size_elements(1024, 1.0), 102);
    EXPECT_EQ(compute_chunk_size_elements(1024, 1.0, 0, 50), 50);
}

TEST(BatchPlannerTest, PartitionedBatchesGroupUnits) {
    // Unit sizes 3, 1, 4, 1, 5 -> offsets 0 3 4 8 9 14
    const std::vector<int64_t> offsets{0, 3, 4, 8, 9, 14};
    const auto groups = plan_partitioned_batches(offsets, 5);
    const std::vector<PartitionGroup> expected{
        {0, 2, 0, 4},
        {2, 4, 4, 9},
        {4, 5, 9, 14},
    };
    EXPECT_EQ(groups, expected);
}

TEST(BatchPlannerTest, PartitionedBatchesOversizedUnitStandsAlone) {
    const std::vector<int64_t> offsets{0, 2, 12, 13};
    const auto groups = plan_partitioned_batches(offsets, 4, 1);
    ASSERT_EQ(groups.size(), 2);
    EXPECT_EQ(groups[0], (PartitionGroup{1, 2, 2, 12}));
    EXPECT_EQ(groups[1], (PartitionGroup{2, 3, 12, 13}));
    EXPECT_THROW(plan_partitioned_batches(offsets, 0), UsageError);
    EXPECT_THROW(plan_partitioned_batches(offsets, 4, 2, 1), UsageError);
}

TEST(ResourceMonitorTest, FixedBudget) {
    const FixedResourceMonitor monitor(12.5);
    EXPECT_DOUBLE_EQ(monitor.available_memory_mb(), 12.5);
    EXPECT_DOUBLE_EQ(FixedResourceMonitor(-3.0).available_memory_mb(), 0.0);
}

TEST(ResourceMonitorTest, ProcessBudgetSubtractsResidentSet) {
    const double rss = process_resident_memory_mb();
    EXPECT_GT(rss, 0.0);
    EXPECT_GT(system_total_memory_mb(), 0.0);

    const ProcessResourceMonitor monitor(rss + 1.0e6);
    EXPECT_GT(monitor.available_memory_mb(), 0.0);
    EXPECT_LE(monitor.available_memory_mb(), 1.0e6 + 1.0);
    EXPECT_DOUBLE_EQ(ProcessResourceMonitor(0.0).available_memory_mb(), 0.0);
}
