/* SPDX-FileCopyrightText: 2025 DHResponse Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/batch.hpp"
#include <core/tensor.hpp>
#include <cstdint>
#include <vector>

namespace dhr::core {

    // Fraction of the advisory budget a chunk may fill
    constexpr double BUDGET_SAFETY_FACTOR = 0.8;

    /**
     * @brief Split [start, stop) into contiguous chunks of @p chunk, the last truncated.
     * @throws UsageError if chunk <= 0 or stop < start
     */
    std::vector<Batch> plan_batches(int64_t start, int64_t stop, int64_t chunk);

    /**
     * @brief Largest n with n * unit_cost + baseline_cost <= 0.8 * memory_budget.
     *
     * All quantities are bytes. The result is at least 1 even when the baseline
     * alone exceeds the budget; the budget is advisory. A zero unit cost is
     * unconstrained and yields @p extent (1 when extent is 0). When extent > 0
     * the result never exceeds it.
     *
     * @throws UsageError on negative inputs
     */
    int64_t compute_chunk_size(int64_t unit_cost, int64_t memory_budget,
                               int64_t baseline_cost = 0, int64_t extent = 0);

    int64_t elements_to_bytes(int64_t elements, DataType dtype = DataType::Float64);
    int64_t megabytes_to_bytes(double megabytes);

    /// compute_chunk_size in float64 element counts against a budget in MB
    int64_t compute_chunk_size_elements(int64_t unit_elements, double memory_budget_mb,
                                        int64_t baseline_elements = 0, int64_t extent = 0);

    struct PartitionGroup {
        int64_t unit_start;
        int64_t unit_stop;
        int64_t offset_start;
        int64_t offset_stop;

        bool operator==(const PartitionGroup&) const = default;
    };

    /**
     * @brief Group consecutive variable-size units so each group spans at most
     * @p block_size offset units.
     *
     * @p offsets has one more entry than there are units (offsets[u] is where unit
     * u begins). A unit larger than block_size forms its own group.
     * @p stop_id < 0 means "through the last unit".
     */
    std::vector<PartitionGroup> plan_partitioned_batches(const std::vector<int64_t>& offsets,
                                                         int64_t block_size,
                                                         int64_t start_id = 0,
                                                         int64_t stop_id = -1);

    inline int64_t element_count(const Tensor& tensor) { return static_cast<int64_t>(tensor.numel()); }
    inline int64_t element_count(const TensorShape& shape) { return static_cast<int64_t>(shape.elements()); }

    /// Sum of element counts, for baseline-cost estimates
    template <typename... Ts>
    int64_t total_elements(const Ts&... items) {
        return (int64_t{0} + ... + element_count(items));
    }

} // namespace dhr::core
