/* SPDX-FileCopyrightText: 2025 DHResponse Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/batch_planner.hpp"
#include "core/logger.hpp"
#include <algorithm>
#include <cmath>
#include <format>

namespace dhr::core {

    std::vector<Batch> plan_batches(const int64_t start, const int64_t stop, const int64_t chunk) {
        if (chunk <= 0) {
            throw UsageError(std::format("Batch size must be positive, got {}", chunk));
        }
        if (stop < start) {
            throw UsageError(std::format("Invalid batch range [{}, {})", start, stop));
        }

        std::vector<Batch> batches;
        batches.reserve(static_cast<size_t>((stop - start) / chunk + 1));
        for (int64_t i = start; i < stop;) {
            const int64_t n = std::min(chunk, stop - i);
            batches.push_back({i, i + n});
            i += n;
        }
        return batches;
    }

    int64_t compute_chunk_size(const int64_t unit_cost, const int64_t memory_budget,
                               const int64_t baseline_cost, const int64_t extent) {
        if (unit_cost < 0 || memory_budget < 0 || baseline_cost < 0 || extent < 0) {
            throw UsageError(std::format("Invalid chunk parameters: unit={} budget={} baseline={} extent={}",
                                         unit_cost, memory_budget, baseline_cost, extent));
        }

        if (unit_cost == 0) {
            return std::max<int64_t>(extent, 1);
        }

        const double available = BUDGET_SAFETY_FACTOR * static_cast<double>(memory_budget) -
                                 static_cast<double>(baseline_cost);
        int64_t n = 1;
        if (available > 0.0) {
            n = std::max<int64_t>(static_cast<int64_t>(std::floor(available / static_cast<double>(unit_cost))), 1);
        } else {
            LOG_DEBUG("Baseline of {} bytes already exceeds budget of {} bytes, proceeding one unit at a time",
                      baseline_cost, memory_budget);
        }

        if (extent > 0) {
            n = std::min(n, extent);
        }
        return n;
    }

    int64_t elements_to_bytes(const int64_t elements, const DataType dtype) {
        return elements * static_cast<int64_t>(dtype_size(dtype));
    }

    int64_t megabytes_to_bytes(const double megabytes) {
        if (megabytes <= 0.0)
            return 0;
        return static_cast<int64_t>(megabytes * 1024.0 * 1024.0);
    }

    int64_t compute_chunk_size_elements(const int64_t unit_elements, const double memory_budget_mb,
                                        const int64_t baseline_elements, const int64_t extent) {
        const int64_t n = compute_chunk_size(elements_to_bytes(unit_elements),
                                             megabytes_to_bytes(memory_budget_mb),
                                             elements_to_bytes(baseline_elements),
                                             extent);
        LOG_TRACE("chunk size {} (unit {} elements, budget {:.1f} MB, baseline {} elements)",
                  n, unit_elements, memory_budget_mb, baseline_elements);
        return n;
    }

    std::vector<PartitionGroup> plan_partitioned_batches(const std::vector<int64_t>& offsets,
                                                         const int64_t block_size,
                                                         const int64_t start_id,
                                                         int64_t stop_id) {
        if (block_size <= 0) {
            throw UsageError(std::format("Partition block size must be positive, got {}", block_size));
        }
        if (offsets.empty()) {
            throw UsageError("Partition offsets must not be empty");
        }
        const auto nunits = static_cast<int64_t>(offsets.size()) - 1;
        if (stop_id < 0)
            stop_id = nunits;
        if (start_id < 0 || start_id > stop_id || stop_id > nunits) {
            throw UsageError(std::format("Invalid unit range [{}, {}) for {} units", start_id, stop_id, nunits));
        }
        for (int64_t u = start_id; u < stop_id; ++u) {
            if (offsets[u + 1] < offsets[u]) {
                throw UsageError(std::format("Partition offsets must be non-decreasing (unit {})", u));
            }
        }

        std::vector<PartitionGroup> groups;
        int64_t begin = start_id;
        while (begin < stop_id) {
            int64_t end = begin + 1;
            while (end < stop_id && offsets[end + 1] - offsets[begin] <= block_size) {
                ++end;
            }
            groups.push_back({begin, end, offsets[begin], offsets[end]});
            begin = end;
        }
        return groups;
    }

} // namespace dhr::core
