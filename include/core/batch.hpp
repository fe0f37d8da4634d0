/* SPDX-FileCopyrightText: 2025 DHResponse Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <cstddef>
#include <cstdint>
#include <format>
#include <string>
#include <vector>

namespace dhr::core {

    /// Half-open index range [start, stop) over one tensor dimension.
    struct Batch {
        int64_t start = 0;
        int64_t stop = 0;

        [[nodiscard]] int64_t size() const { return stop - start; }
        [[nodiscard]] bool empty() const { return stop <= start; }

        bool operator==(const Batch&) const = default;

        [[nodiscard]] std::string str() const { return std::format("[{}, {})", start, stop); }
    };

    /// One range per leading dimension; missing trailing entries select the whole dimension.
    using BlockRanges = std::vector<Batch>;

    inline Batch full_range(const size_t extent) { return Batch{0, static_cast<int64_t>(extent)}; }

    inline Batch make_batch(const size_t start, const size_t stop) {
        return Batch{static_cast<int64_t>(start), static_cast<int64_t>(stop)};
    }

} // namespace dhr::core
