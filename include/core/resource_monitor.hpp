/* SPDX-FileCopyrightText: 2025 DHResponse Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <cstddef>

namespace dhr::core {

    /**
     * @brief Advisory memory accounting consulted by stages before batching.
     */
    class IResourceMonitor {
    public:
        virtual ~IResourceMonitor() = default;

        /// Memory a stage may still use, in MB. Never negative.
        virtual double available_memory_mb() const = 0;
    };

    /// Reports max_memory_mb minus the current resident set size of this process.
    class ProcessResourceMonitor : public IResourceMonitor {
    public:
        explicit ProcessResourceMonitor(double max_memory_mb);

        double available_memory_mb() const override;

        double max_memory_mb() const { return max_memory_mb_; }

    private:
        double max_memory_mb_;
    };

    /// Reports a constant budget regardless of process state.
    class FixedResourceMonitor : public IResourceMonitor {
    public:
        explicit FixedResourceMonitor(double budget_mb) : budget_mb_(budget_mb < 0.0 ? 0.0 : budget_mb) {}

        double available_memory_mb() const override { return budget_mb_; }

    private:
        double budget_mb_;
    };

    /// Resident set size of this process in MB, 0 when unavailable.
    double process_resident_memory_mb();

    /// Physical memory of the machine in MB, 0 when unavailable.
    double system_total_memory_mb();

} // namespace dhr::core
