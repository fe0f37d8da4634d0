/* SPDX-FileCopyrightText: 2025 DHResponse Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/resource_monitor.hpp"
#include "core/logger.hpp"
#include <algorithm>
#include <fstream>

#ifdef __linux__
#include <sys/sysinfo.h>
#include <unistd.h>
#endif

namespace dhr::core {

    namespace {
        constexpr double BYTES_PER_MB = 1024.0 * 1024.0;
    }

    double process_resident_memory_mb() {
#ifdef __linux__
        std::ifstream statm("/proc/self/statm");
        size_t total_pages = 0;
        size_t resident_pages = 0;
        if (statm >> total_pages >> resident_pages) {
            const long page_size = sysconf(_SC_PAGESIZE);
            return static_cast<double>(resident_pages) * static_cast<double>(page_size) / BYTES_PER_MB;
        }
        LOG_WARN("Failed to read /proc/self/statm");
#else
        LOG_WARN("Unsupported platform for resident memory detection");
#endif
        return 0.0;
    }

    double system_total_memory_mb() {
#ifdef __linux__
        struct sysinfo info;
        if (sysinfo(&info) == 0) {
            return static_cast<double>(info.totalram) * static_cast<double>(info.mem_unit) / BYTES_PER_MB;
        }
        LOG_WARN("Failed to get total memory on Linux");
#else
        LOG_WARN("Unsupported platform for memory detection");
#endif
        return 0.0;
    }

    ProcessResourceMonitor::ProcessResourceMonitor(const double max_memory_mb)
        : max_memory_mb_(max_memory_mb) {
        const double total = system_total_memory_mb();
        if (total > 0.0 && max_memory_mb_ > total) {
            LOG_WARN("max_memory {:.0f} MB exceeds physical memory {:.0f} MB", max_memory_mb_, total);
        }
    }

    double ProcessResourceMonitor::available_memory_mb() const {
        return std::max(0.0, max_memory_mb_ - process_resident_memory_mb());
    }

} // namespace dhr::core
