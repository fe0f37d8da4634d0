/* SPDX-FileCopyrightText: 2025 DHResponse Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <memory>

namespace dhr::core::param {
    struct PolarParameters;
}

namespace dhr::app {

    class Application {
    public:
        // Runs one polarizability calculation; returns the process exit code
        int run(std::unique_ptr<dhr::core::param::PolarParameters> params);
    };

} // namespace dhr::app
