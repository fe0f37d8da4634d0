/* SPDX-FileCopyrightText: 2025 DHResponse Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/parameters.hpp"
#include <expected>
#include <memory>
#include <string>
#include <variant>

namespace dhr::core::args {

    // Parsed argument modes
    struct PolarMode {
        std::unique_ptr<param::PolarParameters> params;
    };
    struct HelpMode {};

    using ParsedArgs = std::variant<PolarMode, HelpMode>;

    /**
     * Options override a --config file, which overrides the defaults.
     * --checkpoint DIR expands to DIR/tensors.h5 and DIR/tensors.dat.
     */
    std::expected<ParsedArgs, std::string> parse_args(int argc, const char* const argv[]);

    std::string usage(std::string_view program);

} // namespace dhr::core::args
