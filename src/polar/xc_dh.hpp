/* SPDX-FileCopyrightText: 2025 DHResponse Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dhr::polar {

    /**
     * @brief Doubly hybrid functional decomposition.
     *
     * xc_s is the self-consistent low-rung functional, xc_n the optional
     * non-consistent functional evaluated at the xc_s density, and
     * cc * (c_os, c_ss) the opposite/same-spin PT2 scaling.
     */
    struct XcDoublyHybrid {
        std::string name;
        std::string xc_s;
        std::optional<std::string> xc_n;
        double cc = 1.0;
        double c_os = 1.0;
        double c_ss = 1.0;
    };

    // "XYG3", "xyg-3" and "XYG_3" all map to "xyg3"
    std::string normalize_xc_name(std::string_view name);

    std::expected<XcDoublyHybrid, std::string> parse_xc_dh(std::string_view name);

    std::vector<std::string> known_xc_dh();

} // namespace dhr::polar
