/* SPDX-FileCopyrightText: 2025 DHResponse Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "app/application.hpp"
#include "core/argument_parser.hpp"

#include <print>

int main(int argc, char* argv[]) {
    auto result = dhr::core::args::parse_args(argc, argv);
    if (!result) {
        std::println(stderr, "Error: {}", result.error());
        return 1;
    }

    return std::visit([](auto&& mode) -> int {
        using T = std::decay_t<decltype(mode)>;

        if constexpr (std::is_same_v<T, dhr::core::args::HelpMode>) {
            return 0;
        } else if constexpr (std::is_same_v<T, dhr::core::args::PolarMode>) {
            dhr::app::Application app;
            return app.run(std::move(mode.params));
        }
    },
                      std::move(*result));
}
