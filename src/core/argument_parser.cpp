/* SPDX-FileCopyrightText: 2025 DHResponse Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/argument_parser.hpp"
#include <charconv>
#include <filesystem>
#include <format>
#include <optional>
#include <print>
#include <string_view>
#include <vector>

namespace dhr::core::args {

    namespace {

        template <typename T>
        std::expected<T, std::string> parse_number(const std::string_view option, const std::string_view text) {
            T value{};
            const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
            if (ec != std::errc() || ptr != text.data() + text.size()) {
                return std::unexpected(std::format("Invalid value '{}' for {}", text, option));
            }
            return value;
        }

        struct Token {
            std::string_view name;
            std::optional<std::string_view> value; // from --name=value
        };

        Token split_token(const std::string_view arg) {
            if (const auto eq = arg.find('='); arg.starts_with("--") && eq != std::string_view::npos) {
                return {arg.substr(0, eq), arg.substr(eq + 1)};
            }
            return {arg, std::nullopt};
        }

        bool takes_value(const std::string_view name) {
            static constexpr std::string_view with_value[] = {
                "--config", "--xc", "--max-memory", "--nocc", "--nvir", "--naux", "--ngrid",
                "--seed", "--scratch", "--checkpoint", "--log-level", "--log-file", "--log-module"};
            for (const auto v : with_value) {
                if (v == name)
                    return true;
            }
            return false;
        }

    } // namespace

    std::string usage(const std::string_view program) {
        return std::format(
            "Usage: {} [options]\n"
            "\n"
            "Doubly hybrid static polarizability on the built-in synthetic system.\n"
            "\n"
            "Options:\n"
            "  --config FILE        JSON parameter file (options below override it)\n"
            "  --xc NAME            doubly hybrid functional (default XYG3)\n"
            "  --max-memory MB      advisory memory budget\n"
            "  --nocc N --nvir N    synthetic orbital counts\n"
            "  --naux N --ngrid N   synthetic auxiliary basis and grid sizes\n"
            "  --seed N             synthetic system seed\n"
            "  --gga | --lda        family of non-HF low-rung functionals\n"
            "  --parallel           parallel tensor contractions\n"
            "  --scratch DIR        directory for the temporary backing file\n"
            "  --checkpoint DIR     write DIR/tensors.h5 and DIR/tensors.dat\n"
            "  --log-level LEVEL    trace, debug, info, perf, warn, error, critical, off\n"
            "  --log-file FILE      also log to FILE\n"
            "  --log-module M=LEVEL level for one module (core, store, planner, pipeline,\n"
            "                       stage, io, app); repeatable\n"
            "  -h, --help           show this help\n",
            program);
    }

    std::expected<ParsedArgs, std::string> parse_args(const int argc, const char* const argv[]) {
        const std::string_view program = argc > 0 ? argv[0] : "dhr_polar";

        std::vector<std::pair<std::string_view, std::string_view>> options;
        std::optional<std::string_view> config;
        for (int i = 1; i < argc; ++i) {
            auto [name, value] = split_token(argv[i]);
            if (name == "-h" || name == "--help") {
                std::print("{}", usage(program));
                return HelpMode{};
            }
            if (!name.starts_with("--")) {
                return std::unexpected(std::format("Unexpected argument '{}'", name));
            }
            if (takes_value(name)) {
                if (!value) {
                    if (i + 1 >= argc) {
                        return std::unexpected(std::format("Option {} requires a value", name));
                    }
                    value = argv[++i];
                }
            } else if (value) {
                return std::unexpected(std::format("Option {} does not take a value", name));
            }
            if (name == "--config") {
                config = *value;
            } else {
                options.emplace_back(name, value.value_or(std::string_view{}));
            }
        }

        auto params = std::make_unique<param::PolarParameters>();
        if (config) {
            auto loaded = param::load_parameters(std::filesystem::path(*config));
            if (!loaded) {
                return std::unexpected(loaded.error());
            }
            *params = std::move(*loaded);
        }

        for (const auto& [name, value] : options) {
            if (name == "--xc") {
                params->xc = std::string(value);
            } else if (name == "--max-memory") {
                auto v = parse_number<double>(name, value);
                if (!v)
                    return std::unexpected(v.error());
                params->max_memory_mb = *v;
            } else if (name == "--nocc" || name == "--nvir" || name == "--naux" || name == "--ngrid") {
                auto v = parse_number<int64_t>(name, value);
                if (!v)
                    return std::unexpected(v.error());
                auto& s = params->synthetic;
                (name == "--nocc" ? s.nocc : name == "--nvir" ? s.nvir : name == "--naux" ? s.naux : s.ngrid) = *v;
            } else if (name == "--seed") {
                auto v = parse_number<uint64_t>(name, value);
                if (!v)
                    return std::unexpected(v.error());
                params->synthetic.seed = *v;
            } else if (name == "--gga") {
                params->synthetic.xc_family = "GGA";
            } else if (name == "--lda") {
                params->synthetic.xc_family = "LDA";
            } else if (name == "--parallel") {
                params->parallel_contractions = true;
            } else if (name == "--scratch") {
                params->scratch_dir = std::string(value);
            } else if (name == "--checkpoint") {
                const std::filesystem::path dir(value);
                params->checkpoint_dataset = (dir / "tensors.h5").string();
                params->checkpoint_metadata = (dir / "tensors.dat").string();
            } else if (name == "--log-level") {
                params->log_level = std::string(value);
            } else if (name == "--log-file") {
                params->log_file = std::string(value);
            } else if (name == "--log-module") {
                const auto eq = value.find('=');
                if (eq == std::string_view::npos || eq == 0) {
                    return std::unexpected(std::format("Expected MODULE=LEVEL for --log-module, got '{}'", value));
                }
                params->log_modules[std::string(value.substr(0, eq))] = std::string(value.substr(eq + 1));
            } else {
                return std::unexpected(std::format("Unknown option '{}'", name));
            }
        }

        if (auto ok = param::validate(*params); !ok) {
            return std::unexpected(ok.error());
        }
        return PolarMode{std::move(params)};
    }

} // namespace dhr::core::args
