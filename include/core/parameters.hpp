/* SPDX-FileCopyrightText: 2025 DHResponse Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <map>
#include <nlohmann/json_fwd.hpp>
#include <string>

namespace dhr::core::param {

    /// Sizes of the built-in synthetic model system
    struct SyntheticSystemConfig {
        int64_t nocc = 4;
        int64_t nvir = 8;
        int64_t naux = 24;
        int64_t ngrid = 96;
        uint64_t seed = 20250101;
        std::string xc_family = "GGA"; // family of non-HF functionals: "GGA" or "LDA"

        nlohmann::json to_json() const;
        static SyntheticSystemConfig from_json(const nlohmann::json& j);
    };

    struct PolarParameters {
        std::string xc = "XYG3";
        double max_memory_mb = 4000.0;
        int cpks_max_cycle = 100;
        double cpks_tol = 1e-8;
        std::string scratch_dir;
        bool parallel_contractions = false;
        std::string log_level = "info";
        std::string log_file;
        std::map<std::string, std::string> log_modules; // module name -> level, e.g. {"store": "debug"}
        std::string checkpoint_dataset;
        std::string checkpoint_metadata;
        SyntheticSystemConfig synthetic;

        nlohmann::json to_json() const;
        static PolarParameters from_json(const nlohmann::json& j);
    };

    /// Range and consistency checks; the message names the offending field
    std::expected<void, std::string> validate(const PolarParameters& params);

    std::expected<PolarParameters, std::string> load_parameters(const std::filesystem::path& path);
    std::expected<void, std::string> save_parameters(const PolarParameters& params,
                                                     const std::filesystem::path& path);

} // namespace dhr::core::param
