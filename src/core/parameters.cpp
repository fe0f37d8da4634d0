/* SPDX-FileCopyrightText: 2025 DHResponse Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/parameters.hpp"
#include "core/logger.hpp"
#include "core/path_utils.hpp"
#include <format>
#include <fstream>
#include <nlohmann/json.hpp>

namespace dhr::core::param {

    nlohmann::json SyntheticSystemConfig::to_json() const {
        nlohmann::json j;
        j["nocc"] = nocc;
        j["nvir"] = nvir;
        j["naux"] = naux;
        j["ngrid"] = ngrid;
        j["seed"] = seed;
        j["xc_family"] = xc_family;
        return j;
    }

    SyntheticSystemConfig SyntheticSystemConfig::from_json(const nlohmann::json& j) {
        SyntheticSystemConfig c;
        c.nocc = j.value("nocc", c.nocc);
        c.nvir = j.value("nvir", c.nvir);
        c.naux = j.value("naux", c.naux);
        c.ngrid = j.value("ngrid", c.ngrid);
        c.seed = j.value("seed", c.seed);
        c.xc_family = j.value("xc_family", c.xc_family);
        return c;
    }

    nlohmann::json PolarParameters::to_json() const {
        nlohmann::json j;
        j["xc"] = xc;
        j["max_memory_mb"] = max_memory_mb;
        j["cpks_max_cycle"] = cpks_max_cycle;
        j["cpks_tol"] = cpks_tol;
        j["scratch_dir"] = scratch_dir;
        j["parallel_contractions"] = parallel_contractions;
        j["log_level"] = log_level;
        j["log_file"] = log_file;
        j["log_modules"] = log_modules;
        j["checkpoint_dataset"] = checkpoint_dataset;
        j["checkpoint_metadata"] = checkpoint_metadata;
        j["synthetic"] = synthetic.to_json();
        return j;
    }

    PolarParameters PolarParameters::from_json(const nlohmann::json& j) {
        PolarParameters p;
        p.xc = j.value("xc", p.xc);
        p.max_memory_mb = j.value("max_memory_mb", p.max_memory_mb);
        p.cpks_max_cycle = j.value("cpks_max_cycle", p.cpks_max_cycle);
        p.cpks_tol = j.value("cpks_tol", p.cpks_tol);
        p.scratch_dir = j.value("scratch_dir", p.scratch_dir);
        p.parallel_contractions = j.value("parallel_contractions", p.parallel_contractions);
        p.log_level = j.value("log_level", p.log_level);
        p.log_file = j.value("log_file", p.log_file);
        p.log_modules = j.value("log_modules", p.log_modules);
        p.checkpoint_dataset = j.value("checkpoint_dataset", p.checkpoint_dataset);
        p.checkpoint_metadata = j.value("checkpoint_metadata", p.checkpoint_metadata);
        if (j.contains("synthetic")) {
            p.synthetic = SyntheticSystemConfig::from_json(j["synthetic"]);
        }
        return p;
    }

    std::expected<void, std::string> validate(const PolarParameters& params) {
        if (params.xc.empty()) {
            return std::unexpected("xc must not be empty");
        }
        if (params.max_memory_mb <= 0.0) {
            return std::unexpected(std::format("max_memory_mb must be positive, got {}", params.max_memory_mb));
        }
        if (params.cpks_max_cycle <= 0) {
            return std::unexpected(std::format("cpks_max_cycle must be positive, got {}", params.cpks_max_cycle));
        }
        if (params.cpks_tol <= 0.0) {
            return std::unexpected(std::format("cpks_tol must be positive, got {}", params.cpks_tol));
        }
        LogLevel level;
        if (!parse_log_level(params.log_level, level)) {
            return std::unexpected("Unknown log_level '" + params.log_level + "'");
        }
        for (const auto& [name, module_level] : params.log_modules) {
            LogModule module;
            if (!parse_log_module(name, module)) {
                return std::unexpected("Unknown module '" + name + "' in log_modules");
            }
            if (!parse_log_level(module_level, level)) {
                return std::unexpected(std::format("Unknown level '{}' for module '{}' in log_modules", module_level, name));
            }
        }
        if (params.checkpoint_dataset.empty() != params.checkpoint_metadata.empty()) {
            return std::unexpected("checkpoint_dataset and checkpoint_metadata must be given together");
        }

        const auto& s = params.synthetic;
        if (s.nocc < 1 || s.nvir < 1 || s.naux < 1 || s.ngrid < 1) {
            return std::unexpected(std::format("synthetic sizes must be positive (nocc={}, nvir={}, naux={}, ngrid={})",
                                               s.nocc, s.nvir, s.naux, s.ngrid));
        }
        if (s.xc_family != "GGA" && s.xc_family != "LDA") {
            return std::unexpected("synthetic.xc_family must be \"GGA\" or \"LDA\", got \"" + s.xc_family + "\"");
        }
        return {};
    }

    std::expected<PolarParameters, std::string> load_parameters(const std::filesystem::path& path) {
        try {
            std::ifstream file;
            if (!open_file_for_read(path, file)) {
                return std::unexpected("Failed to open parameter file: " + path.string());
            }

            nlohmann::json j;
            file >> j;
            auto params = PolarParameters::from_json(j);

            if (auto ok = validate(params); !ok) {
                return std::unexpected(std::format("Invalid parameters in {}: {}", path.string(), ok.error()));
            }
            LOG_DEBUG("Loaded parameters from {}", path.string());
            return params;

        } catch (const nlohmann::json::exception& e) {
            return std::unexpected(std::format("Failed to parse {}: {}", path.string(), e.what()));
        }
    }

    std::expected<void, std::string> save_parameters(const PolarParameters& params,
                                                     const std::filesystem::path& path) {
        std::ofstream file;
        if (!open_file_for_write(path, file)) {
            return std::unexpected("Failed to open parameter file for writing: " + path.string());
        }
        file << params.to_json().dump(2);
        if (!file) {
            return std::unexpected("Failed to write parameter file: " + path.string());
        }
        return {};
    }

} // namespace dhr::core::param
