/* SPDX-FileCopyrightText: 2025 DHResponse Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "app/application.hpp"
#include "core/logger.hpp"
#include "core/parameters.hpp"
#include "core/resource_monitor.hpp"
#include "core/tensor_store.hpp"
#include "polar/cpks_solver.hpp"
#include "polar/pipeline.hpp"
#include "polar/synthetic/synthetic_system.hpp"
#include <print>

namespace dhr::app {

    namespace {

        void print_matrix(const char* title, const core::Tensor& m) {
            std::println("{}", title);
            for (size_t a = 0; a < m.size(0); ++a) {
                std::println("  {:16.8f} {:16.8f} {:16.8f}", m.at({a, 0}), m.at({a, 1}), m.at({a, 2}));
            }
        }

    } // namespace

    int Application::run(std::unique_ptr<core::param::PolarParameters> params) {
        core::LogLevel level = core::LogLevel::Info;
        if (!core::parse_log_level(params->log_level, level)) {
            std::println(stderr, "Error: unknown log level '{}'", params->log_level);
            return 1;
        }
        auto& logger = core::Logger::get();
        logger.init(level, params->log_file);
        for (const auto& [name, module_level_name] : params->log_modules) {
            core::LogModule module;
            core::LogLevel module_level;
            if (!core::parse_log_module(name, module) || !core::parse_log_level(module_level_name, module_level)) {
                std::println(stderr, "Error: invalid log level '{}' for module '{}'", module_level_name, name);
                return 1;
            }
            logger.set_module_level(module, module_level);
        }

        auto settings = polar::make_settings(*params);
        if (!settings) {
            LOG_ERROR("{}", settings.error());
            std::println(stderr, "Error: {}", settings.error());
            return 1;
        }

        try {
            polar::SyntheticSystem system(params->synthetic);
            polar::JacobiCpksSolver cpks;
            core::ProcessResourceMonitor monitor(params->max_memory_mb);
            const polar::Collaborators collaborators{system, system, system, cpks, system, monitor};

            core::TensorStore store({.scratch_dir = params->scratch_dir});
            polar::PolarPipeline pipeline(store, collaborators, std::move(*settings));

            auto result = pipeline.run();
            if (!result) {
                const auto& err = result.error();
                if (err.key.empty()) {
                    std::println(stderr, "Error in stage '{}': {}", err.stage, err.message);
                } else {
                    std::println(stderr, "Error in stage '{}' (tensor '{}'): {}", err.stage, err.key, err.message);
                }
                return 1;
            }

            std::println("Functional: {} (low-rung {}, {})", params->xc, pipeline.context().xc(),
                         polar::xc_family_name(result->family));
            std::println("PT2 correlation energy: {:.10f}", result->e_pt2);
            print_matrix("SCF polarizability:", result->pol_scf);
            print_matrix("Correlation contribution:", result->pol_corr);
            print_matrix("Polarizability:", result->polar);

            if (!params->checkpoint_dataset.empty()) {
                store.checkpoint(params->checkpoint_dataset, params->checkpoint_metadata);
                LOG_INFO("Checkpoint written to {} and {}", params->checkpoint_dataset, params->checkpoint_metadata);
            }
        } catch (const core::Error& e) {
            LOG_ERROR("{}: {}", core::error_code_name(e.code()), e.what());
            std::println(stderr, "Error: {}", e.what());
            return 2;
        }

        logger.flush();
        return 0;
    }

} // namespace dhr::app
