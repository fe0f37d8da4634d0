/* SPDX-FileCopyrightText: 2025 DHResponse Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/error.hpp"
#include "core/parameters.hpp"
#include "polar_context.hpp"
#include <expected>
#include <functional>
#include <string>
#include <vector>

namespace dhr::polar {

    enum class PipelineState : uint8_t {
        Initialized,
        ScfDone,
        PerturbationPrepared,
        IntegralsPrepared,
        ResponseSolved,
        GgaKernelPrepared,
        DerivativeDensityAssembled,
        PropertyAssembled,
        Done,
        Failed
    };

    const char* pipeline_state_name(PipelineState state);

    struct PipelineError {
        std::string stage;
        std::string key; // empty unless the failure names a tensor
        core::ErrorCode code = core::ErrorCode::USAGE;
        std::string message;
    };

    struct PolarResult {
        Tensor pol_scf;  // (3, 3)
        Tensor pol_corr; // (3, 3)
        Tensor polar;    // (3, 3)
        double e_pt2 = 0.0;
        XcFamily family = XcFamily::HF;
        std::vector<std::string> stages_run;
    };

    /// Resolve a doubly hybrid name and solver settings from parameters
    std::expected<PolarSettings, std::string> make_settings(const core::param::PolarParameters& params);

    /**
     * @brief Runs the polarizability stages in their fixed order.
     *
     * The only branch is the GGA kernel response, taken when the XC
     * collaborator classifies the low-rung functional as gradient corrected.
     * A pipeline runs once; every stage reads its inputs from the store and
     * a failing stage moves the pipeline to Failed.
     */
    class PolarPipeline {
    public:
        PolarPipeline(core::TensorStore& store, const Collaborators& collaborators, PolarSettings settings);

        std::expected<PolarResult, PipelineError> run();

        PipelineState state() const { return state_; }
        const PolarContext& context() const { return ctx_; }

    private:
        struct Step {
            const char* name;
            std::function<void(PolarContext&)> fn;
        };

        bool run_steps(const std::vector<Step>& steps, PipelineState on_success);
        void advance(PipelineState next);

        PolarContext ctx_;
        PipelineState state_ = PipelineState::Initialized;
        std::vector<std::string> stages_run_;
        PipelineError error_;
    };

} // namespace dhr::polar
