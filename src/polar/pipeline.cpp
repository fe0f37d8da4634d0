/* SPDX-FileCopyrightText: 2025 DHResponse Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "pipeline.hpp"
#include "core/logger.hpp"
#include "stages.hpp"
#include <format>

namespace dhr::polar {

    const char* pipeline_state_name(const PipelineState state) {
        switch (state) {
        case PipelineState::Initialized: return "Initialized";
        case PipelineState::ScfDone: return "ScfDone";
        case PipelineState::PerturbationPrepared: return "PerturbationPrepared";
        case PipelineState::IntegralsPrepared: return "IntegralsPrepared";
        case PipelineState::ResponseSolved: return "ResponseSolved";
        case PipelineState::GgaKernelPrepared: return "GgaKernelPrepared";
        case PipelineState::DerivativeDensityAssembled: return "DerivativeDensityAssembled";
        case PipelineState::PropertyAssembled: return "PropertyAssembled";
        case PipelineState::Done: return "Done";
        case PipelineState::Failed: return "Failed";
        default: return "Unknown";
        }
    }

    std::expected<PolarSettings, std::string> make_settings(const core::param::PolarParameters& params) {
        auto xc = parse_xc_dh(params.xc);
        if (!xc) {
            return std::unexpected(xc.error());
        }
        PolarSettings settings;
        settings.xc = std::move(*xc);
        settings.cpks_max_cycle = params.cpks_max_cycle;
        settings.cpks_tol = params.cpks_tol;
        settings.contraction.parallel = params.parallel_contractions;
        return settings;
    }

    PolarPipeline::PolarPipeline(core::TensorStore& store, const Collaborators& collaborators, PolarSettings settings)
        : ctx_(store, collaborators, std::move(settings)) {}

    void PolarPipeline::advance(const PipelineState next) {
        LOG_DEBUG("Pipeline state {} -> {}", pipeline_state_name(state_), pipeline_state_name(next));
        state_ = next;
    }

    bool PolarPipeline::run_steps(const std::vector<Step>& steps, const PipelineState on_success) {
        for (const auto& step : steps) {
            try {
                LOG_DEBUG("Running stage {}", step.name);
                step.fn(ctx_);
                stages_run_.emplace_back(step.name);
            } catch (const core::PreconditionError& e) {
                LOG_ERROR("Stage {} failed: missing tensor '{}'", e.stage(), e.key());
                error_ = {e.stage(), e.key(), e.code(), e.what()};
                advance(PipelineState::Failed);
                return false;
            } catch (const core::NotFoundError& e) {
                LOG_ERROR("Stage {} failed: {}", step.name, e.what());
                error_ = {step.name, e.key(), e.code(), e.what()};
                advance(PipelineState::Failed);
                return false;
            } catch (const core::Error& e) {
                LOG_ERROR("Stage {} failed ({}): {}", step.name, core::error_code_name(e.code()), e.what());
                error_ = {step.name, {}, e.code(), e.what()};
                advance(PipelineState::Failed);
                return false;
            }
        }
        advance(on_success);
        return true;
    }

    std::expected<PolarResult, PipelineError> PolarPipeline::run() {
        if (state_ != PipelineState::Initialized) {
            return std::unexpected(PipelineError{
                "run", {}, core::ErrorCode::USAGE,
                std::format("Pipeline already ran (state {})", pipeline_state_name(state_))});
        }

        LOG_INFO("Starting polarizability pipeline for {}", ctx_.settings().xc.name);
        LOG_TIMER("polar pipeline");

        if (!run_steps({{stage::RUN_SCF, run_scf}}, PipelineState::ScfDone) ||
            !run_steps({{stage::H_1, prepare_H_1}}, PipelineState::PerturbationPrepared) ||
            !run_steps({{stage::INTEGRAL, prepare_integral},
                        {stage::XC_KERNEL, prepare_xc_kernel}},
                       PipelineState::IntegralsPrepared) ||
            !run_steps({{stage::PT2, prepare_pt2},
                        {stage::LAGRANGIAN, prepare_lagrangian},
                        {stage::D_R, prepare_D_r},
                        {stage::U_1, prepare_U_1}},
                       PipelineState::ResponseSolved)) {
            return std::unexpected(error_);
        }

        if (ctx_.family() == XcFamily::GGA) {
            if (!run_steps({{stage::DMU, prepare_dmU},
                            {stage::AX1_GGA, prepare_polar_Ax1_gga}},
                           PipelineState::GgaKernelPrepared)) {
                return std::unexpected(error_);
            }
        } else {
            LOG_DEBUG("Low-rung functional {} is {}: no kernel response stages",
                      ctx_.xc(), xc_family_name(ctx_.family()));
        }

        if (!run_steps({{stage::PDA_F_0_MO, prepare_pdA_F_0_mo},
                        {stage::PDA_Y_IA_RI, prepare_pdA_Y_ia_ri},
                        {stage::PT2_DERIV, prepare_pt2_deriv}},
                       PipelineState::DerivativeDensityAssembled) ||
            !run_steps({{stage::POLAR, prepare_polar}}, PipelineState::PropertyAssembled)) {
            return std::unexpected(error_);
        }

        PolarResult result;
        try {
            auto& store = ctx_.store();
            result.pol_scf = store.load("pol_scf");
            result.pol_corr = store.load("pol_corr");
            result.polar = store.load("polar");
        } catch (const core::Error& e) {
            LOG_ERROR("Collecting results failed: {}", e.what());
            error_ = {stage::POLAR, {}, e.code(), e.what()};
            advance(PipelineState::Failed);
            return std::unexpected(error_);
        }
        result.e_pt2 = ctx_.e_pt2;
        result.family = ctx_.family();
        result.stages_run = stages_run_;

        advance(PipelineState::Done);
        LOG_INFO("Polarizability pipeline finished: {} stages", stages_run_.size());
        return result;
    }

} // namespace dhr::polar
