/* SPDX-FileCopyrightText: 2025 DHResponse Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "polar_context.hpp"

namespace dhr::polar {

    namespace stage {
        inline constexpr const char* RUN_SCF = "run_scf";
        inline constexpr const char* H_1 = "prepare_H_1";
        inline constexpr const char* INTEGRAL = "prepare_integral";
        inline constexpr const char* XC_KERNEL = "prepare_xc_kernel";
        inline constexpr const char* PT2 = "prepare_pt2";
        inline constexpr const char* LAGRANGIAN = "prepare_lagrangian";
        inline constexpr const char* D_R = "prepare_D_r";
        inline constexpr const char* U_1 = "prepare_U_1";
        inline constexpr const char* DMU = "prepare_dmU";
        inline constexpr const char* AX1_GGA = "prepare_polar_Ax1_gga";
        inline constexpr const char* PDA_F_0_MO = "prepare_pdA_F_0_mo";
        inline constexpr const char* PDA_Y_IA_RI = "prepare_pdA_Y_ia_ri";
        inline constexpr const char* PT2_DERIV = "prepare_pt2_deriv";
        inline constexpr const char* POLAR = "prepare_polar";
    } // namespace stage

    // Reference quantities (reference_stages.cpp)
    void run_scf(PolarContext& ctx);
    void prepare_H_1(PolarContext& ctx);
    void prepare_integral(PolarContext& ctx);
    void prepare_xc_kernel(PolarContext& ctx);
    void prepare_pt2(PolarContext& ctx);
    void prepare_lagrangian(PolarContext& ctx);
    void prepare_D_r(PolarContext& ctx);

    // First-order response (response_stages.cpp)
    void prepare_U_1(PolarContext& ctx);
    void prepare_pdA_F_0_mo(PolarContext& ctx);
    void prepare_pdA_Y_ia_ri(PolarContext& ctx);
    void prepare_pt2_deriv(PolarContext& ctx);

    // Gradient-corrected kernel response (gga_stages.cpp)
    void prepare_dmU(PolarContext& ctx);
    void prepare_polar_Ax1_gga(PolarContext& ctx);

    // Final assembly (property_stage.cpp)
    Tensor compute_SCR3(PolarContext& ctx);
    void prepare_polar(PolarContext& ctx);

} // namespace dhr::polar
