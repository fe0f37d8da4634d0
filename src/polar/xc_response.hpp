/* SPDX-FileCopyrightText: 2025 DHResponse Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <core/tensor.hpp>

namespace dhr::polar {

    /**
     * @brief Second-order GGA kernel response on the grid.
     *
     * rho0, rho1, rho2 are (4, ngrid) densities with gradients; fxc is
     * (frr, frg, fgg) and kxc is (frrr, frrg, frgg, fggg). Returns the weighted
     * potential wv of shape (4, ngrid) for IXcKernel::contract_potential.
     */
    core::Tensor rks_gga_wv2(const core::Tensor& rho0, const core::Tensor& rho1, const core::Tensor& rho2,
                             const core::Tensor& fxc, const core::Tensor& kxc, const core::Tensor& weight);

} // namespace dhr::polar
