/* SPDX-FileCopyrightText: 2025 DHResponse Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/logger.hpp"
#include "polar/amplitude_ops.hpp"
#include "polar/stages.hpp"
#include "polar/xc_response.hpp"

namespace dhr::polar {

    using core::full_range;
    using core::make_batch;

    namespace {

        Tensor row(const Tensor& t, const size_t i) {
            const Tensor blk = t.block({make_batch(i, i + 1)});
            return blk.reshape({blk.size(1), blk.size(2)});
        }

    } // namespace

    void prepare_dmU(PolarContext& ctx) {
        LOG_TIMER(stage::DMU);
        const Tensor U_1 = ctx.require(stage::DMU, "U_1");
        const Tensor D_r = ctx.require(stage::DMU, "D_r");
        const Tensor rho = ctx.require(stage::DMU, "rho");

        const size_t nao = ctx.nao();
        const size_t ncomp = U_1.size(0);
        const Tensor& C = ctx.mo_coeff();
        const Tensor Co = ctx.mo_coeff_occ();

        Tensor dmU = ctx.einsum("Aui,vi->Auv",
                                ctx.einsum("um,Ami->Aui", C, U_1.block({full_range(ncomp), ctx.sa(), ctx.so()})), Co);
        symmetrize_last2_(dmU);
        Tensor dmDr = ctx.einsum("uq,vq->uv", ctx.einsum("up,pq->uq", C, D_r), C);
        symmetrize_last2_(dmDr);

        Tensor dmX = Tensor::empty({ncomp + 1, nao, nao});
        dmX.set_block({make_batch(0, ncomp)}, dmU);
        dmX.set_block({make_batch(ncomp, ncomp + 1)}, dmDr.reshape({1, nao, nao}));

        const auto& xc = ctx.collab().xc;
        const Tensor rhoX = xc.density_on_grid(dmX);
        const XcDerivatives derivs = xc.evaluate(rho, ctx.xc(), 3);
        if (!derivs.kxc.is_valid()) {
            throw core::UsageError("XC kernel returned no third derivatives for " + ctx.xc());
        }

        auto& store = ctx.store();
        store.create("rhoU", {.data = rhoX.block({make_batch(0, ncomp)})});
        store.create("rhoDr", {.data = row(rhoX, ncomp)});
        store.create("kxc" + ctx.xc(), {.data = derivs.kxc});
        LOG_DEBUG("{}: {} perturbed densities on {} grid points", stage::DMU, ncomp, rho.size(1));
    }

    void prepare_polar_Ax1_gga(PolarContext& ctx) {
        LOG_TIMER(stage::AX1_GGA);
        const Tensor U_1 = ctx.require(stage::AX1_GGA, "U_1");
        const Tensor rho = ctx.require(stage::AX1_GGA, "rho");
        const Tensor rhoU = ctx.require(stage::AX1_GGA, "rhoU");
        const Tensor rhoDr = ctx.require(stage::AX1_GGA, "rhoDr");
        const Tensor fxc = ctx.require(stage::AX1_GGA, "fxc" + ctx.xc());
        const Tensor kxc = ctx.require(stage::AX1_GGA, "kxc" + ctx.xc());

        const auto& xc = ctx.collab().xc;
        const Tensor weights = xc.grid_weights();
        const size_t nao = ctx.nao();
        const size_t ncomp = U_1.size(0);

        Tensor Ax1 = Tensor::zeros({ncomp, nao, nao});
        for (size_t i = 0; i < ncomp; ++i) {
            const Tensor wv2 = rks_gga_wv2(rho, row(rhoU, i), rhoDr, fxc, kxc, weights);
            const Tensor v = xc.contract_potential(wv2);
            Ax1.add_block({make_batch(i, i + 1)}, (v + v.transpose_last2()).reshape({1, nao, nao}), 2.0);
        }

        // Ax1[A,u,v] C[u,m] Co[v,i] U_1[B,m,i]
        const Tensor X = ctx.einsum("um,Aui->Ami", ctx.mo_coeff(), ctx.einsum("Auv,vi->Aui", Ax1, ctx.mo_coeff_occ()));
        const Tensor res = ctx.einsum("Ami,Bmi->AB", X, U_1.block({full_range(ncomp), ctx.sa(), ctx.so()}));
        ctx.store().create("Ax1_contrib", {.data = res});
    }

} // namespace dhr::polar
