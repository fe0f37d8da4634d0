/* SPDX-FileCopyrightText: 2025 DHResponse Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/batch_planner.hpp"
#include "core/logger.hpp"
#include "polar/amplitude_ops.hpp"
#include "polar/stages.hpp"

namespace dhr::polar {

    using core::full_range;
    using core::plan_batches;

    Tensor compute_SCR3(PolarContext& ctx) {
        const Tensor U_1 = ctx.require(stage::POLAR, "U_1");
        auto G_ia = ctx.require_handle(stage::POLAR, "G_ia");
        auto pdA_G_ia = ctx.require_handle(stage::POLAR, "pdA_G_ia");
        auto Y_mo_ri = ctx.require_handle(stage::POLAR, "Y_mo_ri");

        const size_t nocc = ctx.nocc(), nvir = ctx.nvir(), nmo = ctx.nmo(), naux = ctx.naux();
        const size_t ncomp = U_1.size(0);
        const auto so = ctx.so(), sv = ctx.sv(), sa = ctx.sa();
        const auto sA = full_range(ncomp);

        const Tensor U_1_o = U_1.block({sA, sa, so});
        const Tensor U_1_v = U_1.block({sA, sa, sv});

        Tensor SCR3 = Tensor::zeros({ncomp, nvir, nocc});
        const int64_t nbatch = core::compute_chunk_size_elements(
            10 * static_cast<int64_t>(nmo * nmo), ctx.memory_mb(),
            core::total_elements(G_ia.shape(), pdA_G_ia.shape()), static_cast<int64_t>(naux));
        const auto batches = plan_batches(0, static_cast<int64_t>(naux), nbatch);
        LOG_DEBUG("{}: SCR3 over {} auxiliary batches of up to {}", stage::POLAR, batches.size(), nbatch);

        for (const auto& saux : batches) {
            const Tensor Y_blk = Y_mo_ri.read({saux});
            const Tensor G_blk = G_ia.read({saux});
            const Tensor pdA_G_blk = pdA_G_ia.read({sA, saux});
            const auto sP = full_range(static_cast<size_t>(saux.size()));

            Tensor pdA_Y_oo = ctx.einsum("Ami,Pmj->APij", U_1_o, Y_blk.block({sP, sa, so}));
            symmetrize_last2_(pdA_Y_oo);
            SCR3.add_(ctx.einsum("APja,Pij->Aai", pdA_G_blk, Y_blk.block({sP, so, so})), -4.0);
            SCR3.add_(ctx.einsum("Pja,APij->Aai", G_blk, pdA_Y_oo), -4.0);

            Tensor pdA_Y_vv = ctx.einsum("Ama,Pmb->APab", U_1_v, Y_blk.block({sP, sa, sv}));
            symmetrize_last2_(pdA_Y_vv);
            SCR3.add_(ctx.einsum("APib,Pab->Aai", pdA_G_blk, Y_blk.block({sP, sv, sv})), 4.0);
            SCR3.add_(ctx.einsum("Pib,APab->Aai", G_blk, pdA_Y_vv), 4.0);
        }

        if (ctx.has_xc_n()) {
            const Tensor pdA_F_0_mo_n = ctx.require(stage::POLAR, "pdA_F_0_mo_n");
            SCR3.add_(pdA_F_0_mo_n.block({sA, sv, so}), 4.0);
        }
        return SCR3;
    }

    void prepare_polar(PolarContext& ctx) {
        LOG_TIMER(stage::POLAR);
        const Tensor H_1_mo = ctx.require(stage::POLAR, "H_1_mo");
        const Tensor U_1 = ctx.require(stage::POLAR, "U_1");
        const Tensor pdA_F_0_mo = ctx.require(stage::POLAR, "pdA_F_0_mo");
        const Tensor D_r = ctx.require(stage::POLAR, "D_r");
        const Tensor pdA_D_rdm1 = ctx.require(stage::POLAR, "pdA_D_rdm1");

        const size_t ncomp = U_1.size(0), nmo = ctx.nmo();
        const auto so = ctx.so(), sv = ctx.sv(), sa = ctx.sa();
        const auto sA = full_range(ncomp), sN = full_range(nmo);

        const Tensor U_1_vo = U_1.block({sA, sv, so});
        const Tensor U_1_o = U_1.block({sA, sa, so});
        const Tensor U_1_v = U_1.block({sA, sa, sv});
        const Tensor D_r_vo = D_r.block({sv, so});

        const Tensor SCR1 = ctx.ax0_core(sa, sa, sa, sa, D_r);
        const Tensor SCR2 = H_1_mo + ctx.ax0_core(sa, sa, sv, so, U_1_vo);
        const Tensor SCR3 = compute_SCR3(ctx);

        Tensor pol_scf = ctx.einsum("Api,Bpi->AB", H_1_mo.block({sA, sa, so}), U_1_o);
        pol_scf.mul_(-4.0);

        // Three-factor products are contracted pairwise, innermost pair first
        Tensor pol_corr = ctx.einsum("Aai,Bai->AB", U_1_vo, ctx.einsum("Bma,mi->Bai", U_1_v, SCR1.block({sN, so})));
        pol_corr.add_(ctx.einsum("Aai,Bai->AB", U_1_vo, ctx.einsum("Bmi,ma->Bai", U_1_o, SCR1.block({sN, sv}))));
        pol_corr.add_(ctx.einsum("Apm,Bmp->AB", SCR2, ctx.einsum("Bmq,pq->Bmp", U_1, D_r)));
        pol_corr.add_(ctx.einsum("Amq,Bmq->AB", SCR2, ctx.einsum("Bmp,pq->Bmq", U_1, D_r)));
        pol_corr.add_(ctx.einsum("Apq,Bpq->AB", SCR2, pdA_D_rdm1));
        pol_corr.add_(ctx.einsum("Bai,Aai->AB", SCR3, U_1_vo));
        pol_corr.add_(ctx.einsum("Bki,Aik->AB", pdA_F_0_mo.block({sA, so, so}),
                                 ctx.einsum("Aai,ak->Aik", U_1_vo, D_r_vo)), -1.0);
        pol_corr.add_(ctx.einsum("Bca,Aac->AB", pdA_F_0_mo.block({sA, sv, sv}),
                                 ctx.einsum("Aai,ci->Aac", U_1_vo, D_r_vo)));
        pol_corr.mul_(-1.0);

        if (ctx.family() == XcFamily::GGA) {
            pol_corr.add_(ctx.require(stage::POLAR, "Ax1_contrib"), -2.0);
        }

        const Tensor polar = pol_scf + pol_corr;
        auto& store = ctx.store();
        store.create("pol_scf", {.data = pol_scf});
        store.create("pol_corr", {.data = pol_corr});
        store.create("polar", {.data = polar});

        LOG_INFO("Polarizability trace: SCF {:.8f}, correlation {:.8f}, total {:.8f}",
                 pol_scf.at({0, 0}) + pol_scf.at({1, 1}) + pol_scf.at({2, 2}),
                 pol_corr.at({0, 0}) + pol_corr.at({1, 1}) + pol_corr.at({2, 2}),
                 polar.at({0, 0}) + polar.at({1, 1}) + polar.at({2, 2}));
    }

} // namespace dhr::polar
