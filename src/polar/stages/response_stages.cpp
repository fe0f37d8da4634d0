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
    using core::TensorShape;

    namespace {

        // out[A,p,q] += U[A,p,q] e[p] + U[A,q,p] e[q]
        void add_orbital_energy_terms(Tensor& out, const Tensor& U, const Tensor& e) {
            const size_t ncomp = U.size(0), n = U.size(1);
            const double* u = U.ptr<double>();
            const double* pe = e.ptr<double>();
            double* o = out.ptr<double>();
            for (size_t A = 0; A < ncomp; ++A) {
                const double* ua = u + A * n * n;
                double* oa = o + A * n * n;
                for (size_t p = 0; p < n; ++p) {
                    for (size_t q = 0; q < n; ++q) {
                        oa[p * n + q] += ua[p * n + q] * pe[p] + ua[q * n + p] * pe[q];
                    }
                }
            }
        }

    } // namespace

    void prepare_U_1(PolarContext& ctx) {
        LOG_TIMER(stage::U_1);
        const Tensor H_1_mo = ctx.require(stage::U_1, "H_1_mo");

        const auto sA = full_range(H_1_mo.size(0));
        const auto so = ctx.so(), sv = ctx.sv();

        const Tensor U_1_vo = ctx.solve_cpks(H_1_mo.block({sA, sv, so}));

        Tensor U_1 = Tensor::zeros(H_1_mo.shape());
        U_1.set_block({sA, sv, so}, U_1_vo);
        U_1.set_block({sA, so, sv}, -U_1_vo.transpose_last2());
        ctx.store().create("U_1", {.data = U_1});
    }

    void prepare_pdA_F_0_mo(PolarContext& ctx) {
        LOG_TIMER(stage::PDA_F_0_MO);
        const Tensor H_1_mo = ctx.require(stage::PDA_F_0_MO, "H_1_mo");
        const Tensor U_1 = ctx.require(stage::PDA_F_0_MO, "U_1");

        const auto so = ctx.so(), sa = ctx.sa();
        const Tensor U_1_o = U_1.block({full_range(U_1.size(0)), sa, so});

        Tensor pdA_F_0_mo = H_1_mo.clone();
        add_orbital_energy_terms(pdA_F_0_mo, U_1, ctx.mo_energy());
        pdA_F_0_mo.add_(ctx.ax0_core(sa, sa, sa, so, U_1_o));
        ctx.store().create("pdA_F_0_mo", {.data = pdA_F_0_mo});

        if (ctx.has_xc_n()) {
            const Tensor F_0_mo_n = ctx.non_consistent_fock_mo();
            Tensor pdA_F_0_mo_n = H_1_mo.clone();
            pdA_F_0_mo_n.add_(ctx.einsum("Amp,mq->Apq", U_1, F_0_mo_n));
            pdA_F_0_mo_n.add_(ctx.einsum("Amq,pm->Apq", U_1, F_0_mo_n));
            pdA_F_0_mo_n.add_(ctx.ax0_core(sa, sa, sa, so, U_1_o, *ctx.settings().xc.xc_n));
            ctx.store().create("pdA_F_0_mo_n", {.data = pdA_F_0_mo_n});
        }
    }

    void prepare_pdA_Y_ia_ri(PolarContext& ctx) {
        LOG_TIMER(stage::PDA_Y_IA_RI);
        const Tensor U_1 = ctx.require(stage::PDA_Y_IA_RI, "U_1");
        auto Y_mo_ri = ctx.require_handle(stage::PDA_Y_IA_RI, "Y_mo_ri");

        const size_t nocc = ctx.nocc(), nvir = ctx.nvir(), nmo = ctx.nmo(), naux = ctx.naux();
        const size_t ncomp = U_1.size(0);
        const auto so = ctx.so(), sv = ctx.sv(), sa = ctx.sa();
        const auto sA = full_range(ncomp);

        const Tensor U_1_o = U_1.block({sA, sa, so});
        const Tensor U_1_v = U_1.block({sA, sa, sv});

        auto pdA_Y_ia_ri = ctx.store().create(
            "pdA_Y_ia_ri", {.resident = false, .shape = TensorShape{ncomp, naux, nocc, nvir}});

        const int64_t nbatch = core::compute_chunk_size_elements(
            8 * static_cast<int64_t>(nmo * nmo), ctx.memory_mb(),
            core::total_elements(U_1), static_cast<int64_t>(naux));
        const auto batches = plan_batches(0, static_cast<int64_t>(naux), nbatch);
        LOG_DEBUG("{}: {} auxiliary batches of up to {}", stage::PDA_Y_IA_RI, batches.size(), nbatch);

        for (const auto& saux : batches) {
            const Tensor Y_blk = Y_mo_ri.read({saux});
            const auto sP = full_range(static_cast<size_t>(saux.size()));
            Tensor blk = ctx.einsum("Ami,Pma->APia", U_1_o, Y_blk.block({sP, sa, sv}));
            blk.add_(ctx.einsum("Ama,Pmi->APia", U_1_v, Y_blk.block({sP, sa, so})));
            pdA_Y_ia_ri.write({sA, saux}, blk);
        }
    }

    void prepare_pt2_deriv(PolarContext& ctx) {
        LOG_TIMER(stage::PT2_DERIV);
        const Tensor pdA_F_0_mo = ctx.require(stage::PT2_DERIV, "pdA_F_0_mo");
        auto Y_mo_ri = ctx.require_handle(stage::PT2_DERIV, "Y_mo_ri");
        const Tensor pdA_Y_ia_ri = ctx.require(stage::PT2_DERIV, "pdA_Y_ia_ri");
        auto t_ijab = ctx.require_handle(stage::PT2_DERIV, "t_ijab");

        const size_t nocc = ctx.nocc(), nvir = ctx.nvir(), nmo = ctx.nmo(), naux = ctx.naux();
        const size_t ncomp = pdA_F_0_mo.size(0);
        const auto so = ctx.so(), sv = ctx.sv();
        const auto sA = full_range(ncomp), sP = full_range(naux);
        const auto& xc = ctx.settings().xc;
        auto& store = ctx.store();

        const Tensor Y_ia_ri = Y_mo_ri.read({sP, so, sv});
        const Tensor eo = ctx.eo(), ev = ctx.ev();
        const Tensor pdA_F_oo = pdA_F_0_mo.block({sA, so, so});
        const Tensor pdA_F_vv = pdA_F_0_mo.block({sA, sv, sv});

        auto pdA_G_ia = store.create("pdA_G_ia", {.resident = false, .shape = TensorShape{ncomp, naux, nocc, nvir}});
        auto pdA_D_rdm1 = store.create("pdA_D_rdm1", {.shape = TensorShape{ncomp, nmo, nmo}});

        // Per occupied i: t, D, T and pdA_t, pdA_T for every component, plus the G block
        const int64_t ovv = static_cast<int64_t>(nocc * nvir * nvir);
        const int64_t nbatch_i = core::compute_chunk_size_elements(
            (3 + 2 * static_cast<int64_t>(ncomp)) * ovv + static_cast<int64_t>(ncomp * naux * nvir),
            ctx.memory_mb(), core::total_elements(Y_ia_ri, pdA_F_0_mo, pdA_Y_ia_ri), static_cast<int64_t>(nocc));
        const auto outer = plan_batches(0, static_cast<int64_t>(nocc), nbatch_i);
        LOG_DEBUG("{}: {} occupied batches of up to {}", stage::PT2_DERIV, outer.size(), nbatch_i);

        for (const auto& sI : outer) {
            const Tensor t = t_ijab.read({sI});
            const Tensor D_ijab = energy_denominator(eo.block({sI}), eo, ev, ev);

            Tensor pdA_t = ctx.einsum("APia,Pjb->Aijab", pdA_Y_ia_ri.block({sA, sP, sI}), Y_ia_ri);
            pdA_t.add_(ctx.einsum("APjb,Pia->Aijab", pdA_Y_ia_ri, Y_ia_ri.block({sP, sI})));

            // Per occupied k: the t_ijab[k] slice and its contraction operand
            const int64_t nbatch_k = core::compute_chunk_size_elements(
                2 * ovv, ctx.memory_mb(),
                core::total_elements(Y_ia_ri, pdA_F_0_mo, pdA_Y_ia_ri, t, D_ijab, pdA_t) +
                    static_cast<int64_t>(pdA_t.numel()),
                static_cast<int64_t>(nocc));
            const auto inner = plan_batches(0, static_cast<int64_t>(nocc), nbatch_k);
            LOG_TRACE("{}: block {} contracts t_ijab in {} batches of up to {}", stage::PT2_DERIV, sI.str(),
                      inner.size(), nbatch_k);

            for (const auto& sK : inner) {
                const Tensor t_k = sK == sI ? t : t_ijab.read({sK});
                pdA_t.add_(ctx.einsum("Aki,kjab->Aijab", pdA_F_0_mo.block({sA, sK, sI}), t_k), -1.0);
            }
            pdA_t.add_(ctx.einsum("Akj,ikab->Aijab", pdA_F_oo, t), -1.0);
            pdA_t.add_(ctx.einsum("Acb,ijac->Aijab", pdA_F_vv, t));
            pdA_t.add_(ctx.einsum("Aca,ijcb->Aijab", pdA_F_vv, t));
            divide_trailing_(pdA_t, D_ijab);

            const Tensor T = biorthogonalize(t, xc.cc, xc.c_os, xc.c_ss);
            const Tensor pdA_T = biorthogonalize(pdA_t, xc.cc, xc.c_os, xc.c_ss);

            Tensor G_blk = ctx.einsum("Aijab,Pjb->APia", pdA_T, Y_ia_ri);
            G_blk.add_(ctx.einsum("ijab,APjb->APia", T, pdA_Y_ia_ri));
            pdA_G_ia.add({sA, sP, sI}, G_blk);

            pdA_D_rdm1.add({sA, so, so}, ctx.einsum("kiab,Akjab->Aij", T, pdA_t), -2.0);
            pdA_D_rdm1.add({sA, sv, sv}, ctx.einsum("ijac,Aijbc->Aab", T, pdA_t), 2.0);
        }

        const int64_t sym_chunk = core::compute_chunk_size_elements(
            2 * static_cast<int64_t>(nmo * nmo), ctx.memory_mb(), 0, static_cast<int64_t>(ncomp));
        symmetrize_last2(pdA_D_rdm1, sym_chunk);
    }

} // namespace dhr::polar
