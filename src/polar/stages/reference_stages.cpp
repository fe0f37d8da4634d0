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

    void run_scf(PolarContext& ctx) {
        LOG_TIMER(stage::RUN_SCF);

        const ReferenceOrbitals orbitals = ctx.collab().scf.run();
        const auto naux = ctx.collab().integrals.naux();
        if (naux <= 0) {
            throw core::UsageError("Integral engine reports no auxiliary basis functions");
        }
        ctx.set_orbitals(orbitals, static_cast<size_t>(naux));
        ctx.set_family(ctx.collab().xc.family(ctx.xc()));

        auto& store = ctx.store();
        store.create("mo_coeff", {.data = ctx.mo_coeff()});
        store.create("mo_energy", {.data = ctx.mo_energy()});

        LOG_INFO("Reference {}: nao={} nmo={} nocc={} nvir={} naux={}, low-rung {} ({})",
                 ctx.settings().xc.name, ctx.nao(), ctx.nmo(), ctx.nocc(), ctx.nvir(), ctx.naux(),
                 ctx.xc(), xc_family_name(ctx.family()));
    }

    void prepare_H_1(PolarContext& ctx) {
        LOG_TIMER(stage::H_1);
        ctx.require_orbitals(stage::H_1);

        const Tensor& C = ctx.mo_coeff();
        const Tensor H_1_ao = -ctx.collab().integrals.dipole_integrals();
        const Tensor H_1_mo = ctx.einsum("up,Auq->Apq", C, ctx.einsum("Auv,vq->Auq", H_1_ao, C));

        ctx.store().create("H_1_ao", {.data = H_1_ao});
        ctx.store().create("H_1_mo", {.data = H_1_mo});
    }

    void prepare_integral(PolarContext& ctx) {
        LOG_TIMER(stage::INTEGRAL);
        ctx.require_orbitals(stage::INTEGRAL);

        const size_t naux = ctx.naux(), nmo = ctx.nmo();
        auto Y_mo_ri = ctx.store().create("Y_mo_ri", {.resident = false, .shape = TensorShape{naux, nmo, nmo}});

        const int64_t nbatch = core::compute_chunk_size_elements(
            2 * static_cast<int64_t>(nmo * nmo), ctx.memory_mb(),
            core::total_elements(ctx.mo_coeff()), static_cast<int64_t>(naux));
        const auto offsets = ctx.collab().integrals.aux_shell_offsets();
        if (offsets.size() < 2 || offsets.front() != 0 || offsets.back() != static_cast<int64_t>(naux)) {
            throw core::UsageError(std::format("Auxiliary shell offsets do not span [0, {})", naux));
        }
        const auto groups = core::plan_partitioned_batches(offsets, nbatch);
        LOG_DEBUG("{}: {} auxiliary shells in {} batches of up to {} functions", stage::INTEGRAL,
                  offsets.size() - 1, groups.size(), nbatch);

        for (const auto& group : groups) {
            const Batch saux{group.offset_start, group.offset_stop};
            Y_mo_ri.write({saux}, ctx.collab().integrals.ri_mo_block(ctx.mo_coeff(), saux));
        }
    }

    void prepare_xc_kernel(PolarContext& ctx) {
        LOG_TIMER(stage::XC_KERNEL);
        ctx.require_orbitals(stage::XC_KERNEL);

        if (ctx.family() == XcFamily::HF) {
            LOG_DEBUG("{}: skipped for pure HF reference", stage::XC_KERNEL);
            return;
        }

        const auto& xc = ctx.collab().xc;
        const Tensor D = ctx.density_ao();
        const Tensor rho_sets = xc.density_on_grid(D.reshape({1, D.size(0), D.size(1)}));
        const Tensor rho = rho_sets.reshape({rho_sets.size(1), rho_sets.size(2)});
        const XcDerivatives derivs = xc.evaluate(rho, ctx.xc(), 2);

        ctx.store().create("rho", {.data = rho});
        ctx.store().create("fxc" + ctx.xc(), {.data = derivs.fxc});
    }

    void prepare_pt2(PolarContext& ctx) {
        LOG_TIMER(stage::PT2);
        auto Y_mo_ri = ctx.require_handle(stage::PT2, "Y_mo_ri");

        const size_t nocc = ctx.nocc(), nvir = ctx.nvir(), nmo = ctx.nmo(), naux = ctx.naux();
        const auto so = ctx.so(), sv = ctx.sv();
        const auto& xc = ctx.settings().xc;
        auto& store = ctx.store();

        const Tensor Y_ia = Y_mo_ri.read({full_range(naux), so, sv});
        const Tensor eo = ctx.eo(), ev = ctx.ev();

        auto t_ijab = store.create("t_ijab", {.resident = false, .shape = TensorShape{nocc, nocc, nvir, nvir}});
        auto G_ia = store.create("G_ia", {.resident = false, .shape = TensorShape{naux, nocc, nvir}});
        Tensor D_rdm1 = Tensor::zeros({nmo, nmo});

        const int64_t nbatch = core::compute_chunk_size_elements(
            4 * static_cast<int64_t>(nocc * nvir * nvir), ctx.memory_mb(),
            core::total_elements(Y_ia, D_rdm1), static_cast<int64_t>(nocc));
        const auto batches = plan_batches(0, static_cast<int64_t>(nocc), nbatch);
        LOG_DEBUG("{}: {} occupied batches of up to {}", stage::PT2, batches.size(), nbatch);

        double e_pt2 = 0.0;
        for (const auto& sI : batches) {
            const Tensor g_ijab = ctx.einsum("Pia,Pjb->ijab", Y_ia.block({full_range(naux), sI}), Y_ia);
            Tensor t = g_ijab.clone();
            t.div_(energy_denominator(eo.block({sI}), eo, ev, ev));
            t_ijab.write({sI}, t);

            const Tensor T = biorthogonalize(t, xc.cc, xc.c_os, xc.c_ss);
            e_pt2 += T.dot(g_ijab);

            G_ia.write({full_range(naux), sI}, ctx.einsum("ijab,Pjb->Pia", T, Y_ia));

            D_rdm1.add_block({so, so}, ctx.einsum("kiab,kjab->ij", T, t), -2.0);
            D_rdm1.add_block({sv, sv}, ctx.einsum("ijac,ijbc->ab", T, t), 2.0);
        }

        ctx.e_pt2 = e_pt2;
        store.create("D_rdm1", {.data = D_rdm1});
        LOG_INFO("PT2 correlation energy: {:.10f}", e_pt2);
    }

    void prepare_lagrangian(PolarContext& ctx) {
        LOG_TIMER(stage::LAGRANGIAN);
        auto Y_mo_ri = ctx.require_handle(stage::LAGRANGIAN, "Y_mo_ri");
        auto G_ia = ctx.require_handle(stage::LAGRANGIAN, "G_ia");
        const Tensor D_rdm1 = ctx.require(stage::LAGRANGIAN, "D_rdm1");

        const size_t nocc = ctx.nocc(), nvir = ctx.nvir(), nmo = ctx.nmo(), naux = ctx.naux();
        const auto so = ctx.so(), sv = ctx.sv(), sa = ctx.sa();

        Tensor L = ctx.ax0_core(sv, so, sa, sa, D_rdm1);

        const int64_t nbatch = core::compute_chunk_size_elements(
            static_cast<int64_t>(nmo * nmo + 2 * nocc * nvir), ctx.memory_mb(),
            core::total_elements(L, D_rdm1), static_cast<int64_t>(naux));
        const auto batches = plan_batches(0, static_cast<int64_t>(naux), nbatch);
        LOG_DEBUG("{}: {} auxiliary batches of up to {}", stage::LAGRANGIAN, batches.size(), nbatch);

        for (const auto& saux : batches) {
            const Tensor Y_blk = Y_mo_ri.read({saux});
            const Tensor G_blk = G_ia.read({saux});
            const auto sP = full_range(static_cast<size_t>(saux.size()));
            L.add_(ctx.einsum("Pja,Pij->ai", G_blk, Y_blk.block({sP, so, so})), -4.0);
            L.add_(ctx.einsum("Pib,Pab->ai", G_blk, Y_blk.block({sP, sv, sv})), 4.0);
        }

        if (ctx.has_xc_n()) {
            L.add_(ctx.non_consistent_fock_mo().block({sv, so}), 4.0);
        }

        ctx.store().create("L", {.data = L});
    }

    void prepare_D_r(PolarContext& ctx) {
        LOG_TIMER(stage::D_R);
        const Tensor L = ctx.require(stage::D_R, "L");
        const Tensor D_rdm1 = ctx.require(stage::D_R, "D_rdm1");

        Tensor D_r = D_rdm1.clone();
        D_r.set_block({ctx.sv(), ctx.so()}, ctx.solve_cpks(L));
        ctx.store().create("D_r", {.data = D_r});
    }

} // namespace dhr::polar
