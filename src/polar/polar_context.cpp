/* SPDX-FileCopyrightText: 2025 DHResponse Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "polar_context.hpp"
#include "core/logger.hpp"
#include <format>

namespace dhr::polar {

    void PolarContext::set_orbitals(const ReferenceOrbitals& orbitals, const size_t naux) {
        const Tensor& C = orbitals.mo_coeff;
        if (!C.is_valid() || C.ndim() != 2) {
            throw core::UsageError("SCF returned invalid mo_coeff " + C.str());
        }
        const size_t nmo = C.size(1);
        if (orbitals.mo_energy.numel() != nmo || orbitals.mo_occ.numel() != nmo) {
            throw core::UsageError(std::format("SCF returned {} orbital energies and {} occupations for {} orbitals",
                                               orbitals.mo_energy.numel(), orbitals.mo_occ.numel(), nmo));
        }
        if (orbitals.nocc <= 0 || static_cast<size_t>(orbitals.nocc) >= nmo) {
            throw core::UsageError(std::format("SCF returned nocc={} for {} orbitals", orbitals.nocc, nmo));
        }

        mo_coeff_ = C;
        mo_energy_ = orbitals.mo_energy.reshape({nmo});
        mo_occ_ = orbitals.mo_occ.reshape({nmo});
        nao_ = C.size(0);
        nmo_ = nmo;
        nocc_ = static_cast<size_t>(orbitals.nocc);
        nvir_ = nmo - nocc_;
        naux_ = naux;
    }

    Tensor PolarContext::mo_coeff_occ() const {
        return mo_coeff_.block({core::full_range(nao_), so()});
    }

    Tensor PolarContext::eo() const {
        return mo_energy_.block({so()});
    }

    Tensor PolarContext::ev() const {
        return mo_energy_.block({sv()});
    }

    Tensor PolarContext::density_ao() const {
        const Tensor Co = mo_coeff_occ();
        return core::einsum("ui,vi->uv", Co, Co, settings_.contraction).mul_(2.0);
    }

    Tensor PolarContext::non_consistent_fock_mo() const {
        if (!has_xc_n()) {
            throw core::UsageError("Functional " + settings_.xc.name + " has no non-consistent part");
        }
        const Tensor F_ao = collab_.integrals.non_consistent_fock(density_ao(), *settings_.xc.xc_n);
        const Tensor tmp = core::einsum("uv,vq->uq", F_ao, mo_coeff_, settings_.contraction);
        return core::einsum("up,uq->pq", mo_coeff_, tmp, settings_.contraction);
    }

    Tensor PolarContext::require(const std::string& stage, const std::string& key) {
        if (!store_.contains(key)) {
            throw core::PreconditionError(stage, key);
        }
        return store_.load(key);
    }

    core::StoredTensor PolarContext::require_handle(const std::string& stage, const std::string& key) {
        if (!store_.contains(key)) {
            throw core::PreconditionError(stage, key);
        }
        return store_.at(key);
    }

    void PolarContext::require_orbitals(const std::string& stage) const {
        if (!has_orbitals() || !store_.contains("mo_coeff")) {
            throw core::PreconditionError(stage, "mo_coeff");
        }
    }

    Tensor PolarContext::ax0_core(const core::Batch& sp, const core::Batch& sq,
                                  const core::Batch& sr, const core::Batch& ss,
                                  const Tensor& X, const std::string& xc) const {
        if (X.ndim() == 2) {
            const Tensor res = collab_.fock.apply(mo_coeff_, sp, sq, sr, ss,
                                                  X.reshape({1, X.size(0), X.size(1)}), xc);
            return res.reshape({res.size(1), res.size(2)});
        }
        return collab_.fock.apply(mo_coeff_, sp, sq, sr, ss, X, xc);
    }

    CpksOperator PolarContext::cpks_operator() const {
        return [this](const Tensor& U) {
            return ax0_core(sv(), so(), sv(), so(), U);
        };
    }

    Tensor PolarContext::solve_cpks(const Tensor& rhs) const {
        const bool single = rhs.ndim() == 2;
        const Tensor rhs3 = single ? rhs.reshape({1, rhs.size(0), rhs.size(1)}) : rhs;
        const Tensor U = collab_.cpks.solve(cpks_operator(), mo_energy_, mo_occ_, rhs3,
                                            settings_.cpks_max_cycle, settings_.cpks_tol);
        return single ? U.reshape({U.size(1), U.size(2)}) : U;
    }

} // namespace dhr::polar
