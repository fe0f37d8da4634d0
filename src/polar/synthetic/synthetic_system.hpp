/* SPDX-FileCopyrightText: 2025 DHResponse Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/parameters.hpp"
#include "polar/collaborators.hpp"
#include <string>

namespace dhr::polar {

    /**
     * @brief Seeded model system standing in for a quantum chemistry backend.
     *
     * Orbitals are a random orthonormal basis (nao == nmo) with a gap between
     * occupied and virtual energies. The RI factors B[P,u,v] are symmetric in
     * (u, v) so that (uv|ls) = sum_P B[P,u,v] B[P,l,s] behaves like a real
     * two-electron integral, and the Fock response is J - 0.5 cx K on the
     * symmetrized response density. Same seed, same system.
     */
    class SyntheticSystem : public IScfDriver,
                            public IIntegralEngine,
                            public IFockResponse,
                            public IXcKernel {
    public:
        explicit SyntheticSystem(const core::param::SyntheticSystemConfig& config);

        // IScfDriver
        ReferenceOrbitals run() override;

        // IIntegralEngine
        Tensor dipole_integrals() const override { return dipole_; }
        int64_t naux() const override { return static_cast<int64_t>(naux_); }
        std::vector<int64_t> aux_shell_offsets() const override;
        Tensor ri_mo_block(const Tensor& mo_coeff, const Batch& aux_batch) const override;
        Tensor non_consistent_fock(const Tensor& dm, const std::string& xc) const override;

        // IFockResponse
        Tensor apply(const Tensor& mo_coeff,
                     const Batch& sp, const Batch& sq,
                     const Batch& sr, const Batch& ss,
                     const Tensor& X, const std::string& xc) const override;

        // IXcKernel
        XcFamily family(const std::string& xc) const override;
        XcDerivatives evaluate(const Tensor& rho, const std::string& xc, int deriv) const override;
        Tensor density_on_grid(const Tensor& dms) const override;
        Tensor grid_weights() const override { return weights_; }
        Tensor contract_potential(const Tensor& wv) const override;

        size_t nao() const { return nao_; }
        size_t nocc() const { return nocc_; }
        size_t ngrid() const { return ngrid_; }
        int scf_runs() const { return scf_runs_; }

        /// Coulomb and exchange matrices for a stack of symmetric AO densities (nset, nao, nao)
        Tensor coulomb(const Tensor& dms) const;
        Tensor exchange(const Tensor& dms) const;

        /// Exact-exchange fraction of a functional string ("HF", "0.5*HF + ...", "B3LYPg", "PBE0")
        static double exact_exchange_fraction(const std::string& xc);

    private:
        size_t nocc_;
        size_t nvir_;
        size_t nao_;
        size_t naux_;
        size_t ngrid_;
        XcFamily dft_family_;

        Tensor mo_coeff_;  // (nao, nmo)
        Tensor mo_energy_; // (nmo)
        Tensor mo_occ_;    // (nmo)
        Tensor dipole_;    // (3, nao, nao)
        Tensor ri_ao_;     // (naux, nao, nao)
        Tensor ao_;        // (4, ngrid, nao): values and x/y/z derivatives
        Tensor weights_;   // (ngrid)
        int scf_runs_ = 0;
    };

} // namespace dhr::polar
