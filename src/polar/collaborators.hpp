/* SPDX-FileCopyrightText: 2025 DHResponse Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/resource_monitor.hpp"
#include <core/tensor.hpp>
#include <functional>
#include <string>
#include <vector>

namespace dhr::polar {

    using core::Batch;
    using core::Tensor;

    /// Reference orbitals produced by the SCF collaborator
    struct ReferenceOrbitals {
        Tensor mo_coeff;  // (nao, nmo)
        Tensor mo_energy; // (nmo)
        Tensor mo_occ;    // (nmo), occupied orbitals first
        int64_t nocc = 0;
    };

    enum class XcFamily : uint8_t {
        HF = 0,
        LDA = 1,
        GGA = 2
    };

    inline const char* xc_family_name(const XcFamily family) {
        switch (family) {
        case XcFamily::HF: return "HF";
        case XcFamily::LDA: return "LDA";
        case XcFamily::GGA: return "GGA";
        default: return "unknown";
        }
    }

    struct XcDerivatives {
        Tensor fxc; // (3, ngrid): frr, frg, fgg
        Tensor kxc; // (4, ngrid): frrr, frrg, frgg, fggg; invalid unless deriv >= 3
    };

    class IScfDriver {
    public:
        virtual ~IScfDriver() = default;

        virtual ReferenceOrbitals run() = 0;
    };

    class IIntegralEngine {
    public:
        virtual ~IIntegralEngine() = default;

        // Dipole integrals r_x, r_y, r_z over AOs, (3, nao, nao)
        virtual Tensor dipole_integrals() const = 0;

        virtual int64_t naux() const = 0;

        // First auxiliary function of every shell followed by naux; integral
        // batches never split a shell
        virtual std::vector<int64_t> aux_shell_offsets() const = 0;

        // RI three-index integrals transformed to MOs for one auxiliary batch,
        // (batch, nmo, nmo)
        virtual Tensor ri_mo_block(const Tensor& mo_coeff, const Batch& aux_batch) const = 0;

        // Fock matrix of functional @p xc evaluated at AO density @p dm, (nao, nao)
        virtual Tensor non_consistent_fock(const Tensor& dm, const std::string& xc) const = 0;
    };

    /**
     * @brief Fock response operator.
     *
     * Maps X of shape (nset, |sr|, |ss|) to the MO block (nset, |sp|, |sq|) of the
     * response Fock matrix built from the symmetrized density C_r X C_s^T + h.c.
     */
    class IFockResponse {
    public:
        virtual ~IFockResponse() = default;

        virtual Tensor apply(const Tensor& mo_coeff,
                             const Batch& sp, const Batch& sq,
                             const Batch& sr, const Batch& ss,
                             const Tensor& X, const std::string& xc) const = 0;
    };

    /// Linear map on (nset, nvir, nocc) amplitudes
    using CpksOperator = std::function<Tensor(const Tensor&)>;

    class ICpksSolver {
    public:
        virtual ~ICpksSolver() = default;

        // Solves (e_a - e_i) U + A(U) = -rhs for U of shape (nset, nvir, nocc)
        virtual Tensor solve(const CpksOperator& op,
                             const Tensor& mo_energy,
                             const Tensor& mo_occ,
                             const Tensor& rhs,
                             int max_cycle,
                             double tol) const = 0;
    };

    class IXcKernel {
    public:
        virtual ~IXcKernel() = default;

        virtual XcFamily family(const std::string& xc) const = 0;

        // Kernel derivatives at grid density @p rho (4, ngrid)
        virtual XcDerivatives evaluate(const Tensor& rho, const std::string& xc, int deriv) const = 0;

        // Density and gradient on the grid for each AO density, (nset, 4, ngrid)
        virtual Tensor density_on_grid(const Tensor& dms) const = 0;

        virtual Tensor grid_weights() const = 0;

        // sum_rg wv[r,g] ao[r,g,u] ao[0,g,v], (nao, nao)
        virtual Tensor contract_potential(const Tensor& wv) const = 0;
    };

    /// Non-owning bundle of every external service the pipeline calls
    struct Collaborators {
        IScfDriver& scf;
        IIntegralEngine& integrals;
        IFockResponse& fock;
        ICpksSolver& cpks;
        IXcKernel& xc;
        const core::IResourceMonitor& resources;
    };

} // namespace dhr::polar
