/* SPDX-FileCopyrightText: 2025 DHResponse Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "collaborators.hpp"
#include "core/tensor_store.hpp"
#include "xc_dh.hpp"
#include <core/tensor.hpp>
#include <string>

namespace dhr::polar {

    struct PolarSettings {
        XcDoublyHybrid xc;
        int cpks_max_cycle = 100;
        double cpks_tol = 1e-8;
        core::ContractionOptions contraction;
    };

    /**
     * @brief Shared state of one polarizability run.
     *
     * Tensors live in the store; the context carries orbital dimensions,
     * settings and the collaborators every stage calls.
     */
    class PolarContext {
    public:
        PolarContext(core::TensorStore& store, const Collaborators& collaborators, PolarSettings settings)
            : store_(store),
              collab_(collaborators),
              settings_(std::move(settings)) {}

        core::TensorStore& store() { return store_; }
        const Collaborators& collab() const { return collab_; }
        const PolarSettings& settings() const { return settings_; }
        const core::ContractionOptions& contraction() const { return settings_.contraction; }

        // Low-rung functional used for kernels and the response operator
        const std::string& xc() const { return settings_.xc.xc_s; }
        bool has_xc_n() const { return settings_.xc.xc_n.has_value(); }
        XcFamily family() const { return family_; }
        void set_family(const XcFamily family) { family_ = family; }

        // Orbitals, set by run_scf
        void set_orbitals(const ReferenceOrbitals& orbitals, size_t naux);
        bool has_orbitals() const { return mo_coeff_.is_valid(); }

        size_t nao() const { return nao_; }
        size_t nmo() const { return nmo_; }
        size_t nocc() const { return nocc_; }
        size_t nvir() const { return nvir_; }
        size_t naux() const { return naux_; }

        core::Batch so() const { return core::make_batch(0, nocc_); }
        core::Batch sv() const { return core::make_batch(nocc_, nmo_); }
        core::Batch sa() const { return core::make_batch(0, nmo_); }

        const Tensor& mo_coeff() const { return mo_coeff_; }
        const Tensor& mo_energy() const { return mo_energy_; }
        const Tensor& mo_occ() const { return mo_occ_; }
        Tensor mo_coeff_occ() const; // (nao, nocc)
        Tensor eo() const;           // (nocc)
        Tensor ev() const;           // (nvir)
        Tensor density_ao() const;   // 2 Co Co^T

        /// C^T F_n C with F_n the non-consistent functional's Fock matrix at density_ao()
        Tensor non_consistent_fock_mo() const;

        double e_pt2 = 0.0;

        /// Advisory budget for the next batched loop, MB
        double memory_mb() const { return collab_.resources.available_memory_mb(); }

        /// Full tensor for @p key; PreconditionError naming @p stage if absent
        Tensor require(const std::string& stage, const std::string& key);
        core::StoredTensor require_handle(const std::string& stage, const std::string& key);
        void require_orbitals(const std::string& stage) const;

        /// Fock response restricted to the given MO blocks; X is (nset, |sr|, |ss|) or (|sr|, |ss|)
        Tensor ax0_core(const core::Batch& sp, const core::Batch& sq,
                        const core::Batch& sr, const core::Batch& ss,
                        const Tensor& X, const std::string& xc) const;
        Tensor ax0_core(const core::Batch& sp, const core::Batch& sq,
                        const core::Batch& sr, const core::Batch& ss, const Tensor& X) const {
            return ax0_core(sp, sq, sr, ss, X, xc());
        }

        /// CPKS operator on (nset, nvir, nocc) amplitudes for the low-rung functional
        CpksOperator cpks_operator() const;

        Tensor solve_cpks(const Tensor& rhs) const;

        Tensor einsum(std::string_view spec, const Tensor& a, const Tensor& b) const {
            return core::einsum(spec, a, b, settings_.contraction);
        }

    private:
        core::TensorStore& store_;
        Collaborators collab_;
        PolarSettings settings_;
        XcFamily family_ = XcFamily::HF;

        Tensor mo_coeff_;
        Tensor mo_energy_;
        Tensor mo_occ_;
        size_t nao_ = 0;
        size_t nmo_ = 0;
        size_t nocc_ = 0;
        size_t nvir_ = 0;
        size_t naux_ = 0;
    };

} // namespace dhr::polar
