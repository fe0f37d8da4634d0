/* SPDX-FileCopyrightText: 2025 DHResponse Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "synthetic_system.hpp"
#include "core/logger.hpp"
#include "polar/amplitude_ops.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <format>
#include <random>

namespace dhr::polar {

    using core::full_range;

    namespace {

        std::string to_upper(std::string s) {
            std::transform(s.begin(), s.end(), s.begin(),
                           [](const unsigned char c) { return static_cast<char>(std::toupper(c)); });
            return s;
        }

        // Modified Gram-Schmidt on the columns of a square matrix
        void orthonormalize_columns(Tensor& m) {
            const size_t n = m.size(0);
            double* a = m.ptr<double>();
            for (size_t j = 0; j < n; ++j) {
                for (size_t k = 0; k < j; ++k) {
                    double proj = 0.0;
                    for (size_t r = 0; r < n; ++r) {
                        proj += a[r * n + k] * a[r * n + j];
                    }
                    for (size_t r = 0; r < n; ++r) {
                        a[r * n + j] -= proj * a[r * n + k];
                    }
                }
                double norm = 0.0;
                for (size_t r = 0; r < n; ++r) {
                    norm += a[r * n + j] * a[r * n + j];
                }
                norm = std::sqrt(norm);
                if (norm < 1e-10) {
                    throw core::UsageError("Synthetic orbitals are linearly dependent; choose another seed");
                }
                for (size_t r = 0; r < n; ++r) {
                    a[r * n + j] /= norm;
                }
            }
        }

        size_t positive_size(const int64_t value, const char* name) {
            if (value <= 0) {
                throw core::UsageError(std::format("Synthetic system: {} must be positive, got {}", name, value));
            }
            return static_cast<size_t>(value);
        }

    } // namespace

    SyntheticSystem::SyntheticSystem(const core::param::SyntheticSystemConfig& config)
        : nocc_(positive_size(config.nocc, "nocc")),
          nvir_(positive_size(config.nvir, "nvir")),
          nao_(nocc_ + nvir_),
          naux_(positive_size(config.naux, "naux")),
          ngrid_(positive_size(config.ngrid, "ngrid")) {
        const std::string family = to_upper(config.xc_family);
        if (family == "GGA") {
            dft_family_ = XcFamily::GGA;
        } else if (family == "LDA") {
            dft_family_ = XcFamily::LDA;
        } else {
            throw core::UsageError("Synthetic system: xc_family must be GGA or LDA, got '" + config.xc_family + "'");
        }

        std::mt19937_64 rng(config.seed);
        std::normal_distribution<double> normal(0.0, 1.0);
        std::uniform_real_distribution<double> uniform(-1.0, 1.0);
        const size_t n = nao_;

        mo_coeff_ = Tensor::empty({n, n});
        for (double* p = mo_coeff_.ptr<double>(); p != mo_coeff_.ptr<double>() + n * n; ++p) {
            *p = normal(rng);
        }
        orthonormalize_columns(mo_coeff_);

        std::vector<double> occ_e(nocc_), vir_e(nvir_);
        std::uniform_real_distribution<double> occ_dist(-2.0, -1.0);
        std::uniform_real_distribution<double> vir_dist(0.5, 2.0);
        std::generate(occ_e.begin(), occ_e.end(), [&] { return occ_dist(rng); });
        std::generate(vir_e.begin(), vir_e.end(), [&] { return vir_dist(rng); });
        std::sort(occ_e.begin(), occ_e.end());
        std::sort(vir_e.begin(), vir_e.end());
        occ_e.insert(occ_e.end(), vir_e.begin(), vir_e.end());
        mo_energy_ = Tensor::from_vector(occ_e, {n});

        std::vector<double> occ(n, 0.0);
        std::fill_n(occ.begin(), nocc_, 2.0);
        mo_occ_ = Tensor::from_vector(occ, {n});

        dipole_ = Tensor::empty({3, n, n});
        for (double* p = dipole_.ptr<double>(); p != dipole_.ptr<double>() + dipole_.numel(); ++p) {
            *p = uniform(rng);
        }
        symmetrize_last2_(dipole_);
        dipole_.mul_(0.5);

        const double ri_scale = 0.15 / std::sqrt(static_cast<double>(naux_ * n));
        ri_ao_ = Tensor::empty({naux_, n, n});
        for (double* p = ri_ao_.ptr<double>(); p != ri_ao_.ptr<double>() + ri_ao_.numel(); ++p) {
            *p = normal(rng) * ri_scale;
        }
        symmetrize_last2_(ri_ao_);

        ao_ = Tensor::empty({4, ngrid_, n});
        double* ao = ao_.ptr<double>();
        for (size_t r = 0; r < 4; ++r) {
            const double scale = r == 0 ? 1.0 : 0.5;
            for (size_t k = 0; k < ngrid_ * n; ++k) {
                ao[r * ngrid_ * n + k] = uniform(rng) * scale;
            }
        }

        std::uniform_real_distribution<double> weight_dist(0.01, 0.1);
        weights_ = Tensor::empty({ngrid_});
        for (double* p = weights_.ptr<double>(); p != weights_.ptr<double>() + ngrid_; ++p) {
            *p = weight_dist(rng);
        }

        LOG_DEBUG("Synthetic system: nocc={} nvir={} naux={} ngrid={} seed={} family={}",
                  nocc_, nvir_, naux_, ngrid_, config.seed, xc_family_name(dft_family_));
    }

    ReferenceOrbitals SyntheticSystem::run() {
        ++scf_runs_;
        return {mo_coeff_.clone(), mo_energy_.clone(), mo_occ_.clone(), static_cast<int64_t>(nocc_)};
    }

    std::vector<int64_t> SyntheticSystem::aux_shell_offsets() const {
        // s, p, d shells in turn; the last one is cut to fit
        constexpr int64_t shell_sizes[] = {1, 3, 5};
        const auto n = static_cast<int64_t>(naux_);
        std::vector<int64_t> offsets{0};
        for (size_t l = 0; offsets.back() < n; ++l) {
            offsets.push_back(std::min(offsets.back() + shell_sizes[l % 3], n));
        }
        return offsets;
    }

    Tensor SyntheticSystem::ri_mo_block(const Tensor& mo_coeff, const Batch& aux_batch) const {
        if (aux_batch.start < 0 || aux_batch.stop > static_cast<int64_t>(naux_) || aux_batch.empty()) {
            throw core::UsageError(std::format("Auxiliary batch {} outside [0, {})", aux_batch.str(), naux_));
        }
        const Tensor B = ri_ao_.block({aux_batch});
        return core::einsum("up,Puq->Ppq", mo_coeff, core::einsum("Puv,vq->Puq", B, mo_coeff));
    }

    Tensor SyntheticSystem::coulomb(const Tensor& dms) const {
        const Tensor rho_P = core::einsum("Pls,nls->nP", ri_ao_, dms);
        return core::einsum("nP,Puv->nuv", rho_P, ri_ao_);
    }

    Tensor SyntheticSystem::exchange(const Tensor& dms) const {
        const Tensor half = core::einsum("Pul,nls->nPus", ri_ao_, dms);
        return core::einsum("nPus,Pvs->nuv", half, ri_ao_);
    }

    Tensor SyntheticSystem::non_consistent_fock(const Tensor& dm, const std::string& xc) const {
        if (dm.ndim() != 2 || dm.size(0) != nao_ || dm.size(1) != nao_) {
            throw core::UsageError("non_consistent_fock: density " + dm.shape().str() + " is not (nao, nao)");
        }
        // Reference Fock matrix plus the exact exchange the functional does not carry
        Tensor F = core::einsum("up,vp->uv", mo_coeff_,
                                core::einsum("vp,p->vp", mo_coeff_, mo_energy_));
        const Tensor K = exchange(dm.reshape({1, nao_, nao_}));
        F.add_(K.reshape({nao_, nao_}), 0.5 * (1.0 - exact_exchange_fraction(xc)));
        return F;
    }

    Tensor SyntheticSystem::apply(const Tensor& mo_coeff,
                                  const Batch& sp, const Batch& sq,
                                  const Batch& sr, const Batch& ss,
                                  const Tensor& X, const std::string& xc) const {
        const size_t nao = mo_coeff.size(0);
        const auto su = full_range(nao);
        if (X.ndim() != 3 || X.size(1) != static_cast<size_t>(sr.size()) ||
            X.size(2) != static_cast<size_t>(ss.size())) {
            throw core::UsageError(std::format("Fock response: X {} does not match blocks {} x {}",
                                               X.shape().str(), sr.str(), ss.str()));
        }

        Tensor dm = core::einsum("nus,vs->nuv",
                                 core::einsum("ur,nrs->nus", mo_coeff.block({su, sr}), X),
                                 mo_coeff.block({su, ss}));
        symmetrize_last2_(dm);

        Tensor v = coulomb(dm);
        v.add_(exchange(dm), -0.5 * exact_exchange_fraction(xc));

        return core::einsum("npv,vq->npq",
                            core::einsum("up,nuv->npv", mo_coeff.block({su, sp}), v),
                            mo_coeff.block({su, sq}));
    }

    double SyntheticSystem::exact_exchange_fraction(const std::string& xc) {
        const std::string name = to_upper(xc);
        if (name == "HF") {
            return 1.0;
        }
        if (const auto pos = name.find("*HF"); pos != std::string::npos) {
            size_t begin = pos;
            while (begin > 0 && (std::isdigit(static_cast<unsigned char>(name[begin - 1])) || name[begin - 1] == '.')) {
                --begin;
            }
            double value = 0.0;
            const auto [ptr, ec] = std::from_chars(name.data() + begin, name.data() + pos, value);
            if (ec != std::errc() || ptr != name.data() + pos) {
                throw core::UsageError("Cannot parse exact-exchange coefficient in '" + xc + "'");
            }
            return value;
        }
        if (name == "B3LYPG" || name == "B3LYP") {
            return 0.2;
        }
        if (name == "PBE0") {
            return 0.25;
        }
        return 0.0;
    }

    XcFamily SyntheticSystem::family(const std::string& xc) const {
        return to_upper(xc) == "HF" ? XcFamily::HF : dft_family_;
    }

    XcDerivatives SyntheticSystem::evaluate(const Tensor& rho, const std::string& xc, const int deriv) const {
        if (rho.ndim() != 2 || rho.size(0) != 4 || rho.size(1) != ngrid_) {
            throw core::UsageError(std::format("XC evaluate: density {} is not (4, {})", rho.shape().str(), ngrid_));
        }
        if (deriv < 2) {
            throw core::UsageError(std::format("XC evaluate: deriv={} but kernels need at least 2", deriv));
        }

        const bool gga = family(xc) == XcFamily::GGA;
        const double c = 0.1 * (1.0 - exact_exchange_fraction(xc));
        const double* r = rho.ptr<double>();

        XcDerivatives out;
        out.fxc = Tensor::zeros({3, ngrid_});
        double* f = out.fxc.ptr<double>();
        double* k = nullptr;
        if (deriv >= 3) {
            out.kxc = Tensor::zeros({4, ngrid_});
            k = out.kxc.ptr<double>();
        }

        for (size_t g = 0; g < ngrid_; ++g) {
            const double a = 1.0 + std::abs(r[g]);
            double sigma = 0.0;
            for (size_t x = 1; x < 4; ++x) {
                sigma += r[x * ngrid_ + g] * r[x * ngrid_ + g];
            }
            const double b = 1.0 + sigma;

            f[g] = -c / (a * a);
            if (gga) {
                f[ngrid_ + g] = 0.01 * c / a;
                f[2 * ngrid_ + g] = -0.005 * c / b;
            }
            if (k) {
                k[g] = 2.0 * c / (a * a * a);
                if (gga) {
                    k[ngrid_ + g] = -0.01 * c / (a * a);
                    k[3 * ngrid_ + g] = 0.005 * c / (b * b);
                }
            }
        }
        return out;
    }

    Tensor SyntheticSystem::density_on_grid(const Tensor& dms) const {
        if (dms.ndim() != 3 || dms.size(1) != nao_ || dms.size(2) != nao_) {
            throw core::UsageError("density_on_grid: densities " + dms.shape().str() + " are not (nset, nao, nao)");
        }
        const size_t nset = dms.size(0);
        const auto sg = full_range(ngrid_), su = full_range(nao_);
        const Tensor ao0 = ao_.block({core::make_batch(0, 1)}).reshape({ngrid_, nao_});

        // c[n,g,u] = sum_v dm[n,u,v] ao0[g,v]
        const Tensor c = core::einsum("nuv,gv->ngu", dms, ao0);
        Tensor rho = Tensor::empty({nset, 4, ngrid_});
        rho.set_block({full_range(nset), core::make_batch(0, 1)},
                      core::einsum("ngu,gu->ng", c, ao0).reshape({nset, 1, ngrid_}));
        const Tensor grad = core::einsum("rgu,ngu->nrg", ao_.block({core::make_batch(1, 4), sg, su}), c);
        rho.set_block({full_range(nset), core::make_batch(1, 4)}, grad * 2.0);
        return rho;
    }

    Tensor SyntheticSystem::contract_potential(const Tensor& wv) const {
        if (wv.ndim() != 2 || wv.size(0) != 4 || wv.size(1) != ngrid_) {
            throw core::UsageError(std::format("contract_potential: wv {} is not (4, {})", wv.shape().str(), ngrid_));
        }
        const Tensor aow = core::einsum("rg,rgu->gu", wv, ao_);
        const Tensor ao0 = ao_.block({core::make_batch(0, 1)}).reshape({ngrid_, nao_});
        return core::einsum("gu,gv->uv", aow, ao0);
    }

} // namespace dhr::polar
