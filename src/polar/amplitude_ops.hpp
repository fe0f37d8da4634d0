/* SPDX-FileCopyrightText: 2025 DHResponse Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/tensor_store.hpp"
#include <core/tensor.hpp>

namespace dhr::polar {

    // Below this magnitude the same-spin term cc * c_ss is dropped
    constexpr double SAME_SPIN_TOLERANCE = 1e-7;

    /**
     * @brief cc * ((c_os + c_ss) * t - c_ss * t^T), transposing the trailing two axes.
     *
     * When |cc * c_ss| < 1e-7 only the scalar scaling is applied.
     */
    core::Tensor biorthogonalize(const core::Tensor& t, double cc, double c_os, double c_ss);

    /// T += T^T over the trailing two axes, in place
    void symmetrize_last2_(core::Tensor& t);

    /// symmetrize_last2_ applied to a stored tensor in chunks of @p chunk leading indices
    void symmetrize_last2(core::StoredTensor tensor, int64_t chunk);

    /// e_i + e_j - e_a - e_b as a (|ei|, |ej|, |ea|, |eb|) tensor
    core::Tensor energy_denominator(const core::Tensor& ei, const core::Tensor& ej,
                                    const core::Tensor& ea, const core::Tensor& eb);

    /// t[..., k] /= denom[k] with denom broadcast over the leading axes of t
    void divide_trailing_(core::Tensor& t, const core::Tensor& denom);

} // namespace dhr::polar
