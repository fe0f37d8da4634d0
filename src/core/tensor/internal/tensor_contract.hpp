/* SPDX-FileCopyrightText: 2025 DHResponse Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "tensor_impl.hpp"
#include <string_view>

namespace dhr::core {

    /**
     * @brief Execution settings for einsum, resolved once from configuration.
     *
     * When @c parallel is set the batch index range (output labels present in
     * both operands) is split across TBB worker threads in blocks of @c grain;
     * each block issues its own dgemm calls.
     */
    struct ContractionOptions {
        bool parallel = false;
        size_t grain = 1;
    };

    /**
     * @brief Two-operand index-label contraction.
     *
     * @p spec has the form "Ami,Pma->APia" (whitespace ignored). Every label is a
     * single ASCII letter; labels absent from the output are summed over. Labels
     * shared by both operands and the output act as batch indices. Operands are
     * permuted into matrix form and multiplied with BLAS dgemm.
     *
     * @throws UsageError on malformed specs, rank or extent mismatches
     */
    Tensor einsum(std::string_view spec, const Tensor& a, const Tensor& b,
                  const ContractionOptions& options = {});

} // namespace dhr::core
