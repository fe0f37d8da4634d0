/* SPDX-FileCopyrightText: 2025 DHResponse Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

/**
 * @file tensor.hpp
 * @brief DHResponse tensor library - dense CPU tensors for the response pipeline
 *
 * @section quick_start Quick Start
 * @code
 * #include <core/tensor.hpp>
 * using namespace dhr::core;
 *
 * auto U = Tensor::zeros({3, nmo, nmo});
 * auto Y = store.at("Y_mo_ri").read({aux_batch});
 *
 * // Index-label contraction, optionally TBB-parallel
 * Tensor r = einsum("Ami,Pma->APia", U, Y, ContractionOptions{.parallel = true});
 *
 * // Block access
 * Tensor vo = U.block({full_range(3), vir, occ});
 *
 * // Serialization
 * save_tensor(r, "tensor.bin");
 * auto loaded = load_tensor("tensor.bin");
 * @endcode
 *
 * @section memory Memory Management
 * - Assignment creates a shallow copy (shared data)
 * - Use .clone() for deep copy
 *
 * All types are in `dhr::core`.
 */

#include <core/tensor/internal/tensor_contract.hpp>
#include <core/tensor/internal/tensor_impl.hpp>
#include <core/tensor/internal/tensor_serialization.hpp>
