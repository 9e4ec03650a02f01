/*
 * SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 * http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#pragma once

#include <revised_simplex/basis_solves.hpp>
#include <revised_simplex/simplex_solver_settings.hpp>
#include <revised_simplex/standard_form.hpp>
#include <revised_simplex/types.hpp>

#include <vector>

namespace warmlp::linear_programming::revised_simplex {

// y' = c_B' * B^{-1}. The only m-vector recomputed each iteration
template <typename i_t, typename f_t>
void compute_dual_prices(const standard_form_t<i_t, f_t>& problem,
                         const std::vector<f_t>& objective,
                         const basis_t<i_t, f_t>& basis,
                         std::vector<f_t>& y);

// Same as above, gathering c_B into the caller's workspace
template <typename i_t, typename f_t>
void compute_dual_prices(const standard_form_t<i_t, f_t>& problem,
                         const std::vector<f_t>& objective,
                         const basis_t<i_t, f_t>& basis,
                         std::vector<f_t>& c_basic,
                         std::vector<f_t>& y);

// r_j = y' * A(:, j) - c_j
template <typename i_t, typename f_t>
f_t column_reduced_cost(const standard_form_t<i_t, f_t>& problem,
                        const std::vector<f_t>& objective,
                        const std::vector<f_t>& y,
                        i_t j);

// r = y' * a - c for a dense column a that is not part of the problem
template <typename i_t, typename f_t>
f_t dense_column_reduced_cost(const std::vector<f_t>& y, const std::vector<f_t>& a, f_t c);

// z_j = r_j for nonbasic columns, z_j = 0 for basic columns
template <typename i_t, typename f_t>
void compute_reduced_costs(const standard_form_t<i_t, f_t>& problem,
                           const std::vector<f_t>& objective,
                           const basis_t<i_t, f_t>& basis,
                           const std::vector<f_t>& y,
                           std::vector<f_t>& z);

// Selects the entering column among nonbasic columns with r_j < -dual_tol.
// Artificial columns may only enter in phase 1. Returns -1 if there is none (optimal)
template <typename i_t, typename f_t>
i_t price_entering(const standard_form_t<i_t, f_t>& problem,
                   const std::vector<f_t>& objective,
                   const simplex_solver_settings_t<i_t, f_t>& settings,
                   pricing_rule_t rule,
                   i_t phase,
                   const basis_t<i_t, f_t>& basis,
                   const std::vector<f_t>& y,
                   f_t& entering_reduced_cost);

// Minimum ratio test over rows with d_i > pivot_tol. Ties go to the basic column with the
// lowest index. Returns the leaving row and sets the step length theta, or returns -1 if
// no row limits the step (unbounded)
template <typename i_t, typename f_t>
i_t ratio_test(const standard_form_t<i_t, f_t>& problem,
               const simplex_solver_settings_t<i_t, f_t>& settings,
               i_t phase,
               const basis_t<i_t, f_t>& basis,
               const std::vector<f_t>& d,
               f_t& theta);

}  // namespace warmlp::linear_programming::revised_simplex
