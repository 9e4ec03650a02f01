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

#include <revised_simplex/basis_updates.hpp>
#include <revised_simplex/dense_matrix.hpp>
#include <revised_simplex/initial_basis.hpp>
#include <revised_simplex/simplex_solver_settings.hpp>
#include <revised_simplex/sparse_matrix.hpp>
#include <revised_simplex/standard_form.hpp>
#include <revised_simplex/types.hpp>

#include <vector>

namespace warmlp::linear_programming::revised_simplex {

// The basis: which column is basic in each row, the status of every column,
// the inverse of B = A(:, basic_list) and the values of the basic variables
template <typename i_t, typename f_t>
struct basis_t {
  basis_t() : binv(0) {}
  std::vector<i_t> basic_list;             // basic_list[k] is the column basic in row k
  std::vector<variable_status_t> vstatus;  // one entry per column
  std::vector<f_t> x_basic;                // x_B = B^{-1} * b
  basis_update_t<i_t, f_t> binv;
};

// Form the basis matrix B = A(:, basic_list)
template <typename i_t, typename f_t>
i_t form_b(const csc_matrix_t<i_t, f_t>& A,
           const std::vector<i_t>& basic_list,
           dense_matrix_t<i_t, f_t>& B);

// y = B*x = sum_{k} A(:, basic_list[k]) * x(k)
template <typename i_t, typename f_t>
i_t b_multiply(const standard_form_t<i_t, f_t>& problem,
               const std::vector<i_t>& basic_list,
               const std::vector<f_t>& x,
               std::vector<f_t>& y);

// Installs basic_list as the basis, computes B^{-1} and x_B. Returns -1 if B is singular
template <typename i_t, typename f_t>
i_t initialize_basis(const standard_form_t<i_t, f_t>& problem,
                     const simplex_solver_settings_t<i_t, f_t>& settings,
                     const std::vector<i_t>& basic_list,
                     basis_t<i_t, f_t>& basis);

// Recomputes B^{-1} from scratch and x_B = B^{-1} * b. Returns -1 if B is singular
template <typename i_t, typename f_t>
i_t refactor_basis(const standard_form_t<i_t, f_t>& problem,
                   const simplex_solver_settings_t<i_t, f_t>& settings,
                   basis_t<i_t, f_t>& basis);

// Returns || B*x_B - b ||_inf
template <typename i_t, typename f_t>
f_t basis_residual(const standard_form_t<i_t, f_t>& problem, const basis_t<i_t, f_t>& basis);

// Same as above, with B*x_B - b left in residual
template <typename i_t, typename f_t>
f_t basis_residual(const standard_form_t<i_t, f_t>& problem,
                   const basis_t<i_t, f_t>& basis,
                   std::vector<f_t>& residual);

// Scatter x_B into a vector over all columns, nonbasic columns are zero
template <typename i_t, typename f_t>
void basic_solution(const standard_form_t<i_t, f_t>& problem,
                    const basis_t<i_t, f_t>& basis,
                    std::vector<f_t>& x);

}  // namespace warmlp::linear_programming::revised_simplex
