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

#include <revised_simplex/simplex_solver_settings.hpp>
#include <revised_simplex/sparse_matrix.hpp>
#include <revised_simplex/types.hpp>
#include <revised_simplex/user_problem.hpp>

#include <vector>

namespace warmlp::linear_programming::revised_simplex {

// The equality form solved by the engine
//
//   max  objective'*x
//   s.t. A*x = rhs, x >= 0, rhs >= 0
//
// Columns are laid out as user variables, negative parts of free variables,
// slack and surplus columns in row order, then artificial columns in row order.
// Columns appended by a warm start follow.
template <typename i_t, typename f_t>
struct standard_form_t {
  standard_form_t(i_t m, i_t n, i_t nz)
    : num_rows(m),
      num_cols(n),
      objective(n),
      A(m, n, nz),
      rhs(m),
      column_kind(n, column_kind_t::STRUCTURAL),
      row_sign(m, 1.0),
      row_slack(m, -1),
      row_artificial(m, -1),
      num_user_rows(0),
      num_user_cols(0),
      num_artificial(0),
      obj_constant(0.0),
      obj_scale(1.0)
  {
  }
  i_t num_rows;
  i_t num_cols;
  std::vector<f_t> objective;
  csc_matrix_t<i_t, f_t> A;
  std::vector<f_t> rhs;
  std::vector<column_kind_t> column_kind;
  std::vector<f_t> row_sign;        // -1.0 if the row was negated to make its rhs nonnegative
  std::vector<i_t> row_slack;       // slack or surplus column of each row, -1 for = rows
  std::vector<i_t> row_artificial;  // artificial column of each row, -1 if none
  i_t num_user_rows;                // rows 0..num_user_rows-1 come from the user constraints
  i_t num_user_cols;
  std::vector<i_t> positive_col;  // column holding x_j (or its positive part) for user variable j
  std::vector<i_t> negative_col;  // column holding the negative part of a free variable, else -1
  std::vector<f_t> shift;         // user x_j = shift_j + x(positive_col) - x(negative_col)
  i_t num_artificial;
  f_t obj_constant;  // in user units
  f_t obj_scale;     // 1.0 for max, -1.0 for min
};

// Converts a user problem to equality form. Throws malformed_problem_error when the
// dimensions of A, rhs, objective, senses or bounds disagree, when A references a row or
// variable outside the problem, or when the data contains NaN
template <typename i_t, typename f_t>
void standardize(const user_problem_t<i_t, f_t>& user_problem,
                 const simplex_solver_settings_t<i_t, f_t>& settings,
                 standard_form_t<i_t, f_t>& problem);

// Maps a column over the user constraints onto the rows of the standard form.
// Throws dimension_mismatch_error if user_column does not have one entry per user row
template <typename i_t, typename f_t>
void crush_column(const standard_form_t<i_t, f_t>& problem,
                  const std::vector<f_t>& user_column,
                  std::vector<f_t>& column);

// Appends a new nonnegative user variable with the given standard-form column and
// maximization objective coefficient. Returns its standard-form column index
template <typename i_t, typename f_t>
i_t append_structural_column(standard_form_t<i_t, f_t>& problem,
                             const std::vector<f_t>& column,
                             f_t objective);

template <typename i_t, typename f_t>
void uncrush_primal_solution(const standard_form_t<i_t, f_t>& problem,
                             const std::vector<f_t>& solution,
                             std::vector<f_t>& user_solution);

}  // namespace warmlp::linear_programming::revised_simplex
