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

#include <revised_simplex/standard_form.hpp>

#include <utilities/error.hpp>

#include <warmlp/linear_programming/constants.h>

#include <algorithm>
#include <cmath>

namespace warmlp::linear_programming::revised_simplex {

namespace {

template <typename f_t>
bool has_nan(const std::vector<f_t>& v)
{
  for (const f_t val : v) {
    if (std::isnan(val)) { return true; }
  }
  return false;
}

template <typename i_t, typename f_t>
void check_user_problem(const user_problem_t<i_t, f_t>& user_problem)
{
  const i_t m = user_problem.num_rows;
  const i_t n = user_problem.num_cols;
  warmlp_expects(m >= 0 && n >= 0,
                 error_type_t::MalformedProblem,
                 "Problem has negative dimensions %d x %d",
                 m,
                 n);
  warmlp_expects(static_cast<i_t>(user_problem.objective.size()) == n,
                 error_type_t::MalformedProblem,
                 "Objective has %d entries but the problem has %d variables",
                 static_cast<i_t>(user_problem.objective.size()),
                 n);
  warmlp_expects(static_cast<i_t>(user_problem.rhs.size()) == m,
                 error_type_t::MalformedProblem,
                 "Right-hand side has %d entries but the problem has %d constraints",
                 static_cast<i_t>(user_problem.rhs.size()),
                 m);
  warmlp_expects(static_cast<i_t>(user_problem.row_sense.size()) == m,
                 error_type_t::MalformedProblem,
                 "Row sense has %d entries but the problem has %d constraints",
                 static_cast<i_t>(user_problem.row_sense.size()),
                 m);
  warmlp_expects(user_problem.lower.empty() || static_cast<i_t>(user_problem.lower.size()) == n,
                 error_type_t::MalformedProblem,
                 "Lower bounds have %d entries but the problem has %d variables",
                 static_cast<i_t>(user_problem.lower.size()),
                 n);
  warmlp_expects(user_problem.upper.empty() || static_cast<i_t>(user_problem.upper.size()) == n,
                 error_type_t::MalformedProblem,
                 "Upper bounds have %d entries but the problem has %d variables",
                 static_cast<i_t>(user_problem.upper.size()),
                 n);
  warmlp_expects(user_problem.A.m == m && user_problem.A.n == n,
                 error_type_t::MalformedProblem,
                 "Constraint matrix is %d x %d but the problem is %d x %d",
                 user_problem.A.m,
                 user_problem.A.n,
                 m,
                 n);
  warmlp_expects(user_problem.A.check_matrix() == 0,
                 error_type_t::MalformedProblem,
                 "Constraint matrix references an undefined row or has a non-finite entry");
  const f_t obj_scale = user_problem.obj_scale;
  warmlp_expects(obj_scale == WARMLP_MAXIMIZE || obj_scale == WARMLP_MINIMIZE,
                 error_type_t::MalformedProblem,
                 "Objective scale must be 1 (max) or -1 (min), got %g",
                 obj_scale);
  warmlp_expects(!has_nan(user_problem.objective) && !has_nan(user_problem.rhs) &&
                   !has_nan(user_problem.lower) && !has_nan(user_problem.upper),
                 error_type_t::MalformedProblem,
                 "Problem data contains NaN");
  for (i_t j = 0; j < n; ++j) {
    warmlp_expects(std::isfinite(user_problem.objective[j]),
                   error_type_t::MalformedProblem,
                   "Variable %d has a non-finite objective coefficient",
                   j);
  }
  for (i_t i = 0; i < m; ++i) {
    const char sense = user_problem.row_sense[i];
    const bool known_sense =
      sense == WARMLP_LESS_THAN || sense == WARMLP_GREATER_THAN || sense == WARMLP_EQUAL;
    warmlp_expects(known_sense,
                   error_type_t::MalformedProblem,
                   "Row %d has unknown sense '%c'",
                   i,
                   sense);
    warmlp_expects(std::isfinite(user_problem.rhs[i]),
                   error_type_t::MalformedProblem,
                   "Row %d has an infinite right-hand side",
                   i);
  }
  for (i_t j = 0; j < n; ++j) {
    const f_t lower = user_problem.lower.empty() ? 0.0 : user_problem.lower[j];
    const f_t upper = user_problem.upper.empty() ? inf : user_problem.upper[j];
    warmlp_expects(lower < inf && upper > -inf,
                   error_type_t::MalformedProblem,
                   "Variable %d has bounds [%g, %g]",
                   j,
                   lower,
                   upper);
  }
}

}  // namespace

template <typename i_t, typename f_t>
void standardize(const user_problem_t<i_t, f_t>& user_problem,
                 const simplex_solver_settings_t<i_t, f_t>& settings,
                 standard_form_t<i_t, f_t>& problem)
{
  check_user_problem(user_problem);

  const i_t m_user = user_problem.num_rows;
  const i_t n_user = user_problem.num_cols;
  const auto& Auser = user_problem.A;

  std::vector<f_t> lower(n_user);
  std::vector<f_t> upper(n_user);
  for (i_t j = 0; j < n_user; ++j) {
    lower[j] = user_problem.lower.empty() ? 0.0 : user_problem.lower[j];
    upper[j] = user_problem.upper.empty() ? inf : user_problem.upper[j];
  }

  // Columns for the negative part of free variables
  std::vector<i_t> negative_col(n_user, -1);
  i_t num_structural = n_user;
  for (i_t j = 0; j < n_user; ++j) {
    if (lower[j] == -inf) { negative_col[j] = num_structural++; }
  }

  // Rows for finite upper bounds
  std::vector<i_t> upper_rows;
  for (i_t j = 0; j < n_user; ++j) {
    if (upper[j] < inf) { upper_rows.push_back(j); }
  }
  const i_t m = m_user + static_cast<i_t>(upper_rows.size());

  // x_j = shift_j + x'_j
  std::vector<f_t> shift(n_user, 0.0);
  for (i_t j = 0; j < n_user; ++j) {
    if (lower[j] > -inf) { shift[j] = lower[j]; }
  }

  std::vector<f_t> rhs(m);
  std::vector<char> sense(m);
  for (i_t i = 0; i < m_user; ++i) {
    rhs[i]   = user_problem.rhs[i];
    sense[i] = user_problem.row_sense[i];
  }
  for (i_t j = 0; j < n_user; ++j) {
    if (shift[j] == 0.0) { continue; }
    const i_t col_start = Auser.col_start[j];
    const i_t col_end   = Auser.col_start[j + 1];
    for (i_t p = col_start; p < col_end; ++p) {
      rhs[Auser.i[p]] -= Auser.x[p] * shift[j];
    }
  }
  for (size_t k = 0; k < upper_rows.size(); ++k) {
    const i_t j       = upper_rows[k];
    rhs[m_user + k]   = upper[j] - shift[j];
    sense[m_user + k] = WARMLP_LESS_THAN;
  }

  std::vector<f_t> row_sign(m, 1.0);
  for (i_t i = 0; i < m; ++i) {
    if (rhs[i] < 0.0) {
      row_sign[i] = -1.0;
      rhs[i]      = -rhs[i];
      if (sense[i] == WARMLP_LESS_THAN) {
        sense[i] = WARMLP_GREATER_THAN;
      } else if (sense[i] == WARMLP_GREATER_THAN) {
        sense[i] = WARMLP_LESS_THAN;
      }
    }
  }

  i_t num_slack      = 0;
  i_t num_artificial = 0;
  for (i_t i = 0; i < m; ++i) {
    if (sense[i] != WARMLP_EQUAL) { num_slack++; }
    if (sense[i] != WARMLP_LESS_THAN) { num_artificial++; }
  }
  const i_t n = num_structural + num_slack + num_artificial;

  std::vector<i_t> Ai;
  std::vector<i_t> Aj;
  std::vector<f_t> Ax;
  const i_t user_nz = Auser.col_start[n_user];
  Ai.reserve(2 * user_nz + 2 * upper_rows.size() + num_slack + num_artificial);
  Aj.reserve(Ai.capacity());
  Ax.reserve(Ai.capacity());

  for (i_t j = 0; j < n_user; ++j) {
    const i_t col_start = Auser.col_start[j];
    const i_t col_end   = Auser.col_start[j + 1];
    for (i_t p = col_start; p < col_end; ++p) {
      const i_t i   = Auser.i[p];
      const f_t aij = row_sign[i] * Auser.x[p];
      Ai.push_back(i);
      Aj.push_back(j);
      Ax.push_back(aij);
      if (negative_col[j] != -1) {
        Ai.push_back(i);
        Aj.push_back(negative_col[j]);
        Ax.push_back(-aij);
      }
    }
  }
  for (size_t k = 0; k < upper_rows.size(); ++k) {
    const i_t j = upper_rows[k];
    const i_t i = m_user + k;
    Ai.push_back(i);
    Aj.push_back(j);
    Ax.push_back(row_sign[i]);
    if (negative_col[j] != -1) {
      Ai.push_back(i);
      Aj.push_back(negative_col[j]);
      Ax.push_back(-row_sign[i]);
    }
  }

  problem =
    standard_form_t<i_t, f_t>(m, n, static_cast<i_t>(Ax.size()) + num_slack + num_artificial);
  problem.rhs            = rhs;
  problem.row_sign       = row_sign;
  problem.num_user_rows  = m_user;
  problem.num_user_cols  = n_user;
  problem.negative_col   = negative_col;
  problem.shift          = shift;
  problem.num_artificial = num_artificial;
  problem.obj_scale      = user_problem.obj_scale;
  problem.positive_col.resize(n_user);
  for (i_t j = 0; j < n_user; ++j) {
    problem.positive_col[j] = j;
  }

  i_t col = num_structural;
  for (i_t i = 0; i < m; ++i) {
    if (sense[i] == WARMLP_EQUAL) { continue; }
    Ai.push_back(i);
    Aj.push_back(col);
    Ax.push_back(sense[i] == WARMLP_LESS_THAN ? 1.0 : -1.0);
    problem.column_kind[col] =
      sense[i] == WARMLP_LESS_THAN ? column_kind_t::SLACK : column_kind_t::SURPLUS;
    problem.row_slack[i]     = col++;
  }
  for (i_t i = 0; i < m; ++i) {
    if (sense[i] == WARMLP_LESS_THAN) { continue; }
    Ai.push_back(i);
    Aj.push_back(col);
    Ax.push_back(1.0);
    problem.column_kind[col]  = column_kind_t::ARTIFICIAL;
    problem.row_artificial[i] = col++;
  }
  assert(col == n);

  const i_t status = coo_to_csc(Ai, Aj, Ax, problem.A);
  warmlp_expects(status == 0,
                 error_type_t::MalformedProblem,
                 "Failed to assemble the standard form constraint matrix");

  // Internally we always maximize
  std::fill(problem.objective.begin(), problem.objective.end(), 0.0);
  f_t obj_constant = user_problem.obj_constant;
  for (i_t j = 0; j < n_user; ++j) {
    const f_t cj         = user_problem.objective[j];
    problem.objective[j] = user_problem.obj_scale * cj;
    if (negative_col[j] != -1) {
      problem.objective[negative_col[j]] = -user_problem.obj_scale * cj;
    }
    obj_constant += cj * shift[j];
  }
  problem.obj_constant = obj_constant;

  settings.log.printf(
    "Standard form: %d rows, %d columns (%d structural, %d slack, %d artificial), %d nonzeros\n",
    problem.num_rows,
    problem.num_cols,
    num_structural,
    num_slack,
    num_artificial,
    problem.A.col_start[problem.num_cols]);
}

template <typename i_t, typename f_t>
void crush_column(const standard_form_t<i_t, f_t>& problem,
                  const std::vector<f_t>& user_column,
                  std::vector<f_t>& column)
{
  warmlp_expects(static_cast<i_t>(user_column.size()) == problem.num_user_rows,
                 error_type_t::DimensionMismatch,
                 "Column has %d entries but the problem has %d constraints",
                 static_cast<i_t>(user_column.size()),
                 problem.num_user_rows);
  column.assign(problem.num_rows, 0.0);
  for (i_t i = 0; i < problem.num_user_rows; ++i) {
    warmlp_expects(std::isfinite(user_column[i]),
                   error_type_t::MalformedProblem,
                   "Column entry %d is not finite",
                   i);
    column[i] = problem.row_sign[i] * user_column[i];
  }
}

template <typename i_t, typename f_t>
i_t append_structural_column(standard_form_t<i_t, f_t>& problem,
                             const std::vector<f_t>& column,
                             f_t objective)
{
  assert(static_cast<i_t>(column.size()) == problem.num_rows);
  const i_t j = problem.A.append_column(column);
  problem.num_cols = problem.A.n;
  problem.objective.push_back(objective);
  problem.column_kind.push_back(column_kind_t::STRUCTURAL);
  problem.positive_col.push_back(j);
  problem.negative_col.push_back(-1);
  problem.shift.push_back(0.0);
  problem.num_user_cols++;
  return j;
}

template <typename i_t, typename f_t>
void uncrush_primal_solution(const standard_form_t<i_t, f_t>& problem,
                             const std::vector<f_t>& solution,
                             std::vector<f_t>& user_solution)
{
  const i_t n = problem.num_user_cols;
  user_solution.resize(n);
  for (i_t j = 0; j < n; ++j) {
    f_t xj = problem.shift[j] + solution[problem.positive_col[j]];
    if (problem.negative_col[j] != -1) { xj -= solution[problem.negative_col[j]]; }
    user_solution[j] = xj;
  }
}

#ifdef REVISED_SIMPLEX_INSTANTIATE_DOUBLE

template void standardize<int, double>(const user_problem_t<int, double>& user_problem,
                                       const simplex_solver_settings_t<int, double>& settings,
                                       standard_form_t<int, double>& problem);

template void crush_column<int, double>(const standard_form_t<int, double>& problem,
                                        const std::vector<double>& user_column,
                                        std::vector<double>& column);

template int append_structural_column<int, double>(standard_form_t<int, double>& problem,
                                                   const std::vector<double>& column,
                                                   double objective);

template void uncrush_primal_solution<int, double>(const standard_form_t<int, double>& problem,
                                                   const std::vector<double>& solution,
                                                   std::vector<double>& user_solution);

#endif

}  // namespace warmlp::linear_programming::revised_simplex
