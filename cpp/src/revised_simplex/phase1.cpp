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

#include <revised_simplex/phase1.hpp>

#include <utilities/error.hpp>

#include <algorithm>
#include <cmath>

namespace warmlp::linear_programming::revised_simplex {

template <typename i_t, typename f_t>
void create_phase1_objective(const standard_form_t<i_t, f_t>& problem,
                             std::vector<f_t>& objective)
{
  const i_t n = problem.num_cols;
  objective.assign(n, 0.0);
  for (i_t j = 0; j < n; ++j) {
    if (problem.column_kind[j] == column_kind_t::ARTIFICIAL) { objective[j] = -1.0; }
  }
}

template <typename i_t, typename f_t>
f_t artificial_infeasibility(const standard_form_t<i_t, f_t>& problem,
                             const basis_t<i_t, f_t>& basis)
{
  const i_t m = problem.num_rows;
  f_t sum     = 0.0;
  for (i_t k = 0; k < m; ++k) {
    if (problem.column_kind[basis.basic_list[k]] == column_kind_t::ARTIFICIAL) {
      sum += basis.x_basic[k];
    }
  }
  return sum;
}

template <typename i_t, typename f_t>
i_t remove_artificials(const standard_form_t<i_t, f_t>& problem,
                       const simplex_solver_settings_t<i_t, f_t>& settings,
                       basis_t<i_t, f_t>& basis,
                       lp_solution_t<i_t, f_t>& sol,
                       i_t& iter)
{
  const i_t m = problem.num_rows;
  const i_t n = problem.num_cols;
  std::vector<f_t> row(m);
  std::vector<f_t> aj(m);
  std::vector<f_t> d(m);
  i_t num_remaining = 0;
  for (i_t k = 0; k < m; ++k) {
    const i_t artificial = basis.basic_list[k];
    if (problem.column_kind[artificial] != column_kind_t::ARTIFICIAL) { continue; }

    // alpha_j = e_k' * B^{-1} * A(:, j)
    basis.binv.b_inverse_row(k, row);
    i_t entering = -1;
    for (i_t j = 0; j < n; ++j) {
      if (basis.vstatus[j] == variable_status_t::BASIC) { continue; }
      if (problem.column_kind[j] == column_kind_t::ARTIFICIAL) { continue; }
      const i_t col_start = problem.A.col_start[j];
      const i_t col_end   = problem.A.col_start[j + 1];
      f_t alpha           = 0.0;
      for (i_t p = col_start; p < col_end; ++p) {
        alpha += row[problem.A.i[p]] * problem.A.x[p];
      }
      if (std::abs(alpha) > settings.pivot_tol) {
        entering = j;
        break;
      }
    }
    if (entering == -1) {
      settings.log.debug("Row %d is redundant, artificial %d stays basic\n", k, artificial);
      num_remaining++;
      continue;
    }

    std::fill(aj.begin(), aj.end(), 0.0);
    problem.A.load_a_column(entering, aj);
    basis.binv.b_solve(aj, d);
    const f_t theta = basis.x_basic[k] / d[k];
    for (i_t i = 0; i < m; ++i) {
      basis.x_basic[i] -= theta * d[i];
    }
    basis.x_basic[k]          = theta;
    basis.basic_list[k]       = entering;
    basis.vstatus[entering]   = variable_status_t::BASIC;
    basis.vstatus[artificial] = variable_status_t::NONBASIC_LOWER;
    sol.pivots.push_back({iter, 1, entering, artificial, k, theta, 0.0});
    iter++;
    if (basis.binv.update(d, k) == -1) {
      warmlp_expects(refactor_basis(problem, settings, basis) == 0,
                     error_type_t::NumericalStall,
                     "Basis became singular while removing artificial %d",
                     artificial);
    }
  }
  if (num_remaining > 0) {
    settings.log.printf("%d redundant rows keep an artificial in the basis\n", num_remaining);
  }
  return num_remaining;
}

#ifdef REVISED_SIMPLEX_INSTANTIATE_DOUBLE

template void create_phase1_objective<int, double>(const standard_form_t<int, double>& problem,
                                                   std::vector<double>& objective);

template double artificial_infeasibility<int, double>(const standard_form_t<int, double>& problem,
                                                      const basis_t<int, double>& basis);

template int remove_artificials<int, double>(const standard_form_t<int, double>& problem,
                                             const simplex_solver_settings_t<int, double>& settings,
                                             basis_t<int, double>& basis,
                                             lp_solution_t<int, double>& sol,
                                             int& iter);

#endif

}  // namespace warmlp::linear_programming::revised_simplex
