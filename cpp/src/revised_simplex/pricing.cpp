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

#include <revised_simplex/pricing.hpp>

#include <revised_simplex/vector_math.hpp>

#include <algorithm>

namespace warmlp::linear_programming::revised_simplex {

template <typename i_t, typename f_t>
void compute_dual_prices(const standard_form_t<i_t, f_t>& problem,
                         const std::vector<f_t>& objective,
                         const basis_t<i_t, f_t>& basis,
                         std::vector<f_t>& c_basic,
                         std::vector<f_t>& y)
{
  const i_t m = problem.num_rows;
  c_basic.resize(m);
  for (i_t k = 0; k < m; ++k) {
    c_basic[k] = objective[basis.basic_list[k]];
  }
  // Solve B'*y = cB
  basis.binv.b_transpose_solve(c_basic, y);
}

template <typename i_t, typename f_t>
void compute_dual_prices(const standard_form_t<i_t, f_t>& problem,
                         const std::vector<f_t>& objective,
                         const basis_t<i_t, f_t>& basis,
                         std::vector<f_t>& y)
{
  std::vector<f_t> c_basic;
  compute_dual_prices(problem, objective, basis, c_basic, y);
}

template <typename i_t, typename f_t>
f_t column_reduced_cost(const standard_form_t<i_t, f_t>& problem,
                        const std::vector<f_t>& objective,
                        const std::vector<f_t>& y,
                        i_t j)
{
  const i_t col_start = problem.A.col_start[j];
  const i_t col_end   = problem.A.col_start[j + 1];
  f_t dot             = 0.0;
  for (i_t p = col_start; p < col_end; ++p) {
    dot += problem.A.x[p] * y[problem.A.i[p]];
  }
  return dot - objective[j];
}

template <typename i_t, typename f_t>
f_t dense_column_reduced_cost(const std::vector<f_t>& y, const std::vector<f_t>& a, f_t c)
{
  return dot<i_t, f_t>(y, a) - c;
}

template <typename i_t, typename f_t>
void compute_reduced_costs(const standard_form_t<i_t, f_t>& problem,
                           const std::vector<f_t>& objective,
                           const basis_t<i_t, f_t>& basis,
                           const std::vector<f_t>& y,
                           std::vector<f_t>& z)
{
  const i_t n = problem.num_cols;
  z.resize(n);
  for (i_t j = 0; j < n; ++j) {
    if (basis.vstatus[j] == variable_status_t::BASIC) {
      z[j] = 0.0;
    } else {
      z[j] = column_reduced_cost(problem, objective, y, j);
    }
  }
}

template <typename i_t, typename f_t>
i_t price_entering(const standard_form_t<i_t, f_t>& problem,
                   const std::vector<f_t>& objective,
                   const simplex_solver_settings_t<i_t, f_t>& settings,
                   pricing_rule_t rule,
                   i_t phase,
                   const basis_t<i_t, f_t>& basis,
                   const std::vector<f_t>& y,
                   f_t& entering_reduced_cost)
{
  const i_t n  = problem.num_cols;
  i_t entering = -1;
  f_t min_val  = -settings.dual_tol;
  for (i_t j = 0; j < n; ++j) {
    if (basis.vstatus[j] == variable_status_t::BASIC) { continue; }
    if (phase == 2 && problem.column_kind[j] == column_kind_t::ARTIFICIAL) { continue; }
    const f_t rj = column_reduced_cost(problem, objective, y, j);
    // Strict comparison: on ties the lowest index wins
    if (rj < min_val) {
      min_val  = rj;
      entering = j;
      if (rule == pricing_rule_t::BLAND) { break; }
    }
  }
  entering_reduced_cost = entering == -1 ? 0.0 : min_val;
  return entering;
}

template <typename i_t, typename f_t>
i_t ratio_test(const standard_form_t<i_t, f_t>& problem,
               const simplex_solver_settings_t<i_t, f_t>& settings,
               i_t phase,
               const basis_t<i_t, f_t>& basis,
               const std::vector<f_t>& d,
               f_t& theta)
{
  const i_t m         = problem.num_rows;
  i_t leaving_row     = -1;
  f_t min_ratio       = inf;
  i_t leaving_index   = -1;
  const f_t pivot_tol = settings.pivot_tol;
  for (i_t k = 0; k < m; ++k) {
    const i_t j = basis.basic_list[k];
    f_t ratio;
    if (d[k] > pivot_tol) {
      ratio = std::max(basis.x_basic[k], f_t(0.0)) / d[k];
    } else if (phase == 2 && problem.column_kind[j] == column_kind_t::ARTIFICIAL &&
               d[k] < -pivot_tol) {
      // An artificial left in the basis after phase 1 sits at zero and must stay there
      ratio = 0.0;
    } else {
      continue;
    }
    bool take = leaving_row == -1;
    if (!take) {
      const f_t tie_tol = settings.zero_tol * std::max(f_t(1.0), min_ratio);
      take              = ratio < min_ratio - tie_tol ||
             (ratio <= min_ratio + tie_tol && j < leaving_index);
    }
    if (take) {
      min_ratio     = ratio;
      leaving_row   = k;
      leaving_index = j;
    }
  }
  theta = leaving_row == -1 ? inf : min_ratio;
  return leaving_row;
}

#ifdef REVISED_SIMPLEX_INSTANTIATE_DOUBLE

template void compute_dual_prices<int, double>(const standard_form_t<int, double>& problem,
                                               const std::vector<double>& objective,
                                               const basis_t<int, double>& basis,
                                               std::vector<double>& c_basic,
                                               std::vector<double>& y);

template void compute_dual_prices<int, double>(const standard_form_t<int, double>& problem,
                                               const std::vector<double>& objective,
                                               const basis_t<int, double>& basis,
                                               std::vector<double>& y);

template double column_reduced_cost<int, double>(const standard_form_t<int, double>& problem,
                                                 const std::vector<double>& objective,
                                                 const std::vector<double>& y,
                                                 int j);

template double dense_column_reduced_cost<int, double>(const std::vector<double>& y,
                                                       const std::vector<double>& a,
                                                       double c);

template void compute_reduced_costs<int, double>(const standard_form_t<int, double>& problem,
                                                 const std::vector<double>& objective,
                                                 const basis_t<int, double>& basis,
                                                 const std::vector<double>& y,
                                                 std::vector<double>& z);

template int price_entering<int, double>(const standard_form_t<int, double>& problem,
                                         const std::vector<double>& objective,
                                         const simplex_solver_settings_t<int, double>& settings,
                                         pricing_rule_t rule,
                                         int phase,
                                         const basis_t<int, double>& basis,
                                         const std::vector<double>& y,
                                         double& entering_reduced_cost);

template int ratio_test<int, double>(const standard_form_t<int, double>& problem,
                                     const simplex_solver_settings_t<int, double>& settings,
                                     int phase,
                                     const basis_t<int, double>& basis,
                                     const std::vector<double>& d,
                                     double& theta);

#endif

}  // namespace warmlp::linear_programming::revised_simplex
