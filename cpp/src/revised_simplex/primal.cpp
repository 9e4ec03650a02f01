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

#include <revised_simplex/primal.hpp>

#include <revised_simplex/pricing.hpp>
#include <revised_simplex/tic_toc.hpp>
#include <revised_simplex/vector_math.hpp>

#include <utilities/error.hpp>

#include <algorithm>
#include <cassert>

namespace warmlp::linear_programming::revised_simplex {

namespace {

template <typename i_t, typename f_t>
void refactor_or_stall(const standard_form_t<i_t, f_t>& problem,
                       const simplex_solver_settings_t<i_t, f_t>& settings,
                       i_t iter,
                       basis_t<i_t, f_t>& basis)
{
  warmlp_expects(refactor_basis(problem, settings, basis) == 0,
                 error_type_t::NumericalStall,
                 "Basis became singular at iteration %d",
                 iter);
}

}  // namespace

template <typename i_t, typename f_t>
f_t basic_objective(const std::vector<f_t>& objective, const basis_t<i_t, f_t>& basis)
{
  const i_t m = basis.basic_list.size();
  f_t obj     = 0.0;
  for (i_t k = 0; k < m; ++k) {
    obj += objective[basis.basic_list[k]] * basis.x_basic[k];
  }
  return obj;
}

template <typename i_t, typename f_t>
primal::status_t primal_phase2(i_t phase,
                               f_t start_time,
                               const standard_form_t<i_t, f_t>& problem,
                               const std::vector<f_t>& objective,
                               const simplex_solver_settings_t<i_t, f_t>& settings,
                               i_t first_entering,
                               basis_t<i_t, f_t>& basis,
                               lp_solution_t<i_t, f_t>& sol,
                               i_t& iter)
{
  const i_t m = problem.num_rows;
  const i_t n = problem.num_cols;
  assert(objective.size() == n);
  assert(basis.basic_list.size() == m);
  assert(basis.vstatus.size() == n);
  assert(basis.x_basic.size() == m);
  assert(basis.binv.dimension() == m);

  primal::status_t status = primal::status_t::UNSET;
  pricing_rule_t rule     = settings.pricing;
  i_t degenerate_pivots   = 0;
  const f_t rhs_norm      = vector_norm_inf<i_t, f_t>(problem.rhs);
  const f_t residual_tol  = settings.residual_tol * (1.0 + rhs_norm);

  // Workspace reused by every iteration
  std::vector<f_t> y(m);
  std::vector<f_t> c_basic(m);
  std::vector<f_t> aq(m);
  std::vector<f_t> d(m);
  std::vector<f_t> residual_work(m);

  f_t obj = basic_objective(objective, basis);
  settings.log.printf("Revised Simplex Phase %d\n", phase);
  settings.log.printf(" Iter     Objective     Entering  Leaving       Step\n");

  while (true) {
    // Pricing: y' = c_B' * B^{-1}, then r_j = y' * A(:, j) - c_j
    compute_dual_prices(problem, objective, basis, c_basic, y);

    i_t entering = -1;
    f_t rq       = 0.0;
    if (first_entering != -1 && basis.vstatus[first_entering] != variable_status_t::BASIC) {
      rq = column_reduced_cost(problem, objective, y, first_entering);
      if (rq < -settings.dual_tol) { entering = first_entering; }
    }
    first_entering = -1;
    if (entering == -1) {
      entering = price_entering(problem, objective, settings, rule, phase, basis, y, rq);
    }
    if (entering == -1) {
      status = primal::status_t::OPTIMAL;
      break;
    }

    // d = B^{-1} * A(:, entering)
    std::fill(aq.begin(), aq.end(), 0.0);
    problem.A.load_a_column(entering, aq);
    basis.binv.b_solve(aq, d);

    f_t theta;
    const i_t leaving_row = ratio_test(problem, settings, phase, basis, d, theta);
    if (leaving_row == -1) {
      sol.unbounded_column = entering;
      sol.unbounded_direction.assign(n, 0.0);
      sol.unbounded_direction[entering] = 1.0;
      for (i_t k = 0; k < m; ++k) {
        sol.unbounded_direction[basis.basic_list[k]] = -d[k];
      }
      settings.log.printf("Unbounded: column %d enters with no limiting row\n", entering);
      status = primal::status_t::UNBOUNDED;
      break;
    }

    warmlp_expects(iter < settings.iteration_limit,
                   error_type_t::NumericalStall,
                   "Iteration limit %d exceeded in phase %d",
                   settings.iteration_limit,
                   phase);

    // Pivot: column entering replaces the column basic in leaving_row
    const i_t leaving = basis.basic_list[leaving_row];
    for (i_t k = 0; k < m; ++k) {
      basis.x_basic[k] -= theta * d[k];
    }
    basis.x_basic[leaving_row]    = theta;
    basis.basic_list[leaving_row] = entering;
    basis.vstatus[entering]       = variable_status_t::BASIC;
    basis.vstatus[leaving]        = variable_status_t::NONBASIC_LOWER;
    obj -= rq * theta;
    sol.pivots.push_back({iter, phase, entering, leaving, leaving_row, theta, rq});
    iter++;

    bool refactored = false;
    if (basis.binv.update(d, leaving_row) == -1 ||
        basis.binv.num_updates() >= settings.refactor_frequency) {
      refactor_or_stall(problem, settings, iter, basis);
      refactored = true;
    }

    f_t residual = basis_residual(problem, basis, residual_work);
    if (residual > residual_tol && !refactored) {
      settings.log.printf("|| B*xB - b || %e at iteration %d. Refactoring\n", residual, iter);
      refactor_or_stall(problem, settings, iter, basis);
      residual = basis_residual(problem, basis, residual_work);
    }
    warmlp_expects(residual <= residual_tol,
                   error_type_t::NumericalStall,
                   "|| B*xB - b || = %e after refactorization at iteration %d",
                   residual,
                   iter);
    if (refactored) { obj = basic_objective(objective, basis); }

    if (theta <= settings.zero_tol) {
      degenerate_pivots++;
      if (rule == pricing_rule_t::DANTZIG && degenerate_pivots >= settings.degenerate_pivot_limit) {
        settings.log.printf("%d consecutive degenerate pivots. Switching to Bland's rule\n",
                            degenerate_pivots);
        rule = pricing_rule_t::BLAND;
      }
    } else {
      degenerate_pivots = 0;
    }

    if (iter <= settings.first_iteration_log || iter % settings.iteration_log_frequency == 0) {
      settings.log.printf("%5d %+.8e %8d %8d %+.4e\n", iter, obj, entering, leaving, theta);
    }

    if (toc(start_time) > settings.time_limit) {
      status = primal::status_t::TIME_LIMIT;
      break;
    }
  }

  sol.objective = basic_objective(objective, basis);
  return status;
}

#ifdef REVISED_SIMPLEX_INSTANTIATE_DOUBLE

template primal::status_t primal_phase2<int, double>(
  int phase,
  double start_time,
  const standard_form_t<int, double>& problem,
  const std::vector<double>& objective,
  const simplex_solver_settings_t<int, double>& settings,
  int first_entering,
  basis_t<int, double>& basis,
  lp_solution_t<int, double>& sol,
  int& iter);

template double basic_objective<int, double>(const std::vector<double>& objective,
                                             const basis_t<int, double>& basis);

#endif

}  // namespace warmlp::linear_programming::revised_simplex
