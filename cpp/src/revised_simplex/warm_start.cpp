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

#include <revised_simplex/warm_start.hpp>

#include <revised_simplex/pricing.hpp>
#include <revised_simplex/primal.hpp>
#include <revised_simplex/tic_toc.hpp>

#include <utilities/error.hpp>

#include <cmath>
#include <utility>

namespace warmlp::linear_programming::revised_simplex {

namespace {

template <typename i_t, typename f_t>
void check_has_basis(const simplex_state_t<i_t, f_t>& state)
{
  warmlp_expects(state.status != lp_status_t::UNSET,
                 error_type_t::InvalidState,
                 "No basis available. Solve the problem first");
}

template <typename f_t>
void check_objective_coefficient(f_t objective)
{
  warmlp_expects(std::isfinite(objective),
                 error_type_t::MalformedProblem,
                 "New variable has a non-finite objective coefficient");
}

}  // namespace

template <typename i_t, typename f_t>
f_t reduced_cost(const simplex_state_t<i_t, f_t>& state, i_t j)
{
  check_has_basis(state);
  const auto& problem = state.problem;
  warmlp_expects(j >= 0 && j < problem.num_cols,
                 error_type_t::MalformedProblem,
                 "Column %d is not in the problem, which has %d columns",
                 j,
                 problem.num_cols);
  if (state.basis.vstatus[j] == variable_status_t::BASIC) { return 0.0; }
  std::vector<f_t> y(problem.num_rows);
  compute_dual_prices(problem, problem.objective, state.basis, y);
  return column_reduced_cost(problem, problem.objective, y, j);
}

template <typename i_t, typename f_t>
f_t reduced_cost(const simplex_state_t<i_t, f_t>& state,
                 const std::vector<f_t>& column,
                 f_t objective)
{
  check_has_basis(state);
  const auto& problem = state.problem;
  std::vector<f_t> a;
  crush_column(problem, column, a);
  check_objective_coefficient(objective);
  std::vector<f_t> y(problem.num_rows);
  compute_dual_prices(problem, problem.objective, state.basis, y);
  return dense_column_reduced_cost<i_t, f_t>(y, a, problem.obj_scale * objective);
}

template <typename i_t, typename f_t>
add_variable_status_t add_variable(simplex_state_t<i_t, f_t>& state,
                                   const std::vector<f_t>& column,
                                   f_t objective,
                                   const simplex_solver_settings_t<i_t, f_t>& settings,
                                   add_variable_report_t<i_t, f_t>& report)
{
  warmlp_expects(state.status == lp_status_t::OPTIMAL,
                 error_type_t::InvalidState,
                 "Variables can only be added to an optimal problem. Status is %s",
                 lp_status_to_string(state.status).c_str());

  const f_t start_time = tic();
  auto& problem        = state.problem;
  const i_t m          = problem.num_rows;
  std::vector<f_t> a;
  crush_column(problem, column, a);
  check_objective_coefficient(objective);
  const f_t c = problem.obj_scale * objective;

  // r = c_B' * B^{-1} * a - c against the existing basis
  std::vector<f_t> y(m);
  compute_dual_prices(problem, problem.objective, state.basis, y);
  const f_t r         = dense_column_reduced_cost<i_t, f_t>(y, a, c);
  report.reduced_cost = r;
  report.pivots       = 0;
  if (r >= -settings.dual_tol) {
    settings.log.printf("New variable has reduced cost %e. Not beneficial\n", r);
    report.status         = add_variable_status_t::NOT_BENEFICIAL;
    report.objective      = state.solution.user_objective;
    report.x              = state.solution.x;
    report.variable_index = -1;
    return report.status;
  }

  simplex_state_t<i_t, f_t> snapshot = state;

  const i_t q = append_structural_column(problem, a, c);
  state.basis.vstatus.push_back(variable_status_t::NONBASIC_LOWER);
  settings.log.printf("New variable enters as column %d with reduced cost %e\n", q, r);

  primal::status_t status = primal::status_t::UNSET;
  lp_solution_t<i_t, f_t> sol(m, problem.num_cols);
  i_t iter = 0;
  try {
    status = primal_phase2(
      2, start_time, problem, problem.objective, settings, q, state.basis, sol, iter);
  } catch (const numerical_stall_error&) {
    settings.log.printf("Re-optimization stalled. Restoring the previous basis\n");
    state = std::move(snapshot);
    throw;
  }

  sol.phase1_infeasibility = state.solution.phase1_infeasibility;
  sol.iterations           = iter;
  state.solution           = std::move(sol);
  switch (status) {
    case primal::status_t::OPTIMAL:
      state.status  = lp_status_t::OPTIMAL;
      report.status = add_variable_status_t::OPTIMAL;
      break;
    case primal::status_t::UNBOUNDED:
      state.status  = lp_status_t::UNBOUNDED;
      report.status = add_variable_status_t::UNBOUNDED;
      break;
    case primal::status_t::TIME_LIMIT:
      state.status  = lp_status_t::TIME_LIMIT;
      report.status = add_variable_status_t::TIME_LIMIT;
      break;
    case primal::status_t::UNSET: WARMLP_FAIL("Re-optimization returned without a status");
  }
  finalize_solution(problem.objective, state);

  report.objective      = state.solution.user_objective;
  report.x              = state.solution.x;
  report.pivots         = iter;
  report.variable_index = problem.num_user_cols - 1;
  settings.log.printf("%s after adding a variable. Objective %+.8e in %d pivots\n",
                      lp_status_to_string(state.status).c_str(),
                      report.objective,
                      iter);
  return report.status;
}

#ifdef REVISED_SIMPLEX_INSTANTIATE_DOUBLE

template double reduced_cost<int, double>(const simplex_state_t<int, double>& state, int j);

template double reduced_cost<int, double>(const simplex_state_t<int, double>& state,
                                          const std::vector<double>& column,
                                          double objective);

template add_variable_status_t add_variable<int, double>(
  simplex_state_t<int, double>& state,
  const std::vector<double>& column,
  double objective,
  const simplex_solver_settings_t<int, double>& settings,
  add_variable_report_t<int, double>& report);

#endif

}  // namespace warmlp::linear_programming::revised_simplex
