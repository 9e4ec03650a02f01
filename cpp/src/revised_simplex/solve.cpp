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

#include <revised_simplex/solve.hpp>

#include <revised_simplex/initial_basis.hpp>
#include <revised_simplex/phase1.hpp>
#include <revised_simplex/pricing.hpp>
#include <revised_simplex/primal.hpp>
#include <revised_simplex/tic_toc.hpp>
#include <revised_simplex/vector_math.hpp>

#include <utilities/error.hpp>

namespace warmlp::linear_programming::revised_simplex {

std::string lp_status_to_string(lp_status_t status)
{
  switch (status) {
    case lp_status_t::OPTIMAL: return "Optimal";
    case lp_status_t::INFEASIBLE: return "Infeasible";
    case lp_status_t::UNBOUNDED: return "Unbounded";
    case lp_status_t::TIME_LIMIT: return "Time limit";
    case lp_status_t::UNSET: return "Unset";
  }
  return "Unknown";
}

template <typename i_t, typename f_t>
f_t compute_user_objective(const standard_form_t<i_t, f_t>& problem, f_t obj)
{
  const f_t user_obj = obj * problem.obj_scale + problem.obj_constant;
  return user_obj;
}

template <typename i_t, typename f_t>
void finalize_solution(const std::vector<f_t>& objective, simplex_state_t<i_t, f_t>& state)
{
  const auto& problem = state.problem;
  auto& sol           = state.solution;
  basic_solution(problem, state.basis, sol.x_standard);
  uncrush_primal_solution(problem, sol.x_standard, sol.x);
  compute_dual_prices(problem, objective, state.basis, sol.y);
  compute_reduced_costs(problem, objective, state.basis, sol.y, sol.z);
  sol.objective      = dot<i_t, f_t>(problem.objective, sol.x_standard);
  sol.user_objective = compute_user_objective(problem, sol.objective);
}

template <typename i_t, typename f_t>
lp_status_t solve_standard_form(const standard_form_t<i_t, f_t>& problem,
                                const simplex_solver_settings_t<i_t, f_t>& settings,
                                simplex_state_t<i_t, f_t>& state)
{
  const f_t start_time = tic();
  const i_t m          = problem.num_rows;
  const i_t n          = problem.num_cols;
  state.problem        = problem;
  state.status         = lp_status_t::UNSET;
  state.solution       = lp_solution_t<i_t, f_t>(m, n);
  auto& sol            = state.solution;
  auto& basis          = state.basis;

  std::vector<i_t> basic_list;
  const i_t num_artificial_basic = slack_basis(problem, basic_list);
  warmlp_expects(initialize_basis(problem, settings, basic_list, basis) == 0,
                 error_type_t::NumericalStall,
                 "Slack basis is singular");

  i_t iter = 0;
  if (num_artificial_basic > 0) {
    std::vector<f_t> phase1_objective;
    create_phase1_objective(problem, phase1_objective);
    const primal::status_t phase1_status = primal_phase2(
      1, start_time, problem, phase1_objective, settings, -1, basis, sol, iter);
    if (phase1_status == primal::status_t::TIME_LIMIT) {
      state.status = lp_status_t::TIME_LIMIT;
      finalize_solution(phase1_objective, state);
      sol.iterations = iter;
      return state.status;
    }
    warmlp_expects(phase1_status == primal::status_t::OPTIMAL,
                   error_type_t::NumericalStall,
                   "Phase 1 did not reach an optimum");

    const f_t infeasibility  = artificial_infeasibility(problem, basis);
    sol.phase1_infeasibility = infeasibility;
    const f_t rhs_norm       = vector_norm_inf<i_t, f_t>(problem.rhs);
    if (infeasibility > settings.primal_tol * (1.0 + rhs_norm)) {
      settings.log.printf("Phase 1 infeasibility %e. Problem is infeasible\n", infeasibility);
      state.status = lp_status_t::INFEASIBLE;
      // y holds the phase 1 prices, a certificate of infeasibility
      finalize_solution(phase1_objective, state);
      sol.iterations = iter;
      return state.status;
    }
    remove_artificials(problem, settings, basis, sol, iter);
  }

  const primal::status_t status =
    primal_phase2(2, start_time, problem, problem.objective, settings, -1, basis, sol, iter);
  switch (status) {
    case primal::status_t::OPTIMAL: state.status = lp_status_t::OPTIMAL; break;
    case primal::status_t::UNBOUNDED: state.status = lp_status_t::UNBOUNDED; break;
    case primal::status_t::TIME_LIMIT: state.status = lp_status_t::TIME_LIMIT; break;
    case primal::status_t::UNSET: WARMLP_FAIL("Phase 2 returned without a status");
  }
  finalize_solution(problem.objective, state);
  sol.iterations = iter;
  settings.log.printf("%s. Objective %+.8e after %d iterations in %.2fs\n",
                      lp_status_to_string(state.status).c_str(),
                      sol.user_objective,
                      iter,
                      toc(start_time));
  return state.status;
}

template <typename i_t, typename f_t>
lp_status_t solve_linear_program(const user_problem_t<i_t, f_t>& user_problem,
                                 const simplex_solver_settings_t<i_t, f_t>& settings,
                                 simplex_state_t<i_t, f_t>& state)
{
  standard_form_t<i_t, f_t> problem(0, 0, 0);
  standardize(user_problem, settings, problem);
  return solve_standard_form(problem, settings, state);
}

#ifdef REVISED_SIMPLEX_INSTANTIATE_DOUBLE

template double compute_user_objective<int, double>(const standard_form_t<int, double>& problem,
                                                    double obj);

template void finalize_solution<int, double>(const std::vector<double>& objective,
                                             simplex_state_t<int, double>& state);

template lp_status_t solve_standard_form<int, double>(
  const standard_form_t<int, double>& problem,
  const simplex_solver_settings_t<int, double>& settings,
  simplex_state_t<int, double>& state);

template lp_status_t solve_linear_program<int, double>(
  const user_problem_t<int, double>& user_problem,
  const simplex_solver_settings_t<int, double>& settings,
  simplex_state_t<int, double>& state);

#endif

}  // namespace warmlp::linear_programming::revised_simplex
