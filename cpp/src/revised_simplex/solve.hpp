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

#include <warmlp/linear_programming/constants.h>

#include <revised_simplex/basis_solves.hpp>
#include <revised_simplex/simplex_solver_settings.hpp>
#include <revised_simplex/solution.hpp>
#include <revised_simplex/standard_form.hpp>
#include <revised_simplex/types.hpp>
#include <revised_simplex/user_problem.hpp>

#include <string>
#include <vector>

namespace warmlp::linear_programming::revised_simplex {

enum class lp_status_t {
  OPTIMAL    = WARMLP_TERMINATION_STATUS_OPTIMAL,
  INFEASIBLE = WARMLP_TERMINATION_STATUS_INFEASIBLE,
  UNBOUNDED  = WARMLP_TERMINATION_STATUS_UNBOUNDED,
  TIME_LIMIT = WARMLP_TERMINATION_STATUS_TIME_LIMIT,
  UNSET      = WARMLP_TERMINATION_STATUS_UNSET
};

std::string lp_status_to_string(lp_status_t status);

// Everything needed to resume from a solve: the standard form it solved, the final basis with
// its inverse, the terminal status and the solution. Not safe for concurrent use; give each
// thread its own copy
template <typename i_t, typename f_t>
struct simplex_state_t {
  simplex_state_t() : problem(0, 0, 0), status(lp_status_t::UNSET), solution(0, 0) {}
  standard_form_t<i_t, f_t> problem;
  basis_t<i_t, f_t> basis;
  lp_status_t status;
  lp_solution_t<i_t, f_t> solution;
};

// Standardizes and solves a user problem from the slack basis.
// Throws malformed_problem_error or numerical_stall_error
template <typename i_t, typename f_t>
lp_status_t solve_linear_program(const user_problem_t<i_t, f_t>& user_problem,
                                 const simplex_solver_settings_t<i_t, f_t>& settings,
                                 simplex_state_t<i_t, f_t>& state);

// Solves a problem already in standard form, running phase 1 when the slack basis contains
// artificial columns
template <typename i_t, typename f_t>
lp_status_t solve_standard_form(const standard_form_t<i_t, f_t>& problem,
                                const simplex_solver_settings_t<i_t, f_t>& settings,
                                simplex_state_t<i_t, f_t>& state);

// Fills x, x_standard, y, z and the objectives of state.solution from state.basis
template <typename i_t, typename f_t>
void finalize_solution(const std::vector<f_t>& objective, simplex_state_t<i_t, f_t>& state);

template <typename i_t, typename f_t>
f_t compute_user_objective(const standard_form_t<i_t, f_t>& problem, f_t obj);

}  // namespace warmlp::linear_programming::revised_simplex
