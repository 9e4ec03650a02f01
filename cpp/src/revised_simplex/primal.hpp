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
#include <revised_simplex/solution.hpp>
#include <revised_simplex/standard_form.hpp>
#include <revised_simplex/types.hpp>

#include <vector>

namespace warmlp::linear_programming::revised_simplex {

namespace primal {
enum class status_t { OPTIMAL = 0, UNBOUNDED = 1, TIME_LIMIT = 2, UNSET = 3 };
}

// Runs revised primal simplex iterations that maximize objective'*x from the current basis,
// which must be primal feasible. Phase 1 passes the artificial objective, phase 2 the problem
// objective; in phase 2 artificial columns never enter the basis. If first_entering is not -1
// and has a negative reduced cost it enters on the first iteration.
//
// Pivots are appended to sol.pivots and counted in iter. Throws numerical_stall_error if
// settings.iteration_limit pivots are exceeded or if the basis cannot be refactorized to
// satisfy B*x_B = b
template <typename i_t, typename f_t>
primal::status_t primal_phase2(i_t phase,
                               f_t start_time,
                               const standard_form_t<i_t, f_t>& problem,
                               const std::vector<f_t>& objective,
                               const simplex_solver_settings_t<i_t, f_t>& settings,
                               i_t first_entering,
                               basis_t<i_t, f_t>& basis,
                               lp_solution_t<i_t, f_t>& sol,
                               i_t& iter);

// Objective value objective'*x at the current basic solution
template <typename i_t, typename f_t>
f_t basic_objective(const std::vector<f_t>& objective, const basis_t<i_t, f_t>& basis);

}  // namespace warmlp::linear_programming::revised_simplex
