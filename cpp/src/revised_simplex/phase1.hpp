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

#include <vector>

namespace warmlp::linear_programming::revised_simplex {

// Phase 1 maximizes -sum(artificials): objective is -1 on artificial columns, 0 elsewhere
template <typename i_t, typename f_t>
void create_phase1_objective(const standard_form_t<i_t, f_t>& problem,
                             std::vector<f_t>& objective);

// Sum of the artificial variables at the current basis
template <typename i_t, typename f_t>
f_t artificial_infeasibility(const standard_form_t<i_t, f_t>& problem,
                             const basis_t<i_t, f_t>& basis);

// After a successful phase 1, replaces every artificial still basic at zero by a
// non-artificial column with a nonzero entry in that row of B^{-1}*A. These pivots are
// degenerate and recorded in sol.pivots. Returns the number of artificial columns left in the
// basis; each one marks a redundant row
template <typename i_t, typename f_t>
i_t remove_artificials(const standard_form_t<i_t, f_t>& problem,
                       const simplex_solver_settings_t<i_t, f_t>& settings,
                       basis_t<i_t, f_t>& basis,
                       lp_solution_t<i_t, f_t>& sol,
                       i_t& iter);

}  // namespace warmlp::linear_programming::revised_simplex
