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
#include <revised_simplex/solve.hpp>

#include <vector>

namespace warmlp::linear_programming::revised_simplex {

enum class add_variable_status_t {
  NOT_BENEFICIAL = 0,
  OPTIMAL        = 1,
  UNBOUNDED      = 2,
  TIME_LIMIT     = 3
};

template <typename i_t, typename f_t>
struct add_variable_report_t {
  add_variable_status_t status = add_variable_status_t::NOT_BENEFICIAL;
  f_t reduced_cost             = 0.0;  // of the new column against the basis it was offered to
  f_t objective                = 0.0;  // user objective after the call
  std::vector<f_t> x;                  // user solution after the call
  i_t pivots         = 0;              // pivots performed by the re-optimization
  i_t variable_index = -1;             // user index of the new variable, -1 if not added
};

// Offers a new nonnegative variable with constraint coefficients column (one per user row)
// and objective coefficient objective (in the user's sense) to an optimal state.
//
// If its reduced cost is not negative the state is left untouched and NOT_BENEFICIAL is
// reported. Otherwise the column is appended and primal simplex resumes from the current
// basis with the new column entering first.
//
// Throws invalid_state_error unless state.status is OPTIMAL, dimension_mismatch_error if
// column has the wrong length. If re-optimization throws numerical_stall_error the state is
// restored before the error propagates
template <typename i_t, typename f_t>
add_variable_status_t add_variable(simplex_state_t<i_t, f_t>& state,
                                   const std::vector<f_t>& column,
                                   f_t objective,
                                   const simplex_solver_settings_t<i_t, f_t>& settings,
                                   add_variable_report_t<i_t, f_t>& report);

// Reduced cost of standard-form column j at the current basis. Zero for basic columns
template <typename i_t, typename f_t>
f_t reduced_cost(const simplex_state_t<i_t, f_t>& state, i_t j);

// Reduced cost of a prospective column over the user rows. Does not modify the state
template <typename i_t, typename f_t>
f_t reduced_cost(const simplex_state_t<i_t, f_t>& state,
                 const std::vector<f_t>& column,
                 f_t objective);

}  // namespace warmlp::linear_programming::revised_simplex
