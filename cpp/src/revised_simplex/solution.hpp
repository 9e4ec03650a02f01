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

#include <revised_simplex/types.hpp>

#include <limits>
#include <vector>

namespace warmlp::linear_programming::revised_simplex {

// One basis exchange
template <typename i_t, typename f_t>
struct pivot_record_t {
  i_t iteration;
  i_t phase;
  i_t entering;      // column entering the basis
  i_t leaving;       // column leaving the basis
  i_t leaving_row;   // row of the basis where the exchange happened
  f_t theta;         // step length from the ratio test
  f_t reduced_cost;  // reduced cost of the entering column before the pivot

  bool operator==(const pivot_record_t& other) const
  {
    return iteration == other.iteration && phase == other.phase && entering == other.entering &&
           leaving == other.leaving && leaving_row == other.leaving_row &&
           theta == other.theta && reduced_cost == other.reduced_cost;
  }
};

template <typename i_t, typename f_t>
class lp_solution_t {
 public:
  lp_solution_t(i_t m, i_t n)
    : x(n),
      y(m),
      objective(std::numeric_limits<f_t>::quiet_NaN()),
      user_objective(std::numeric_limits<f_t>::quiet_NaN()),
      iterations(0),
      phase1_infeasibility(0.0),
      unbounded_column(-1)
  {
  }

  // Primal solution in terms of the user variables
  std::vector<f_t> x;
  // Primal solution over the standard form columns
  std::vector<f_t> x_standard;
  // Dual prices y' = c_B' * B^{-1}, one per standard form row
  std::vector<f_t> y;
  // Reduced costs r_j = y' * A(:, j) - c_j, one per standard form column. Zero for basic columns
  std::vector<f_t> z;
  f_t objective;       // c'*x of the standard form, maximization sense
  f_t user_objective;  // objective in the caller's sense, including the constant
  i_t iterations;      // pivots performed by the call that produced this solution
  std::vector<pivot_record_t<i_t, f_t>> pivots;
  f_t phase1_infeasibility;  // sum of artificial variables at the end of phase 1
  // Certificate of unboundedness: the entering column and the direction d over the standard
  // columns such that x + t*d stays feasible for all t >= 0 while the objective increases
  i_t unbounded_column;
  std::vector<f_t> unbounded_direction;
};

}  // namespace warmlp::linear_programming::revised_simplex
