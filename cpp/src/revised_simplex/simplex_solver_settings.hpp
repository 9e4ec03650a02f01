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

#include <revised_simplex/logger.hpp>
#include <revised_simplex/types.hpp>

#include <limits>
#include <string>

namespace warmlp::linear_programming::revised_simplex {

template <typename i_t, typename f_t>
struct simplex_solver_settings_t {
 public:
  simplex_solver_settings_t()
    : iteration_limit(100000),
      time_limit(std::numeric_limits<f_t>::infinity()),
      primal_tol(1e-9),
      dual_tol(1e-9),
      pivot_tol(1e-9),
      zero_tol(1e-12),
      residual_tol(1e-7),
      refactor_frequency(50),
      degenerate_pivot_limit(50),
      pricing(pricing_rule_t::DANTZIG),
      iteration_log_frequency(100),
      first_iteration_log(2)
  {
  }

  void set_log(bool logging) const { log.log = logging; }
  void set_log_to_console(bool log_to_console) const { log.log_to_console = log_to_console; }
  void enable_log_to_file() { log.enable_log_to_file(); }
  void set_log_filename(const std::string& log_filename) { log.set_log_file(log_filename); }
  void close_log_file() { log.close_log_file(); }
  i_t iteration_limit;         // pivots allowed in one solve before declaring a numerical stall
  f_t time_limit;              // seconds
  f_t primal_tol;              // Absolute primal infeasibility tolerance
  f_t dual_tol;                // A reduced cost must be below -dual_tol to enter the basis
  f_t pivot_tol;               // Smallest |d_i| accepted in the ratio test and in factorization
  f_t zero_tol;                // Values below this tolerance are considered numerically zero
  f_t residual_tol;            // Relative bound on || B*xB - b || before refactorizing
  i_t refactor_frequency;      // number of product-form updates before an exact inversion
  i_t degenerate_pivot_limit;  // consecutive degenerate pivots before switching to Bland's
                               // rule, <= 0 to switch at the first one
  pricing_rule_t pricing;      // entering variable selection
  i_t iteration_log_frequency;  // number of iterations between log updates
  i_t first_iteration_log;      // number of iterations to log at beginning of solve
  mutable logger_t log;
};

}  // namespace warmlp::linear_programming::revised_simplex
