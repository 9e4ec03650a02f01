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

#include <revised_simplex/sparse_matrix.hpp>
#include <revised_simplex/types.hpp>

#include <string>
#include <vector>

namespace warmlp::linear_programming::revised_simplex {

// A linear program as the caller states it:
//
//   max (or min)  c'*x + obj_constant
//   subject to    A(i, :)*x  {<=, >=, =}  rhs(i)   for each row i, sense in row_sense(i)
//                 lower <= x <= upper
//
// Unless stated otherwise lower = 0 and upper = inf
template <typename i_t, typename f_t>
struct user_problem_t {
  user_problem_t()
    : num_rows(0), num_cols(0), A(0, 0, 0), obj_constant(0.0), obj_scale(1.0)
  {
  }

  // Sets lower = 0 and upper = inf for every column
  void set_default_bounds()
  {
    lower.assign(num_cols, 0.0);
    upper.assign(num_cols, inf);
  }

  i_t num_rows;
  i_t num_cols;
  std::vector<f_t> objective;
  csc_matrix_t<i_t, f_t> A;
  std::vector<f_t> rhs;
  std::vector<char> row_sense;  // 'L', 'G' or 'E'
  std::vector<f_t> lower;
  std::vector<f_t> upper;
  std::string problem_name;
  std::vector<std::string> row_names;
  std::vector<std::string> col_names;
  f_t obj_constant;
  f_t obj_scale;  // 1.0 for max, -1.0 for min
};

}  // namespace warmlp::linear_programming::revised_simplex
