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
#include <revised_simplex/sparse_matrix.hpp>
#include <revised_simplex/user_problem.hpp>

#include <utilities/error.hpp>

#include <warmlp/linear_programming/constants.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace warmlp {
namespace test {

namespace rs = warmlp::linear_programming::revised_simplex;

/**
 * @brief Builds a user problem from dense constraint rows
 *
 * @param obj_scale 1 to maximize, -1 to minimize
 * @param objective One coefficient per variable
 * @param rows Dense constraint rows, each with one entry per variable
 * @param senses One of 'L', 'G', 'E' per row
 * @param rhs One right-hand side per row
 * @return rs::user_problem_t<int, double>
 */
inline rs::user_problem_t<int, double> make_problem(double obj_scale,
                                                    const std::vector<double>& objective,
                                                    const std::vector<std::vector<double>>& rows,
                                                    const std::string& senses,
                                                    const std::vector<double>& rhs)
{
  rs::user_problem_t<int, double> problem;
  problem.num_rows  = rows.size();
  problem.num_cols  = objective.size();
  problem.objective = objective;
  problem.rhs       = rhs;
  problem.row_sense.assign(senses.begin(), senses.end());
  problem.obj_scale = obj_scale;
  problem.set_default_bounds();

  std::vector<int> Ai;
  std::vector<int> Aj;
  std::vector<double> Ax;
  for (size_t i = 0; i < rows.size(); ++i) {
    WARMLP_EXPECTS(rows[i].size() == objective.size(), "Row %zu has the wrong length", i);
    for (size_t j = 0; j < rows[i].size(); ++j) {
      if (rows[i][j] == 0.0) { continue; }
      Ai.push_back(i);
      Aj.push_back(j);
      Ax.push_back(rows[i][j]);
    }
  }
  problem.A.m = problem.num_rows;
  problem.A.n = problem.num_cols;
  WARMLP_EXPECTS(rs::coo_to_csc(Ai, Aj, Ax, problem.A) == 0, "Invalid test matrix");
  return problem;
}

// max 100*x1 + 200*x2  s.t.  x1 + x2 <= 4,  x1 + 2*x2 <= 6
inline rs::user_problem_t<int, double> hospital_problem()
{
  return make_problem(
    WARMLP_MAXIMIZE, {100.0, 200.0}, {{1.0, 1.0}, {1.0, 2.0}}, "LL", {4.0, 6.0});
}

// The hospital problem with x3 (objective 400, column [0, 1]) present from the start
inline rs::user_problem_t<int, double> extended_hospital_problem()
{
  return make_problem(WARMLP_MAXIMIZE,
                      {100.0, 200.0, 400.0},
                      {{1.0, 1.0, 0.0}, {1.0, 2.0, 1.0}},
                      "LL",
                      {4.0, 6.0});
}

// Appends a column to a dense problem description. Used to cold solve what a warm start adds
inline rs::user_problem_t<int, double> add_column(const rs::user_problem_t<int, double>& problem,
                                                  const std::vector<double>& column,
                                                  double objective)
{
  rs::user_problem_t<int, double> augmented = problem;
  std::vector<double> dense(problem.num_rows, 0.0);
  for (size_t i = 0; i < column.size(); ++i) {
    dense[i] = column[i];
  }
  augmented.A.append_column(dense);
  augmented.num_cols++;
  augmented.objective.push_back(objective);
  augmented.lower.push_back(0.0);
  augmented.upper.push_back(rs::inf);
  return augmented;
}

inline rs::simplex_solver_settings_t<int, double> quiet_settings()
{
  rs::simplex_solver_settings_t<int, double> settings;
  settings.set_log(false);
  return settings;
}

inline std::string temp_file_path(const std::string& name)
{
  const char* tmp = std::getenv("TMPDIR");
  std::string dir = (tmp != NULL) ? tmp : "/tmp";
  return dir + "/" + name;
}

inline std::string read_file(const std::string& path)
{
  std::ifstream infile(path.c_str());
  std::stringstream contents;
  contents << infile.rdbuf();
  return contents.str();
}

}  // namespace test
}  // namespace warmlp
