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

#include <revised_simplex/standard_form.hpp>

#include <utilities/common_utils.hpp>
#include <utilities/error.hpp>

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <vector>

namespace rs = warmlp::linear_programming::revised_simplex;

using column_kind = rs::column_kind_t;

namespace {

std::vector<double> dense_column(const rs::standard_form_t<int, double>& lp, int j)
{
  std::vector<double> column(lp.num_rows, 0.0);
  lp.A.load_a_column(j, column);
  return column;
}

}  // namespace

TEST(standardize, slack_columns_for_less_equal_rows)
{
  auto settings = warmlp::test::quiet_settings();
  rs::standard_form_t<int, double> lp(0, 0, 0);
  rs::standardize(warmlp::test::hospital_problem(), settings, lp);

  EXPECT_EQ(lp.num_rows, 2);
  EXPECT_EQ(lp.num_cols, 4);
  EXPECT_EQ(lp.num_artificial, 0);
  EXPECT_EQ(lp.column_kind,
            (std::vector<column_kind>{
              column_kind::STRUCTURAL, column_kind::STRUCTURAL, column_kind::SLACK, column_kind::SLACK}));
  EXPECT_EQ(lp.row_slack, (std::vector<int>{2, 3}));
  EXPECT_EQ(lp.row_artificial, (std::vector<int>{-1, -1}));
  EXPECT_EQ(lp.objective, (std::vector<double>{100.0, 200.0, 0.0, 0.0}));
  EXPECT_EQ(lp.rhs, (std::vector<double>{4.0, 6.0}));
  EXPECT_EQ(dense_column(lp, 1), (std::vector<double>{1.0, 2.0}));
  EXPECT_EQ(dense_column(lp, 3), (std::vector<double>{0.0, 1.0}));
}

TEST(standardize, surplus_artificial_and_negative_rhs)
{
  // x1 + x2 >= 1, x1 - x2 <= -2, x1 + 2*x2 = 3
  auto user = warmlp::test::make_problem(
    1.0, {1.0, 1.0}, {{1.0, 1.0}, {1.0, -1.0}, {1.0, 2.0}}, "GLE", {1.0, -2.0, 3.0});
  auto settings = warmlp::test::quiet_settings();
  rs::standard_form_t<int, double> lp(0, 0, 0);
  rs::standardize(user, settings, lp);

  EXPECT_EQ(lp.num_rows, 3);
  EXPECT_EQ(lp.num_cols, 7);
  EXPECT_EQ(lp.num_artificial, 3);
  EXPECT_EQ(lp.row_sign, (std::vector<double>{1.0, -1.0, 1.0}));
  EXPECT_EQ(lp.rhs, (std::vector<double>{1.0, 2.0, 3.0}));
  EXPECT_EQ(lp.row_slack, (std::vector<int>{2, 3, -1}));
  EXPECT_EQ(lp.row_artificial, (std::vector<int>{4, 5, 6}));
  EXPECT_EQ(lp.column_kind[2], column_kind::SURPLUS);
  EXPECT_EQ(lp.column_kind[3], column_kind::SURPLUS);
  EXPECT_EQ(lp.column_kind[6], column_kind::ARTIFICIAL);
  EXPECT_EQ(dense_column(lp, 0), (std::vector<double>{1.0, -1.0, 1.0}));
  EXPECT_EQ(dense_column(lp, 1), (std::vector<double>{1.0, 1.0, 2.0}));
  EXPECT_EQ(dense_column(lp, 3), (std::vector<double>{0.0, -1.0, 0.0}));
  EXPECT_EQ(dense_column(lp, 5), (std::vector<double>{0.0, 1.0, 0.0}));
}

TEST(standardize, bounds_and_free_variables)
{
  // x1 in [2, 5], x2 free, x3 >= 0
  auto user = warmlp::test::make_problem(1.0, {1.0, 1.0, 1.0}, {{1.0, 1.0, 1.0}}, "L", {10.0});
  user.lower    = {2.0, -rs::inf, 0.0};
  user.upper    = {5.0, rs::inf, rs::inf};
  auto settings = warmlp::test::quiet_settings();
  rs::standard_form_t<int, double> lp(0, 0, 0);
  rs::standardize(user, settings, lp);

  EXPECT_EQ(lp.num_rows, 2);
  EXPECT_EQ(lp.num_cols, 6);
  EXPECT_EQ(lp.num_user_rows, 1);
  EXPECT_EQ(lp.rhs, (std::vector<double>{8.0, 3.0}));
  EXPECT_EQ(lp.negative_col, (std::vector<int>{-1, 3, -1}));
  EXPECT_EQ(lp.shift, (std::vector<double>{2.0, 0.0, 0.0}));
  EXPECT_EQ(lp.objective, (std::vector<double>{1.0, 1.0, 1.0, -1.0, 0.0, 0.0}));
  EXPECT_EQ(lp.obj_constant, 2.0);
  EXPECT_EQ(dense_column(lp, 0), (std::vector<double>{1.0, 1.0}));
  EXPECT_EQ(dense_column(lp, 3), (std::vector<double>{-1.0, 0.0}));

  std::vector<double> x_std{1.0, 0.0, 0.0, 4.0, 0.0, 0.0};
  std::vector<double> x;
  rs::uncrush_primal_solution(lp, x_std, x);
  EXPECT_EQ(x, (std::vector<double>{3.0, -4.0, 0.0}));
}

TEST(standardize, minimization_negates_objective)
{
  auto user =
    warmlp::test::make_problem(WARMLP_MINIMIZE, {2.0, 3.0}, {{1.0, 1.0}}, "G", {4.0});
  auto settings = warmlp::test::quiet_settings();
  rs::standard_form_t<int, double> lp(0, 0, 0);
  rs::standardize(user, settings, lp);
  EXPECT_EQ(lp.obj_scale, -1.0);
  EXPECT_EQ(lp.objective[0], -2.0);
  EXPECT_EQ(lp.objective[1], -3.0);
}

TEST(standardize, malformed_input)
{
  auto settings = warmlp::test::quiet_settings();
  rs::standard_form_t<int, double> lp(0, 0, 0);
  const double nan = std::numeric_limits<double>::quiet_NaN();

  auto user = warmlp::test::hospital_problem();
  user.objective.pop_back();
  EXPECT_THROW(rs::standardize(user, settings, lp), warmlp::malformed_problem_error);

  user = warmlp::test::hospital_problem();
  user.rhs.push_back(1.0);
  EXPECT_THROW(rs::standardize(user, settings, lp), warmlp::malformed_problem_error);

  user = warmlp::test::hospital_problem();
  user.row_sense[1] = 'X';
  EXPECT_THROW(rs::standardize(user, settings, lp), warmlp::malformed_problem_error);

  user = warmlp::test::hospital_problem();
  user.A.i[0] = 7;
  EXPECT_THROW(rs::standardize(user, settings, lp), warmlp::malformed_problem_error);

  user = warmlp::test::hospital_problem();
  user.A.col_start[1] = 5;
  EXPECT_THROW(rs::standardize(user, settings, lp), warmlp::malformed_problem_error);

  user = warmlp::test::hospital_problem();
  user.num_cols = 3;
  EXPECT_THROW(rs::standardize(user, settings, lp), warmlp::malformed_problem_error);

  user = warmlp::test::hospital_problem();
  user.objective[0] = nan;
  EXPECT_THROW(rs::standardize(user, settings, lp), warmlp::malformed_problem_error);

  user = warmlp::test::hospital_problem();
  user.rhs[0] = rs::inf;
  EXPECT_THROW(rs::standardize(user, settings, lp), warmlp::malformed_problem_error);

  user = warmlp::test::hospital_problem();
  user.upper[0] = -rs::inf;
  EXPECT_THROW(rs::standardize(user, settings, lp), warmlp::malformed_problem_error);

  user = warmlp::test::hospital_problem();
  user.obj_scale = 2.0;
  EXPECT_THROW(rs::standardize(user, settings, lp), warmlp::malformed_problem_error);

  user = warmlp::test::make_problem(1.0, {rs::inf, 1.0}, {{1.0, 1.0}}, "L", {4.0});
  EXPECT_THROW(rs::standardize(user, settings, lp), warmlp::malformed_problem_error);

  user = warmlp::test::hospital_problem();
  user.objective[1] = -rs::inf;
  EXPECT_THROW(rs::standardize(user, settings, lp), warmlp::malformed_problem_error);

  user = warmlp::test::hospital_problem();
  user.A.x[2] = rs::inf;
  EXPECT_THROW(rs::standardize(user, settings, lp), warmlp::malformed_problem_error);
}

TEST(standardize, crush_and_append_column)
{
  auto user     = warmlp::test::make_problem(1.0, {1.0}, {{1.0}, {1.0}}, "LL", {4.0, -1.0});
  user.upper    = {3.0};
  auto settings = warmlp::test::quiet_settings();
  rs::standard_form_t<int, double> lp(0, 0, 0);
  rs::standardize(user, settings, lp);
  ASSERT_EQ(lp.num_rows, 3);

  std::vector<double> column;
  rs::crush_column(lp, {2.0, 5.0}, column);
  EXPECT_EQ(column, (std::vector<double>{2.0, -5.0, 0.0}));
  EXPECT_THROW(rs::crush_column(lp, {2.0}, column), warmlp::dimension_mismatch_error);
  EXPECT_THROW(rs::crush_column(lp, {2.0, rs::inf}, column), warmlp::malformed_problem_error);

  const int n = lp.num_cols;
  EXPECT_EQ(rs::append_structural_column(lp, column, 7.0), n);
  EXPECT_EQ(lp.num_cols, n + 1);
  EXPECT_EQ(lp.num_user_cols, 2);
  EXPECT_EQ(lp.column_kind[n], column_kind::STRUCTURAL);
  EXPECT_EQ(lp.objective[n], 7.0);
  EXPECT_EQ(dense_column(lp, n), column);
}
