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

#include <revised_simplex/basis_solves.hpp>
#include <revised_simplex/initial_basis.hpp>
#include <revised_simplex/phase1.hpp>
#include <revised_simplex/pricing.hpp>
#include <revised_simplex/standard_form.hpp>

#include <utilities/common_utils.hpp>

#include <gtest/gtest.h>

#include <vector>

namespace rs = warmlp::linear_programming::revised_simplex;

namespace {

rs::standard_form_t<int, double> standard_hospital(
  const rs::simplex_solver_settings_t<int, double>& settings)
{
  rs::standard_form_t<int, double> lp(0, 0, 0);
  rs::standardize(warmlp::test::hospital_problem(), settings, lp);
  return lp;
}

}  // namespace

TEST(basis, slack_basis_is_identity)
{
  auto settings = warmlp::test::quiet_settings();
  auto lp       = standard_hospital(settings);
  std::vector<int> basic_list;
  EXPECT_EQ(rs::slack_basis(lp, basic_list), 0);
  EXPECT_EQ(basic_list, (std::vector<int>{2, 3}));

  rs::basis_t<int, double> basis;
  ASSERT_EQ(rs::initialize_basis(lp, settings, basic_list, basis), 0);
  EXPECT_EQ(basis.x_basic, (std::vector<double>{4.0, 6.0}));
  EXPECT_EQ(basis.vstatus[0], rs::variable_status_t::NONBASIC_LOWER);
  EXPECT_EQ(basis.vstatus[3], rs::variable_status_t::BASIC);
  EXPECT_EQ(rs::basis_residual(lp, basis), 0.0);
}

TEST(basis, slack_basis_uses_artificials)
{
  auto user = warmlp::test::make_problem(
    1.0, {1.0, 1.0}, {{1.0, 1.0}, {1.0, -1.0}, {1.0, 2.0}}, "LGE", {4.0, 1.0, 3.0});
  auto settings = warmlp::test::quiet_settings();
  rs::standard_form_t<int, double> lp(0, 0, 0);
  rs::standardize(user, settings, lp);
  std::vector<int> basic_list;
  EXPECT_EQ(rs::slack_basis(lp, basic_list), 2);
  EXPECT_EQ(basic_list[0], lp.row_slack[0]);
  EXPECT_EQ(basic_list[1], lp.row_artificial[1]);
  EXPECT_EQ(basic_list[2], lp.row_artificial[2]);

  rs::basis_t<int, double> basis;
  ASSERT_EQ(rs::initialize_basis(lp, settings, basic_list, basis), 0);
  EXPECT_EQ(rs::artificial_infeasibility(lp, basis), 4.0);

  std::vector<double> phase1_objective;
  rs::create_phase1_objective(lp, phase1_objective);
  for (int j = 0; j < lp.num_cols; ++j) {
    const bool artificial = lp.column_kind[j] == rs::column_kind_t::ARTIFICIAL;
    EXPECT_EQ(phase1_objective[j], artificial ? -1.0 : 0.0);
  }
}

TEST(basis, structural_basis_and_singular_detection)
{
  auto settings = warmlp::test::quiet_settings();
  auto lp       = standard_hospital(settings);
  rs::basis_t<int, double> basis;
  ASSERT_EQ(rs::initialize_basis(lp, settings, {0, 1}, basis), 0);
  EXPECT_NEAR(basis.x_basic[0], 2.0, 1e-12);
  EXPECT_NEAR(basis.x_basic[1], 2.0, 1e-12);
  EXPECT_LE(rs::basis_residual(lp, basis), 1e-12);

  std::vector<double> x;
  rs::basic_solution(lp, basis, x);
  EXPECT_EQ(x.size(), 4u);
  EXPECT_EQ(x[2], 0.0);

  rs::basis_t<int, double> singular;
  EXPECT_EQ(rs::initialize_basis(lp, settings, {0, 0}, singular), -1);
}

TEST(basis, residual_into_workspace)
{
  auto settings = warmlp::test::quiet_settings();
  auto lp       = standard_hospital(settings);
  rs::basis_t<int, double> basis;
  ASSERT_EQ(rs::initialize_basis(lp, settings, {0, 1}, basis), 0);

  std::vector<double> residual(2, 7.0);
  EXPECT_LE(rs::basis_residual(lp, basis, residual), 1e-12);
  ASSERT_EQ(residual.size(), 2u);
  EXPECT_NEAR(residual[0], 0.0, 1e-12);
  EXPECT_NEAR(residual[1], 0.0, 1e-12);

  // x1 = 3, x2 = 2 overshoots both rows by one
  basis.x_basic[0] = 3.0;
  EXPECT_NEAR(rs::basis_residual(lp, basis, residual), 1.0, 1e-12);
  EXPECT_NEAR(residual[0], 1.0, 1e-12);
  EXPECT_NEAR(residual[1], 1.0, 1e-12);
  EXPECT_NEAR(rs::basis_residual(lp, basis), 1.0, 1e-12);
}

TEST(basis, refactor_matches_updated_inverse)
{
  auto settings = warmlp::test::quiet_settings();
  auto lp       = standard_hospital(settings);
  rs::basis_t<int, double> basis;
  ASSERT_EQ(rs::initialize_basis(lp, settings, {2, 3}, basis), 0);

  // x2 replaces the slack of row 1
  std::vector<double> aq(2, 0.0);
  lp.A.load_a_column(1, aq);
  std::vector<double> d;
  basis.binv.b_solve(aq, d);
  ASSERT_EQ(basis.binv.update(d, 1), 0);
  const double theta = basis.x_basic[1] / d[1];
  for (int k = 0; k < 2; ++k) {
    basis.x_basic[k] -= theta * d[k];
  }
  basis.x_basic[1]    = theta;
  basis.basic_list[1] = 1;
  EXPECT_LE(rs::basis_residual(lp, basis), 1e-12);

  const auto updated = basis.binv.inverse();
  ASSERT_EQ(rs::refactor_basis(lp, settings, basis), 0);
  EXPECT_EQ(basis.binv.num_updates(), 0);
  for (int i = 0; i < 2; ++i) {
    for (int j = 0; j < 2; ++j) {
      EXPECT_NEAR(basis.binv.inverse()(i, j), updated(i, j), 1e-12);
    }
  }
  EXPECT_NEAR(basis.x_basic[0], 1.0, 1e-12);
  EXPECT_NEAR(basis.x_basic[1], 3.0, 1e-12);
}

TEST(pricing, dual_prices_and_reduced_costs)
{
  auto settings = warmlp::test::quiet_settings();
  auto lp       = standard_hospital(settings);
  rs::basis_t<int, double> basis;
  ASSERT_EQ(rs::initialize_basis(lp, settings, {2, 1}, basis), 0);

  std::vector<double> y;
  rs::compute_dual_prices(lp, lp.objective, basis, y);
  EXPECT_NEAR(y[0], 0.0, 1e-12);
  EXPECT_NEAR(y[1], 100.0, 1e-12);

  std::vector<double> c_basic(2);
  std::vector<double> y_work(2);
  rs::compute_dual_prices(lp, lp.objective, basis, c_basic, y_work);
  EXPECT_EQ(c_basic, (std::vector<double>{0.0, 200.0}));
  EXPECT_EQ(y_work, y);

  std::vector<double> z;
  rs::compute_reduced_costs(lp, lp.objective, basis, y, z);
  EXPECT_NEAR(z[0], 0.0, 1e-12);
  EXPECT_EQ(z[1], 0.0);
  EXPECT_EQ(z[2], 0.0);
  EXPECT_NEAR(z[3], 100.0, 1e-12);
  EXPECT_NEAR(rs::column_reduced_cost(lp, lp.objective, y, 3), 100.0, 1e-12);
  EXPECT_NEAR((rs::dense_column_reduced_cost<int, double>(y, {0.0, 1.0}, 400.0)), -300.0, 1e-12);

  double rq = 0.0;
  EXPECT_EQ(
    rs::price_entering(lp, lp.objective, settings, rs::pricing_rule_t::DANTZIG, 2, basis, y, rq),
    -1);
}

TEST(pricing, dantzig_and_bland_choose_differently)
{
  auto settings = warmlp::test::quiet_settings();
  auto lp       = standard_hospital(settings);
  rs::basis_t<int, double> basis;
  ASSERT_EQ(rs::initialize_basis(lp, settings, {2, 3}, basis), 0);
  std::vector<double> y;
  rs::compute_dual_prices(lp, lp.objective, basis, y);

  double rq = 0.0;
  EXPECT_EQ(
    rs::price_entering(lp, lp.objective, settings, rs::pricing_rule_t::DANTZIG, 2, basis, y, rq),
    1);
  EXPECT_EQ(rq, -200.0);
  EXPECT_EQ(
    rs::price_entering(lp, lp.objective, settings, rs::pricing_rule_t::BLAND, 2, basis, y, rq), 0);
  EXPECT_EQ(rq, -100.0);
}

TEST(pricing, ratio_test_ties_go_to_lowest_column)
{
  // x1 <= 2, x1 + x2 <= 2
  auto user =
    warmlp::test::make_problem(1.0, {1.0, 1.0}, {{1.0, 0.0}, {1.0, 1.0}}, "LL", {2.0, 2.0});
  auto settings = warmlp::test::quiet_settings();
  rs::standard_form_t<int, double> lp(0, 0, 0);
  rs::standardize(user, settings, lp);

  // Slack of row 1 is basic in position 0, slack of row 0 in position 1
  rs::basis_t<int, double> basis;
  ASSERT_EQ(rs::initialize_basis(lp, settings, {3, 2}, basis), 0);
  std::vector<double> d{1.0, 1.0};
  double theta = 0.0;
  EXPECT_EQ(rs::ratio_test(lp, settings, 2, basis, d, theta), 1);
  EXPECT_EQ(theta, 2.0);

  std::vector<double> unbounded{-1.0, 0.0};
  EXPECT_EQ(rs::ratio_test(lp, settings, 2, basis, unbounded, theta), -1);
}
