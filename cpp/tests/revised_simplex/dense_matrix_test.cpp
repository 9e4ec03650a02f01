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

#include <revised_simplex/basis_updates.hpp>
#include <revised_simplex/dense_matrix.hpp>
#include <revised_simplex/sparse_matrix.hpp>
#include <revised_simplex/vector_math.hpp>

#include <gtest/gtest.h>

#include <vector>

namespace rs = warmlp::linear_programming::revised_simplex;

namespace {

rs::dense_matrix_t<int, double> make_dense(const std::vector<std::vector<double>>& rows)
{
  rs::dense_matrix_t<int, double> A(rows.size(), rows[0].size());
  for (size_t i = 0; i < rows.size(); ++i) {
    for (size_t j = 0; j < rows[i].size(); ++j) {
      A(i, j) = rows[i][j];
    }
  }
  return A;
}

void expect_identity(const rs::dense_matrix_t<int, double>& A, double tol)
{
  for (int i = 0; i < A.m; ++i) {
    for (int j = 0; j < A.n; ++j) {
      EXPECT_NEAR(A(i, j), i == j ? 1.0 : 0.0, tol) << "entry (" << i << ", " << j << ")";
    }
  }
}

}  // namespace

TEST(vector_math, norms_and_dot)
{
  std::vector<double> x{3.0, -4.0, 0.0};
  std::vector<double> y{1.0, 2.0, 5.0};
  EXPECT_EQ((rs::vector_norm_inf<int, double>(x)), 4.0);
  EXPECT_EQ((rs::vector_norm2<int, double>(x)), 5.0);
  EXPECT_EQ((rs::dot<int, double>(x, y)), -5.0);
  rs::axpy<int, double>(2.0, x, y);
  EXPECT_EQ(y, (std::vector<double>{7.0, -6.0, 5.0}));
}

TEST(dense_matrix, matrix_vector_products)
{
  auto A = make_dense({{1.0, 2.0}, {3.0, 4.0}, {5.0, 6.0}});
  std::vector<double> x{1.0, -1.0};
  std::vector<double> y(3, 1.0);
  A.matrix_vector_multiply(1.0, x, 2.0, y);
  EXPECT_EQ(y, (std::vector<double>{1.0, 1.0, 1.0}));

  std::vector<double> u{1.0, 0.0, -1.0};
  std::vector<double> v(2, 0.0);
  A.transpose_multiply(1.0, u, 0.0, v);
  EXPECT_EQ(v, (std::vector<double>{-4.0, -4.0}));
  EXPECT_EQ(A.norm_inf(), 11.0);
}

TEST(dense_matrix, invert_needs_pivoting)
{
  // Zero in the leading position
  auto A = make_dense({{0.0, 1.0, 2.0}, {1.0, 0.0, 3.0}, {4.0, -3.0, 8.0}});
  rs::dense_matrix_t<int, double> Ainv(3, 3);
  ASSERT_EQ(rs::invert(A, 1e-12, Ainv), 0);
  rs::dense_matrix_t<int, double> product(3, 3);
  A.matrix_multiply(Ainv, product);
  expect_identity(product, 1e-12);
}

TEST(dense_matrix, invert_detects_singular)
{
  auto A = make_dense({{1.0, 2.0}, {2.0, 4.0}});
  rs::dense_matrix_t<int, double> Ainv(2, 2);
  EXPECT_EQ(rs::invert(A, 1e-12, Ainv), -1);
}

TEST(basis_update, product_form_matches_fresh_inverse)
{
  auto B = make_dense({{2.0, 0.0, 1.0}, {1.0, 3.0, 0.0}, {0.0, 1.0, 4.0}});
  rs::basis_update_t<int, double> binv(3);
  ASSERT_EQ(binv.factorize(B, 1e-12), 0);

  // Replace column 1 of B with a_q
  std::vector<double> aq{1.0, 1.0, 2.0};
  std::vector<double> d;
  binv.b_solve(aq, d);
  ASSERT_EQ(binv.update(d, 1), 0);
  EXPECT_EQ(binv.num_updates(), 1);

  auto B_new = B;
  for (int i = 0; i < 3; ++i) {
    B_new(i, 1) = aq[i];
  }
  rs::dense_matrix_t<int, double> expected(3, 3);
  ASSERT_EQ(rs::invert(B_new, 1e-12, expected), 0);
  for (int i = 0; i < 3; ++i) {
    for (int j = 0; j < 3; ++j) {
      EXPECT_NEAR(binv.inverse()(i, j), expected(i, j), 1e-12);
    }
  }

  std::vector<double> row;
  binv.b_inverse_row(2, row);
  for (int j = 0; j < 3; ++j) {
    EXPECT_NEAR(row[j], expected(2, j), 1e-12);
  }
}

TEST(basis_update, rejects_zero_pivot)
{
  rs::basis_update_t<int, double> binv(2);
  std::vector<double> d{1.0, 0.0};
  EXPECT_EQ(binv.update(d, 1), -1);
  EXPECT_EQ(binv.num_updates(), 0);
}

TEST(sparse_matrix, coo_to_csc_and_products)
{
  rs::csc_matrix_t<int, double> A(2, 3, 0);
  std::vector<int> Ai{1, 0, 0, 1};
  std::vector<int> Aj{2, 0, 1, 0};
  std::vector<double> Ax{5.0, 1.0, 2.0, 3.0};
  ASSERT_EQ(rs::coo_to_csc(Ai, Aj, Ax, A), 0);
  EXPECT_EQ(A.check_matrix(), 0);
  EXPECT_EQ(A.col_start, (std::vector<int>{0, 2, 3, 4}));

  std::vector<double> x{1.0, 1.0, 1.0};
  std::vector<double> y(2, 0.0);
  rs::matrix_vector_multiply(A, 1.0, x, 0.0, y);
  EXPECT_EQ(y, (std::vector<double>{3.0, 8.0}));

  std::vector<double> z(3, 0.0);
  rs::matrix_transpose_vector_multiply(A, 1.0, y, 0.0, z);
  EXPECT_EQ(z, (std::vector<double>{27.0, 6.0, 40.0}));

  EXPECT_EQ(A.append_column({0.0, 7.0}), 3);
  std::vector<double> column(2, 0.0);
  EXPECT_EQ(A.load_a_column(3, column), 1);
  EXPECT_EQ(column, (std::vector<double>{0.0, 7.0}));
}

TEST(sparse_matrix, coo_to_csc_rejects_out_of_range)
{
  rs::csc_matrix_t<int, double> A(2, 2, 0);
  EXPECT_EQ((rs::coo_to_csc<int, double>({2}, {0}, {1.0}, A)), -1);
  EXPECT_EQ((rs::coo_to_csc<int, double>({0}, {-1}, {1.0}, A)), -1);
}
