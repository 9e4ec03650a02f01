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

#include <revised_simplex/dense_matrix.hpp>

#include <algorithm>
#include <cmath>
#include <utility>

namespace warmlp::linear_programming::revised_simplex {

template <typename i_t, typename f_t>
void dense_matrix_t<i_t, f_t>::set_identity()
{
  assert(m == n);
  std::fill(values.begin(), values.end(), 0.0);
  for (i_t k = 0; k < m; ++k) {
    (*this)(k, k) = 1.0;
  }
}

template <typename i_t, typename f_t>
void dense_matrix_t<i_t, f_t>::matrix_vector_multiply(f_t alpha,
                                                      const std::vector<f_t>& x,
                                                      f_t beta,
                                                      std::vector<f_t>& y) const
{
  assert(x.size() == n);
  assert(y.size() == m);
  for (i_t i = 0; i < m; ++i) {
    y[i] *= beta;
  }
  for (i_t j = 0; j < n; ++j) {
    const f_t xj = x[j];
    if (xj == 0.0) { continue; }
    for (i_t i = 0; i < m; ++i) {
      y[i] += alpha * (*this)(i, j) * xj;
    }
  }
}

template <typename i_t, typename f_t>
void dense_matrix_t<i_t, f_t>::transpose_multiply(f_t alpha,
                                                  const std::vector<f_t>& x,
                                                  f_t beta,
                                                  std::vector<f_t>& y) const
{
  assert(x.size() == m);
  assert(y.size() == n);
  for (i_t j = 0; j < n; ++j) {
    f_t sum = 0.0;
    for (i_t i = 0; i < m; ++i) {
      sum += (*this)(i, j) * x[i];
    }
    y[j] = alpha * sum + beta * y[j];
  }
}

template <typename i_t, typename f_t>
void dense_matrix_t<i_t, f_t>::matrix_multiply(const dense_matrix_t<i_t, f_t>& B,
                                               dense_matrix_t<i_t, f_t>& C) const
{
  assert(n == B.m);
  C.resize(m, B.n);
  for (i_t j = 0; j < B.n; ++j) {
    for (i_t k = 0; k < n; ++k) {
      const f_t bkj = B(k, j);
      if (bkj == 0.0) { continue; }
      for (i_t i = 0; i < m; ++i) {
        C(i, j) += (*this)(i, k) * bkj;
      }
    }
  }
}

template <typename i_t, typename f_t>
f_t dense_matrix_t<i_t, f_t>::norm_inf() const
{
  f_t norm = 0.0;
  for (i_t i = 0; i < m; ++i) {
    f_t row_sum = 0.0;
    for (i_t j = 0; j < n; ++j) {
      row_sum += std::abs((*this)(i, j));
    }
    norm = std::max(norm, row_sum);
  }
  return norm;
}

template <typename i_t, typename f_t>
i_t invert(const dense_matrix_t<i_t, f_t>& A, f_t pivot_tol, dense_matrix_t<i_t, f_t>& Ainv)
{
  assert(A.m == A.n);
  const i_t m = A.m;
  dense_matrix_t<i_t, f_t> W = A;
  Ainv.resize(m, m);
  Ainv.set_identity();

  for (i_t k = 0; k < m; ++k) {
    // Partial pivoting: largest magnitude in column k on or below the diagonal
    i_t pivot_row = k;
    f_t max_abs   = std::abs(W(k, k));
    for (i_t i = k + 1; i < m; ++i) {
      const f_t val = std::abs(W(i, k));
      if (val > max_abs) {
        max_abs   = val;
        pivot_row = i;
      }
    }
    if (max_abs < pivot_tol) { return -1; }

    if (pivot_row != k) {
      for (i_t j = 0; j < m; ++j) {
        std::swap(W(k, j), W(pivot_row, j));
        std::swap(Ainv(k, j), Ainv(pivot_row, j));
      }
    }

    const f_t pivot = W(k, k);
    for (i_t j = 0; j < m; ++j) {
      W(k, j) /= pivot;
      Ainv(k, j) /= pivot;
    }

    for (i_t i = 0; i < m; ++i) {
      if (i == k) { continue; }
      const f_t factor = W(i, k);
      if (factor == 0.0) { continue; }
      for (i_t j = 0; j < m; ++j) {
        W(i, j) -= factor * W(k, j);
        Ainv(i, j) -= factor * Ainv(k, j);
      }
    }
  }
  return 0;
}

#ifdef REVISED_SIMPLEX_INSTANTIATE_DOUBLE

template class dense_matrix_t<int, double>;

template int invert<int, double>(const dense_matrix_t<int, double>& A,
                                 double pivot_tol,
                                 dense_matrix_t<int, double>& Ainv);

#endif

}  // namespace warmlp::linear_programming::revised_simplex
