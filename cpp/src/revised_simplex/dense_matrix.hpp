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

#include <cassert>
#include <vector>

namespace warmlp::linear_programming::revised_simplex {

// A dense matrix stored in column major order
template <typename i_t, typename f_t>
class dense_matrix_t {
 public:
  dense_matrix_t(i_t rows, i_t cols) : m(rows), n(cols), values(rows * cols, 0.0) {}

  dense_matrix_t(i_t rows, i_t cols, f_t value) : m(rows), n(cols), values(rows * cols, value) {}

  void resize(i_t rows, i_t cols)
  {
    m = rows;
    n = cols;
    values.assign(rows * cols, 0.0);
  }

  f_t& operator()(i_t row, i_t col) { return values[col * m + row]; }

  f_t operator()(i_t row, i_t col) const { return values[col * m + row]; }

  // Sets this matrix to the m x m identity
  void set_identity();

  // y <- alpha * A * x + beta * y
  void matrix_vector_multiply(f_t alpha, const std::vector<f_t>& x, f_t beta, std::vector<f_t>& y)
    const;

  // y <- alpha * A' * x + beta * y
  void transpose_multiply(f_t alpha, const std::vector<f_t>& x, f_t beta, std::vector<f_t>& y)
    const;

  // C <- A * B
  void matrix_multiply(const dense_matrix_t<i_t, f_t>& B, dense_matrix_t<i_t, f_t>& C) const;

  // Returns || A ||_inf, the maximum absolute row sum
  f_t norm_inf() const;

  i_t m;
  i_t n;
  std::vector<f_t> values;
};

// Computes Ainv = A^{-1} with Gauss-Jordan elimination and partial pivoting.
// Returns -1 if a pivot smaller than pivot_tol in magnitude is encountered (A is singular)
template <typename i_t, typename f_t>
i_t invert(const dense_matrix_t<i_t, f_t>& A, f_t pivot_tol, dense_matrix_t<i_t, f_t>& Ainv);

}  // namespace warmlp::linear_programming::revised_simplex
