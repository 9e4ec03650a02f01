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
#include <type_traits>
#include <vector>

namespace warmlp::linear_programming::revised_simplex {

// A sparse matrix stored in compressed sparse column format
template <typename i_t, typename f_t>
class csc_matrix_t {
 public:
  csc_matrix_t(i_t rows, i_t cols, i_t nz)
    : nz_max(nz), m(rows), n(cols), col_start(cols + 1, 0), i(nz), x(nz)
  {
  }

  // Adjust to i and x vectors for a new number of nonzeros
  void reallocate(i_t new_nz);

  // Aj <- A(:, j), where Aj is a dense vector initially all zero
  i_t load_a_column(i_t j, std::vector<f_t>& Aj) const;

  // Appends the nonzeros of the dense vector Aj as a new last column. Returns the column index
  i_t append_column(const std::vector<f_t>& Aj);

  // Returns -1 if column pointers or row indices are inconsistent with the dimensions
  i_t check_matrix() const;

  i_t nz_max;                  // maximum number of entries
  i_t m;                       // number of rows
  i_t n;                       // number of columns
  std::vector<i_t> col_start;  // column pointers (size n + 1)
  std::vector<i_t> i;          // row indices, size nz_max
  std::vector<f_t> x;          // numerical values, size nz_max

  static_assert(std::is_signed_v<i_t>);  // Require signed integers
};

template <typename i_t>
void cumulative_sum(std::vector<i_t>& inout, std::vector<i_t>& output);

// Builds A from triplets (Ai[k], Aj[k], Ax[k]). A.m and A.n must be set by the caller.
// Returns -1 if a triplet lies outside the m x n shape
template <typename i_t, typename f_t>
i_t coo_to_csc(const std::vector<i_t>& Ai,
               const std::vector<i_t>& Aj,
               const std::vector<f_t>& Ax,
               csc_matrix_t<i_t, f_t>& A);

// y <- alpha*A*x + beta*y
template <typename i_t, typename f_t>
i_t matrix_vector_multiply(const csc_matrix_t<i_t, f_t>& A,
                           f_t alpha,
                           const std::vector<f_t>& x,
                           f_t beta,
                           std::vector<f_t>& y);

// y <- alpha*A'*x + beta*y
template <typename i_t, typename f_t>
i_t matrix_transpose_vector_multiply(const csc_matrix_t<i_t, f_t>& A,
                                     f_t alpha,
                                     const std::vector<f_t>& x,
                                     f_t beta,
                                     std::vector<f_t>& y);

}  // namespace warmlp::linear_programming::revised_simplex
