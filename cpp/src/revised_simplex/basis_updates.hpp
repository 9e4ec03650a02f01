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

#include <revised_simplex/dense_matrix.hpp>
#include <revised_simplex/types.hpp>

#include <vector>

namespace warmlp::linear_programming::revised_simplex {

// Maintains an explicit dense inverse of the basis matrix B. After a pivot the inverse is
// updated in product form, B_new^{-1} = E * B^{-1}, where E is the elementary matrix that
// maps the entering column d = B^{-1} * a_q onto the unit vector e_r. Each update costs
// O(m^2), a factorization costs O(m^3)
template <typename i_t, typename f_t>
class basis_update_t {
 public:
  explicit basis_update_t(i_t m) : Binv_(m, m), num_updates_(0) { Binv_.set_identity(); }

  // Replaces the stored inverse with B^{-1}. Returns -1 if B is singular
  i_t factorize(const dense_matrix_t<i_t, f_t>& B, f_t pivot_tol);

  // Solves for x such that B*x = b, where B is the basis matrix
  i_t b_solve(const std::vector<f_t>& rhs, std::vector<f_t>& solution) const;

  // Solves for y such that B'*y = c, where B is the basis matrix
  i_t b_transpose_solve(const std::vector<f_t>& rhs, std::vector<f_t>& solution) const;

  // row <- e_r' * B^{-1}
  void b_inverse_row(i_t r, std::vector<f_t>& row) const;

  // Replace the column B(:, leaving_row) with the column whose solve is d = B^{-1} * a_q.
  // Returns -1 if d(leaving_row) is zero
  i_t update(const std::vector<f_t>& d, i_t leaving_row);

  i_t num_updates() const { return num_updates_; }

  i_t dimension() const { return Binv_.m; }

  const dense_matrix_t<i_t, f_t>& inverse() const { return Binv_; }

 private:
  dense_matrix_t<i_t, f_t> Binv_;  // Explicit inverse of the basis matrix
  i_t num_updates_;                // Number of product-form updates since the last factorization
};

}  // namespace warmlp::linear_programming::revised_simplex
