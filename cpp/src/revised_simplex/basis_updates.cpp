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

#include <cassert>
#include <utility>

namespace warmlp::linear_programming::revised_simplex {

template <typename i_t, typename f_t>
i_t basis_update_t<i_t, f_t>::factorize(const dense_matrix_t<i_t, f_t>& B, f_t pivot_tol)
{
  dense_matrix_t<i_t, f_t> Binv(B.m, B.m);
  if (invert(B, pivot_tol, Binv) == -1) { return -1; }
  Binv_        = std::move(Binv);
  num_updates_ = 0;
  return 0;
}

template <typename i_t, typename f_t>
i_t basis_update_t<i_t, f_t>::b_solve(const std::vector<f_t>& rhs,
                                      std::vector<f_t>& solution) const
{
  const i_t m = Binv_.m;
  assert(rhs.size() == m);
  solution.resize(m);
  // x = B^{-1} * b
  Binv_.matrix_vector_multiply(1.0, rhs, 0.0, solution);
  return 0;
}

template <typename i_t, typename f_t>
i_t basis_update_t<i_t, f_t>::b_transpose_solve(const std::vector<f_t>& rhs,
                                                std::vector<f_t>& solution) const
{
  const i_t m = Binv_.m;
  assert(rhs.size() == m);
  solution.resize(m);
  // B'*y = c  ->  y' = c' * B^{-1}
  Binv_.transpose_multiply(1.0, rhs, 0.0, solution);
  return 0;
}

template <typename i_t, typename f_t>
void basis_update_t<i_t, f_t>::b_inverse_row(i_t r, std::vector<f_t>& row) const
{
  const i_t m = Binv_.m;
  row.resize(m);
  for (i_t j = 0; j < m; ++j) {
    row[j] = Binv_(r, j);
  }
}

template <typename i_t, typename f_t>
i_t basis_update_t<i_t, f_t>::update(const std::vector<f_t>& d, i_t leaving_row)
{
  const i_t m = Binv_.m;
  assert(d.size() == m);
  const f_t pivot = d[leaving_row];
  if (pivot == 0.0) { return -1; }

  // Row r of B^{-1} is divided by d_r, then d_i times the new row r is
  // subtracted from every other row i
  for (i_t j = 0; j < m; ++j) {
    f_t& brj = Binv_(leaving_row, j);
    if (brj == 0.0) { continue; }
    brj /= pivot;
    for (i_t i = 0; i < m; ++i) {
      if (i == leaving_row || d[i] == 0.0) { continue; }
      Binv_(i, j) -= d[i] * brj;
    }
  }
  num_updates_++;
  return 0;
}

#ifdef REVISED_SIMPLEX_INSTANTIATE_DOUBLE
template class basis_update_t<int, double>;
#endif

}  // namespace warmlp::linear_programming::revised_simplex
