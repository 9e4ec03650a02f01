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

#include <revised_simplex/sparse_matrix.hpp>

#include <cmath>

namespace warmlp::linear_programming::revised_simplex {

template <typename i_t, typename f_t>
void csc_matrix_t<i_t, f_t>::reallocate(i_t new_nz)
{
  this->i.resize(new_nz);
  this->x.resize(new_nz);
  this->nz_max = new_nz;
}

template <typename i_t, typename f_t>
i_t csc_matrix_t<i_t, f_t>::load_a_column(i_t j, std::vector<f_t>& Aj) const
{
  assert(Aj.size() == this->m);
  const i_t col_start = this->col_start[j];
  const i_t col_end   = this->col_start[j + 1];
  for (i_t p = col_start; p < col_end; ++p) {
    Aj[this->i[p]] = this->x[p];
  }
  return col_end - col_start;
}

template <typename i_t, typename f_t>
i_t csc_matrix_t<i_t, f_t>::append_column(const std::vector<f_t>& Aj)
{
  assert(Aj.size() == this->m);
  i_t nz = this->col_start[this->n];
  for (i_t k = 0; k < this->m; ++k) {
    if (Aj[k] != 0.0) {
      if (nz >= this->nz_max) { reallocate(2 * this->nz_max + 1); }
      this->i[nz] = k;
      this->x[nz] = Aj[k];
      nz++;
    }
  }
  this->col_start.push_back(nz);
  return this->n++;
}

template <typename i_t, typename f_t>
i_t csc_matrix_t<i_t, f_t>::check_matrix() const
{
  if (this->m < 0 || this->n < 0) { return -1; }
  if (static_cast<i_t>(this->col_start.size()) != this->n + 1) { return -1; }
  if (this->col_start[0] != 0) { return -1; }
  for (i_t j = 0; j < this->n; ++j) {
    if (this->col_start[j + 1] < this->col_start[j]) { return -1; }
  }
  const i_t nz = this->col_start[this->n];
  if (nz > static_cast<i_t>(this->i.size()) || nz > static_cast<i_t>(this->x.size())) {
    return -1;
  }
  for (i_t p = 0; p < nz; ++p) {
    if (this->i[p] < 0 || this->i[p] >= this->m) { return -1; }
    if (!std::isfinite(this->x[p])) { return -1; }
  }
  return 0;
}

template <typename i_t>
void cumulative_sum(std::vector<i_t>& inout, std::vector<i_t>& output)
{
  i_t n = inout.size();
  assert(output.size() == n + 1);
  i_t nz = 0;
  for (i_t i = 0; i < n; ++i) {
    output[i] = nz;
    nz += inout[i];
    inout[i] = output[i];
  }
  output[n] = nz;
}

template <typename i_t, typename f_t>
i_t coo_to_csc(const std::vector<i_t>& Ai,
               const std::vector<i_t>& Aj,
               const std::vector<f_t>& Ax,
               csc_matrix_t<i_t, f_t>& A)
{
  const i_t nz = Ax.size();
  if (Ai.size() != Ax.size() || Aj.size() != Ax.size()) { return -1; }
  for (i_t k = 0; k < nz; ++k) {
    if (Ai[k] < 0 || Ai[k] >= A.m || Aj[k] < 0 || Aj[k] >= A.n) { return -1; }
  }
  A.reallocate(nz);
  A.col_start.assign(A.n + 1, 0);
  std::vector<i_t> workspace(A.n, 0);
  for (i_t k = 0; k < nz; ++k) {
    workspace[Aj[k]]++;
  }
  cumulative_sum(workspace, A.col_start);
  for (i_t k = 0; k < nz; ++k) {
    const i_t p = workspace[Aj[k]]++;
    A.i[p]      = Ai[k];
    A.x[p]      = Ax[k];
  }
  return 0;
}

template <typename i_t, typename f_t>
i_t matrix_vector_multiply(const csc_matrix_t<i_t, f_t>& A,
                           f_t alpha,
                           const std::vector<f_t>& x,
                           f_t beta,
                           std::vector<f_t>& y)
{
  // y <- alpha*A*x + beta*y
  const i_t m = A.m;
  const i_t n = A.n;
  assert(y.size() == m);
  assert(x.size() == n);
  for (i_t i = 0; i < m; ++i) {
    y[i] *= beta;
  }
  for (i_t j = 0; j < n; ++j) {
    const i_t col_start = A.col_start[j];
    const i_t col_end   = A.col_start[j + 1];
    const f_t xj        = x[j];
    if (xj == 0.0) { continue; }
    for (i_t p = col_start; p < col_end; ++p) {
      y[A.i[p]] += alpha * A.x[p] * xj;
    }
  }
  return 0;
}

template <typename i_t, typename f_t>
i_t matrix_transpose_vector_multiply(const csc_matrix_t<i_t, f_t>& A,
                                     f_t alpha,
                                     const std::vector<f_t>& x,
                                     f_t beta,
                                     std::vector<f_t>& y)
{
  // y <- alpha*A'*x + beta*y
  const i_t m = A.m;
  const i_t n = A.n;
  assert(y.size() == n);
  assert(x.size() == m);
  for (i_t j = 0; j < n; ++j) {
    const i_t col_start = A.col_start[j];
    const i_t col_end   = A.col_start[j + 1];
    f_t dot             = 0.0;
    for (i_t p = col_start; p < col_end; ++p) {
      dot += A.x[p] * x[A.i[p]];
    }
    y[j] = alpha * dot + beta * y[j];
  }
  return 0;
}

#ifdef REVISED_SIMPLEX_INSTANTIATE_DOUBLE

template class csc_matrix_t<int, double>;

template void cumulative_sum<int>(std::vector<int>& inout, std::vector<int>& output);

template int coo_to_csc<int, double>(const std::vector<int>& Ai,
                                     const std::vector<int>& Aj,
                                     const std::vector<double>& Ax,
                                     csc_matrix_t<int, double>& A);

template int matrix_vector_multiply<int, double>(const csc_matrix_t<int, double>& A,
                                                 double alpha,
                                                 const std::vector<double>& x,
                                                 double beta,
                                                 std::vector<double>& y);

template int matrix_transpose_vector_multiply<int, double>(const csc_matrix_t<int, double>& A,
                                                           double alpha,
                                                           const std::vector<double>& x,
                                                           double beta,
                                                           std::vector<double>& y);

#endif

}  // namespace warmlp::linear_programming::revised_simplex
