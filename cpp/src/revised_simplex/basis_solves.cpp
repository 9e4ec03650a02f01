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

#include <revised_simplex/vector_math.hpp>

#include <cassert>

namespace warmlp::linear_programming::revised_simplex {

template <typename i_t, typename f_t>
i_t form_b(const csc_matrix_t<i_t, f_t>& A,
           const std::vector<i_t>& basic_list,
           dense_matrix_t<i_t, f_t>& B)
{
  const i_t m = A.m;
  assert(basic_list.size() == m);
  B.resize(m, m);
  for (i_t k = 0; k < m; ++k) {
    const i_t j         = basic_list[k];
    const i_t col_start = A.col_start[j];
    const i_t col_end   = A.col_start[j + 1];
    for (i_t p = col_start; p < col_end; ++p) {
      B(A.i[p], k) = A.x[p];
    }
  }
  return 0;
}

template <typename i_t, typename f_t>
i_t b_multiply(const standard_form_t<i_t, f_t>& problem,
               const std::vector<i_t>& basic_list,
               const std::vector<f_t>& x,
               std::vector<f_t>& y)
{
  const i_t m = problem.num_rows;
  y.assign(m, 0.0);
  for (i_t k = 0; k < m; ++k) {
    const i_t j         = basic_list[k];
    const i_t col_start = problem.A.col_start[j];
    const i_t col_end   = problem.A.col_start[j + 1];
    for (i_t p = col_start; p < col_end; ++p) {
      y[problem.A.i[p]] += problem.A.x[p] * x[k];
    }
  }
  return 0;
}

template <typename i_t, typename f_t>
i_t initialize_basis(const standard_form_t<i_t, f_t>& problem,
                     const simplex_solver_settings_t<i_t, f_t>& settings,
                     const std::vector<i_t>& basic_list,
                     basis_t<i_t, f_t>& basis)
{
  const i_t m = problem.num_rows;
  const i_t n = problem.num_cols;
  assert(basic_list.size() == m);
  basis.basic_list = basic_list;
  basis.vstatus.assign(n, variable_status_t::NONBASIC_LOWER);
  for (i_t k = 0; k < m; ++k) {
    basis.vstatus[basic_list[k]] = variable_status_t::BASIC;
  }
  basis.binv = basis_update_t<i_t, f_t>(m);
  return refactor_basis(problem, settings, basis);
}

template <typename i_t, typename f_t>
i_t refactor_basis(const standard_form_t<i_t, f_t>& problem,
                   const simplex_solver_settings_t<i_t, f_t>& settings,
                   basis_t<i_t, f_t>& basis)
{
  const i_t m = problem.num_rows;
  dense_matrix_t<i_t, f_t> B(m, m);
  form_b(problem.A, basis.basic_list, B);
  if (basis.binv.factorize(B, settings.pivot_tol) == -1) {
    settings.log.debug("Basis matrix is singular\n");
    return -1;
  }
  basis.binv.b_solve(problem.rhs, basis.x_basic);
  return 0;
}

template <typename i_t, typename f_t>
f_t basis_residual(const standard_form_t<i_t, f_t>& problem,
                   const basis_t<i_t, f_t>& basis,
                   std::vector<f_t>& residual)
{
  b_multiply(problem, basis.basic_list, basis.x_basic, residual);
  const i_t m = problem.num_rows;
  for (i_t i = 0; i < m; ++i) {
    residual[i] -= problem.rhs[i];
  }
  return vector_norm_inf<i_t, f_t>(residual);
}

template <typename i_t, typename f_t>
f_t basis_residual(const standard_form_t<i_t, f_t>& problem, const basis_t<i_t, f_t>& basis)
{
  std::vector<f_t> residual;
  return basis_residual(problem, basis, residual);
}

template <typename i_t, typename f_t>
void basic_solution(const standard_form_t<i_t, f_t>& problem,
                    const basis_t<i_t, f_t>& basis,
                    std::vector<f_t>& x)
{
  const i_t m = problem.num_rows;
  x.assign(problem.num_cols, 0.0);
  for (i_t k = 0; k < m; ++k) {
    x[basis.basic_list[k]] = basis.x_basic[k];
  }
}

#ifdef REVISED_SIMPLEX_INSTANTIATE_DOUBLE

template int form_b<int, double>(const csc_matrix_t<int, double>& A,
                                 const std::vector<int>& basic_list,
                                 dense_matrix_t<int, double>& B);

template int b_multiply<int, double>(const standard_form_t<int, double>& problem,
                                     const std::vector<int>& basic_list,
                                     const std::vector<double>& x,
                                     std::vector<double>& y);

template int initialize_basis<int, double>(const standard_form_t<int, double>& problem,
                                           const simplex_solver_settings_t<int, double>& settings,
                                           const std::vector<int>& basic_list,
                                           basis_t<int, double>& basis);

template int refactor_basis<int, double>(const standard_form_t<int, double>& problem,
                                         const simplex_solver_settings_t<int, double>& settings,
                                         basis_t<int, double>& basis);

template double basis_residual<int, double>(const standard_form_t<int, double>& problem,
                                            const basis_t<int, double>& basis);

template double basis_residual<int, double>(const standard_form_t<int, double>& problem,
                                            const basis_t<int, double>& basis,
                                            std::vector<double>& residual);

template void basic_solution<int, double>(const standard_form_t<int, double>& problem,
                                          const basis_t<int, double>& basis,
                                          std::vector<double>& x);

#endif

}  // namespace warmlp::linear_programming::revised_simplex
