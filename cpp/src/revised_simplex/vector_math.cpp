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

#include <revised_simplex/vector_math.hpp>

#include <algorithm>
#include <cassert>
#include <cmath>

namespace warmlp::linear_programming::revised_simplex {

template <typename i_t, typename f_t>
f_t vector_norm_inf(const std::vector<f_t>& x)
{
  const i_t n = x.size();
  f_t a       = 0.0;
  for (i_t j = 0; j < n; ++j) {
    a = std::max(a, std::abs(x[j]));
  }
  return a;
}

template <typename i_t, typename f_t>
f_t vector_norm2(const std::vector<f_t>& x)
{
  return std::sqrt(dot<i_t, f_t>(x, x));
}

template <typename i_t, typename f_t>
f_t dot(const std::vector<f_t>& x, const std::vector<f_t>& y)
{
  assert(x.size() == y.size());
  const i_t n = x.size();
  f_t sum     = 0.0;
  for (i_t j = 0; j < n; ++j) {
    sum += x[j] * y[j];
  }
  return sum;
}

template <typename i_t, typename f_t>
void axpy(f_t alpha, const std::vector<f_t>& x, std::vector<f_t>& y)
{
  assert(x.size() == y.size());
  const i_t n = x.size();
  for (i_t j = 0; j < n; ++j) {
    y[j] += alpha * x[j];
  }
}

#ifdef REVISED_SIMPLEX_INSTANTIATE_DOUBLE

template double vector_norm_inf<int, double>(const std::vector<double>& x);

template double vector_norm2<int, double>(const std::vector<double>& x);

template double dot<int, double>(const std::vector<double>& x, const std::vector<double>& y);

template void axpy<int, double>(double alpha,
                                const std::vector<double>& x,
                                std::vector<double>& y);

#endif

}  // namespace warmlp::linear_programming::revised_simplex
