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

#include <vector>

namespace warmlp::linear_programming::revised_simplex {

// Computes || x ||_inf = max_j | x_j |
template <typename i_t, typename f_t>
f_t vector_norm_inf(const std::vector<f_t>& x);

// Computes || x ||_2
template <typename i_t, typename f_t>
f_t vector_norm2(const std::vector<f_t>& x);

// Computes x'*y
template <typename i_t, typename f_t>
f_t dot(const std::vector<f_t>& x, const std::vector<f_t>& y);

// y <- alpha*x + y
template <typename i_t, typename f_t>
void axpy(f_t alpha, const std::vector<f_t>& x, std::vector<f_t>& y);

}  // namespace warmlp::linear_programming::revised_simplex
