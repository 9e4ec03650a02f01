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

#include <revised_simplex/standard_form.hpp>
#include <revised_simplex/types.hpp>

#include <cstdint>
#include <vector>

namespace warmlp::linear_programming::revised_simplex {

enum class variable_status_t : int8_t {
  BASIC          = 0,
  NONBASIC_LOWER = -1,
};

// Chooses the starting basis of a standardized problem: the slack of every <= row and
// the artificial of every >= or = row. basic_list[i] is the column basic in row i.
// Returns the number of artificial columns in the basis. A return value of zero means
// the basis is feasible and phase 1 can be skipped
template <typename i_t, typename f_t>
i_t slack_basis(const standard_form_t<i_t, f_t>& problem, std::vector<i_t>& basic_list);

}  // namespace warmlp::linear_programming::revised_simplex
