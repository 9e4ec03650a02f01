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

#include <revised_simplex/initial_basis.hpp>

#include <cassert>

namespace warmlp::linear_programming::revised_simplex {

template <typename i_t, typename f_t>
i_t slack_basis(const standard_form_t<i_t, f_t>& problem, std::vector<i_t>& basic_list)
{
  const i_t m = problem.num_rows;
  basic_list.resize(m);
  i_t num_artificial = 0;
  for (i_t i = 0; i < m; ++i) {
    const i_t slack = problem.row_slack[i];
    if (slack != -1 && problem.column_kind[slack] == column_kind_t::SLACK) {
      basic_list[i] = slack;
    } else {
      assert(problem.row_artificial[i] != -1);
      basic_list[i] = problem.row_artificial[i];
      num_artificial++;
    }
  }
  return num_artificial;
}

#ifdef REVISED_SIMPLEX_INSTANTIATE_DOUBLE

template int slack_basis<int, double>(const standard_form_t<int, double>& problem,
                                      std::vector<int>& basic_list);

#endif

}  // namespace warmlp::linear_programming::revised_simplex
