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

#include <cstdint>
#include <limits>

namespace warmlp::linear_programming::revised_simplex {

constexpr double inf = std::numeric_limits<double>::infinity();

// Role of a column in the standard (equality) form
enum class column_kind_t : int8_t {
  STRUCTURAL = 0,  // a user variable, its negative part, or a column added by a warm start
  SLACK      = 1,  // +1 in a <= row
  SURPLUS    = 2,  // -1 in a >= row
  ARTIFICIAL = 3   // +1 in a >= or = row, only used to seed phase 1
};

enum class pricing_rule_t : int8_t {
  DANTZIG = 0,  // most negative reduced cost, lowest index on ties
  BLAND   = 1   // first column with a negative reduced cost
};

}  // namespace warmlp::linear_programming::revised_simplex
