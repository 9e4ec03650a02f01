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

#ifndef WARMLP_CONSTANTS_H
#define WARMLP_CONSTANTS_H

#ifdef __cplusplus
#include <limits>
#else
#include <math.h>
#endif

/* @brief LP parameter string constants */
#define WARMLP_TIME_LIMIT              "TimeLimit"
#define WARMLP_ITERATION_LIMIT         "IterationLimit"
#define WARMLP_PRIMAL_TOLERANCE        "PrimalTolerance"
#define WARMLP_DUAL_TOLERANCE          "DualTolerance"
#define WARMLP_PIVOT_TOLERANCE         "PivotTolerance"
#define WARMLP_RESIDUAL_TOLERANCE      "ResidualTolerance"
#define WARMLP_REFACTOR_FREQUENCY      "RefactorFrequency"
#define WARMLP_DEGENERATE_PIVOT_LIMIT  "DegeneratePivotLimit"
#define WARMLP_PRICING_RULE            "PricingRule"
#define WARMLP_LOG_TO_CONSOLE          "LogToConsole"
#define WARMLP_LOG_FILE                "LogFile"

/* @brief LP termination status constants */
#define WARMLP_TERMINATION_STATUS_OPTIMAL    0
#define WARMLP_TERMINATION_STATUS_INFEASIBLE 1
#define WARMLP_TERMINATION_STATUS_UNBOUNDED  2
#define WARMLP_TERMINATION_STATUS_TIME_LIMIT 3
#define WARMLP_TERMINATION_STATUS_UNSET      4

/* @brief The objective sense constants */
#define WARMLP_MINIMIZE -1
#define WARMLP_MAXIMIZE 1

/* @brief The constraint sense constants */
#define WARMLP_LESS_THAN    'L'
#define WARMLP_GREATER_THAN 'G'
#define WARMLP_EQUAL        'E'

/* @brief The infinity constant */
#ifdef __cplusplus
#define WARMLP_INFINITY std::numeric_limits<double>::infinity()
#else
#define WARMLP_INFINITY INFINITY
#endif

#define WARMLP_PRICING_DANTZIG 0
#define WARMLP_PRICING_BLAND   1

#endif  // WARMLP_CONSTANTS_H
