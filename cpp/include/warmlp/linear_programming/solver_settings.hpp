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

#include <warmlp/linear_programming/constants.h>

#include <limits>
#include <string>
#include <string_view>
#include <vector>

namespace warmlp::linear_programming {

namespace revised_simplex {
template <typename i_t, typename f_t>
struct simplex_solver_settings_t;
}  // namespace revised_simplex

template <typename T>
struct parameter_info_t {
  parameter_info_t(std::string_view param_name, T* value, T min, T max, T def)
    : param_name(param_name), value_ptr(value), min_value(min), max_value(max), default_value(def)
  {
  }
  std::string param_name;
  T* value_ptr;
  T min_value;
  T max_value;
  T default_value;
};

template <>
struct parameter_info_t<bool> {
  parameter_info_t(std::string_view name, bool* value, bool def)
    : param_name(name), value_ptr(value), default_value(def)
  {
  }
  std::string param_name;
  bool* value_ptr;
  bool default_value;
};

template <>
struct parameter_info_t<std::string> {
  parameter_info_t(std::string_view name, std::string* value, std::string def)
    : param_name(name), value_ptr(value), default_value(def)
  {
  }
  std::string param_name;
  std::string* value_ptr;
  std::string default_value;
};

template <typename i_t, typename f_t>
class solver_settings_t {
 public:
  solver_settings_t()
  {
    // clang-format off
    // Float parameters
    float_parameters = {
      {WARMLP_TIME_LIMIT, &time_limit_, 0, std::numeric_limits<f_t>::infinity(), std::numeric_limits<f_t>::infinity()},
      {WARMLP_PRIMAL_TOLERANCE, &primal_tolerance_, 1e-14, 1e-1, 1e-9},
      {WARMLP_DUAL_TOLERANCE, &dual_tolerance_, 1e-14, 1e-1, 1e-9},
      {WARMLP_PIVOT_TOLERANCE, &pivot_tolerance_, 1e-14, 1e-1, 1e-9},
      {WARMLP_RESIDUAL_TOLERANCE, &residual_tolerance_, 1e-14, 1e-1, 1e-7}
    };

    // Int parameters
    int_parameters = {
      {WARMLP_ITERATION_LIMIT, &iteration_limit_, 1, std::numeric_limits<i_t>::max(), 100000},
      {WARMLP_REFACTOR_FREQUENCY, &refactor_frequency_, 1, std::numeric_limits<i_t>::max(), 50},
      {WARMLP_DEGENERATE_PIVOT_LIMIT, &degenerate_pivot_limit_, 1, std::numeric_limits<i_t>::max(), 50},
      {WARMLP_PRICING_RULE, &pricing_rule_, WARMLP_PRICING_DANTZIG, WARMLP_PRICING_BLAND, WARMLP_PRICING_DANTZIG}
    };

    // Bool parameters
    bool_parameters = {
      {WARMLP_LOG_TO_CONSOLE, &log_to_console_, true}
    };

    // String parameters
    string_parameters = {
      {WARMLP_LOG_FILE, &log_file_, ""}
    };
    // clang-format on
    for (auto& param : float_parameters) {
      *param.value_ptr = param.default_value;
    }
    for (auto& param : int_parameters) {
      *param.value_ptr = param.default_value;
    }
    for (auto& param : bool_parameters) {
      *param.value_ptr = param.default_value;
    }
    for (auto& param : string_parameters) {
      *param.value_ptr = param.default_value;
    }
  }

  // Delete copy constructor
  solver_settings_t(const solver_settings_t& settings) = delete;
  // Delete assignment operator
  solver_settings_t& operator=(const solver_settings_t& settings) = delete;
  // Delete move constructor
  solver_settings_t(solver_settings_t&& settings) = delete;
  // Delete move assignment operator
  solver_settings_t& operator=(solver_settings_t&& settings) = delete;

  // Parses value according to the type of the named parameter. Throws a ValidationError
  // for an unknown name, an unparsable value or a value outside the parameter's range
  void set_parameter_from_string(const std::string& name, const std::string& value);

  template <typename T>
  void set_parameter(const std::string& name, T value);

  template <typename T>
  T get_parameter(const std::string& name) const;

  std::string get_parameter_as_string(const std::string& name) const;

  void set_time_limit(f_t time_limit);
  void set_iteration_limit(i_t iteration_limit);
  void set_log_file(std::string log_file);
  void set_log_to_console(bool log_to_console);

  f_t get_time_limit() const noexcept;
  i_t get_iteration_limit() const noexcept;
  std::string get_log_file() const noexcept;
  bool get_log_to_console() const noexcept;

  // Copies every parameter into the settings used by the engine. A non-empty LogFile is
  // opened for the engine's log
  void to_simplex_settings(revised_simplex::simplex_solver_settings_t<i_t, f_t>& settings) const;

 private:
  f_t time_limit_;
  f_t primal_tolerance_;
  f_t dual_tolerance_;
  f_t pivot_tolerance_;
  f_t residual_tolerance_;
  i_t iteration_limit_;
  i_t refactor_frequency_;
  i_t degenerate_pivot_limit_;
  i_t pricing_rule_;
  bool log_to_console_;
  std::string log_file_;

  std::vector<parameter_info_t<f_t>> float_parameters;
  std::vector<parameter_info_t<i_t>> int_parameters;
  std::vector<parameter_info_t<bool>> bool_parameters;
  std::vector<parameter_info_t<std::string>> string_parameters;
};

}  // namespace warmlp::linear_programming
