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

#include <warmlp/linear_programming/solver_settings.hpp>

#include <revised_simplex/simplex_solver_settings.hpp>

#include <utilities/error.hpp>

#include <algorithm>
#include <cctype>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <type_traits>

namespace warmlp::linear_programming {

namespace {

bool string_to_bool(const std::string& name, const std::string& value)
{
  std::string lower = value;
  std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
    return std::tolower(c);
  });
  if (lower == "true" || lower == "1") { return true; }
  if (lower == "false" || lower == "0") { return false; }
  throw_error(error_type_t::ValidationError,
              "Parameter " + name + " expects a boolean, got '" + value + "'");
}

template <typename T>
T string_to_number(const std::string& name, const std::string& value)
{
  size_t parsed = 0;
  T result;
  try {
    if constexpr (std::is_floating_point_v<T>) {
      result = static_cast<T>(std::stod(value, &parsed));
    } else {
      const long long wide = std::stoll(value, &parsed);
      warmlp_expects(wide >= static_cast<long long>(std::numeric_limits<T>::min()) &&
                       wide <= static_cast<long long>(std::numeric_limits<T>::max()),
                     error_type_t::ValidationError,
                     "Parameter %s value '%s' does not fit in an integer",
                     name.c_str(),
                     value.c_str());
      result = static_cast<T>(wide);
    }
  } catch (const std::logic_error&) {
    throw_error(error_type_t::ValidationError,
                "Parameter " + name + " could not parse '" + value + "'");
  }
  warmlp_expects(parsed == value.size(),
                 error_type_t::ValidationError,
                 "Parameter %s has trailing characters in '%s'",
                 name.c_str(),
                 value.c_str());
  return result;
}

template <typename T>
std::string number_to_string(T value)
{
  std::ostringstream oss;
  oss << value;
  return oss.str();
}

}  // namespace

template <typename i_t, typename f_t>
void solver_settings_t<i_t, f_t>::set_parameter_from_string(const std::string& name,
                                                           const std::string& value)
{
  for (auto& param : float_parameters) {
    if (param.param_name == name) {
      set_parameter<f_t>(name, string_to_number<f_t>(name, value));
      return;
    }
  }
  for (auto& param : int_parameters) {
    if (param.param_name == name) {
      set_parameter<i_t>(name, string_to_number<i_t>(name, value));
      return;
    }
  }
  for (auto& param : bool_parameters) {
    if (param.param_name == name) {
      *param.value_ptr = string_to_bool(name, value);
      return;
    }
  }
  for (auto& param : string_parameters) {
    if (param.param_name == name) {
      *param.value_ptr = value;
      return;
    }
  }
  throw_error(error_type_t::ValidationError, "Parameter " + name + " not found");
}

template <typename i_t, typename f_t>
template <typename T>
void solver_settings_t<i_t, f_t>::set_parameter(const std::string& name, T value)
{
  if constexpr (std::is_same_v<T, bool>) {
    for (auto& param : bool_parameters) {
      if (param.param_name == name) {
        *param.value_ptr = value;
        return;
      }
    }
  } else if constexpr (std::is_same_v<T, std::string>) {
    for (auto& param : string_parameters) {
      if (param.param_name == name) {
        *param.value_ptr = value;
        return;
      }
    }
  } else if constexpr (std::is_same_v<T, f_t>) {
    for (auto& param : float_parameters) {
      if (param.param_name == name) {
        warmlp_expects(value >= param.min_value && value <= param.max_value,
                       error_type_t::ValidationError,
                       "Parameter %s: value %g out of range [%g, %g]",
                       name.c_str(),
                       static_cast<double>(value),
                       static_cast<double>(param.min_value),
                       static_cast<double>(param.max_value));
        *param.value_ptr = value;
        return;
      }
    }
  } else if constexpr (std::is_same_v<T, i_t>) {
    for (auto& param : int_parameters) {
      if (param.param_name == name) {
        warmlp_expects(value >= param.min_value && value <= param.max_value,
                       error_type_t::ValidationError,
                       "Parameter %s: value %lld out of range [%lld, %lld]",
                       name.c_str(),
                       static_cast<long long>(value),
                       static_cast<long long>(param.min_value),
                       static_cast<long long>(param.max_value));
        *param.value_ptr = value;
        return;
      }
    }
  }
  throw_error(error_type_t::ValidationError, "Parameter " + name + " not found for this type");
}

template <typename i_t, typename f_t>
template <typename T>
T solver_settings_t<i_t, f_t>::get_parameter(const std::string& name) const
{
  if constexpr (std::is_same_v<T, bool>) {
    for (const auto& param : bool_parameters) {
      if (param.param_name == name) { return *param.value_ptr; }
    }
  } else if constexpr (std::is_same_v<T, std::string>) {
    for (const auto& param : string_parameters) {
      if (param.param_name == name) { return *param.value_ptr; }
    }
  } else if constexpr (std::is_same_v<T, f_t>) {
    for (const auto& param : float_parameters) {
      if (param.param_name == name) { return *param.value_ptr; }
    }
  } else if constexpr (std::is_same_v<T, i_t>) {
    for (const auto& param : int_parameters) {
      if (param.param_name == name) { return *param.value_ptr; }
    }
  }
  throw_error(error_type_t::ValidationError, "Parameter " + name + " not found for this type");
}

template <typename i_t, typename f_t>
std::string solver_settings_t<i_t, f_t>::get_parameter_as_string(const std::string& name) const
{
  for (const auto& param : float_parameters) {
    if (param.param_name == name) { return number_to_string(*param.value_ptr); }
  }
  for (const auto& param : int_parameters) {
    if (param.param_name == name) { return number_to_string(*param.value_ptr); }
  }
  for (const auto& param : bool_parameters) {
    if (param.param_name == name) { return *param.value_ptr ? "true" : "false"; }
  }
  for (const auto& param : string_parameters) {
    if (param.param_name == name) { return *param.value_ptr; }
  }
  throw_error(error_type_t::ValidationError, "Parameter " + name + " not found");
}

template <typename i_t, typename f_t>
void solver_settings_t<i_t, f_t>::set_time_limit(f_t time_limit)
{
  set_parameter<f_t>(WARMLP_TIME_LIMIT, time_limit);
}

template <typename i_t, typename f_t>
void solver_settings_t<i_t, f_t>::set_iteration_limit(i_t iteration_limit)
{
  set_parameter<i_t>(WARMLP_ITERATION_LIMIT, iteration_limit);
}

template <typename i_t, typename f_t>
void solver_settings_t<i_t, f_t>::set_log_file(std::string log_file)
{
  log_file_ = log_file;
}

template <typename i_t, typename f_t>
void solver_settings_t<i_t, f_t>::set_log_to_console(bool log_to_console)
{
  log_to_console_ = log_to_console;
}

template <typename i_t, typename f_t>
f_t solver_settings_t<i_t, f_t>::get_time_limit() const noexcept
{
  return time_limit_;
}

template <typename i_t, typename f_t>
i_t solver_settings_t<i_t, f_t>::get_iteration_limit() const noexcept
{
  return iteration_limit_;
}

template <typename i_t, typename f_t>
std::string solver_settings_t<i_t, f_t>::get_log_file() const noexcept
{
  return log_file_;
}

template <typename i_t, typename f_t>
bool solver_settings_t<i_t, f_t>::get_log_to_console() const noexcept
{
  return log_to_console_;
}

template <typename i_t, typename f_t>
void solver_settings_t<i_t, f_t>::to_simplex_settings(
  revised_simplex::simplex_solver_settings_t<i_t, f_t>& settings) const
{
  settings.time_limit             = time_limit_;
  settings.iteration_limit        = iteration_limit_;
  settings.primal_tol             = primal_tolerance_;
  settings.dual_tol               = dual_tolerance_;
  settings.pivot_tol              = pivot_tolerance_;
  settings.residual_tol           = residual_tolerance_;
  settings.refactor_frequency     = refactor_frequency_;
  settings.degenerate_pivot_limit = degenerate_pivot_limit_;
  settings.pricing                = pricing_rule_ == WARMLP_PRICING_BLAND
                                      ? revised_simplex::pricing_rule_t::BLAND
                                      : revised_simplex::pricing_rule_t::DANTZIG;
  settings.set_log_to_console(log_to_console_);
  if (!log_file_.empty()) {
    settings.set_log_filename(log_file_);
  } else {
    settings.close_log_file();
  }
}

#ifdef REVISED_SIMPLEX_INSTANTIATE_DOUBLE
template class solver_settings_t<int, double>;

template void solver_settings_t<int, double>::set_parameter(const std::string& name,
                                                            double value);
template void solver_settings_t<int, double>::set_parameter(const std::string& name, int value);
template void solver_settings_t<int, double>::set_parameter(const std::string& name, bool value);
template void solver_settings_t<int, double>::set_parameter(const std::string& name,
                                                            std::string value);

template double solver_settings_t<int, double>::get_parameter(const std::string& name) const;
template int solver_settings_t<int, double>::get_parameter(const std::string& name) const;
template bool solver_settings_t<int, double>::get_parameter(const std::string& name) const;
template std::string solver_settings_t<int, double>::get_parameter(const std::string& name) const;
#endif

}  // namespace warmlp::linear_programming
