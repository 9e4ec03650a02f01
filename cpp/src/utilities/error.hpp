/*
 * SPDX-FileCopyrightText: Copyright (c) 2021-2025, NVIDIA CORPORATION & AFFILIATES. All rights
 * reserved. SPDX-License-Identifier: Apache-2.0
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

#include <stdarg.h>

#include <cstdio>
#include <stdexcept>
#include <string>

namespace warmlp {

/**
 * @brief Base of every exception thrown by warmlp.
 *
 * This exception should not be thrown directly and is instead thrown by the
 * WARMLP_EXPECTS and WARMLP_FAIL macros, or by warmlp_expects.
 *
 */
struct logic_error : public std::logic_error {
  /**
   * @brief Constructs the exception.
   *
   * @param message Exception message.
   */
  explicit logic_error(char const* const message) : std::logic_error(message) {}
  /**
   * @brief Constructs the exception.
   *
   * @param message Exception message.
   */
  explicit logic_error(std::string const& message) : std::logic_error(message) {}
};

/**
 * @brief Indicates different type of exceptions which warmlp might throw
 */
enum class error_type_t {
  ValidationError,
  MalformedProblem,
  InvalidState,
  DimensionMismatch,
  NumericalStall
};

// Structural input error: dimension disagreement or reference to an undefined row or variable
struct malformed_problem_error : public logic_error {
  explicit malformed_problem_error(std::string const& message) : logic_error(message) {}
};

// Operation invoked on a problem or basis that is not in the required lifecycle state
struct invalid_state_error : public logic_error {
  explicit invalid_state_error(std::string const& message) : logic_error(message) {}
};

// A column or vector supplied by the caller has the wrong length
struct dimension_mismatch_error : public logic_error {
  explicit dimension_mismatch_error(std::string const& message) : logic_error(message) {}
};

// Iteration cap exceeded, or refactorization failed to restore B*xB = b
struct numerical_stall_error : public logic_error {
  explicit numerical_stall_error(std::string const& message) : logic_error(message) {}
};

/**
 * @brief Convert error enum type to string
 *
 * @param error error_type_t type enum value
 */
inline std::string error_to_string(error_type_t error)
{
  switch (error) {
    case error_type_t::ValidationError: return std::string("ValidationError");
    case error_type_t::MalformedProblem: return std::string("MalformedProblemError");
    case error_type_t::InvalidState: return std::string("InvalidStateError");
    case error_type_t::DimensionMismatch: return std::string("DimensionMismatchError");
    case error_type_t::NumericalStall: return std::string("NumericalStallError");
  }

  return std::string("UnAccountedError");
}

/**
 * @brief Throws the exception type matching error_type with a formatted message
 *
 * @param[error_type_t] error enum error type
 * @param[const std::string&] msg already formatted message
 */
[[noreturn]] inline void throw_error(error_type_t error_type, const std::string& msg)
{
  const std::string what =
    "{\"WARMLP_ERROR_TYPE\": \"" + error_to_string(error_type) + "\", \"msg\": \"" + msg + "\"}";
  switch (error_type) {
    case error_type_t::MalformedProblem: throw malformed_problem_error(what);
    case error_type_t::InvalidState: throw invalid_state_error(what);
    case error_type_t::DimensionMismatch: throw dimension_mismatch_error(what);
    case error_type_t::NumericalStall: throw numerical_stall_error(what);
    case error_type_t::ValidationError: break;
  }
  throw warmlp::logic_error(what);
}

/**
 * @brief Function for checking (pre-)conditions that throws an exception when a
 * condition is false
 *
 * @param[bool] cond From expression that evaluates to true or false
 * @param[error_type_t] error enum error type
 * @param[const char *] fmt String format for error message
 * @param variable set of arguments used for fmt
 * @throw warmlp::logic_error (or the matching subtype) if the condition evaluates to false.
 */
inline void warmlp_expects(bool cond, error_type_t error_type, const char* fmt, ...)
{
  if (not cond) {
    va_list args;
    va_start(args, fmt);

    char msg[2048];
    vsnprintf(msg, sizeof(msg), fmt, args);
    va_end(args);

    throw_error(error_type, std::string(msg));
  }
}

#define WARMLP_SET_ERROR_MSG(msg, location_prefix, fmt, ...)     \
  do {                                                           \
    char err_msg[2048]; /* NOLINT */                             \
    std::snprintf(err_msg, sizeof(err_msg), location_prefix);    \
    msg += err_msg;                                              \
    std::snprintf(err_msg, sizeof(err_msg), fmt, ##__VA_ARGS__); \
    msg += err_msg;                                              \
  } while (0)

/**
 * @brief Macro for checking (pre-)conditions that throws an exception when a
 * condition is false
 *
 * @param[in] cond Expression that evaluates to true or false
 * @param[in] fmt String literal description of the reason that cond is expected
 * to be true with optional format tags
 * @throw warmlp::logic_error if the condition evaluates to false.
 */
#define WARMLP_EXPECTS(cond, fmt, ...)                                 \
  do {                                                                 \
    if (!(cond)) {                                                     \
      std::string msg{};                                               \
      WARMLP_SET_ERROR_MSG(msg, "warmlp failure - ", fmt, ##__VA_ARGS__); \
      throw warmlp::logic_error(msg);                                  \
    }                                                                  \
  } while (0)

/**
 * @brief Indicates that an erroneous code path has been taken.
 *
 * @param[in] fmt String literal description of the reason that this code path
 * is erroneous with optional format tags
 * @throw always throws warmlp::logic_error
 */
#define WARMLP_FAIL(fmt, ...)                                          \
  do {                                                                 \
    std::string msg{};                                                 \
    WARMLP_SET_ERROR_MSG(msg, "warmlp failure - ", fmt, ##__VA_ARGS__); \
    throw warmlp::logic_error(msg);                                    \
  } while (0)

}  // namespace warmlp
