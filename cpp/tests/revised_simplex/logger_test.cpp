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

#include <revised_simplex/solve.hpp>

#include <utilities/common_utils.hpp>
#include <utilities/logger.hpp>

#include <gtest/gtest.h>

#include <cstdio>
#include <string>

namespace rs = warmlp::linear_programming::revised_simplex;

TEST(logger, buffers_until_sinks_are_installed)
{
  warmlp::reset_default_logger();
  const size_t buffered = warmlp::buffered_log_size();
  WARMLP_LOG_INFO("buffered message %d", 1);
  EXPECT_EQ(warmlp::buffered_log_size(), buffered + 1);

  const std::string path = warmlp::test::temp_file_path("warmlp_logger_test.log");
  std::remove(path.c_str());
  {
    warmlp::init_logger_t log(path, false);
    EXPECT_EQ(warmlp::buffered_log_size(), 0u);
    WARMLP_LOG_INFO("direct message");
  }
  const std::string contents = warmlp::test::read_file(path);
  EXPECT_NE(contents.find("buffered message 1"), std::string::npos);
  EXPECT_NE(contents.find("direct message"), std::string::npos);
  std::remove(path.c_str());
}

TEST(logger, solve_writes_engine_log_file)
{
  const std::string path = warmlp::test::temp_file_path("warmlp_engine_test.log");
  std::remove(path.c_str());
  {
    rs::simplex_solver_settings_t<int, double> settings;
    settings.set_log_to_console(false);
    settings.set_log_filename(path);
    rs::simplex_state_t<int, double> state;
    ASSERT_EQ(rs::solve_linear_program(warmlp::test::hospital_problem(), settings, state),
              rs::lp_status_t::OPTIMAL);
    settings.close_log_file();
  }
  const std::string contents = warmlp::test::read_file(path);
  EXPECT_NE(contents.find("Standard form: 2 rows, 4 columns"), std::string::npos);
  EXPECT_NE(contents.find("Revised Simplex Phase 2"), std::string::npos);
  EXPECT_NE(contents.find("Optimal"), std::string::npos);
  std::remove(path.c_str());
}

TEST(logger, disabled_log_writes_nothing)
{
  const std::string path = warmlp::test::temp_file_path("warmlp_quiet_test.log");
  std::remove(path.c_str());
  {
    rs::simplex_solver_settings_t<int, double> settings;
    settings.set_log_filename(path);
    settings.set_log(false);
    rs::simplex_state_t<int, double> state;
    ASSERT_EQ(rs::solve_linear_program(warmlp::test::hospital_problem(), settings, state),
              rs::lp_status_t::OPTIMAL);
  }
  EXPECT_EQ(warmlp::test::read_file(path), "");
  std::remove(path.c_str());
}
