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

#include <utilities/logger.hpp>

#include <cstdarg>
#include <cstdio>
#include <string>

namespace warmlp::linear_programming::revised_simplex {

class logger_t {
 public:
  logger_t()
    : log(true),
      log_to_console(true),
      log_to_file(false),
      log_filename("revised_simplex.log"),
      log_file(nullptr)
  {
  }

  ~logger_t() { close_log_file(); }

  logger_t(const logger_t& other)
    : log(other.log),
      log_to_console(other.log_to_console),
      log_to_file(false),
      log_filename(other.log_filename),
      log_file(nullptr)
  {
  }

  logger_t& operator=(const logger_t& other)
  {
    if (this != &other) {
      close_log_file();
      log            = other.log;
      log_to_console = other.log_to_console;
      log_filename   = other.log_filename;
    }
    return *this;
  }

  void enable_log_to_file(const char* mode = "w")
  {
    if (log_file != nullptr) { std::fclose(log_file); }
    log_file    = std::fopen(log_filename.c_str(), mode);
    log_to_file = log_file != nullptr;
    if (!log_to_file) { WARMLP_LOG_WARN("Unable to open log file %s", log_filename.c_str()); }
  }

  void set_log_file(const std::string& filename, const char* mode = "w")
  {
    log_filename = filename;
    enable_log_to_file(mode);
  }

  void close_log_file()
  {
    if (log_file != nullptr) {
      std::fclose(log_file);
      log_file = nullptr;
    }
    log_to_file = false;
  }

  void printf(const char* fmt, ...)
  {
    if (!log) { return; }
    char buffer[1024];
    va_list args;
    va_start(args, fmt);
    std::vsnprintf(buffer, sizeof(buffer), fmt, args);
    va_end(args);
    if (log_to_console) { WARMLP_LOG_INFO("%s", strip_newline(buffer).c_str()); }
    if (log_to_file) {
      std::fputs(buffer, log_file);
      std::fflush(log_file);
    }
  }

  void debug(const char* fmt, ...)
  {
    if (!log) { return; }
    char buffer[1024];
    va_list args;
    va_start(args, fmt);
    std::vsnprintf(buffer, sizeof(buffer), fmt, args);
    va_end(args);
    WARMLP_LOG_DEBUG("%s", strip_newline(buffer).c_str());
  }

  bool log;
  bool log_to_console;
  bool log_to_file;
  std::string log_filename;
  std::FILE* log_file;

 private:
  static std::string strip_newline(const char* msg)
  {
    std::string str(msg);
    if (!str.empty() && str.back() == '\n') { str.pop_back(); }
    return str;
  }
};

}  // namespace warmlp::linear_programming::revised_simplex
