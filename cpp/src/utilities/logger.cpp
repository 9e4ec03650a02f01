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

#include <utilities/logger.hpp>

namespace warmlp {

namespace {

// Messages logged before init_logger_t installs real sinks
class pending_log_t {
 public:
  void push(rapids_logger::level_enum level, const char* text)
  {
    if (text == nullptr) { return; }
    std::string line(text);
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
      line.pop_back();
    }
    std::lock_guard<std::mutex> guard(lock_);
    lines_.emplace_back(level, std::move(line));
  }

  size_t count() const
  {
    std::lock_guard<std::mutex> guard(lock_);
    return lines_.size();
  }

  std::vector<std::pair<rapids_logger::level_enum, std::string>> take()
  {
    std::lock_guard<std::mutex> guard(lock_);
    std::vector<std::pair<rapids_logger::level_enum, std::string>> taken;
    taken.swap(lines_);
    return taken;
  }

 private:
  std::vector<std::pair<rapids_logger::level_enum, std::string>> lines_;
  mutable std::mutex lock_;
};

pending_log_t& pending_log()
{
  static pending_log_t pending;
  return pending;
}

void pending_log_callback(int level, const char* text)
{
  pending_log().push(static_cast<rapids_logger::level_enum>(level), text);
}

rapids_logger::sink_ptr pending_sink()
{
  return std::make_shared<rapids_logger::callback_sink_mt>(pending_log_callback);
}

/**
 * @brief Level the engine logs at, chosen by WARMLP_LOG_ACTIVE_LEVEL at build time.
 */
rapids_logger::level_enum compiled_level()
{
#if WARMLP_LOG_ACTIVE_LEVEL == RAPIDS_LOGGER_LOG_LEVEL_TRACE
  return rapids_logger::level_enum::trace;
#elif WARMLP_LOG_ACTIVE_LEVEL == RAPIDS_LOGGER_LOG_LEVEL_DEBUG
  return rapids_logger::level_enum::debug;
#elif WARMLP_LOG_ACTIVE_LEVEL == RAPIDS_LOGGER_LOG_LEVEL_WARN
  return rapids_logger::level_enum::warn;
#elif WARMLP_LOG_ACTIVE_LEVEL == RAPIDS_LOGGER_LOG_LEVEL_ERROR
  return rapids_logger::level_enum::error;
#elif WARMLP_LOG_ACTIVE_LEVEL == RAPIDS_LOGGER_LOG_LEVEL_CRITICAL
  return rapids_logger::level_enum::critical;
#else
  return rapids_logger::level_enum::info;
#endif
}

// Iteration logs are printed bare at info level and above, timestamped below it
void apply_format(rapids_logger::logger& logger)
{
#if WARMLP_LOG_ACTIVE_LEVEL >= RAPIDS_LOGGER_LOG_LEVEL_INFO
  logger.set_pattern("%v");
#else
  logger.set_pattern("[%Y-%m-%d %H:%M:%S:%f] [%n] [%-6l] %v");
#endif
  logger.set_level(compiled_level());
  logger.flush_on(rapids_logger::level_enum::debug);
}

}  // namespace

rapids_logger::logger& default_logger()
{
  static rapids_logger::logger logger_ = [] {
    rapids_logger::logger logger_{"WARMLP", {pending_sink()}};
    apply_format(logger_);
    return logger_;
  }();
  return logger_;
}

void reset_default_logger()
{
  auto& logger = default_logger();
  logger.sinks().clear();
  logger.sinks().push_back(pending_sink());
  apply_format(logger);
}

size_t buffered_log_size() { return pending_log().count(); }

init_logger_t::init_logger_t(std::string log_file, bool log_to_console)
{
  auto& logger = default_logger();
  logger.sinks().clear();
  if (log_to_console) {
    logger.sinks().push_back(std::make_shared<rapids_logger::ostream_sink_mt>(std::cout));
  }
  if (!log_file.empty()) {
    logger.sinks().push_back(std::make_shared<rapids_logger::basic_file_sink_mt>(log_file, true));
  }
  apply_format(logger);

  for (const auto& [level, line] : pending_log().take()) {
    logger.log(level, line.c_str());
  }
}

init_logger_t::~init_logger_t() { reset_default_logger(); }

}  // namespace warmlp
