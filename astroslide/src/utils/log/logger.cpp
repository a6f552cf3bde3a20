//  Copyright 2026 Yurun Zi
//
//  Licensed under the Apache License, Version 2.0 (the "License");
//  you may not use this file except in compliance with the License.
//  You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
//  Unless required by applicable law or agreed to in writing, software
//  distributed under the License is distributed on an "AS IS" BASIS,
//  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//  See the License for the specific language governing permissions and
//  limitations under the License.

#include "utils/log/logger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>

namespace astroslide::log {
namespace {
constexpr const char* kLoggerName = "astroslide";
}  // namespace

auto GetLogger() -> std::shared_ptr<spdlog::logger> {
  static std::once_flag init_flag;
  std::call_once(init_flag, []() {
    if (!spdlog::get(kLoggerName)) {
      auto logger = spdlog::stdout_color_mt(kLoggerName);
      logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [t%t] %v");
      logger->set_level(spdlog::level::info);
    }
  });
  return spdlog::get(kLoggerName);
}

void SetLevel(const std::string& level_name) {
  auto level = spdlog::level::from_str(level_name);
  // from_str maps unknown names to "off"
  if (level == spdlog::level::off && level_name != "off") {
    level = spdlog::level::info;
  }
  GetLogger()->set_level(level);
}
};  // namespace astroslide::log
