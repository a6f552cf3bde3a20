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

#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace astroslide::log {
/**
 * @brief Get the process-wide "astroslide" logger, created on first use with a colored stdout
 * sink.
 *
 * @return std::shared_ptr<spdlog::logger>
 */
auto GetLogger() -> std::shared_ptr<spdlog::logger>;

/**
 * @brief Set the level of the astroslide logger from its name ("trace", "debug", "info", "warn",
 * "error", "critical", "off"). Unknown names fall back to "info".
 *
 * @param level_name
 */
void SetLevel(const std::string& level_name);
};  // namespace astroslide::log
