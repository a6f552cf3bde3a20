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

#include <format>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

#include "type/enhance_error.hpp"

namespace astroslide::json_reader {
/**
 * @brief Overwrite out with obj[key] when the key is present. A value of the wrong type raises
 * INVALID_PARAMETER naming the owner and the key.
 *
 */
template <typename T>
void ReadIfPresent(const nlohmann::json& obj, std::string_view key, T& out, std::string_view who) {
  auto it = obj.find(std::string(key));
  if (it == obj.end()) {
    return;
  }
  try {
    out = it->template get<T>();
  } catch (const nlohmann::json::exception& e) {
    throw EnhanceException(EnhanceErrorCode::INVALID_PARAMETER,
                           std::format("{}: bad value for \"{}\": {}", who, key, e.what()));
  }
}

/**
 * @brief Require obj to be a JSON object, returning it for chaining
 *
 */
inline auto ExpectObject(const nlohmann::json& obj, std::string_view who) -> const nlohmann::json& {
  if (!obj.is_object()) {
    throw EnhanceException(EnhanceErrorCode::INVALID_PARAMETER,
                           std::format("{}: expected a JSON object", who));
  }
  return obj;
}
};  // namespace astroslide::json_reader
