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

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "type/type.hpp"

namespace astroslide {
/**
 * @brief One operator invocation: the operator script name and its inner parameter object
 *
 */
struct StageDefinition {
  std::string    op_;
  nlohmann::json params_ = nlohmann::json::object();

  static auto    FromJson(const nlohmann::json& j) -> StageDefinition;
  auto           ToJson() const -> nlohmann::json;
};

/**
 * @brief Luminance threshold isolating a bright subject (a lunar disk) from the sky. Stage
 * output is kept inside the mask only.
 *
 */
struct SubjectMaskDefinition {
  float threshold_        = 0.04f;
  /**
   * @brief Diameter of the elliptical kernel of the close/open cleanup, 0 disables it
   *
   */
  int   cleanup_kernel_   = 0;
  /**
   * @brief Darken the sky outside the mask toward black with the intensity
   *
   */
  bool  black_background_ = false;

  static auto FromJson(const nlohmann::json& j) -> SubjectMaskDefinition;
  auto        ToJson() const -> nlohmann::json;
};

struct PresetDefinition {
  preset_id_t                          id_;
  std::string                          name_;
  std::string                          description_;
  std::string                          best_for_;
  std::optional<SubjectMaskDefinition> subject_mask_;
  std::vector<StageDefinition>         stages_;

  /**
   * @brief Parse one entry of a preset document. Unknown operators and malformed fields raise
   * INVALID_PARAMETER.
   *
   */
  static auto                          FromJson(const nlohmann::json& j) -> PresetDefinition;
  auto                                 ToJson() const -> nlohmann::json;
};

/**
 * @brief The listing shown to users, without the stage data
 *
 */
struct PresetInfo {
  preset_id_t id_;
  std::string name_;
  std::string description_;
  std::string best_for_;
};
};  // namespace astroslide
