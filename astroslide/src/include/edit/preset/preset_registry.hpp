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
#include <string>
#include <unordered_map>
#include <vector>

#include "edit/preset/preset_definition.hpp"

namespace astroslide {
/**
 * @brief Read-only lookup table of presets, built once before any request is served. Extending a
 * registry produces a new one.
 *
 */
class PresetRegistry {
 private:
  std::unordered_map<preset_id_t, PresetDefinition> presets_;
  // Declaration order, for listings
  std::vector<preset_id_t>                          order_;

  void                                              Insert(PresetDefinition&& preset);

 public:
  PresetRegistry() = default;
  explicit PresetRegistry(std::vector<PresetDefinition> presets);

  /**
   * @brief Parse a {"presets": [...]} document
   *
   * @param doc
   * @return PresetRegistry
   */
  static auto FromJson(const nlohmann::json& doc) -> PresetRegistry;

  /**
   * @brief The presets shipped with the engine
   *
   */
  static auto BuiltIn() -> PresetRegistry;

  /**
   * @brief Copy of this registry where presets of doc replace those with the same id and new ids
   * are appended
   *
   */
  auto        Extend(const nlohmann::json& doc) const -> PresetRegistry;

  auto        Contains(const preset_id_t& id) const -> bool;
  /**
   * @brief Throws INVALID_PARAMETER for an unknown id
   *
   */
  auto        Get(const preset_id_t& id) const -> const PresetDefinition&;
  auto        List() const -> std::vector<PresetInfo>;
  auto        Size() const -> size_t { return order_.size(); }
  auto        ToJson() const -> nlohmann::json;
};
};  // namespace astroslide
