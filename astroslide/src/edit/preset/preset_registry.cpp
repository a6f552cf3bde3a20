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

#include "edit/preset/preset_registry.hpp"

#include <format>
#include <utility>

#include "edit/preset/default_presets.hpp"
#include "type/enhance_error.hpp"

namespace astroslide {
PresetRegistry::PresetRegistry(std::vector<PresetDefinition> presets) {
  for (auto& preset : presets) {
    Insert(std::move(preset));
  }
}

void PresetRegistry::Insert(PresetDefinition&& preset) {
  auto id = preset.id_;
  if (!presets_.contains(id)) {
    order_.push_back(id);
  }
  presets_.insert_or_assign(id, std::move(preset));
}

auto PresetRegistry::FromJson(const nlohmann::json& doc) -> PresetRegistry {
  return PresetRegistry{}.Extend(doc);
}

auto PresetRegistry::BuiltIn() -> PresetRegistry {
  return FromJson(preset_defaults::MakeBuiltInPresetDocument());
}

auto PresetRegistry::Extend(const nlohmann::json& doc) const -> PresetRegistry {
  if (!doc.is_object() || !doc.contains("presets") || !doc["presets"].is_array()) {
    throw EnhanceException(EnhanceErrorCode::INVALID_PARAMETER,
                           "preset document: expected {\"presets\": [...]}");
  }
  PresetRegistry extended = *this;
  for (const auto& entry : doc["presets"]) {
    extended.Insert(PresetDefinition::FromJson(entry));
  }
  return extended;
}

auto PresetRegistry::Contains(const preset_id_t& id) const -> bool { return presets_.contains(id); }

auto PresetRegistry::Get(const preset_id_t& id) const -> const PresetDefinition& {
  auto it = presets_.find(id);
  if (it == presets_.end()) {
    throw EnhanceException(EnhanceErrorCode::INVALID_PARAMETER,
                           std::format("Unknown preset \"{}\"", id));
  }
  return it->second;
}

auto PresetRegistry::List() const -> std::vector<PresetInfo> {
  std::vector<PresetInfo> infos;
  infos.reserve(order_.size());
  for (const auto& id : order_) {
    const auto& preset = presets_.at(id);
    infos.push_back({preset.id_, preset.name_, preset.description_, preset.best_for_});
  }
  return infos;
}

auto PresetRegistry::ToJson() const -> nlohmann::json {
  nlohmann::json presets = nlohmann::json::array();
  for (const auto& id : order_) {
    presets.push_back(presets_.at(id).ToJson());
  }
  return {{"presets", presets}};
}
};  // namespace astroslide
