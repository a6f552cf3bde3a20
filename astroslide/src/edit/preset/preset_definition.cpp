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

#include "edit/preset/preset_definition.hpp"

#include <format>
#include <utility>

#include "edit/operators/operator_factory.hpp"
#include "edit/operators/operator_registeration.hpp"
#include "type/enhance_error.hpp"
#include "utils/json/json_reader.hpp"

namespace astroslide {
auto StageDefinition::FromJson(const nlohmann::json& j) -> StageDefinition {
  json_reader::ExpectObject(j, "stage");
  StageDefinition stage;
  json_reader::ReadIfPresent(j, "op", stage.op_, "stage");
  json_reader::ReadIfPresent(j, "params", stage.params_, "stage");

  RegisterAllOperators();
  if (!OperatorFactory::Instance().Contains(stage.op_)) {
    throw EnhanceException(EnhanceErrorCode::INVALID_PARAMETER,
                           std::format("stage: unknown operator \"{}\"", stage.op_));
  }
  json_reader::ExpectObject(stage.params_, stage.op_);
  return stage;
}

auto StageDefinition::ToJson() const -> nlohmann::json {
  return {{"op", op_}, {"params", params_}};
}

auto SubjectMaskDefinition::FromJson(const nlohmann::json& j) -> SubjectMaskDefinition {
  constexpr std::string_view who = "subject_mask";
  json_reader::ExpectObject(j, who);
  SubjectMaskDefinition mask;
  json_reader::ReadIfPresent(j, "threshold", mask.threshold_, who);
  json_reader::ReadIfPresent(j, "cleanup_kernel", mask.cleanup_kernel_, who);
  json_reader::ReadIfPresent(j, "black_background", mask.black_background_, who);
  if (!(mask.threshold_ >= 0.0f && mask.threshold_ < 1.0f) || mask.cleanup_kernel_ < 0) {
    throw EnhanceException(EnhanceErrorCode::INVALID_PARAMETER,
                           "subject_mask: threshold must be in [0, 1) and cleanup_kernel >= 0");
  }
  return mask;
}

auto SubjectMaskDefinition::ToJson() const -> nlohmann::json {
  return {{"threshold", threshold_},
          {"cleanup_kernel", cleanup_kernel_},
          {"black_background", black_background_}};
}

auto PresetDefinition::FromJson(const nlohmann::json& j) -> PresetDefinition {
  json_reader::ExpectObject(j, "preset");
  PresetDefinition preset;
  json_reader::ReadIfPresent(j, "id", preset.id_, "preset");
  if (preset.id_.empty()) {
    throw EnhanceException(EnhanceErrorCode::INVALID_PARAMETER, "preset: missing \"id\"");
  }
  const std::string who = std::format("preset {}", preset.id_);
  preset.name_          = preset.id_;
  json_reader::ReadIfPresent(j, "name", preset.name_, who);
  json_reader::ReadIfPresent(j, "description", preset.description_, who);
  json_reader::ReadIfPresent(j, "best_for", preset.best_for_, who);

  if (j.contains("subject_mask")) {
    preset.subject_mask_ = SubjectMaskDefinition::FromJson(j["subject_mask"]);
  }

  auto stages = j.find("stages");
  if (stages == j.end() || !stages->is_array()) {
    throw EnhanceException(EnhanceErrorCode::INVALID_PARAMETER,
                           std::format("{}: \"stages\" must be an array", who));
  }
  for (const auto& stage : *stages) {
    preset.stages_.push_back(StageDefinition::FromJson(stage));
  }
  return preset;
}

auto PresetDefinition::ToJson() const -> nlohmann::json {
  nlohmann::json j;
  j["id"]          = id_;
  j["name"]        = name_;
  j["description"] = description_;
  j["best_for"]    = best_for_;
  if (subject_mask_.has_value()) {
    j["subject_mask"] = subject_mask_->ToJson();
  }
  nlohmann::json stages = nlohmann::json::array();
  for (const auto& stage : stages_) {
    stages.push_back(stage.ToJson());
  }
  j["stages"] = std::move(stages);
  return j;
}
};  // namespace astroslide
