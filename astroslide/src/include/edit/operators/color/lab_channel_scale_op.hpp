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

#include <array>

#include "edit/operators/op_base.hpp"

namespace astroslide {
/**
 * @brief Per channel gains in CIE L*a*b*. Gains on a and b push lunar mineral hues (titanium blue,
 * iron orange) apart without shifting them.
 *
 */
class LabChannelScaleOp : public OperatorBase<LabChannelScaleOp> {
 private:
  float gain_l_ = 1.0f;
  float gain_a_ = 1.0f;
  float gain_b_ = 1.0f;

 public:
  static constexpr std::string_view             _canonical_name = "LAB Channel Scale";
  static constexpr std::string_view             _script_name    = "lab_channel_scale";
  static constexpr OperatorType                 _operator_type  = OperatorType::LAB_CHANNEL_SCALE;
  static constexpr std::array<StrengthParam, 3> _strength_params = {
      {{"gain_l", 1.0f}, {"gain_a", 1.0f}, {"gain_b", 1.0f}}};

  LabChannelScaleOp() = default;
  LabChannelScaleOp(const nlohmann::json& params);

  void Apply(PixelBuffer& buffer) override;
  auto GetParams() const -> nlohmann::json override;
  void SetParams(const nlohmann::json& params) override;
};
};  // namespace astroslide
