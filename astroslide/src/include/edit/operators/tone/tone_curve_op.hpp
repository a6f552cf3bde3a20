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

#include "edit/operators/CPU_kernels/tone_kernels.hpp"
#include "edit/operators/op_base.hpp"

namespace astroslide {
class ToneCurveOp : public OperatorBase<ToneCurveOp> {
 private:
  kernels::ToneCurveParams params_;

 public:
  static constexpr std::string_view             _canonical_name  = "Tone Curve";
  static constexpr std::string_view             _script_name     = "tone_curve";
  static constexpr OperatorType                 _operator_type   = OperatorType::TONE_CURVE;
  static constexpr std::array<StrengthParam, 3> _strength_params = {
      {{"shadow_lift", 0.0f}, {"highlight_compression", 0.0f}, {"s_curve", 0.0f}}};

  ToneCurveOp() = default;
  ToneCurveOp(const nlohmann::json& params);

  void Apply(PixelBuffer& buffer) override;
  auto GetParams() const -> nlohmann::json override;
  void SetParams(const nlohmann::json& params) override;
};
};  // namespace astroslide
