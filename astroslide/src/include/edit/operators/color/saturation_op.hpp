//  Copyright 2025 Yurun Zi
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
class SaturationOp : public OperatorBase<SaturationOp> {
 private:
  /**
   * @brief Multiplier on HSV saturation, 1 keeps the image unchanged
   *
   */
  float gain_           = 1.0f;

  /**
   * @brief When set, the boost (gain - 1) is scaled by a factor derived from the saturation and
   * brightness statistics of the subject pixels
   *
   */
  bool  adaptive_       = false;

  /**
   * @brief Pixels with HSV value at or below this level are background and excluded from the
   * adaptive statistics
   *
   */
  float stat_threshold_ = 0.04f;

 public:
  static constexpr std::string_view             _canonical_name  = "HSV Saturation Scale";
  static constexpr std::string_view             _script_name     = "hsv_saturation_scale";
  static constexpr OperatorType                 _operator_type   = OperatorType::HSV_SATURATION_SCALE;
  static constexpr std::array<StrengthParam, 1> _strength_params = {{{"gain", 1.0f}}};

  SaturationOp()                                                 = default;
  SaturationOp(const nlohmann::json& params);

  /**
   * @brief Factor in [0.5, 2] applied to the saturation boost of adaptive mode. Low saturation,
   * high variance, dark or mostly desaturated subjects get a larger factor.
   *
   * @param hsv HSV buffer
   * @return float
   */
  auto AdaptiveFactor(const PixelBuffer& hsv) const -> float;

  void Apply(PixelBuffer& buffer) override;
  auto GetParams() const -> nlohmann::json override;
  void SetParams(const nlohmann::json& params) override;
};
};  // namespace astroslide
