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
class ClaheOp : public OperatorBase<ClaheOp> {
 private:
  float clip_limit_     = 2.0f;
  int   tile_grid_size_ = 8;
  /**
   * @brief Blend between the input (0) and the equalized luminance (1)
   *
   */
  float amount_         = 0.0f;

 public:
  static constexpr std::string_view             _canonical_name  = "Adaptive Contrast";
  static constexpr std::string_view             _script_name     = "clahe_contrast";
  static constexpr OperatorType                 _operator_type   = OperatorType::CLAHE_CONTRAST;
  static constexpr std::array<StrengthParam, 1> _strength_params = {{{"amount", 0.0f}}};

  ClaheOp()                                                      = default;
  ClaheOp(const nlohmann::json& params);

  void Apply(PixelBuffer& buffer) override;
  auto GetParams() const -> nlohmann::json override;
  void SetParams(const nlohmann::json& params) override;
};
};  // namespace astroslide
