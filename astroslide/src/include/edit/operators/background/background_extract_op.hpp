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
class BackgroundExtractOp : public OperatorBase<BackgroundExtractOp> {
 private:
  int    grid_size_  = 8;
  double percentile_ = 25.0;
  float  amount_     = 0.0f;

 public:
  static constexpr std::string_view             _canonical_name  = "Gradient Removal";
  static constexpr std::string_view             _script_name     = "background_extract";
  static constexpr OperatorType                 _operator_type   = OperatorType::BACKGROUND_EXTRACT;
  static constexpr std::array<StrengthParam, 1> _strength_params = {{{"amount", 0.0f}}};

  BackgroundExtractOp()                                          = default;
  BackgroundExtractOp(const nlohmann::json& params);

  void Apply(PixelBuffer& buffer) override;
  auto GetParams() const -> nlohmann::json override;
  void SetParams(const nlohmann::json& params) override;
};
};  // namespace astroslide
