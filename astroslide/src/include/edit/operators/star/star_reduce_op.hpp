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
#include "edit/star/star_detector.hpp"

namespace astroslide {
/**
 * @brief Star detection and inpainting as a pipeline stage. Detection thresholds are part of the
 * parameter object under the same keys as the "star_detection" configuration section.
 *
 */
class StarReduceOp : public OperatorBase<StarReduceOp> {
 private:
  float               amount_ = 0.0f;
  StarDetectionConfig config_;

 public:
  static constexpr std::string_view             _canonical_name  = "Star Reduction";
  static constexpr std::string_view             _script_name     = "star_reduce";
  static constexpr OperatorType                 _operator_type   = OperatorType::STAR_REDUCE;
  static constexpr std::array<StrengthParam, 1> _strength_params = {{{"amount", 0.0f}}};

  StarReduceOp()                                                 = default;
  StarReduceOp(const nlohmann::json& params);

  void Apply(PixelBuffer& buffer) override;
  auto GetParams() const -> nlohmann::json override;
  void SetParams(const nlohmann::json& params) override;
};
};  // namespace astroslide
