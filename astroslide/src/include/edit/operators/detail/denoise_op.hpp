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

#include "edit/operators/CPU_kernels/detail_kernels.hpp"
#include "edit/operators/op_base.hpp"

namespace astroslide {
class DenoiseOp : public OperatorBase<DenoiseOp> {
 private:
  kernels::DenoiseParams params_;
  /**
   * @brief Scale the strength by the measured noise level of the input
   *
   */
  bool                   adaptive_ = false;

 public:
  static constexpr std::string_view             _canonical_name  = "Denoise";
  static constexpr std::string_view             _script_name     = "denoise";
  static constexpr OperatorType                 _operator_type   = OperatorType::DENOISE;
  static constexpr std::array<StrengthParam, 1> _strength_params = {{{"strength", 0.0f}}};

  DenoiseOp()                                                    = default;
  DenoiseOp(const nlohmann::json& params);

  void Apply(PixelBuffer& buffer) override;
  auto GetParams() const -> nlohmann::json override;
  void SetParams(const nlohmann::json& params) override;
};
};  // namespace astroslide
