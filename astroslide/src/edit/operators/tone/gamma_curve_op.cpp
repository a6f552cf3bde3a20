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

#include "edit/operators/tone/gamma_curve_op.hpp"

#include "edit/operators/CPU_kernels/tone_kernels.hpp"
#include "utils/json/json_reader.hpp"

namespace astroslide {

GammaCurveOp::GammaCurveOp(const nlohmann::json& params) { SetParams(params); }

void GammaCurveOp::Apply(PixelBuffer& buffer) { buffer = kernels::GammaCurve(buffer, gamma_); }

auto GammaCurveOp::GetParams() const -> nlohmann::json {
  nlohmann::json o;
  o[_script_name] = {{"gamma", gamma_}};
  return o;
}

void GammaCurveOp::SetParams(const nlohmann::json& params) {
  json_reader::ReadIfPresent(InnerParams(params), "gamma", gamma_, _script_name);
}
};  // namespace astroslide
