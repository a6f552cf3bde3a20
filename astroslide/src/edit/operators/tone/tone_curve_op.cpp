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

#include "edit/operators/tone/tone_curve_op.hpp"

#include "utils/json/json_reader.hpp"

namespace astroslide {
ToneCurveOp::ToneCurveOp(const nlohmann::json& params) { SetParams(params); }

void ToneCurveOp::Apply(PixelBuffer& buffer) { buffer = kernels::ToneCurve(buffer, params_); }

auto ToneCurveOp::GetParams() const -> nlohmann::json {
  nlohmann::json o;
  nlohmann::json inner;

  inner["shadow_lift"]           = params_.shadow_lift_;
  inner["shadow_gamma"]          = params_.shadow_gamma_;
  inner["highlight_compression"] = params_.highlight_compression_;
  inner["highlight_threshold"]   = params_.highlight_threshold_;
  inner["s_curve"]               = params_.s_curve_;
  inner["s_curve_slope"]         = params_.s_curve_slope_;

  o[_script_name]                = inner;
  return o;
}

void ToneCurveOp::SetParams(const nlohmann::json& params) {
  const auto& inner = InnerParams(params);
  json_reader::ReadIfPresent(inner, "shadow_lift", params_.shadow_lift_, _script_name);
  json_reader::ReadIfPresent(inner, "shadow_gamma", params_.shadow_gamma_, _script_name);
  json_reader::ReadIfPresent(inner, "highlight_compression", params_.highlight_compression_,
                             _script_name);
  json_reader::ReadIfPresent(inner, "highlight_threshold", params_.highlight_threshold_,
                             _script_name);
  json_reader::ReadIfPresent(inner, "s_curve", params_.s_curve_, _script_name);
  json_reader::ReadIfPresent(inner, "s_curve_slope", params_.s_curve_slope_, _script_name);
}
};  // namespace astroslide
