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

#include "edit/operators/detail/denoise_op.hpp"

#include <algorithm>

#include "utils/json/json_reader.hpp"

namespace astroslide {
DenoiseOp::DenoiseOp(const nlohmann::json& params) { SetParams(params); }

void DenoiseOp::Apply(PixelBuffer& buffer) {
  if (params_.strength_ == 0.0f) {
    return;
  }
  kernels::DenoiseParams effective = params_;
  if (adaptive_) {
    // Noisy frames get up to 2.5x the nominal strength, clean ones half of it
    const float noise   = kernels::EstimateNoiseLevel(buffer);
    effective.strength_ = std::min(params_.strength_ * (0.5f + 2.0f * noise), 1.5f);
  }
  buffer = kernels::Denoise(buffer, effective);
}

auto DenoiseOp::GetParams() const -> nlohmann::json {
  nlohmann::json o;
  nlohmann::json inner;

  inner["strength"]       = params_.strength_;
  inner["edge_threshold"] = params_.edge_threshold_;
  inner["max_radius"]     = params_.max_radius_;
  inner["adaptive"]       = adaptive_;

  o[_script_name]         = inner;
  return o;
}

void DenoiseOp::SetParams(const nlohmann::json& params) {
  const auto& inner = InnerParams(params);
  json_reader::ReadIfPresent(inner, "strength", params_.strength_, _script_name);
  json_reader::ReadIfPresent(inner, "edge_threshold", params_.edge_threshold_, _script_name);
  json_reader::ReadIfPresent(inner, "max_radius", params_.max_radius_, _script_name);
  json_reader::ReadIfPresent(inner, "adaptive", adaptive_, _script_name);
}
};  // namespace astroslide
