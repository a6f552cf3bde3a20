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

#include "edit/operators/tone/clahe_op.hpp"

#include <opencv2/core.hpp>
#include <utility>

#include "edit/operators/CPU_kernels/tone_kernels.hpp"
#include "utils/json/json_reader.hpp"

namespace astroslide {
ClaheOp::ClaheOp(const nlohmann::json& params) { SetParams(params); }

void ClaheOp::Apply(PixelBuffer& buffer) {
  auto equalized = kernels::AdaptiveContrast(buffer, clip_limit_, tile_grid_size_);
  if (amount_ == 1.0f) {
    buffer = std::move(equalized);
    return;
  }
  cv::Mat out;
  cv::addWeighted(buffer.GetCPUData(), 1.0 - amount_, equalized.GetCPUData(), amount_, 0.0, out);
  buffer.ReplaceData(std::move(out));
  buffer.Clamp();
}

auto ClaheOp::GetParams() const -> nlohmann::json {
  nlohmann::json o;
  nlohmann::json inner;

  inner["clip_limit"]     = clip_limit_;
  inner["tile_grid_size"] = tile_grid_size_;
  inner["amount"]         = amount_;

  o[_script_name]         = inner;
  return o;
}

void ClaheOp::SetParams(const nlohmann::json& params) {
  const auto& inner = InnerParams(params);
  json_reader::ReadIfPresent(inner, "clip_limit", clip_limit_, _script_name);
  json_reader::ReadIfPresent(inner, "tile_grid_size", tile_grid_size_, _script_name);
  json_reader::ReadIfPresent(inner, "amount", amount_, _script_name);
}
};  // namespace astroslide
