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

#include "edit/operators/tone/histogram_stretch_op.hpp"

#include <opencv2/core.hpp>
#include <utility>

#include "edit/operators/CPU_kernels/tone_kernels.hpp"
#include "utils/json/json_reader.hpp"

namespace astroslide {
HistogramStretchOp::HistogramStretchOp(const nlohmann::json& params) { SetParams(params); }

void HistogramStretchOp::Apply(PixelBuffer& buffer) {
  auto stretched = kernels::HistogramStretch(buffer, low_percentile_, high_percentile_);
  if (amount_ == 1.0f) {
    buffer = std::move(stretched);
    return;
  }
  cv::Mat out;
  cv::addWeighted(buffer.GetCPUData(), 1.0 - amount_, stretched.GetCPUData(), amount_, 0.0, out);
  buffer.ReplaceData(std::move(out));
  buffer.Clamp();
}

auto HistogramStretchOp::GetParams() const -> nlohmann::json {
  nlohmann::json o;
  nlohmann::json inner;

  inner["low"]    = low_percentile_;
  inner["high"]   = high_percentile_;
  inner["amount"] = amount_;

  o[_script_name] = inner;
  return o;
}

void HistogramStretchOp::SetParams(const nlohmann::json& params) {
  const auto& inner = InnerParams(params);
  json_reader::ReadIfPresent(inner, "low", low_percentile_, _script_name);
  json_reader::ReadIfPresent(inner, "high", high_percentile_, _script_name);
  json_reader::ReadIfPresent(inner, "amount", amount_, _script_name);
}
};  // namespace astroslide
