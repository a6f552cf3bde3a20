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

#include "edit/operators/color/saturation_op.hpp"

#include <algorithm>
#include <cmath>
#include <opencv2/core.hpp>
#include <vector>

#include "edit/operators/CPU_kernels/tone_kernels.hpp"
#include "edit/operators/utils/color_conversion.hpp"
#include "utils/json/json_reader.hpp"

namespace astroslide {

SaturationOp::SaturationOp(const nlohmann::json& params) { SetParams(params); }

auto SaturationOp::AdaptiveFactor(const PixelBuffer& hsv) const -> float {
  const cv::Mat& data = hsv.GetCPUData();
  std::vector<float> sat;
  double             val_sum = 0.0;
  sat.reserve(static_cast<size_t>(data.total()));
  for (int r = 0; r < data.rows; ++r) {
    const auto* row = data.ptr<cv::Vec3f>(r);
    for (int c = 0; c < data.cols; ++c) {
      if (row[c][2] > stat_threshold_) {
        sat.push_back(row[c][1]);
        val_sum += row[c][2];
      }
    }
  }
  if (sat.empty()) {
    return 1.0f;
  }

  const auto n        = static_cast<double>(sat.size());
  double     sat_sum  = 0.0;
  double     sat_sum2 = 0.0;
  for (float s : sat) {
    sat_sum += s;
    sat_sum2 += static_cast<double>(s) * s;
  }
  const double mean_sat = sat_sum / n;
  const double std_sat  = std::sqrt(std::max(0.0, sat_sum2 / n - mean_sat * mean_sat));
  const double mean_val = val_sum / n;
  const float  p75_sat  = kernels::Percentile(cv::Mat(sat, false).reshape(1, 1), 75.0);

  double       factor   = 1.0;
  // Desaturated subjects take a larger boost, saturated ones a smaller one
  if (mean_sat < 0.15) {
    factor *= 1.3;
  } else if (mean_sat < 0.25) {
    factor *= 1.15;
  } else if (mean_sat > 0.4) {
    factor *= 0.85;
  }
  if (std_sat > 0.15) {
    factor *= 1.1;
  } else if (std_sat < 0.08) {
    factor *= 0.95;
  }
  if (mean_val < 0.3) {
    factor *= 1.05;
  } else if (mean_val > 0.7) {
    factor *= 0.98;
  }
  if (p75_sat > 0.5f) {
    factor *= 0.9;
  } else if (p75_sat < 0.2f) {
    factor *= 1.1;
  }
  return static_cast<float>(std::clamp(factor, 0.5, 2.0));
}

void SaturationOp::Apply(PixelBuffer& buffer) {
  if (buffer.Channels() != 3) {
    return;
  }
  auto  hsv  = ColorCvt::RGB2HSV(buffer);
  float gain = gain_;
  if (adaptive_) {
    gain = 1.0f + (gain_ - 1.0f) * AdaptiveFactor(hsv);
  }
  hsv    = ColorCvt::ScaleChannel(hsv, 1, gain);
  buffer = ColorCvt::HSV2RGB(hsv);
}

auto SaturationOp::GetParams() const -> nlohmann::json {
  nlohmann::json o;
  nlohmann::json inner;

  inner["gain"]           = gain_;
  inner["adaptive"]       = adaptive_;
  inner["stat_threshold"] = stat_threshold_;

  o[_script_name]         = inner;
  return o;
}

void SaturationOp::SetParams(const nlohmann::json& params) {
  const auto& inner = InnerParams(params);
  json_reader::ReadIfPresent(inner, "gain", gain_, _script_name);
  json_reader::ReadIfPresent(inner, "adaptive", adaptive_, _script_name);
  json_reader::ReadIfPresent(inner, "stat_threshold", stat_threshold_, _script_name);
}
};  // namespace astroslide
