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

#include "edit/operators/color/white_balance_op.hpp"

#include <algorithm>
#include <format>
#include <opencv2/core.hpp>
#include <vector>

#include "edit/operators/CPU_kernels/tone_kernels.hpp"
#include "edit/operators/utils/color_conversion.hpp"
#include "utils/json/json_reader.hpp"

namespace astroslide {
namespace {
constexpr float kDegenerateLevel = 1e-6f;
}  // namespace

WhiteBalanceOp::WhiteBalanceOp(const nlohmann::json& params) { SetParams(params); }

auto WhiteBalanceOp::ComputeGains(const PixelBuffer& buffer) const -> std::array<float, 3> {
  std::array<float, 3> levels{};
  const cv::Mat&       data = buffer.GetCPUData();
  if (method_ == "gray_world") {
    const cv::Scalar mean = cv::mean(data);
    for (int c = 0; c < 3; ++c) {
      levels[c] = static_cast<float>(mean[c]);
    }
  } else {
    std::vector<cv::Mat> planes;
    cv::split(data, planes);
    for (int c = 0; c < 3; ++c) {
      levels[c] = kernels::Percentile(planes[c], 99.5);
    }
  }

  for (int c = 0; c < 3; ++c) {
    if (!(levels[c] > kDegenerateLevel)) {
      throw EnhanceException(
          EnhanceErrorCode::DEGENERATE_INPUT,
          std::format("WhiteBalance: channel {} carries no signal ({})", c, levels[c]));
    }
  }

  const float reference = method_ == "gray_world"
                              ? (levels[0] + levels[1] + levels[2]) / 3.0f
                              : std::max({levels[0], levels[1], levels[2]});
  std::array<float, 3> gains{};
  for (int c = 0; c < 3; ++c) {
    const float full = reference / levels[c];
    gains[c]         = 1.0f + amount_ * (full - 1.0f);
  }
  return gains;
}

void WhiteBalanceOp::Apply(PixelBuffer& buffer) {
  // A single channel has no color cast to correct
  if (buffer.Channels() != 3) {
    return;
  }
  buffer = ColorCvt::ApplyChannelGains(buffer, ComputeGains(buffer));
  buffer.Clamp();
}

auto WhiteBalanceOp::GetParams() const -> nlohmann::json {
  nlohmann::json o;
  nlohmann::json inner;

  inner["method"] = method_;
  inner["amount"] = amount_;

  o[_script_name] = inner;
  return o;
}

void WhiteBalanceOp::SetParams(const nlohmann::json& params) {
  const auto& inner = InnerParams(params);
  json_reader::ReadIfPresent(inner, "method", method_, _script_name);
  json_reader::ReadIfPresent(inner, "amount", amount_, _script_name);
  if (method_ != "gray_world" && method_ != "white_patch") {
    throw EnhanceException(EnhanceErrorCode::INVALID_PARAMETER,
                           std::format("WhiteBalance: unknown method \"{}\"", method_));
  }
}
};  // namespace astroslide
