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

#include "analysis/histogram_analyzer.hpp"

#include <easy/profiler.h>

#include <algorithm>
#include <cmath>

#include "edit/operators/utils/color_conversion.hpp"
#include "type/enhance_error.hpp"

namespace astroslide {
auto HistogramResult::ToJson() const -> nlohmann::json {
  return {{"red", red_}, {"green", green_}, {"blue", blue_}, {"luminance", luminance_}};
}

auto HistogramAnalyzer::BinOf(float value) -> int {
  if (std::isnan(value)) {
    return 0;
  }
  const float scaled = std::floor(value * static_cast<float>(kHistogramBins - 1));
  return static_cast<int>(std::clamp(scaled, 0.0f, static_cast<float>(kHistogramBins - 1)));
}

auto HistogramAnalyzer::Compute(const PixelBuffer& buffer) -> HistogramResult {
  EASY_FUNCTION(profiler::colors::Yellow);
  ValidateBuffer(buffer, "ComputeHistogram");
  const cv::Mat&  data = buffer.GetCPUData();
  HistogramResult result;

  if (data.channels() == 1) {
    for (int r = 0; r < data.rows; ++r) {
      const float* row = data.ptr<float>(r);
      for (int c = 0; c < data.cols; ++c) {
        result.luminance_[BinOf(row[c])]++;
      }
    }
    result.red_   = result.luminance_;
    result.green_ = result.luminance_;
    result.blue_  = result.luminance_;
    return result;
  }

  for (int r = 0; r < data.rows; ++r) {
    const auto* row = data.ptr<cv::Vec3f>(r);
    for (int c = 0; c < data.cols; ++c) {
      const cv::Vec3f& px = row[c];
      result.red_[BinOf(px[0])]++;
      result.green_[BinOf(px[1])]++;
      result.blue_[BinOf(px[2])]++;
      const float luma = ColorCvt::kLumaR * px[0] + ColorCvt::kLumaG * px[1] +
                         ColorCvt::kLumaB * px[2];
      result.luminance_[BinOf(luma)]++;
    }
  }
  return result;
}
};  // namespace astroslide
