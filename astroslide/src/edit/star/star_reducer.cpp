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

#include "edit/star/star_reducer.hpp"

#include <easy/profiler.h>

#include <cmath>
#include <format>
#include <opencv2/imgproc.hpp>
#include <opencv2/photo.hpp>
#include <vector>

#include "type/enhance_error.hpp"

namespace astroslide {
StarReducer::StarReducer(const StarDetectionConfig& config) : config_(config) {
  if (!(config_.mask_scale_ > 0.0f) || config_.mask_padding_ < 0.0f ||
      !(config_.inpaint_radius_ > 0.0)) {
    throw EnhanceException(EnhanceErrorCode::INVALID_PARAMETER,
                           "StarReducer: mask scale and inpaint radius must be positive");
  }
}

auto StarReducer::BuildStarMask(cv::Size size, const StarMap& stars) const -> cv::Mat {
  cv::Mat mask = cv::Mat::zeros(size, CV_8UC1);
  for (const auto& star : stars) {
    const float r = star.radius_ * config_.mask_scale_ + config_.mask_padding_;
    cv::circle(mask, cv::Point(static_cast<int>(std::lround(star.center_.x)),
                               static_cast<int>(std::lround(star.center_.y))),
               static_cast<int>(std::ceil(r)), cv::Scalar(255), cv::FILLED, cv::LINE_8);
  }
  return mask;
}

auto StarReducer::Reduce(const PixelBuffer& buffer, const StarMap& stars, float amount) const
    -> PixelBuffer {
  EASY_FUNCTION(profiler::colors::Orange);
  ValidateBuffer(buffer, "ReduceStars");
  if (!(amount >= 0.0f && amount <= 1.0f)) {
    throw EnhanceException(EnhanceErrorCode::INVALID_PARAMETER,
                           std::format("ReduceStars: amount must be in [0, 1], got {}", amount));
  }

  PixelBuffer result = buffer.Clone();
  if (amount == 0.0f || stars.empty()) {
    return result;
  }

  const cv::Mat&       src  = buffer.GetCPUData();
  const cv::Mat        mask = BuildStarMask(src.size(), stars);

  std::vector<cv::Mat> planes;
  cv::split(src, planes);
  std::vector<cv::Mat> filled(planes.size());
  for (size_t c = 0; c < planes.size(); ++c) {
    // Telea inpainting accepts single channel float input
    cv::inpaint(planes[c], mask, filled[c], config_.inpaint_radius_, cv::INPAINT_TELEA);
  }
  cv::Mat inpainted;
  cv::merge(filled, inpainted);

  cv::Mat blended;
  if (amount == 1.0f) {
    blended = inpainted;
  } else {
    cv::addWeighted(src, 1.0 - amount, inpainted, amount, 0.0, blended);
  }

  cv::Mat out = result.GetCPUData();
  blended.copyTo(out, mask);
  result.Clamp();
  return result;
}

auto StarReducer::ReduceStars(const PixelBuffer& buffer, float amount) const -> PixelBuffer {
  ValidateBuffer(buffer, "ReduceStars");
  if (!(amount >= 0.0f && amount <= 1.0f)) {
    throw EnhanceException(EnhanceErrorCode::INVALID_PARAMETER,
                           std::format("ReduceStars: amount must be in [0, 1], got {}", amount));
  }
  if (amount == 0.0f) {
    return buffer.Clone();
  }
  StarDetector detector{config_};
  return Reduce(buffer, detector.Detect(buffer), amount);
}
};  // namespace astroslide
