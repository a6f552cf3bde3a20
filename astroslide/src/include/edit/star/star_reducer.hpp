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

#include <opencv2/core.hpp>

#include "edit/star/star_detector.hpp"
#include "image/pixel_buffer.hpp"

namespace astroslide {
class StarReducer {
 private:
  StarDetectionConfig config_;

 public:
  StarReducer() = default;
  explicit StarReducer(const StarDetectionConfig& config);

  /**
   * @brief Union of the reduction circles of every star, so overlapping stars share one
   * inpainting region.
   *
   * @param size
   * @param stars
   * @return cv::Mat CV_8UC1, 255 inside the mask
   */
  auto BuildStarMask(cv::Size size, const StarMap& stars) const -> cv::Mat;

  /**
   * @brief Inpaint the given stars and blend masked pixels toward the inpainted background by
   * amount. Pixels outside the mask are copied unchanged.
   *
   */
  auto Reduce(const PixelBuffer& buffer, const StarMap& stars, float amount) const
      -> PixelBuffer;

  /**
   * @brief Detect and reduce in one call
   *
   * @param buffer
   * @param amount 0 keeps the buffer, 1 removes every detected star
   * @return PixelBuffer
   */
  auto ReduceStars(const PixelBuffer& buffer, float amount) const -> PixelBuffer;
};
};  // namespace astroslide
