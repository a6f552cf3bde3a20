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

#include <nlohmann/json.hpp>
#include <opencv2/core.hpp>
#include <vector>

#include "image/pixel_buffer.hpp"

namespace astroslide {
/**
 * @brief Detection and reduction thresholds. These are calibration values for real telescope
 * frames and are read from configuration.
 *
 */
struct StarDetectionConfig {
  // Local background statistics
  int    background_grid_       = 8;
  double background_percentile_ = 50.0;

  // A pixel is a candidate above background + max(sigma_k * noise, min_contrast)
  float  sigma_k_               = 5.0f;
  float  min_contrast_          = 0.05f;

  // Compactness bounds of a star region
  int    min_area_              = 3;
  float  max_radius_            = 12.0f;
  float  max_elongation_        = 2.0f;
  float  min_fill_ratio_        = 0.4f;

  // Reduction mask and inpainting
  float  mask_scale_            = 1.5f;
  float  mask_padding_          = 1.0f;
  double inpaint_radius_        = 3.0;

  /**
   * @brief Read the keys present in j on top of this config, see ToJson() for the names
   *
   * @param j
   */
  void   ReadJson(const nlohmann::json& j);
  auto   ToJson() const -> nlohmann::json;
};

struct Star {
  cv::Point2f center_;
  float       radius_     = 0.0f;
  float       peak_       = 0.0f;
  float       background_ = 0.0f;
};

using StarMap = std::vector<Star>;

class StarDetector {
 private:
  StarDetectionConfig config_;

 public:
  StarDetector() = default;
  explicit StarDetector(const StarDetectionConfig& config);

  /**
   * @brief Find compact bright regions on the luminance of the buffer
   *
   * @param buffer RGB or GRAY buffer
   * @return StarMap
   */
  auto Detect(const PixelBuffer& buffer) const -> StarMap;

  auto GetConfig() const -> const StarDetectionConfig& { return config_; }
};
};  // namespace astroslide
