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

#include "edit/star/star_detector.hpp"

#include <easy/profiler.h>

#include <algorithm>
#include <cmath>
#include <numbers>
#include <opencv2/imgproc.hpp>

#include "edit/operators/CPU_kernels/background_kernels.hpp"
#include "edit/operators/utils/color_conversion.hpp"
#include "type/enhance_error.hpp"
#include "utils/json/json_reader.hpp"

namespace astroslide {
void StarDetectionConfig::ReadJson(const nlohmann::json& j) {
  constexpr std::string_view who = "star_detection";
  json_reader::ExpectObject(j, who);
  json_reader::ReadIfPresent(j, "background_grid", background_grid_, who);
  json_reader::ReadIfPresent(j, "background_percentile", background_percentile_, who);
  json_reader::ReadIfPresent(j, "sigma_k", sigma_k_, who);
  json_reader::ReadIfPresent(j, "min_contrast", min_contrast_, who);
  json_reader::ReadIfPresent(j, "min_area", min_area_, who);
  json_reader::ReadIfPresent(j, "max_radius", max_radius_, who);
  json_reader::ReadIfPresent(j, "max_elongation", max_elongation_, who);
  json_reader::ReadIfPresent(j, "min_fill_ratio", min_fill_ratio_, who);
  json_reader::ReadIfPresent(j, "mask_scale", mask_scale_, who);
  json_reader::ReadIfPresent(j, "mask_padding", mask_padding_, who);
  json_reader::ReadIfPresent(j, "inpaint_radius", inpaint_radius_, who);
}

auto StarDetectionConfig::ToJson() const -> nlohmann::json {
  return {{"background_grid", background_grid_},
          {"background_percentile", background_percentile_},
          {"sigma_k", sigma_k_},
          {"min_contrast", min_contrast_},
          {"min_area", min_area_},
          {"max_radius", max_radius_},
          {"max_elongation", max_elongation_},
          {"min_fill_ratio", min_fill_ratio_},
          {"mask_scale", mask_scale_},
          {"mask_padding", mask_padding_},
          {"inpaint_radius", inpaint_radius_}};
}

StarDetector::StarDetector(const StarDetectionConfig& config) : config_(config) {
  if (config_.background_grid_ < 1 || config_.min_area_ < 1 || !(config_.max_radius_ > 0.0f) ||
      !(config_.max_elongation_ >= 1.0f) || config_.min_fill_ratio_ < 0.0f ||
      config_.min_fill_ratio_ > 1.0f || config_.sigma_k_ < 0.0f || config_.min_contrast_ < 0.0f) {
    throw EnhanceException(EnhanceErrorCode::INVALID_PARAMETER,
                           "StarDetector: inconsistent detection thresholds");
  }
}

auto StarDetector::Detect(const PixelBuffer& buffer) const -> StarMap {
  EASY_FUNCTION(profiler::colors::Orange);
  ValidateBuffer(buffer, "StarDetector");

  const cv::Mat luma       = ColorCvt::Luminance(buffer);
  const cv::Mat background = kernels::EstimateBackground(luma, config_.background_grid_,
                                                         config_.background_percentile_);
  const cv::Mat noise      = kernels::EstimateNoiseMap(luma, config_.background_grid_);

  cv::Mat       scaled_noise = noise * config_.sigma_k_;
  cv::Mat       margin;
  cv::max(scaled_noise, static_cast<double>(config_.min_contrast_), margin);
  cv::Mat       threshold = background + margin;
  cv::Mat       candidates;
  cv::compare(luma, threshold, candidates, cv::CMP_GT);

  cv::Mat       labels, stats, centroids;
  const int     n_labels =
      cv::connectedComponentsWithStats(candidates, labels, stats, centroids, 8, CV_32S);

  const double max_area =
      std::numbers::pi * static_cast<double>(config_.max_radius_) * config_.max_radius_;

  StarMap stars;
  // Label 0 is the background component
  for (int label = 1; label < n_labels; ++label) {
    const int area = stats.at<int>(label, cv::CC_STAT_AREA);
    const int x0   = stats.at<int>(label, cv::CC_STAT_LEFT);
    const int y0   = stats.at<int>(label, cv::CC_STAT_TOP);
    const int w    = stats.at<int>(label, cv::CC_STAT_WIDTH);
    const int h    = stats.at<int>(label, cv::CC_STAT_HEIGHT);

    if (area < config_.min_area_ || static_cast<double>(area) > max_area) {
      continue;
    }
    const float elongation =
        static_cast<float>(std::max(w, h)) / static_cast<float>(std::min(w, h));
    const float fill = static_cast<float>(area) / static_cast<float>(w * h);
    if (elongation > config_.max_elongation_ || fill < config_.min_fill_ratio_) {
      continue;
    }

    float  peak   = 0.0f;
    double bg_sum = 0.0;
    for (int y = y0; y < y0 + h; ++y) {
      const int*   lab = labels.ptr<int>(y);
      const float* l   = luma.ptr<float>(y);
      const float* b   = background.ptr<float>(y);
      for (int x = x0; x < x0 + w; ++x) {
        if (lab[x] == label) {
          peak = std::max(peak, l[x]);
          bg_sum += b[x];
        }
      }
    }
    const float bg_level  = static_cast<float>(bg_sum / area);
    const float half_max  = bg_level + (peak - bg_level) * 0.5f;

    int         above_half = 0;
    double      wsum = 0.0, wx = 0.0, wy = 0.0;
    for (int y = y0; y < y0 + h; ++y) {
      const int*   lab = labels.ptr<int>(y);
      const float* l   = luma.ptr<float>(y);
      for (int x = x0; x < x0 + w; ++x) {
        if (lab[x] != label) {
          continue;
        }
        if (l[x] >= half_max) {
          ++above_half;
        }
        const double weight = std::max(0.0f, l[x] - bg_level);
        wsum += weight;
        wx += weight * x;
        wy += weight * y;
      }
    }

    Star star;
    if (wsum > 0.0) {
      star.center_ = cv::Point2f(static_cast<float>(wx / wsum), static_cast<float>(wy / wsum));
    } else {
      star.center_ = cv::Point2f(static_cast<float>(centroids.at<double>(label, 0)),
                                 static_cast<float>(centroids.at<double>(label, 1)));
    }
    star.radius_     = std::sqrt(static_cast<float>(std::max(above_half, 1)) /
                                 std::numbers::pi_v<float>);
    star.peak_       = peak;
    star.background_ = bg_level;
    stars.push_back(star);
  }
  return stars;
}
};  // namespace astroslide
