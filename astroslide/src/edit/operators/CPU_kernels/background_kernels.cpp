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

#include "edit/operators/CPU_kernels/background_kernels.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <opencv2/imgproc.hpp>
#include <vector>

#include "edit/operators/CPU_kernels/tone_kernels.hpp"
#include "type/enhance_error.hpp"

namespace astroslide::kernels {
namespace {
void CheckPlane(const cv::Mat& plane, int grid, const char* who) {
  if (plane.empty() || plane.type() != CV_32FC1) {
    throw EnhanceException(EnhanceErrorCode::INVALID_PARAMETER,
                           std::format("{}: expected a non-empty CV_32FC1 plane", who));
  }
  if (grid < 1) {
    throw EnhanceException(EnhanceErrorCode::INVALID_PARAMETER,
                           std::format("{}: grid must be >= 1, got {}", who, grid));
  }
}

/**
 * @brief Evaluate cell_fn on every grid cell and upsample the per-cell results to the plane size
 *
 */
template <typename CellFn>
auto MapCells(const cv::Mat& plane, int grid, CellFn&& cell_fn) -> cv::Mat {
  const int grid_x = std::min(grid, plane.cols);
  const int grid_y = std::min(grid, plane.rows);
  cv::Mat   coarse(grid_y, grid_x, CV_32FC1);
  for (int gy = 0; gy < grid_y; ++gy) {
    const int y0 = gy * plane.rows / grid_y;
    const int y1 = (gy + 1) * plane.rows / grid_y;
    for (int gx = 0; gx < grid_x; ++gx) {
      const int x0             = gx * plane.cols / grid_x;
      const int x1             = (gx + 1) * plane.cols / grid_x;
      coarse.at<float>(gy, gx) = cell_fn(plane(cv::Range(y0, y1), cv::Range(x0, x1)));
    }
  }
  cv::Mat full;
  cv::resize(coarse, full, plane.size(), 0.0, 0.0, cv::INTER_CUBIC);
  return full;
}
}  // namespace

auto EstimateBackground(const cv::Mat& plane, int grid, double percentile) -> cv::Mat {
  CheckPlane(plane, grid, "EstimateBackground");
  return MapCells(plane, grid, [percentile](const cv::Mat& cell) {
    // Percentile() copies the samples, so a non-contiguous ROI is fine
    return Percentile(cell, percentile);
  });
}

auto EstimateNoiseMap(const cv::Mat& plane, int grid) -> cv::Mat {
  CheckPlane(plane, grid, "EstimateNoiseMap");
  cv::Mat noise = MapCells(plane, grid, [](const cv::Mat& cell) {
    const float median = Percentile(cell, 50.0);
    cv::Mat     deviation;
    cv::absdiff(cell, cv::Scalar(median), deviation);
    return 1.4826f * Percentile(deviation, 50.0);
  });
  // Bicubic overshoot can go slightly negative between cells
  cv::max(noise, 0.0, noise);
  return noise;
}

auto ExtractBackground(const PixelBuffer& buffer, int grid, double percentile, float amount)
    -> PixelBuffer {
  ValidateBuffer(buffer, "ExtractBackground");
  if (!(percentile >= 0.0 && percentile <= 100.0) || !std::isfinite(amount)) {
    throw EnhanceException(
        EnhanceErrorCode::INVALID_PARAMETER,
        std::format("ExtractBackground: invalid percentile {} or amount {}", percentile, amount));
  }
  if (amount == 0.0f) {
    return buffer.Clone();
  }

  std::vector<cv::Mat> planes;
  cv::split(buffer.GetCPUData(), planes);
  for (auto& plane : planes) {
    cv::Mat     background = EstimateBackground(plane, grid, percentile);
    const float level      = Percentile(background, 50.0);
    cv::Mat     corrected  = plane - background + level;
    cv::addWeighted(plane, 1.0 - amount, corrected, amount, 0.0, plane);
  }

  cv::Mat merged;
  cv::merge(planes, merged);
  auto result = PixelBuffer::FromFloatMat(std::move(merged), buffer.GetColorSpace());
  result.Clamp();
  return result;
}
};  // namespace astroslide::kernels
