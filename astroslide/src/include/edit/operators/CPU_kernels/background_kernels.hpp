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

#include "image/pixel_buffer.hpp"

namespace astroslide::kernels {
/**
 * @brief Smooth background model of a single plane. The plane is split into grid x grid cells,
 * each cell contributes the value at the given percentile, and the coarse grid is resized back to
 * the plane size with bicubic interpolation.
 *
 * @param plane CV_32FC1
 * @param grid cells per dimension, reduced to the plane size when larger
 * @param percentile
 * @return cv::Mat CV_32FC1 of the same size as plane
 */
auto EstimateBackground(const cv::Mat& plane, int grid, double percentile) -> cv::Mat;

/**
 * @brief Median absolute deviation per cell scaled by 1.4826, resized like EstimateBackground
 *
 */
auto EstimateNoiseMap(const cv::Mat& plane, int grid) -> cv::Mat;

/**
 * @brief Remove large scale gradients (light pollution, vignetting). Per channel the background
 * model is subtracted and its median added back, then the result is blended with the input by
 * amount.
 *
 */
auto ExtractBackground(const PixelBuffer& buffer, int grid, double percentile, float amount)
    -> PixelBuffer;
};  // namespace astroslide::kernels
