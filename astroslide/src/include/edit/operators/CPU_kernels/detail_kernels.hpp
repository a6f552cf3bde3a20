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
struct DenoiseParams {
  float strength_       = 0.0f;
  /**
   * @brief Luminance gradient magnitude above which a pixel is treated as an edge and keeps its
   * original value. Also the range sigma of the bilateral filter.
   *
   */
  float edge_threshold_ = 0.08f;
  int   max_radius_     = 4;
};

/**
 * @brief Edge-preserving smoothing. The bilateral radius grows with strength, strength 0 returns
 * an equal buffer.
 *
 * @param buffer
 * @param params
 * @return PixelBuffer
 */
auto Denoise(const PixelBuffer& buffer, const DenoiseParams& params) -> PixelBuffer;

/**
 * @brief Normalized noise level in [0, 1] from the variance of the Laplacian of the luminance
 *
 */
auto EstimateNoiseLevel(const PixelBuffer& buffer) -> float;

/**
 * @brief Sobel gradient magnitude of a single plane, scaled so a unit step edge reads about 1
 *
 */
auto GradientMagnitude(const cv::Mat& plane) -> cv::Mat;

/**
 * @brief USM: output = input + amount * (input - GaussianBlur(input, radius)), clamped
 *
 */
auto UnsharpMask(const PixelBuffer& buffer, float radius, float amount) -> PixelBuffer;
};  // namespace astroslide::kernels
