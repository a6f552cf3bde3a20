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

#include <functional>
#include <opencv2/core.hpp>

#include "image/pixel_buffer.hpp"

namespace astroslide::kernels {
/**
 * @brief Value at the given percentile (0 - 100) of a single channel plane, linearly
 * interpolated between the two nearest ranks.
 *
 * @param plane CV_32FC1
 * @param percentile
 * @return float
 */
auto Percentile(const cv::Mat& plane, double percentile) -> float;

/**
 * @brief Per channel percentile stretch. The value at low_percentile maps to 0 and the value at
 * high_percentile maps to 1, with clamping. A channel whose two percentile values coincide is
 * left as is.
 *
 */
auto HistogramStretch(const PixelBuffer& buffer, double low_percentile, double high_percentile)
    -> PixelBuffer;

/**
 * @brief output = input ^ gamma per channel
 *
 */
auto GammaCurve(const PixelBuffer& buffer, float gamma) -> PixelBuffer;

/**
 * @brief Contrast limited adaptive histogram equalization of a single [0, 1] plane.
 *
 * @param plane CV_32FC1 in [0, 1]
 * @param clip_limit Histogram clip factor, <= 0 disables clipping
 * @param tile_grid_size Tiles per dimension, reduced to the image size when larger
 * @return cv::Mat
 */
auto EqualizeTiles(const cv::Mat& plane, double clip_limit, int tile_grid_size) -> cv::Mat;

/**
 * @brief CLAHE on the luminance of the buffer (LAB L for RGB input), colors are preserved
 *
 */
auto AdaptiveContrast(const PixelBuffer& buffer, double clip_limit, int tile_grid_size)
    -> PixelBuffer;

struct ToneCurveParams {
  float shadow_lift_           = 0.0f;
  float shadow_gamma_          = 0.85f;
  float highlight_compression_ = 0.0f;
  float highlight_threshold_   = 0.75f;
  float s_curve_               = 0.0f;
  float s_curve_slope_         = 10.0f;
};

/**
 * @brief Luminance tone curve: shadow lift weighted toward deep shadows, soft-knee highlight
 * compression and a sigmoid midtone contrast blend.
 *
 */
auto ToneCurve(const PixelBuffer& buffer, const ToneCurveParams& params) -> PixelBuffer;

/**
 * @brief Apply a plane function to the luminance of a buffer. RGB buffers go through LAB so
 * that chroma stays untouched; GRAY buffers are mapped directly.
 *
 */
auto MapLuminance(const PixelBuffer&                             buffer,
                  const std::function<cv::Mat(const cv::Mat&)>& plane_fn) -> PixelBuffer;
};  // namespace astroslide::kernels
