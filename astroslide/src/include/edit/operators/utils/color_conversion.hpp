//  Copyright 2025 Yurun Zi
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

#include <array>
#include <opencv2/core.hpp>

#include "image/pixel_buffer.hpp"

namespace astroslide::ColorCvt {
// Perceptual luminance weights shared by the histogram, tone and star code
constexpr float kLumaR = 0.299f;
constexpr float kLumaG = 0.587f;
constexpr float kLumaB = 0.114f;

/**
 * @brief Convert an RGB buffer to HSV. H is in [0, 360), S and V in [0, 1].
 *
 * @param rgb
 * @return PixelBuffer tagged ColorSpace::HSV
 */
auto RGB2HSV(const PixelBuffer& rgb) -> PixelBuffer;
/**
 * @brief Convert an HSV buffer back to RGB, clamping the result to [0, 1]
 *
 */
auto HSV2RGB(const PixelBuffer& hsv) -> PixelBuffer;
/**
 * @brief Convert an RGB buffer to CIE L*a*b*. L is in [0, 100], a and b roughly in [-127, 127].
 *
 */
auto RGB2LAB(const PixelBuffer& rgb) -> PixelBuffer;
auto LAB2RGB(const PixelBuffer& lab) -> PixelBuffer;

/**
 * @brief Multiply one channel by gain, leaving the others untouched. The result is not clamped.
 *
 * @param buffer
 * @param channel_index
 * @param gain
 * @return PixelBuffer
 */
auto ScaleChannel(const PixelBuffer& buffer, int channel_index, float gain) -> PixelBuffer;

/**
 * @brief Multiply every channel by its own gain. Not clamped.
 *
 */
auto ApplyChannelGains(const PixelBuffer& buffer, const std::array<float, 3>& gains)
    -> PixelBuffer;

/**
 * @brief Perceptual luminance plane (CV_32FC1) of an RGB or GRAY buffer
 *
 * @param buffer
 * @return cv::Mat
 */
auto Luminance(const PixelBuffer& buffer) -> cv::Mat;
};  // namespace astroslide::ColorCvt
