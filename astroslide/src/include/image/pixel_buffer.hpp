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

#include <cstddef>
#include <opencv2/core.hpp>
#include <utility>

#include "type/type.hpp"

namespace astroslide {
/**
 * @brief An owned height x width x channel image with float samples. RGB and GRAY buffers hold
 * values in [0, 1]; HSV and LAB buffers are intermediate representations that may exceed it.
 * The shape of a buffer never changes after construction.
 *
 */
class PixelBuffer {
 private:
  cv::Mat    cpu_data_;
  ColorSpace color_space_ = ColorSpace::RGB;

  PixelBuffer(cv::Mat&& data, ColorSpace color_space);

 public:
  PixelBuffer() = default;
  PixelBuffer(PixelBuffer&& other) noexcept;
  PixelBuffer& operator=(PixelBuffer&& other) noexcept;

  // Copies are always explicit through Clone()
  PixelBuffer(const PixelBuffer&)            = delete;
  PixelBuffer& operator=(const PixelBuffer&) = delete;

  /**
   * @brief Build a buffer from decoded image data. 8-bit and 16-bit samples are normalized to
   * [0, 1]; float samples are clamped into it and NaNs are zeroed. Only 1 or 3 channel data is
   * accepted.
   *
   * @param data
   * @return PixelBuffer
   */
  static auto FromMat(const cv::Mat& data) -> PixelBuffer;
  /**
   * @brief Wrap float data that is already in the given color space without normalizing it.
   *
   * @param data CV_32FC1 or CV_32FC3
   * @param color_space
   * @return PixelBuffer
   */
  static auto FromFloatMat(cv::Mat&& data, ColorSpace color_space) -> PixelBuffer;

  auto        Clone() const -> PixelBuffer;

  /**
   * @brief Get a header sharing the pixel memory of this buffer. Writing pixels through it
   * modifies the buffer, reassigning it does not.
   *
   * @return cv::Mat
   */
  auto        GetCPUData() -> cv::Mat { return cpu_data_; }
  auto        GetCPUData() const -> const cv::Mat& { return cpu_data_; }

  /**
   * @brief Replace the samples with data of the same shape, e.g. the output of an OpenCV call
   * that allocates its destination.
   *
   * @param data
   * @param color_space
   */
  void        ReplaceData(cv::Mat&& data, ColorSpace color_space);
  void        ReplaceData(cv::Mat&& data) { ReplaceData(std::move(data), color_space_); }

  void        Clamp();

  auto        Rows() const -> int { return cpu_data_.rows; }
  auto        Cols() const -> int { return cpu_data_.cols; }
  auto        Channels() const -> int { return cpu_data_.channels(); }
  auto        PixelCount() const -> pixel_cost_t {
    return static_cast<pixel_cost_t>(cpu_data_.rows) * static_cast<pixel_cost_t>(cpu_data_.cols);
  }
  auto GetColorSpace() const -> ColorSpace { return color_space_; }
  auto IsEmpty() const -> bool { return cpu_data_.empty(); }
};

/**
 * @brief Throw INVALID_PARAMETER unless the buffer holds 1 or 3 channel float samples
 *
 * @param buffer
 * @param who name used in the error message
 */
void ValidateBuffer(const PixelBuffer& buffer, const char* who);
};  // namespace astroslide
