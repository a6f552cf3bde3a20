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

#include "image/pixel_buffer.hpp"

#include <opencv2/core/hal/interface.h>

#include <format>
#include <opencv2/imgproc.hpp>
#include <utility>

#include "type/enhance_error.hpp"

namespace astroslide {
PixelBuffer::PixelBuffer(cv::Mat&& data, ColorSpace color_space)
    : cpu_data_(std::move(data)), color_space_(color_space) {}

PixelBuffer::PixelBuffer(PixelBuffer&& other) noexcept
    : cpu_data_(std::move(other.cpu_data_)), color_space_(other.color_space_) {}

PixelBuffer& PixelBuffer::operator=(PixelBuffer&& other) noexcept {
  if (this != &other) {
    cpu_data_    = std::move(other.cpu_data_);
    color_space_ = other.color_space_;
  }
  return *this;
}

auto PixelBuffer::FromMat(const cv::Mat& data) -> PixelBuffer {
  if (data.empty() || data.dims != 2) {
    throw EnhanceException(EnhanceErrorCode::INVALID_PARAMETER,
                           "PixelBuffer: image data is empty or not two-dimensional");
  }
  const int channels = data.channels();
  if (channels != 1 && channels != 3) {
    throw EnhanceException(EnhanceErrorCode::INVALID_PARAMETER,
                           std::format("PixelBuffer: unsupported channel count {}", channels));
  }

  cv::Mat normalized;
  switch (data.depth()) {
    case CV_8U:
      data.convertTo(normalized, CV_32F, 1.0 / 255.0);
      break;
    case CV_16U:
      data.convertTo(normalized, CV_32F, 1.0 / 65535.0);
      break;
    case CV_32F:
    case CV_64F:
      data.convertTo(normalized, CV_32F);
      cv::patchNaNs(normalized, 0.0);
      break;
    default:
      throw EnhanceException(
          EnhanceErrorCode::INVALID_PARAMETER,
          std::format("PixelBuffer: unsupported sample depth {}", data.depth()));
  }

  PixelBuffer buffer{std::move(normalized), channels == 1 ? ColorSpace::GRAY : ColorSpace::RGB};
  buffer.Clamp();
  return buffer;
}

auto PixelBuffer::FromFloatMat(cv::Mat&& data, ColorSpace color_space) -> PixelBuffer {
  if (data.empty() || data.depth() != CV_32F || (data.channels() != 1 && data.channels() != 3)) {
    throw EnhanceException(EnhanceErrorCode::INVALID_PARAMETER,
                           "PixelBuffer: expected CV_32FC1 or CV_32FC3 data");
  }
  return PixelBuffer{std::move(data), color_space};
}

auto PixelBuffer::Clone() const -> PixelBuffer { return PixelBuffer{cpu_data_.clone(), color_space_}; }

void PixelBuffer::ReplaceData(cv::Mat&& data, ColorSpace color_space) {
  if (data.size() != cpu_data_.size() || data.type() != cpu_data_.type()) {
    throw std::runtime_error("PixelBuffer: replacement data does not match the buffer shape");
  }
  cpu_data_    = std::move(data);
  color_space_ = color_space;
}

void PixelBuffer::Clamp() {
  if (cpu_data_.empty()) {
    return;
  }
  cv::threshold(cpu_data_, cpu_data_, 1.0, 1.0, cv::THRESH_TRUNC);
  cv::threshold(cpu_data_, cpu_data_, 0.0, 0.0, cv::THRESH_TOZERO);
}

void ValidateBuffer(const PixelBuffer& buffer, const char* who) {
  if (buffer.IsEmpty()) {
    throw EnhanceException(EnhanceErrorCode::INVALID_PARAMETER,
                           std::format("{}: input buffer is empty", who));
  }
  const auto& data = buffer.GetCPUData();
  if (data.depth() != CV_32F || (data.channels() != 1 && data.channels() != 3)) {
    throw EnhanceException(EnhanceErrorCode::INVALID_PARAMETER,
                           std::format("{}: input buffer must hold 1 or 3 float channels", who));
  }
}
};  // namespace astroslide
