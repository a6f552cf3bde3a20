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

#include "edit/operators/utils/color_conversion.hpp"

#include <format>
#include <opencv2/imgproc.hpp>
#include <vector>

#include "type/enhance_error.hpp"

namespace astroslide::ColorCvt {
namespace {
void ExpectColorSpace(const PixelBuffer& buffer, ColorSpace expected, const char* who) {
  ValidateBuffer(buffer, who);
  if (buffer.Channels() != 3 || buffer.GetColorSpace() != expected) {
    throw EnhanceException(EnhanceErrorCode::INVALID_PARAMETER,
                           std::format("{}: unexpected color space or channel count", who));
  }
}

auto Convert(const PixelBuffer& src, int code, ColorSpace target, bool clamp) -> PixelBuffer {
  cv::Mat dst;
  cv::cvtColor(src.GetCPUData(), dst, code);
  auto result = PixelBuffer::FromFloatMat(std::move(dst), target);
  if (clamp) {
    result.Clamp();
  }
  return result;
}
}  // namespace

auto RGB2HSV(const PixelBuffer& rgb) -> PixelBuffer {
  ExpectColorSpace(rgb, ColorSpace::RGB, "RGB2HSV");
  return Convert(rgb, cv::COLOR_RGB2HSV, ColorSpace::HSV, false);
}

auto HSV2RGB(const PixelBuffer& hsv) -> PixelBuffer {
  ExpectColorSpace(hsv, ColorSpace::HSV, "HSV2RGB");
  // Saturation and value may have been scaled past 1, hue must stay on the circle
  cv::Mat              data = hsv.GetCPUData().clone();
  std::vector<cv::Mat> planes;
  cv::split(data, planes);
  cv::threshold(planes[1], planes[1], 1.0, 1.0, cv::THRESH_TRUNC);
  cv::threshold(planes[2], planes[2], 1.0, 1.0, cv::THRESH_TRUNC);
  cv::max(planes[1], 0.0, planes[1]);
  cv::max(planes[2], 0.0, planes[2]);
  cv::merge(planes, data);

  cv::Mat dst;
  cv::cvtColor(data, dst, cv::COLOR_HSV2RGB);
  auto result = PixelBuffer::FromFloatMat(std::move(dst), ColorSpace::RGB);
  result.Clamp();
  return result;
}

auto RGB2LAB(const PixelBuffer& rgb) -> PixelBuffer {
  ExpectColorSpace(rgb, ColorSpace::RGB, "RGB2LAB");
  return Convert(rgb, cv::COLOR_RGB2Lab, ColorSpace::LAB, false);
}

auto LAB2RGB(const PixelBuffer& lab) -> PixelBuffer {
  ExpectColorSpace(lab, ColorSpace::LAB, "LAB2RGB");
  return Convert(lab, cv::COLOR_Lab2RGB, ColorSpace::RGB, true);
}

auto ScaleChannel(const PixelBuffer& buffer, int channel_index, float gain) -> PixelBuffer {
  ValidateBuffer(buffer, "ScaleChannel");
  if (channel_index < 0 || channel_index >= buffer.Channels()) {
    throw EnhanceException(EnhanceErrorCode::INVALID_PARAMETER,
                           std::format("ScaleChannel: channel index {} out of range", channel_index));
  }
  // Work on a scratch copy, the input stays untouched
  PixelBuffer          result = buffer.Clone();
  cv::Mat              data   = result.GetCPUData();
  std::vector<cv::Mat> planes;
  cv::split(data, planes);
  planes[channel_index] *= gain;
  cv::Mat merged;
  cv::merge(planes, merged);
  result.ReplaceData(std::move(merged));
  return result;
}

auto ApplyChannelGains(const PixelBuffer& buffer, const std::array<float, 3>& gains)
    -> PixelBuffer {
  ValidateBuffer(buffer, "ApplyChannelGains");
  PixelBuffer result = buffer.Clone();
  cv::Mat     data   = result.GetCPUData();
  if (data.channels() == 1) {
    data *= gains[0];
    return result;
  }
  cv::multiply(data, cv::Scalar(gains[0], gains[1], gains[2]), data);
  return result;
}

auto Luminance(const PixelBuffer& buffer) -> cv::Mat {
  ValidateBuffer(buffer, "Luminance");
  const cv::Mat& data = buffer.GetCPUData();
  if (data.channels() == 1) {
    return data.clone();
  }
  if (buffer.GetColorSpace() != ColorSpace::RGB) {
    throw EnhanceException(EnhanceErrorCode::INVALID_PARAMETER,
                           "Luminance: buffer must be RGB or GRAY");
  }
  cv::Mat luma(data.size(), CV_32FC1);
  for (int r = 0; r < data.rows; ++r) {
    const auto* src = data.ptr<cv::Vec3f>(r);
    auto*       dst = luma.ptr<float>(r);
    for (int c = 0; c < data.cols; ++c) {
      dst[c] = kLumaR * src[c][0] + kLumaG * src[c][1] + kLumaB * src[c][2];
    }
  }
  return luma;
}
};  // namespace astroslide::ColorCvt
