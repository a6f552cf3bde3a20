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

#include "edit/operators/CPU_kernels/detail_kernels.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <opencv2/imgproc.hpp>

#include "edit/operators/utils/color_conversion.hpp"
#include "type/enhance_error.hpp"

namespace astroslide::kernels {
auto GradientMagnitude(const cv::Mat& plane) -> cv::Mat {
  cv::Mat gx, gy, mag;
  cv::Sobel(plane, gx, CV_32F, 1, 0, 3, 1.0, 0.0, cv::BORDER_REPLICATE);
  cv::Sobel(plane, gy, CV_32F, 0, 1, 3, 1.0, 0.0, cv::BORDER_REPLICATE);
  cv::magnitude(gx, gy, mag);
  // The 3x3 Sobel kernel weighs a unit step by 4
  mag *= 0.25;
  return mag;
}

auto EstimateNoiseLevel(const PixelBuffer& buffer) -> float {
  ValidateBuffer(buffer, "EstimateNoiseLevel");
  cv::Mat luma = ColorCvt::Luminance(buffer);
  cv::Mat luma_8u;
  luma.convertTo(luma_8u, CV_8U, 255.0);

  cv::Mat lap;
  cv::Laplacian(luma_8u, lap, CV_64F);
  cv::Scalar mean, stddev;
  cv::meanStdDev(lap, mean, stddev);
  const double variance = stddev[0] * stddev[0];
  return static_cast<float>(std::min(variance / 1000.0, 1.0));
}

auto Denoise(const PixelBuffer& buffer, const DenoiseParams& params) -> PixelBuffer {
  ValidateBuffer(buffer, "Denoise");
  if (!(params.strength_ >= 0.0f) || !std::isfinite(params.strength_)) {
    throw EnhanceException(EnhanceErrorCode::INVALID_PARAMETER,
                           std::format("Denoise: strength must be >= 0, got {}", params.strength_));
  }
  if (params.max_radius_ < 1 || !(params.edge_threshold_ > 0.0f)) {
    throw EnhanceException(EnhanceErrorCode::INVALID_PARAMETER,
                           "Denoise: max radius and edge threshold must be positive");
  }
  if (params.strength_ == 0.0f) {
    return buffer.Clone();
  }

  const int radius =
      std::max(1, static_cast<int>(std::lround(std::min(params.strength_, 1.0f) *
                                               static_cast<float>(params.max_radius_))));
  const cv::Mat& src = buffer.GetCPUData();
  cv::Mat        smoothed;
  // bilateralFilter does not work in place
  cv::bilateralFilter(src, smoothed, 2 * radius + 1, params.edge_threshold_,
                      static_cast<double>(radius), cv::BORDER_REPLICATE);

  const float   blend = std::min(params.strength_, 1.0f);
  cv::Mat       out;
  cv::addWeighted(src, 1.0 - blend, smoothed, blend, 0.0, out);

  // Edges keep their original samples
  cv::Mat       edges = GradientMagnitude(ColorCvt::Luminance(buffer)) > params.edge_threshold_;
  src.copyTo(out, edges);

  auto result = PixelBuffer::FromFloatMat(std::move(out), buffer.GetColorSpace());
  result.Clamp();
  return result;
}

auto UnsharpMask(const PixelBuffer& buffer, float radius, float amount) -> PixelBuffer {
  ValidateBuffer(buffer, "UnsharpMask");
  if (!(radius > 0.0f) || !std::isfinite(radius) || !std::isfinite(amount)) {
    throw EnhanceException(
        EnhanceErrorCode::INVALID_PARAMETER,
        std::format("UnsharpMask: invalid radius {} or amount {}", radius, amount));
  }
  if (amount == 0.0f) {
    return buffer.Clone();
  }
  const cv::Mat& img = buffer.GetCPUData();
  cv::Mat        blurred;
  cv::GaussianBlur(img, blurred, cv::Size(), radius, radius, cv::BORDER_REPLICATE);

  cv::Mat high_pass = img - blurred;
  cv::Mat out;
  cv::scaleAdd(high_pass, amount, img, out);

  auto result = PixelBuffer::FromFloatMat(std::move(out), buffer.GetColorSpace());
  result.Clamp();
  return result;
}
};  // namespace astroslide::kernels
