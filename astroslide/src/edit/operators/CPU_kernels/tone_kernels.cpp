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

#include "edit/operators/CPU_kernels/tone_kernels.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <format>
#include <opencv2/imgproc.hpp>
#include <vector>

#include "edit/operators/utils/color_conversion.hpp"
#include "type/enhance_error.hpp"

namespace astroslide::kernels {
namespace {
constexpr int kBins = 256;

inline auto BinOf(float v) -> int {
  return std::clamp(static_cast<int>(v * (kBins - 1) + 0.5f), 0, kBins - 1);
}

/**
 * @brief Clip a tile histogram at limit and hand the excess back uniformly, the same scheme as
 * OpenCV's CLAHE (batch to every bin, residual spread with a fixed step).
 *
 */
void ClipHistogram(std::array<int, kBins>& hist, int limit) {
  int excess = 0;
  for (int& bin : hist) {
    if (bin > limit) {
      excess += bin - limit;
      bin = limit;
    }
  }
  const int batch    = excess / kBins;
  int       residual = excess - batch * kBins;
  for (int& bin : hist) {
    bin += batch;
  }
  if (residual > 0) {
    const int step = std::max(kBins / residual, 1);
    for (int i = 0; i < kBins && residual > 0; i += step, --residual) {
      hist[i]++;
    }
  }
}
}  // namespace

auto Percentile(const cv::Mat& plane, double percentile) -> float {
  if (plane.empty() || plane.type() != CV_32FC1) {
    throw EnhanceException(EnhanceErrorCode::INVALID_PARAMETER,
                           "Percentile: expected a non-empty CV_32FC1 plane");
  }
  std::vector<float> values;
  values.reserve(plane.total());
  for (int r = 0; r < plane.rows; ++r) {
    const float* row = plane.ptr<float>(r);
    values.insert(values.end(), row, row + plane.cols);
  }

  const double p    = std::clamp(percentile, 0.0, 100.0);
  const double rank = p / 100.0 * static_cast<double>(values.size() - 1);
  const auto   lo   = static_cast<size_t>(std::floor(rank));
  const auto   hi   = static_cast<size_t>(std::ceil(rank));

  std::nth_element(values.begin(), values.begin() + lo, values.end());
  const float lo_value = values[lo];
  if (hi == lo) {
    return lo_value;
  }
  // Everything after lo is >= lo_value, the next rank is the minimum of that tail
  const float hi_value = *std::min_element(values.begin() + lo + 1, values.end());
  return lo_value + static_cast<float>(rank - static_cast<double>(lo)) * (hi_value - lo_value);
}

auto HistogramStretch(const PixelBuffer& buffer, double low_percentile, double high_percentile)
    -> PixelBuffer {
  ValidateBuffer(buffer, "HistogramStretch");
  if (!(low_percentile >= 0.0 && high_percentile <= 100.0 && low_percentile <= high_percentile)) {
    throw EnhanceException(
        EnhanceErrorCode::INVALID_PARAMETER,
        std::format("HistogramStretch: invalid percentiles [{}, {}]", low_percentile,
                    high_percentile));
  }

  std::vector<cv::Mat> planes;
  cv::split(buffer.GetCPUData(), planes);
  for (auto& plane : planes) {
    const float lo = Percentile(plane, low_percentile);
    const float hi = Percentile(plane, high_percentile);
    if (!(hi > lo)) {
      // Flat channel, nothing to stretch
      continue;
    }
    const float range = hi - lo;
    for (int r = 0; r < plane.rows; ++r) {
      float* row = plane.ptr<float>(r);
      for (int c = 0; c < plane.cols; ++c) {
        row[c] = std::clamp((row[c] - lo) / range, 0.0f, 1.0f);
      }
    }
  }

  cv::Mat merged;
  cv::merge(planes, merged);
  return PixelBuffer::FromFloatMat(std::move(merged), buffer.GetColorSpace());
}

auto GammaCurve(const PixelBuffer& buffer, float gamma) -> PixelBuffer {
  ValidateBuffer(buffer, "GammaCurve");
  if (!(gamma > 0.0f) || !std::isfinite(gamma)) {
    throw EnhanceException(EnhanceErrorCode::INVALID_PARAMETER,
                           std::format("GammaCurve: gamma must be positive, got {}", gamma));
  }
  cv::Mat out;
  cv::pow(buffer.GetCPUData(), gamma, out);
  auto result = PixelBuffer::FromFloatMat(std::move(out), buffer.GetColorSpace());
  result.Clamp();
  return result;
}

auto EqualizeTiles(const cv::Mat& plane, double clip_limit, int tile_grid_size) -> cv::Mat {
  if (plane.empty() || plane.type() != CV_32FC1) {
    throw EnhanceException(EnhanceErrorCode::INVALID_PARAMETER,
                           "AdaptiveContrast: expected a non-empty CV_32FC1 plane");
  }
  if (tile_grid_size < 1) {
    throw EnhanceException(
        EnhanceErrorCode::INVALID_PARAMETER,
        std::format("AdaptiveContrast: tile grid size must be >= 1, got {}", tile_grid_size));
  }

  const int rows   = plane.rows;
  const int cols   = plane.cols;
  // Never more tiles than pixels along an axis, so every tile holds at least one pixel
  const int grid_x = std::min(tile_grid_size, cols);
  const int grid_y = std::min(tile_grid_size, rows);

  std::vector<std::array<float, kBins>> luts(static_cast<size_t>(grid_x) * grid_y);

  for (int ty = 0; ty < grid_y; ++ty) {
    const int y0 = ty * rows / grid_y;
    const int y1 = (ty + 1) * rows / grid_y;
    for (int tx = 0; tx < grid_x; ++tx) {
      const int              x0 = tx * cols / grid_x;
      const int              x1 = (tx + 1) * cols / grid_x;
      const int              n  = (y1 - y0) * (x1 - x0);

      std::array<int, kBins> hist{};
      for (int y = y0; y < y1; ++y) {
        const float* row = plane.ptr<float>(y);
        for (int x = x0; x < x1; ++x) {
          hist[BinOf(row[x])]++;
        }
      }

      if (clip_limit > 0.0) {
        const int limit = std::max(1, static_cast<int>(clip_limit * n / kBins));
        ClipHistogram(hist, limit);
      }

      // The CDF is normalized by the pixel count, which is never zero
      auto&       lut = luts[static_cast<size_t>(ty) * grid_x + tx];
      int         sum = 0;
      const float inv = 1.0f / static_cast<float>(n);
      for (int b = 0; b < kBins; ++b) {
        sum += hist[b];
        lut[b] = std::min(1.0f, static_cast<float>(sum) * inv);
      }
    }
  }

  // Bilinear blend between the four nearest tile mappings
  cv::Mat     result(plane.size(), CV_32FC1);
  const float tile_w = static_cast<float>(cols) / static_cast<float>(grid_x);
  const float tile_h = static_cast<float>(rows) / static_cast<float>(grid_y);

  for (int y = 0; y < rows; ++y) {
    const float  tyf = static_cast<float>(y) / tile_h - 0.5f;
    int          ty1 = static_cast<int>(std::floor(tyf));
    int          ty2 = ty1 + 1;
    const float  ya  = tyf - static_cast<float>(ty1);
    ty1              = std::max(ty1, 0);
    ty2              = std::min(ty2, grid_y - 1);

    const float* src = plane.ptr<float>(y);
    float*       dst = result.ptr<float>(y);
    for (int x = 0; x < cols; ++x) {
      const float txf = static_cast<float>(x) / tile_w - 0.5f;
      int         tx1 = static_cast<int>(std::floor(txf));
      int         tx2 = tx1 + 1;
      const float xa  = txf - static_cast<float>(tx1);
      tx1             = std::max(tx1, 0);
      tx2             = std::min(tx2, grid_x - 1);

      const int   bin = BinOf(src[x]);
      const float v11 = luts[static_cast<size_t>(ty1) * grid_x + tx1][bin];
      const float v12 = luts[static_cast<size_t>(ty1) * grid_x + tx2][bin];
      const float v21 = luts[static_cast<size_t>(ty2) * grid_x + tx1][bin];
      const float v22 = luts[static_cast<size_t>(ty2) * grid_x + tx2][bin];

      dst[x] = (1.0f - ya) * ((1.0f - xa) * v11 + xa * v12) + ya * ((1.0f - xa) * v21 + xa * v22);
    }
  }
  return result;
}

auto MapLuminance(const PixelBuffer&                             buffer,
                  const std::function<cv::Mat(const cv::Mat&)>& plane_fn) -> PixelBuffer {
  ValidateBuffer(buffer, "MapLuminance");
  if (buffer.Channels() == 1) {
    cv::Mat mapped = plane_fn(buffer.GetCPUData());
    auto    result = PixelBuffer::FromFloatMat(std::move(mapped), buffer.GetColorSpace());
    result.Clamp();
    return result;
  }

  auto                 lab = ColorCvt::RGB2LAB(buffer);
  std::vector<cv::Mat> planes;
  cv::split(lab.GetCPUData(), planes);

  cv::Mat l_norm;
  planes[0].convertTo(l_norm, CV_32F, 1.0 / 100.0);
  cv::Mat mapped = plane_fn(l_norm);
  mapped.convertTo(planes[0], CV_32F, 100.0);

  cv::Mat merged;
  cv::merge(planes, merged);
  lab.ReplaceData(std::move(merged));
  return ColorCvt::LAB2RGB(lab);
}

auto AdaptiveContrast(const PixelBuffer& buffer, double clip_limit, int tile_grid_size)
    -> PixelBuffer {
  return MapLuminance(buffer, [clip_limit, tile_grid_size](const cv::Mat& l) {
    cv::Mat clamped;
    cv::max(l, 0.0, clamped);
    cv::min(clamped, 1.0, clamped);
    return EqualizeTiles(clamped, clip_limit, tile_grid_size);
  });
}

auto ToneCurve(const PixelBuffer& buffer, const ToneCurveParams& params) -> PixelBuffer {
  if (!(params.highlight_threshold_ >= 0.0f && params.highlight_threshold_ < 1.0f)) {
    throw EnhanceException(EnhanceErrorCode::INVALID_PARAMETER,
                           "ToneCurve: highlight threshold must be in [0, 1)");
  }
  return MapLuminance(buffer, [&params](const cv::Mat& l) {
    cv::Mat     out(l.size(), CV_32FC1);
    const float knee = params.highlight_threshold_;
    for (int r = 0; r < l.rows; ++r) {
      const float* src = l.ptr<float>(r);
      float*       dst = out.ptr<float>(r);
      for (int c = 0; c < l.cols; ++c) {
        float v = std::clamp(src[c], 0.0f, 1.0f);

        if (params.shadow_lift_ != 0.0f) {
          const float lifted = std::pow(v, params.shadow_gamma_);
          const float w      = (1.0f - v) * (1.0f - v);
          v                  = std::clamp(v + (lifted - v) * w * params.shadow_lift_, 0.0f, 1.0f);
        }
        if (params.highlight_compression_ != 0.0f) {
          const float mask = std::max(v - knee, 0.0f) / (1.0f - knee);
          v = std::clamp(v - mask * params.highlight_compression_ * (v - knee), 0.0f, 1.0f);
        }
        if (params.s_curve_ != 0.0f) {
          const float s = 1.0f / (1.0f + std::exp(-params.s_curve_slope_ * (v - 0.5f)));
          v             = std::clamp(v * (1.0f - params.s_curve_) + s * params.s_curve_, 0.0f, 1.0f);
        }
        dst[c] = v;
      }
    }
    return out;
  });
}
};  // namespace astroslide::kernels
