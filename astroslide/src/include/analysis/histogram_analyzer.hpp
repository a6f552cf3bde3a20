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

#include <array>
#include <cstdint>
#include <nlohmann/json.hpp>

#include "image/pixel_buffer.hpp"

namespace astroslide {
constexpr int kHistogramBins = 256;

using HistogramBins          = std::array<uint64_t, kHistogramBins>;

struct HistogramResult {
  HistogramBins red_{};
  HistogramBins green_{};
  HistogramBins blue_{};
  HistogramBins luminance_{};

  /**
   * @brief {"red": [...], "green": [...], "blue": [...], "luminance": [...]}
   *
   */
  auto          ToJson() const -> nlohmann::json;
};

class HistogramAnalyzer {
 public:
  /**
   * @brief Bin index of a normalized sample, floor(value * 255) clamped to [0, 255]
   *
   */
  static auto BinOf(float value) -> int;

  /**
   * @brief 256-bin counts per channel and of the perceptual luminance. Gray buffers report the
   * same plane for every channel.
   *
   * @param buffer RGB or GRAY buffer
   * @return HistogramResult
   */
  static auto Compute(const PixelBuffer& buffer) -> HistogramResult;
};
};  // namespace astroslide
