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

#include "edit/pipeline/preview_generator.hpp"

#include <easy/profiler.h>

#include <algorithm>
#include <cmath>
#include <format>
#include <opencv2/imgproc.hpp>

#include "type/enhance_error.hpp"

namespace astroslide {
PreviewGenerator::PreviewGenerator(const PresetEngine& engine) : engine_(engine) {}

auto PreviewGenerator::FitSize(cv::Size size, int target_size) -> cv::Size {
  if (size.width <= target_size && size.height <= target_size) {
    return size;
  }
  const double scale = static_cast<double>(target_size) / std::max(size.width, size.height);
  const int    w     = std::clamp(static_cast<int>(std::lround(size.width * scale)), 1, target_size);
  const int    h     = std::clamp(static_cast<int>(std::lround(size.height * scale)), 1, target_size);
  return {w, h};
}

auto PreviewGenerator::Generate(const PixelBuffer& buffer, const preset_id_t& preset_id,
                                int target_size, PipelineRun* run) const -> PixelBuffer {
  EASY_FUNCTION(profiler::colors::Cyan);
  if (target_size <= 0) {
    throw EnhanceException(EnhanceErrorCode::INVALID_PARAMETER,
                           std::format("Preview: target size must be positive, got {}", target_size));
  }
  ValidateBuffer(buffer, "Preview");
  // Fail fast on an unknown preset before resampling
  engine_.GetRegistry().Get(preset_id);

  const cv::Size source = buffer.GetCPUData().size();
  const cv::Size fitted = FitSize(source, target_size);
  if (fitted == source) {
    return engine_.Run(buffer, preset_id, 1.0f, run);
  }

  cv::Mat small;
  cv::resize(buffer.GetCPUData(), small, fitted, 0.0, 0.0, cv::INTER_AREA);
  auto preview = PixelBuffer::FromFloatMat(std::move(small), buffer.GetColorSpace());
  preview.Clamp();
  return engine_.Run(preview, preset_id, 1.0f, run);
}
};  // namespace astroslide
