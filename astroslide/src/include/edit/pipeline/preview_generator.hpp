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

#include "edit/pipeline/preset_engine.hpp"
#include "image/pixel_buffer.hpp"

namespace astroslide {
class PreviewGenerator {
 private:
  const PresetEngine& engine_;

 public:
  explicit PreviewGenerator(const PresetEngine& engine);

  /**
   * @brief Size that fits in target_size x target_size with the aspect ratio of size, never
   * larger than size and never smaller than 1 on either side
   *
   */
  static auto FitSize(cv::Size size, int target_size) -> cv::Size;

  /**
   * @brief Area-average the buffer down to fit target_size (a smaller buffer is left as is) and
   * run the preset at intensity 1 on it
   *
   * @param buffer
   * @param preset_id
   * @param target_size must be positive
   * @param run optional progress object
   * @return PixelBuffer
   */
  auto Generate(const PixelBuffer& buffer, const preset_id_t& preset_id, int target_size,
                PipelineRun* run = nullptr) const -> PixelBuffer;
};
};  // namespace astroslide
