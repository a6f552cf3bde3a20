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

#include <memory>
#include <nlohmann/json.hpp>
#include <opencv2/core.hpp>
#include <string>
#include <vector>

#include "config/engine_config.hpp"
#include "edit/pipeline/pipeline_run.hpp"
#include "edit/preset/preset_definition.hpp"
#include "edit/preset/preset_registry.hpp"
#include "image/pixel_buffer.hpp"

namespace astroslide {
/**
 * @brief A stage with its parameters scaled by the intensity
 *
 */
struct ResolvedStage {
  std::string    op_;
  nlohmann::json params_;
  /**
   * @brief Every strength parameter sits at its off value, the stage is skipped
   *
   */
  bool           identity_ = false;
};

/**
 * @brief Build the subject mask of a buffer: luminance above the threshold, then a morphological
 * close and open with an elliptical kernel when cleanup_kernel > 0.
 *
 * @return cv::Mat CV_8UC1, 255 on the subject
 */
auto BuildSubjectMask(const PixelBuffer& buffer, const SubjectMaskDefinition& mask) -> cv::Mat;

class PresetEngine {
 private:
  std::shared_ptr<const PresetRegistry> registry_;
  EngineConfig                          config_;

  /**
   * @brief Engine level defaults (denoise radius, star thresholds) under the stage parameters
   *
   */
  auto WithDefaults(const std::string& op, const nlohmann::json& params) const -> nlohmann::json;

 public:
  PresetEngine(std::shared_ptr<const PresetRegistry> registry, const EngineConfig& config);

  /**
   * @brief Scale every strength parameter of the preset to off + intensity * (nominal - off).
   * Other parameters are copied as they are.
   *
   * @param preset
   * @param intensity in [0, 1]
   * @return std::vector<ResolvedStage>
   */
  auto ResolveStages(const PresetDefinition& preset, float intensity) const
      -> std::vector<ResolvedStage>;
  auto ResolveStages(const preset_id_t& preset_id, float intensity) const
      -> std::vector<ResolvedStage>;

  /**
   * @brief Run a preset on a copy of the input. Any failure aborts the run and throws, no partial
   * result is returned.
   *
   * @param input
   * @param preset_id
   * @param intensity
   * @param run optional progress object, must be IDLE
   * @param overrides stages appended after the preset, taken verbatim
   * @return PixelBuffer
   */
  auto Run(const PixelBuffer& input, const preset_id_t& preset_id, float intensity,
           PipelineRun* run = nullptr, const std::vector<StageDefinition>& overrides = {}) const
      -> PixelBuffer;

  auto GetRegistry() const -> const PresetRegistry& { return *registry_; }
  auto GetConfig() const -> const EngineConfig& { return config_; }
};
};  // namespace astroslide
