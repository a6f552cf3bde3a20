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

#include <chrono>
#include <cstddef>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include "edit/star/star_detector.hpp"
#include "type/type.hpp"

namespace astroslide {
struct SchedulerConfig {
  size_t                    worker_count_        = 4;
  /**
   * @brief Upper bound on the summed pixel count of running tasks. A single task larger than the
   * bound still runs, alone.
   *
   */
  pixel_cost_t              max_inflight_pixels_ = 64ull * 1024 * 1024;
  size_t                    max_queue_depth_     = 16;
  std::chrono::milliseconds timeout_{120000};
};

struct PreviewConfig {
  int target_size_ = 512;
};

struct DenoiseConfig {
  int   max_radius_     = 4;
  float edge_threshold_ = 0.08f;
};

struct EngineConfig {
  SchedulerConfig               scheduler_;
  PreviewConfig                 preview_;
  StarDetectionConfig           star_detection_;
  DenoiseConfig                 denoise_;
  std::string                   log_level_ = "info";
  /**
   * @brief Preset document merged over the built-in presets
   *
   */
  std::optional<nlohmann::json> presets_;

  /**
   * @brief Read a configuration document. Missing keys keep their defaults, values of the wrong
   * type or out of range raise INVALID_PARAMETER.
   *
   * @param j
   * @return EngineConfig
   */
  static auto                   FromJson(const nlohmann::json& j) -> EngineConfig;
  static auto                   FromString(const std::string& text) -> EngineConfig;
  auto                          ToJson() const -> nlohmann::json;
};
};  // namespace astroslide
