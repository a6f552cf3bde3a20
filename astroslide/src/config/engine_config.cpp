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

#include "config/engine_config.hpp"

#include <cstdint>
#include <format>
#include <string_view>

#include "type/enhance_error.hpp"
#include "utils/json/json_reader.hpp"

namespace astroslide {
namespace {
// Counts are read signed so a negative value is rejected instead of wrapping around in size_t
template <typename T>
void ReadCount(const nlohmann::json& obj, std::string_view key, T& out, int64_t minimum) {
  int64_t value = static_cast<int64_t>(out);
  json_reader::ReadIfPresent(obj, key, value, "scheduler");
  if (value < minimum) {
    throw EnhanceException(EnhanceErrorCode::INVALID_PARAMETER,
                           std::format("scheduler: \"{}\" must be at least {}, got {}", key,
                                       minimum, value));
  }
  out = static_cast<T>(value);
}
}  // namespace

auto EngineConfig::FromJson(const nlohmann::json& j) -> EngineConfig {
  json_reader::ExpectObject(j, "config");
  EngineConfig config;

  if (j.contains("scheduler")) {
    const auto& s = json_reader::ExpectObject(j["scheduler"], "scheduler");
    ReadCount(s, "worker_count", config.scheduler_.worker_count_, 1);
    ReadCount(s, "max_inflight_pixels", config.scheduler_.max_inflight_pixels_, 1);
    ReadCount(s, "max_queue_depth", config.scheduler_.max_queue_depth_, 0);
    int64_t timeout_ms = config.scheduler_.timeout_.count();
    json_reader::ReadIfPresent(s, "timeout_ms", timeout_ms, "scheduler");
    if (timeout_ms <= 0) {
      throw EnhanceException(EnhanceErrorCode::INVALID_PARAMETER,
                             "scheduler: timeout_ms must be positive");
    }
    config.scheduler_.timeout_ = std::chrono::milliseconds(timeout_ms);
  }

  if (j.contains("preview")) {
    const auto& p = json_reader::ExpectObject(j["preview"], "preview");
    json_reader::ReadIfPresent(p, "target_size", config.preview_.target_size_, "preview");
    if (config.preview_.target_size_ <= 0) {
      throw EnhanceException(EnhanceErrorCode::INVALID_PARAMETER,
                             "preview: target_size must be positive");
    }
  }

  if (j.contains("star_detection")) {
    config.star_detection_.ReadJson(j["star_detection"]);
  }

  if (j.contains("denoise")) {
    const auto& d = json_reader::ExpectObject(j["denoise"], "denoise");
    json_reader::ReadIfPresent(d, "max_radius", config.denoise_.max_radius_, "denoise");
    json_reader::ReadIfPresent(d, "edge_threshold", config.denoise_.edge_threshold_, "denoise");
    if (config.denoise_.max_radius_ < 1 || !(config.denoise_.edge_threshold_ > 0.0f)) {
      throw EnhanceException(EnhanceErrorCode::INVALID_PARAMETER,
                             "denoise: max_radius and edge_threshold must be positive");
    }
  }

  json_reader::ReadIfPresent(j, "log_level", config.log_level_, "config");

  if (j.contains("presets")) {
    // Either a bare array of presets or a whole {"presets": [...]} document
    const auto& presets = j["presets"];
    if (presets.is_array()) {
      config.presets_ = nlohmann::json{{"presets", presets}};
    } else if (presets.is_object()) {
      config.presets_ = presets;
    } else {
      throw EnhanceException(EnhanceErrorCode::INVALID_PARAMETER,
                             "config: \"presets\" must be an array or a preset document");
    }
  }
  return config;
}

auto EngineConfig::FromString(const std::string& text) -> EngineConfig {
  nlohmann::json j;
  try {
    j = nlohmann::json::parse(text);
  } catch (const nlohmann::json::parse_error& e) {
    throw EnhanceException(EnhanceErrorCode::INVALID_PARAMETER,
                           std::format("config: malformed JSON: {}", e.what()));
  }
  return FromJson(j);
}

auto EngineConfig::ToJson() const -> nlohmann::json {
  nlohmann::json j;
  j["scheduler"] = {{"worker_count", scheduler_.worker_count_},
                    {"max_inflight_pixels", scheduler_.max_inflight_pixels_},
                    {"max_queue_depth", scheduler_.max_queue_depth_},
                    {"timeout_ms", scheduler_.timeout_.count()}};
  j["preview"]        = {{"target_size", preview_.target_size_}};
  j["star_detection"] = star_detection_.ToJson();
  j["denoise"]        = {{"max_radius", denoise_.max_radius_},
                         {"edge_threshold", denoise_.edge_threshold_}};
  j["log_level"]      = log_level_;
  if (presets_.has_value()) {
    j["presets"] = *presets_;
  }
  return j;
}
};  // namespace astroslide
