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

#include <nlohmann/json.hpp>
#include <utility>

namespace astroslide::preset_defaults {
// Subject mask thresholds are the 8-bit levels 10 and 15 of the lunar presets, normalized
constexpr float kSubtleMoonThreshold = 10.0f / 255.0f;
constexpr float kMoonThreshold       = 15.0f / 255.0f;

// Nominal gains of the mineral continuum
constexpr float kMineralLabGain      = 1.6f;
constexpr float kMineralHsvGain      = 1.25f;
constexpr float kVividHsvGain        = 3.5f;
constexpr float kSubtleHsvGain       = 1.4f;

inline auto MakeStage(const char* op, nlohmann::json params) -> nlohmann::json {
  return {{"op", op}, {"params", std::move(params)}};
}

inline auto MakeStretchStage() -> nlohmann::json {
  return MakeStage("histogram_stretch", {{"low", 0.1}, {"high", 99.9}, {"amount", 1.0f}});
}

inline auto MakeGeneralPreset() -> nlohmann::json {
  return {{"id", "general"},
          {"name", "General Auto"},
          {"description", "Balanced enhancement for any astrophoto"},
          {"best_for", "General astrophotography"},
          {"stages",
           {MakeStretchStage(), MakeStage("hsv_saturation_scale", {{"gain", 1.15f}}),
            MakeStage("denoise", {{"strength", 0.2f}})}}};
}

inline auto MakeDeepSkyPreset() -> nlohmann::json {
  return {{"id", "deep_sky"},
          {"name", "Deep Sky Boost"},
          {"description", "Optimized for nebulae, galaxies, and star clusters"},
          {"best_for", "Deep space objects"},
          {"stages",
           {MakeStage("background_extract", {{"grid_size", 8}, {"percentile", 25.0}, {"amount", 1.0f}}),
            MakeStretchStage(), MakeStage("hsv_saturation_scale", {{"gain", 1.4f}}),
            MakeStage("unsharp_mask", {{"radius", 2.0f}, {"amount", 0.5f}}),
            MakeStage("denoise", {{"strength", 0.6f}, {"adaptive", true}})}}};
}

/**
 * @brief The three mineral moon presets share their stage kinds and differ in LAB/HSV gains and
 * tone aggressiveness only. Stages at their off values (gain 1, amount 0) are skipped.
 *
 */
inline auto MakeMineralPreset(const char* id, const char* name, const char* description,
                              const char* best_for, float threshold, float white_balance,
                              float clahe_clip, float lab_gain, float hsv_gain, bool adaptive,
                              float gamma, float sharpen, float denoise) -> nlohmann::json {
  return {{"id", id},
          {"name", name},
          {"description", description},
          {"best_for", best_for},
          {"subject_mask",
           {{"threshold", threshold}, {"cleanup_kernel", 0}, {"black_background", true}}},
          {"stages",
           {MakeStage("white_balance", {{"method", "gray_world"}, {"amount", white_balance}}),
            MakeStage("clahe_contrast",
                      {{"clip_limit", clahe_clip}, {"tile_grid_size", 8}, {"amount", 1.0f}}),
            MakeStage("lab_channel_scale",
                      {{"gain_l", 1.0f}, {"gain_a", lab_gain}, {"gain_b", lab_gain}}),
            MakeStage("hsv_saturation_scale", {{"gain", hsv_gain}, {"adaptive", adaptive}}),
            MakeStage("gamma_curve", {{"gamma", gamma}}),
            MakeStage("unsharp_mask", {{"radius", 1.0f}, {"amount", sharpen}}),
            MakeStage("denoise", {{"strength", denoise}})}}};
}

inline auto MakeMoonHdrPreset() -> nlohmann::json {
  return {{"id", "moon_hdr"},
          {"name", "Moon HDR"},
          {"description", "HDR tone mapping for lunar surface detail"},
          {"best_for", "Seestar and smart telescope moon captures"},
          {"subject_mask",
           {{"threshold", kMoonThreshold}, {"cleanup_kernel", 5}, {"black_background", true}}},
          {"stages",
           {MakeStage("clahe_contrast",
                      {{"clip_limit", 2.5f}, {"tile_grid_size", 8}, {"amount", 1.0f}}),
            MakeStage("tone_curve", {{"shadow_lift", 0.4f},
                                     {"shadow_gamma", 0.85f},
                                     {"highlight_compression", 0.3f},
                                     {"highlight_threshold", 0.75f}}),
            MakeStage("unsharp_mask", {{"radius", 1.0f}, {"amount", 0.3f}}),
            MakeStage("unsharp_mask", {{"radius", 2.5f}, {"amount", 0.2f}}),
            MakeStage("unsharp_mask", {{"radius", 5.0f}, {"amount", 0.15f}}),
            MakeStage("tone_curve", {{"s_curve", 0.3f}, {"s_curve_slope", 10.0f}}),
            MakeStage("denoise", {{"strength", 0.3f}})}}};
}

inline auto MakeNebulaStarlessPreset() -> nlohmann::json {
  return {{"id", "nebula_starless"},
          {"name", "Starless Nebula"},
          {"description", "Removes stars to reveal faint nebulosity"},
          {"best_for", "Emission and reflection nebulae"},
          {"stages",
           {MakeStage("background_extract", {{"grid_size", 8}, {"percentile", 25.0}, {"amount", 1.0f}}),
            MakeStretchStage(), MakeStage("star_reduce", {{"amount", 1.0f}}),
            MakeStage("hsv_saturation_scale", {{"gain", 1.3f}}),
            MakeStage("denoise", {{"strength", 0.3f}})}}};
}

inline auto MakeBuiltInPresetDocument() -> nlohmann::json {
  nlohmann::json presets = nlohmann::json::array();
  presets.push_back(MakeGeneralPreset());
  presets.push_back(MakeDeepSkyPreset());
  presets.push_back(MakeMineralPreset("mineral_moon_subtle", "Mineral Moon (Subtle)",
                                      "Conservative enhancement for scientific accuracy",
                                      "Scientific/realistic lunar imaging", kSubtleMoonThreshold,
                                      0.0f, 1.5f, 1.0f, kSubtleHsvGain, true, 1.0f, 0.2f, 0.2f));
  presets.push_back(MakeMineralPreset("mineral_moon", "Mineral Moon",
                                      "Reveals titanium and iron rich regions of the lunar surface",
                                      "Lunar mineral color imaging", kSubtleMoonThreshold, 1.0f,
                                      2.0f, kMineralLabGain, kMineralHsvGain, false, 0.9f, 0.3f,
                                      0.2f));
  presets.push_back(MakeMineralPreset("mineral_moon_vivid", "Mineral Moon (Vivid)",
                                      "Strongly exaggerated mineral colors",
                                      "Artistic lunar imaging", kSubtleMoonThreshold, 1.0f, 2.5f,
                                      kMineralLabGain, kVividHsvGain, false, 0.8f, 0.4f, 0.3f));
  presets.push_back(MakeMoonHdrPreset());
  presets.push_back(MakeNebulaStarlessPreset());
  return {{"presets", presets}};
}
}  // namespace astroslide::preset_defaults
