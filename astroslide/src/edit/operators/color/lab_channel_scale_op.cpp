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

#include "edit/operators/color/lab_channel_scale_op.hpp"

#include "edit/operators/utils/color_conversion.hpp"
#include "utils/json/json_reader.hpp"

namespace astroslide {
LabChannelScaleOp::LabChannelScaleOp(const nlohmann::json& params) { SetParams(params); }

void LabChannelScaleOp::Apply(PixelBuffer& buffer) {
  if (buffer.Channels() != 3) {
    return;
  }
  // LAB values may leave their nominal range here, LAB2RGB clamps on the way back
  auto lab = ColorCvt::RGB2LAB(buffer);
  lab      = ColorCvt::ApplyChannelGains(lab, {gain_l_, gain_a_, gain_b_});
  buffer   = ColorCvt::LAB2RGB(lab);
}

auto LabChannelScaleOp::GetParams() const -> nlohmann::json {
  nlohmann::json o;
  nlohmann::json inner;

  inner["gain_l"] = gain_l_;
  inner["gain_a"] = gain_a_;
  inner["gain_b"] = gain_b_;

  o[_script_name] = inner;
  return o;
}

void LabChannelScaleOp::SetParams(const nlohmann::json& params) {
  const auto& inner = InnerParams(params);
  json_reader::ReadIfPresent(inner, "gain_l", gain_l_, _script_name);
  json_reader::ReadIfPresent(inner, "gain_a", gain_a_, _script_name);
  json_reader::ReadIfPresent(inner, "gain_b", gain_b_, _script_name);
}
};  // namespace astroslide
