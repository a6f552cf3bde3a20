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

#include "edit/operators/background/background_extract_op.hpp"

#include "edit/operators/CPU_kernels/background_kernels.hpp"
#include "utils/json/json_reader.hpp"

namespace astroslide {
BackgroundExtractOp::BackgroundExtractOp(const nlohmann::json& params) { SetParams(params); }

void BackgroundExtractOp::Apply(PixelBuffer& buffer) {
  buffer = kernels::ExtractBackground(buffer, grid_size_, percentile_, amount_);
}

auto BackgroundExtractOp::GetParams() const -> nlohmann::json {
  nlohmann::json o;
  nlohmann::json inner;

  inner["grid_size"]  = grid_size_;
  inner["percentile"] = percentile_;
  inner["amount"]     = amount_;

  o[_script_name]     = inner;
  return o;
}

void BackgroundExtractOp::SetParams(const nlohmann::json& params) {
  const auto& inner = InnerParams(params);
  json_reader::ReadIfPresent(inner, "grid_size", grid_size_, _script_name);
  json_reader::ReadIfPresent(inner, "percentile", percentile_, _script_name);
  json_reader::ReadIfPresent(inner, "amount", amount_, _script_name);
}
};  // namespace astroslide
