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

#include "edit/operators/star/star_reduce_op.hpp"

#include "edit/star/star_reducer.hpp"
#include "utils/json/json_reader.hpp"

namespace astroslide {
StarReduceOp::StarReduceOp(const nlohmann::json& params) { SetParams(params); }

void StarReduceOp::Apply(PixelBuffer& buffer) {
  StarReducer reducer{config_};
  buffer = reducer.ReduceStars(buffer, amount_);
}

auto StarReduceOp::GetParams() const -> nlohmann::json {
  nlohmann::json o;
  nlohmann::json inner = config_.ToJson();
  inner["amount"]      = amount_;
  o[_script_name]      = inner;
  return o;
}

void StarReduceOp::SetParams(const nlohmann::json& params) {
  const auto& inner = InnerParams(params);
  json_reader::ReadIfPresent(inner, "amount", amount_, _script_name);
  nlohmann::json thresholds = inner;
  thresholds.erase("amount");
  config_.ReadJson(thresholds);
}
};  // namespace astroslide
