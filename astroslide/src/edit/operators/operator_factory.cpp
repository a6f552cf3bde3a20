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

#include "edit/operators/operator_factory.hpp"

#include <format>
#include <memory>
#include <utility>

namespace astroslide {
auto OperatorFactory::Instance() -> OperatorFactory& {
  static OperatorFactory instance;
  return instance;
}

void OperatorFactory::Register(const std::string& script_name, Entry entry) {
  creators_[script_name] = std::move(entry);
}

auto OperatorFactory::Find(const std::string& script_name) const -> const Entry& {
  auto it = creators_.find(script_name);
  if (it == creators_.end()) {
    throw EnhanceException(EnhanceErrorCode::INVALID_PARAMETER,
                           std::format("Unknown operator \"{}\"", script_name));
  }
  return it->second;
}

auto OperatorFactory::Create(const std::string& script_name, const nlohmann::json& params) const
    -> std::shared_ptr<IOperatorBase> {
  return Find(script_name).creator_(params);
}

auto OperatorFactory::Contains(const std::string& script_name) const -> bool {
  return creators_.contains(script_name);
}

auto OperatorFactory::GetStrengthParams(const std::string& script_name) const
    -> const std::vector<StrengthParam>& {
  return Find(script_name).strength_params_;
}

auto OperatorFactory::GetType(const std::string& script_name) const -> OperatorType {
  return Find(script_name).type_;
}
};  // namespace astroslide
