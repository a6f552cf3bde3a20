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

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "op_base.hpp"

namespace astroslide {
class OperatorFactory {
 public:
  using Creator = std::function<std::shared_ptr<IOperatorBase>(const nlohmann::json&)>;

  struct Entry {
    OperatorType               type_;
    Creator                    creator_;
    std::vector<StrengthParam> strength_params_;
  };

  static auto Instance() -> OperatorFactory&;

  void        Register(const std::string& script_name, Entry entry);

  template <typename T>
  void Register() {
    auto strength = T::StrengthParams();
    Register(std::string(T::_script_name),
             Entry{T::_operator_type, MakeCreator<T>(),
                   std::vector<StrengthParam>(strength.begin(), strength.end())});
  }

  /**
   * @brief Create an operator from its script name and its inner parameter object
   *
   * @param script_name e.g. "unsharp_mask"
   * @param params e.g. {"radius": 1.0, "amount": 0.2}
   * @return std::shared_ptr<IOperatorBase>
   */
  auto Create(const std::string& script_name, const nlohmann::json& params = {}) const
      -> std::shared_ptr<IOperatorBase>;

  auto Contains(const std::string& script_name) const -> bool;

  auto GetStrengthParams(const std::string& script_name) const
      -> const std::vector<StrengthParam>&;

  auto GetType(const std::string& script_name) const -> OperatorType;

  template <typename T>
  static Creator MakeCreator() {
    return [](const nlohmann::json& params) -> std::shared_ptr<IOperatorBase> {
      nlohmann::json wrapped;
      wrapped[std::string(T::_script_name)] = params.is_null() ? nlohmann::json::object() : params;
      auto op = std::make_shared<T>(wrapped);
      return std::static_pointer_cast<IOperatorBase>(op);
    };
  }

 private:
  std::unordered_map<std::string, Entry> creators_;

  auto                                   Find(const std::string& script_name) const
      -> const Entry&;
};
};  // namespace astroslide
