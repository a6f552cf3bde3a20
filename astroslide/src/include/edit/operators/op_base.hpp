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

#include <format>
#include <memory>
#include <nlohmann/json.hpp>
#include <span>
#include <string>
#include <string_view>

#include "image/pixel_buffer.hpp"
#include "type/enhance_error.hpp"

namespace astroslide {
enum class OperatorType : int {
  WHITE_BALANCE,
  GAMMA_CURVE,
  LAB_CHANNEL_SCALE,
  HSV_SATURATION_SCALE,
  CLAHE_CONTRAST,
  UNSHARP_MASK,
  DENOISE,
  STAR_REDUCE,
  HISTOGRAM_STRETCH,
  BACKGROUND_EXTRACT,
  TONE_CURVE,
  UNKNOWN  // For unrecognized operator types or placeholders
};

/**
 * @brief A parameter scaled by the preset intensity, and the value at which it has no effect
 *
 */
struct StrengthParam {
  std::string_view name_;
  float            off_;
};

class IOperatorBase {
 public:
  /**
   * @brief Apply the adjustment in place on an exclusively owned buffer
   *
   * @param buffer
   */
  virtual void Apply(PixelBuffer& buffer)                 = 0;
  /**
   * @brief Get JSON parameter for this operator, keyed by its script name
   *
   * @return nlohmann::json
   */
  virtual auto GetParams() const -> nlohmann::json        = 0;
  /**
   * @brief Set the parameters of this operator from JSON
   *
   * @param params
   */
  virtual void SetParams(const nlohmann::json& params)    = 0;

  virtual auto GetScriptName() const -> std::string       = 0;

  virtual auto GetOperatorType() const -> OperatorType    = 0;

  /**
   * @brief True when every strength parameter sits at its off value
   *
   */
  virtual auto IsIdentity() const -> bool                 = 0;

  virtual ~IOperatorBase()                                = default;
};

/**
 * @brief A base class for all operators
 *
 * @tparam Derived CRTP derived class
 */
template <typename Derived>
class OperatorBase : public IOperatorBase {
 protected:
  /**
   * @brief Unwrap {"<script_name>": {...}} and check that the inner value is an object
   *
   * @param params
   * @return const nlohmann::json&
   */
  static auto InnerParams(const nlohmann::json& params) -> const nlohmann::json& {
    auto it = params.find(std::string(Derived::_script_name));
    if (it == params.end() || !it->is_object()) {
      throw EnhanceException(
          EnhanceErrorCode::INVALID_PARAMETER,
          std::format("{}: missing parameter object \"{}\"", Derived::_canonical_name,
                      Derived::_script_name));
    }
    return *it;
  }

 public:
  /**
   * @brief Get the script name of the operator (for JSON serialization)
   *
   * @return std::string
   */
  auto GetScriptName() const -> std::string override { return std::string(Derived::_script_name); }

  auto GetOperatorType() const -> OperatorType override { return Derived::_operator_type; }

  static auto StrengthParams() -> std::span<const StrengthParam> {
    return Derived::_strength_params;
  }

  auto IsIdentity() const -> bool override {
    const auto params = GetParams();
    const auto& inner = params.at(std::string(Derived::_script_name));
    for (const auto& param : Derived::_strength_params) {
      if (inner.at(std::string(param.name_)).template get<float>() != param.off_) {
        return false;
      }
    }
    return true;
  }
};
};  // namespace astroslide
