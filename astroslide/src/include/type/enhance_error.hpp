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

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace astroslide {
enum class EnhanceErrorCode : uint8_t {
  INVALID_PARAMETER = 0,  // unknown preset, intensity out of range, malformed buffer
  DEGENERATE_INPUT,       // a stage cannot produce a valid result for this input
  CAPACITY_EXCEEDED,      // scheduler queue is full
  TIMEOUT,                // request deadline elapsed while queued or running
  CANCELED                // caller abandoned the request
};

inline auto ToString(EnhanceErrorCode code) -> std::string_view {
  switch (code) {
    case EnhanceErrorCode::INVALID_PARAMETER:
      return "InvalidParameter";
    case EnhanceErrorCode::DEGENERATE_INPUT:
      return "DegenerateInput";
    case EnhanceErrorCode::CAPACITY_EXCEEDED:
      return "CapacityExceeded";
    case EnhanceErrorCode::TIMEOUT:
      return "Timeout";
    case EnhanceErrorCode::CANCELED:
      return "Canceled";
  }
  return "Unknown";
}

class EnhanceException : public std::runtime_error {
 private:
  EnhanceErrorCode code_;

 public:
  EnhanceException(EnhanceErrorCode code, const std::string& message)
      : std::runtime_error(std::string(ToString(code)) + ": " + message), code_(code) {}

  auto Code() const noexcept -> EnhanceErrorCode { return code_; }
};
};  // namespace astroslide
