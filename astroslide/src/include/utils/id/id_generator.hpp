//  Copyright 2025 Yurun Zi
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

#include <concepts>
#include <cstdint>
#include <mutex>

namespace astroslide {
namespace IncrID {
template <typename IDType>
concept Incrementable = requires(IDType t) {
  { ++t } -> std::same_as<IDType&>;
};
/**
 * @brief Monotonic id source shared by every submitter of a scheduler
 *
 */
template <Incrementable T>
class IDGenerator {
 private:
  T                  counter_;
  std::mutex         lock_;

 public:
  explicit IDGenerator(T start_id) : counter_(start_id) {}
  auto GenerateID() -> T {
    std::lock_guard<std::mutex> guard(lock_);
    return ++counter_;
  }
};
};  // namespace IncrID
};  // namespace astroslide
