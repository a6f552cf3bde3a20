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

#include <atomic>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "type/enhance_error.hpp"

namespace astroslide {
enum class RunState : int { IDLE, VALIDATING, EXECUTING, DONE, FAILED, CANCELED };

auto ToString(RunState state) -> std::string_view;

/**
 * @brief Progress of one preset engine run, readable from other threads while the run executes.
 * IDLE -> VALIDATING -> EXECUTING (stage i of N) -> DONE, with FAILED reachable from VALIDATING
 * or EXECUTING and CANCELED reachable between stages.
 *
 */
class PipelineRun {
 private:
  std::atomic<RunState>           state_{RunState::IDLE};
  std::atomic<size_t>             current_stage_{0};
  std::atomic<size_t>             stage_count_{0};
  std::atomic<bool>               cancel_requested_{false};

  mutable std::mutex              error_lock_;
  std::optional<EnhanceErrorCode> error_code_;
  std::string                     error_message_;

 public:
  PipelineRun() = default;

  auto GetState() const -> RunState { return state_.load(); }
  auto GetCurrentStage() const -> size_t { return current_stage_.load(); }
  auto GetStageCount() const -> size_t { return stage_count_.load(); }
  auto GetErrorCode() const -> std::optional<EnhanceErrorCode>;
  auto GetErrorMessage() const -> std::string;

  /**
   * @brief Ask the run to stop before its next stage. A run that already finished is unaffected.
   *
   */
  void RequestCancel() { cancel_requested_.store(true); }
  auto IsCancelRequested() const -> bool { return cancel_requested_.load(); }

  /**
   * @brief Move to the next state, throws std::logic_error on a transition the state machine
   * does not have
   *
   */
  void Transition(RunState next);
  void BeginStages(size_t stage_count);
  void EnterStage(size_t index);
  void Fail(EnhanceErrorCode code, const std::string& message);
  void Cancel();
};
};  // namespace astroslide
