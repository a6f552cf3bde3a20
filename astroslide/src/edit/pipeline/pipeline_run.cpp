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

#include "edit/pipeline/pipeline_run.hpp"

#include <format>
#include <stdexcept>

namespace astroslide {
auto ToString(RunState state) -> std::string_view {
  switch (state) {
    case RunState::IDLE:
      return "Idle";
    case RunState::VALIDATING:
      return "Validating";
    case RunState::EXECUTING:
      return "Executing";
    case RunState::DONE:
      return "Done";
    case RunState::FAILED:
      return "Failed";
    case RunState::CANCELED:
      return "Canceled";
  }
  return "Unknown";
}

auto PipelineRun::GetErrorCode() const -> std::optional<EnhanceErrorCode> {
  std::lock_guard<std::mutex> lock(error_lock_);
  return error_code_;
}

auto PipelineRun::GetErrorMessage() const -> std::string {
  std::lock_guard<std::mutex> lock(error_lock_);
  return error_message_;
}

void PipelineRun::Transition(RunState next) {
  const RunState current = state_.load();
  bool           allowed = false;
  switch (next) {
    case RunState::VALIDATING:
      allowed = current == RunState::IDLE;
      break;
    case RunState::EXECUTING:
      allowed = current == RunState::VALIDATING;
      break;
    case RunState::DONE:
      allowed = current == RunState::EXECUTING;
      break;
    case RunState::FAILED:
      allowed = current == RunState::VALIDATING || current == RunState::EXECUTING;
      break;
    case RunState::CANCELED:
      allowed = current == RunState::VALIDATING || current == RunState::EXECUTING;
      break;
    case RunState::IDLE:
      allowed = false;
      break;
  }
  if (!allowed) {
    throw std::logic_error(std::format("PipelineRun: illegal transition {} -> {}",
                                       ToString(current), ToString(next)));
  }
  state_.store(next);
}

void PipelineRun::BeginStages(size_t stage_count) {
  stage_count_.store(stage_count);
  current_stage_.store(0);
  Transition(RunState::EXECUTING);
}

void PipelineRun::EnterStage(size_t index) { current_stage_.store(index); }

void PipelineRun::Fail(EnhanceErrorCode code, const std::string& message) {
  {
    std::lock_guard<std::mutex> lock(error_lock_);
    error_code_    = code;
    error_message_ = message;
  }
  Transition(RunState::FAILED);
}

void PipelineRun::Cancel() {
  {
    std::lock_guard<std::mutex> lock(error_lock_);
    error_code_    = EnhanceErrorCode::CANCELED;
    error_message_ = "run canceled";
  }
  Transition(RunState::CANCELED);
}
};  // namespace astroslide
