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

#include <chrono>
#include <exception>
#include <format>
#include <functional>
#include <future>
#include <memory>
#include <utility>

#include "edit/pipeline/pipeline_run.hpp"
#include "type/enhance_error.hpp"
#include "type/type.hpp"

namespace astroslide {
/**
 * @brief Type-erased unit of work held by the scheduler queue. Execute runs the work and
 * fulfills the promise behind it, Reject fulfills the promise with an error without running.
 *
 */
struct RenderTask {
  task_id_t                                 task_id_    = 0;
  pixel_cost_t                              pixel_cost_ = 0;
  std::shared_ptr<PipelineRun>              run_;

  std::function<void()>                     execute_;
  std::function<void(std::exception_ptr)>   reject_;
};

/**
 * @brief Caller side handle of a submitted task
 *
 * @tparam T result type
 */
template <typename T>
class RenderTicket {
 private:
  task_id_t                    task_id_ = 0;
  std::future<T>               future_;
  std::shared_ptr<PipelineRun> run_;
  std::chrono::milliseconds    default_timeout_;

 public:
  RenderTicket(task_id_t task_id, std::future<T>&& future, std::shared_ptr<PipelineRun> run,
               std::chrono::milliseconds default_timeout)
      : task_id_(task_id),
        future_(std::move(future)),
        run_(std::move(run)),
        default_timeout_(default_timeout) {}

  auto GetTaskID() const -> task_id_t { return task_id_; }
  auto GetRun() const -> const PipelineRun& { return *run_; }

  /**
   * @brief A queued task will be dropped, a running one stops before its next stage
   *
   */
  void Cancel() { run_->RequestCancel(); }

  auto Wait() -> T { return Wait(default_timeout_); }

  /**
   * @brief Block until the result is ready. On expiry the task is canceled and TIMEOUT is raised;
   * errors raised by the task are rethrown here.
   *
   * @param timeout
   * @return T
   */
  auto Wait(std::chrono::milliseconds timeout) -> T {
    if (future_.wait_for(timeout) != std::future_status::ready) {
      Cancel();
      throw EnhanceException(EnhanceErrorCode::TIMEOUT,
                             std::format("task {} did not finish within {} ms", task_id_,
                                         timeout.count()));
    }
    return future_.get();
  }
};
};  // namespace astroslide
