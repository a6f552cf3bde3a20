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

#include <deque>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <utility>

#include "concurrency/thread_pool.hpp"
#include "config/engine_config.hpp"
#include "renderer/render_task.hpp"
#include "utils/id/id_generator.hpp"

namespace astroslide {
/**
 * @brief Bounded admission in front of a fixed thread pool. A task is dispatched when a worker
 * is free and the running pixel total stays within max_inflight_pixels; otherwise it waits in a
 * FIFO of at most max_queue_depth tasks.
 *
 */
class RenderScheduler {
 private:
  SchedulerConfig                config_;
  IncrID::IDGenerator<task_id_t> id_generator_{0};

  std::mutex                     scheduler_lock_;
  std::deque<RenderTask>         queue_;
  size_t                         running_         = 0;
  pixel_cost_t                   inflight_pixels_ = 0;
  bool                           stopping_        = false;

  // Declared last so that workers are joined before the bookkeeping above goes away
  ThreadPool                     thread_pool_;

  auto                           CanAdmitLocked(pixel_cost_t pixel_cost) const -> bool;
  void                           PurgeCanceledLocked();
  void                           DispatchLocked();
  void                           Enqueue(RenderTask&& task);
  void                           OnTaskFinished(pixel_cost_t pixel_cost);

 public:
  explicit RenderScheduler(const SchedulerConfig& config);
  ~RenderScheduler();

  RenderScheduler(const RenderScheduler&)            = delete;
  RenderScheduler& operator=(const RenderScheduler&) = delete;

  /**
   * @brief Schedule work costing pixel_cost pixels. Throws CAPACITY_EXCEEDED when the task
   * would have to wait and the queue is already full.
   *
   * @tparam T result type
   * @param pixel_cost
   * @param work called on a worker with the run object of the task
   * @return RenderTicket<T>
   */
  template <typename T>
  auto Submit(pixel_cost_t pixel_cost, std::function<T(PipelineRun&)> work) -> RenderTicket<T> {
    auto promise = std::make_shared<std::promise<T>>();
    auto run     = std::make_shared<PipelineRun>();

    RenderTask task;
    task.task_id_    = id_generator_.GenerateID();
    task.pixel_cost_ = pixel_cost;
    task.run_        = run;
    task.execute_    = [promise, run, work = std::move(work)]() {
      try {
        promise->set_value(work(*run));
      } catch (...) {
        promise->set_exception(std::current_exception());
      }
    };
    task.reject_ = [promise](std::exception_ptr error) { promise->set_exception(error); };

    RenderTicket<T> ticket(task.task_id_, promise->get_future(), run, config_.timeout_);
    Enqueue(std::move(task));
    return ticket;
  }

  auto GetConfig() const -> const SchedulerConfig& { return config_; }
  auto QueuedCount() -> size_t;
  auto RunningCount() -> size_t;
};
};  // namespace astroslide
