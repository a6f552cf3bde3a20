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

#include "renderer/render_scheduler.hpp"

#include <easy/profiler.h>

#include <algorithm>
#include <format>

#include "type/enhance_error.hpp"
#include "utils/log/logger.hpp"

namespace astroslide {
namespace {
auto MakeError(EnhanceErrorCode code, const std::string& message) -> std::exception_ptr {
  return std::make_exception_ptr(EnhanceException(code, message));
}
}  // namespace

RenderScheduler::RenderScheduler(const SchedulerConfig& config)
    : config_(config), thread_pool_(std::max<size_t>(config.worker_count_, 1)) {}

RenderScheduler::~RenderScheduler() {
  std::deque<RenderTask> dropped;
  {
    std::lock_guard<std::mutex> lock(scheduler_lock_);
    stopping_ = true;
    dropped.swap(queue_);
  }
  for (auto& task : dropped) {
    task.run_->RequestCancel();
    task.reject_(MakeError(EnhanceErrorCode::CANCELED, "scheduler shut down"));
  }
  // thread_pool_ joins the running tasks when it is destroyed
}

auto RenderScheduler::CanAdmitLocked(pixel_cost_t pixel_cost) const -> bool {
  if (running_ >= thread_pool_.Size()) {
    return false;
  }
  // An oversized task is admitted only on an idle scheduler, where it runs alone
  if (running_ == 0) {
    return true;
  }
  return inflight_pixels_ + pixel_cost <= config_.max_inflight_pixels_;
}

void RenderScheduler::Enqueue(RenderTask&& task) {
  {
    std::lock_guard<std::mutex> lock(scheduler_lock_);
    if (stopping_) {
      throw EnhanceException(EnhanceErrorCode::CANCELED, "scheduler is shutting down");
    }
    // Abandoned tasks must not hold queue slots against live submissions
    PurgeCanceledLocked();
    const bool must_wait = !queue_.empty() || !CanAdmitLocked(task.pixel_cost_);
    if (must_wait && queue_.size() >= config_.max_queue_depth_) {
      log::GetLogger()->warn("Rejecting task {}: {} tasks already queued", task.task_id_,
                             queue_.size());
      throw EnhanceException(
          EnhanceErrorCode::CAPACITY_EXCEEDED,
          std::format("queue is full ({} tasks waiting)", config_.max_queue_depth_));
    }
    queue_.push_back(std::move(task));
    DispatchLocked();
  }
}

void RenderScheduler::PurgeCanceledLocked() {
  // Canceled tasks that never started are dropped wherever they sit in the queue
  for (auto it = queue_.begin(); it != queue_.end();) {
    if (it->run_->IsCancelRequested()) {
      it->reject_(MakeError(EnhanceErrorCode::CANCELED,
                            std::format("task {} canceled before it started", it->task_id_)));
      it = queue_.erase(it);
    } else {
      ++it;
    }
  }
}

void RenderScheduler::DispatchLocked() {
  if (stopping_) {
    return;
  }
  PurgeCanceledLocked();

  while (!queue_.empty() && CanAdmitLocked(queue_.front().pixel_cost_)) {
    RenderTask task = std::move(queue_.front());
    queue_.pop_front();
    ++running_;
    inflight_pixels_ += task.pixel_cost_;

    thread_pool_.Submit([this, task = std::move(task)]() {
      EASY_BLOCK("RenderTask");
      if (task.run_->IsCancelRequested()) {
        task.reject_(MakeError(EnhanceErrorCode::CANCELED,
                               std::format("task {} canceled before it started", task.task_id_)));
      } else {
        task.execute_();
      }
      OnTaskFinished(task.pixel_cost_);
    });
  }
}

void RenderScheduler::OnTaskFinished(pixel_cost_t pixel_cost) {
  std::lock_guard<std::mutex> lock(scheduler_lock_);
  --running_;
  inflight_pixels_ -= pixel_cost;
  DispatchLocked();
}

auto RenderScheduler::QueuedCount() -> size_t {
  std::lock_guard<std::mutex> lock(scheduler_lock_);
  return queue_.size();
}

auto RenderScheduler::RunningCount() -> size_t {
  std::lock_guard<std::mutex> lock(scheduler_lock_);
  return running_;
}
};  // namespace astroslide
