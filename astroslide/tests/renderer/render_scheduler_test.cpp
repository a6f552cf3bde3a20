#include "renderer/render_scheduler.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>

#include "type/enhance_error.hpp"

using namespace astroslide;
using namespace std::chrono_literals;

namespace {
// Work that blocks on a gate so tests control when a worker frees up
auto GatedWork(std::shared_future<void> gate, int value) -> std::function<int(PipelineRun&)> {
  return [gate, value](PipelineRun&) {
    gate.wait();
    return value;
  };
}

auto MakeConfig(size_t workers, pixel_cost_t inflight, size_t depth) -> SchedulerConfig {
  SchedulerConfig config;
  config.worker_count_        = workers;
  config.max_inflight_pixels_ = inflight;
  config.max_queue_depth_     = depth;
  config.timeout_             = 5000ms;
  return config;
}
}  // namespace

TEST(RenderSchedulerTests, RunsTasksAndReturnsResults) {
  RenderScheduler scheduler{MakeConfig(2, 1000, 4)};
  auto            a = scheduler.Submit<int>(10, [](PipelineRun&) { return 1; });
  auto            b = scheduler.Submit<int>(10, [](PipelineRun&) { return 2; });
  EXPECT_EQ(a.Wait(), 1);
  EXPECT_EQ(b.Wait(), 2);
  EXPECT_NE(a.GetTaskID(), b.GetTaskID());
}

TEST(RenderSchedulerTests, WorkerErrorsReachTheCaller) {
  RenderScheduler scheduler{MakeConfig(1, 1000, 4)};
  auto            ticket = scheduler.Submit<int>(10, [](PipelineRun&) -> int {
    throw EnhanceException(EnhanceErrorCode::DEGENERATE_INPUT, "flat frame");
  });
  try {
    ticket.Wait();
    FAIL() << "expected DEGENERATE_INPUT";
  } catch (const EnhanceException& e) {
    EXPECT_EQ(e.Code(), EnhanceErrorCode::DEGENERATE_INPUT);
  }
}

TEST(RenderSchedulerTests, FullQueueRejectsSubmission) {
  std::promise<void>       release;
  std::shared_future<void> gate = release.get_future().share();
  RenderScheduler          scheduler{MakeConfig(1, 1000, 1)};

  auto running = scheduler.Submit<int>(10, GatedWork(gate, 1));
  auto queued  = scheduler.Submit<int>(10, GatedWork(gate, 2));
  EXPECT_EQ(scheduler.RunningCount(), 1u);
  EXPECT_EQ(scheduler.QueuedCount(), 1u);

  try {
    scheduler.Submit<int>(10, GatedWork(gate, 3));
    ADD_FAILURE() << "expected CAPACITY_EXCEEDED";
  } catch (const EnhanceException& e) {
    EXPECT_EQ(e.Code(), EnhanceErrorCode::CAPACITY_EXCEEDED);
  }

  release.set_value();
  EXPECT_EQ(running.Wait(), 1);
  EXPECT_EQ(queued.Wait(), 2);
}

TEST(RenderSchedulerTests, PixelBudgetQueuesInsteadOfRejecting) {
  std::promise<void>       release;
  std::shared_future<void> gate = release.get_future().share();
  RenderScheduler          scheduler{MakeConfig(2, 100, 4)};

  auto big   = scheduler.Submit<int>(80, GatedWork(gate, 1));
  // A worker is free but the pixel budget is not
  auto small = scheduler.Submit<int>(50, GatedWork(gate, 2));
  EXPECT_EQ(scheduler.RunningCount(), 1u);
  EXPECT_EQ(scheduler.QueuedCount(), 1u);

  release.set_value();
  EXPECT_EQ(big.Wait(), 1);
  EXPECT_EQ(small.Wait(), 2);
}

TEST(RenderSchedulerTests, OversizedTaskRunsAlone) {
  RenderScheduler scheduler{MakeConfig(2, 100, 4)};
  auto            huge = scheduler.Submit<int>(10000, [](PipelineRun&) { return 7; });
  EXPECT_EQ(huge.Wait(), 7);
}

TEST(RenderSchedulerTests, TimeoutCancelsTheTask) {
  std::promise<void>       release;
  std::shared_future<void> gate = release.get_future().share();
  RenderScheduler          scheduler{MakeConfig(1, 1000, 4)};

  auto running = scheduler.Submit<int>(10, GatedWork(gate, 1));
  std::atomic<bool> started{false};
  auto waiting = scheduler.Submit<int>(10, [&started](PipelineRun&) {
    started = true;
    return 2;
  });

  try {
    waiting.Wait(20ms);
    FAIL() << "expected TIMEOUT";
  } catch (const EnhanceException& e) {
    EXPECT_EQ(e.Code(), EnhanceErrorCode::TIMEOUT);
  }
  EXPECT_TRUE(waiting.GetRun().IsCancelRequested());

  release.set_value();
  EXPECT_EQ(running.Wait(), 1);
  // The canceled task never starts
  try {
    waiting.Wait(5000ms);
    FAIL() << "expected CANCELED";
  } catch (const EnhanceException& e) {
    EXPECT_EQ(e.Code(), EnhanceErrorCode::CANCELED);
  }
  EXPECT_FALSE(started.load());
}

TEST(RenderSchedulerTests, AbandonedTaskFreesItsQueueSlot) {
  std::promise<void>       release;
  std::shared_future<void> gate = release.get_future().share();
  RenderScheduler          scheduler{MakeConfig(1, 1000, 1)};

  auto running   = scheduler.Submit<int>(10, GatedWork(gate, 1));
  auto abandoned = scheduler.Submit<int>(10, GatedWork(gate, 2));
  EXPECT_EQ(scheduler.QueuedCount(), 1u);
  EXPECT_THROW(abandoned.Wait(1ms), EnhanceException);

  // The queue holds only the timed out task, so a live request still fits
  auto live = scheduler.Submit<int>(10, GatedWork(gate, 3));
  EXPECT_EQ(scheduler.QueuedCount(), 1u);
  try {
    abandoned.Wait(5000ms);
    FAIL() << "expected CANCELED";
  } catch (const EnhanceException& e) {
    EXPECT_EQ(e.Code(), EnhanceErrorCode::CANCELED);
  }

  release.set_value();
  EXPECT_EQ(running.Wait(), 1);
  EXPECT_EQ(live.Wait(), 3);
}
