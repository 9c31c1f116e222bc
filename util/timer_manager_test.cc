/*
 * Copyright 2025 The Android Open Source Project
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "fprint_binding/util/timer_manager.h"

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

#include "gtest/gtest.h"

namespace fprint_binding {
namespace util {
namespace {

using ::testing::Test;

using std::chrono::milliseconds;

class TimerManagerTest : public Test {
 protected:
  // Returns a promise to fulfil from a task and the future observing it.
  std::pair<std::shared_ptr<std::promise<void>>, std::future<void>>
  MakeSignal() {
    auto promise = std::make_shared<std::promise<void>>();
    std::future<void> future = promise->get_future();
    return {std::move(promise), std::move(future)};
  }
};

TEST_F(TimerManagerTest, RunsTaskAfterDelay) {
  Timer timer;
  auto [promise, future] = MakeSignal();
  ASSERT_TRUE(timer.Schedule([promise]() { promise->set_value(); },
                             milliseconds(50)));
  EXPECT_TRUE(timer.IsScheduled());
  EXPECT_NE(std::future_status::ready, future.wait_for(milliseconds(10)));
  EXPECT_EQ(std::future_status::ready, future.wait_for(milliseconds(200)));
  EXPECT_FALSE(timer.IsScheduled());
}

TEST_F(TimerManagerTest, RejectsNonPositiveDelay) {
  Timer timer;
  EXPECT_FALSE(timer.Schedule([]() {}, milliseconds(0)));
  EXPECT_FALSE(timer.Schedule([]() {}, milliseconds(-5)));
  EXPECT_FALSE(timer.IsScheduled());
}

TEST_F(TimerManagerTest, CancelDropsPendingTask) {
  Timer timer;
  auto [promise, future] = MakeSignal();
  ASSERT_TRUE(timer.Schedule([promise]() { promise->set_value(); },
                             milliseconds(20)));
  EXPECT_TRUE(timer.Cancel());
  EXPECT_FALSE(timer.IsScheduled());
  EXPECT_NE(std::future_status::ready, future.wait_for(milliseconds(100)));
}

TEST_F(TimerManagerTest, CancelWithoutPendingTaskReturnsFalse) {
  Timer timer;
  EXPECT_FALSE(timer.Cancel());
}

TEST_F(TimerManagerTest, DestroyingTimerCancelsTask) {
  auto [promise, future] = MakeSignal();
  {
    Timer timer;
    ASSERT_TRUE(timer.Schedule([promise]() { promise->set_value(); },
                               milliseconds(20)));
  }
  EXPECT_NE(std::future_status::ready, future.wait_for(milliseconds(100)));
}

TEST_F(TimerManagerTest, EarlierDeadlineFiresFirst) {
  Timer late, early;
  std::mutex mutex;
  std::vector<int> order;
  auto [promise, future] = MakeSignal();
  ASSERT_TRUE(late.Schedule(
      [&mutex, &order, promise]() {
        std::lock_guard<std::mutex> lock(mutex);
        order.push_back(2);
        promise->set_value();
      },
      milliseconds(80)));
  ASSERT_TRUE(early.Schedule(
      [&mutex, &order]() {
        std::lock_guard<std::mutex> lock(mutex);
        order.push_back(1);
      },
      milliseconds(20)));
  ASSERT_EQ(std::future_status::ready, future.wait_for(milliseconds(300)));
  std::lock_guard<std::mutex> lock(mutex);
  EXPECT_EQ(order, (std::vector<int>{1, 2}));
}

TEST_F(TimerManagerTest, CancellingEarliestKeepsLaterTask) {
  Timer first, second;
  auto [promise1, future1] = MakeSignal();
  auto [promise2, future2] = MakeSignal();
  ASSERT_TRUE(first.Schedule([promise1]() { promise1->set_value(); },
                             milliseconds(30)));
  ASSERT_TRUE(second.Schedule([promise2]() { promise2->set_value(); },
                              milliseconds(60)));
  ASSERT_TRUE(first.Cancel());
  EXPECT_EQ(std::future_status::ready, future2.wait_for(milliseconds(200)));
  EXPECT_NE(std::future_status::ready, future1.wait_for(milliseconds(0)));
}

TEST_F(TimerManagerTest, RescheduleReplacesTask) {
  Timer timer;
  auto [promise1, future1] = MakeSignal();
  auto [promise2, future2] = MakeSignal();
  ASSERT_TRUE(timer.Schedule([promise1]() { promise1->set_value(); },
                             milliseconds(30)));
  ASSERT_TRUE(timer.Schedule([promise2]() { promise2->set_value(); },
                             milliseconds(30)));
  EXPECT_EQ(std::future_status::ready, future2.wait_for(milliseconds(200)));
  EXPECT_NE(std::future_status::ready, future1.wait_for(milliseconds(50)));
}

TEST_F(TimerManagerTest, TaskCanScheduleItsOwnTimer) {
  Timer timer;
  std::atomic<int> runs{0};
  auto [promise, future] = MakeSignal();
  ASSERT_TRUE(timer.Schedule(
      [&timer, &runs, promise]() {
        runs++;
        // The running task is no longer pending.
        EXPECT_FALSE(timer.IsScheduled());
        EXPECT_TRUE(timer.Schedule(
            [&runs, promise]() {
              runs++;
              promise->set_value();
            },
            milliseconds(10)));
      },
      milliseconds(10)));
  ASSERT_EQ(std::future_status::ready, future.wait_for(milliseconds(300)));
  EXPECT_EQ(runs.load(), 2);
}

}  // namespace
}  // namespace util
}  // namespace fprint_binding
