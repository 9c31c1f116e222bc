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

#pragma once

#include <chrono>
#include <functional>
#include <utility>

namespace fprint_binding {
namespace util {

class Timer;

/**
 * @class TimerManager
 * @brief Drives every Timer of the process from one timerfd.
 *
 * Expired tasks run one after another on the manager's task thread, never on
 * the thread that scheduled them.
 */
class TimerManager {
 public:
  virtual ~TimerManager() = default;

 private:
  friend class Timer;

  virtual bool Schedule(Timer* timer, std::function<void()> task,
                        std::chrono::milliseconds delay) = 0;

  virtual bool Cancel(Timer* timer) = 0;

  virtual bool IsScheduled(Timer* timer) = 0;

  static TimerManager& GetManager();
};

/**
 * @class Timer
 * @brief A one-shot task scheduled on the TimerManager.
 *
 * Destroying the timer cancels its pending task.
 */
class Timer {
 public:
  Timer() = default;
  ~Timer() { Cancel(); }

  Timer(const Timer&) = delete;
  Timer& operator=(const Timer&) = delete;

  /**
   * @brief Runs `task` once `delay` has elapsed, replacing a pending task.
   *
   * @param task The function to run.
   * @param delay The delay, must be greater than 0ms.
   * @return true if the task was scheduled.
   */
  bool Schedule(std::function<void()> task, std::chrono::milliseconds delay) {
    if (delay <= std::chrono::milliseconds(0)) {
      return false;
    }
    Cancel();
    return TimerManager::GetManager().Schedule(this, std::move(task), delay);
  }

  /**
   * @brief Drops the pending task.
   *
   * @return true if a task was pending, false if there was none or it has
   * already started running.
   */
  bool Cancel() { return TimerManager::GetManager().Cancel(this); }

  /**
   * @brief Checks whether a task is pending on this timer.
   */
  bool IsScheduled() { return TimerManager::GetManager().IsScheduled(this); }
};

}  // namespace util
}  // namespace fprint_binding
