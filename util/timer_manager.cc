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

#define LOG_TAG "fprint_binding.timer_manager"

#include "fprint_binding/util/timer_manager.h"

#include <errno.h>
#include <string.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/timerfd.h>
#include <time.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <utility>

#include "android-base/logging.h"
#include "fprint_binding/util/worker.h"

namespace fprint_binding {
namespace util {
namespace {

constexpr long kMillisecondsPerSecond = 1000;
constexpr long kNanosecondsPerMillisecond = 1000000;

using Clock = std::chrono::steady_clock;

int RunSyscallUntilNoIntr(const std::function<int()>& fn) {
  int result = fn();
  while (result == -1 && errno == EINTR) {
    result = fn();
  }
  return result;
}

}  // namespace

class TimerManagerImpl : public TimerManager {
 public:
  TimerManagerImpl();
  ~TimerManagerImpl() override;

  bool Schedule(Timer* timer, std::function<void()> task,
                std::chrono::milliseconds delay) override;
  bool Cancel(Timer* timer) override;
  bool IsScheduled(Timer* timer) override;

 private:
  enum class LoopMessage : int {
    kWaitForEvents = 1,
  };

  struct PendingTask {
    Clock::time_point expires_at;
    std::function<void()> task;
  };

  // Ordered by deadline; ties keep scheduling order.
  using Deadlines = std::multimap<Clock::time_point, Timer*>;

  void WaitForEvents();
  void RunExpiredTasks();
  bool ArmForEarliest();
  bool SetTimer(std::chrono::nanoseconds delay);
  void Unlink(Timer* timer);

  int timer_fd_ = -1;
  int wake_fd_ = -1;
  int epoll_fd_ = -1;
  std::unique_ptr<Worker<LoopMessage>> loop_thread_;
  std::unique_ptr<Worker<std::function<void()>>> task_thread_;
  std::unordered_map<Timer*, PendingTask> pending_;
  Deadlines deadlines_;
  std::mutex mutex_;
  std::atomic<bool> running_ = false;
};

TimerManagerImpl::TimerManagerImpl() {
  timer_fd_ = timerfd_create(CLOCK_MONOTONIC, TFD_CLOEXEC);
  if (timer_fd_ < 0) {
    LOG(ERROR) << __func__ << ": Failed to create timerfd: " << strerror(errno);
    return;
  }

  wake_fd_ = eventfd(0, EFD_CLOEXEC);
  if (wake_fd_ < 0) {
    LOG(ERROR) << __func__ << ": Failed to create eventfd: " << strerror(errno);
    close(timer_fd_);
    return;
  }

  epoll_fd_ = RunSyscallUntilNoIntr([] { return epoll_create1(EPOLL_CLOEXEC); });
  if (epoll_fd_ < 0) {
    LOG(ERROR) << __func__ << ": Failed to create epoll fd: "
               << strerror(errno);
    close(timer_fd_);
    close(wake_fd_);
    return;
  }

  for (int fd : {timer_fd_, wake_fd_}) {
    epoll_event event{.events = EPOLLIN, .data{.fd = fd}};
    int result = RunSyscallUntilNoIntr([this, fd, &event]() -> int {
      return epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &event);
    });
    if (result < 0) {
      LOG(ERROR) << __func__ << ": Failed to add fd " << fd
                 << " to epoll: " << strerror(errno);
      close(timer_fd_);
      close(wake_fd_);
      close(epoll_fd_);
      return;
    }
  }

  running_.store(true);
  task_thread_ = std::make_unique<Worker<std::function<void()>>>(
      [](std::function<void()> task) { task(); });
  loop_thread_ =
      std::make_unique<Worker<LoopMessage>>([this](LoopMessage message) {
        if (message == LoopMessage::kWaitForEvents) {
          WaitForEvents();
        } else {
          LOG(ERROR) << "Unknown message: " << static_cast<int>(message);
        }
      });
  loop_thread_->Post(LoopMessage::kWaitForEvents);
}

TimerManagerImpl::~TimerManagerImpl() {
  if (!running_.exchange(false)) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_.clear();
    deadlines_.clear();
  }
  const uint64_t wake = 1;
  if (write(wake_fd_, &wake, sizeof(wake)) != sizeof(wake)) {
    LOG(ERROR) << __func__ << ": Failed to wake the timer loop: "
               << strerror(errno);
  }
  loop_thread_.reset();
  task_thread_.reset();
  close(timer_fd_);
  close(wake_fd_);
  close(epoll_fd_);
}

bool TimerManagerImpl::Schedule(Timer* timer, std::function<void()> task,
                                std::chrono::milliseconds delay) {
  if (!running_.load()) {
    LOG(ERROR) << __func__ << ": Timer manager is not running.";
    return false;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  Unlink(timer);
  const Clock::time_point expires_at = Clock::now() + delay;
  pending_[timer] = PendingTask{expires_at, std::move(task)};
  const bool earliest = deadlines_.empty() || expires_at < deadlines_.begin()->first;
  deadlines_.emplace(expires_at, timer);
  if (earliest) {
    return ArmForEarliest();
  }
  return true;
}

bool TimerManagerImpl::Cancel(Timer* timer) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = pending_.find(timer);
  if (it == pending_.end()) {
    return false;
  }
  const bool was_earliest =
      !deadlines_.empty() && deadlines_.begin()->second == timer;
  Unlink(timer);
  if (was_earliest) {
    ArmForEarliest();
  }
  return true;
}

bool TimerManagerImpl::IsScheduled(Timer* timer) {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.find(timer) != pending_.end();
}

void TimerManagerImpl::Unlink(Timer* timer) {
  auto it = pending_.find(timer);
  if (it == pending_.end()) {
    return;
  }
  auto range = deadlines_.equal_range(it->second.expires_at);
  for (auto entry = range.first; entry != range.second; ++entry) {
    if (entry->second == timer) {
      deadlines_.erase(entry);
      break;
    }
  }
  pending_.erase(it);
}

bool TimerManagerImpl::ArmForEarliest() {
  if (deadlines_.empty()) {
    // A zero it_value disarms the timerfd.
    return SetTimer(std::chrono::nanoseconds(0));
  }
  auto delay = deadlines_.begin()->first - Clock::now();
  if (delay <= Clock::duration::zero()) {
    // Already due; fire on the next loop iteration.
    delay = std::chrono::nanoseconds(1);
  }
  return SetTimer(std::chrono::duration_cast<std::chrono::nanoseconds>(delay));
}

bool TimerManagerImpl::SetTimer(std::chrono::nanoseconds delay) {
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(delay);
  itimerspec timer_spec{};
  timer_spec.it_value.tv_sec =
      static_cast<time_t>(ms.count() / kMillisecondsPerSecond);
  timer_spec.it_value.tv_nsec =
      static_cast<long>((ms.count() % kMillisecondsPerSecond) *
                        kNanosecondsPerMillisecond) +
      static_cast<long>((delay - ms).count());
  if (timerfd_settime(timer_fd_, 0, &timer_spec, nullptr) < 0) {
    LOG(ERROR) << __func__ << ": Failed to set timerfd: " << strerror(errno);
    return false;
  }
  return true;
}

void TimerManagerImpl::WaitForEvents() {
  if (!running_.load()) {
    return;
  }
  epoll_event event[2];
  int event_count = RunSyscallUntilNoIntr(
      [this, &event]() -> int { return epoll_wait(epoll_fd_, event, 2, -1); });
  if (event_count < 0) {
    LOG(ERROR) << __func__ << ": epoll_wait error: " << strerror(errno);
  }
  for (int i = 0; i < event_count; ++i) {
    uint64_t count;
    if (read(event[i].data.fd, &count, sizeof(count)) != sizeof(count)) {
      continue;
    }
    if (event[i].data.fd == wake_fd_) {
      return;
    }
    RunExpiredTasks();
  }
  if (running_.load()) {
    loop_thread_->Post(LoopMessage::kWaitForEvents);
  }
}

void TimerManagerImpl::RunExpiredTasks() {
  std::lock_guard<std::mutex> lock(mutex_);
  const Clock::time_point now = Clock::now();
  while (!deadlines_.empty() && deadlines_.begin()->first <= now) {
    Timer* timer = deadlines_.begin()->second;
    deadlines_.erase(deadlines_.begin());
    auto it = pending_.find(timer);
    if (it == pending_.end()) {
      continue;
    }
    std::function<void()> task = std::move(it->second.task);
    pending_.erase(it);
    // The task may schedule timers itself, so it runs outside the lock on
    // the task thread.
    task_thread_->Post(std::move(task));
  }
  ArmForEarliest();
}

TimerManager& TimerManager::GetManager() {
  static TimerManagerImpl manager;
  return manager;
}

}  // namespace util
}  // namespace fprint_binding
