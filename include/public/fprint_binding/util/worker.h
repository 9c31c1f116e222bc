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
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <utility>

#include "android-base/logging.h"

namespace fprint_binding {
namespace util {

constexpr size_t kDefaultMaxQueueSize = 16;
constexpr std::chrono::seconds kPostTimeout{5};

/**
 * @class Worker
 * @brief A single thread draining a bounded queue of messages.
 *
 * Messages are handed to `handler` one at a time, in posting order, on the
 * worker's own thread.
 */
template <typename Message>
class Worker {
 public:
  explicit Worker(std::function<void(Message)> handler,
                  size_t max_queue_size = kDefaultMaxQueueSize)
      : handler_(std::move(handler)), max_queue_size_(max_queue_size) {
    worker_thread_ = std::thread(&Worker::RunWorkerLoop, this);
  }

  ~Worker() {
    Stop();
    if (worker_thread_.joinable()) {
      worker_thread_.join();
    }
  }

  Worker(const Worker&) = delete;
  Worker& operator=(const Worker&) = delete;

  /**
   * @brief Queues a message, waiting up to kPostTimeout for room.
   *
   * @return false if the worker was stopped or the queue stayed full.
   */
  bool Post(Message message) {
    std::unique_lock<std::mutex> lock(mutex_);
    producer_cv_.wait_for(lock, kPostTimeout, [&] {
      return message_queue_.size() < max_queue_size_ || !running_;
    });
    if (!running_) {
      return false;
    }
    if (message_queue_.size() >= max_queue_size_) {
      LOG(ERROR) << __func__ << ": Timed out waiting for queue space.";
      return false;
    }
    message_queue_.push(std::move(message));
    consumer_cv_.notify_one();
    return true;
  }

  /**
   * @brief Stops the loop. Queued messages that have not started are dropped.
   */
  void Stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) {
      return;
    }
    running_ = false;
    std::queue<Message>().swap(message_queue_);
    consumer_cv_.notify_all();
    producer_cv_.notify_all();
  }

 private:
  void RunWorkerLoop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (running_) {
      consumer_cv_.wait(lock,
                        [&] { return !message_queue_.empty() || !running_; });
      if (!running_) {
        break;
      }
      Message message = std::move(message_queue_.front());
      message_queue_.pop();
      lock.unlock();
      handler_(std::move(message));
      producer_cv_.notify_one();
      lock.lock();
    }
  }

  std::queue<Message> message_queue_;
  std::mutex mutex_;
  std::condition_variable producer_cv_;
  std::condition_variable consumer_cv_;
  std::thread worker_thread_;
  std::function<void(Message)> handler_;
  const size_t max_queue_size_;
  bool running_ = true;
};

}  // namespace util
}  // namespace fprint_binding
