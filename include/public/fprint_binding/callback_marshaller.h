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

#include <fprint.h>
#include <glib.h>

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>

#include "android-base/logging.h"

namespace fprint_binding {

/**
 * @class CallbackMarshaller
 * @brief Bridges a native callback/user-data pair to a typed handler.
 *
 * The marshaller boxes the handler behind a stable heap address. That address
 * is handed to libfprint as the callback's user data, together with one of
 * the fixed trampolines below. The marshaller lives on the stack of the
 * blocking call that issues the native request:
 *
 *   CallbackMarshaller<...> marshaller(handler);
 *   native_call(..., marshaller.GetTrampoline(), marshaller.GetUserData());
 *   marshaller.Seal();
 *
 * Once sealed, late invocations are dropped instead of reaching the handler.
 * The box is released exactly once, when the marshaller is destroyed, however
 * many times the trampoline ran.
 *
 * Invocations are serialized: the handler may be called from whichever thread
 * libfprint dispatches on, but never from two threads at once.
 *
 * @tparam NativeCallback The libfprint callback type (FpEnrollProgress or
 * FpMatchCb).
 * @tparam Args The native arguments forwarded to the handler, without the
 * device and user data.
 */
template <typename NativeCallback, typename... Args>
class CallbackMarshaller {
 public:
  using Handler = std::function<void(Args...)>;

  CallbackMarshaller(Handler handler, NativeCallback trampoline)
      : box_(handler ? std::make_unique<Box>(std::move(handler)) : nullptr),
        trampoline_(trampoline) {}

  ~CallbackMarshaller() { Seal(); }

  CallbackMarshaller(const CallbackMarshaller&) = delete;
  CallbackMarshaller& operator=(const CallbackMarshaller&) = delete;

  /**
   * @brief Returns the trampoline to register, or nullptr if there is no
   * handler.
   */
  NativeCallback GetTrampoline() const {
    return box_ ? trampoline_ : nullptr;
  }

  /**
   * @brief Returns the user data to register alongside the trampoline.
   */
  gpointer GetUserData() const { return box_.get(); }

  /**
   * @brief Stops forwarding invocations to the handler.
   *
   * Called once the native call has returned. Blocks until an invocation
   * running on another thread has finished.
   */
  void Seal() {
    if (box_) {
      std::lock_guard<std::mutex> lock(box_->mutex);
      box_->sealed = true;
    }
  }

  size_t GetInvocationCount() const {
    return box_ ? box_->invocations.load() : 0;
  }

  /**
   * @brief Forwards one native invocation to the boxed handler.
   *
   * Called by the trampolines only.
   *
   * @param user_data The user data registered with the native call.
   * @param args The typed arguments for the handler.
   */
  static void Dispatch(gpointer user_data, Args... args) {
    if (user_data == nullptr) {
      LOG(FATAL) << __func__ << ": Native callback without user data.";
    }
    Box* box = static_cast<Box*>(user_data);
    std::lock_guard<std::mutex> lock(box->mutex);
    if (box->sealed) {
      LOG(WARNING) << __func__
                   << ": Dropping a callback delivered after its call "
                      "returned.";
      return;
    }
    box->invocations++;
    box->handler(std::forward<Args>(args)...);
  }

 private:
  struct Box {
    explicit Box(Handler h) : handler(std::move(h)) {}

    Handler handler;
    std::mutex mutex;
    bool sealed = false;
    std::atomic<size_t> invocations{0};
  };

  std::unique_ptr<Box> box_;
  NativeCallback trampoline_;
};

// Handler arguments: completed stages, the print being enrolled (transfer
// none, may be nullptr) and the stage error (transfer none, may be nullptr).
using EnrollProgressMarshaller =
    CallbackMarshaller<FpEnrollProgress, int, FpPrint*, const GError*>;

// Handler arguments: the matching print (transfer none, nullptr if no match),
// the scanned print (transfer none, may be nullptr) and the match error
// (transfer none, may be nullptr).
using MatchMarshaller =
    CallbackMarshaller<FpMatchCb, FpPrint*, FpPrint*, const GError*>;

/**
 * @brief The FpEnrollProgress registered for every enrollment.
 *
 * `user_data` must be the address returned by
 * EnrollProgressMarshaller::GetUserData().
 */
void EnrollProgressTrampoline(FpDevice* device, gint completed_stages,
                              FpPrint* print, gpointer user_data,
                              GError* error);

/**
 * @brief The FpMatchCb registered for every verification and identification.
 *
 * `user_data` must be the address returned by MatchMarshaller::GetUserData().
 */
void MatchTrampoline(FpDevice* device, FpPrint* match, FpPrint* print,
                     gpointer user_data, GError* error);

inline EnrollProgressMarshaller MakeEnrollProgressMarshaller(
    EnrollProgressMarshaller::Handler handler) {
  return EnrollProgressMarshaller(std::move(handler),
                                  &EnrollProgressTrampoline);
}

inline MatchMarshaller MakeMatchMarshaller(MatchMarshaller::Handler handler) {
  return MatchMarshaller(std::move(handler), &MatchTrampoline);
}

}  // namespace fprint_binding
