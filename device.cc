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

#define LOG_TAG "fprint_binding.device"

#include "fprint_binding/device.h"

#include <fprint.h>
#include <gio/gio.h>
#include <glib.h>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "android-base/logging.h"
#include "fprint_binding/callback_marshaller.h"
#include "fprint_binding/config/binding_config_loader.h"
#include "fprint_binding/error.h"
#include "fprint_binding/finger.h"
#include "fprint_binding/fprint_types.h"
#include "fprint_binding/image.h"
#include "fprint_binding/native/fprint_wrapper.h"
#include "fprint_binding/print.h"
#include "fprint_binding/result.h"
#include "fprint_binding/util/timer_manager.h"

namespace fprint_binding {
namespace {

using ::fprint_binding::config::BindingConfigLoader;
using ::fprint_binding::native::FprintWrapper;

std::string ToString(const gchar* value) {
  return value == nullptr ? std::string() : std::string(value);
}

}  // namespace

/**
 * Tracks one blocking operation: marks the device busy for its lifetime,
 * owns the GCancellable handed to libfprint and, when a timeout is
 * configured, the timer that cancels it.
 */
class Device::ScopedOperation {
 public:
  ScopedOperation(Device& device, const char* name,
                  std::shared_ptr<GCancellable> cancellable, int timeout_ms)
      : device_(device),
        name_(name),
        cancellable_(std::move(cancellable)),
        timed_out_(std::make_shared<std::atomic<bool>>(false)),
        timeout_ms_(timeout_ms) {
    if (timeout_ms_ <= 0) {
      return;
    }
    // The task may still run after this object is gone, so it only touches
    // state it shares ownership of.
    std::shared_ptr<GCancellable> cancellable_ref = cancellable_;
    std::shared_ptr<std::atomic<bool>> timed_out = timed_out_;
    std::string operation_name(name_);
    if (!timer_.Schedule(
            [cancellable_ref, timed_out, operation_name]() {
              LOG(WARNING) << "Operation " << operation_name
                           << " timed out, cancelling.";
              timed_out->store(true);
              g_cancellable_cancel(cancellable_ref.get());
            },
            std::chrono::milliseconds(timeout_ms_))) {
      LOG(ERROR) << __func__ << ": Failed to arm the timeout of " << name_;
    }
  }

  ~ScopedOperation() {
    timer_.Cancel();
    {
      std::lock_guard<std::mutex> lock(device_.mutex_);
      if (device_.in_flight_ == cancellable_) {
        device_.in_flight_.reset();
      }
    }
    device_.operation_done_.notify_all();
  }

  ScopedOperation(const ScopedOperation&) = delete;
  ScopedOperation& operator=(const ScopedOperation&) = delete;

  const char* GetName() const { return name_; }
  GCancellable* GetCancellable() const { return cancellable_.get(); }
  bool HasTimedOut() const { return timed_out_->load(); }
  int GetTimeoutMs() const { return timeout_ms_; }

 private:
  Device& device_;
  const char* name_;
  std::shared_ptr<GCancellable> cancellable_;
  std::shared_ptr<std::atomic<bool>> timed_out_;
  const int timeout_ms_;
  util::Timer timer_;
};

Device::Device(FpDevice* native)
    : native_(static_cast<FpDevice*>(
          FprintWrapper::GetWrapper().ObjectRef(native))) {}

Device::~Device() {
  if (is_open_) {
    LOG(WARNING) << __func__ << ": Device destroyed while open.";
  }
  FprintWrapper::GetWrapper().ObjectUnref(native_);
}

FpDevice* Device::GetNative() const { return native_; }

bool Device::IsDetached() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return detached_;
}

std::string Device::GetDriver() const {
  return ToString(FprintWrapper::GetWrapper().DeviceGetDriver(native_));
}

std::string Device::GetDeviceId() const {
  return ToString(FprintWrapper::GetWrapper().DeviceGetDeviceId(native_));
}

std::string Device::GetName() const {
  return ToString(FprintWrapper::GetWrapper().DeviceGetName(native_));
}

ScanType Device::GetScanType() const {
  return static_cast<ScanType>(
      FprintWrapper::GetWrapper().DeviceGetScanType(native_));
}

FingerStatus Device::GetFingerStatus() const {
  return static_cast<FingerStatus>(
      FprintWrapper::GetWrapper().DeviceGetFingerStatus(native_));
}

bool Device::IsOpen() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return is_open_;
}

Result<int> Device::GetNrEnrollStages() const {
  if (!IsOpen()) {
    return Error(ErrorKind::kNotOpen, "Device is not open");
  }
  return static_cast<int>(
      FprintWrapper::GetWrapper().DeviceGetNrEnrollStages(native_));
}

Result<DeviceFeature> Device::GetFeatures() const {
  if (!IsOpen()) {
    return Error(ErrorKind::kNotOpen, "Device is not open");
  }
  return static_cast<DeviceFeature>(
      FprintWrapper::GetWrapper().DeviceGetFeatures(native_));
}

bool Device::HasFeature(DeviceFeature feature) const {
  Result<DeviceFeature> features = GetFeatures();
  return features.IsOk() && HasDeviceFeature(features.GetValue(), feature);
}

Result<std::unique_ptr<Device::ScopedOperation>> Device::BeginOperation(
    const char* name, Requirement requirement,
    std::optional<DeviceFeature> feature) {
  std::shared_ptr<GCancellable> cancellable;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    std::optional<Error> rejection;
    if (detached_) {
      rejection = Error(ErrorKind::kNotOpen,
                        "Device was detached from its context");
    } else if (in_flight_) {
      rejection =
          Error(ErrorKind::kBusy, "Another operation is in flight");
    } else if (requirement == Requirement::kOpen && !is_open_) {
      rejection = Error(ErrorKind::kNotOpen, "Device is not open");
    } else if (requirement == Requirement::kClosed && permission_denied_) {
      rejection = Error(ErrorKind::kPermissionDenied,
                        "Access to the device was denied earlier");
    } else if (requirement == Requirement::kClosed && is_open_) {
      rejection = Error(ErrorKind::kBusy, "Device is already open");
    }
    if (rejection.has_value()) {
      LOG(WARNING) << __func__ << ": " << name << " rejected: " << *rejection;
      return *rejection;
    }
    cancellable = std::shared_ptr<GCancellable>(g_cancellable_new(),
                                                g_object_unref);
    in_flight_ = cancellable;
    in_flight_thread_ = std::this_thread::get_id();
  }
  auto operation = std::make_unique<ScopedOperation>(
      *this, name, std::move(cancellable),
      BindingConfigLoader::GetLoader().GetOperationTimeoutMs());
  if (feature.has_value() && !HasFeature(*feature)) {
    Error rejection(ErrorKind::kNotSupported,
                    std::string(name) + " is not supported by " +
                        GetDeviceId());
    LOG(WARNING) << __func__ << ": " << name << " rejected: " << rejection;
    return rejection;
  }
  return operation;
}

Error Device::RecordFailure(const ScopedOperation& operation, Error error) {
  if (error.GetKind() == ErrorKind::kPermissionDenied) {
    std::lock_guard<std::mutex> lock(mutex_);
    permission_denied_ = true;
  }
  if (error.GetKind() == ErrorKind::kCancelled && operation.HasTimedOut()) {
    error = Error::Wrap(ErrorKind::kCancelled,
                        std::string(operation.GetName()) + " timed out after " +
                            std::to_string(operation.GetTimeoutMs()) + " ms",
                        error);
  }
  LOG(ERROR) << operation.GetName() << " failed: " << error;
  return error;
}

Status Device::RunSimpleOperation(
    const char* name, Requirement requirement,
    const std::function<gboolean(GCancellable*, GError**)>& call,
    std::optional<DeviceFeature> feature) {
  auto operation = BeginOperation(name, requirement, feature);
  if (!operation.IsOk()) {
    return operation.GetError();
  }
  const ScopedOperation& scoped = *operation.GetValue();
  GError* error = nullptr;
  if (!call(scoped.GetCancellable(), &error)) {
    return RecordFailure(scoped,
                         Error::TakeNative(&error, std::string(name) + " failed"));
  }
  if (error != nullptr) {
    LOG(WARNING) << name << " succeeded with a spurious error: "
                 << Error::FromNative(error);
    g_clear_error(&error);
  }
  return Status::Ok();
}

Status Device::Open() {
  Status status = RunSimpleOperation(
      "Open", Requirement::kClosed,
      [this](GCancellable* cancellable, GError** error) -> gboolean {
        if (!FprintWrapper::GetWrapper().DeviceOpenSync(native_, cancellable,
                                                        error)) {
          return FALSE;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        is_open_ = true;
        return TRUE;
      });
  if (status.IsOk()) {
    LOG(INFO) << __func__ << ": Opened " << GetDeviceId() << " ("
              << GetDriver() << ").";
  }
  return status;
}

Status Device::Close() {
  return RunSimpleOperation(
      "Close", Requirement::kOpen,
      [this](GCancellable* cancellable, GError** error) -> gboolean {
        const gboolean closed = FprintWrapper::GetWrapper().DeviceCloseSync(
            native_, cancellable, error);
        // libfprint reports NOT_OPEN when the device already went away; the
        // wrapper must agree with it.
        if (closed || (*error != nullptr &&
                       Error::FromNative(*error).GetKind() ==
                           ErrorKind::kNotOpen)) {
          std::lock_guard<std::mutex> lock(mutex_);
          is_open_ = false;
        }
        return closed;
      });
}

Result<Print> Device::EnrollInternal(const Print& template_print,
                                     EnrollProgressMarshaller::Handler handler) {
  auto operation = BeginOperation("Enroll", Requirement::kOpen);
  if (!operation.IsOk()) {
    return operation.GetError();
  }
  const ScopedOperation& scoped = *operation.GetValue();

  if (BindingConfigLoader::GetLoader().IsEnrollProgressLoggingEnabled()) {
    handler = [this, inner = std::move(handler)](int completed_stages,
                                                 FpPrint* print,
                                                 const GError* error) {
      LOG(INFO) << "Enroll stage " << completed_stages << " on "
                << GetDeviceId()
                << (error != nullptr ? " failed: " : " completed")
                << (error != nullptr ? Error::FromNative(error).ToString()
                                     : std::string());
      if (inner) {
        inner(completed_stages, print, error);
      }
    };
  }

  EnrollProgressMarshaller marshaller =
      MakeEnrollProgressMarshaller(std::move(handler));
  GError* error = nullptr;
  FpPrint* enrolled = FprintWrapper::GetWrapper().DeviceEnrollSync(
      native_, template_print.GetNative(), scoped.GetCancellable(),
      marshaller.GetTrampoline(), marshaller.GetUserData(), &error);
  marshaller.Seal();

  if (enrolled == nullptr) {
    if (error == nullptr) {
      LOG(FATAL) << __func__
                 << ": fp_device_enroll_sync returned neither a print nor "
                    "an error.";
    }
    return RecordFailure(scoped, Error::TakeNative(&error, "Enroll failed"));
  }
  if (error != nullptr) {
    LOG(WARNING) << __func__ << ": Enrolled with a spurious error: "
                 << Error::FromNative(error);
    g_clear_error(&error);
  }
  LOG(INFO) << __func__ << ": Enrolled a print on " << GetDeviceId()
            << " after " << marshaller.GetInvocationCount()
            << " progress reports.";
  return Print::Adopt(enrolled);
}

Result<VerifyResult> Device::VerifyInternal(const Print& enrolled_print,
                                            MatchMarshaller::Handler handler,
                                            std::optional<Print>* match_buffer) {
  auto operation = BeginOperation("Verify", Requirement::kOpen);
  if (!operation.IsOk()) {
    return operation.GetError();
  }
  const ScopedOperation& scoped = *operation.GetValue();

  MatchMarshaller marshaller = MakeMatchMarshaller(std::move(handler));
  gboolean matched = FALSE;
  FpPrint* scanned = nullptr;
  GError* error = nullptr;
  const gboolean completed = FprintWrapper::GetWrapper().DeviceVerifySync(
      native_, enrolled_print.GetNative(), scoped.GetCancellable(),
      marshaller.GetTrampoline(), marshaller.GetUserData(), &matched, &scanned,
      &error);
  marshaller.Seal();

  std::optional<Print> scanned_print;
  if (scanned != nullptr) {
    scanned_print = Print::Adopt(scanned);
  }
  if (!completed) {
    return RecordFailure(scoped, Error::TakeNative(&error, "Verify failed"));
  }
  if (error != nullptr) {
    LOG(WARNING) << __func__ << ": Verified with a spurious error: "
                 << Error::FromNative(error);
    g_clear_error(&error);
  }
  if (match_buffer != nullptr) {
    *match_buffer = scanned_print;
  }
  return VerifyResult{.matched = matched != FALSE,
                      .scanned_print = std::move(scanned_print)};
}

Result<IdentifyResult> Device::IdentifyInternal(
    const std::vector<Print>& candidates, MatchMarshaller::Handler handler,
    std::optional<Print>* out_print) {
  auto operation = BeginOperation("Identify", Requirement::kOpen);
  if (!operation.IsOk()) {
    return operation.GetError();
  }
  if (candidates.empty()) {
    LOG(INFO) << __func__ << ": No candidates, nothing can match.";
    if (out_print != nullptr) {
      out_print->reset();
    }
    return IdentifyResult{};
  }
  const ScopedOperation& scoped = *operation.GetValue();

  // The gallery only borrows the candidates' references.
  GPtrArray* gallery = g_ptr_array_sized_new(candidates.size());
  for (const Print& candidate : candidates) {
    g_ptr_array_add(gallery, candidate.GetNative());
  }

  MatchMarshaller marshaller = MakeMatchMarshaller(std::move(handler));
  FpPrint* match = nullptr;
  FpPrint* scanned = nullptr;
  GError* error = nullptr;
  const gboolean completed = FprintWrapper::GetWrapper().DeviceIdentifySync(
      native_, gallery, scoped.GetCancellable(), marshaller.GetTrampoline(),
      marshaller.GetUserData(), &match, &scanned, &error);
  marshaller.Seal();
  g_ptr_array_unref(gallery);

  std::optional<Print> matched_print;
  if (match != nullptr) {
    matched_print = Print::Adopt(match);
  }
  std::optional<Print> scanned_print;
  if (scanned != nullptr) {
    scanned_print = Print::Adopt(scanned);
  }
  if (!completed) {
    return RecordFailure(scoped, Error::TakeNative(&error, "Identify failed"));
  }
  if (error != nullptr) {
    LOG(WARNING) << __func__ << ": Identified with a spurious error: "
                 << Error::FromNative(error);
    g_clear_error(&error);
  }

  IdentifyResult result;
  if (matched_print.has_value()) {
    // Hand back the caller's own handle: by identity first, then by content
    // for drivers that return a copy.
    for (size_t i = 0; i < candidates.size() && !result.match_index; ++i) {
      if (candidates[i].IsSameHandle(*matched_print)) {
        result.match_index = i;
      }
    }
    for (size_t i = 0; i < candidates.size() && !result.match_index; ++i) {
      if (candidates[i].Equals(*matched_print)) {
        result.match_index = i;
      }
    }
    if (result.match_index.has_value()) {
      result.match = candidates[*result.match_index];
    } else {
      LOG(WARNING) << __func__
                   << ": Matching print is not among the candidates.";
      result.match = std::move(matched_print);
    }
  }
  if (out_print != nullptr) {
    *out_print = scanned_print;
  }
  result.scanned_print = std::move(scanned_print);
  return result;
}

Result<Image> Device::CaptureImage(std::optional<bool> wait_for_finger) {
  auto operation = BeginOperation("CaptureImage", Requirement::kOpen,
                                  DeviceFeature::kCapture);
  if (!operation.IsOk()) {
    return operation.GetError();
  }
  const ScopedOperation& scoped = *operation.GetValue();
  const bool wait = wait_for_finger.value_or(
      BindingConfigLoader::GetLoader().IsCaptureWaitForFinger());

  GError* error = nullptr;
  FpImage* image = FprintWrapper::GetWrapper().DeviceCaptureSync(
      native_, wait ? TRUE : FALSE, scoped.GetCancellable(), &error);
  if (image == nullptr) {
    return RecordFailure(scoped,
                         Error::TakeNative(&error, "CaptureImage failed"));
  }
  if (error != nullptr) {
    LOG(WARNING) << __func__ << ": Captured with a spurious error: "
                 << Error::FromNative(error);
    g_clear_error(&error);
  }
  return Image::Adopt(image);
}

Result<std::vector<Print>> Device::ListPrints() {
  auto operation = BeginOperation("ListPrints", Requirement::kOpen,
                                  DeviceFeature::kStorageList);
  if (!operation.IsOk()) {
    return operation.GetError();
  }
  const ScopedOperation& scoped = *operation.GetValue();

  GError* error = nullptr;
  GPtrArray* stored = FprintWrapper::GetWrapper().DeviceListPrintsSync(
      native_, scoped.GetCancellable(), &error);
  if (stored == nullptr) {
    return RecordFailure(scoped,
                         Error::TakeNative(&error, "ListPrints failed"));
  }
  g_clear_error(&error);

  std::vector<Print> prints;
  prints.reserve(stored->len);
  for (guint i = 0; i < stored->len; ++i) {
    prints.push_back(
        Print::Borrow(static_cast<FpPrint*>(g_ptr_array_index(stored, i))));
  }
  // Drops the array's own element references.
  g_ptr_array_unref(stored);
  return prints;
}

Status Device::DeletePrint(const Print& print) {
  return RunSimpleOperation(
      "DeletePrint", Requirement::kOpen,
      [this, &print](GCancellable* cancellable, GError** error) {
        return FprintWrapper::GetWrapper().DeviceDeletePrintSync(
            native_, print.GetNative(), cancellable, error);
      },
      DeviceFeature::kStorageDelete);
}

Status Device::ClearStorage() {
  return RunSimpleOperation(
      "ClearStorage", Requirement::kOpen,
      [this](GCancellable* cancellable, GError** error) {
        return FprintWrapper::GetWrapper().DeviceClearStorageSync(
            native_, cancellable, error);
      },
      DeviceFeature::kStorageClear);
}

Status Device::Suspend() {
  return RunSimpleOperation(
      "Suspend", Requirement::kOpen,
      [this](GCancellable* cancellable, GError** error) {
        return FprintWrapper::GetWrapper().DeviceSuspendSync(
            native_, cancellable, error);
      });
}

Status Device::Resume() {
  return RunSimpleOperation(
      "Resume", Requirement::kOpen,
      [this](GCancellable* cancellable, GError** error) {
        return FprintWrapper::GetWrapper().DeviceResumeSync(
            native_, cancellable, error);
      });
}

bool Device::Cancel() {
  std::shared_ptr<GCancellable> in_flight;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    in_flight = in_flight_;
  }
  if (!in_flight) {
    return false;
  }
  LOG(INFO) << __func__ << ": Cancelling the operation on " << GetDeviceId();
  g_cancellable_cancel(in_flight.get());
  return true;
}

void Device::Detach(bool close_if_open) {
  bool was_open = false;
  {
    std::unique_lock<std::mutex> lock(mutex_);
    if (detached_) {
      return;
    }
    detached_ = true;
    if (in_flight_) {
      LOG(WARNING) << __func__ << ": Context destroyed during an operation on "
                   << GetDeviceId() << ", cancelling it.";
      g_cancellable_cancel(in_flight_.get());
      if (in_flight_thread_ == std::this_thread::get_id()) {
        // Torn down from a callback of the operation itself; it cannot have
        // returned yet, so the device is left to libfprint.
        LOG(WARNING) << __func__ << ": Not closing " << GetDeviceId()
                     << " from inside its own operation.";
        is_open_ = false;
        return;
      }
      operation_done_.wait(lock, [this] { return !in_flight_; });
    }
    was_open = is_open_;
    is_open_ = false;
  }
  if (!was_open || !close_if_open) {
    return;
  }
  GError* error = nullptr;
  if (!FprintWrapper::GetWrapper().DeviceCloseSync(native_, nullptr, &error)) {
    LOG(WARNING) << __func__ << ": Closing " << GetDeviceId()
                 << " on teardown failed: "
                 << Error::TakeNative(&error, "Close failed");
    return;
  }
  g_clear_error(&error);
  LOG(INFO) << __func__ << ": Closed " << GetDeviceId() << " on teardown.";
}

}  // namespace fprint_binding
