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

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <variant>
#include <vector>

#include "fprint_binding/callback_marshaller.h"
#include "fprint_binding/error.h"
#include "fprint_binding/finger.h"
#include "fprint_binding/fprint_types.h"
#include "fprint_binding/image.h"
#include "fprint_binding/print.h"
#include "fprint_binding/result.h"

namespace fprint_binding {

class Device;

/**
 * @brief Progress callback of Device::Enroll().
 *
 * Arguments: the device, the number of completed stages, the print being
 * enrolled (if the driver reports one), the stage error (if the stage
 * failed) and the user data given to Enroll(). A stage error does not end
 * the enrollment by itself.
 */
template <typename UserData>
using EnrollProgressCallback = std::function<void(
    Device&, int, std::optional<Print>, std::optional<Error>,
    const std::shared_ptr<UserData>&)>;

/**
 * @brief Match callback of Device::Verify() and Device::Identify().
 *
 * Arguments: the device, the matching print (std::nullopt if nothing
 * matched), the freshly scanned print (if any), the scan error (if the scan
 * failed) and the user data. The callback runs as soon as the result is
 * known, which may be before the device has finished the operation.
 */
template <typename UserData>
using MatchCallback = std::function<void(
    Device&, std::optional<Print>, std::optional<Print>,
    std::optional<Error>, const std::shared_ptr<UserData>&)>;

struct VerifyResult {
  bool matched = false;
  std::optional<Print> scanned_print;
};

struct IdentifyResult {
  // Position of the matching print in the candidate list.
  std::optional<size_t> match_index;
  // The caller's own candidate handle, not a copy made by libfprint.
  std::optional<Print> match;
  std::optional<Print> scanned_print;
};

/**
 * @class Device
 * @brief One fingerprint reader, shared out by Context::ListDevices().
 *
 * A device is either Closed or Open. Operations that need an open device
 * fail with ErrorKind::kNotOpen while it is closed, and no native call is
 * made. Only one blocking operation may run at a time; a second one fails
 * with ErrorKind::kBusy. Cancel() may be called from any thread, including
 * from inside a callback.
 *
 * Blocking operations run libfprint's synchronous API, which iterates the
 * calling thread's default GMainContext. Callbacks therefore usually run on
 * the calling thread, but drivers are free to report from their own threads;
 * callbacks of one operation never run concurrently with each other, and
 * none runs after the operation has returned.
 *
 * Once the owning Context is destroyed the device is detached: blocking
 * operations fail with ErrorKind::kNotOpen.
 */
class Device {
 public:
  ~Device();

  Device(const Device&) = delete;
  Device& operator=(const Device&) = delete;

  // Identity. Available in every state.
  std::string GetDriver() const;
  std::string GetDeviceId() const;
  std::string GetName() const;
  ScanType GetScanType() const;
  FingerStatus GetFingerStatus() const;
  bool IsOpen() const;

  /**
   * @brief Gets the number of enrollment stages the driver requires.
   *
   * @return The stage count, or kNotOpen while the device is closed.
   */
  Result<int> GetNrEnrollStages() const;

  /**
   * @brief Gets the features the device supports.
   *
   * @return The feature flags, or kNotOpen while the device is closed.
   */
  Result<DeviceFeature> GetFeatures() const;

  /**
   * @brief Checks for a feature. Always false while the device is closed.
   */
  bool HasFeature(DeviceFeature feature) const;

  /**
   * @brief Opens the device.
   *
   * @return kBusy if the device is already open, kPermissionDenied if an
   * earlier attempt was denied, otherwise the translated native result.
   */
  Status Open();

  /**
   * @brief Closes the device. A second call fails with kNotOpen.
   */
  Status Close();

  /**
   * @brief Enrolls a finger, blocking until the enrollment ends.
   *
   * @param template_print A template from Print::New(), with the finger and
   * metadata the enrolled print should carry.
   * @param progress Called once per enrollment stage, may be empty.
   * @param user_data Handed to every progress invocation. The same object is
   * seen by every invocation, so mutations accumulate.
   *
   * @return The enrolled print, or the error that ended the enrollment.
   */
  template <typename UserData = std::monostate>
  Result<Print> Enroll(const Print& template_print,
                       EnrollProgressCallback<UserData> progress = nullptr,
                       std::shared_ptr<UserData> user_data = nullptr) {
    EnrollProgressMarshaller::Handler handler;
    if (progress) {
      handler = [this, progress = std::move(progress), user_data](
                    int completed_stages, FpPrint* print,
                    const GError* error) {
        progress(*this, completed_stages, Print::BorrowOptional(print),
                 Error::FromNativeOptional(error), user_data);
      };
    }
    return EnrollInternal(template_print, std::move(handler));
  }

  /**
   * @brief Scans a finger and checks it against `enrolled_print`.
   *
   * @param enrolled_print The print to verify against.
   * @param match_cb Called once the match result is known, may be empty.
   * @param user_data Handed to the callback.
   * @param match_buffer If not null, receives the scanned print.
   *
   * @return Whether the finger matched, together with the scanned print.
   */
  template <typename UserData = std::monostate>
  Result<VerifyResult> Verify(const Print& enrolled_print,
                              MatchCallback<UserData> match_cb = nullptr,
                              std::shared_ptr<UserData> user_data = nullptr,
                              std::optional<Print>* match_buffer = nullptr) {
    return VerifyInternal(enrolled_print,
                          MakeMatchHandler(std::move(match_cb),
                                           std::move(user_data)),
                          match_buffer);
  }

  /**
   * @brief Scans a finger and searches for it among `candidates`.
   *
   * The order in which candidates are compared is up to libfprint. An empty
   * candidate list yields no match without scanning.
   *
   * @param candidates The prints to search.
   * @param match_cb Called once the match result is known, may be empty.
   * @param user_data Handed to the callback.
   * @param out_print If not null, receives the scanned print.
   *
   * @return The matching candidate and its index, or no match.
   */
  template <typename UserData = std::monostate>
  Result<IdentifyResult> Identify(const std::vector<Print>& candidates,
                                  MatchCallback<UserData> match_cb = nullptr,
                                  std::shared_ptr<UserData> user_data = nullptr,
                                  std::optional<Print>* out_print = nullptr) {
    return IdentifyInternal(candidates,
                            MakeMatchHandler(std::move(match_cb),
                                             std::move(user_data)),
                            out_print);
  }

  /**
   * @brief Captures a raw image. Needs DeviceFeature::kCapture.
   *
   * @param wait_for_finger Whether to wait for a finger before capturing.
   * Defaults to the configured capture_wait_for_finger.
   */
  Result<Image> CaptureImage(std::optional<bool> wait_for_finger = std::nullopt);

  // On-device storage. Needs the matching kStorage* feature.
  Result<std::vector<Print>> ListPrints();
  Status DeletePrint(const Print& print);
  Status ClearStorage();

  Status Suspend();
  Status Resume();

  /**
   * @brief Cancels the operation in flight, if any.
   *
   * The cancelled operation returns kCancelled and the device keeps its
   * open state.
   *
   * @return false if no operation was in flight.
   */
  bool Cancel();

 private:
  friend class Context;
  friend class Print;

  enum class Requirement {
    kOpen,
    kClosed,
  };

  class ScopedOperation;

  explicit Device(FpDevice* native);

  template <typename UserData>
  MatchMarshaller::Handler MakeMatchHandler(MatchCallback<UserData> match_cb,
                                            std::shared_ptr<UserData> user_data) {
    if (!match_cb) {
      return nullptr;
    }
    return [this, match_cb = std::move(match_cb), user_data](
               FpPrint* match, FpPrint* print, const GError* error) {
      match_cb(*this, Print::BorrowOptional(match),
               Print::BorrowOptional(print), Error::FromNativeOptional(error),
               user_data);
    };
  }

  // Rejects the call unless the device is idle, in the required state and,
  // when `feature` is set, supports it.
  Result<std::unique_ptr<ScopedOperation>> BeginOperation(
      const char* name, Requirement requirement,
      std::optional<DeviceFeature> feature = std::nullopt);
  Error RecordFailure(const ScopedOperation& operation, Error error);

  Result<Print> EnrollInternal(const Print& template_print,
                               EnrollProgressMarshaller::Handler handler);
  Result<VerifyResult> VerifyInternal(const Print& enrolled_print,
                                      MatchMarshaller::Handler handler,
                                      std::optional<Print>* match_buffer);
  Result<IdentifyResult> IdentifyInternal(const std::vector<Print>& candidates,
                                          MatchMarshaller::Handler handler,
                                          std::optional<Print>* out_print);
  Status RunSimpleOperation(
      const char* name, Requirement requirement,
      const std::function<gboolean(GCancellable*, GError**)>& call,
      std::optional<DeviceFeature> feature = std::nullopt);

  // Called by the owning Context before it goes away.
  void Detach(bool close_if_open);
  bool IsDetached() const;
  FpDevice* GetNative() const;

  FpDevice* const native_;

  mutable std::mutex mutex_;
  bool is_open_ = false;
  bool permission_denied_ = false;
  bool detached_ = false;
  std::shared_ptr<GCancellable> in_flight_;
  std::thread::id in_flight_thread_;
  std::condition_variable operation_done_;
};

}  // namespace fprint_binding
