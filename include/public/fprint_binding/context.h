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

#include <memory>
#include <mutex>
#include <vector>

#include "fprint_binding/device.h"
#include "fprint_binding/result.h"

namespace fprint_binding {

/**
 * @class Context
 * @brief Entry point of the binding: owns the libfprint context and the
 * devices discovered through it.
 *
 * Devices are handed out as shared pointers, and the same Device object is
 * returned for a reader every time it is listed. Destroying the Context
 * detaches every Device it handed out; a detached Device rejects blocking
 * operations with ErrorKind::kNotOpen. If close_open_devices_on_teardown is
 * configured, devices still open at that point are closed first.
 */
class Context {
 public:
  /**
   * @brief Initializes libfprint.
   *
   * @return The new context, or a kInternal error if libfprint could not be
   * initialized.
   */
  static Result<std::unique_ptr<Context>> Create();

  ~Context();

  Context(const Context&) = delete;
  Context& operator=(const Context&) = delete;

  /**
   * @brief Asks libfprint to rescan for attached readers.
   */
  void Enumerate();

  /**
   * @brief Lists the readers currently known to libfprint.
   *
   * Readers whose driver is not in the configured driver_allowlist are left
   * out. Devices listed earlier whose reader has since been removed are
   * detached and dropped from the context.
   */
  std::vector<std::shared_ptr<Device>> ListDevices();

 private:
  explicit Context(FpContext* native);

  std::shared_ptr<Device> GetOrCreateDevice(FpDevice* native);
  // Removes and returns the cached devices missing from `native_devices`.
  std::vector<std::shared_ptr<Device>> EvictUnplugged(
      GPtrArray* native_devices);

  FpContext* const native_;
  std::mutex mutex_;
  std::vector<std::shared_ptr<Device>> devices_;
};

}  // namespace fprint_binding
