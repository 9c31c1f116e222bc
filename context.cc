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

#define LOG_TAG "fprint_binding.context"

#include "fprint_binding/context.h"

#include <fprint.h>
#include <glib.h>

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "android-base/logging.h"
#include "fprint_binding/config/binding_config_loader.h"
#include "fprint_binding/device.h"
#include "fprint_binding/error.h"
#include "fprint_binding/native/fprint_wrapper.h"
#include "fprint_binding/result.h"

namespace fprint_binding {

using ::fprint_binding::config::BindingConfigLoader;
using ::fprint_binding::native::FprintWrapper;

Result<std::unique_ptr<Context>> Context::Create() {
  FpContext* native = FprintWrapper::GetWrapper().ContextNew();
  if (native == nullptr) {
    LOG(ERROR) << __func__ << ": fp_context_new failed.";
    return Error(ErrorKind::kInternal,
                 "libfprint context initialization failed");
  }
  // The first use of the loader reads the configuration file.
  BindingConfigLoader::GetLoader();
  return std::unique_ptr<Context>(new Context(native));
}

Context::Context(FpContext* native) : native_(native) {}

Context::~Context() {
  const bool close_open_devices =
      BindingConfigLoader::GetLoader().IsCloseOpenDevicesOnTeardown();
  std::vector<std::shared_ptr<Device>> devices;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    devices.swap(devices_);
  }
  for (const std::shared_ptr<Device>& device : devices) {
    device->Detach(close_open_devices);
  }
  LOG(INFO) << __func__ << ": Detached " << devices.size() << " device(s).";
  FprintWrapper::GetWrapper().ObjectUnref(native_);
}

void Context::Enumerate() {
  FprintWrapper::GetWrapper().ContextEnumerate(native_);
}

std::shared_ptr<Device> Context::GetOrCreateDevice(FpDevice* native) {
  for (const std::shared_ptr<Device>& device : devices_) {
    if (device->GetNative() == native) {
      return device;
    }
  }
  std::shared_ptr<Device> device(new Device(native));
  devices_.push_back(device);
  return device;
}

std::vector<std::shared_ptr<Device>> Context::EvictUnplugged(
    GPtrArray* native_devices) {
  std::vector<std::shared_ptr<Device>> unplugged;
  auto it = devices_.begin();
  while (it != devices_.end()) {
    bool present = false;
    for (guint i = 0; i < native_devices->len && !present; ++i) {
      present = g_ptr_array_index(native_devices, i) == (*it)->GetNative();
    }
    if (present) {
      ++it;
      continue;
    }
    unplugged.push_back(std::move(*it));
    it = devices_.erase(it);
  }
  return unplugged;
}

std::vector<std::shared_ptr<Device>> Context::ListDevices() {
  std::vector<std::shared_ptr<Device>> devices;
  std::vector<std::shared_ptr<Device>> unplugged;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    // Owned by the context.
    GPtrArray* native_devices =
        FprintWrapper::GetWrapper().ContextGetDevices(native_);
    if (native_devices == nullptr) {
      LOG(WARNING) << __func__ << ": libfprint returned no device list.";
      return devices;
    }
    unplugged = EvictUnplugged(native_devices);

    const BindingConfigLoader& config = BindingConfigLoader::GetLoader();
    for (guint i = 0; i < native_devices->len; ++i) {
      auto* native =
          static_cast<FpDevice*>(g_ptr_array_index(native_devices, i));
      std::shared_ptr<Device> device = GetOrCreateDevice(native);
      const std::string driver = device->GetDriver();
      if (!config.IsDriverAllowed(driver)) {
        LOG(INFO) << __func__ << ": Skipping " << device->GetDeviceId()
                  << ", driver " << driver << " is not allowed.";
        continue;
      }
      devices.push_back(std::move(device));
    }
  }
  // Outside the lock: detaching waits for an operation still running.
  for (const std::shared_ptr<Device>& device : unplugged) {
    LOG(INFO) << __func__ << ": " << device->GetDeviceId()
              << " was removed, detaching it.";
    device->Detach(false);
  }
  return devices;
}

}  // namespace fprint_binding
