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

#include <cstddef>
#include <cstdint>
#include <vector>

namespace fprint_binding {

class Property {
 public:
  // Config properties.
  static constexpr char kConfigFile[] = "fprint_binding.config_file";
  static constexpr char kVerboseLogging[] = "fprint_binding.verbose_logging";
  static constexpr char kOperationTimeoutMs[] =
      "fprint_binding.operation_timeout_ms";
};

// Values match FpScanType.
enum class ScanType : uint8_t {
  kSwipe = 0,
  kPress,
};

// Values match FpDeviceFeature.
enum class DeviceFeature : uint32_t {
  kNone = 0,
  kCapture = 1 << 0,
  kIdentify = 1 << 1,
  kVerify = 1 << 2,
  kStorage = 1 << 3,
  kStorageList = 1 << 4,
  kStorageDelete = 1 << 5,
  kStorageClear = 1 << 6,
  kDuplicatesCheck = 1 << 7,
  kAlwaysOn = 1 << 8,
  kUpdatePrint = 1 << 9,
};

constexpr DeviceFeature operator|(DeviceFeature lhs, DeviceFeature rhs) {
  return static_cast<DeviceFeature>(static_cast<uint32_t>(lhs) |
                                    static_cast<uint32_t>(rhs));
}

constexpr bool HasDeviceFeature(DeviceFeature features, DeviceFeature flag) {
  return (static_cast<uint32_t>(features) & static_cast<uint32_t>(flag)) != 0;
}

// Calendar date a print was enrolled on.
struct EnrollDate {
  int year = 0;
  int month = 0;
  int day = 0;

  bool operator==(const EnrollDate& other) const = default;
};

// libfprint's serialized print, passed through unmodified.
using SerializedPrint = std::vector<uint8_t>;

}  // namespace fprint_binding
