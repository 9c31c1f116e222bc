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

namespace fprint_binding {
namespace config {
namespace constants {

inline constexpr char kBindingConfigFile[] =
    "/etc/fprint_binding/fprint_binding.json";

inline constexpr int kDefaultOperationTimeoutMs = 0;
inline constexpr bool kDefaultCaptureWaitForFinger = true;
inline constexpr bool kDefaultLogEnrollProgress = false;
inline constexpr bool kDefaultCloseOpenDevicesOnTeardown = true;

}  // namespace constants
}  // namespace config
}  // namespace fprint_binding
