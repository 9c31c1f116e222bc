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

#include "fprint_binding/finger.h"

#include <fprint.h>

#include <optional>
#include <ostream>
#include <string_view>

namespace fprint_binding {
namespace {

static_assert(static_cast<int>(Finger::kUnknown) == FP_FINGER_UNKNOWN);
static_assert(static_cast<int>(kFirstFinger) == FP_FINGER_FIRST);
static_assert(static_cast<int>(kLastFinger) == FP_FINGER_LAST);
static_assert(static_cast<int>(FingerStatus::kNeeded) ==
              FP_FINGER_STATUS_NEEDED);
static_assert(static_cast<int>(FingerStatus::kPresent) ==
              FP_FINGER_STATUS_PRESENT);

constexpr std::string_view kFingerNames[] = {
    "unknown",      "left-thumb",  "left-index", "left-middle",
    "left-ring",    "left-little", "right-thumb", "right-index",
    "right-middle", "right-ring",  "right-little"};

}  // namespace

std::string_view FingerToString(Finger finger) {
  const auto index = static_cast<size_t>(finger);
  if (index >= std::size(kFingerNames)) {
    return kFingerNames[0];
  }
  return kFingerNames[index];
}

std::optional<Finger> FingerFromString(std::string_view name) {
  for (size_t i = 0; i < std::size(kFingerNames); ++i) {
    if (kFingerNames[i] == name) {
      return static_cast<Finger>(i);
    }
  }
  return std::nullopt;
}

std::ostream& operator<<(std::ostream& os, Finger finger) {
  return os << FingerToString(finger);
}

}  // namespace fprint_binding
