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

#include <cstdint>
#include <optional>
#include <ostream>
#include <string_view>

namespace fprint_binding {

// Values match FpFinger.
enum class Finger : uint8_t {
  kUnknown = 0,
  kLeftThumb,
  kLeftIndex,
  kLeftMiddle,
  kLeftRing,
  kLeftLittle,
  kRightThumb,
  kRightIndex,
  kRightMiddle,
  kRightRing,
  kRightLittle,
};

inline constexpr Finger kFirstFinger = Finger::kLeftThumb;
inline constexpr Finger kLastFinger = Finger::kRightLittle;

std::string_view FingerToString(Finger finger);

/**
 * @brief Parses the names produced by FingerToString, e.g. "right-index".
 *
 * @return The finger, or std::nullopt if the name is not known.
 */
std::optional<Finger> FingerFromString(std::string_view name);

std::ostream& operator<<(std::ostream& os, Finger finger);

// Values match FpFingerStatusFlags.
enum class FingerStatus : uint8_t {
  kNone = 0,
  // The device is waiting for a finger.
  kNeeded = 1 << 0,
  // A finger is on the sensor.
  kPresent = 1 << 1,
};

constexpr FingerStatus operator|(FingerStatus lhs, FingerStatus rhs) {
  return static_cast<FingerStatus>(static_cast<uint8_t>(lhs) |
                                   static_cast<uint8_t>(rhs));
}

constexpr bool HasFingerStatus(FingerStatus flags, FingerStatus flag) {
  return (static_cast<uint8_t>(flags) & static_cast<uint8_t>(flag)) != 0;
}

}  // namespace fprint_binding
