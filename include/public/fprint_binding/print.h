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

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "fprint_binding/finger.h"
#include "fprint_binding/fprint_types.h"
#include "fprint_binding/image.h"
#include "fprint_binding/result.h"

namespace fprint_binding {

class Device;

/**
 * @class Print
 * @brief A fingerprint template.
 *
 * A Print is a value. Copies share the native template until one of them is
 * modified; a setter first gives its Print a private native template when
 * the current one is referenced elsewhere, so a copy never observes changes
 * made through another. The matching payload is owned by libfprint and never
 * interpreted by the binding.
 */
class Print {
 public:
  /**
   * @brief Creates an empty template scoped to the capabilities of `device`.
   *
   * The template is meant to be handed to Device::Enroll().
   *
   * @param device The device the print will be enrolled on.
   *
   * @return The new print, or kNotOpen if the device has been detached from
   * its context.
   *
   */
  static Result<Print> New(Device& device);

  /**
   * @brief Recreates a print from the bytes produced by Serialize().
   *
   * @param data The serialized print.
   *
   * @return The print, or the translated native error if the data cannot be
   * parsed.
   *
   */
  static Result<Print> Deserialize(std::span<const uint8_t> data);

  Print(const Print& other);
  Print& operator=(const Print& other);
  Print(Print&& other) noexcept;
  Print& operator=(Print&& other) noexcept;
  ~Print();

  // The setters fail only when a shared template cannot be copied, or, for
  // the enroll date, with kInvalidArgument on a date that does not exist.
  // A copied template loses the image attached to the original.
  std::optional<std::string> GetUsername() const;
  Status SetUsername(std::string_view username);

  std::optional<std::string> GetDescription() const;
  Status SetDescription(std::string_view description);

  Finger GetFinger() const;
  Status SetFinger(Finger finger);

  std::optional<EnrollDate> GetEnrollDate() const;
  Status SetEnrollDate(const EnrollDate& date);

  // Driver and device id the print was enrolled with.
  std::string GetDriver() const;
  std::string GetDeviceId() const;

  // Whether the template lives in the device's own storage.
  bool IsDeviceStored() const;

  // The image the print was generated from, if the driver kept it.
  std::optional<Image> GetImage() const;

  // Whether the print can be matched on `device`.
  bool IsCompatible(const Device& device) const;

  // Whether both prints hold the same matching data.
  bool Equals(const Print& other) const;

  // Whether both values currently share the same native template.
  bool IsSameHandle(const Print& other) const {
    return native_ == other.native_;
  }

  /**
   * @brief Serializes the print into libfprint's binary format.
   *
   * The result contains the metadata and the matching payload exactly as
   * libfprint encodes them.
   *
   * @return The serialized bytes, or the translated native error.
   *
   */
  Result<SerializedPrint> Serialize() const;

 private:
  friend class Device;

  // Takes over one reference held by the caller.
  static Print Adopt(FpPrint* native);
  // Takes a new reference; the caller keeps its own.
  static Print Borrow(FpPrint* native);
  static std::optional<Print> BorrowOptional(FpPrint* native);

  explicit Print(FpPrint* native);

  FpPrint* GetNative() const;
  void Release();

  // Replaces a shared native template with a private copy.
  Status MakeExclusive(const char* caller);

  FpPrint* native_;
};

}  // namespace fprint_binding
