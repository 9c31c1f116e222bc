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

#define LOG_TAG "fprint_binding.print"

#include "fprint_binding/print.h"

#include <fprint.h>
#include <glib.h>

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include "android-base/logging.h"
#include "fprint_binding/device.h"
#include "fprint_binding/error.h"
#include "fprint_binding/finger.h"
#include "fprint_binding/fprint_types.h"
#include "fprint_binding/image.h"
#include "fprint_binding/native/fprint_wrapper.h"
#include "fprint_binding/result.h"

namespace fprint_binding {
namespace {

using ::fprint_binding::native::FprintWrapper;

std::optional<std::string> ToOptionalString(const gchar* value) {
  if (value == nullptr) {
    return std::nullopt;
  }
  return std::string(value);
}

}  // namespace

Print::Print(FpPrint* native) : native_(native) {
  if (native_ == nullptr) {
    LOG(FATAL) << __func__ << ": Wrapping a null native print.";
  }
}

Print Print::Adopt(FpPrint* native) {
  if (native == nullptr) {
    LOG(FATAL) << __func__ << ": Adopting a null native print.";
  }
  return Print(static_cast<FpPrint*>(
      FprintWrapper::GetWrapper().ObjectTakeOwnership(native)));
}

Print Print::Borrow(FpPrint* native) {
  if (native == nullptr) {
    LOG(FATAL) << __func__ << ": Borrowing a null native print.";
  }
  return Print(
      static_cast<FpPrint*>(FprintWrapper::GetWrapper().ObjectRef(native)));
}

std::optional<Print> Print::BorrowOptional(FpPrint* native) {
  if (native == nullptr) {
    return std::nullopt;
  }
  return Borrow(native);
}

Result<Print> Print::New(Device& device) {
  if (device.IsDetached()) {
    return Error(ErrorKind::kNotOpen,
                 "Cannot create a print for a device whose context is gone");
  }
  FpPrint* native = FprintWrapper::GetWrapper().PrintNew(device.GetNative());
  if (native == nullptr) {
    return Error(ErrorKind::kInternal, "fp_print_new returned no print");
  }
  return Adopt(native);
}

Result<Print> Print::Deserialize(std::span<const uint8_t> data) {
  if (data.empty()) {
    return Error(ErrorKind::kInvalidArgument, "Serialized print is empty");
  }
  GError* error = nullptr;
  FpPrint* native = FprintWrapper::GetWrapper().PrintDeserialize(
      data.data(), data.size(), &error);
  if (native == nullptr) {
    return Error::TakeNative(&error, "Print deserialization failed");
  }
  if (error != nullptr) {
    LOG(WARNING) << __func__ << ": Deserialized with a spurious error: "
                 << Error::FromNative(error);
    g_clear_error(&error);
  }
  return Adopt(native);
}

Print::Print(const Print& other)
    : native_(static_cast<FpPrint*>(
          FprintWrapper::GetWrapper().ObjectRef(other.GetNative()))) {}

Print& Print::operator=(const Print& other) {
  if (this != &other) {
    FpPrint* native = static_cast<FpPrint*>(
        FprintWrapper::GetWrapper().ObjectRef(other.GetNative()));
    Release();
    native_ = native;
  }
  return *this;
}

Print::Print(Print&& other) noexcept
    : native_(std::exchange(other.native_, nullptr)) {}

Print& Print::operator=(Print&& other) noexcept {
  if (this != &other) {
    Release();
    native_ = std::exchange(other.native_, nullptr);
  }
  return *this;
}

Print::~Print() { Release(); }

void Print::Release() {
  if (native_ != nullptr) {
    FprintWrapper::GetWrapper().ObjectUnref(native_);
    native_ = nullptr;
  }
}

Status Print::MakeExclusive(const char* caller) {
  if (!FprintWrapper::GetWrapper().ObjectIsShared(GetNative())) {
    return Status::Ok();
  }
  Result<SerializedPrint> bytes = Serialize();
  if (!bytes.IsOk()) {
    LOG(ERROR) << caller << ": Cannot copy a shared print: "
               << bytes.GetError();
    return Error::Wrap(ErrorKind::kInternal, "Cannot copy a shared print",
                       bytes.GetError());
  }
  Result<Print> copy = Deserialize(bytes.GetValue());
  if (!copy.IsOk()) {
    LOG(ERROR) << caller << ": Cannot copy a shared print: "
               << copy.GetError();
    return Error::Wrap(ErrorKind::kInternal, "Cannot copy a shared print",
                       copy.GetError());
  }
  *this = std::move(copy).GetValue();
  return Status::Ok();
}

FpPrint* Print::GetNative() const {
  if (native_ == nullptr) {
    LOG(FATAL) << __func__ << ": Print used after being moved from.";
  }
  return native_;
}

std::optional<std::string> Print::GetUsername() const {
  return ToOptionalString(
      FprintWrapper::GetWrapper().PrintGetUsername(GetNative()));
}

Status Print::SetUsername(std::string_view username) {
  Status status = MakeExclusive(__func__);
  if (!status.IsOk()) {
    return status;
  }
  const std::string value(username);
  FprintWrapper::GetWrapper().PrintSetUsername(GetNative(), value.c_str());
  return Status::Ok();
}

std::optional<std::string> Print::GetDescription() const {
  return ToOptionalString(
      FprintWrapper::GetWrapper().PrintGetDescription(GetNative()));
}

Status Print::SetDescription(std::string_view description) {
  Status status = MakeExclusive(__func__);
  if (!status.IsOk()) {
    return status;
  }
  const std::string value(description);
  FprintWrapper::GetWrapper().PrintSetDescription(GetNative(), value.c_str());
  return Status::Ok();
}

Finger Print::GetFinger() const {
  const FpFinger finger =
      FprintWrapper::GetWrapper().PrintGetFinger(GetNative());
  if (finger < FP_FINGER_UNKNOWN || finger > FP_FINGER_LAST) {
    LOG(WARNING) << __func__ << ": Unexpected native finger "
                 << static_cast<int>(finger);
    return Finger::kUnknown;
  }
  return static_cast<Finger>(finger);
}

Status Print::SetFinger(Finger finger) {
  Status status = MakeExclusive(__func__);
  if (!status.IsOk()) {
    return status;
  }
  FprintWrapper::GetWrapper().PrintSetFinger(GetNative(),
                                             static_cast<FpFinger>(finger));
  return Status::Ok();
}

std::optional<EnrollDate> Print::GetEnrollDate() const {
  const GDate* date =
      FprintWrapper::GetWrapper().PrintGetEnrollDate(GetNative());
  if (date == nullptr || !g_date_valid(date)) {
    return std::nullopt;
  }
  return EnrollDate{.year = g_date_get_year(date),
                    .month = static_cast<int>(g_date_get_month(date)),
                    .day = g_date_get_day(date)};
}

Status Print::SetEnrollDate(const EnrollDate& date) {
  if (!g_date_valid_dmy(static_cast<GDateDay>(date.day),
                        static_cast<GDateMonth>(date.month),
                        static_cast<GDateYear>(date.year))) {
    LOG(ERROR) << __func__ << ": Invalid date " << date.year << "-"
               << date.month << "-" << date.day;
    return Error(ErrorKind::kInvalidArgument, "Enroll date does not exist");
  }
  Status status = MakeExclusive(__func__);
  if (!status.IsOk()) {
    return status;
  }
  GDate* native_date = g_date_new_dmy(static_cast<GDateDay>(date.day),
                                      static_cast<GDateMonth>(date.month),
                                      static_cast<GDateYear>(date.year));
  FprintWrapper::GetWrapper().PrintSetEnrollDate(GetNative(), native_date);
  g_date_free(native_date);
  return Status::Ok();
}

std::string Print::GetDriver() const {
  return ToOptionalString(
             FprintWrapper::GetWrapper().PrintGetDriver(GetNative()))
      .value_or("");
}

std::string Print::GetDeviceId() const {
  return ToOptionalString(
             FprintWrapper::GetWrapper().PrintGetDeviceId(GetNative()))
      .value_or("");
}

bool Print::IsDeviceStored() const {
  return FprintWrapper::GetWrapper().PrintGetDeviceStored(GetNative());
}

std::optional<Image> Print::GetImage() const {
  FpImage* image = FprintWrapper::GetWrapper().PrintGetImage(GetNative());
  if (image == nullptr) {
    return std::nullopt;
  }
  return Image::Borrow(image);
}

bool Print::IsCompatible(const Device& device) const {
  if (device.IsDetached()) {
    return false;
  }
  return FprintWrapper::GetWrapper().PrintCompatible(GetNative(),
                                                     device.GetNative());
}

bool Print::Equals(const Print& other) const {
  if (IsSameHandle(other)) {
    return true;
  }
  return FprintWrapper::GetWrapper().PrintEqual(GetNative(),
                                                other.GetNative());
}

Result<SerializedPrint> Print::Serialize() const {
  guchar* data = nullptr;
  gsize length = 0;
  GError* error = nullptr;
  if (!FprintWrapper::GetWrapper().PrintSerialize(GetNative(), &data, &length,
                                                  &error)) {
    g_free(data);
    return Error::TakeNative(&error, "Print serialization failed");
  }
  SerializedPrint serialized(data, data + length);
  g_free(data);
  return serialized;
}

}  // namespace fprint_binding
