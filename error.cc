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

#define LOG_TAG "fprint_binding.error"

#include "fprint_binding/error.h"

#include <fprint.h>
#include <gio/gio.h>
#include <glib.h>

#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

#include "android-base/logging.h"
#include "fprint_binding/native/fprint_wrapper.h"

namespace fprint_binding {
namespace {

using ::fprint_binding::native::FprintWrapper;

ErrorKind TranslateIoError(int code) {
  switch (code) {
    case G_IO_ERROR_CANCELLED:
      return ErrorKind::kCancelled;
    case G_IO_ERROR_PERMISSION_DENIED:
      return ErrorKind::kPermissionDenied;
    case G_IO_ERROR_NOT_FOUND:
      return ErrorKind::kNotFound;
    case G_IO_ERROR_BUSY:
      return ErrorKind::kBusy;
    case G_IO_ERROR_NOT_SUPPORTED:
      return ErrorKind::kNotSupported;
    case G_IO_ERROR_INVALID_ARGUMENT:
      return ErrorKind::kInvalidArgument;
    default:
      return ErrorKind::kInternal;
  }
}

ErrorKind TranslateDeviceError(int code) {
  switch (code) {
    case FP_DEVICE_ERROR_NOT_SUPPORTED:
      return ErrorKind::kNotSupported;
    case FP_DEVICE_ERROR_NOT_OPEN:
      return ErrorKind::kNotOpen;
    case FP_DEVICE_ERROR_ALREADY_OPEN:
    case FP_DEVICE_ERROR_BUSY:
      return ErrorKind::kBusy;
    case FP_DEVICE_ERROR_PROTO:
      return ErrorKind::kProtocolError;
    case FP_DEVICE_ERROR_DATA_INVALID:
    case FP_DEVICE_ERROR_DATA_DUPLICATE:
      return ErrorKind::kInvalidArgument;
    case FP_DEVICE_ERROR_DATA_NOT_FOUND:
    case FP_DEVICE_ERROR_REMOVED:
      return ErrorKind::kNotFound;
    case FP_DEVICE_ERROR_GENERAL:
    case FP_DEVICE_ERROR_DATA_FULL:
    default:
      return ErrorKind::kInternal;
  }
}

ErrorKind TranslateNativeError(const GError* error) {
  if (error->domain == G_IO_ERROR) {
    return TranslateIoError(error->code);
  }
  FprintWrapper& wrapper = FprintWrapper::GetWrapper();
  if (error->domain == wrapper.DeviceErrorQuark()) {
    return TranslateDeviceError(error->code);
  }
  if (error->domain == wrapper.DeviceRetryQuark()) {
    return ErrorKind::kRetry;
  }
  return ErrorKind::kInternal;
}

}  // namespace

std::string_view ErrorKindToString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kNotFound:
      return "NotFound";
    case ErrorKind::kInvalidArgument:
      return "InvalidArgument";
    case ErrorKind::kBusy:
      return "Busy";
    case ErrorKind::kPermissionDenied:
      return "PermissionDenied";
    case ErrorKind::kCancelled:
      return "Cancelled";
    case ErrorKind::kProtocolError:
      return "ProtocolError";
    case ErrorKind::kNotSupported:
      return "NotSupported";
    case ErrorKind::kInternal:
      return "Internal";
    case ErrorKind::kRetry:
      return "Retry";
    case ErrorKind::kNotOpen:
      return "NotOpen";
  }
  return "Unknown";
}

Error::Error(ErrorKind kind, std::string message)
    : kind_(kind), message_(std::move(message)) {}

Error Error::FromNative(const GError* error) {
  if (error == nullptr) {
    LOG(FATAL) << __func__ << ": Translating a null native error.";
  }
  Error translated(TranslateNativeError(error),
                   error->message != nullptr ? error->message : "");
  const char* domain = g_quark_to_string(error->domain);
  translated.domain_ = domain != nullptr ? domain : "unknown";
  translated.code_ = error->code;
  return translated;
}

std::optional<Error> Error::FromNativeOptional(const GError* error) {
  if (error == nullptr) {
    return std::nullopt;
  }
  return FromNative(error);
}

Error Error::TakeNative(GError** error, std::string_view fallback_message) {
  if (error == nullptr || *error == nullptr) {
    LOG(WARNING) << __func__
                 << ": Native call failed without an error, reporting: "
                 << fallback_message;
    return Error(ErrorKind::kInternal, std::string(fallback_message));
  }
  Error translated = FromNative(*error);
  g_clear_error(error);
  return translated;
}

Error Error::Wrap(ErrorKind kind, std::string message, const Error& source) {
  Error wrapped(kind, std::move(message));
  wrapped.source_ = std::make_shared<const Error>(source);
  return wrapped;
}

bool Error::IsRetryable() const {
  switch (kind_) {
    case ErrorKind::kPermissionDenied:
    case ErrorKind::kInvalidArgument:
    case ErrorKind::kNotSupported:
      return false;
    default:
      return true;
  }
}

std::string Error::ToString() const {
  std::stringstream ss;
  ss << ErrorKindToString(kind_) << ": " << message_;
  if (IsNative()) {
    ss << " [" << domain_ << ":" << code_ << "]";
  }
  for (const Error* cause = GetSource(); cause != nullptr;
       cause = cause->GetSource()) {
    ss << "; caused by " << ErrorKindToString(cause->kind_) << ": "
       << cause->message_;
    if (cause->IsNative()) {
      ss << " [" << cause->domain_ << ":" << cause->code_ << "]";
    }
  }
  return ss.str();
}

std::ostream& operator<<(std::ostream& os, ErrorKind kind) {
  return os << ErrorKindToString(kind);
}

std::ostream& operator<<(std::ostream& os, const Error& error) {
  return os << error.ToString();
}

}  // namespace fprint_binding
