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

#include <glib.h>

#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace fprint_binding {

enum class ErrorKind : int {
  kNotFound = 0,
  kInvalidArgument,
  kBusy,
  kPermissionDenied,
  kCancelled,
  kProtocolError,
  kNotSupported,
  kInternal,
  // The scan was not usable (too short, off center, ...); asking the user to
  // try again is expected to succeed.
  kRetry,
  // Raised by the binding itself when the device is closed or detached. Never
  // reaches native code.
  kNotOpen,
};

std::string_view ErrorKindToString(ErrorKind kind);

/**
 * @class Error
 * @brief An owned, copyable error value.
 *
 * Native errors are copied out of their GError at the call boundary, so an
 * Error never refers to native memory. An Error may carry the Error that
 * caused it.
 */
class Error {
 public:
  Error(ErrorKind kind, std::string message);

  /**
   * @brief Copies a native GError into a new Error.
   *
   * The GError is not modified or released.
   *
   * @param error The native error, must not be nullptr.
   *
   * @return The translated error.
   *
   */
  static Error FromNative(const GError* error);

  /**
   * @brief Translates a native GError, if any, leaving it untouched.
   *
   * @param error The native error, or nullptr.
   *
   * @return The translated error, or std::nullopt for nullptr.
   *
   */
  static std::optional<Error> FromNativeOptional(const GError* error);

  /**
   * @brief Translates the GError stored in `error` and frees it.
   *
   * After the call `*error` is nullptr. Used right after a failed native
   * call so the GError never outlives it.
   *
   * @param error The return location passed to the native call.
   * @param fallback_message Message used if the native call reported failure
   * without setting an error.
   *
   * @return The translated error.
   *
   */
  static Error TakeNative(GError** error, std::string_view fallback_message);

  /**
   * @brief Returns a new error of the given kind that has `source` as its
   * cause.
   */
  static Error Wrap(ErrorKind kind, std::string message, const Error& source);

  ErrorKind GetKind() const { return kind_; }
  const std::string& GetMessage() const { return message_; }

  // Native error domain name, empty for errors raised by the binding.
  const std::string& GetDomain() const { return domain_; }
  int GetCode() const { return code_; }
  bool IsNative() const { return !domain_.empty(); }

  // The error this one wraps, or nullptr.
  const Error* GetSource() const { return source_.get(); }

  /**
   * @brief Whether retrying the operation on the same device may succeed.
   *
   * Permission errors are terminal for a device instance. Invalid arguments
   * and unsupported operations fail the same way on every attempt.
   */
  bool IsRetryable() const;

  // Renders "<kind>: <message> [domain:code]" followed by the source chain.
  std::string ToString() const;

 private:
  ErrorKind kind_;
  std::string message_;
  std::string domain_;
  int code_ = 0;
  std::shared_ptr<const Error> source_;
};

std::ostream& operator<<(std::ostream& os, ErrorKind kind);
std::ostream& operator<<(std::ostream& os, const Error& error);

}  // namespace fprint_binding
