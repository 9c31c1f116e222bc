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

#include <optional>
#include <utility>
#include <variant>

#include "android-base/logging.h"
#include "fprint_binding/error.h"

namespace fprint_binding {

/**
 * @class Result
 * @brief Either a value of type T or an Error.
 *
 * Reading the value of a failed result (or the error of a successful one) is
 * a programming error and aborts.
 */
template <typename T>
class Result {
 public:
  Result(T value) : storage_(std::in_place_index<0>, std::move(value)) {}
  Result(Error error) : storage_(std::in_place_index<1>, std::move(error)) {}

  bool IsOk() const { return storage_.index() == 0; }
  explicit operator bool() const { return IsOk(); }

  T& GetValue() & {
    CheckOk();
    return std::get<0>(storage_);
  }

  const T& GetValue() const& {
    CheckOk();
    return std::get<0>(storage_);
  }

  T&& GetValue() && {
    CheckOk();
    return std::get<0>(std::move(storage_));
  }

  const Error& GetError() const {
    if (IsOk()) {
      LOG(FATAL) << __func__ << ": Result holds a value.";
    }
    return std::get<1>(storage_);
  }

 private:
  void CheckOk() const {
    if (!IsOk()) {
      LOG(FATAL) << __func__ << ": Result holds an error: "
                 << std::get<1>(storage_);
    }
  }

  std::variant<T, Error> storage_;
};

/**
 * @class Status
 * @brief The outcome of an operation that produces no value.
 */
class Status {
 public:
  Status() = default;
  Status(Error error) : error_(std::move(error)) {}

  static Status Ok() { return Status(); }

  bool IsOk() const { return !error_.has_value(); }
  explicit operator bool() const { return IsOk(); }

  const Error& GetError() const {
    if (IsOk()) {
      LOG(FATAL) << __func__ << ": Status is ok.";
    }
    return *error_;
  }

 private:
  std::optional<Error> error_;
};

}  // namespace fprint_binding
