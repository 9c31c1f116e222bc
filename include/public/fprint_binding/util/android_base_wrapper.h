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

#include <string>

namespace fprint_binding {
namespace util {

class AndroidBaseWrapper {
 public:
  virtual ~AndroidBaseWrapper() = default;

  static AndroidBaseWrapper& GetWrapper();

  /**
   * @brief Reads a property as a string.
   *
   * @param key The property name.
   * @param default_value Returned when the property is unset.
   *
   * @return The property value, or `default_value`.
   *
   */
  virtual std::string GetProperty(const std::string& key,
                                  const std::string& default_value) = 0;

  /**
   * @brief Reads a property as a boolean.
   *
   * "1", "y", "yes", "on" and "true" read as true; "0", "n", "no", "off" and
   * "false" read as false. Anything else yields `default_value`.
   *
   */
  virtual bool GetBoolProperty(const std::string& key, bool default_value) = 0;

  /**
   * @brief Parses a decimal integer within [min, max].
   *
   * @param s The string to parse.
   * @param out Where the value is stored on success.
   * @param min The smallest accepted value.
   * @param max The largest accepted value.
   *
   * @return `true` if `s` held an integer within range.
   *
   */
  virtual bool ParseInt(const std::string& s, int* out, int min, int max) = 0;
};

}  // namespace util
}  // namespace fprint_binding
