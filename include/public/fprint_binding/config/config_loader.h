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
#include <string_view>

namespace fprint_binding {
namespace config {

/**
 * @class ConfigLoader
 * @brief Common base of the binding's configuration loaders.
 */
class ConfigLoader {
 public:
  virtual ~ConfigLoader() = default;

  /**
   * @brief Loads the configuration from its default location.
   *
   * @return true if a configuration was read and applied.
   */
  virtual bool LoadConfig() = 0;

  /**
   * @brief Reads and applies the configuration stored at `path`.
   *
   * Loaders without file support return false.
   */
  virtual bool LoadConfigFromFile([[maybe_unused]] std::string_view path) {
    return false;
  }

  /**
   * @brief Parses and applies a configuration held in memory.
   *
   * Loaders without string support return false.
   */
  virtual bool LoadConfigFromString(
      [[maybe_unused]] std::string_view content) {
    return false;
  }

  /**
   * @brief Returns a human readable dump of the effective configuration.
   */
  virtual std::string DumpConfigToString() const = 0;
};

}  // namespace config
}  // namespace fprint_binding
