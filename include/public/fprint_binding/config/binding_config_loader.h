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

#include <mutex>
#include <string>
#include <vector>

#include "fprint_binding/config/config_loader.h"

namespace fprint_binding {
namespace config {

/**
 * @class BindingConfigLoader
 * @brief Process-wide tunables of the binding.
 *
 * The configuration is a JSON document mapped onto the BindingConfig
 * protobuf message. It is read from the path named by the
 * `fprint_binding.config_file` property, falling back to
 * /etc/fprint_binding/fprint_binding.json. Fields missing from the document
 * keep their defaults, and unknown fields are ignored.
 */
class BindingConfigLoader : public ConfigLoader {
 public:
  virtual ~BindingConfigLoader() = default;

  virtual bool LoadConfig() override = 0;
  virtual std::string DumpConfigToString() const override = 0;

  /**
   * @brief Gets the timeout applied to blocking device operations.
   *
   * @return The timeout in milliseconds, or 0 if operations never time out.
   */
  virtual int GetOperationTimeoutMs() const = 0;

  /**
   * @brief Whether Device::CaptureImage() waits for a finger by default.
   */
  virtual bool IsCaptureWaitForFinger() const = 0;

  /**
   * @brief Gets the drivers whose devices are reported on enumeration.
   *
   * @return The driver ids, or an empty list if every driver is allowed.
   */
  virtual const std::vector<std::string>& GetDriverAllowlist() const = 0;

  /**
   * @brief Checks whether a driver passes the allowlist.
   */
  virtual bool IsDriverAllowed(const std::string& driver) const = 0;

  virtual bool IsEnrollProgressLoggingEnabled() const = 0;

  /**
   * @brief Whether a context closes the devices left open when it is
   * destroyed.
   */
  virtual bool IsCloseOpenDevicesOnTeardown() const = 0;

  /**
   * @brief Gets the path LoadConfig() reads from.
   *
   * @return The value of the config file property, or the default path.
   */
  virtual std::string GetConfigFilePath() const = 0;

  /**
   * @brief Gets the singleton loader, creating it on first use.
   *
   * Outside of unit tests, the first call also loads the configuration file.
   */
  static BindingConfigLoader& GetLoader();

  /**
   * @brief Destroys the singleton loader. The next GetLoader() call starts
   * from the defaults again.
   */
  static void ResetLoader();

 private:
  static BindingConfigLoader* loader_;
  static std::mutex loader_mutex_;
};

}  // namespace config
}  // namespace fprint_binding
