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

#define LOG_TAG "fprint_binding.config"

#include "fprint_binding/config/binding_config_loader.h"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <limits>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "android-base/logging.h"
#include "fprint_binding/config/config_constants.h"
#include "fprint_binding/fprint_types.h"
#include "fprint_binding/util/android_base_wrapper.h"
#include "fprint_config.pb.h"
#include "google/protobuf/util/json_util.h"

namespace fprint_binding {
namespace config {
namespace {

using ::fprint_binding::Property;
using ::fprint_binding::config::proto::BindingConfig;
using ::fprint_binding::util::AndroidBaseWrapper;

using ::google::protobuf::util::JsonParseOptions;
using ::google::protobuf::util::JsonStringToMessage;

namespace cfg_consts = ::fprint_binding::config::constants;

std::string VectorToString(const std::vector<std::string>& vec) {
  std::stringstream ss;
  ss << "[";
  for (size_t i = 0; i < vec.size(); ++i) {
    ss << "\"" << vec[i] << "\"";
    if (i < vec.size() - 1) {
      ss << ", ";
    }
  }
  ss << "]";
  return ss.str();
}

}  // namespace

class BindingConfigLoaderImpl : public BindingConfigLoader {
 public:
  BindingConfigLoaderImpl();
  ~BindingConfigLoaderImpl() override = default;

  bool LoadConfig() override;
  bool LoadConfigFromFile(std::string_view path) override;
  bool LoadConfigFromString(std::string_view content) override;

  int GetOperationTimeoutMs() const override;
  bool IsCaptureWaitForFinger() const override;
  const std::vector<std::string>& GetDriverAllowlist() const override;
  bool IsDriverAllowed(const std::string& driver) const override;
  bool IsEnrollProgressLoggingEnabled() const override;
  bool IsCloseOpenDevicesOnTeardown() const override;
  std::string GetConfigFilePath() const override;

  std::string DumpConfigToString() const override;

 private:
  void UpdateOperationTimeout(int timeout_ms);

  int operation_timeout_ms_{cfg_consts::kDefaultOperationTimeoutMs};
  bool capture_wait_for_finger_{cfg_consts::kDefaultCaptureWaitForFinger};
  std::vector<std::string> driver_allowlist_;
  bool log_enroll_progress_{cfg_consts::kDefaultLogEnrollProgress};
  bool close_open_devices_on_teardown_{
      cfg_consts::kDefaultCloseOpenDevicesOnTeardown};
};

int BindingConfigLoaderImpl::GetOperationTimeoutMs() const {
  // The property wins over the file so a single run can be tuned.
  const std::string value = AndroidBaseWrapper::GetWrapper().GetProperty(
      Property::kOperationTimeoutMs, "");
  if (value.empty()) {
    return operation_timeout_ms_;
  }
  int timeout_ms = 0;
  if (!AndroidBaseWrapper::GetWrapper().ParseInt(
          value, &timeout_ms, 0, std::numeric_limits<int>::max())) {
    LOG(WARNING) << __func__ << ": Ignoring invalid "
                 << Property::kOperationTimeoutMs << ": \"" << value << "\".";
    return operation_timeout_ms_;
  }
  return timeout_ms;
}

bool BindingConfigLoaderImpl::IsCaptureWaitForFinger() const {
  return capture_wait_for_finger_;
}

const std::vector<std::string>& BindingConfigLoaderImpl::GetDriverAllowlist()
    const {
  return driver_allowlist_;
}

bool BindingConfigLoaderImpl::IsDriverAllowed(const std::string& driver) const {
  if (driver_allowlist_.empty()) {
    return true;
  }
  return std::find(driver_allowlist_.begin(), driver_allowlist_.end(),
                   driver) != driver_allowlist_.end();
}

bool BindingConfigLoaderImpl::IsEnrollProgressLoggingEnabled() const {
  return log_enroll_progress_;
}

bool BindingConfigLoaderImpl::IsCloseOpenDevicesOnTeardown() const {
  return close_open_devices_on_teardown_;
}

std::string BindingConfigLoaderImpl::GetConfigFilePath() const {
  return AndroidBaseWrapper::GetWrapper().GetProperty(
      Property::kConfigFile, cfg_consts::kBindingConfigFile);
}

void BindingConfigLoaderImpl::UpdateOperationTimeout(int timeout_ms) {
  if (timeout_ms < 0) {
    LOG(WARNING) << __func__ << ": Negative operation_timeout_ms "
                 << timeout_ms << ", timeout disabled.";
    operation_timeout_ms_ = 0;
    return;
  }
  operation_timeout_ms_ = timeout_ms;
}

BindingConfigLoaderImpl::BindingConfigLoaderImpl() {
#ifndef UNIT_TEST
  if (AndroidBaseWrapper::GetWrapper().GetBoolProperty(
          Property::kVerboseLogging, false)) {
    ::android::base::SetMinimumLogSeverity(::android::base::VERBOSE);
  }
  LoadConfig();
#endif
}

bool BindingConfigLoaderImpl::LoadConfig() {
  return LoadConfigFromFile(GetConfigFilePath());
}

bool BindingConfigLoaderImpl::LoadConfigFromFile(std::string_view path) {
  const std::string file_path(path);
  std::ifstream json_file(file_path);
  if (!json_file.is_open()) {
    LOG(INFO) << __func__ << ": No config at " << file_path
              << ", using defaults.";
    return false;
  }

  std::string json_str((std::istreambuf_iterator<char>(json_file)),
                       std::istreambuf_iterator<char>());

  return LoadConfigFromString(json_str);
}

bool BindingConfigLoaderImpl::LoadConfigFromString(std::string_view content) {
  BindingConfig config;
  JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = JsonStringToMessage(std::string(content), &config, options);
  if (!status.ok()) {
    LOG(ERROR) << __func__
               << ": Failed to parse json config, error: " << status.message();
    return false;
  }

  if (config.has_operation_timeout_ms()) {
    UpdateOperationTimeout(config.operation_timeout_ms());
  }

  if (config.has_capture_wait_for_finger()) {
    capture_wait_for_finger_ = config.capture_wait_for_finger();
  }

  if (config.driver_allowlist_size() > 0) {
    driver_allowlist_.assign(config.driver_allowlist().begin(),
                             config.driver_allowlist().end());
  }

  if (config.has_log_enroll_progress()) {
    log_enroll_progress_ = config.log_enroll_progress();
  }

  if (config.has_close_open_devices_on_teardown()) {
    close_open_devices_on_teardown_ = config.close_open_devices_on_teardown();
  }

  LOG(INFO) << DumpConfigToString();

  return true;
}

std::string BindingConfigLoaderImpl::DumpConfigToString() const {
  std::stringstream ss;
  ss << std::boolalpha;

  ss << "--- BindingConfigLoader State ---\n";
  ss << "GetOperationTimeoutMs (Configured): " << operation_timeout_ms_
     << "\n";
  ss << "IsCaptureWaitForFinger: " << IsCaptureWaitForFinger() << "\n";
  ss << "GetDriverAllowlist: " << VectorToString(GetDriverAllowlist())
     << "\n";
  ss << "IsEnrollProgressLoggingEnabled: " << IsEnrollProgressLoggingEnabled()
     << "\n";
  ss << "IsCloseOpenDevicesOnTeardown: " << IsCloseOpenDevicesOnTeardown()
     << "\n";
  ss << "---------------------------------\n";

  return ss.str();
}

std::mutex BindingConfigLoader::loader_mutex_;
BindingConfigLoader* BindingConfigLoader::loader_ = nullptr;

BindingConfigLoader& BindingConfigLoader::GetLoader() {
  std::lock_guard<std::mutex> lock(loader_mutex_);
  if (loader_ == nullptr) {
    loader_ = new BindingConfigLoaderImpl();
  }
  return *loader_;
}

void BindingConfigLoader::ResetLoader() {
  std::lock_guard<std::mutex> lock(loader_mutex_);
  if (loader_ != nullptr) {
    delete loader_;
    loader_ = nullptr;
  }
}

}  // namespace config
}  // namespace fprint_binding
