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

#include "fprint_binding/config/binding_config_loader.h"

#include <cstdio>
#include <fstream>
#include <string>
#include <string_view>
#include <vector>

#include "fprint_binding/config/config_constants.h"
#include "fprint_binding/fprint_types.h"
#include "fprint_binding/test/mock/mock_android_base_wrapper.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace fprint_binding {
namespace config {
namespace {

using ::testing::_;
using ::testing::DoAll;
using ::testing::HasSubstr;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::SetArgPointee;
using ::testing::Test;

using ::fprint_binding::Property;
using ::fprint_binding::util::MockAndroidBaseWrapper;

namespace cfg_consts = ::fprint_binding::config::constants;

constexpr int kTestOperationTimeoutMs = 15000;

constexpr std::string_view kValidContent = R"({
  "operation_timeout_ms": 15000,
  "capture_wait_for_finger": false,
  "driver_allowlist": ["synaptics", "goodixmoc"],
  "log_enroll_progress": true,
  "close_open_devices_on_teardown": false
})";

class BindingConfigLoaderTest : public Test {
 protected:
  void SetUp() override {
    MockAndroidBaseWrapper::SetMockWrapper(&mock_android_base_wrapper_);
    ON_CALL(mock_android_base_wrapper_, GetProperty(_, _))
        .WillByDefault(
            [](const std::string&, const std::string& default_value) {
              return default_value;
            });

    BindingConfigLoader::ResetLoader();
  }

  void TearDown() override {
    BindingConfigLoader::ResetLoader();
    MockAndroidBaseWrapper::SetMockWrapper(nullptr);
  }

  NiceMock<MockAndroidBaseWrapper> mock_android_base_wrapper_;
};

TEST_F(BindingConfigLoaderTest, GetOperationTimeoutMsOnInit) {
  EXPECT_EQ(BindingConfigLoader::GetLoader().GetOperationTimeoutMs(),
            cfg_consts::kDefaultOperationTimeoutMs);
}

TEST_F(BindingConfigLoaderTest, IsCaptureWaitForFingerOnInit) {
  EXPECT_EQ(BindingConfigLoader::GetLoader().IsCaptureWaitForFinger(),
            cfg_consts::kDefaultCaptureWaitForFinger);
}

TEST_F(BindingConfigLoaderTest, DriverAllowlistEmptyOnInit) {
  EXPECT_TRUE(BindingConfigLoader::GetLoader().GetDriverAllowlist().empty());
  EXPECT_TRUE(BindingConfigLoader::GetLoader().IsDriverAllowed("anything"));
}

TEST_F(BindingConfigLoaderTest, IsEnrollProgressLoggingEnabledOnInit) {
  EXPECT_FALSE(
      BindingConfigLoader::GetLoader().IsEnrollProgressLoggingEnabled());
}

TEST_F(BindingConfigLoaderTest, IsCloseOpenDevicesOnTeardownOnInit) {
  EXPECT_EQ(BindingConfigLoader::GetLoader().IsCloseOpenDevicesOnTeardown(),
            cfg_consts::kDefaultCloseOpenDevicesOnTeardown);
}

TEST_F(BindingConfigLoaderTest, GetConfigFilePathDefault) {
  EXPECT_EQ(BindingConfigLoader::GetLoader().GetConfigFilePath(),
            cfg_consts::kBindingConfigFile);
}

TEST_F(BindingConfigLoaderTest, GetConfigFilePathFromProperty) {
  EXPECT_CALL(mock_android_base_wrapper_,
              GetProperty(std::string(Property::kConfigFile), _))
      .WillOnce(Return("/tmp/custom.json"));
  EXPECT_EQ(BindingConfigLoader::GetLoader().GetConfigFilePath(),
            "/tmp/custom.json");
}

class BindingConfigLoaderProtoTest : public BindingConfigLoaderTest {
 protected:
  void SetUp() override {
    BindingConfigLoaderTest::SetUp();
    EXPECT_TRUE(
        BindingConfigLoader::GetLoader().LoadConfigFromString(kValidContent));
  }
};

TEST_F(BindingConfigLoaderProtoTest, GetOperationTimeoutMs) {
  EXPECT_EQ(BindingConfigLoader::GetLoader().GetOperationTimeoutMs(),
            kTestOperationTimeoutMs);
}

TEST_F(BindingConfigLoaderProtoTest, IsCaptureWaitForFinger) {
  EXPECT_FALSE(BindingConfigLoader::GetLoader().IsCaptureWaitForFinger());
}

TEST_F(BindingConfigLoaderProtoTest, GetDriverAllowlist) {
  EXPECT_EQ(BindingConfigLoader::GetLoader().GetDriverAllowlist(),
            (std::vector<std::string>{"synaptics", "goodixmoc"}));
}

TEST_F(BindingConfigLoaderProtoTest, IsDriverAllowed) {
  EXPECT_TRUE(BindingConfigLoader::GetLoader().IsDriverAllowed("synaptics"));
  EXPECT_FALSE(BindingConfigLoader::GetLoader().IsDriverAllowed("virtual_image"));
}

TEST_F(BindingConfigLoaderProtoTest, IsEnrollProgressLoggingEnabled) {
  EXPECT_TRUE(
      BindingConfigLoader::GetLoader().IsEnrollProgressLoggingEnabled());
}

TEST_F(BindingConfigLoaderProtoTest, IsCloseOpenDevicesOnTeardown) {
  EXPECT_FALSE(BindingConfigLoader::GetLoader().IsCloseOpenDevicesOnTeardown());
}

TEST_F(BindingConfigLoaderProtoTest, PropertyOverridesOperationTimeout) {
  EXPECT_CALL(mock_android_base_wrapper_,
              GetProperty(std::string(Property::kOperationTimeoutMs), _))
      .WillOnce(Return("250"));
  EXPECT_CALL(mock_android_base_wrapper_, ParseInt("250", _, 0, _))
      .WillOnce(DoAll(SetArgPointee<1>(250), Return(true)));
  EXPECT_EQ(BindingConfigLoader::GetLoader().GetOperationTimeoutMs(), 250);
}

TEST_F(BindingConfigLoaderProtoTest, InvalidTimeoutPropertyIsIgnored) {
  EXPECT_CALL(mock_android_base_wrapper_,
              GetProperty(std::string(Property::kOperationTimeoutMs), _))
      .WillOnce(Return("soon"));
  EXPECT_CALL(mock_android_base_wrapper_, ParseInt("soon", _, _, _))
      .WillOnce(Return(false));
  EXPECT_EQ(BindingConfigLoader::GetLoader().GetOperationTimeoutMs(),
            kTestOperationTimeoutMs);
}

TEST_F(BindingConfigLoaderProtoTest, DumpConfigToString) {
  const std::string dump = BindingConfigLoader::GetLoader().DumpConfigToString();
  EXPECT_THAT(dump, HasSubstr("GetOperationTimeoutMs (Configured): 15000"));
  EXPECT_THAT(dump, HasSubstr("\"synaptics\", \"goodixmoc\""));
  EXPECT_THAT(dump, HasSubstr("IsCaptureWaitForFinger: false"));
}

TEST_F(BindingConfigLoaderTest, PartialContentKeepsDefaults) {
  EXPECT_TRUE(BindingConfigLoader::GetLoader().LoadConfigFromString(
      R"({"log_enroll_progress": true})"));
  EXPECT_TRUE(
      BindingConfigLoader::GetLoader().IsEnrollProgressLoggingEnabled());
  EXPECT_EQ(BindingConfigLoader::GetLoader().GetOperationTimeoutMs(),
            cfg_consts::kDefaultOperationTimeoutMs);
  EXPECT_EQ(BindingConfigLoader::GetLoader().IsCaptureWaitForFinger(),
            cfg_consts::kDefaultCaptureWaitForFinger);
}

TEST_F(BindingConfigLoaderTest, UnknownFieldsAreIgnored) {
  EXPECT_TRUE(BindingConfigLoader::GetLoader().LoadConfigFromString(
      R"({"capture_wait_for_finger": false, "future_option": 3})"));
  EXPECT_FALSE(BindingConfigLoader::GetLoader().IsCaptureWaitForFinger());
}

TEST_F(BindingConfigLoaderTest, NegativeTimeoutDisablesTimeout) {
  EXPECT_TRUE(BindingConfigLoader::GetLoader().LoadConfigFromString(
      R"({"operation_timeout_ms": -5})"));
  EXPECT_EQ(BindingConfigLoader::GetLoader().GetOperationTimeoutMs(), 0);
}

TEST_F(BindingConfigLoaderTest, InvalidContentFails) {
  EXPECT_FALSE(BindingConfigLoader::GetLoader().LoadConfigFromString(
      "{ this is not json"));
  EXPECT_EQ(BindingConfigLoader::GetLoader().GetOperationTimeoutMs(),
            cfg_consts::kDefaultOperationTimeoutMs);
}

TEST_F(BindingConfigLoaderTest, LoadConfigFromMissingFileFails) {
  EXPECT_FALSE(BindingConfigLoader::GetLoader().LoadConfigFromFile(
      "/nonexistent/fprint_binding.json"));
}

TEST_F(BindingConfigLoaderTest, LoadConfigReadsPathFromProperty) {
  const std::string path =
      ::testing::TempDir() + "binding_config_loader_test.json";
  {
    std::ofstream file(path);
    file << kValidContent;
  }
  EXPECT_CALL(mock_android_base_wrapper_,
              GetProperty(std::string(Property::kConfigFile), _))
      .WillOnce(Return(path));

  EXPECT_TRUE(BindingConfigLoader::GetLoader().LoadConfig());
  EXPECT_EQ(BindingConfigLoader::GetLoader().GetOperationTimeoutMs(),
            kTestOperationTimeoutMs);
  std::remove(path.c_str());
}

TEST_F(BindingConfigLoaderTest, ResetLoaderRestoresDefaults) {
  EXPECT_TRUE(
      BindingConfigLoader::GetLoader().LoadConfigFromString(kValidContent));
  BindingConfigLoader::ResetLoader();
  EXPECT_EQ(BindingConfigLoader::GetLoader().GetOperationTimeoutMs(),
            cfg_consts::kDefaultOperationTimeoutMs);
  EXPECT_TRUE(BindingConfigLoader::GetLoader().GetDriverAllowlist().empty());
}

}  // namespace
}  // namespace config
}  // namespace fprint_binding
