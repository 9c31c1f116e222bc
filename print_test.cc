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

#include "fprint_binding/print.h"

#include <fprint.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include "fprint_binding/config/binding_config_loader.h"
#include "fprint_binding/context.h"
#include "fprint_binding/device.h"
#include "fprint_binding/error.h"
#include "fprint_binding/finger.h"
#include "fprint_binding/fprint_types.h"
#include "fprint_binding/result.h"
#include "fprint_binding/test/common/test_helper.h"
#include "fprint_binding/test/mock/mock_android_base_wrapper.h"
#include "fprint_binding/test/mock/mock_fprint_wrapper.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace fprint_binding {
namespace {

using ::testing::_;
using ::testing::ElementsAre;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Test;

using ::fprint_binding::config::BindingConfigLoader;
using ::fprint_binding::native::MockFprintWrapper;
using ::fprint_binding::test::FakeLibfprint;
using ::fprint_binding::test::FakePrint;
using ::fprint_binding::util::MockAndroidBaseWrapper;

class PrintTest : public Test {
 protected:
  void SetUp() override {
    MockFprintWrapper::SetMockWrapper(&mock_fprint_wrapper_);
    MockAndroidBaseWrapper::SetMockWrapper(&mock_android_base_wrapper_);
    BindingConfigLoader::ResetLoader();

    device_handle_ = fake_.AddDevice("fake-0");
    auto context = Context::Create();
    ASSERT_TRUE(context.IsOk());
    context_ = std::move(context).GetValue();
    auto devices = context_->ListDevices();
    ASSERT_EQ(devices.size(), 1u);
    device_ = devices[0];
  }

  void TearDown() override {
    device_.reset();
    context_.reset();
    BindingConfigLoader::ResetLoader();
    MockAndroidBaseWrapper::SetMockWrapper(nullptr);
    MockFprintWrapper::SetMockWrapper(nullptr);
  }

  Print NewPrint() {
    Result<Print> print = Print::New(*device_);
    EXPECT_TRUE(print.IsOk());
    return std::move(print).GetValue();
  }

  NiceMock<MockFprintWrapper> mock_fprint_wrapper_;
  NiceMock<MockAndroidBaseWrapper> mock_android_base_wrapper_;
  FakeLibfprint fake_{mock_fprint_wrapper_};
  FpDevice* device_handle_ = nullptr;
  std::unique_ptr<Context> context_;
  std::shared_ptr<Device> device_;
};

TEST_F(PrintTest, NewPrintIsScopedToTheDevice) {
  Print print = NewPrint();

  EXPECT_EQ(print.GetDriver(), test::kFakeDriver);
  EXPECT_EQ(print.GetDeviceId(), "fake-0");
  EXPECT_FALSE(print.IsDeviceStored());
  EXPECT_TRUE(print.IsCompatible(*device_));
}

TEST_F(PrintTest, NewPrintHasNoMetadata) {
  Print print = NewPrint();

  EXPECT_EQ(print.GetFinger(), Finger::kUnknown);
  EXPECT_FALSE(print.GetUsername().has_value());
  EXPECT_FALSE(print.GetDescription().has_value());
  EXPECT_FALSE(print.GetEnrollDate().has_value());
  EXPECT_FALSE(print.GetImage().has_value());
}

TEST_F(PrintTest, NewPrintFailsWhenNativeReturnsNothing) {
  EXPECT_CALL(mock_fprint_wrapper_, PrintNew(_)).WillOnce(Return(nullptr));

  Result<Print> print = Print::New(*device_);
  ASSERT_FALSE(print.IsOk());
  EXPECT_EQ(print.GetError().GetKind(), ErrorKind::kInternal);
}

TEST_F(PrintTest, NewPrintFailsOnceContextIsGone) {
  context_.reset();

  Result<Print> print = Print::New(*device_);
  ASSERT_FALSE(print.IsOk());
  EXPECT_EQ(print.GetError().GetKind(), ErrorKind::kNotOpen);
}

TEST_F(PrintTest, StoresMetadata) {
  Print print = NewPrint();
  EXPECT_TRUE(print.SetFinger(Finger::kRightIndex).IsOk());
  EXPECT_TRUE(print.SetUsername("alice").IsOk());
  EXPECT_TRUE(print.SetDescription("work laptop").IsOk());

  EXPECT_EQ(print.GetFinger(), Finger::kRightIndex);
  EXPECT_EQ(print.GetUsername(), "alice");
  EXPECT_EQ(print.GetDescription(), "work laptop");
}

TEST_F(PrintTest, StoresEnrollDate) {
  Print print = NewPrint();
  EXPECT_TRUE(
      print.SetEnrollDate({.year = 2024, .month = 2, .day = 29}).IsOk());

  std::optional<EnrollDate> date = print.GetEnrollDate();
  ASSERT_TRUE(date.has_value());
  EXPECT_EQ(*date, (EnrollDate{.year = 2024, .month = 2, .day = 29}));
}

TEST_F(PrintTest, RejectsInvalidEnrollDate) {
  Print print = NewPrint();
  EXPECT_CALL(mock_fprint_wrapper_, PrintSetEnrollDate(_, _)).Times(0);

  Status status = print.SetEnrollDate({.year = 2023, .month = 2, .day = 29});
  ASSERT_FALSE(status.IsOk());
  EXPECT_EQ(status.GetError().GetKind(), ErrorKind::kInvalidArgument);
  EXPECT_FALSE(print.GetEnrollDate().has_value());
}

TEST_F(PrintTest, UnknownNativeFingerReadsAsUnknown) {
  FpPrint* handle = fake_.NewPrint({});
  fake_.GetPrint(handle).finger = static_cast<FpFinger>(42);

  EXPECT_EQ(fake_.WrapPrint(handle).GetFinger(),
            Finger::kUnknown);
}

TEST_F(PrintTest, SerializeProducesNativeEncoding) {
  FpPrint* handle = fake_.NewPrint({0xaa, 0xbb}, FP_FINGER_LEFT_THUMB, "bob");
  Print print = fake_.WrapPrint(handle);

  Result<SerializedPrint> bytes = print.Serialize();
  ASSERT_TRUE(bytes.IsOk());
  EXPECT_EQ(bytes.GetValue(),
            FakeLibfprint::Encode(fake_.GetPrint(handle)));
}

TEST_F(PrintTest, DeserializeRestoresMetadataAndPayload) {
  Print print = NewPrint();
  ASSERT_TRUE(print.SetFinger(Finger::kLeftRing).IsOk());
  ASSERT_TRUE(print.SetUsername("carol").IsOk());

  Result<SerializedPrint> bytes = print.Serialize();
  ASSERT_TRUE(bytes.IsOk());
  Result<Print> restored = Print::Deserialize(bytes.GetValue());
  ASSERT_TRUE(restored.IsOk());

  EXPECT_EQ(restored.GetValue().GetFinger(), Finger::kLeftRing);
  EXPECT_EQ(restored.GetValue().GetUsername(), "carol");
  EXPECT_FALSE(restored.GetValue().IsSameHandle(print));
  EXPECT_TRUE(restored.GetValue().Equals(print));
}

TEST_F(PrintTest, DeserializeRejectsEmptyInput) {
  EXPECT_CALL(mock_fprint_wrapper_, PrintDeserialize(_, _, _)).Times(0);

  Result<Print> print = Print::Deserialize({});
  ASSERT_FALSE(print.IsOk());
  EXPECT_EQ(print.GetError().GetKind(), ErrorKind::kInvalidArgument);
}

TEST_F(PrintTest, DeserializeReportsCorruptInput) {
  const std::vector<uint8_t> corrupt = {0x01, 0x20, 'x'};

  Result<Print> print = Print::Deserialize(corrupt);
  ASSERT_FALSE(print.IsOk());
  EXPECT_EQ(print.GetError().GetKind(), ErrorKind::kInvalidArgument);
  EXPECT_EQ(print.GetError().GetCode(), FP_DEVICE_ERROR_DATA_INVALID);
  EXPECT_EQ(print.GetError().GetMessage(), "Corrupt serialized print");
}

TEST_F(PrintTest, SerializeReportsNativeFailure) {
  Print print = NewPrint();
  EXPECT_CALL(mock_fprint_wrapper_, PrintSerialize(_, _, _, _))
      .WillOnce([](FpPrint*, guchar**, gsize*, GError** error) {
        *error = test::NewDeviceError(FP_DEVICE_ERROR_GENERAL, "no memory");
        return FALSE;
      });

  Result<SerializedPrint> bytes = print.Serialize();
  ASSERT_FALSE(bytes.IsOk());
  EXPECT_EQ(bytes.GetError().GetKind(), ErrorKind::kInternal);
  EXPECT_EQ(bytes.GetError().GetMessage(), "no memory");
}

TEST_F(PrintTest, EqualityFollowsMatchingData) {
  Print first = fake_.WrapPrint(fake_.NewPrint({1, 2, 3}));
  Print same = fake_.WrapPrint(fake_.NewPrint({1, 2, 3}));
  Print other = fake_.WrapPrint(fake_.NewPrint({9}));

  EXPECT_TRUE(first.Equals(same));
  EXPECT_FALSE(first.Equals(other));
  EXPECT_FALSE(first.IsSameHandle(same));
}

TEST_F(PrintTest, SameHandleIsEqualWithoutNativeComparison) {
  Print print = NewPrint();
  Print copy = print;
  EXPECT_CALL(mock_fprint_wrapper_, PrintEqual(_, _)).Times(0);

  EXPECT_TRUE(print.IsSameHandle(copy));
  EXPECT_TRUE(print.Equals(copy));
}

TEST_F(PrintTest, IncompatibleWithOtherDrivers) {
  FpPrint* handle = fake_.NewPrint({1});
  fake_.GetPrint(handle).driver = "other_driver";

  EXPECT_FALSE(fake_.WrapPrint(handle).IsCompatible(*device_));
}

TEST_F(PrintTest, IncompatibleOnceContextIsGone) {
  Print print = NewPrint();
  context_.reset();

  EXPECT_FALSE(print.IsCompatible(*device_));
}

TEST_F(PrintTest, CopiesShareTheTemplateUntilModified) {
  FpPrint* handle = fake_.NewPrint({1});
  {
    Print print = fake_.WrapPrint(handle);
    Print copy = print;
    EXPECT_EQ(fake_.GetRefCount(handle), 2);

    Print moved = std::move(copy);
    EXPECT_EQ(fake_.GetRefCount(handle), 2);
    moved = print;
    EXPECT_EQ(fake_.GetRefCount(handle), 2);
  }
  EXPECT_EQ(fake_.GetRefCount(handle), 0);
}

TEST_F(PrintTest, ModifyingACopyLeavesTheOriginalUnchanged) {
  FpPrint* handle =
      fake_.NewPrint({0x42, 0x43}, FP_FINGER_RIGHT_THUMB, "erin");
  Print original = fake_.WrapPrint(handle);
  Print copy = original;

  ASSERT_TRUE(copy.SetUsername("frank").IsOk());
  ASSERT_TRUE(copy.SetFinger(Finger::kLeftLittle).IsOk());

  EXPECT_FALSE(copy.IsSameHandle(original));
  EXPECT_EQ(fake_.GetRefCount(handle), 1);
  EXPECT_EQ(original.GetUsername(), "erin");
  EXPECT_EQ(original.GetFinger(), Finger::kRightThumb);
  EXPECT_EQ(copy.GetUsername(), "frank");
  EXPECT_EQ(copy.GetFinger(), Finger::kLeftLittle);
  EXPECT_TRUE(copy.Equals(original));
}

TEST_F(PrintTest, UnsharedPrintIsModifiedInPlace) {
  FpPrint* handle = fake_.NewPrint({1});
  Print print = fake_.WrapPrint(handle);
  EXPECT_CALL(mock_fprint_wrapper_, PrintSerialize(_, _, _, _)).Times(0);

  ASSERT_TRUE(print.SetDescription("desk reader").IsOk());

  EXPECT_EQ(fake_.GetPrint(handle).description, "desk reader");
}

TEST_F(PrintTest, ModifyingASharedPrintFailsWhenItCannotBeCopied) {
  FpPrint* handle = fake_.NewPrint({1}, FP_FINGER_UNKNOWN, "gina");
  Print print = fake_.WrapPrint(handle);
  Print copy = print;
  EXPECT_CALL(mock_fprint_wrapper_, PrintSerialize(handle, _, _, _))
      .WillOnce([](FpPrint*, guchar**, gsize*, GError** error) {
        *error = test::NewDeviceError(FP_DEVICE_ERROR_GENERAL, "no memory");
        return FALSE;
      });
  EXPECT_CALL(mock_fprint_wrapper_, PrintSetUsername(_, _)).Times(0);

  Status status = copy.SetUsername("hank");
  ASSERT_FALSE(status.IsOk());
  EXPECT_EQ(status.GetError().GetKind(), ErrorKind::kInternal);
  EXPECT_TRUE(copy.IsSameHandle(print));
  EXPECT_EQ(print.GetUsername(), "gina");
}

TEST_F(PrintTest, AssignmentReleasesThePreviousTemplate) {
  FpPrint* first = fake_.NewPrint({1});
  FpPrint* second = fake_.NewPrint({2});
  Print print = fake_.WrapPrint(first);
  Print other = fake_.WrapPrint(second);

  print = other;
  EXPECT_EQ(fake_.GetRefCount(first), 0);
  EXPECT_EQ(fake_.GetRefCount(second), 2);

  print = std::move(other);
  EXPECT_EQ(fake_.GetRefCount(second), 1);
}

}  // namespace
}  // namespace fprint_binding
