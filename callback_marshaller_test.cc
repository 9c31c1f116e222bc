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

#include "fprint_binding/callback_marshaller.h"

#include <fprint.h>
#include <glib.h>

#include <atomic>
#include <thread>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace fprint_binding {
namespace {

using ::testing::Test;

FpDevice* const kDevice = reinterpret_cast<FpDevice*>(0x10);
FpPrint* const kPrint = reinterpret_cast<FpPrint*>(0x20);

TEST(CallbackMarshallerTest, NoHandlerRegistersNothing) {
  EnrollProgressMarshaller marshaller = MakeEnrollProgressMarshaller(nullptr);
  EXPECT_EQ(marshaller.GetTrampoline(), nullptr);
  EXPECT_EQ(marshaller.GetUserData(), nullptr);
  EXPECT_EQ(marshaller.GetInvocationCount(), 0u);
}

TEST(CallbackMarshallerTest, TrampolineForwardsArguments) {
  std::vector<int> stages;
  std::vector<FpPrint*> prints;
  EnrollProgressMarshaller marshaller = MakeEnrollProgressMarshaller(
      [&](int completed_stages, FpPrint* print, const GError* error) {
        stages.push_back(completed_stages);
        prints.push_back(print);
        EXPECT_EQ(error, nullptr);
      });
  ASSERT_EQ(marshaller.GetTrampoline(), &EnrollProgressTrampoline);

  marshaller.GetTrampoline()(kDevice, 1, kPrint, marshaller.GetUserData(),
                             nullptr);
  marshaller.GetTrampoline()(kDevice, 2, nullptr, marshaller.GetUserData(),
                             nullptr);

  EXPECT_EQ(stages, (std::vector<int>{1, 2}));
  EXPECT_EQ(prints, (std::vector<FpPrint*>{kPrint, nullptr}));
  EXPECT_EQ(marshaller.GetInvocationCount(), 2u);
}

TEST(CallbackMarshallerTest, ForwardsNativeError) {
  GError* error = g_error_new_literal(g_quark_from_static_string("test"), 7,
                                      "scan failed");
  const GError* seen = nullptr;
  MatchMarshaller marshaller = MakeMatchMarshaller(
      [&](FpPrint*, FpPrint*, const GError* e) { seen = e; });

  MatchTrampoline(kDevice, nullptr, kPrint, marshaller.GetUserData(), error);

  EXPECT_EQ(seen, error);
  g_error_free(error);
}

TEST(CallbackMarshallerTest, SealedMarshallerDropsLateInvocations) {
  int calls = 0;
  MatchMarshaller marshaller =
      MakeMatchMarshaller([&](FpPrint*, FpPrint*, const GError*) { calls++; });

  MatchTrampoline(kDevice, kPrint, kPrint, marshaller.GetUserData(), nullptr);
  marshaller.Seal();
  MatchTrampoline(kDevice, kPrint, kPrint, marshaller.GetUserData(), nullptr);

  EXPECT_EQ(calls, 1);
  EXPECT_EQ(marshaller.GetInvocationCount(), 1u);
}

TEST(CallbackMarshallerTest, InvocationsAreSerialized) {
  constexpr int kThreads = 4;
  constexpr int kCallsPerThread = 250;
  // Deliberately not atomic: the marshaller's lock is what keeps it exact.
  int counter = 0;
  EnrollProgressMarshaller marshaller = MakeEnrollProgressMarshaller(
      [&](int, FpPrint*, const GError*) { counter++; });

  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&marshaller]() {
      for (int i = 0; i < kCallsPerThread; ++i) {
        EnrollProgressTrampoline(kDevice, i, nullptr, marshaller.GetUserData(),
                                 nullptr);
      }
    });
  }
  for (std::thread& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(counter, kThreads * kCallsPerThread);
  EXPECT_EQ(marshaller.GetInvocationCount(),
            static_cast<size_t>(kThreads * kCallsPerThread));
}

TEST(CallbackMarshallerDeathTest, DispatchWithoutUserDataIsFatal) {
  EXPECT_DEATH(MatchTrampoline(kDevice, nullptr, nullptr, nullptr, nullptr),
               "without user data");
}

}  // namespace
}  // namespace fprint_binding
