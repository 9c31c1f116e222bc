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

#define LOG_TAG "fprint_binding.tool"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "android-base/logging.h"
#include "fprint_binding/context.h"
#include "fprint_binding/device.h"
#include "fprint_binding/error.h"
#include "fprint_binding/finger.h"
#include "fprint_binding/fprint_types.h"
#include "fprint_binding/image.h"
#include "fprint_binding/print.h"
#include "fprint_binding/result.h"

using ::fprint_binding::Context;
using ::fprint_binding::Device;
using ::fprint_binding::Error;
using ::fprint_binding::Finger;
using ::fprint_binding::FingerFromString;
using ::fprint_binding::IdentifyResult;
using ::fprint_binding::Image;
using ::fprint_binding::Print;
using ::fprint_binding::Result;
using ::fprint_binding::SerializedPrint;
using ::fprint_binding::Status;
using ::fprint_binding::VerifyResult;

namespace {

constexpr char kUsage[] =
    "usage: fprint_tool list\n"
    "       fprint_tool enroll <finger> <file>\n"
    "       fprint_tool verify <file>\n"
    "       fprint_tool identify <file>...\n"
    "       fprint_tool capture\n";

std::optional<Print> ReadPrint(const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    LOG(ERROR) << __func__ << ": Cannot open " << path;
    return std::nullopt;
  }
  SerializedPrint bytes((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());
  Result<Print> print = Print::Deserialize(bytes);
  if (!print.IsOk()) {
    LOG(ERROR) << __func__ << ": " << path << ": " << print.GetError();
    return std::nullopt;
  }
  return std::move(print).GetValue();
}

bool WritePrint(const Print& print, const std::string& path) {
  Result<SerializedPrint> bytes = print.Serialize();
  if (!bytes.IsOk()) {
    LOG(ERROR) << __func__ << ": " << bytes.GetError();
    return false;
  }
  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  file.write(reinterpret_cast<const char*>(bytes.GetValue().data()),
             bytes.GetValue().size());
  if (!file.good()) {
    LOG(ERROR) << __func__ << ": Cannot write " << path;
    return false;
  }
  return true;
}

// Opens the first device the context reports.
std::shared_ptr<Device> OpenFirstDevice(Context& context) {
  std::vector<std::shared_ptr<Device>> devices = context.ListDevices();
  if (devices.empty()) {
    LOG(ERROR) << __func__ << ": No fingerprint reader found.";
    return nullptr;
  }
  std::shared_ptr<Device> device = devices.front();
  Status status = device->Open();
  if (!status.IsOk()) {
    LOG(ERROR) << __func__ << ": Cannot open " << device->GetDeviceId()
               << ": " << status.GetError();
    return nullptr;
  }
  return device;
}

void CloseDevice(Device& device) {
  Status status = device.Close();
  if (!status.IsOk()) {
    LOG(WARNING) << __func__ << ": " << status.GetError();
  }
}

int List(Context& context) {
  for (const std::shared_ptr<Device>& device : context.ListDevices()) {
    std::cout << device->GetDeviceId() << "\t" << device->GetDriver() << "\t"
              << device->GetName() << "\n";
  }
  return EXIT_SUCCESS;
}

int Enroll(Device& device, Finger finger, const std::string& path) {
  Result<Print> template_print = Print::New(device);
  if (!template_print.IsOk()) {
    LOG(ERROR) << __func__ << ": " << template_print.GetError();
    return EXIT_FAILURE;
  }
  Status status = template_print.GetValue().SetFinger(finger);
  if (!status.IsOk()) {
    LOG(ERROR) << __func__ << ": " << status.GetError();
    return EXIT_FAILURE;
  }

  Result<int> stages = device.GetNrEnrollStages();
  const int total = stages.IsOk() ? stages.GetValue() : 0;
  std::cout << "Enrolling " << finger << ", " << total
            << " scans needed.\n";

  Result<Print> enrolled = device.Enroll<std::monostate>(
      template_print.GetValue(),
      [total](Device&, int completed, std::optional<Print>,
              std::optional<Error> error,
              const std::shared_ptr<std::monostate>&) {
        if (error.has_value()) {
          std::cout << "Scan failed: " << error->GetMessage() << "\n";
          return;
        }
        std::cout << "Stage " << completed << "/" << total << "\n";
      });
  if (!enrolled.IsOk()) {
    LOG(ERROR) << __func__ << ": " << enrolled.GetError();
    return EXIT_FAILURE;
  }
  return WritePrint(enrolled.GetValue(), path) ? EXIT_SUCCESS : EXIT_FAILURE;
}

int Verify(Device& device, const std::string& path) {
  std::optional<Print> enrolled = ReadPrint(path);
  if (!enrolled.has_value()) {
    return EXIT_FAILURE;
  }
  std::cout << "Scan your " << enrolled->GetFinger() << ".\n";
  Result<VerifyResult> result = device.Verify(*enrolled);
  if (!result.IsOk()) {
    LOG(ERROR) << __func__ << ": " << result.GetError();
    return EXIT_FAILURE;
  }
  std::cout << (result.GetValue().matched ? "Match" : "No match") << "\n";
  return result.GetValue().matched ? EXIT_SUCCESS : EXIT_FAILURE;
}

int Identify(Device& device, const std::vector<std::string>& paths) {
  std::vector<Print> candidates;
  for (const std::string& path : paths) {
    std::optional<Print> print = ReadPrint(path);
    if (!print.has_value()) {
      return EXIT_FAILURE;
    }
    candidates.push_back(std::move(*print));
  }
  Result<IdentifyResult> result = device.Identify(candidates);
  if (!result.IsOk()) {
    LOG(ERROR) << __func__ << ": " << result.GetError();
    return EXIT_FAILURE;
  }
  if (!result.GetValue().match_index.has_value()) {
    std::cout << "No match\n";
    return EXIT_FAILURE;
  }
  std::cout << "Matched " << paths[*result.GetValue().match_index] << "\n";
  return EXIT_SUCCESS;
}

int Capture(Device& device) {
  Result<Image> image = device.CaptureImage();
  if (!image.IsOk()) {
    LOG(ERROR) << __func__ << ": " << image.GetError();
    return EXIT_FAILURE;
  }
  std::cout << "Captured " << image.GetValue().GetWidth() << "x"
            << image.GetValue().GetHeight() << " at "
            << image.GetValue().GetPpmm() << " px/mm, "
            << image.GetValue().GetMinutiae().size() << " minutiae\n";
  return EXIT_SUCCESS;
}

}  // namespace

int main(int argc, char** argv) {
  android::base::InitLogging(argv, android::base::StderrLogger);
  if (argc < 2) {
    std::cerr << kUsage;
    return EXIT_FAILURE;
  }
  const std::string command = argv[1];
  const std::vector<std::string> args(argv + 2, argv + argc);

  Result<std::unique_ptr<Context>> context = Context::Create();
  if (!context.IsOk()) {
    LOG(ERROR) << "Cannot create context: " << context.GetError();
    return EXIT_FAILURE;
  }
  Context& ctx = *context.GetValue();

  if (command == "list") {
    return List(ctx);
  }

  std::optional<Finger> finger;
  if (command == "enroll") {
    if (args.size() != 2) {
      std::cerr << kUsage;
      return EXIT_FAILURE;
    }
    finger = FingerFromString(args[0]);
    if (!finger.has_value()) {
      std::cerr << "Unknown finger \"" << args[0] << "\"\n";
      return EXIT_FAILURE;
    }
  } else if ((command == "verify" && args.size() != 1) ||
             (command == "identify" && args.empty()) ||
             (command == "capture" && !args.empty())) {
    std::cerr << kUsage;
    return EXIT_FAILURE;
  } else if (command != "verify" && command != "identify" &&
             command != "capture") {
    std::cerr << kUsage;
    return EXIT_FAILURE;
  }

  std::shared_ptr<Device> device = OpenFirstDevice(ctx);
  if (device == nullptr) {
    return EXIT_FAILURE;
  }
  int result = EXIT_FAILURE;
  if (command == "enroll") {
    result = Enroll(*device, *finger, args[1]);
  } else if (command == "verify") {
    result = Verify(*device, args[0]);
  } else if (command == "identify") {
    result = Identify(*device, args);
  } else {
    result = Capture(*device);
  }
  CloseDevice(*device);
  return result;
}
