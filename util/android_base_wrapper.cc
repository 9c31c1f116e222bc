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

#include "fprint_binding/util/android_base_wrapper.h"

#include <string>

#include "android-base/parseint.h"
#include "android-base/properties.h"

namespace fprint_binding {
namespace util {

class AndroidBaseWrapperImpl : public AndroidBaseWrapper {
 public:
  std::string GetProperty(const std::string& key,
                          const std::string& default_value) override {
    return ::android::base::GetProperty(key, default_value);
  }

  bool GetBoolProperty(const std::string& key, bool default_value) override {
    return ::android::base::GetBoolProperty(key, default_value);
  }

  bool ParseInt(const std::string& s, int* out, int min, int max) override {
    return ::android::base::ParseInt<int>(s, out, min, max);
  }
};

AndroidBaseWrapper& AndroidBaseWrapper::GetWrapper() {
  static AndroidBaseWrapperImpl wrapper;
  return wrapper;
}

}  // namespace util
}  // namespace fprint_binding
