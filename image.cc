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

#define LOG_TAG "fprint_binding.image"

#include "fprint_binding/image.h"

#include <fprint.h>
#include <glib.h>

#include <cstdint>
#include <span>
#include <utility>
#include <vector>

#include "android-base/logging.h"
#include "fprint_binding/native/fprint_wrapper.h"

namespace fprint_binding {

using ::fprint_binding::native::FprintWrapper;

Image::Image(FpImage* native) : native_(native) {
  if (native_ == nullptr) {
    LOG(FATAL) << __func__ << ": Wrapping a null native image.";
  }
}

Image Image::Adopt(FpImage* native) { return Image(native); }

Image Image::Borrow(FpImage* native) {
  return Image(static_cast<FpImage*>(
      FprintWrapper::GetWrapper().ObjectRef(native)));
}

Image::Image(const Image& other)
    : native_(static_cast<FpImage*>(
          FprintWrapper::GetWrapper().ObjectRef(other.GetNative()))) {}

Image& Image::operator=(const Image& other) {
  if (this != &other) {
    FpImage* native = static_cast<FpImage*>(
        FprintWrapper::GetWrapper().ObjectRef(other.GetNative()));
    Release();
    native_ = native;
  }
  return *this;
}

Image::Image(Image&& other) noexcept
    : native_(std::exchange(other.native_, nullptr)) {}

Image& Image::operator=(Image&& other) noexcept {
  if (this != &other) {
    Release();
    native_ = std::exchange(other.native_, nullptr);
  }
  return *this;
}

Image::~Image() { Release(); }

void Image::Release() {
  if (native_ != nullptr) {
    FprintWrapper::GetWrapper().ObjectUnref(native_);
    native_ = nullptr;
  }
}

FpImage* Image::GetNative() const {
  if (native_ == nullptr) {
    LOG(FATAL) << __func__ << ": Image used after being moved from.";
  }
  return native_;
}

uint32_t Image::GetWidth() const {
  return FprintWrapper::GetWrapper().ImageGetWidth(GetNative());
}

uint32_t Image::GetHeight() const {
  return FprintWrapper::GetWrapper().ImageGetHeight(GetNative());
}

double Image::GetPpmm() const {
  return FprintWrapper::GetWrapper().ImageGetPpmm(GetNative());
}

std::span<const uint8_t> Image::GetData() const {
  gsize length = 0;
  const guchar* data =
      FprintWrapper::GetWrapper().ImageGetData(GetNative(), &length);
  if (data == nullptr) {
    return {};
  }
  return {data, length};
}

std::span<const uint8_t> Image::GetBinarized() const {
  gsize length = 0;
  const guchar* data =
      FprintWrapper::GetWrapper().ImageGetBinarized(GetNative(), &length);
  if (data == nullptr) {
    return {};
  }
  return {data, length};
}

std::vector<Minutia> Image::GetMinutiae() const {
  FprintWrapper& wrapper = FprintWrapper::GetWrapper();
  std::vector<Minutia> minutiae;
  GPtrArray* native_minutiae = wrapper.ImageGetMinutiae(GetNative());
  if (native_minutiae == nullptr) {
    return minutiae;
  }
  minutiae.reserve(native_minutiae->len);
  for (guint i = 0; i < native_minutiae->len; ++i) {
    gint x = 0;
    gint y = 0;
    wrapper.MinutiaGetCoords(
        static_cast<FpMinutia*>(g_ptr_array_index(native_minutiae, i)), &x,
        &y);
    minutiae.push_back({x, y});
  }
  return minutiae;
}

}  // namespace fprint_binding
