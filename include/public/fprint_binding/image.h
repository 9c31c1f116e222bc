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

#include <fprint.h>

#include <cstdint>
#include <span>
#include <vector>

namespace fprint_binding {

struct Minutia {
  int x = 0;
  int y = 0;
};

/**
 * @class Image
 * @brief A read-only captured fingerprint image.
 *
 * Copies share the same native image. The views returned by GetData() and
 * GetBinarized() stay valid as long as any copy of the Image is alive.
 */
class Image {
 public:
  Image(const Image& other);
  Image& operator=(const Image& other);
  Image(Image&& other) noexcept;
  Image& operator=(Image&& other) noexcept;
  ~Image();

  uint32_t GetWidth() const;
  uint32_t GetHeight() const;

  // Resolution in pixels per millimetre.
  double GetPpmm() const;

  // 8 bit greyscale pixels, row major, GetWidth() * GetHeight() bytes.
  std::span<const uint8_t> GetData() const;

  // Binarized pixels, empty until minutiae detection has run.
  std::span<const uint8_t> GetBinarized() const;

  std::vector<Minutia> GetMinutiae() const;

 private:
  friend class Device;
  friend class Print;

  // Takes over one reference held by the caller.
  static Image Adopt(FpImage* native);
  // Takes a new reference; the caller keeps its own.
  static Image Borrow(FpImage* native);

  explicit Image(FpImage* native);

  FpImage* GetNative() const;
  void Release();

  FpImage* native_;
};

}  // namespace fprint_binding
