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

#define LOG_TAG "fprint_binding.callback"

#include "fprint_binding/callback_marshaller.h"

#include <fprint.h>
#include <glib.h>

namespace fprint_binding {

// The device argument is not forwarded: each handler already knows the
// Device wrapper it was created for.

void EnrollProgressTrampoline([[maybe_unused]] FpDevice* device,
                              gint completed_stages, FpPrint* print,
                              gpointer user_data, GError* error) {
  EnrollProgressMarshaller::Dispatch(user_data, completed_stages, print, error);
}

void MatchTrampoline([[maybe_unused]] FpDevice* device, FpPrint* match,
                     FpPrint* print, gpointer user_data, GError* error) {
  MatchMarshaller::Dispatch(user_data, match, print, error);
}

}  // namespace fprint_binding
