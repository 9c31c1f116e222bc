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
#include <gio/gio.h>
#include <glib.h>

namespace fprint_binding {
namespace native {

/**
 * @class FprintWrapper
 * @brief A wrapper class providing an interface to the libfprint entry points.
 *
 * Every call the binding makes into libfprint or into the GObject reference
 * counting of libfprint objects goes through this interface, so that tests
 * can replace the native library with a mock. Ownership annotations follow
 * the libfprint documentation of the wrapped function.
 */
class FprintWrapper {
 public:
  virtual ~FprintWrapper() = default;

  /**
   * @brief Gets a reference to the singleton instance of this class.
   *
   * @return A reference to the singleton FprintWrapper instance.
   *
   */
  static FprintWrapper& GetWrapper();

  /**
   * @brief Takes a new strong reference on a libfprint object.
   *
   * @param object The FpContext, FpDevice, FpPrint or FpImage to reference.
   *
   * @return The same object.
   *
   */
  virtual gpointer ObjectRef(gpointer object) = 0;

  /**
   * @brief Turns a returned reference into a strong one.
   *
   * A floating reference (GInitiallyUnowned objects such as a fresh FpPrint)
   * is sunk; a reference that is already strong is kept as-is. Either way the
   * caller ends up owning exactly one reference.
   *
   * @param object The object returned by libfprint.
   *
   * @return The same object.
   *
   */
  virtual gpointer ObjectTakeOwnership(gpointer object) = 0;

  /**
   * @brief Drops one strong reference on a libfprint object.
   *
   * @param object The object to release.
   *
   */
  virtual void ObjectUnref(gpointer object) = 0;

  /**
   * @brief Whether anyone other than the caller holds a reference.
   *
   * @param object An object the caller holds one strong reference on.
   *
   * @return true if the reference count is above one.
   *
   */
  virtual gboolean ObjectIsShared(gpointer object) = 0;

  /**
   * @brief Returns the quark of the FP_DEVICE_ERROR domain.
   */
  virtual GQuark DeviceErrorQuark() = 0;

  /**
   * @brief Returns the quark of the FP_DEVICE_RETRY domain.
   */
  virtual GQuark DeviceRetryQuark() = 0;

  /**
   * @brief Creates a new libfprint context.
   *
   * @return A new context (transfer full), or nullptr on failure.
   *
   */
  virtual FpContext* ContextNew() = 0;

  /**
   * @brief Triggers an enumeration of the attached devices.
   *
   * @param context The context.
   *
   */
  virtual void ContextEnumerate(FpContext* context) = 0;

  /**
   * @brief Gets the currently known devices.
   *
   * @param context The context.
   *
   * @return An array of FpDevice owned by the context (transfer none).
   *
   */
  virtual GPtrArray* ContextGetDevices(FpContext* context) = 0;

  virtual const gchar* DeviceGetDriver(FpDevice* device) = 0;
  virtual const gchar* DeviceGetDeviceId(FpDevice* device) = 0;
  virtual const gchar* DeviceGetName(FpDevice* device) = 0;
  virtual FpScanType DeviceGetScanType(FpDevice* device) = 0;
  virtual gint DeviceGetNrEnrollStages(FpDevice* device) = 0;
  virtual FpFingerStatusFlags DeviceGetFingerStatus(FpDevice* device) = 0;
  virtual FpDeviceFeature DeviceGetFeatures(FpDevice* device) = 0;

  /**
   * @brief Opens the device, blocking until done.
   *
   * @param device The device.
   * @param cancellable A cancellable, or nullptr.
   * @param error Return location for a GError (transfer full).
   *
   * @return true on success.
   *
   */
  virtual gboolean DeviceOpenSync(FpDevice* device, GCancellable* cancellable,
                                  GError** error) = 0;

  /**
   * @brief Closes the device, blocking until done.
   *
   * @param device The device.
   * @param cancellable A cancellable, or nullptr.
   * @param error Return location for a GError (transfer full).
   *
   * @return true on success.
   *
   */
  virtual gboolean DeviceCloseSync(FpDevice* device, GCancellable* cancellable,
                                   GError** error) = 0;

  /**
   * @brief Enrolls a print, blocking until the enrollment is finished.
   *
   * The progress callback is invoked once per completed or failed stage,
   * from the thread iterating the context's main loop.
   *
   * @param device The device.
   * @param template_print The template print (transfer floating).
   * @param cancellable A cancellable, or nullptr.
   * @param progress_cb The progress callback, or nullptr.
   * @param progress_data User data passed to progress_cb.
   * @param error Return location for a GError (transfer full).
   *
   * @return The enrolled print (transfer full), or nullptr on failure.
   *
   */
  virtual FpPrint* DeviceEnrollSync(FpDevice* device, FpPrint* template_print,
                                    GCancellable* cancellable,
                                    FpEnrollProgress progress_cb,
                                    gpointer progress_data, GError** error) = 0;

  /**
   * @brief Verifies a freshly scanned finger against an enrolled print.
   *
   * @param device The device.
   * @param enrolled_print The print to verify against (transfer none).
   * @param cancellable A cancellable, or nullptr.
   * @param match_cb The match callback, or nullptr.
   * @param match_data User data passed to match_cb.
   * @param match Return location for the match result.
   * @param print Return location for the scanned print (transfer full).
   * @param error Return location for a GError (transfer full).
   *
   * @return true if the verification ran to completion.
   *
   */
  virtual gboolean DeviceVerifySync(FpDevice* device, FpPrint* enrolled_print,
                                    GCancellable* cancellable,
                                    FpMatchCb match_cb, gpointer match_data,
                                    gboolean* match, FpPrint** print,
                                    GError** error) = 0;

  /**
   * @brief Identifies a freshly scanned finger within a gallery of prints.
   *
   * @param device The device.
   * @param prints The gallery (element-type FpPrint, transfer none).
   * @param cancellable A cancellable, or nullptr.
   * @param match_cb The match callback, or nullptr.
   * @param match_data User data passed to match_cb.
   * @param match Return location for the matching gallery print (transfer
   * full), set to nullptr if none matched.
   * @param print Return location for the scanned print (transfer full).
   * @param error Return location for a GError (transfer full).
   *
   * @return true if the identification ran to completion.
   *
   */
  virtual gboolean DeviceIdentifySync(FpDevice* device, GPtrArray* prints,
                                      GCancellable* cancellable,
                                      FpMatchCb match_cb, gpointer match_data,
                                      FpPrint** match, FpPrint** print,
                                      GError** error) = 0;

  /**
   * @brief Captures a raw image from the device.
   *
   * @return The image (transfer full), or nullptr on failure.
   *
   */
  virtual FpImage* DeviceCaptureSync(FpDevice* device,
                                     gboolean wait_for_finger,
                                     GCancellable* cancellable,
                                     GError** error) = 0;

  /**
   * @brief Lists the prints stored on the device.
   *
   * @return An array of FpPrint whose free function drops the element
   * references (transfer full), or nullptr on failure.
   *
   */
  virtual GPtrArray* DeviceListPrintsSync(FpDevice* device,
                                          GCancellable* cancellable,
                                          GError** error) = 0;

  virtual gboolean DeviceDeletePrintSync(FpDevice* device,
                                         FpPrint* enrolled_print,
                                         GCancellable* cancellable,
                                         GError** error) = 0;

  virtual gboolean DeviceClearStorageSync(FpDevice* device,
                                          GCancellable* cancellable,
                                          GError** error) = 0;

  virtual gboolean DeviceSuspendSync(FpDevice* device,
                                     GCancellable* cancellable,
                                     GError** error) = 0;

  virtual gboolean DeviceResumeSync(FpDevice* device, GCancellable* cancellable,
                                    GError** error) = 0;

  /**
   * @brief Creates an empty template print for the device.
   *
   * @return A new print with a floating reference.
   *
   */
  virtual FpPrint* PrintNew(FpDevice* device) = 0;

  virtual const gchar* PrintGetDriver(FpPrint* print) = 0;
  virtual const gchar* PrintGetDeviceId(FpPrint* print) = 0;
  virtual gboolean PrintGetDeviceStored(FpPrint* print) = 0;

  /**
   * @brief Gets the image the print was generated from.
   *
   * @return The image (transfer none), or nullptr.
   *
   */
  virtual FpImage* PrintGetImage(FpPrint* print) = 0;

  virtual FpFinger PrintGetFinger(FpPrint* print) = 0;
  virtual void PrintSetFinger(FpPrint* print, FpFinger finger) = 0;
  virtual const gchar* PrintGetUsername(FpPrint* print) = 0;
  virtual void PrintSetUsername(FpPrint* print, const gchar* username) = 0;
  virtual const gchar* PrintGetDescription(FpPrint* print) = 0;
  virtual void PrintSetDescription(FpPrint* print,
                                   const gchar* description) = 0;
  virtual const GDate* PrintGetEnrollDate(FpPrint* print) = 0;
  virtual void PrintSetEnrollDate(FpPrint* print, const GDate* enroll_date) = 0;
  virtual gboolean PrintCompatible(FpPrint* print, FpDevice* device) = 0;
  virtual gboolean PrintEqual(FpPrint* first, FpPrint* second) = 0;

  /**
   * @brief Serializes a print into libfprint's binary format.
   *
   * @param print The print.
   * @param data Return location for the data, released with g_free().
   * @param length Return location for the data length.
   * @param error Return location for a GError (transfer full).
   *
   * @return true on success.
   *
   */
  virtual gboolean PrintSerialize(FpPrint* print, guchar** data,
                                  gsize* length, GError** error) = 0;

  /**
   * @brief Deserializes a print from libfprint's binary format.
   *
   * @return The print (transfer full), or nullptr on failure.
   *
   */
  virtual FpPrint* PrintDeserialize(const guchar* data, gsize length,
                                    GError** error) = 0;

  virtual guint ImageGetWidth(FpImage* image) = 0;
  virtual guint ImageGetHeight(FpImage* image) = 0;
  virtual gdouble ImageGetPpmm(FpImage* image) = 0;
  virtual const guchar* ImageGetData(FpImage* image, gsize* length) = 0;
  virtual const guchar* ImageGetBinarized(FpImage* image, gsize* length) = 0;

  /**
   * @brief Gets the minutiae detected on the image.
   *
   * @return An array of FpMinutia (transfer none), or nullptr if detection
   * has not run.
   *
   */
  virtual GPtrArray* ImageGetMinutiae(FpImage* image) = 0;

  virtual void MinutiaGetCoords(FpMinutia* minutia, gint* x, gint* y) = 0;
};

}  // namespace native
}  // namespace fprint_binding
