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

#include "fprint_binding/native/fprint_wrapper.h"

#include <fprint.h>
#include <gio/gio.h>
#include <glib-object.h>
#include <glib.h>

namespace fprint_binding {
namespace native {

class FprintWrapperImpl : public FprintWrapper {
 public:
  gpointer ObjectRef(gpointer object) override { return g_object_ref(object); }

  gpointer ObjectTakeOwnership(gpointer object) override {
    if (g_object_is_floating(object)) {
      g_object_ref_sink(object);
    }
    return object;
  }

  void ObjectUnref(gpointer object) override { g_object_unref(object); }

  gboolean ObjectIsShared(gpointer object) override {
    return g_atomic_int_get(&G_OBJECT(object)->ref_count) > 1;
  }

  GQuark DeviceErrorQuark() override { return fp_device_error_quark(); }

  GQuark DeviceRetryQuark() override { return fp_device_retry_quark(); }

  FpContext* ContextNew() override { return fp_context_new(); }

  void ContextEnumerate(FpContext* context) override {
    fp_context_enumerate(context);
  }

  GPtrArray* ContextGetDevices(FpContext* context) override {
    return fp_context_get_devices(context);
  }

  const gchar* DeviceGetDriver(FpDevice* device) override {
    return fp_device_get_driver(device);
  }

  const gchar* DeviceGetDeviceId(FpDevice* device) override {
    return fp_device_get_device_id(device);
  }

  const gchar* DeviceGetName(FpDevice* device) override {
    return fp_device_get_name(device);
  }

  FpScanType DeviceGetScanType(FpDevice* device) override {
    return fp_device_get_scan_type(device);
  }

  gint DeviceGetNrEnrollStages(FpDevice* device) override {
    return fp_device_get_nr_enroll_stages(device);
  }

  FpFingerStatusFlags DeviceGetFingerStatus(FpDevice* device) override {
    return fp_device_get_finger_status(device);
  }

  FpDeviceFeature DeviceGetFeatures(FpDevice* device) override {
    return fp_device_get_features(device);
  }

  gboolean DeviceOpenSync(FpDevice* device, GCancellable* cancellable,
                          GError** error) override {
    return fp_device_open_sync(device, cancellable, error);
  }

  gboolean DeviceCloseSync(FpDevice* device, GCancellable* cancellable,
                           GError** error) override {
    return fp_device_close_sync(device, cancellable, error);
  }

  FpPrint* DeviceEnrollSync(FpDevice* device, FpPrint* template_print,
                            GCancellable* cancellable,
                            FpEnrollProgress progress_cb,
                            gpointer progress_data, GError** error) override {
    return fp_device_enroll_sync(device, template_print, cancellable,
                                 progress_cb, progress_data, error);
  }

  gboolean DeviceVerifySync(FpDevice* device, FpPrint* enrolled_print,
                            GCancellable* cancellable, FpMatchCb match_cb,
                            gpointer match_data, gboolean* match,
                            FpPrint** print, GError** error) override {
    return fp_device_verify_sync(device, enrolled_print, cancellable, match_cb,
                                 match_data, match, print, error);
  }

  gboolean DeviceIdentifySync(FpDevice* device, GPtrArray* prints,
                              GCancellable* cancellable, FpMatchCb match_cb,
                              gpointer match_data, FpPrint** match,
                              FpPrint** print, GError** error) override {
    return fp_device_identify_sync(device, prints, cancellable, match_cb,
                                   match_data, match, print, error);
  }

  FpImage* DeviceCaptureSync(FpDevice* device, gboolean wait_for_finger,
                             GCancellable* cancellable,
                             GError** error) override {
    return fp_device_capture_sync(device, wait_for_finger, cancellable, error);
  }

  GPtrArray* DeviceListPrintsSync(FpDevice* device, GCancellable* cancellable,
                                  GError** error) override {
    return fp_device_list_prints_sync(device, cancellable, error);
  }

  gboolean DeviceDeletePrintSync(FpDevice* device, FpPrint* enrolled_print,
                                 GCancellable* cancellable,
                                 GError** error) override {
    return fp_device_delete_print_sync(device, enrolled_print, cancellable,
                                       error);
  }

  gboolean DeviceClearStorageSync(FpDevice* device, GCancellable* cancellable,
                                  GError** error) override {
    return fp_device_clear_storage_sync(device, cancellable, error);
  }

  gboolean DeviceSuspendSync(FpDevice* device, GCancellable* cancellable,
                             GError** error) override {
    return fp_device_suspend_sync(device, cancellable, error);
  }

  gboolean DeviceResumeSync(FpDevice* device, GCancellable* cancellable,
                            GError** error) override {
    return fp_device_resume_sync(device, cancellable, error);
  }

  FpPrint* PrintNew(FpDevice* device) override { return fp_print_new(device); }

  const gchar* PrintGetDriver(FpPrint* print) override {
    return fp_print_get_driver(print);
  }

  const gchar* PrintGetDeviceId(FpPrint* print) override {
    return fp_print_get_device_id(print);
  }

  gboolean PrintGetDeviceStored(FpPrint* print) override {
    return fp_print_get_device_stored(print);
  }

  FpImage* PrintGetImage(FpPrint* print) override {
    return fp_print_get_image(print);
  }

  FpFinger PrintGetFinger(FpPrint* print) override {
    return fp_print_get_finger(print);
  }

  void PrintSetFinger(FpPrint* print, FpFinger finger) override {
    fp_print_set_finger(print, finger);
  }

  const gchar* PrintGetUsername(FpPrint* print) override {
    return fp_print_get_username(print);
  }

  void PrintSetUsername(FpPrint* print, const gchar* username) override {
    fp_print_set_username(print, username);
  }

  const gchar* PrintGetDescription(FpPrint* print) override {
    return fp_print_get_description(print);
  }

  void PrintSetDescription(FpPrint* print, const gchar* description) override {
    fp_print_set_description(print, description);
  }

  const GDate* PrintGetEnrollDate(FpPrint* print) override {
    return fp_print_get_enroll_date(print);
  }

  void PrintSetEnrollDate(FpPrint* print, const GDate* enroll_date) override {
    fp_print_set_enroll_date(print, enroll_date);
  }

  gboolean PrintCompatible(FpPrint* print, FpDevice* device) override {
    return fp_print_compatible(print, device);
  }

  gboolean PrintEqual(FpPrint* first, FpPrint* second) override {
    return fp_print_equal(first, second);
  }

  gboolean PrintSerialize(FpPrint* print, guchar** data, gsize* length,
                          GError** error) override {
    return fp_print_serialize(print, data, length, error);
  }

  FpPrint* PrintDeserialize(const guchar* data, gsize length,
                            GError** error) override {
    return fp_print_deserialize(data, length, error);
  }

  guint ImageGetWidth(FpImage* image) override {
    return fp_image_get_width(image);
  }

  guint ImageGetHeight(FpImage* image) override {
    return fp_image_get_height(image);
  }

  gdouble ImageGetPpmm(FpImage* image) override {
    return fp_image_get_ppmm(image);
  }

  const guchar* ImageGetData(FpImage* image, gsize* length) override {
    return fp_image_get_data(image, length);
  }

  const guchar* ImageGetBinarized(FpImage* image, gsize* length) override {
    return fp_image_get_binarized(image, length);
  }

  GPtrArray* ImageGetMinutiae(FpImage* image) override {
    return fp_image_get_minutiae(image);
  }

  void MinutiaGetCoords(FpMinutia* minutia, gint* x, gint* y) override {
    fp_minutia_get_coords(minutia, x, y);
  }
};

FprintWrapper& FprintWrapper::GetWrapper() {
  static FprintWrapperImpl wrapper;
  return wrapper;
}

}  // namespace native
}  // namespace fprint_binding
