/*
 * Copyright (C) 2026 The Tessel authors
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */

#ifndef TESSEL_PANE_H
#define TESSEL_PANE_H

#include <gio/gio.h>

#include "tessel-context.hh"
#include "tessel-emulator.hh"
#include "tessel-enums.hh"

G_BEGIN_DECLS

#define TESSEL_TYPE_PANE              (tessel_pane_get_type ())
#define TESSEL_PANE(obj)              (G_TYPE_CHECK_INSTANCE_CAST ((obj), TESSEL_TYPE_PANE, TesselPane))
#define TESSEL_PANE_CLASS(klass)      (G_TYPE_CHECK_CLASS_CAST ((klass), TESSEL_TYPE_PANE, TesselPaneClass))
#define TESSEL_IS_PANE(obj)           (G_TYPE_CHECK_INSTANCE_TYPE ((obj), TESSEL_TYPE_PANE))
#define TESSEL_IS_PANE_CLASS(klass)   (G_TYPE_CHECK_CLASS_TYPE ((klass), TESSEL_TYPE_PANE))
#define TESSEL_PANE_GET_CLASS(obj)    (G_TYPE_INSTANCE_GET_CLASS ((obj), TESSEL_TYPE_PANE, TesselPaneClass))

typedef struct _TesselPane        TesselPane;
typedef struct _TesselPaneClass   TesselPaneClass;
typedef struct _TesselPanePrivate TesselPanePrivate;

struct _TesselPane
{
  GObject parent_instance;

  TesselPanePrivate *priv;
};

struct _TesselPaneClass
{
  GObjectClass parent_class;

  void     (* focus_in)               (TesselPane *pane);
  void     (* close_request)          (TesselPane *pane);
  void     (* split_request)          (TesselPane *pane,
                                       TesselOrientation orientation);
  void     (* move_request)           (TesselPane *pane,
                                       const char *source_uuid,
                                       TesselDragQuadrant quadrant);
  gboolean (* detach_veto)            (TesselPane *pane);
  void     (* detach_request)         (TesselPane *pane,
                                       double x,
                                       double y);
  void     (* key_press_sync)         (TesselPane *pane,
                                       guint keyval,
                                       guint state);
  void     (* process_notification)   (TesselPane *pane,
                                       const char *summary,
                                       const char *body);
  void     (* unsafe_paste_requested) (TesselPane *pane,
                                       const char *text);
  void     (* exit_held)              (TesselPane *pane,
                                       const char *message);
};

GType tessel_pane_get_type (void) G_GNUC_CONST;

G_DEFINE_AUTOPTR_CLEANUP_FUNC (TesselPane, g_object_unref)

TesselPane *tessel_pane_new (TesselContext *context,
                             TesselEmulator *emulator,
                             const char *profile_uuid);

TesselContext *tessel_pane_get_context (TesselPane *pane);

TesselEmulator *tessel_pane_get_emulator (TesselPane *pane);

const char *tessel_pane_get_uuid (TesselPane *pane);

int tessel_pane_get_id (TesselPane *pane);

void tessel_pane_set_id (TesselPane *pane,
                         int id);

const char *tessel_pane_get_profile_uuid (TesselPane *pane);

void tessel_pane_set_profile_uuid (TesselPane *pane,
                                   const char *profile_uuid);

GSettings *tessel_pane_get_profile (TesselPane *pane);

const char *tessel_pane_get_title (TesselPane *pane);

const char *tessel_pane_get_override_title (TesselPane *pane);

void tessel_pane_set_override_title (TesselPane *pane,
                                     const char *title);

gboolean tessel_pane_get_synchronize_input (TesselPane *pane);

void tessel_pane_set_synchronize_input (TesselPane *pane,
                                        gboolean setting);

gboolean tessel_pane_get_read_only (TesselPane *pane);

void tessel_pane_set_read_only (TesselPane *pane,
                                gboolean setting);

gboolean tessel_pane_get_scrollbar_visible (TesselPane *pane);

gboolean tessel_pane_get_initialized (TesselPane *pane);

gboolean tessel_pane_get_focused (TesselPane *pane);

/* Preferences */

void tessel_pane_apply_preference (TesselPane *pane,
                                   const char *key);

void tessel_pane_apply_preferences_all (TesselPane *pane);

void tessel_pane_get_colors (TesselPane *pane,
                             GdkRGBA *foreground,
                             GdkRGBA *background,
                             GdkRGBA *palette,
                             gsize palette_size);

void tessel_pane_select_encoding (TesselPane *pane,
                                  const char *charset);

/* Title */

void tessel_pane_update_title (TesselPane *pane);

char *tessel_pane_dup_current_directory (TesselPane *pane);

/* Process lifecycle */

void tessel_pane_spawn (TesselPane *pane,
                        const char *working_directory);

void tessel_pane_relaunch (TesselPane *pane);

GPid tessel_pane_get_child_pid (TesselPane *pane);

gboolean tessel_pane_is_process_running (TesselPane *pane);

/* Clipboard */

void tessel_pane_paste_text (TesselPane *pane,
                             const char *text);

void tessel_pane_confirm_unsafe_paste (TesselPane *pane,
                                       const char *text,
                                       gboolean accepted);

void tessel_pane_feed_dropped_text (TesselPane *pane,
                                    const char *text);

/* Focus and input */

void tessel_pane_focus_in (TesselPane *pane);

void tessel_pane_focus_out (TesselPane *pane);

gboolean tessel_pane_key_pressed (TesselPane *pane,
                                  guint keyval,
                                  guint state,
                                  gboolean synthetic);

void tessel_pane_echo_key_press (TesselPane *pane,
                                 guint keyval,
                                 guint state);

/* Requests to the session */

void tessel_pane_request_close (TesselPane *pane);

void tessel_pane_request_split (TesselPane *pane,
                                TesselOrientation orientation);

gboolean tessel_pane_request_detach (TesselPane *pane,
                                     double x,
                                     double y);

/* Drag and drop */

TesselDragQuadrant tessel_pane_drag_motion (TesselPane *pane,
                                            int x,
                                            int y,
                                            int width,
                                            int height);

void tessel_pane_drag_leave (TesselPane *pane);

gboolean tessel_pane_drag_drop (TesselPane *pane,
                                const char *source_uuid,
                                int x,
                                int y,
                                int width,
                                int height);

void tessel_pane_drag_end (TesselPane *pane,
                           gboolean dropped,
                           double x,
                           double y);

gboolean tessel_pane_get_drag_active (TesselPane *pane);

TesselDragQuadrant tessel_pane_get_drag_quadrant (TesselPane *pane);

G_END_DECLS

#endif /* TESSEL_PANE_H */
