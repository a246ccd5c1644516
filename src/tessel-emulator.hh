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

#ifndef TESSEL_EMULATOR_H
#define TESSEL_EMULATOR_H

#include <gio/gio.h>
#include <gdk/gdk.h>
#include <pango/pango.h>

G_BEGIN_DECLS

#define TESSEL_TYPE_EMULATOR            (tessel_emulator_get_type ())
#define TESSEL_EMULATOR(obj)            (G_TYPE_CHECK_INSTANCE_CAST ((obj), TESSEL_TYPE_EMULATOR, TesselEmulator))
#define TESSEL_IS_EMULATOR(obj)         (G_TYPE_CHECK_INSTANCE_TYPE ((obj), TESSEL_TYPE_EMULATOR))
#define TESSEL_EMULATOR_GET_IFACE(inst) (G_TYPE_INSTANCE_GET_INTERFACE ((inst), TESSEL_TYPE_EMULATOR, TesselEmulatorInterface))

typedef struct _TesselEmulator          TesselEmulator;
typedef struct _TesselEmulatorInterface TesselEmulatorInterface;

typedef void (* TesselEmulatorSpawnCallback) (TesselEmulator *emulator,
                                              GPid pid,
                                              GError *error,
                                              gpointer user_data);

struct _TesselEmulatorInterface {
  GTypeInterface parent_iface;

  /* vfuncs */
  void          (* spawn_async)              (TesselEmulator *emulator,
                                              const char *working_directory,
                                              char **argv,
                                              char **envv,
                                              GSpawnFlags spawn_flags,
                                              GCancellable *cancellable,
                                              TesselEmulatorSpawnCallback callback,
                                              gpointer user_data);
  void          (* feed)                     (TesselEmulator *emulator,
                                              const char *data,
                                              gssize length);
  void          (* feed_child)               (TesselEmulator *emulator,
                                              const char *text,
                                              gssize length);
  void          (* paste_text)               (TesselEmulator *emulator,
                                              const char *text);
  void          (* set_colors)               (TesselEmulator *emulator,
                                              const GdkRGBA *foreground,
                                              const GdkRGBA *background,
                                              const GdkRGBA *palette,
                                              gsize palette_size);
  void          (* set_font)                 (TesselEmulator *emulator,
                                              const PangoFontDescription *font_desc);
  void          (* set_audible_bell)         (TesselEmulator *emulator,
                                              gboolean setting);
  void          (* set_bold_is_bright)       (TesselEmulator *emulator,
                                              gboolean setting);
  void          (* set_rewrap_on_resize)     (TesselEmulator *emulator,
                                              gboolean setting);
  void          (* set_cursor_shape)         (TesselEmulator *emulator,
                                              int shape);
  void          (* set_cursor_blink_mode)    (TesselEmulator *emulator,
                                              int mode);
  void          (* set_scrollback_lines)     (TesselEmulator *emulator,
                                              glong lines);
  void          (* set_scroll_on_output)     (TesselEmulator *emulator,
                                              gboolean setting);
  void          (* set_scroll_on_keystroke)  (TesselEmulator *emulator,
                                              gboolean setting);
  void          (* set_backspace_binding)    (TesselEmulator *emulator,
                                              int binding);
  void          (* set_delete_binding)       (TesselEmulator *emulator,
                                              int binding);
  gboolean      (* set_encoding)             (TesselEmulator *emulator,
                                              const char *charset,
                                              GError **error);
  void          (* set_cjk_ambiguous_width)  (TesselEmulator *emulator,
                                              int width);
  void          (* set_input_enabled)        (TesselEmulator *emulator,
                                              gboolean enabled);
  void          (* set_size)                 (TesselEmulator *emulator,
                                              glong columns,
                                              glong rows);
  const char *  (* get_window_title)         (TesselEmulator *emulator);
  const char *  (* get_icon_title)           (TesselEmulator *emulator);
  const char *  (* get_current_directory_uri)(TesselEmulator *emulator);
  gboolean      (* has_foreground_process)   (TesselEmulator *emulator,
                                              GPid pid);
  void          (* grab_focus)               (TesselEmulator *emulator);

  /* signals */
  void (* title_updated)      (TesselEmulator *emulator);
  void (* icon_title_updated) (TesselEmulator *emulator);
  void (* directory_updated)  (TesselEmulator *emulator);
  void (* process_exited)     (TesselEmulator *emulator,
                               int status);
  void (* shell_notification) (TesselEmulator *emulator,
                               const char *summary,
                               const char *body);
};

GType tessel_emulator_get_type (void);

void tessel_emulator_spawn_async (TesselEmulator *emulator,
                                  const char *working_directory,
                                  char **argv,
                                  char **envv,
                                  GSpawnFlags spawn_flags,
                                  GCancellable *cancellable,
                                  TesselEmulatorSpawnCallback callback,
                                  gpointer user_data);

void tessel_emulator_feed (TesselEmulator *emulator,
                           const char *data,
                           gssize length);

void tessel_emulator_feed_child (TesselEmulator *emulator,
                                 const char *text,
                                 gssize length);

void tessel_emulator_paste_text (TesselEmulator *emulator,
                                 const char *text);

void tessel_emulator_set_colors (TesselEmulator *emulator,
                                 const GdkRGBA *foreground,
                                 const GdkRGBA *background,
                                 const GdkRGBA *palette,
                                 gsize palette_size);

void tessel_emulator_set_font (TesselEmulator *emulator,
                               const PangoFontDescription *font_desc);

void tessel_emulator_set_audible_bell (TesselEmulator *emulator,
                                       gboolean setting);

void tessel_emulator_set_bold_is_bright (TesselEmulator *emulator,
                                         gboolean setting);

void tessel_emulator_set_rewrap_on_resize (TesselEmulator *emulator,
                                           gboolean setting);

void tessel_emulator_set_cursor_shape (TesselEmulator *emulator,
                                       int shape);

void tessel_emulator_set_cursor_blink_mode (TesselEmulator *emulator,
                                            int mode);

void tessel_emulator_set_scrollback_lines (TesselEmulator *emulator,
                                           glong lines);

void tessel_emulator_set_scroll_on_output (TesselEmulator *emulator,
                                           gboolean setting);

void tessel_emulator_set_scroll_on_keystroke (TesselEmulator *emulator,
                                              gboolean setting);

void tessel_emulator_set_backspace_binding (TesselEmulator *emulator,
                                            int binding);

void tessel_emulator_set_delete_binding (TesselEmulator *emulator,
                                         int binding);

gboolean tessel_emulator_set_encoding (TesselEmulator *emulator,
                                       const char *charset,
                                       GError **error);

void tessel_emulator_set_cjk_ambiguous_width (TesselEmulator *emulator,
                                              int width);

void tessel_emulator_set_input_enabled (TesselEmulator *emulator,
                                        gboolean enabled);

void tessel_emulator_set_size (TesselEmulator *emulator,
                               glong columns,
                               glong rows);

const char *tessel_emulator_get_window_title (TesselEmulator *emulator);

const char *tessel_emulator_get_icon_title (TesselEmulator *emulator);

const char *tessel_emulator_get_current_directory_uri (TesselEmulator *emulator);

gboolean tessel_emulator_has_foreground_process (TesselEmulator *emulator,
                                                 GPid pid);

void tessel_emulator_grab_focus (TesselEmulator *emulator);

G_END_DECLS

#endif /* TESSEL_EMULATOR_H */
