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

#include <config.h>

#include "tessel-emulator.hh"
#include "tessel-intl.hh"

enum {
  WINDOW_TITLE_CHANGED,
  ICON_TITLE_CHANGED,
  CURRENT_DIRECTORY_CHANGED,
  CHILD_EXITED,
  NOTIFICATION_RECEIVED,
  LAST_SIGNAL
};

static guint signals[LAST_SIGNAL];

G_DEFINE_INTERFACE (TesselEmulator, tessel_emulator, G_TYPE_OBJECT)

static void
tessel_emulator_default_init (TesselEmulatorInterface *iface)
{
  signals[WINDOW_TITLE_CHANGED] =
    g_signal_new (I_("title-updated"),
                  G_TYPE_FROM_INTERFACE (iface),
                  G_SIGNAL_RUN_LAST,
                  G_STRUCT_OFFSET (TesselEmulatorInterface, title_updated),
                  nullptr, nullptr,
                  g_cclosure_marshal_VOID__VOID,
                  G_TYPE_NONE,
                  0);

  signals[ICON_TITLE_CHANGED] =
    g_signal_new (I_("icon-title-updated"),
                  G_TYPE_FROM_INTERFACE (iface),
                  G_SIGNAL_RUN_LAST,
                  G_STRUCT_OFFSET (TesselEmulatorInterface, icon_title_updated),
                  nullptr, nullptr,
                  g_cclosure_marshal_VOID__VOID,
                  G_TYPE_NONE,
                  0);

  signals[CURRENT_DIRECTORY_CHANGED] =
    g_signal_new (I_("directory-updated"),
                  G_TYPE_FROM_INTERFACE (iface),
                  G_SIGNAL_RUN_LAST,
                  G_STRUCT_OFFSET (TesselEmulatorInterface, directory_updated),
                  nullptr, nullptr,
                  g_cclosure_marshal_VOID__VOID,
                  G_TYPE_NONE,
                  0);

  signals[CHILD_EXITED] =
    g_signal_new (I_("process-exited"),
                  G_TYPE_FROM_INTERFACE (iface),
                  G_SIGNAL_RUN_LAST,
                  G_STRUCT_OFFSET (TesselEmulatorInterface, process_exited),
                  nullptr, nullptr,
                  g_cclosure_marshal_VOID__INT,
                  G_TYPE_NONE,
                  1, G_TYPE_INT);

  signals[NOTIFICATION_RECEIVED] =
    g_signal_new (I_("shell-notification"),
                  G_TYPE_FROM_INTERFACE (iface),
                  G_SIGNAL_RUN_LAST,
                  G_STRUCT_OFFSET (TesselEmulatorInterface, shell_notification),
                  nullptr, nullptr,
                  nullptr,
                  G_TYPE_NONE,
                  2, G_TYPE_STRING, G_TYPE_STRING);
}

/* public API */

void
tessel_emulator_spawn_async (TesselEmulator *emulator,
                             const char *working_directory,
                             char **argv,
                             char **envv,
                             GSpawnFlags spawn_flags,
                             GCancellable *cancellable,
                             TesselEmulatorSpawnCallback callback,
                             gpointer user_data)
{
  g_return_if_fail (TESSEL_IS_EMULATOR (emulator));

  TESSEL_EMULATOR_GET_IFACE (emulator)->spawn_async (emulator, working_directory,
                                                     argv, envv, spawn_flags,
                                                     cancellable,
                                                     callback, user_data);
}

void
tessel_emulator_feed (TesselEmulator *emulator,
                      const char *data,
                      gssize length)
{
  g_return_if_fail (TESSEL_IS_EMULATOR (emulator));

  TESSEL_EMULATOR_GET_IFACE (emulator)->feed (emulator, data, length);
}

void
tessel_emulator_feed_child (TesselEmulator *emulator,
                            const char *text,
                            gssize length)
{
  g_return_if_fail (TESSEL_IS_EMULATOR (emulator));

  TESSEL_EMULATOR_GET_IFACE (emulator)->feed_child (emulator, text, length);
}

void
tessel_emulator_paste_text (TesselEmulator *emulator,
                            const char *text)
{
  g_return_if_fail (TESSEL_IS_EMULATOR (emulator));

  TESSEL_EMULATOR_GET_IFACE (emulator)->paste_text (emulator, text);
}

void
tessel_emulator_set_colors (TesselEmulator *emulator,
                            const GdkRGBA *foreground,
                            const GdkRGBA *background,
                            const GdkRGBA *palette,
                            gsize palette_size)
{
  g_return_if_fail (TESSEL_IS_EMULATOR (emulator));

  TESSEL_EMULATOR_GET_IFACE (emulator)->set_colors (emulator, foreground, background,
                                                    palette, palette_size);
}

void
tessel_emulator_set_font (TesselEmulator *emulator,
                          const PangoFontDescription *font_desc)
{
  g_return_if_fail (TESSEL_IS_EMULATOR (emulator));

  TESSEL_EMULATOR_GET_IFACE (emulator)->set_font (emulator, font_desc);
}

void
tessel_emulator_set_audible_bell (TesselEmulator *emulator,
                                  gboolean setting)
{
  g_return_if_fail (TESSEL_IS_EMULATOR (emulator));

  TESSEL_EMULATOR_GET_IFACE (emulator)->set_audible_bell (emulator, setting);
}

void
tessel_emulator_set_bold_is_bright (TesselEmulator *emulator,
                                    gboolean setting)
{
  g_return_if_fail (TESSEL_IS_EMULATOR (emulator));

  TESSEL_EMULATOR_GET_IFACE (emulator)->set_bold_is_bright (emulator, setting);
}

void
tessel_emulator_set_rewrap_on_resize (TesselEmulator *emulator,
                                      gboolean setting)
{
  g_return_if_fail (TESSEL_IS_EMULATOR (emulator));

  TESSEL_EMULATOR_GET_IFACE (emulator)->set_rewrap_on_resize (emulator, setting);
}

void
tessel_emulator_set_cursor_shape (TesselEmulator *emulator,
                                  int shape)
{
  g_return_if_fail (TESSEL_IS_EMULATOR (emulator));

  TESSEL_EMULATOR_GET_IFACE (emulator)->set_cursor_shape (emulator, shape);
}

void
tessel_emulator_set_cursor_blink_mode (TesselEmulator *emulator,
                                       int mode)
{
  g_return_if_fail (TESSEL_IS_EMULATOR (emulator));

  TESSEL_EMULATOR_GET_IFACE (emulator)->set_cursor_blink_mode (emulator, mode);
}

void
tessel_emulator_set_scrollback_lines (TesselEmulator *emulator,
                                      glong lines)
{
  g_return_if_fail (TESSEL_IS_EMULATOR (emulator));

  TESSEL_EMULATOR_GET_IFACE (emulator)->set_scrollback_lines (emulator, lines);
}

void
tessel_emulator_set_scroll_on_output (TesselEmulator *emulator,
                                      gboolean setting)
{
  g_return_if_fail (TESSEL_IS_EMULATOR (emulator));

  TESSEL_EMULATOR_GET_IFACE (emulator)->set_scroll_on_output (emulator, setting);
}

void
tessel_emulator_set_scroll_on_keystroke (TesselEmulator *emulator,
                                         gboolean setting)
{
  g_return_if_fail (TESSEL_IS_EMULATOR (emulator));

  TESSEL_EMULATOR_GET_IFACE (emulator)->set_scroll_on_keystroke (emulator, setting);
}

void
tessel_emulator_set_backspace_binding (TesselEmulator *emulator,
                                       int binding)
{
  g_return_if_fail (TESSEL_IS_EMULATOR (emulator));

  TESSEL_EMULATOR_GET_IFACE (emulator)->set_backspace_binding (emulator, binding);
}

void
tessel_emulator_set_delete_binding (TesselEmulator *emulator,
                                    int binding)
{
  g_return_if_fail (TESSEL_IS_EMULATOR (emulator));

  TESSEL_EMULATOR_GET_IFACE (emulator)->set_delete_binding (emulator, binding);
}

gboolean
tessel_emulator_set_encoding (TesselEmulator *emulator,
                              const char *charset,
                              GError **error)
{
  g_return_val_if_fail (TESSEL_IS_EMULATOR (emulator), FALSE);

  return TESSEL_EMULATOR_GET_IFACE (emulator)->set_encoding (emulator, charset, error);
}

void
tessel_emulator_set_cjk_ambiguous_width (TesselEmulator *emulator,
                                         int width)
{
  g_return_if_fail (TESSEL_IS_EMULATOR (emulator));

  TESSEL_EMULATOR_GET_IFACE (emulator)->set_cjk_ambiguous_width (emulator, width);
}

void
tessel_emulator_set_input_enabled (TesselEmulator *emulator,
                                   gboolean enabled)
{
  g_return_if_fail (TESSEL_IS_EMULATOR (emulator));

  TESSEL_EMULATOR_GET_IFACE (emulator)->set_input_enabled (emulator, enabled);
}

void
tessel_emulator_set_size (TesselEmulator *emulator,
                          glong columns,
                          glong rows)
{
  g_return_if_fail (TESSEL_IS_EMULATOR (emulator));

  TESSEL_EMULATOR_GET_IFACE (emulator)->set_size (emulator, columns, rows);
}

const char *
tessel_emulator_get_window_title (TesselEmulator *emulator)
{
  g_return_val_if_fail (TESSEL_IS_EMULATOR (emulator), nullptr);

  return TESSEL_EMULATOR_GET_IFACE (emulator)->get_window_title (emulator);
}

const char *
tessel_emulator_get_icon_title (TesselEmulator *emulator)
{
  g_return_val_if_fail (TESSEL_IS_EMULATOR (emulator), nullptr);

  return TESSEL_EMULATOR_GET_IFACE (emulator)->get_icon_title (emulator);
}

const char *
tessel_emulator_get_current_directory_uri (TesselEmulator *emulator)
{
  g_return_val_if_fail (TESSEL_IS_EMULATOR (emulator), nullptr);

  return TESSEL_EMULATOR_GET_IFACE (emulator)->get_current_directory_uri (emulator);
}

gboolean
tessel_emulator_has_foreground_process (TesselEmulator *emulator,
                                        GPid pid)
{
  g_return_val_if_fail (TESSEL_IS_EMULATOR (emulator), FALSE);

  return TESSEL_EMULATOR_GET_IFACE (emulator)->has_foreground_process (emulator, pid);
}

void
tessel_emulator_grab_focus (TesselEmulator *emulator)
{
  g_return_if_fail (TESSEL_IS_EMULATOR (emulator));

  TESSEL_EMULATOR_GET_IFACE (emulator)->grab_focus (emulator);
}
