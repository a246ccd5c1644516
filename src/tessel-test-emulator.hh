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

#pragma once

#include "tessel-context.hh"
#include "tessel-emulator.hh"

G_BEGIN_DECLS

#define TESSEL_TYPE_TEST_EMULATOR (tessel_test_emulator_get_type ())

G_DECLARE_FINAL_TYPE (TesselTestEmulator, tessel_test_emulator, TESSEL, TEST_EMULATOR, GObject)

/* A terminal that records what it is asked to do */
struct _TesselTestEmulator {
  GObject parent_instance;

  GPtrArray *calls;

  /* spawn */
  guint n_spawns;
  char *spawn_working_directory;
  char **spawn_argv;
  char **spawn_envv;
  GSpawnFlags spawn_flags;
  GError *spawn_error;
  GPid next_pid;
  /* When set, spawns wait for tessel_test_emulator_complete_spawn() */
  gboolean defer_spawns;
  GPtrArray *pending_spawns;

  GString *fed;
  GString *fed_child;
  GString *pasted;

  gboolean colors_use_theme;
  GdkRGBA foreground;
  GdkRGBA background;
  GdkRGBA palette[16];
  gsize palette_size;
  guint n_set_colors;

  char *font;
  gboolean audible_bell;
  gboolean bold_is_bright;
  gboolean rewrap_on_resize;
  int cursor_shape;
  int cursor_blink_mode;
  glong scrollback_lines;
  gboolean scroll_on_output;
  gboolean scroll_on_keystroke;
  int backspace_binding;
  int delete_binding;
  char *encoding;
  int cjk_ambiguous_width;
  gboolean input_enabled;
  glong columns;
  glong rows;
  guint n_grab_focus;

  char *window_title;
  char *icon_title;
  char *current_directory_uri;
  GPid foreground_pgid;
};

TesselTestEmulator *tessel_test_emulator_new (void);

void tessel_test_emulator_clear_calls (TesselTestEmulator *emulator);

guint tessel_test_emulator_count_calls (TesselTestEmulator *emulator,
                                        const char *name);

void tessel_test_emulator_set_window_title (TesselTestEmulator *emulator,
                                            const char *title);

void tessel_test_emulator_set_icon_title (TesselTestEmulator *emulator,
                                          const char *title);

void tessel_test_emulator_set_current_directory_uri (TesselTestEmulator *emulator,
                                                     const char *uri);

GPid tessel_test_emulator_complete_spawn (TesselTestEmulator *emulator,
                                          guint index);

void tessel_test_emulator_child_exited (TesselTestEmulator *emulator,
                                        int status);

void tessel_test_emulator_notify (TesselTestEmulator *emulator,
                                  const char *summary,
                                  const char *body);

/* Context backed by the memory settings backend and the schemas of the build tree */
TesselContext *tessel_test_context_new (TesselOverrides *overrides);

G_END_DECLS
