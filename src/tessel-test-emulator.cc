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

#include "config.h"

#define G_SETTINGS_ENABLE_BACKEND
#include <gio/gsettingsbackend.h>

#include <string.h>

#include "tessel-test-emulator.hh"

static void tessel_test_emulator_iface_init (TesselEmulatorInterface *iface);

G_DEFINE_FINAL_TYPE_WITH_CODE (TesselTestEmulator, tessel_test_emulator, G_TYPE_OBJECT,
                               G_IMPLEMENT_INTERFACE (TESSEL_TYPE_EMULATOR,
                                                      tessel_test_emulator_iface_init))

#define TEST_EMULATOR(e) (reinterpret_cast<TesselTestEmulator*>(e))

static void
record_call (TesselEmulator *emulator,
             const char *name)
{
  g_ptr_array_add (TEST_EMULATOR (emulator)->calls, g_strdup (name));
}

typedef struct {
  TesselEmulatorSpawnCallback callback;
  gpointer user_data;
  gboolean completed;
} PendingSpawn;

static void
test_spawn_async (TesselEmulator *emulator,
                  const char *working_directory,
                  char **argv,
                  char **envv,
                  GSpawnFlags spawn_flags,
                  GCancellable *cancellable,
                  TesselEmulatorSpawnCallback callback,
                  gpointer user_data)
{
  TesselTestEmulator *self = TEST_EMULATOR (emulator);

  record_call (emulator, "spawn_async");

  self->n_spawns++;
  g_free (self->spawn_working_directory);
  self->spawn_working_directory = g_strdup (working_directory);
  g_strfreev (self->spawn_argv);
  self->spawn_argv = g_strdupv (argv);
  g_strfreev (self->spawn_envv);
  self->spawn_envv = g_strdupv (envv);
  self->spawn_flags = spawn_flags;

  if (self->defer_spawns) {
    auto const pending = g_new0 (PendingSpawn, 1);
    pending->callback = callback;
    pending->user_data = user_data;
    g_ptr_array_add (self->pending_spawns, pending);
    return;
  }

  if (self->spawn_error != nullptr) {
    g_autoptr(GError) error = self->spawn_error;
    self->spawn_error = nullptr;
    callback (emulator, -1, error, user_data);
    return;
  }

  callback (emulator, self->next_pid++, nullptr, user_data);
}

static void
test_feed (TesselEmulator *emulator,
           const char *data,
           gssize length)
{
  record_call (emulator, "feed");
  g_string_append_len (TEST_EMULATOR (emulator)->fed, data, length);
}

static void
test_feed_child (TesselEmulator *emulator,
                 const char *text,
                 gssize length)
{
  record_call (emulator, "feed_child");
  g_string_append_len (TEST_EMULATOR (emulator)->fed_child, text, length);
}

static void
test_paste_text (TesselEmulator *emulator,
                 const char *text)
{
  record_call (emulator, "paste_text");
  g_string_append (TEST_EMULATOR (emulator)->pasted, text);
}

static void
test_set_colors (TesselEmulator *emulator,
                 const GdkRGBA *foreground,
                 const GdkRGBA *background,
                 const GdkRGBA *palette,
                 gsize palette_size)
{
  TesselTestEmulator *self = TEST_EMULATOR (emulator);

  record_call (emulator, "set_colors");

  self->n_set_colors++;
  self->colors_use_theme = foreground == nullptr && background == nullptr;
  if (foreground)
    self->foreground = *foreground;
  if (background)
    self->background = *background;

  self->palette_size = MIN (palette_size, G_N_ELEMENTS (self->palette));
  for (gsize i = 0; i < self->palette_size; ++i)
    self->palette[i] = palette[i];
}

static void
test_set_font (TesselEmulator *emulator,
               const PangoFontDescription *font_desc)
{
  TesselTestEmulator *self = TEST_EMULATOR (emulator);

  record_call (emulator, "set_font");
  g_free (self->font);
  self->font = pango_font_description_to_string (font_desc);
}

static void
test_set_audible_bell (TesselEmulator *emulator,
                       gboolean setting)
{
  record_call (emulator, "set_audible_bell");
  TEST_EMULATOR (emulator)->audible_bell = setting;
}

static void
test_set_bold_is_bright (TesselEmulator *emulator,
                         gboolean setting)
{
  record_call (emulator, "set_bold_is_bright");
  TEST_EMULATOR (emulator)->bold_is_bright = setting;
}

static void
test_set_rewrap_on_resize (TesselEmulator *emulator,
                           gboolean setting)
{
  record_call (emulator, "set_rewrap_on_resize");
  TEST_EMULATOR (emulator)->rewrap_on_resize = setting;
}

static void
test_set_cursor_shape (TesselEmulator *emulator,
                       int shape)
{
  record_call (emulator, "set_cursor_shape");
  TEST_EMULATOR (emulator)->cursor_shape = shape;
}

static void
test_set_cursor_blink_mode (TesselEmulator *emulator,
                            int mode)
{
  record_call (emulator, "set_cursor_blink_mode");
  TEST_EMULATOR (emulator)->cursor_blink_mode = mode;
}

static void
test_set_scrollback_lines (TesselEmulator *emulator,
                           glong lines)
{
  record_call (emulator, "set_scrollback_lines");
  TEST_EMULATOR (emulator)->scrollback_lines = lines;
}

static void
test_set_scroll_on_output (TesselEmulator *emulator,
                           gboolean setting)
{
  record_call (emulator, "set_scroll_on_output");
  TEST_EMULATOR (emulator)->scroll_on_output = setting;
}

static void
test_set_scroll_on_keystroke (TesselEmulator *emulator,
                              gboolean setting)
{
  record_call (emulator, "set_scroll_on_keystroke");
  TEST_EMULATOR (emulator)->scroll_on_keystroke = setting;
}

static void
test_set_backspace_binding (TesselEmulator *emulator,
                            int binding)
{
  record_call (emulator, "set_backspace_binding");
  TEST_EMULATOR (emulator)->backspace_binding = binding;
}

static void
test_set_delete_binding (TesselEmulator *emulator,
                         int binding)
{
  record_call (emulator, "set_delete_binding");
  TEST_EMULATOR (emulator)->delete_binding = binding;
}

static gboolean
test_set_encoding (TesselEmulator *emulator,
                   const char *charset,
                   GError **error)
{
  TesselTestEmulator *self = TEST_EMULATOR (emulator);

  record_call (emulator, "set_encoding");
  g_free (self->encoding);
  self->encoding = g_strdup (charset);
  return TRUE;
}

static void
test_set_cjk_ambiguous_width (TesselEmulator *emulator,
                              int width)
{
  record_call (emulator, "set_cjk_ambiguous_width");
  TEST_EMULATOR (emulator)->cjk_ambiguous_width = width;
}

static void
test_set_input_enabled (TesselEmulator *emulator,
                        gboolean enabled)
{
  record_call (emulator, "set_input_enabled");
  TEST_EMULATOR (emulator)->input_enabled = enabled;
}

static void
test_set_size (TesselEmulator *emulator,
               glong columns,
               glong rows)
{
  record_call (emulator, "set_size");
  TEST_EMULATOR (emulator)->columns = columns;
  TEST_EMULATOR (emulator)->rows = rows;
}

static const char *
test_get_window_title (TesselEmulator *emulator)
{
  return TEST_EMULATOR (emulator)->window_title;
}

static const char *
test_get_icon_title (TesselEmulator *emulator)
{
  return TEST_EMULATOR (emulator)->icon_title;
}

static const char *
test_get_current_directory_uri (TesselEmulator *emulator)
{
  return TEST_EMULATOR (emulator)->current_directory_uri;
}

static gboolean
test_has_foreground_process (TesselEmulator *emulator,
                             GPid pid)
{
  GPid pgid = TEST_EMULATOR (emulator)->foreground_pgid;

  return pgid != -1 && pgid != pid;
}

static void
test_grab_focus (TesselEmulator *emulator)
{
  record_call (emulator, "grab_focus");
  TEST_EMULATOR (emulator)->n_grab_focus++;
}

static void
tessel_test_emulator_iface_init (TesselEmulatorInterface *iface)
{
  iface->spawn_async = test_spawn_async;
  iface->feed = test_feed;
  iface->feed_child = test_feed_child;
  iface->paste_text = test_paste_text;
  iface->set_colors = test_set_colors;
  iface->set_font = test_set_font;
  iface->set_audible_bell = test_set_audible_bell;
  iface->set_bold_is_bright = test_set_bold_is_bright;
  iface->set_rewrap_on_resize = test_set_rewrap_on_resize;
  iface->set_cursor_shape = test_set_cursor_shape;
  iface->set_cursor_blink_mode = test_set_cursor_blink_mode;
  iface->set_scrollback_lines = test_set_scrollback_lines;
  iface->set_scroll_on_output = test_set_scroll_on_output;
  iface->set_scroll_on_keystroke = test_set_scroll_on_keystroke;
  iface->set_backspace_binding = test_set_backspace_binding;
  iface->set_delete_binding = test_set_delete_binding;
  iface->set_encoding = test_set_encoding;
  iface->set_cjk_ambiguous_width = test_set_cjk_ambiguous_width;
  iface->set_input_enabled = test_set_input_enabled;
  iface->set_size = test_set_size;
  iface->get_window_title = test_get_window_title;
  iface->get_icon_title = test_get_icon_title;
  iface->get_current_directory_uri = test_get_current_directory_uri;
  iface->has_foreground_process = test_has_foreground_process;
  iface->grab_focus = test_grab_focus;
}

static void
tessel_test_emulator_init (TesselTestEmulator *self)
{
  self->calls = g_ptr_array_new_with_free_func (g_free);
  self->fed = g_string_new (nullptr);
  self->fed_child = g_string_new (nullptr);
  self->pasted = g_string_new (nullptr);
  self->next_pid = 1000;
  self->foreground_pgid = -1;
  self->input_enabled = TRUE;
  self->pending_spawns = g_ptr_array_new_with_free_func (g_free);
}

static void
tessel_test_emulator_finalize (GObject *object)
{
  TesselTestEmulator *self = TEST_EMULATOR (object);

  g_ptr_array_unref (self->calls);
  g_ptr_array_unref (self->pending_spawns);
  g_free (self->spawn_working_directory);
  g_strfreev (self->spawn_argv);
  g_strfreev (self->spawn_envv);
  g_clear_error (&self->spawn_error);
  g_string_free (self->fed, TRUE);
  g_string_free (self->fed_child, TRUE);
  g_string_free (self->pasted, TRUE);
  g_free (self->font);
  g_free (self->encoding);
  g_free (self->window_title);
  g_free (self->icon_title);
  g_free (self->current_directory_uri);

  G_OBJECT_CLASS (tessel_test_emulator_parent_class)->finalize (object);
}

static void
tessel_test_emulator_class_init (TesselTestEmulatorClass *klass)
{
  GObjectClass *object_class = G_OBJECT_CLASS (klass);

  object_class->finalize = tessel_test_emulator_finalize;
}

TesselTestEmulator *
tessel_test_emulator_new (void)
{
  return reinterpret_cast<TesselTestEmulator*>(g_object_new (TESSEL_TYPE_TEST_EMULATOR, nullptr));
}

/**
 * tessel_test_emulator_complete_spawn:
 * @emulator:
 * @index: the deferred spawn to finish, in the order they were started
 *
 * Finishes a deferred spawn successfully, whether or not its
 * cancellable was cancelled meanwhile.
 *
 * Returns: the pid handed to the callback
 */
GPid
tessel_test_emulator_complete_spawn (TesselTestEmulator *emulator,
                                     guint index)
{
  g_assert_cmpuint (index, <, emulator->pending_spawns->len);

  auto const pending = static_cast<PendingSpawn*>(g_ptr_array_index (emulator->pending_spawns, index));
  g_assert_false (pending->completed);
  pending->completed = TRUE;

  GPid pid = emulator->next_pid++;
  pending->callback (TESSEL_EMULATOR (emulator), pid, nullptr, pending->user_data);

  return pid;
}

void
tessel_test_emulator_clear_calls (TesselTestEmulator *emulator)
{
  g_ptr_array_set_size (emulator->calls, 0);
}

guint
tessel_test_emulator_count_calls (TesselTestEmulator *emulator,
                                  const char *name)
{
  guint n = 0;

  for (guint i = 0; i < emulator->calls->len; ++i) {
    if (g_str_equal (g_ptr_array_index (emulator->calls, i), name))
      n++;
  }

  return n;
}

void
tessel_test_emulator_set_window_title (TesselTestEmulator *emulator,
                                       const char *title)
{
  g_free (emulator->window_title);
  emulator->window_title = g_strdup (title);
  g_signal_emit_by_name (emulator, "title-updated");
}

void
tessel_test_emulator_set_icon_title (TesselTestEmulator *emulator,
                                     const char *title)
{
  g_free (emulator->icon_title);
  emulator->icon_title = g_strdup (title);
  g_signal_emit_by_name (emulator, "icon-title-updated");
}

void
tessel_test_emulator_set_current_directory_uri (TesselTestEmulator *emulator,
                                                const char *uri)
{
  g_free (emulator->current_directory_uri);
  emulator->current_directory_uri = g_strdup (uri);
  g_signal_emit_by_name (emulator, "directory-updated");
}

void
tessel_test_emulator_child_exited (TesselTestEmulator *emulator,
                                   int status)
{
  g_signal_emit_by_name (emulator, "process-exited", status);
}

void
tessel_test_emulator_notify (TesselTestEmulator *emulator,
                             const char *summary,
                             const char *body)
{
  g_signal_emit_by_name (emulator, "shell-notification", summary, body);
}

TesselContext *
tessel_test_context_new (TesselOverrides *overrides)
{
  g_autoptr(GError) error = nullptr;
  g_autoptr(GSettingsBackend) backend = g_memory_settings_backend_new ();
  g_autoptr(GSettingsSchemaSource) source =
    g_settings_schema_source_new_from_directory (TESSEL_TEST_SCHEMA_DIR,
                                                 g_settings_schema_source_get_default (),
                                                 FALSE,
                                                 &error);
  g_assert_no_error (error);
  g_assert_nonnull (source);

  return tessel_context_new (backend, source, overrides);
}
