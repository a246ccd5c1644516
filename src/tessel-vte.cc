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

#include <unistd.h>

#include <glib/gi18n.h>
#include <gtk/gtk.h>

#include "tessel-debug.hh"
#include "tessel-intl.hh"
#include "tessel-pcre2.hh"
#include "tessel-regex.hh"
#include "tessel-util.hh"
#include "tessel-vte.hh"

#define URL_MATCH_CURSOR_NAME "pointer"

typedef struct
{
  int tag;
  TesselURLFlavor flavor;
} TagData;

namespace {

typedef struct {
  TesselEmulatorSpawnCallback callback;
  gpointer user_data;
} SpawnData;

} // anon namespace

struct _TesselVte
{
  VteTerminal parent_instance;

  GSList *match_tags;
};

enum {
  SHOW_POPUP_MENU,
  LAST_SIGNAL
};

static guint signals[LAST_SIGNAL];

static VteRegex **url_regexes;
static TesselURLFlavor *url_regex_flavors;
static guint n_url_regexes;

static void tessel_vte_emulator_iface_init (TesselEmulatorInterface *iface);

G_DEFINE_FINAL_TYPE_WITH_CODE (TesselVte, tessel_vte, VTE_TYPE_TERMINAL,
                               G_IMPLEMENT_INTERFACE (TESSEL_TYPE_EMULATOR,
                                                      tessel_vte_emulator_iface_init))

static void
free_tag_data (TagData *tagdata)
{
  g_slice_free (TagData, tagdata);
}

static void
precompile_regexes (const TesselRegexPattern *regex_patterns,
                    guint n_regexes,
                    VteRegex ***regexes,
                    TesselURLFlavor **regex_flavors)
{
  *regexes = g_new0 (VteRegex*, n_regexes);
  *regex_flavors = g_new0 (TesselURLFlavor, n_regexes);

  for (guint i = 0; i < n_regexes; ++i) {
    g_autoptr(GError) error = nullptr;

    (*regexes)[i] = vte_regex_new_for_match (regex_patterns[i].pattern, -1,
                                             PCRE2_UTF | PCRE2_NO_UTF_CHECK | PCRE2_UCP | PCRE2_MULTILINE,
                                             &error);
    if ((*regexes)[i] == nullptr) {
      g_warning ("Failed to compile regex '%s': %s", regex_patterns[i].pattern, error->message);
      continue;
    }

    if (!vte_regex_jit ((*regexes)[i], PCRE2_JIT_COMPLETE, &error) ||
        !vte_regex_jit ((*regexes)[i], PCRE2_JIT_PARTIAL_SOFT, &error)) {
      g_printerr ("Failed to JIT regex '%s': %s\n", regex_patterns[i].pattern, error->message);
      g_clear_error (&error);
    }

    (*regex_flavors)[i] = regex_patterns[i].flavor;
  }
}

/* VTE to emulator signal mapping */

static void
tessel_vte_window_title_changed_cb (VteTerminal *terminal,
                                    TesselVte *vte)
{
  g_signal_emit_by_name (vte, "title-updated");
}

static void
tessel_vte_current_directory_uri_changed_cb (VteTerminal *terminal,
                                             TesselVte *vte)
{
  g_signal_emit_by_name (vte, "directory-updated");
}

static void
tessel_vte_shell_postexec_cb (VteTerminal *terminal,
                              const char *prop,
                              TesselVte *vte)
{
  const char *title = vte_terminal_get_window_title (terminal);

  _tessel_debug_print (TESSEL_DEBUG_PROCESSES,
                       "[vte %p] shell post-exec, title \"%s\"\n", vte, title ? title : "");

  g_signal_emit_by_name (vte, "shell-notification",
                         _("Command completed"), title ? title : "");
}

static void
tessel_vte_child_exited (VteTerminal *terminal,
                         int status)
{
  g_signal_emit_by_name (terminal, "process-exited", status);
}

/* Clicks */

static void
tessel_vte_open_url_cb (GObject *source,
                        GAsyncResult *result,
                        gpointer user_data)
{
  g_autoptr(GError) error = nullptr;

  if (!gtk_uri_launcher_launch_finish (GTK_URI_LAUNCHER (source), result, &error) &&
      !g_error_matches (error, GTK_DIALOG_ERROR, GTK_DIALOG_ERROR_DISMISSED))
    g_warning ("Could not open the address “%s”: %s",
               gtk_uri_launcher_get_uri (GTK_URI_LAUNCHER (source)), error->message);
}

void
tessel_vte_open_url (TesselVte *vte,
                     const char *url)
{
  g_return_if_fail (TESSEL_IS_VTE (vte));
  g_return_if_fail (url != nullptr);

  auto const root = gtk_widget_get_root (GTK_WIDGET (vte));
  g_autoptr(GtkUriLauncher) launcher = gtk_uri_launcher_new (url);

  gtk_uri_launcher_launch (launcher,
                           GTK_IS_WINDOW (root) ? GTK_WINDOW (root) : nullptr,
                           nullptr,
                           tessel_vte_open_url_cb,
                           nullptr);
}

/**
 * tessel_vte_check_match:
 * @vte:
 * @x:
 * @y:
 *
 * Returns: (transfer full) (nullable): the hyperlink or the matched URL
 *   at the given position, as an absolute URI
 */
char *
tessel_vte_check_match (TesselVte *vte,
                        double x,
                        double y)
{
  g_return_val_if_fail (TESSEL_IS_VTE (vte), nullptr);

  char *hyperlink = vte_terminal_check_hyperlink_at (VTE_TERMINAL (vte), x, y);
  if (hyperlink != nullptr)
    return hyperlink;

  int tag;
  g_autofree char *match = vte_terminal_check_match_at (VTE_TERMINAL (vte), x, y, &tag);
  if (match == nullptr)
    return nullptr;

  for (GSList *tags = vte->match_tags; tags != nullptr; tags = tags->next) {
    TagData *tag_data = (TagData*) tags->data;
    if (tag_data->tag == tag)
      return tessel_util_url_for_flavor (match, tag_data->flavor);
  }

  return nullptr;
}

static void
tessel_vte_click_pressed_cb (GtkGestureClick *click,
                             int n_press,
                             double x,
                             double y,
                             TesselVte *vte)
{
  auto event = gtk_event_controller_get_current_event (GTK_EVENT_CONTROLLER (click));
  auto state = gdk_event_get_modifier_state (event) & gtk_accelerator_get_default_mod_mask ();
  auto button = gtk_gesture_single_get_current_button (GTK_GESTURE_SINGLE (click));

  if (n_press == 1 &&
      (button == 1 || button == 2) &&
      (state & GDK_CONTROL_MASK)) {
    g_autofree char *url = tessel_vte_check_match (vte, x, y);
    if (url != nullptr) {
      tessel_vte_open_url (vte, url);
      gtk_gesture_set_state (GTK_GESTURE (click), GTK_EVENT_SEQUENCE_CLAIMED);
      return;
    }
  }

  if (n_press == 1 && button == 3 &&
      !(state & (GDK_CONTROL_MASK | GDK_ALT_MASK))) {
    g_signal_emit (vte, signals[SHOW_POPUP_MENU], 0, x, y);
    gtk_gesture_set_state (GTK_GESTURE (click), GTK_EVENT_SEQUENCE_CLAIMED);
    return;
  }

  gtk_gesture_set_state (GTK_GESTURE (click), GTK_EVENT_SEQUENCE_DENIED);
}

/* TesselEmulator implementation */

static void
spawn_result_cb (VteTerminal *terminal,
                 GPid pid,
                 GError *error,
                 gpointer user_data)
{
  SpawnData *data = (SpawnData*) user_data;

  /* terminal is nullptr if it was destroyed while spawning */
  data->callback (terminal ? TESSEL_EMULATOR (terminal) : nullptr,
                  pid, error, data->user_data);

  g_free (data);
}

static void
tessel_vte_spawn_async (TesselEmulator *emulator,
                        const char *working_directory,
                        char **argv,
                        char **envv,
                        GSpawnFlags spawn_flags,
                        GCancellable *cancellable,
                        TesselEmulatorSpawnCallback callback,
                        gpointer user_data)
{
  SpawnData *data = g_new0 (SpawnData, 1);
  data->callback = callback;
  data->user_data = user_data;

  vte_terminal_spawn_async (VTE_TERMINAL (emulator),
                            VTE_PTY_DEFAULT,
                            working_directory,
                            argv,
                            envv,
                            spawn_flags,
                            nullptr, nullptr, nullptr, /* child setup, data, destroy */
                            -1,
                            cancellable,
                            spawn_result_cb,
                            data);
}

static void
tessel_vte_feed (TesselEmulator *emulator,
                 const char *data,
                 gssize length)
{
  vte_terminal_feed (VTE_TERMINAL (emulator), data, length);
}

static void
tessel_vte_feed_child (TesselEmulator *emulator,
                       const char *text,
                       gssize length)
{
  vte_terminal_feed_child (VTE_TERMINAL (emulator), text, length);
}

static void
tessel_vte_paste_text (TesselEmulator *emulator,
                       const char *text)
{
  vte_terminal_paste_text (VTE_TERMINAL (emulator), text);
}

static void
tessel_vte_set_colors (TesselEmulator *emulator,
                       const GdkRGBA *foreground,
                       const GdkRGBA *background,
                       const GdkRGBA *palette,
                       gsize palette_size)
{
  vte_terminal_set_colors (VTE_TERMINAL (emulator), foreground, background,
                           palette, palette_size);
}

static void
tessel_vte_set_font (TesselEmulator *emulator,
                     const PangoFontDescription *font_desc)
{
  vte_terminal_set_font (VTE_TERMINAL (emulator), font_desc);
}

static void
tessel_vte_set_audible_bell (TesselEmulator *emulator,
                             gboolean setting)
{
  vte_terminal_set_audible_bell (VTE_TERMINAL (emulator), setting);
}

static void
tessel_vte_set_bold_is_bright (TesselEmulator *emulator,
                               gboolean setting)
{
  vte_terminal_set_bold_is_bright (VTE_TERMINAL (emulator), setting);
}

static void
tessel_vte_set_rewrap_on_resize (TesselEmulator *emulator,
                                 gboolean setting)
{
  vte_terminal_set_rewrap_on_resize (VTE_TERMINAL (emulator), setting);
}

static void
tessel_vte_set_cursor_shape (TesselEmulator *emulator,
                             int shape)
{
  vte_terminal_set_cursor_shape (VTE_TERMINAL (emulator), VteCursorShape (shape));
}

static void
tessel_vte_set_cursor_blink_mode (TesselEmulator *emulator,
                                  int mode)
{
  vte_terminal_set_cursor_blink_mode (VTE_TERMINAL (emulator), VteCursorBlinkMode (mode));
}

static void
tessel_vte_set_scrollback_lines (TesselEmulator *emulator,
                                 glong lines)
{
  vte_terminal_set_scrollback_lines (VTE_TERMINAL (emulator), lines);
}

static void
tessel_vte_set_scroll_on_output (TesselEmulator *emulator,
                                 gboolean setting)
{
  vte_terminal_set_scroll_on_output (VTE_TERMINAL (emulator), setting);
}

static void
tessel_vte_set_scroll_on_keystroke (TesselEmulator *emulator,
                                    gboolean setting)
{
  vte_terminal_set_scroll_on_keystroke (VTE_TERMINAL (emulator), setting);
}

static void
tessel_vte_set_backspace_binding (TesselEmulator *emulator,
                                  int binding)
{
  vte_terminal_set_backspace_binding (VTE_TERMINAL (emulator), VteEraseBinding (binding));
}

static void
tessel_vte_set_delete_binding (TesselEmulator *emulator,
                               int binding)
{
  vte_terminal_set_delete_binding (VTE_TERMINAL (emulator), VteEraseBinding (binding));
}

static gboolean
tessel_vte_set_encoding (TesselEmulator *emulator,
                         const char *charset,
                         GError **error)
{
  return vte_terminal_set_encoding (VTE_TERMINAL (emulator), charset, error);
}

static void
tessel_vte_set_cjk_ambiguous_width (TesselEmulator *emulator,
                                    int width)
{
  vte_terminal_set_cjk_ambiguous_width (VTE_TERMINAL (emulator), width);
}

static void
tessel_vte_set_input_enabled (TesselEmulator *emulator,
                              gboolean enabled)
{
  vte_terminal_set_input_enabled (VTE_TERMINAL (emulator), enabled);
}

static void
tessel_vte_set_size (TesselEmulator *emulator,
                     glong columns,
                     glong rows)
{
  vte_terminal_set_size (VTE_TERMINAL (emulator), columns, rows);
}

static const char *
tessel_vte_get_window_title (TesselEmulator *emulator)
{
  return vte_terminal_get_window_title (VTE_TERMINAL (emulator));
}

static const char *
tessel_vte_get_icon_title (TesselEmulator *emulator)
{
  /* VTE no longer tracks a separate icon title */
  return nullptr;
}

static const char *
tessel_vte_get_current_directory_uri (TesselEmulator *emulator)
{
  return vte_terminal_get_current_directory_uri (VTE_TERMINAL (emulator));
}

static gboolean
tessel_vte_has_foreground_process (TesselEmulator *emulator,
                                   GPid pid)
{
  VtePty *pty = vte_terminal_get_pty (VTE_TERMINAL (emulator));
  if (pty == nullptr)
    return FALSE;

  int fd = vte_pty_get_fd (pty);
  if (fd == -1)
    return FALSE;

  int fgpid = tcgetpgrp (fd);
  if (fgpid == -1 || fgpid == pid)
    return FALSE;

  return TRUE;
}

static void
tessel_vte_grab_focus (TesselEmulator *emulator)
{
  gtk_widget_grab_focus (GTK_WIDGET (emulator));
}

static void
tessel_vte_emulator_iface_init (TesselEmulatorInterface *iface)
{
  iface->spawn_async = tessel_vte_spawn_async;
  iface->feed = tessel_vte_feed;
  iface->feed_child = tessel_vte_feed_child;
  iface->paste_text = tessel_vte_paste_text;
  iface->set_colors = tessel_vte_set_colors;
  iface->set_font = tessel_vte_set_font;
  iface->set_audible_bell = tessel_vte_set_audible_bell;
  iface->set_bold_is_bright = tessel_vte_set_bold_is_bright;
  iface->set_rewrap_on_resize = tessel_vte_set_rewrap_on_resize;
  iface->set_cursor_shape = tessel_vte_set_cursor_shape;
  iface->set_cursor_blink_mode = tessel_vte_set_cursor_blink_mode;
  iface->set_scrollback_lines = tessel_vte_set_scrollback_lines;
  iface->set_scroll_on_output = tessel_vte_set_scroll_on_output;
  iface->set_scroll_on_keystroke = tessel_vte_set_scroll_on_keystroke;
  iface->set_backspace_binding = tessel_vte_set_backspace_binding;
  iface->set_delete_binding = tessel_vte_set_delete_binding;
  iface->set_encoding = tessel_vte_set_encoding;
  iface->set_cjk_ambiguous_width = tessel_vte_set_cjk_ambiguous_width;
  iface->set_input_enabled = tessel_vte_set_input_enabled;
  iface->set_size = tessel_vte_set_size;
  iface->get_window_title = tessel_vte_get_window_title;
  iface->get_icon_title = tessel_vte_get_icon_title;
  iface->get_current_directory_uri = tessel_vte_get_current_directory_uri;
  iface->has_foreground_process = tessel_vte_has_foreground_process;
  iface->grab_focus = tessel_vte_grab_focus;
}

/* Class implementation */

static void
tessel_vte_init (TesselVte *vte)
{
  VteTerminal *terminal = VTE_TERMINAL (vte);

  gtk_widget_set_hexpand (GTK_WIDGET (vte), TRUE);
  gtk_widget_set_vexpand (GTK_WIDGET (vte), TRUE);

  vte_terminal_set_mouse_autohide (terminal, TRUE);
  vte_terminal_set_allow_hyperlink (terminal, TRUE);
  vte_terminal_set_scroll_unit_is_pixels (terminal, TRUE);
  vte_terminal_set_enable_fallback_scrolling (terminal, FALSE);

  for (guint i = 0; i < n_url_regexes; ++i) {
    if (url_regexes[i] == nullptr)
      continue;

    TagData *tag_data = g_slice_new (TagData);
    tag_data->flavor = url_regex_flavors[i];
    tag_data->tag = vte_terminal_match_add_regex (terminal, url_regexes[i], 0);
    vte_terminal_match_set_cursor_name (terminal, tag_data->tag, URL_MATCH_CURSOR_NAME);

    vte->match_tags = g_slist_prepend (vte->match_tags, tag_data);
  }

  GtkGesture *click = gtk_gesture_click_new ();
  gtk_gesture_single_set_button (GTK_GESTURE_SINGLE (click), 0);
  gtk_event_controller_set_propagation_phase (GTK_EVENT_CONTROLLER (click), GTK_PHASE_CAPTURE);
  g_signal_connect (click, "pressed", G_CALLBACK (tessel_vte_click_pressed_cb), vte);
  gtk_widget_add_controller (GTK_WIDGET (vte), GTK_EVENT_CONTROLLER (click));

  g_signal_connect (vte, "window-title-changed",
                    G_CALLBACK (tessel_vte_window_title_changed_cb), vte);
  g_signal_connect (vte, "current-directory-uri-changed",
                    G_CALLBACK (tessel_vte_current_directory_uri_changed_cb), vte);
  g_signal_connect (vte, "termprop-changed::" VTE_TERMPROP_SHELL_POSTEXEC,
                    G_CALLBACK (tessel_vte_shell_postexec_cb), vte);
}

static void
tessel_vte_finalize (GObject *object)
{
  TesselVte *vte = TESSEL_VTE (object);

  g_slist_free_full (vte->match_tags, (GDestroyNotify) free_tag_data);

  G_OBJECT_CLASS (tessel_vte_parent_class)->finalize (object);
}

static void
tessel_vte_class_init (TesselVteClass *klass)
{
  GObjectClass *object_class = G_OBJECT_CLASS (klass);
  VteTerminalClass *terminal_class = VTE_TERMINAL_CLASS (klass);

  object_class->finalize = tessel_vte_finalize;

  terminal_class->child_exited = tessel_vte_child_exited;

  signals[SHOW_POPUP_MENU] =
    g_signal_new (I_("show-popup-menu"),
                  G_OBJECT_CLASS_TYPE (object_class),
                  G_SIGNAL_RUN_LAST,
                  0,
                  nullptr, nullptr,
                  nullptr,
                  G_TYPE_NONE,
                  2, G_TYPE_DOUBLE, G_TYPE_DOUBLE);

  n_url_regexes = G_N_ELEMENTS (url_regex_patterns);
  precompile_regexes (url_regex_patterns, n_url_regexes, &url_regexes, &url_regex_flavors);
}

TesselVte *
tessel_vte_new (void)
{
  return reinterpret_cast<TesselVte*>(g_object_new (TESSEL_TYPE_VTE, nullptr));
}
