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

#include <string.h>

#include <glib/gi18n.h>
#include <uuid.h>

#include "tessel-debug.hh"
#include "tessel-defines.hh"
#include "tessel-encoding.hh"
#include "tessel-exit-status.hh"
#include "tessel-intl.hh"
#include "tessel-keys.hh"
#include "tessel-pane.hh"
#include "tessel-paste.hh"
#include "tessel-preferences.hh"
#include "tessel-quadrant.hh"
#include "tessel-schemas.hh"
#include "tessel-title.hh"
#include "tessel-util.hh"

#define PALETTE_SIZE (16)

struct _TesselPanePrivate
{
  TesselContext *context;
  TesselEmulator *emulator;

  char *uuid;
  int id;

  char *profile_uuid;
  GSettings *profile;
  gulong profile_changed_id;

  char *title;
  char *override_title;

  gboolean synchronize_input;
  gboolean read_only;
  gboolean scrollbar_visible;
  gboolean initialized;
  gboolean focused;
  gboolean registered;

  gboolean drag_active;
  TesselDragQuadrant drag_quadrant;

  gboolean unsafe_paste_ignored;

  char *initial_working_directory;
  gboolean spawned;
  GPid child_pid;
  GCancellable *spawn_cancellable;

  GdkRGBA foreground;
  GdkRGBA background;
  GdkRGBA palette[PALETTE_SIZE];
};

enum
{
  PROP_0,
  PROP_CONTEXT,
  PROP_EMULATOR,
  PROP_UUID,
  PROP_ID,
  PROP_PROFILE_UUID,
  PROP_TITLE,
  PROP_OVERRIDE_TITLE,
  PROP_SYNCHRONIZE_INPUT,
  PROP_READ_ONLY,
  PROP_SCROLLBAR_VISIBLE,
  PROP_INITIALIZED,
  PROP_FOCUSED,
  N_PROPS
};

enum
{
  FOCUS_IN,
  CLOSE_REQUEST,
  SPLIT_REQUEST,
  MOVE_REQUEST,
  DETACH_VETO,
  DETACH_REQUEST,
  KEY_PRESS_SYNC,
  PROCESS_NOTIFICATION,
  UNSAFE_PASTE_REQUESTED,
  EXIT_HELD,
  LAST_SIGNAL
};

static guint signals[LAST_SIGNAL];
static GParamSpec *pspecs[N_PROPS];

/* Tango */
static const char *default_foreground = "#D3D7CF";
static const char *default_background = "#2E3436";
static const char *default_palette[PALETTE_SIZE] = {
  "#2E3436", "#CC0000", "#4E9A06", "#C4A000",
  "#3465A4", "#75507B", "#06989A", "#D3D7CF",
  "#555753", "#EF2929", "#8AE234", "#FCE94F",
  "#729FCF", "#AD7FA8", "#34E2E2", "#EEEEEC",
};

G_DEFINE_TYPE_WITH_PRIVATE (TesselPane, tessel_pane, G_TYPE_OBJECT)

/* Preference handlers */

static void
apply_audible_bell (TesselPane *pane)
{
  TesselPanePrivate *priv = pane->priv;

  tessel_emulator_set_audible_bell (priv->emulator,
                                    g_settings_get_boolean (priv->profile, TESSEL_PROFILE_AUDIBLE_BELL_KEY));
}

static void
apply_bold_is_bright (TesselPane *pane)
{
  TesselPanePrivate *priv = pane->priv;

  tessel_emulator_set_bold_is_bright (priv->emulator,
                                      g_settings_get_boolean (priv->profile, TESSEL_PROFILE_BOLD_IS_BRIGHT_KEY));
}

static void
apply_rewrap_on_resize (TesselPane *pane)
{
  TesselPanePrivate *priv = pane->priv;

  tessel_emulator_set_rewrap_on_resize (priv->emulator,
                                        g_settings_get_boolean (priv->profile, TESSEL_PROFILE_REWRAP_ON_RESIZE_KEY));
}

static void
apply_cursor_shape (TesselPane *pane)
{
  TesselPanePrivate *priv = pane->priv;

  tessel_emulator_set_cursor_shape (priv->emulator,
                                    g_settings_get_enum (priv->profile, TESSEL_PROFILE_CURSOR_SHAPE_KEY));
}

static void
apply_colors (TesselPane *pane)
{
  TesselPanePrivate *priv = pane->priv;
  GSettings *profile = priv->profile;

  /* Entries that don't parse keep their previous value */
  tessel_g_settings_get_rgba (profile, TESSEL_PROFILE_FOREGROUND_COLOR_KEY, &priv->foreground);
  tessel_g_settings_get_rgba (profile, TESSEL_PROFILE_BACKGROUND_COLOR_KEY, &priv->background);
  tessel_g_settings_update_rgba_palette (profile, TESSEL_PROFILE_PALETTE_KEY,
                                         priv->palette, PALETTE_SIZE);

  int transparency = g_settings_get_int (profile, TESSEL_PROFILE_BACKGROUND_TRANSPARENCY_KEY);
  priv->background.alpha = (100 - CLAMP (transparency, 0, 100)) / 100.0;

  if (g_settings_get_boolean (profile, TESSEL_PROFILE_USE_THEME_COLORS_KEY))
    tessel_emulator_set_colors (priv->emulator, nullptr, nullptr,
                                priv->palette, PALETTE_SIZE);
  else
    tessel_emulator_set_colors (priv->emulator, &priv->foreground, &priv->background,
                                priv->palette, PALETTE_SIZE);
}

static void
apply_show_scrollbar (TesselPane *pane)
{
  TesselPanePrivate *priv = pane->priv;
  gboolean visible = g_settings_get_boolean (priv->profile, TESSEL_PROFILE_SHOW_SCROLLBAR_KEY);

  if (visible == priv->scrollbar_visible)
    return;

  priv->scrollbar_visible = visible;
  g_object_notify_by_pspec (G_OBJECT (pane), pspecs[PROP_SCROLLBAR_VISIBLE]);
}

static void
apply_scroll_on_output (TesselPane *pane)
{
  TesselPanePrivate *priv = pane->priv;

  tessel_emulator_set_scroll_on_output (priv->emulator,
                                        g_settings_get_boolean (priv->profile, TESSEL_PROFILE_SCROLL_ON_OUTPUT_KEY));
}

static void
apply_scroll_on_keystroke (TesselPane *pane)
{
  TesselPanePrivate *priv = pane->priv;

  tessel_emulator_set_scroll_on_keystroke (priv->emulator,
                                           g_settings_get_boolean (priv->profile, TESSEL_PROFILE_SCROLL_ON_KEYSTROKE_KEY));
}

static void
apply_scrollback (TesselPane *pane)
{
  TesselPanePrivate *priv = pane->priv;

  glong lines = g_settings_get_boolean (priv->profile, TESSEL_PROFILE_SCROLLBACK_UNLIMITED_KEY) ?
                -1 : g_settings_get_int (priv->profile, TESSEL_PROFILE_SCROLLBACK_LINES_KEY);
  tessel_emulator_set_scrollback_lines (priv->emulator, lines);
}

static void
apply_backspace_binding (TesselPane *pane)
{
  TesselPanePrivate *priv = pane->priv;

  tessel_emulator_set_backspace_binding (priv->emulator,
                                         g_settings_get_enum (priv->profile, TESSEL_PROFILE_BACKSPACE_BINDING_KEY));
}

static void
apply_delete_binding (TesselPane *pane)
{
  TesselPanePrivate *priv = pane->priv;

  tessel_emulator_set_delete_binding (priv->emulator,
                                      g_settings_get_enum (priv->profile, TESSEL_PROFILE_DELETE_BINDING_KEY));
}

static void
apply_encoding (TesselPane *pane)
{
  TesselPanePrivate *priv = pane->priv;
  g_autofree char *charset = g_settings_get_string (priv->profile, TESSEL_PROFILE_ENCODING_KEY);
  g_autoptr(GError) error = nullptr;

  if (!tessel_emulator_set_encoding (priv->emulator, charset, &error))
    g_warning ("Failed to set encoding %s: %s", charset, error ? error->message : "unknown error");
}

static void
apply_cjk_width (TesselPane *pane)
{
  TesselPanePrivate *priv = pane->priv;

  tessel_emulator_set_cjk_ambiguous_width (priv->emulator,
                                           g_settings_get_enum (priv->profile, TESSEL_PROFILE_CJK_UTF8_AMBIGUOUS_WIDTH_KEY));
}

static void
apply_cursor_blink_mode (TesselPane *pane)
{
  TesselPanePrivate *priv = pane->priv;

  tessel_emulator_set_cursor_blink_mode (priv->emulator,
                                         g_settings_get_enum (priv->profile, TESSEL_PROFILE_CURSOR_BLINK_MODE_KEY));
}

static void
apply_title (TesselPane *pane)
{
  tessel_pane_update_title (pane);
}

static void
apply_font (TesselPane *pane)
{
  TesselPanePrivate *priv = pane->priv;
  PangoFontDescription *desc;

  if (g_settings_get_boolean (priv->profile, TESSEL_PROFILE_USE_SYSTEM_FONT_KEY))
    {
      desc = tessel_context_get_system_font (priv->context);
    }
  else
    {
      g_autofree char *font = g_settings_get_string (priv->profile, TESSEL_PROFILE_FONT_KEY);
      desc = pango_font_description_from_string (font);
    }

  /* Sanity check */
  if (pango_font_description_get_size (desc) == 0) {
    if (pango_font_description_get_size_is_absolute (desc))
      pango_font_description_set_absolute_size (desc, TESSEL_DEFAULT_FONT_SIZE * PANGO_SCALE);
    else
      pango_font_description_set_size (desc, TESSEL_DEFAULT_FONT_SIZE * PANGO_SCALE);
  }

  tessel_emulator_set_font (priv->emulator, desc);

  pango_font_description_free (desc);
}

typedef void (* PreferenceHandler) (TesselPane *pane);

static const PreferenceHandler preference_handlers[] = {
  apply_audible_bell,        /* TESSEL_PREFERENCE_AUDIBLE_BELL */
  apply_bold_is_bright,      /* TESSEL_PREFERENCE_BOLD_IS_BRIGHT */
  apply_rewrap_on_resize,    /* TESSEL_PREFERENCE_REWRAP_ON_RESIZE */
  apply_cursor_shape,        /* TESSEL_PREFERENCE_CURSOR_SHAPE */
  apply_colors,              /* TESSEL_PREFERENCE_COLORS */
  apply_show_scrollbar,      /* TESSEL_PREFERENCE_SHOW_SCROLLBAR */
  apply_scroll_on_output,    /* TESSEL_PREFERENCE_SCROLL_ON_OUTPUT */
  apply_scroll_on_keystroke, /* TESSEL_PREFERENCE_SCROLL_ON_KEYSTROKE */
  apply_scrollback,          /* TESSEL_PREFERENCE_SCROLLBACK */
  apply_backspace_binding,   /* TESSEL_PREFERENCE_BACKSPACE_BINDING */
  apply_delete_binding,      /* TESSEL_PREFERENCE_DELETE_BINDING */
  apply_encoding,            /* TESSEL_PREFERENCE_ENCODING */
  apply_cjk_width,           /* TESSEL_PREFERENCE_CJK_WIDTH */
  apply_cursor_blink_mode,   /* TESSEL_PREFERENCE_CURSOR_BLINK_MODE */
  apply_title,               /* TESSEL_PREFERENCE_TITLE */
  apply_font,                /* TESSEL_PREFERENCE_FONT */
};

G_STATIC_ASSERT (G_N_ELEMENTS (preference_handlers) == TESSEL_PREFERENCE_LAST);

static void
tessel_pane_profile_changed_cb (GSettings  *profile,
                                const char *key,
                                TesselPane *pane)
{
  tessel_pane_apply_preference (pane, key);
}

static void
tessel_pane_system_font_changed_cb (GSettings  *settings,
                                    const char *key,
                                    TesselPane *pane)
{
  TesselPanePrivate *priv = pane->priv;

  if (priv->profile == nullptr ||
      !g_settings_get_boolean (priv->profile, TESSEL_PROFILE_USE_SYSTEM_FONT_KEY))
    return;

  apply_font (pane);
}

/* Emulator notifications */

static void
tessel_pane_set_initialized (TesselPane *pane)
{
  TesselPanePrivate *priv = pane->priv;

  if (priv->initialized)
    return;

  priv->initialized = TRUE;
  g_object_notify_by_pspec (G_OBJECT (pane), pspecs[PROP_INITIALIZED]);
}

static void
emulator_title_updated_cb (TesselEmulator *emulator,
                                  TesselPane *pane)
{
  tessel_pane_set_initialized (pane);
  tessel_pane_update_title (pane);
}

static void
emulator_icon_title_updated_cb (TesselEmulator *emulator,
                                TesselPane *pane)
{
  tessel_pane_update_title (pane);
}

static void
emulator_directory_updated_cb (TesselEmulator *emulator,
                                       TesselPane *pane)
{
  tessel_pane_set_initialized (pane);
  tessel_pane_update_title (pane);
}

static void
emulator_process_exited_cb (TesselEmulator *emulator,
                          int status,
                          TesselPane *pane)
{
  TesselPanePrivate *priv = pane->priv;

  _tessel_debug_print (TESSEL_DEBUG_PROCESSES,
                       "[pane %s] child process %d exited with status %d\n",
                       priv->uuid, priv->child_pid, status);

  /* No child, or it has been disowned */
  if (priv->child_pid == -1)
    return;

  priv->child_pid = -1;

  auto const action = TesselExitAction (g_settings_get_enum (priv->profile, TESSEL_PROFILE_EXIT_ACTION_KEY));

  switch (action) {
  case TESSEL_EXIT_RESTART:
    tessel_pane_relaunch (pane);
    break;
  case TESSEL_EXIT_CLOSE:
    g_signal_emit (pane, signals[CLOSE_REQUEST], 0);
    break;
  case TESSEL_EXIT_HOLD: {
    g_autofree char *message = tessel_exit_status_describe (status);
    g_signal_emit (pane, signals[EXIT_HELD], 0, message);
    break;
  }
  case TESSEL_EXIT_NONE:
  default:
    break;
  }
}

static void
emulator_shell_notification_cb (TesselEmulator *emulator,
                                   const char *summary,
                                   const char *body,
                                   TesselPane *pane)
{
  TesselPanePrivate *priv = pane->priv;

  _tessel_debug_print (TESSEL_DEBUG_PROCESSES,
                       "[pane %s] notification \"%s\" \"%s\" (initialized %d focused %d)\n",
                       priv->uuid, summary, body, priv->initialized, priv->focused);

  if (!priv->initialized || priv->focused)
    return;

  g_signal_emit (pane, signals[PROCESS_NOTIFICATION], 0, summary, body);
}

/* Class implementation */

static void
tessel_pane_init (TesselPane *pane)
{
  TesselPanePrivate *priv;
  uuid_t u;
  char uuidstr[37];

  priv = pane->priv = (TesselPanePrivate*)tessel_pane_get_instance_private (pane);

  uuid_generate (u);
  uuid_unparse (u, uuidstr);
  priv->uuid = g_strdup (uuidstr);

  priv->child_pid = -1;
  priv->scrollbar_visible = TRUE;
  priv->drag_quadrant = TESSEL_DRAG_QUADRANT_LEFT;
  priv->title = g_strdup ("");

  gdk_rgba_parse (&priv->foreground, default_foreground);
  gdk_rgba_parse (&priv->background, default_background);
  for (guint i = 0; i < PALETTE_SIZE; ++i)
    gdk_rgba_parse (&priv->palette[i], default_palette[i]);
}

static void
tessel_pane_constructed (GObject *object)
{
  TesselPane *pane = TESSEL_PANE (object);
  TesselPanePrivate *priv = pane->priv;

  G_OBJECT_CLASS (tessel_pane_parent_class)->constructed (object);

  g_assert (priv->context != nullptr);
  g_assert (priv->emulator != nullptr);

  tessel_context_register_pane (priv->context, pane);
  priv->registered = TRUE;

  g_signal_connect (priv->emulator, "title-updated",
                    G_CALLBACK (emulator_title_updated_cb), pane);
  g_signal_connect (priv->emulator, "icon-title-updated",
                    G_CALLBACK (emulator_icon_title_updated_cb), pane);
  g_signal_connect (priv->emulator, "directory-updated",
                    G_CALLBACK (emulator_directory_updated_cb), pane);
  g_signal_connect (priv->emulator, "process-exited",
                    G_CALLBACK (emulator_process_exited_cb), pane);
  g_signal_connect (priv->emulator, "shell-notification",
                    G_CALLBACK (emulator_shell_notification_cb), pane);

  GSettings *desktop_settings = tessel_context_get_desktop_interface_settings (priv->context);
  if (desktop_settings != nullptr)
    g_signal_connect (desktop_settings, "changed::" MONOSPACE_FONT_KEY_NAME,
                      G_CALLBACK (tessel_pane_system_font_changed_cb), pane);
}

static void
tessel_pane_dispose (GObject *object)
{
  TesselPane *pane = TESSEL_PANE (object);
  TesselPanePrivate *priv = pane->priv;

  /* Unset child PID so that when an eventual process-exited signal arrives,
   * we don't emit "close-request".
   */
  priv->child_pid = -1;

  if (priv->spawn_cancellable != nullptr) {
    g_cancellable_cancel (priv->spawn_cancellable);
    g_clear_object (&priv->spawn_cancellable);
  }

  if (priv->emulator != nullptr) {
    g_signal_handlers_disconnect_by_data (priv->emulator, pane);
    g_clear_object (&priv->emulator);
  }

  if (priv->profile_changed_id != 0) {
    g_signal_handler_disconnect (priv->profile, priv->profile_changed_id);
    priv->profile_changed_id = 0;
  }
  g_clear_object (&priv->profile);

  if (priv->context != nullptr) {
    GSettings *desktop_settings = tessel_context_get_desktop_interface_settings (priv->context);
    if (desktop_settings != nullptr)
      g_signal_handlers_disconnect_by_func (desktop_settings,
                                            (void*)tessel_pane_system_font_changed_cb,
                                            pane);

    if (priv->registered) {
      tessel_context_unregister_pane (priv->context, pane);
      priv->registered = FALSE;
    }

    g_clear_object (&priv->context);
  }

  G_OBJECT_CLASS (tessel_pane_parent_class)->dispose (object);
}

static void
tessel_pane_finalize (GObject *object)
{
  TesselPane *pane = TESSEL_PANE (object);
  TesselPanePrivate *priv = pane->priv;

  g_free (priv->uuid);
  g_free (priv->profile_uuid);
  g_free (priv->title);
  g_free (priv->override_title);
  g_free (priv->initial_working_directory);

  G_OBJECT_CLASS (tessel_pane_parent_class)->finalize (object);
}

static void
tessel_pane_get_property (GObject *object,
                          guint prop_id,
                          GValue *value,
                          GParamSpec *pspec)
{
  TesselPane *pane = TESSEL_PANE (object);
  TesselPanePrivate *priv = pane->priv;

  switch (prop_id)
    {
      case PROP_CONTEXT:
        g_value_set_object (value, priv->context);
        break;
      case PROP_EMULATOR:
        g_value_set_object (value, priv->emulator);
        break;
      case PROP_UUID:
        g_value_set_string (value, priv->uuid);
        break;
      case PROP_ID:
        g_value_set_int (value, priv->id);
        break;
      case PROP_PROFILE_UUID:
        g_value_set_string (value, priv->profile_uuid);
        break;
      case PROP_TITLE:
        g_value_set_string (value, priv->title);
        break;
      case PROP_OVERRIDE_TITLE:
        g_value_set_string (value, priv->override_title);
        break;
      case PROP_SYNCHRONIZE_INPUT:
        g_value_set_boolean (value, priv->synchronize_input);
        break;
      case PROP_READ_ONLY:
        g_value_set_boolean (value, priv->read_only);
        break;
      case PROP_SCROLLBAR_VISIBLE:
        g_value_set_boolean (value, priv->scrollbar_visible);
        break;
      case PROP_INITIALIZED:
        g_value_set_boolean (value, priv->initialized);
        break;
      case PROP_FOCUSED:
        g_value_set_boolean (value, priv->focused);
        break;
      default:
        G_OBJECT_WARN_INVALID_PROPERTY_ID (object, prop_id, pspec);
        break;
    }
}

static void
tessel_pane_set_property (GObject *object,
                          guint prop_id,
                          const GValue *value,
                          GParamSpec *pspec)
{
  TesselPane *pane = TESSEL_PANE (object);
  TesselPanePrivate *priv = pane->priv;

  switch (prop_id)
    {
      case PROP_CONTEXT:
        priv->context = (TesselContext*)g_value_dup_object (value);
        break;
      case PROP_EMULATOR:
        priv->emulator = (TesselEmulator*)g_value_dup_object (value);
        break;
      case PROP_ID:
        tessel_pane_set_id (pane, g_value_get_int (value));
        break;
      case PROP_PROFILE_UUID:
        tessel_pane_set_profile_uuid (pane, g_value_get_string (value));
        break;
      case PROP_OVERRIDE_TITLE:
        tessel_pane_set_override_title (pane, g_value_get_string (value));
        break;
      case PROP_SYNCHRONIZE_INPUT:
        tessel_pane_set_synchronize_input (pane, g_value_get_boolean (value));
        break;
      case PROP_READ_ONLY:
        tessel_pane_set_read_only (pane, g_value_get_boolean (value));
        break;
      case PROP_UUID:
      case PROP_TITLE:
      case PROP_SCROLLBAR_VISIBLE:
      case PROP_INITIALIZED:
      case PROP_FOCUSED:
        /* not writable */
      default:
        G_OBJECT_WARN_INVALID_PROPERTY_ID (object, prop_id, pspec);
        break;
    }
}

static void
tessel_pane_class_init (TesselPaneClass *klass)
{
  GObjectClass *object_class = G_OBJECT_CLASS (klass);

  object_class->constructed = tessel_pane_constructed;
  object_class->dispose = tessel_pane_dispose;
  object_class->finalize = tessel_pane_finalize;
  object_class->get_property = tessel_pane_get_property;
  object_class->set_property = tessel_pane_set_property;

  signals[FOCUS_IN] =
    g_signal_new (I_("focus-in"),
                  G_OBJECT_CLASS_TYPE (object_class),
                  G_SIGNAL_RUN_LAST,
                  G_STRUCT_OFFSET (TesselPaneClass, focus_in),
                  nullptr, nullptr,
                  g_cclosure_marshal_VOID__VOID,
                  G_TYPE_NONE,
                  0);

  signals[CLOSE_REQUEST] =
    g_signal_new (I_("close-request"),
                  G_OBJECT_CLASS_TYPE (object_class),
                  G_SIGNAL_RUN_LAST,
                  G_STRUCT_OFFSET (TesselPaneClass, close_request),
                  nullptr, nullptr,
                  g_cclosure_marshal_VOID__VOID,
                  G_TYPE_NONE,
                  0);

  signals[SPLIT_REQUEST] =
    g_signal_new (I_("split-request"),
                  G_OBJECT_CLASS_TYPE (object_class),
                  G_SIGNAL_RUN_LAST,
                  G_STRUCT_OFFSET (TesselPaneClass, split_request),
                  nullptr, nullptr,
                  g_cclosure_marshal_VOID__INT,
                  G_TYPE_NONE,
                  1, G_TYPE_INT);

  signals[MOVE_REQUEST] =
    g_signal_new (I_("move-request"),
                  G_OBJECT_CLASS_TYPE (object_class),
                  G_SIGNAL_RUN_LAST,
                  G_STRUCT_OFFSET (TesselPaneClass, move_request),
                  nullptr, nullptr,
                  nullptr,
                  G_TYPE_NONE,
                  2, G_TYPE_STRING, G_TYPE_INT);

  signals[DETACH_VETO] =
    g_signal_new (I_("detach-veto"),
                  G_OBJECT_CLASS_TYPE (object_class),
                  G_SIGNAL_RUN_LAST,
                  G_STRUCT_OFFSET (TesselPaneClass, detach_veto),
                  g_signal_accumulator_true_handled, nullptr,
                  nullptr,
                  G_TYPE_BOOLEAN,
                  0);

  signals[DETACH_REQUEST] =
    g_signal_new (I_("detach-request"),
                  G_OBJECT_CLASS_TYPE (object_class),
                  G_SIGNAL_RUN_LAST,
                  G_STRUCT_OFFSET (TesselPaneClass, detach_request),
                  nullptr, nullptr,
                  nullptr,
                  G_TYPE_NONE,
                  2, G_TYPE_DOUBLE, G_TYPE_DOUBLE);

  signals[KEY_PRESS_SYNC] =
    g_signal_new (I_("key-press-sync"),
                  G_OBJECT_CLASS_TYPE (object_class),
                  G_SIGNAL_RUN_LAST,
                  G_STRUCT_OFFSET (TesselPaneClass, key_press_sync),
                  nullptr, nullptr,
                  nullptr,
                  G_TYPE_NONE,
                  2, G_TYPE_UINT, G_TYPE_UINT);

  signals[PROCESS_NOTIFICATION] =
    g_signal_new (I_("process-notification"),
                  G_OBJECT_CLASS_TYPE (object_class),
                  G_SIGNAL_RUN_LAST,
                  G_STRUCT_OFFSET (TesselPaneClass, process_notification),
                  nullptr, nullptr,
                  nullptr,
                  G_TYPE_NONE,
                  2, G_TYPE_STRING, G_TYPE_STRING);

  signals[UNSAFE_PASTE_REQUESTED] =
    g_signal_new (I_("unsafe-paste-requested"),
                  G_OBJECT_CLASS_TYPE (object_class),
                  G_SIGNAL_RUN_LAST,
                  G_STRUCT_OFFSET (TesselPaneClass, unsafe_paste_requested),
                  nullptr, nullptr,
                  g_cclosure_marshal_VOID__STRING,
                  G_TYPE_NONE,
                  1, G_TYPE_STRING);

  signals[EXIT_HELD] =
    g_signal_new (I_("exit-held"),
                  G_OBJECT_CLASS_TYPE (object_class),
                  G_SIGNAL_RUN_LAST,
                  G_STRUCT_OFFSET (TesselPaneClass, exit_held),
                  nullptr, nullptr,
                  g_cclosure_marshal_VOID__STRING,
                  G_TYPE_NONE,
                  1, G_TYPE_STRING);

  pspecs[PROP_CONTEXT] =
    g_param_spec_object ("context", nullptr, nullptr,
                         TESSEL_TYPE_CONTEXT,
                         GParamFlags(G_PARAM_READWRITE |
                                     G_PARAM_CONSTRUCT_ONLY |
                                     G_PARAM_STATIC_STRINGS));

  pspecs[PROP_EMULATOR] =
    g_param_spec_object ("emulator", nullptr, nullptr,
                         TESSEL_TYPE_EMULATOR,
                         GParamFlags(G_PARAM_READWRITE |
                                     G_PARAM_CONSTRUCT_ONLY |
                                     G_PARAM_STATIC_STRINGS));

  pspecs[PROP_UUID] =
    g_param_spec_string ("uuid", nullptr, nullptr,
                         nullptr,
                         GParamFlags(G_PARAM_READABLE |
                                     G_PARAM_STATIC_STRINGS));

  pspecs[PROP_ID] =
    g_param_spec_int ("id", nullptr, nullptr,
                      0, G_MAXINT, 0,
                      GParamFlags(G_PARAM_READWRITE |
                                  G_PARAM_STATIC_STRINGS |
                                  G_PARAM_EXPLICIT_NOTIFY));

  pspecs[PROP_PROFILE_UUID] =
    g_param_spec_string ("profile-uuid", nullptr, nullptr,
                         nullptr,
                         GParamFlags(G_PARAM_READWRITE |
                                     G_PARAM_STATIC_STRINGS |
                                     G_PARAM_EXPLICIT_NOTIFY));

  pspecs[PROP_TITLE] =
    g_param_spec_string ("title", nullptr, nullptr,
                         nullptr,
                         GParamFlags(G_PARAM_READABLE |
                                     G_PARAM_STATIC_STRINGS |
                                     G_PARAM_EXPLICIT_NOTIFY));

  pspecs[PROP_OVERRIDE_TITLE] =
    g_param_spec_string ("override-title", nullptr, nullptr,
                         nullptr,
                         GParamFlags(G_PARAM_READWRITE |
                                     G_PARAM_STATIC_STRINGS |
                                     G_PARAM_EXPLICIT_NOTIFY));

  pspecs[PROP_SYNCHRONIZE_INPUT] =
    g_param_spec_boolean ("synchronize-input", nullptr, nullptr,
                          FALSE,
                          GParamFlags(G_PARAM_READWRITE |
                                      G_PARAM_STATIC_STRINGS |
                                      G_PARAM_EXPLICIT_NOTIFY));

  pspecs[PROP_READ_ONLY] =
    g_param_spec_boolean ("read-only", nullptr, nullptr,
                          FALSE,
                          GParamFlags(G_PARAM_READWRITE |
                                      G_PARAM_STATIC_STRINGS |
                                      G_PARAM_EXPLICIT_NOTIFY));

  pspecs[PROP_SCROLLBAR_VISIBLE] =
    g_param_spec_boolean ("scrollbar-visible", nullptr, nullptr,
                          TRUE,
                          GParamFlags(G_PARAM_READABLE |
                                      G_PARAM_STATIC_STRINGS |
                                      G_PARAM_EXPLICIT_NOTIFY));

  pspecs[PROP_INITIALIZED] =
    g_param_spec_boolean ("initialized", nullptr, nullptr,
                          FALSE,
                          GParamFlags(G_PARAM_READABLE |
                                      G_PARAM_STATIC_STRINGS |
                                      G_PARAM_EXPLICIT_NOTIFY));

  pspecs[PROP_FOCUSED] =
    g_param_spec_boolean ("focused", nullptr, nullptr,
                          FALSE,
                          GParamFlags(G_PARAM_READABLE |
                                      G_PARAM_STATIC_STRINGS |
                                      G_PARAM_EXPLICIT_NOTIFY));

  g_object_class_install_properties (object_class, N_PROPS, pspecs);
}

/* Public API */

/**
 * tessel_pane_new:
 * @context: the #TesselContext
 * @emulator: the #TesselEmulator hosting the terminal
 * @profile_uuid: (allow-none): the UUID of the profile, or %nullptr
 *   for the default profile
 *
 * Returns: (transfer full): a new #TesselPane, registered with @context
 */
TesselPane *
tessel_pane_new (TesselContext *context,
                 TesselEmulator *emulator,
                 const char *profile_uuid)
{
  g_return_val_if_fail (TESSEL_IS_CONTEXT (context), nullptr);
  g_return_val_if_fail (TESSEL_IS_EMULATOR (emulator), nullptr);

  TesselPane *pane = (TesselPane*)g_object_new (TESSEL_TYPE_PANE,
                                                "context", context,
                                                "emulator", emulator,
                                                nullptr);

  tessel_pane_set_profile_uuid (pane, profile_uuid);

  return pane;
}

TesselContext *
tessel_pane_get_context (TesselPane *pane)
{
  g_return_val_if_fail (TESSEL_IS_PANE (pane), nullptr);

  return pane->priv->context;
}

TesselEmulator *
tessel_pane_get_emulator (TesselPane *pane)
{
  g_return_val_if_fail (TESSEL_IS_PANE (pane), nullptr);

  return pane->priv->emulator;
}

const char *
tessel_pane_get_uuid (TesselPane *pane)
{
  g_return_val_if_fail (TESSEL_IS_PANE (pane), nullptr);

  return pane->priv->uuid;
}

int
tessel_pane_get_id (TesselPane *pane)
{
  g_return_val_if_fail (TESSEL_IS_PANE (pane), 0);

  return pane->priv->id;
}

void
tessel_pane_set_id (TesselPane *pane,
                    int id)
{
  g_return_if_fail (TESSEL_IS_PANE (pane));

  TesselPanePrivate *priv = pane->priv;
  if (priv->id == id)
    return;

  priv->id = id;
  g_object_notify_by_pspec (G_OBJECT (pane), pspecs[PROP_ID]);

  tessel_pane_update_title (pane);
}

const char *
tessel_pane_get_profile_uuid (TesselPane *pane)
{
  g_return_val_if_fail (TESSEL_IS_PANE (pane), nullptr);

  return pane->priv->profile_uuid;
}

/**
 * tessel_pane_set_profile_uuid:
 * @pane:
 * @profile_uuid: (allow-none): a profile UUID, or %nullptr for the default profile
 *
 * Switches @pane to another profile and applies all of its preferences.
 * An unknown UUID is ignored, unless @pane has no profile yet, in which
 * case the default profile is used.
 */
void
tessel_pane_set_profile_uuid (TesselPane *pane,
                              const char *profile_uuid)
{
  g_return_if_fail (TESSEL_IS_PANE (pane));

  TesselPanePrivate *priv = pane->priv;
  TesselProfilesList *profiles_list = tessel_context_get_profiles_list (priv->context);
  g_autoptr(GError) error = nullptr;

  g_autofree char *uuid = tessel_profiles_list_dup_uuid (profiles_list, profile_uuid, &error);
  if (uuid == nullptr) {
    g_warning ("Failed to set profile: %s", error->message);
    if (priv->profile != nullptr)
      return;

    uuid = tessel_profiles_list_dup_uuid (profiles_list, nullptr, nullptr);
    if (uuid == nullptr)
      return;
  }

  if (priv->profile != nullptr && g_str_equal (uuid, priv->profile_uuid))
    return;

  g_autoptr(GSettings) profile = tessel_profiles_list_ref_child (profiles_list, uuid);
  if (profile == nullptr)
    return;

  _tessel_debug_print (TESSEL_DEBUG_PROFILE,
                       "[pane %s] using profile %s\n", priv->uuid, uuid);

  if (priv->profile_changed_id != 0) {
    g_signal_handler_disconnect (priv->profile, priv->profile_changed_id);
    priv->profile_changed_id = 0;
  }
  g_clear_object (&priv->profile);

  priv->profile = (GSettings*)g_steal_pointer (&profile);
  g_free (priv->profile_uuid);
  priv->profile_uuid = (char*)g_steal_pointer (&uuid);

  priv->profile_changed_id =
    g_signal_connect (priv->profile, "changed",
                      G_CALLBACK (tessel_pane_profile_changed_cb), pane);

  g_object_freeze_notify (G_OBJECT (pane));
  tessel_pane_apply_preferences_all (pane);
  g_object_notify_by_pspec (G_OBJECT (pane), pspecs[PROP_PROFILE_UUID]);
  g_object_thaw_notify (G_OBJECT (pane));
}

/**
 * tessel_pane_get_profile:
 *
 * Returns: (transfer none): the profile #GSettings of @pane
 */
GSettings *
tessel_pane_get_profile (TesselPane *pane)
{
  g_return_val_if_fail (TESSEL_IS_PANE (pane), nullptr);

  return pane->priv->profile;
}

const char *
tessel_pane_get_title (TesselPane *pane)
{
  g_return_val_if_fail (TESSEL_IS_PANE (pane), nullptr);

  return pane->priv->title;
}

const char *
tessel_pane_get_override_title (TesselPane *pane)
{
  g_return_val_if_fail (TESSEL_IS_PANE (pane), nullptr);

  return pane->priv->override_title;
}

/**
 * tessel_pane_set_override_title:
 * @pane:
 * @title: (allow-none): a title template, or %nullptr
 *
 * Uses @title instead of the profile's title template. An empty
 * @title removes the override.
 */
void
tessel_pane_set_override_title (TesselPane *pane,
                                const char *title)
{
  g_return_if_fail (TESSEL_IS_PANE (pane));

  TesselPanePrivate *priv = pane->priv;

  if (tessel_str_empty0 (title))
    title = nullptr;

  if (g_strcmp0 (title, priv->override_title) == 0)
    return;

  g_free (priv->override_title);
  priv->override_title = g_strdup (title);
  g_object_notify_by_pspec (G_OBJECT (pane), pspecs[PROP_OVERRIDE_TITLE]);

  tessel_pane_update_title (pane);
}

gboolean
tessel_pane_get_synchronize_input (TesselPane *pane)
{
  g_return_val_if_fail (TESSEL_IS_PANE (pane), FALSE);

  return pane->priv->synchronize_input;
}

void
tessel_pane_set_synchronize_input (TesselPane *pane,
                                   gboolean setting)
{
  g_return_if_fail (TESSEL_IS_PANE (pane));

  TesselPanePrivate *priv = pane->priv;

  setting = setting != FALSE;
  if (setting == priv->synchronize_input)
    return;

  priv->synchronize_input = setting;
  g_object_notify_by_pspec (G_OBJECT (pane), pspecs[PROP_SYNCHRONIZE_INPUT]);
}

gboolean
tessel_pane_get_read_only (TesselPane *pane)
{
  g_return_val_if_fail (TESSEL_IS_PANE (pane), FALSE);

  return pane->priv->read_only;
}

void
tessel_pane_set_read_only (TesselPane *pane,
                           gboolean setting)
{
  g_return_if_fail (TESSEL_IS_PANE (pane));

  TesselPanePrivate *priv = pane->priv;

  setting = setting != FALSE;
  if (setting == priv->read_only)
    return;

  priv->read_only = setting;
  tessel_emulator_set_input_enabled (priv->emulator, !setting);
  g_object_notify_by_pspec (G_OBJECT (pane), pspecs[PROP_READ_ONLY]);
}

gboolean
tessel_pane_get_scrollbar_visible (TesselPane *pane)
{
  g_return_val_if_fail (TESSEL_IS_PANE (pane), FALSE);

  return pane->priv->scrollbar_visible;
}

gboolean
tessel_pane_get_initialized (TesselPane *pane)
{
  g_return_val_if_fail (TESSEL_IS_PANE (pane), FALSE);

  return pane->priv->initialized;
}

gboolean
tessel_pane_get_focused (TesselPane *pane)
{
  g_return_val_if_fail (TESSEL_IS_PANE (pane), FALSE);

  return pane->priv->focused;
}

/**
 * tessel_pane_apply_preference:
 * @pane: a #TesselPane
 * @key: the name of a profile key
 *
 * Applies the current value of @key in the profile of @pane. Keys
 * that have no effect on a pane are ignored.
 */
void
tessel_pane_apply_preference (TesselPane *pane,
                              const char *key)
{
  g_return_if_fail (TESSEL_IS_PANE (pane));

  TesselPanePrivate *priv = pane->priv;
  TesselPreference preference;

  if (priv->profile == nullptr || priv->emulator == nullptr)
    return;

  if (!tessel_preference_from_key (key, &preference))
    return;

  _tessel_debug_print (TESSEL_DEBUG_PROFILE,
                       "[pane %s] applying %s for key %s\n",
                       priv->uuid, tessel_preference_to_string (preference), key);

  preference_handlers[preference] (pane);
}

void
tessel_pane_apply_preferences_all (TesselPane *pane)
{
  g_return_if_fail (TESSEL_IS_PANE (pane));

  TesselPanePrivate *priv = pane->priv;

  if (priv->profile == nullptr || priv->emulator == nullptr)
    return;

  gsize n_preferences;
  const TesselPreference *order = tessel_preference_get_apply_order (&n_preferences);
  for (gsize i = 0; i < n_preferences; ++i)
    preference_handlers[order[i]] (pane);

  tessel_pane_update_title (pane);
}

/**
 * tessel_pane_get_colors:
 * @pane:
 * @foreground: (out) (allow-none):
 * @background: (out) (allow-none):
 * @palette: (out caller-allocates) (allow-none):
 * @palette_size: the number of entries in @palette
 *
 * Gets the colors last applied to the emulator.
 */
void
tessel_pane_get_colors (TesselPane *pane,
                        GdkRGBA *foreground,
                        GdkRGBA *background,
                        GdkRGBA *palette,
                        gsize palette_size)
{
  g_return_if_fail (TESSEL_IS_PANE (pane));

  TesselPanePrivate *priv = pane->priv;

  if (foreground)
    *foreground = priv->foreground;
  if (background)
    *background = priv->background;
  for (gsize i = 0; palette != nullptr && i < MIN (palette_size, PALETTE_SIZE); ++i)
    palette[i] = priv->palette[i];
}

/**
 * tessel_pane_select_encoding:
 * @pane:
 * @charset: a character set name
 *
 * Stores @charset in the profile of @pane; the profile change then
 * applies it.
 */
void
tessel_pane_select_encoding (TesselPane *pane,
                             const char *charset)
{
  g_return_if_fail (TESSEL_IS_PANE (pane));
  g_return_if_fail (charset != nullptr);

  TesselPanePrivate *priv = pane->priv;

  if (!tessel_encodings_is_known_charset (charset)) {
    g_warning ("Unknown encoding \"%s\"", charset);
    return;
  }

  _tessel_debug_print (TESSEL_DEBUG_ENCODINGS,
                       "[pane %s] selecting encoding %s\n", priv->uuid, charset);

  g_settings_set_string (priv->profile, TESSEL_PROFILE_ENCODING_KEY, charset);
}

/**
 * tessel_pane_dup_current_directory:
 * @pane:
 *
 * Returns: (transfer full) (nullable): the working directory of the
 *   terminal's shell as reported by the terminal, or %nullptr
 */
char *
tessel_pane_dup_current_directory (TesselPane *pane)
{
  g_return_val_if_fail (TESSEL_IS_PANE (pane), nullptr);

  TesselPanePrivate *priv = pane->priv;

  if (!priv->initialized || !priv->spawned || priv->emulator == nullptr)
    return nullptr;

  const char *uri = tessel_emulator_get_current_directory_uri (priv->emulator);
  if (tessel_str_empty0 (uri))
    return nullptr;

  return g_filename_from_uri (uri, nullptr, nullptr);
}

void
tessel_pane_update_title (TesselPane *pane)
{
  g_return_if_fail (TESSEL_IS_PANE (pane));

  TesselPanePrivate *priv = pane->priv;
  g_autofree char *profile_template = nullptr;
  const char *title_template;

  if (priv->emulator == nullptr)
    return;

  if (priv->override_title != nullptr)
    title_template = priv->override_title;
  else if (priv->profile != nullptr)
    title_template = profile_template = g_settings_get_string (priv->profile, TESSEL_PROFILE_TERMINAL_TITLE_KEY);
  else
    title_template = TESSEL_TITLE_PLACEHOLDER_TITLE;

  g_autofree char *directory = tessel_pane_dup_current_directory (pane);

  TesselTitleInfo info;
  info.window_title = tessel_emulator_get_window_title (priv->emulator);
  if (tessel_str_empty0 (info.window_title))
    info.window_title = _(TESSEL_DEFAULT_TITLE);
  info.icon_title = tessel_emulator_get_icon_title (priv->emulator);
  info.id = priv->id;
  info.directory = directory;

  g_autofree char *title = tessel_title_format (title_template, &info);
  if (g_strcmp0 (title, priv->title) == 0)
    return;

  g_free (priv->title);
  priv->title = (char*)g_steal_pointer (&title);
  g_object_notify_by_pspec (G_OBJECT (pane), pspecs[PROP_TITLE]);
}

/* Process lifecycle */

static gboolean
tessel_pane_get_child_command (TesselPane   *pane,
                               const char   *command,
                               GSpawnFlags  *spawn_flags_p,
                               char       ***exec_argv_p,
                               GError      **err)
{
  TesselPanePrivate *priv = pane->priv;
  GSettings *profile = priv->profile;
  char **exec_argv = nullptr;

  *exec_argv_p = nullptr;

  if (command != nullptr)
    {
      if (!g_shell_parse_argv (command, nullptr, &exec_argv, err))
        return FALSE;

      *spawn_flags_p = GSpawnFlags(*spawn_flags_p | G_SPAWN_SEARCH_PATH);
    }
  else if (g_settings_get_boolean (profile, TESSEL_PROFILE_USE_CUSTOM_COMMAND_KEY))
    {
      g_autofree char *exec_argv_str = g_settings_get_string (profile, TESSEL_PROFILE_CUSTOM_COMMAND_KEY);
      if (!g_shell_parse_argv (exec_argv_str, nullptr, &exec_argv, err))
        return FALSE;

      *spawn_flags_p = GSpawnFlags(*spawn_flags_p | G_SPAWN_SEARCH_PATH);
    }
  else
    {
      const char *only_name;
      char *shell;
      int argc = 0;

      shell = tessel_util_dup_user_shell ();

      only_name = strrchr (shell, '/');
      if (only_name != nullptr)
        only_name++;
      else {
        only_name = shell;
        *spawn_flags_p = GSpawnFlags(*spawn_flags_p | G_SPAWN_SEARCH_PATH);
      }

      exec_argv = g_new (char*, 3);

      exec_argv[argc++] = shell;

      if (g_settings_get_boolean (profile, TESSEL_PROFILE_LOGIN_SHELL_KEY))
        exec_argv[argc++] = g_strconcat ("-", only_name, nullptr);
      else
        exec_argv[argc++] = g_strdup (only_name);

      exec_argv[argc++] = nullptr;

      *spawn_flags_p = GSpawnFlags(*spawn_flags_p | G_SPAWN_FILE_AND_ARGV_ZERO);
    }

  *exec_argv_p = exec_argv;

  return TRUE;
}

static char **
tessel_pane_get_child_environment (TesselPane *pane)
{
  TesselPanePrivate *priv = pane->priv;
  char **envv = g_get_environ ();

  /* The terminal sets these itself */
  envv = g_environ_unsetenv (envv, "COLUMNS");
  envv = g_environ_unsetenv (envv, "LINES");

  envv = g_environ_setenv (envv, TESSEL_ENV_TERMINAL_ID, priv->uuid, TRUE);

  return envv;
}

static void
tessel_pane_report_spawn_error (TesselPane *pane,
                                GError *error)
{
  TesselPanePrivate *priv = pane->priv;
  g_autofree char *message = g_strdup_printf (_("Unexpected error occurred: %s"), error->message);

  g_warning ("%s", message);
  tessel_emulator_feed (priv->emulator, message, -1);
}

typedef struct {
  TesselPane *pane;
  GCancellable *cancellable;
} SpawnData;

static void
spawn_data_free (SpawnData *data)
{
  g_object_unref (data->pane);
  g_object_unref (data->cancellable);
  g_free (data);
}

G_DEFINE_AUTOPTR_CLEANUP_FUNC (SpawnData, spawn_data_free)

static void
spawn_result_cb (TesselEmulator *emulator,
                 GPid pid,
                 GError *error,
                 gpointer user_data)
{
  g_autoptr(SpawnData) data = (SpawnData*)user_data;
  TesselPane *pane = data->pane;
  TesselPanePrivate *priv = pane->priv;

  /* Pane was disposed while the spawn operation was in progress; nothing to do. */
  if (priv->emulator == nullptr ||
      g_error_matches (error, G_IO_ERROR, G_IO_ERROR_CANCELLED))
    return;

  /* A newer spawn replaced this one */
  if (data->cancellable != priv->spawn_cancellable) {
    _tessel_debug_print (TESSEL_DEBUG_PROCESSES,
                         "[pane %s] ignoring result of a superseded spawn\n", priv->uuid);
    return;
  }

  g_clear_object (&priv->spawn_cancellable);

  if (error != nullptr) {
    tessel_pane_report_spawn_error (pane, error);
    return;
  }

  _tessel_debug_print (TESSEL_DEBUG_PROCESSES,
                       "[pane %s] child process %d spawned\n", priv->uuid, pid);

  priv->child_pid = pid;
  tessel_emulator_grab_focus (priv->emulator);
}

static void
tessel_pane_spawn_internal (TesselPane *pane,
                            const char *working_directory,
                            const char *command,
                            gboolean first_run)
{
  TesselPanePrivate *priv = pane->priv;
  GSpawnFlags spawn_flags = G_SPAWN_DEFAULT;
  g_auto(GStrv) exec_argv = nullptr;
  g_autoptr(GError) error = nullptr;

  if (!tessel_pane_get_child_command (pane, command, &spawn_flags, &exec_argv, &error)) {
    tessel_pane_report_spawn_error (pane, error);
    return;
  }

  g_auto(GStrv) envv = tessel_pane_get_child_environment (pane);

  _TESSEL_DEBUG_IF (TESSEL_DEBUG_PROCESSES) {
    g_autofree char *argv_str = g_strjoinv (" ", exec_argv);
    _tessel_debug_print (TESSEL_DEBUG_PROCESSES,
                         "[pane %s] now launching the child process: %s in %s\n",
                         priv->uuid, argv_str, working_directory ? working_directory : "(cwd)");
  }

  if (first_run)
    tessel_emulator_set_size (priv->emulator,
                              g_settings_get_int (priv->profile, TESSEL_PROFILE_DEFAULT_SIZE_COLUMNS_KEY),
                              g_settings_get_int (priv->profile, TESSEL_PROFILE_DEFAULT_SIZE_ROWS_KEY));

  if (priv->spawn_cancellable != nullptr) {
    g_cancellable_cancel (priv->spawn_cancellable);
    g_object_unref (priv->spawn_cancellable);
  }
  priv->spawn_cancellable = g_cancellable_new ();

  priv->spawned = TRUE;

  auto const data = g_new0 (SpawnData, 1);
  data->pane = (TesselPane*)g_object_ref (pane);
  data->cancellable = (GCancellable*)g_object_ref (priv->spawn_cancellable);

  tessel_emulator_spawn_async (priv->emulator,
                               working_directory,
                               exec_argv,
                               envv,
                               spawn_flags,
                               priv->spawn_cancellable,
                               spawn_result_cb,
                               data);
}

/**
 * tessel_pane_spawn:
 * @pane: a #TesselPane
 * @working_directory: (allow-none): the directory to start the child in
 *
 * Starts the child process of @pane. The first pane to spawn consumes
 * the command line overrides of the context.
 */
void
tessel_pane_spawn (TesselPane *pane,
                   const char *working_directory)
{
  g_return_if_fail (TESSEL_IS_PANE (pane));

  TesselPanePrivate *priv = pane->priv;
  g_autoptr(TesselOverrides) overrides = nullptr;
  const char *command = nullptr;

  gboolean first_run = !priv->spawned;
  if (first_run)
    overrides = tessel_context_take_overrides (priv->context);

  if (overrides != nullptr) {
    if (overrides->profile != nullptr) {
      TesselProfilesList *profiles_list = tessel_context_get_profiles_list (priv->context);
      g_autoptr(GError) error = nullptr;
      g_autofree char *uuid = tessel_profiles_list_dup_uuid_or_name (profiles_list,
                                                                      overrides->profile,
                                                                      &error);
      if (uuid != nullptr)
        tessel_pane_set_profile_uuid (pane, uuid);
      else
        g_warning ("%s", error->message);
    }

    if (overrides->working_directory != nullptr)
      working_directory = overrides->working_directory;

    command = overrides->command;
  }

  g_free (priv->initial_working_directory);
  priv->initial_working_directory = g_strdup (working_directory);

  tessel_pane_spawn_internal (pane, priv->initial_working_directory, command, first_run);
}

/**
 * tessel_pane_relaunch:
 * @pane:
 *
 * Starts a new child process in the initial working directory.
 */
void
tessel_pane_relaunch (TesselPane *pane)
{
  g_return_if_fail (TESSEL_IS_PANE (pane));

  TesselPanePrivate *priv = pane->priv;

  _tessel_debug_print (TESSEL_DEBUG_PROCESSES,
                       "[pane %s] relaunching in %s\n", priv->uuid,
                       priv->initial_working_directory ? priv->initial_working_directory : "(cwd)");

  tessel_pane_spawn_internal (pane, priv->initial_working_directory, nullptr, FALSE);
}

GPid
tessel_pane_get_child_pid (TesselPane *pane)
{
  g_return_val_if_fail (TESSEL_IS_PANE (pane), -1);

  return pane->priv->child_pid;
}

/**
 * tessel_pane_is_process_running:
 * @pane:
 *
 * Returns: %TRUE if a process other than the shell is in the
 *   foreground of the terminal
 */
gboolean
tessel_pane_is_process_running (TesselPane *pane)
{
  g_return_val_if_fail (TESSEL_IS_PANE (pane), FALSE);

  TesselPanePrivate *priv = pane->priv;

  if (priv->child_pid == -1 || priv->emulator == nullptr)
    return FALSE;

  return tessel_emulator_has_foreground_process (priv->emulator, priv->child_pid);
}

/* Clipboard */

static void
tessel_pane_paste_internal (TesselPane *pane,
                            const char *text)
{
  TesselPanePrivate *priv = pane->priv;
  GSettings *settings = tessel_context_get_global_settings (priv->context);

  gboolean strip = g_settings_get_boolean (settings, TESSEL_SETTING_STRIP_FIRST_COMMENT_CHAR_KEY);
  const char *stripped = tessel_paste_strip_comment_char (text, strip);

  if (stripped != text)
    tessel_emulator_feed_child (priv->emulator, stripped, -1);
  else
    tessel_emulator_paste_text (priv->emulator, text);
}

/**
 * tessel_pane_paste_text:
 * @pane:
 * @text: the text to paste
 *
 * Pastes @text into the terminal, unless it looks like a command asking
 * for administrative access; then "unsafe-paste-requested" is emitted and
 * the paste waits for tessel_pane_confirm_unsafe_paste().
 */
void
tessel_pane_paste_text (TesselPane *pane,
                        const char *text)
{
  g_return_if_fail (TESSEL_IS_PANE (pane));

  TesselPanePrivate *priv = pane->priv;

  if (text == nullptr || priv->emulator == nullptr)
    return;

  if (priv->read_only) {
    _tessel_debug_print (TESSEL_DEBUG_CLIPBOARD,
                         "[pane %s] read-only, not pasting\n", priv->uuid);
    return;
  }

  GSettings *settings = tessel_context_get_global_settings (priv->context);
  gboolean alert = g_settings_get_boolean (settings, TESSEL_SETTING_UNSAFE_PASTE_ALERT_KEY);

  if (tessel_paste_guard_decide (text, priv->unsafe_paste_ignored, alert) == TESSEL_PASTE_ACTION_PROMPT) {
    _tessel_debug_print (TESSEL_DEBUG_CLIPBOARD,
                         "[pane %s] unsafe paste, asking for confirmation\n", priv->uuid);
    g_signal_emit (pane, signals[UNSAFE_PASTE_REQUESTED], 0, text);
    return;
  }

  tessel_pane_paste_internal (pane, text);
}

void
tessel_pane_confirm_unsafe_paste (TesselPane *pane,
                                  const char *text,
                                  gboolean accepted)
{
  g_return_if_fail (TESSEL_IS_PANE (pane));

  TesselPanePrivate *priv = pane->priv;

  _tessel_debug_print (TESSEL_DEBUG_CLIPBOARD,
                       "[pane %s] unsafe paste %s\n", priv->uuid,
                       accepted ? "accepted" : "cancelled");

  if (!accepted || text == nullptr || priv->emulator == nullptr)
    return;

  priv->unsafe_paste_ignored = TRUE;
  tessel_pane_paste_internal (pane, text);
}

/**
 * tessel_pane_feed_dropped_text:
 * @pane:
 * @text: quoted paths or plain text dropped on the terminal
 *
 * Sends @text to the child as typed input, without the paste checks.
 */
void
tessel_pane_feed_dropped_text (TesselPane *pane,
                               const char *text)
{
  g_return_if_fail (TESSEL_IS_PANE (pane));

  TesselPanePrivate *priv = pane->priv;

  if (text == nullptr || priv->emulator == nullptr || priv->read_only)
    return;

  _tessel_debug_print (TESSEL_DEBUG_DND,
                       "[pane %s] feeding dropped text\n", priv->uuid);

  tessel_emulator_feed_child (priv->emulator, text, -1);
}

/* Focus and input */

void
tessel_pane_focus_in (TesselPane *pane)
{
  g_return_if_fail (TESSEL_IS_PANE (pane));

  TesselPanePrivate *priv = pane->priv;

  if (!priv->focused) {
    priv->focused = TRUE;
    g_object_notify_by_pspec (G_OBJECT (pane), pspecs[PROP_FOCUSED]);
  }

  g_signal_emit (pane, signals[FOCUS_IN], 0);
}

void
tessel_pane_focus_out (TesselPane *pane)
{
  g_return_if_fail (TESSEL_IS_PANE (pane));

  TesselPanePrivate *priv = pane->priv;

  if (!priv->focused)
    return;

  priv->focused = FALSE;
  g_object_notify_by_pspec (G_OBJECT (pane), pspecs[PROP_FOCUSED]);
}

/**
 * tessel_pane_key_pressed:
 * @pane:
 * @keyval: the key value of the key press
 * @state: the modifier state of the key press
 * @synthetic: whether the key press was synthesized
 *
 * Returns: %TRUE if the key press was forwarded for input synchronization
 */
gboolean
tessel_pane_key_pressed (TesselPane *pane,
                         guint keyval,
                         guint state,
                         gboolean synthetic)
{
  g_return_val_if_fail (TESSEL_IS_PANE (pane), FALSE);

  if (!pane->priv->synchronize_input || synthetic)
    return FALSE;

  g_signal_emit (pane, signals[KEY_PRESS_SYNC], 0, keyval, state);
  return TRUE;
}

void
tessel_pane_echo_key_press (TesselPane *pane,
                            guint keyval,
                            guint state)
{
  g_return_if_fail (TESSEL_IS_PANE (pane));

  TesselPanePrivate *priv = pane->priv;

  if (priv->read_only || priv->emulator == nullptr)
    return;

  gsize length = 0;
  g_autofree char *sequence = tessel_key_to_sequence (keyval, GdkModifierType (state), &length);
  if (sequence == nullptr)
    return;

  tessel_emulator_feed_child (priv->emulator, sequence, length);
}

/* Requests */

void
tessel_pane_request_close (TesselPane *pane)
{
  g_return_if_fail (TESSEL_IS_PANE (pane));

  g_signal_emit (pane, signals[CLOSE_REQUEST], 0);
}

void
tessel_pane_request_split (TesselPane *pane,
                           TesselOrientation orientation)
{
  g_return_if_fail (TESSEL_IS_PANE (pane));

  g_signal_emit (pane, signals[SPLIT_REQUEST], 0, orientation);
}

/**
 * tessel_pane_request_detach:
 * @pane:
 * @x: the pointer position, relative to the surface under the pointer
 * @y:
 *
 * Asks the session to move @pane into a new window, unless a
 * "detach-veto" handler refuses.
 *
 * Returns: %TRUE if "detach-request" was emitted
 */
gboolean
tessel_pane_request_detach (TesselPane *pane,
                            double x,
                            double y)
{
  g_return_val_if_fail (TESSEL_IS_PANE (pane), FALSE);

  gboolean vetoed = FALSE;
  g_signal_emit (pane, signals[DETACH_VETO], 0, &vetoed);
  if (vetoed) {
    _tessel_debug_print (TESSEL_DEBUG_DND,
                         "[pane %s] detach vetoed\n", pane->priv->uuid);
    return FALSE;
  }

  g_signal_emit (pane, signals[DETACH_REQUEST], 0, x, y);
  return TRUE;
}

/* Drag and drop */

TesselDragQuadrant
tessel_pane_drag_motion (TesselPane *pane,
                         int x,
                         int y,
                         int width,
                         int height)
{
  g_return_val_if_fail (TESSEL_IS_PANE (pane), TESSEL_DRAG_QUADRANT_LEFT);

  TesselPanePrivate *priv = pane->priv;

  priv->drag_quadrant = tessel_drag_quadrant_resolve (x, y, width, height);
  priv->drag_active = TRUE;

  return priv->drag_quadrant;
}

void
tessel_pane_drag_leave (TesselPane *pane)
{
  g_return_if_fail (TESSEL_IS_PANE (pane));

  TesselPanePrivate *priv = pane->priv;

  priv->drag_active = FALSE;
  priv->drag_quadrant = TESSEL_DRAG_QUADRANT_LEFT;
}

/**
 * tessel_pane_drag_drop:
 * @pane: the pane the drop happened on
 * @source_uuid: the UUID of the dragged pane
 * @x:
 * @y:
 * @width: the width of the drop area
 * @height: the height of the drop area
 *
 * Returns: %TRUE if the drop was accepted and "move-request" emitted
 */
gboolean
tessel_pane_drag_drop (TesselPane *pane,
                       const char *source_uuid,
                       int x,
                       int y,
                       int width,
                       int height)
{
  g_return_val_if_fail (TESSEL_IS_PANE (pane), FALSE);

  TesselPanePrivate *priv = pane->priv;
  TesselDragQuadrant quadrant = tessel_drag_quadrant_resolve (x, y, width, height);

  tessel_pane_drag_leave (pane);

  if (source_uuid == nullptr || g_str_equal (source_uuid, priv->uuid)) {
    _tessel_debug_print (TESSEL_DEBUG_DND,
                         "[pane %s] rejecting drop of itself\n", priv->uuid);
    return FALSE;
  }

  if (tessel_context_get_pane_by_uuid (priv->context, source_uuid) == nullptr) {
    _tessel_debug_print (TESSEL_DEBUG_DND,
                         "[pane %s] rejecting drop of unknown pane %s\n",
                         priv->uuid, source_uuid);
    return FALSE;
  }

  _tessel_debug_print (TESSEL_DEBUG_DND,
                       "[pane %s] pane %s dropped on %s\n", priv->uuid, source_uuid,
                       tessel_drag_quadrant_to_string (quadrant));

  g_signal_emit (pane, signals[MOVE_REQUEST], 0, source_uuid, int (quadrant));
  return TRUE;
}

/**
 * tessel_pane_drag_end:
 * @pane: the dragged pane
 * @dropped: whether the drag ended on a target
 * @x: the pointer position
 * @y:
 *
 * Finishes a drag of @pane. A drag that found no target detaches @pane.
 */
void
tessel_pane_drag_end (TesselPane *pane,
                      gboolean dropped,
                      double x,
                      double y)
{
  g_return_if_fail (TESSEL_IS_PANE (pane));

  tessel_pane_drag_leave (pane);

  if (dropped)
    return;

  tessel_pane_request_detach (pane, x, y);
}

gboolean
tessel_pane_get_drag_active (TesselPane *pane)
{
  g_return_val_if_fail (TESSEL_IS_PANE (pane), FALSE);

  return pane->priv->drag_active;
}

TesselDragQuadrant
tessel_pane_get_drag_quadrant (TesselPane *pane)
{
  g_return_val_if_fail (TESSEL_IS_PANE (pane), TESSEL_DRAG_QUADRANT_LEFT);

  return pane->priv->drag_quadrant;
}
