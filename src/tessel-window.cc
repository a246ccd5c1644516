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

#include <glib/gi18n.h>

#include "tessel-debug.hh"
#include "tessel-defines.hh"
#include "tessel-schemas.hh"
#include "tessel-util.hh"
#include "tessel-window.hh"

struct _TesselWindow
{
  AdwApplicationWindow parent_instance;

  TesselContext *context;

  GtkWidget *window_title;
  GtkWidget *session_bin;
  GtkWidget *session;

  TesselPane *active_pane;

  GtkWidget *confirm_close_dialog;
  gboolean close_confirmed;
};

enum {
  PROP_0,
  PROP_CONTEXT,
  N_PROPS
};

static GParamSpec *pspecs[N_PROPS];

G_DEFINE_FINAL_TYPE (TesselWindow, tessel_window, ADW_TYPE_APPLICATION_WINDOW)

/* helper functions */

static void
tessel_window_update_title (TesselWindow *window)
{
  auto const markup = window->active_pane ? tessel_pane_get_title (window->active_pane) : nullptr;
  g_autofree char *text = nullptr;

  if (markup != nullptr &&
      !pango_parse_markup (markup, -1, 0, nullptr, &text, nullptr, nullptr))
    text = g_strdup (markup);

  auto const title = tessel_str_empty0 (text) ? _(TESSEL_DEFAULT_TITLE) : text;

  adw_window_title_set_title (ADW_WINDOW_TITLE (window->window_title), title);
  gtk_window_set_title (GTK_WINDOW (window), title);
}

static void
active_pane_notify_title_cb (TesselPane *pane,
                             GParamSpec *pspec,
                             TesselWindow *window)
{
  tessel_window_update_title (window);
}

static void
tessel_window_set_active_pane (TesselWindow *window,
                               TesselPane *pane)
{
  if (window->active_pane == pane)
    return;

  if (window->active_pane != nullptr) {
    g_signal_handlers_disconnect_by_func (window->active_pane,
                                          (void*)active_pane_notify_title_cb,
                                          window);
    g_object_remove_weak_pointer (G_OBJECT (window->active_pane),
                                  (void**)&window->active_pane);
  }

  window->active_pane = pane;

  if (window->active_pane != nullptr) {
    g_object_add_weak_pointer (G_OBJECT (window->active_pane),
                               (void**)&window->active_pane);
    g_signal_connect (window->active_pane, "notify::title",
                      G_CALLBACK (active_pane_notify_title_cb), window);
  }

  tessel_window_update_title (window);
}

/* Session callbacks */

static void
session_notify_active_view_cb (TesselSession *session,
                               GParamSpec *pspec,
                               TesselWindow *window)
{
  auto const view = tessel_session_get_active_view (session);

  tessel_window_set_active_pane (window, view ? tessel_pane_view_get_pane (view) : nullptr);
}

static void
session_empty_cb (TesselSession *session,
                  TesselWindow *window)
{
  _tessel_debug_print (TESSEL_DEBUG_SESSION, "Last pane closed, closing window\n");

  window->close_confirmed = TRUE;
  gtk_window_destroy (GTK_WINDOW (window));
}

static void
session_detach_view_cb (TesselSession *session,
                        TesselPaneView *view,
                        double x,
                        double y,
                        TesselWindow *window)
{
  auto const new_window = tessel_window_new (gtk_window_get_application (GTK_WINDOW (window)),
                                             window->context);

  _tessel_debug_print (TESSEL_DEBUG_SESSION,
                       "Detaching pane %s at %.0f,%.0f\n",
                       tessel_pane_get_uuid (tessel_pane_view_get_pane (view)), x, y);

  g_autoptr(TesselPaneView) detached = tessel_session_take_view (session, view);
  tessel_session_add_view (tessel_window_get_session (new_window), detached);

  gtk_window_present (GTK_WINDOW (new_window));
  gtk_widget_grab_focus (GTK_WIDGET (detached));
}

/* Actions */

static void
tessel_window_split_action (GtkWidget *widget,
                            const char *action_name,
                            GVariant *parameter)
{
  TesselWindow *window = TESSEL_WINDOW (widget);
  auto const session = TESSEL_SESSION (window->session);
  auto const view = tessel_session_get_active_view (session);

  if (view == nullptr)
    return;

  tessel_session_split (session, view,
                        g_str_equal (action_name, "window.split-right") ? TESSEL_ORIENTATION_HORIZONTAL
                                                                        : TESSEL_ORIENTATION_VERTICAL);
}

/* Close confirmation */

static void
confirm_close_response_cb (GtkDialog *dialog,
                           int response,
                           TesselWindow *window)
{
  gtk_window_destroy (GTK_WINDOW (dialog));

  if (response != GTK_RESPONSE_ACCEPT)
    return;

  window->close_confirmed = TRUE;
  gtk_window_destroy (GTK_WINDOW (window));
}

static gboolean
tessel_window_close_request (GtkWindow *gtk_window)
{
  TesselWindow *window = TESSEL_WINDOW (gtk_window);

  if (window->close_confirmed)
    return FALSE;

  auto const settings = tessel_context_get_global_settings (window->context);
  if (!g_settings_get_boolean (settings, TESSEL_SETTING_CONFIRM_CLOSE_KEY) ||
      !tessel_session_has_running_processes (TESSEL_SESSION (window->session)))
    return FALSE;

  if (window->confirm_close_dialog != nullptr) {
    gtk_window_present (GTK_WINDOW (window->confirm_close_dialog));
    return TRUE;
  }

  gboolean several = tessel_session_get_n_views (TESSEL_SESSION (window->session)) > 1;

  auto dialog = window->confirm_close_dialog =
    gtk_message_dialog_new (GTK_WINDOW (window),
                            GtkDialogFlags(GTK_DIALOG_MODAL |
                                           GTK_DIALOG_DESTROY_WITH_PARENT),
                            GTK_MESSAGE_WARNING,
                            GTK_BUTTONS_CANCEL,
                            "%s", several ? _("Close this window?") : _("Close this terminal?"));

  if (several)
    gtk_message_dialog_format_secondary_text (GTK_MESSAGE_DIALOG (dialog),
                                              "%s", _("There are still processes running in some terminals in this window. "
                                                      "Closing the window will kill all of them."));
  else
    gtk_message_dialog_format_secondary_text (GTK_MESSAGE_DIALOG (dialog),
                                              "%s", _("There is still a process running in this terminal. "
                                                      "Closing the terminal will kill it."));

  gtk_window_set_title (GTK_WINDOW (dialog), "");

  GtkWidget *remove_button = gtk_dialog_add_button (GTK_DIALOG (dialog),
                                                    several ? _("C_lose Window") : _("C_lose Terminal"),
                                                    GTK_RESPONSE_ACCEPT);
  gtk_widget_add_css_class (remove_button, "destructive-action");
  gtk_dialog_set_default_response (GTK_DIALOG (dialog), GTK_RESPONSE_ACCEPT);

  g_signal_connect_swapped (dialog, "destroy",
                            G_CALLBACK (g_nullify_pointer),
                            &window->confirm_close_dialog);
  g_signal_connect (dialog, "response",
                    G_CALLBACK (confirm_close_response_cb), window);

  gtk_window_present (GTK_WINDOW (dialog));

  return TRUE;
}

/* Class implementation */

static void
tessel_window_init (TesselWindow *window)
{
  gtk_widget_init_template (GTK_WIDGET (window));
}

static void
tessel_window_constructed (GObject *object)
{
  TesselWindow *window = TESSEL_WINDOW (object);

  G_OBJECT_CLASS (tessel_window_parent_class)->constructed (object);

  window->session = tessel_session_new (window->context);
  adw_bin_set_child (ADW_BIN (window->session_bin), window->session);

  g_signal_connect (window->session, "notify::active-view",
                    G_CALLBACK (session_notify_active_view_cb), window);
  g_signal_connect (window->session, "empty",
                    G_CALLBACK (session_empty_cb), window);
  g_signal_connect (window->session, "detach-view",
                    G_CALLBACK (session_detach_view_cb), window);

  tessel_window_update_title (window);
}

static void
tessel_window_dispose (GObject *object)
{
  TesselWindow *window = TESSEL_WINDOW (object);

  g_clear_pointer (&window->confirm_close_dialog, gtk_window_destroy);

  tessel_window_set_active_pane (window, nullptr);

  if (window->session != nullptr) {
    g_signal_handlers_disconnect_by_data (window->session, window);
    window->session = nullptr;
  }

  gtk_widget_dispose_template (GTK_WIDGET (window), TESSEL_TYPE_WINDOW);

  G_OBJECT_CLASS (tessel_window_parent_class)->dispose (object);
}

static void
tessel_window_finalize (GObject *object)
{
  TesselWindow *window = TESSEL_WINDOW (object);

  g_clear_object (&window->context);

  G_OBJECT_CLASS (tessel_window_parent_class)->finalize (object);
}

static void
tessel_window_get_property (GObject *object,
                            guint prop_id,
                            GValue *value,
                            GParamSpec *pspec)
{
  TesselWindow *window = TESSEL_WINDOW (object);

  switch (prop_id) {
    case PROP_CONTEXT:
      g_value_set_object (value, window->context);
      break;
    default:
      G_OBJECT_WARN_INVALID_PROPERTY_ID (object, prop_id, pspec);
      break;
  }
}

static void
tessel_window_set_property (GObject *object,
                            guint prop_id,
                            const GValue *value,
                            GParamSpec *pspec)
{
  TesselWindow *window = TESSEL_WINDOW (object);

  switch (prop_id) {
    case PROP_CONTEXT:
      window->context = (TesselContext*)g_value_dup_object (value);
      break;
    default:
      G_OBJECT_WARN_INVALID_PROPERTY_ID (object, prop_id, pspec);
      break;
  }
}

static void
tessel_window_class_init (TesselWindowClass *klass)
{
  GObjectClass *object_class = G_OBJECT_CLASS (klass);
  GtkWidgetClass *widget_class = GTK_WIDGET_CLASS (klass);
  GtkWindowClass *window_class = GTK_WINDOW_CLASS (klass);

  object_class->constructed = tessel_window_constructed;
  object_class->dispose = tessel_window_dispose;
  object_class->finalize = tessel_window_finalize;
  object_class->get_property = tessel_window_get_property;
  object_class->set_property = tessel_window_set_property;

  window_class->close_request = tessel_window_close_request;

  pspecs[PROP_CONTEXT] =
    g_param_spec_object ("context", nullptr, nullptr,
                         TESSEL_TYPE_CONTEXT,
                         GParamFlags(G_PARAM_READWRITE |
                                     G_PARAM_CONSTRUCT_ONLY |
                                     G_PARAM_STATIC_STRINGS));

  g_object_class_install_properties (object_class, N_PROPS, pspecs);

  gtk_widget_class_set_template_from_resource (widget_class, TESSEL_RESOURCE_PATH "/ui/window.ui");

  gtk_widget_class_bind_template_child (widget_class, TesselWindow, window_title);
  gtk_widget_class_bind_template_child (widget_class, TesselWindow, session_bin);

  gtk_widget_class_install_action (widget_class, "window.split-right", nullptr, tessel_window_split_action);
  gtk_widget_class_install_action (widget_class, "window.split-down", nullptr, tessel_window_split_action);
}

/* public API */

TesselWindow *
tessel_window_new (GtkApplication *app,
                   TesselContext *context)
{
  g_return_val_if_fail (GTK_IS_APPLICATION (app), nullptr);
  g_return_val_if_fail (TESSEL_IS_CONTEXT (context), nullptr);

  return reinterpret_cast<TesselWindow*>(g_object_new (TESSEL_TYPE_WINDOW,
                                                       "application", app,
                                                       "context", context,
                                                       nullptr));
}

TesselSession *
tessel_window_get_session (TesselWindow *window)
{
  g_return_val_if_fail (TESSEL_IS_WINDOW (window), nullptr);

  return TESSEL_SESSION (window->session);
}
