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

#include "tessel-app.hh"
#include "tessel-debug.hh"
#include "tessel-defines.hh"
#include "tessel-window.hh"

struct _TesselApp
{
  AdwApplication parent_instance;

  TesselContext *context;

  char *working_directory;
  char *command;
  char *profile;
};

G_DEFINE_FINAL_TYPE (TesselApp, tessel_app, ADW_TYPE_APPLICATION)

static const GOptionEntry options[] = {
  { "working-directory", 'w', 0, G_OPTION_ARG_FILENAME, nullptr,
    N_("Set the working directory"), N_("DIRNAME") },
  { "command", 'e', 0, G_OPTION_ARG_STRING, nullptr,
    N_("Execute the argument to this option inside the terminal"), N_("COMMAND") },
  { "profile", 'p', 0, G_OPTION_ARG_STRING, nullptr,
    N_("Use the given profile instead of the default profile"), N_("PROFILE-NAME") },
  { nullptr }
};

static void
app_load_css (GApplication *application)
{
  g_autoptr(GtkCssProvider) provider = gtk_css_provider_new ();
  g_autofree char *path = g_strdup_printf ("%s/css/tessel.css",
                                           g_application_get_resource_base_path (application));

  gtk_css_provider_load_from_resource (provider, path);

  gtk_style_context_add_provider_for_display (gdk_display_get_default (),
                                              GTK_STYLE_PROVIDER (provider),
                                              GTK_STYLE_PROVIDER_PRIORITY_APPLICATION);
}

static void
app_quit_cb (GSimpleAction *action,
             GVariant *parameter,
             gpointer user_data)
{
  GtkApplication *application = GTK_APPLICATION (user_data);

  GList *windows = gtk_application_get_windows (application);
  while (windows != nullptr) {
    auto const window = GTK_WINDOW (windows->data);
    windows = windows->next;
    gtk_window_close (window);
  }
}

/* GApplicationClass impl */

static int
tessel_app_handle_local_options (GApplication *application,
                                 GVariantDict *options_dict)
{
  TesselApp *app = TESSEL_APP (application);

  g_variant_dict_lookup (options_dict, "working-directory", "^ay", &app->working_directory);
  g_variant_dict_lookup (options_dict, "command", "s", &app->command);
  g_variant_dict_lookup (options_dict, "profile", "s", &app->profile);

  _tessel_debug_print (TESSEL_DEBUG_SETTINGS,
                       "Command line: working directory \"%s\" command \"%s\" profile \"%s\"\n",
                       app->working_directory ? app->working_directory : "",
                       app->command ? app->command : "",
                       app->profile ? app->profile : "");

  return -1;
}

static void
tessel_app_startup (GApplication *application)
{
  TesselApp *app = TESSEL_APP (application);

  g_application_set_resource_base_path (application, TESSEL_RESOURCE_PATH);

  G_APPLICATION_CLASS (tessel_app_parent_class)->startup (application);

  app_load_css (application);

  GActionEntry const action_entries[] = {
    { "quit", app_quit_cb, nullptr, nullptr, nullptr },
  };

  g_action_map_add_action_entries (G_ACTION_MAP (application),
                                   action_entries, G_N_ELEMENTS (action_entries),
                                   application);

  const char *quit_accels[] = { "<Control><Shift>q", nullptr };
  gtk_application_set_accels_for_action (GTK_APPLICATION (application), "app.quit", quit_accels);

  auto overrides = tessel_overrides_new (app->working_directory, app->command, app->profile);
  app->context = tessel_context_new (nullptr,
                                     g_settings_schema_source_get_default (),
                                     overrides);

  _tessel_debug_print (TESSEL_DEBUG_SESSION, "Startup complete\n");
}

static void
tessel_app_activate (GApplication *application)
{
  TesselApp *app = TESSEL_APP (application);

  auto const window = tessel_window_new (GTK_APPLICATION (application), app->context);
  auto const view = tessel_session_start (tessel_window_get_session (window), nullptr, nullptr);

  gtk_window_present (GTK_WINDOW (window));
  gtk_widget_grab_focus (GTK_WIDGET (view));
}

/* GObjectClass impl */

static void
tessel_app_init (TesselApp *app)
{
  g_application_add_main_option_entries (G_APPLICATION (app), options);
}

static void
tessel_app_finalize (GObject *object)
{
  TesselApp *app = TESSEL_APP (object);

  g_clear_object (&app->context);
  g_free (app->working_directory);
  g_free (app->command);
  g_free (app->profile);

  G_OBJECT_CLASS (tessel_app_parent_class)->finalize (object);
}

static void
tessel_app_class_init (TesselAppClass *klass)
{
  GObjectClass *object_class = G_OBJECT_CLASS (klass);
  GApplicationClass *g_application_class = G_APPLICATION_CLASS (klass);

  object_class->finalize = tessel_app_finalize;

  g_application_class->handle_local_options = tessel_app_handle_local_options;
  g_application_class->startup = tessel_app_startup;
  g_application_class->activate = tessel_app_activate;
}

/* Public API */

TesselApp *
tessel_app_new (void)
{
  return reinterpret_cast<TesselApp*>(g_object_new (TESSEL_TYPE_APP,
                                                    "application-id", TESSEL_APPLICATION_ID,
                                                    "flags", G_APPLICATION_NON_UNIQUE,
                                                    nullptr));
}

TesselContext *
tessel_app_get_context (TesselApp *app)
{
  g_return_val_if_fail (TESSEL_IS_APP (app), nullptr);

  return app->context;
}
