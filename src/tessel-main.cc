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

#include <locale.h>
#include <stdlib.h>

#include <glib.h>
#include <glib/gi18n.h>
#include <gio/gio.h>

#include "tessel-app.hh"
#include "tessel-debug.hh"
#include "tessel-defines.hh"
#include "tessel-i18n.hh"
#include "tessel-schemas.hh"

int
main (int argc,
      char *argv[])
{
  // Sanitise environment
  g_unsetenv ("CHARSET");
  g_unsetenv ("DBUS_STARTER_BUS_TYPE");
  if (g_getenv ("G_ENABLE_DIAGNOSTIC") == nullptr)
    g_setenv ("G_ENABLE_DIAGNOSTIC", "0", true);

  if (setlocale (LC_ALL, "") == nullptr) {
    g_printerr ("Locale not supported.\n");
    return _EXIT_FAILURE_UNSUPPORTED_LOCALE;
  }

  tessel_i18n_init (true);

  char const *charset = nullptr;
  if (!g_get_charset (&charset)) {
    g_printerr ("Non UTF-8 locale (%s) is not supported!\n", charset);
    return _EXIT_FAILURE_NO_UTF8;
  }

  _tessel_debug_init ();

  auto const source = g_settings_schema_source_get_default ();
  g_autoptr(GSettingsSchema) schema = source ?
    g_settings_schema_source_lookup (source, TESSEL_SETTING_SCHEMA, true) : nullptr;
  if (schema == nullptr) {
    g_printerr ("Settings schema \"%s\" is not installed.\n", TESSEL_SETTING_SCHEMA);
    return _EXIT_FAILURE_NO_SCHEMAS;
  }

  g_set_prgname ("tessel");
  g_set_application_name (_(TESSEL_DEFAULT_TITLE));

  g_autoptr(TesselApp) app = tessel_app_new ();

  return g_application_run (G_APPLICATION (app), argc, argv);
}
