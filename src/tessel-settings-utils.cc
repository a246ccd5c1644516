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

#include "tessel-settings-utils.hh"
#include "tessel-debug.hh"

/**
 * tessel_g_settings_new_with_path:
 * @backend: (nullable): a #GSettingsBackend, or %nullptr for the default
 * @source: the #GSettingsSchemaSource to look @schema_id up in
 * @schema_id: the schema ID
 * @path: (nullable): the path for relocatable schemas
 *
 * Returns: (transfer full) (nullable): a new #GSettings, or %nullptr if
 *   @schema_id is not found in @source
 */
GSettings*
tessel_g_settings_new_with_path (GSettingsBackend* backend,
                                 GSettingsSchemaSource* source,
                                 char const* schema_id,
                                 char const* path)
{
  g_autoptr(GSettingsSchema) schema =
    g_settings_schema_source_lookup(source,
                                    schema_id,
                                    TRUE /* recursive */);
  if (schema == nullptr) {
    _tessel_debug_print(TESSEL_DEBUG_SETTINGS,
                        "Schema %s not found\n", schema_id);
    return nullptr;
  }

  _tessel_debug_print(TESSEL_DEBUG_SETTINGS,
                      "Creating GSettings for schema %s at %s with backend %s\n",
                      schema_id, path ? path : "(default)",
                      backend ? G_OBJECT_TYPE_NAME(backend) : "(default)");

  return g_settings_new_full(schema, backend, path);
}

GSettings*
tessel_g_settings_new(GSettingsBackend* backend,
                      GSettingsSchemaSource* source,
                      char const* schema_id)
{
  return tessel_g_settings_new_with_path(backend, source, schema_id, nullptr);
}

/**
 * tessel_g_settings_schema_source_get_default:
 *
 * Returns the schema source layering our compiled schemas in
 * TESSEL_SCHEMADIR over the installed ones, or the default source if
 * that directory cannot be loaded.
 *
 * Returns: (transfer full) (nullable): a #GSettingsSchemaSource
 */
GSettingsSchemaSource*
tessel_g_settings_schema_source_get_default(void)
{
  GSettingsSchemaSource* default_source = g_settings_schema_source_get_default();

  g_autoptr(GError) error = nullptr;
  GSettingsSchemaSource* source =
    g_settings_schema_source_new_from_directory(TESSEL_SCHEMADIR,
                                                default_source,
                                                FALSE /* trusted */,
                                                &error);
  if (!source) {
    _tessel_debug_print(TESSEL_DEBUG_SETTINGS,
                        "Failed to load schemas from %s: %s\n",
                        TESSEL_SCHEMADIR, error->message);
    return default_source ? g_settings_schema_source_ref(default_source) : nullptr;
  }

  return source;
}
