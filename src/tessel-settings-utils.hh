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

#include <gio/gio.h>

G_BEGIN_DECLS

GSettings* tessel_g_settings_new (GSettingsBackend* backend,
                                  GSettingsSchemaSource* source,
                                  char const* schema_id);

GSettings* tessel_g_settings_new_with_path (GSettingsBackend* backend,
                                            GSettingsSchemaSource* source,
                                            char const* schema_id,
                                            char const* path);

GSettingsSchemaSource* tessel_g_settings_schema_source_get_default(void);

G_END_DECLS
