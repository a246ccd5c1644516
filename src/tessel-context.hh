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

#ifndef TESSEL_CONTEXT_H
#define TESSEL_CONTEXT_H

#include <gio/gio.h>
#include <pango/pango.h>

#include "tessel-profiles-list.hh"

G_BEGIN_DECLS

typedef struct _TesselPane TesselPane;

/* Options given on the command line; they apply to the first
 * terminal spawned only. */
typedef struct {
  char *working_directory;
  char *command;
  char *profile;
} TesselOverrides;

TesselOverrides *tessel_overrides_new (const char *working_directory,
                                       const char *command,
                                       const char *profile);

void tessel_overrides_free (TesselOverrides *overrides);

G_DEFINE_AUTOPTR_CLEANUP_FUNC (TesselOverrides, tessel_overrides_free)

#define TESSEL_TYPE_CONTEXT (tessel_context_get_type ())

G_DECLARE_FINAL_TYPE (TesselContext, tessel_context, TESSEL, CONTEXT, GObject)

TesselContext *tessel_context_new (GSettingsBackend *backend,
                                   GSettingsSchemaSource *schema_source,
                                   TesselOverrides *overrides);

GSettingsBackend *tessel_context_get_settings_backend (TesselContext *context);

GSettingsSchemaSource *tessel_context_get_schema_source (TesselContext *context);

GSettings *tessel_context_get_global_settings (TesselContext *context);

GSettings *tessel_context_get_desktop_interface_settings (TesselContext *context);

TesselProfilesList *tessel_context_get_profiles_list (TesselContext *context);

PangoFontDescription *tessel_context_get_system_font (TesselContext *context);

TesselOverrides *tessel_context_take_overrides (TesselContext *context);

/* Pane registry */

void tessel_context_register_pane (TesselContext *context,
                                   TesselPane *pane);

void tessel_context_unregister_pane (TesselContext *context,
                                     TesselPane *pane);

TesselPane *tessel_context_get_pane_by_uuid (TesselContext *context,
                                             const char *uuid);

guint tessel_context_get_n_panes (TesselContext *context);

G_END_DECLS

#endif /* !TESSEL_CONTEXT_H */
