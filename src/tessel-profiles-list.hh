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

#ifndef TESSEL_PROFILES_LIST_H
#define TESSEL_PROFILES_LIST_H

#include <gio/gio.h>

G_BEGIN_DECLS

#define TESSEL_TYPE_PROFILES_LIST (tessel_profiles_list_get_type ())

G_DECLARE_FINAL_TYPE (TesselProfilesList, tessel_profiles_list, TESSEL, PROFILES_LIST, GObject)

TesselProfilesList *tessel_profiles_list_new (GSettingsBackend *backend,
                                              GSettingsSchemaSource *schema_source);

char **tessel_profiles_list_dupv_children (TesselProfilesList *list);

gboolean tessel_profiles_list_has_child (TesselProfilesList *list,
                                         const char *uuid);

GSettings *tessel_profiles_list_ref_child (TesselProfilesList *list,
                                           const char *uuid);

char *tessel_profiles_list_dup_default_child (TesselProfilesList *list);

char *tessel_profiles_list_dup_uuid (TesselProfilesList *list,
                                     const char *uuid,
                                     GError **error);

char *tessel_profiles_list_dup_uuid_or_name (TesselProfilesList *list,
                                             const char *uuid_or_name,
                                             GError **error);

GSettings *tessel_profiles_list_ref_profile_by_uuid (TesselProfilesList *list,
                                                     const char *uuid,
                                                     GError **error);

char *tessel_profiles_list_dup_visible_name (TesselProfilesList *list,
                                             const char *uuid);

gboolean tessel_profiles_list_valid_uuid (const char *str);

G_END_DECLS

#endif /* TESSEL_PROFILES_LIST_H */
