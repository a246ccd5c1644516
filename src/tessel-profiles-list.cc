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

#include "tessel-profiles-list.hh"
#include "tessel-debug.hh"
#include "tessel-schemas.hh"
#include "tessel-settings-utils.hh"

#include <string.h>
#include <uuid.h>

struct _TesselProfilesList {
  GObject parent_instance;

  GSettingsBackend *backend;
  GSettingsSchemaSource *schema_source;

  GSettings *settings;
  GHashTable *children;
};

enum {
  SIGNAL_CHILDREN_CHANGED,
  N_SIGNALS
};

static guint signals[N_SIGNALS];

G_DEFINE_FINAL_TYPE (TesselProfilesList, tessel_profiles_list, G_TYPE_OBJECT)

static char *
path_new (const char *uuid)
{
  return g_strdup_printf ("%s:%s/", TESSEL_PROFILES_PATH_PREFIX, uuid);
}

static void
tessel_profiles_list_changed_cb (GSettings *settings,
                                 const char *key,
                                 TesselProfilesList *list)
{
  _tessel_debug_print (TESSEL_DEBUG_PROFILE, "Profiles list changed\n");

  g_signal_emit (list, signals[SIGNAL_CHILDREN_CHANGED], 0);
}

static void
tessel_profiles_list_init (TesselProfilesList *list)
{
  list->children = g_hash_table_new_full (g_str_hash, g_str_equal, g_free, g_object_unref);
}

static void
tessel_profiles_list_finalize (GObject *object)
{
  TesselProfilesList *list = TESSEL_PROFILES_LIST (object);

  if (list->settings)
    g_signal_handlers_disconnect_by_func (list->settings,
                                          (void*)tessel_profiles_list_changed_cb,
                                          list);
  g_clear_object (&list->settings);
  g_hash_table_unref (list->children);
  g_clear_object (&list->backend);
  g_clear_pointer (&list->schema_source, g_settings_schema_source_unref);

  G_OBJECT_CLASS (tessel_profiles_list_parent_class)->finalize (object);
}

static void
tessel_profiles_list_class_init (TesselProfilesListClass *klass)
{
  GObjectClass *object_class = G_OBJECT_CLASS (klass);

  object_class->finalize = tessel_profiles_list_finalize;

  signals[SIGNAL_CHILDREN_CHANGED] =
    g_signal_new ("children-changed",
                  G_OBJECT_CLASS_TYPE (object_class),
                  G_SIGNAL_RUN_FIRST,
                  0,
                  nullptr, nullptr,
                  g_cclosure_marshal_VOID__VOID,
                  G_TYPE_NONE, 0);
}

/**
 * tessel_profiles_list_new:
 * @backend: (nullable): a #GSettingsBackend
 * @schema_source: a #GSettingsSchemaSource
 *
 * Returns: (transfer full): a new #TesselProfilesList
 */
TesselProfilesList *
tessel_profiles_list_new (GSettingsBackend *backend,
                          GSettingsSchemaSource *schema_source)
{
  g_return_val_if_fail (schema_source != nullptr, nullptr);

  auto list = reinterpret_cast<TesselProfilesList*>(g_object_new (TESSEL_TYPE_PROFILES_LIST, nullptr));

  list->backend = backend ? reinterpret_cast<GSettingsBackend*>(g_object_ref (backend)) : nullptr;
  list->schema_source = g_settings_schema_source_ref (schema_source);
  list->settings = tessel_g_settings_new (backend, schema_source, TESSEL_PROFILES_LIST_SCHEMA);
  g_assert_nonnull (list->settings);

  g_signal_connect (list->settings, "changed::" TESSEL_PROFILES_LIST_LIST_KEY,
                    G_CALLBACK (tessel_profiles_list_changed_cb), list);

  return list;
}

/**
 * tessel_profiles_list_dupv_children:
 * @list: a #TesselProfilesList
 *
 * Returns: (transfer full): the UUIDs of the valid profiles in @list
 */
char **
tessel_profiles_list_dupv_children (TesselProfilesList *list)
{
  g_return_val_if_fail (TESSEL_IS_PROFILES_LIST (list), nullptr);

  g_auto(GStrv) entries = g_settings_get_strv (list->settings, TESSEL_PROFILES_LIST_LIST_KEY);
  GPtrArray *uuids = g_ptr_array_new ();

  for (guint i = 0; entries[i]; ++i) {
    if (!tessel_profiles_list_valid_uuid (entries[i])) {
      g_warning ("Ignoring invalid profile UUID \"%s\"", entries[i]);
      continue;
    }
    g_ptr_array_add (uuids, g_strdup (entries[i]));
  }
  g_ptr_array_add (uuids, nullptr);

  return (char **) g_ptr_array_free (uuids, FALSE);
}

gboolean
tessel_profiles_list_has_child (TesselProfilesList *list,
                                const char *uuid)
{
  g_return_val_if_fail (TESSEL_IS_PROFILES_LIST (list), FALSE);

  if (!tessel_profiles_list_valid_uuid (uuid))
    return FALSE;

  g_auto(GStrv) uuids = tessel_profiles_list_dupv_children (list);
  return g_strv_contains (uuids, uuid);
}

/**
 * tessel_profiles_list_ref_child:
 * @list: a #TesselProfilesList
 * @uuid: the UUID of a list child
 *
 * Returns: (transfer full) (nullable): the profile #GSettings, or
 *   %nullptr if @list has no such child
 */
GSettings *
tessel_profiles_list_ref_child (TesselProfilesList *list,
                                const char *uuid)
{
  g_return_val_if_fail (TESSEL_IS_PROFILES_LIST (list), nullptr);

  if (!tessel_profiles_list_has_child (list, uuid))
    return nullptr;

  auto child = reinterpret_cast<GSettings*>(g_hash_table_lookup (list->children, uuid));
  if (child == nullptr) {
    g_autofree char *path = path_new (uuid);

    _tessel_debug_print (TESSEL_DEBUG_PROFILE, "Creating profile %s at %s\n", uuid, path);

    child = tessel_g_settings_new_with_path (list->backend,
                                             list->schema_source,
                                             TESSEL_PROFILE_SCHEMA,
                                             path);
    g_assert_nonnull (child);
    g_hash_table_insert (list->children, g_strdup (uuid), child /* adopted */);
  }

  return reinterpret_cast<GSettings*>(g_object_ref (child));
}

char *
tessel_profiles_list_dup_default_child (TesselProfilesList *list)
{
  g_return_val_if_fail (TESSEL_IS_PROFILES_LIST (list), nullptr);

  g_autofree char *uuid = g_settings_get_string (list->settings, TESSEL_PROFILES_LIST_DEFAULT_KEY);
  if (tessel_profiles_list_has_child (list, uuid))
    return g_steal_pointer (&uuid);

  /* Fall back to the first profile in the list */
  g_auto(GStrv) uuids = tessel_profiles_list_dupv_children (list);
  if (uuids[0] != nullptr)
    return g_strdup (uuids[0]);

  return nullptr;
}

/**
 * tessel_profiles_list_dup_uuid:
 * @list:
 * @uuid: (allow-none):
 * @error:
 *
 * Returns: (transfer full): the UUID of the profile specified by @uuid,
 *   the default profile if @uuid is %nullptr, or %nullptr on error
 */
char *
tessel_profiles_list_dup_uuid (TesselProfilesList *list,
                               const char *uuid,
                               GError **error)
{
  if (uuid == nullptr) {
    char *rv = tessel_profiles_list_dup_default_child (list);
    if (rv == nullptr)
      g_set_error_literal (error, G_IO_ERROR, G_IO_ERROR_NOT_FOUND,
                           "No default profile");
    return rv;
  }

  if (!tessel_profiles_list_valid_uuid (uuid)) {
    g_set_error (error, G_IO_ERROR, G_IO_ERROR_INVALID_ARGUMENT,
                 "\"%s\" is not a valid UUID", uuid);
    return nullptr;
  }

  if (tessel_profiles_list_has_child (list, uuid))
    return g_strdup (uuid);

  g_set_error (error, G_IO_ERROR, G_IO_ERROR_NOT_FOUND,
               "No profile with UUID \"%s\" exists", uuid);
  return nullptr;
}

/**
 * tessel_profiles_list_dup_uuid_or_name:
 * @list:
 * @uuid_or_name:
 * @error:
 *
 * Returns: (transfer full): the UUID of the profile whose UUID or
 *   visible name is @uuid_or_name, or %nullptr
 */
char *
tessel_profiles_list_dup_uuid_or_name (TesselProfilesList *list,
                                       const char *uuid_or_name,
                                       GError **error)
{
  g_return_val_if_fail (uuid_or_name != nullptr, nullptr);

  char *rv = tessel_profiles_list_dup_uuid (list, uuid_or_name, nullptr);
  if (rv != nullptr)
    return rv;

  /* Not found as UUID; try finding a profile with this string as 'visible-name' */
  g_auto(GStrv) uuids = tessel_profiles_list_dupv_children (list);
  guint n = 0;
  for (guint i = 0; uuids[i]; ++i) {
    g_autofree char *name = tessel_profiles_list_dup_visible_name (list, uuids[i]);
    if (g_strcmp0 (name, uuid_or_name) == 0) {
      if (n++ == 0)
        rv = g_strdup (uuids[i]);
    }
  }

  if (n == 0) {
    g_set_error (error, G_IO_ERROR, G_IO_ERROR_NOT_FOUND,
                 "No profile with UUID or name \"%s\" exists", uuid_or_name);
  } else if (n != 1) {
    g_set_error (error, G_IO_ERROR, G_IO_ERROR_INVALID_ARGUMENT,
                 "No profile with UUID \"%s\" found and name is ambiguous", uuid_or_name);
    g_clear_pointer (&rv, g_free);
  }

  return rv;
}

/**
 * tessel_profiles_list_ref_profile_by_uuid:
 * @list:
 * @uuid: (allow-none):
 * @error:
 *
 * Returns: (transfer full): the profile #GSettings specified by @uuid, or %nullptr
 */
GSettings *
tessel_profiles_list_ref_profile_by_uuid (TesselProfilesList *list,
                                          const char *uuid,
                                          GError **error)
{
  g_autofree char *profile_uuid = tessel_profiles_list_dup_uuid (list, uuid, error);
  if (profile_uuid == nullptr)
    return nullptr;

  return tessel_profiles_list_ref_child (list, profile_uuid);
}

char *
tessel_profiles_list_dup_visible_name (TesselProfilesList *list,
                                       const char *uuid)
{
  g_autoptr(GSettings) profile = tessel_profiles_list_ref_child (list, uuid);
  if (profile == nullptr)
    return nullptr;

  return g_settings_get_string (profile, TESSEL_PROFILE_VISIBLE_NAME_KEY);
}

gboolean
tessel_profiles_list_valid_uuid (const char *str)
{
  uuid_t u;

  if (str == nullptr)
    return FALSE;

  return uuid_parse ((char *) str, u) == 0;
}
