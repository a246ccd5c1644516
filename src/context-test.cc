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

#include <glib.h>

#include "tessel-context.hh"
#include "tessel-pane.hh"
#include "tessel-profiles-list.hh"
#include "tessel-schemas.hh"
#include "tessel-settings-utils.hh"
#include "tessel-test-emulator.hh"

#define DEFAULT_PROFILE_UUID "b1dcc9dd-5262-4d8d-a863-c897e6d979b9"
#define OTHER_PROFILE_UUID   "0f5d4c4e-8f0e-4b8c-9a4f-2d8f6b3c1e7a"
#define UNKNOWN_PROFILE_UUID "6e1f3a2b-1c4d-4e5f-8a9b-0c1d2e3f4a5b"

static GSettings *
profiles_list_settings_new (TesselContext *context)
{
  return tessel_g_settings_new (tessel_context_get_settings_backend (context),
                                tessel_context_get_schema_source (context),
                                TESSEL_PROFILES_LIST_SCHEMA);
}

static void
count_cb (gpointer object,
          guint *n)
{
  (*n)++;
}

static void
add_profile (TesselContext *context,
             const char *uuid,
             const char *name)
{
  TesselProfilesList *list = tessel_context_get_profiles_list (context);
  g_autoptr(GSettings) settings = profiles_list_settings_new (context);
  g_auto(GStrv) children = tessel_profiles_list_dupv_children (list);
  g_autoptr(GStrvBuilder) builder = g_strv_builder_new ();

  g_strv_builder_addv (builder, (const char **) children);
  g_strv_builder_add (builder, uuid);
  g_auto(GStrv) new_children = g_strv_builder_end (builder);
  g_settings_set_strv (settings, TESSEL_PROFILES_LIST_LIST_KEY, new_children);

  g_autoptr(GSettings) profile = tessel_profiles_list_ref_child (list, uuid);
  g_assert_nonnull (profile);
  g_settings_set_string (profile, TESSEL_PROFILE_VISIBLE_NAME_KEY, name);

  while (g_main_context_iteration (nullptr, FALSE));
}

static void
test_profiles_list_default (void)
{
  g_autoptr(TesselContext) context = tessel_test_context_new (nullptr);
  TesselProfilesList *list = tessel_context_get_profiles_list (context);

  g_auto(GStrv) children = tessel_profiles_list_dupv_children (list);
  g_assert_cmpuint (g_strv_length (children), ==, 1);
  g_assert_cmpstr (children[0], ==, DEFAULT_PROFILE_UUID);

  g_autofree char *default_uuid = tessel_profiles_list_dup_default_child (list);
  g_assert_cmpstr (default_uuid, ==, DEFAULT_PROFILE_UUID);

  g_assert_true (tessel_profiles_list_has_child (list, DEFAULT_PROFILE_UUID));
  g_assert_false (tessel_profiles_list_has_child (list, UNKNOWN_PROFILE_UUID));

  g_autofree char *name = tessel_profiles_list_dup_visible_name (list, DEFAULT_PROFILE_UUID);
  g_assert_cmpstr (name, ==, "Default");

  /* The same settings object is handed out for a profile */
  g_autoptr(GSettings) first = tessel_profiles_list_ref_child (list, DEFAULT_PROFILE_UUID);
  g_autoptr(GSettings) second = tessel_profiles_list_ref_child (list, DEFAULT_PROFILE_UUID);
  g_assert_true (first == second);
}

static void
test_profiles_list_lookup (void)
{
  g_autoptr(TesselContext) context = tessel_test_context_new (nullptr);
  TesselProfilesList *list = tessel_context_get_profiles_list (context);
  g_autoptr(GError) error = nullptr;

  g_autofree char *by_default = tessel_profiles_list_dup_uuid (list, nullptr, &error);
  g_assert_no_error (error);
  g_assert_cmpstr (by_default, ==, DEFAULT_PROFILE_UUID);

  g_autofree char *by_uuid = tessel_profiles_list_dup_uuid (list, DEFAULT_PROFILE_UUID, &error);
  g_assert_no_error (error);
  g_assert_cmpstr (by_uuid, ==, DEFAULT_PROFILE_UUID);

  g_autofree char *invalid = tessel_profiles_list_dup_uuid (list, "not-a-uuid", &error);
  g_assert_error (error, G_IO_ERROR, G_IO_ERROR_INVALID_ARGUMENT);
  g_assert_null (invalid);
  g_clear_error (&error);

  g_autofree char *unknown = tessel_profiles_list_dup_uuid (list, UNKNOWN_PROFILE_UUID, &error);
  g_assert_error (error, G_IO_ERROR, G_IO_ERROR_NOT_FOUND);
  g_assert_null (unknown);
  g_clear_error (&error);

  g_autofree char *by_name = tessel_profiles_list_dup_uuid_or_name (list, "Default", &error);
  g_assert_no_error (error);
  g_assert_cmpstr (by_name, ==, DEFAULT_PROFILE_UUID);

  g_autofree char *no_name = tessel_profiles_list_dup_uuid_or_name (list, "Solarized", &error);
  g_assert_error (error, G_IO_ERROR, G_IO_ERROR_NOT_FOUND);
  g_assert_null (no_name);
  g_clear_error (&error);
}

static void
test_profiles_list_changed (void)
{
  g_autoptr(TesselContext) context = tessel_test_context_new (nullptr);
  TesselProfilesList *list = tessel_context_get_profiles_list (context);
  guint n_changed = 0;

  g_signal_connect (list, "children-changed",
                    G_CALLBACK (count_cb), &n_changed);

  add_profile (context, OTHER_PROFILE_UUID, "Solarized");

  g_assert_cmpuint (n_changed, >=, 1);
  g_assert_true (tessel_profiles_list_has_child (list, OTHER_PROFILE_UUID));

  g_autoptr(GError) error = nullptr;
  g_autofree char *by_name = tessel_profiles_list_dup_uuid_or_name (list, "Solarized", &error);
  g_assert_no_error (error);
  g_assert_cmpstr (by_name, ==, OTHER_PROFILE_UUID);

  /* Two profiles with the same name */
  g_autoptr(GSettings) other = tessel_profiles_list_ref_child (list, OTHER_PROFILE_UUID);
  g_settings_set_string (other, TESSEL_PROFILE_VISIBLE_NAME_KEY, "Default");

  g_autofree char *ambiguous = tessel_profiles_list_dup_uuid_or_name (list, "Default", &error);
  g_assert_error (error, G_IO_ERROR, G_IO_ERROR_INVALID_ARGUMENT);
  g_assert_null (ambiguous);
}

static void
test_profiles_list_invalid_entry (void)
{
  g_autoptr(TesselContext) context = tessel_test_context_new (nullptr);
  TesselProfilesList *list = tessel_context_get_profiles_list (context);
  g_autoptr(GSettings) settings = profiles_list_settings_new (context);
  const char *entries[] = { "garbage", DEFAULT_PROFILE_UUID, nullptr };

  g_settings_set_strv (settings, TESSEL_PROFILES_LIST_LIST_KEY, entries);
  while (g_main_context_iteration (nullptr, FALSE));

  g_test_expect_message (G_LOG_DOMAIN, G_LOG_LEVEL_WARNING, "Ignoring invalid profile UUID*");
  g_auto(GStrv) children = tessel_profiles_list_dupv_children (list);
  g_test_assert_expected_messages ();

  g_assert_cmpuint (g_strv_length (children), ==, 1);
  g_assert_cmpstr (children[0], ==, DEFAULT_PROFILE_UUID);
}

static void
test_context_overrides (void)
{
  g_autoptr(TesselContext) context =
    tessel_test_context_new (tessel_overrides_new ("/srv", "top", nullptr));

  g_autoptr(TesselOverrides) overrides = tessel_context_take_overrides (context);
  g_assert_nonnull (overrides);
  g_assert_cmpstr (overrides->working_directory, ==, "/srv");
  g_assert_cmpstr (overrides->command, ==, "top");
  g_assert_null (overrides->profile);

  g_assert_null (tessel_context_take_overrides (context));
}

static void
test_context_registry (void)
{
  g_autoptr(TesselContext) context = tessel_test_context_new (nullptr);
  g_autoptr(TesselTestEmulator) emulator_a = tessel_test_emulator_new ();
  g_autoptr(TesselTestEmulator) emulator_b = tessel_test_emulator_new ();

  g_assert_cmpuint (tessel_context_get_n_panes (context), ==, 0);

  TesselPane *a = tessel_pane_new (context, TESSEL_EMULATOR (emulator_a), nullptr);
  TesselPane *b = tessel_pane_new (context, TESSEL_EMULATOR (emulator_b), nullptr);

  g_assert_cmpuint (tessel_context_get_n_panes (context), ==, 2);
  g_assert_true (tessel_context_get_pane_by_uuid (context, tessel_pane_get_uuid (a)) == a);
  g_assert_true (tessel_context_get_pane_by_uuid (context, tessel_pane_get_uuid (b)) == b);
  g_assert_cmpstr (tessel_pane_get_uuid (a), !=, tessel_pane_get_uuid (b));
  g_assert_null (tessel_context_get_pane_by_uuid (context, UNKNOWN_PROFILE_UUID));

  g_autofree char *uuid_a = g_strdup (tessel_pane_get_uuid (a));
  g_object_unref (a);

  g_assert_cmpuint (tessel_context_get_n_panes (context), ==, 1);
  g_assert_null (tessel_context_get_pane_by_uuid (context, uuid_a));

  g_object_unref (b);
  g_assert_cmpuint (tessel_context_get_n_panes (context), ==, 0);
}

int
main (int argc,
      char *argv[])
{
  g_test_init (&argc, &argv, nullptr);

  g_test_add_func ("/tessel/profiles-list/default", test_profiles_list_default);
  g_test_add_func ("/tessel/profiles-list/lookup", test_profiles_list_lookup);
  g_test_add_func ("/tessel/profiles-list/changed", test_profiles_list_changed);
  g_test_add_func ("/tessel/profiles-list/invalid-entry", test_profiles_list_invalid_entry);
  g_test_add_func ("/tessel/context/overrides", test_context_overrides);
  g_test_add_func ("/tessel/context/registry", test_context_registry);

  return g_test_run ();
}
