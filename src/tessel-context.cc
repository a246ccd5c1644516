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

#include "tessel-context.hh"
#include "tessel-debug.hh"
#include "tessel-defines.hh"
#include "tessel-pane.hh"
#include "tessel-schemas.hh"
#include "tessel-settings-utils.hh"

#define FALLBACK_SYSTEM_FONT "Monospace 10"

struct _TesselContext {
  GObject parent_instance;

  GSettingsBackend *settings_backend;
  GSettingsSchemaSource *schema_source;

  GSettings *global_settings;
  GSettings *desktop_interface_settings;
  TesselProfilesList *profiles_list;

  TesselOverrides *overrides;

  GHashTable *pane_map;
};

G_DEFINE_FINAL_TYPE (TesselContext, tessel_context, G_TYPE_OBJECT)

/* TesselOverrides */

TesselOverrides *
tessel_overrides_new (const char *working_directory,
                      const char *command,
                      const char *profile)
{
  auto overrides = g_new0 (TesselOverrides, 1);

  overrides->working_directory = g_strdup (working_directory);
  overrides->command = g_strdup (command);
  overrides->profile = g_strdup (profile);

  return overrides;
}

void
tessel_overrides_free (TesselOverrides *overrides)
{
  if (overrides == nullptr)
    return;

  g_free (overrides->working_directory);
  g_free (overrides->command);
  g_free (overrides->profile);
  g_free (overrides);
}

/* Class implementation */

static void
tessel_context_init (TesselContext *context)
{
  context->pane_map = g_hash_table_new_full (g_str_hash, g_str_equal, g_free, nullptr);
}

static void
tessel_context_dispose (GObject *object)
{
  TesselContext *context = TESSEL_CONTEXT (object);

  g_clear_object (&context->global_settings);
  g_clear_object (&context->desktop_interface_settings);
  g_clear_object (&context->profiles_list);

  G_OBJECT_CLASS (tessel_context_parent_class)->dispose (object);
}

static void
tessel_context_finalize (GObject *object)
{
  TesselContext *context = TESSEL_CONTEXT (object);

  if (g_hash_table_size (context->pane_map) != 0)
    g_warning ("Context finalized with %u panes still registered",
               g_hash_table_size (context->pane_map));
  g_hash_table_destroy (context->pane_map);

  g_clear_pointer (&context->overrides, tessel_overrides_free);
  g_clear_object (&context->settings_backend);
  g_clear_pointer (&context->schema_source, g_settings_schema_source_unref);

  G_OBJECT_CLASS (tessel_context_parent_class)->finalize (object);
}

static void
tessel_context_class_init (TesselContextClass *klass)
{
  GObjectClass *object_class = G_OBJECT_CLASS (klass);

  object_class->dispose = tessel_context_dispose;
  object_class->finalize = tessel_context_finalize;
}

/* Public API */

/**
 * tessel_context_new:
 * @backend: (nullable): the #GSettingsBackend to use, or %nullptr for the default
 * @schema_source: the #GSettingsSchemaSource to look schemas up in
 * @overrides: (transfer full) (nullable): command line overrides
 *
 * Returns: (transfer full): a new #TesselContext
 */
TesselContext *
tessel_context_new (GSettingsBackend *backend,
                    GSettingsSchemaSource *schema_source,
                    TesselOverrides *overrides)
{
  g_return_val_if_fail (schema_source != nullptr, nullptr);

  auto context = reinterpret_cast<TesselContext*>(g_object_new (TESSEL_TYPE_CONTEXT, nullptr));

  context->settings_backend = backend ? reinterpret_cast<GSettingsBackend*>(g_object_ref (backend)) : nullptr;
  context->schema_source = g_settings_schema_source_ref (schema_source);
  context->overrides = overrides;

  /* Tessel global settings */
  context->global_settings = tessel_g_settings_new (context->settings_backend,
                                                    context->schema_source,
                                                    TESSEL_SETTING_SCHEMA);
  g_assert_nonnull (context->global_settings);

  /* Desktop Interface settings; not all systems ship them */
  context->desktop_interface_settings = tessel_g_settings_new (context->settings_backend,
                                                               context->schema_source,
                                                               DESKTOP_INTERFACE_SETTINGS_SCHEMA);
  if (context->desktop_interface_settings == nullptr)
    g_debug ("Schema %s not installed; using %s as the system font",
             DESKTOP_INTERFACE_SETTINGS_SCHEMA, FALLBACK_SYSTEM_FONT);

  context->profiles_list = tessel_profiles_list_new (context->settings_backend,
                                                     context->schema_source);

  return context;
}

GSettingsBackend *
tessel_context_get_settings_backend (TesselContext *context)
{
  g_return_val_if_fail (TESSEL_IS_CONTEXT (context), nullptr);

  return context->settings_backend;
}

GSettingsSchemaSource *
tessel_context_get_schema_source (TesselContext *context)
{
  g_return_val_if_fail (TESSEL_IS_CONTEXT (context), nullptr);

  return context->schema_source;
}

/**
 * tessel_context_get_global_settings:
 * @context: a #TesselContext
 *
 * Returns: (transfer none): the cached #GSettings object for the global settings
 */
GSettings *
tessel_context_get_global_settings (TesselContext *context)
{
  g_return_val_if_fail (TESSEL_IS_CONTEXT (context), nullptr);

  return context->global_settings;
}

/**
 * tessel_context_get_desktop_interface_settings:
 * @context: a #TesselContext
 *
 * Returns: (transfer none) (nullable): the cached #GSettings object for the
 *   org.gnome.desktop.interface schema, or %nullptr if it is not installed
 */
GSettings *
tessel_context_get_desktop_interface_settings (TesselContext *context)
{
  g_return_val_if_fail (TESSEL_IS_CONTEXT (context), nullptr);

  return context->desktop_interface_settings;
}

/**
 * tessel_context_get_profiles_list:
 *
 * Returns: (transfer none): the #TesselProfilesList
 */
TesselProfilesList *
tessel_context_get_profiles_list (TesselContext *context)
{
  g_return_val_if_fail (TESSEL_IS_CONTEXT (context), nullptr);

  return context->profiles_list;
}

/**
 * tessel_context_get_system_font:
 * @context:
 *
 * Creates a #PangoFontDescription for the system monospace font.
 *
 * Returns: (transfer full): a new #PangoFontDescription
 */
PangoFontDescription *
tessel_context_get_system_font (TesselContext *context)
{
  g_return_val_if_fail (TESSEL_IS_CONTEXT (context), nullptr);

  if (context->desktop_interface_settings == nullptr)
    return pango_font_description_from_string (FALLBACK_SYSTEM_FONT);

  g_autofree char *font = g_settings_get_string (context->desktop_interface_settings,
                                                 MONOSPACE_FONT_KEY_NAME);
  return pango_font_description_from_string (font);
}

/**
 * tessel_context_take_overrides:
 * @context:
 *
 * Hands out the command line overrides. Only the first caller gets them.
 *
 * Returns: (transfer full) (nullable): the overrides, or %nullptr
 */
TesselOverrides *
tessel_context_take_overrides (TesselContext *context)
{
  g_return_val_if_fail (TESSEL_IS_CONTEXT (context), nullptr);

  return static_cast<TesselOverrides*>(g_steal_pointer (&context->overrides));
}

void
tessel_context_register_pane (TesselContext *context,
                              TesselPane *pane)
{
  g_return_if_fail (TESSEL_IS_CONTEXT (context));
  g_return_if_fail (TESSEL_IS_PANE (pane));

  const char *uuid = tessel_pane_get_uuid (pane);
  g_hash_table_insert (context->pane_map, g_strdup (uuid), pane);

  _tessel_debug_print (TESSEL_DEBUG_PANE, "Registered pane %s (%u panes)\n",
                       uuid, g_hash_table_size (context->pane_map));
}

void
tessel_context_unregister_pane (TesselContext *context,
                                TesselPane *pane)
{
  g_return_if_fail (TESSEL_IS_CONTEXT (context));
  g_return_if_fail (TESSEL_IS_PANE (pane));

  const char *uuid = tessel_pane_get_uuid (pane);
  gboolean found = g_hash_table_remove (context->pane_map, uuid);
  g_warn_if_fail (found);
  if (!found)
    return; /* repeat unregistering */

  _tessel_debug_print (TESSEL_DEBUG_PANE, "Unregistered pane %s (%u panes)\n",
                       uuid, g_hash_table_size (context->pane_map));
}

/**
 * tessel_context_get_pane_by_uuid:
 * @context:
 * @uuid:
 *
 * Returns: (transfer none) (nullable): the #TesselPane registered under @uuid
 */
TesselPane *
tessel_context_get_pane_by_uuid (TesselContext *context,
                                 const char *uuid)
{
  g_return_val_if_fail (TESSEL_IS_CONTEXT (context), nullptr);

  if (uuid == nullptr)
    return nullptr;

  return reinterpret_cast<TesselPane*>(g_hash_table_lookup (context->pane_map, uuid));
}

guint
tessel_context_get_n_panes (TesselContext *context)
{
  g_return_val_if_fail (TESSEL_IS_CONTEXT (context), 0);

  return g_hash_table_size (context->pane_map);
}
