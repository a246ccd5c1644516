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

#include <pwd.h>
#include <unistd.h>

#include "tessel-util.hh"

/**
 * tessel_g_settings_get_rgba:
 * @settings: a #GSettings
 * @key: a valid key in @settings of type "s"
 * @color: location to store the parsed color
 *
 * Gets a color from @key in @settings. @color is left untouched
 * when the stored string does not parse.
 *
 * Returns: %TRUE if parsing succeeded
 */
gboolean
tessel_g_settings_get_rgba (GSettings  *settings,
                            const char *key,
                            GdkRGBA    *color)
{
  g_return_val_if_fail (G_IS_SETTINGS (settings), FALSE);
  g_return_val_if_fail (color != nullptr, FALSE);

  g_autofree char *str = g_settings_get_string (settings, key);
  GdkRGBA parsed;
  if (!gdk_rgba_parse (&parsed, str)) {
    g_warning ("Failed to parse color \"%s\" for key \"%s\"", str, key);
    return FALSE;
  }

  parsed.alpha = 1.0;
  *color = parsed;
  return TRUE;
}

/**
 * tessel_g_settings_update_rgba_palette:
 * @settings: a #GSettings
 * @key: a valid key in @settings of type "as"
 * @palette: (array length=n_colors) (inout): the palette to update
 * @n_colors: number of entries in @palette
 *
 * Parses the colors stored in @key into @palette. Entries that fail
 * to parse, and entries beyond the end of the stored list, keep their
 * current value.
 *
 * Returns: the number of entries updated
 */
gsize
tessel_g_settings_update_rgba_palette (GSettings  *settings,
                                       const char *key,
                                       GdkRGBA    *palette,
                                       gsize       n_colors)
{
  g_return_val_if_fail (G_IS_SETTINGS (settings), 0);
  g_return_val_if_fail (palette != nullptr, 0);

  g_auto(GStrv) strv = g_settings_get_strv (settings, key);
  gsize n_updated = 0;

  for (gsize i = 0; i < n_colors && strv[i] != nullptr; ++i) {
    GdkRGBA color;

    if (!gdk_rgba_parse (&color, strv[i])) {
      g_warning ("Failed to parse palette color %" G_GSIZE_FORMAT " \"%s\"", i, strv[i]);
      continue;
    }

    color.alpha = 1.0;
    palette[i] = color;
    n_updated++;
  }

  return n_updated;
}

/**
 * tessel_util_quote_file_list:
 * @files: (element-type GFile): dropped files
 *
 * Returns: (transfer full): the shell-quoted local paths, or URIs for
 *   non-native files, each followed by a space
 */
char *
tessel_util_quote_file_list (const GList *files)
{
  g_autoptr(GString) string = g_string_new (nullptr);

  for (const GList *iter = files; iter; iter = iter->next) {
    GFile *file = G_FILE (iter->data);

    if (g_file_is_native (file)) {
      g_autofree char *quoted = g_shell_quote (g_file_peek_path (file));

      g_string_append (string, quoted);
      g_string_append_c (string, ' ');
    } else {
      g_autofree char *uri = g_file_get_uri (file);
      g_autofree char *quoted = g_shell_quote (uri);

      g_string_append (string, quoted);
      g_string_append_c (string, ' ');
    }
  }

  return g_strdup (string->str);
}

char *
tessel_util_quote_uri_list (char **uris)
{
  GList *files = nullptr;

  if (uris == nullptr)
    return g_strdup ("");

  for (guint i = 0; uris[i]; ++i)
    files = g_list_prepend (files, g_file_new_for_uri (uris[i]));
  files = g_list_reverse (files);

  char *quoted = tessel_util_quote_file_list (files);
  g_list_free_full (files, g_object_unref);
  return quoted;
}

/**
 * tessel_util_dup_user_shell:
 *
 * Looks up the login shell of the current user in the password
 * database, falling back to $SHELL and then to /bin/sh.
 *
 * Returns: (transfer full): the path of the shell
 */
char *
tessel_util_dup_user_shell (void)
{
  struct passwd *pw = getpwuid (getuid ());
  if (pw != nullptr && !tessel_str_empty0 (pw->pw_shell))
    return g_strdup (pw->pw_shell);

  const char *shell = g_getenv ("SHELL");
  if (!tessel_str_empty0 (shell))
    return g_strdup (shell);

  return g_strdup ("/bin/sh");
}

/**
 * tessel_util_url_for_flavor:
 * @url: a matched URL
 * @flavor: the flavor of the regex that matched @url
 *
 * Returns: (transfer full): @url made into an absolute URI
 */
char *
tessel_util_url_for_flavor (const char *url,
                            TesselURLFlavor flavor)
{
  g_return_val_if_fail (url != nullptr, nullptr);

  switch (flavor) {
  case TESSEL_URL_FLAVOR_DEFAULT_TO_HTTP:
    return g_strdup_printf ("http://%s", url);
  case TESSEL_URL_FLAVOR_EMAIL:
    if (g_ascii_strncasecmp ("mailto:", url, 7) != 0)
      return g_strdup_printf ("mailto:%s", url);
    return g_strdup (url);
  case TESSEL_URL_FLAVOR_AS_IS:
  default:
    return g_strdup (url);
  }
}
