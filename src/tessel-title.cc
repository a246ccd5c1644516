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

#include "tessel-title.hh"

#include <string.h>

static void
append_escaped (GString *string,
                const char *value)
{
  if (value == nullptr || value[0] == '\0')
    return;

  g_autofree char *escaped = g_markup_escape_text (value, -1);
  g_string_append (string, escaped);
}

/**
 * tessel_title_format:
 * @title_template: the title template, e.g. "${id}: ${title}"
 * @info: the values to substitute
 *
 * Substitutes every placeholder in @title_template. The substituted
 * values are escaped for use as Pango markup; the template itself is
 * taken to be markup already. Unset values substitute as the empty
 * string, so the result never contains a known placeholder.
 *
 * Returns: (transfer full): the formatted title
 */
char *
tessel_title_format (const char *title_template,
                     const TesselTitleInfo *info)
{
  g_return_val_if_fail (info != nullptr, nullptr);

  if (title_template == nullptr)
    return g_strdup ("");

  char id_str[16];
  g_snprintf (id_str, sizeof (id_str), "%d", info->id);

  const struct {
    const char *placeholder;
    const char *value;
  } substitutions[] = {
    { TESSEL_TITLE_PLACEHOLDER_TITLE,      info->window_title },
    { TESSEL_TITLE_PLACEHOLDER_ICON_TITLE, info->icon_title   },
    { TESSEL_TITLE_PLACEHOLDER_ID,         id_str             },
    { TESSEL_TITLE_PLACEHOLDER_DIRECTORY,  info->directory    },
  };

  GString *title = g_string_sized_new (strlen (title_template) + 32);
  const char *p = title_template;

  while (*p != '\0') {
    gboolean matched = FALSE;

    if (p[0] == '$' && p[1] == '{') {
      for (guint i = 0; i < G_N_ELEMENTS (substitutions); ++i) {
        auto const len = strlen (substitutions[i].placeholder);
        if (strncmp (p, substitutions[i].placeholder, len) == 0) {
          append_escaped (title, substitutions[i].value);
          p += len;
          matched = TRUE;
          break;
        }
      }
    }

    if (!matched)
      g_string_append_c (title, *p++);
  }

  return g_string_free (title, FALSE);
}
