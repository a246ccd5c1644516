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

#ifndef TESSEL_UTIL_H
#define TESSEL_UTIL_H

#include <gio/gio.h>
#include <gdk/gdk.h>

#include "tessel-enums.hh"

G_BEGIN_DECLS

#define tessel_str_empty0(s) ((s) == nullptr || (s)[0] == '\0')

gboolean tessel_g_settings_get_rgba (GSettings  *settings,
                                     const char *key,
                                     GdkRGBA    *color);

gsize tessel_g_settings_update_rgba_palette (GSettings  *settings,
                                             const char *key,
                                             GdkRGBA    *palette,
                                             gsize       n_colors);

char *tessel_util_quote_file_list (const GList *files) G_GNUC_MALLOC;

char *tessel_util_quote_uri_list (char **uris) G_GNUC_MALLOC;

char *tessel_util_dup_user_shell (void) G_GNUC_MALLOC;

char *tessel_util_url_for_flavor (const char *url,
                                  TesselURLFlavor flavor) G_GNUC_MALLOC;

G_END_DECLS

#endif /* TESSEL_UTIL_H */
