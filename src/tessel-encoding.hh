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

#ifndef TESSEL_ENCODING_H
#define TESSEL_ENCODING_H

#include <gio/gio.h>

G_BEGIN_DECLS

gboolean tessel_encodings_is_known_charset (const char *charset);

const char *tessel_encodings_get_name (const char *charset);

void tessel_encodings_append_menu (GMenu *menu,
                                   char **charsets,
                                   const char *detailed_action);

G_END_DECLS

#endif /* TESSEL_ENCODING_H */
