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

#include <gtk/gtk.h>

#include "tessel-vte.hh"

G_BEGIN_DECLS

typedef enum {
  TESSEL_FIND_MATCH_CASE   = 1 << 0,
  TESSEL_FIND_WHOLE_WORDS  = 1 << 1,
  TESSEL_FIND_REGEX        = 1 << 2,
} TesselFindFlags;

#define TESSEL_TYPE_FIND_BAR (tessel_find_bar_get_type ())

G_DECLARE_FINAL_TYPE (TesselFindBar, tessel_find_bar, TESSEL, FIND_BAR, GtkWidget)

TesselVte *tessel_find_bar_get_vte (TesselFindBar *bar);

void tessel_find_bar_set_vte (TesselFindBar *bar,
                              TesselVte *vte);

VteRegex *tessel_find_regex_new (const char *text,
                                 TesselFindFlags flags,
                                 GError **error);

G_END_DECLS
