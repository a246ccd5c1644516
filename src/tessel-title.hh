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

#include <glib.h>

G_BEGIN_DECLS

#define TESSEL_TITLE_PLACEHOLDER_TITLE      "${title}"
#define TESSEL_TITLE_PLACEHOLDER_ICON_TITLE "${iconTitle}"
#define TESSEL_TITLE_PLACEHOLDER_ID         "${id}"
#define TESSEL_TITLE_PLACEHOLDER_DIRECTORY  "${directory}"

typedef struct {
  const char *window_title;
  const char *icon_title;
  int         id;
  const char *directory;
} TesselTitleInfo;

char *tessel_title_format (const char *title_template,
                           const TesselTitleInfo *info) G_GNUC_MALLOC;

G_END_DECLS
